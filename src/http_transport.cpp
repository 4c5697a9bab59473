// src/http_transport.cpp
#include "foxess/http_transport.hpp"
#include "foxess/errors.hpp"
#include "foxess/log.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/system/system_error.hpp>
#include <memory>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <type_traits>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace foxess {

// Цепочка resolve -> connect -> [handshake] -> write -> read.
// Первая ошибка сохраняется в ec и прерывает цепочку.
template <class Stream>
struct BeastHttpTransport::Exchange
    : public std::enable_shared_from_this<BeastHttpTransport::Exchange<Stream>> {
  static constexpr bool kTls =
      std::is_same_v<Stream, beast::ssl_stream<beast::tcp_stream>>;

  tcp::resolver resolver;
  Stream stream;
  const HttpRequest &req;
  std::string host;
  std::string port;

  beast::flat_buffer buffer;
  HttpResponse res;
  beast::error_code ec;
  const char *stage = "resolve";
  bool done = false;

  template <class... StreamArgs>
  Exchange(net::io_context &ioc, const HttpRequest &r, std::string h,
           std::string p, StreamArgs &&...args)
      : resolver(ioc), stream(std::forward<StreamArgs>(args)...), req(r),
        host(std::move(h)), port(std::move(p)) {}

  beast::tcp_stream &tcp_layer() { return beast::get_lowest_layer(stream); }

  void run(std::chrono::milliseconds timeout) {
    tcp_layer().expires_after(timeout);
    auto self = this->shared_from_this();
    resolver.async_resolve(
        host, port,
        [self](beast::error_code e, tcp::resolver::results_type results) {
          if (self->fail(e))
            return;
          self->connect(results);
        });
  }

  void connect(const tcp::resolver::results_type &results) {
    stage = "connect";
    auto self = this->shared_from_this();
    tcp_layer().async_connect(
        results, [self](beast::error_code e, tcp::endpoint) {
          if (self->fail(e))
            return;
          self->handshake();
        });
  }

  void handshake() {
    if constexpr (kTls) {
      stage = "tls handshake";
      auto self = this->shared_from_this();
      stream.async_handshake(ssl::stream_base::client,
                             [self](beast::error_code e) {
                               if (self->fail(e))
                                 return;
                               self->write();
                             });
    } else {
      write();
    }
  }

  void write() {
    stage = "write";
    auto self = this->shared_from_this();
    http::async_write(stream, req,
                      [self](beast::error_code e, std::size_t) {
                        if (self->fail(e))
                          return;
                        self->read();
                      });
  }

  void read() {
    stage = "read";
    auto self = this->shared_from_this();
    http::async_read(stream, buffer, res,
                     [self](beast::error_code e, std::size_t) {
                       if (self->fail(e))
                         return;
                       self->done = true;
                       self->close();
                     });
  }

  // Ответ уже получен, ошибки закрытия только в debug-лог.
  void close() {
    beast::error_code e;
    tcp_layer().socket().shutdown(tcp::socket::shutdown_both, e);
    if (e && e != beast::errc::not_connected)
      log_dbg("HTTP", std::string("shutdown: ") + e.message());
    tcp_layer().close();
  }

  bool fail(beast::error_code e) {
    if (!e)
      return false;
    ec = e;
    return true;
  }
};

BeastHttpTransport::BeastHttpTransport(const Config &cfg)
    : host_(cfg.host), port_(std::to_string(cfg.port)), use_tls_(cfg.use_tls),
      timeout_(cfg.request_timeout_ms) {}

namespace {

template <class Exchange>
HttpResponse finish(net::io_context &ioc, const std::shared_ptr<Exchange> &ex,
                    std::chrono::milliseconds timeout) {
  ex->run(timeout);
  // tcp_stream не ограничивает resolve, поэтому общий лимит через run_for
  ioc.run_for(timeout);
  if (!ioc.stopped()) {
    ex->resolver.cancel();
    ex->tcp_layer().cancel();
    ioc.run(); // доиграть отменённые обработчики
    throw TransportError(0, std::string("request timed out during ") +
                                ex->stage);
  }
  if (ex->ec == beast::error::timeout)
    throw TransportError(0, std::string("request timed out during ") +
                                ex->stage);
  if (ex->ec)
    throw TransportError(0, std::string(ex->stage) + ": " + ex->ec.message());
  if (!ex->done)
    throw TransportError(0, "connection closed without response");
  return std::move(ex->res);
}

} // namespace

HttpResponse BeastHttpTransport::send(const HttpRequest &req) {
  try {
    return exchange(req);
  } catch (const boost::system::system_error &e) {
    throw TransportError(0, e.what());
  }
}

HttpResponse BeastHttpTransport::exchange(const HttpRequest &req) {
  net::io_context ioc;

  if (!use_tls_) {
    auto ex = std::make_shared<Exchange<beast::tcp_stream>>(ioc, req, host_,
                                                            port_, ioc);
    return finish(ioc, ex, timeout_);
  }

  ssl::context ctx(ssl::context::tls_client);
  ctx.set_default_verify_paths();
  ctx.set_verify_mode(ssl::verify_peer);

  auto ex = std::make_shared<Exchange<beast::ssl_stream<beast::tcp_stream>>>(
      ioc, req, host_, port_, ioc, ctx);

  // SNI
  if (!SSL_set_tlsext_host_name(ex->stream.native_handle(), host_.c_str())) {
    beast::error_code e{static_cast<int>(::ERR_get_error()),
                        net::error::get_ssl_category()};
    throw TransportError(0, "SNI setup failed: " + e.message());
  }
  ex->stream.set_verify_callback(ssl::host_name_verification(host_));

  return finish(ioc, ex, timeout_);
}

} // namespace foxess
