// include/foxess/http_transport.hpp
#pragma once
#include "types.hpp"
#include <boost/beast/http.hpp>
#include <chrono>
#include <string>

namespace foxess {

using HttpRequest =
    boost::beast::http::request<boost::beast::http::string_body>;
using HttpResponse =
    boost::beast::http::response<boost::beast::http::string_body>;

// Один HTTP-обмен запрос/ответ. Сетевые сбои и таймаут -> TransportError(0).
// Статус ответа не проверяется: это делает ApiClient.
class HttpTransport {
public:
  virtual ~HttpTransport() = default;
  virtual HttpResponse send(const HttpRequest &req) = 0;
};

// Boost.Beast поверх Asio, TLS через OpenSSL (если cfg.use_tls).
// Каждый send() открывает новое соединение на собственном io_context.
// Ошибки Asio/SSL (включая настройку контекста) приводятся к TransportError.
class BeastHttpTransport : public HttpTransport {
public:
  explicit BeastHttpTransport(const Config &cfg);

  HttpResponse send(const HttpRequest &req) override;

private:
  template <class Stream> struct Exchange;

  HttpResponse exchange(const HttpRequest &req);

  const std::string host_;
  const std::string port_;
  const bool use_tls_;
  const std::chrono::milliseconds timeout_;
};

} // namespace foxess
