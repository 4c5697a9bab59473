#include <gtest/gtest.h>
#include <foxess/errors.hpp>
#include <foxess/http_transport.hpp>
#include <foxess/telemetry_session.hpp>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/thread.hpp>
#include <chrono>
#include <string>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;
using json = nlohmann::json;

namespace {

foxess::Config loopback_config(unsigned short port, int timeout_ms) {
  foxess::Config cfg;
  cfg.host = "127.0.0.1";
  cfg.port = port;
  cfg.use_tls = false;
  cfg.request_timeout_ms = timeout_ms;
  cfg.timezone = "UTC";
  return cfg;
}

foxess::HttpRequest simple_post(const std::string &target) {
  foxess::HttpRequest req{http::verb::post, target, 11};
  req.set(http::field::host, "127.0.0.1");
  req.set(http::field::content_type, "application/json");
  req.body() = "{}";
  req.prepare_payload();
  return req;
}

// Принимает одно соединение, читает запрос, отдаёт заготовленный ответ.
class OneShotServer {
public:
  OneShotServer(int status, std::string body)
      : acceptor_(ioc_, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0)),
        status_(status), body_(std::move(body)) {
    port_ = acceptor_.local_endpoint().port();
    thread_ = boost::thread([this] { serve(); });
  }

  ~OneShotServer() {
    if (thread_.joinable())
      thread_.join();
  }

  unsigned short port() const { return port_; }

  // после join: запрос, который пришёл на сервер
  const http::request<http::string_body> &received() {
    if (thread_.joinable())
      thread_.join();
    return received_;
  }

private:
  void serve() {
    tcp::socket socket(ioc_);
    acceptor_.accept(socket);

    beast::flat_buffer buffer;
    http::read(socket, buffer, received_);

    http::response<http::string_body> res{
        static_cast<http::status>(status_), received_.version()};
    res.set(http::field::content_type, "application/json");
    res.keep_alive(false);
    res.body() = body_;
    res.prepare_payload();
    http::write(socket, res);

    beast::error_code ec;
    socket.shutdown(tcp::socket::shutdown_send, ec);
  }

  net::io_context ioc_;
  tcp::acceptor acceptor_;
  unsigned short port_ = 0;
  int status_;
  std::string body_;
  http::request<http::string_body> received_;
  boost::thread thread_;
};

} // namespace

TEST(BeastHttpTransport, SilentServerTimesOutWithStatusZero) {
  net::io_context ioc;
  // соединение примет ядро (backlog), accept не вызываем и ничего не отвечаем
  tcp::acceptor silent(ioc,
                       tcp::endpoint(net::ip::make_address("127.0.0.1"), 0));
  const auto port = silent.local_endpoint().port();

  foxess::BeastHttpTransport transport(loopback_config(port, 500));

  const auto start = std::chrono::steady_clock::now();
  try {
    transport.send(simple_post("/op/v0/device/list"));
    FAIL() << "expected TransportError";
  } catch (const foxess::TransportError &e) {
    EXPECT_EQ(e.status(), 0);
    EXPECT_NE(std::string(e.what()).find("timed out"), std::string::npos)
        << e.what();
  }
  const auto elapsed = std::chrono::steady_clock::now() - start;
  EXPECT_GE(elapsed, std::chrono::milliseconds(400));
  EXPECT_LT(elapsed, std::chrono::seconds(5));
}

TEST(BeastHttpTransport, RefusedConnectionIsStatusZero) {
  unsigned short port = 0;
  {
    net::io_context ioc;
    tcp::acceptor reserved(
        ioc, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0));
    port = reserved.local_endpoint().port();
  } // порт освобождён, слушателя нет

  foxess::BeastHttpTransport transport(loopback_config(port, 2000));
  try {
    transport.send(simple_post("/x"));
    FAIL() << "expected TransportError";
  } catch (const foxess::TransportError &e) {
    EXPECT_EQ(e.status(), 0);
  }
}

TEST(BeastHttpTransport, ReturnsResponseAsIs) {
  OneShotServer server(500, "oops");
  foxess::BeastHttpTransport transport(loopback_config(server.port(), 5000));

  auto res = transport.send(simple_post("/x"));
  EXPECT_EQ(res.result_int(), 500u);
  EXPECT_EQ(res.body(), "oops");
  EXPECT_EQ(server.received().target(), "/x");
}

TEST(BeastHttpTransport, Http500ThroughClientIsTransportError) {
  OneShotServer server(500, R"({"errno":0,"result":{"data":[]}})");
  const auto cfg = loopback_config(server.port(), 5000);
  foxess::BeastHttpTransport transport(cfg);
  foxess::TelemetrySession session(cfg, transport, "KEY1");
  session.authenticate();

  try {
    session.list_devices();
    FAIL() << "expected TransportError";
  } catch (const foxess::TransportError &e) {
    EXPECT_EQ(e.status(), 500);
  }
}

TEST(BeastHttpTransport, DeviceListRoundTrip) {
  OneShotServer server(
      200, R"({"errno":0,"result":{"currentPage":1,"pageSize":10,"total":1,
               "data":[{"deviceSN":"SN001","stationName":"Home"}]}})");
  const auto cfg = loopback_config(server.port(), 5000);
  foxess::BeastHttpTransport transport(cfg);
  foxess::TelemetrySession session(cfg, transport, "KEY1");
  session.authenticate();

  auto devices = session.list_devices();
  ASSERT_EQ(devices.size(), 1u);
  EXPECT_EQ(devices[0].station_name, "Home");

  const auto &req = server.received();
  EXPECT_EQ(req.target(), "/op/v0/device/list");
  EXPECT_EQ(req["token"], "KEY1");
  EXPECT_EQ(req["signature"].size(), 32u);
  EXPECT_EQ(req[http::field::host],
            "127.0.0.1:" + std::to_string(server.port()));
  EXPECT_EQ(json::parse(req.body()),
            (json{{"currentPage", 1}, {"pageSize", 10}}));
}
