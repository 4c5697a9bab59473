#include "foxess/api_client.hpp"
#include "foxess/errors.hpp"
#include "foxess/log.hpp"
#include "foxess/signature.hpp"
#include "foxess/time_utils.hpp"

namespace http = boost::beast::http;
using json = nlohmann::json;

namespace foxess {

namespace {

// тело ошибки в debug-лог не целиком
std::string truncated(const std::string &s, std::size_t n = 512) {
  return s.size() <= n ? s : s.substr(0, n) + "...";
}

} // namespace

ApiClient::ApiClient(const Config &cfg, HttpTransport &transport)
    : cfg_(cfg), transport_(transport),
      timezone_(local_timezone_id(cfg.timezone)) {}

HttpRequest ApiClient::build_request(const std::string &path,
                                     http::verb method, const json &body,
                                     std::int64_t timestamp_millis) const {
  HttpRequest req{method, path, 11};
  // порт в Host только если он не стандартный для схемы
  const unsigned short default_port = cfg_.use_tls ? 443 : 80;
  req.set(http::field::host,
          cfg_.port == default_port
              ? cfg_.host
              : cfg_.host + ":" + std::to_string(cfg_.port));

  const std::string token = token_.value_or("");
  if (token_)
    req.set("token", token);
  req.set(http::field::accept, "application/json, text/plain, */*");
  req.set(http::field::accept_language, "en-US;q=0.9,en;q=0.8");
  req.set(http::field::content_type, "application/json");
  req.set("lang", "en");
  req.set("timezone", timezone_);
  req.set(http::field::user_agent, kUserAgent);

  const std::string ts = std::to_string(timestamp_millis);
  req.set("timestamp", ts);
  req.set("signature", sign(path, token, timestamp_millis));

  if (method != http::verb::get)
    req.body() = body.dump();
  req.keep_alive(false);
  req.prepare_payload();
  return req;
}

json ApiClient::fetch_json(const std::string &path, http::verb method,
                           const json &body) {
  // timestamp свежий на каждый запрос, подпись одноразовая
  const auto ts = now_epoch_millis();
  auto req = build_request(path, method, body, ts);

  const auto verb = http::to_string(method);
  const auto signature = req["signature"];
  log_dbg("API", "fetching " + std::string(verb.data(), verb.size()) + " " +
                     cfg_.host + path);
  log_dbg("API", "timestamp: " + std::to_string(ts) + " signature: " +
                     std::string(signature.data(), signature.size()));

  HttpResponse res = transport_.send(req);

  const int status = static_cast<int>(res.result_int());
  log_dbg("API", "status code: " + std::to_string(status));
  if (status < 200 || status > 299) {
    log_dbg("API", "error response: " + truncated(res.body()));
    throw TransportError(status);
  }

  try {
    return json::parse(res.body());
  } catch (const json::parse_error &e) {
    throw DecodeError(std::string("response is not valid JSON: ") + e.what());
  }
}

} // namespace foxess
