#pragma once
#include "envelope.hpp"
#include "http_transport.hpp"
#include "types.hpp"
#include <boost/beast/http/verb.hpp>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace foxess {

inline constexpr const char *kUserAgent = "FoxESSCmdLine/1.0";

// Один аутентифицированный цикл запрос/ответ.
// Токен хранится в экземпляре клиента, глобального состояния нет.
class ApiClient {
public:
  ApiClient(const Config &cfg, HttpTransport &transport);

  void set_token(std::string token) { token_ = std::move(token); }
  bool has_token() const noexcept { return token_.has_value(); }

  // Подпись, отправка, разбор конверта. Бросает наследников ApiError.
  template <class T>
  T request(const std::string &path, boost::beast::http::verb method,
            const nlohmann::json &body) {
    return unwrap(decode_envelope<T>(fetch_json(path, method, body)));
  }

  // Заголовки и тело без отправки; timestamp передаётся явно.
  HttpRequest build_request(const std::string &path,
                            boost::beast::http::verb method,
                            const nlohmann::json &body,
                            std::int64_t timestamp_millis) const;

private:
  // Отправляет запрос, проверяет HTTP-статус, парсит JSON.
  nlohmann::json fetch_json(const std::string &path,
                            boost::beast::http::verb method,
                            const nlohmann::json &body);

  const Config cfg_;
  HttpTransport &transport_;
  const std::string timezone_;
  std::optional<std::string> token_;
};

} // namespace foxess
