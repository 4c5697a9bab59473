#pragma once
#include "api_client.hpp"
#include "http_transport.hpp"
#include "types.hpp"
#include <string>
#include <vector>

namespace foxess {

inline constexpr const char *kDeviceListPath = "/op/v0/device/list";
inline constexpr const char *kRealtimeQueryPath = "/op/v0/device/real/query";
inline constexpr int kDeviceListPageSize = 10;

enum class SessionState { Unauthenticated, Authenticated };

// Последовательность authenticate -> list_devices -> fetch_realtime.
// Сессия владеет учётными данными и своим ApiClient.
class TelemetrySession {
public:
  TelemetrySession(const Config &cfg, HttpTransport &transport,
                   std::string credential);

  // Только локальное присваивание токена, сети нет.
  void authenticate();

  // authenticate() + запрос списка устройств. Любое исключение -> false:
  // неверный ключ и недоступная сеть неразличимы.
  bool test_authentication();

  // Первая страница (10 шт.), поле data как есть.
  std::vector<Device> list_devices();

  // Блок с device_sn == серийнику, позиция в массиве не важна.
  std::vector<TelemetryPoint> fetch_realtime(const std::string &device_sn);

  SessionState state() const noexcept { return state_; }
  bool is_authenticated() const noexcept {
    return state_ == SessionState::Authenticated;
  }

  static const std::vector<std::string> &realtime_variables();

private:
  void require_authenticated() const;

  ApiClient client_;
  const std::string credential_;
  SessionState state_ = SessionState::Unauthenticated;
};

} // namespace foxess
