#pragma once
#include <chrono>
#include <cstdint>
#include <string>

namespace foxess {

// Текущее время в миллисекундах от epoch (UTC).
inline std::int64_t now_epoch_millis() {
  using namespace std::chrono;
  return duration_cast<milliseconds>(system_clock::now().time_since_epoch())
      .count();
}

// IANA-идентификатор локальной зоны ("Europe/Berlin").
// Порядок: override -> $TZ -> /etc/timezone -> ссылка /etc/localtime -> "UTC".
std::string local_timezone_id(const std::string &override_id = "");

// Разбор цели симлинка /etc/localtime: ".../zoneinfo/Europe/Berlin" ->
// "Europe/Berlin". Пустая строка, если "zoneinfo/" в пути нет.
std::string timezone_from_zoneinfo_path(const std::string &path);

} // namespace foxess
