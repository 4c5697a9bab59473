#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>

namespace foxess {

// Базовый класс всех ошибок конвейера запросов.
// В сообщениях никогда не должно быть токена.
class ApiError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Не-2xx ответ или сетевой сбой (status == 0: connect/timeout/TLS).
class TransportError : public ApiError {
public:
  explicit TransportError(int status)
      : ApiError("HTTP status " + std::to_string(status)), status_(status) {}
  TransportError(int status, const std::string &detail)
      : ApiError(status == 0
                     ? "transport failure: " + detail
                     : "HTTP status " + std::to_string(status) + ": " + detail),
        status_(status) {}

  int status() const noexcept { return status_; }

private:
  int status_;
};

// Тело не соответствует ожидаемой схеме.
class DecodeError : public ApiError {
public:
  explicit DecodeError(const std::string &detail)
      : ApiError("decode error: " + detail) {}
};

// Ненулевой errno в конверте. Коды не интерпретируем.
class ServerError : public ApiError {
public:
  explicit ServerError(std::int64_t code)
      : ApiError("Server error " + std::to_string(code)), code_(code) {}

  std::int64_t code() const noexcept { return code_; }

private:
  std::int64_t code_;
};

class MissingResultError : public ApiError {
public:
  MissingResultError() : ApiError("Missing result in response") {}
};

class DeviceNotFoundInResponse : public ApiError {
public:
  explicit DeviceNotFoundInResponse(const std::string &device_sn)
      : ApiError("No data found for device " + device_sn),
        device_sn_(device_sn) {}

  const std::string &device_sn() const noexcept { return device_sn_; }

private:
  std::string device_sn_;
};

class NotAuthenticatedError : public ApiError {
public:
  NotAuthenticatedError()
      : ApiError("session is not authenticated, call authenticate() first") {}
};

} // namespace foxess
