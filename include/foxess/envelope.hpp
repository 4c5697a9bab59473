#pragma once
#include "errors.hpp"
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <utility>

namespace foxess {

// Конверт всех ответов API: {"errno": int, "result": T?}.
// error_code == 0 <=> result присутствует и достоверен.
template <class T> struct ResponseEnvelope {
  std::int64_t error_code = 0;
  std::optional<T> result;
};

// Разбор конверта. result декодируется только при error_code == 0,
// иначе он игнорируется (даже битый). Ошибки схемы -> DecodeError.
template <class T>
ResponseEnvelope<T> decode_envelope(const nlohmann::json &body) {
  if (!body.is_object())
    throw DecodeError("response body is not a JSON object");

  auto code_it = body.find("errno");
  if (code_it == body.end() || !code_it->is_number_integer())
    throw DecodeError("response has no integer 'errno' field");

  ResponseEnvelope<T> env;
  // int64 без сужения: 2^32 не должно превратиться в 0.
  // unsigned за пределами int64 остаётся ненулевым после приведения.
  env.error_code = code_it->template get<std::int64_t>();
  if (env.error_code != 0)
    return env;

  auto res_it = body.find("result");
  if (res_it == body.end() || res_it->is_null())
    return env;

  try {
    env.result = res_it->template get<T>();
  } catch (const nlohmann::json::exception &e) {
    throw DecodeError(std::string("unexpected 'result' shape: ") + e.what());
  }
  return env;
}

// Ровно одно из двух: значение или классифицированная ошибка.
template <class T> T unwrap(ResponseEnvelope<T> env) {
  if (env.error_code != 0)
    throw ServerError(env.error_code);
  if (!env.result)
    throw MissingResultError();
  return std::move(*env.result);
}

} // namespace foxess
