#include "foxess/dynamic_value.hpp"

namespace foxess {

DynamicValue DynamicValue::decode(const nlohmann::json &j) noexcept {
  // is_number() не включает boolean
  if (j.is_number())
    return DynamicValue(j.get<double>());
  if (j.is_string())
    return DynamicValue(j.get_ref<const std::string &>());
  return DynamicValue();
}

std::optional<double> DynamicValue::as_number() const {
  if (const auto *d = std::get_if<double>(&v_))
    return *d;
  return std::nullopt;
}

std::optional<std::string> DynamicValue::as_text() const {
  if (const auto *s = std::get_if<std::string>(&v_))
    return *s;
  return std::nullopt;
}

void to_json(nlohmann::json &j, const DynamicValue &v) {
  switch (v.kind()) {
  case DynamicValue::Kind::Numeric:
    j = *v.as_number();
    break;
  case DynamicValue::Kind::Text:
    j = *v.as_text();
    break;
  case DynamicValue::Kind::Unrecognized:
    j = nullptr;
    break;
  }
}

void from_json(const nlohmann::json &j, DynamicValue &v) {
  v = DynamicValue::decode(j);
}

} // namespace foxess
