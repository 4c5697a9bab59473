#pragma once
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>

namespace foxess {

// Значение телеметрии неизвестной формы: число, строка или "не распознано".
class DynamicValue {
public:
  enum class Kind { Unrecognized, Numeric, Text };

  DynamicValue() = default;
  explicit DynamicValue(double v) : v_(v) {}
  explicit DynamicValue(std::string s) : v_(std::move(s)) {}

  // Тотальная функция: никогда не бросает.
  // Порядок: число -> строка -> Unrecognized (объект, массив, bool, null).
  static DynamicValue decode(const nlohmann::json &j) noexcept;

  Kind kind() const noexcept { return static_cast<Kind>(v_.index()); }
  bool is_numeric() const noexcept { return kind() == Kind::Numeric; }
  bool is_text() const noexcept { return kind() == Kind::Text; }
  bool is_unrecognized() const noexcept { return kind() == Kind::Unrecognized; }

  std::optional<double> as_number() const;
  std::optional<std::string> as_text() const;

  bool operator==(const DynamicValue &o) const { return v_ == o.v_; }
  bool operator!=(const DynamicValue &o) const { return !(*this == o); }

private:
  // порядок альтернатив совпадает с Kind
  std::variant<std::monostate, double, std::string> v_;
};

// Unrecognized сериализуется как null.
void to_json(nlohmann::json &j, const DynamicValue &v);
void from_json(const nlohmann::json &j, DynamicValue &v);

} // namespace foxess
