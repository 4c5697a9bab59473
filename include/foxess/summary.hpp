#pragma once
#include "types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace foxess {

// ниже этого порога показания солнечной генерации считаем шумом
inline constexpr double kSolarNoiseThreshold = 0.02;

// Первое совпадение по ключу без учёта регистра (ASCII), либо nullptr.
const TelemetryPoint *find_point(const std::vector<TelemetryPoint> &points,
                                 const std::string &key);

std::optional<double> numeric_value(const std::vector<TelemetryPoint> &points,
                                    const std::string &key);

// "°C" -> "C"; пустая строка, если точки или единицы нет
std::string display_unit(const std::vector<TelemetryPoint> &points,
                         const std::string &key);

bool is_solar_key(const std::string &key);

// generationPower/pvPower <= 0.02 -> ровно 0
double suppress_solar_noise(const std::string &key, double value);

struct PowerSummary {
  std::string station_name;
  double solar = 0;
  double pv = 0;
  double home = 0;
  double grid_flow = 0;    // потребление - отдача; > 0 импорт
  double battery_flow = 0; // заряд - разряд; > 0 заряд
  double soc = 0;
  bool has_battery = false;

  bool grid_importing() const { return grid_flow > 0; }
  bool battery_charging() const { return battery_flow > 0; }
};

// Отсутствующие или нечисловые значения читаются как 0.
PowerSummary summarize(const std::vector<TelemetryPoint> &points,
                       const Device &device);

} // namespace foxess
