#include "foxess/summary.hpp"

#include <algorithm>
#include <cctype>

namespace foxess {

namespace {

bool iequals(const std::string &a, const std::string &b) {
  return a.size() == b.size() &&
         std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
           return std::tolower(static_cast<unsigned char>(x)) ==
                  std::tolower(static_cast<unsigned char>(y));
         });
}

double value_or_zero(const std::vector<TelemetryPoint> &points,
                     const char *key) {
  return numeric_value(points, key).value_or(0.0);
}

} // namespace

const TelemetryPoint *find_point(const std::vector<TelemetryPoint> &points,
                                 const std::string &key) {
  auto it = std::find_if(points.begin(), points.end(),
                         [&](const TelemetryPoint &p) {
                           return iequals(p.key, key);
                         });
  return it == points.end() ? nullptr : &*it;
}

std::optional<double> numeric_value(const std::vector<TelemetryPoint> &points,
                                    const std::string &key) {
  const auto *p = find_point(points, key);
  if (!p)
    return std::nullopt;
  return p->value.as_number();
}

std::string display_unit(const std::vector<TelemetryPoint> &points,
                         const std::string &key) {
  const auto *p = find_point(points, key);
  if (!p || !p->unit)
    return {};
  std::string unit = *p->unit;
  static const std::string degrees = "\xC2\xB0" "C"; // "°C" в UTF-8
  for (auto pos = unit.find(degrees); pos != std::string::npos;
       pos = unit.find(degrees, pos + 1)) {
    unit.replace(pos, degrees.size(), "C");
  }
  return unit;
}

bool is_solar_key(const std::string &key) {
  return iequals(key, "generationPower") || iequals(key, "pvPower");
}

double suppress_solar_noise(const std::string &key, double value) {
  if (is_solar_key(key) && value <= kSolarNoiseThreshold)
    return 0.0;
  return value;
}

PowerSummary summarize(const std::vector<TelemetryPoint> &points,
                       const Device &device) {
  PowerSummary s;
  s.station_name = device.station_name;
  s.has_battery = device.has_battery;

  s.solar = suppress_solar_noise("generationPower",
                                 value_or_zero(points, "generationPower"));
  s.pv = suppress_solar_noise("pvPower", value_or_zero(points, "pvPower"));
  s.home = value_or_zero(points, "loadsPower");
  s.grid_flow = value_or_zero(points, "gridConsumptionPower") -
                value_or_zero(points, "feedinPower");
  s.battery_flow = value_or_zero(points, "batChargePower") -
                   value_or_zero(points, "batDischargePower");
  s.soc = value_or_zero(points, "SoC");
  return s;
}

} // namespace foxess
