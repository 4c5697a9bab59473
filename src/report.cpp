#include "foxess/report.hpp"

#include <cmath>
#include <cstdio>

namespace foxess {

std::string format_number(double value, int decimals) {
  if (decimals < 0)
    decimals = 0;
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.*f", decimals, value);
  std::string s(buf);
  if (s.find('.') != std::string::npos) {
    while (!s.empty() && s.back() == '0')
      s.pop_back();
    if (!s.empty() && s.back() == '.')
      s.pop_back();
  }
  // "-0" после округления
  if (s == "-0")
    s = "0";
  return s;
}

std::string format_power(double value, int decimals) {
  return format_number(value, decimals) + " kW";
}

void render_summary(std::ostream &out, const PowerSummary &s, int decimals) {
  out << "Device: " << s.station_name << "\n";
  out << "generationPower: " << format_power(s.solar, decimals) << "\n";
  out << "pvPower: " << format_power(s.pv, decimals) << "\n";
  out << "loadsPower: " << format_power(s.home, decimals) << "\n";
  out << "Grid: " << format_power(std::fabs(s.grid_flow), decimals) << " "
      << (s.grid_importing() ? "import" : "export") << "\n";

  if (s.has_battery) {
    out << "Battery: " << format_power(std::fabs(s.battery_flow), decimals)
        << " " << (s.battery_charging() ? "charging" : "discharging") << "\n";
    out << "SoC: " << format_number(s.soc, decimals) << "%\n";
  }
}

void render_all(std::ostream &out, const std::vector<TelemetryPoint> &points,
                int decimals) {
  out << "Available variables:\n";
  for (const auto &p : points) {
    std::string value;
    switch (p.value.kind()) {
    case DynamicValue::Kind::Numeric:
      value = format_number(suppress_solar_noise(p.key, *p.value.as_number()),
                            decimals);
      break;
    case DynamicValue::Kind::Text:
      value = *p.value.as_text();
      break;
    case DynamicValue::Kind::Unrecognized:
      value = "unknown";
      break;
    }
    out << "  " << p.key << ": " << value << " " << p.unit.value_or("")
        << "\n";
  }
}

void render_selected(std::ostream &out,
                     const std::vector<TelemetryPoint> &points,
                     const std::vector<std::string> &keys, int decimals) {
  for (const auto &key : keys) {
    const auto v = numeric_value(points, key);
    if (!v) {
      out << key << ": Not available\n";
      continue;
    }
    out << key << ": " << format_number(suppress_solar_noise(key, *v), decimals)
        << " " << display_unit(points, key) << "\n";
  }
}

} // namespace foxess
