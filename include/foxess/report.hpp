#pragma once
#include "summary.hpp"
#include "types.hpp"
#include <ostream>
#include <string>
#include <vector>

namespace foxess {

// Фиксированная точка, затем срезаются хвостовые нули и точка: 1.50 -> "1.5".
std::string format_number(double value, int decimals);

std::string format_power(double value, int decimals); // "<v> kW"

// Вид по умолчанию: устройство, солнце, дом, сеть, батарея.
void render_summary(std::ostream &out, const PowerSummary &s, int decimals);

// --all
void render_all(std::ostream &out, const std::vector<TelemetryPoint> &points,
                int decimals);

// --<variable>...: отсутствующие -> "Not available"
void render_selected(std::ostream &out,
                     const std::vector<TelemetryPoint> &points,
                     const std::vector<std::string> &keys, int decimals);

} // namespace foxess
