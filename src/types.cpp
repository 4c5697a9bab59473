#include "foxess/types.hpp"

namespace foxess {

using json = nlohmann::json;

namespace {

template <class T>
T value_or(const json &j, const char *key, T def) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null())
    return def;
  return it->get<T>();
}

std::optional<std::string> optional_string(const json &j, const char *key) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null())
    return std::nullopt;
  return it->get<std::string>();
}

} // namespace

void from_json(const json &j, Device &d) {
  d.device_sn = j.at("deviceSN").get<std::string>();
  d.station_name = value_or<std::string>(j, "stationName", "");
  d.station_id = value_or<std::string>(j, "stationID", "");
  d.module_sn = value_or<std::string>(j, "moduleSN", "");
  d.device_type = value_or<std::string>(j, "deviceType", "");
  d.has_pv = value_or(j, "hasPV", false);
  d.has_battery = value_or(j, "hasBattery", false);
  auto bat = j.find("battery");
  if (bat != j.end() && !bat->is_null())
    d.battery = *bat;
}

void from_json(const json &j, TelemetryPoint &p) {
  p.key = j.at("variable").get<std::string>();
  auto it = j.find("value");
  p.value = it == j.end() ? DynamicValue() : DynamicValue::decode(*it);
  p.display_name = value_or<std::string>(j, "name", "");
  p.unit = optional_string(j, "unit");
}

void from_json(const json &j, PagedDeviceList &l) {
  l.current_page = value_or(j, "currentPage", 0);
  l.page_size = value_or(j, "pageSize", 0);
  l.total = value_or(j, "total", 0);
  l.data = j.at("data").get<std::vector<Device>>();
}

void from_json(const json &j, RealtimeBlock &b) {
  b.device_sn = j.at("deviceSN").get<std::string>();
  b.datas = value_or(j, "datas", std::vector<TelemetryPoint>{});
}

void to_json(json &j, const DeviceListRequest &r) {
  j = json{{"currentPage", r.current_page}, {"pageSize", r.page_size}};
}

void to_json(json &j, const RealtimeQueryRequest &r) {
  j = json{{"deviceSN", r.device_sn}, {"variables", r.variables}};
}

} // namespace foxess
