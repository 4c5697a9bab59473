#pragma once
#include "dynamic_value.hpp"
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace foxess {

struct Device {
  std::string device_sn; // уникальный серийный номер, обязателен
  std::string station_name;
  std::string station_id;
  std::string module_sn;
  std::string device_type;
  bool has_pv = false;
  bool has_battery = false;
  std::optional<nlohmann::json> battery; // форма не фиксирована, как есть
};

struct TelemetryPoint {
  std::string key; // "variable" в ответе API
  DynamicValue value;
  std::string display_name;
  std::optional<std::string> unit;
};

// result ответа /device/list
struct PagedDeviceList {
  int current_page = 0;
  int page_size = 0;
  int total = 0;
  std::vector<Device> data;
};

// один блок ответа /device/real/query
struct RealtimeBlock {
  std::string device_sn;
  std::vector<TelemetryPoint> datas;
};

struct DeviceListRequest {
  int current_page = 1;
  int page_size = 10;
};

struct RealtimeQueryRequest {
  std::string device_sn;
  std::vector<std::string> variables;
};

struct Config {
  std::string host = "www.foxesscloud.com";
  unsigned short port = 443;
  bool use_tls = true;
  int request_timeout_ms = 30000; // на один HTTP-обмен целиком
  int run_timeout_ms = 60000;     // общий лимит на весь запуск CLI
  int decimals = 2;
  std::string timezone; // пусто = определить автоматически
};

void from_json(const nlohmann::json &j, Device &d);
void from_json(const nlohmann::json &j, TelemetryPoint &p);
void from_json(const nlohmann::json &j, PagedDeviceList &l);
void from_json(const nlohmann::json &j, RealtimeBlock &b);
void to_json(nlohmann::json &j, const DeviceListRequest &r);
void to_json(nlohmann::json &j, const RealtimeQueryRequest &r);

} // namespace foxess
