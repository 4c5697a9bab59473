#include "foxess/config.hpp"

#include <fstream>
#include <stdexcept>
#include <type_traits>

using json = nlohmann::json;

namespace foxess {

Config apply_config(const json &j, Config c) {
  if (!j.is_object())
    throw std::runtime_error("config: top-level value must be an object");

  auto get = [&](auto key, auto def) {
    return j.contains(key) ? j[key].template get<std::decay_t<decltype(def)>>()
                           : def;
  };

  try {
    c.host = get("host", c.host);
    c.port = static_cast<unsigned short>(get("port", (int)c.port));
    c.use_tls = get("use_tls", c.use_tls);
    c.request_timeout_ms = get("request_timeout_ms", c.request_timeout_ms);
    c.run_timeout_ms = get("run_timeout_ms", c.run_timeout_ms);
    c.decimals = get("decimals", c.decimals);
    c.timezone = get("timezone", c.timezone);
  } catch (const json::exception &e) {
    throw std::runtime_error(std::string("config: ") + e.what());
  }

  if (c.request_timeout_ms <= 0 || c.run_timeout_ms <= 0)
    throw std::runtime_error("config: timeouts must be positive");
  return c;
}

Config load_config(const std::string &path) {
  Config c;
  std::ifstream f(path);
  if (!f)
    return c;

  json j;
  try {
    f >> j;
  } catch (const json::parse_error &e) {
    throw std::runtime_error("config " + path + ": " + e.what());
  }
  return apply_config(j, c);
}

} // namespace foxess
