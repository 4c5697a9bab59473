#pragma once
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace foxess {

// Нет файла -> значения по умолчанию. Битый JSON -> std::runtime_error.
Config load_config(const std::string &path);

// Поверх cfg применяются только присутствующие ключи.
Config apply_config(const nlohmann::json &j, Config cfg);

} // namespace foxess
