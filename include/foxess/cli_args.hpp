#pragma once
#include <optional>
#include <string>
#include <vector>

namespace foxess {

struct CliArgs {
  std::optional<std::string> api_key;
  bool debug = false;
  bool test = false;
  bool show_all = false;
  bool show_help = false;
  std::optional<int> decimals;
  std::string config_path = "foxess.json";
  std::vector<std::string> variables; // --generationPower -> "generationPower"
};

// Первый аргумент без "-" считается ключом API, прочие "--x" это запрошенные
// переменные.
// Бросает std::invalid_argument при некорректном --decimals/--config.
CliArgs parse_cli_args(int argc, const char *const *argv);

void print_usage(const char *prog);

} // namespace foxess
