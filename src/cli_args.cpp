#include "foxess/cli_args.hpp"

#include <cstdio>
#include <stdexcept>

namespace foxess {

CliArgs parse_cli_args(int argc, const char *const *argv) {
  CliArgs a;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];

    if (arg == "--debug") {
      a.debug = true;
    } else if (arg == "--test") {
      a.test = true;
    } else if (arg == "--all") {
      a.show_all = true;
    } else if (arg == "--help" || arg == "-h") {
      a.show_help = true;
    } else if (arg == "--decimals") {
      if (i + 1 >= argc)
        throw std::invalid_argument("--decimals requires a value");
      const std::string v = argv[++i];
      std::size_t used = 0;
      int n = 0;
      try {
        n = std::stoi(v, &used);
      } catch (const std::exception &) {
        throw std::invalid_argument("--decimals: not a number: " + v);
      }
      if (used != v.size() || n < 0 || n > 12)
        throw std::invalid_argument("--decimals must be in 0..12");
      a.decimals = n;
    } else if (arg == "--config") {
      if (i + 1 >= argc)
        throw std::invalid_argument("--config requires a path");
      a.config_path = argv[++i];
    } else if (arg.size() > 2 && arg.compare(0, 2, "--") == 0) {
      a.variables.push_back(arg.substr(2));
    } else if (!arg.empty() && arg[0] != '-') {
      if (!a.api_key)
        a.api_key = arg;
    }
  }
  return a;
}

void print_usage(const char *prog) {
  std::printf(
      "foxess - command line tool to query FoxESS energy data\n"
      "\n"
      "Usage: %s <API_KEY> [options] [variables]\n"
      "\n"
      "Options:\n"
      "  --help, -h           Display this help message\n"
      "  --debug              Enable debug output\n"
      "  --test               Test the API key only\n"
      "  --all                Show all available variables\n"
      "  --decimals N         Decimal places for numeric output (default: 2)\n"
      "  --config PATH        JSON config file (default: foxess.json)\n"
      "\n"
      "Variables (use with --<variable>):\n"
      "  generationPower      Solar generation power\n"
      "  pvPower              PV power\n"
      "  feedinPower          Power feeding into the grid\n"
      "  gridConsumptionPower Power drawn from the grid\n"
      "  loadsPower           Home consumption power\n"
      "  batChargePower       Battery charging power\n"
      "  batDischargePower    Battery discharging power\n"
      "  SoC                  Battery state of charge\n"
      "  batTemperature       Battery temperature\n"
      "  ambientTemperation   Ambient temperature\n"
      "  invTemperation       Inverter temperature\n"
      "  meterPower2          CT2 power reading\n"
      "\n"
      "Example:\n"
      "  %s YOUR_API_KEY --generationPower --SoC\n"
      "  %s YOUR_API_KEY --all\n",
      prog, prog, prog);
}

} // namespace foxess
