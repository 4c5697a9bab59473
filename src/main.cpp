#include "foxess/cli_args.hpp"
#include "foxess/config.hpp"
#include "foxess/errors.hpp"
#include "foxess/http_transport.hpp"
#include "foxess/log.hpp"
#include "foxess/report.hpp"
#include "foxess/run_guard.hpp"
#include "foxess/summary.hpp"
#include "foxess/telemetry_session.hpp"

#include <atomic>
#include <boost/thread.hpp>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <sstream>

static void term_handler() {
  try {
    throw; // поймать текущее исключение
  } catch (const std::exception &e) {
    std::fprintf(stderr, "[FATAL] std::terminate: %s\n", e.what());
  } catch (...) {
    std::fprintf(stderr, "[FATAL] std::terminate: unknown exception\n");
  }
  std::fflush(stderr);
  std::abort();
}

namespace {

// Один запуск: ключ -> устройство -> телеметрия -> вывод.
// Вывод копится в out и печатается после завершения рабочего потока.
int run(const foxess::CliArgs &args, const foxess::Config &cfg,
        std::ostream &out) {
  foxess::BeastHttpTransport transport(cfg);
  foxess::TelemetrySession session(cfg, transport, *args.api_key);

  if (args.test) {
    if (session.test_authentication()) {
      out << "API Key is valid\n";
      return 0;
    }
    out << "API Key is invalid or there was a connection problem\n";
    return 1;
  }

  session.authenticate();

  const auto devices = session.list_devices();
  if (devices.empty()) {
    out << "No devices found for this account\n";
    return 0;
  }

  const auto &device = devices.front();
  foxess::log_dbg("MAIN", "found device: " + device.station_name + " (" +
                              device.device_sn + ")");

  const auto points = session.fetch_realtime(device.device_sn);
  const int decimals = args.decimals.value_or(cfg.decimals);

  if (args.show_all) {
    foxess::render_all(out, points, decimals);
  } else if (!args.variables.empty()) {
    foxess::render_selected(out, points, args.variables, decimals);
  } else {
    foxess::render_summary(out, foxess::summarize(points, device), decimals);
  }
  return 0;
}

} // namespace

int main(int argc, char **argv) {
  std::set_terminate(term_handler);

  foxess::CliArgs args;
  try {
    args = foxess::parse_cli_args(argc, argv);
  } catch (const std::invalid_argument &e) {
    std::fprintf(stderr, "Error: %s\n", e.what());
    foxess::print_usage(argv[0]);
    return 2;
  }

  if (args.show_help) {
    foxess::print_usage(argv[0]);
    return 0;
  }
  if (!args.api_key) {
    std::fprintf(stderr, "Error: No API key provided\n");
    std::fprintf(stderr, "Use --help for usage information\n");
    return 2;
  }

  foxess::set_debug_logging(args.debug);

  foxess::Config cfg;
  try {
    cfg = foxess::load_config(args.config_path);
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  // Весь конвейер в рабочем потоке, основной ждёт не дольше run_timeout_ms.
  // Состояние общее через shared_ptr: при таймауте процесс выходит сразу.
  struct Outcome {
    std::ostringstream out;
    std::string error;
    std::atomic<int> code{1};
  };
  auto outcome = std::make_shared<Outcome>();

  boost::thread worker([outcome, args, cfg] {
    try {
      outcome->code = run(args, cfg, outcome->out);
    } catch (const foxess::ApiError &e) {
      outcome->error = e.what();
      outcome->code = 1;
    } catch (const std::exception &e) {
      outcome->error = std::string("unexpected failure: ") + e.what();
      outcome->code = 1;
    }
  });

  foxess::join_or_exit(worker, cfg.run_timeout_ms, std::cout);

  std::cout << outcome->out.str();
  if (!outcome->error.empty())
    std::cout << "Error: " << outcome->error << std::endl;
  foxess::log_dbg("MAIN", "done");
  return outcome->code;
}
