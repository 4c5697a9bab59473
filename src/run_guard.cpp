#include "foxess/run_guard.hpp"
#include "foxess/log.hpp"

#include <boost/chrono.hpp>
#include <cstdio>
#include <cstdlib>
#include <string>

namespace foxess {

void join_or_exit(boost::thread &worker, int timeout_ms, std::ostream &out) {
  if (worker.try_join_for(boost::chrono::milliseconds(timeout_ms)))
    return;

  log_err("MAIN", "run timed out after " + std::to_string(timeout_ms) + "ms");
  worker.detach();
  out << "Error: request timed out" << std::endl;
  out.flush();
  std::fflush(stdout);
  std::fflush(stderr);
  std::_Exit(1);
}

} // namespace foxess
