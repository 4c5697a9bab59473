#pragma once
#include <atomic>
#include <cstdio>
#include <string>

namespace foxess {

// включается флагом --debug
extern std::atomic<bool> g_debug_logging;

inline void set_debug_logging(bool on) {
  g_debug_logging.store(on, std::memory_order_relaxed);
}

inline bool debug_logging() {
  return g_debug_logging.load(std::memory_order_relaxed);
}

inline void log_err(const char *tag, const std::string &msg) {
  std::fprintf(stderr, "[%s] %s\n", tag, msg.c_str());
  std::fflush(stderr);
}

inline void log_dbg(const char *tag, const std::string &msg) {
  if (!debug_logging())
    return;
  std::fprintf(stderr, "[%s] %s\n", tag, msg.c_str());
  std::fflush(stderr);
}

} // namespace foxess
