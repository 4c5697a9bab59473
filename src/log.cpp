#include "foxess/log.hpp"

namespace foxess {

std::atomic<bool> g_debug_logging{false};

} // namespace foxess
