#pragma once
#include <boost/thread.hpp>
#include <ostream>

namespace foxess {

// Ждёт рабочий поток не дольше timeout_ms и возвращается после join.
// По таймауту пишет ошибку в out, сбрасывает stdout/stderr и завершает
// процесс через std::_Exit(1): поток ещё жив, статические деструкторы
// запускать нельзя.
void join_or_exit(boost::thread &worker, int timeout_ms, std::ostream &out);

} // namespace foxess
