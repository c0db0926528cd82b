// syslog backend: one process-wide connection, categories visible via message prefix.
#include "Logging.hpp"

#include <cstdarg>
#include <mutex>

namespace {
std::once_flag gOpenOnce;

inline XHCD::Driver::Logging::Category MakeCategory(const char* category) {
    return XHCD::Driver::Logging::Category{category};
}
} // namespace

namespace XHCD::Driver::Logging {

const Category& Controller() { static const Category log = MakeCategory("controller"); return log; }
const Category& Hardware()   { static const Category log = MakeCategory("hardware");   return log; }
const Category& Rings()      { static const Category log = MakeCategory("rings");      return log; }
const Category& Reactor()    { static const Category log = MakeCategory("reactor");    return log; }
const Category& Doorbell()   { static const Category log = MakeCategory("doorbell");   return log; }

void Emit(const Category& category, int priority, const char* fmt, ...) {
    (void)category; // name already in the "[Category]" prefix
    std::call_once(gOpenOnce, [] {
        openlog("xhcd", LOG_PID | LOG_PERROR, LOG_DAEMON);
    });

    va_list args;
    va_start(args, fmt);
    vsyslog(priority, fmt, args);
    va_end(args);
}

} // namespace XHCD::Driver::Logging
