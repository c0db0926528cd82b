#pragma once

#include <syslog.h>
#include <time.h>

#include <atomic>
#include <cstdint>

//
// Category-stable logging over syslog(3). Every line carries a "[Category]"
// prefix so journal output can be filtered per subsystem.
//

namespace XHCD::Driver::Logging {

struct Category {
    const char* name;
};

const Category& Controller();
const Category& Hardware();
const Category& Rings();
const Category& Reactor();
const Category& Doorbell();

// Lazily opens the syslog connection (LOG_PID | LOG_PERROR, facility LOG_DAEMON).
void Emit(const Category& category, int priority, const char* fmt, ...)
    __attribute__((format(printf, 3, 4)));

} // namespace XHCD::Driver::Logging

// ----- time helpers -----
namespace XHCD::LogDetail {
inline uint64_t NowNs() {
    timespec ts{};
    clock_gettime(CLOCK_MONOTONIC, &ts);
    return static_cast<uint64_t>(ts.tv_sec) * 1000000000ull + static_cast<uint64_t>(ts.tv_nsec);
}
struct RlState {
    std::atomic<uint64_t> last_ns{0};
    std::atomic<uint64_t> suppressed{0};
};
} // namespace XHCD::LogDetail

// ----- Plain logging -----
#define XHCD_LOG(cat, fmt, ...) \
    XHCD::Driver::Logging::Emit(XHCD::Driver::Logging::cat(), LOG_NOTICE, "[%s] " fmt, #cat, ##__VA_ARGS__)

#define XHCD_LOG_TYPE(cat, prio, fmt, ...) \
    XHCD::Driver::Logging::Emit(XHCD::Driver::Logging::cat(), (prio), "[%s] " fmt, #cat, ##__VA_ARGS__)

// ----- Rate-limited logging -----
// key: per-callsite stable string (e.g. "reactor/lost"); interval_ms: throttle window
#define XHCD_LOG_RL(cat, key, interval_ms, prio, fmt, ...)                                      \
    do {                                                                                        \
        static XHCD::LogDetail::RlState _s;                                                     \
        const uint64_t _now = XHCD::LogDetail::NowNs();                                         \
        const uint64_t _intv = (uint64_t)(interval_ms) * 1000000ull;                            \
        uint64_t _last = _s.last_ns.load(std::memory_order_relaxed);                            \
        if (_now - _last >= _intv || _last == 0) {                                              \
            if (_s.last_ns.exchange(_now, std::memory_order_relaxed) != 0) {                    \
                uint64_t _lost = _s.suppressed.exchange(0, std::memory_order_relaxed);          \
                if (_lost) {                                                                    \
                    XHCD::Driver::Logging::Emit(XHCD::Driver::Logging::cat(), (prio),           \
                        "[%s][%s] (suppressed=%llu prior)", #cat, key,                          \
                        (unsigned long long)_lost);                                             \
                }                                                                               \
            }                                                                                   \
            XHCD::Driver::Logging::Emit(XHCD::Driver::Logging::cat(), (prio),                   \
                "[%s][%s] " fmt, #cat, key, ##__VA_ARGS__);                                     \
        } else {                                                                                \
            _s.suppressed.fetch_add(1, std::memory_order_relaxed);                              \
        }                                                                                       \
    } while (0)

// Convenience shorthands
#define XHCD_LOG_INFO(cat, fmt, ...)    XHCD_LOG_TYPE(cat, LOG_INFO,    fmt, ##__VA_ARGS__)
#define XHCD_LOG_ERROR(cat, fmt, ...)   XHCD_LOG_TYPE(cat, LOG_ERR,     fmt, ##__VA_ARGS__)
#define XHCD_LOG_WARNING(cat, fmt, ...) XHCD_LOG_TYPE(cat, LOG_WARNING, fmt, ##__VA_ARGS__)
#define XHCD_LOG_DEBUG(cat, fmt, ...)   XHCD_LOG_TYPE(cat, LOG_DEBUG,   fmt, ##__VA_ARGS__)
#define XHCD_LOG_FAULT(cat, fmt, ...)   XHCD_LOG_TYPE(cat, LOG_CRIT,    fmt, ##__VA_ARGS__)

// ----- Site-aware logging -----
#ifndef __FILE_NAME__
#define __FILE_NAME__ __FILE__
#endif

#define XHCD_LOG_SITE(cat, fmt, ...) \
    XHCD::Driver::Logging::Emit(XHCD::Driver::Logging::cat(), LOG_NOTICE, "[%s] %s:%d %s | " fmt, \
                                #cat, __FILE_NAME__, __LINE__, __func__, ##__VA_ARGS__)

// ============================================================================
// Runtime Verbosity-Aware Logging Macros
// ============================================================================
//
// Usage:
//   XHCD_LOG_V0(Reactor, "Event ring full, growth failed");   // always
//   XHCD_LOG_V1(Reactor, "cmd slot=%u ok", slot);             // compact summaries
//   XHCD_LOG_V2(Rings, "cycle toggled");                      // key transitions
//   XHCD_LOG_V3(Reactor, "scan record %zu");                  // detailed flow
//   XHCD_LOG_V4(Rings, "trb dump ...");                       // full diagnostics
//
// Levels come from XHCD_<CATEGORY>_VERBOSITY environment variables, see LogConfig.
//

namespace XHCD {
class LogConfig;
}

#define XHCD_GET_VERBOSITY(category) \
    (XHCD::LogConfig::Shared().Get##category##Verbosity())

#define XHCD_LOG_V0(category, fmt, ...) \
    do { \
        if (XHCD_GET_VERBOSITY(category) >= 0) { \
            XHCD_LOG(category, fmt, ##__VA_ARGS__); \
        } \
    } while (0)

#define XHCD_LOG_V1(category, fmt, ...) \
    do { \
        if (XHCD_GET_VERBOSITY(category) >= 1) { \
            XHCD_LOG(category, fmt, ##__VA_ARGS__); \
        } \
    } while (0)

#define XHCD_LOG_V2(category, fmt, ...) \
    do { \
        if (XHCD_GET_VERBOSITY(category) >= 2) { \
            XHCD_LOG(category, fmt, ##__VA_ARGS__); \
        } \
    } while (0)

#define XHCD_LOG_V3(category, fmt, ...) \
    do { \
        if (XHCD_GET_VERBOSITY(category) >= 3) { \
            XHCD_LOG_DEBUG(category, fmt, ##__VA_ARGS__); \
        } \
    } while (0)

#define XHCD_LOG_V4(category, fmt, ...) \
    do { \
        if (XHCD_GET_VERBOSITY(category) >= 4) { \
            XHCD_LOG_DEBUG(category, fmt, ##__VA_ARGS__); \
        } \
    } while (0)

// Hex dumps: require both the hex-dump flag and level 4
#define XHCD_LOG_HEX(category, fmt, ...) \
    do { \
        if (XHCD::LogConfig::Shared().IsHexDumpsEnabled() && \
            XHCD_GET_VERBOSITY(category) >= 4) { \
            XHCD_LOG_DEBUG(category, fmt, ##__VA_ARGS__); \
        } \
    } while (0)

// Macros above need the full LogConfig definition at the call site.
#include "LogConfig.hpp"
