// Error.hpp - C++23 error handling with std::expected
//
// Rich error context with source location tracking. Every fallible ring,
// reactor and controller operation returns Result<T> instead of a bare kr_t.
//
// Usage:
//   Result<EnqueuedTrb> TrbRing::Enqueue(...) {
//       if (IsFull()) {
//           return XHCD_ERROR_NO_SPACE("TrbRing: enqueue would overrun hardware dequeue");
//       }
//       ...
//   }
//
//   auto slot = ring.Enqueue(...);
//   if (!slot) {
//       slot.error().Log();
//       return std::unexpected(slot.error());
//   }

#pragma once

#include <expected>
#include <string_view>

#include "../Common/ReturnCodes.hpp"
#include "../Logging/Logging.hpp"

namespace XHCD {

// ============================================================================
// Source Location
// ============================================================================

/// Compile-time source location tracking via compiler builtins
struct SourceLocation {
    const char* file;
    const char* function;
    int line;

    constexpr SourceLocation(
        const char* f = __builtin_FILE(),
        const char* fn = __builtin_FUNCTION(),
        int l = __builtin_LINE()) noexcept
        : file(f), function(fn), line(l) {}

    /// Extract filename from full path (strips directory)
    [[nodiscard]] constexpr std::string_view FileName() const noexcept {
        std::string_view path(file);
        auto pos = path.find_last_of('/');
        return (pos != std::string_view::npos) ? path.substr(pos + 1) : path;
    }
};

// ============================================================================
// Error Severity
// ============================================================================

enum class ErrorSeverity : uint8_t {
    /// Caller may retry or continue (ring full, cancelled, hardware completion error)
    Recoverable,

    /// Operation cannot continue (bad argument, mapping lost, out of DMA memory)
    Fatal,

    /// Logged, operation continues
    Warning
};

[[nodiscard]] constexpr const char* ToString(ErrorSeverity severity) noexcept {
    switch (severity) {
        case ErrorSeverity::Recoverable: return "RECOVERABLE";
        case ErrorSeverity::Fatal:       return "FATAL";
        case ErrorSeverity::Warning:     return "WARNING";
    }
    return "UNKNOWN";
}

// ============================================================================
// Error Type
// ============================================================================

struct Error {
    kr_t kr;                       ///< Driver status code
    SourceLocation location;       ///< Capture site (file, line, function)
    ErrorSeverity severity;        ///< Error severity level
    const char* message;           ///< Static human-readable description

    /// Use the XHCD_ERROR_* macros instead of calling this directly
    [[nodiscard]] static constexpr Error Make(
        kr_t kr,
        ErrorSeverity sev,
        const char* msg,
        SourceLocation loc = SourceLocation()) noexcept
    {
        return Error{kr, loc, sev, msg};
    }

    [[nodiscard]] constexpr bool IsRecoverable() const noexcept {
        return severity == ErrorSeverity::Recoverable;
    }

    [[nodiscard]] constexpr bool IsFatal() const noexcept {
        return severity == ErrorSeverity::Fatal;
    }

    [[nodiscard]] constexpr bool IsWarning() const noexcept {
        return severity == ErrorSeverity::Warning;
    }

    /// Log error with full context (file, line, function, message)
    void Log() const noexcept {
        const std::string_view name = location.FileName();
        XHCD_LOG_ERROR(Controller,
                       "[%s] %.*s:%d in %s() - kr=%d/%s (%s)",
                       ToString(severity),
                       static_cast<int>(name.size()), name.data(),
                       location.line,
                       location.function,
                       kr,
                       ReturnCodeName(kr),
                       message);
    }

    /// Log error as warning (for non-fatal errors)
    void LogAsWarning() const noexcept {
        const std::string_view name = location.FileName();
        XHCD_LOG_WARNING(Controller,
                         "[%s] %.*s:%d in %s() - kr=%d/%s (%s)",
                         ToString(severity),
                         static_cast<int>(name.size()), name.data(),
                         location.line,
                         location.function,
                         kr,
                         ReturnCodeName(kr),
                         message);
    }
};

static_assert(sizeof(Error) <= 64, "Error must be cache-line friendly (<=64 bytes)");

// ============================================================================
// Result Type (std::expected alias)
// ============================================================================

template<typename T>
using Result = std::expected<T, Error>;

// ============================================================================
// Error Creation Macros (with automatic source location)
// ============================================================================

#define XHCD_ERROR_RECOVERABLE(kr, msg) \
    std::unexpected(::XHCD::Error::Make((kr), ::XHCD::ErrorSeverity::Recoverable, (msg)))

#define XHCD_ERROR_FATAL(kr, msg) \
    std::unexpected(::XHCD::Error::Make((kr), ::XHCD::ErrorSeverity::Fatal, (msg)))

#define XHCD_ERROR_WARNING(kr, msg) \
    std::unexpected(::XHCD::Error::Make((kr), ::XHCD::ErrorSeverity::Warning, (msg)))

#define XHCD_ERROR_INVALID(msg) \
    XHCD_ERROR_FATAL(kXHCDReturnBadArgument, (msg))

#define XHCD_ERROR_NOT_READY(msg) \
    XHCD_ERROR_RECOVERABLE(kXHCDReturnNotReady, (msg))

#define XHCD_ERROR_TIMEOUT(msg) \
    XHCD_ERROR_RECOVERABLE(kXHCDReturnTimeout, (msg))

#define XHCD_ERROR_NO_MEMORY(msg) \
    XHCD_ERROR_FATAL(kXHCDReturnNoMemory, (msg))

/// Ring full / event ring cannot grow
#define XHCD_ERROR_NO_SPACE(msg) \
    XHCD_ERROR_RECOVERABLE(kXHCDReturnNoSpace, (msg))

/// Request cancelled by ring teardown
#define XHCD_ERROR_ABORTED(msg) \
    XHCD_ERROR_RECOVERABLE(kXHCDReturnAborted, (msg))

/// Malformed hardware state or non-success completion code
#define XHCD_ERROR_IO(msg) \
    XHCD_ERROR_RECOVERABLE(kXHCDReturnIOError, (msg))

// ============================================================================
// Error Propagation Helpers
// ============================================================================

/// Propagate error or extract value (GNU statement expression)
#define XHCD_TRY(expr) \
    ({ \
        auto&& _result = (expr); \
        if (!_result) { \
            return std::unexpected(_result.error()); \
        } \
        std::move(_result).value(); \
    })

/// Propagate error with logging
#define XHCD_TRY_LOG(expr) \
    ({ \
        auto&& _result = (expr); \
        if (!_result) { \
            _result.error().Log(); \
            return std::unexpected(_result.error()); \
        } \
        std::move(_result).value(); \
    })

/// Convert kr_t to Result<void>
[[nodiscard]] inline Result<void> ToResult(kr_t kr, const char* msg,
                                           SourceLocation loc = SourceLocation()) noexcept {
    if (kr == kXHCDReturnSuccess) {
        return {};
    }
    return std::unexpected(Error::Make(kr, ErrorSeverity::Fatal, msg, loc));
}

/// Convert Result<T> to kr_t, logging the error if present
template<typename T>
[[nodiscard]] kr_t ToReturnCode(const Result<T>& result) noexcept {
    if (result) {
        return kXHCDReturnSuccess;
    }
    result.error().Log();
    return result.error().kr;
}

} // namespace XHCD
