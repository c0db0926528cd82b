#pragma once

#include <cstdint>

// Driver-wide status codes. Negative values are failures; 0 is success.
using kr_t = int32_t;

constexpr kr_t kXHCDReturnSuccess      = 0;
constexpr kr_t kXHCDReturnError        = -1;
constexpr kr_t kXHCDReturnNoMemory     = -2;
constexpr kr_t kXHCDReturnNoSpace      = -3;
constexpr kr_t kXHCDReturnBadArgument  = -4;
constexpr kr_t kXHCDReturnNotReady     = -5;
constexpr kr_t kXHCDReturnTimeout      = -6;
constexpr kr_t kXHCDReturnAborted      = -7;
constexpr kr_t kXHCDReturnIOError      = -8;
constexpr kr_t kXHCDReturnUnderrun     = -9;
constexpr kr_t kXHCDReturnNotFound     = -10;
constexpr kr_t kXHCDReturnBusy         = -11;

[[nodiscard]] constexpr const char* ReturnCodeName(kr_t kr) noexcept {
    switch (kr) {
        case kXHCDReturnSuccess:     return "Success";
        case kXHCDReturnError:       return "Error";
        case kXHCDReturnNoMemory:    return "NoMemory";
        case kXHCDReturnNoSpace:     return "NoSpace";
        case kXHCDReturnBadArgument: return "BadArgument";
        case kXHCDReturnNotReady:    return "NotReady";
        case kXHCDReturnTimeout:     return "Timeout";
        case kXHCDReturnAborted:     return "Aborted";
        case kXHCDReturnIOError:     return "IOError";
        case kXHCDReturnUnderrun:    return "Underrun";
        case kXHCDReturnNotFound:    return "NotFound";
        case kXHCDReturnBusy:        return "Busy";
    }
    return "Unknown";
}
