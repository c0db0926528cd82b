#include "ControllerConfig.hpp"

#include <cerrno>
#include <cstdlib>
#include <strings.h>

#include "../Logging/Logging.hpp"

namespace XHCD::Driver {

namespace {

bool ParseUnsigned(const char* key, unsigned long& out) {
    const char* raw = std::getenv(key);
    if (raw == nullptr || *raw == '\0') {
        return false;
    }
    errno = 0;
    char* end = nullptr;
    const unsigned long value = std::strtoul(raw, &end, 10);
    if (errno != 0 || end == raw || *end != '\0') {
        XHCD_LOG_ERROR(Controller, "ControllerConfig: %s='%s' is not a number, ignored", key, raw);
        return false;
    }
    out = value;
    return true;
}

} // namespace

ControllerConfig ControllerConfig::MakeDefault() {
    ControllerConfig config;
    config.commandRingSize = 16;
    config.transferRingSize = 16;
    config.eventRingSegmentSize = 256;
    config.maxEventRingSegments = 4;
    config.interruptMode = InterruptMode::Polling;
    config.pollInterval = std::chrono::milliseconds(2);
    config.resetTimeoutUsec = 1'000'000;
    config.haltTimeoutUsec = 1'000'000;
    config.maxSlots = 0;
    config.dmaSlabSize = 2 * 1024 * 1024;
    config.startReactorThread = true;
    return config;
}

ControllerConfig ControllerConfig::FromEnvironment() {
    ControllerConfig config = MakeDefault();

    unsigned long value = 0;
    if (ParseUnsigned("XHCD_POLL_INTERVAL_MS", value)) {
        config.pollInterval = std::chrono::milliseconds(value == 0 ? 1 : value);
    }
    if (ParseUnsigned("XHCD_EVENT_RING_SEGMENTS", value) && value > 0) {
        config.maxEventRingSegments = static_cast<size_t>(value);
    }

    if (const char* mode = std::getenv("XHCD_INTERRUPT_MODE"); mode != nullptr && *mode != '\0') {
        if (strcasecmp(mode, "polling") == 0) {
            config.interruptMode = InterruptMode::Polling;
        } else if (strcasecmp(mode, "msi") == 0) {
            config.interruptMode = InterruptMode::Msi;
        } else if (strcasecmp(mode, "intx") == 0) {
            config.interruptMode = InterruptMode::Intx;
        } else {
            XHCD_LOG_ERROR(Controller, "ControllerConfig: unknown XHCD_INTERRUPT_MODE '%s', using %s",
                           mode, ToString(config.interruptMode));
        }
    }

    XHCD_LOG_INFO(Controller, "ControllerConfig: mode=%s poll=%lldms erstSegments<=%zu",
                  ToString(config.interruptMode),
                  static_cast<long long>(config.pollInterval.count()),
                  config.maxEventRingSegments);
    return config;
}

} // namespace XHCD::Driver
