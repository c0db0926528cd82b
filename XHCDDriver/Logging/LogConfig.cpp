//
// LogConfig.cpp
// XHCDDriver
//
// Runtime logging configuration implementation
//

#include "LogConfig.hpp"
#include "Logging.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <strings.h>

namespace XHCD {

// ============================================================================
// Singleton Access
// ============================================================================

LogConfig& LogConfig::Shared() {
    static LogConfig instance;
    return instance;
}

// ============================================================================
// Constructor / Destructor
// ============================================================================

LogConfig::LogConfig()
{
    controllerVerbosity_.store(1);      // Default: Compact
    hardwareVerbosity_.store(1);
    ringsVerbosity_.store(1);
    reactorVerbosity_.store(1);
    doorbellVerbosity_.store(1);
    enableHexDumps_.store(false);       // Default: No hex dumps
    logStatistics_.store(true);         // Default: Show statistics
    initialized_.store(false);
}

LogConfig::~LogConfig() = default;

// ============================================================================
// Initialization
// ============================================================================

void LogConfig::Initialize() {
    if (initialized_.exchange(true)) {
        XHCD_LOG(Controller, "LogConfig already initialized, skipping");
        return;
    }

    controllerVerbosity_.store(ReadUInt8Env("XHCD_CONTROLLER_VERBOSITY", 1));
    hardwareVerbosity_.store(ReadUInt8Env("XHCD_HARDWARE_VERBOSITY", 1));
    ringsVerbosity_.store(ReadUInt8Env("XHCD_RINGS_VERBOSITY", 1));
    reactorVerbosity_.store(ReadUInt8Env("XHCD_REACTOR_VERBOSITY", 1));
    doorbellVerbosity_.store(ReadUInt8Env("XHCD_DOORBELL_VERBOSITY", 1));
    enableHexDumps_.store(ReadBoolEnv("XHCD_ENABLE_HEX_DUMPS", false));
    logStatistics_.store(ReadBoolEnv("XHCD_LOG_STATISTICS", true));

    XHCD_LOG_INFO(Controller,
                  "LogConfig initialized: Controller=%u Hardware=%u Rings=%u Reactor=%u Doorbell=%u HexDumps=%d Stats=%d",
                  controllerVerbosity_.load(), hardwareVerbosity_.load(), ringsVerbosity_.load(),
                  reactorVerbosity_.load(), doorbellVerbosity_.load(),
                  enableHexDumps_.load(), logStatistics_.load());
}

// ============================================================================
// Getters (Thread-Safe)
// ============================================================================

uint8_t LogConfig::GetControllerVerbosity() const {
    return controllerVerbosity_.load(std::memory_order_relaxed);
}

uint8_t LogConfig::GetHardwareVerbosity() const {
    return hardwareVerbosity_.load(std::memory_order_relaxed);
}

uint8_t LogConfig::GetRingsVerbosity() const {
    return ringsVerbosity_.load(std::memory_order_relaxed);
}

uint8_t LogConfig::GetReactorVerbosity() const {
    return reactorVerbosity_.load(std::memory_order_relaxed);
}

uint8_t LogConfig::GetDoorbellVerbosity() const {
    return doorbellVerbosity_.load(std::memory_order_relaxed);
}

bool LogConfig::IsHexDumpsEnabled() const {
    return enableHexDumps_.load(std::memory_order_relaxed);
}

bool LogConfig::IsStatisticsEnabled() const {
    return logStatistics_.load(std::memory_order_relaxed);
}

bool LogConfig::IsInitialized() const {
    return initialized_.load(std::memory_order_relaxed);
}

// ============================================================================
// Runtime Setters (Thread-Safe)
// ============================================================================

void LogConfig::SetControllerVerbosity(uint8_t level) {
    level = ClampLevel(level);
    controllerVerbosity_.store(level, std::memory_order_relaxed);
    XHCD_LOG_INFO(Controller, "Controller verbosity changed to %u", level);
}

void LogConfig::SetHardwareVerbosity(uint8_t level) {
    level = ClampLevel(level);
    hardwareVerbosity_.store(level, std::memory_order_relaxed);
    XHCD_LOG_INFO(Controller, "Hardware verbosity changed to %u", level);
}

void LogConfig::SetRingsVerbosity(uint8_t level) {
    level = ClampLevel(level);
    ringsVerbosity_.store(level, std::memory_order_relaxed);
    XHCD_LOG_INFO(Controller, "Rings verbosity changed to %u", level);
}

void LogConfig::SetReactorVerbosity(uint8_t level) {
    level = ClampLevel(level);
    reactorVerbosity_.store(level, std::memory_order_relaxed);
    XHCD_LOG_INFO(Controller, "Reactor verbosity changed to %u", level);
}

void LogConfig::SetDoorbellVerbosity(uint8_t level) {
    level = ClampLevel(level);
    doorbellVerbosity_.store(level, std::memory_order_relaxed);
    XHCD_LOG_INFO(Controller, "Doorbell verbosity changed to %u", level);
}

void LogConfig::SetHexDumps(bool enable) {
    enableHexDumps_.store(enable, std::memory_order_relaxed);
    XHCD_LOG_INFO(Controller, "Hex dumps %s", enable ? "enabled" : "disabled");
}

void LogConfig::SetStatistics(bool enable) {
    logStatistics_.store(enable, std::memory_order_relaxed);
    XHCD_LOG_INFO(Controller, "Statistics logging %s", enable ? "enabled" : "disabled");
}

// ============================================================================
// Private Helpers
// ============================================================================

uint8_t LogConfig::ReadUInt8Env(const char* key, uint8_t defaultValue) {
    const char* raw = std::getenv(key);
    if (raw == nullptr || *raw == '\0') {
        XHCD_LOG_DEBUG(Controller, "LogConfig: %s not set, using default %u", key, defaultValue);
        return defaultValue;
    }

    errno = 0;
    char* end = nullptr;
    const long parsed = std::strtol(raw, &end, 10);
    if (errno != 0 || end == raw || *end != '\0' || parsed < 0) {
        XHCD_LOG_ERROR(Controller, "LogConfig: %s='%s' is not a level, using default %u",
                       key, raw, defaultValue);
        return defaultValue;
    }

    const uint8_t level = ClampLevel(parsed > 255 ? 255 : static_cast<uint8_t>(parsed));
    XHCD_LOG_DEBUG(Controller, "LogConfig: %s = %u (from environment)", key, level);
    return level;
}

bool LogConfig::ReadBoolEnv(const char* key, bool defaultValue) {
    const char* raw = std::getenv(key);
    if (raw == nullptr || *raw == '\0') {
        XHCD_LOG_DEBUG(Controller, "LogConfig: %s not set, using default %d", key, defaultValue);
        return defaultValue;
    }

    if (std::strcmp(raw, "1") == 0 || strcasecmp(raw, "true") == 0 ||
        strcasecmp(raw, "yes") == 0 || strcasecmp(raw, "on") == 0) {
        return true;
    }
    if (std::strcmp(raw, "0") == 0 || strcasecmp(raw, "false") == 0 ||
        strcasecmp(raw, "no") == 0 || strcasecmp(raw, "off") == 0) {
        return false;
    }

    XHCD_LOG_ERROR(Controller, "LogConfig: %s='%s' is not a boolean, using default %d",
                   key, raw, defaultValue);
    return defaultValue;
}

uint8_t LogConfig::ClampLevel(uint8_t level) {
    return (level > 4) ? 4 : level;
}

} // namespace XHCD
