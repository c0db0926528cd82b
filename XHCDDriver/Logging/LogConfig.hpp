//
// LogConfig.hpp
// XHCDDriver
//
// Runtime logging configuration singleton
// Reads verbosity levels from the process environment and supports runtime updates
//

#ifndef XHCD_LOGGING_LOGCONFIG_HPP
#define XHCD_LOGGING_LOGCONFIG_HPP

#include <stdint.h>
#include <atomic>

namespace XHCD {

/**
 * @brief Centralized logging configuration manager
 *
 * Reads verbosity settings from environment variables:
 * - XHCD_CONTROLLER_VERBOSITY (integer 0-4): controller bring-up and command helpers
 * - XHCD_HARDWARE_VERBOSITY (integer 0-4): register access and interrupter state
 * - XHCD_RINGS_VERBOSITY (integer 0-4): command/transfer/event ring bookkeeping
 * - XHCD_REACTOR_VERBOSITY (integer 0-4): event matching and dispatch
 * - XHCD_DOORBELL_VERBOSITY (integer 0-4): doorbell writes
 * - XHCD_ENABLE_HEX_DUMPS (boolean): TRB dumps at level 4
 * - XHCD_LOG_STATISTICS (boolean): periodic reactor statistics
 *
 * Thread-safe singleton with runtime update support.
 */
class LogConfig {
public:
    /**
     * @brief Get singleton instance
     */
    static LogConfig& Shared();

    /**
     * @brief Initialize from the environment
     *
     * Must be called once during driver start. Later calls are ignored.
     */
    void Initialize();

    // ========================================================================
    // Getters (thread-safe, const)
    // ========================================================================

    uint8_t GetControllerVerbosity() const;
    uint8_t GetHardwareVerbosity() const;
    uint8_t GetRingsVerbosity() const;

    /**
     * @brief Get Reactor subsystem verbosity level (0-4)
     */
    uint8_t GetReactorVerbosity() const;
    uint8_t GetDoorbellVerbosity() const;

    bool IsHexDumpsEnabled() const;
    bool IsStatisticsEnabled() const;
    bool IsInitialized() const;

    // ========================================================================
    // Runtime Setters (thread-safe)
    // ========================================================================

    /**
     * @brief Set Controller verbosity at runtime
     * @param level New verbosity level (0-4, clamped if out of range)
     */
    void SetControllerVerbosity(uint8_t level);
    void SetHardwareVerbosity(uint8_t level);
    void SetRingsVerbosity(uint8_t level);
    void SetReactorVerbosity(uint8_t level);
    void SetDoorbellVerbosity(uint8_t level);
    void SetHexDumps(bool enable);
    void SetStatistics(bool enable);

    /**
     * @brief Clamp verbosity level to valid range [0, 4]
     */
    static uint8_t ClampLevel(uint8_t level);

private:
    LogConfig();
    ~LogConfig();

    // Non-copyable
    LogConfig(const LogConfig&) = delete;
    LogConfig& operator=(const LogConfig&) = delete;

    /**
     * @brief Read a 0-4 level from the environment, falling back to defaultValue
     */
    uint8_t ReadUInt8Env(const char* key, uint8_t defaultValue);

    /**
     * @brief Read a boolean (1/0, true/false, yes/no, on/off) from the environment
     */
    bool ReadBoolEnv(const char* key, bool defaultValue);

    std::atomic<uint8_t> controllerVerbosity_;
    std::atomic<uint8_t> hardwareVerbosity_;
    std::atomic<uint8_t> ringsVerbosity_;
    std::atomic<uint8_t> reactorVerbosity_;
    std::atomic<uint8_t> doorbellVerbosity_;
    std::atomic<bool> enableHexDumps_;
    std::atomic<bool> logStatistics_;
    std::atomic<bool> initialized_;
};

} // namespace XHCD

#endif // XHCD_LOGGING_LOGCONFIG_HPP
