#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace XHCD::Driver {

enum class InterruptMode : uint8_t {
    Polling,  ///< no interrupt file, reactor polls the event ring
    Msi,      ///< MSI/MSI-X: every notification belongs to this controller
    Intx,     ///< shared legacy line: IMAN.IP decides ownership
};

[[nodiscard]] constexpr const char* ToString(InterruptMode mode) noexcept {
    switch (mode) {
        case InterruptMode::Polling: return "polling";
        case InterruptMode::Msi:     return "msi";
        case InterruptMode::Intx:    return "intx";
    }
    return "unknown";
}

// Configuration describing how the controller core sizes its rings and
// services the primary interrupter. Populated by the driver process before
// Initialize() so the core stays free of argument parsing.
struct ControllerConfig {
    size_t commandRingSize{16};          ///< TRBs, including the Link TRB
    size_t transferRingSize{16};         ///< TRBs, including the Link TRB
    size_t eventRingSegmentSize{256};    ///< TRBs per event ring segment
    size_t maxEventRingSegments{4};      ///< growth cap, further limited by ERST_Max
    InterruptMode interruptMode{InterruptMode::Polling};
    std::chrono::milliseconds pollInterval{2};
    uint32_t resetTimeoutUsec{1'000'000};
    uint32_t haltTimeoutUsec{1'000'000};
    uint8_t maxSlots{0};                 ///< 0 = HCSPARAMS1.MaxSlots
    size_t dmaSlabSize{2 * 1024 * 1024};
    bool startReactorThread{true};       ///< false: caller drives IrqReactor::RunOnce()

    static ControllerConfig MakeDefault();

    /// Defaults overlaid with XHCD_POLL_INTERVAL_MS, XHCD_INTERRUPT_MODE
    /// (polling|msi|intx) and XHCD_EVENT_RING_SEGMENTS
    static ControllerConfig FromEnvironment();
};

} // namespace XHCD::Driver
