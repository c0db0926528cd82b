#pragma once

#include <atomic>
#include <cstdint>

#include "../Hardware/RegisterMap.hpp"

namespace XHCD::Driver {

class HardwareInterface;

namespace DoorbellTarget {
/// Slot 0 target 0: host controller command ring
constexpr uint8_t kCommandRing = 0;
/// DCI of the default control endpoint (EP0 bidirectional)
constexpr uint8_t kDefaultControl = 1;
} // namespace DoorbellTarget

/// Device Context Index for endpoint @p endpointNum (xHCI §4.5.1)
[[nodiscard]] constexpr uint8_t EndpointDci(uint8_t endpointNum, bool in) noexcept {
    if (endpointNum == 0) {
        return DoorbellTarget::kDefaultControl;
    }
    return static_cast<uint8_t>(endpointNum * 2 + (in ? 1 : 0));
}

/// Doorbell register value: DB Stream ID [31:16], DB Target [7:0]
[[nodiscard]] constexpr uint32_t DoorbellValue(uint8_t target, uint16_t streamId) noexcept {
    return (static_cast<uint32_t>(streamId) << 16) | target;
}

/**
 * The doorbell array. Writes are single 32-bit stores with no read-back;
 * callers must have made the ring contents and the pending-completion record
 * visible before ringing.
 */
class DoorbellArray {
public:
    DoorbellArray(HardwareInterface& hw, RegisterLayout layout, uint8_t maxSlots) noexcept
        : hw_(hw), layout_(layout), maxSlots_(maxSlots) {}

    /// Host controller doorbell (slot 0, target 0)
    void RingCommand() noexcept;

    /// Endpoint doorbell. Returns false (and writes nothing) for an out-of-range slot or target.
    bool Ring(uint8_t slotId, uint8_t target, uint16_t streamId = 0) noexcept;

    /// Whether Ring() would write for this slot and target
    [[nodiscard]] bool Accepts(uint8_t slotId, uint8_t target) const noexcept {
        return slotId != 0 && slotId <= maxSlots_ && target != 0 && target <= 31;
    }

    [[nodiscard]] uint64_t RingCount() const noexcept { return rings_.load(std::memory_order_relaxed); }

private:
    HardwareInterface& hw_;
    RegisterLayout layout_;
    uint8_t maxSlots_;
    std::atomic<uint64_t> rings_{0};
};

} // namespace XHCD::Driver
