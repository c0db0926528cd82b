#include "Doorbell.hpp"

#include "../Common/BarrierUtils.hpp"
#include "../Hardware/HardwareInterface.hpp"
#include "../Logging/Logging.hpp"

namespace XHCD::Driver {

void DoorbellArray::RingCommand() noexcept {
    // TRB stores must reach memory before the controller is told to fetch
    WriteBarrier();
    hw_.Write(layout_.Doorbell(0), DoorbellValue(DoorbellTarget::kCommandRing, 0));
    rings_.fetch_add(1, std::memory_order_relaxed);
    XHCD_LOG_V3(Doorbell, "DB0 <- command ring");
}

bool DoorbellArray::Ring(uint8_t slotId, uint8_t target, uint16_t streamId) noexcept {
    if (!Accepts(slotId, target)) {
        XHCD_LOG_ERROR(Doorbell, "Doorbell: rejected slot=%u target=%u (maxSlots=%u)",
                       slotId, target, maxSlots_);
        return false;
    }
    WriteBarrier();
    hw_.Write(layout_.Doorbell(slotId), DoorbellValue(target, streamId));
    rings_.fetch_add(1, std::memory_order_relaxed);
    XHCD_LOG_V3(Doorbell, "DB%u <- target=%u stream=%u", slotId, target, streamId);
    return true;
}

} // namespace XHCD::Driver
