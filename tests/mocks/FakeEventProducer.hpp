#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>

#include "FakeXhciRegisters.hpp"
#include "XHCDDriver/Hardware/XHCITrb.hpp"
#include "XHCDDriver/Rings/EventRing.hpp"
#include "XHCDDriver/Shared/Memory/IDMAMemory.hpp"

namespace XHCD::Testing {

/**
 * Plays the controller side of the primary event ring and, optionally, the
 * command ring.
 *
 * Segment addresses are read back from ERSTBA/ERSTSZ and the segment table
 * in DMA memory, so the producer sees exactly what software programmed,
 * including segments added by growth.
 */
class FakeEventProducer {
public:
    FakeEventProducer(FakeXhciRegisters& regs, Shared::IDMAMemory& dma) : regs_(regs), dma_(dma) {}

    // ----- event ring -----

    /// Write @p trb at the producer enqueue slot with the producer cycle state
    uint64_t Post(HW::Trb trb) {
        std::lock_guard guard(lock_);
        const uint64_t iova = SegmentAddress(segment_) + index_ * sizeof(HW::Trb);
        auto* slot = static_cast<volatile HW::Trb*>(dma_.IOVAToVirt(iova));

        trb.SetCycle(pcs_);
        slot->dataLow = trb.dataLow;
        slot->dataHigh = trb.dataHigh;
        slot->status = trb.status;
        std::atomic_thread_fence(std::memory_order_release);
        slot->control = trb.control;

        index_++;
        if (index_ == SegmentSize(segment_)) {
            index_ = 0;
            segment_++;
            if (segment_ >= ErstSize()) {
                segment_ = 0;
                pcs_ = !pcs_;
            }
        }
        posted_++;
        return iova;
    }

    uint64_t PostCommandCompletion(uint64_t commandTrb, HW::CompletionCode code, uint8_t slotId = 0,
                                   uint32_t param = 0) {
        return Post(HW::Trb::Make(commandTrb, (static_cast<uint32_t>(code) << 24) | (param & 0xFFFFFF),
                                  TypeBits(HW::TrbType::CommandCompletion) | (static_cast<uint32_t>(slotId) << 24)));
    }

    uint64_t PostTransfer(uint64_t transferTrb, HW::CompletionCode code, uint8_t slotId, uint8_t dci,
                          uint32_t residue = 0, bool eventData = false) {
        return Post(HW::Trb::Make(transferTrb, (static_cast<uint32_t>(code) << 24) | (residue & 0xFFFFFF),
                                  TypeBits(HW::TrbType::Transfer) | (static_cast<uint32_t>(slotId) << 24) |
                                  (static_cast<uint32_t>(dci & 0x1F) << 16) |
                                  (eventData ? HW::TrbField::kEventDataBit : 0u)));
    }

    uint64_t PostPortStatusChange(uint8_t port) {
        return Post(HW::Trb::Make(static_cast<uint64_t>(port) << 24,
                                  static_cast<uint32_t>(HW::CompletionCode::Success) << 24,
                                  TypeBits(HW::TrbType::PortStatusChange)));
    }

    uint64_t PostHostController(HW::CompletionCode code) {
        return Post(HW::Trb::Make(0, static_cast<uint32_t>(code) << 24, TypeBits(HW::TrbType::HostController)));
    }

    uint64_t PostEvent(HW::TrbType type, HW::CompletionCode code = HW::CompletionCode::Success) {
        return Post(HW::Trb::Make(0, static_cast<uint32_t>(code) << 24, TypeBits(type)));
    }

    [[nodiscard]] uint64_t Posted() const {
        std::lock_guard guard(lock_);
        return posted_;
    }

    // ----- command ring -----

    /**
     * Execute every command TRB software has handed over since the last call
     * and post a completion for each. Enable Slot completions carry
     * increasing slot ids.
     */
    size_t ProcessCommandRing(HW::CompletionCode code = HW::CompletionCode::Success) {
        size_t completed = 0;
        for (;;) {
            uint64_t pointer = 0;
            HW::Trb trb{};
            {
                std::lock_guard guard(lock_);
                if (!commandDequeue_) {
                    const uint64_t crcr = regs_.Peek64(regs_.Op(Driver::OpReg::kCrcrLo));
                    commandDequeue_ = crcr & ~uint64_t{0x3F};
                    commandCycle_ = (crcr & 0x1) != 0;
                }
                pointer = *commandDequeue_;
                const auto* slot = static_cast<const volatile HW::Trb*>(dma_.IOVAToVirt(pointer));
                trb.control = slot->control;
                std::atomic_thread_fence(std::memory_order_acquire);
                trb.dataLow = slot->dataLow;
                trb.dataHigh = slot->dataHigh;
                trb.status = slot->status;
                if (trb.Cycle() != commandCycle_) {
                    return completed;
                }
                if (trb.Type() == HW::TrbType::Link) {
                    commandDequeue_ = trb.Data() & ~uint64_t{0xF};
                    if (trb.control & HW::TrbField::kToggleCycleBit) {
                        commandCycle_ = !commandCycle_;
                    }
                    continue;
                }
                *commandDequeue_ += sizeof(HW::Trb);
            }
            const uint8_t slotId = trb.Type() == HW::TrbType::EnableSlot ? ++lastSlot_ : trb.SlotId();
            PostCommandCompletion(pointer, code, slotId);
            completed++;
        }
    }

private:
    [[nodiscard]] static constexpr uint32_t TypeBits(HW::TrbType type) noexcept {
        return static_cast<uint32_t>(type) << HW::TrbField::kTypeShift;
    }

    [[nodiscard]] uint32_t ErstSize() const {
        return regs_.Peek(regs_.Intr(Driver::InterrupterReg::kErstSz)) & 0xFFFF;
    }

    [[nodiscard]] const Rings::ErstEntry& Entry(size_t segment) const {
        const uint64_t erstba = regs_.Peek64(regs_.Intr(Driver::InterrupterReg::kErstBaLo));
        const auto* table = static_cast<const Rings::ErstEntry*>(dma_.IOVAToVirt(erstba));
        return table[segment];
    }

    [[nodiscard]] uint64_t SegmentAddress(size_t segment) const {
        const auto& e = Entry(segment);
        return static_cast<uint64_t>(e.addressLow) | (static_cast<uint64_t>(e.addressHigh) << 32);
    }

    [[nodiscard]] size_t SegmentSize(size_t segment) const { return Entry(segment).size; }

    FakeXhciRegisters& regs_;
    Shared::IDMAMemory& dma_;

    mutable std::mutex lock_;
    size_t segment_{0};
    size_t index_{0};
    bool pcs_{true};
    uint64_t posted_{0};

    std::optional<uint64_t> commandDequeue_;
    bool commandCycle_{true};
    uint8_t lastSlot_{0};
};

} // namespace XHCD::Testing
