#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <span>

#include "../Core/Error.hpp"
#include "../Hardware/XHCITrb.hpp"
#include "../Shared/Memory/IDMAMemory.hpp"

namespace XHCD::Rings {

/// Result of one enqueue: where the TRB landed and the cycle it was written with
struct EnqueuedTrb {
    size_t index{0};
    bool cycle{false};
    uint64_t physAddr{0};
};

/**
 * Producer ring (command ring or transfer ring, xHCI §4.9.2).
 *
 * The last slot is reserved for a Link TRB back to slot 0 with Toggle Cycle
 * set. Every TRB the hardware may read carries the producer cycle state in
 * effect when it was written; every stale slot carries the opposite.
 *
 * Not internally locked: owners wrap it in LockedTrbRing.
 */
class TrbRing {
public:
    TrbRing() = default;
    ~TrbRing();

    /**
     * Allocate @p trbCount slots (including the Link slot) from @p dma.
     * @p ac64 false means the controller only decodes 32-bit addresses.
     */
    [[nodiscard]] Result<void> Initialize(Shared::IDMAMemory& dma, size_t trbCount, bool ac64 = true);

    /**
     * Return the storage to the DMA allocator. Storage is only released when
     * the hardware has consumed everything that was enqueued; otherwise it is
     * quarantined (never reused) and false is returned.
     */
    bool Release() noexcept;

    /**
     * Write one TRB built by @p build(cycle) at the enqueue index.
     *
     * The cycle bit of the built TRB is forced to the current producer cycle.
     * Fails with kXHCDReturnNoSpace if the slot would overwrite a TRB the
     * hardware has not yet consumed.
     */
    template <typename Builder>
    [[nodiscard]] Result<EnqueuedTrb> Enqueue(Builder&& build) {
        if (!IsInitialized()) {
            return XHCD_ERROR_NOT_READY("TrbRing: enqueue on uninitialized ring");
        }
        if (IsFull()) {
            return XHCD_ERROR_NO_SPACE("TrbRing: enqueue would overrun hardware dequeue");
        }
        const HW::Trb trb = build(cycle_);
        return WriteNext(trb);
    }

    /// Enqueue a prebuilt TRB (cycle bit is overwritten)
    [[nodiscard]] Result<EnqueuedTrb> EnqueueTrb(const HW::Trb& trb);

    /// Enqueue pointer OR'd with the producer cycle state (CRCR / TR Dequeue format)
    [[nodiscard]] uint64_t Register() const noexcept;

    [[nodiscard]] uint64_t TrbPhysAddr(size_t index) const noexcept;
    [[nodiscard]] std::optional<size_t> PhysToIndex(uint64_t physAddr) const noexcept;
    [[nodiscard]] bool Contains(uint64_t physAddr) const noexcept { return PhysToIndex(physAddr).has_value(); }

    /// Snapshot of the slot at @p index (after a device fetch barrier)
    [[nodiscard]] HW::Trb EntryAt(size_t index) const noexcept;
    [[nodiscard]] std::optional<HW::Trb> EntryAtPhys(uint64_t physAddr) const noexcept;

    /**
     * Mark a consumed slot as free: type Reserved, parameters cleared, cycle
     * bit preserved so the hardware still sees it as stale on the next lap.
     */
    void ReleaseSlot(size_t index) noexcept;

    /**
     * Record that the hardware finished the TRB at @p physAddr. Moves the
     * last-known dequeue position just past it. Stale or out-of-window
     * pointers are ignored; the dequeue never moves backward.
     */
    bool AdvanceDequeue(uint64_t physAddr) noexcept;

    [[nodiscard]] bool IsInitialized() const noexcept { return trbs_.data() != nullptr; }
    [[nodiscard]] bool IsFull() const noexcept;
    /// Nothing enqueued that the hardware has not reported back
    [[nodiscard]] bool IsIdle() const noexcept;
    [[nodiscard]] size_t InFlight() const noexcept;
    [[nodiscard]] size_t FreeSlots() const noexcept;

    /// Total slots including the Link TRB
    [[nodiscard]] size_t Capacity() const noexcept { return trbs_.size(); }
    [[nodiscard]] size_t EnqueueIndex() const noexcept { return enqueue_; }
    [[nodiscard]] size_t DequeueIndex() const noexcept { return dequeue_; }
    [[nodiscard]] bool Cycle() const noexcept { return cycle_; }
    [[nodiscard]] uint64_t BaseIOVA() const noexcept { return region_.deviceBase; }
    [[nodiscard]] uint64_t WrapCount() const noexcept { return wraps_; }

    TrbRing(const TrbRing&) = delete;
    TrbRing& operator=(const TrbRing&) = delete;

private:
    [[nodiscard]] Result<EnqueuedTrb> WriteNext(const HW::Trb& trb);
    void StoreSlot(size_t index, const HW::Trb& trb) noexcept;
    [[nodiscard]] size_t DataSlots() const noexcept { return trbs_.empty() ? 0 : trbs_.size() - 1; }

    Shared::IDMAMemory* dma_{nullptr};
    Shared::DMARegion region_{};
    std::span<HW::Trb> trbs_;
    bool ac64_{true};

    size_t enqueue_{0};     ///< next slot the producer writes
    size_t dequeue_{0};     ///< first slot not yet reported consumed
    bool cycle_{true};      ///< producer cycle state (xHCI PCS starts at 1)
    uint64_t wraps_{0};
};

/// TrbRing plus the lock that guards its cursors
struct LockedTrbRing {
    mutable std::mutex lock;
    TrbRing ring;
};

} // namespace XHCD::Rings
