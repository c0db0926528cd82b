#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include "../Core/Error.hpp"
#include "../Hardware/XHCITrb.hpp"
#include "../Shared/Memory/IDMAMemory.hpp"

namespace XHCD::Rings {

/// Event Ring Segment Table entry (xHCI §6.5)
struct ErstEntry {
    uint32_t addressLow;
    uint32_t addressHigh;
    uint16_t size;          ///< TRBs in the segment (16..4096)
    uint16_t reserved0;
    uint32_t reserved1;
};
static_assert(sizeof(ErstEntry) == 16, "ERST entry must be 16 bytes per xHCI §6.5");

/**
 * Consumer side of the primary event ring (xHCI §4.9.4).
 *
 * The controller is the only writer. An entry belongs to software once its
 * cycle bit equals the consumer cycle state (CCS). CCS starts at 1 and flips
 * each time the dequeue index passes the end of the last segment.
 *
 * Single consumer: only the reactor pass touches the cursor after Initialize.
 */
class EventRing {
public:
    EventRing() = default;
    ~EventRing();

    /**
     * Allocate the segment table (room for @p maxSegments entries) and the
     * first segment of @p segmentSize TRBs.
     */
    [[nodiscard]] Result<void> Initialize(Shared::IDMAMemory& dma, size_t segmentSize, size_t maxSegments);
    void Release() noexcept;

    /// Event at the dequeue index if the controller has written it, else nullopt
    [[nodiscard]] std::optional<HW::Trb> Peek() const noexcept;

    /// Global index (segment * segmentSize + offset) of the next slot to read
    [[nodiscard]] size_t NextIndex() const noexcept;

    /**
     * Mark the current entry consumed and advance. The slot is rewritten as a
     * Reserved TRB with the stale cycle so a second read cannot match it.
     */
    void Consume() noexcept;

    /// Dequeue pointer with DESI in bits 0..2. EHB is not included.
    [[nodiscard]] uint64_t Erdp() const noexcept;
    [[nodiscard]] uint64_t DequeuePointer() const noexcept;

    /**
     * Append one segment and its ERST entry.
     * @return new ERSTSZ for the interrupter register
     */
    [[nodiscard]] Result<uint32_t> Grow();

    [[nodiscard]] bool IsInitialized() const noexcept { return dma_ != nullptr; }
    [[nodiscard]] bool ConsumerCycle() const noexcept { return ccs_; }
    [[nodiscard]] uint64_t ErstBase() const noexcept { return erst_.deviceBase; }
    [[nodiscard]] uint32_t ErstSize() const noexcept { return static_cast<uint32_t>(segments_.size()); }
    [[nodiscard]] size_t SegmentCount() const noexcept { return segments_.size(); }
    [[nodiscard]] size_t SegmentSize() const noexcept { return segmentSize_; }
    [[nodiscard]] size_t MaxSegments() const noexcept { return maxSegments_; }
    [[nodiscard]] uint64_t SegmentBase(size_t segment) const noexcept;

    EventRing(const EventRing&) = delete;
    EventRing& operator=(const EventRing&) = delete;

private:
    struct Segment {
        Shared::DMARegion region;
        std::span<HW::Trb> trbs;
    };

    [[nodiscard]] Result<Segment> AllocateSegment();
    void WriteErstEntry(size_t index, const Segment& segment) noexcept;

    Shared::IDMAMemory* dma_{nullptr};
    Shared::DMARegion erst_{};
    std::vector<Segment> segments_;
    size_t segmentSize_{0};
    size_t maxSegments_{0};

    size_t segment_{0};   ///< current segment
    size_t index_{0};     ///< offset in the current segment
    bool ccs_{true};
};

} // namespace XHCD::Rings
