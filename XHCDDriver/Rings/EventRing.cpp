#include "EventRing.hpp"

#include "../Common/BarrierUtils.hpp"
#include "../Logging/Logging.hpp"

namespace XHCD::Rings {

namespace {
constexpr size_t kSegmentAlignment = 64;
constexpr size_t kSegmentBoundary = 64 * 1024;
constexpr size_t kErstAlignment = 64;
constexpr size_t kMinSegmentSize = 16;
constexpr size_t kMaxSegmentSize = 4096;
} // namespace

EventRing::~EventRing() {
    Release();
}

Result<void> EventRing::Initialize(Shared::IDMAMemory& dma, size_t segmentSize, size_t maxSegments) {
    if (IsInitialized()) {
        return XHCD_ERROR_INVALID("EventRing: already initialized");
    }
    if (segmentSize < kMinSegmentSize || segmentSize > kMaxSegmentSize || maxSegments == 0) {
        XHCD_LOG_ERROR(Rings, "EventRing: bad geometry segmentSize=%zu maxSegments=%zu",
                       segmentSize, maxSegments);
        return XHCD_ERROR_INVALID("EventRing: segment geometry out of range");
    }

    auto erst = dma.AllocateRegion(maxSegments * sizeof(ErstEntry), kErstAlignment);
    if (!erst) {
        return XHCD_ERROR_NO_MEMORY("EventRing: segment table allocation failed");
    }

    dma_ = &dma;
    erst_ = *erst;
    segmentSize_ = segmentSize;
    maxSegments_ = maxSegments;
    segment_ = 0;
    index_ = 0;
    ccs_ = true;

    auto first = AllocateSegment();
    if (!first) {
        Release();
        return std::unexpected(first.error());
    }
    segments_.push_back(*first);
    WriteErstEntry(0, segments_.front());

    XHCD_LOG_V2(Rings, "EventRing: erst=0x%llx seg0=0x%llx size=%zu max=%zu",
                static_cast<unsigned long long>(erst_.deviceBase),
                static_cast<unsigned long long>(segments_.front().region.deviceBase),
                segmentSize_, maxSegments_);
    return {};
}

void EventRing::Release() noexcept {
    if (!IsInitialized()) {
        return;
    }
    for (const auto& segment : segments_) {
        dma_->ReleaseRegion(segment.region);
    }
    segments_.clear();
    dma_->ReleaseRegion(erst_);
    erst_ = {};
    dma_ = nullptr;
}

Result<EventRing::Segment> EventRing::AllocateSegment() {
    auto region = dma_->AllocateRegion(segmentSize_ * sizeof(HW::Trb), kSegmentAlignment, kSegmentBoundary);
    if (!region) {
        return XHCD_ERROR_NO_SPACE("EventRing: no DMA memory for a new segment");
    }
    Segment segment{*region, std::span<HW::Trb>(reinterpret_cast<HW::Trb*>(region->virtualBase), segmentSize_)};
    // Fresh memory is zero: cycle 0 and code Invalid, never valid for CCS=1
    dma_->PublishToDevice(segment.trbs.data(), segment.trbs.size_bytes());
    return segment;
}

void EventRing::WriteErstEntry(size_t index, const Segment& segment) noexcept {
    auto* table = reinterpret_cast<ErstEntry*>(erst_.virtualBase);
    ErstEntry& entry = table[index];
    entry.addressLow = static_cast<uint32_t>(segment.region.deviceBase);
    entry.addressHigh = static_cast<uint32_t>(segment.region.deviceBase >> 32);
    entry.size = static_cast<uint16_t>(segmentSize_);
    entry.reserved0 = 0;
    entry.reserved1 = 0;
    dma_->PublishToDevice(&entry, sizeof(entry));
}

std::optional<HW::Trb> EventRing::Peek() const noexcept {
    if (!IsInitialized()) {
        return std::nullopt;
    }
    const HW::Trb* slot = &segments_[segment_].trbs[index_];
    dma_->FetchFromDevice(slot, sizeof(HW::Trb));

    // Control word carries the cycle; read it before the rest of the TRB
    const uint32_t control = reinterpret_cast<const volatile HW::Trb*>(slot)->control;
    Driver::ReadBarrier();
    const bool cycle = (control & HW::TrbField::kCycleBit) != 0;
    if (cycle != ccs_) {
        return std::nullopt;
    }

    HW::Trb trb = *slot;
    trb.control = control;
    if (trb.Code() == HW::CompletionCode::Invalid) {
        return std::nullopt;
    }
    return trb;
}

size_t EventRing::NextIndex() const noexcept {
    return segment_ * segmentSize_ + index_;
}

void EventRing::Consume() noexcept {
    if (!IsInitialized()) {
        return;
    }

    HW::Trb& slot = segments_[segment_].trbs[index_];
    const HW::Trb cleared = HW::Trb::Reserved(!ccs_);
    slot.dataLow = cleared.dataLow;
    slot.dataHigh = cleared.dataHigh;
    slot.status = cleared.status;
    Driver::WriteBarrier();
    slot.control = cleared.control;

    index_++;
    if (index_ == segmentSize_) {
        index_ = 0;
        segment_++;
        if (segment_ == segments_.size()) {
            segment_ = 0;
            ccs_ = !ccs_;
            XHCD_LOG_V3(Rings, "EventRing: wrapped, ccs=%d", ccs_);
        }
    }
}

uint64_t EventRing::DequeuePointer() const noexcept {
    if (!IsInitialized()) {
        return 0;
    }
    return segments_[segment_].region.deviceBase + static_cast<uint64_t>(index_) * sizeof(HW::Trb);
}

uint64_t EventRing::Erdp() const noexcept {
    return DequeuePointer() | (static_cast<uint64_t>(segment_) & 0x7);
}

uint64_t EventRing::SegmentBase(size_t segment) const noexcept {
    return segment < segments_.size() ? segments_[segment].region.deviceBase : 0;
}

Result<uint32_t> EventRing::Grow() {
    if (!IsInitialized()) {
        return XHCD_ERROR_NOT_READY("EventRing: grow on uninitialized ring");
    }
    if (segments_.size() >= maxSegments_) {
        XHCD_LOG_ERROR(Rings, "EventRing: segment table full (%zu/%zu), cannot grow",
                       segments_.size(), maxSegments_);
        return XHCD_ERROR_NO_SPACE("EventRing: segment table at capacity");
    }

    auto segment = XHCD_TRY(AllocateSegment());
    const size_t slot = segments_.size();
    WriteErstEntry(slot, segment);
    segments_.push_back(segment);

    XHCD_LOG_V1(Rings, "EventRing: grew to %zu segments (new seg iova=0x%llx)",
                segments_.size(), static_cast<unsigned long long>(segment.region.deviceBase));
    return static_cast<uint32_t>(segments_.size());
}

} // namespace XHCD::Rings
