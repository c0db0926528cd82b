#include "TrbRing.hpp"

#include "../Common/BarrierUtils.hpp"
#include "../Logging/Logging.hpp"
#include "../Shared/Rings/RingHelpers.hpp"

namespace XHCD::Rings {

namespace {
constexpr size_t kRingAlignment = 64;
constexpr size_t kRingBoundary = 64 * 1024;
constexpr size_t kMinRingSize = 4;
} // namespace

TrbRing::~TrbRing() {
    Release();
}

Result<void> TrbRing::Initialize(Shared::IDMAMemory& dma, size_t trbCount, bool ac64) {
    if (IsInitialized()) {
        return XHCD_ERROR_INVALID("TrbRing: already initialized");
    }
    if (trbCount < kMinRingSize || trbCount * sizeof(HW::Trb) > kRingBoundary) {
        XHCD_LOG_ERROR(Rings, "TrbRing: unsupported size %zu", trbCount);
        return XHCD_ERROR_INVALID("TrbRing: ring size out of range");
    }

    auto region = dma.AllocateRegion(trbCount * sizeof(HW::Trb), kRingAlignment, kRingBoundary);
    if (!region) {
        return XHCD_ERROR_NO_MEMORY("TrbRing: DMA allocation failed");
    }
    if (!ac64 && (region->deviceBase + region->size) > 0x1'0000'0000ull) {
        dma.ReleaseRegion(*region);
        return XHCD_ERROR_NO_MEMORY("TrbRing: ring above 4 GiB on a 32-bit controller");
    }

    dma_ = &dma;
    region_ = *region;
    trbs_ = std::span<HW::Trb>(reinterpret_cast<HW::Trb*>(region_.virtualBase), trbCount);
    ac64_ = ac64;
    enqueue_ = 0;
    dequeue_ = 0;
    cycle_ = true;
    wraps_ = 0;

    // Zeroed slots carry cycle 0, so the hardware sees them as not yet written
    dma_->PublishToDevice(trbs_.data(), trbs_.size_bytes());

    XHCD_LOG_V2(Rings, "TrbRing: %zu TRBs at iova=0x%llx", trbCount,
                static_cast<unsigned long long>(region_.deviceBase));
    return {};
}

bool TrbRing::Release() noexcept {
    if (!IsInitialized()) {
        return true;
    }

    const bool idle = IsIdle();
    if (idle) {
        dma_->ReleaseRegion(region_);
    } else {
        XHCD_LOG_ERROR(Rings, "TrbRing: releasing ring iova=0x%llx with %zu TRBs outstanding, storage quarantined",
                       static_cast<unsigned long long>(region_.deviceBase), InFlight());
    }

    trbs_ = {};
    region_ = {};
    dma_ = nullptr;
    enqueue_ = 0;
    dequeue_ = 0;
    cycle_ = true;
    return idle;
}

Result<EnqueuedTrb> TrbRing::EnqueueTrb(const HW::Trb& trb) {
    return Enqueue([&trb](bool) { return trb; });
}

Result<EnqueuedTrb> TrbRing::WriteNext(const HW::Trb& built) {
    HW::Trb trb = built;
    trb.SetCycle(cycle_);

    const EnqueuedTrb slot{enqueue_, cycle_, TrbPhysAddr(enqueue_)};
    StoreSlot(enqueue_, trb);

    enqueue_++;
    if (enqueue_ == DataSlots()) {
        // Link slot: follow back to 0 and flip the producer cycle state.
        // The chain bit carries a TD that continues across the wrap.
        const HW::Trb link = HW::MakeLink(region_.deviceBase, true, trb.ChainFlag(), cycle_);
        StoreSlot(enqueue_, link);
        cycle_ = !cycle_;
        enqueue_ = 0;
        wraps_++;
        XHCD_LOG_V3(Rings, "TrbRing iova=0x%llx wrapped, cycle now %d",
                    static_cast<unsigned long long>(region_.deviceBase), cycle_);
    }

    XHCD_LOG_V4(Rings, "TrbRing: idx=%zu type=%s cycle=%d phys=0x%llx",
                slot.index, HW::ToString(trb.Type()), slot.cycle,
                static_cast<unsigned long long>(slot.physAddr));
    return slot;
}

void TrbRing::StoreSlot(size_t index, const HW::Trb& trb) noexcept {
    HW::Trb& dst = trbs_[index];
    dst.dataLow = trb.dataLow;
    dst.dataHigh = trb.dataHigh;
    dst.status = trb.status;
    // Parameters must be visible before the control word hands the slot over
    Driver::WriteBarrier();
    dst.control = trb.control;
    dma_->PublishToDevice(&dst, sizeof(HW::Trb));
}

uint64_t TrbRing::Register() const noexcept {
    return TrbPhysAddr(enqueue_) | (cycle_ ? 1u : 0u);
}

uint64_t TrbRing::TrbPhysAddr(size_t index) const noexcept {
    return region_.deviceBase + static_cast<uint64_t>(index) * sizeof(HW::Trb);
}

std::optional<size_t> TrbRing::PhysToIndex(uint64_t physAddr) const noexcept {
    if (!IsInitialized()) {
        return std::nullopt;
    }

    uint64_t base = region_.deviceBase;
    if (!ac64_) {
        base &= 0xFFFFFFFFull;
        physAddr &= 0xFFFFFFFFull;
    }

    if (physAddr < base || (physAddr - base) % sizeof(HW::Trb) != 0) {
        return std::nullopt;
    }
    const uint64_t index = (physAddr - base) / sizeof(HW::Trb);
    if (index >= trbs_.size()) {
        return std::nullopt;
    }
    return static_cast<size_t>(index);
}

HW::Trb TrbRing::EntryAt(size_t index) const noexcept {
    if (index >= trbs_.size()) {
        return HW::Trb{};
    }
    dma_->FetchFromDevice(&trbs_[index], sizeof(HW::Trb));
    return trbs_[index];
}

std::optional<HW::Trb> TrbRing::EntryAtPhys(uint64_t physAddr) const noexcept {
    const auto index = PhysToIndex(physAddr);
    if (!index) {
        return std::nullopt;
    }
    return EntryAt(*index);
}

void TrbRing::ReleaseSlot(size_t index) noexcept {
    if (index >= DataSlots()) {
        return;
    }
    const bool staleCycle = trbs_[index].Cycle();
    StoreSlot(index, HW::Trb::Reserved(staleCycle));
}

bool TrbRing::AdvanceDequeue(uint64_t physAddr) noexcept {
    const auto index = PhysToIndex(physAddr);
    if (!index || *index >= DataSlots()) {
        return false;
    }

    // Only pointers inside [dequeue, enqueue) are outstanding
    const size_t slots = DataSlots();
    const size_t distance = Shared::RingHelpers::Count(dequeue_, *index, slots);
    if (distance >= InFlight()) {
        XHCD_LOG_V2(Rings, "TrbRing: ignoring completion for idx=%zu outside window [%zu,%zu)",
                    *index, dequeue_, enqueue_);
        return false;
    }

    dequeue_ = Shared::RingHelpers::Advance(*index, 1, slots);
    return true;
}

bool TrbRing::IsFull() const noexcept {
    return Shared::RingHelpers::IsFull(dequeue_, enqueue_, DataSlots());
}

bool TrbRing::IsIdle() const noexcept {
    return Shared::RingHelpers::IsEmpty(dequeue_, enqueue_);
}

size_t TrbRing::InFlight() const noexcept {
    return Shared::RingHelpers::Count(dequeue_, enqueue_, DataSlots());
}

size_t TrbRing::FreeSlots() const noexcept {
    return Shared::RingHelpers::Available(dequeue_, enqueue_, DataSlots());
}

} // namespace XHCD::Rings
