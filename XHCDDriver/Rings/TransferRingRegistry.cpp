#include "TransferRingRegistry.hpp"

#include "../Logging/Logging.hpp"

namespace XHCD::Rings {

Result<std::shared_ptr<TransferRing>> TransferRingRegistry::Create(Shared::IDMAMemory& dma, RingId id,
                                                                   uint8_t slotId, uint8_t dci,
                                                                   bool isochronous, size_t trbCount,
                                                                   bool ac64) {
    if (slotId == 0 || dci == 0 || dci > 31) {
        XHCD_LOG_ERROR(Rings, "TransferRingRegistry: bad address slot=%u dci=%u", slotId, dci);
        return XHCD_ERROR_INVALID("TransferRingRegistry: slot or DCI out of range");
    }

    std::lock_guard guard(lock_);
    if (rings_.contains(id)) {
        XHCD_LOG_WARNING(Rings, "TransferRingRegistry: ring port=%u ep=%u stream=%u already exists",
                         id.port, id.endpointNum, id.streamId);
        return XHCD_ERROR_RECOVERABLE(kXHCDReturnBusy, "TransferRingRegistry: ring id already registered");
    }

    auto ring = std::make_shared<TransferRing>(id, slotId, dci, isochronous);
    XHCD_TRY(ring->ring.Initialize(dma, trbCount, ac64));
    rings_.emplace(id, ring);

    XHCD_LOG_V2(Rings, "TransferRingRegistry: + port=%u ep=%u stream=%u slot=%u dci=%u%s base=0x%llx",
                id.port, id.endpointNum, id.streamId, slotId, dci, isochronous ? " isoch" : "",
                static_cast<unsigned long long>(ring->ring.BaseIOVA()));
    return ring;
}

std::shared_ptr<TransferRing> TransferRingRegistry::Find(RingId id) const {
    std::lock_guard guard(lock_);
    auto it = rings_.find(id);
    return it != rings_.end() ? it->second : nullptr;
}

std::shared_ptr<TransferRing> TransferRingRegistry::FindBySlot(uint8_t slotId, uint8_t dci) const {
    std::lock_guard guard(lock_);
    for (const auto& [id, ring] : rings_) {
        if (ring->slotId == slotId && ring->dci == dci) {
            return ring;
        }
    }
    return nullptr;
}

std::shared_ptr<TransferRing> TransferRingRegistry::Remove(RingId id) {
    std::lock_guard guard(lock_);
    auto it = rings_.find(id);
    if (it == rings_.end()) {
        return nullptr;
    }
    auto ring = std::move(it->second);
    rings_.erase(it);
    XHCD_LOG_V2(Rings, "TransferRingRegistry: - port=%u ep=%u stream=%u",
                id.port, id.endpointNum, id.streamId);
    return ring;
}

bool TransferRingRegistry::Contains(RingId id) const {
    std::lock_guard guard(lock_);
    return rings_.contains(id);
}

size_t TransferRingRegistry::Size() const {
    std::lock_guard guard(lock_);
    return rings_.size();
}

std::vector<std::shared_ptr<TransferRing>> TransferRingRegistry::Snapshot() const {
    std::lock_guard guard(lock_);
    std::vector<std::shared_ptr<TransferRing>> out;
    out.reserve(rings_.size());
    for (const auto& [id, ring] : rings_) {
        out.push_back(ring);
    }
    return out;
}

} // namespace XHCD::Rings
