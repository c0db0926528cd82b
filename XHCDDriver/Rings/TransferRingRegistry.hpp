#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

#include "../Core/Error.hpp"
#include "RingId.hpp"
#include "TrbRing.hpp"

namespace XHCD::Rings {

/**
 * Transfer ring of one (slot, endpoint[, stream]).
 *
 * `lock` guards the ring cursors and `tornDown`. Submitters and the reactor
 * both take it; teardown sets `tornDown` under it so no record can be
 * registered for a ring that is leaving the registry.
 */
struct TransferRing : LockedTrbRing {
    TransferRing(RingId ringId, uint8_t slot, uint8_t endpointDci, bool isoch) noexcept
        : id(ringId), slotId(slot), dci(endpointDci), isochronous(isoch) {}

    const RingId id;
    const uint8_t slotId;
    const uint8_t dci;          ///< Device Context Index, also the doorbell target
    const bool isochronous;
    bool tornDown{false};
};

/// Live transfer rings keyed by RingId
class TransferRingRegistry {
public:
    TransferRingRegistry() = default;

    /// Allocate and register a ring. Fails with kXHCDReturnBusy if @p id is taken.
    [[nodiscard]] Result<std::shared_ptr<TransferRing>> Create(Shared::IDMAMemory& dma, RingId id,
                                                               uint8_t slotId, uint8_t dci,
                                                               bool isochronous, size_t trbCount,
                                                               bool ac64);

    [[nodiscard]] std::shared_ptr<TransferRing> Find(RingId id) const;
    [[nodiscard]] std::shared_ptr<TransferRing> FindBySlot(uint8_t slotId, uint8_t dci) const;

    /// Remove from the registry; the caller decides what happens to the storage
    [[nodiscard]] std::shared_ptr<TransferRing> Remove(RingId id);

    [[nodiscard]] bool Contains(RingId id) const;
    [[nodiscard]] size_t Size() const;

    /// Copy of the live rings, taken under the registry lock
    [[nodiscard]] std::vector<std::shared_ptr<TransferRing>> Snapshot() const;

    TransferRingRegistry(const TransferRingRegistry&) = delete;
    TransferRingRegistry& operator=(const TransferRingRegistry&) = delete;

private:
    mutable std::mutex lock_;
    std::map<RingId, std::shared_ptr<TransferRing>> rings_;
};

} // namespace XHCD::Rings
