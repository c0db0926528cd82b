#pragma once

#include <cstdint>
#include <optional>
#include <variant>

#include "../Hardware/XHCITrb.hpp"
#include "../Rings/RingId.hpp"

namespace XHCD::Reactor {

/// What a resumed caller receives: the event and, when known, the TRB it completes
struct NextEventTrb {
    HW::Trb event{};
    std::optional<HW::Trb> source;
};

// ============================================================================
// Pending record discriminant
// ============================================================================

/// Waits for the Command Completion event pointing at @p physPtr
struct CommandCompletion {
    uint64_t physPtr{0};
};

/// Waits for a Transfer event pointing anywhere in [firstPtr, lastPtr] on @p ringId
struct TransferCompletion {
    uint64_t firstPtr{0};
    uint64_t lastPtr{0};
    Rings::RingId ringId{};
};

/// Waits for the next event of @p type (port status change, MFINDEX wrap, ...)
struct OtherEvent {
    HW::TrbType type{HW::TrbType::Reserved};
};

using StateKind = std::variant<CommandCompletion, TransferCompletion, OtherEvent>;

/**
 * Circular inclusive range test. A TD that wrapped the ring has
 * first > last; both ends are still part of the TD.
 */
[[nodiscard]] constexpr bool InCircularRange(uint64_t first, uint64_t last, uint64_t p) noexcept {
    if (first <= last) {
        return first <= p && p <= last;
    }
    return p >= first || p <= last;
}

} // namespace XHCD::Reactor
