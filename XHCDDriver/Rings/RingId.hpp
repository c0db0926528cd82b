#pragma once

#include <compare>
#include <cstdint>

namespace XHCD::Rings {

/// Transfer ring key: root hub port, endpoint number and stream
struct RingId {
    uint8_t port{0};
    uint8_t endpointNum{0};
    uint16_t streamId{0};

    [[nodiscard]] static constexpr RingId DefaultControlPipe(uint8_t port) noexcept {
        return RingId{port, 0, 0};
    }

    [[nodiscard]] constexpr bool IsDefaultControlPipe() const noexcept {
        return endpointNum == 0 && streamId == 0;
    }

    friend constexpr auto operator<=>(const RingId&, const RingId&) = default;
};

} // namespace XHCD::Rings
