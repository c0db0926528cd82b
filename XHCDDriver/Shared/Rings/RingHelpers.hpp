// RingHelpers.hpp - Index arithmetic shared by producer rings
//
// head = oldest slot the consumer (hardware) has not finished with,
// tail = next slot the producer will write. One slot stays empty so that
// head == tail always means "empty".

#pragma once

#include <cstddef>

namespace XHCD::Shared::RingHelpers {

[[nodiscard]] constexpr inline size_t UsableCapacity(size_t storageSize) noexcept {
    return storageSize > 0 ? storageSize - 1 : 0;
}

[[nodiscard]] constexpr inline size_t Count(size_t head, size_t tail, size_t capacity) noexcept {
    if (capacity == 0) return 0;
    return (capacity + tail - head) % capacity;
}

[[nodiscard]] constexpr inline bool IsEmpty(size_t head, size_t tail) noexcept {
    return head == tail;
}

[[nodiscard]] constexpr inline bool IsFull(size_t head, size_t tail, size_t capacity) noexcept {
    if (capacity == 0) return true;
    return ((tail + 1) % capacity) == head;
}

[[nodiscard]] constexpr inline size_t Advance(size_t index, size_t amount, size_t capacity) noexcept {
    if (capacity == 0) return 0;
    return (index + amount) % capacity;
}

[[nodiscard]] constexpr inline size_t Available(size_t head, size_t tail, size_t capacity) noexcept {
    if (capacity == 0) return 0;
    const size_t used = Count(head, tail, capacity);
    return (capacity > used + 1) ? (capacity - used - 1) : 0;
}

} // namespace XHCD::Shared::RingHelpers
