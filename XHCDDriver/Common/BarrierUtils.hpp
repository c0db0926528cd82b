#pragma once

#include <atomic>
#include <cstdint>

namespace XHCD::Driver {

// Memory barrier helpers for DMA rings shared with the controller.
void WriteBarrier();   // publish normal-memory writes (release)
void ReadBarrier();    // consume normal-memory reads (acquire)
void FullBarrier();    // full fence for rare cases

// MMIO barrier for programming device registers. On x86 a seq_cst fence
// compiles to mfence, which also orders uncached BAR accesses.
inline void IoBarrier() { std::atomic_thread_fence(std::memory_order_seq_cst); }

// Raw MMIO 32-bit accesses
inline void Write32(volatile uint32_t* addr, uint32_t value) {
    *addr = value;
    IoBarrier();
}

inline uint32_t Read32(volatile uint32_t* addr) {
    IoBarrier();
    return *addr;
}

} // namespace XHCD::Driver
