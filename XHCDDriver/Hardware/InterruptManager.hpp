#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

#include "../Core/ControllerConfig.hpp"
#include "../Core/Error.hpp"
#include "RegisterMap.hpp"

namespace XHCD::Driver {

class HardwareInterface;

/// Interrupt notification file handed over by the platform (vfio eventfd or /dev/uioN)
enum class IrqFileKind : uint8_t {
    Uio,       ///< read 4-byte count, write 1 to re-enable
    EventFd,   ///< read 8-byte counter
};

enum class IrqWait : uint8_t {
    Interrupt,   ///< irq file readable
    Woken,       ///< Wake() was called
    TimedOut,
};

/**
 * Primary interrupter ownership: IMAN shadow, ERDP/EHB handshake and the
 * blocking wait on the interrupt file.
 *
 * IMAN.IE is shadowed so the reactor only touches the register when the
 * state actually changes. IMAN.IP and ERDP.EHB are RW1C.
 */
class InterruptManager {
public:
    InterruptManager(HardwareInterface& hw, RegisterLayout layout, InterruptMode mode,
                     uint16_t interrupter = 0) noexcept;
    ~InterruptManager();

    /// Create the wake eventfd. @p irqFd (not owned) may be -1 in polling mode.
    [[nodiscard]] Result<void> Initialise(int irqFd, IrqFileKind kind);

    /// ERSTSZ, ERDP (with EHB), ERSTBA, IMOD=0, then IMAN.IE|IP (xHCI §4.17.2)
    void ProgramEventRing(uint32_t erstSize, uint64_t erdp, uint64_t erstBase) noexcept;
    void WriteErstSize(uint32_t erstSize) noexcept;

    /// Advance ERDP. EHB is written as 0 so the busy flag is left alone.
    void WriteErdp(uint64_t erdp) noexcept;

    /// Clear EHB (write 1) once per service pass, after the last ERDP update
    void EventHandlerFinished() noexcept;

    void Mask() noexcept;
    void Unmask() noexcept;
    [[nodiscard]] bool IsUnmasked() const noexcept { return enabled_.load(std::memory_order_acquire); }

    /// MSI: always ours. INTx: test IMAN.IP and clear it when set.
    [[nodiscard]] bool ReceivedIrq() noexcept;

    /// IMAN.IP or ERDP.EHB set on this interrupter
    [[nodiscard]] bool InterruptIsPending() const noexcept;

    /// Clear EHB; warns when nothing was pending
    void ForceClearInterrupt() noexcept;

    /// Block until the irq file or the wake fd is readable
    [[nodiscard]] Result<IrqWait> WaitForInterrupt();

    /// Polling mode: sleep up to @p timeout unless woken
    [[nodiscard]] IrqWait WaitForWake(std::chrono::milliseconds timeout);

    void Wake() noexcept;

    /// Re-arm the irq file after an interrupt was serviced
    [[nodiscard]] Result<void> AcknowledgeIrqFile();

    [[nodiscard]] InterruptMode Mode() const noexcept { return mode_; }
    [[nodiscard]] uint64_t LastErdp() const noexcept { return lastErdp_; }
    [[nodiscard]] bool HasIrqFile() const noexcept { return irqFd_ >= 0; }

    InterruptManager(const InterruptManager&) = delete;
    InterruptManager& operator=(const InterruptManager&) = delete;

private:
    [[nodiscard]] uint32_t Reg(InterrupterReg reg) const noexcept { return layout_.Interrupter(interrupter_, reg); }
    void DrainWakeFd() noexcept;
    [[nodiscard]] Result<void> DrainIrqFd();

    HardwareInterface& hw_;
    RegisterLayout layout_;
    InterruptMode mode_;
    uint16_t interrupter_;

    int irqFd_{-1};
    IrqFileKind irqKind_{IrqFileKind::EventFd};
    int wakeFd_{-1};

    std::atomic<bool> enabled_{false};   ///< shadow of IMAN.IE
    uint64_t lastErdp_{0};
};

} // namespace XHCD::Driver
