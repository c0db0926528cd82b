#include "InterruptManager.hpp"

#include <poll.h>
#include <sys/eventfd.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include "../Logging/Logging.hpp"
#include "HardwareInterface.hpp"

namespace XHCD::Driver {

InterruptManager::InterruptManager(HardwareInterface& hw, RegisterLayout layout, InterruptMode mode,
                                   uint16_t interrupter) noexcept
    : hw_(hw), layout_(layout), mode_(mode), interrupter_(interrupter) {}

InterruptManager::~InterruptManager() {
    if (wakeFd_ >= 0) {
        ::close(wakeFd_);
    }
}

Result<void> InterruptManager::Initialise(int irqFd, IrqFileKind kind) {
    if (mode_ != InterruptMode::Polling && irqFd < 0) {
        XHCD_LOG_ERROR(Hardware, "InterruptManager: %s mode needs an irq file", ToString(mode_));
        return XHCD_ERROR_INVALID("InterruptManager: missing irq file descriptor");
    }

    if (wakeFd_ < 0) {
        wakeFd_ = ::eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK);
        if (wakeFd_ < 0) {
            XHCD_LOG_ERROR(Hardware, "InterruptManager: eventfd failed: %s", std::strerror(errno));
            return XHCD_ERROR_FATAL(kXHCDReturnError, "InterruptManager: cannot create wake eventfd");
        }
    }

    irqFd_ = irqFd;
    irqKind_ = kind;
    XHCD_LOG_V1(Hardware, "InterruptManager: interrupter %u mode=%s irqFd=%d kind=%s",
                interrupter_, ToString(mode_), irqFd_, kind == IrqFileKind::Uio ? "uio" : "eventfd");
    return {};
}

void InterruptManager::ProgramEventRing(uint32_t erstSize, uint64_t erdp, uint64_t erstBase) noexcept {
    hw_.Write(Reg(InterrupterReg::kErstSz), erstSize & 0xFFFF);
    hw_.Write64(Reg(InterrupterReg::kErdpLo), erdp | Erdp::kEventHandlerBusy);
    lastErdp_ = erdp;
    // ERSTBA last: writing it enables the event ring state machine
    hw_.Write64(Reg(InterrupterReg::kErstBaLo), erstBase & ~uint64_t{0x3F});
    hw_.Write(Reg(InterrupterReg::kImod), 0);

    const uint32_t iman = hw_.Read(Reg(InterrupterReg::kIman));
    hw_.Write(Reg(InterrupterReg::kIman), iman | Iman::kInterruptEnable | Iman::kInterruptPending);
    enabled_.store(true, std::memory_order_release);

    XHCD_LOG_V2(Hardware, "Interrupter %u: ERSTSZ=%u ERSTBA=0x%llx ERDP=0x%llx",
                interrupter_, erstSize, static_cast<unsigned long long>(erstBase),
                static_cast<unsigned long long>(erdp));
}

void InterruptManager::WriteErstSize(uint32_t erstSize) noexcept {
    hw_.Write(Reg(InterrupterReg::kErstSz), erstSize & 0xFFFF);
}

void InterruptManager::WriteErdp(uint64_t erdp) noexcept {
    hw_.Write64(Reg(InterrupterReg::kErdpLo), erdp & ~Erdp::kEventHandlerBusy);
    lastErdp_ = erdp;
}

void InterruptManager::EventHandlerFinished() noexcept {
    const uint32_t low = static_cast<uint32_t>(lastErdp_ & ~Erdp::kEventHandlerBusy);
    hw_.Write(Reg(InterrupterReg::kErdpLo), low | static_cast<uint32_t>(Erdp::kEventHandlerBusy));
}

void InterruptManager::Mask() noexcept {
    if (!enabled_.exchange(false, std::memory_order_acq_rel)) {
        XHCD_LOG_WARNING(Hardware, "InterruptManager: Mask on already masked interrupter %u", interrupter_);
        return;
    }
    const uint32_t iman = hw_.Read(Reg(InterrupterReg::kIman));
    hw_.Write(Reg(InterrupterReg::kIman), iman & ~(Iman::kInterruptEnable | Iman::kInterruptPending));
}

void InterruptManager::Unmask() noexcept {
    if (enabled_.exchange(true, std::memory_order_acq_rel)) {
        XHCD_LOG_WARNING(Hardware, "InterruptManager: Unmask on already unmasked interrupter %u", interrupter_);
        return;
    }
    const uint32_t iman = hw_.Read(Reg(InterrupterReg::kIman));
    hw_.Write(Reg(InterrupterReg::kIman), (iman & ~Iman::kInterruptPending) | Iman::kInterruptEnable);
}

bool InterruptManager::ReceivedIrq() noexcept {
    if (mode_ == InterruptMode::Msi) {
        return true;
    }
    const uint32_t iman = hw_.Read(Reg(InterrupterReg::kIman));
    if ((iman & Iman::kInterruptPending) == 0) {
        return false;
    }
    // IP is RW1C; writing the value back clears it and keeps IE
    hw_.Write(Reg(InterrupterReg::kIman), iman);
    return true;
}

bool InterruptManager::InterruptIsPending() const noexcept {
    const uint32_t iman = hw_.Read(Reg(InterrupterReg::kIman));
    const uint32_t erdpLow = hw_.Read(Reg(InterrupterReg::kErdpLo));
    return (iman & Iman::kInterruptPending) != 0 || (erdpLow & Erdp::kEventHandlerBusy) != 0;
}

void InterruptManager::ForceClearInterrupt() noexcept {
    const uint32_t erdpLow = hw_.Read(Reg(InterrupterReg::kErdpLo));
    if ((erdpLow & Erdp::kEventHandlerBusy) == 0) {
        XHCD_LOG_WARNING(Hardware, "InterruptManager: ForceClearInterrupt with EHB already clear");
        return;
    }
    hw_.Write(Reg(InterrupterReg::kErdpLo), erdpLow);
}

Result<IrqWait> InterruptManager::WaitForInterrupt() {
    if (irqFd_ < 0) {
        return XHCD_ERROR_NOT_READY("InterruptManager: no irq file attached");
    }

    pollfd fds[2] = {
        {irqFd_, POLLIN, 0},
        {wakeFd_, POLLIN, 0},
    };

    for (;;) {
        const int ready = ::poll(fds, 2, -1);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            XHCD_LOG_ERROR(Hardware, "InterruptManager: poll failed: %s", std::strerror(errno));
            return XHCD_ERROR_FATAL(kXHCDReturnIOError, "InterruptManager: poll on irq file failed");
        }
        break;
    }

    if (fds[1].revents & POLLIN) {
        DrainWakeFd();
        return IrqWait::Woken;
    }
    if (fds[0].revents & (POLLERR | POLLHUP | POLLNVAL)) {
        XHCD_LOG_ERROR(Hardware, "InterruptManager: irq file error revents=0x%x", fds[0].revents);
        return XHCD_ERROR_FATAL(kXHCDReturnIOError, "InterruptManager: irq file closed");
    }
    XHCD_TRY(DrainIrqFd());
    return IrqWait::Interrupt;
}

IrqWait InterruptManager::WaitForWake(std::chrono::milliseconds timeout) {
    if (wakeFd_ < 0) {
        return IrqWait::TimedOut;
    }
    pollfd fd{wakeFd_, POLLIN, 0};
    const int ready = ::poll(&fd, 1, static_cast<int>(timeout.count()));
    if (ready > 0 && (fd.revents & POLLIN)) {
        DrainWakeFd();
        return IrqWait::Woken;
    }
    return IrqWait::TimedOut;
}

void InterruptManager::Wake() noexcept {
    if (wakeFd_ < 0) {
        return;
    }
    const uint64_t one = 1;
    if (::write(wakeFd_, &one, sizeof(one)) != static_cast<ssize_t>(sizeof(one)) && errno != EAGAIN) {
        XHCD_LOG_ERROR(Hardware, "InterruptManager: wake write failed: %s", std::strerror(errno));
    }
}

Result<void> InterruptManager::AcknowledgeIrqFile() {
    if (irqFd_ < 0 || irqKind_ != IrqFileKind::Uio) {
        return {};
    }
    const int32_t enable = 1;
    if (::write(irqFd_, &enable, sizeof(enable)) != static_cast<ssize_t>(sizeof(enable))) {
        XHCD_LOG_ERROR(Hardware, "InterruptManager: uio re-enable failed: %s", std::strerror(errno));
        return XHCD_ERROR_IO("InterruptManager: cannot re-enable uio interrupt");
    }
    return {};
}

void InterruptManager::DrainWakeFd() noexcept {
    uint64_t counter = 0;
    while (::read(wakeFd_, &counter, sizeof(counter)) == static_cast<ssize_t>(sizeof(counter))) {
    }
}

Result<void> InterruptManager::DrainIrqFd() {
    uint64_t counter = 0;
    const size_t width = irqKind_ == IrqFileKind::Uio ? sizeof(uint32_t) : sizeof(uint64_t);
    const ssize_t got = ::read(irqFd_, &counter, width);
    if (got != static_cast<ssize_t>(width)) {
        if (got < 0 && (errno == EAGAIN || errno == EINTR)) {
            return {};
        }
        XHCD_LOG_ERROR(Hardware, "InterruptManager: irq read returned %zd: %s", got, std::strerror(errno));
        return XHCD_ERROR_IO("InterruptManager: short read on irq file");
    }
    XHCD_LOG_V4(Hardware, "InterruptManager: irq count=%llu", static_cast<unsigned long long>(counter));
    return {};
}

} // namespace XHCD::Driver
