#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <utility>
#include <vector>

#include "XHCDDriver/Hardware/HardwareInterface.hpp"
#include "XHCDDriver/Hardware/RegisterMap.hpp"

namespace XHCD::Testing {

struct FakeCapabilities {
    uint8_t maxSlots{8};
    uint8_t maxPorts{4};
    uint8_t erstMax{2};          ///< ERST holds 2^erstMax entries
    bool ac64{true};
    uint16_t scratchpads{0};
};

/**
 * Behavioural xHCI register file.
 *
 * - HCRST clears itself and resets operational/runtime state
 * - USBSTS.HCH follows USBCMD.RS
 * - IMAN.IP, ERDP.EHB and the PORTSC change bits (plus PED) are RW1C
 * - Doorbell writes are recorded and forwarded to an optional hook
 * - Every write is appended to an ordered log
 */
class FakeXhciRegisters final : public Driver::HardwareInterface {
public:
    static constexpr uint32_t kCapLength = 0x20;
    static constexpr uint32_t kRuntimeOffset = 0x1000;
    static constexpr uint32_t kDoorbellOffset = 0x2000;
    static constexpr uint16_t kHciVersion = 0x0110;

    using DoorbellHook = std::function<void(uint8_t slot, uint32_t value)>;

    explicit FakeXhciRegisters(FakeCapabilities caps = {}) : caps_(caps) {
        using Driver::CapReg;
        regs_[Cap(CapReg::kCapLengthVersion)] = kCapLength | (static_cast<uint32_t>(kHciVersion) << 16);
        regs_[Cap(CapReg::kHcsParams1)] = caps.maxSlots | (1u << 8) | (static_cast<uint32_t>(caps.maxPorts) << 24);
        regs_[Cap(CapReg::kHcsParams2)] = (static_cast<uint32_t>(caps.erstMax & 0xF) << 4) |
                                          (static_cast<uint32_t>((caps.scratchpads >> 5) & 0x1F) << 21) |
                                          (static_cast<uint32_t>(caps.scratchpads & 0x1F) << 27);
        regs_[Cap(CapReg::kHccParams1)] = caps.ac64 ? 0x1u : 0x0u;
        regs_[Cap(CapReg::kDbOff)] = kDoorbellOffset;
        regs_[Cap(CapReg::kRtsOff)] = kRuntimeOffset;

        layout_ = Driver::RegisterLayout::From(Driver::Capabilities::Decode(
            regs_[Cap(CapReg::kCapLengthVersion)], regs_[Cap(CapReg::kHcsParams1)],
            regs_[Cap(CapReg::kHcsParams2)], regs_[Cap(CapReg::kHccParams1)], kDoorbellOffset, kRuntimeOffset));
        ResetLocked();
    }

    [[nodiscard]] uint32_t Read(uint32_t offset) const noexcept override {
        std::lock_guard guard(lock_);
        if (deviceGone_) {
            return 0xFFFFFFFFu;
        }
        auto it = regs_.find(offset);
        return it != regs_.end() ? it->second : 0;
    }

    void Write(uint32_t offset, uint32_t value) noexcept override {
        DoorbellHook hook;
        uint8_t slot = 0;
        {
            std::lock_guard guard(lock_);
            writes_.emplace_back(offset, value);

            if (offset == Op(Driver::OpReg::kUsbCmd)) {
                WriteUsbCmdLocked(value);
            } else if (offset == Op(Driver::OpReg::kUsbSts)) {
                constexpr uint32_t kW1C = Driver::UsbSts::kEventInterrupt | Driver::UsbSts::kPortChangeDetect |
                                          Driver::UsbSts::kHostSystemError;
                regs_[offset] &= ~(value & kW1C);
            } else if (offset == Iman()) {
                const uint32_t old = regs_[offset];
                const uint32_t ip = (value & Driver::Iman::kInterruptPending) ? 0u
                                                                              : (old & Driver::Iman::kInterruptPending);
                regs_[offset] = (value & ~Driver::Iman::kInterruptPending) | ip;
            } else if (offset == ErdpLo()) {
                const uint32_t ehb = static_cast<uint32_t>(Driver::Erdp::kEventHandlerBusy);
                const uint32_t old = regs_[offset];
                regs_[offset] = (value & ~ehb) | ((value & ehb) ? 0u : (old & ehb));
            } else if (PortOf(offset) != 0) {
                const uint32_t old = regs_[offset];
                const uint32_t w1c = Driver::Portsc::kChangeBits | Driver::Portsc::kPortEnabled;
                regs_[offset] = old & ~(value & w1c);
            } else if (offset >= layout_.Doorbell(0) && offset < layout_.Doorbell(0) + 4u * 256u) {
                slot = static_cast<uint8_t>((offset - layout_.Doorbell(0)) / 4);
                doorbells_.emplace_back(slot, value);
                regs_[offset] = value;
                hook = doorbellHook_;
            } else {
                regs_[offset] = value;
            }
        }
        if (hook) {
            hook(slot, value);
        }
    }

    // ----- test controls -----

    [[nodiscard]] const Driver::RegisterLayout& Layout() const noexcept { return layout_; }
    [[nodiscard]] const FakeCapabilities& Caps() const noexcept { return caps_; }

    [[nodiscard]] uint32_t Op(Driver::OpReg reg) const noexcept { return layout_.Op(reg); }
    [[nodiscard]] uint32_t Intr(Driver::InterrupterReg reg) const noexcept { return layout_.Interrupter(0, reg); }
    [[nodiscard]] uint32_t Iman() const noexcept { return Intr(Driver::InterrupterReg::kIman); }
    [[nodiscard]] uint32_t ErdpLo() const noexcept { return Intr(Driver::InterrupterReg::kErdpLo); }

    /// Raw register value, no side effects
    [[nodiscard]] uint32_t Peek(uint32_t offset) const {
        std::lock_guard guard(lock_);
        auto it = regs_.find(offset);
        return it != regs_.end() ? it->second : 0;
    }
    [[nodiscard]] uint64_t Peek64(uint32_t offset) const {
        return static_cast<uint64_t>(Peek(offset)) | (static_cast<uint64_t>(Peek(offset + 4)) << 32);
    }
    void Poke(uint32_t offset, uint32_t value) {
        std::lock_guard guard(lock_);
        regs_[offset] = value;
    }

    /// What the controller does when it posts an event: IMAN.IP and ERDP.EHB go high
    void RaiseInterrupt() {
        std::lock_guard guard(lock_);
        regs_[Iman()] |= Driver::Iman::kInterruptPending;
        regs_[ErdpLo()] |= static_cast<uint32_t>(Driver::Erdp::kEventHandlerBusy);
    }

    /// Connect a device on @p port: CCS plus CSC
    void ConnectPort(uint8_t port) {
        std::lock_guard guard(lock_);
        regs_[layout_.PortSc(port)] |= Driver::Portsc::kCurrentConnect | Driver::Portsc::kConnectStatusChange |
                                       Driver::Portsc::kPortEnabled;
    }

    void SetDoorbellHook(DoorbellHook hook) {
        std::lock_guard guard(lock_);
        doorbellHook_ = std::move(hook);
    }

    /// Controller ignores RS (never leaves halted state)
    void SetStuckHalted(bool stuck) {
        std::lock_guard guard(lock_);
        stuckHalted_ = stuck;
    }

    /// All reads return 0xFFFFFFFF (surprise removal)
    void SetDeviceGone(bool gone) {
        std::lock_guard guard(lock_);
        deviceGone_ = gone;
    }

    [[nodiscard]] std::vector<std::pair<uint32_t, uint32_t>> WriteLog() const {
        std::lock_guard guard(lock_);
        return writes_;
    }
    void ClearWriteLog() {
        std::lock_guard guard(lock_);
        writes_.clear();
    }
    [[nodiscard]] std::vector<std::pair<uint8_t, uint32_t>> Doorbells() const {
        std::lock_guard guard(lock_);
        return doorbells_;
    }

private:
    [[nodiscard]] static constexpr uint32_t Cap(Driver::CapReg reg) noexcept { return static_cast<uint32_t>(reg); }

    [[nodiscard]] uint8_t PortOf(uint32_t offset) const noexcept {
        for (uint8_t port = 1; port <= caps_.maxPorts; ++port) {
            if (offset == layout_.PortSc(port)) {
                return port;
            }
        }
        return 0;
    }

    void WriteUsbCmdLocked(uint32_t value) {
        const uint32_t usbcmd = Op(Driver::OpReg::kUsbCmd);
        const uint32_t usbsts = Op(Driver::OpReg::kUsbSts);
        if (value & Driver::UsbCmd::kHcReset) {
            ResetLocked();
            return;
        }
        regs_[usbcmd] = value;
        const bool running = (value & Driver::UsbCmd::kRunStop) != 0 && !stuckHalted_;
        regs_[usbsts] = (regs_[usbsts] & ~Driver::UsbSts::kHcHalted) | (running ? 0u : Driver::UsbSts::kHcHalted);
    }

    void ResetLocked() {
        for (auto it = regs_.begin(); it != regs_.end();) {
            if (it->first >= kCapLength) {
                it = regs_.erase(it);
            } else {
                ++it;
            }
        }
        regs_[Op(Driver::OpReg::kUsbCmd)] = 0;
        regs_[Op(Driver::OpReg::kUsbSts)] = Driver::UsbSts::kHcHalted;
        regs_[Op(Driver::OpReg::kPageSize)] = 0x1;   // 4 KiB
        for (uint8_t port = 1; port <= caps_.maxPorts; ++port) {
            regs_[layout_.PortSc(port)] = Driver::Portsc::kPortPower;
        }
    }

    FakeCapabilities caps_;
    Driver::RegisterLayout layout_{};

    mutable std::mutex lock_;
    std::map<uint32_t, uint32_t> regs_;
    std::vector<std::pair<uint32_t, uint32_t>> writes_;
    std::vector<std::pair<uint8_t, uint32_t>> doorbells_;
    DoorbellHook doorbellHook_;
    bool stuckHalted_{false};
    bool deviceGone_{false};
};

} // namespace XHCD::Testing
