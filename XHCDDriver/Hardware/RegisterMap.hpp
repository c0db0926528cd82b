#pragma once

#include <cstdint>

namespace XHCD::Driver {

// xHCI register offsets and bit fields (xHCI 1.2 chapter 5). Capability
// offsets are absolute within BAR0; the other blocks are relative to the
// base computed by RegisterLayout.

enum class CapReg : uint32_t {
    kCapLengthVersion = 0x00,  // CAPLENGTH [7:0], HCIVERSION [31:16]
    kHcsParams1 = 0x04,
    kHcsParams2 = 0x08,
    kHcsParams3 = 0x0C,
    kHccParams1 = 0x10,
    kDbOff = 0x14,
    kRtsOff = 0x18,
    kHccParams2 = 0x1C,
};

enum class OpReg : uint32_t {
    kUsbCmd = 0x00,
    kUsbSts = 0x04,
    kPageSize = 0x08,
    kDnCtrl = 0x14,
    kCrcrLo = 0x18,
    kCrcrHi = 0x1C,
    kDcbaapLo = 0x30,
    kDcbaapHi = 0x34,
    kConfig = 0x38,
};

enum class InterrupterReg : uint32_t {
    kIman = 0x00,
    kImod = 0x04,
    kErstSz = 0x08,
    kErstBaLo = 0x10,
    kErstBaHi = 0x14,
    kErdpLo = 0x18,
    kErdpHi = 0x1C,
};

namespace UsbCmd {
constexpr uint32_t kRunStop = 1u << 0;
constexpr uint32_t kHcReset = 1u << 1;
constexpr uint32_t kInterrupterEnable = 1u << 2;
constexpr uint32_t kHostSystemErrorEnable = 1u << 3;
} // namespace UsbCmd

namespace UsbSts {
constexpr uint32_t kHcHalted = 1u << 0;
constexpr uint32_t kHostSystemError = 1u << 2;
constexpr uint32_t kEventInterrupt = 1u << 3;       // RW1C
constexpr uint32_t kPortChangeDetect = 1u << 4;     // RW1C
constexpr uint32_t kControllerNotReady = 1u << 11;
constexpr uint32_t kHostControllerError = 1u << 12;
} // namespace UsbSts

namespace Iman {
constexpr uint32_t kInterruptPending = 1u << 0;     // RW1C
constexpr uint32_t kInterruptEnable = 1u << 1;
} // namespace Iman

namespace Erdp {
constexpr uint64_t kSegmentIndexMask = 0x7;         // DESI
constexpr uint64_t kEventHandlerBusy = 1u << 3;     // RW1C
constexpr uint64_t kPointerMask = ~uint64_t{0xF};
} // namespace Erdp

/// CRCR writable bits: pointer [63:6] and RCS [0]
constexpr uint64_t kCrcrMask = 0xFFFFFFFFFFFFFFC1ull;

namespace Portsc {
constexpr uint32_t kCurrentConnect = 1u << 0;
constexpr uint32_t kPortEnabled = 1u << 1;          // RW1C, writing 1 disables the port
constexpr uint32_t kPortReset = 1u << 4;            // RW1S
constexpr uint32_t kPortPower = 1u << 9;
constexpr uint32_t kLinkWriteStrobe = 1u << 16;
constexpr uint32_t kConnectStatusChange = 1u << 17; // RW1C
constexpr uint32_t kChangeBits = 0x00FE0000u;       // CSC PEC WRC OCC PRC PLC CEC (RW1C)

/// Bits that are safe to write back unchanged (RO and RWS fields)
constexpr uint32_t kPreserveMask =
    kCurrentConnect | (1u << 3) /*OCA*/ | (0xFu << 5) /*PLS*/ | kPortPower |
    (0xFu << 10) /*speed*/ | (0x3u << 14) /*PIC*/ | (0x7u << 25) /*WCE WDE WOE*/ | (1u << 30) /*DR*/;

[[nodiscard]] constexpr uint32_t Neutral(uint32_t portsc) noexcept { return portsc & kPreserveMask; }
} // namespace Portsc

constexpr uint32_t kPortRegisterBase = 0x400;
constexpr uint32_t kPortRegisterStride = 0x10;
constexpr uint32_t kInterrupterBase = 0x20;
constexpr uint32_t kInterrupterStride = 0x20;

/// Decoded capability fields (xHCI §5.3)
struct Capabilities {
    uint8_t capLength{0};
    uint16_t hciVersion{0};
    uint8_t maxSlots{0};
    uint16_t maxInterrupters{0};
    uint8_t maxPorts{0};
    uint8_t erstMax{0};        ///< ERST may hold 2^erstMax entries
    bool ac64{false};
    bool contextSize64{false};
    uint32_t doorbellOffset{0};
    uint32_t runtimeOffset{0};

    [[nodiscard]] static constexpr Capabilities Decode(uint32_t capLengthVersion, uint32_t hcsParams1,
                                                       uint32_t hcsParams2, uint32_t hccParams1,
                                                       uint32_t dbOff, uint32_t rtsOff) noexcept {
        Capabilities caps{};
        caps.capLength = static_cast<uint8_t>(capLengthVersion & 0xFF);
        caps.hciVersion = static_cast<uint16_t>(capLengthVersion >> 16);
        caps.maxSlots = static_cast<uint8_t>(hcsParams1 & 0xFF);
        caps.maxInterrupters = static_cast<uint16_t>((hcsParams1 >> 8) & 0x7FF);
        caps.maxPorts = static_cast<uint8_t>(hcsParams1 >> 24);
        caps.erstMax = static_cast<uint8_t>((hcsParams2 >> 4) & 0xF);
        caps.ac64 = (hccParams1 & 0x1) != 0;
        caps.contextSize64 = (hccParams1 & 0x4) != 0;
        caps.doorbellOffset = dbOff & ~0x3u;
        caps.runtimeOffset = rtsOff & ~0x1Fu;
        return caps;
    }

    [[nodiscard]] constexpr uint32_t MaxErstEntries() const noexcept { return 1u << erstMax; }
};

/// BAR offsets of every register block, derived from Capabilities
struct RegisterLayout {
    uint32_t operationalBase{0};
    uint32_t runtimeBase{0};
    uint32_t doorbellBase{0};

    [[nodiscard]] static constexpr RegisterLayout From(const Capabilities& caps) noexcept {
        return RegisterLayout{caps.capLength, caps.runtimeOffset, caps.doorbellOffset};
    }

    [[nodiscard]] constexpr uint32_t Op(OpReg reg) const noexcept {
        return operationalBase + static_cast<uint32_t>(reg);
    }
    [[nodiscard]] constexpr uint32_t Interrupter(uint16_t index, InterrupterReg reg) const noexcept {
        return runtimeBase + kInterrupterBase + kInterrupterStride * index + static_cast<uint32_t>(reg);
    }
    /// @p portNumber is 1-based as reported in Port Status Change events
    [[nodiscard]] constexpr uint32_t PortSc(uint8_t portNumber) const noexcept {
        return operationalBase + kPortRegisterBase + kPortRegisterStride * (portNumber - 1u);
    }
    [[nodiscard]] constexpr uint32_t Doorbell(uint8_t slotId) const noexcept {
        return doorbellBase + 4u * slotId;
    }
};

} // namespace XHCD::Driver
