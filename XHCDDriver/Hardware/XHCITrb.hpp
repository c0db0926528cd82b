#pragma once

#include <cstdint>
#include <optional>

namespace XHCD::HW {

// ============================================================================
// TRB types (xHCI 1.2 Table 6-91)
// ============================================================================

enum class TrbType : uint8_t {
    Reserved = 0,
    // Transfer
    Normal = 1,
    SetupStage = 2,
    DataStage = 3,
    StatusStage = 4,
    Isoch = 5,
    Link = 6,
    EventData = 7,
    NoOp = 8,
    // Command
    EnableSlot = 9,
    DisableSlot = 10,
    AddressDevice = 11,
    ConfigureEndpoint = 12,
    EvaluateContext = 13,
    ResetEndpoint = 14,
    StopEndpoint = 15,
    SetTrDequeuePointer = 16,
    ResetDevice = 17,
    ForceEvent = 18,
    NegotiateBandwidth = 19,
    SetLatencyToleranceValue = 20,
    GetPortBandwidth = 21,
    ForceHeader = 22,
    NoOpCmd = 23,
    GetExtendedProperty = 24,
    SetExtendedProperty = 25,
    Rsv26 = 26,
    Rsv27 = 27,
    Rsv28 = 28,
    Rsv29 = 29,
    Rsv30 = 30,
    Rsv31 = 31,
    // Events
    Transfer = 32,
    CommandCompletion = 33,
    PortStatusChange = 34,
    BandwidthRequest = 35,
    Doorbell = 36,
    HostController = 37,
    DeviceNotification = 38,
    MfindexWrap = 39,
};

// ============================================================================
// Completion codes (xHCI 1.2 Table 6-90)
// ============================================================================

enum class CompletionCode : uint8_t {
    Invalid = 0x00,
    Success = 0x01,
    DataBuffer = 0x02,
    BabbleDetected = 0x03,
    UsbTransaction = 0x04,
    Trb = 0x05,
    Stall = 0x06,
    Resource = 0x07,
    Bandwidth = 0x08,
    NoSlotsAvailable = 0x09,
    InvalidStreamType = 0x0A,
    SlotNotEnabled = 0x0B,
    EndpointNotEnabled = 0x0C,
    ShortPacket = 0x0D,
    RingUnderrun = 0x0E,
    RingOverrun = 0x0F,
    VfEventRingFull = 0x10,
    Parameter = 0x11,
    BandwidthOverrun = 0x12,
    ContextState = 0x13,
    NoPingResponse = 0x14,
    EventRingFull = 0x15,
    IncompatibleDevice = 0x16,
    MissedService = 0x17,
    CommandRingStopped = 0x18,
    CommandAborted = 0x19,
    Stopped = 0x1A,
    StoppedLengthInvalid = 0x1B,
    StoppedShortPacket = 0x1C,
    MaxExitLatencyTooLarge = 0x1D,
    Rsv30 = 0x1E,
    IsochBuffer = 0x1F,
    EventLost = 0x20,
    Undefined = 0x21,
    InvalidStreamId = 0x22,
    SecondaryBandwidth = 0x23,
    SplitTransaction = 0x24,
};

/// Setup Stage TRT field (xHCI §6.4.1.2.1)
enum class TransferKind : uint8_t {
    NoData = 0,
    Reserved = 1,
    Out = 2,
    In = 3,
};

// ============================================================================
// Field layout
// ============================================================================

namespace TrbField {
constexpr uint32_t kCycleBit = 1u << 0;
constexpr uint32_t kEntBit = 1u << 1;           // Evaluate Next TRB
constexpr uint32_t kToggleCycleBit = 1u << 1;   // Link TRB
constexpr uint32_t kIspBit = 1u << 2;           // Interrupt on Short Packet
constexpr uint32_t kEventDataBit = 1u << 2;     // Transfer event ED
constexpr uint32_t kChainBit = 1u << 4;
constexpr uint32_t kIocBit = 1u << 5;
constexpr uint32_t kIdtBit = 1u << 6;
constexpr uint32_t kBsrBit = 1u << 9;           // Address Device / Evaluate Context
constexpr uint32_t kTspBit = 1u << 9;           // Reset Endpoint
constexpr uint32_t kBeiBit = 1u << 9;
constexpr uint32_t kDirInBit = 1u << 16;
constexpr uint32_t kSuspendBit = 1u << 23;

constexpr uint32_t kTypeShift = 10;
constexpr uint32_t kTypeMask = 0x0000FC00u;
constexpr uint32_t kEndpointIdShift = 16;
constexpr uint32_t kEndpointIdMask = 0x001F0000u;
constexpr uint32_t kSlotIdShift = 24;
constexpr uint32_t kTransferTypeShift = 16;

constexpr uint32_t kCompletionCodeShift = 24;
constexpr uint32_t kCompletionParamMask = 0x00FFFFFFu;
constexpr uint32_t kTransferLengthMask = 0x00FFFFFFu;
constexpr uint32_t kTdSizeShift = 17;
constexpr uint32_t kInterrupterShift = 22;
constexpr uint32_t kStreamIdShift = 16;
} // namespace TrbField

// ============================================================================
// TRB
// ============================================================================

/// Transfer Request Block (xHCI §4.11). Same layout on every ring.
struct alignas(16) Trb {
    uint32_t dataLow{0};
    uint32_t dataHigh{0};
    uint32_t status{0};
    uint32_t control{0};

    [[nodiscard]] static constexpr Trb Make(uint64_t data, uint32_t status, uint32_t control) noexcept {
        return Trb{static_cast<uint32_t>(data), static_cast<uint32_t>(data >> 32), status, control};
    }

    /// Reserved TRB: type 0, parameters cleared, cycle as given
    [[nodiscard]] static constexpr Trb Reserved(bool cycle) noexcept {
        return Make(0, 0, (static_cast<uint32_t>(TrbType::Reserved) << TrbField::kTypeShift) |
                              (cycle ? TrbField::kCycleBit : 0u));
    }

    [[nodiscard]] constexpr uint64_t Data() const noexcept {
        return static_cast<uint64_t>(dataLow) | (static_cast<uint64_t>(dataHigh) << 32);
    }
    [[nodiscard]] constexpr bool Cycle() const noexcept { return (control & TrbField::kCycleBit) != 0; }
    [[nodiscard]] constexpr uint8_t RawType() const noexcept {
        return static_cast<uint8_t>((control & TrbField::kTypeMask) >> TrbField::kTypeShift);
    }
    [[nodiscard]] constexpr TrbType Type() const noexcept { return static_cast<TrbType>(RawType()); }
    [[nodiscard]] constexpr uint8_t RawCompletionCode() const noexcept {
        return static_cast<uint8_t>(status >> TrbField::kCompletionCodeShift);
    }
    [[nodiscard]] constexpr CompletionCode Code() const noexcept {
        return static_cast<CompletionCode>(RawCompletionCode());
    }
    [[nodiscard]] constexpr uint32_t CompletionParam() const noexcept {
        return status & TrbField::kCompletionParamMask;
    }
    /// Transfer event: residual byte count that was not transferred
    [[nodiscard]] constexpr uint32_t TransferLength() const noexcept {
        return status & TrbField::kTransferLengthMask;
    }
    [[nodiscard]] constexpr uint8_t SlotId() const noexcept {
        return static_cast<uint8_t>(control >> TrbField::kSlotIdShift);
    }
    [[nodiscard]] constexpr uint8_t EndpointId() const noexcept {
        return static_cast<uint8_t>((control & TrbField::kEndpointIdMask) >> TrbField::kEndpointIdShift);
    }
    [[nodiscard]] constexpr bool EventDataFlag() const noexcept {
        return (control & TrbField::kEventDataBit) != 0;
    }
    [[nodiscard]] constexpr bool ChainFlag() const noexcept { return (control & TrbField::kChainBit) != 0; }

    constexpr void SetCycle(bool cycle) noexcept {
        control = (control & ~TrbField::kCycleBit) | (cycle ? TrbField::kCycleBit : 0u);
    }

    friend constexpr bool operator==(const Trb&, const Trb&) = default;
};
static_assert(sizeof(Trb) == 16, "TRB must be 16 bytes per xHCI §4.11");

// ============================================================================
// Event accessors
// ============================================================================

/// Ring Underrun, Ring Overrun and VF Event Ring Full events carry no TRB pointer (§4.10.3.1)
[[nodiscard]] constexpr bool HasSourcePointer(CompletionCode code) noexcept {
    return code != CompletionCode::RingUnderrun &&
           code != CompletionCode::RingOverrun &&
           code != CompletionCode::VfEventRingFull;
}

/// Command TRB pointer of a Command Completion event
[[nodiscard]] constexpr std::optional<uint64_t> CommandTrbPointer(const Trb& event) noexcept {
    if (event.Type() != TrbType::CommandCompletion || !HasSourcePointer(event.Code())) {
        return std::nullopt;
    }
    return event.Data();
}

/// Transfer TRB pointer of a Transfer event. ED=1 events carry Event Data instead.
[[nodiscard]] constexpr std::optional<uint64_t> TransferTrbPointer(const Trb& event) noexcept {
    if (event.Type() != TrbType::Transfer || !HasSourcePointer(event.Code()) || event.EventDataFlag()) {
        return std::nullopt;
    }
    return event.Data();
}

/// Root hub port number of a Port Status Change event (§6.4.2.3)
[[nodiscard]] constexpr std::optional<uint8_t> PortStatusChangePortId(const Trb& event) noexcept {
    if (event.Type() != TrbType::PortStatusChange) {
        return std::nullopt;
    }
    return static_cast<uint8_t>((event.Data() >> 24) & 0xFF);
}

[[nodiscard]] constexpr bool IsCommandTrb(const Trb& trb) noexcept {
    switch (trb.Type()) {
        case TrbType::NoOpCmd:
        case TrbType::EnableSlot:
        case TrbType::DisableSlot:
        case TrbType::AddressDevice:
        case TrbType::ConfigureEndpoint:
        case TrbType::EvaluateContext:
        case TrbType::ResetEndpoint:
        case TrbType::StopEndpoint:
        case TrbType::SetTrDequeuePointer:
        case TrbType::ResetDevice:
        case TrbType::ForceEvent:
        case TrbType::NegotiateBandwidth:
        case TrbType::SetLatencyToleranceValue:
        case TrbType::GetPortBandwidth:
        case TrbType::ForceHeader:
        case TrbType::GetExtendedProperty:
        case TrbType::SetExtendedProperty:
            return true;
        default:
            return false;
    }
}

[[nodiscard]] constexpr bool IsTransferTrb(const Trb& trb) noexcept {
    switch (trb.Type()) {
        case TrbType::Normal:
        case TrbType::SetupStage:
        case TrbType::DataStage:
        case TrbType::StatusStage:
        case TrbType::Isoch:
        case TrbType::NoOp:
            return true;
        default:
            return false;
    }
}

/// Event types a caller may wait on without a source TRB
[[nodiscard]] constexpr bool IsMiscEventType(TrbType type) noexcept {
    switch (type) {
        case TrbType::PortStatusChange:
        case TrbType::BandwidthRequest:
        case TrbType::Doorbell:
        case TrbType::HostController:
        case TrbType::DeviceNotification:
        case TrbType::MfindexWrap:
            return true;
        default:
            return false;
    }
}

[[nodiscard]] const char* ToString(TrbType type) noexcept;
[[nodiscard]] const char* ToString(CompletionCode code) noexcept;

// ============================================================================
// Builders
// ============================================================================

namespace Detail {
[[nodiscard]] constexpr uint32_t TypeBits(TrbType type) noexcept {
    return static_cast<uint32_t>(type) << TrbField::kTypeShift;
}
[[nodiscard]] constexpr uint32_t Flag(bool on, uint32_t bit) noexcept { return on ? bit : 0u; }
[[nodiscard]] constexpr uint32_t SlotBits(uint8_t slotId) noexcept {
    return static_cast<uint32_t>(slotId) << TrbField::kSlotIdShift;
}
[[nodiscard]] constexpr uint32_t EndpointBits(uint8_t dci) noexcept {
    return (static_cast<uint32_t>(dci) << TrbField::kEndpointIdShift) & TrbField::kEndpointIdMask;
}
} // namespace Detail

/// Link TRB pointing at @p ringBase (§6.4.4.1)
[[nodiscard]] constexpr Trb MakeLink(uint64_t ringBase, bool toggleCycle, bool chain, bool cycle) noexcept {
    return Trb::Make(ringBase & ~uint64_t{0xF}, 0,
                     Detail::TypeBits(TrbType::Link) |
                     Detail::Flag(chain, TrbField::kChainBit) |
                     Detail::Flag(toggleCycle, TrbField::kToggleCycleBit) |
                     Detail::Flag(cycle, TrbField::kCycleBit));
}

// ----- Commands (§6.4.3) -----

[[nodiscard]] constexpr Trb MakeNoOpCommand(bool cycle) noexcept {
    return Trb::Make(0, 0, Detail::TypeBits(TrbType::NoOpCmd) | Detail::Flag(cycle, TrbField::kCycleBit));
}

[[nodiscard]] constexpr Trb MakeEnableSlot(uint8_t slotType, bool cycle) noexcept {
    return Trb::Make(0, 0, ((static_cast<uint32_t>(slotType) & 0x1F) << 16) |
                               Detail::TypeBits(TrbType::EnableSlot) |
                               Detail::Flag(cycle, TrbField::kCycleBit));
}

[[nodiscard]] constexpr Trb MakeDisableSlot(uint8_t slotId, bool cycle) noexcept {
    return Trb::Make(0, 0, Detail::SlotBits(slotId) | Detail::TypeBits(TrbType::DisableSlot) |
                               Detail::Flag(cycle, TrbField::kCycleBit));
}

/// @p inputContext must be 16-byte aligned; low bits are dropped
[[nodiscard]] constexpr Trb MakeAddressDevice(uint8_t slotId, uint64_t inputContext, bool bsr, bool cycle) noexcept {
    return Trb::Make(inputContext & ~uint64_t{0xF}, 0,
                     Detail::SlotBits(slotId) | Detail::TypeBits(TrbType::AddressDevice) |
                     Detail::Flag(bsr, TrbField::kBsrBit) | Detail::Flag(cycle, TrbField::kCycleBit));
}

[[nodiscard]] constexpr Trb MakeConfigureEndpoint(uint8_t slotId, uint64_t inputContext, bool deconfigure, bool cycle) noexcept {
    return Trb::Make(inputContext & ~uint64_t{0xF}, 0,
                     Detail::SlotBits(slotId) | Detail::TypeBits(TrbType::ConfigureEndpoint) |
                     Detail::Flag(deconfigure, 1u << 9) | Detail::Flag(cycle, TrbField::kCycleBit));
}

[[nodiscard]] constexpr Trb MakeEvaluateContext(uint8_t slotId, uint64_t inputContext, bool bsr, bool cycle) noexcept {
    return Trb::Make(inputContext & ~uint64_t{0xF}, 0,
                     Detail::SlotBits(slotId) | Detail::TypeBits(TrbType::EvaluateContext) |
                     Detail::Flag(bsr, TrbField::kBsrBit) | Detail::Flag(cycle, TrbField::kCycleBit));
}

[[nodiscard]] constexpr Trb MakeResetEndpoint(uint8_t slotId, uint8_t dci, bool transferStatePreserve, bool cycle) noexcept {
    return Trb::Make(0, 0, Detail::SlotBits(slotId) | Detail::EndpointBits(dci) |
                               Detail::TypeBits(TrbType::ResetEndpoint) |
                               Detail::Flag(transferStatePreserve, TrbField::kTspBit) |
                               Detail::Flag(cycle, TrbField::kCycleBit));
}

[[nodiscard]] constexpr Trb MakeStopEndpoint(uint8_t slotId, uint8_t dci, bool suspend, bool cycle) noexcept {
    return Trb::Make(0, 0, Detail::SlotBits(slotId) | Detail::Flag(suspend, TrbField::kSuspendBit) |
                               Detail::EndpointBits(dci) | Detail::TypeBits(TrbType::StopEndpoint) |
                               Detail::Flag(cycle, TrbField::kCycleBit));
}

/// @p dequeuePointer carries the DCS in bit 0; @p streamContextType goes to bits 1..3
[[nodiscard]] constexpr Trb MakeSetTrDequeuePointer(uint64_t dequeuePointer, uint8_t streamContextType,
                                                    uint16_t streamId, uint8_t dci, uint8_t slotId,
                                                    bool cycle) noexcept {
    return Trb::Make((dequeuePointer & ~uint64_t{0xE}) | ((static_cast<uint64_t>(streamContextType) & 0x7) << 1),
                     static_cast<uint32_t>(streamId) << TrbField::kStreamIdShift,
                     Detail::SlotBits(slotId) | Detail::EndpointBits(dci) |
                     Detail::TypeBits(TrbType::SetTrDequeuePointer) | Detail::Flag(cycle, TrbField::kCycleBit));
}

[[nodiscard]] constexpr Trb MakeResetDevice(uint8_t slotId, bool cycle) noexcept {
    return Trb::Make(0, 0, Detail::SlotBits(slotId) | Detail::TypeBits(TrbType::ResetDevice) |
                               Detail::Flag(cycle, TrbField::kCycleBit));
}

// ----- Transfers (§6.4.1) -----

/// USB SETUP packet (USB 2.0 §9.3), little-endian on the wire
struct UsbSetup {
    uint8_t requestType{0};
    uint8_t request{0};
    uint16_t value{0};
    uint16_t index{0};
    uint16_t length{0};

    [[nodiscard]] constexpr uint64_t Pack() const noexcept {
        return static_cast<uint64_t>(requestType) |
               (static_cast<uint64_t>(request) << 8) |
               (static_cast<uint64_t>(value) << 16) |
               (static_cast<uint64_t>(index) << 32) |
               (static_cast<uint64_t>(length) << 48);
    }
    [[nodiscard]] constexpr bool IsDeviceToHost() const noexcept { return (requestType & 0x80) != 0; }
};

/// Setup Stage: immediate data, TRB transfer length always 8
[[nodiscard]] constexpr Trb MakeSetupStage(const UsbSetup& setup, TransferKind kind, bool cycle) noexcept {
    return Trb::Make(setup.Pack(), 8,
                     (static_cast<uint32_t>(kind) << TrbField::kTransferTypeShift) |
                     Detail::TypeBits(TrbType::SetupStage) | TrbField::kIdtBit |
                     Detail::Flag(cycle, TrbField::kCycleBit));
}

[[nodiscard]] constexpr Trb MakeDataStage(uint64_t buffer, uint16_t length, bool in, bool cycle) noexcept {
    return Trb::Make(buffer, length,
                     Detail::Flag(in, TrbField::kDirInBit) | Detail::TypeBits(TrbType::DataStage) |
                     Detail::Flag(cycle, TrbField::kCycleBit));
}

[[nodiscard]] constexpr Trb MakeStatusStage(uint16_t interrupter, bool in, bool ioc, bool chain, bool ent, bool cycle) noexcept {
    return Trb::Make(0, static_cast<uint32_t>(interrupter) << TrbField::kInterrupterShift,
                     Detail::Flag(in, TrbField::kDirInBit) | Detail::TypeBits(TrbType::StatusStage) |
                     Detail::Flag(ioc, TrbField::kIocBit) | Detail::Flag(chain, TrbField::kChainBit) |
                     Detail::Flag(ent, TrbField::kEntBit) | Detail::Flag(cycle, TrbField::kCycleBit));
}

struct NormalFlags {
    uint8_t tdSize{0};       ///< TD Size, 5 bits
    uint8_t interrupter{0};
    bool ent{false};
    bool isp{false};
    bool chain{false};
    bool ioc{true};
    bool idt{false};
    bool bei{false};
};

[[nodiscard]] constexpr Trb MakeNormal(uint64_t buffer, uint32_t length, const NormalFlags& f, bool cycle) noexcept {
    return Trb::Make(buffer,
                     (length & 0x1FFFF) |
                     ((static_cast<uint32_t>(f.tdSize) & 0x1F) << TrbField::kTdSizeShift) |
                     (static_cast<uint32_t>(f.interrupter) << TrbField::kInterrupterShift),
                     Detail::Flag(cycle, TrbField::kCycleBit) | Detail::Flag(f.ent, TrbField::kEntBit) |
                     Detail::Flag(f.isp, TrbField::kIspBit) | Detail::Flag(f.chain, TrbField::kChainBit) |
                     Detail::Flag(f.ioc, TrbField::kIocBit) | Detail::Flag(f.idt, TrbField::kIdtBit) |
                     Detail::Flag(f.bei, TrbField::kBeiBit) | Detail::TypeBits(TrbType::Normal));
}

/// Isoch TRB with SIA (start as soon as possible) set
[[nodiscard]] constexpr Trb MakeIsoch(uint64_t buffer, uint32_t length, const NormalFlags& f, bool cycle) noexcept {
    constexpr uint32_t kSiaBit = 1u << 31;
    return Trb::Make(buffer,
                     (length & 0x1FFFF) |
                     ((static_cast<uint32_t>(f.tdSize) & 0x1F) << TrbField::kTdSizeShift) |
                     (static_cast<uint32_t>(f.interrupter) << TrbField::kInterrupterShift),
                     kSiaBit | Detail::Flag(cycle, TrbField::kCycleBit) | Detail::Flag(f.ent, TrbField::kEntBit) |
                     Detail::Flag(f.isp, TrbField::kIspBit) | Detail::Flag(f.chain, TrbField::kChainBit) |
                     Detail::Flag(f.ioc, TrbField::kIocBit) | Detail::Flag(f.idt, TrbField::kIdtBit) |
                     Detail::Flag(f.bei, TrbField::kBeiBit) | Detail::TypeBits(TrbType::Isoch));
}

[[nodiscard]] constexpr Trb MakeTransferNoOp(uint8_t interrupter, bool ent, bool chain, bool ioc, bool cycle) noexcept {
    return Trb::Make(0, static_cast<uint32_t>(interrupter) << TrbField::kInterrupterShift,
                     Detail::TypeBits(TrbType::NoOp) | Detail::Flag(ioc, TrbField::kIocBit) |
                     Detail::Flag(chain, TrbField::kChainBit) | Detail::Flag(ent, TrbField::kEntBit) |
                     Detail::Flag(cycle, TrbField::kCycleBit));
}

} // namespace XHCD::HW
