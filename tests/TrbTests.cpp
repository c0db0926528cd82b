#include <gtest/gtest.h>

#include "XHCDDriver/Hardware/XHCITrb.hpp"

namespace XHCD::Testing {

using namespace XHCD::HW;

// ============================================================================
// Field accessors
// ============================================================================

TEST(TrbTests, ControlWordFieldsDecode) {
    // Transfer event: slot 5, EP ID 3, ED=0, cycle 1
    const Trb event = Trb::Make(0x1234'5678'9ABC'DEF0ull,
                                (static_cast<uint32_t>(CompletionCode::ShortPacket) << 24) | 0x000123,
                                (5u << 24) | (3u << 16) | (32u << 10) | 1u);

    EXPECT_EQ(event.Type(), TrbType::Transfer);
    EXPECT_EQ(event.Code(), CompletionCode::ShortPacket);
    EXPECT_EQ(event.SlotId(), 5u);
    EXPECT_EQ(event.EndpointId(), 3u);
    EXPECT_EQ(event.TransferLength(), 0x123u);
    EXPECT_TRUE(event.Cycle());
    EXPECT_FALSE(event.EventDataFlag());
    EXPECT_EQ(event.Data(), 0x1234'5678'9ABC'DEF0ull);
}

TEST(TrbTests, SetCycleOnlyTouchesBitZero) {
    Trb trb = MakeNoOpCommand(false);
    const uint32_t before = trb.control;
    trb.SetCycle(true);
    EXPECT_EQ(trb.control, before | 1u);
    trb.SetCycle(false);
    EXPECT_EQ(trb.control, before);
}

TEST(TrbTests, ReservedTrbKeepsRequestedCycle) {
    EXPECT_TRUE(Trb::Reserved(true).Cycle());
    EXPECT_FALSE(Trb::Reserved(false).Cycle());
    EXPECT_EQ(Trb::Reserved(true).Type(), TrbType::Reserved);
    EXPECT_EQ(Trb::Reserved(true).Data(), 0u);
}

// ============================================================================
// Source pointers
// ============================================================================

TEST(TrbTests, UnderrunOverrunAndVfFullCarryNoPointer) {
    EXPECT_FALSE(HasSourcePointer(CompletionCode::RingUnderrun));
    EXPECT_FALSE(HasSourcePointer(CompletionCode::RingOverrun));
    EXPECT_FALSE(HasSourcePointer(CompletionCode::VfEventRingFull));
    EXPECT_TRUE(HasSourcePointer(CompletionCode::Success));
    EXPECT_TRUE(HasSourcePointer(CompletionCode::Stall));
}

TEST(TrbTests, TransferPointerAbsentForEventDataAndUnderrun) {
    const uint32_t transfer = static_cast<uint32_t>(TrbType::Transfer) << 10;
    const uint32_t success = static_cast<uint32_t>(CompletionCode::Success) << 24;
    const uint32_t underrun = static_cast<uint32_t>(CompletionCode::RingUnderrun) << 24;

    EXPECT_EQ(TransferTrbPointer(Trb::Make(0x1000, success, transfer)), 0x1000u);
    EXPECT_FALSE(TransferTrbPointer(Trb::Make(0x1000, success, transfer | TrbField::kEventDataBit)).has_value());
    EXPECT_FALSE(TransferTrbPointer(Trb::Make(0x1000, underrun, transfer)).has_value());
    // Not a transfer event at all
    EXPECT_FALSE(TransferTrbPointer(Trb::Make(0x1000, success, static_cast<uint32_t>(TrbType::CommandCompletion) << 10))
                     .has_value());
}

TEST(TrbTests, CommandPointerOnlyOnCommandCompletion) {
    const uint32_t success = static_cast<uint32_t>(CompletionCode::Success) << 24;
    const Trb completion = Trb::Make(0x2040, success, static_cast<uint32_t>(TrbType::CommandCompletion) << 10);
    EXPECT_EQ(CommandTrbPointer(completion), 0x2040u);

    const Trb portChange = Trb::Make(0x2040, success, static_cast<uint32_t>(TrbType::PortStatusChange) << 10);
    EXPECT_FALSE(CommandTrbPointer(portChange).has_value());
}

TEST(TrbTests, PortStatusChangePortIdFromParameter) {
    const Trb event = Trb::Make(static_cast<uint64_t>(7) << 24, 1u << 24,
                                static_cast<uint32_t>(TrbType::PortStatusChange) << 10);
    EXPECT_EQ(PortStatusChangePortId(event), 7u);
}

// ============================================================================
// Classification
// ============================================================================

TEST(TrbTests, ClassifiesCommandsTransfersAndMiscEvents) {
    EXPECT_TRUE(IsCommandTrb(MakeEnableSlot(0, true)));
    EXPECT_TRUE(IsCommandTrb(MakeNoOpCommand(true)));
    EXPECT_FALSE(IsCommandTrb(MakeTransferNoOp(0, false, false, true, true)));

    EXPECT_TRUE(IsTransferTrb(MakeSetupStage(UsbSetup{}, TransferKind::NoData, true)));
    EXPECT_TRUE(IsTransferTrb(MakeNormal(0x1000, 64, NormalFlags{}, true)));
    EXPECT_FALSE(IsTransferTrb(MakeLink(0x1000, true, false, true)));

    EXPECT_TRUE(IsMiscEventType(TrbType::PortStatusChange));
    EXPECT_TRUE(IsMiscEventType(TrbType::MfindexWrap));
    EXPECT_FALSE(IsMiscEventType(TrbType::Transfer));
    EXPECT_FALSE(IsMiscEventType(TrbType::CommandCompletion));
}

// ============================================================================
// Builders
// ============================================================================

TEST(TrbTests, LinkTrbPointsAtBaseWithToggleCycle) {
    const Trb link = MakeLink(0xABCD'0040ull, true, true, false);
    EXPECT_EQ(link.Type(), TrbType::Link);
    EXPECT_EQ(link.Data(), 0xABCD'0040ull);
    EXPECT_NE(link.control & TrbField::kToggleCycleBit, 0u);
    EXPECT_TRUE(link.ChainFlag());
    EXPECT_FALSE(link.Cycle());
}

TEST(TrbTests, SetupStageCarriesImmediatePacket) {
    const UsbSetup getDescriptor{0x80, 0x06, 0x0100, 0x0000, 18};
    const Trb setup = MakeSetupStage(getDescriptor, TransferKind::In, true);

    EXPECT_EQ(setup.Type(), TrbType::SetupStage);
    EXPECT_EQ(setup.dataLow, 0x0100'0680u);
    EXPECT_EQ(setup.dataHigh, 0x0012'0000u);
    EXPECT_EQ(setup.status, 8u);
    EXPECT_NE(setup.control & TrbField::kIdtBit, 0u);
    EXPECT_EQ((setup.control >> 16) & 0x3, static_cast<uint32_t>(TransferKind::In));
    EXPECT_TRUE(getDescriptor.IsDeviceToHost());
}

TEST(TrbTests, AddressDeviceEncodesSlotAndBsr) {
    const Trb trb = MakeAddressDevice(3, 0x5000'0040ull, true, true);
    EXPECT_EQ(trb.Type(), TrbType::AddressDevice);
    EXPECT_EQ(trb.SlotId(), 3u);
    EXPECT_EQ(trb.Data(), 0x5000'0040ull);
    EXPECT_NE(trb.control & TrbField::kBsrBit, 0u);
}

TEST(TrbTests, StopEndpointEncodesDciAndSuspend) {
    const Trb trb = MakeStopEndpoint(2, 5, true, false);
    EXPECT_EQ(trb.SlotId(), 2u);
    EXPECT_EQ(trb.EndpointId(), 5u);
    EXPECT_NE(trb.control & TrbField::kSuspendBit, 0u);
}

TEST(TrbTests, SetTrDequeuePointerKeepsDcsAndStream) {
    const Trb trb = MakeSetTrDequeuePointer(0x8000'0001ull, 1, 4, 3, 1, true);
    EXPECT_EQ(trb.Type(), TrbType::SetTrDequeuePointer);
    EXPECT_EQ(trb.Data() & 0x1, 1u);
    EXPECT_EQ((trb.Data() >> 1) & 0x7, 1u);
    EXPECT_EQ(trb.status >> 16, 4u);
    EXPECT_EQ(trb.EndpointId(), 3u);
}

TEST(TrbTests, IsochSetsStartAsap) {
    const Trb trb = MakeIsoch(0x9000, 192, NormalFlags{}, true);
    EXPECT_EQ(trb.Type(), TrbType::Isoch);
    EXPECT_NE(trb.control & (1u << 31), 0u);
    EXPECT_EQ(trb.status & 0x1FFFF, 192u);
}

TEST(TrbTests, NamesForLogs) {
    EXPECT_STREQ(ToString(TrbType::CommandCompletion), "CommandCompletion");
    EXPECT_STREQ(ToString(CompletionCode::Success), "Success");
}

} // namespace XHCD::Testing
