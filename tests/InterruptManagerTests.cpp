#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <sys/eventfd.h>
#include <unistd.h>

#include <chrono>
#include <thread>

#include "XHCDDriver/Hardware/InterruptManager.hpp"
#include "XHCDDriver/Hardware/RegisterMap.hpp"
#include "mocks/MockHardwareInterface.hpp"

namespace XHCD::Testing {

using namespace XHCD::Driver;
using XHCD::Driver::Tests::MockHardwareInterface;
using ::testing::InSequence;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::StrictMock;
using namespace std::chrono_literals;

namespace {
constexpr RegisterLayout kLayout{0x20, 0x1000, 0x2000};

uint32_t Reg(InterrupterReg reg) { return kLayout.Interrupter(0, reg); }
} // namespace

// ───────────────────────────────────────────────
// IMAN shadow
// ───────────────────────────────────────────────
class InterruptManagerShadowTest : public ::testing::Test {
protected:
    StrictMock<MockHardwareInterface> hw_;
    InterruptManager mgr_{hw_, kLayout, InterruptMode::Msi};
};

TEST_F(InterruptManagerShadowTest, StartsMasked) {
    EXPECT_FALSE(mgr_.IsUnmasked());
}

TEST_F(InterruptManagerShadowTest, UnmaskSetsEnableAndLeavesPendingAlone) {
    // IP reads as 1 but must not be written back (RW1C)
    EXPECT_CALL(hw_, Read(Reg(InterrupterReg::kIman))).WillOnce(Return(Iman::kInterruptPending));
    EXPECT_CALL(hw_, Write(Reg(InterrupterReg::kIman), Iman::kInterruptEnable));

    mgr_.Unmask();
    EXPECT_TRUE(mgr_.IsUnmasked());
}

TEST_F(InterruptManagerShadowTest, RedundantUnmaskSkipsRegister) {
    EXPECT_CALL(hw_, Read(Reg(InterrupterReg::kIman))).WillOnce(Return(0u));
    EXPECT_CALL(hw_, Write(Reg(InterrupterReg::kIman), Iman::kInterruptEnable)).Times(1);

    mgr_.Unmask();
    mgr_.Unmask();
    EXPECT_TRUE(mgr_.IsUnmasked());
}

TEST_F(InterruptManagerShadowTest, MaskClearsEnableOnce) {
    {
        InSequence seq;
        EXPECT_CALL(hw_, Read(Reg(InterrupterReg::kIman))).WillOnce(Return(0u));
        EXPECT_CALL(hw_, Write(Reg(InterrupterReg::kIman), Iman::kInterruptEnable));
        EXPECT_CALL(hw_, Read(Reg(InterrupterReg::kIman)))
            .WillOnce(Return(Iman::kInterruptEnable | Iman::kInterruptPending));
        EXPECT_CALL(hw_, Write(Reg(InterrupterReg::kIman), 0u));
    }

    mgr_.Unmask();
    mgr_.Mask();
    mgr_.Mask();
    EXPECT_FALSE(mgr_.IsUnmasked());
}

TEST_F(InterruptManagerShadowTest, ShadowSurvivesMultipleCycles) {
    EXPECT_CALL(hw_, Read(Reg(InterrupterReg::kIman))).WillRepeatedly(Return(0u));
    EXPECT_CALL(hw_, Write(Reg(InterrupterReg::kIman), Iman::kInterruptEnable)).Times(3);
    EXPECT_CALL(hw_, Write(Reg(InterrupterReg::kIman), 0u)).Times(3);

    for (int i = 0; i < 3; ++i) {
        mgr_.Unmask();
        EXPECT_TRUE(mgr_.IsUnmasked());
        mgr_.Mask();
        EXPECT_FALSE(mgr_.IsUnmasked());
    }
}

// ───────────────────────────────────────────────
// Event ring registers
// ───────────────────────────────────────────────
class InterruptManagerRegisterTest : public ::testing::Test {
protected:
    StrictMock<MockHardwareInterface> hw_;
    InterruptManager mgr_{hw_, kLayout, InterruptMode::Polling};
};

TEST_F(InterruptManagerRegisterTest, ProgramEventRingOrder) {
    const uint64_t erdp = 0x1'2345'6780ull;
    const uint64_t erstBase = 0x0000'0000'8000'0040ull;
    {
        InSequence seq;
        EXPECT_CALL(hw_, Write(Reg(InterrupterReg::kErstSz), 2u));
        EXPECT_CALL(hw_, Write(Reg(InterrupterReg::kErdpLo), 0x2345'6788u));   // EHB written as 1
        EXPECT_CALL(hw_, Write(Reg(InterrupterReg::kErdpHi), 0x1u));
        EXPECT_CALL(hw_, Write(Reg(InterrupterReg::kErstBaLo), 0x8000'0040u));
        EXPECT_CALL(hw_, Write(Reg(InterrupterReg::kErstBaHi), 0u));
        EXPECT_CALL(hw_, Write(Reg(InterrupterReg::kImod), 0u));
        EXPECT_CALL(hw_, Read(Reg(InterrupterReg::kIman))).WillOnce(Return(0u));
        EXPECT_CALL(hw_, Write(Reg(InterrupterReg::kIman), Iman::kInterruptEnable | Iman::kInterruptPending));
    }

    mgr_.ProgramEventRing(2, erdp, erstBase);
    EXPECT_TRUE(mgr_.IsUnmasked());
    EXPECT_EQ(mgr_.LastErdp(), erdp);
}

TEST_F(InterruptManagerRegisterTest, WriteErdpNeverSetsBusy) {
    {
        InSequence seq;
        EXPECT_CALL(hw_, Write(Reg(InterrupterReg::kErdpLo), 0x4000'0012u));
        EXPECT_CALL(hw_, Write(Reg(InterrupterReg::kErdpHi), 0u));
    }
    mgr_.WriteErdp(0x4000'001Aull);   // segment 2 with a stray EHB bit
    EXPECT_EQ(mgr_.LastErdp(), 0x4000'001Aull);
}

TEST_F(InterruptManagerRegisterTest, EventHandlerFinishedClearsBusyAtLastErdp) {
    EXPECT_CALL(hw_, Write(Reg(InterrupterReg::kErdpLo), 0x4000'0011u));
    EXPECT_CALL(hw_, Write(Reg(InterrupterReg::kErdpHi), 0u));
    mgr_.WriteErdp(0x4000'0011ull);

    EXPECT_CALL(hw_, Write(Reg(InterrupterReg::kErdpLo), 0x4000'0019u));
    mgr_.EventHandlerFinished();
}

TEST_F(InterruptManagerRegisterTest, WriteErstSizeKeepsLowHalf) {
    EXPECT_CALL(hw_, Write(Reg(InterrupterReg::kErstSz), 0x0003u));
    mgr_.WriteErstSize(0xABCD'0003u);
}

TEST_F(InterruptManagerRegisterTest, PendingWhenIpOrBusy) {
    EXPECT_CALL(hw_, Read(Reg(InterrupterReg::kIman)))
        .WillOnce(Return(Iman::kInterruptPending))
        .WillOnce(Return(0u))
        .WillOnce(Return(0u));
    EXPECT_CALL(hw_, Read(Reg(InterrupterReg::kErdpLo)))
        .WillOnce(Return(0u))
        .WillOnce(Return(static_cast<uint32_t>(Erdp::kEventHandlerBusy)))
        .WillOnce(Return(0x4000'0000u));

    EXPECT_TRUE(mgr_.InterruptIsPending());
    EXPECT_TRUE(mgr_.InterruptIsPending());
    EXPECT_FALSE(mgr_.InterruptIsPending());
}

TEST_F(InterruptManagerRegisterTest, ForceClearWritesBusyBack) {
    EXPECT_CALL(hw_, Read(Reg(InterrupterReg::kErdpLo))).WillOnce(Return(0x4000'0028u));
    EXPECT_CALL(hw_, Write(Reg(InterrupterReg::kErdpLo), 0x4000'0028u));
    mgr_.ForceClearInterrupt();
}

TEST_F(InterruptManagerRegisterTest, ForceClearWithoutBusyWritesNothing) {
    EXPECT_CALL(hw_, Read(Reg(InterrupterReg::kErdpLo))).WillOnce(Return(0x4000'0020u));
    mgr_.ForceClearInterrupt();
}

TEST(InterruptManagerIrqTest, IntxChecksAndClearsPending) {
    StrictMock<MockHardwareInterface> hw;
    InterruptManager mgr{hw, kLayout, InterruptMode::Intx};

    const uint32_t asserted = Iman::kInterruptEnable | Iman::kInterruptPending;
    EXPECT_CALL(hw, Read(Reg(InterrupterReg::kIman)))
        .WillOnce(Return(asserted))
        .WillOnce(Return(Iman::kInterruptEnable));
    EXPECT_CALL(hw, Write(Reg(InterrupterReg::kIman), asserted));

    EXPECT_TRUE(mgr.ReceivedIrq());
    EXPECT_FALSE(mgr.ReceivedIrq());
}

TEST(InterruptManagerIrqTest, MsiIsAlwaysOurs) {
    StrictMock<MockHardwareInterface> hw;
    InterruptManager mgr{hw, kLayout, InterruptMode::Msi};
    EXPECT_TRUE(mgr.ReceivedIrq());
}

// ───────────────────────────────────────────────
// Irq file and wake
// ───────────────────────────────────────────────
class InterruptManagerWaitTest : public ::testing::Test {
protected:
    void SetUp() override {
        irqFd_ = ::eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK);
        ASSERT_GE(irqFd_, 0);
    }
    void TearDown() override {
        if (irqFd_ >= 0) {
            ::close(irqFd_);
        }
    }

    NiceMock<MockHardwareInterface> hw_;
    int irqFd_{-1};
};

TEST_F(InterruptManagerWaitTest, MsiWithoutIrqFileIsRejected) {
    InterruptManager mgr{hw_, kLayout, InterruptMode::Msi};
    auto result = mgr.Initialise(-1, IrqFileKind::EventFd);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kr, kXHCDReturnBadArgument);
    EXPECT_FALSE(mgr.HasIrqFile());
}

TEST_F(InterruptManagerWaitTest, WaitWithoutIrqFileIsNotReady) {
    InterruptManager mgr{hw_, kLayout, InterruptMode::Polling};
    ASSERT_TRUE(mgr.Initialise(-1, IrqFileKind::EventFd).has_value());
    auto result = mgr.WaitForInterrupt();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kr, kXHCDReturnNotReady);
}

TEST_F(InterruptManagerWaitTest, SignalledEventFdReportsInterrupt) {
    InterruptManager mgr{hw_, kLayout, InterruptMode::Msi};
    ASSERT_TRUE(mgr.Initialise(irqFd_, IrqFileKind::EventFd).has_value());
    EXPECT_TRUE(mgr.HasIrqFile());

    const uint64_t one = 1;
    ASSERT_EQ(::write(irqFd_, &one, sizeof(one)), static_cast<ssize_t>(sizeof(one)));

    auto result = mgr.WaitForInterrupt();
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, IrqWait::Interrupt);

    // Counter was drained
    uint64_t counter = 0;
    EXPECT_LT(::read(irqFd_, &counter, sizeof(counter)), 0);

    // Acknowledge is a no-op for eventfd
    EXPECT_TRUE(mgr.AcknowledgeIrqFile().has_value());
}

TEST_F(InterruptManagerWaitTest, WakeInterruptsBlockingWait) {
    InterruptManager mgr{hw_, kLayout, InterruptMode::Msi};
    ASSERT_TRUE(mgr.Initialise(irqFd_, IrqFileKind::EventFd).has_value());

    std::thread waker([&] {
        std::this_thread::sleep_for(5ms);
        mgr.Wake();
    });
    auto result = mgr.WaitForInterrupt();
    waker.join();

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, IrqWait::Woken);
}

TEST_F(InterruptManagerWaitTest, PollingWaitTimesOutOrWakes) {
    InterruptManager mgr{hw_, kLayout, InterruptMode::Polling};
    ASSERT_TRUE(mgr.Initialise(-1, IrqFileKind::EventFd).has_value());

    const auto start = std::chrono::steady_clock::now();
    EXPECT_EQ(mgr.WaitForWake(5ms), IrqWait::TimedOut);
    EXPECT_GE(std::chrono::steady_clock::now() - start, 4ms);

    mgr.Wake();
    mgr.Wake();
    EXPECT_EQ(mgr.WaitForWake(1s), IrqWait::Woken);
    // Both wakes were folded into one
    EXPECT_EQ(mgr.WaitForWake(1ms), IrqWait::TimedOut);
}

TEST_F(InterruptManagerWaitTest, WaitForWakeBeforeInitialiseTimesOut) {
    InterruptManager mgr{hw_, kLayout, InterruptMode::Polling};
    mgr.Wake();
    EXPECT_EQ(mgr.WaitForWake(1ms), IrqWait::TimedOut);
}

} // namespace XHCD::Testing
