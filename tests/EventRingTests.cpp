#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "XHCDDriver/Rings/EventRing.hpp"
#include "mocks/MockDMAMemory.hpp"
#include "mocks/TestDmaSlab.hpp"

namespace XHCD::Testing {

using namespace XHCD::HW;
using Rings::ErstEntry;
using Rings::EventRing;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;

class EventRingTest : public ::testing::Test {
protected:
    static constexpr size_t kSegmentSize = 16;
    static constexpr size_t kMaxSegments = 2;

    TestDmaSlab slab_{};
    EventRing ring_{};

    void SetUp() override {
        ASSERT_TRUE(slab_.Ok());
        ASSERT_TRUE(ring_.Initialize(slab_.Dma(), kSegmentSize, kMaxSegments).has_value());
    }

    /// Controller-side write of one event slot
    void Produce(size_t segment, size_t index, bool cycle, CompletionCode code = CompletionCode::Success,
                 TrbType type = TrbType::CommandCompletion) {
        Trb* slots = slab_.At<Trb>(ring_.SegmentBase(segment));
        slots[index] = Trb::Make(0x1000 + index * 16, static_cast<uint32_t>(code) << 24,
                                 (static_cast<uint32_t>(type) << 10) | (cycle ? 1u : 0u));
    }

    [[nodiscard]] const ErstEntry& Erst(size_t index) {
        return slab_.At<ErstEntry>(ring_.ErstBase())[index];
    }

    void ProduceAndConsumeSegment(size_t segment, bool cycle) {
        for (size_t i = 0; i < kSegmentSize; ++i) {
            Produce(segment, i, cycle);
            ASSERT_TRUE(ring_.Peek().has_value()) << "segment " << segment << " slot " << i;
            ring_.Consume();
        }
    }
};

// ============================================================================
// Initialization
// ============================================================================

TEST_F(EventRingTest, InitializeWritesFirstSegmentTableEntry) {
    EXPECT_EQ(ring_.ErstSize(), 1u);
    EXPECT_EQ(ring_.ErstBase() % 64, 0u);
    EXPECT_EQ(ring_.SegmentBase(0) % 64, 0u);

    const ErstEntry& entry = Erst(0);
    const uint64_t address = (static_cast<uint64_t>(entry.addressHigh) << 32) | entry.addressLow;
    EXPECT_EQ(address, ring_.SegmentBase(0));
    EXPECT_EQ(entry.size, kSegmentSize);

    EXPECT_TRUE(ring_.ConsumerCycle());
    EXPECT_EQ(ring_.Erdp(), ring_.SegmentBase(0));
    EXPECT_EQ(ring_.NextIndex(), 0u);
    EXPECT_FALSE(ring_.Peek().has_value());
}

TEST_F(EventRingTest, RejectsBadGeometry) {
    EventRing small;
    auto tooSmall = small.Initialize(slab_.Dma(), 8, 1);
    ASSERT_FALSE(tooSmall.has_value());
    EXPECT_EQ(tooSmall.error().kr, kXHCDReturnBadArgument);

    EventRing noSegments;
    auto none = noSegments.Initialize(slab_.Dma(), 16, 0);
    ASSERT_FALSE(none.has_value());
    EXPECT_EQ(none.error().kr, kXHCDReturnBadArgument);

    auto twice = ring_.Initialize(slab_.Dma(), 16, 1);
    ASSERT_FALSE(twice.has_value());
    EXPECT_EQ(twice.error().kr, kXHCDReturnBadArgument);
}

// ============================================================================
// Ownership by cycle bit
// ============================================================================

TEST_F(EventRingTest, PeekReturnsEventOwnedBySoftware) {
    Produce(0, 0, true);

    auto event = ring_.Peek();
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->Type(), TrbType::CommandCompletion);
    EXPECT_EQ(event->Code(), CompletionCode::Success);
    EXPECT_EQ(event->Data(), 0x1000u);

    // Peek does not advance
    EXPECT_TRUE(ring_.Peek().has_value());
    EXPECT_EQ(ring_.NextIndex(), 0u);
}

TEST_F(EventRingTest, WrongCycleOrInvalidCodeIsNotAnEvent) {
    Produce(0, 0, false);
    EXPECT_FALSE(ring_.Peek().has_value());

    Produce(0, 0, true, CompletionCode::Invalid);
    EXPECT_FALSE(ring_.Peek().has_value());
}

TEST_F(EventRingTest, ConsumeClearsSlotAndAdvancesErdpByOneTrb) {
    Produce(0, 0, true);
    Produce(0, 1, true);

    ring_.Consume();

    const Trb& cleared = slab_.At<Trb>(ring_.SegmentBase(0))[0];
    EXPECT_EQ(cleared.Type(), TrbType::Reserved);
    EXPECT_FALSE(cleared.Cycle());
    EXPECT_EQ(cleared.Data(), 0u);

    EXPECT_EQ(ring_.Erdp(), ring_.SegmentBase(0) + sizeof(Trb));
    EXPECT_EQ(ring_.NextIndex(), 1u);
    auto next = ring_.Peek();
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(next->Data(), 0x1010u);
}

TEST_F(EventRingTest, WrapTogglesConsumerCycle) {
    ProduceAndConsumeSegment(0, true);

    EXPECT_FALSE(ring_.ConsumerCycle());
    EXPECT_EQ(ring_.Erdp(), ring_.SegmentBase(0));
    EXPECT_EQ(ring_.NextIndex(), 0u);
}

TEST_F(EventRingTest, ConsumedEntriesStayInvalidAfterWrap) {
    ProduceAndConsumeSegment(0, true);

    // Every consumed slot now carries cycle 0 == CCS, but code Invalid
    for (size_t i = 0; i < kSegmentSize; ++i) {
        EXPECT_FALSE(ring_.Peek().has_value());
        Produce(0, i, false);
        ASSERT_TRUE(ring_.Peek().has_value());
        ring_.Consume();
    }
    EXPECT_TRUE(ring_.ConsumerCycle());
}

// ============================================================================
// Growth
// ============================================================================

TEST_F(EventRingTest, GrowAppendsSegmentAndTableEntry) {
    auto size = ring_.Grow();
    ASSERT_TRUE(size.has_value());
    EXPECT_EQ(*size, 2u);
    EXPECT_EQ(ring_.SegmentCount(), 2u);

    const ErstEntry& entry = Erst(1);
    const uint64_t address = (static_cast<uint64_t>(entry.addressHigh) << 32) | entry.addressLow;
    EXPECT_EQ(address, ring_.SegmentBase(1));
    EXPECT_EQ(entry.size, kSegmentSize);
    EXPECT_NE(ring_.SegmentBase(1), ring_.SegmentBase(0));
}

TEST_F(EventRingTest, ErdpCarriesSegmentIndexAcrossSegments) {
    ASSERT_TRUE(ring_.Grow().has_value());

    ProduceAndConsumeSegment(0, true);
    // Still on the first lap: CCS unchanged, DESI = 1
    EXPECT_TRUE(ring_.ConsumerCycle());
    EXPECT_EQ(ring_.Erdp(), ring_.SegmentBase(1) | 1u);
    EXPECT_EQ(ring_.DequeuePointer(), ring_.SegmentBase(1));
    EXPECT_EQ(ring_.NextIndex(), kSegmentSize);

    ProduceAndConsumeSegment(1, true);
    EXPECT_FALSE(ring_.ConsumerCycle());
    EXPECT_EQ(ring_.Erdp(), ring_.SegmentBase(0));
}

TEST_F(EventRingTest, GrowAtTableCapacityIsNoSpace) {
    ASSERT_TRUE(ring_.Grow().has_value());

    auto full = ring_.Grow();
    ASSERT_FALSE(full.has_value());
    EXPECT_EQ(full.error().kr, kXHCDReturnNoSpace);
    EXPECT_TRUE(full.error().IsRecoverable());
    EXPECT_EQ(ring_.SegmentCount(), kMaxSegments);
}

TEST_F(EventRingTest, GrowWithoutDmaMemoryIsNoSpace) {
    alignas(64) static uint8_t erst[64];
    alignas(64) static Trb segment[kSegmentSize];

    NiceMock<MockDMAMemory> dma;
    EXPECT_CALL(dma, AllocateRegion(_, _, _))
        .WillOnce(Return(Shared::DMARegion{erst, 0x2000'0000ull, sizeof(erst)}))
        .WillOnce(Return(Shared::DMARegion{reinterpret_cast<uint8_t*>(segment), 0x2000'1000ull, sizeof(segment)}))
        .WillOnce(Return(std::nullopt));

    EventRing ring;
    ASSERT_TRUE(ring.Initialize(dma, kSegmentSize, 4).has_value());

    auto grown = ring.Grow();
    ASSERT_FALSE(grown.has_value());
    EXPECT_EQ(grown.error().kr, kXHCDReturnNoSpace);
    EXPECT_EQ(ring.SegmentCount(), 1u);
    EXPECT_EQ(ring.ErstSize(), 1u);
}

TEST_F(EventRingTest, ReleaseReturnsSegmentsAndTable) {
    ASSERT_TRUE(ring_.Grow().has_value());
    ring_.Release();

    EXPECT_FALSE(ring_.IsInitialized());
    EXPECT_EQ(slab_.Dma().FreeListSize(), 3u);
    EXPECT_FALSE(ring_.Peek().has_value());
}

} // namespace XHCD::Testing
