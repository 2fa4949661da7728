#include <gtest/gtest.h>

#include <memory>

#include "simulation/trace.h"
#include "test_helpers.h"

using namespace breadsim;

// --- ResolveWired ---

TEST(TraceResolution, HighDominatesLow) {
  EXPECT_EQ(ResolveWired(State::kLow, State::kHigh), State::kHigh);
  EXPECT_EQ(ResolveWired(State::kHigh, State::kLow), State::kHigh);
}

TEST(TraceResolution, LowBeatsNothing) {
  EXPECT_EQ(ResolveWired(State::kUndefined, State::kLow), State::kLow);
  EXPECT_EQ(ResolveWired(State::kLow, State::kUndefined), State::kLow);
}

TEST(TraceResolution, UndefinedDrivesNothing) {
  EXPECT_EQ(ResolveWired(State::kUndefined, State::kUndefined),
            State::kUndefined);
}

// --- Trace::Communicate ---

class TraceTest : public ::testing::Test {
 protected:
  // Pins 1-2 drive, 3 listens, 4 has no direction.
  ProbeChip driver_{{PinType::kOutput, PinType::kOutput, PinType::kInput,
                     PinType::kUndefined}};
  ProbeChip other_{{PinType::kOutput, PinType::kInput}};
  Trace trace_;

  void ConnectAll() {
    for (uint32_t i = 1; i <= 4; ++i) {
      ASSERT_TRUE(trace_.Connect(driver_, i));
    }
    ASSERT_TRUE(trace_.Connect(other_, 1));
    ASSERT_TRUE(trace_.Connect(other_, 2));
  }
};

TEST_F(TraceTest, LowAndUndefinedResolveLow) {
  ConnectAll();
  driver_.Set(1, State::kLow);
  driver_.Set(2, State::kUndefined);
  other_.Set(1, State::kUndefined);
  trace_.Communicate();
  EXPECT_EQ(trace_.Resolved(), State::kLow);
  EXPECT_EQ(driver_.GetPin(3)->state, State::kLow);
  EXPECT_EQ(driver_.GetPin(4)->state, State::kLow);
  EXPECT_EQ(other_.GetPin(2)->state, State::kLow);
}

TEST_F(TraceTest, HighAndLowResolveHigh) {
  ConnectAll();
  driver_.Set(1, State::kLow);
  driver_.Set(2, State::kHigh);
  other_.Set(1, State::kLow);
  trace_.Communicate();
  EXPECT_EQ(trace_.Resolved(), State::kHigh);
  EXPECT_EQ(driver_.GetPin(3)->state, State::kHigh);
  EXPECT_EQ(other_.GetPin(2)->state, State::kHigh);
}

TEST_F(TraceTest, OutputsAreNeverOverwritten) {
  ConnectAll();
  driver_.Set(1, State::kLow);
  driver_.Set(2, State::kHigh);
  other_.Set(1, State::kUndefined);
  trace_.Communicate();
  EXPECT_EQ(driver_.GetPin(1)->state, State::kLow);
  EXPECT_EQ(driver_.GetPin(2)->state, State::kHigh);
  EXPECT_EQ(other_.GetPin(1)->state, State::kUndefined);
}

TEST_F(TraceTest, AllUndefinedDriversResolveUndefined) {
  ConnectAll();
  driver_.Set(1, State::kUndefined);
  driver_.Set(2, State::kUndefined);
  other_.Set(1, State::kUndefined);
  driver_.GetPin(3)->state = State::kHigh;
  trace_.Communicate();
  EXPECT_EQ(trace_.Resolved(), State::kUndefined);
  EXPECT_EQ(driver_.GetPin(3)->state, State::kUndefined);
}

TEST_F(TraceTest, FloatingWireDrivesUndefined) {
  ASSERT_TRUE(trace_.Connect(driver_, 3));
  ASSERT_TRUE(trace_.Connect(other_, 2));
  driver_.GetPin(3)->state = State::kHigh;
  other_.GetPin(2)->state = State::kLow;
  trace_.Communicate();
  EXPECT_EQ(trace_.Resolved(), State::kUndefined);
  EXPECT_EQ(driver_.GetPin(3)->state, State::kUndefined);
  EXPECT_EQ(other_.GetPin(2)->state, State::kUndefined);
}

TEST_F(TraceTest, EmptyTraceResolvesUndefined) {
  trace_.Communicate();
  EXPECT_EQ(trace_.Resolved(), State::kUndefined);
}

TEST_F(TraceTest, MultipleHighDriversAreAccepted) {
  ConnectAll();
  driver_.Set(1, State::kHigh);
  driver_.Set(2, State::kHigh);
  other_.Set(1, State::kHigh);
  trace_.Communicate();
  EXPECT_EQ(trace_.Resolved(), State::kHigh);
}

TEST_F(TraceTest, ResultIsOrderIndependent) {
  Trace reversed;
  ASSERT_TRUE(reversed.Connect(other_, 1));
  ASSERT_TRUE(reversed.Connect(driver_, 2));
  ASSERT_TRUE(reversed.Connect(driver_, 1));
  ASSERT_TRUE(trace_.Connect(driver_, 1));
  ASSERT_TRUE(trace_.Connect(driver_, 2));
  ASSERT_TRUE(trace_.Connect(other_, 1));
  driver_.Set(1, State::kHigh);
  driver_.Set(2, State::kLow);
  other_.Set(1, State::kUndefined);
  trace_.Communicate();
  reversed.Communicate();
  EXPECT_EQ(trace_.Resolved(), reversed.Resolved());
}

TEST_F(TraceTest, ConnectRejectsOutOfRangePin) {
  EXPECT_FALSE(trace_.Connect(driver_, 0));
  EXPECT_FALSE(trace_.Connect(driver_, 5));
  EXPECT_EQ(trace_.LinkCount(), 0u);
  EXPECT_EQ(driver_.GetPin(5), nullptr);
}

TEST_F(TraceTest, DestroyedChipPinsAreSkipped) {
  auto temp = std::make_unique<ProbeChip>(
      std::initializer_list<PinType>{PinType::kOutput});
  ASSERT_TRUE(trace_.Connect(*temp, 1));
  ASSERT_TRUE(trace_.Connect(driver_, 3));
  temp->Set(1, State::kHigh);
  temp.reset();
  trace_.Communicate();
  EXPECT_EQ(trace_.Resolved(), State::kUndefined);
  EXPECT_EQ(trace_.Pins().size(), 1u);
  EXPECT_EQ(trace_.LinkCount(), 2u);
}
