// Repository: DeckSync
// Component: Position extrapolator contract tests
// Purpose: Clock-derived positions with looping and clamping.
// Copyright (c) 2025 DeckSync

#include "../BaseContractTest.h"
#include "ContractRegistryEnvironment.h"

#include <optional>

#include "decksync/timeline/DeckTypes.hpp"
#include "decksync/timeline/PositionExtrapolator.hpp"

using namespace decksync;
using namespace decksync::tests;

namespace
{

  const bool kRegisterCoverage = []()
  {
    RegisterExpectedDomainCoverage("PositionExtrapolator",
                                   {"PEX-001", "PEX-002", "PEX-003", "PEX-004", "PEX-005"});
    return true;
  }();

  class PositionExtrapolatorContractTest : public BaseContractTest
  {
  protected:
    [[nodiscard]] std::string DomainName() const override
    {
      return "PositionExtrapolator";
    }

    [[nodiscard]] std::vector<std::string> CoveredRuleIds() const override
    {
      return {"PEX-001", "PEX-002", "PEX-003", "PEX-004", "PEX-005"};
    }

    static timeline::DeckTimelineState Playing(double base, double rate, double updated_at)
    {
      timeline::DeckTimelineState state;
      state.src = "clip.mp4";
      state.is_playing = true;
      state.base_position = base;
      state.play_rate = rate;
      state.updated_at = updated_at;
      return state;
    }
  };

  // Rule: PEX-001 Playing position advances with wall clock at play rate
  TEST_F(PositionExtrapolatorContractTest, PEX_001_PlayingAtNeutralRate)
  {
    const auto state = Playing(10.0, 1.0, 100.0);
    EXPECT_DOUBLE_EQ(timeline::PositionAt(state, 103.0), 13.0);
  }

  TEST_F(PositionExtrapolatorContractTest, PEX_001_PlayingAtDoubleRate)
  {
    const auto state = Playing(10.0, 2.0, 100.0);
    EXPECT_DOUBLE_EQ(timeline::PositionAt(state, 102.5), 15.0);
  }

  // Rule: PEX-002 Stopped decks report base position, never negative
  TEST_F(PositionExtrapolatorContractTest, PEX_002_StoppedIgnoresElapsedTime)
  {
    auto state = Playing(42.0, 1.0, 100.0);
    state.is_playing = false;
    EXPECT_DOUBLE_EQ(timeline::PositionAt(state, 500.0), 42.0);

    state.base_position = -3.0;
    EXPECT_DOUBLE_EQ(timeline::PositionAt(state, 500.0), 0.0);
  }

  TEST_F(PositionExtrapolatorContractTest, PEX_002_ClockBehindSnapshotClampsAtZero)
  {
    // A client clock running behind the authority must not yield negatives.
    const auto state = Playing(1.0, 1.0, 100.0);
    EXPECT_DOUBLE_EQ(timeline::PositionAt(state, 95.0), 0.0);
  }

  // Rule: PEX-003 Position is monotonically non-decreasing while playing
  TEST_F(PositionExtrapolatorContractTest, PEX_003_MonotonicWhilePlaying)
  {
    for (double rate : {0.0, 0.25, 1.0, 3.5, 8.0})
    {
      const auto state = Playing(5.0, rate, 100.0);
      double previous = timeline::PositionAt(state, 100.0);
      for (int i = 1; i <= 200; ++i)
      {
        const double now = 100.0 + i * 0.037;
        const double position = timeline::PositionAt(state, now);
        EXPECT_GE(position, previous) << "rate=" << rate << " now=" << now;
        previous = position;
      }
    }
  }

  // Rule: PEX-004 Progress is capped at 100 and unknown without duration
  TEST_F(PositionExtrapolatorContractTest, PEX_004_ProgressCappedAtHundred)
  {
    auto state = Playing(0.0, 1.0, 100.0);
    EXPECT_FALSE(timeline::ProgressPercent(state, 110.0).has_value());

    state.duration = 20.0;
    ASSERT_TRUE(timeline::ProgressPercent(state, 110.0).has_value());
    EXPECT_DOUBLE_EQ(*timeline::ProgressPercent(state, 110.0), 50.0);
    EXPECT_DOUBLE_EQ(*timeline::ProgressPercent(state, 160.0), 100.0);
  }

  // Rule: PEX-005 Looped position folds into the media duration
  TEST_F(PositionExtrapolatorContractTest, PEX_005_LoopedPositionWrapsByDuration)
  {
    auto state = Playing(0.0, 1.0, 100.0);
    EXPECT_DOUBLE_EQ(timeline::LoopedPositionAt(state, 125.0), 25.0);

    state.duration = 10.0;
    EXPECT_NEAR(timeline::LoopedPositionAt(state, 125.0), 5.0, 1e-9);
  }

} // namespace
