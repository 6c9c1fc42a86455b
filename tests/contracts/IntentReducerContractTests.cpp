// Repository: DeckSync
// Component: Intent reducer contract tests
// Purpose: Pure reduction of intents and patches into deck state.
// Copyright (c) 2025 DeckSync

#include "../BaseContractTest.h"
#include "ContractRegistryEnvironment.h"

#include <limits>

#include "decksync/timeline/DeckTypes.hpp"
#include "decksync/timeline/Intent.hpp"
#include "decksync/timeline/IntentReducer.hpp"
#include "decksync/timeline/PositionExtrapolator.hpp"

using namespace decksync;
using namespace decksync::tests;

namespace
{

  const bool kRegisterCoverage = []()
  {
    RegisterExpectedDomainCoverage("IntentReducer",
                                   {"IRD-001", "IRD-002", "IRD-003", "IRD-004", "IRD-005", "IRD-006"});
    return true;
  }();

  class IntentReducerContractTest : public BaseContractTest
  {
  protected:
    [[nodiscard]] std::string DomainName() const override
    {
      return "IntentReducer";
    }

    [[nodiscard]] std::vector<std::string> CoveredRuleIds() const override
    {
      return {"IRD-001", "IRD-002", "IRD-003", "IRD-004", "IRD-005", "IRD-006"};
    }

    void SetUp() override
    {
      BaseContractTest::SetUp();
      state_.src = "clip.mp4";
      state_.is_playing = true;
      state_.base_position = 10.0;
      state_.play_rate = 1.0;
      state_.updated_at = 100.0;
      state_.version = 7;
      state_.duration = 60.0;
      state_.command_id = "cmd-7";
    }

    timeline::DeckTimelineState state_;
  };

  // Rule: IRD-001 Playhead edits re-base so the derived position is continuous
  TEST_F(IntentReducerContractTest, IRD_001_PauseFreezesExtrapolatedPosition)
  {
    const auto result = timeline::ApplyIntent(state_, timeline::PauseIntent{}, 104.0);
    ASSERT_TRUE(result.ok);
    EXPECT_FALSE(result.state.is_playing);
    EXPECT_DOUBLE_EQ(result.state.base_position, 14.0);
    EXPECT_DOUBLE_EQ(result.state.updated_at, 104.0);
    EXPECT_DOUBLE_EQ(timeline::PositionAt(result.state, 200.0), 14.0);
  }

  TEST_F(IntentReducerContractTest, IRD_001_RateChangeKeepsPositionContinuous)
  {
    const auto result = timeline::ApplyIntent(state_, timeline::RateIntent{2.0}, 102.0);
    ASSERT_TRUE(result.ok);
    EXPECT_DOUBLE_EQ(timeline::PositionAt(result.state, 102.0),
                     timeline::PositionAt(state_, 102.0));
    EXPECT_DOUBLE_EQ(timeline::PositionAt(result.state, 103.0), 14.0);
  }

  TEST_F(IntentReducerContractTest, IRD_001_ToggleFlipsPlayState)
  {
    const auto paused = timeline::ApplyIntent(state_, timeline::ToggleIntent{}, 101.0);
    ASSERT_TRUE(paused.ok);
    EXPECT_FALSE(paused.state.is_playing);
    const auto resumed = timeline::ApplyIntent(paused.state, timeline::ToggleIntent{}, 150.0);
    ASSERT_TRUE(resumed.ok);
    EXPECT_TRUE(resumed.state.is_playing);
    EXPECT_DOUBLE_EQ(resumed.state.base_position, 11.0);
  }

  // Rule: IRD-002 Seek is clamped to [0, duration] and may resume
  TEST_F(IntentReducerContractTest, IRD_002_SeekClampsToDuration)
  {
    auto result = timeline::ApplyIntent(state_, timeline::SeekIntent{75.0, false}, 101.0);
    ASSERT_TRUE(result.ok);
    EXPECT_DOUBLE_EQ(result.state.base_position, 60.0);
    EXPECT_FALSE(result.state.is_playing);

    result = timeline::ApplyIntent(state_, timeline::SeekIntent{-5.0, std::nullopt}, 101.0);
    ASSERT_TRUE(result.ok);
    EXPECT_DOUBLE_EQ(result.state.base_position, 0.0);
    EXPECT_TRUE(result.state.is_playing);
  }

  // Rule: IRD-003 Invalid numbers are rejected as E_INVALID_COMMAND
  TEST_F(IntentReducerContractTest, IRD_003_RejectsNegativeAndNonFiniteValues)
  {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();

    auto result = timeline::ApplyIntent(state_, timeline::RateIntent{-1.0}, 101.0);
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.code, timeline::ErrorCode::kInvalidCommand);

    result = timeline::ApplyIntent(state_, timeline::RateIntent{nan}, 101.0);
    EXPECT_EQ(result.code, timeline::ErrorCode::kInvalidCommand);

    result = timeline::ApplyIntent(state_, timeline::SeekIntent{inf, std::nullopt}, 101.0);
    EXPECT_EQ(result.code, timeline::ErrorCode::kInvalidCommand);

    timeline::StatePatch patch;
    patch.duration = -2.0;
    result = timeline::ApplyIntent(state_, patch, 101.0);
    EXPECT_EQ(result.code, timeline::ErrorCode::kInvalidCommand);
  }

  TEST_F(IntentReducerContractTest, IRD_003_RateAboveRangeIsClamped)
  {
    const auto result = timeline::ApplyIntent(state_, timeline::RateIntent{20.0}, 101.0);
    ASSERT_TRUE(result.ok);
    EXPECT_DOUBLE_EQ(result.state.play_rate, timeline::kMaxPlayRate);
  }

  // Rule: IRD-004 Source changes reset the timeline; same src is a no-op
  TEST_F(IntentReducerContractTest, IRD_004_NewSourceResetsTimeline)
  {
    state_.error = true;
    state_.error_message = "decode failed";
    const auto result = timeline::ApplyIntent(
        state_, timeline::SourceIntent{std::string("next.mp4"), false}, 120.0);
    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.state.src, std::optional<std::string>("next.mp4"));
    EXPECT_DOUBLE_EQ(result.state.base_position, 0.0);
    EXPECT_FALSE(result.state.duration.has_value());
    EXPECT_TRUE(result.state.is_loading);
    EXPECT_FALSE(result.state.error);
    EXPECT_TRUE(result.state.error_message.empty());
  }

  TEST_F(IntentReducerContractTest, IRD_004_SameSourceWithoutReloadUnchanged)
  {
    const auto result = timeline::ApplyIntent(
        state_, timeline::SourceIntent{std::string("clip.mp4"), false}, 120.0);
    ASSERT_TRUE(result.ok);
    EXPECT_TRUE(timeline::SameComparisonFields(result.state, state_));

    const auto reload = timeline::ApplyIntent(
        state_, timeline::SourceIntent{std::string("clip.mp4"), true}, 120.0);
    ASSERT_TRUE(reload.ok);
    EXPECT_TRUE(reload.state.is_loading);
  }

  TEST_F(IntentReducerContractTest, IRD_004_OnlySourceEditsStartANewLoad)
  {
    state_.load_generation = 4;
    const auto swapped = timeline::ApplyIntent(
        state_, timeline::SourceIntent{std::string("next.mp4"), false}, 120.0);
    ASSERT_TRUE(swapped.ok);
    EXPECT_EQ(swapped.state.load_generation, 5u);

    const auto reload = timeline::ApplyIntent(
        state_, timeline::SourceIntent{std::string("clip.mp4"), true}, 120.0);
    ASSERT_TRUE(reload.ok);
    EXPECT_EQ(reload.state.load_generation, 5u);
    EXPECT_FALSE(timeline::SameComparisonFields(reload.state, state_));

    const auto same = timeline::ApplyIntent(
        state_, timeline::SourceIntent{std::string("clip.mp4"), false}, 120.0);
    ASSERT_TRUE(same.ok);
    EXPECT_EQ(same.state.load_generation, 4u);

    // Load reports from a surface never start another load.
    timeline::StatePatch loaded;
    loaded.is_loading = false;
    loaded.duration = 95.0;
    const auto reported = timeline::ApplyIntent(state_, loaded, 121.0);
    ASSERT_TRUE(reported.ok);
    EXPECT_EQ(reported.state.load_generation, 4u);
  }

  TEST_F(IntentReducerContractTest, IRD_004_EmptySourceStopsPlayback)
  {
    const auto cleared = timeline::ApplyIntent(
        state_, timeline::SourceIntent{std::nullopt, false}, 120.0);
    ASSERT_TRUE(cleared.ok);
    EXPECT_FALSE(cleared.state.src.has_value());
    EXPECT_FALSE(cleared.state.is_playing);
    EXPECT_FALSE(cleared.state.is_loading);

    const auto rejected = timeline::ApplyIntent(
        state_, timeline::SourceIntent{std::string(), false}, 120.0);
    EXPECT_FALSE(rejected.ok);
    EXPECT_EQ(rejected.code, timeline::ErrorCode::kDeckLoad);
  }

  // Rule: IRD-005 Partial reports leave absent fields and known duration alone
  TEST_F(IntentReducerContractTest, IRD_005_PatchKeepsDurationSticky)
  {
    timeline::StatePatch patch;
    patch.is_loading = false;
    patch.error = false;
    const auto result = timeline::ApplyIntent(state_, patch, 101.0);
    ASSERT_TRUE(result.ok);
    ASSERT_TRUE(result.state.duration.has_value());
    EXPECT_DOUBLE_EQ(*result.state.duration, 60.0);
    EXPECT_DOUBLE_EQ(result.state.base_position, 10.0);
    EXPECT_DOUBLE_EQ(result.state.updated_at, 100.0);
  }

  TEST_F(IntentReducerContractTest, IRD_005_ErrorReportRetainsDiagnostic)
  {
    timeline::StatePatch patch;
    patch.error = true;
    patch.is_loading = false;
    patch.error_message = "source missing";
    const auto failed = timeline::ApplyIntent(state_, patch, 101.0);
    ASSERT_TRUE(failed.ok);
    EXPECT_TRUE(failed.state.error);
    EXPECT_EQ(failed.state.error_message, "source missing");

    timeline::StatePatch clear;
    clear.error = false;
    const auto recovered = timeline::ApplyIntent(failed.state, clear, 102.0);
    ASSERT_TRUE(recovered.ok);
    EXPECT_TRUE(recovered.state.error_message.empty());
  }

  // Rule: IRD-006 Version and command id belong to the caller
  TEST_F(IntentReducerContractTest, IRD_006_NeverStampsCausality)
  {
    const auto result = timeline::ApplyIntent(state_, timeline::PlayIntent{}, 130.0);
    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.state.version, 7u);
    EXPECT_EQ(result.state.command_id, std::optional<std::string>("cmd-7"));
  }

} // namespace
