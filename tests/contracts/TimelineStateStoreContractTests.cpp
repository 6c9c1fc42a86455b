// Repository: DeckSync
// Component: Timeline state store contract tests
// Purpose: Authoritative state, projections and expiry.
// Copyright (c) 2025 DeckSync

#include "../BaseContractTest.h"
#include "ContractRegistryEnvironment.h"

#include <string>

#include "decksync/timeline/DeckTypes.hpp"
#include "decksync/timeline/Intent.hpp"
#include "decksync/timeline/TimelineStateStore.hpp"

using namespace decksync;
using namespace decksync::tests;
using timeline::ApplyResult;
using timeline::DeckTimelineState;

namespace
{

  const bool kRegisterCoverage = []()
  {
    RegisterExpectedDomainCoverage("TimelineStateStore",
                                   {"TSS-001", "TSS-002", "TSS-003", "TSS-004",
                                    "TSS-005", "TSS-006", "TSS-007", "TSS-008"});
    return true;
  }();

  class TimelineStateStoreContractTest : public BaseContractTest
  {
  protected:
    [[nodiscard]] std::string DomainName() const override
    {
      return "TimelineStateStore";
    }

    [[nodiscard]] std::vector<std::string> CoveredRuleIds() const override
    {
      return {"TSS-001", "TSS-002", "TSS-003", "TSS-004",
              "TSS-005", "TSS-006", "TSS-007", "TSS-008"};
    }

    TimelineStateStoreContractTest()
        : store_(timeline::DeckKey::kA, timeline::StoreConfig{},
                 [this] { return "local-" + std::to_string(++next_id_); })
    {
    }

    static DeckTimelineState Remote(uint64_t version, const std::string& command_id,
                                    double base = 0.0, bool playing = false)
    {
      DeckTimelineState state;
      state.src = "clip.mp4";
      state.is_playing = playing;
      state.base_position = base;
      state.updated_at = 100.0;
      state.version = version;
      state.command_id = command_id;
      return state;
    }

    int next_id_ = 0;
    timeline::TimelineStateStore store_;
  };

  // Rule: TSS-001 Lower versions are dropped without touching the store
  TEST_F(TimelineStateStoreContractTest, TSS_001_OlderVersionIsStale)
  {
    ASSERT_EQ(store_.ApplyRemote(Remote(7, "remote-7", 3.0)), ApplyResult::kApplied);

    EXPECT_EQ(store_.ApplyRemote(Remote(5, "remote-5", 99.0, true)), ApplyResult::kStale);
    EXPECT_EQ(store_.View().version, 7u);
    EXPECT_DOUBLE_EQ(store_.View().base_position, 3.0);
    EXPECT_FALSE(store_.View().is_playing);
    EXPECT_EQ(store_.Snapshot().stale_total, 1u);
  }

  // Rule: TSS-002 Re-applying an identical update is a no-op
  TEST_F(TimelineStateStoreContractTest, TSS_002_IdenticalUpdateIsUnchanged)
  {
    const auto state = Remote(3, "remote-3", 12.0, true);
    ASSERT_EQ(store_.ApplyRemote(state), ApplyResult::kApplied);
    EXPECT_EQ(store_.ApplyRemote(state), ApplyResult::kUnchanged);
    EXPECT_EQ(store_.ApplyRemote(state), ApplyResult::kUnchanged);
    EXPECT_EQ(store_.Snapshot().applied_total, 1u);
    EXPECT_EQ(store_.Snapshot().unchanged_total, 2u);
  }

  TEST_F(TimelineStateStoreContractTest, TSS_002_SameVersionDifferentPayloadApplies)
  {
    ASSERT_EQ(store_.ApplyRemote(Remote(3, "remote-3", 12.0)), ApplyResult::kApplied);
    EXPECT_EQ(store_.ApplyRemote(Remote(3, "remote-3", 13.0)), ApplyResult::kApplied);
    EXPECT_DOUBLE_EQ(store_.View().base_position, 13.0);
  }

  // Rule: TSS-003 Issue projects optimistically; the echo bumps the version
  TEST_F(TimelineStateStoreContractTest, TSS_003_SeekRoundTrip)
  {
    ASSERT_EQ(store_.ApplyRemote(Remote(4, "remote-4", 1.0)), ApplyResult::kApplied);

    const auto issued = store_.IssueCommand(timeline::SeekIntent{42.0, std::nullopt}, 101.0);
    ASSERT_TRUE(issued.accepted);
    EXPECT_EQ(issued.command_id, "local-1");
    EXPECT_TRUE(store_.HasProjection());
    EXPECT_DOUBLE_EQ(store_.View().base_position, 42.0);
    EXPECT_EQ(store_.View().version, 4u);
    EXPECT_EQ(store_.Authoritative().version, 4u);

    auto echo = Remote(5, issued.command_id, 42.0);
    echo.updated_at = 101.0;
    EXPECT_EQ(store_.ApplyRemote(echo), ApplyResult::kApplied);
    EXPECT_FALSE(store_.HasProjection());
    EXPECT_DOUBLE_EQ(store_.View().base_position, 42.0);
    EXPECT_GT(store_.View().version, 4u);
    EXPECT_EQ(store_.LastAdoptedCommandId(), std::optional<std::string>("local-1"));
  }

  TEST_F(TimelineStateStoreContractTest, TSS_003_InvalidIntentIsRefusedLocally)
  {
    const auto issued = store_.IssueCommand(timeline::RateIntent{-2.0}, 101.0);
    EXPECT_FALSE(issued.accepted);
    EXPECT_EQ(issued.code, timeline::ErrorCode::kInvalidCommand);
    EXPECT_FALSE(store_.PendingCommandId().has_value());
  }

  // Rule: TSS-004 Foreign updates are held while a local command is pending
  TEST_F(TimelineStateStoreContractTest, TSS_004_ForeignUpdateHeldUntilEcho)
  {
    ASSERT_EQ(store_.ApplyRemote(Remote(1, "remote-1")), ApplyResult::kApplied);
    const auto issued = store_.IssueCommand(timeline::PlayIntent{}, 101.0);
    ASSERT_TRUE(issued.accepted);

    // Another client's edit lands first; it must not clobber the projection.
    EXPECT_EQ(store_.ApplyRemote(Remote(2, "remote-2", 5.0)), ApplyResult::kHeld);
    EXPECT_TRUE(store_.View().is_playing);
    EXPECT_TRUE(store_.HasHeld());

    // Our echo is version 3, newer than the held update: it wins.
    EXPECT_EQ(store_.ApplyRemote(Remote(3, issued.command_id, 5.0, true)),
              ApplyResult::kApplied);
    EXPECT_FALSE(store_.HasHeld());
    EXPECT_EQ(store_.View().version, 3u);
    EXPECT_TRUE(store_.View().is_playing);
  }

  TEST_F(TimelineStateStoreContractTest, TSS_004_NewerHeldUpdateWinsOverEcho)
  {
    ASSERT_EQ(store_.ApplyRemote(Remote(1, "remote-1")), ApplyResult::kApplied);
    const auto issued = store_.IssueCommand(timeline::PlayIntent{}, 101.0);
    ASSERT_TRUE(issued.accepted);

    EXPECT_EQ(store_.ApplyRemote(Remote(3, "remote-3", 9.0)), ApplyResult::kHeld);
    EXPECT_EQ(store_.ApplyRemote(Remote(2, issued.command_id, 0.0, true)),
              ApplyResult::kApplied);
    EXPECT_EQ(store_.View().version, 3u);
    EXPECT_DOUBLE_EQ(store_.View().base_position, 9.0);
    EXPECT_EQ(store_.Snapshot().released_total, 1u);
  }

  // Rule: TSS-005 A pending command expires and forces a resync
  TEST_F(TimelineStateStoreContractTest, TSS_005_PendingExpiresAfterTimeout)
  {
    ASSERT_EQ(store_.ApplyRemote(Remote(1, "remote-1")), ApplyResult::kApplied);
    ASSERT_TRUE(store_.IssueCommand(timeline::PlayIntent{}, 100.0).accepted);
    ASSERT_EQ(store_.ApplyRemote(Remote(2, "remote-2", 4.0)), ApplyResult::kHeld);

    EXPECT_FALSE(store_.Expire(101.5).expired);
    const auto outcome = store_.Expire(102.0);
    EXPECT_TRUE(outcome.expired);
    EXPECT_TRUE(outcome.adopted_held);
    EXPECT_EQ(outcome.command_id, "local-1");
    EXPECT_FALSE(store_.HasProjection());
    EXPECT_EQ(store_.View().version, 2u);
    EXPECT_FALSE(store_.View().is_playing);
  }

  // Rule: TSS-006 Full resync discards pending and held state
  TEST_F(TimelineStateStoreContractTest, TSS_006_ResyncClearsPending)
  {
    ASSERT_EQ(store_.ApplyRemote(Remote(1, "remote-1")), ApplyResult::kApplied);
    ASSERT_TRUE(store_.IssueCommand(timeline::SeekIntent{30.0, std::nullopt}, 100.0).accepted);
    ASSERT_EQ(store_.ApplyRemote(Remote(2, "remote-2")), ApplyResult::kHeld);

    EXPECT_EQ(store_.ApplyResync(Remote(4, "remote-4", 7.0)), ApplyResult::kApplied);
    EXPECT_FALSE(store_.PendingCommandId().has_value());
    EXPECT_FALSE(store_.HasHeld());
    EXPECT_DOUBLE_EQ(store_.View().base_position, 7.0);

    EXPECT_EQ(store_.ApplyResync(Remote(3, "remote-3")), ApplyResult::kStale);
  }

  // Rule: TSS-007 Known duration survives updates for the same src
  TEST_F(TimelineStateStoreContractTest, TSS_007_DurationIsSticky)
  {
    auto with_duration = Remote(1, "remote-1");
    with_duration.duration = 90.0;
    ASSERT_EQ(store_.ApplyRemote(with_duration), ApplyResult::kApplied);

    ASSERT_EQ(store_.ApplyRemote(Remote(2, "remote-2", 3.0)), ApplyResult::kApplied);
    ASSERT_TRUE(store_.View().duration.has_value());
    EXPECT_DOUBLE_EQ(*store_.View().duration, 90.0);

    auto other_src = Remote(3, "remote-3");
    other_src.src = "other.mp4";
    ASSERT_EQ(store_.ApplyRemote(other_src), ApplyResult::kApplied);
    EXPECT_FALSE(store_.View().duration.has_value());
  }

  // Rule: TSS-008 A rejected command's projection is dropped
  TEST_F(TimelineStateStoreContractTest, TSS_008_AbandonRestoresAuthoritative)
  {
    ASSERT_EQ(store_.ApplyRemote(Remote(1, "remote-1", 2.0)), ApplyResult::kApplied);
    const auto issued = store_.IssueCommand(timeline::SeekIntent{50.0, std::nullopt}, 100.0);
    ASSERT_TRUE(issued.accepted);

    EXPECT_FALSE(store_.AbandonCommand("someone-else"));
    EXPECT_TRUE(store_.AbandonCommand(issued.command_id));
    EXPECT_DOUBLE_EQ(store_.View().base_position, 2.0);
    EXPECT_EQ(store_.Snapshot().abandoned_total, 1u);
  }

  TEST_F(TimelineStateStoreContractTest, TSS_008_NewCommandSupersedesProjection)
  {
    ASSERT_EQ(store_.ApplyRemote(Remote(1, "remote-1")), ApplyResult::kApplied);
    const auto first = store_.IssueCommand(timeline::SeekIntent{10.0, std::nullopt}, 100.0);
    const auto second = store_.IssueCommand(timeline::SeekIntent{20.0, std::nullopt}, 100.1);
    ASSERT_TRUE(first.accepted);
    ASSERT_TRUE(second.accepted);
    EXPECT_EQ(store_.PendingCommandId(), std::optional<std::string>(second.command_id));

    // The first command's echo is now foreign to the pending command.
    EXPECT_EQ(store_.ApplyRemote(Remote(2, first.command_id, 10.0)), ApplyResult::kHeld);
    EXPECT_DOUBLE_EQ(store_.View().base_position, 20.0);
  }

} // namespace
