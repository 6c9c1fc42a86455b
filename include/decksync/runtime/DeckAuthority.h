// Repository: DeckSync
// Component: Deck Authority
// Purpose: Single source of truth for all deck timelines; versions and broadcasts every edit.
// Copyright (c) 2025 DeckSync

#ifndef DECKSYNC_RUNTIME_DECK_AUTHORITY_H_
#define DECKSYNC_RUNTIME_DECK_AUTHORITY_H_

#include <array>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

#include "decksync/runtime/Messages.h"
#include "decksync/timeline/DeckTypes.hpp"
#include "decksync/timing/WallClock.h"

namespace decksync::runtime {

struct AuthorityConfig {
  // Command ids remembered per deck for duplicate detection.
  std::size_t remembered_commands_per_deck = 1024;
  // Empty: a random epoch is generated.
  std::string epoch;
};

// DeckAuthority owns the authoritative DeckTimelineState of all four decks.
// Every accepted, state-changing command bumps the deck version by one,
// stamps the command id and is broadcast to every subscriber in version
// order. Clients (including the native engine) only render what it emits.
//
// Thread-safe. Broadcasts queue under the authority lock and are delivered
// outside it, one at a time in version order, by whichever Apply() call found
// the outbox idle. Listeners may call back into the authority; broadcasts
// they cause are delivered after the current one. A listener can still run
// once after Unsubscribe() returns while another thread is delivering.
class DeckAuthority {
 public:
  using BroadcastListener = std::function<void(const DeckBroadcast&)>;
  using SubscriptionId = uint64_t;

  struct MetricsSnapshot {
    uint64_t accepted_total = 0;
    uint64_t rejected_total = 0;
    uint64_t duplicate_total = 0;
    uint64_t noop_total = 0;
    uint64_t broadcast_total = 0;
    std::map<timeline::ErrorCode, uint64_t> rejections_by_code;
    std::size_t subscriber_count = 0;
  };

  struct Subscription {
    SubscriptionId id = 0;
    // Taken atomically with registration; no broadcast can fall between.
    FullStateResync resync;
  };

  explicit DeckAuthority(std::shared_ptr<timing::WallClock> clock,
                         AuthorityConfig config = {});

  DeckAuthority(const DeckAuthority&) = delete;
  DeckAuthority& operator=(const DeckAuthority&) = delete;

  CommandResult Apply(const DeckCommand& command, timeline::ClientRole role);

  [[nodiscard]] FullStateResync Snapshot() const;
  [[nodiscard]] timeline::DeckTimelineState State(timeline::DeckKey deck) const;

  Subscription Subscribe(BroadcastListener listener);
  void Unsubscribe(SubscriptionId id);

  [[nodiscard]] const std::string& epoch() const { return epoch_; }
  [[nodiscard]] MetricsSnapshot Metrics() const;

 private:
  struct DeckRecord {
    timeline::DeckTimelineState state;
    std::unordered_set<std::string> processed_commands;
    std::deque<std::string> processed_order;
  };

  // Remembers an applied command id, evicting the oldest beyond the limit.
  void RememberCommandLocked(DeckRecord& record, const std::string& command_id);
  CommandResult RejectLocked(const DeckCommand& command,
                             const DeckRecord& record,
                             timeline::ErrorCode code, std::string message);
  FullStateResync SnapshotLocked() const;
  CommandResult ApplyLocked(const DeckCommand& command,
                            timeline::ClientRole role);
  void DrainBroadcasts();

  std::shared_ptr<timing::WallClock> clock_;
  AuthorityConfig config_;
  std::string epoch_;

  mutable std::mutex mutex_;
  std::array<DeckRecord, timeline::kDeckCount> decks_;
  std::map<SubscriptionId, BroadcastListener> listeners_;
  SubscriptionId next_subscription_id_ = 1;
  std::deque<DeckBroadcast> outbox_;
  bool draining_ = false;
  MetricsSnapshot metrics_;
};

}  // namespace decksync::runtime

#endif  // DECKSYNC_RUNTIME_DECK_AUTHORITY_H_
