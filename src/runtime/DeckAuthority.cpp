// Repository: DeckSync
// Component: Deck Authority
// Purpose: Single source of truth for all deck timelines; versions and broadcasts every edit.
// Copyright (c) 2025 DeckSync

#include "decksync/runtime/DeckAuthority.h"

#include <sstream>
#include <utility>

#include "decksync/timeline/IntentReducer.hpp"
#include "decksync/util/Identifiers.hpp"
#include "decksync/util/Logger.hpp"

namespace decksync::runtime {

using timeline::ClientRole;
using timeline::DeckTimelineState;
using timeline::ErrorCode;

DeckAuthority::DeckAuthority(std::shared_ptr<timing::WallClock> clock,
                             AuthorityConfig config)
    : clock_(std::move(clock)), config_(std::move(config)) {
  epoch_ = config_.epoch.empty() ? util::GenerateUuidV4() : config_.epoch;
  std::ostringstream oss;
  oss << "[DeckAuthority] STARTED epoch=" << epoch_;
  util::Logger::Info(oss.str());
}

void DeckAuthority::RememberCommandLocked(DeckRecord& record,
                                          const std::string& command_id) {
  if (!record.processed_commands.insert(command_id).second) {
    return;
  }
  record.processed_order.push_back(command_id);
  while (record.processed_order.size() > config_.remembered_commands_per_deck) {
    record.processed_commands.erase(record.processed_order.front());
    record.processed_order.pop_front();
  }
}

CommandResult DeckAuthority::RejectLocked(const DeckCommand& command,
                                          const DeckRecord& record,
                                          ErrorCode code,
                                          std::string message) {
  CommandResult result;
  result.accepted = false;
  result.code = code;
  result.message = std::move(message);
  result.deck = command.deck;
  result.command_id = command.intent.command_id;
  result.state = record.state;

  ++metrics_.rejected_total;
  ++metrics_.rejections_by_code[code];

  std::ostringstream oss;
  oss << "[DeckAuthority] COMMAND_REJECTED deck=" << timeline::ToString(command.deck)
      << " intent=" << timeline::IntentName(command.intent.payload)
      << " cmd=" << command.intent.command_id
      << " code=" << timeline::ToString(code) << " reason=" << result.message;
  util::Logger::Warn(oss.str());
  return result;
}

CommandResult DeckAuthority::Apply(const DeckCommand& command,
                                   ClientRole role) {
  CommandResult result;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    result = ApplyLocked(command, role);
    if (outbox_.empty() || draining_) {
      return result;
    }
    draining_ = true;
  }
  DrainBroadcasts();
  return result;
}

void DeckAuthority::DrainBroadcasts() {
  std::vector<BroadcastListener> listeners;
  for (;;) {
    DeckBroadcast broadcast;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (outbox_.empty()) {
        draining_ = false;
        return;
      }
      broadcast = std::move(outbox_.front());
      outbox_.pop_front();
      listeners.clear();
      for (const auto& [id, listener] : listeners_) {
        listeners.push_back(listener);
      }
    }
    for (const auto& listener : listeners) {
      if (listener) {
        listener(broadcast);
      }
    }
  }
}

CommandResult DeckAuthority::ApplyLocked(const DeckCommand& command,
                                         ClientRole role) {
  DeckRecord& record = decks_[timeline::DeckIndex(command.deck)];

  if (role != ClientRole::kController) {
    return RejectLocked(command, record, ErrorCode::kForbidden,
                        std::string("role ") + timeline::ToString(role) +
                            " may not issue deck commands");
  }
  if (command.intent.command_id.empty()) {
    return RejectLocked(command, record, ErrorCode::kInvalidPayload,
                        "commandId is required");
  }
  // Duplicates are checked before revision so a retried command with an
  // expected_version still acknowledges cleanly.
  if (record.processed_commands.count(command.intent.command_id) != 0) {
    ++metrics_.duplicate_total;
    CommandResult result;
    result.accepted = true;
    result.duplicate = true;
    result.deck = command.deck;
    result.command_id = command.intent.command_id;
    result.state = record.state;
    return result;
  }
  if (command.expected_version &&
      *command.expected_version != record.state.version) {
    std::ostringstream reason;
    reason << "expected version " << *command.expected_version
           << " but deck is at " << record.state.version;
    return RejectLocked(command, record, ErrorCode::kRevisionMismatch,
                        reason.str());
  }

  const double now = clock_->NowSeconds();
  timeline::ReduceResult reduced =
      timeline::ApplyIntent(record.state, command.intent.payload, now);
  if (!reduced.ok) {
    return RejectLocked(command, record, reduced.code, reduced.message);
  }

  RememberCommandLocked(record, command.intent.command_id);

  CommandResult result;
  result.accepted = true;
  result.deck = command.deck;
  result.command_id = command.intent.command_id;

  if (timeline::SameComparisonFields(reduced.state, record.state) &&
      reduced.state.error_message == record.state.error_message) {
    ++metrics_.noop_total;
    result.state = record.state;
    return result;
  }

  reduced.state.version = record.state.version + 1;
  reduced.state.command_id = command.intent.command_id;
  record.state = std::move(reduced.state);
  result.state = record.state;
  ++metrics_.accepted_total;

  {
    std::ostringstream oss;
    oss << "[DeckAuthority] COMMAND_APPLIED deck="
        << timeline::ToString(command.deck)
        << " intent=" << timeline::IntentName(command.intent.payload) << " "
        << timeline::Describe(record.state);
    util::Logger::Debug(oss.str());
  }

  outbox_.push_back(DeckBroadcast{command.deck, record.state});
  ++metrics_.broadcast_total;
  return result;
}

FullStateResync DeckAuthority::SnapshotLocked() const {
  FullStateResync resync;
  resync.authority_epoch = epoch_;
  for (std::size_t i = 0; i < timeline::kDeckCount; ++i) {
    resync.decks[i] = decks_[i].state;
  }
  return resync;
}

FullStateResync DeckAuthority::Snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return SnapshotLocked();
}

DeckTimelineState DeckAuthority::State(timeline::DeckKey deck) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return decks_[timeline::DeckIndex(deck)].state;
}

DeckAuthority::Subscription DeckAuthority::Subscribe(
    BroadcastListener listener) {
  std::lock_guard<std::mutex> lock(mutex_);
  Subscription subscription;
  subscription.id = next_subscription_id_++;
  subscription.resync = SnapshotLocked();
  listeners_.emplace(subscription.id, std::move(listener));
  return subscription;
}

void DeckAuthority::Unsubscribe(SubscriptionId id) {
  std::lock_guard<std::mutex> lock(mutex_);
  listeners_.erase(id);
}

DeckAuthority::MetricsSnapshot DeckAuthority::Metrics() const {
  std::lock_guard<std::mutex> lock(mutex_);
  MetricsSnapshot snapshot = metrics_;
  snapshot.subscriber_count = listeners_.size();
  return snapshot;
}

}  // namespace decksync::runtime
