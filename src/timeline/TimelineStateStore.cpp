// Repository: DeckSync
// Component: Timeline State Store
// Purpose: Per-deck authoritative snapshot with optimistic projection and version fencing.
// Copyright (c) 2025 DeckSync

#include "decksync/timeline/TimelineStateStore.hpp"

#include <sstream>
#include <utility>

#include "decksync/timeline/IntentReducer.hpp"
#include "decksync/util/Identifiers.hpp"
#include "decksync/util/Logger.hpp"

namespace decksync::timeline {

const char* ToString(ApplyResult result) {
  switch (result) {
    case ApplyResult::kApplied:
      return "applied";
    case ApplyResult::kStale:
      return "stale";
    case ApplyResult::kUnchanged:
      return "unchanged";
    case ApplyResult::kHeld:
      return "held";
  }
  return "unknown";
}

TimelineStateStore::TimelineStateStore(DeckKey deck, StoreConfig config,
                                       IdGenerator id_generator)
    : deck_(deck),
      config_(config),
      id_generator_(std::move(id_generator)) {
  if (!id_generator_) {
    id_generator_ = [] { return util::GenerateUuidV4(); };
  }
}

DeckTimelineState TimelineStateStore::WithStickyDuration(
    const DeckTimelineState& incoming) const {
  DeckTimelineState merged = incoming;
  if (!merged.duration && authoritative_.duration &&
      merged.src == authoritative_.src && merged.src.has_value() &&
      merged.load_generation == authoritative_.load_generation) {
    merged.duration = authoritative_.duration;
  }
  return merged;
}

void TimelineStateStore::Adopt(const DeckTimelineState& state) {
  authoritative_ = state;
  if (state.command_id) {
    last_adopted_command_id_ = state.command_id;
  }
  ++metrics_.applied_total;
}

void TimelineStateStore::ClearPending() {
  pending_.reset();
  projection_.reset();
}

ApplyResult TimelineStateStore::ApplyRemote(const DeckTimelineState& incoming) {
  if (incoming.version < authoritative_.version) {
    ++metrics_.stale_total;
    std::ostringstream oss;
    oss << "[TimelineStateStore] STALE_DROPPED deck=" << ToString(deck_)
        << " incoming_version=" << incoming.version
        << " stored_version=" << authoritative_.version;
    util::Logger::Debug(oss.str());
    return ApplyResult::kStale;
  }

  const DeckTimelineState merged = WithStickyDuration(incoming);
  if (merged.version == authoritative_.version &&
      SameComparisonFields(merged, authoritative_)) {
    ++metrics_.unchanged_total;
    return ApplyResult::kUnchanged;
  }

  if (pending_ && merged.command_id != pending_->command_id) {
    if (!held_ || merged.version >= held_->version) {
      held_ = merged;
    }
    ++metrics_.held_total;
    std::ostringstream oss;
    oss << "[TimelineStateStore] FENCED deck=" << ToString(deck_)
        << " incoming_version=" << merged.version
        << " pending_cmd=" << pending_->command_id;
    util::Logger::Debug(oss.str());
    return ApplyResult::kHeld;
  }

  const bool was_echo = pending_.has_value();
  Adopt(merged);
  if (was_echo) {
    ClearPending();
    if (held_) {
      if (held_->version > authoritative_.version) {
        Adopt(WithStickyDuration(*held_));
        ++metrics_.released_total;
      }
      held_.reset();
    }
  }
  return ApplyResult::kApplied;
}

ApplyResult TimelineStateStore::ApplyResync(const DeckTimelineState& incoming) {
  ClearPending();
  held_.reset();
  if (incoming.version < authoritative_.version) {
    ++metrics_.stale_total;
    return ApplyResult::kStale;
  }
  const DeckTimelineState merged = WithStickyDuration(incoming);
  if (merged.version == authoritative_.version &&
      SameComparisonFields(merged, authoritative_)) {
    ++metrics_.unchanged_total;
    return ApplyResult::kUnchanged;
  }
  Adopt(merged);
  return ApplyResult::kApplied;
}

TimelineStateStore::IssueResult TimelineStateStore::IssueCommand(
    const IntentPayload& intent, double now) {
  IssueResult result;
  ReduceResult reduced = ApplyIntent(View(), intent, now);
  if (!reduced.ok) {
    result.code = reduced.code;
    result.message = reduced.message;
    std::ostringstream oss;
    oss << "[TimelineStateStore] ISSUE_REFUSED deck=" << ToString(deck_)
        << " intent=" << IntentName(intent) << " code=" << ToString(result.code)
        << " reason=" << result.message;
    util::Logger::Warn(oss.str());
    return result;
  }

  result.accepted = true;
  result.command_id = id_generator_();
  // A newer command supersedes the previous projection.
  reduced.state.command_id = result.command_id;
  reduced.state.version = authoritative_.version;
  projection_ = std::move(reduced.state);
  pending_ = PendingCommand{result.command_id, now};
  ++metrics_.issued_total;
  return result;
}

bool TimelineStateStore::AbandonCommand(const std::string& command_id) {
  if (!pending_ || pending_->command_id != command_id) {
    return false;
  }
  ClearPending();
  ++metrics_.abandoned_total;
  if (held_) {
    if (held_->version >= authoritative_.version) {
      Adopt(WithStickyDuration(*held_));
      ++metrics_.released_total;
    }
    held_.reset();
  }
  return true;
}

TimelineStateStore::ExpireOutcome TimelineStateStore::Expire(double now) {
  ExpireOutcome outcome;
  if (!pending_ || now - pending_->issued_at < config_.pending_timeout_s) {
    return outcome;
  }
  outcome.expired = true;
  outcome.command_id = pending_->command_id;
  ClearPending();
  ++metrics_.expired_total;
  if (held_) {
    if (held_->version >= authoritative_.version) {
      Adopt(WithStickyDuration(*held_));
      outcome.adopted_held = true;
      ++metrics_.released_total;
    }
    held_.reset();
  }

  std::ostringstream oss;
  oss << "[TimelineStateStore] PENDING_EXPIRED deck=" << ToString(deck_)
      << " cmd=" << outcome.command_id
      << " adopted_held=" << (outcome.adopted_held ? 1 : 0);
  util::Logger::Warn(oss.str());
  return outcome;
}

void TimelineStateStore::Reset() {
  ClearPending();
  held_.reset();
  authoritative_ = DeckTimelineState{};
  last_adopted_command_id_.reset();
}

const DeckTimelineState& TimelineStateStore::View() const {
  return projection_ ? *projection_ : authoritative_;
}

std::optional<std::string> TimelineStateStore::PendingCommandId() const {
  if (!pending_) {
    return std::nullopt;
  }
  return pending_->command_id;
}

}  // namespace decksync::timeline
