// Repository: DeckSync
// Component: Timeline State Store
// Purpose: Per-deck authoritative snapshot with optimistic projection and version fencing.
// Copyright (c) 2025 DeckSync

#ifndef DECKSYNC_TIMELINE_TIMELINE_STATE_STORE_HPP_
#define DECKSYNC_TIMELINE_TIMELINE_STATE_STORE_HPP_

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include "decksync/timeline/DeckTypes.hpp"
#include "decksync/timeline/Intent.hpp"

namespace decksync::timeline {

struct StoreConfig {
  // A pending command whose echo has not arrived after this long is
  // abandoned and the deck is re-synced.
  double pending_timeout_s = 2.0;
};

enum class ApplyResult {
  kApplied,
  kStale,
  kUnchanged,
  // Fenced: a newer local command is still awaiting its echo.
  kHeld,
};

[[nodiscard]] const char* ToString(ApplyResult result);

// TimelineStateStore holds one deck's authoritative DeckTimelineState plus the
// single most recent locally issued command.
//
// Ordering:
//   - incoming.version < stored.version             -> kStale (dropped)
//   - same version and same comparison fields       -> kUnchanged
//   - a pending command exists and incoming carries a different command id
//                                                   -> kHeld
//   - otherwise                                     -> kApplied
//
// Only the highest-version held update is kept. It is released when the
// matching echo arrives (the newer of the two wins) or when the pending
// command expires.
//
// Not thread-safe: owned by one DeckCoordinator on the dispatch thread.
class TimelineStateStore {
 public:
  struct MetricsSnapshot {
    uint64_t applied_total = 0;
    uint64_t stale_total = 0;
    uint64_t unchanged_total = 0;
    uint64_t held_total = 0;
    uint64_t released_total = 0;
    uint64_t expired_total = 0;
    uint64_t issued_total = 0;
    uint64_t abandoned_total = 0;
  };

  struct IssueResult {
    bool accepted = false;
    std::string command_id;
    ErrorCode code = ErrorCode::kNone;
    std::string message;
  };

  struct ExpireOutcome {
    bool expired = false;
    bool adopted_held = false;
    std::string command_id;
  };

  using IdGenerator = std::function<std::string()>;

  explicit TimelineStateStore(DeckKey deck, StoreConfig config = {},
                              IdGenerator id_generator = nullptr);

  ApplyResult ApplyRemote(const DeckTimelineState& incoming);

  // Full-state resync from the authority. Version fencing still applies, but
  // any pending command and held update are discarded.
  ApplyResult ApplyResync(const DeckTimelineState& incoming);

  // Allocates a command id and projects the intent on top of the current
  // view. The authoritative version is left untouched. A locally invalid
  // intent is refused and nothing becomes pending.
  IssueResult IssueCommand(const IntentPayload& intent, double now);

  // Authority rejected `command_id`: drop its projection if still current.
  bool AbandonCommand(const std::string& command_id);

  // Expires the pending command once pending_timeout_s has elapsed.
  ExpireOutcome Expire(double now);

  // Forgets everything (authority restarted with a new epoch).
  void Reset();

  // Projection when one exists, otherwise the authoritative state.
  [[nodiscard]] const DeckTimelineState& View() const;
  [[nodiscard]] const DeckTimelineState& Authoritative() const {
    return authoritative_;
  }
  [[nodiscard]] bool HasProjection() const { return projection_.has_value(); }
  [[nodiscard]] bool HasHeld() const { return held_.has_value(); }
  [[nodiscard]] std::optional<std::string> PendingCommandId() const;
  [[nodiscard]] const std::optional<std::string>& LastAdoptedCommandId() const {
    return last_adopted_command_id_;
  }
  [[nodiscard]] DeckKey deck() const { return deck_; }

  [[nodiscard]] MetricsSnapshot Snapshot() const { return metrics_; }

 private:
  struct PendingCommand {
    std::string command_id;
    double issued_at = 0.0;
  };

  // Carries a known duration forward when incoming omits it for the same src.
  DeckTimelineState WithStickyDuration(const DeckTimelineState& incoming) const;

  void Adopt(const DeckTimelineState& state);
  void ClearPending();

  DeckKey deck_;
  StoreConfig config_;
  IdGenerator id_generator_;

  DeckTimelineState authoritative_;
  std::optional<DeckTimelineState> projection_;
  std::optional<PendingCommand> pending_;
  std::optional<DeckTimelineState> held_;
  std::optional<std::string> last_adopted_command_id_;

  MetricsSnapshot metrics_;
};

}  // namespace decksync::timeline

#endif  // DECKSYNC_TIMELINE_TIMELINE_STATE_STORE_HPP_
