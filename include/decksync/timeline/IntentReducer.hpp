// Repository: DeckSync
// Component: Intent Reducer
// Purpose: Pure state transition shared by the authority and optimistic projection.
// Copyright (c) 2025 DeckSync

#ifndef DECKSYNC_TIMELINE_INTENT_REDUCER_HPP_
#define DECKSYNC_TIMELINE_INTENT_REDUCER_HPP_

#include <string>

#include "decksync/timeline/DeckTypes.hpp"
#include "decksync/timeline/Intent.hpp"

namespace decksync::timeline {

struct ReduceResult {
  bool ok = false;
  ErrorCode code = ErrorCode::kNone;
  std::string message;
  // Valid only when ok. Equal to the input when the intent changes nothing.
  DeckTimelineState state;
};

// Applies one intent at wall-clock time `now`.
//
// Every transition that changes the playhead (play, pause, toggle, rate,
// seek, patched position or play flag) first re-bases base_position to the
// extrapolated position at `now`, so the derived position is continuous
// across the edit. version and command_id are never touched; the caller owns
// causality stamping.
[[nodiscard]] ReduceResult ApplyIntent(const DeckTimelineState& state,
                                       const IntentPayload& intent,
                                       double now);

}  // namespace decksync::timeline

#endif  // DECKSYNC_TIMELINE_INTENT_REDUCER_HPP_
