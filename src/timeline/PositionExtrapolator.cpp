// Repository: DeckSync
// Component: Position Extrapolator
// Purpose: Derives "position now" from a timeline snapshot and the local wall clock.
// Copyright (c) 2025 DeckSync

#include "decksync/timeline/PositionExtrapolator.hpp"

#include <algorithm>
#include <cmath>

namespace decksync::timeline {

double PositionAt(const DeckTimelineState& state, double now) {
  if (state.is_playing) {
    return std::max(
        0.0, state.base_position + (now - state.updated_at) * state.play_rate);
  }
  return std::max(0.0, state.base_position);
}

std::optional<double> ProgressPercent(const DeckTimelineState& state,
                                      double now) {
  if (!state.duration || *state.duration <= 0.0) {
    return std::nullopt;
  }
  const double percent = PositionAt(state, now) / *state.duration * 100.0;
  return std::min(100.0, percent);
}

double LoopedPositionAt(const DeckTimelineState& state, double now) {
  const double position = PositionAt(state, now);
  if (!state.duration || *state.duration <= 0.0) {
    return position;
  }
  return std::fmod(position, *state.duration);
}

}  // namespace decksync::timeline
