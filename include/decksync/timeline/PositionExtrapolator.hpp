// Repository: DeckSync
// Component: Position Extrapolator
// Purpose: Derives "position now" from a timeline snapshot and the local wall clock.
// Copyright (c) 2025 DeckSync

#ifndef DECKSYNC_TIMELINE_POSITION_EXTRAPOLATOR_HPP_
#define DECKSYNC_TIMELINE_POSITION_EXTRAPOLATOR_HPP_

#include <optional>

#include "decksync/timeline/DeckTypes.hpp"

namespace decksync::timeline {

// Playing:  max(0, base_position + (now - updated_at) * play_rate)
// Stopped:  max(0, base_position)
//
// Every consumer reconstructs the same position from one shared snapshot, so
// only edits travel over the wire.
[[nodiscard]] double PositionAt(const DeckTimelineState& state, double now);

// Progress in percent, capped at 100. nullopt while duration is unknown.
[[nodiscard]] std::optional<double> ProgressPercent(
    const DeckTimelineState& state, double now);

// Position folded into [0, duration) for looping media. Returns the plain
// position when duration is unknown or not positive.
[[nodiscard]] double LoopedPositionAt(const DeckTimelineState& state,
                                      double now);

}  // namespace decksync::timeline

#endif  // DECKSYNC_TIMELINE_POSITION_EXTRAPOLATOR_HPP_
