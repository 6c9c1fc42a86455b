// Repository: DeckSync
// Component: Intent Reducer
// Purpose: Pure state transition shared by the authority and optimistic projection.
// Copyright (c) 2025 DeckSync

#include "decksync/timeline/IntentReducer.hpp"

#include <algorithm>
#include <cmath>
#include <type_traits>
#include <utility>
#include <variant>

#include "decksync/timeline/PositionExtrapolator.hpp"

namespace decksync::timeline {

namespace {

ReduceResult Ok(DeckTimelineState state) {
  ReduceResult result;
  result.ok = true;
  result.state = std::move(state);
  return result;
}

ReduceResult Reject(ErrorCode code, std::string message) {
  ReduceResult result;
  result.ok = false;
  result.code = code;
  result.message = std::move(message);
  return result;
}

void Rebase(DeckTimelineState& state, double now) {
  state.base_position = PositionAt(state, now);
  state.updated_at = now;
}

double CapToDuration(const DeckTimelineState& state, double position) {
  position = std::max(0.0, position);
  if (state.duration && *state.duration > 0.0) {
    position = std::min(position, *state.duration);
  }
  return position;
}

ReduceResult ReduceSeek(DeckTimelineState next, const SeekIntent& seek,
                        double now) {
  if (!std::isfinite(seek.position)) {
    return Reject(ErrorCode::kInvalidCommand, "seek position must be finite");
  }
  next.base_position = CapToDuration(next, seek.position);
  next.updated_at = now;
  if (seek.resume) {
    next.is_playing = *seek.resume;
  }
  return Ok(std::move(next));
}

ReduceResult ReduceRate(DeckTimelineState next, const RateIntent& rate,
                        double now) {
  if (!std::isfinite(rate.value) || rate.value < 0.0) {
    return Reject(ErrorCode::kInvalidCommand,
                  "rate must be a finite non-negative number");
  }
  Rebase(next, now);
  next.play_rate = ClampPlayRate(rate.value);
  return Ok(std::move(next));
}

ReduceResult ReduceSource(DeckTimelineState next, const SourceIntent& source,
                          double now) {
  if (source.src && source.src->empty()) {
    return Reject(ErrorCode::kDeckLoad, "source locator is empty");
  }
  if (source.src == next.src && !source.reload) {
    return Ok(std::move(next));
  }
  next.src = source.src;
  ++next.load_generation;
  next.base_position = 0.0;
  next.updated_at = now;
  next.duration.reset();
  next.error = false;
  next.error_message.clear();
  next.is_loading = next.src.has_value();
  if (!next.src) {
    next.is_playing = false;
  }
  return Ok(std::move(next));
}

ReduceResult ReducePatch(DeckTimelineState next, const StatePatch& patch,
                         double now) {
  if (patch.base_position && !std::isfinite(*patch.base_position)) {
    return Reject(ErrorCode::kInvalidCommand, "basePosition must be finite");
  }
  if (patch.play_rate &&
      (!std::isfinite(*patch.play_rate) || *patch.play_rate < 0.0)) {
    return Reject(ErrorCode::kInvalidCommand,
                  "playRate must be a finite non-negative number");
  }
  if (patch.duration &&
      (!std::isfinite(*patch.duration) || *patch.duration < 0.0)) {
    return Reject(ErrorCode::kInvalidCommand,
                  "duration must be a finite non-negative number");
  }

  if (patch.is_playing || patch.base_position || patch.play_rate) {
    Rebase(next, now);
  }
  if (patch.is_playing) {
    next.is_playing = *patch.is_playing;
  }
  if (patch.base_position) {
    next.base_position = std::max(0.0, *patch.base_position);
  }
  if (patch.play_rate) {
    next.play_rate = ClampPlayRate(*patch.play_rate);
  }
  // A patch without duration never erases a known one.
  if (patch.duration) {
    next.duration = *patch.duration;
  }
  if (patch.is_loading) {
    next.is_loading = *patch.is_loading;
  }
  if (patch.error) {
    next.error = *patch.error;
    if (!next.error) {
      next.error_message.clear();
    }
  }
  if (patch.error_message) {
    next.error_message = *patch.error_message;
  }
  return Ok(std::move(next));
}

}  // namespace

ReduceResult ApplyIntent(const DeckTimelineState& state,
                         const IntentPayload& intent, double now) {
  if (!std::isfinite(now)) {
    return Reject(ErrorCode::kInvalidCommand, "clock reading is not finite");
  }
  DeckTimelineState next = state;
  return std::visit(
      [&](const auto& payload) -> ReduceResult {
        using T = std::decay_t<decltype(payload)>;
        if constexpr (std::is_same_v<T, ToggleIntent>) {
          Rebase(next, now);
          next.is_playing = !next.is_playing;
          return Ok(std::move(next));
        } else if constexpr (std::is_same_v<T, PlayIntent>) {
          Rebase(next, now);
          next.is_playing = true;
          return Ok(std::move(next));
        } else if constexpr (std::is_same_v<T, PauseIntent>) {
          Rebase(next, now);
          next.is_playing = false;
          return Ok(std::move(next));
        } else if constexpr (std::is_same_v<T, SeekIntent>) {
          return ReduceSeek(std::move(next), payload, now);
        } else if constexpr (std::is_same_v<T, RateIntent>) {
          return ReduceRate(std::move(next), payload, now);
        } else if constexpr (std::is_same_v<T, SourceIntent>) {
          return ReduceSource(std::move(next), payload, now);
        } else {
          return ReducePatch(std::move(next), payload, now);
        }
      },
      intent);
}

}  // namespace decksync::timeline
