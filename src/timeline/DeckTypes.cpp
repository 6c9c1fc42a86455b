// Repository: DeckSync
// Component: Deck Timeline Types
// Purpose: Deck keys, the authoritative per-deck timeline snapshot and protocol error codes.
// Copyright (c) 2025 DeckSync

#include "decksync/timeline/DeckTypes.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace decksync::timeline {

const char* ToString(DeckKey deck) {
  switch (deck) {
    case DeckKey::kA:
      return "a";
    case DeckKey::kB:
      return "b";
    case DeckKey::kC:
      return "c";
    case DeckKey::kD:
      return "d";
  }
  return "?";
}

std::optional<DeckKey> ParseDeckKey(std::string_view text) {
  if (text.size() != 1) {
    return std::nullopt;
  }
  switch (text[0]) {
    case 'a':
    case 'A':
      return DeckKey::kA;
    case 'b':
    case 'B':
      return DeckKey::kB;
    case 'c':
    case 'C':
      return DeckKey::kC;
    case 'd':
    case 'D':
      return DeckKey::kD;
    default:
      return std::nullopt;
  }
}

const char* ToString(ClientRole role) {
  switch (role) {
    case ClientRole::kController:
      return "controller";
    case ClientRole::kPreview:
      return "preview";
    case ClientRole::kViewer:
      return "viewer";
  }
  return "unknown";
}

const char* ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::kNone:
      return "OK";
    case ErrorCode::kInvalidPayload:
      return "E_INVALID_PAYLOAD";
    case ErrorCode::kInvalidCommand:
      return "E_INVALID_COMMAND";
    case ErrorCode::kRevisionMismatch:
      return "E_REVISION_MISMATCH";
    case ErrorCode::kForbidden:
      return "E_FORBIDDEN";
    case ErrorCode::kDeckLoad:
      return "E_DECK_LOAD";
  }
  return "E_UNKNOWN";
}

bool SameComparisonFields(const DeckTimelineState& a,
                          const DeckTimelineState& b) {
  return a.src == b.src && a.is_playing == b.is_playing &&
         a.base_position == b.base_position && a.play_rate == b.play_rate &&
         a.is_loading == b.is_loading && a.error == b.error &&
         a.duration == b.duration && a.command_id == b.command_id &&
         a.load_generation == b.load_generation;
}

double ClampPlayRate(double rate) {
  if (!std::isfinite(rate)) {
    return kNeutralPlayRate;
  }
  return std::clamp(rate, kMinPlayRate, kMaxPlayRate);
}

std::string Describe(const DeckTimelineState& state) {
  std::ostringstream oss;
  oss << "v=" << state.version
      << " src=" << (state.src ? *state.src : std::string("<none>"))
      << " playing=" << (state.is_playing ? 1 : 0)
      << " base=" << state.base_position << " rate=" << state.play_rate
      << " at=" << state.updated_at << " gen=" << state.load_generation;
  if (state.duration) {
    oss << " duration=" << *state.duration;
  }
  if (state.is_loading) {
    oss << " loading=1";
  }
  if (state.error) {
    oss << " error=1";
  }
  if (state.command_id) {
    oss << " cmd=" << *state.command_id;
  }
  return oss.str();
}

}  // namespace decksync::timeline
