// Repository: DeckSync
// Component: Deck Timeline Types
// Purpose: Deck keys, the authoritative per-deck timeline snapshot and protocol error codes.
// Copyright (c) 2025 DeckSync

#ifndef DECKSYNC_TIMELINE_DECK_TYPES_HPP_
#define DECKSYNC_TIMELINE_DECK_TYPES_HPP_

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace decksync::timeline {

enum class DeckKey {
  kA = 0,
  kB = 1,
  kC = 2,
  kD = 3,
};

constexpr std::size_t kDeckCount = 4;
constexpr std::array<DeckKey, kDeckCount> kAllDecks = {
    DeckKey::kA, DeckKey::kB, DeckKey::kC, DeckKey::kD};

// Rates at or below this are an effective pause.
constexpr double kStopRateThreshold = 0.0001;
constexpr double kMinPlayRate = 0.0;
constexpr double kMaxPlayRate = 8.0;
constexpr double kNeutralPlayRate = 1.0;

[[nodiscard]] constexpr std::size_t DeckIndex(DeckKey deck) {
  return static_cast<std::size_t>(deck);
}

[[nodiscard]] const char* ToString(DeckKey deck);

// Accepts "a".."d" (case-insensitive). Anything else is rejected.
[[nodiscard]] std::optional<DeckKey> ParseDeckKey(std::string_view text);

// Roles a connected client may hold. Only controllers mutate decks.
enum class ClientRole {
  kController = 0,
  kPreview = 1,
  kViewer = 2,
};

[[nodiscard]] const char* ToString(ClientRole role);

enum class ErrorCode {
  kNone = 0,
  kInvalidPayload = 1,
  kInvalidCommand = 2,
  kRevisionMismatch = 3,
  kForbidden = 4,
  kDeckLoad = 5,
};

// Wire spelling, e.g. "E_REVISION_MISMATCH".
[[nodiscard]] const char* ToString(ErrorCode code);

// DeckTimelineState is one deck's authoritative timeline snapshot.
// Position is never stored; it is derived from (base_position, updated_at,
// play_rate, is_playing) by PositionAt().
struct DeckTimelineState {
  std::optional<std::string> src;
  bool is_playing = false;
  // Seconds, valid as of updated_at.
  double base_position = 0.0;
  // [0, 8]; 0 is an effective pause.
  double play_rate = kNeutralPlayRate;
  // Wall-clock seconds at which base_position was sampled.
  double updated_at = 0.0;
  uint64_t version = 0;
  // Sticky until src changes.
  std::optional<double> duration;
  bool is_loading = false;
  bool error = false;
  // Retained diagnostic for a surfaced load/decode failure. Not compared.
  std::string error_message;
  std::optional<std::string> command_id;
  // Bumped by every source change and every explicit reload. A surface
  // rebuilds its instance only when this differs from the load it last
  // started.
  uint64_t load_generation = 0;
};

// True when every field that drives rendering matches:
// src, is_playing, base_position, play_rate, is_loading, error, duration,
// command_id, load_generation.
[[nodiscard]] bool SameComparisonFields(const DeckTimelineState& a,
                                        const DeckTimelineState& b);

[[nodiscard]] double ClampPlayRate(double rate);

[[nodiscard]] inline bool IsEffectivelyStopped(double rate) {
  return rate <= kStopRateThreshold;
}

// One-line summary for logs.
[[nodiscard]] std::string Describe(const DeckTimelineState& state);

}  // namespace decksync::timeline

#endif  // DECKSYNC_TIMELINE_DECK_TYPES_HPP_
