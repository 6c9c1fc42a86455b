// Repository: DeckSync
// Component: Deck Intents
// Purpose: Closed set of commands a client may issue against one deck.
// Copyright (c) 2025 DeckSync

#ifndef DECKSYNC_TIMELINE_INTENT_HPP_
#define DECKSYNC_TIMELINE_INTENT_HPP_

#include <optional>
#include <string>
#include <variant>

namespace decksync::timeline {

struct ToggleIntent {};

struct PlayIntent {};

struct PauseIntent {};

struct SeekIntent {
  double position = 0.0;
  // When present, also sets is_playing.
  std::optional<bool> resume;
};

struct RateIntent {
  double value = 1.0;
};

// src == nullopt empties the deck. reload forces a rebuild of the same src.
struct SourceIntent {
  std::optional<std::string> src;
  bool reload = false;
};

// Partial state report. Absent fields are left untouched.
struct StatePatch {
  std::optional<bool> is_playing;
  std::optional<double> base_position;
  std::optional<double> play_rate;
  std::optional<double> duration;
  std::optional<bool> is_loading;
  std::optional<bool> error;
  std::optional<std::string> error_message;
};

using IntentPayload = std::variant<ToggleIntent, PlayIntent, PauseIntent,
                                   SeekIntent, RateIntent, SourceIntent,
                                   StatePatch>;

struct Intent {
  IntentPayload payload;
  std::string command_id;
};

// "toggle", "play", "pause", "seek", "rate", "source" or "state".
[[nodiscard]] const char* IntentName(const IntentPayload& payload);

}  // namespace decksync::timeline

#endif  // DECKSYNC_TIMELINE_INTENT_HPP_
