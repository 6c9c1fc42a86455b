// Repository: DeckSync
// Component: Deck Intents
// Purpose: Closed set of commands a client may issue against one deck.
// Copyright (c) 2025 DeckSync

#include "decksync/timeline/Intent.hpp"

#include <type_traits>

namespace decksync::timeline {

const char* IntentName(const IntentPayload& payload) {
  return std::visit(
      [](const auto& intent) -> const char* {
        using T = std::decay_t<decltype(intent)>;
        if constexpr (std::is_same_v<T, ToggleIntent>) {
          return "toggle";
        } else if constexpr (std::is_same_v<T, PlayIntent>) {
          return "play";
        } else if constexpr (std::is_same_v<T, PauseIntent>) {
          return "pause";
        } else if constexpr (std::is_same_v<T, SeekIntent>) {
          return "seek";
        } else if constexpr (std::is_same_v<T, RateIntent>) {
          return "rate";
        } else if constexpr (std::is_same_v<T, SourceIntent>) {
          return "source";
        } else {
          return "state";
        }
      },
      payload);
}

}  // namespace decksync::timeline
