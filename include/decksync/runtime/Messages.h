// Repository: DeckSync
// Component: Protocol Messages
// Purpose: Native forms of commands, acknowledgements and server messages.
// Copyright (c) 2025 DeckSync

#ifndef DECKSYNC_RUNTIME_MESSAGES_H_
#define DECKSYNC_RUNTIME_MESSAGES_H_

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

#include "decksync/timeline/DeckTypes.hpp"
#include "decksync/timeline/Intent.hpp"

namespace decksync::runtime {

// Client -> authority.
struct DeckCommand {
  timeline::DeckKey deck = timeline::DeckKey::kA;
  timeline::Intent intent;
  // When set, the command only applies if the deck is still at this version.
  std::optional<uint64_t> expected_version;
};

// Authority -> issuing client. Failures are data, never exceptions.
struct CommandResult {
  bool accepted = false;
  timeline::ErrorCode code = timeline::ErrorCode::kNone;
  std::string message;
  // Already applied earlier under the same command id.
  bool duplicate = false;
  timeline::DeckKey deck = timeline::DeckKey::kA;
  std::string command_id;
  // Deck state after the command (current state on rejection).
  timeline::DeckTimelineState state;
};

// Authority -> every subscriber, once per applied command.
struct DeckBroadcast {
  timeline::DeckKey deck = timeline::DeckKey::kA;
  timeline::DeckTimelineState state;
};

// Authority -> subscriber on (re)connect.
struct FullStateResync {
  // Changes whenever the authority restarts; versions restart with it.
  std::string authority_epoch;
  std::array<timeline::DeckTimelineState, timeline::kDeckCount> decks;
};

using ServerMessage = std::variant<DeckBroadcast, FullStateResync>;

}  // namespace decksync::runtime

#endif  // DECKSYNC_RUNTIME_MESSAGES_H_
