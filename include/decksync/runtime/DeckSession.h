// Repository: DeckSync
// Component: Deck Session
// Purpose: One client's view of all four decks, fed by one authority subscription.
// Copyright (c) 2025 DeckSync

#ifndef DECKSYNC_RUNTIME_DECK_SESSION_H_
#define DECKSYNC_RUNTIME_DECK_SESSION_H_

#include <array>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "decksync/runtime/DeckCoordinator.h"
#include "decksync/runtime/DispatchQueue.h"
#include "decksync/runtime/Messages.h"
#include "decksync/surface/MediaTypes.hpp"
#include "decksync/timeline/DeckTypes.hpp"

namespace decksync::runtime {

// DeckSession routes server messages and command results to the
// coordinator of the addressed deck. A FullStateResync under a different
// authority epoch resets every deck before it is applied, because versions
// restart with the authority.
//
// Dispatch-thread only.
class DeckSession {
 public:
  struct Callbacks {
    std::function<void(const DeckCommand&)> send_command;
    // Some deck's pending command expired; the transport should fetch a
    // fresh FullStateResync.
    std::function<void(timeline::DeckKey)> request_resync;
    std::function<void(timeline::DeckKey, const timeline::DeckTimelineState&)>
        on_view_changed;
  };

  DeckSession(std::shared_ptr<surface::IMediaBackend> backend,
              std::shared_ptr<DispatchQueue> queue,
              CoordinatorConfig config = {}, Callbacks callbacks = {});

  DeckSession(const DeckSession&) = delete;
  DeckSession& operator=(const DeckSession&) = delete;

  void OnServerMessage(const ServerMessage& message);
  void OnCommandResult(const CommandResult& result);

  timeline::TimelineStateStore::IssueResult Issue(
      timeline::DeckKey deck, const timeline::IntentPayload& intent,
      std::optional<uint64_t> expected_version = std::nullopt);

  void Tick();
  // Forwards a user gesture to every deck; true if any blocked play resumed.
  bool OnUserGesture();

  [[nodiscard]] DeckCoordinator& Deck(timeline::DeckKey deck) {
    return *decks_[timeline::DeckIndex(deck)];
  }
  [[nodiscard]] const DeckCoordinator& Deck(timeline::DeckKey deck) const {
    return *decks_[timeline::DeckIndex(deck)];
  }
  [[nodiscard]] const std::string& authority_epoch() const {
    return authority_epoch_;
  }

 private:
  void ApplyResync(const FullStateResync& resync);

  std::shared_ptr<DispatchQueue> queue_;
  std::array<std::unique_ptr<DeckCoordinator>, timeline::kDeckCount> decks_;
  std::string authority_epoch_;
};

}  // namespace decksync::runtime

#endif  // DECKSYNC_RUNTIME_DECK_SESSION_H_
