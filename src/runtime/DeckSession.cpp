// Repository: DeckSync
// Component: Deck Session
// Purpose: One client's view of all four decks, fed by one authority subscription.
// Copyright (c) 2025 DeckSync

#include "decksync/runtime/DeckSession.h"

#include <sstream>
#include <utility>
#include <variant>

#include "decksync/util/Logger.hpp"

namespace decksync::runtime {

DeckSession::DeckSession(std::shared_ptr<surface::IMediaBackend> backend,
                         std::shared_ptr<DispatchQueue> queue,
                         CoordinatorConfig config, Callbacks callbacks)
    : queue_(std::move(queue)) {
  DeckCoordinator::Callbacks deck_callbacks;
  deck_callbacks.send_command = callbacks.send_command;
  deck_callbacks.request_resync = callbacks.request_resync;
  deck_callbacks.on_view_changed = callbacks.on_view_changed;
  for (timeline::DeckKey deck : timeline::kAllDecks) {
    decks_[timeline::DeckIndex(deck)] = std::make_unique<DeckCoordinator>(
        deck, backend, queue_, config, deck_callbacks);
  }
}

void DeckSession::OnServerMessage(const ServerMessage& message) {
  if (const auto* broadcast = std::get_if<DeckBroadcast>(&message)) {
    Deck(broadcast->deck).OnBroadcast(broadcast->state);
    return;
  }
  ApplyResync(std::get<FullStateResync>(message));
}

void DeckSession::ApplyResync(const FullStateResync& resync) {
  if (!resync.authority_epoch.empty() &&
      resync.authority_epoch != authority_epoch_) {
    if (!authority_epoch_.empty()) {
      std::ostringstream oss;
      oss << "[DeckSession] AUTHORITY_EPOCH_CHANGED from=" << authority_epoch_
          << " to=" << resync.authority_epoch;
      util::Logger::Info(oss.str());
      for (auto& deck : decks_) {
        deck->Reset();
      }
    }
    authority_epoch_ = resync.authority_epoch;
  }
  for (timeline::DeckKey deck : timeline::kAllDecks) {
    Deck(deck).OnResync(resync.decks[timeline::DeckIndex(deck)]);
  }
}

void DeckSession::OnCommandResult(const CommandResult& result) {
  Deck(result.deck).OnCommandResult(result);
}

timeline::TimelineStateStore::IssueResult DeckSession::Issue(
    timeline::DeckKey deck, const timeline::IntentPayload& intent,
    std::optional<uint64_t> expected_version) {
  return Deck(deck).Issue(intent, expected_version);
}

void DeckSession::Tick() {
  for (auto& deck : decks_) {
    deck->Tick();
  }
}

bool DeckSession::OnUserGesture() {
  bool resumed = false;
  for (auto& deck : decks_) {
    resumed = deck->OnUserGesture() || resumed;
  }
  return resumed;
}

}  // namespace decksync::runtime
