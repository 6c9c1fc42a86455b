// Repository: DeckSync
// Component: Deck Coordinator
// Purpose: Drives one deck's store, playback surface and mirrors from protocol traffic.
// Copyright (c) 2025 DeckSync

#ifndef DECKSYNC_RUNTIME_DECK_COORDINATOR_H_
#define DECKSYNC_RUNTIME_DECK_COORDINATOR_H_

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "decksync/mirror/MirrorSynchronizer.hpp"
#include "decksync/runtime/DispatchQueue.h"
#include "decksync/runtime/Messages.h"
#include "decksync/surface/MediaTypes.hpp"
#include "decksync/surface/PlaybackSurface.hpp"
#include "decksync/timeline/DeckTypes.hpp"
#include "decksync/timeline/Intent.hpp"
#include "decksync/timeline/TimelineStateStore.hpp"

namespace decksync::runtime {

struct CoordinatorConfig {
  timeline::ClientRole role = timeline::ClientRole::kController;
  // Surface is re-seeked only when it is further than this from the
  // extrapolated timeline position.
  double seek_tolerance_s = 0.25;
  timeline::StoreConfig store;
  surface::SurfaceConfig surface;
  mirror::MirrorConfig mirror;
};

// DeckCoordinator funnels every mutation of one deck through its
// TimelineStateStore and then reconciles the PlaybackSurface with the
// resulting view: source, rate, position (beyond seek_tolerance_s) and
// play state. Surface observations travel back to the authority as
// state(partial) reports, controller role only.
//
// Dispatch-thread only.
class DeckCoordinator {
 public:
  struct Callbacks {
    std::function<void(const DeckCommand&)> send_command;
    // The pending command expired; a full-state resync is wanted.
    std::function<void(timeline::DeckKey)> request_resync;
    std::function<void(timeline::DeckKey, const timeline::DeckTimelineState&)>
        on_view_changed;
  };

  struct MetricsSnapshot {
    uint64_t commands_sent_total = 0;
    uint64_t reports_sent_total = 0;
    uint64_t acks_rejected_total = 0;
    uint64_t resync_requests_total = 0;
    uint64_t corrective_seeks_total = 0;
    timeline::TimelineStateStore::MetricsSnapshot store;
    surface::PlaybackSurface::MetricsSnapshot surface;
    mirror::MirrorSynchronizer::MetricsSnapshot mirror;
  };

  DeckCoordinator(timeline::DeckKey deck,
                  std::shared_ptr<surface::IMediaBackend> backend,
                  std::shared_ptr<DispatchQueue> queue,
                  CoordinatorConfig config, Callbacks callbacks);
  ~DeckCoordinator();

  DeckCoordinator(const DeckCoordinator&) = delete;
  DeckCoordinator& operator=(const DeckCoordinator&) = delete;

  timeline::ApplyResult OnBroadcast(const timeline::DeckTimelineState& state);
  timeline::ApplyResult OnResync(const timeline::DeckTimelineState& state);
  void OnCommandResult(const CommandResult& result);

  // Local user intent: optimistic projection, then send to the authority.
  timeline::TimelineStateStore::IssueResult Issue(
      const timeline::IntentPayload& intent,
      std::optional<uint64_t> expected_version = std::nullopt);

  // Pending-command expiry, drift correction and mirror reconciliation.
  void Tick();

  // Authority restarted under a new epoch.
  void Reset();

  void AttachPrimary(surface::IRenderContainer* container);
  bool AddMirror(surface::IRenderContainer* container);
  bool RemoveMirror(const std::string& container_id);
  bool OnUserGesture();

  [[nodiscard]] const timeline::DeckTimelineState& View() const {
    return store_.View();
  }
  [[nodiscard]] double PositionNow() const;
  [[nodiscard]] std::optional<double> ProgressNow() const;

  [[nodiscard]] timeline::DeckKey deck() const { return deck_; }
  [[nodiscard]] const timeline::TimelineStateStore& store() const {
    return store_;
  }
  [[nodiscard]] surface::PlaybackSurface& surface() { return *surface_; }
  [[nodiscard]] mirror::MirrorSynchronizer& mirrors() { return *mirrors_; }

  [[nodiscard]] MetricsSnapshot Snapshot() const;

 private:
  void ReconcileSurface();
  void Report(const timeline::StatePatch& patch);
  void SendCommand(const timeline::IntentPayload& intent,
                   const std::string& command_id,
                   std::optional<uint64_t> expected_version);
  void NotifyView();

  void OnSurfaceDuration(double duration);
  void OnSurfaceSourceReady(const std::string& src);
  void OnSurfaceFault(surface::FaultKind kind, const std::string& message);

  [[nodiscard]] double Now() const { return queue_->clock()->NowSeconds(); }
  [[nodiscard]] bool IsController() const {
    return config_.role == timeline::ClientRole::kController;
  }

  timeline::DeckKey deck_;
  std::shared_ptr<DispatchQueue> queue_;
  CoordinatorConfig config_;
  Callbacks callbacks_;

  timeline::TimelineStateStore store_;
  std::unique_ptr<surface::PlaybackSurface> surface_;
  std::unique_ptr<mirror::MirrorSynchronizer> mirrors_;

  // load_generation the surface last started loading; unset after Reset().
  std::optional<uint64_t> loaded_generation_;
  // Surface forced neutral rate; holds until a newer version arrives.
  std::optional<uint64_t> forced_neutral_version_;

  MetricsSnapshot metrics_;
};

}  // namespace decksync::runtime

#endif  // DECKSYNC_RUNTIME_DECK_COORDINATOR_H_
