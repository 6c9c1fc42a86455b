// Repository: DeckSync
// Component: Deck Coordinator
// Purpose: Drives one deck's store, playback surface and mirrors from protocol traffic.
// Copyright (c) 2025 DeckSync

#include "decksync/runtime/DeckCoordinator.h"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <utility>

#include "decksync/timeline/PositionExtrapolator.hpp"
#include "decksync/util/Identifiers.hpp"
#include "decksync/util/Logger.hpp"

namespace decksync::runtime {

using timeline::ApplyResult;
using timeline::DeckTimelineState;
using timeline::StatePatch;

DeckCoordinator::DeckCoordinator(timeline::DeckKey deck,
                                 std::shared_ptr<surface::IMediaBackend> backend,
                                 std::shared_ptr<DispatchQueue> queue,
                                 CoordinatorConfig config, Callbacks callbacks)
    : deck_(deck),
      queue_(std::move(queue)),
      config_(std::move(config)),
      callbacks_(std::move(callbacks)),
      store_(deck, config_.store) {
  surface::PlaybackSurface::Callbacks surface_callbacks;
  surface_callbacks.on_primary_replaced = [this](surface::IMediaInstance*) {
    if (mirrors_) {
      mirrors_->Rebind();
    }
  };
  // Surface callbacks fire mid-transition; reactions run as separate tasks.
  surface_callbacks.on_duration = [this](double duration) {
    queue_->Post([this, duration] { OnSurfaceDuration(duration); }, this);
  };
  surface_callbacks.on_source_ready = [this](const std::string& src) {
    queue_->Post([this, src] { OnSurfaceSourceReady(src); }, this);
  };
  surface_callbacks.on_fault = [this](surface::FaultKind kind,
                                      const std::string& message) {
    queue_->Post([this, kind, message] { OnSurfaceFault(kind, message); },
                 this);
  };

  surface_ = std::make_unique<surface::PlaybackSurface>(
      deck_, backend, queue_, config_.surface, std::move(surface_callbacks));
  mirrors_ = std::make_unique<mirror::MirrorSynchronizer>(
      deck_, backend, queue_, config_.mirror);
  mirrors_->BindSurface(surface_.get());
}

DeckCoordinator::~DeckCoordinator() {
  queue_->CancelOwner(this);
  mirrors_->Teardown();
  mirrors_.reset();
  surface_.reset();
}

// ---------------------------------------------------------------------------
// Inbound
// ---------------------------------------------------------------------------

ApplyResult DeckCoordinator::OnBroadcast(const DeckTimelineState& state) {
  const ApplyResult result = store_.ApplyRemote(state);
  if (result == ApplyResult::kApplied) {
    NotifyView();
    ReconcileSurface();
  }
  return result;
}

ApplyResult DeckCoordinator::OnResync(const DeckTimelineState& state) {
  const bool had_projection = store_.HasProjection();
  const ApplyResult result = store_.ApplyResync(state);
  if (result == ApplyResult::kApplied || had_projection) {
    NotifyView();
    ReconcileSurface();
  }
  return result;
}

void DeckCoordinator::OnCommandResult(const CommandResult& result) {
  if (!result.accepted) {
    ++metrics_.acks_rejected_total;
    std::ostringstream oss;
    oss << "[DeckCoordinator] COMMAND_REJECTED deck=" << timeline::ToString(deck_)
        << " cmd=" << result.command_id
        << " code=" << timeline::ToString(result.code)
        << " reason=" << result.message;
    util::Logger::Warn(oss.str());
  }

  // Rejected, duplicate and no-op commands never produce their own echo;
  // the projection is dropped and the returned current state adopted.
  const bool echoes_command = result.accepted && result.state.command_id &&
                              *result.state.command_id == result.command_id;
  bool changed = false;
  if (!echoes_command) {
    changed = store_.AbandonCommand(result.command_id);
  }
  changed = store_.ApplyRemote(result.state) == ApplyResult::kApplied || changed;
  if (changed) {
    NotifyView();
    ReconcileSurface();
  }
}

// ---------------------------------------------------------------------------
// Outbound
// ---------------------------------------------------------------------------

timeline::TimelineStateStore::IssueResult DeckCoordinator::Issue(
    const timeline::IntentPayload& intent,
    std::optional<uint64_t> expected_version) {
  if (!IsController()) {
    timeline::TimelineStateStore::IssueResult refused;
    refused.code = timeline::ErrorCode::kForbidden;
    refused.message = std::string("role ") + timeline::ToString(config_.role) +
                      " may not issue deck commands";
    return refused;
  }
  auto result = store_.IssueCommand(intent, Now());
  if (!result.accepted) {
    return result;
  }
  SendCommand(intent, result.command_id, expected_version);
  NotifyView();
  ReconcileSurface();
  return result;
}

void DeckCoordinator::SendCommand(const timeline::IntentPayload& intent,
                                  const std::string& command_id,
                                  std::optional<uint64_t> expected_version) {
  DeckCommand command;
  command.deck = deck_;
  command.intent.payload = intent;
  command.intent.command_id = command_id;
  command.expected_version = expected_version;
  ++metrics_.commands_sent_total;
  if (callbacks_.send_command) {
    callbacks_.send_command(command);
  }
}

void DeckCoordinator::Report(const StatePatch& patch) {
  if (!IsController()) {
    return;
  }
  ++metrics_.reports_sent_total;
  SendCommand(patch, util::GenerateUuidV4(), std::nullopt);
}

void DeckCoordinator::NotifyView() {
  if (callbacks_.on_view_changed) {
    callbacks_.on_view_changed(deck_, store_.View());
  }
}

// ---------------------------------------------------------------------------
// Surface reconciliation
// ---------------------------------------------------------------------------

void DeckCoordinator::ReconcileSurface() {
  const DeckTimelineState& view = store_.View();
  const double now = Now();

  if (view.src != surface_->Src()) {
    loaded_generation_ = view.load_generation;
    forced_neutral_version_.reset();
    surface_->SetSource(view.src);
  } else if (view.src && !loaded_generation_) {
    // First state after an authority restart: keep the instance already
    // showing this src.
    loaded_generation_ = view.load_generation;
  } else if (view.src && view.load_generation > *loaded_generation_) {
    // Same src under a newer load generation: explicit reload. A dropped
    // reload projection falls back to an older generation and is ignored.
    loaded_generation_ = view.load_generation;
    forced_neutral_version_.reset();
    surface_->SetSource(view.src, /*reload=*/true);
  }
  if (!view.src) {
    return;
  }

  if (forced_neutral_version_ && view.version > *forced_neutral_version_) {
    forced_neutral_version_.reset();
  }
  const bool forced_neutral = forced_neutral_version_.has_value();
  const double rate = forced_neutral ? timeline::kNeutralPlayRate
                                     : view.play_rate;
  surface_->SetRate(rate);

  // While the surface runs at a forced rate the timeline would drag it
  // back every tick; position is left alone until the timeline agrees.
  if (!forced_neutral) {
    const double target = config_.surface.loop
                              ? timeline::LoopedPositionAt(view, now)
                              : timeline::PositionAt(view, now);
    if (surface_->Primary() != nullptr && !surface_->IsPreparing()) {
      double offset = std::abs(surface_->CurrentTime() - target);
      if (config_.surface.loop && view.duration && *view.duration > 0.0) {
        offset = std::min(offset, *view.duration - offset);
      }
      if (offset > config_.seek_tolerance_s) {
        surface_->Seek(target);
        ++metrics_.corrective_seeks_total;
      }
    } else {
      surface_->Seek(target);
    }
  }

  if (view.is_playing && !timeline::IsEffectivelyStopped(rate)) {
    surface_->Play();
  } else {
    surface_->Pause();
  }
}

void DeckCoordinator::OnSurfaceDuration(double duration) {
  const DeckTimelineState& view = store_.View();
  if (!view.src || (view.duration && std::abs(*view.duration - duration) < 1e-3)) {
    return;
  }
  StatePatch patch;
  patch.duration = duration;
  Report(patch);
}

void DeckCoordinator::OnSurfaceSourceReady(const std::string& src) {
  const DeckTimelineState& view = store_.View();
  if (view.src != src || (!view.is_loading && !view.error)) {
    return;
  }
  StatePatch patch;
  patch.is_loading = false;
  patch.error = false;
  Report(patch);
}

void DeckCoordinator::OnSurfaceFault(surface::FaultKind kind,
                                     const std::string& message) {
  switch (kind) {
    case surface::FaultKind::kSourceLoadFailure:
    case surface::FaultKind::kDecodeFailure: {
      StatePatch patch;
      patch.error = true;
      patch.is_loading = false;
      patch.error_message = message;
      Report(patch);
      break;
    }
    case surface::FaultKind::kRateForcedNeutral:
      forced_neutral_version_ = store_.View().version;
      if (IsController() && std::abs(store_.View().play_rate -
                                     timeline::kNeutralPlayRate) > 1e-9) {
        const auto issued =
            Issue(timeline::RateIntent{timeline::kNeutralPlayRate});
        if (!issued.accepted) {
          util::Logger::Warn("[DeckCoordinator] NEUTRAL_RATE_REFUSED deck=" +
                             std::string(timeline::ToString(deck_)) +
                             " reason=" + issued.message);
        }
      }
      break;
    case surface::FaultKind::kAutoplayBlocked:
    case surface::FaultKind::kRateApplyMismatch: {
      std::ostringstream oss;
      oss << "[DeckCoordinator] SURFACE_FAULT deck=" << timeline::ToString(deck_)
          << " kind=" << surface::ToString(kind) << " reason=" << message;
      util::Logger::Warn(oss.str());
      break;
    }
  }
}

// ---------------------------------------------------------------------------

void DeckCoordinator::Tick() {
  const auto outcome = store_.Expire(Now());
  if (outcome.expired) {
    ++metrics_.resync_requests_total;
    NotifyView();
    if (callbacks_.request_resync) {
      callbacks_.request_resync(deck_);
    }
  }
  ReconcileSurface();
  mirrors_->Reconcile();
}

void DeckCoordinator::Reset() {
  store_.Reset();
  loaded_generation_.reset();
  forced_neutral_version_.reset();
  NotifyView();
}

void DeckCoordinator::AttachPrimary(surface::IRenderContainer* container) {
  surface_->AttachContainer(container);
}

bool DeckCoordinator::AddMirror(surface::IRenderContainer* container) {
  return mirrors_->AddMirror(container);
}

bool DeckCoordinator::RemoveMirror(const std::string& container_id) {
  return mirrors_->RemoveMirror(container_id);
}

bool DeckCoordinator::OnUserGesture() { return surface_->OnUserGesture(); }

double DeckCoordinator::PositionNow() const {
  return timeline::PositionAt(store_.View(), Now());
}

std::optional<double> DeckCoordinator::ProgressNow() const {
  return timeline::ProgressPercent(store_.View(), Now());
}

DeckCoordinator::MetricsSnapshot DeckCoordinator::Snapshot() const {
  MetricsSnapshot snapshot = metrics_;
  snapshot.store = store_.Snapshot();
  snapshot.surface = surface_->Snapshot();
  snapshot.mirror = mirrors_->Snapshot();
  return snapshot;
}

}  // namespace decksync::runtime
