// Repository: DeckSync
// Component: Mirror Synchronizer
// Purpose: Keeps secondary render containers visually identical to a deck's primary instance.
// Copyright (c) 2025 DeckSync

#include "decksync/mirror/MirrorSynchronizer.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <utility>

#include "decksync/util/Logger.hpp"

namespace decksync::mirror {

using surface::IMediaInstance;
using surface::IRenderContainer;
using surface::MediaEvent;
using surface::MediaEventKind;

const char* ToString(MirrorMode mode) {
  switch (mode) {
    case MirrorMode::kUnbound:
      return "unbound";
    case MirrorMode::kDirect:
      return "direct";
    case MirrorMode::kFallback:
      return "fallback";
  }
  return "unknown";
}

MirrorSynchronizer::MirrorSynchronizer(
    timeline::DeckKey deck, std::shared_ptr<surface::IMediaBackend> backend,
    std::shared_ptr<runtime::DispatchQueue> queue, MirrorConfig config,
    Callbacks callbacks)
    : deck_(deck),
      backend_(std::move(backend)),
      queue_(std::move(queue)),
      config_(config),
      callbacks_(std::move(callbacks)) {}

MirrorSynchronizer::~MirrorSynchronizer() {
  Teardown();
  queue_->CancelOwner(this);
}

std::string MirrorSynchronizer::OriginOf(const std::string& locator) {
  const std::size_t scheme = locator.find("://");
  if (scheme == std::string::npos) {
    return {};
  }
  const std::size_t path = locator.find('/', scheme + 3);
  return locator.substr(0, path);
}

void MirrorSynchronizer::BindSurface(surface::PlaybackSurface* surface) {
  surface_ = surface;
  Rebind();
}

bool MirrorSynchronizer::AddMirror(IRenderContainer* container) {
  if (container == nullptr || FindMirror(container->Id()) != nullptr) {
    return false;
  }
  mirrors_.push_back(Mirror{});
  Mirror& mirror = mirrors_.back();
  mirror.container = container;
  if (surface_ != nullptr) {
    BindMirror(mirror, surface_->Primary(), surface_->Src());
  }
  std::ostringstream oss;
  oss << "[MirrorSynchronizer] MIRROR_ADDED deck=" << timeline::ToString(deck_)
      << " container=" << container->Id()
      << " mode=" << ToString(mirror.mode);
  util::Logger::Info(oss.str());
  return true;
}

bool MirrorSynchronizer::RemoveMirror(const std::string& container_id) {
  auto it = std::find_if(mirrors_.begin(), mirrors_.end(),
                         [&](const Mirror& m) {
                           return m.container->Id() == container_id;
                         });
  if (it == mirrors_.end()) {
    return false;
  }
  ReleaseFallback(*it);
  it->container->Unmount();
  mirrors_.erase(it);
  return true;
}

void MirrorSynchronizer::Rebind() {
  ++metrics_.rebinds_total;
  IMediaInstance* primary = surface_ != nullptr ? surface_->Primary() : nullptr;
  const std::optional<std::string> src =
      surface_ != nullptr ? surface_->Src() : std::nullopt;
  for (Mirror& mirror : mirrors_) {
    BindMirror(mirror, primary, src);
  }
}

void MirrorSynchronizer::Reconcile() {
  PromoteIfPrimaryUnbound();
  if (surface_ == nullptr) {
    return;
  }
  IMediaInstance* primary = surface_->Primary();
  for (Mirror& mirror : mirrors_) {
    switch (mirror.mode) {
      case MirrorMode::kDirect:
        if (primary != nullptr && mirror.container->Mounted() != primary) {
          mirror.container->Mount(primary);
        }
        break;
      case MirrorMode::kFallback:
        SyncFallback(mirror, primary);
        break;
      case MirrorMode::kUnbound:
        break;
    }
  }
}

void MirrorSynchronizer::Teardown() {
  for (Mirror& mirror : mirrors_) {
    ReleaseFallback(mirror);
    mirror.container->Unmount();
    mirror.mode = MirrorMode::kUnbound;
  }
  mirrors_.clear();
}

MirrorMode MirrorSynchronizer::ModeOf(const std::string& container_id) const {
  const Mirror* mirror = FindMirror(container_id);
  return mirror != nullptr ? mirror->mode : MirrorMode::kUnbound;
}

IMediaInstance* MirrorSynchronizer::FallbackInstance(
    const std::string& container_id) const {
  const Mirror* mirror = FindMirror(container_id);
  return mirror != nullptr ? mirror->own.get() : nullptr;
}

MirrorSynchronizer::MetricsSnapshot MirrorSynchronizer::Snapshot() const {
  MetricsSnapshot snapshot = metrics_;
  snapshot.mirror_count = mirrors_.size();
  return snapshot;
}

// ---------------------------------------------------------------------------

bool MirrorSynchronizer::ProbeDirect(const std::string& src) {
  const std::string origin = OriginOf(src);
  if (!direct_allowed_ || origin != probed_origin_) {
    direct_allowed_ = backend_->CanShareOutput(src);
    probed_origin_ = origin;
    ++metrics_.share_probes_total;
    std::ostringstream oss;
    oss << "[MirrorSynchronizer] SHARE_PROBE deck=" << timeline::ToString(deck_)
        << " origin=" << (origin.empty() ? "<local>" : origin)
        << " direct=" << (*direct_allowed_ ? 1 : 0);
    util::Logger::Info(oss.str());
  }
  return *direct_allowed_;
}

void MirrorSynchronizer::BindMirror(Mirror& mirror, IMediaInstance* primary,
                                    const std::optional<std::string>& src) {
  if (primary == nullptr || !src) {
    ReleaseFallback(mirror);
    mirror.container->Unmount();
    mirror.mode = MirrorMode::kUnbound;
    return;
  }
  if (ProbeDirect(*src)) {
    // Mount first so the container never goes blank, then release.
    mirror.container->Mount(primary);
    ReleaseFallback(mirror);
    mirror.mode = MirrorMode::kDirect;
    return;
  }
  mirror.mode = MirrorMode::kFallback;
  if (mirror.own && mirror.own_src == *src) {
    return;
  }
  if (mirror.preparing && mirror.preparing_src == *src) {
    return;
  }
  StartFallback(mirror, *src);
}

void MirrorSynchronizer::StartFallback(Mirror& mirror, const std::string& src) {
  if (mirror.preparing) {
    mirror.preparing->Dispose();
    mirror.preparing.reset();
    ++metrics_.fallback_released_total;
  }
  auto queue = queue_;
  mirror.preparing = backend_->CreateInstance(
      src, [queue, this](const MediaEvent& event) {
        queue->Post([this, event] { OnFallbackEvent(event); }, this);
      });
  if (!mirror.preparing) {
    std::ostringstream oss;
    oss << "[MirrorSynchronizer] FALLBACK_REFUSED deck="
        << timeline::ToString(deck_) << " container=" << mirror.container->Id()
        << " src=" << src;
    util::Logger::Warn(oss.str());
    return;
  }
  mirror.preparing_src = src;
  mirror.preparing->SetLoop(true);
  mirror.preparing->SetMuted(config_.mute_fallback);
  mirror.preparing->Load();
  ++metrics_.fallback_created_total;
}

void MirrorSynchronizer::OnFallbackEvent(const MediaEvent& event) {
  for (Mirror& mirror : mirrors_) {
    if (mirror.preparing && mirror.preparing->Id() == event.instance) {
      if (event.kind == MediaEventKind::kCanPlay) {
        mirror.container->Mount(mirror.preparing.get());
        std::unique_ptr<IMediaInstance> previous = std::move(mirror.own);
        mirror.own = std::move(mirror.preparing);
        mirror.own_src = mirror.preparing_src;
        mirror.preparing_src.clear();
        if (previous) {
          previous->Dispose();
          ++metrics_.fallback_released_total;
        }
        SyncFallback(mirror,
                     surface_ != nullptr ? surface_->Primary() : nullptr);
      } else if (event.kind == MediaEventKind::kDecodeError ||
                 event.kind == MediaEventKind::kSourceMissing) {
        std::ostringstream oss;
        oss << "[MirrorSynchronizer] FALLBACK_LOAD_FAILED deck="
            << timeline::ToString(deck_)
            << " container=" << mirror.container->Id()
            << " reason=" << event.detail;
        util::Logger::Warn(oss.str());
        mirror.preparing->Dispose();
        mirror.preparing.reset();
        ++metrics_.fallback_released_total;
      }
      return;
    }
    if (mirror.own && mirror.own->Id() == event.instance) {
      if (event.kind == MediaEventKind::kDecodeError && !mirror.preparing) {
        // Rebuild off-screen; the faulted decoder stays visible meanwhile.
        StartFallback(mirror, mirror.own_src);
      }
      return;
    }
  }
}

void MirrorSynchronizer::SyncFallback(Mirror& mirror, IMediaInstance* primary) {
  if (!mirror.own || primary == nullptr) {
    return;
  }
  const double primary_rate = primary->PlaybackRate();
  if (std::abs(mirror.own->PlaybackRate() - primary_rate) >
      config_.rate_tolerance) {
    mirror.own->SetPlaybackRate(primary_rate);
    ++metrics_.rate_corrections_total;
  }

  const double target = primary->CurrentTime();
  double drift = std::abs(mirror.own->CurrentTime() - target);
  const std::optional<double> duration = primary->Duration();
  if (duration && *duration > 0.0) {
    // Looping media: 59.9s and 0.1s are 0.2s apart.
    drift = std::min(drift, *duration - drift);
  }
  if (drift > config_.drift_tolerance_s) {
    mirror.own->SetCurrentTime(target);
    ++metrics_.drift_corrections_total;
    std::ostringstream oss;
    oss << "[MirrorSynchronizer] DRIFT_CORRECTED deck="
        << timeline::ToString(deck_) << " container=" << mirror.container->Id()
        << " drift_s=" << drift;
    util::Logger::Debug(oss.str());
  }

  if (primary->Paused() != mirror.own->Paused()) {
    if (primary->Paused()) {
      mirror.own->Pause();
    } else {
      mirror.own->Play();
    }
    ++metrics_.play_state_corrections_total;
  }
}

void MirrorSynchronizer::ReleaseFallback(Mirror& mirror) {
  if (mirror.preparing) {
    mirror.preparing->Dispose();
    mirror.preparing.reset();
    mirror.preparing_src.clear();
    ++metrics_.fallback_released_total;
  }
  if (mirror.own) {
    if (mirror.container->Mounted() == mirror.own.get()) {
      mirror.container->Unmount();
    }
    mirror.own->Dispose();
    mirror.own.reset();
    mirror.own_src.clear();
    ++metrics_.fallback_released_total;
  }
}

bool MirrorSynchronizer::PromoteIfPrimaryUnbound() {
  if (surface_ == nullptr || mirrors_.empty()) {
    return false;
  }
  IRenderContainer* primary_container = surface_->Container();
  if (primary_container != nullptr && primary_container->IsBound()) {
    return false;
  }
  auto it = std::find_if(mirrors_.begin(), mirrors_.end(), [](const Mirror& m) {
    return m.container->IsBound();
  });
  if (it == mirrors_.end()) {
    return false;
  }

  Mirror promoted = std::move(*it);
  mirrors_.erase(it);
  // The surface mounts its instance straight over whatever the mirror showed.
  surface_->AttachContainer(promoted.container);
  ReleaseFallback(promoted);
  ++metrics_.promotions_total;

  std::ostringstream oss;
  oss << "[MirrorSynchronizer] PRIMARY_PROMOTED deck="
      << timeline::ToString(deck_)
      << " container=" << promoted.container->Id()
      << " remaining_mirrors=" << mirrors_.size();
  util::Logger::Info(oss.str());

  if (callbacks_.on_promoted) {
    callbacks_.on_promoted(promoted.container);
  }
  return true;
}

MirrorSynchronizer::Mirror* MirrorSynchronizer::FindMirror(
    const std::string& container_id) {
  for (Mirror& mirror : mirrors_) {
    if (mirror.container->Id() == container_id) {
      return &mirror;
    }
  }
  return nullptr;
}

const MirrorSynchronizer::Mirror* MirrorSynchronizer::FindMirror(
    const std::string& container_id) const {
  for (const Mirror& mirror : mirrors_) {
    if (mirror.container->Id() == container_id) {
      return &mirror;
    }
  }
  return nullptr;
}

}  // namespace decksync::mirror
