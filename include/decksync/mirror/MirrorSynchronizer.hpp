// Repository: DeckSync
// Component: Mirror Synchronizer
// Purpose: Keeps secondary render containers visually identical to a deck's primary instance.
// Copyright (c) 2025 DeckSync

#ifndef DECKSYNC_MIRROR_MIRROR_SYNCHRONIZER_HPP_
#define DECKSYNC_MIRROR_MIRROR_SYNCHRONIZER_HPP_

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "decksync/runtime/DispatchQueue.h"
#include "decksync/surface/MediaTypes.hpp"
#include "decksync/surface/PlaybackSurface.hpp"
#include "decksync/timeline/DeckTypes.hpp"

namespace decksync::mirror {

struct MirrorConfig {
  // Fallback mirrors are re-seeked only beyond this drift.
  double drift_tolerance_s = 0.2;
  double rate_tolerance = 0.01;
  // Fallback decoders are muted so only the primary is audible.
  bool mute_fallback = true;
};

enum class MirrorMode {
  kUnbound,
  // Container displays the primary instance's live output.
  kDirect,
  // Mirror owns an independent decoder of the same src.
  kFallback,
};

[[nodiscard]] const char* ToString(MirrorMode mode);

// MirrorSynchronizer binds N mirror containers to one PlaybackSurface.
//
// Direct binding is preferred; whether the backend allows it is probed once
// per source origin and cached. When disallowed, each mirror decodes the
// same src itself and Reconcile() corrects drift beyond the tolerance and
// matches play state and rate. Fallback replacements are prepared
// off-screen and mounted in one step, like primary swaps.
//
// If the primary container is detached, the first bound mirror is promoted
// to primary container.
//
// Dispatch-thread only.
class MirrorSynchronizer {
 public:
  struct MetricsSnapshot {
    uint64_t rebinds_total = 0;
    uint64_t drift_corrections_total = 0;
    uint64_t rate_corrections_total = 0;
    uint64_t play_state_corrections_total = 0;
    uint64_t promotions_total = 0;
    uint64_t share_probes_total = 0;
    uint64_t fallback_created_total = 0;
    uint64_t fallback_released_total = 0;
    std::size_t mirror_count = 0;
  };

  struct Callbacks {
    std::function<void(surface::IRenderContainer* promoted)> on_promoted;
  };

  MirrorSynchronizer(timeline::DeckKey deck,
                     std::shared_ptr<surface::IMediaBackend> backend,
                     std::shared_ptr<runtime::DispatchQueue> queue,
                     MirrorConfig config = {}, Callbacks callbacks = {});
  ~MirrorSynchronizer();

  MirrorSynchronizer(const MirrorSynchronizer&) = delete;
  MirrorSynchronizer& operator=(const MirrorSynchronizer&) = delete;

  void BindSurface(surface::PlaybackSurface* surface);

  bool AddMirror(surface::IRenderContainer* container);
  bool RemoveMirror(const std::string& container_id);

  // Called whenever the primary instance is replaced or removed.
  void Rebind();
  // Periodic pass: promotion, direct-binding repair, fallback drift.
  void Reconcile();
  // Releases every fallback decoder and detaches all mirrors.
  void Teardown();

  [[nodiscard]] std::size_t MirrorCount() const { return mirrors_.size(); }
  [[nodiscard]] MirrorMode ModeOf(const std::string& container_id) const;
  [[nodiscard]] surface::IMediaInstance* FallbackInstance(
      const std::string& container_id) const;
  [[nodiscard]] std::optional<bool> DirectBindingAllowed() const {
    return direct_allowed_;
  }

  [[nodiscard]] MetricsSnapshot Snapshot() const;

  // "scheme://host" for URLs, empty for plain paths.
  [[nodiscard]] static std::string OriginOf(const std::string& locator);

 private:
  struct Mirror {
    surface::IRenderContainer* container = nullptr;
    MirrorMode mode = MirrorMode::kUnbound;
    std::unique_ptr<surface::IMediaInstance> own;
    std::string own_src;
    std::unique_ptr<surface::IMediaInstance> preparing;
    std::string preparing_src;
  };

  bool ProbeDirect(const std::string& src);
  void BindMirror(Mirror& mirror, surface::IMediaInstance* primary,
                  const std::optional<std::string>& src);
  void StartFallback(Mirror& mirror, const std::string& src);
  void OnFallbackEvent(const surface::MediaEvent& event);
  void SyncFallback(Mirror& mirror, surface::IMediaInstance* primary);
  void ReleaseFallback(Mirror& mirror);
  bool PromoteIfPrimaryUnbound();
  Mirror* FindMirror(const std::string& container_id);
  const Mirror* FindMirror(const std::string& container_id) const;

  timeline::DeckKey deck_;
  std::shared_ptr<surface::IMediaBackend> backend_;
  std::shared_ptr<runtime::DispatchQueue> queue_;
  MirrorConfig config_;
  Callbacks callbacks_;
  surface::PlaybackSurface* surface_ = nullptr;

  std::vector<Mirror> mirrors_;
  std::optional<bool> direct_allowed_;
  std::string probed_origin_;
  MetricsSnapshot metrics_;
};

}  // namespace decksync::mirror

#endif  // DECKSYNC_MIRROR_MIRROR_SYNCHRONIZER_HPP_
