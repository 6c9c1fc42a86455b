// Repository: DeckSync
// Component: Media Host Interfaces
// Purpose: Seams to the external decode engine and the render host.
// Copyright (c) 2025 DeckSync

#ifndef DECKSYNC_SURFACE_MEDIA_TYPES_HPP_
#define DECKSYNC_SURFACE_MEDIA_TYPES_HPP_

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace decksync::surface {

using InstanceId = uint64_t;

enum class MediaEventKind {
  kLoadedMetadata,  // value = duration seconds
  kCanPlay,
  kPlaying,
  kPaused,
  kPlayRejected,  // host autoplay policy refused Play()
  kPlayFailed,    // transient failure to start
  kWaiting,       // buffering stall
  kTimeUpdate,    // value = current time
  kEnded,
  kDecodeError,    // recoverable by rebuilding the instance
  kSourceMissing,  // fatal: locator cannot be resolved
};

[[nodiscard]] const char* ToString(MediaEventKind kind);

struct MediaEvent {
  InstanceId instance = 0;
  MediaEventKind kind = MediaEventKind::kCanPlay;
  double value = 0.0;
  std::string detail;
};

// Invoked by the backend from any thread. Surfaces wrap it so every event is
// re-posted onto the dispatch queue before it touches deck state.
using MediaEventSink = std::function<void(const MediaEvent&)>;

// One decode resource. Calls are asynchronous requests; outcomes arrive as
// MediaEvents tagged with Id(). After Dispose() no further events are
// delivered and the decode resource is released.
class IMediaInstance {
 public:
  virtual ~IMediaInstance() = default;

  [[nodiscard]] virtual InstanceId Id() const = 0;
  [[nodiscard]] virtual const std::string& Locator() const = 0;

  virtual void Load() = 0;
  virtual void Play() = 0;
  virtual void Pause() = 0;
  [[nodiscard]] virtual bool Paused() const = 0;

  virtual void SetCurrentTime(double seconds) = 0;
  [[nodiscard]] virtual double CurrentTime() const = 0;

  virtual void SetPlaybackRate(double rate) = 0;
  // Rate as observed by the engine; may differ from the last request.
  [[nodiscard]] virtual double PlaybackRate() const = 0;

  virtual void SetVolume(double volume) = 0;
  [[nodiscard]] virtual double Volume() const = 0;
  virtual void SetMuted(bool muted) = 0;
  [[nodiscard]] virtual bool Muted() const = 0;
  virtual void SetLoop(bool loop) = 0;

  [[nodiscard]] virtual std::optional<double> Duration() const = 0;

  virtual void Dispose() = 0;
};

class IMediaBackend {
 public:
  virtual ~IMediaBackend() = default;

  virtual std::unique_ptr<IMediaInstance> CreateInstance(
      const std::string& locator, MediaEventSink sink) = 0;

  // Whether a second container may display this instance's live output
  // (false e.g. for cross-origin sources).
  virtual bool CanShareOutput(const std::string& locator) = 0;
};

// Mountable container supplied by the render host. Mount() replaces the
// displayed instance in one step; the container never owns the instance.
class IRenderContainer {
 public:
  virtual ~IRenderContainer() = default;

  [[nodiscard]] virtual const std::string& Id() const = 0;
  virtual void Mount(IMediaInstance* instance) = 0;
  virtual void Unmount() = 0;
  [[nodiscard]] virtual IMediaInstance* Mounted() const = 0;
  // False once the host has detached the container.
  [[nodiscard]] virtual bool IsBound() const = 0;
};

}  // namespace decksync::surface

#endif  // DECKSYNC_SURFACE_MEDIA_TYPES_HPP_
