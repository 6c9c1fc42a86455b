// Repository: DeckSync
// Component: Playback Surface
// Purpose: State machine around one decode instance: prepare/commit swaps, rate resync, decode recovery.
// Copyright (c) 2025 DeckSync

#ifndef DECKSYNC_SURFACE_PLAYBACK_SURFACE_HPP_
#define DECKSYNC_SURFACE_PLAYBACK_SURFACE_HPP_

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "decksync/runtime/DispatchQueue.h"
#include "decksync/surface/MediaTypes.hpp"
#include "decksync/timeline/DeckTypes.hpp"
#include "decksync/timing/WallClock.h"

namespace decksync::surface {

struct SurfaceConfig {
  // Off-screen instance must reach a playable point within this window.
  double prepare_timeout_s = 10.0;

  // Non-policy play failures: backoff = play_retry_backoff_s * attempt.
  double play_retry_backoff_s = 0.2;
  int max_play_retries = 5;

  // Observed rate within this of the request counts as applied.
  double rate_tolerance = 0.01;
  int max_rate_resync_attempts = 3;
  double rate_nudge_s = 0.001;
  double rate_verify_delay_s = 0.05;

  // Consecutive decode faults are counted while each follows the previous
  // one within recovery_window_s.
  double recovery_window_s = 5.0;
  // Attempts beyond this force the rate to neutral.
  int neutral_rate_after_attempts = 2;
  // Attempts beyond this are terminal.
  int max_recovery_attempts = 5;
  double recovery_backoff_s = 0.25;

  bool loop = true;
};

enum class FaultKind {
  kSourceLoadFailure,
  kDecodeFailure,
  kAutoplayBlocked,
  kRateApplyMismatch,
  kRateForcedNeutral,
};

[[nodiscard]] const char* ToString(FaultKind kind);

// PlaybackSurface renders one deck into its primary container.
//
// States: kIdle -> kLoading -> kReady -> {kPlaying, kPaused}; kBlocked when
// host policy rejects playback (recoverable by a user gesture); kError on a
// fault, left through kLoading when recovery starts; any -> kIdle on Clear().
//
// A new source is always prepared on an off-screen instance (load, wait for
// canplay, play/pause/rewind prime) and then mounted in one step. The
// previous instance keeps rendering until that mount and is disposed only
// after it, so the container never shows a blank frame.
//
// All methods must be called on the dispatch thread. Media events are
// re-posted onto the dispatch queue and matched to the instance they came
// from; events of superseded instances are dropped.
class PlaybackSurface {
 public:
  enum class State {
    kIdle = 0,
    kLoading = 1,
    kReady = 2,
    kPlaying = 3,
    kPaused = 4,
    kBlocked = 5,
    kError = 6,
  };

  struct Callbacks {
    std::function<void(State from, State to)> on_state_changed;
    std::function<void(double duration)> on_duration;
    std::function<void(double time)> on_time_update;
    // nullptr when the surface lost its instance (clear or terminal fault).
    std::function<void(IMediaInstance* primary)> on_primary_replaced;
    // Surfaced faults only; transient ones are retried silently.
    std::function<void(FaultKind kind, const std::string& message)> on_fault;
    // A requested source (not a recovery rebuild) became visible.
    std::function<void(const std::string& src)> on_source_ready;
  };

  struct MetricsSnapshot {
    uint64_t swaps_total = 0;
    uint64_t play_retries_total = 0;
    uint64_t autoplay_blocked_total = 0;
    uint64_t gesture_retries_total = 0;
    uint64_t rate_resyncs_total = 0;
    uint64_t rate_mismatch_total = 0;
    uint64_t rate_forced_neutral_total = 0;
    uint64_t decode_faults_total = 0;
    uint64_t recoveries_started_total = 0;
    uint64_t recoveries_completed_total = 0;
    uint64_t recoveries_abandoned_total = 0;
    uint64_t stalls_total = 0;
    uint64_t stale_events_ignored = 0;
    uint64_t seeks_total = 0;
    State state = State::kIdle;
  };

  PlaybackSurface(timeline::DeckKey deck,
                  std::shared_ptr<IMediaBackend> backend,
                  std::shared_ptr<runtime::DispatchQueue> queue,
                  SurfaceConfig config = {}, Callbacks callbacks = {});
  ~PlaybackSurface();

  PlaybackSurface(const PlaybackSurface&) = delete;
  PlaybackSurface& operator=(const PlaybackSurface&) = delete;

  // nullptr detaches; the instance keeps decoding off-screen.
  void AttachContainer(IRenderContainer* container);

  // Same src without reload is a no-op. nullopt clears the surface.
  void SetSource(const std::optional<std::string>& src, bool reload = false);
  void Clear();

  void Play();
  void Pause();
  void Seek(double seconds);
  // Clamped to [0, 8]. At or below the stop threshold the instance pauses
  // while the play request is remembered.
  void SetRate(double rate);
  void SetVolume(double volume);
  void SetMuted(bool muted);

  // Retries a policy-blocked play exactly once. Returns false when nothing
  // was blocked.
  bool OnUserGesture();

  [[nodiscard]] State state() const { return state_; }
  [[nodiscard]] const std::optional<std::string>& Src() const { return src_; }
  [[nodiscard]] IMediaInstance* Primary() const { return current_.get(); }
  [[nodiscard]] IRenderContainer* Container() const { return container_; }
  [[nodiscard]] bool IsPreparing() const { return pending_ != nullptr; }
  [[nodiscard]] bool IsRecovering() const {
    return recovery_snapshot_.has_value();
  }
  [[nodiscard]] double CurrentTime() const;
  [[nodiscard]] double DesiredRate() const { return desired_rate_; }
  [[nodiscard]] bool DesiredPlaying() const { return desired_playing_; }
  [[nodiscard]] std::optional<double> Duration() const { return duration_; }
  [[nodiscard]] int RecoveryAttempts() const { return recovery_attempts_; }
  [[nodiscard]] const std::string& LastError() const { return last_error_; }
  [[nodiscard]] uint64_t epoch() const { return epoch_; }

  [[nodiscard]] MetricsSnapshot Snapshot() const;

  // locator + "?_ts=<stamp_ms>-<token>" (or "&" when a query exists).
  [[nodiscard]] static std::string CacheBustedLocator(
      const std::string& locator, uint64_t token, double now_s);

 private:
  enum class PendingPhase { kNone, kLoading, kPriming };

  struct RecoverySnapshot {
    double time = 0.0;
    double volume = 1.0;
    bool muted = false;
    double rate = timeline::kNeutralPlayRate;
    bool was_playing = false;
  };

  MediaEventSink MakeSink();
  void OnMediaEvent(const MediaEvent& event);
  void OnPendingEvent(const MediaEvent& event);
  void OnCurrentEvent(const MediaEvent& event);

  void BeginPrepare(const std::string& locator, bool recovery);
  void FinishPriming();
  void Commit();
  void OnPrepareTimeout(uint64_t token);

  void StartPlayback();
  void IssuePlay();
  void OnPlayFailed(const std::string& detail);

  void ApplyRate();
  void VerifyRate();
  void ResyncRate();

  void HandleDecodeFault(const std::string& detail);
  void BeginRecovery();
  void AbandonRecovery();

  void Fail(FaultKind kind, const std::string& message);
  void RaiseFault(FaultKind kind, const std::string& message);
  void ReleaseCurrent();
  void DisposePending();
  void CancelTimer(runtime::DispatchQueue::TimerId& id);
  void CancelTimers();
  void TransitionTo(State next);

  timeline::DeckKey deck_;
  std::shared_ptr<IMediaBackend> backend_;
  std::shared_ptr<runtime::DispatchQueue> queue_;
  SurfaceConfig config_;
  Callbacks callbacks_;

  IRenderContainer* container_ = nullptr;
  std::unique_ptr<IMediaInstance> current_;
  std::unique_ptr<IMediaInstance> pending_;
  PendingPhase pending_phase_ = PendingPhase::kNone;
  bool preparing_recovery_ = false;
  uint64_t load_token_ = 0;
  uint64_t pending_token_ = 0;
  std::optional<double> pending_duration_;

  State state_ = State::kIdle;
  std::optional<std::string> src_;
  // Bumped on every source change; async work captured under an older
  // epoch abandons itself.
  uint64_t epoch_ = 0;
  // Epoch whose source is on current_. on_source_ready fires when an epoch
  // first commits, whether that commit is a plain swap or a recovery.
  uint64_t committed_epoch_ = 0;

  bool desired_playing_ = false;
  double desired_rate_ = timeline::kNeutralPlayRate;
  double volume_ = 1.0;
  bool muted_ = false;
  std::optional<double> pending_seek_;
  std::optional<double> duration_;

  bool awaiting_play_ = false;
  int play_attempts_ = 0;
  bool gesture_armed_ = false;
  int rate_resync_attempts_ = 0;

  int recovery_attempts_ = 0;
  std::optional<double> last_fault_at_;
  std::optional<RecoverySnapshot> recovery_snapshot_;
  uint64_t recovery_epoch_ = 0;
  std::optional<std::string> recovery_src_;

  runtime::DispatchQueue::TimerId prepare_timer_ = 0;
  runtime::DispatchQueue::TimerId play_retry_timer_ = 0;
  runtime::DispatchQueue::TimerId rate_verify_timer_ = 0;
  runtime::DispatchQueue::TimerId recovery_timer_ = 0;

  std::string last_error_;
  MetricsSnapshot metrics_;
};

[[nodiscard]] const char* ToString(PlaybackSurface::State state);

}  // namespace decksync::surface

#endif  // DECKSYNC_SURFACE_PLAYBACK_SURFACE_HPP_
