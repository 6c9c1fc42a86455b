// Repository: DeckSync
// Component: Playback Surface
// Purpose: State machine around one decode instance: prepare/commit swaps, rate resync, decode recovery.
// Copyright (c) 2025 DeckSync

#include "decksync/surface/PlaybackSurface.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <utility>

#include "decksync/util/Logger.hpp"

namespace decksync::surface {

using timeline::IsEffectivelyStopped;
using timeline::kNeutralPlayRate;

const char* ToString(FaultKind kind) {
  switch (kind) {
    case FaultKind::kSourceLoadFailure:
      return "SourceLoadFailure";
    case FaultKind::kDecodeFailure:
      return "DecodeFailure";
    case FaultKind::kAutoplayBlocked:
      return "AutoplayBlocked";
    case FaultKind::kRateApplyMismatch:
      return "RateApplyMismatch";
    case FaultKind::kRateForcedNeutral:
      return "RateForcedNeutral";
  }
  return "Unknown";
}

const char* ToString(PlaybackSurface::State state) {
  switch (state) {
    case PlaybackSurface::State::kIdle:
      return "idle";
    case PlaybackSurface::State::kLoading:
      return "loading";
    case PlaybackSurface::State::kReady:
      return "ready";
    case PlaybackSurface::State::kPlaying:
      return "playing";
    case PlaybackSurface::State::kPaused:
      return "paused";
    case PlaybackSurface::State::kBlocked:
      return "blocked";
    case PlaybackSurface::State::kError:
      return "error";
  }
  return "unknown";
}

PlaybackSurface::PlaybackSurface(timeline::DeckKey deck,
                                 std::shared_ptr<IMediaBackend> backend,
                                 std::shared_ptr<runtime::DispatchQueue> queue,
                                 SurfaceConfig config, Callbacks callbacks)
    : deck_(deck),
      backend_(std::move(backend)),
      queue_(std::move(queue)),
      config_(config),
      callbacks_(std::move(callbacks)) {}

PlaybackSurface::~PlaybackSurface() {
  queue_->CancelOwner(this);
  DisposePending();
  if (container_ != nullptr && container_->Mounted() == current_.get()) {
    container_->Unmount();
  }
  if (current_) {
    current_->Dispose();
    current_.reset();
  }
}

std::string PlaybackSurface::CacheBustedLocator(const std::string& locator,
                                                uint64_t token, double now_s) {
  std::ostringstream oss;
  oss << locator << (locator.find('?') == std::string::npos ? '?' : '&')
      << "_ts=" << static_cast<int64_t>(now_s * 1000.0) << "-" << token;
  return oss.str();
}

// ---------------------------------------------------------------------------
// Host-facing operations
// ---------------------------------------------------------------------------

void PlaybackSurface::AttachContainer(IRenderContainer* container) {
  if (container_ == container) {
    return;
  }
  if (container_ != nullptr && current_ &&
      container_->Mounted() == current_.get()) {
    container_->Unmount();
  }
  container_ = container;
  if (container_ != nullptr && current_) {
    container_->Mount(current_.get());
  }
}

void PlaybackSurface::SetSource(const std::optional<std::string>& src,
                                bool reload) {
  if (src == src_ && !reload) {
    return;
  }
  if (!src) {
    Clear();
    return;
  }

  ++epoch_;
  src_ = src;
  AbandonRecovery();
  recovery_attempts_ = 0;
  last_fault_at_.reset();
  rate_resync_attempts_ = 0;
  pending_seek_.reset();
  duration_.reset();
  gesture_armed_ = false;

  std::ostringstream oss;
  oss << "[PlaybackSurface] SOURCE_REQUESTED deck=" << timeline::ToString(deck_)
      << " src=" << *src_ << " reload=" << (reload ? 1 : 0)
      << " epoch=" << epoch_;
  util::Logger::Info(oss.str());

  BeginPrepare(*src_, /*recovery=*/false);
}

void PlaybackSurface::Clear() {
  ++epoch_;
  src_.reset();
  CancelTimers();
  DisposePending();
  recovery_snapshot_.reset();
  recovery_attempts_ = 0;
  last_fault_at_.reset();
  pending_seek_.reset();
  duration_.reset();
  awaiting_play_ = false;
  gesture_armed_ = false;
  ReleaseCurrent();
  TransitionTo(State::kIdle);
}

void PlaybackSurface::Play() {
  desired_playing_ = true;
  if (!current_ || pending_phase_ != PendingPhase::kNone) {
    // Applied at commit.
    return;
  }
  if (state_ == State::kBlocked || state_ == State::kError ||
      state_ == State::kPlaying || awaiting_play_ || play_retry_timer_ != 0) {
    return;
  }
  StartPlayback();
}

void PlaybackSurface::Pause() {
  const bool was_desired = desired_playing_;
  desired_playing_ = false;
  gesture_armed_ = false;
  CancelTimer(play_retry_timer_);
  awaiting_play_ = false;
  if (!current_) {
    return;
  }
  if (!was_desired && current_->Paused() && state_ != State::kPlaying) {
    return;
  }
  current_->Pause();
  if (pending_phase_ == PendingPhase::kNone &&
      (state_ == State::kReady || state_ == State::kPlaying ||
       state_ == State::kBlocked)) {
    TransitionTo(State::kPaused);
  }
}

void PlaybackSurface::Seek(double seconds) {
  const double target = std::max(0.0, seconds);
  if (recovery_snapshot_) {
    recovery_snapshot_->time = target;
  }
  if (!current_ || pending_phase_ != PendingPhase::kNone) {
    pending_seek_ = target;
    return;
  }
  current_->SetCurrentTime(target);
  ++metrics_.seeks_total;
}

void PlaybackSurface::SetRate(double rate) {
  const double clamped = timeline::ClampPlayRate(rate);
  if (std::abs(clamped - desired_rate_) < 1e-9) {
    return;
  }
  desired_rate_ = clamped;
  if (recovery_snapshot_) {
    recovery_snapshot_->rate = clamped;
  }
  if (!current_ || pending_phase_ != PendingPhase::kNone) {
    return;
  }
  ApplyRate();
}

void PlaybackSurface::SetVolume(double volume) {
  volume_ = std::clamp(volume, 0.0, 1.0);
  if (current_) {
    current_->SetVolume(volume_);
  }
}

void PlaybackSurface::SetMuted(bool muted) {
  muted_ = muted;
  if (current_) {
    current_->SetMuted(muted_);
  }
}

bool PlaybackSurface::OnUserGesture() {
  if (state_ != State::kBlocked || !gesture_armed_ || !current_) {
    return false;
  }
  gesture_armed_ = false;
  ++metrics_.gesture_retries_total;
  std::ostringstream oss;
  oss << "[PlaybackSurface] GESTURE_RETRY deck=" << timeline::ToString(deck_);
  util::Logger::Info(oss.str());
  IssuePlay();
  return true;
}

double PlaybackSurface::CurrentTime() const {
  if (current_) {
    return current_->CurrentTime();
  }
  return pending_seek_.value_or(0.0);
}

PlaybackSurface::MetricsSnapshot PlaybackSurface::Snapshot() const {
  MetricsSnapshot snapshot = metrics_;
  snapshot.state = state_;
  return snapshot;
}

// ---------------------------------------------------------------------------
// Media events
// ---------------------------------------------------------------------------

MediaEventSink PlaybackSurface::MakeSink() {
  auto queue = queue_;
  return [queue, this](const MediaEvent& event) {
    queue->Post([this, event] { OnMediaEvent(event); }, this);
  };
}

void PlaybackSurface::OnMediaEvent(const MediaEvent& event) {
  if (pending_ && event.instance == pending_->Id()) {
    OnPendingEvent(event);
    return;
  }
  if (current_ && event.instance == current_->Id()) {
    OnCurrentEvent(event);
    return;
  }
  ++metrics_.stale_events_ignored;
}

void PlaybackSurface::OnPendingEvent(const MediaEvent& event) {
  switch (event.kind) {
    case MediaEventKind::kLoadedMetadata:
      pending_duration_ = event.value;
      break;
    case MediaEventKind::kCanPlay:
      if (pending_phase_ == PendingPhase::kLoading) {
        pending_phase_ = PendingPhase::kPriming;
        pending_->Play();
      }
      break;
    case MediaEventKind::kPlaying:
    case MediaEventKind::kPlayRejected:
    case MediaEventKind::kPlayFailed:
      // Pre-roll outcome does not matter; playback is retried after commit.
      if (pending_phase_ == PendingPhase::kPriming) {
        FinishPriming();
      }
      break;
    case MediaEventKind::kDecodeError:
      DisposePending();
      HandleDecodeFault(event.detail.empty() ? "decode error while preparing"
                                             : event.detail);
      break;
    case MediaEventKind::kSourceMissing:
      Fail(FaultKind::kSourceLoadFailure,
           event.detail.empty() ? "source could not be resolved"
                                : event.detail);
      break;
    default:
      break;
  }
}

void PlaybackSurface::OnCurrentEvent(const MediaEvent& event) {
  switch (event.kind) {
    case MediaEventKind::kPlaying:
      awaiting_play_ = false;
      play_attempts_ = 0;
      if (!desired_playing_ || IsEffectivelyStopped(desired_rate_)) {
        current_->Pause();
        if (pending_phase_ == PendingPhase::kNone && state_ != State::kError) {
          TransitionTo(State::kPaused);
        }
      } else if (pending_phase_ == PendingPhase::kNone &&
                 state_ != State::kError) {
        TransitionTo(State::kPlaying);
      }
      break;
    case MediaEventKind::kPlayRejected:
      awaiting_play_ = false;
      if (!desired_playing_) {
        break;
      }
      gesture_armed_ = true;
      ++metrics_.autoplay_blocked_total;
      if (pending_phase_ == PendingPhase::kNone) {
        TransitionTo(State::kBlocked);
      }
      RaiseFault(FaultKind::kAutoplayBlocked,
                 "playback start rejected by host policy");
      break;
    case MediaEventKind::kPlayFailed:
      awaiting_play_ = false;
      if (desired_playing_) {
        OnPlayFailed(event.detail);
      }
      break;
    case MediaEventKind::kLoadedMetadata:
      duration_ = event.value;
      if (callbacks_.on_duration) {
        callbacks_.on_duration(event.value);
      }
      break;
    case MediaEventKind::kTimeUpdate:
      if (callbacks_.on_time_update) {
        callbacks_.on_time_update(event.value);
      }
      break;
    case MediaEventKind::kWaiting:
      ++metrics_.stalls_total;
      {
        std::ostringstream oss;
        oss << "[PlaybackSurface] STALL deck=" << timeline::ToString(deck_)
            << " time=" << current_->CurrentTime();
        util::Logger::Debug(oss.str());
      }
      break;
    case MediaEventKind::kEnded:
      if (!config_.loop) {
        desired_playing_ = false;
        TransitionTo(State::kPaused);
      }
      break;
    case MediaEventKind::kDecodeError:
      if (recovery_snapshot_) {
        // Already rebuilding; the faulted instance is only kept on screen.
        ++metrics_.stale_events_ignored;
        break;
      }
      HandleDecodeFault(event.detail.empty() ? "decode error" : event.detail);
      break;
    case MediaEventKind::kSourceMissing:
      Fail(FaultKind::kSourceLoadFailure,
           event.detail.empty() ? "source disappeared" : event.detail);
      break;
    case MediaEventKind::kCanPlay:
    case MediaEventKind::kPaused:
      break;
  }
}

// ---------------------------------------------------------------------------
// Prepare / commit
// ---------------------------------------------------------------------------

void PlaybackSurface::BeginPrepare(const std::string& locator, bool recovery) {
  CancelTimer(prepare_timer_);
  DisposePending();

  const uint64_t token = ++load_token_;
  pending_ = backend_->CreateInstance(locator, MakeSink());
  if (!pending_) {
    Fail(FaultKind::kSourceLoadFailure, "backend refused locator " + locator);
    return;
  }
  pending_token_ = token;
  pending_phase_ = PendingPhase::kLoading;
  preparing_recovery_ = recovery;
  pending_duration_.reset();

  pending_->SetLoop(config_.loop);
  // Priming plays briefly; keep it silent.
  pending_->SetMuted(true);
  pending_->Load();

  prepare_timer_ = queue_->PostDelayed(
      config_.prepare_timeout_s, [this, token] { OnPrepareTimeout(token); },
      this);
  TransitionTo(State::kLoading);
}

void PlaybackSurface::FinishPriming() {
  pending_->Pause();
  pending_->SetCurrentTime(0.0);
  Commit();
}

void PlaybackSurface::Commit() {
  CancelTimer(prepare_timer_);
  const bool was_recovery = preparing_recovery_;
  std::unique_ptr<IMediaInstance> previous = std::move(current_);
  current_ = std::move(pending_);
  pending_phase_ = PendingPhase::kNone;
  preparing_recovery_ = false;

  double start_time = pending_seek_.value_or(0.0);
  double volume = volume_;
  bool muted = muted_;
  bool resume = desired_playing_;
  if (was_recovery && recovery_snapshot_) {
    if (!pending_seek_) {
      start_time = recovery_snapshot_->time;
    }
    volume = recovery_snapshot_->volume;
    muted = recovery_snapshot_->muted;
    resume = recovery_snapshot_->was_playing && desired_playing_;
  }
  pending_seek_.reset();

  current_->SetVolume(volume);
  current_->SetMuted(muted);
  current_->SetCurrentTime(start_time);
  current_->SetPlaybackRate(
      IsEffectivelyStopped(desired_rate_) ? kNeutralPlayRate : desired_rate_);

  // One-step substitution: the container goes from the old instance straight
  // to the new one.
  if (container_ != nullptr) {
    container_->Mount(current_.get());
  }
  ++metrics_.swaps_total;
  if (callbacks_.on_primary_replaced) {
    callbacks_.on_primary_replaced(current_.get());
  }
  if (previous) {
    previous->Dispose();
    previous.reset();
  }

  if (was_recovery) {
    ++metrics_.recoveries_completed_total;
    recovery_snapshot_.reset();
  }

  duration_ = pending_duration_ ? pending_duration_ : current_->Duration();
  pending_duration_.reset();

  {
    std::ostringstream oss;
    oss << "[PlaybackSurface] SWAP_COMMITTED deck="
        << timeline::ToString(deck_) << " locator=" << current_->Locator()
        << " recovery=" << (was_recovery ? 1 : 0) << " time=" << start_time;
    util::Logger::Info(oss.str());
  }

  TransitionTo(State::kReady);
  if (duration_ && callbacks_.on_duration) {
    callbacks_.on_duration(*duration_);
  }
  const bool first_commit = committed_epoch_ != epoch_;
  committed_epoch_ = epoch_;
  if (first_commit && src_ && callbacks_.on_source_ready) {
    callbacks_.on_source_ready(*src_);
  }

  rate_resync_attempts_ = 0;
  VerifyRate();
  if (resume && !IsEffectivelyStopped(desired_rate_)) {
    StartPlayback();
  } else if (!desired_playing_ || IsEffectivelyStopped(desired_rate_)) {
    TransitionTo(State::kPaused);
  }
}

void PlaybackSurface::OnPrepareTimeout(uint64_t token) {
  prepare_timer_ = 0;
  if (!pending_ || token != pending_token_) {
    return;
  }
  std::ostringstream oss;
  oss << "prepare timed out after " << config_.prepare_timeout_s << "s";
  if (preparing_recovery_) {
    DisposePending();
    HandleDecodeFault(oss.str());
    return;
  }
  Fail(FaultKind::kSourceLoadFailure, oss.str());
}

// ---------------------------------------------------------------------------
// Playback start
// ---------------------------------------------------------------------------

void PlaybackSurface::StartPlayback() {
  if (!current_) {
    return;
  }
  CancelTimer(play_retry_timer_);
  play_attempts_ = 0;
  if (IsEffectivelyStopped(desired_rate_)) {
    current_->Pause();
    TransitionTo(State::kPaused);
    return;
  }
  IssuePlay();
}

void PlaybackSurface::IssuePlay() {
  awaiting_play_ = true;
  current_->Play();
}

void PlaybackSurface::OnPlayFailed(const std::string& detail) {
  ++play_attempts_;
  if (play_attempts_ > config_.max_play_retries) {
    play_attempts_ = 0;
    HandleDecodeFault("play failed after retries: " + detail);
    return;
  }
  const double delay = config_.play_retry_backoff_s * play_attempts_;
  std::ostringstream oss;
  oss << "[PlaybackSurface] PLAY_RETRY_SCHEDULED deck="
      << timeline::ToString(deck_) << " attempt=" << play_attempts_
      << " delay_s=" << delay << " reason=" << detail;
  util::Logger::Warn(oss.str());

  const uint64_t epoch = epoch_;
  const InstanceId instance = current_->Id();
  CancelTimer(play_retry_timer_);
  play_retry_timer_ = queue_->PostDelayed(
      delay,
      [this, epoch, instance] {
        play_retry_timer_ = 0;
        if (epoch != epoch_ || !current_ || current_->Id() != instance ||
            !desired_playing_) {
          return;
        }
        ++metrics_.play_retries_total;
        IssuePlay();
      },
      this);
}

// ---------------------------------------------------------------------------
// Rate
// ---------------------------------------------------------------------------

void PlaybackSurface::ApplyRate() {
  if (IsEffectivelyStopped(desired_rate_)) {
    CancelTimer(rate_verify_timer_);
    current_->Pause();
    if (state_ == State::kPlaying || state_ == State::kReady) {
      TransitionTo(State::kPaused);
    }
    return;
  }
  current_->SetPlaybackRate(desired_rate_);
  rate_resync_attempts_ = 0;
  VerifyRate();
  if (desired_playing_ && state_ == State::kPaused && !awaiting_play_) {
    StartPlayback();
  }
}

void PlaybackSurface::VerifyRate() {
  CancelTimer(rate_verify_timer_);
  if (!current_ || IsEffectivelyStopped(desired_rate_)) {
    return;
  }
  const double observed = current_->PlaybackRate();
  if (std::abs(observed - desired_rate_) <= config_.rate_tolerance) {
    rate_resync_attempts_ = 0;
    return;
  }
  if (rate_resync_attempts_ >= config_.max_rate_resync_attempts) {
    rate_resync_attempts_ = 0;
    ++metrics_.rate_mismatch_total;
    std::ostringstream oss;
    oss << "observed rate " << observed << " after requesting "
        << desired_rate_;
    RaiseFault(FaultKind::kRateApplyMismatch, oss.str());
    return;
  }

  ++rate_resync_attempts_;
  ++metrics_.rate_resyncs_total;
  {
    std::ostringstream oss;
    oss << "[PlaybackSurface] RATE_RESYNC deck=" << timeline::ToString(deck_)
        << " attempt=" << rate_resync_attempts_ << " requested="
        << desired_rate_ << " observed=" << observed;
    util::Logger::Debug(oss.str());
  }
  ResyncRate();

  const InstanceId instance = current_->Id();
  rate_verify_timer_ = queue_->PostDelayed(
      config_.rate_verify_delay_s,
      [this, instance] {
        rate_verify_timer_ = 0;
        if (current_ && current_->Id() == instance) {
          VerifyRate();
        }
      },
      this);
}

void PlaybackSurface::ResyncRate() {
  const bool was_playing = !current_->Paused();
  const double time = current_->CurrentTime();
  if (was_playing) {
    current_->Pause();
  }
  current_->SetPlaybackRate(kNeutralPlayRate);
  // Sub-frame nudge forces the engine to rebuild its playback state.
  current_->SetCurrentTime(std::max(0.0, time - config_.rate_nudge_s));
  current_->SetCurrentTime(time);
  current_->SetPlaybackRate(desired_rate_);
  if (was_playing) {
    current_->Play();
  }
}

// ---------------------------------------------------------------------------
// Decode recovery
// ---------------------------------------------------------------------------

void PlaybackSurface::HandleDecodeFault(const std::string& detail) {
  const double now = queue_->clock()->NowSeconds();
  ++metrics_.decode_faults_total;
  if (!last_fault_at_ || now - *last_fault_at_ > config_.recovery_window_s) {
    recovery_attempts_ = 0;
  }
  last_fault_at_ = now;
  ++recovery_attempts_;

  {
    std::ostringstream oss;
    oss << "[PlaybackSurface] DECODE_FAULT deck=" << timeline::ToString(deck_)
        << " attempt=" << recovery_attempts_ << " reason=" << detail;
    util::Logger::Warn(oss.str());
  }

  if (recovery_attempts_ > config_.max_recovery_attempts) {
    std::ostringstream oss;
    oss << "decode recovery exhausted after " << config_.max_recovery_attempts
        << " attempts: " << detail;
    Fail(FaultKind::kDecodeFailure, oss.str());
    return;
  }

  if (!recovery_snapshot_) {
    RecoverySnapshot snapshot;
    // current_ may still show the previous source while the new one was
    // preparing; only an instance of the current epoch has a usable position.
    if (current_ && committed_epoch_ == epoch_) {
      snapshot.time = current_->CurrentTime();
      snapshot.volume = current_->Volume();
      snapshot.muted = current_->Muted();
    } else {
      snapshot.time = pending_seek_.value_or(0.0);
      snapshot.volume = volume_;
      snapshot.muted = muted_;
    }
    snapshot.rate = desired_rate_;
    snapshot.was_playing = desired_playing_;
    recovery_snapshot_ = snapshot;
  }

  if (recovery_attempts_ > config_.neutral_rate_after_attempts) {
    desired_rate_ = kNeutralPlayRate;
    recovery_snapshot_->rate = kNeutralPlayRate;
    if (recovery_attempts_ == config_.neutral_rate_after_attempts + 1) {
      ++metrics_.rate_forced_neutral_total;
      RaiseFault(FaultKind::kRateForcedNeutral,
                 "repeated decode faults; playback rate forced to 1.0");
    }
  }

  DisposePending();
  pending_phase_ = PendingPhase::kNone;
  preparing_recovery_ = false;
  CancelTimer(prepare_timer_);
  CancelTimer(play_retry_timer_);
  CancelTimer(rate_verify_timer_);
  awaiting_play_ = false;

  recovery_epoch_ = epoch_;
  recovery_src_ = src_;
  TransitionTo(State::kError);

  CancelTimer(recovery_timer_);
  recovery_timer_ = queue_->PostDelayed(
      config_.recovery_backoff_s * recovery_attempts_,
      [this] {
        recovery_timer_ = 0;
        BeginRecovery();
      },
      this);
}

void PlaybackSurface::BeginRecovery() {
  if (recovery_epoch_ != epoch_ || recovery_src_ != src_ || !src_) {
    ++metrics_.recoveries_abandoned_total;
    recovery_snapshot_.reset();
    std::ostringstream oss;
    oss << "[PlaybackSurface] RECOVERY_ABANDONED deck="
        << timeline::ToString(deck_) << " captured_epoch=" << recovery_epoch_
        << " epoch=" << epoch_;
    util::Logger::Info(oss.str());
    return;
  }
  ++metrics_.recoveries_started_total;
  const std::string locator = CacheBustedLocator(
      *src_, load_token_ + 1, queue_->clock()->NowSeconds());
  // The faulted instance stays mounted until the rebuilt one commits.
  BeginPrepare(locator, /*recovery=*/true);
}

void PlaybackSurface::AbandonRecovery() {
  if (recovery_timer_ != 0 || recovery_snapshot_) {
    ++metrics_.recoveries_abandoned_total;
  }
  CancelTimer(recovery_timer_);
  recovery_snapshot_.reset();
  recovery_src_.reset();
}

// ---------------------------------------------------------------------------
// Faults and teardown
// ---------------------------------------------------------------------------

void PlaybackSurface::Fail(FaultKind kind, const std::string& message) {
  CancelTimers();
  DisposePending();
  recovery_snapshot_.reset();
  awaiting_play_ = false;
  gesture_armed_ = false;
  ReleaseCurrent();
  last_error_ = message;

  std::ostringstream oss;
  oss << "[PlaybackSurface] FAULT deck=" << timeline::ToString(deck_)
      << " kind=" << ToString(kind) << " reason=" << message;
  util::Logger::Error(oss.str());

  TransitionTo(State::kError);
  RaiseFault(kind, message);
}

void PlaybackSurface::RaiseFault(FaultKind kind, const std::string& message) {
  if (callbacks_.on_fault) {
    callbacks_.on_fault(kind, message);
  }
}

void PlaybackSurface::ReleaseCurrent() {
  if (!current_) {
    return;
  }
  std::unique_ptr<IMediaInstance> released = std::move(current_);
  if (container_ != nullptr && container_->Mounted() == released.get()) {
    container_->Unmount();
  }
  // Mirrors detach before the instance they may be showing goes away.
  if (callbacks_.on_primary_replaced) {
    callbacks_.on_primary_replaced(nullptr);
  }
  released->Dispose();
}

void PlaybackSurface::DisposePending() {
  if (pending_) {
    pending_->Dispose();
    pending_.reset();
  }
  pending_phase_ = PendingPhase::kNone;
  pending_duration_.reset();
}

void PlaybackSurface::CancelTimer(runtime::DispatchQueue::TimerId& id) {
  if (id != 0) {
    queue_->Cancel(id);
    id = 0;
  }
}

void PlaybackSurface::CancelTimers() {
  CancelTimer(prepare_timer_);
  CancelTimer(play_retry_timer_);
  CancelTimer(rate_verify_timer_);
  CancelTimer(recovery_timer_);
}

void PlaybackSurface::TransitionTo(State next) {
  if (state_ == next) {
    return;
  }
  const State previous = state_;
  state_ = next;
  std::ostringstream oss;
  oss << "[PlaybackSurface] STATE deck=" << timeline::ToString(deck_)
      << " from=" << ToString(previous) << " to=" << ToString(next);
  util::Logger::Debug(oss.str());
  if (callbacks_.on_state_changed) {
    callbacks_.on_state_changed(previous, next);
  }
}

}  // namespace decksync::surface
