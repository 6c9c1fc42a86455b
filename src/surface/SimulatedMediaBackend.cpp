// Repository: DeckSync
// Component: Simulated Media Backend
// Purpose: Deterministic decode engine stand-in with fault injection for the harness and tests.
// Copyright (c) 2025 DeckSync

#include "decksync/surface/SimulatedMediaBackend.hpp"

#include <algorithm>
#include <cmath>
#include <optional>
#include <sstream>
#include <utility>

#include "decksync/timeline/DeckTypes.hpp"
#include "decksync/util/Logger.hpp"

namespace decksync::surface {

class SimulatedMediaInstance : public IMediaInstance {
 public:
  SimulatedMediaInstance(SimulatedMediaBackend* backend, InstanceId id,
                         std::string locator, MediaEventSink sink)
      : backend_(backend),
        id_(id),
        locator_(std::move(locator)),
        sink_(std::move(sink)) {
    anchor_s_ = Now();
  }

  ~SimulatedMediaInstance() override {
    if (!disposed_) {
      Dispose();
    }
  }

  [[nodiscard]] InstanceId Id() const override { return id_; }
  [[nodiscard]] const std::string& Locator() const override { return locator_; }

  void Load() override {
    if (disposed_) {
      return;
    }
    auto& knobs = backend_->knobs_;
    const std::string base = SimulatedMediaBackend::BaseLocator(locator_);
    if (knobs.stalled_loads > 0) {
      --knobs.stalled_loads;
      return;
    }
    if (knobs.missing_sources.count(base) != 0) {
      EmitLater(knobs.load_latency_s, MediaEventKind::kSourceMissing, 0.0,
                "source not found: " + base);
      return;
    }
    auto it = knobs.durations.find(base);
    const double duration =
        it != knobs.durations.end() ? it->second : knobs.default_duration_s;
    backend_->queue_->PostDelayed(
        knobs.load_latency_s,
        [this, duration] {
          loaded_ = true;
          duration_ = duration;
          Emit(MediaEventKind::kLoadedMetadata, duration);
          Emit(MediaEventKind::kCanPlay);
        },
        this);
  }

  void Play() override {
    if (disposed_) {
      return;
    }
    auto& knobs = backend_->knobs_;
    if (!loaded_) {
      EmitLater(0.0, MediaEventKind::kPlayFailed, 0.0, "not loaded");
      return;
    }
    if (knobs.autoplay_blocked && !muted_) {
      EmitLater(0.0, MediaEventKind::kPlayRejected, 0.0, "NotAllowedError");
      return;
    }
    if (knobs.play_failures > 0) {
      --knobs.play_failures;
      EmitLater(0.0, MediaEventKind::kPlayFailed, 0.0, "simulated failure");
      return;
    }
    Anchor();
    paused_ = false;
    EmitLater(0.0, MediaEventKind::kPlaying);
  }

  void Pause() override {
    if (disposed_) {
      return;
    }
    Anchor();
    if (!paused_) {
      paused_ = true;
      EmitLater(0.0, MediaEventKind::kPaused);
    }
  }

  [[nodiscard]] bool Paused() const override { return paused_; }

  void SetCurrentTime(double seconds) override {
    position_s_ = std::max(0.0, seconds);
    anchor_s_ = Now();
  }

  [[nodiscard]] double CurrentTime() const override {
    double position = position_s_;
    if (!paused_) {
      position += (Now() - anchor_s_) * rate_;
    }
    if (loop_ && duration_ && *duration_ > 0.0) {
      position = std::fmod(position, *duration_);
    }
    return position;
  }

  void SetPlaybackRate(double rate) override {
    auto& knobs = backend_->knobs_;
    if (rate != timeline::kNeutralPlayRate && knobs.ignored_rate_changes > 0) {
      --knobs.ignored_rate_changes;
      return;
    }
    Anchor();
    rate_ = rate;
  }

  [[nodiscard]] double PlaybackRate() const override { return rate_; }

  void SetVolume(double volume) override { volume_ = volume; }
  [[nodiscard]] double Volume() const override { return volume_; }
  void SetMuted(bool muted) override { muted_ = muted; }
  [[nodiscard]] bool Muted() const override { return muted_; }
  void SetLoop(bool loop) override { loop_ = loop; }

  [[nodiscard]] std::optional<double> Duration() const override {
    return duration_;
  }

  void Dispose() override {
    if (disposed_) {
      return;
    }
    disposed_ = true;
    backend_->queue_->CancelOwner(this);
    backend_->Unregister(id_);
  }

  void Inject(MediaEventKind kind, const std::string& detail) {
    EmitLater(0.0, kind, 0.0, detail);
  }

 private:
  [[nodiscard]] double Now() const {
    return backend_->queue_->clock()->NowSeconds();
  }

  void Anchor() {
    position_s_ = CurrentTime();
    anchor_s_ = Now();
  }

  void Emit(MediaEventKind kind, double value = 0.0,
            const std::string& detail = {}) {
    if (disposed_ || !sink_) {
      return;
    }
    sink_(MediaEvent{id_, kind, value, detail});
  }

  void EmitLater(double delay_s, MediaEventKind kind, double value = 0.0,
                 std::string detail = {}) {
    backend_->queue_->PostDelayed(
        delay_s,
        [this, kind, value, detail = std::move(detail)] {
          Emit(kind, value, detail);
        },
        this);
  }

  SimulatedMediaBackend* backend_;
  InstanceId id_;
  std::string locator_;
  MediaEventSink sink_;

  bool loaded_ = false;
  bool disposed_ = false;
  bool paused_ = true;
  bool loop_ = false;
  bool muted_ = false;
  double volume_ = 1.0;
  double rate_ = timeline::kNeutralPlayRate;
  double position_s_ = 0.0;
  double anchor_s_ = 0.0;
  std::optional<double> duration_;
};

SimulatedMediaBackend::SimulatedMediaBackend(
    std::shared_ptr<runtime::DispatchQueue> queue, SimulationKnobs knobs)
    : queue_(std::move(queue)), knobs_(std::move(knobs)) {}

SimulatedMediaBackend::~SimulatedMediaBackend() {
  if (!live_.empty()) {
    std::ostringstream oss;
    oss << "[SimulatedMediaBackend] LEAKED_INSTANCES count=" << live_.size();
    util::Logger::Warn(oss.str());
  }
}

std::string SimulatedMediaBackend::BaseLocator(const std::string& locator) {
  const std::size_t query = locator.find("_ts=");
  if (query == std::string::npos || query == 0) {
    return locator;
  }
  const char separator = locator[query - 1];
  if (separator != '?' && separator != '&') {
    return locator;
  }
  std::size_t end = locator.find('&', query);
  std::string base = locator.substr(0, query - 1);
  if (end != std::string::npos) {
    base += separator;
    base += locator.substr(end + 1);
  }
  return base;
}

std::unique_ptr<IMediaInstance> SimulatedMediaBackend::CreateInstance(
    const std::string& locator, MediaEventSink sink) {
  auto instance = std::make_unique<SimulatedMediaInstance>(
      this, next_id_++, locator, std::move(sink));
  Register(instance.get());
  ++created_total_;
  return instance;
}

bool SimulatedMediaBackend::CanShareOutput(const std::string& locator) {
  ++share_probes_total_;
  for (const auto& prefix : knobs_.unshareable_prefixes) {
    if (locator.compare(0, prefix.size(), prefix) == 0) {
      return false;
    }
  }
  return true;
}

bool SimulatedMediaBackend::InjectEvent(InstanceId id, MediaEventKind kind,
                                        const std::string& detail) {
  auto it = live_.find(id);
  if (it == live_.end()) {
    return false;
  }
  it->second->Inject(kind, detail);
  return true;
}

IMediaInstance* SimulatedMediaBackend::Find(InstanceId id) const {
  auto it = live_.find(id);
  return it == live_.end() ? nullptr : it->second;
}

std::vector<InstanceId> SimulatedMediaBackend::LiveInstances() const {
  std::vector<InstanceId> ids;
  ids.reserve(live_.size());
  for (const auto& [id, instance] : live_) {
    ids.push_back(id);
  }
  return ids;
}

void SimulatedMediaBackend::Register(SimulatedMediaInstance* instance) {
  live_[instance->Id()] = instance;
}

void SimulatedMediaBackend::Unregister(InstanceId id) { live_.erase(id); }

}  // namespace decksync::surface
