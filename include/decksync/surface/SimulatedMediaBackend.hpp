// Repository: DeckSync
// Component: Simulated Media Backend
// Purpose: Deterministic decode engine stand-in with fault injection for the harness and tests.
// Copyright (c) 2025 DeckSync

#ifndef DECKSYNC_SURFACE_SIMULATED_MEDIA_BACKEND_HPP_
#define DECKSYNC_SURFACE_SIMULATED_MEDIA_BACKEND_HPP_

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "decksync/runtime/DispatchQueue.h"
#include "decksync/surface/MediaTypes.hpp"

namespace decksync::surface {

struct SimulationKnobs {
  // Delay between Load() and loadedmetadata/canplay.
  double load_latency_s = 0.05;
  double default_duration_s = 60.0;
  // Per-locator durations (keyed by locator without cache-busting query).
  std::map<std::string, double> durations;
  // Locators that fail with kSourceMissing.
  std::set<std::string> missing_sources;
  // Locators starting with any of these cannot share their live output.
  std::set<std::string> unshareable_prefixes;
  // Unmuted Play() is rejected (muted playback stays allowed).
  bool autoplay_blocked = false;
  // The next N Play() calls fail with kPlayFailed.
  int play_failures = 0;
  // The next N non-neutral SetPlaybackRate() calls are silently ignored.
  int ignored_rate_changes = 0;
  // The next N Load() calls never reach canplay.
  int stalled_loads = 0;
};

class SimulatedMediaInstance;

// SimulatedMediaBackend plays media on the dispatch queue's clock. Instances
// derive CurrentTime() from an anchor and their rate, honour looping, and
// report every outcome as a MediaEvent posted through the queue.
class SimulatedMediaBackend : public IMediaBackend {
 public:
  explicit SimulatedMediaBackend(std::shared_ptr<runtime::DispatchQueue> queue,
                                 SimulationKnobs knobs = {});
  ~SimulatedMediaBackend() override;

  SimulatedMediaBackend(const SimulatedMediaBackend&) = delete;
  SimulatedMediaBackend& operator=(const SimulatedMediaBackend&) = delete;

  std::unique_ptr<IMediaInstance> CreateInstance(const std::string& locator,
                                                 MediaEventSink sink) override;
  bool CanShareOutput(const std::string& locator) override;

  [[nodiscard]] SimulationKnobs& knobs() { return knobs_; }

  // Delivers `kind` from a live instance. Returns false if it is gone.
  bool InjectEvent(InstanceId id, MediaEventKind kind,
                   const std::string& detail = {});

  [[nodiscard]] IMediaInstance* Find(InstanceId id) const;
  [[nodiscard]] std::vector<InstanceId> LiveInstances() const;
  [[nodiscard]] std::size_t LiveCount() const { return live_.size(); }
  [[nodiscard]] uint64_t created_total() const { return created_total_; }
  [[nodiscard]] uint64_t share_probes_total() const {
    return share_probes_total_;
  }

  // Locator without the "_ts=" cache-busting parameter.
  [[nodiscard]] static std::string BaseLocator(const std::string& locator);

 private:
  friend class SimulatedMediaInstance;

  void Register(SimulatedMediaInstance* instance);
  void Unregister(InstanceId id);

  std::shared_ptr<runtime::DispatchQueue> queue_;
  SimulationKnobs knobs_;
  std::map<InstanceId, SimulatedMediaInstance*> live_;
  InstanceId next_id_ = 1;
  uint64_t created_total_ = 0;
  uint64_t share_probes_total_ = 0;
};

}  // namespace decksync::surface

#endif  // DECKSYNC_SURFACE_SIMULATED_MEDIA_BACKEND_HPP_
