#ifndef DECKSYNC_TIMING_WALL_CLOCK_H_
#define DECKSYNC_TIMING_WALL_CLOCK_H_

#include <memory>
#include <mutex>

namespace decksync::timing {

// WallClock is the single time reference shared by all decks of one process.
// Timeline extrapolation, dispatch timers and media simulation all read it.
class WallClock {
 public:
  virtual ~WallClock() = default;

  // Returns wall-clock seconds. For the system clock this is seconds since
  // the Unix epoch, so values are comparable across processes.
  [[nodiscard]] virtual double NowSeconds() const = 0;

  // Returns true if this is a manual/test clock. Consumers must not sleep
  // against a fake clock.
  [[nodiscard]] virtual bool is_fake() const { return false; }
};

// Manually driven clock for tests and the standalone harness.
class ManualWallClock : public WallClock {
 public:
  explicit ManualWallClock(double start_s = 0.0) : now_s_(start_s) {}

  [[nodiscard]] double NowSeconds() const override {
    std::lock_guard<std::mutex> lock(mutex_);
    return now_s_;
  }

  [[nodiscard]] bool is_fake() const override { return true; }

  void Set(double now_s) {
    std::lock_guard<std::mutex> lock(mutex_);
    now_s_ = now_s;
  }

  void Advance(double delta_s) {
    std::lock_guard<std::mutex> lock(mutex_);
    now_s_ += delta_s;
  }

 private:
  mutable std::mutex mutex_;
  double now_s_;
};

std::shared_ptr<WallClock> MakeSystemWallClock();

}  // namespace decksync::timing

#endif  // DECKSYNC_TIMING_WALL_CLOCK_H_
