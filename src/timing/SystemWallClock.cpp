// Repository: DeckSync
// Component: System Wall Clock
// Purpose: WallClock backed by std::chrono::system_clock.
// Copyright (c) 2025 DeckSync

#include <chrono>

#include "decksync/timing/WallClock.h"

namespace decksync::timing {

namespace {

class SystemWallClock : public WallClock {
 public:
  [[nodiscard]] double NowSeconds() const override {
    const auto now = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::microseconds>(now).count() /
           1'000'000.0;
  }
};

}  // namespace

std::shared_ptr<WallClock> MakeSystemWallClock() {
  return std::make_shared<SystemWallClock>();
}

}  // namespace decksync::timing
