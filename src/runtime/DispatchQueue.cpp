// Repository: DeckSync
// Component: Dispatch Queue
// Purpose: Single-consumer task queue with timers; the only place deck state mutates.
// Copyright (c) 2025 DeckSync

#include "decksync/runtime/DispatchQueue.h"

#include <algorithm>
#include <chrono>

namespace decksync::runtime {

namespace {
// Upper bound on one wait in Run(), so Stop() and clock jumps are noticed.
constexpr double kMaxIdleWaitS = 0.05;
}  // namespace

DispatchQueue::DispatchQueue(std::shared_ptr<timing::WallClock> clock)
    : clock_(std::move(clock)) {}

DispatchQueue::TimerId DispatchQueue::Enqueue(double due, Task task,
                                              const void* owner) {
  TimerId id = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    id = next_sequence_++;
    const Key key{due, id};
    entries_.emplace(key, Entry{std::move(task), owner});
    index_.emplace(id, key);
  }
  cv_.notify_one();
  return id;
}

DispatchQueue::TimerId DispatchQueue::Post(Task task, const void* owner) {
  return Enqueue(clock_->NowSeconds(), std::move(task), owner);
}

DispatchQueue::TimerId DispatchQueue::PostDelayed(double delay_s, Task task,
                                                  const void* owner) {
  return Enqueue(clock_->NowSeconds() + std::max(0.0, delay_s),
                 std::move(task), owner);
}

bool DispatchQueue::Cancel(TimerId id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = index_.find(id);
  if (it == index_.end()) {
    return false;
  }
  entries_.erase(it->second);
  index_.erase(it);
  return true;
}

std::size_t DispatchQueue::CancelOwner(const void* owner) {
  if (owner == nullptr) {
    return 0;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t removed = 0;
  for (auto it = entries_.begin(); it != entries_.end();) {
    if (it->second.owner == owner) {
      index_.erase(it->first.second);
      it = entries_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  return removed;
}

std::size_t DispatchQueue::RunDue() {
  std::size_t executed = 0;
  while (true) {
    Task task;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (entries_.empty()) {
        break;
      }
      auto it = entries_.begin();
      if (it->first.first > clock_->NowSeconds()) {
        break;
      }
      task = std::move(it->second.task);
      index_.erase(it->first.second);
      entries_.erase(it);
    }
    if (task) {
      task();
    }
    ++executed;
  }
  return executed;
}

void DispatchQueue::Run() {
  stop_requested_.store(false, std::memory_order_release);
  while (!stop_requested_.load(std::memory_order_acquire)) {
    RunDue();
    std::unique_lock<std::mutex> lock(mutex_);
    double wait_s = kMaxIdleWaitS;
    if (!entries_.empty()) {
      wait_s = std::clamp(entries_.begin()->first.first - clock_->NowSeconds(),
                          0.0, kMaxIdleWaitS);
    }
    if (wait_s > 0.0) {
      // Post() and Stop() notify; the loop re-evaluates after any wakeup.
      cv_.wait_for(lock, std::chrono::microseconds(
                             static_cast<int64_t>(wait_s * 1'000'000.0)));
    }
  }
}

void DispatchQueue::Stop() {
  stop_requested_.store(true, std::memory_order_release);
  cv_.notify_all();
}

std::size_t DispatchQueue::PendingCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

std::optional<double> DispatchQueue::NextDueTime() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (entries_.empty()) {
    return std::nullopt;
  }
  return entries_.begin()->first.first;
}

}  // namespace decksync::runtime
