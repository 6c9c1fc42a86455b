// Repository: DeckSync
// Component: Dispatch Queue
// Purpose: Single-consumer task queue with timers; the only place deck state mutates.
// Copyright (c) 2025 DeckSync

#ifndef DECKSYNC_RUNTIME_DISPATCH_QUEUE_H_
#define DECKSYNC_RUNTIME_DISPATCH_QUEUE_H_

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <utility>

#include "decksync/timing/WallClock.h"

namespace decksync::runtime {

// DispatchQueue serializes inbound network messages, media callbacks and
// timers onto one consumer thread. Producers may Post from any thread; tasks
// only ever run on the thread calling RunDue() / Run().
//
// Tasks due at the same instant run in post order. A task may carry an owner
// tag; CancelOwner() drops every queued task of that owner, which is how
// components detach before destruction.
class DispatchQueue {
 public:
  using Task = std::function<void()>;
  using TimerId = uint64_t;

  explicit DispatchQueue(std::shared_ptr<timing::WallClock> clock);

  DispatchQueue(const DispatchQueue&) = delete;
  DispatchQueue& operator=(const DispatchQueue&) = delete;

  TimerId Post(Task task, const void* owner = nullptr);
  TimerId PostDelayed(double delay_s, Task task, const void* owner = nullptr);

  // Returns false if the task already ran or was never queued.
  bool Cancel(TimerId id);
  std::size_t CancelOwner(const void* owner);

  // Runs every task whose due time has been reached, including tasks those
  // tasks post for immediate execution. Returns the number executed.
  std::size_t RunDue();

  // Blocking loop for binaries: waits for the next due time and runs it
  // until Stop() is called.
  void Run();
  void Stop();

  [[nodiscard]] std::size_t PendingCount() const;
  [[nodiscard]] std::optional<double> NextDueTime() const;
  [[nodiscard]] const std::shared_ptr<timing::WallClock>& clock() const {
    return clock_;
  }

 private:
  struct Entry {
    Task task;
    const void* owner = nullptr;
  };
  // (due time, sequence) gives FIFO order among equal due times.
  using Key = std::pair<double, uint64_t>;

  TimerId Enqueue(double due, Task task, const void* owner);

  std::shared_ptr<timing::WallClock> clock_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::map<Key, Entry> entries_;
  std::unordered_map<TimerId, Key> index_;
  uint64_t next_sequence_ = 1;
  std::atomic<bool> stop_requested_{false};
};

}  // namespace decksync::runtime

#endif  // DECKSYNC_RUNTIME_DISPATCH_QUEUE_H_
