#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <utility>
#include <vector>

namespace perpsim {

// -----------------------------------------------------------------------------
// ThreadSafeQueue<T>
// -----------------------------------------------------------------------------
// Responsibility: FIFO hand-off between one thread that must never wait and
// one that drains at its own pace.
//
// In perpsim the tick thread pushes telemetry events and the IpcServer
// thread drains them onto its PUB socket in batches. If nobody drains (IPC
// thread stalled on a slow handler), the queue holds at most `capacity`
// items and push() discards the oldest one to make room: a status client
// wants the latest state, not a backlog.
//
// capacity == 0 means unbounded.
//
// Consumers poll with drain(); nothing blocks waiting for items.
//
// Thread model: Any number of producers and consumers.
// -----------------------------------------------------------------------------
template <typename T>
class ThreadSafeQueue {
 public:
  explicit ThreadSafeQueue(std::size_t capacity = 0) : capacity_(capacity) {}

  ThreadSafeQueue(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue(ThreadSafeQueue&&) = delete;
  ThreadSafeQueue& operator=(ThreadSafeQueue&&) = delete;

  // @return false if the queue was full and its oldest item was discarded.
  bool push(T value) {
    std::lock_guard lock(mutex_);
    bool kept_all = true;
    if (capacity_ != 0 && queue_.size() >= capacity_) {
      queue_.pop_front();
      ++dropped_;
      kept_all = false;
    }
    queue_.push_back(std::move(value));
    return kept_all;
  }

  // Removes up to `max_items` (all of them if 0) in FIFO order under a
  // single lock.
  std::vector<T> drain(std::size_t max_items = 0) {
    std::lock_guard lock(mutex_);
    std::size_t n = queue_.size();
    if (max_items != 0 && max_items < n) {
      n = max_items;
    }
    std::vector<T> out;
    out.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
      out.push_back(std::move(queue_.front()));
      queue_.pop_front();
    }
    return out;
  }

  bool empty() const {
    std::lock_guard lock(mutex_);
    return queue_.empty();
  }

  std::size_t size() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
  }

  std::size_t capacity() const { return capacity_; }

  // Items discarded by push() since construction.
  std::uint64_t dropped() const {
    std::lock_guard lock(mutex_);
    return dropped_;
  }

 private:
  const std::size_t capacity_;
  mutable std::mutex mutex_;
  std::deque<T> queue_;
  std::uint64_t dropped_{0};
};

}  // namespace perpsim
