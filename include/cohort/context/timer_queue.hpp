#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <stop_token>
#include <thread>
#include <unordered_map>
#include <utility>

namespace cohort::context {

using clock = std::chrono::steady_clock;

// Runs callbacks at their due time on a single worker thread.
//
// Callbacks run outside the queue lock, in due-time order; callbacks sharing a due time
// run in scheduling order. A cancelled callback that has not started never runs.
class timer_queue {
 public:
  using handle = std::uint64_t;

  timer_queue() : worker_([this](std::stop_token stop) { run(stop); }) {}

  ~timer_queue() {
    worker_.request_stop();
    cv_.notify_all();
  }

  timer_queue(const timer_queue&)            = delete;
  timer_queue& operator=(const timer_queue&) = delete;

  // Process-wide queue used for deadlines. Created on the first deadline and stopped at
  // exit; a scope holding a deadline must not outlive static destruction.
  static timer_queue& shared() {
    static timer_queue queue;
    return queue;
  }

  handle schedule(clock::time_point when, std::function<void()> fn) {
    std::scoped_lock lock(mutex_);
    handle id = ++next_handle_;
    entries_.emplace(std::pair{when, id}, std::move(fn));
    index_.emplace(id, when);
    cv_.notify_all();
    return id;
  }

  // Returns true when the callback was removed before it started.
  bool cancel(handle id) noexcept {
    std::scoped_lock lock(mutex_);
    auto it = index_.find(id);
    if (it == index_.end()) {
      return false;
    }
    entries_.erase(std::pair{it->second, id});
    index_.erase(it);
    return true;
  }

  [[nodiscard]] std::size_t pending() const {
    std::scoped_lock lock(mutex_);
    return entries_.size();
  }

 private:
  void run(std::stop_token stop) {
    std::unique_lock lock(mutex_);
    while (!stop.stop_requested()) {
      if (entries_.empty()) {
        cv_.wait(lock, stop, [this] { return !entries_.empty(); });
        continue;
      }

      auto next = entries_.begin();
      if (clock::now() < next->first.first) {
        auto due = next->first.first;
        cv_.wait_until(lock, stop, due, [this, due] {
          return !entries_.empty() && entries_.begin()->first.first < due;
        });
        continue;
      }

      auto fn = std::move(next->second);
      index_.erase(next->first.second);
      entries_.erase(next);

      lock.unlock();
      fn();
      lock.lock();
    }
  }

  mutable std::mutex                                                    mutex_;
  std::condition_variable_any                                           cv_;
  std::map<std::pair<clock::time_point, handle>, std::function<void()>> entries_;
  std::unordered_map<handle, clock::time_point>                         index_;
  handle                                                                next_handle_{0};
  std::jthread                                                          worker_;
};

}  // namespace cohort::context
