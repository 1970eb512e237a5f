#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <map>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

#include "errors.hpp"

namespace cohort::context {

// Tracks concurrently running units of work and keeps the first error any of them
// returns. The bound cancel function is invoked with that error as soon as it is captured
// and again, with the final result, once wait() returns.
//
// Every unit runs on its own thread; there is no bound on concurrency. Cancellation is
// cooperative: a unit that never looks at its scope's done-signal runs to completion.
class task_group {
 public:
  using unit      = std::function<error()>;
  using cancel_fn = std::function<void(error)>;

  enum class phase : std::uint8_t {
    empty,     // nothing spawned yet
    running,   // at least one unit spawned, nobody waiting
    draining,  // wait() entered, units still outstanding
    settled,   // wait() returned; the captured error is frozen
  };

  explicit task_group(cancel_fn cancel = {}) : cancel_(std::move(cancel)) {}

  ~task_group() {
    std::vector<std::thread> threads;
    {
      std::scoped_lock lock(mutex_);
      threads = take_all();
    }
    join(threads);
  }

  task_group(const task_group&)            = delete;
  task_group& operator=(const task_group&) = delete;

  // Starts `task` on a new thread. An empty function is a programming error and throws
  // bad_task without tracking anything. Threads of units that already returned are
  // joined first.
  void spawn(unit task) {
    if (!task) {
      throw bad_task("task_group::spawn: empty task function");
    }

    std::vector<std::thread> reaped;
    {
      std::scoped_lock lock(mutex_);
      reaped = std::exchange(finished_, {});
    }
    join(reaped);

    // The worker cannot complete before its handle is registered: complete() needs mutex_.
    std::scoped_lock lock(mutex_);
    ++outstanding_;
    if (phase_ == phase::empty) {
      phase_ = phase::running;
    }
    try {
      std::thread worker([this, task = std::move(task)]() mutable {
        error result = invoke(task);
        complete(std::move(result));
        // The task's captures may hold the last reference to this group.
        task = nullptr;
      });
      auto id = worker.get_id();
      running_.emplace(id, std::move(worker));
    } catch (...) {
      --outstanding_;
      throw;
    }
  }

  // Blocks until every spawned unit has returned and yields the first captured error.
  // Must not be called from one of the group's own units.
  error wait() {
    std::vector<std::thread> finished;
    error                    result;
    {
      std::unique_lock lock(mutex_);
      if (phase_ == phase::running) {
        phase_ = phase::draining;
      }
      cv_.wait(lock, [this] { return outstanding_ == 0; });
      finished = take_all();
      phase_   = phase::settled;
      result   = error_;
    }

    join(finished);
    if (cancel_) {
      cancel_(result);
    }
    return result;
  }

  [[nodiscard]] error captured() const {
    std::scoped_lock lock(mutex_);
    return error_;
  }

  [[nodiscard]] phase current_phase() const {
    std::scoped_lock lock(mutex_);
    return phase_;
  }

  [[nodiscard]] std::size_t outstanding() const {
    std::scoped_lock lock(mutex_);
    return outstanding_;
  }

  // Thread handles not joined yet: running units plus those finished since the last
  // spawn() or wait().
  [[nodiscard]] std::size_t unjoined() const {
    std::scoped_lock lock(mutex_);
    return running_.size() + finished_.size();
  }

 private:
  static error invoke(unit& task) noexcept {
    try {
      return task();
    } catch (...) {
      return std::current_exception();
    }
  }

  // Caller holds mutex_.
  std::vector<std::thread> take_all() {
    std::vector<std::thread> all = std::exchange(finished_, {});
    all.reserve(all.size() + running_.size());
    for (auto& [id, t] : running_) {
      all.push_back(std::move(t));
    }
    running_.clear();
    return all;
  }

  static void join(std::vector<std::thread>& threads) {
    for (auto& t : threads) {
      if (!t.joinable()) {
        continue;
      }
      if (t.get_id() == std::this_thread::get_id()) {
        t.detach();
      } else {
        t.join();
      }
    }
  }

  void complete(error result) {
    bool first = false;
    if (result) {
      std::scoped_lock lock(mutex_);
      if (!error_ && phase_ != phase::settled) {
        error_ = result;
        first  = true;
      }
    }

    if (first && cancel_) {
      cancel_(result);
    }

    std::scoped_lock lock(mutex_);
    if (auto node = running_.extract(std::this_thread::get_id())) {
      finished_.push_back(std::move(node.mapped()));
    }
    --outstanding_;
    cv_.notify_all();
  }

  mutable std::mutex                     mutex_;
  std::condition_variable                cv_;
  std::map<std::thread::id, std::thread> running_;
  std::vector<std::thread>               finished_;
  std::size_t                            outstanding_ = 0;
  error                                  error_;
  phase                                  phase_ = phase::empty;
  cancel_fn                              cancel_;
};

}  // namespace cohort::context
