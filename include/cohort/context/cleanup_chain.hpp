#pragma once

#include <functional>
#include <mutex>
#include <utility>
#include <vector>

#include "errors.hpp"

namespace cohort::context {

// Cleanup callbacks run once when a scope closes, last pushed first. A callback pushed
// after the chain ran is invoked immediately with the recorded cause.
class cleanup_chain {
 public:
  using callback = std::function<void(error)>;

  cleanup_chain() = default;

  cleanup_chain(const cleanup_chain&)            = delete;
  cleanup_chain& operator=(const cleanup_chain&) = delete;

  void push(callback fn) {
    error cause;
    {
      std::scoped_lock lock(mutex_);
      if (!ran_) {
        callbacks_.push_back(std::move(fn));
        return;
      }
      cause = cause_;
    }
    fn(std::move(cause));
  }

  // Returns false when the chain had already run.
  bool run(error cause) {
    std::vector<callback> callbacks;
    {
      std::scoped_lock lock(mutex_);
      if (ran_) {
        return false;
      }
      ran_      = true;
      cause_    = cause;
      callbacks = std::exchange(callbacks_, {});
    }

    for (auto it = callbacks.rbegin(); it != callbacks.rend(); ++it) {
      (*it)(cause);
    }
    return true;
  }

  [[nodiscard]] bool ran() const {
    std::scoped_lock lock(mutex_);
    return ran_;
  }

 private:
  mutable std::mutex    mutex_;
  std::vector<callback> callbacks_;
  error                 cause_;
  bool                  ran_ = false;
};

}  // namespace cohort::context
