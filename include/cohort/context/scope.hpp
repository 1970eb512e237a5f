#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <thread>
#include <utility>

#include "cleanup_chain.hpp"
#include "conditional.hpp"
#include "errors.hpp"
#include "labels.hpp"
#include "source.hpp"
#include "task_group.hpp"
#include "value_store.hpp"

namespace cohort::context {

using cancel_fn = std::function<void(error)>;

namespace __scope {

struct state {
  state(source src, cancel_fn cancel, std::shared_ptr<task_group> group,
        std::shared_ptr<value_store> values)
      : src_(std::move(src)),
        cancel_(std::move(cancel)),
        group_(std::move(group)),
        values_(std::move(values)) {}

  state(const state&)            = delete;
  state& operator=(const state&) = delete;

  [[nodiscard]] source current() const {
    std::scoped_lock lock(mutex_);
    return src_;
  }

  [[nodiscard]] cancel_fn base_cancel() const {
    std::scoped_lock lock(mutex_);
    return cancel_;
  }

  // Runs the cleanup chain when `src` closes, whatever closed it.
  void attach(const source& src) {
    std::scoped_lock lock(link_mutex_);
    chain_link_.reset();
    chain_link_.emplace(src.token(), [this, src] { chain_.run(src.cause()); });
  }

  mutable std::mutex           mutex_;
  source                       src_;
  cancel_fn                    cancel_;
  cleanup_chain                chain_;
  std::shared_ptr<task_group>  group_;
  std::shared_ptr<value_store> values_;

  std::mutex                                              link_mutex_;
  std::optional<std::stop_callback<std::function<void()>>> chain_link_;
};

}  // namespace __scope

// A cancellable execution scope.
//
// A scope carries a cancellation source (done-signal, terminal status, frozen cause,
// deadline), a cleanup chain run once when the source closes, a task group shared with
// every scope derived from it, and a value store shared the same way. Copies of a scope
// refer to the same scope.
//
// Cancellation is cooperative. Work running under a scope is expected to watch done()
// and return when it closes; nothing is ever interrupted.
class scope {
 public:
  using unit = task_group::unit;

  // Builds a root scope around `root`. The task group cancels `root` with its first
  // error.
  [[nodiscard]] static scope make(source root) {
    auto group  = std::make_shared<task_group>([root](error e) { root.cancel(std::move(e)); });
    auto values = std::make_shared<value_store>();
    return scope{root, [root](error e) { root.cancel(std::move(e)); }, std::move(group),
                 std::move(values)};
  }

  void cancel() const {
    cancel_with_cause(canceled());
  }

  // Closes the scope. Only the first close of the underlying source records its cause; a
  // null cause records the canceled sentinel. Returns after the cleanup chain has run.
  void cancel_with_cause(error cause) const {
    if (!cause) {
      cause = canceled();
    }
    cancel_fn base    = state_->base_cancel();
    source    current = state_->current();
    if (base) {
      base(cause);
    }
    current.cancel(std::move(cause));
  }

  // The newest cleanup runs first.
  void push_cleanup(std::function<void()> fn) const {
    state_->chain_.push([fn = std::move(fn)](error /*unused*/) { fn(); });
  }

  void push_cleanup_with_cause(std::function<void(error)> fn) const {
    state_->chain_.push(std::move(fn));
  }

  [[nodiscard]] std::optional<clock::time_point> deadline() const {
    return state_->current().deadline();
  }

  // Stops exactly once, when the scope closes.
  [[nodiscard]] std::stop_token done() const {
    return state_->current().token();
  }

  // Null while open, then canceled() or deadline_exceeded(). Never the cause.
  [[nodiscard]] error err() const {
    return state_->current().err();
  }

  [[nodiscard]] status state() const {
    return state_->current().state();
  }

  [[nodiscard]] error cause() const {
    return state_->current().cause();
  }

  void wait_done() const {
    auto                        token = done();
    std::mutex                  mutex;
    std::condition_variable_any cv;
    std::unique_lock            lock(mutex);
    cv.wait(lock, token, [] { return false; });
  }

  // Returns true when the scope closed within `timeout`.
  template <class Rep, class Period>
  bool wait_done_for(std::chrono::duration<Rep, Period> timeout) const {
    auto                        token = done();
    std::mutex                  mutex;
    std::condition_variable_any cv;
    std::unique_lock            lock(mutex);
    cv.wait_for(lock, token, timeout, [] { return false; });
    return token.stop_requested();
  }

  [[nodiscard]] source underlying() const {
    return state_->current();
  }

  [[nodiscard]] label_set labels() const {
    return state_->current().labels();
  }

  // Swaps the underlying source for transform(current). The cleanup chain follows the new
  // source when it carries a different cancellation state.
  void replace_underlying(const std::function<source(source)>& transform) const {
    source next = transform(state_->current());
    bool   same = false;
    {
      std::scoped_lock lock(state_->mutex_);
      same         = next.shares_state_with(state_->src_);
      state_->src_ = next;
    }
    if (!same) {
      state_->attach(next);
    }
  }

  // New scope closing through `src` and cancelled by `cancel`, sharing this scope's task
  // group and value store.
  [[nodiscard]] scope derive_from(source src, cancel_fn cancel) const {
    return scope{std::move(src), std::move(cancel), state_->group_, state_->values_};
  }

  // Runs `task` in the shared task group. Throws bad_task when `task` is empty.
  void go(unit task) const {
    state_->group_->spawn(std::move(task));
  }

  // Like go(), with the scope's labels merged with `extra` active while `task` runs. The
  // task runs on its own thread inside a label window; its result reaches the task group
  // through a future, so the group sees an ordinary unit.
  void go_labelled(label_set extra, unit task) const {
    if (!task) {
      throw bad_task("scope::go_labelled: empty task function");
    }
    go([window = labels().merge(extra), task = std::move(task)]() -> error {
      std::packaged_task<error()> labelled([&window, &task] { return run_labelled(window, task); });
      auto                        result = labelled.get_future();
      std::jthread                worker(std::move(labelled));
      return result.get();
    });
  }

  // Blocks until every task of the shared group returned. Yields the first task error;
  // the group's root scope is closed afterwards.
  error wait() const {
    return state_->group_->wait();
  }

  [[nodiscard]] task_group& group() const noexcept {
    return *state_->group_;
  }

  [[nodiscard]] value_store& values() const noexcept {
    return *state_->values_;
  }

  void set_flag(const flag_key& key, bool value) const {
    context::set_flag(*state_->values_, key, value);
  }

  template <class F>
  bool run_if(const flag_key& key, F&& f) const {
    return context::run_if(*state_->values_, key, std::forward<F>(f));
  }

  friend bool operator==(const scope& lhs, const scope& rhs) noexcept {
    return lhs.state_ == rhs.state_;
  }

 private:
  scope(source src, cancel_fn cancel, std::shared_ptr<task_group> group,
        std::shared_ptr<value_store> values)
      : state_(std::make_shared<__scope::state>(src, std::move(cancel), std::move(group),
                                                std::move(values))) {
    state_->attach(src);
  }

  std::shared_ptr<__scope::state> state_;
};

// A fresh root scope.
[[nodiscard]] inline scope background() {
  return scope::make(source::make_root());
}

}  // namespace cohort::context
