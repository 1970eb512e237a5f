#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <utility>

#include "errors.hpp"
#include "labels.hpp"
#include "timer_queue.hpp"

namespace cohort::context {

namespace __source {

// Shared cancellation state. Closes exactly once; the status and cause recorded by the
// first close are frozen.
class state : public std::enable_shared_from_this<state> {
 public:
  explicit state(std::optional<clock::time_point> deadline) noexcept : deadline_(deadline) {}

  ~state() {
    if (timer_) {
      timer_queue::shared().cancel(*timer_);
    }
  }

  state(const state&)            = delete;
  state& operator=(const state&) = delete;

  bool cancel(status reason, error cause) {
    std::optional<timer_queue::handle> timer;
    {
      std::scoped_lock lock(mutex_);
      if (status_ != status::open) {
        return false;
      }
      status_ = reason;
      cause_  = cause ? std::move(cause) : error_for(reason);
      timer   = std::exchange(timer_, std::nullopt);
    }

    if (timer) {
      timer_queue::shared().cancel(*timer);
    }
    stop_.request_stop();
    return true;
  }

  [[nodiscard]] status current() const {
    std::scoped_lock lock(mutex_);
    return status_;
  }

  [[nodiscard]] error cause() const {
    std::scoped_lock lock(mutex_);
    return cause_;
  }

  [[nodiscard]] std::optional<clock::time_point> deadline() const noexcept {
    return deadline_;
  }

  [[nodiscard]] std::stop_token token() const noexcept {
    return stop_.get_token();
  }

  // Closes with the parent's status and cause when the parent closes.
  void link_parent(std::stop_token parent_token, std::shared_ptr<const state> parent) {
    parent_link_.emplace(std::move(parent_token),
                         [this, parent = std::move(parent)] {
                           if (parent) {
                             cancel(parent->current(), parent->cause());
                           } else {
                             cancel(status::canceled, canceled());
                           }
                         });
  }

  void link_trigger(std::stop_token trigger, std::function<error()> make_cause) {
    trigger_link_.emplace(std::move(trigger), [this, make_cause = std::move(make_cause)] {
      cancel(status::canceled, make_cause ? make_cause() : canceled());
    });
  }

  void arm(clock::time_point when, error cause) {
    if (when <= clock::now()) {
      cancel(status::deadline_exceeded, std::move(cause));
      return;
    }

    std::scoped_lock lock(mutex_);
    if (status_ != status::open) {
      return;
    }
    timer_ = timer_queue::shared().schedule(when, [weak = weak_from_this(), cause] {
      if (auto self = weak.lock()) {
        self->cancel(status::deadline_exceeded, cause);
      }
    });
  }

 private:
  using link = std::stop_callback<std::function<void()>>;

  mutable std::mutex                       mutex_;
  status                                   status_ = status::open;
  error                                    cause_;
  std::optional<clock::time_point>         deadline_;
  std::optional<timer_queue::handle>       timer_;
  std::stop_source                         stop_;
  // Declared last so they deregister before anything they touch is destroyed.
  std::optional<link> parent_link_;
  std::optional<link> trigger_link_;
};

}  // namespace __source

// Handle to a cancellation source: a done-signal, a terminal status, a frozen cause and an
// optional deadline. Copies share the same cancellation state; the label set travels with
// the handle and is inherited by children.
class source {
 public:
  [[nodiscard]] static source make_root() {
    return source{std::make_shared<__source::state>(std::nullopt), {}};
  }

  // Root that also closes when an external stop token is stopped.
  [[nodiscard]] static source make_linked(std::stop_token external) {
    auto st = std::make_shared<__source::state>(std::nullopt);
    st->link_parent(std::move(external), nullptr);
    return source{std::move(st), {}};
  }

  [[nodiscard]] source make_child() const {
    auto st = std::make_shared<__source::state>(state_->deadline());
    st->link_parent(token(), state_);
    return source{std::move(st), labels_};
  }

  // Child closing at `deadline` with status deadline_exceeded. The parent's deadline wins
  // when it is earlier; no timer is armed in that case.
  [[nodiscard]] source make_child(clock::time_point deadline, error cause = nullptr) const {
    auto inherited = state_->deadline();
    bool earlier   = !inherited || deadline < *inherited;

    auto st = std::make_shared<__source::state>(earlier ? deadline : inherited);
    st->link_parent(token(), state_);
    if (earlier) {
      st->arm(deadline, std::move(cause));
    }
    return source{std::move(st), labels_};
  }

  // Child that also closes when `trigger` stops, with the cause produced by `make_cause`.
  [[nodiscard]] source make_triggered(std::stop_token trigger, std::function<error()> make_cause) const {
    auto st = std::make_shared<__source::state>(state_->deadline());
    st->link_parent(token(), state_);
    st->link_trigger(std::move(trigger), std::move(make_cause));
    return source{std::move(st), labels_};
  }

  // Same cancellation state, carrying `extra` merged over the current labels.
  [[nodiscard]] source with_labels(const label_set& extra) const {
    return source{state_, labels_.merge(extra)};
  }

  // Closes with status canceled. Only the first close records its cause; a null cause
  // records the canceled sentinel. Returns true when this call closed the source.
  bool cancel(error cause = nullptr) const {
    return state_->cancel(status::canceled, std::move(cause));
  }

  [[nodiscard]] std::stop_token token() const noexcept {
    return state_->token();
  }

  [[nodiscard]] status state() const {
    return state_->current();
  }

  [[nodiscard]] error err() const {
    return error_for(state_->current());
  }

  [[nodiscard]] error cause() const {
    return state_->cause();
  }

  [[nodiscard]] std::optional<clock::time_point> deadline() const noexcept {
    return state_->deadline();
  }

  [[nodiscard]] const label_set& labels() const noexcept {
    return labels_;
  }

  [[nodiscard]] bool shares_state_with(const source& other) const noexcept {
    return state_ == other.state_;
  }

 private:
  source(std::shared_ptr<__source::state> st, label_set labels)
      : state_(std::move(st)), labels_(std::move(labels)) {}

  std::shared_ptr<__source::state> state_;
  label_set                        labels_;
};

}  // namespace cohort::context
