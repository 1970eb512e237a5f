#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <stop_token>
#include <utility>
#include <vector>

#include "errors.hpp"
#include "labels.hpp"
#include "scope.hpp"
#include "signals.hpp"
#include "source.hpp"
#include "value_store.hpp"

namespace cohort::context {

// [derive], scopes derived from a parent. Each derived scope owns its own cancellation
// trigger, closes when the parent closes, and shares the parent's task group and value
// store. A derived scope is cancelled through its own cancel().

[[nodiscard]] inline scope with_cancel(const scope& parent) {
  auto src = parent.underlying().make_child();
  return parent.derive_from(src, [src](error cause) { src.cancel(std::move(cause)); });
}

// Closes at `deadline` with err() == deadline_exceeded() and cause() == `cause`, or the
// deadline sentinel when `cause` is null.
[[nodiscard]] inline scope with_deadline_cause(const scope& parent, clock::time_point deadline,
                                               error cause) {
  auto src = parent.underlying().make_child(deadline, std::move(cause));
  return parent.derive_from(src, [src](error c) { src.cancel(std::move(c)); });
}

[[nodiscard]] inline scope with_deadline(const scope& parent, clock::time_point deadline) {
  return with_deadline_cause(parent, deadline, nullptr);
}

template <class Rep, class Period>
[[nodiscard]] scope with_timeout_cause(const scope& parent, std::chrono::duration<Rep, Period> timeout,
                                       error cause) {
  return with_deadline_cause(
      parent, clock::now() + std::chrono::duration_cast<clock::duration>(timeout), std::move(cause));
}

template <class Rep, class Period>
[[nodiscard]] scope with_timeout(const scope& parent, std::chrono::duration<Rep, Period> timeout) {
  return with_timeout_cause(parent, timeout, nullptr);
}

// Closes when one of `signals` arrives (SIGINT and SIGTERM when empty), with a
// signal_error cause. The listener is stopped when the scope closes for any reason.
[[nodiscard]] inline scope with_signal_cancel(const scope& parent, std::vector<int> signals = {}) {
  auto listener = std::make_shared<signal_listener>(std::move(signals));
  auto src      = parent.underlying().make_triggered(
      listener->token(),
      [weak = std::weak_ptr<signal_listener>(listener)]() -> error {
        auto l = weak.lock();
        return make_error(signal_error{l ? l->received() : 0});
      });

  auto derived = parent.derive_from(src, [src](error cause) { src.cancel(std::move(cause)); });
  derived.push_cleanup([listener] { listener->stop(); });
  return derived;
}

// [options], transformations applied in order by make_scope().
using option = std::function<scope(scope)>;

[[nodiscard]] inline option timeout_option(clock::duration timeout) {
  return [timeout](scope s) { return with_timeout(s, timeout); };
}

[[nodiscard]] inline option deadline_option(clock::time_point deadline) {
  return [deadline](scope s) { return with_deadline(s, deadline); };
}

[[nodiscard]] inline option signal_cancel_option(std::vector<int> signals = {}) {
  return [signals = std::move(signals)](scope s) { return with_signal_cancel(s, signals); };
}

// Attaches profiler labels to the scope's source; cancellation is unchanged.
[[nodiscard]] inline option labels_option(label_set labels) {
  return [labels = std::move(labels)](scope s) {
    s.replace_underlying([&labels](source src) { return src.with_labels(labels); });
    return s;
  };
}

// Seeds the shared value store.
[[nodiscard]] inline option values_option(std::vector<key_value> pairs) {
  return [pairs = std::move(pairs)](scope s) {
    for (const auto& [key, value] : pairs) {
      s.values().set(key, value);
    }
    return s;
  };
}

[[nodiscard]] inline option cleanup_option(std::function<void()> fn) {
  return [fn = std::move(fn)](scope s) {
    s.push_cleanup(fn);
    return s;
  };
}

[[nodiscard]] inline option cleanup_with_cause_option(std::function<void(error)> fn) {
  return [fn = std::move(fn)](scope s) {
    s.push_cleanup_with_cause(fn);
    return s;
  };
}

namespace __options {

inline scope apply(scope s, const std::vector<option>& options) {
  for (const auto& opt : options) {
    s = opt(std::move(s));
  }
  return s;
}

}  // namespace __options

// Root scope with `options` applied in the order given.
[[nodiscard]] inline scope make_scope(const std::vector<option>& options = {}) {
  return __options::apply(scope::make(source::make_root()), options);
}

// Root scope that also closes when `parent` is stopped.
[[nodiscard]] inline scope make_scope(std::stop_token parent, const std::vector<option>& options = {}) {
  return __options::apply(scope::make(source::make_linked(std::move(parent))), options);
}

}  // namespace cohort::context
