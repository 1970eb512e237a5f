#pragma once

#include <concepts>
#include <functional>
#include <stop_token>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

#include "errors.hpp"
#include "labels.hpp"
#include "scope.hpp"

namespace cohort::context {

// The three accepted task shapes.
using plain_task = std::function<error()>;
using token_task = std::function<error(std::stop_token)>;
using scope_task = std::function<error(scope&)>;

using any_task = std::variant<plain_task, token_task, scope_task>;

namespace __dispatch {

template <class... Fs>
struct overloaded : Fs... {
  using Fs::operator()...;
};

template <class F>
concept returns_error_plain = std::is_invocable_r_v<error, F>;

template <class F>
concept returns_error_token = std::is_invocable_r_v<error, F, std::stop_token>;

template <class F>
concept returns_error_scope = std::is_invocable_r_v<error, F, scope&>;

template <class F>
concept task_function = returns_error_plain<F> || returns_error_token<F> || returns_error_scope<F>;

inline bool empty(const any_task& task) noexcept {
  return std::visit([](const auto& fn) { return !static_cast<bool>(fn); }, task);
}

}  // namespace __dispatch

// Wraps a callable into the task variant. A callable accepting no argument is a plain
// task, one accepting a std::stop_token a token task, one accepting a scope a scope task.
template <__dispatch::task_function F>
[[nodiscard]] any_task make_task(F&& f) {
  if constexpr (__dispatch::returns_error_plain<F>) {
    return any_task{std::in_place_type<plain_task>, std::forward<F>(f)};
  } else if constexpr (__dispatch::returns_error_token<F>) {
    return any_task{std::in_place_type<token_task>, std::forward<F>(f)};
  } else {
    return any_task{std::in_place_type<scope_task>, std::forward<F>(f)};
  }
}

// Reduces any task shape to an argument-less unit bound to `s`. An empty task function
// is a programming error: throws bad_task.
[[nodiscard]] inline scope::unit normalize(const scope& s, any_task task) {
  if (__dispatch::empty(task)) {
    throw bad_task("cohort::context: dispatch of an empty task function");
  }

  return std::visit(
      __dispatch::overloaded{
          [](plain_task fn) -> scope::unit { return fn; },
          [&s](token_task fn) -> scope::unit {
            return [s, fn = std::move(fn)] { return fn(s.done()); };
          },
          [&s](scope_task fn) -> scope::unit {
            return [s = s, fn = std::move(fn)]() mutable { return fn(s); };
          },
      },
      std::move(task));
}

// Runs `f` in the task group of `s`.
template <__dispatch::task_function F>
void go(const scope& s, F&& f) {
  s.go(normalize(s, make_task(std::forward<F>(f))));
}

inline void go(const scope& s, any_task task) {
  s.go(normalize(s, std::move(task)));
}

// Runs `f` in the task group of `s` with the labels {name, description} (plus `extra`)
// active while it runs.
template <__dispatch::task_function F>
void go_labelled(const scope& s, std::string name, std::string description, F&& f,
                 const label_set& extra = {}) {
  s.go_labelled(labels(std::move(name), std::move(description)).merge(extra),
                normalize(s, make_task(std::forward<F>(f))));
}

}  // namespace cohort::context
