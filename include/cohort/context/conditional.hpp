#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <utility>

#include "value_store.hpp"

namespace cohort::context {

// Key of a boolean flag. Distinct from a plain string key with the same text.
struct flag_key {
  std::string name;

  friend bool operator==(const flag_key&, const flag_key&) = default;
};

}  // namespace cohort::context

template <>
struct std::hash<cohort::context::flag_key> {
  std::size_t operator()(const cohort::context::flag_key& key) const noexcept {
    return std::hash<std::string>{}(key.name);
  }
};

namespace cohort::context {

inline void set_flag(value_store& values, const flag_key& key, bool value) {
  values.set(key, value);
}

// Invokes f only when the flag is present and true. Returns whether f ran.
template <class F>
bool run_if(const value_store& values, const flag_key& key, F&& f) {
  if (values.get_as<bool>(key).value_or(false)) {
    std::invoke(std::forward<F>(f));
    return true;
  }
  return false;
}

}  // namespace cohort::context
