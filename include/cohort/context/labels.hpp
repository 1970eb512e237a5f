#pragma once

#include <pthread.h>

#include <algorithm>
#include <array>
#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cohort::context {

// Ordered string key/value pairs attached to a task for profiler attribution.
class label_set {
 public:
  using value_type     = std::pair<std::string, std::string>;
  using const_iterator = std::vector<value_type>::const_iterator;

  label_set() = default;

  label_set(std::initializer_list<value_type> pairs) {
    for (const auto& [key, value] : pairs) {
      assign(key, value);
    }
  }

  [[nodiscard]] std::optional<std::string_view> find(std::string_view key) const noexcept {
    auto it = std::ranges::find(pairs_, key, &value_type::first);
    if (it == pairs_.end()) {
      return std::nullopt;
    }
    return std::string_view{it->second};
  }

  // Pairs of `overlay` replace same-keyed pairs in place, new keys are appended.
  [[nodiscard]] label_set merge(const label_set& overlay) const {
    label_set out = *this;
    for (const auto& [key, value] : overlay.pairs_) {
      out.assign(key, value);
    }
    return out;
  }

  [[nodiscard]] bool empty() const noexcept {
    return pairs_.empty();
  }

  [[nodiscard]] std::size_t size() const noexcept {
    return pairs_.size();
  }

  [[nodiscard]] const_iterator begin() const noexcept {
    return pairs_.begin();
  }

  [[nodiscard]] const_iterator end() const noexcept {
    return pairs_.end();
  }

  friend bool operator==(const label_set&, const label_set&) = default;

 private:
  void assign(const std::string& key, const std::string& value) {
    auto it = std::ranges::find(pairs_, key, &value_type::first);
    if (it != pairs_.end()) {
      it->second = value;
    } else {
      pairs_.emplace_back(key, value);
    }
  }

  std::vector<value_type> pairs_;
};

inline constexpr std::string_view name_label        = "name";
inline constexpr std::string_view description_label = "description";

// The conventional label set of a named task.
[[nodiscard]] inline label_set labels(std::string name, std::string description) {
  return label_set{{std::string{name_label}, std::move(name)},
                   {std::string{description_label}, std::move(description)}};
}

[[nodiscard]] inline label_set raw_labels(std::initializer_list<label_set::value_type> pairs) {
  return label_set{pairs};
}

namespace __labels {

inline const label_set& empty_set() noexcept {
  static const label_set set;
  return set;
}

inline thread_local const label_set* current = nullptr;

// Linux limits thread names to 15 bytes plus the terminator.
inline constexpr std::size_t thread_name_max = 16;

}  // namespace __labels

// Labels of the execution window open on the calling thread.
[[nodiscard]] inline const label_set& current_labels() noexcept {
  return __labels::current != nullptr ? *__labels::current : __labels::empty_set();
}

// RAII execution window. While alive, current_labels() on this thread returns the
// window's labels and the OS thread name follows the "name" label so that external
// profilers attribute samples to the task.
class label_window {
 public:
  explicit label_window(label_set labels) : labels_(std::move(labels)), previous_(__labels::current) {
    __labels::current = &labels_;

    if (auto name = labels_.find(name_label); name && !name->empty()) {
      if (pthread_getname_np(pthread_self(), saved_name_.data(), saved_name_.size()) == 0) {
        renamed_ = true;
        std::string truncated{name->substr(0, __labels::thread_name_max - 1)};
        pthread_setname_np(pthread_self(), truncated.c_str());
      }
    }
  }

  ~label_window() {
    if (renamed_) {
      pthread_setname_np(pthread_self(), saved_name_.data());
    }
    __labels::current = previous_;
  }

  label_window(const label_window&)            = delete;
  label_window& operator=(const label_window&) = delete;

  label_window(label_window&&)            = delete;
  label_window& operator=(label_window&&) = delete;

  [[nodiscard]] const label_set& labels() const noexcept {
    return labels_;
  }

 private:
  label_set                                    labels_;
  const label_set*                             previous_;
  std::array<char, __labels::thread_name_max> saved_name_{};
  bool                                         renamed_ = false;
};

// Runs f inside a label window and returns its result.
template <class F>
decltype(auto) run_labelled(label_set labels, F&& f) {
  label_window window{std::move(labels)};
  return std::forward<F>(f)();
}

}  // namespace cohort::context
