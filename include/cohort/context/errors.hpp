#pragma once

#include <cstdint>
#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

namespace cohort::context {

// A failure travelling through a scope. A null pointer means success.
using error = std::exception_ptr;

// Terminal status of a cancellation source, kept apart from the cause.
enum class status : std::uint8_t {
  open,
  canceled,
  deadline_exceeded,
};

class canceled_error : public std::runtime_error {
 public:
  canceled_error() : std::runtime_error("context canceled") {}
};

class deadline_exceeded_error : public std::runtime_error {
 public:
  deadline_exceeded_error() : std::runtime_error("context deadline exceeded") {}
};

// Cause recorded by signal-triggered cancellation
class signal_error : public std::runtime_error {
 public:
  explicit signal_error(int signo)
      : std::runtime_error("interrupted by signal " + std::to_string(signo)), signo_(signo) {}

  [[nodiscard]] int signal_number() const noexcept {
    return signo_;
  }

 private:
  int signo_;
};

// Thrown when an empty task function is dispatched.
class bad_task : public std::invalid_argument {
 public:
  explicit bad_task(const std::string& what) : std::invalid_argument(what) {}
};

[[nodiscard]] inline error canceled() noexcept {
  static const error sentinel = std::make_exception_ptr(canceled_error{});
  return sentinel;
}

[[nodiscard]] inline error deadline_exceeded() noexcept {
  static const error sentinel = std::make_exception_ptr(deadline_exceeded_error{});
  return sentinel;
}

template <class E>
[[nodiscard]] error make_error(E&& e) {
  return std::make_exception_ptr(std::forward<E>(e));
}

// Sentinel error reported for a terminal status, null while open.
[[nodiscard]] inline error error_for(status s) noexcept {
  switch (s) {
    case status::canceled:
      return canceled();
    case status::deadline_exceeded:
      return deadline_exceeded();
    case status::open:
      break;
  }
  return nullptr;
}

namespace __errors {

template <class E>
bool holds(const error& e) {
  if (!e) {
    return false;
  }
  try {
    std::rethrow_exception(e);
  } catch (const E&) {
    return true;
  } catch (...) {
    return false;
  }
}

}  // namespace __errors

[[nodiscard]] inline bool is_canceled(const error& e) {
  return e == canceled() || __errors::holds<canceled_error>(e);
}

[[nodiscard]] inline bool is_deadline_exceeded(const error& e) {
  return e == deadline_exceeded() || __errors::holds<deadline_exceeded_error>(e);
}

// Human readable text of an error, empty for success.
[[nodiscard]] inline std::string describe(const error& e) {
  if (!e) {
    return {};
  }
  try {
    std::rethrow_exception(e);
  } catch (const std::exception& ex) {
    return ex.what();
  } catch (...) {
    return "unknown error";
  }
}

}  // namespace cohort::context
