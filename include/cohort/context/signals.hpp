#pragma once

#include <fcntl.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <map>
#include <memory>
#include <mutex>
#include <stop_token>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

namespace cohort::context {

namespace __signals {

// Write end of the self-pipe, read by the signal handler.
inline std::atomic<int> write_fd{-1};

}  // namespace __signals

}  // namespace cohort::context

extern "C" {

// Installed with sigaction, so it needs C language linkage.
inline void cohort_context_on_signal(int signo) {
  int  saved = errno;
  auto byte  = static_cast<unsigned char>(signo);
  int  fd    = cohort::context::__signals::write_fd.load(std::memory_order_relaxed);
  if (fd >= 0) {
    // A failed write means the pipe is full, so a wakeup is already pending.
    [[maybe_unused]] auto written = ::write(fd, &byte, 1);
  }
  errno = saved;
}
}

namespace cohort::context {

namespace __signals {

struct channel {
  std::stop_source stop;
  std::atomic<int> received{0};
};

// Process-wide registry translating signal deliveries into channel closures. Handlers are
// installed while at least one listener watches a signal and the previous disposition is
// restored afterwards.
class hub {
 public:
  static hub& instance() {
    static hub h;
    return h;
  }

  std::uint64_t add(const std::vector<int>& signals, std::shared_ptr<channel> ch) {
    std::scoped_lock lock(mutex_);
    std::vector<int> installed_now;
    for (int signo : signals) {
      auto it = installed_.find(signo);
      if (it != installed_.end()) {
        ++it->second.listeners;
        continue;
      }

      struct sigaction action {};
      action.sa_handler = &cohort_context_on_signal;
      action.sa_flags   = SA_RESTART;
      sigemptyset(&action.sa_mask);

      struct sigaction previous {};
      if (::sigaction(signo, &action, &previous) != 0) {
        int code = errno;
        for (int undo : installed_now) {
          release(undo);
        }
        throw std::system_error(code, std::generic_category(), "sigaction");
      }
      installed_.emplace(signo, installation{1, previous});
      installed_now.push_back(signo);
    }

    std::uint64_t id = ++next_id_;
    listeners_.emplace(id, registration{signals, std::move(ch)});
    return id;
  }

  void remove(std::uint64_t id) noexcept {
    std::scoped_lock lock(mutex_);
    auto             it = listeners_.find(id);
    if (it == listeners_.end()) {
      return;
    }
    for (int signo : it->second.signals) {
      release(signo);
    }
    listeners_.erase(it);
  }

  ~hub() {
    dispatcher_.request_stop();
    wake();
    dispatcher_.join();
    int write_end = write_fd.exchange(-1, std::memory_order_relaxed);
    ::close(write_end);
    ::close(read_fd_);
  }

  hub(const hub&)            = delete;
  hub& operator=(const hub&) = delete;

 private:
  struct installation {
    std::size_t      listeners;
    struct sigaction previous;
  };

  struct registration {
    std::vector<int>         signals;
    std::shared_ptr<channel> ch;
  };

  hub() {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
      throw std::system_error(errno, std::generic_category(), "pipe2");
    }
    if (::fcntl(fds[1], F_SETFL, O_NONBLOCK) != 0) {
      int code = errno;
      ::close(fds[0]);
      ::close(fds[1]);
      throw std::system_error(code, std::generic_category(), "fcntl");
    }
    read_fd_ = fds[0];
    write_fd.store(fds[1], std::memory_order_relaxed);
    dispatcher_ = std::jthread([this](std::stop_token stop) { dispatch(stop); });
  }

  // Unblocks the dispatcher's read(); a full pipe already guarantees a pending wakeup.
  void wake() noexcept {
    unsigned char         byte    = 0;
    [[maybe_unused]] auto written = ::write(write_fd.load(std::memory_order_relaxed), &byte, 1);
  }

  // Caller holds mutex_.
  void release(int signo) noexcept {
    auto it = installed_.find(signo);
    if (it == installed_.end() || --it->second.listeners > 0) {
      return;
    }
    // Restoring a disposition installed above cannot fail for the same signal number.
    if (::sigaction(signo, &it->second.previous, nullptr) != 0) {
      std::terminate();
    }
    installed_.erase(it);
  }

  void dispatch(std::stop_token stop) {
    unsigned char buffer[64];
    while (!stop.stop_requested()) {
      auto n = ::read(read_fd_, buffer, sizeof(buffer));
      if (n < 0) {
        if (errno == EINTR) {
          continue;
        }
        return;
      }
      if (n == 0) {
        return;
      }

      for (ssize_t i = 0; i < n; ++i) {
        if (buffer[i] != 0) {
          notify(static_cast<int>(buffer[i]));
        }
      }
    }
  }

  void notify(int signo) {
    std::vector<std::shared_ptr<channel>> targets;
    {
      std::scoped_lock lock(mutex_);
      for (const auto& [id, reg] : listeners_) {
        for (int watched : reg.signals) {
          if (watched == signo) {
            targets.push_back(reg.ch);
            break;
          }
        }
      }
    }

    for (const auto& ch : targets) {
      int expected = 0;
      ch->received.compare_exchange_strong(expected, signo, std::memory_order_acq_rel);
      ch->stop.request_stop();
    }
  }

  std::mutex                              mutex_;
  std::map<int, installation>             installed_;
  std::map<std::uint64_t, registration>   listeners_;
  std::uint64_t                           next_id_ = 0;
  int                                     read_fd_ = -1;
  std::jthread                            dispatcher_;
};

}  // namespace __signals

[[nodiscard]] inline std::vector<int> default_signals() {
  return {SIGINT, SIGTERM};
}

// A handle whose token stops when one of the watched signals arrives. stop() deregisters
// the listener; the signal's previous disposition returns once no listener watches it.
class signal_listener {
 public:
  explicit signal_listener(std::vector<int> signals = default_signals())
      : ch_(std::make_shared<__signals::channel>()) {
    if (signals.empty()) {
      signals = default_signals();
    }
    id_ = __signals::hub::instance().add(signals, ch_);
  }

  ~signal_listener() {
    stop();
  }

  signal_listener(const signal_listener&)            = delete;
  signal_listener& operator=(const signal_listener&) = delete;

  [[nodiscard]] std::stop_token token() const noexcept {
    return ch_->stop.get_token();
  }

  // The first signal received, 0 when none arrived.
  [[nodiscard]] int received() const noexcept {
    return ch_->received.load(std::memory_order_acquire);
  }

  void stop() noexcept {
    if (!stopped_.exchange(true, std::memory_order_acq_rel)) {
      __signals::hub::instance().remove(id_);
    }
  }

 private:
  std::shared_ptr<__signals::channel> ch_;
  std::uint64_t                       id_ = 0;
  std::atomic<bool>                   stopped_{false};
};

}  // namespace cohort::context
