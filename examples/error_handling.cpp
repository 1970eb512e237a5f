#include <chrono>
#include <cohort/context.hpp>
#include <iostream>
#include <stdexcept>
#include <stop_token>
#include <thread>

using namespace cohort::context;
using namespace std::chrono_literals;

// Polls until the scope closes or the work is done
auto slow_worker(int id) {
  return [id](std::stop_token done) -> error {
    for (int step = 0; step < 100; ++step) {
      if (done.stop_requested()) {
        std::cout << "Worker " << id << " cancelled at step " << step << '\n';
        return canceled();
      }
      std::this_thread::sleep_for(10ms);
    }
    return nullptr;
  };
}

void example_first_error() {
  std::cout << "=== First error wins ===" << '\n';
  auto s = background();

  go(s, slow_worker(1));
  go(s, slow_worker(2));
  go(s, []() -> error {
    std::this_thread::sleep_for(50ms);
    return make_error(std::runtime_error("disk full"));
  });

  auto err = s.wait();
  std::cout << "Group error: " << describe(err) << '\n';
  std::cout << "Scope err(): " << describe(s.err()) << '\n';
  std::cout << "Scope cause(): " << describe(s.cause()) << "\n\n";
}

void example_deadline() {
  std::cout << "=== Deadline with cause ===" << '\n';
  auto s = with_timeout_cause(background(), 100ms,
                              make_error(std::runtime_error("report generation too slow")));

  go(s, slow_worker(3));
  s.wait_done();
  std::cout << "Scope err(): " << describe(s.err()) << '\n';
  std::cout << "Scope cause(): " << describe(s.cause()) << '\n';
  s.wait();
  std::cout << '\n';
}

void example_misuse() {
  std::cout << "=== Empty task ===" << '\n';
  auto s = background();
  try {
    go(s, plain_task{});
  } catch (const bad_task& e) {
    std::cout << "Rejected: " << e.what() << '\n';
  }
}

auto main() -> int {
  example_first_error();
  example_deadline();
  example_misuse();
  return 0;
}
