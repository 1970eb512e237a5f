#include <chrono>
#include <cohort/context.hpp>
#include <csignal>
#include <iostream>
#include <thread>

using namespace cohort::context;
using namespace std::chrono_literals;

// Runs a ticking service until SIGINT/SIGTERM or a 5 second budget, whichever comes first.
auto main() -> int {
  auto scope = make_scope({
      signal_cancel_option(),
      timeout_option(5s),
      cleanup_with_cause_option([](error cause) {
        std::cout << "Shutting down: " << describe(cause) << '\n';
      }),
  });

  go_labelled(scope, "ticker", "prints a tick every 500ms", [](cohort::context::scope& s) -> error {
    int ticks = 0;
    while (!s.wait_done_for(500ms)) {
      std::cout << "tick " << ++ticks << '\n';
    }
    return nullptr;
  });

  std::cout << "Press Ctrl-C to stop" << '\n';
  scope.wait_done();
  scope.wait();
  return 0;
}
