#include <atomic>
#include <cohort/context.hpp>
#include <iostream>
#include <string>

using namespace cohort::context;

auto main() -> int {
  // Root scope with a value seeded for every task
  auto scope = make_scope({values_option({{"greeting", "Hello"}})});

  std::atomic<int> done{0};
  for (int i = 0; i < 4; ++i) {
    go(scope, [&done, i](cohort::context::scope& s) -> error {
      std::cout << s.values().get_string("greeting") + " from task " + std::to_string(i) + '\n';
      done.fetch_add(1);
      return nullptr;
    });
  }

  // Wait for every task; the scope closes afterwards
  auto err = scope.wait();
  std::cout << "Tasks finished: " << done.load() << '\n';
  std::cout << "Result: " << (err ? describe(err) : "success") << '\n';
  std::cout << "Scope state: " << describe(scope.err()) << '\n';

  return 0;
}
