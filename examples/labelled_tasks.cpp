#include <cohort/context.hpp>
#include <iostream>
#include <mutex>
#include <string>

using namespace cohort::context;

// Prints the labels active inside each task
auto main() -> int {
  auto scope = make_scope({labels_option(raw_labels({{"service", "indexer"}}))});

  std::mutex out;
  auto       report = [&out]() -> error {
    std::string line;
    for (const auto& [key, value] : current_labels()) {
      line += key + '=' + value + ' ';
    }
    std::scoped_lock lock(out);
    std::cout << line << '\n';
    return nullptr;
  };

  go_labelled(scope, "crawl", "fetches pages", report);
  go_labelled(scope, "parse", "extracts links", report, raw_labels({{"shard", "2"}}));
  go(scope, report);

  scope.wait();
  return 0;
}
