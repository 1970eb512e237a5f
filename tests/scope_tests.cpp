#include <atomic>
#include <boost/ut.hpp>
#include <chrono>
#include <cohort/context.hpp>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace ctx = cohort::context;

using namespace boost::ut;
using namespace std::chrono_literals;

suite scope_cancellation_tests = [] {
  "background scope is open"_test = [] {
    auto s = ctx::background();
    expect(s.err() == nullptr);
    expect(s.state() == ctx::status::open);
    expect(!s.done().stop_requested());
    expect(!s.deadline().has_value());
  };

  "cancel closes with the canceled sentinel"_test = [] {
    auto s = ctx::background();
    s.cancel();
    expect(s.done().stop_requested());
    expect(s.err() == ctx::canceled());
    expect(s.cause() == ctx::canceled());
  };

  "cause is frozen by the first cancel"_test = [] {
    auto s  = ctx::background();
    auto e1 = ctx::make_error(std::runtime_error("e1"));
    auto e2 = ctx::make_error(std::runtime_error("e2"));

    s.cancel_with_cause(e1);
    s.cancel_with_cause(e2);
    expect(s.cause() == e1);
    expect(s.err() == ctx::canceled());
  };

  "null cause is recorded as canceled"_test = [] {
    auto s = ctx::background();
    s.cancel_with_cause(nullptr);
    expect(s.cause() == ctx::canceled());
  };

  "wait_done_for times out on an open scope"_test = [] {
    auto s = ctx::background();
    expect(!s.wait_done_for(20ms));
  };

  "wait_done returns once cancelled elsewhere"_test = [] {
    auto        s = ctx::background();
    std::thread canceller([s] {
      std::this_thread::sleep_for(10ms);
      s.cancel();
    });
    s.wait_done();
    canceller.join();
    expect(s.err() == ctx::canceled());
  };

  "copies refer to the same scope"_test = [] {
    auto s    = ctx::background();
    auto copy = s;
    expect(copy == s);
    copy.cancel();
    expect(s.err() == ctx::canceled());
  };
};

suite scope_cleanup_tests = [] {
  "cleanups run in reverse order before cancel returns"_test = [] {
    auto             s = ctx::background();
    std::vector<int> order;
    s.push_cleanup([&] { order.push_back(1); });
    s.push_cleanup([&] { order.push_back(2); });

    s.cancel();
    expect(order == std::vector<int>{2, 1});
  };

  "cleanup runs once across repeated cancels"_test = [] {
    auto s     = ctx::background();
    int  calls = 0;
    s.push_cleanup([&] { ++calls; });
    s.cancel();
    s.cancel();
    expect(calls == 1);
  };

  "cleanup with cause sees the frozen cause"_test = [] {
    auto       s     = ctx::background();
    auto       cause = ctx::make_error(std::runtime_error("stop"));
    ctx::error seen;
    s.push_cleanup_with_cause([&](ctx::error e) { seen = e; });
    s.cancel_with_cause(cause);
    expect(seen == cause);
  };

  "cleanup runs when a parent closes the scope"_test = [] {
    auto parent = ctx::background();
    auto child  = ctx::with_cancel(parent);
    bool ran    = false;
    child.push_cleanup([&] { ran = true; });

    parent.cancel();
    expect(ran);
  };

  "cleanup pushed after closure runs immediately"_test = [] {
    auto s = ctx::background();
    s.cancel();
    bool ran = false;
    s.push_cleanup([&] { ran = true; });
    expect(ran);
  };
};

suite scope_group_tests = [] {
  "first error wins and closes the scope"_test = [] {
    auto              s = ctx::background();
    auto              e = ctx::make_error(std::runtime_error("failed"));
    std::atomic<int>  observed{0};
    constexpr int     blockers = 4;

    for (int i = 0; i < blockers; ++i) {
      s.go([s, &observed]() -> ctx::error {
        if (s.wait_done_for(1s)) {
          observed.fetch_add(1);
        }
        return ctx::canceled();
      });
    }
    s.go([e] { return e; });

    auto started = std::chrono::steady_clock::now();
    expect(s.wait() == e);
    expect(std::chrono::steady_clock::now() - started < 1s);
    expect(observed.load() == blockers);
    expect(s.err() == ctx::canceled());
    expect(s.cause() == e);
  };

  "successful wait closes the scope with canceled"_test = [] {
    auto s = ctx::background();
    s.go([]() -> ctx::error { return nullptr; });
    expect(s.wait() == nullptr);
    expect(s.err() == ctx::canceled());
    expect(s.cause() == ctx::canceled());
  };

  "derived scopes share the task group"_test = [] {
    auto             root  = ctx::background();
    auto             child = ctx::with_cancel(root);
    std::atomic<int> counter{0};
    child.go([&]() -> ctx::error {
      counter.fetch_add(1);
      return nullptr;
    });
    root.go([&]() -> ctx::error {
      counter.fetch_add(1);
      return nullptr;
    });

    expect(&root.group() == &child.group());
    expect(root.wait() == nullptr);
    expect(counter.load() == 2);
  };

  "go with an empty unit throws"_test = [] {
    auto s = ctx::background();
    expect(throws<ctx::bad_task>([&] { s.go(ctx::scope::unit{}); }));
  };
};

suite scope_values_tests = [] {
  "derived scopes share the value store"_test = [] {
    auto root  = ctx::background();
    auto child = ctx::with_timeout(root, 10s);
    child.values().set("user", "alice");
    expect(root.values().get_string("user") == "alice");
    expect(&root.values() == &child.values());
  };

  "values survive cancellation"_test = [] {
    auto s = ctx::background();
    s.values().set("k", 1);
    s.cancel();
    expect(s.values().get_int("k") == 1);
  };
};

suite scope_labels_tests = [] {
  "go_labelled applies merged labels while the task runs"_test = [] {
    auto s = ctx::background();
    s.replace_underlying([](ctx::source src) { return src.with_labels({{"service", "api"}}); });

    ctx::label_set seen;
    s.go_labelled(ctx::labels("fetch", "fetches"), [&]() -> ctx::error {
      seen = ctx::current_labels();
      return nullptr;
    });
    expect(s.wait() == nullptr);
    expect(seen.find("service") == "api");
    expect(seen.find("name") == "fetch");
    expect(seen.find("description") == "fetches");
  };

  "go_labelled forwards the task error"_test = [] {
    auto s = ctx::background();
    auto e = ctx::make_error(std::runtime_error("labelled failure"));
    s.go_labelled(ctx::labels("w", "d"), [e] { return e; });
    expect(s.wait() == e);
  };

  "replace_underlying keeps the cancellation state"_test = [] {
    auto s      = ctx::background();
    auto before = s.underlying();
    s.replace_underlying([](ctx::source src) { return src.with_labels({{"k", "v"}}); });
    expect(s.underlying().shares_state_with(before));
    expect(s.labels().find("k") == "v");

    bool ran = false;
    s.push_cleanup([&] { ran = true; });
    s.cancel();
    expect(ran);
  };
};

int main() {
  return 0;
}
