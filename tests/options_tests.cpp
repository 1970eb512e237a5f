#include <atomic>
#include <boost/ut.hpp>
#include <chrono>
#include <cohort/context.hpp>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

namespace ctx = cohort::context;

using namespace boost::ut;
using namespace std::chrono_literals;

suite derivation_tests = [] {
  "timeout elapses with deadline_exceeded"_test = [] {
    auto s = ctx::with_timeout(ctx::background(), 50ms);
    expect(s.deadline().has_value());
    std::this_thread::sleep_for(1s);
    expect(s.err() == ctx::deadline_exceeded());
    expect(s.cause() == ctx::deadline_exceeded());
  };

  "deadline with a custom cause"_test = [] {
    auto cause = ctx::make_error(std::runtime_error("budget spent"));
    auto s     = ctx::with_deadline_cause(ctx::background(), ctx::clock::now() + 20ms, cause);
    expect(s.wait_done_for(2s));
    expect(s.err() == ctx::deadline_exceeded());
    expect(s.cause() == cause);
  };

  "timeout with a custom cause"_test = [] {
    auto cause = ctx::make_error(std::runtime_error("slow upstream"));
    auto s     = ctx::with_timeout_cause(ctx::background(), 20ms, cause);
    expect(s.wait_done_for(2s));
    expect(ctx::is_deadline_exceeded(s.err()));
    expect(s.cause() == cause);
  };

  "explicit cancel of a timeout scope reports canceled"_test = [] {
    auto s = ctx::with_timeout_cause(ctx::background(), 10s,
                                     ctx::make_error(std::runtime_error("unused")));
    s.cancel();
    expect(s.err() == ctx::canceled());
    expect(s.cause() == ctx::canceled());
  };

  "parent cancellation reaches every derived scope"_test = [] {
    auto parent   = ctx::background();
    auto child    = ctx::with_cancel(parent);
    auto timed    = ctx::with_timeout(parent, 10s);
    auto deadline = ctx::with_deadline(child, ctx::clock::now() + 10s);

    parent.cancel();
    for (const auto& s : {child, timed, deadline}) {
      expect(s.done().stop_requested());
      expect(s.err() == ctx::canceled());
    }
  };

  "a derived scope that closed first keeps its own reason"_test = [] {
    auto parent = ctx::background();
    auto child  = ctx::with_timeout(parent, 10ms);
    expect(child.wait_done_for(2s));

    parent.cancel();
    expect(child.err() == ctx::deadline_exceeded());
  };

  "child cancel leaves the parent open"_test = [] {
    auto parent = ctx::background();
    auto child  = ctx::with_cancel(parent);
    child.cancel();
    expect(child.err() == ctx::canceled());
    expect(parent.err() == nullptr);
  };

  "parent deadline bounds a later child deadline"_test = [] {
    auto parent = ctx::with_timeout(ctx::background(), 30ms);
    auto child  = ctx::with_timeout(parent, 10s);
    expect(child.deadline() == parent.deadline());
    expect(child.wait_done_for(2s));
    expect(child.err() == ctx::deadline_exceeded());
  };
};

suite option_tests = [] {
  "options are applied in order"_test = [] {
    std::vector<std::string> applied;
    auto record = [&applied](std::string name) -> ctx::option {
      return [&applied, name = std::move(name)](ctx::scope s) {
        applied.push_back(name);
        return s;
      };
    };

    [[maybe_unused]] auto s = ctx::make_scope({record("first"), record("second"), record("third")});
    expect(applied == std::vector<std::string>{"first", "second", "third"});
  };

  "timeout option"_test = [] {
    auto s = ctx::make_scope({ctx::timeout_option(20ms)});
    expect(s.wait_done_for(2s));
    expect(s.err() == ctx::deadline_exceeded());
  };

  "deadline option"_test = [] {
    auto when = ctx::clock::now() + 10s;
    auto s    = ctx::make_scope({ctx::deadline_option(when)});
    expect(s.deadline() == when);
    s.cancel();
  };

  "labels option keeps cancellation unchanged"_test = [] {
    auto s = ctx::make_scope({ctx::labels_option(ctx::raw_labels({{"tenant", "acme"}}))});
    expect(s.labels().find("tenant") == "acme");
    expect(s.err() == nullptr);
    s.cancel();
    expect(s.err() == ctx::canceled());
  };

  "values option seeds the store"_test = [] {
    auto s = ctx::make_scope({ctx::values_option({{"retries", "3"}, {"region", "eu"}})});
    expect(s.values().get_int("retries") == 3);
    expect(s.values().get_string("region") == "eu");
  };

  "cleanup options run on cancel, newest first"_test = [] {
    std::vector<std::string> order;
    ctx::error               seen;
    auto                     cause = ctx::make_error(std::runtime_error("done"));
    auto                     s     = ctx::make_scope({
        ctx::cleanup_option([&] { order.emplace_back("plain"); }),
        ctx::cleanup_with_cause_option([&](ctx::error e) {
          order.emplace_back("with cause");
          seen = e;
        }),
    });

    s.cancel_with_cause(cause);
    expect(order == std::vector<std::string>{"with cause", "plain"});
    expect(seen == cause);
  };

  "cleanup option runs when the timeout elapses"_test = [] {
    std::atomic<bool> ran{false};
    auto s = ctx::make_scope({ctx::timeout_option(10ms), ctx::cleanup_option([&] { ran = true; })});
    expect(s.wait_done_for(2s));
    auto until = ctx::clock::now() + 2s;
    while (!ran.load() && ctx::clock::now() < until) {
      std::this_thread::sleep_for(1ms);
    }
    expect(ran.load());
  };

  "make_scope follows an external stop token"_test = [] {
    std::stop_source external;
    auto             s = ctx::make_scope(external.get_token());
    expect(s.err() == nullptr);
    external.request_stop();
    expect(s.err() == ctx::canceled());
  };
};

int main() {
  return 0;
}
