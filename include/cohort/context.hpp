#pragma once

// Structured concurrency over cancellable scopes
//   - errors.hpp: error pointer, terminal status and sentinels
//   - timer_queue.hpp: deadline timers
//   - source.hpp: cancellation sources (done-signal, status, cause, deadline)
//   - scope.hpp: coordination scope, cleanup chain, shared task group and values
//   - dispatch.hpp: task shapes and dispatch
//   - options.hpp: derivations and construction options

#include "context/cleanup_chain.hpp"  // Run-once cleanup callbacks
#include "context/conditional.hpp"    // Flag-gated execution
#include "context/dispatch.hpp"       // go / go_labelled
#include "context/errors.hpp"         // error, status, canceled(), deadline_exceeded()
#include "context/labels.hpp"         // Profiler label sets and windows
#include "context/options.hpp"        // with_* derivations, make_scope
#include "context/scope.hpp"          // Coordination scope
#include "context/signals.hpp"        // Signal listeners
#include "context/source.hpp"         // Cancellation sources
#include "context/task_group.hpp"     // First-error-wins task group
#include "context/timer_queue.hpp"    // Deadline timers
#include "context/value_store.hpp"    // Shared key/value store
