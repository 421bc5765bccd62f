/*
 * Copyright 2025 Tally Contributors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

// Tally Runtime Simulator - Header
// Synthetic actor workload driven through the instrumentation entry points

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace tally::runtime {

/// Shape of a simulated workload
struct WorkloadOptions {
    uint32_t actors = 8;         // User actors, spread over the worker threads
    uint32_t messages = 1000;    // Messages per actor
    uint32_t threads = 4;        // Dispatcher threads
    uint32_t batch = 4;          // Enqueues before the actor drains its mailbox
    uint32_t copy_every = 16;    // Every Nth envelope is also copied (0 disables)
    bool system_actors = true;   // Also drive a runtime-internal actor per thread
    std::vector<std::string> message_types = {"demo.protocol.Ping", "demo.protocol.Pong",
                                              "demo.protocol.Tick"};
};

/// Totals of a finished run
struct WorkloadResult {
    uint64_t actors_created = 0;
    uint64_t messages_processed = 0;
    uint64_t events_fired = 0;
    int64_t elapsed_nanos = 0;
};

/// Run the workload to completion on options.threads threads.
/// Every actor is created, receives its messages in batches, and is terminated.
[[nodiscard]] WorkloadResult run_workload(const WorkloadOptions& options);

}  // namespace tally::runtime
