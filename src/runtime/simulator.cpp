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

// Tally Runtime Simulator - Implementation

#include "simulator.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <atomic>
#include <thread>

#include "../core/clock.hpp"
#include "../metrics/instrumentation.hpp"

namespace tally::runtime {

namespace {

struct SimulatedActor {
    std::string path;
    std::string actor_class;
};

/// Messages of one actor: enqueue a batch, then drain it
uint64_t drive_actor(const SimulatedActor& actor, const WorkloadOptions& options,
                     uint64_t& processed) {
    using namespace tally::instrumentation;

    const metrics::ActorRef ref{actor.path, actor.actor_class};
    const uint32_t batch = std::max<uint32_t>(1, options.batch);
    const size_t type_count = options.message_types.size();

    uint64_t events = 0;
    on_actor_created(ref);
    ++events;

    uint32_t sent = 0;
    while (sent < options.messages) {
        uint32_t in_batch = std::min(batch, options.messages - sent);

        std::vector<metrics::Envelope> envelopes;
        envelopes.reserve(in_batch);
        for (uint32_t i = 0; i < in_batch; ++i) {
            std::string_view type;
            if (type_count > 0) {
                type = options.message_types[(sent + i) % type_count];
            }
            envelopes.push_back(metrics::Envelope{type});

            on_envelope_created(&envelopes.back(), core::monotonic_nanos());
            if (options.copy_every > 0 && (sent + i + 1) % options.copy_every == 0) {
                metrics::Envelope copy = envelopes.back();
                on_envelope_copied(&envelopes.back(), &copy, core::monotonic_nanos());
                ++events;
            }
            on_envelope_sent(&envelopes.back(), core::monotonic_nanos());
            on_mailbox_enqueue(ref, static_cast<int64_t>(i + 1));
            events += 3;
        }

        for (uint32_t i = 0; i < in_batch; ++i) {
            const metrics::Envelope* envelope = &envelopes[i];
            on_mailbox_dequeue(ref, static_cast<int64_t>(in_batch - i - 1), envelope);

            int64_t started = core::monotonic_nanos();
            on_processing_started(ref, envelope, started);
            on_processing_finished(ref, envelope, core::monotonic_nanos() - started);
            events += 3;
            ++processed;
        }

        sent += in_batch;
    }

    on_actor_terminated(ref);
    return events + 1;
}

}  // namespace

WorkloadResult run_workload(const WorkloadOptions& options) {
    const uint32_t threads = std::max<uint32_t>(1, options.threads);

    std::atomic<uint64_t> actors_created{0};
    std::atomic<uint64_t> messages_processed{0};
    std::atomic<uint64_t> events_fired{0};

    int64_t start = core::monotonic_nanos();

    std::vector<std::thread> workers;
    workers.reserve(threads);
    for (uint32_t t = 0; t < threads; ++t) {
        workers.emplace_back([&, t] {
            uint64_t processed = 0;
            uint64_t events = 0;
            uint64_t created = 0;

            for (uint32_t a = t; a < options.actors; a += threads) {
                SimulatedActor actor{fmt::format("tally://demo/user/worker-{}", a),
                                     a % 2 == 0 ? "demo::Worker" : "demo::Aggregator"};
                events += drive_actor(actor, options, processed);
                ++created;
            }

            if (options.system_actors) {
                SimulatedActor logger{fmt::format("tally://demo/system/log-{}", t),
                                      "runtime::Logger"};
                WorkloadOptions system_options = options;
                system_options.messages = std::min<uint32_t>(options.messages, 16);
                events += drive_actor(logger, system_options, processed);
                ++created;
            }

            actors_created.fetch_add(created, std::memory_order_relaxed);
            messages_processed.fetch_add(processed, std::memory_order_relaxed);
            events_fired.fetch_add(events, std::memory_order_relaxed);
        });
    }

    for (auto& worker : workers) {
        worker.join();
    }

    WorkloadResult result;
    result.actors_created = actors_created.load(std::memory_order_relaxed);
    result.messages_processed = messages_processed.load(std::memory_order_relaxed);
    result.events_fired = events_fired.load(std::memory_order_relaxed);
    result.elapsed_nanos = core::monotonic_nanos() - start;
    return result;
}

}  // namespace tally::runtime
