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

// Tally Processing Time Module - Header

#pragma once

#include <atomic>
#include <cstdint>
#include <limits>
#include <optional>
#include <string_view>

#include "../../core/clock.hpp"
#include "../../core/containers.hpp"
#include "../listeners.hpp"
#include "../module.hpp"
#include "../primitives.hpp"

namespace tally::metrics {

/// Message processing duration per message type.
///
/// An actor processes one message at a time, so the start timestamp is remembered per
/// actor path. A finished event carrying a measured duration uses it as is; with
/// DURATION_UNMEASURED the duration is the module clock minus the remembered start
/// (hook timestamps are expected on the same monotonic clock).
///
/// Backend metrics:
///   actor.message.processing.time  timer    (actor.class, message.type)
///   actor.message.processed        counter  (actor.class, message.type)
class ProcessingTimeModule final : public MetricsModule,
                                   public ProcessingListener,
                                   public ActorLifecycleListener {
public:
    static constexpr std::string_view METRIC_PROCESSING_TIME = "actor.message.processing.time";
    static constexpr std::string_view METRIC_PROCESSED = "actor.message.processed";

    explicit ProcessingTimeModule(core::NanoClock clock = core::monotonic_nanos);

    [[nodiscard]] std::string_view module_id() const noexcept override;
    [[nodiscard]] std::string_view description() const noexcept override;

    void shutdown() override;

    void on_processing_started(const ActorRef& actor, const Envelope* envelope,
                               int64_t timestamp_nanos) override;
    void on_processing_finished(const ActorRef& actor, const Envelope* envelope,
                                int64_t duration_nanos) override;
    void on_actor_terminated(const ActorRef& actor) override;

    /// Timer for a message type simple name (nullopt if never processed)
    [[nodiscard]] std::optional<TimerSnapshot> processing_time(std::string_view message_type) const {
        return processing_time_.get(message_type);
    }

    [[nodiscard]] std::optional<int64_t> processed_count(std::string_view message_type) const {
        return processed_.get(message_type);
    }

    /// Whether a started message of this actor has not finished yet
    [[nodiscard]] bool in_flight(std::string_view actor_path) const;

    [[nodiscard]] const Timer& processing_times() const noexcept { return processing_time_; }
    [[nodiscard]] const Counter& processed() const noexcept { return processed_; }

private:
    static constexpr int64_t NO_START = std::numeric_limits<int64_t>::min();

    struct StartSlot {
        std::atomic<int64_t> started_at{NO_START};
    };

    core::NanoClock clock_;
    core::ConcurrentMap<StartSlot> starts_;
    Timer processing_time_;
    Counter processed_;
};

}  // namespace tally::metrics
