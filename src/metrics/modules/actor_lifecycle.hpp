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

// Tally Actor Lifecycle Module - Header

#pragma once

#include <cstdint>
#include <string_view>

#include "../listeners.hpp"
#include "../module.hpp"
#include "../primitives.hpp"

namespace tally::metrics {

/// Counts actor creations and terminations and tracks the live actor count.
///
/// Backend metrics:
///   actor.lifecycle.created     counter  (actor.class)
///   actor.lifecycle.terminated  counter  (actor.class)
///   actor.lifecycle.active      gauge    (registry static tags only)
class ActorLifecycleModule final : public MetricsModule, public ActorLifecycleListener {
public:
    static constexpr std::string_view ACTIVE_ACTORS = "active-actors";
    static constexpr std::string_view CREATED_ACTORS = "created-actors-total";
    static constexpr std::string_view TERMINATED_ACTORS = "terminated-actors-total";

    static constexpr std::string_view METRIC_CREATED = "actor.lifecycle.created";
    static constexpr std::string_view METRIC_TERMINATED = "actor.lifecycle.terminated";
    static constexpr std::string_view METRIC_ACTIVE = "actor.lifecycle.active";

    ActorLifecycleModule() = default;

    [[nodiscard]] std::string_view module_id() const noexcept override;
    [[nodiscard]] std::string_view description() const noexcept override;

    void on_actor_created(const ActorRef& actor) override;
    void on_actor_terminated(const ActorRef& actor) override;
    void on_unstarted_cell_replaced(const ActorRef& old_ref, const ActorRef& new_ref) override;

    [[nodiscard]] int64_t active_actors() const {
        return gauges_.get(ACTIVE_ACTORS).value_or(0);
    }

    [[nodiscard]] int64_t created_actors() const {
        return counters_.get(CREATED_ACTORS).value_or(0);
    }

    [[nodiscard]] int64_t terminated_actors() const {
        return counters_.get(TERMINATED_ACTORS).value_or(0);
    }

    /// Creations per actor class simple name
    [[nodiscard]] int64_t created_actors(std::string_view actor_class) const {
        return created_by_class_.get(actor_class).value_or(0);
    }

    [[nodiscard]] const Gauge& gauges() const noexcept { return gauges_; }
    [[nodiscard]] const Counter& counters() const noexcept { return counters_; }

private:
    void push(std::string_view metric, std::string_view actor_class, int64_t active_delta);

    Gauge gauges_;
    Counter counters_;
    Counter created_by_class_;
};

}  // namespace tally::metrics
