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

// Tally Actor Lifecycle Module - Implementation

#include "actor_lifecycle.hpp"

#include "../../control/config.hpp"
#include "../../core/logging.hpp"

namespace tally::metrics {

std::string_view ActorLifecycleModule::module_id() const noexcept {
    return control::module_ids::ACTOR_LIFECYCLE;
}

std::string_view ActorLifecycleModule::description() const noexcept {
    return "Actor creation, termination and live actor count";
}

void ActorLifecycleModule::on_actor_created(const ActorRef& actor) {
    gauges_.add(ACTIVE_ACTORS, 1);
    counters_.increment(CREATED_ACTORS);
    created_by_class_.increment(actor.class_key());
    push(METRIC_CREATED, actor.class_key(), 1);
}

void ActorLifecycleModule::on_actor_terminated(const ActorRef& actor) {
    gauges_.add(ACTIVE_ACTORS, -1);
    counters_.increment(TERMINATED_ACTORS);
    push(METRIC_TERMINATED, actor.class_key(), -1);
}

void ActorLifecycleModule::on_unstarted_cell_replaced(const ActorRef& old_ref,
                                                      const ActorRef& new_ref) {
    // Identity migration of an already counted actor
    if (auto* logger = logging::get_logger()) {
        LOG_DEBUG(logger, "Unstarted cell replaced: {} -> {}", old_ref.resolved_path(),
                  new_ref.resolved_path());
    }
}

void ActorLifecycleModule::push(std::string_view metric, std::string_view actor_class,
                                int64_t active_delta) {
    auto* sink = backend();
    if (sink == nullptr) return;

    sink->record_counter(metric, tags_with(tag_keys::ACTOR_CLASS, actor_class), 1);
    // Deltas commute: the backend gauge always converges to active_actors()
    sink->adjust_gauge(METRIC_ACTIVE, global_tags(), active_delta);
}

}  // namespace tally::metrics
