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

// Tally Processing Time Module - Implementation

#include "processing_time.hpp"

#include <utility>

#include "../../control/config.hpp"

namespace tally::metrics {

ProcessingTimeModule::ProcessingTimeModule(core::NanoClock clock) : clock_(std::move(clock)) {}

std::string_view ProcessingTimeModule::module_id() const noexcept {
    return control::module_ids::PROCESSING_TIME;
}

std::string_view ProcessingTimeModule::description() const noexcept {
    return "Message processing time and processed count per message type";
}

void ProcessingTimeModule::shutdown() {
    starts_.clear();
    MetricsModule::shutdown();
}

void ProcessingTimeModule::on_processing_started(const ActorRef& actor, const Envelope* envelope,
                                                 int64_t timestamp_nanos) {
    (void)envelope;
    starts_.get_or_create(actor.resolved_path())
        ->started_at.store(timestamp_nanos, std::memory_order_relaxed);
}

void ProcessingTimeModule::on_processing_finished(const ActorRef& actor, const Envelope* envelope,
                                                  int64_t duration_nanos) {
    // The remembered start is consumed either way
    int64_t started_at = NO_START;
    if (auto slot = starts_.find(actor.resolved_path())) {
        started_at = slot->started_at.exchange(NO_START, std::memory_order_relaxed);
    }

    int64_t duration = duration_nanos;
    if (duration < 0 && started_at != NO_START) {
        duration = clock_() - started_at;
    }

    std::string_view type = message_key(envelope);
    processed_.increment(type);

    auto* sink = backend();
    const Tags* tags = nullptr;
    if (sink != nullptr) {
        tags = &tags_with(tag_keys::ACTOR_CLASS, actor.class_key(), tag_keys::MESSAGE_TYPE, type);
        sink->record_counter(METRIC_PROCESSED, *tags, 1);
    }

    if (duration < 0) return;  // Neither measured nor started

    processing_time_.record(type, duration);
    if (sink != nullptr) {
        sink->record_timer(METRIC_PROCESSING_TIME, *tags, duration);
    }
}

void ProcessingTimeModule::on_actor_terminated(const ActorRef& actor) {
    starts_.erase(actor.resolved_path());
}

bool ProcessingTimeModule::in_flight(std::string_view actor_path) const {
    auto slot = starts_.find(actor_path);
    return slot && slot->started_at.load(std::memory_order_relaxed) != NO_START;
}

}  // namespace tally::metrics
