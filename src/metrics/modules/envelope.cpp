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

// Tally Envelope Modules - Implementation

#include "envelope.hpp"

#include "../../control/config.hpp"

namespace tally::metrics {

void EnvelopeTimelineModule::record(const Envelope* envelope, int64_t timestamp_nanos) {
    std::string_view type = message_key(envelope);
    timeline_.record(type, timestamp_nanos);

    if (auto* sink = backend()) {
        sink->record_counter(metric_name_, tags_with(tag_keys::MESSAGE_TYPE, type), 1);
    }
}

std::string_view EnvelopeCreatedModule::module_id() const noexcept {
    return control::module_ids::ENVELOPE_CREATED;
}

std::string_view EnvelopeCreatedModule::description() const noexcept {
    return "Envelope creation count and timeline per message type";
}

std::string_view EnvelopeSentModule::module_id() const noexcept {
    return control::module_ids::ENVELOPE_SENT;
}

std::string_view EnvelopeSentModule::description() const noexcept {
    return "Envelope send count and timeline per message type";
}

std::string_view EnvelopeCopiedModule::module_id() const noexcept {
    return control::module_ids::ENVELOPE_COPIED;
}

std::string_view EnvelopeCopiedModule::description() const noexcept {
    return "Envelope copy count and timeline per message type";
}

}  // namespace tally::metrics
