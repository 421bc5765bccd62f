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

// Tally Envelope Modules - Header
// Per message type timelines of envelope creation, sending and copying

#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include "../listeners.hpp"
#include "../module.hpp"
#include "../primitives.hpp"

namespace tally::metrics {

/// Count plus first and last timestamp per message type simple name
class EnvelopeTimelineModule : public MetricsModule {
public:
    /// Timeline for a message type (nullopt if never observed)
    [[nodiscard]] std::optional<TimelineSnapshot> timeline(std::string_view message_type) const {
        return timeline_.get(message_type);
    }

    [[nodiscard]] uint64_t count(std::string_view message_type) const {
        auto snap = timeline_.get(message_type);
        return snap ? snap->count : 0;
    }

    [[nodiscard]] const EventTimeline& timelines() const noexcept { return timeline_; }

protected:
    explicit EnvelopeTimelineModule(std::string_view metric_name) : metric_name_(metric_name) {}

    void record(const Envelope* envelope, int64_t timestamp_nanos);

private:
    std::string_view metric_name_;
    EventTimeline timeline_;
};

/// Backend metric: actor.envelope.created  counter  (message.type)
class EnvelopeCreatedModule final : public EnvelopeTimelineModule, public EnvelopeCreatedListener {
public:
    static constexpr std::string_view METRIC_CREATED = "actor.envelope.created";

    EnvelopeCreatedModule() : EnvelopeTimelineModule(METRIC_CREATED) {}

    [[nodiscard]] std::string_view module_id() const noexcept override;
    [[nodiscard]] std::string_view description() const noexcept override;

    void on_envelope_created(const Envelope* envelope, int64_t timestamp_nanos) override {
        record(envelope, timestamp_nanos);
    }
};

/// Backend metric: actor.envelope.sent  counter  (message.type)
class EnvelopeSentModule final : public EnvelopeTimelineModule, public EnvelopeSentListener {
public:
    static constexpr std::string_view METRIC_SENT = "actor.envelope.sent";

    EnvelopeSentModule() : EnvelopeTimelineModule(METRIC_SENT) {}

    [[nodiscard]] std::string_view module_id() const noexcept override;
    [[nodiscard]] std::string_view description() const noexcept override;

    void on_envelope_sent(const Envelope* envelope, int64_t timestamp_nanos) override {
        record(envelope, timestamp_nanos);
    }
};

/// Backend metric: actor.envelope.copied  counter  (message.type of the copy)
class EnvelopeCopiedModule final : public EnvelopeTimelineModule, public EnvelopeCopiedListener {
public:
    static constexpr std::string_view METRIC_COPIED = "actor.envelope.copied";

    EnvelopeCopiedModule() : EnvelopeTimelineModule(METRIC_COPIED) {}

    [[nodiscard]] std::string_view module_id() const noexcept override;
    [[nodiscard]] std::string_view description() const noexcept override;

    void on_envelope_copied(const Envelope* /*original*/, const Envelope* copy,
                            int64_t timestamp_nanos) override {
        record(copy, timestamp_nanos);
    }
};

}  // namespace tally::metrics
