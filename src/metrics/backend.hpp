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

// Tally Metrics Backend - Header
// Pluggable sink for finalized samples

#pragma once

#include <cstdint>
#include <string_view>

#include "tags.hpp"

namespace tally::metrics {

enum class MetricKind : uint8_t {
    Counter,  // Accumulated deltas
    Gauge,    // Last written value, or the sum of adjustments
    Timer     // Duration statistics
};

[[nodiscard]] constexpr std::string_view to_string(MetricKind kind) noexcept {
    switch (kind) {
        case MetricKind::Counter:
            return "counter";
        case MetricKind::Gauge:
            return "gauge";
        case MetricKind::Timer:
            return "timer";
    }
    return "unknown";
}

/// Export sink.
///
/// Calls arrive on the instrumented runtime's threads; an implementation that does I/O
/// must buffer on its own. Every call carries the registry's static tags merged with the
/// call's dynamic tags (actor.class, message.type).
///
/// Read-back accessors aggregate over every tag combination of a metric name.
class MetricsBackend {
public:
    virtual ~MetricsBackend() = default;

    virtual void record_counter(std::string_view name, const Tags& tags, int64_t delta) = 0;
    virtual void record_gauge(std::string_view name, const Tags& tags, int64_t value) = 0;

    /// Add delta to a gauge. Concurrent adjustments commute, so the gauge ends at the sum
    /// of every delta whatever the interleaving (record_gauge is last-writer-wins).
    virtual void adjust_gauge(std::string_view name, const Tags& tags, int64_t delta) = 0;
    virtual void record_timer(std::string_view name, const Tags& tags, int64_t duration_nanos) = 0;

    [[nodiscard]] virtual int64_t counter_value(std::string_view name) const = 0;
    [[nodiscard]] virtual int64_t gauge_value(std::string_view name) const = 0;
    [[nodiscard]] virtual uint64_t timer_count(std::string_view name) const = 0;
    [[nodiscard]] virtual int64_t timer_total_time(std::string_view name) const = 0;

    /// Any series of name carries tag key with value (an empty value matches any value)
    [[nodiscard]] virtual bool has_metric_with_tag(std::string_view name, std::string_view key,
                                                   std::string_view value) const = 0;

    [[nodiscard]] bool has_metric_with_tag(std::string_view name, std::string_view key) const {
        return has_metric_with_tag(name, key, std::string_view{});
    }

    /// Backend name (for logging)
    [[nodiscard]] virtual std::string_view backend_type() const noexcept = 0;
};

}  // namespace tally::metrics
