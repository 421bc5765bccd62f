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

// Tally In-Memory Backend - Header
// Series store used by tests and by the Prometheus formatter

#pragma once

#include <atomic>
#include <string>
#include <vector>

#include "../core/containers.hpp"
#include "backend.hpp"
#include "primitives.hpp"

namespace tally::metrics {

/// One series (name + tag set) at a point in time
struct SeriesSnapshot {
    std::string name;
    Tags tags;
    MetricKind kind = MetricKind::Counter;
    int64_t value = 0;    // Counter total or gauge value
    TimerSnapshot timer;  // Timer statistics (kind == Timer)
};

/// Thread-safe in-memory backend, one series per distinct (name, kind, tags)
class InMemoryBackend final : public MetricsBackend {
public:
    InMemoryBackend() = default;
    ~InMemoryBackend() override = default;

    // Non-copyable, non-movable
    InMemoryBackend(const InMemoryBackend&) = delete;
    InMemoryBackend& operator=(const InMemoryBackend&) = delete;

    void record_counter(std::string_view name, const Tags& tags, int64_t delta) override;
    void record_gauge(std::string_view name, const Tags& tags, int64_t value) override;
    void adjust_gauge(std::string_view name, const Tags& tags, int64_t delta) override;
    void record_timer(std::string_view name, const Tags& tags, int64_t duration_nanos) override;

    [[nodiscard]] int64_t counter_value(std::string_view name) const override;
    [[nodiscard]] int64_t gauge_value(std::string_view name) const override;
    [[nodiscard]] uint64_t timer_count(std::string_view name) const override;
    [[nodiscard]] int64_t timer_total_time(std::string_view name) const override;

    using MetricsBackend::has_metric_with_tag;
    [[nodiscard]] bool has_metric_with_tag(std::string_view name, std::string_view key,
                                           std::string_view value) const override;

    [[nodiscard]] std::string_view backend_type() const noexcept override { return "in-memory"; }

    /// Any series recorded under name
    [[nodiscard]] bool has_metric(std::string_view name) const;

    /// All series sorted by name, then by canonical tags
    [[nodiscard]] std::vector<SeriesSnapshot> series() const;

    [[nodiscard]] size_t series_count() const { return series_.size(); }

    /// Drop every series (for testing)
    void reset() { series_.clear(); }

private:
    struct Series {
        Series(std::string_view series_name, const Tags& series_tags, MetricKind series_kind)
            : name(series_name), tags(series_tags), kind(series_kind) {}

        const std::string name;
        const Tags tags;
        const MetricKind kind;

        std::atomic<int64_t> value{0};
        std::atomic<uint64_t> count{0};
        std::atomic<int64_t> total_nanos{0};
        std::atomic<int64_t> min_nanos{std::numeric_limits<int64_t>::max()};
        std::atomic<int64_t> max_nanos{0};
    };

    [[nodiscard]] std::shared_ptr<Series> series_for(std::string_view name, const Tags& tags,
                                                     MetricKind kind);

    /// Visit every series of name and kind
    template <typename Fn>
    void for_each_named(std::string_view name, MetricKind kind, Fn&& fn) const {
        series_.for_each([&](const std::string&, const Series& series) {
            if (series.kind == kind && series.name == name) {
                fn(series);
            }
        });
    }

    core::ConcurrentMap<Series> series_;
};

}  // namespace tally::metrics
