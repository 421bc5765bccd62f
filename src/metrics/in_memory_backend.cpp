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

// Tally In-Memory Backend - Implementation

#include "in_memory_backend.hpp"

#include <algorithm>
#include <tuple>

namespace tally::metrics {

std::shared_ptr<InMemoryBackend::Series> InMemoryBackend::series_for(std::string_view name,
                                                                     const Tags& tags,
                                                                     MetricKind kind) {
    // Series key "name|kind|canonical tags", built in a per-thread buffer
    thread_local std::string key;
    key.clear();
    key.append(name);
    key += '|';
    key.append(to_string(kind));
    key += '|';
    tags.append_canonical(key);
    return series_.get_or_create(key, name, tags, kind);
}

void InMemoryBackend::record_counter(std::string_view name, const Tags& tags, int64_t delta) {
    series_for(name, tags, MetricKind::Counter)->value.fetch_add(delta, std::memory_order_relaxed);
}

void InMemoryBackend::record_gauge(std::string_view name, const Tags& tags, int64_t value) {
    series_for(name, tags, MetricKind::Gauge)->value.store(value, std::memory_order_relaxed);
}

void InMemoryBackend::adjust_gauge(std::string_view name, const Tags& tags, int64_t delta) {
    series_for(name, tags, MetricKind::Gauge)->value.fetch_add(delta, std::memory_order_relaxed);
}

void InMemoryBackend::record_timer(std::string_view name, const Tags& tags,
                                   int64_t duration_nanos) {
    if (duration_nanos < 0) return;

    auto series = series_for(name, tags, MetricKind::Timer);
    series->total_nanos.fetch_add(duration_nanos, std::memory_order_relaxed);
    atomic_store_min(series->min_nanos, duration_nanos);
    atomic_store_max(series->max_nanos, duration_nanos);
    series->count.fetch_add(1, std::memory_order_release);
}

int64_t InMemoryBackend::counter_value(std::string_view name) const {
    int64_t total = 0;
    for_each_named(name, MetricKind::Counter, [&total](const Series& series) {
        total += series.value.load(std::memory_order_relaxed);
    });
    return total;
}

int64_t InMemoryBackend::gauge_value(std::string_view name) const {
    int64_t total = 0;
    for_each_named(name, MetricKind::Gauge, [&total](const Series& series) {
        total += series.value.load(std::memory_order_relaxed);
    });
    return total;
}

uint64_t InMemoryBackend::timer_count(std::string_view name) const {
    uint64_t total = 0;
    for_each_named(name, MetricKind::Timer, [&total](const Series& series) {
        total += series.count.load(std::memory_order_acquire);
    });
    return total;
}

int64_t InMemoryBackend::timer_total_time(std::string_view name) const {
    int64_t total = 0;
    for_each_named(name, MetricKind::Timer, [&total](const Series& series) {
        total += series.total_nanos.load(std::memory_order_relaxed);
    });
    return total;
}

bool InMemoryBackend::has_metric_with_tag(std::string_view name, std::string_view key,
                                          std::string_view value) const {
    bool found = false;
    series_.for_each([&](const std::string&, const Series& series) {
        if (found || series.name != name) return;
        auto tag_value = series.tags.find(key);
        found = tag_value.has_value() && (value.empty() || *tag_value == value);
    });
    return found;
}

bool InMemoryBackend::has_metric(std::string_view name) const {
    bool found = false;
    series_.for_each([&](const std::string&, const Series& series) {
        found = found || series.name == name;
    });
    return found;
}

std::vector<SeriesSnapshot> InMemoryBackend::series() const {
    std::vector<std::pair<std::string, SeriesSnapshot>> keyed;

    series_.for_each([&keyed](const std::string&, const Series& series) {
        SeriesSnapshot snap;
        snap.name = series.name;
        snap.tags = series.tags;
        snap.kind = series.kind;

        if (series.kind == MetricKind::Timer) {
            snap.timer.count = series.count.load(std::memory_order_acquire);
            if (snap.timer.count == 0) return;  // First record still in flight
            snap.timer.total_nanos = series.total_nanos.load(std::memory_order_relaxed);
            snap.timer.min_nanos = series.min_nanos.load(std::memory_order_relaxed);
            snap.timer.max_nanos = series.max_nanos.load(std::memory_order_relaxed);
        } else {
            snap.value = series.value.load(std::memory_order_relaxed);
        }

        keyed.emplace_back(series.tags.canonical(), std::move(snap));
    });

    std::sort(keyed.begin(), keyed.end(), [](const auto& a, const auto& b) {
        return std::tie(a.second.name, a.second.kind, a.first) <
               std::tie(b.second.name, b.second.kind, b.first);
    });

    std::vector<SeriesSnapshot> result;
    result.reserve(keyed.size());
    for (auto& [_, snap] : keyed) {
        result.push_back(std::move(snap));
    }
    return result;
}

}  // namespace tally::metrics
