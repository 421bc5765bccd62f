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

// Tally Prometheus Exporter - Header
// Formats backend series in Prometheus text exposition format

#pragma once

#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include "../metrics/in_memory_backend.hpp"

namespace tally::control {

/// Prometheus metric types
enum class PrometheusType {
    Counter,  // Monotonically increasing counter
    Gauge,    // Value that can go up or down
    Summary   // Count and sum of observations
};

/// Prometheus exporter over an InMemoryBackend snapshot.
///
/// Dotted metric names become underscored and prefixed ("actor.mailbox.size" ->
/// "tally_actor_mailbox_size"). Counters get a "_total" suffix. A timer is a summary in
/// nanoseconds (_count, _sum) followed by _min and _max gauges.
class PrometheusExporter {
public:
    PrometheusExporter() = default;
    ~PrometheusExporter() = default;

    // Non-copyable, non-movable
    PrometheusExporter(const PrometheusExporter&) = delete;
    PrometheusExporter& operator=(const PrometheusExporter&) = delete;

    /// Export every series of backend
    [[nodiscard]] static std::string export_metrics(const metrics::InMemoryBackend& backend,
                                                    std::string_view namespace_prefix = "tally") {
        return export_series(backend.series(), namespace_prefix);
    }

    /// Export series sorted by name and kind (as returned by InMemoryBackend::series())
    [[nodiscard]] static std::string export_series(
        const std::vector<metrics::SeriesSnapshot>& series,
        std::string_view namespace_prefix = "tally") {
        std::ostringstream out;

        size_t begin = 0;
        while (begin < series.size()) {
            size_t end = begin + 1;
            while (end < series.size() && series[end].name == series[begin].name &&
                   series[end].kind == series[begin].kind) {
                ++end;
            }
            write_family(out, namespace_prefix, series, begin, end);
            begin = end;
        }

        return out.str();
    }

    /// Metric name restricted to [a-zA-Z0-9_:], never starting with a digit
    [[nodiscard]] static std::string sanitize_name(std::string_view name) {
        std::string out;
        out.reserve(name.size() + 1);
        for (char c : name) {
            bool valid = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                         (c >= '0' && c <= '9') || c == '_' || c == ':';
            out += valid ? c : '_';
        }
        if (!out.empty() && out[0] >= '0' && out[0] <= '9') {
            out.insert(out.begin(), '_');
        }
        return out;
    }

    /// Label value with backslash, double quote and newline escaped
    [[nodiscard]] static std::string escape_label_value(std::string_view value) {
        std::string out;
        out.reserve(value.size());
        for (char c : value) {
            switch (c) {
                case '\\':
                    out += "\\\\";
                    break;
                case '"':
                    out += "\\\"";
                    break;
                case '\n':
                    out += "\\n";
                    break;
                default:
                    out += c;
            }
        }
        return out;
    }

private:
    static void write_family(std::ostringstream& out, std::string_view namespace_prefix,
                             const std::vector<metrics::SeriesSnapshot>& series, size_t begin,
                             size_t end) {
        const auto& first = series[begin];
        std::string base = std::string(namespace_prefix) + "_" + sanitize_name(first.name);

        switch (first.kind) {
            case metrics::MetricKind::Counter: {
                std::string name = base + "_total";
                write_header(out, name, first.name, PrometheusType::Counter);
                for (size_t i = begin; i < end; ++i) {
                    write_sample(out, name, series[i].tags, series[i].value);
                }
                break;
            }
            case metrics::MetricKind::Gauge:
                write_header(out, base, first.name, PrometheusType::Gauge);
                for (size_t i = begin; i < end; ++i) {
                    write_sample(out, base, series[i].tags, series[i].value);
                }
                break;
            case metrics::MetricKind::Timer: {
                std::string name = base + "_nanoseconds";
                write_header(out, name, first.name, PrometheusType::Summary);
                for (size_t i = begin; i < end; ++i) {
                    write_sample(out, name + "_count", series[i].tags,
                                 static_cast<int64_t>(series[i].timer.count));
                    write_sample(out, name + "_sum", series[i].tags, series[i].timer.total_nanos);
                }
                write_header(out, name + "_min", first.name, PrometheusType::Gauge);
                for (size_t i = begin; i < end; ++i) {
                    write_sample(out, name + "_min", series[i].tags, series[i].timer.min_nanos);
                }
                write_header(out, name + "_max", first.name, PrometheusType::Gauge);
                for (size_t i = begin; i < end; ++i) {
                    write_sample(out, name + "_max", series[i].tags, series[i].timer.max_nanos);
                }
                break;
            }
        }
    }

    /// Write HELP and TYPE lines
    static void write_header(std::ostringstream& out, std::string_view name, std::string_view help,
                             PrometheusType type) {
        out << "# HELP " << name << " " << help << "\n";

        out << "# TYPE " << name << " ";
        switch (type) {
            case PrometheusType::Counter:
                out << "counter";
                break;
            case PrometheusType::Gauge:
                out << "gauge";
                break;
            case PrometheusType::Summary:
                out << "summary";
                break;
        }
        out << "\n";
    }

    static void write_sample(std::ostringstream& out, std::string_view name,
                             const metrics::Tags& tags, int64_t value) {
        out << name;

        if (!tags.empty()) {
            out << "{";
            bool first = true;
            for (const auto& tag : tags) {
                if (!first) {
                    out << ",";
                }
                out << sanitize_name(tag.key) << "=\"" << escape_label_value(tag.value) << "\"";
                first = false;
            }
            out << "}";
        }

        out << " " << value << "\n";
    }
};

}  // namespace tally::control
