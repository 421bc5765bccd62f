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

// Tally Filter Engine - Implementation

#include "filter.hpp"

#include <algorithm>

#include "../core/containers.hpp"
#include "../core/string_utils.hpp"

namespace tally::metrics {

namespace {

constexpr size_t NPOS = std::string_view::npos;

[[nodiscard]] bool is_wildcard_segment(std::string_view segment) noexcept {
    return segment.find_first_of("*?") != std::string_view::npos;
}

// Greedy wildcard match with single backtrack point ('*' any run, '?' one char)
[[nodiscard]] bool match_wildcard(std::string_view pattern, std::string_view text) noexcept {
    size_t p = 0;
    size_t t = 0;
    size_t star = NPOS;
    size_t mark = 0;

    while (t < text.size()) {
        if (p < pattern.size() && (pattern[p] == '?' || pattern[p] == text[t])) {
            ++p;
            ++t;
        } else if (p < pattern.size() && pattern[p] == '*') {
            star = p++;
            mark = t;
        } else if (star != NPOS) {
            p = star + 1;
            t = ++mark;
        } else {
            return false;
        }
    }

    while (p < pattern.size() && pattern[p] == '*') {
        ++p;
    }
    return p == pattern.size();
}

[[nodiscard]] bool segment_matches(const PatternSegment& segment, std::string_view text) noexcept {
    if (segment.kind == SegmentKind::Literal) {
        return segment.text == text;
    }
    return match_wildcard(segment.text, text);
}

[[nodiscard]] std::vector<GlobPattern> compile_all(const std::vector<std::string>& patterns) {
    std::vector<GlobPattern> compiled;
    compiled.reserve(patterns.size());
    for (const auto& pattern : patterns) {
        compiled.emplace_back(pattern);
    }
    return compiled;
}

}  // namespace

// GlobPattern implementation

std::optional<std::string> GlobPattern::validate(std::string_view pattern) {
    auto segments = core::split_segments(pattern);
    if (segments.empty()) {
        return std::string("pattern is empty");
    }

    for (auto segment : segments) {
        if (segment != "**" && segment.find("**") != std::string_view::npos) {
            return "'**' must be a whole segment in '" + std::string(pattern) + "'";
        }
    }
    return std::nullopt;
}

GlobPattern::GlobPattern(std::string_view pattern) : pattern_(pattern) {
    if (auto error = validate(pattern)) {
        throw control::ConfigError("Invalid glob pattern '" + pattern_ + "': " + *error);
    }

    for (auto segment : core::split_segments(pattern)) {
        if (segment == "**") {
            // Adjacent "**" segments are equivalent to one
            if (!segments_.empty() && segments_.back().kind == SegmentKind::AnyDepth) {
                continue;
            }
            segments_.push_back({SegmentKind::AnyDepth, "**"});
        } else if (is_wildcard_segment(segment)) {
            segments_.push_back({SegmentKind::Wildcard, std::string(segment)});
        } else {
            segments_.push_back({SegmentKind::Literal, std::string(segment)});
        }
    }
}

bool GlobPattern::matches(std::string_view path) const {
    return matches(core::split_segments(path));
}

bool GlobPattern::matches(const std::vector<std::string_view>& parts) const noexcept {
    // Same greedy walk as match_wildcard, one level up: "**" plays the role of '*'
    size_t p = 0;
    size_t s = 0;
    size_t star = NPOS;
    size_t mark = 0;

    while (s < parts.size()) {
        if (p < segments_.size() && segments_[p].kind != SegmentKind::AnyDepth &&
            segment_matches(segments_[p], parts[s])) {
            ++p;
            ++s;
        } else if (p < segments_.size() && segments_[p].kind == SegmentKind::AnyDepth) {
            star = p++;
            mark = s;
        } else if (star != NPOS) {
            p = star + 1;
            s = ++mark;
        } else {
            return false;
        }
    }

    while (p < segments_.size() && segments_[p].kind == SegmentKind::AnyDepth) {
        ++p;
    }
    return p == segments_.size();
}

// FilterEngine implementation

FilterEngine::FilterEngine(const control::FilterConfig& config) {
    if (auto conflict = find_conflict(config.include_actors, config.exclude_actors)) {
        throw control::ConfigError("Conflicting actor filters: " + *conflict);
    }
    if (auto conflict = find_conflict(config.include_messages, config.exclude_messages)) {
        throw control::ConfigError("Conflicting message filters: " + *conflict);
    }

    include_actors_ = compile_all(config.include_actors);
    exclude_actors_ = compile_all(config.exclude_actors);
    include_messages_ = compile_all(config.include_messages);
    exclude_messages_ = compile_all(config.exclude_messages);
}

std::optional<std::string> FilterEngine::find_conflict(const std::vector<std::string>& includes,
                                                       const std::vector<std::string>& excludes) {
    core::fast_set<std::string_view> excluded;
    excluded.reserve(excludes.size());
    for (const auto& pattern : excludes) {
        excluded.emplace(pattern);
    }

    for (const auto& pattern : includes) {
        if (excluded.contains(pattern)) {
            return "pattern '" + pattern + "' is both included and excluded";
        }
    }
    return std::nullopt;
}

bool FilterEngine::matches(std::string_view actor_path) const {
    return evaluate(include_actors_, exclude_actors_, actor_path);
}

bool FilterEngine::matches_message(std::string_view message_type) const {
    return evaluate(include_messages_, exclude_messages_, message_type);
}

bool FilterEngine::evaluate(const std::vector<GlobPattern>& includes,
                            const std::vector<GlobPattern>& excludes, std::string_view subject) {
    if (includes.empty() && excludes.empty()) {
        return true;
    }

    // Split once per event; the buffer is reused so steady state does not allocate
    thread_local std::vector<std::string_view> parts;
    parts.clear();
    core::split_segments(subject, parts);

    for (const auto& pattern : excludes) {
        if (pattern.matches(parts)) {
            return false;
        }
    }

    if (includes.empty()) {
        return true;
    }

    return std::any_of(includes.begin(), includes.end(),
                       [](const GlobPattern& pattern) { return pattern.matches(parts); });
}

}  // namespace tally::metrics
