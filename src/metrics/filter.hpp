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

// Tally Filter Engine - Header
// Ant-style glob matching over slash-delimited actor paths

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../control/config.hpp"

namespace tally::metrics {

/// Segment kinds of a compiled pattern
enum class SegmentKind : uint8_t {
    Literal,   // Exact text
    Wildcard,  // '*' or '?' inside one segment ("worker-*")
    AnyDepth   // "**": zero or more whole segments
};

struct PatternSegment {
    SegmentKind kind;
    std::string text;
};

/// Pre-compiled glob pattern.
///
/// Grammar (segments split on '/', empty segments ignored):
///   **      zero or more segments
///   *       exactly one segment (or any run of characters inside a segment)
///   ?       one character inside a segment
///   other   literal text
class GlobPattern {
public:
    /// Compile a pattern, throws control::ConfigError when invalid
    explicit GlobPattern(std::string_view pattern);

    /// Describe why a pattern is invalid (nullopt when valid)
    [[nodiscard]] static std::optional<std::string> validate(std::string_view pattern);

    [[nodiscard]] bool matches(std::string_view path) const;

    /// Match an already split path
    [[nodiscard]] bool matches(const std::vector<std::string_view>& parts) const noexcept;

    [[nodiscard]] const std::string& pattern() const noexcept { return pattern_; }
    [[nodiscard]] const std::vector<PatternSegment>& segments() const noexcept { return segments_; }

private:
    std::string pattern_;
    std::vector<PatternSegment> segments_;
};

/// Include/exclude filter over actor paths and message type names.
///
/// Exclusion always wins. An empty include list matches everything.
class FilterEngine {
public:
    /// Match everything
    FilterEngine() = default;

    /// Compile all patterns, throws control::ConfigError on invalid or conflicting patterns
    explicit FilterEngine(const control::FilterConfig& config);

    /// Actor path filter
    [[nodiscard]] bool matches(std::string_view actor_path) const;

    /// Message type filter (the type name is a single segment)
    [[nodiscard]] bool matches_message(std::string_view message_type) const;

    /// True when no rule is configured (every call to matches() returns true)
    [[nodiscard]] bool is_pass_through() const noexcept {
        return include_actors_.empty() && exclude_actors_.empty() && include_messages_.empty() &&
               exclude_messages_.empty();
    }

    /// Describe a pattern present in both lists (nullopt when none)
    [[nodiscard]] static std::optional<std::string> find_conflict(
        const std::vector<std::string>& includes, const std::vector<std::string>& excludes);

private:
    [[nodiscard]] static bool evaluate(const std::vector<GlobPattern>& includes,
                                       const std::vector<GlobPattern>& excludes,
                                       std::string_view subject);

    std::vector<GlobPattern> include_actors_;
    std::vector<GlobPattern> exclude_actors_;
    std::vector<GlobPattern> include_messages_;
    std::vector<GlobPattern> exclude_messages_;
};

}  // namespace tally::metrics
