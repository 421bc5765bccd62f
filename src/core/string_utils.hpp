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

// String Utilities - Path Segments, Type Names and Fuzzy Matching

#pragma once

#include <algorithm>
#include <string>
#include <string_view>
#include <vector>

namespace tally::core {

/// Split a slash-delimited path into its non-empty segments, appending to out.
/// "pekko://sys/user/a" -> ["pekko:", "sys", "user", "a"]
inline void split_segments(std::string_view path, std::vector<std::string_view>& out) {
    size_t start = 0;
    while (start <= path.size()) {
        size_t end = path.find('/', start);
        if (end == std::string_view::npos) {
            end = path.size();
        }
        if (end > start) {
            out.push_back(path.substr(start, end - start));
        }
        start = end + 1;
    }
}

[[nodiscard]] inline std::vector<std::string_view> split_segments(std::string_view path) {
    std::vector<std::string_view> segments;
    split_segments(path, segments);
    return segments;
}

/// Strip namespace or package qualifiers from a type name.
/// "app::msg::Ping" -> "Ping", "com.example.Ping" -> "Ping", "Outer$Inner" -> "Inner"
[[nodiscard]] inline std::string_view simple_type_name(std::string_view name) noexcept {
    size_t cut = name.find_last_of(".:$");
    if (cut == std::string_view::npos) {
        return name;
    }
    return name.substr(cut + 1);
}

/// Calculate Levenshtein distance between two strings
/// Returns the minimum number of single-character edits (insertions, deletions, substitutions)
/// required to change one string into the other
[[nodiscard]] inline size_t levenshtein_distance(std::string_view s1, std::string_view s2) {
    const size_t len1 = s1.length();
    const size_t len2 = s2.length();

    if (len1 == 0)
        return len2;
    if (len2 == 0)
        return len1;

    // Two rows instead of the full matrix
    std::vector<size_t> prev_row(len2 + 1);
    std::vector<size_t> curr_row(len2 + 1);

    for (size_t j = 0; j <= len2; ++j) {
        prev_row[j] = j;
    }

    for (size_t i = 1; i <= len1; ++i) {
        curr_row[0] = i;

        for (size_t j = 1; j <= len2; ++j) {
            if (s1[i - 1] == s2[j - 1]) {
                curr_row[j] = prev_row[j - 1];
            } else {
                curr_row[j] = 1 + std::min({
                                      prev_row[j],      // delete
                                      curr_row[j - 1],  // insert
                                      prev_row[j - 1]   // substitute
                                  });
            }
        }

        std::swap(prev_row, curr_row);
    }

    return prev_row[len2];
}

/// Find similar strings from a list based on Levenshtein distance
/// Returns strings with edit distance <= max_distance, sorted by distance
[[nodiscard]] inline std::vector<std::string> find_similar_strings(
    std::string_view target, const std::vector<std::string>& candidates, size_t max_distance = 3) {
    std::vector<std::pair<std::string, size_t>> matches;

    for (const auto& candidate : candidates) {
        size_t distance = levenshtein_distance(target, candidate);
        if (distance <= max_distance && distance > 0) {  // distance > 0 excludes exact matches
            matches.emplace_back(candidate, distance);
        }
    }

    std::stable_sort(matches.begin(), matches.end(),
                     [](const auto& a, const auto& b) { return a.second < b.second; });

    std::vector<std::string> result;
    result.reserve(matches.size());
    for (const auto& [str, _] : matches) {
        result.push_back(str);
    }

    return result;
}

/// Join strings with a delimiter
[[nodiscard]] inline std::string join(const std::vector<std::string>& strings,
                                      std::string_view delimiter) {
    if (strings.empty()) {
        return "";
    }

    std::string result = strings[0];
    for (size_t i = 1; i < strings.size(); ++i) {
        result += delimiter;
        result += strings[i];
    }
    return result;
}

}  // namespace tally::core
