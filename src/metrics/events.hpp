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

// Tally Events - identities carried by instrumentation callbacks

#pragma once

#include <cstdint>
#include <string_view>

#include "../core/string_utils.hpp"

namespace tally::metrics {

/// Key used whenever an identity is missing or malformed
inline constexpr std::string_view UNKNOWN = "unknown";

/// Actor identity as seen by the instrumentation layer (borrowed strings).
/// Callbacks must not retain the views past the call.
struct ActorRef {
    std::string_view path;         // e.g. "pekko://app/user/worker-1"
    std::string_view actor_class;  // e.g. "app::Worker"

    [[nodiscard]] std::string_view resolved_path() const noexcept {
        return path.empty() ? UNKNOWN : path;
    }

    [[nodiscard]] std::string_view resolved_class() const noexcept {
        return actor_class.empty() ? UNKNOWN : actor_class;
    }

    /// Metric key for the actor class: simple name, "unknown" when unresolvable
    [[nodiscard]] std::string_view class_key() const noexcept {
        std::string_view simple = core::simple_type_name(resolved_class());
        return simple.empty() ? UNKNOWN : simple;
    }

    /// Runtime-internal actor: system guardian children, temp actors, anonymous children
    [[nodiscard]] bool is_internal() const noexcept {
        bool system = path.find("://") != std::string_view::npos &&
                      path.find("/system/") != std::string_view::npos;
        bool temporary = path.find("/temp/") != std::string_view::npos ||
                         path.find('$') != std::string_view::npos;
        return system || temporary;
    }
};

/// Message wrapper as it moves through the runtime (borrowed strings)
struct Envelope {
    std::string_view message_type;  // Fully qualified type name
};

/// Message type of a possibly absent envelope
[[nodiscard]] inline std::string_view message_type_of(const Envelope* envelope) noexcept {
    if (envelope == nullptr || envelope->message_type.empty()) {
        return UNKNOWN;
    }
    return envelope->message_type;
}

/// Metric key for a message type: simple name, "unknown" when unresolvable
[[nodiscard]] inline std::string_view message_key(const Envelope* envelope) noexcept {
    std::string_view simple = core::simple_type_name(message_type_of(envelope));
    return simple.empty() ? UNKNOWN : simple;
}

/// Sentinel for ProcessingFinished when the hook could not measure the duration
inline constexpr int64_t DURATION_UNMEASURED = -1;

}  // namespace tally::metrics
