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

// Tally Metrics Module - Header
// Base class for units of metric logic

#pragma once

#include <memory>
#include <string_view>

#include "../core/containers.hpp"
#include "backend.hpp"
#include "tags.hpp"

namespace tally::metrics {

class MetricsRegistry;

/// A unit of metric logic.
///
/// A module subscribes to event categories by also deriving from the matching listener
/// interfaces (ActorLifecycleListener, MailboxListener, ...). The registry detects those
/// interfaces at registration and routes filtered events to them; a module never sees an
/// event that failed the registry's filter or sampling.
class MetricsModule {
public:
    virtual ~MetricsModule() = default;

    /// Stable identifier, also the key under "modules" in configuration
    [[nodiscard]] virtual std::string_view module_id() const noexcept = 0;

    [[nodiscard]] virtual std::string_view description() const noexcept = 0;

    /// Called once on registration. Overrides must call the base version first.
    virtual void initialize(MetricsRegistry& registry);

    /// Called once when the registry shuts down. Overrides must call the base version.
    virtual void shutdown();

    [[nodiscard]] bool initialized() const noexcept { return backend_ != nullptr; }

protected:
    /// Export sink (nullptr before initialize)
    [[nodiscard]] MetricsBackend* backend() const noexcept { return backend_.get(); }

    /// Registry static tags
    [[nodiscard]] const Tags& global_tags() const noexcept { return global_tags_; }

    /// Static tags plus one dynamic tag. Built once per distinct value, then reused.
    [[nodiscard]] const Tags& tags_with(std::string_view key, std::string_view value);

    /// Static tags plus two dynamic tags (cached like the single-tag form)
    [[nodiscard]] const Tags& tags_with(std::string_view key1, std::string_view value1,
                                        std::string_view key2, std::string_view value2);

private:
    std::shared_ptr<MetricsBackend> backend_;
    Tags global_tags_;

    // Entries live until the module is destroyed, so references stay valid
    core::ConcurrentMap<Tags> tag_cache_;
};

}  // namespace tally::metrics
