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

// Tally Metrics Registry - Header
// Owns configuration, modules and backend; routes filtered events to modules

#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string_view>
#include <vector>

#include "../control/config.hpp"
#include "backend.hpp"
#include "events.hpp"
#include "listeners.hpp"
#include "module.hpp"
#include "tags.hpp"

namespace tally::metrics {

/// Metrics registry.
///
/// On construction an internal router is registered with every holder of the hub (the
/// process-wide EventHub unless one is injected). For each event the router:
///   1. returns immediately when metrics are disabled (nothing is registered then either),
///   2. evaluates internal-actor skipping, the filter and sampling once,
///   3. forwards to every module implementing that event's listener interface.
///
/// Configuration errors (bad globs, conflicting filters, bad sampling) throw
/// control::ConfigError from the constructor. Destruction unregisters the router and
/// shuts modules down in reverse registration order.
class MetricsRegistry {
public:
    /// Registry wired into EventHub::global(). A null backend becomes an InMemoryBackend.
    explicit MetricsRegistry(control::MetricsConfiguration config,
                             std::shared_ptr<MetricsBackend> backend = nullptr);

    /// Registry wired into an explicit hub (hub must outlive the registry)
    MetricsRegistry(control::MetricsConfiguration config, std::shared_ptr<MetricsBackend> backend,
                    EventHub& hub);

    ~MetricsRegistry();

    // Non-copyable, non-movable (the hub holds the router by address)
    MetricsRegistry(const MetricsRegistry&) = delete;
    MetricsRegistry& operator=(const MetricsRegistry&) = delete;
    MetricsRegistry(MetricsRegistry&&) = delete;
    MetricsRegistry& operator=(MetricsRegistry&&) = delete;

    /// Initialize and route events to module.
    /// Returns nullptr (module dropped) when configuration disables it or after shutdown.
    /// Throws control::ConfigError on a duplicate module id.
    MetricsModule* register_module(std::unique_ptr<MetricsModule> module);

    /// Construct and register a module, returns it typed (nullptr when disabled)
    template <typename ModuleT, typename... Args>
    ModuleT* emplace_module(Args&&... args) {
        return static_cast<ModuleT*>(
            register_module(std::make_unique<ModuleT>(std::forward<Args>(args)...)));
    }

    /// Register the five built-in modules (those enabled in configuration)
    void register_default_modules();

    [[nodiscard]] const control::MetricsConfiguration& configuration() const noexcept {
        return config_;
    }

    [[nodiscard]] MetricsBackend& backend() const noexcept { return *backend_; }
    [[nodiscard]] std::shared_ptr<MetricsBackend> backend_ptr() const noexcept { return backend_; }

    /// Static tags applied to every exported metric
    [[nodiscard]] const Tags& global_tags() const noexcept { return global_tags_; }

    [[nodiscard]] bool enabled() const noexcept { return config_.enabled(); }

    /// Registered module by id (nullptr if absent)
    [[nodiscard]] MetricsModule* module(std::string_view module_id) const;

    template <typename ModuleT>
    [[nodiscard]] ModuleT* module_as(std::string_view module_id) const {
        return dynamic_cast<ModuleT*>(module(module_id));
    }

    [[nodiscard]] size_t module_count() const;

    /// Whether events of actor would reach modules (enabled, not internal, filter, sampling)
    [[nodiscard]] bool should_instrument(const ActorRef& actor) const;

    /// Module invocations that threw while routing events
    [[nodiscard]] uint64_t failure_count() const noexcept;

    /// Unregister from the hub and shut modules down (idempotent)
    void shutdown();

    [[nodiscard]] bool is_shut_down() const noexcept {
        return shut_down_.load(std::memory_order_acquire);
    }

private:
    class Router;

    control::MetricsConfiguration config_;
    std::shared_ptr<MetricsBackend> backend_;
    EventHub& hub_;
    Tags global_tags_;
    std::shared_ptr<Router> router_;

    mutable std::mutex modules_mutex_;
    std::vector<std::shared_ptr<MetricsModule>> modules_;
    std::atomic<bool> shut_down_{false};
};

}  // namespace tally::metrics
