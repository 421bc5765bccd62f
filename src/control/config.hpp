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

// Tally Configuration - Header
// Metrics configuration schema using nlohmann/json for serialization

#pragma once

#include <cstdint>
#include <initializer_list>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace tally::control {

/// Raised at registry construction for configuration that cannot be honored
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Module identifiers understood by the configuration
namespace module_ids {
inline constexpr std::string_view ACTOR_LIFECYCLE = "actor-lifecycle";
inline constexpr std::string_view MAILBOX = "mailbox";
inline constexpr std::string_view PROCESSING_TIME = "processing-time";
inline constexpr std::string_view ENVELOPE_CREATED = "envelope-created";
inline constexpr std::string_view ENVELOPE_SENT = "envelope-sent";
inline constexpr std::string_view ENVELOPE_COPIED = "envelope-copied";
}  // namespace module_ids

[[nodiscard]] const std::vector<std::string>& known_module_ids();

/// Actor and message filter rules (glob patterns)
struct FilterConfig {
    std::vector<std::string> include_actors;  // Empty = every actor
    std::vector<std::string> exclude_actors;  // Exclusion always wins
    std::vector<std::string> include_messages;
    std::vector<std::string> exclude_messages;

    [[nodiscard]] bool empty() const noexcept {
        return include_actors.empty() && exclude_actors.empty() && include_messages.empty() &&
               exclude_messages.empty();
    }
};

/// Sampling settings
struct SamplingConfig {
    std::string strategy = "always";  // always, never, rate-based
    double rate = 1.0;                // Used by rate-based, 0.0 - 1.0
};

/// Per-module switch
struct ModuleConfig {
    bool enabled = true;
};

/// Logging configuration
struct LogConfig {
    std::string level = "info";      // debug, info, warning, error
    std::string format = "text";     // json, text (file output only)
    std::string output = "stdout";   // "stdout" or a log directory (tally.log appended)

    struct RotationConfig {
        uint32_t max_size_mb = 100;
        uint32_t max_files = 10;
    } rotation;
};

/// Immutable metrics configuration, consumed once at registry construction
class MetricsConfiguration {
public:
    class Builder;

    /// Defaults: enabled, no tags, no filters, sample everything, every module on
    MetricsConfiguration() = default;

    [[nodiscard]] static Builder builder();

    [[nodiscard]] bool enabled() const noexcept { return enabled_; }
    [[nodiscard]] const std::map<std::string, std::string>& tags() const noexcept { return tags_; }
    [[nodiscard]] const FilterConfig& filters() const noexcept { return filters_; }
    [[nodiscard]] const SamplingConfig& sampling() const noexcept { return sampling_; }
    [[nodiscard]] const std::map<std::string, ModuleConfig>& modules() const noexcept {
        return modules_;
    }
    [[nodiscard]] bool skip_internal_actors() const noexcept { return skip_internal_actors_; }
    [[nodiscard]] const LogConfig& logging() const noexcept { return logging_; }

    /// Modules absent from the modules map are enabled
    [[nodiscard]] bool is_module_enabled(std::string_view module_id) const;

private:
    bool enabled_ = true;
    std::map<std::string, std::string> tags_;
    FilterConfig filters_;
    SamplingConfig sampling_;
    std::map<std::string, ModuleConfig> modules_;
    bool skip_internal_actors_ = true;
    LogConfig logging_;
};

/// Fluent builder for MetricsConfiguration
class MetricsConfiguration::Builder {
public:
    Builder& enabled(bool value) {
        config_.enabled_ = value;
        return *this;
    }

    Builder& tag(std::string key, std::string value) {
        config_.tags_[std::move(key)] = std::move(value);
        return *this;
    }

    Builder& tags(std::map<std::string, std::string> values) {
        config_.tags_ = std::move(values);
        return *this;
    }

    Builder& filters(FilterConfig filters) {
        config_.filters_ = std::move(filters);
        return *this;
    }

    Builder& include_actors(std::vector<std::string> patterns) {
        config_.filters_.include_actors = std::move(patterns);
        return *this;
    }

    Builder& exclude_actors(std::vector<std::string> patterns) {
        config_.filters_.exclude_actors = std::move(patterns);
        return *this;
    }

    Builder& include_messages(std::vector<std::string> patterns) {
        config_.filters_.include_messages = std::move(patterns);
        return *this;
    }

    Builder& exclude_messages(std::vector<std::string> patterns) {
        config_.filters_.exclude_messages = std::move(patterns);
        return *this;
    }

    Builder& sampling(std::string strategy, double rate = 1.0) {
        config_.sampling_.strategy = std::move(strategy);
        config_.sampling_.rate = rate;
        return *this;
    }

    Builder& module(std::string module_id, bool enabled) {
        config_.modules_[std::move(module_id)].enabled = enabled;
        return *this;
    }

    Builder& skip_internal_actors(bool value) {
        config_.skip_internal_actors_ = value;
        return *this;
    }

    Builder& logging(LogConfig log_config) {
        config_.logging_ = std::move(log_config);
        return *this;
    }

    [[nodiscard]] MetricsConfiguration build() const { return config_; }

private:
    MetricsConfiguration config_;
};

inline MetricsConfiguration::Builder MetricsConfiguration::builder() {
    return Builder{};
}

// Custom from_json/to_json (no macros): every field is optional and both
// snake_case and camelCase keys are accepted on input.

namespace detail {

/// First present key wins, otherwise the default
template <typename T>
[[nodiscard]] T value_any(const nlohmann::json& j, std::initializer_list<const char*> keys,
                          T default_value) {
    for (const char* key : keys) {
        auto it = j.find(key);
        if (it != j.end() && !it->is_null()) {
            return it->get<T>();
        }
    }
    return default_value;
}

}  // namespace detail

inline void from_json(const nlohmann::json& j, FilterConfig& f) {
    using strings = std::vector<std::string>;
    f.include_actors = detail::value_any(j, {"include_actors", "includeActors"}, strings{});
    f.exclude_actors = detail::value_any(j, {"exclude_actors", "excludeActors"}, strings{});
    f.include_messages = detail::value_any(j, {"include_messages", "includeMessages"}, strings{});
    f.exclude_messages = detail::value_any(j, {"exclude_messages", "excludeMessages"}, strings{});
}

inline void to_json(nlohmann::json& j, const FilterConfig& f) {
    j = nlohmann::json{{"include_actors", f.include_actors},
                       {"exclude_actors", f.exclude_actors},
                       {"include_messages", f.include_messages},
                       {"exclude_messages", f.exclude_messages}};
}

inline void from_json(const nlohmann::json& j, SamplingConfig& s) {
    s.strategy = j.value("strategy", std::string("always"));
    s.rate = j.value("rate", 1.0);
}

inline void to_json(nlohmann::json& j, const SamplingConfig& s) {
    j = nlohmann::json{{"strategy", s.strategy}, {"rate", s.rate}};
}

inline void from_json(const nlohmann::json& j, ModuleConfig& m) {
    m.enabled = j.value("enabled", true);
}

inline void to_json(nlohmann::json& j, const ModuleConfig& m) {
    j = nlohmann::json{{"enabled", m.enabled}};
}

inline void from_json(const nlohmann::json& j, LogConfig::RotationConfig& r) {
    r.max_size_mb = detail::value_any(j, {"max_size_mb", "maxSizeMb"}, 100u);
    r.max_files = detail::value_any(j, {"max_files", "maxFiles"}, 10u);
}

inline void to_json(nlohmann::json& j, const LogConfig::RotationConfig& r) {
    j = nlohmann::json{{"max_size_mb", r.max_size_mb}, {"max_files", r.max_files}};
}

inline void from_json(const nlohmann::json& j, LogConfig& l) {
    l.level = j.value("level", std::string("info"));
    l.format = j.value("format", std::string("text"));
    l.output = j.value("output", std::string("stdout"));
    l.rotation = j.value("rotation", LogConfig::RotationConfig{});
}

inline void to_json(nlohmann::json& j, const LogConfig& l) {
    j = nlohmann::json{
        {"level", l.level}, {"format", l.format}, {"output", l.output}, {"rotation", l.rotation}};
}

void from_json(const nlohmann::json& j, MetricsConfiguration& c);
void to_json(nlohmann::json& j, const MetricsConfiguration& c);

/// Validation result
struct ValidationResult {
    bool valid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    void add_error(std::string error) {
        valid = false;
        errors.push_back(std::move(error));
    }

    void add_warning(std::string warning) { warnings.push_back(std::move(warning)); }

    [[nodiscard]] bool has_errors() const noexcept { return !valid || !errors.empty(); }
};

/// Configuration loader
class ConfigLoader {
public:
    /// Load configuration from JSON file
    [[nodiscard]] static std::optional<MetricsConfiguration> load_from_file(std::string_view path);

    /// Load configuration from JSON string
    [[nodiscard]] static std::optional<MetricsConfiguration> load_from_json(std::string_view json);

    /// Validate configuration
    [[nodiscard]] static ValidationResult validate(const MetricsConfiguration& config);

    /// Convert configuration to JSON string
    [[nodiscard]] static std::string to_json(const MetricsConfiguration& config);
};

}  // namespace tally::control
