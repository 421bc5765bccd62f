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

// Tally Configuration - Implementation

#include "config.hpp"

#include <cmath>
#include <cstdio>
#include <fstream>
#include <sstream>

#include "../core/string_utils.hpp"
#include "../metrics/filter.hpp"  // For glob pattern validation

namespace tally::control {

// Validation limits
static constexpr size_t MAX_LEVENSHTEIN_DISTANCE = 3;
static constexpr size_t MAX_SUGGESTIONS = 3;

static const std::vector<std::string> SAMPLING_STRATEGIES = {"always", "never", "rate-based"};
static const std::vector<std::string> LOG_LEVELS = {"debug", "info", "warning", "warn", "error"};
static const std::vector<std::string> LOG_FORMATS = {"text", "json"};

const std::vector<std::string>& known_module_ids() {
    static const std::vector<std::string> ids = {
        std::string(module_ids::ACTOR_LIFECYCLE), std::string(module_ids::MAILBOX),
        std::string(module_ids::PROCESSING_TIME), std::string(module_ids::ENVELOPE_CREATED),
        std::string(module_ids::ENVELOPE_SENT),    std::string(module_ids::ENVELOPE_COPIED)};
    return ids;
}

bool MetricsConfiguration::is_module_enabled(std::string_view module_id) const {
    auto it = modules_.find(std::string(module_id));
    return it == modules_.end() || it->second.enabled;
}

void from_json(const nlohmann::json& j, MetricsConfiguration& c) {
    auto builder = MetricsConfiguration::builder();

    builder.enabled(j.value("enabled", true));

    if (auto it = j.find("tags"); it != j.end() && !it->is_null()) {
        builder.tags(it->get<std::map<std::string, std::string>>());
    }

    if (auto it = j.find("filters"); it != j.end() && !it->is_null()) {
        builder.filters(it->get<FilterConfig>());
    }

    if (auto it = j.find("sampling"); it != j.end() && !it->is_null()) {
        auto sampling = it->get<SamplingConfig>();
        builder.sampling(sampling.strategy, sampling.rate);
    }

    if (auto it = j.find("modules"); it != j.end() && !it->is_null()) {
        for (const auto& [module_id, module_json] : it->items()) {
            builder.module(module_id, module_json.get<ModuleConfig>().enabled);
        }
    }

    builder.skip_internal_actors(
        detail::value_any(j, {"skip_internal_actors", "skipInternalActors"}, true));

    if (auto it = j.find("logging"); it != j.end() && !it->is_null()) {
        builder.logging(it->get<LogConfig>());
    }

    c = builder.build();
}

void to_json(nlohmann::json& j, const MetricsConfiguration& c) {
    nlohmann::json modules = nlohmann::json::object();
    for (const auto& [module_id, module_config] : c.modules()) {
        modules[module_id] = module_config;
    }

    j = nlohmann::json{{"enabled", c.enabled()},
                       {"tags", c.tags()},
                       {"filters", c.filters()},
                       {"sampling", c.sampling()},
                       {"modules", modules},
                       {"skip_internal_actors", c.skip_internal_actors()},
                       {"logging", c.logging()}};
}

// ConfigLoader implementation

std::optional<MetricsConfiguration> ConfigLoader::load_from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        fprintf(stderr, "Cannot open configuration file: %s\n", path_str.c_str());
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string json = buffer.str();

    return load_from_json(json);
}

std::optional<MetricsConfiguration> ConfigLoader::load_from_json(std::string_view json) {
    MetricsConfiguration config;

    try {
        auto j = nlohmann::json::parse(json);
        config = j.get<MetricsConfiguration>();
    } catch (const nlohmann::json::exception& e) {
        fprintf(stderr, "JSON parsing error: %s\n", e.what());
        return std::nullopt;
    }

    auto validation = validate(config);

    if (validation.has_errors()) {
        for (const auto& error : validation.errors) {
            fprintf(stderr, "Configuration error: %s\n", error.c_str());
        }
        return std::nullopt;
    }

    return config;
}

static std::string with_suggestions(std::string message, std::string_view value,
                                    const std::vector<std::string>& candidates) {
    auto similar = core::find_similar_strings(value, candidates, MAX_LEVENSHTEIN_DISTANCE);
    if (similar.size() > MAX_SUGGESTIONS) {
        similar.resize(MAX_SUGGESTIONS);
    }
    if (!similar.empty()) {
        message += ". Did you mean: " + core::join(similar, ", ");
    }
    return message;
}

static bool contains(const std::vector<std::string>& values, std::string_view value) {
    for (const auto& candidate : values) {
        if (candidate == value) return true;
    }
    return false;
}

static void validate_patterns(const std::vector<std::string>& patterns, std::string_view field,
                              ValidationResult& result) {
    for (size_t i = 0; i < patterns.size(); ++i) {
        if (auto problem = metrics::GlobPattern::validate(patterns[i])) {
            result.add_error("filters." + std::string(field) + "[" + std::to_string(i) +
                             "]: invalid pattern '" + patterns[i] + "': " + *problem);
        }
    }
}

ValidationResult ConfigLoader::validate(const MetricsConfiguration& config) {
    ValidationResult result;

    // Filters
    const auto& filters = config.filters();
    validate_patterns(filters.include_actors, "include_actors", result);
    validate_patterns(filters.exclude_actors, "exclude_actors", result);
    validate_patterns(filters.include_messages, "include_messages", result);
    validate_patterns(filters.exclude_messages, "exclude_messages", result);

    if (auto conflict =
            metrics::FilterEngine::find_conflict(filters.include_actors, filters.exclude_actors)) {
        result.add_error("Conflicting actor filters: " + *conflict);
    }
    if (auto conflict = metrics::FilterEngine::find_conflict(filters.include_messages,
                                                             filters.exclude_messages)) {
        result.add_error("Conflicting message filters: " + *conflict);
    }

    // Sampling
    const auto& sampling = config.sampling();
    if (!contains(SAMPLING_STRATEGIES, sampling.strategy)) {
        result.add_error(with_suggestions("Unknown sampling strategy '" + sampling.strategy + "'",
                                          sampling.strategy, SAMPLING_STRATEGIES));
    }
    if (std::isnan(sampling.rate) || sampling.rate < 0.0 || sampling.rate > 1.0) {
        result.add_error("Sampling rate must be between 0.0 and 1.0, got " +
                         std::to_string(sampling.rate));
    }
    if (sampling.strategy == "never" && config.enabled()) {
        result.add_warning("Sampling strategy 'never' records nothing while metrics are enabled");
    }

    // Modules
    for (const auto& [module_id, module_config] : config.modules()) {
        if (!contains(known_module_ids(), module_id)) {
            result.add_warning(with_suggestions("Unknown module '" + module_id + "'", module_id,
                                                known_module_ids()));
        }
    }

    // Static tags
    for (const auto& [key, value] : config.tags()) {
        if (key.empty()) {
            result.add_error("Static tag key cannot be empty");
        } else if (value.empty()) {
            result.add_warning("Static tag '" + key + "' has an empty value");
        }
    }

    // Logging
    const auto& logging = config.logging();
    if (!contains(LOG_LEVELS, logging.level)) {
        result.add_warning(
            with_suggestions("Unknown log level '" + logging.level + "' (using info)",
                             logging.level, LOG_LEVELS));
    }
    if (!contains(LOG_FORMATS, logging.format)) {
        result.add_warning("Unknown log format '" + logging.format + "' (using text)");
    }
    if (logging.output.empty()) {
        result.add_error("Log output cannot be empty (use \"stdout\" or a directory)");
    }
    if (logging.output != "stdout" && logging.rotation.max_size_mb == 0) {
        result.add_error("Log rotation max_size_mb must be > 0");
    }

    return result;
}

std::string ConfigLoader::to_json(const MetricsConfiguration& config) {
    try {
        nlohmann::json j = config;
        return j.dump(2);  // 2-space indentation
    } catch (const nlohmann::json::exception& e) {
        fprintf(stderr, "JSON serialization error: %s\n", e.what());
        return "";
    }
}

}  // namespace tally::control
