// Configuration Tests

#include <catch2/catch_test_macros.hpp>

#include <cstdio>
#include <fstream>
#include <string>

#include "../../src/control/config.hpp"

using namespace tally::control;

namespace {

bool any_contains(const std::vector<std::string>& messages, std::string_view needle) {
    for (const auto& message : messages) {
        if (message.find(needle) != std::string::npos) {
            return true;
        }
    }
    return false;
}

ValidationResult validate(const MetricsConfiguration::Builder& builder) {
    return ConfigLoader::validate(builder.build());
}

}  // namespace

TEST_CASE("Configuration defaults", "[config]") {
    MetricsConfiguration config;

    REQUIRE(config.enabled());
    REQUIRE(config.tags().empty());
    REQUIRE(config.filters().empty());
    REQUIRE(config.sampling().strategy == "always");
    REQUIRE(config.sampling().rate == 1.0);
    REQUIRE(config.skip_internal_actors());
    REQUIRE(config.logging().output == "stdout");

    for (const auto& id : known_module_ids()) {
        REQUIRE(config.is_module_enabled(id));
    }

    auto validation = ConfigLoader::validate(config);
    REQUIRE(validation.valid);
    REQUIRE(validation.errors.empty());
    REQUIRE(validation.warnings.empty());
}

TEST_CASE("Configuration builder", "[config]") {
    auto config = MetricsConfiguration::builder()
                      .enabled(false)
                      .tag("env", "test")
                      .include_actors({"**/user/**"})
                      .exclude_messages({"*.Heartbeat"})
                      .sampling("rate-based", 0.25)
                      .module(std::string(module_ids::MAILBOX), false)
                      .skip_internal_actors(false)
                      .build();

    REQUIRE_FALSE(config.enabled());
    REQUIRE(config.tags().at("env") == "test");
    REQUIRE(config.filters().include_actors.size() == 1);
    REQUIRE(config.filters().exclude_messages[0] == "*.Heartbeat");
    REQUIRE(config.sampling().strategy == "rate-based");
    REQUIRE(config.sampling().rate == 0.25);
    REQUIRE_FALSE(config.is_module_enabled(module_ids::MAILBOX));
    REQUIRE(config.is_module_enabled(module_ids::PROCESSING_TIME));
    REQUIRE_FALSE(config.skip_internal_actors());
}

TEST_CASE("Configuration JSON parsing", "[config]") {
    SECTION("snake_case keys") {
        auto config = ConfigLoader::load_from_json(R"({
            "enabled": true,
            "tags": {"env": "prod", "region": "eu-west-1"},
            "filters": {
                "include_actors": ["**/user/**"],
                "exclude_actors": ["**/user/noisy-*"],
                "exclude_messages": ["demo.protocol.Tick"]
            },
            "sampling": {"strategy": "rate-based", "rate": 0.5},
            "modules": {"envelope-created": {"enabled": false}},
            "skip_internal_actors": false,
            "logging": {"level": "debug", "output": "/var/log/tally",
                        "rotation": {"max_size_mb": 50, "max_files": 3}}
        })");

        REQUIRE(config.has_value());
        REQUIRE(config->tags().size() == 2);
        REQUIRE(config->filters().exclude_actors[0] == "**/user/noisy-*");
        REQUIRE(config->sampling().rate == 0.5);
        REQUIRE_FALSE(config->is_module_enabled(module_ids::ENVELOPE_CREATED));
        REQUIRE(config->is_module_enabled(module_ids::ENVELOPE_SENT));
        REQUIRE_FALSE(config->skip_internal_actors());
        REQUIRE(config->logging().level == "debug");
        REQUIRE(config->logging().rotation.max_size_mb == 50);
        REQUIRE(config->logging().rotation.max_files == 3);
    }

    SECTION("camelCase keys") {
        auto config = ConfigLoader::load_from_json(R"({
            "filters": {"includeActors": ["/user/*"], "excludeMessages": ["*.Tick"]},
            "skipInternalActors": false,
            "logging": {"output": "/tmp/tally", "rotation": {"maxSizeMb": 7, "maxFiles": 2}}
        })");

        REQUIRE(config.has_value());
        REQUIRE(config->filters().include_actors[0] == "/user/*");
        REQUIRE(config->filters().exclude_messages[0] == "*.Tick");
        REQUIRE_FALSE(config->skip_internal_actors());
        REQUIRE(config->logging().rotation.max_size_mb == 7);
        REQUIRE(config->logging().rotation.max_files == 2);
    }

    SECTION("Empty object gives defaults") {
        auto config = ConfigLoader::load_from_json("{}");
        REQUIRE(config.has_value());
        REQUIRE(config->enabled());
        REQUIRE(config->sampling().strategy == "always");
    }

    SECTION("Malformed JSON") {
        REQUIRE_FALSE(ConfigLoader::load_from_json("{\"enabled\": ").has_value());
    }

    SECTION("Wrong value type") {
        REQUIRE_FALSE(ConfigLoader::load_from_json(R"({"enabled": "yes"})").has_value());
    }

    SECTION("Invalid configuration is rejected") {
        REQUIRE_FALSE(
            ConfigLoader::load_from_json(R"({"sampling": {"strategy": "sometimes"}})").has_value());
    }
}

TEST_CASE("Configuration JSON serialization", "[config]") {
    auto config = MetricsConfiguration::builder()
                      .tag("env", "test")
                      .exclude_actors({"**/temp/**"})
                      .sampling("rate-based", 0.1)
                      .module("mailbox", false)
                      .build();

    auto json = ConfigLoader::to_json(config);
    REQUIRE(json.find("\"skip_internal_actors\"") != std::string::npos);
    REQUIRE(json.find("\"exclude_actors\"") != std::string::npos);

    auto reloaded = ConfigLoader::load_from_json(json);
    REQUIRE(reloaded.has_value());
    REQUIRE(reloaded->tags() == config.tags());
    REQUIRE(reloaded->filters().exclude_actors == config.filters().exclude_actors);
    REQUIRE(reloaded->sampling().strategy == "rate-based");
    REQUIRE(reloaded->sampling().rate == 0.1);
    REQUIRE_FALSE(reloaded->is_module_enabled("mailbox"));
}

TEST_CASE("Configuration file loading", "[config]") {
    SECTION("Missing file") {
        REQUIRE_FALSE(ConfigLoader::load_from_file("/nonexistent/tally/metrics.json").has_value());
    }

    SECTION("File on disk") {
        std::string path = "/tmp/tally_test_metrics.json";
        {
            std::ofstream out(path);
            out << R"({"tags": {"service": "orders"}, "sampling": {"strategy": "never"}})";
        }

        auto config = ConfigLoader::load_from_file(path);
        std::remove(path.c_str());

        REQUIRE(config.has_value());
        REQUIRE(config->tags().at("service") == "orders");
        REQUIRE(config->sampling().strategy == "never");
    }
}

TEST_CASE("Configuration validation", "[config]") {
    SECTION("Unknown sampling strategy suggests the closest") {
        auto result = validate(MetricsConfiguration::builder().sampling("alway"));
        REQUIRE(result.has_errors());
        REQUIRE(any_contains(result.errors, "Unknown sampling strategy 'alway'"));
        REQUIRE(any_contains(result.errors, "Did you mean: always"));
    }

    SECTION("Rate out of range") {
        REQUIRE(validate(MetricsConfiguration::builder().sampling("rate-based", 1.5))
                    .has_errors());
        REQUIRE(validate(MetricsConfiguration::builder().sampling("rate-based", -0.1))
                    .has_errors());
        REQUIRE_FALSE(validate(MetricsConfiguration::builder().sampling("rate-based", 0.0))
                          .has_errors());
    }

    SECTION("Sampling never only warns") {
        auto result = validate(MetricsConfiguration::builder().sampling("never"));
        REQUIRE_FALSE(result.has_errors());
        REQUIRE(any_contains(result.warnings, "'never'"));
    }

    SECTION("Invalid glob") {
        auto result = validate(MetricsConfiguration::builder().include_actors({"/user/a**b"}));
        REQUIRE(result.has_errors());
        REQUIRE(any_contains(result.errors, "filters.include_actors[0]"));
    }

    SECTION("Empty pattern") {
        auto result =
            validate(MetricsConfiguration::builder().exclude_messages({""}));
        REQUIRE(any_contains(result.errors, "filters.exclude_messages[0]"));
    }

    SECTION("Conflicting filters") {
        auto result = validate(MetricsConfiguration::builder()
                                                 .include_actors({"/user/*"})
                                                 .exclude_actors({"/user/*"})
                                                 .include_messages({"*.Ping"})
                                                 .exclude_messages({"*.Ping"})
                                                 );
        REQUIRE(any_contains(result.errors, "Conflicting actor filters"));
        REQUIRE(any_contains(result.errors, "Conflicting message filters"));
    }

    SECTION("Unknown module only warns, with suggestion") {
        auto result =
            validate(MetricsConfiguration::builder().module("mailbx", true));
        REQUIRE_FALSE(result.has_errors());
        REQUIRE(any_contains(result.warnings, "Unknown module 'mailbx'"));
        REQUIRE(any_contains(result.warnings, "Did you mean: mailbox"));
    }

    SECTION("Static tags") {
        auto empty_key = validate(MetricsConfiguration::builder().tag("", "x"));
        REQUIRE(empty_key.has_errors());

        auto empty_value =
            validate(MetricsConfiguration::builder().tag("env", ""));
        REQUIRE_FALSE(empty_value.has_errors());
        REQUIRE(any_contains(empty_value.warnings, "'env'"));
    }

    SECTION("Logging") {
        LogConfig log_config;
        log_config.level = "verbose";
        log_config.format = "xml";
        auto warnings = validate(MetricsConfiguration::builder().logging(log_config));
        REQUIRE_FALSE(warnings.has_errors());
        REQUIRE(warnings.warnings.size() == 2);

        log_config = LogConfig{};
        log_config.output = "";
        REQUIRE(validate(MetricsConfiguration::builder().logging(log_config))
                    .has_errors());

        log_config = LogConfig{};
        log_config.output = "/var/log/tally";
        log_config.rotation.max_size_mb = 0;
        REQUIRE(validate(MetricsConfiguration::builder().logging(log_config))
                    .has_errors());
    }
}
