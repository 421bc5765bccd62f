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

// Tally Metrics Engine - Demo Driver
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <stdexcept>
#include <string>

#include "control/config.hpp"
#include "control/prometheus.hpp"
#include "core/logging.hpp"
#include "metrics/in_memory_backend.hpp"
#include "metrics/registry.hpp"
#include "runtime/simulator.hpp"

namespace {

void print_usage(const char* program) {
    fprintf(stderr,
            "Usage: %s --config <metrics.json> [--actors N] [--messages N] [--threads N]\n"
            "       %s --check <metrics.json>\n",
            program, program);
}

bool parse_count(const char* text, uint32_t& out) {
    char* end = nullptr;
    unsigned long value = std::strtoul(text, &end, 10);
    if (end == text || *end != '\0' || value == 0 || value > 1'000'000) {
        return false;
    }
    out = static_cast<uint32_t>(value);
    return true;
}

void print_validation(const tally::control::ValidationResult& validation) {
    if (!validation.errors.empty()) {
        fprintf(stderr, "Configuration validation errors:\n");
        for (const auto& error : validation.errors) {
            fprintf(stderr, "  - %s\n", error.c_str());
        }
    }
    if (!validation.warnings.empty()) {
        printf("Configuration warnings:\n");
        for (const auto& warning : validation.warnings) {
            printf("  - %s\n", warning.c_str());
        }
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    printf("Tally Metrics Engine v0.1.0\n");
    printf("Actor runtime metrics collection\n\n");

    if (argc < 3 || (std::string(argv[1]) != "--config" && std::string(argv[1]) != "--check")) {
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    bool check_only = std::string(argv[1]) == "--check";
    std::string config_path = argv[2];

    tally::runtime::WorkloadOptions options;
    for (int i = 3; i < argc; ++i) {
        std::string arg = argv[i];
        uint32_t* target = nullptr;
        if (arg == "--actors") {
            target = &options.actors;
        } else if (arg == "--messages") {
            target = &options.messages;
        } else if (arg == "--threads") {
            target = &options.threads;
        } else {
            fprintf(stderr, "Unknown option: %s\n", arg.c_str());
            print_usage(argv[0]);
            return EXIT_FAILURE;
        }

        if (i + 1 >= argc || !parse_count(argv[i + 1], *target)) {
            fprintf(stderr, "Option %s expects a positive number\n", arg.c_str());
            return EXIT_FAILURE;
        }
        ++i;
    }

    printf("Loading configuration from %s...\n", config_path.c_str());
    auto config = tally::control::ConfigLoader::load_from_file(config_path);
    if (!config) {
        fprintf(stderr, "Failed to load configuration\n");
        return EXIT_FAILURE;
    }

    auto validation = tally::control::ConfigLoader::validate(*config);
    print_validation(validation);

    if (check_only) {
        printf("Configuration OK\n");
        return EXIT_SUCCESS;
    }

    tally::logging::init_logging_system();

    int status = EXIT_SUCCESS;
    try {
        tally::logging::init_logger(config->logging());

        auto backend = std::make_shared<tally::metrics::InMemoryBackend>();
        tally::metrics::MetricsRegistry registry(*config, backend);
        registry.register_default_modules();

        printf("Simulating %u actors x %u messages on %u threads...\n", options.actors,
               options.messages, options.threads);
        auto result = tally::runtime::run_workload(options);

        printf("Actors: %llu, messages: %llu, events: %llu, elapsed: %.3f ms\n\n",
               static_cast<unsigned long long>(result.actors_created),
               static_cast<unsigned long long>(result.messages_processed),
               static_cast<unsigned long long>(result.events_fired),
               static_cast<double>(result.elapsed_nanos) / 1e6);

        registry.shutdown();
        printf("%s", tally::control::PrometheusExporter::export_metrics(*backend).c_str());

        if (registry.failure_count() > 0) {
            fprintf(stderr, "Module failures: %llu\n",
                    static_cast<unsigned long long>(registry.failure_count()));
        }
    } catch (const tally::control::ConfigError& e) {
        fprintf(stderr, "Configuration rejected: %s\n", e.what());
        status = EXIT_FAILURE;
    } catch (const std::exception& e) {
        fprintf(stderr, "Error: %s\n", e.what());
        status = EXIT_FAILURE;
    }

    tally::logging::shutdown_logging();
    return status;
}
