// Sampling Tests

#include <catch2/catch_test_macros.hpp>

#include <string>

#include "../../src/metrics/sampling.hpp"

using namespace tally::metrics;
using tally::control::ConfigError;
using tally::control::SamplingConfig;

TEST_CASE("Sampler factory", "[metrics][sampling]") {
    SECTION("always") {
        auto sampler = make_sampler(SamplingConfig{"always", 1.0});
        REQUIRE(sampler->name() == "always");
        REQUIRE(sampler->should_sample("/user/worker-1"));
    }

    SECTION("never") {
        auto sampler = make_sampler(SamplingConfig{"never", 1.0});
        REQUIRE(sampler->name() == "never");
        REQUIRE_FALSE(sampler->should_sample("/user/worker-1"));
    }

    SECTION("rate-based") {
        auto sampler = make_sampler(SamplingConfig{"rate-based", 0.5});
        REQUIRE(sampler->name() == "rate-based");
    }

    SECTION("Unknown strategy") {
        REQUIRE_THROWS_AS(make_sampler(SamplingConfig{"adaptive", 1.0}), ConfigError);
    }

    SECTION("Rate out of range") {
        REQUIRE_THROWS_AS(make_sampler(SamplingConfig{"rate-based", 1.5}), ConfigError);
        REQUIRE_THROWS_AS(make_sampler(SamplingConfig{"rate-based", -0.1}), ConfigError);
    }
}

TEST_CASE("RateSampler decisions", "[metrics][sampling]") {
    SECTION("Bounds") {
        RateSampler none(0.0);
        RateSampler all(1.0);
        for (int i = 0; i < 100; ++i) {
            std::string key = "/user/worker-" + std::to_string(i);
            REQUIRE_FALSE(none.should_sample(key));
            REQUIRE(all.should_sample(key));
        }
    }

    SECTION("Same key always gets the same answer") {
        RateSampler sampler(0.5);
        for (int i = 0; i < 100; ++i) {
            std::string key = "/user/worker-" + std::to_string(i);
            bool first = sampler.should_sample(key);
            REQUIRE(sampler.should_sample(key) == first);
            REQUIRE(sampler.should_sample(key) == first);
        }
    }

    SECTION("Keeps roughly rate of all keys") {
        RateSampler sampler(0.25);
        int kept = 0;
        constexpr int total = 10000;
        for (int i = 0; i < total; ++i) {
            if (sampler.should_sample("/user/worker-" + std::to_string(i))) {
                ++kept;
            }
        }
        REQUIRE(kept > total * 0.20);
        REQUIRE(kept < total * 0.30);
    }
}
