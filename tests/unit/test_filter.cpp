// Filter Engine Tests

#include <catch2/catch_test_macros.hpp>

#include "../../src/metrics/filter.hpp"

using namespace tally::metrics;
using tally::control::ConfigError;
using tally::control::FilterConfig;

TEST_CASE("GlobPattern segment wildcards", "[metrics][filter]") {
    SECTION("Literal path") {
        GlobPattern pattern("/user/worker-1");
        REQUIRE(pattern.matches("/user/worker-1"));
        REQUIRE_FALSE(pattern.matches("/user/worker-2"));
        REQUIRE_FALSE(pattern.matches("/user"));
        REQUIRE_FALSE(pattern.matches("/user/worker-1/child"));
    }

    SECTION("Single star matches exactly one segment") {
        GlobPattern pattern("/user/*");
        REQUIRE(pattern.matches("/user/worker-1"));
        REQUIRE(pattern.matches("/user/router"));
        REQUIRE_FALSE(pattern.matches("/user"));
        REQUIRE_FALSE(pattern.matches("/user/router/child"));
    }

    SECTION("Double star matches zero or more segments") {
        GlobPattern pattern("/user/**");
        REQUIRE(pattern.matches("/user"));
        REQUIRE(pattern.matches("/user/worker-1"));
        REQUIRE(pattern.matches("/user/router/child/grandchild"));
        REQUIRE_FALSE(pattern.matches("/system/log"));
    }

    SECTION("Double star in the middle") {
        GlobPattern pattern("**/user/**/worker");
        REQUIRE(pattern.matches("/user/worker"));
        REQUIRE(pattern.matches("tally://app/user/pool/worker"));
        REQUIRE(pattern.matches("tally://app/user/a/b/c/worker"));
        REQUIRE_FALSE(pattern.matches("tally://app/user/a/b/c/router"));
    }

    SECTION("Character wildcards inside a segment") {
        GlobPattern star("/user/worker-*");
        REQUIRE(star.matches("/user/worker-1"));
        REQUIRE(star.matches("/user/worker-"));
        REQUIRE(star.matches("/user/worker-pool-7"));
        REQUIRE_FALSE(star.matches("/user/router-1"));

        GlobPattern question("/user/worker-?");
        REQUIRE(question.matches("/user/worker-1"));
        REQUIRE_FALSE(question.matches("/user/worker-10"));
        REQUIRE_FALSE(question.matches("/user/worker-"));
    }

    SECTION("Empty segments are ignored") {
        GlobPattern pattern("//user///*");
        REQUIRE(pattern.matches("/user/worker-1"));
        REQUIRE(pattern.matches("user/worker-1/"));
    }

    SECTION("Adjacent double stars collapse") {
        GlobPattern pattern("/**/**/user");
        REQUIRE(pattern.segments().size() == 2);
        REQUIRE(pattern.matches("/user"));
        REQUIRE(pattern.matches("/a/b/user"));
    }
}

TEST_CASE("GlobPattern validation", "[metrics][filter]") {
    SECTION("Valid patterns") {
        REQUIRE_FALSE(GlobPattern::validate("**/user/**").has_value());
        REQUIRE_FALSE(GlobPattern::validate("/user/worker-?").has_value());
        REQUIRE_FALSE(GlobPattern::validate("*").has_value());
    }

    SECTION("Empty pattern") {
        REQUIRE(GlobPattern::validate("").has_value());
        REQUIRE(GlobPattern::validate("///").has_value());
        REQUIRE_THROWS_AS(GlobPattern(""), ConfigError);
    }

    SECTION("Triple star") {
        REQUIRE(GlobPattern::validate("/user/***").has_value());
        REQUIRE_THROWS_AS(GlobPattern("/user/***"), ConfigError);
    }

    SECTION("Double star mixed with text") {
        auto error = GlobPattern::validate("/user/worker**");
        REQUIRE(error.has_value());
        REQUIRE(error->find("whole segment") != std::string::npos);
        REQUIRE_THROWS_AS(GlobPattern("a**/user"), ConfigError);
    }
}

TEST_CASE("FilterEngine include and exclude", "[metrics][filter]") {
    SECTION("Default engine matches everything") {
        FilterEngine engine;
        REQUIRE(engine.is_pass_through());
        REQUIRE(engine.matches("/user/worker-1"));
        REQUIRE(engine.matches("/system/deadLetters"));
        REQUIRE(engine.matches_message("demo.Ping"));
    }

    SECTION("User include with system exclude") {
        FilterConfig config;
        config.include_actors = {"**/user/**"};
        config.exclude_actors = {"**/system/**"};
        FilterEngine engine(config);

        REQUIRE_FALSE(engine.is_pass_through());
        REQUIRE(engine.matches("/user/worker-1"));
        REQUIRE_FALSE(engine.matches("/system/deadLetters"));
        REQUIRE_FALSE(engine.matches("/temp/abc"));
    }

    SECTION("Exclude wins over any include") {
        FilterConfig config;
        config.include_actors = {"**/user/**", "/user/worker-1"};
        config.exclude_actors = {"/user/worker-*"};
        FilterEngine engine(config);

        REQUIRE_FALSE(engine.matches("/user/worker-1"));
        REQUIRE(engine.matches("/user/router"));
    }

    SECTION("Only excludes") {
        FilterConfig config;
        config.exclude_actors = {"**/system/**"};
        FilterEngine engine(config);

        REQUIRE(engine.matches("/user/anything"));
        REQUIRE(engine.matches("/remote/node"));
        REQUIRE_FALSE(engine.matches("tally://app/system/log"));
    }

    SECTION("Full actor paths with scheme and system name") {
        FilterConfig config;
        config.include_actors = {"**/user/**"};
        FilterEngine engine(config);

        REQUIRE(engine.matches("tally://demo/user/worker-1"));
        REQUIRE_FALSE(engine.matches("tally://demo/system/log"));
    }
}

TEST_CASE("FilterEngine message filters", "[metrics][filter]") {
    FilterConfig config;
    config.include_messages = {"demo.protocol.*"};
    config.exclude_messages = {"*Tick"};
    FilterEngine engine(config);

    REQUIRE(engine.matches_message("demo.protocol.Ping"));
    REQUIRE_FALSE(engine.matches_message("demo.protocol.Tick"));
    REQUIRE_FALSE(engine.matches_message("other.Ping"));

    // Actor rules untouched
    REQUIRE(engine.matches("/user/worker-1"));
}

TEST_CASE("FilterEngine rejects invalid configuration", "[metrics][filter]") {
    SECTION("Same pattern included and excluded") {
        FilterConfig config;
        config.include_actors = {"**/user/**"};
        config.exclude_actors = {"**/user/**"};
        REQUIRE_THROWS_AS(FilterEngine(config), ConfigError);

        auto conflict = FilterEngine::find_conflict(config.include_actors, config.exclude_actors);
        REQUIRE(conflict.has_value());
        REQUIRE(conflict->find("**/user/**") != std::string::npos);
    }

    SECTION("Conflicting message patterns") {
        FilterConfig config;
        config.include_messages = {"*Ping"};
        config.exclude_messages = {"*Ping"};
        REQUIRE_THROWS_AS(FilterEngine(config), ConfigError);
    }

    SECTION("Invalid glob") {
        FilterConfig config;
        config.include_actors = {"/user/***"};
        REQUIRE_THROWS_AS(FilterEngine(config), ConfigError);
    }
}
