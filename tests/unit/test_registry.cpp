// Metrics Registry Tests

#include <catch2/catch_test_macros.hpp>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "../../src/metrics/in_memory_backend.hpp"
#include "../../src/metrics/modules/actor_lifecycle.hpp"
#include "../../src/metrics/modules/envelope.hpp"
#include "../../src/metrics/modules/mailbox.hpp"
#include "../../src/metrics/modules/processing_time.hpp"
#include "../../src/metrics/registry.hpp"

using namespace tally::metrics;
using tally::control::ConfigError;
using tally::control::MetricsConfiguration;

namespace {

/// Module that records what happens to it
class RecordingModule : public MetricsModule, public ActorLifecycleListener {
public:
    explicit RecordingModule(std::string id, std::vector<std::string>* shutdown_order = nullptr,
                             bool fail_on_create = false)
        : id_(std::move(id)), shutdown_order_(shutdown_order), fail_on_create_(fail_on_create) {}

    std::string_view module_id() const noexcept override { return id_; }
    std::string_view description() const noexcept override { return "recording"; }

    using MetricsModule::tags_with;

    void initialize(MetricsRegistry& registry) override {
        MetricsModule::initialize(registry);
        ++initialize_calls;
    }

    void shutdown() override {
        if (shutdown_order_) shutdown_order_->push_back(id_);
        MetricsModule::shutdown();
    }

    void on_actor_created(const ActorRef&) override {
        ++created;
        if (fail_on_create_) throw std::runtime_error("recording failure");
    }

    int initialize_calls = 0;
    int created = 0;

private:
    std::string id_;
    std::vector<std::string>* shutdown_order_;
    bool fail_on_create_;
};

const ActorRef WORKER_A1{"tally://demo/user/a-1", "demo::A"};
const ActorRef WORKER_A2{"tally://demo/user/a-2", "demo::A"};
const ActorRef WORKER_B1{"tally://demo/user/b-1", "demo::B"};
const ActorRef SYSTEM_LOG{"tally://demo/system/log", "runtime::Logger"};

}  // namespace

TEST_CASE("Registry wires modules into the hub", "[metrics][registry]") {
    EventHub hub;
    auto backend = std::make_shared<InMemoryBackend>();
    MetricsRegistry registry(MetricsConfiguration{}, backend, hub);

    REQUIRE(registry.enabled());
    REQUIRE(&registry.backend() == backend.get());
    REQUIRE(hub.actor_lifecycle().size() == 1);
    REQUIRE(hub.envelope_created().size() == 1);
    REQUIRE(hub.envelope_sent().size() == 1);
    REQUIRE(hub.envelope_copied().size() == 1);
    REQUIRE(hub.mailbox().size() == 1);
    REQUIRE(hub.processing().size() == 1);

    SECTION("Default modules") {
        registry.register_default_modules();
        REQUIRE(registry.module_count() == 6);
        REQUIRE(registry.module_as<ActorLifecycleModule>("actor-lifecycle") != nullptr);
        REQUIRE(registry.module_as<MailboxModule>("mailbox") != nullptr);
        REQUIRE(registry.module_as<ProcessingTimeModule>("processing-time") != nullptr);
        REQUIRE(registry.module_as<EnvelopeCreatedModule>("envelope-created") != nullptr);
        REQUIRE(registry.module_as<EnvelopeSentModule>("envelope-sent") != nullptr);
        REQUIRE(registry.module_as<EnvelopeCopiedModule>("envelope-copied") != nullptr);
        REQUIRE(registry.module("nope") == nullptr);
    }

    SECTION("Registration initializes the module") {
        auto* recorder = registry.emplace_module<RecordingModule>("recorder");
        REQUIRE(recorder != nullptr);
        REQUIRE(recorder->initialize_calls == 1);
        REQUIRE(recorder->initialized());

        hub.on_actor_created(WORKER_A1);
        REQUIRE(recorder->created == 1);
    }

    SECTION("Duplicate module id is a configuration error") {
        registry.emplace_module<RecordingModule>("recorder");
        REQUIRE_THROWS_AS(registry.emplace_module<RecordingModule>("recorder"), ConfigError);
        REQUIRE(registry.module_count() == 1);
    }

    SECTION("Null module is rejected") {
        REQUIRE_THROWS_AS(registry.register_module(nullptr), std::invalid_argument);
    }
}

TEST_CASE("Registry actor scenario", "[metrics][registry]") {
    EventHub hub;
    auto backend = std::make_shared<InMemoryBackend>();
    MetricsRegistry registry(MetricsConfiguration{}, backend, hub);
    registry.register_default_modules();

    auto* lifecycle = registry.module_as<ActorLifecycleModule>("actor-lifecycle");
    auto* sent = registry.module_as<EnvelopeSentModule>("envelope-sent");
    REQUIRE(lifecycle != nullptr);
    REQUIRE(sent != nullptr);

    hub.on_actor_created(WORKER_A1);
    hub.on_actor_created(WORKER_A2);
    hub.on_actor_created(WORKER_B1);

    REQUIRE(lifecycle->active_actors() == 3);
    REQUIRE(lifecycle->created_actors("A") == 2);
    REQUIRE(lifecycle->created_actors("B") == 1);

    hub.on_actor_terminated(WORKER_A1);

    REQUIRE(lifecycle->active_actors() == 2);
    REQUIRE(lifecycle->terminated_actors() == 1);
    REQUIRE(lifecycle->created_actors() == 3);

    // Never sent message type
    REQUIRE_FALSE(sent->timeline("NeverSent").has_value());
    REQUIRE(sent->count("NeverSent") == 0);

    // Backend view
    REQUIRE(backend->gauge_value("actor.lifecycle.active") == 2);
    REQUIRE(backend->counter_value("actor.lifecycle.created") == 3);
    REQUIRE(backend->counter_value("actor.lifecycle.terminated") == 1);
    REQUIRE(backend->has_metric_with_tag("actor.lifecycle.created", "actor.class", "A"));
    REQUIRE(backend->has_metric_with_tag("actor.lifecycle.created", "actor.class", "B"));
}

TEST_CASE("Registry filtering", "[metrics][registry]") {
    EventHub hub;
    auto backend = std::make_shared<InMemoryBackend>();

    SECTION("Include and exclude globs") {
        auto config = MetricsConfiguration::builder()
                          .include_actors({"**/user/**"})
                          .exclude_actors({"**/user/b-*"})
                          .build();
        MetricsRegistry registry(config, backend, hub);
        auto* lifecycle = registry.emplace_module<ActorLifecycleModule>();

        hub.on_actor_created(WORKER_A1);
        hub.on_actor_created(WORKER_B1);
        hub.on_actor_created(ActorRef{"tally://demo/remote/x", "demo::X"});

        REQUIRE(lifecycle->created_actors() == 1);
        REQUIRE(registry.should_instrument(WORKER_A1));
        REQUIRE_FALSE(registry.should_instrument(WORKER_B1));
    }

    SECTION("Internal actors are skipped by default") {
        MetricsRegistry registry(MetricsConfiguration{}, backend, hub);
        auto* lifecycle = registry.emplace_module<ActorLifecycleModule>();

        hub.on_actor_created(SYSTEM_LOG);
        hub.on_actor_created(ActorRef{"tally://demo/temp/ask-1", "runtime::Ask"});

        REQUIRE(lifecycle->created_actors() == 0);
        REQUIRE_FALSE(registry.should_instrument(SYSTEM_LOG));
    }

    SECTION("Internal actors can be instrumented") {
        auto config = MetricsConfiguration::builder().skip_internal_actors(false).build();
        MetricsRegistry registry(config, backend, hub);
        auto* lifecycle = registry.emplace_module<ActorLifecycleModule>();

        hub.on_actor_created(SYSTEM_LOG);
        REQUIRE(lifecycle->created_actors() == 1);
    }

    SECTION("Envelope events filter by message type only") {
        auto config = MetricsConfiguration::builder()
                          .include_actors({"**/user/**"})
                          .exclude_messages({"*Tick"})
                          .build();
        MetricsRegistry registry(config, backend, hub);
        auto* created = registry.emplace_module<EnvelopeCreatedModule>();

        Envelope ping{"demo.Ping"};
        Envelope tick{"demo.Tick"};
        hub.on_envelope_created(&ping, 100);
        hub.on_envelope_created(&tick, 200);

        REQUIRE(created->count("Ping") == 1);
        REQUIRE(created->count("Tick") == 0);
    }

    SECTION("Copied envelopes filter by the copy's message type") {
        auto config = MetricsConfiguration::builder().exclude_messages({"*Tick"}).build();
        MetricsRegistry registry(config, backend, hub);
        auto* copied = registry.emplace_module<EnvelopeCopiedModule>();

        Envelope ping{"demo.Ping"};
        Envelope tick{"demo.Tick"};
        hub.on_envelope_copied(&ping, &ping, 100);
        hub.on_envelope_copied(&tick, &tick, 200);
        hub.on_envelope_copied(&tick, &ping, 300);

        REQUIRE(copied->count("Ping") == 2);
        REQUIRE(copied->count("Tick") == 0);
        REQUIRE(backend->counter_value("actor.envelope.copied") == 2);
    }

    SECTION("Processing events filter by actor and message type") {
        auto config = MetricsConfiguration::builder()
                          .include_actors({"**/user/**"})
                          .include_messages({"demo.Ping"})
                          .build();
        MetricsRegistry registry(config, backend, hub);
        auto* processing = registry.emplace_module<ProcessingTimeModule>();

        Envelope ping{"demo.Ping"};
        Envelope pong{"demo.Pong"};
        hub.on_processing_finished(WORKER_A1, &ping, 100);
        hub.on_processing_finished(WORKER_A1, &pong, 100);
        hub.on_processing_finished(ActorRef{"tally://demo/remote/x", "demo::X"}, &ping, 100);

        REQUIRE(processing->processed_count("Ping") == 1);
        REQUIRE_FALSE(processing->processed_count("Pong").has_value());
    }
}

TEST_CASE("Registry disabled", "[metrics][registry]") {
    EventHub hub;
    auto backend = std::make_shared<InMemoryBackend>();
    auto config = MetricsConfiguration::builder().enabled(false).build();
    MetricsRegistry registry(config, backend, hub);
    registry.register_default_modules();

    REQUIRE_FALSE(registry.enabled());
    REQUIRE(hub.actor_lifecycle().empty());
    REQUIRE(hub.mailbox().empty());

    Envelope ping{"demo.Ping"};
    hub.on_actor_created(WORKER_A1);
    hub.on_envelope_created(&ping, 1);
    hub.on_mailbox_enqueue(WORKER_A1, 1);
    hub.on_processing_finished(WORKER_A1, &ping, 10);

    auto* lifecycle = registry.module_as<ActorLifecycleModule>("actor-lifecycle");
    REQUIRE(lifecycle != nullptr);
    REQUIRE(lifecycle->created_actors() == 0);
    REQUIRE(backend->series_count() == 0);
    REQUIRE_FALSE(registry.should_instrument(WORKER_A1));
}

TEST_CASE("Registry sampling never records nothing", "[metrics][registry]") {
    EventHub hub;
    auto backend = std::make_shared<InMemoryBackend>();
    auto config = MetricsConfiguration::builder().sampling("never").build();
    MetricsRegistry registry(config, backend, hub);
    registry.register_default_modules();

    Envelope ping{"demo.Ping"};
    hub.on_actor_created(WORKER_A1);
    hub.on_envelope_sent(&ping, 1);
    hub.on_mailbox_enqueue(WORKER_A1, 1);
    hub.on_mailbox_dequeue(WORKER_A1, 0, &ping);
    hub.on_processing_finished(WORKER_A1, &ping, 10);

    REQUIRE(backend->series_count() == 0);
}

TEST_CASE("Registry module switches", "[metrics][registry]") {
    EventHub hub;
    auto backend = std::make_shared<InMemoryBackend>();
    auto config = MetricsConfiguration::builder()
                      .module("mailbox", false)
                      .module("envelope-sent", false)
                      .build();
    MetricsRegistry registry(config, backend, hub);
    registry.register_default_modules();

    REQUIRE(registry.module_count() == 4);
    REQUIRE(registry.module("mailbox") == nullptr);
    REQUIRE(registry.module("envelope-sent") == nullptr);
    REQUIRE(registry.emplace_module<MailboxModule>() == nullptr);

    hub.on_mailbox_enqueue(WORKER_A1, 4);
    REQUIRE_FALSE(backend->has_metric("actor.mailbox.size"));

    hub.on_actor_created(WORKER_A1);
    REQUIRE(backend->has_metric("actor.lifecycle.created"));
}

TEST_CASE("Registry rejects invalid configuration", "[metrics][registry]") {
    EventHub hub;

    SECTION("Conflicting filters") {
        auto config = MetricsConfiguration::builder()
                          .include_actors({"**/user/**"})
                          .exclude_actors({"**/user/**"})
                          .build();
        REQUIRE_THROWS_AS(MetricsRegistry(config, nullptr, hub), ConfigError);
    }

    SECTION("Bad glob") {
        auto config = MetricsConfiguration::builder().include_actors({"/user/***"}).build();
        REQUIRE_THROWS_AS(MetricsRegistry(config, nullptr, hub), ConfigError);
    }

    SECTION("Sampling rate out of range") {
        auto config = MetricsConfiguration::builder().sampling("rate-based", 2.0).build();
        REQUIRE_THROWS_AS(MetricsRegistry(config, nullptr, hub), ConfigError);
    }

    SECTION("Unknown sampling strategy") {
        auto config = MetricsConfiguration::builder().sampling("adaptive").build();
        REQUIRE_THROWS_AS(MetricsRegistry(config, nullptr, hub), ConfigError);
    }

    SECTION("Nothing is registered after a rejection") {
        auto config = MetricsConfiguration::builder().sampling("adaptive").build();
        REQUIRE_THROWS(MetricsRegistry(config, nullptr, hub));
        REQUIRE(hub.actor_lifecycle().empty());
    }
}

TEST_CASE("Registry isolates failing modules", "[metrics][registry]") {
    EventHub hub;
    MetricsRegistry registry(MetricsConfiguration{}, nullptr, hub);

    auto* failing = registry.emplace_module<RecordingModule>("failing", nullptr, true);
    auto* healthy = registry.emplace_module<RecordingModule>("healthy");

    REQUIRE_NOTHROW(hub.on_actor_created(WORKER_A1));

    REQUIRE(failing->created == 1);
    REQUIRE(healthy->created == 1);
    REQUIRE(registry.failure_count() == 1);
    REQUIRE(hub.failure_count() == 0);
}

TEST_CASE("Registry static tags", "[metrics][registry]") {
    EventHub hub;
    auto backend = std::make_shared<InMemoryBackend>();
    auto config = MetricsConfiguration::builder().tag("env", "test").tag("node", "n1").build();
    MetricsRegistry registry(config, backend, hub);
    registry.register_default_modules();

    REQUIRE(registry.global_tags().size() == 2);

    hub.on_actor_created(WORKER_A1);

    REQUIRE(backend->has_metric_with_tag("actor.lifecycle.created", "env", "test"));
    REQUIRE(backend->has_metric_with_tag("actor.lifecycle.created", "node", "n1"));
    REQUIRE(backend->has_metric_with_tag("actor.lifecycle.created", "actor.class", "A"));
    REQUIRE(backend->has_metric_with_tag("actor.lifecycle.active", "env"));
    REQUIRE_FALSE(backend->has_metric_with_tag("actor.lifecycle.active", "actor.class"));
}

TEST_CASE("Module tag sets are built once per value", "[metrics][registry]") {
    EventHub hub;
    auto backend = std::make_shared<InMemoryBackend>();
    auto config = MetricsConfiguration::builder().tag("env", "test").build();
    MetricsRegistry registry(config, backend, hub);
    auto* module = registry.emplace_module<RecordingModule>("recorder");

    const Tags& worker = module->tags_with("actor.class", "Worker");
    REQUIRE(&module->tags_with("actor.class", "Worker") == &worker);
    REQUIRE(worker.canonical() == "actor.class=Worker,env=test");

    const Tags& other = module->tags_with("actor.class", "Aggregator");
    REQUIRE(&other != &worker);
    REQUIRE(worker.find("actor.class") == "Worker");

    const Tags& pair = module->tags_with("actor.class", "Worker", "message.type", "Ping");
    REQUIRE(&module->tags_with("actor.class", "Worker", "message.type", "Ping") == &pair);
    REQUIRE(pair.canonical() == "actor.class=Worker,env=test,message.type=Ping");

    SECTION("Repeated events reuse the backend series") {
        registry.register_default_modules();
        Envelope ping{"demo.Ping"};
        hub.on_processing_finished(WORKER_A1, &ping, 10);
        size_t series = backend->series_count();
        for (int i = 0; i < 100; ++i) {
            hub.on_processing_finished(WORKER_A1, &ping, 10);
        }
        REQUIRE(backend->series_count() == series);
    }
}

TEST_CASE("Registry shutdown", "[metrics][registry]") {
    EventHub hub;
    std::vector<std::string> order;

    SECTION("Modules shut down in reverse registration order") {
        MetricsRegistry registry(MetricsConfiguration{}, nullptr, hub);
        registry.emplace_module<RecordingModule>("first", &order);
        registry.emplace_module<RecordingModule>("second", &order);
        registry.emplace_module<RecordingModule>("third", &order);

        registry.shutdown();
        REQUIRE(order == std::vector<std::string>{"third", "second", "first"});

        // Idempotent
        registry.shutdown();
        REQUIRE(order.size() == 3);
        REQUIRE(registry.is_shut_down());
    }

    SECTION("Events after shutdown are ignored") {
        MetricsRegistry registry(MetricsConfiguration{}, nullptr, hub);
        auto* recorder = registry.emplace_module<RecordingModule>("recorder");

        registry.shutdown();
        REQUIRE(hub.actor_lifecycle().empty());

        hub.on_actor_created(WORKER_A1);
        REQUIRE(recorder->created == 0);
        REQUIRE(registry.emplace_module<RecordingModule>("late") == nullptr);
    }

    SECTION("Destruction unregisters and shuts down") {
        {
            MetricsRegistry registry(MetricsConfiguration{}, nullptr, hub);
            registry.emplace_module<RecordingModule>("recorder", &order);
            REQUIRE(hub.processing().size() == 1);
        }
        REQUIRE(order == std::vector<std::string>{"recorder"});
        REQUIRE(hub.actor_lifecycle().empty());
        REQUIRE(hub.processing().empty());
        REQUIRE(hub.envelope_copied().empty());
    }

    SECTION("Two registries on one hub both receive events") {
        MetricsRegistry first(MetricsConfiguration{}, nullptr, hub);
        MetricsRegistry second(MetricsConfiguration{}, nullptr, hub);
        auto* a = first.emplace_module<RecordingModule>("recorder");
        auto* b = second.emplace_module<RecordingModule>("recorder");

        hub.on_actor_created(WORKER_A1);
        REQUIRE(a->created == 1);
        REQUIRE(b->created == 1);
    }
}

TEST_CASE("Registry defaults to an in-memory backend", "[metrics][registry]") {
    EventHub hub;
    MetricsRegistry registry(MetricsConfiguration{}, nullptr, hub);
    REQUIRE(registry.backend().backend_type() == "in-memory");
}
