// Tally Dispatch Benchmark
// Measures per-event cost of primitives, filtering and registry routing

#include "../src/metrics/filter.hpp"
#include "../src/metrics/in_memory_backend.hpp"
#include "../src/metrics/primitives.hpp"
#include "../src/metrics/registry.hpp"
#include "../src/runtime/simulator.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace tally::metrics;

// Benchmark helper
template<typename Func>
double benchmark(const std::string& name, Func&& func, size_t iterations) {
    (void)name;
    auto start = std::chrono::high_resolution_clock::now();

    for (size_t i = 0; i < iterations; i++) {
        func();
    }

    auto end = std::chrono::high_resolution_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start);
    return static_cast<double>(duration.count()) / iterations;
}

void print_row(const std::string& name, double ns) {
    std::cout << std::setw(40) << std::left << name
              << std::setw(15) << std::right << std::fixed << std::setprecision(2) << ns << "\n";
}

void print_header() {
    std::cout << std::setw(40) << std::left << "Operation"
              << std::setw(15) << std::right << "ns/op" << "\n";
    std::cout << std::string(55, '-') << "\n";
}

void benchmark_primitives() {
    std::cout << "\n=== Primitive Benchmark ===\n";
    const size_t iterations = 2000000;
    print_header();

    Counter counter;
    print_row("Counter::increment (hot key)", benchmark("counter", [&]() {
        counter.increment("demo.protocol.Ping");
    }, iterations));

    Gauge gauge;
    int64_t depth = 0;
    print_row("Gauge::set (hot key)", benchmark("gauge", [&]() {
        gauge.set("Worker", ++depth);
    }, iterations));

    Timer timer;
    int64_t nanos = 0;
    print_row("Timer::record (hot key)", benchmark("timer", [&]() {
        timer.record("Ping", (++nanos) % 5000);
    }, iterations));
}

void benchmark_filter() {
    std::cout << "\n=== Filter Benchmark ===\n";
    const size_t iterations = 1000000;
    print_header();

    FilterEngine pass_through;
    print_row("matches (pass-through)", benchmark("pass", [&]() {
        volatile bool result = pass_through.matches("tally://demo/user/worker-1");
        (void)result;
    }, iterations));

    tally::control::FilterConfig config;
    config.include_actors = {"**/user/**"};
    config.exclude_actors = {"**/system/**", "**/user/worker-?/tmp"};
    FilterEngine globs(config);
    print_row("matches (include + 2 excludes)", benchmark("globs", [&]() {
        volatile bool result = globs.matches("tally://demo/user/worker-1");
        (void)result;
    }, iterations));

    print_row("matches (excluded system path)", benchmark("system", [&]() {
        volatile bool result = globs.matches("tally://demo/system/deadLetters");
        (void)result;
    }, iterations));
}

void benchmark_routing() {
    std::cout << "\n=== Registry Routing Benchmark ===\n";
    const size_t iterations = 1000000;
    print_header();

    EventHub hub;
    auto backend = std::make_shared<InMemoryBackend>();
    auto config = tally::control::MetricsConfiguration::builder()
                      .include_actors({"**/user/**"})
                      .build();
    MetricsRegistry registry(config, backend, hub);
    registry.register_default_modules();

    ActorRef actor{"tally://demo/user/worker-1", "demo::Worker"};
    Envelope envelope{"demo.protocol.Ping"};

    print_row("mailbox enqueue + dequeue", benchmark("mailbox", [&]() {
        hub.on_mailbox_enqueue(actor, 1);
        hub.on_mailbox_dequeue(actor, 0, &envelope);
    }, iterations));

    print_row("processing finished (measured)", benchmark("processing", [&]() {
        hub.on_processing_finished(actor, &envelope, 1200);
    }, iterations));

    ActorRef system_actor{"tally://demo/system/log", "runtime::Logger"};
    print_row("filtered out (system actor)", benchmark("filtered", [&]() {
        hub.on_mailbox_enqueue(system_actor, 1);
    }, iterations));

    auto disabled = tally::control::MetricsConfiguration::builder().enabled(false).build();
    EventHub disabled_hub;
    MetricsRegistry disabled_registry(disabled, backend, disabled_hub);
    disabled_registry.register_default_modules();
    print_row("disabled registry", benchmark("disabled", [&]() {
        disabled_hub.on_mailbox_enqueue(actor, 1);
    }, iterations));
}

void benchmark_workload() {
    std::cout << "\n=== Concurrent Workload Benchmark ===\n";
    std::cout << std::setw(10) << "Threads"
              << std::setw(15) << "Events"
              << std::setw(15) << "ns/event" << "\n";
    std::cout << std::string(40, '-') << "\n";

    auto backend = std::make_shared<InMemoryBackend>();
    MetricsRegistry registry(tally::control::MetricsConfiguration{}, backend);
    registry.register_default_modules();

    for (uint32_t threads : {1u, 2u, 4u, 8u}) {
        tally::runtime::WorkloadOptions options;
        options.actors = 64;
        options.messages = 2000;
        options.threads = threads;

        auto result = tally::runtime::run_workload(options);
        double per_event = result.events_fired == 0
                               ? 0.0
                               : static_cast<double>(result.elapsed_nanos) /
                                     static_cast<double>(result.events_fired);

        std::cout << std::setw(10) << threads
                  << std::setw(15) << result.events_fired
                  << std::setw(15) << std::fixed << std::setprecision(2) << per_event << "\n";
    }
}

int main() {
    std::cout << "Tally Dispatch Performance Benchmark\n";
    std::cout << "====================================\n";

    benchmark_primitives();
    benchmark_filter();
    benchmark_routing();
    benchmark_workload();

    std::cout << "\n";
    return 0;
}
