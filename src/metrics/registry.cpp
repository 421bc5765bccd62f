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

// Tally Metrics Registry - Implementation

#include "registry.hpp"

#include <fmt/format.h>

#include <stdexcept>

#include "../core/logging.hpp"
#include "../core/string_utils.hpp"
#include "filter.hpp"
#include "in_memory_backend.hpp"
#include "modules/actor_lifecycle.hpp"
#include "modules/envelope.hpp"
#include "modules/mailbox.hpp"
#include "modules/processing_time.hpp"
#include "sampling.hpp"

namespace tally::metrics {

// Router: the registry's single listener on every hub holder.
// Filter and sampling run once per event, then modules of that category are invoked
// through private holders so a throwing module is isolated from the others.
class MetricsRegistry::Router final : public ActorLifecycleListener,
                                      public EnvelopeCreatedListener,
                                      public EnvelopeSentListener,
                                      public EnvelopeCopiedListener,
                                      public MailboxListener,
                                      public ProcessingListener {
public:
    explicit Router(const control::MetricsConfiguration& config)
        : enabled_(config.enabled()),
          skip_internal_(config.skip_internal_actors()),
          filter_(config.filters()),
          sampler_(make_sampler(config.sampling())) {}

    /// Route events to every listener interface module implements
    void attach(const std::shared_ptr<MetricsModule>& module) {
        lifecycle_.register_listener(std::dynamic_pointer_cast<ActorLifecycleListener>(module));
        envelope_created_.register_listener(
            std::dynamic_pointer_cast<EnvelopeCreatedListener>(module));
        envelope_sent_.register_listener(std::dynamic_pointer_cast<EnvelopeSentListener>(module));
        envelope_copied_.register_listener(
            std::dynamic_pointer_cast<EnvelopeCopiedListener>(module));
        mailbox_.register_listener(std::dynamic_pointer_cast<MailboxListener>(module));
        processing_.register_listener(std::dynamic_pointer_cast<ProcessingListener>(module));
    }

    void stop() {
        active_.store(false, std::memory_order_release);
        lifecycle_.reset();
        envelope_created_.reset();
        envelope_sent_.reset();
        envelope_copied_.reset();
        mailbox_.reset();
        processing_.reset();
    }

    [[nodiscard]] bool admits(const ActorRef& actor) const {
        if (!enabled_) return false;
        if (skip_internal_ && actor.is_internal()) return false;
        std::string_view path = actor.resolved_path();
        return filter_.matches(path) && sampler_->should_sample(path);
    }

    [[nodiscard]] bool admits_message(std::string_view message_type) const {
        if (!enabled_) return false;
        return filter_.matches_message(message_type) && sampler_->should_sample(message_type);
    }

    [[nodiscard]] uint64_t failure_count() const noexcept {
        return lifecycle_.failure_count() + envelope_created_.failure_count() +
               envelope_sent_.failure_count() + envelope_copied_.failure_count() +
               mailbox_.failure_count() + processing_.failure_count();
    }

    [[nodiscard]] std::string_view sampler_name() const noexcept { return sampler_->name(); }

    // ActorLifecycleListener

    void on_actor_created(const ActorRef& actor) override {
        if (!routable() || !admits(actor)) return;
        lifecycle_.dispatch("actor_created",
                            [&](ActorLifecycleListener& l) { l.on_actor_created(actor); });
    }

    void on_actor_terminated(const ActorRef& actor) override {
        if (!routable() || !admits(actor)) return;
        lifecycle_.dispatch("actor_terminated",
                            [&](ActorLifecycleListener& l) { l.on_actor_terminated(actor); });
    }

    void on_unstarted_cell_replaced(const ActorRef& old_ref, const ActorRef& new_ref) override {
        if (!routable() || !admits(new_ref)) return;
        lifecycle_.dispatch("unstarted_cell_replaced", [&](ActorLifecycleListener& l) {
            l.on_unstarted_cell_replaced(old_ref, new_ref);
        });
    }

    // Envelope listeners: no actor identity, message type only

    void on_envelope_created(const Envelope* envelope, int64_t timestamp_nanos) override {
        if (!routable() || !admits_message(message_type_of(envelope))) return;
        envelope_created_.dispatch("envelope_created", [&](EnvelopeCreatedListener& l) {
            l.on_envelope_created(envelope, timestamp_nanos);
        });
    }

    void on_envelope_sent(const Envelope* envelope, int64_t timestamp_nanos) override {
        if (!routable() || !admits_message(message_type_of(envelope))) return;
        envelope_sent_.dispatch("envelope_sent", [&](EnvelopeSentListener& l) {
            l.on_envelope_sent(envelope, timestamp_nanos);
        });
    }

    // The copy decides admission: it is the envelope that gets delivered
    void on_envelope_copied(const Envelope* original, const Envelope* copy,
                            int64_t timestamp_nanos) override {
        if (!routable() || !admits_message(message_type_of(copy))) return;
        envelope_copied_.dispatch("envelope_copied", [&](EnvelopeCopiedListener& l) {
            l.on_envelope_copied(original, copy, timestamp_nanos);
        });
    }

    // MailboxListener

    void on_mailbox_enqueue(const ActorRef& actor, int64_t new_depth) override {
        if (!routable() || !admits(actor)) return;
        mailbox_.dispatch("mailbox_enqueue",
                          [&](MailboxListener& l) { l.on_mailbox_enqueue(actor, new_depth); });
    }

    void on_mailbox_dequeue(const ActorRef& actor, int64_t new_depth,
                            const Envelope* envelope) override {
        if (!routable() || !admits(actor)) return;
        mailbox_.dispatch("mailbox_dequeue", [&](MailboxListener& l) {
            l.on_mailbox_dequeue(actor, new_depth, envelope);
        });
    }

    // ProcessingListener: actor path and message type

    void on_processing_started(const ActorRef& actor, const Envelope* envelope,
                               int64_t timestamp_nanos) override {
        if (!routable() || !admits_processing(actor, envelope)) return;
        processing_.dispatch("processing_started", [&](ProcessingListener& l) {
            l.on_processing_started(actor, envelope, timestamp_nanos);
        });
    }

    void on_processing_finished(const ActorRef& actor, const Envelope* envelope,
                                int64_t duration_nanos) override {
        if (!routable() || !admits_processing(actor, envelope)) return;
        processing_.dispatch("processing_finished", [&](ProcessingListener& l) {
            l.on_processing_finished(actor, envelope, duration_nanos);
        });
    }

private:
    [[nodiscard]] bool routable() const noexcept {
        return enabled_ && active_.load(std::memory_order_acquire);
    }

    [[nodiscard]] bool admits_processing(const ActorRef& actor, const Envelope* envelope) const {
        return admits(actor) && filter_.matches_message(message_type_of(envelope));
    }

    const bool enabled_;
    const bool skip_internal_;
    const FilterEngine filter_;
    const std::unique_ptr<Sampler> sampler_;
    std::atomic<bool> active_{true};

    ActorLifecycleHolder lifecycle_{"actor-lifecycle"};
    EnvelopeCreatedHolder envelope_created_{"envelope-created"};
    EnvelopeSentHolder envelope_sent_{"envelope-sent"};
    EnvelopeCopiedHolder envelope_copied_{"envelope-copied"};
    MailboxHolder mailbox_{"mailbox"};
    ProcessingHolder processing_{"processing"};
};

MetricsRegistry::MetricsRegistry(control::MetricsConfiguration config,
                                 std::shared_ptr<MetricsBackend> backend)
    : MetricsRegistry(std::move(config), std::move(backend), EventHub::global()) {}

MetricsRegistry::MetricsRegistry(control::MetricsConfiguration config,
                                 std::shared_ptr<MetricsBackend> backend, EventHub& hub)
    : config_(std::move(config)),
      backend_(backend ? std::move(backend) : std::make_shared<InMemoryBackend>()),
      hub_(hub),
      global_tags_(config_.tags()) {
    auto* logger = logging::get_logger();

    auto validation = control::ConfigLoader::validate(config_);
    if (validation.has_errors()) {
        std::string message =
            "Invalid metrics configuration: " + core::join(validation.errors, "; ");
        if (logger) {
            LOG_ERROR(logger, "{}", message);
        }
        throw control::ConfigError(message);
    }

    router_ = std::make_shared<Router>(config_);

    if (!config_.enabled()) {
        if (logger) {
            LOG_INFO(logger, "Metrics disabled by configuration, no listeners registered");
        }
        return;
    }

    hub_.actor_lifecycle().register_listener(router_);
    hub_.envelope_created().register_listener(router_);
    hub_.envelope_sent().register_listener(router_);
    hub_.envelope_copied().register_listener(router_);
    hub_.mailbox().register_listener(router_);
    hub_.processing().register_listener(router_);

    if (logger) {
        LOG_INFO(logger,
                 "Metrics registry started: backend={}, sampling={}, static_tags={}, "
                 "skip_internal_actors={}",
                 backend_->backend_type(), router_->sampler_name(), global_tags_.canonical(),
                 config_.skip_internal_actors());
    }
}

MetricsRegistry::~MetricsRegistry() {
    shutdown();
}

MetricsModule* MetricsRegistry::register_module(std::unique_ptr<MetricsModule> module) {
    if (!module) {
        throw std::invalid_argument("register_module: module is null");
    }

    auto* logger = logging::get_logger();
    std::string_view id = module->module_id();

    if (!config_.is_module_enabled(id)) {
        if (logger) {
            LOG_INFO(logger, "Module disabled by configuration, not registered: id={}", id);
        }
        return nullptr;
    }

    if (is_shut_down()) {
        if (logger) {
            LOG_WARNING(logger, "Registry shut down, module not registered: id={}", id);
        }
        return nullptr;
    }

    std::lock_guard lock(modules_mutex_);
    for (const auto& existing : modules_) {
        if (existing->module_id() == id) {
            throw control::ConfigError(fmt::format("Duplicate module id: {}", id));
        }
    }

    std::shared_ptr<MetricsModule> shared(std::move(module));
    shared->initialize(*this);
    router_->attach(shared);
    modules_.push_back(shared);
    return shared.get();
}

void MetricsRegistry::register_default_modules() {
    emplace_module<ActorLifecycleModule>();
    emplace_module<MailboxModule>();
    emplace_module<ProcessingTimeModule>();
    emplace_module<EnvelopeCreatedModule>();
    emplace_module<EnvelopeSentModule>();
    emplace_module<EnvelopeCopiedModule>();
}

MetricsModule* MetricsRegistry::module(std::string_view module_id) const {
    std::lock_guard lock(modules_mutex_);
    for (const auto& module : modules_) {
        if (module->module_id() == module_id) {
            return module.get();
        }
    }
    return nullptr;
}

size_t MetricsRegistry::module_count() const {
    std::lock_guard lock(modules_mutex_);
    return modules_.size();
}

bool MetricsRegistry::should_instrument(const ActorRef& actor) const {
    return !is_shut_down() && router_->admits(actor);
}

uint64_t MetricsRegistry::failure_count() const noexcept {
    return router_ ? router_->failure_count() : 0;
}

void MetricsRegistry::shutdown() {
    bool expected = false;
    if (!shut_down_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
        return;
    }

    router_->stop();
    hub_.actor_lifecycle().unregister_listener(router_.get());
    hub_.envelope_created().unregister_listener(router_.get());
    hub_.envelope_sent().unregister_listener(router_.get());
    hub_.envelope_copied().unregister_listener(router_.get());
    hub_.mailbox().unregister_listener(router_.get());
    hub_.processing().unregister_listener(router_.get());

    auto* logger = logging::get_logger();

    std::lock_guard lock(modules_mutex_);
    for (auto it = modules_.rbegin(); it != modules_.rend(); ++it) {
        try {
            (*it)->shutdown();
        } catch (const std::exception& e) {
            if (logger) {
                LOG_ERROR(logger, "Module shutdown failed: id={}, error={}", (*it)->module_id(),
                          e.what());
            }
        }
    }

    if (logger) {
        LOG_INFO(logger, "Metrics registry shut down: modules={}", modules_.size());
    }
}

}  // namespace tally::metrics
