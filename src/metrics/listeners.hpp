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

// Tally Listeners - Header
// Event listener interfaces and copy-on-write listener holders

#pragma once

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <string_view>
#include <vector>

#include "events.hpp"

namespace tally::metrics {

// Listener interfaces. One per event category; every callback defaults to a no-op so an
// implementation overrides only what it needs.

class ActorLifecycleListener {
public:
    virtual ~ActorLifecycleListener() = default;

    virtual void on_actor_created(const ActorRef& actor) { (void)actor; }

    virtual void on_actor_terminated(const ActorRef& actor) { (void)actor; }

    /// Placeholder cell swapped for the started cell: same actor, new identity
    virtual void on_unstarted_cell_replaced(const ActorRef& old_ref, const ActorRef& new_ref) {
        (void)old_ref;
        (void)new_ref;
    }
};

class EnvelopeCreatedListener {
public:
    virtual ~EnvelopeCreatedListener() = default;

    virtual void on_envelope_created(const Envelope* envelope, int64_t timestamp_nanos) {
        (void)envelope;
        (void)timestamp_nanos;
    }
};

class EnvelopeSentListener {
public:
    virtual ~EnvelopeSentListener() = default;

    virtual void on_envelope_sent(const Envelope* envelope, int64_t timestamp_nanos) {
        (void)envelope;
        (void)timestamp_nanos;
    }
};

/// An envelope duplicated before delivery. copy carries the message that gets dispatched.
class EnvelopeCopiedListener {
public:
    virtual ~EnvelopeCopiedListener() = default;

    virtual void on_envelope_copied(const Envelope* original, const Envelope* copy,
                                    int64_t timestamp_nanos) {
        (void)original;
        (void)copy;
        (void)timestamp_nanos;
    }
};

class MailboxListener {
public:
    virtual ~MailboxListener() = default;

    virtual void on_mailbox_enqueue(const ActorRef& actor, int64_t new_depth) {
        (void)actor;
        (void)new_depth;
    }

    virtual void on_mailbox_dequeue(const ActorRef& actor, int64_t new_depth,
                                    const Envelope* envelope) {
        (void)actor;
        (void)new_depth;
        (void)envelope;
    }
};

class ProcessingListener {
public:
    virtual ~ProcessingListener() = default;

    virtual void on_processing_started(const ActorRef& actor, const Envelope* envelope,
                                       int64_t timestamp_nanos) {
        (void)actor;
        (void)envelope;
        (void)timestamp_nanos;
    }

    /// duration_nanos is DURATION_UNMEASURED when the hook could not time the call
    virtual void on_processing_finished(const ActorRef& actor, const Envelope* envelope,
                                        int64_t duration_nanos) {
        (void)actor;
        (void)envelope;
        (void)duration_nanos;
    }
};

namespace detail {
/// Log a failed listener invocation (keeps quill out of this header)
void report_listener_failure(std::string_view category, std::string_view event,
                             std::string_view what) noexcept;
}  // namespace detail

/// Process-wide fan-out point for one event category.
///
/// The listener list is copy-on-write: writers (register/unregister/reset) build a new
/// vector under a mutex and publish it atomically; dispatch loads the current snapshot
/// and iterates it without locks or allocation. A dispatch racing with reset() finishes
/// on the snapshot it loaded.
///
/// Dispatch runs listeners synchronously in registration order. A listener that throws
/// is logged and counted, then the next listener runs; nothing propagates to the caller.
template <typename Listener>
class ListenerHolder {
public:
    using ListenerPtr = std::shared_ptr<Listener>;
    using ListenerList = std::vector<ListenerPtr>;

    explicit ListenerHolder(std::string_view category)
        : category_(category), listeners_(std::make_shared<const ListenerList>()) {}

    ~ListenerHolder() = default;

    // Non-copyable, non-movable
    ListenerHolder(const ListenerHolder&) = delete;
    ListenerHolder& operator=(const ListenerHolder&) = delete;
    ListenerHolder(ListenerHolder&&) = delete;
    ListenerHolder& operator=(ListenerHolder&&) = delete;

    /// Append a listener (null is ignored)
    void register_listener(ListenerPtr listener) {
        if (!listener) return;

        std::lock_guard lock(write_mutex_);
        auto current = listeners_.load(std::memory_order_acquire);
        auto next = std::make_shared<ListenerList>(*current);
        next->push_back(std::move(listener));
        listeners_.store(std::move(next), std::memory_order_release);
    }

    /// Remove a listener by identity, returns false if it was not registered
    bool unregister_listener(const Listener* listener) {
        std::lock_guard lock(write_mutex_);
        auto current = listeners_.load(std::memory_order_acquire);
        auto next = std::make_shared<ListenerList>();
        next->reserve(current->size());
        for (const auto& registered : *current) {
            if (registered.get() != listener) {
                next->push_back(registered);
            }
        }
        if (next->size() == current->size()) {
            return false;
        }
        listeners_.store(std::move(next), std::memory_order_release);
        return true;
    }

    /// Remove every listener (test isolation)
    void reset() {
        std::lock_guard lock(write_mutex_);
        listeners_.store(std::make_shared<const ListenerList>(), std::memory_order_release);
    }

    /// Invoke fn(listener) for each registered listener
    template <typename Fn>
    void dispatch(std::string_view event, Fn&& fn) noexcept {
        auto snapshot = listeners_.load(std::memory_order_acquire);
        for (const auto& listener : *snapshot) {
            try {
                fn(*listener);
            } catch (const std::exception& e) {
                record_failure(event, e.what());
            } catch (...) {
                record_failure(event, "non-standard exception");
            }
        }
    }

    [[nodiscard]] size_t size() const noexcept {
        return listeners_.load(std::memory_order_acquire)->size();
    }

    [[nodiscard]] bool empty() const noexcept { return size() == 0; }

    [[nodiscard]] bool contains(const Listener* listener) const noexcept {
        auto snapshot = listeners_.load(std::memory_order_acquire);
        return std::any_of(snapshot->begin(), snapshot->end(),
                           [listener](const ListenerPtr& p) { return p.get() == listener; });
    }

    /// Listener invocations that threw since construction
    [[nodiscard]] uint64_t failure_count() const noexcept {
        return failures_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] std::string_view category() const noexcept { return category_; }

private:
    void record_failure(std::string_view event, std::string_view what) noexcept {
        failures_.fetch_add(1, std::memory_order_relaxed);
        detail::report_listener_failure(category_, event, what);
    }

    std::string_view category_;
    std::atomic<std::shared_ptr<const ListenerList>> listeners_;
    std::mutex write_mutex_;
    std::atomic<uint64_t> failures_{0};
};

using ActorLifecycleHolder = ListenerHolder<ActorLifecycleListener>;
using EnvelopeCreatedHolder = ListenerHolder<EnvelopeCreatedListener>;
using EnvelopeSentHolder = ListenerHolder<EnvelopeSentListener>;
using EnvelopeCopiedHolder = ListenerHolder<EnvelopeCopiedListener>;
using MailboxHolder = ListenerHolder<MailboxListener>;
using ProcessingHolder = ListenerHolder<ProcessingListener>;

/// One holder per event category, with the dispatch entry points.
///
/// EventHub::global() is the process-wide instance reached by the instrumentation layer.
/// Tests construct private hubs and hand them to a registry instead of touching global state.
class EventHub {
public:
    EventHub();
    ~EventHub() = default;

    // Non-copyable, non-movable (holders are referenced by address)
    EventHub(const EventHub&) = delete;
    EventHub& operator=(const EventHub&) = delete;
    EventHub(EventHub&&) = delete;
    EventHub& operator=(EventHub&&) = delete;

    /// Process-wide hub
    [[nodiscard]] static EventHub& global() noexcept;

    [[nodiscard]] ActorLifecycleHolder& actor_lifecycle() noexcept { return actor_lifecycle_; }
    [[nodiscard]] EnvelopeCreatedHolder& envelope_created() noexcept { return envelope_created_; }
    [[nodiscard]] EnvelopeSentHolder& envelope_sent() noexcept { return envelope_sent_; }
    [[nodiscard]] EnvelopeCopiedHolder& envelope_copied() noexcept { return envelope_copied_; }
    [[nodiscard]] MailboxHolder& mailbox() noexcept { return mailbox_; }
    [[nodiscard]] ProcessingHolder& processing() noexcept { return processing_; }

    /// Clear every holder (test isolation)
    void reset();

    /// Sum of failure counts across holders
    [[nodiscard]] uint64_t failure_count() const noexcept;

    // Dispatch entry points
    void on_actor_created(const ActorRef& actor) noexcept;
    void on_actor_terminated(const ActorRef& actor) noexcept;
    void on_unstarted_cell_replaced(const ActorRef& old_ref, const ActorRef& new_ref) noexcept;
    void on_envelope_created(const Envelope* envelope, int64_t timestamp_nanos) noexcept;
    void on_envelope_sent(const Envelope* envelope, int64_t timestamp_nanos) noexcept;
    void on_envelope_copied(const Envelope* original, const Envelope* copy,
                            int64_t timestamp_nanos) noexcept;
    void on_mailbox_enqueue(const ActorRef& actor, int64_t new_depth) noexcept;
    void on_mailbox_dequeue(const ActorRef& actor, int64_t new_depth,
                            const Envelope* envelope) noexcept;
    void on_processing_started(const ActorRef& actor, const Envelope* envelope,
                               int64_t timestamp_nanos) noexcept;
    void on_processing_finished(const ActorRef& actor, const Envelope* envelope,
                                int64_t duration_nanos) noexcept;

private:
    ActorLifecycleHolder actor_lifecycle_;
    EnvelopeCreatedHolder envelope_created_;
    EnvelopeSentHolder envelope_sent_;
    EnvelopeCopiedHolder envelope_copied_;
    MailboxHolder mailbox_;
    ProcessingHolder processing_;
};

}  // namespace tally::metrics
