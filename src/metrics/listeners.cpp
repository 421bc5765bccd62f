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

// Tally Listeners - Implementation

#include "listeners.hpp"

#include "../core/logging.hpp"

namespace tally::metrics {

namespace detail {

void report_listener_failure(std::string_view category, std::string_view event,
                             std::string_view what) noexcept {
    if (auto* logger = logging::get_logger()) {
        LOG_LISTENER_FAILURE(logger, category, event, what);
    }
}

}  // namespace detail

EventHub::EventHub()
    : actor_lifecycle_("actor-lifecycle"),
      envelope_created_("envelope-created"),
      envelope_sent_("envelope-sent"),
      envelope_copied_("envelope-copied"),
      mailbox_("mailbox"),
      processing_("processing") {}

EventHub& EventHub::global() noexcept {
    static EventHub hub;
    return hub;
}

void EventHub::reset() {
    actor_lifecycle_.reset();
    envelope_created_.reset();
    envelope_sent_.reset();
    envelope_copied_.reset();
    mailbox_.reset();
    processing_.reset();
}

uint64_t EventHub::failure_count() const noexcept {
    return actor_lifecycle_.failure_count() + envelope_created_.failure_count() +
           envelope_sent_.failure_count() + envelope_copied_.failure_count() +
           mailbox_.failure_count() + processing_.failure_count();
}

void EventHub::on_actor_created(const ActorRef& actor) noexcept {
    actor_lifecycle_.dispatch("actor_created", [&actor](ActorLifecycleListener& listener) {
        listener.on_actor_created(actor);
    });
}

void EventHub::on_actor_terminated(const ActorRef& actor) noexcept {
    actor_lifecycle_.dispatch("actor_terminated", [&actor](ActorLifecycleListener& listener) {
        listener.on_actor_terminated(actor);
    });
}

void EventHub::on_unstarted_cell_replaced(const ActorRef& old_ref,
                                          const ActorRef& new_ref) noexcept {
    actor_lifecycle_.dispatch("unstarted_cell_replaced",
                              [&old_ref, &new_ref](ActorLifecycleListener& listener) {
                                  listener.on_unstarted_cell_replaced(old_ref, new_ref);
                              });
}

void EventHub::on_envelope_created(const Envelope* envelope, int64_t timestamp_nanos) noexcept {
    envelope_created_.dispatch("envelope_created", [=](EnvelopeCreatedListener& listener) {
        listener.on_envelope_created(envelope, timestamp_nanos);
    });
}

void EventHub::on_envelope_sent(const Envelope* envelope, int64_t timestamp_nanos) noexcept {
    envelope_sent_.dispatch("envelope_sent", [=](EnvelopeSentListener& listener) {
        listener.on_envelope_sent(envelope, timestamp_nanos);
    });
}

void EventHub::on_envelope_copied(const Envelope* original, const Envelope* copy,
                                  int64_t timestamp_nanos) noexcept {
    envelope_copied_.dispatch("envelope_copied", [=](EnvelopeCopiedListener& listener) {
        listener.on_envelope_copied(original, copy, timestamp_nanos);
    });
}

void EventHub::on_mailbox_enqueue(const ActorRef& actor, int64_t new_depth) noexcept {
    mailbox_.dispatch("mailbox_enqueue", [&actor, new_depth](MailboxListener& listener) {
        listener.on_mailbox_enqueue(actor, new_depth);
    });
}

void EventHub::on_mailbox_dequeue(const ActorRef& actor, int64_t new_depth,
                                  const Envelope* envelope) noexcept {
    mailbox_.dispatch("mailbox_dequeue", [&actor, new_depth, envelope](MailboxListener& listener) {
        listener.on_mailbox_dequeue(actor, new_depth, envelope);
    });
}

void EventHub::on_processing_started(const ActorRef& actor, const Envelope* envelope,
                                     int64_t timestamp_nanos) noexcept {
    processing_.dispatch("processing_started",
                         [&actor, envelope, timestamp_nanos](ProcessingListener& listener) {
                             listener.on_processing_started(actor, envelope, timestamp_nanos);
                         });
}

void EventHub::on_processing_finished(const ActorRef& actor, const Envelope* envelope,
                                      int64_t duration_nanos) noexcept {
    processing_.dispatch("processing_finished",
                         [&actor, envelope, duration_nanos](ProcessingListener& listener) {
                             listener.on_processing_finished(actor, envelope, duration_nanos);
                         });
}

}  // namespace tally::metrics
