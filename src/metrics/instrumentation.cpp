#include "instrumentation.hpp"

#include "listeners.hpp"

namespace tally::instrumentation {

using metrics::EventHub;

void on_actor_created(const ActorRef& actor) noexcept {
    EventHub::global().on_actor_created(actor);
}

void on_actor_terminated(const ActorRef& actor) noexcept {
    EventHub::global().on_actor_terminated(actor);
}

void on_unstarted_cell_replaced(const ActorRef& old_ref, const ActorRef& new_ref) noexcept {
    EventHub::global().on_unstarted_cell_replaced(old_ref, new_ref);
}

void on_envelope_created(const Envelope* envelope, int64_t timestamp_nanos) noexcept {
    EventHub::global().on_envelope_created(envelope, timestamp_nanos);
}

void on_envelope_sent(const Envelope* envelope, int64_t timestamp_nanos) noexcept {
    EventHub::global().on_envelope_sent(envelope, timestamp_nanos);
}

void on_envelope_copied(const Envelope* original, const Envelope* copy,
                        int64_t timestamp_nanos) noexcept {
    EventHub::global().on_envelope_copied(original, copy, timestamp_nanos);
}

void on_mailbox_enqueue(const ActorRef& actor, int64_t new_depth) noexcept {
    EventHub::global().on_mailbox_enqueue(actor, new_depth);
}

void on_mailbox_dequeue(const ActorRef& actor, int64_t new_depth,
                        const Envelope* envelope) noexcept {
    EventHub::global().on_mailbox_dequeue(actor, new_depth, envelope);
}

void on_processing_started(const ActorRef& actor, const Envelope* envelope,
                           int64_t timestamp_nanos) noexcept {
    EventHub::global().on_processing_started(actor, envelope, timestamp_nanos);
}

void on_processing_finished(const ActorRef& actor, const Envelope* envelope,
                            int64_t duration_nanos) noexcept {
    EventHub::global().on_processing_finished(actor, envelope, duration_nanos);
}

}  // namespace tally::instrumentation
