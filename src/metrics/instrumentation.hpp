// Tally Instrumentation Entry Points
// Static hooks called by the runtime instrumentation layer. They dispatch through
// EventHub::global() and never throw.

#pragma once

#include <cstdint>

#include "events.hpp"

namespace tally::instrumentation {

using metrics::ActorRef;
using metrics::Envelope;

void on_actor_created(const ActorRef& actor) noexcept;
void on_actor_terminated(const ActorRef& actor) noexcept;
void on_unstarted_cell_replaced(const ActorRef& old_ref, const ActorRef& new_ref) noexcept;

/// envelope may be null (counted under "unknown")
void on_envelope_created(const Envelope* envelope, int64_t timestamp_nanos) noexcept;
void on_envelope_sent(const Envelope* envelope, int64_t timestamp_nanos) noexcept;
void on_envelope_copied(const Envelope* original, const Envelope* copy,
                        int64_t timestamp_nanos) noexcept;

void on_mailbox_enqueue(const ActorRef& actor, int64_t new_depth) noexcept;
void on_mailbox_dequeue(const ActorRef& actor, int64_t new_depth,
                        const Envelope* envelope = nullptr) noexcept;

void on_processing_started(const ActorRef& actor, const Envelope* envelope,
                           int64_t timestamp_nanos) noexcept;
void on_processing_finished(const ActorRef& actor, const Envelope* envelope,
                            int64_t duration_nanos) noexcept;

}  // namespace tally::instrumentation
