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

// Tally Mailbox Module - Header

#pragma once

#include <atomic>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string_view>

#include "../../core/clock.hpp"
#include "../../core/containers.hpp"
#include "../listeners.hpp"
#include "../module.hpp"
#include "../primitives.hpp"

namespace tally::metrics {

/// Mailbox depth and time spent queued.
///
/// The depth of an actor class is the sum of the last depth reported by each of its live
/// instances. Every hook call moves the class gauge by the difference between the actor's
/// new and previous depth, and a terminated actor's remaining depth is subtracted.
/// Time in mailbox pairs each dequeue with the oldest unmatched enqueue of the same actor
/// (FIFO mailboxes). Pending enqueue timestamps are bounded per actor and dropped when
/// the actor terminates.
///
/// Backend metrics:
///   actor.mailbox.size  gauge  (actor.class)
///   actor.mailbox.time  timer  (actor.class, message.type)
class MailboxModule final : public MetricsModule,
                            public MailboxListener,
                            public ActorLifecycleListener {
public:
    static constexpr size_t DEFAULT_MAX_PENDING = 10000;

    static constexpr std::string_view METRIC_SIZE = "actor.mailbox.size";
    static constexpr std::string_view METRIC_TIME = "actor.mailbox.time";

    explicit MailboxModule(core::NanoClock clock = core::monotonic_nanos,
                           size_t max_pending_per_actor = DEFAULT_MAX_PENDING);

    [[nodiscard]] std::string_view module_id() const noexcept override;
    [[nodiscard]] std::string_view description() const noexcept override;

    /// Drops every per-actor state (pending timestamps and depths)
    void shutdown() override;

    void on_mailbox_enqueue(const ActorRef& actor, int64_t new_depth) override;
    void on_mailbox_dequeue(const ActorRef& actor, int64_t new_depth,
                            const Envelope* envelope) override;
    void on_actor_terminated(const ActorRef& actor) override;

    /// Summed depth of the live instances of an actor class simple name
    [[nodiscard]] std::optional<int64_t> mailbox_depth(std::string_view actor_class) const {
        return depth_.get(actor_class);
    }

    /// Last depth reported for one actor (0 if unknown or terminated)
    [[nodiscard]] int64_t actor_depth(std::string_view actor_path) const;

    [[nodiscard]] std::optional<TimerSnapshot> time_in_mailbox(std::string_view actor_class) const {
        return time_in_mailbox_.get(actor_class);
    }

    /// Enqueue timestamps still waiting for their dequeue
    [[nodiscard]] size_t pending_count(std::string_view actor_path) const;

    /// Timestamps discarded because an actor exceeded max_pending_per_actor
    [[nodiscard]] uint64_t dropped_count() const noexcept {
        return dropped_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] const Gauge& depth() const noexcept { return depth_; }
    [[nodiscard]] const Timer& time_in_mailbox() const noexcept { return time_in_mailbox_; }

private:
    // Per actor instance. terminated is set once and never cleared; hooks racing the
    // termination then leave the class gauge alone.
    struct ActorMailbox {
        std::mutex mutex;
        std::deque<int64_t> timestamps;
        int64_t depth = 0;
        bool terminated = false;
    };

    /// Move the class gauge and the backend gauge by delta
    void adjust_class_depth(std::string_view actor_class, int64_t delta);

    core::NanoClock clock_;
    const size_t max_pending_;

    Gauge depth_;
    Timer time_in_mailbox_;
    core::ConcurrentMap<ActorMailbox> actors_;
    std::atomic<uint64_t> dropped_{0};
};

}  // namespace tally::metrics
