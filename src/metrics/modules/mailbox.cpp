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

// Tally Mailbox Module - Implementation

#include "mailbox.hpp"

#include <utility>

#include "../../control/config.hpp"
#include "../../core/logging.hpp"

namespace tally::metrics {

MailboxModule::MailboxModule(core::NanoClock clock, size_t max_pending_per_actor)
    : clock_(std::move(clock)),
      max_pending_(max_pending_per_actor == 0 ? 1 : max_pending_per_actor) {}

std::string_view MailboxModule::module_id() const noexcept {
    return control::module_ids::MAILBOX;
}

std::string_view MailboxModule::description() const noexcept {
    return "Mailbox depth and time in mailbox per actor class";
}

void MailboxModule::shutdown() {
    actors_.clear();
    MetricsModule::shutdown();
}

void MailboxModule::on_mailbox_enqueue(const ActorRef& actor, int64_t new_depth) {
    int64_t now = clock_();
    auto mailbox = actors_.get_or_create(actor.resolved_path());

    int64_t delta = 0;
    bool dropped = false;
    {
        std::lock_guard lock(mailbox->mutex);
        if (mailbox->terminated) return;

        delta = new_depth - mailbox->depth;
        mailbox->depth = new_depth;

        if (mailbox->timestamps.size() >= max_pending_) {
            mailbox->timestamps.pop_front();
            dropped = true;
        }
        mailbox->timestamps.push_back(now);
    }

    adjust_class_depth(actor.class_key(), delta);

    if (dropped && dropped_.fetch_add(1, std::memory_order_relaxed) == 0) {
        if (auto* logger = logging::get_logger()) {
            LOG_WARNING(logger,
                        "Mailbox pending timestamps exceeded limit, dropping oldest: actor={}, "
                        "limit={}",
                        actor.resolved_path(), max_pending_);
        }
    }
}

void MailboxModule::on_mailbox_dequeue(const ActorRef& actor, int64_t new_depth,
                                       const Envelope* envelope) {
    auto mailbox = actors_.get_or_create(actor.resolved_path());

    int64_t delta = 0;
    int64_t enqueued_at = 0;
    bool paired = false;
    {
        std::lock_guard lock(mailbox->mutex);
        if (mailbox->terminated) return;

        delta = new_depth - mailbox->depth;
        mailbox->depth = new_depth;

        // Empty when the enqueue predates registration or was dropped
        if (!mailbox->timestamps.empty()) {
            enqueued_at = mailbox->timestamps.front();
            mailbox->timestamps.pop_front();
            paired = true;
        }
    }

    std::string_view actor_class = actor.class_key();
    adjust_class_depth(actor_class, delta);
    if (!paired) return;

    int64_t elapsed = clock_() - enqueued_at;
    if (elapsed < 0) return;

    time_in_mailbox_.record(actor_class, elapsed);
    if (auto* sink = backend()) {
        sink->record_timer(METRIC_TIME,
                           tags_with(tag_keys::ACTOR_CLASS, actor_class, tag_keys::MESSAGE_TYPE,
                                     message_key(envelope)),
                           elapsed);
    }
}

void MailboxModule::on_actor_terminated(const ActorRef& actor) {
    std::string_view path = actor.resolved_path();
    auto mailbox = actors_.find(path);
    if (!mailbox) return;
    actors_.erase(path);

    int64_t remaining = 0;
    {
        std::lock_guard lock(mailbox->mutex);
        if (mailbox->terminated) return;
        mailbox->terminated = true;
        remaining = mailbox->depth;
        mailbox->depth = 0;
        mailbox->timestamps.clear();
    }

    adjust_class_depth(actor.class_key(), -remaining);
}

size_t MailboxModule::pending_count(std::string_view actor_path) const {
    auto mailbox = actors_.find(actor_path);
    if (!mailbox) return 0;
    std::lock_guard lock(mailbox->mutex);
    return mailbox->timestamps.size();
}

int64_t MailboxModule::actor_depth(std::string_view actor_path) const {
    auto mailbox = actors_.find(actor_path);
    if (!mailbox) return 0;
    std::lock_guard lock(mailbox->mutex);
    return mailbox->depth;
}

void MailboxModule::adjust_class_depth(std::string_view actor_class, int64_t delta) {
    depth_.add(actor_class, delta);
    if (auto* sink = backend()) {
        sink->adjust_gauge(METRIC_SIZE, tags_with(tag_keys::ACTOR_CLASS, actor_class), delta);
    }
}

}  // namespace tally::metrics
