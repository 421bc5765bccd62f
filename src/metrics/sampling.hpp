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

// Tally Sampling - Header
// Decides whether an instrumented identity contributes samples

#pragma once

#include <memory>
#include <string_view>

#include "../control/config.hpp"

namespace tally::metrics {

/// Sampling strategy
///
/// Decisions are keyed, not random: the same key always gets the same answer, so paired
/// events of one actor (enqueue/dequeue, started/finished) are kept or dropped together.
class Sampler {
public:
    virtual ~Sampler() = default;

    [[nodiscard]] virtual bool should_sample(std::string_view key) const noexcept = 0;

    /// Strategy name (for logging)
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

class AlwaysSampler final : public Sampler {
public:
    [[nodiscard]] bool should_sample(std::string_view) const noexcept override { return true; }
    [[nodiscard]] std::string_view name() const noexcept override { return "always"; }
};

class NeverSampler final : public Sampler {
public:
    [[nodiscard]] bool should_sample(std::string_view) const noexcept override { return false; }
    [[nodiscard]] std::string_view name() const noexcept override { return "never"; }
};

/// Keeps roughly `rate` of all keys, chosen by key hash
class RateSampler final : public Sampler {
public:
    /// Throws control::ConfigError unless 0.0 <= rate <= 1.0
    explicit RateSampler(double rate);

    [[nodiscard]] bool should_sample(std::string_view key) const noexcept override;
    [[nodiscard]] std::string_view name() const noexcept override { return "rate-based"; }

    [[nodiscard]] double rate() const noexcept { return rate_; }

private:
    double rate_;
};

/// Build the sampler named by config, throws control::ConfigError on unknown strategy
[[nodiscard]] std::unique_ptr<Sampler> make_sampler(const control::SamplingConfig& config);

}  // namespace tally::metrics
