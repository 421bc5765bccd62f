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

// Tally Sampling - Implementation

#include "sampling.hpp"

#include <fmt/format.h>

#include <cstdint>

#include "../core/containers.hpp"

namespace tally::metrics {

RateSampler::RateSampler(double rate) : rate_(rate) {
    if (!(rate >= 0.0 && rate <= 1.0)) {
        throw control::ConfigError(
            fmt::format("Sampling rate must be between 0.0 and 1.0, got: {}", rate));
    }
}

bool RateSampler::should_sample(std::string_view key) const noexcept {
    if (rate_ >= 1.0) {
        return true;
    }
    if (rate_ <= 0.0) {
        return false;
    }

    // Top 53 bits of the hash as a uniform double in [0, 1)
    uint64_t hash = core::string_hash{}(key);
    double position = static_cast<double>(hash >> 11) * 0x1.0p-53;
    return position < rate_;
}

std::unique_ptr<Sampler> make_sampler(const control::SamplingConfig& config) {
    if (config.strategy == "always") {
        return std::make_unique<AlwaysSampler>();
    }
    if (config.strategy == "never") {
        return std::make_unique<NeverSampler>();
    }
    if (config.strategy == "rate-based") {
        return std::make_unique<RateSampler>(config.rate);
    }
    throw control::ConfigError(fmt::format("Unknown sampling strategy: {}", config.strategy));
}

}  // namespace tally::metrics
