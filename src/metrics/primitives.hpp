// Tally Metric Primitives - Header
// Keyed, lock-free-on-update counters, gauges, timers and event timelines

#pragma once

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "../core/containers.hpp"

namespace tally::metrics {

/// Timer statistics at a point in time
struct TimerSnapshot {
    uint64_t count = 0;
    int64_t total_nanos = 0;
    int64_t min_nanos = 0;
    int64_t max_nanos = 0;

    // Derived metrics
    [[nodiscard]] double average_nanos() const noexcept {
        if (count == 0) return 0.0;
        return static_cast<double>(total_nanos) / static_cast<double>(count);
    }
};

/// Event timeline statistics at a point in time
struct TimelineSnapshot {
    uint64_t count = 0;
    int64_t first_timestamp_nanos = 0;
    int64_t last_timestamp_nanos = 0;

    /// Time between first and last observation (0 for a single observation)
    [[nodiscard]] int64_t span_nanos() const noexcept {
        return last_timestamp_nanos - first_timestamp_nanos;
    }
};

/// Atomic min/max helpers (CAS retry loops, no locks)
inline void atomic_store_min(std::atomic<int64_t>& target, int64_t value) noexcept {
    int64_t current = target.load(std::memory_order_relaxed);
    while (value < current) {
        if (target.compare_exchange_weak(current, value, std::memory_order_relaxed,
                                         std::memory_order_relaxed)) {
            break;
        }
    }
}

inline void atomic_store_max(std::atomic<int64_t>& target, int64_t value) noexcept {
    int64_t current = target.load(std::memory_order_relaxed);
    while (value > current) {
        if (target.compare_exchange_weak(current, value, std::memory_order_relaxed,
                                         std::memory_order_relaxed)) {
            break;
        }
    }
}

/// Keyed counter (signed: a value driven below zero stays observable)
class Counter {
public:
    Counter() = default;
    ~Counter() = default;

    // Non-copyable, non-movable (std::atomic is not movable)
    Counter(const Counter&) = delete;
    Counter& operator=(const Counter&) = delete;
    Counter(Counter&&) = delete;
    Counter& operator=(Counter&&) = delete;

    /// Add delta (may be negative), returns the new value
    int64_t increment(std::string_view key, int64_t delta = 1) {
        auto cell = cells_.get_or_create(key);
        return cell->value.fetch_add(delta, std::memory_order_relaxed) + delta;
    }

    /// Current value (nullopt if key was never observed)
    [[nodiscard]] std::optional<int64_t> get(std::string_view key) const {
        auto cell = cells_.find(key);
        if (!cell) return std::nullopt;
        return cell->value.load(std::memory_order_relaxed);
    }

    /// All keys with their values
    [[nodiscard]] std::vector<std::pair<std::string, int64_t>> snapshot() const {
        std::vector<std::pair<std::string, int64_t>> values;
        cells_.for_each([&values](const std::string& key, const Cell& cell) {
            values.emplace_back(key, cell.value.load(std::memory_order_relaxed));
        });
        return values;
    }

    [[nodiscard]] size_t size() const { return cells_.size(); }

    /// Forget all keys (for testing)
    void reset() { cells_.clear(); }

private:
    struct Cell {
        std::atomic<int64_t> value{0};
    };

    core::ConcurrentMap<Cell> cells_;
};

/// Keyed gauge (last written value)
class Gauge {
public:
    Gauge() = default;
    ~Gauge() = default;

    // Non-copyable, non-movable
    Gauge(const Gauge&) = delete;
    Gauge& operator=(const Gauge&) = delete;
    Gauge(Gauge&&) = delete;
    Gauge& operator=(Gauge&&) = delete;

    void set(std::string_view key, int64_t value) {
        cells_.get_or_create(key)->value.store(value, std::memory_order_relaxed);
    }

    /// Atomic read-modify-write, returns the new value
    int64_t add(std::string_view key, int64_t delta) {
        auto cell = cells_.get_or_create(key);
        return cell->value.fetch_add(delta, std::memory_order_relaxed) + delta;
    }

    [[nodiscard]] std::optional<int64_t> get(std::string_view key) const {
        auto cell = cells_.find(key);
        if (!cell) return std::nullopt;
        return cell->value.load(std::memory_order_relaxed);
    }

    [[nodiscard]] std::vector<std::pair<std::string, int64_t>> snapshot() const {
        std::vector<std::pair<std::string, int64_t>> values;
        cells_.for_each([&values](const std::string& key, const Cell& cell) {
            values.emplace_back(key, cell.value.load(std::memory_order_relaxed));
        });
        return values;
    }

    [[nodiscard]] size_t size() const { return cells_.size(); }

    void reset() { cells_.clear(); }

private:
    struct Cell {
        std::atomic<int64_t> value{0};
    };

    core::ConcurrentMap<Cell> cells_;
};

/// Keyed duration statistics (count, total, min, max)
class Timer {
public:
    Timer() = default;
    ~Timer() = default;

    // Non-copyable, non-movable
    Timer(const Timer&) = delete;
    Timer& operator=(const Timer&) = delete;
    Timer(Timer&&) = delete;
    Timer& operator=(Timer&&) = delete;

    /// Record one duration. Negative durations (clock skew) are ignored.
    void record(std::string_view key, int64_t duration_nanos) {
        if (duration_nanos < 0) return;

        auto cell = cells_.get_or_create(key);
        cell->total_nanos.fetch_add(duration_nanos, std::memory_order_relaxed);
        atomic_store_min(cell->min_nanos, duration_nanos);
        atomic_store_max(cell->max_nanos, duration_nanos);
        // Count last: a reader seeing count == n also sees the n-th min/max
        cell->count.fetch_add(1, std::memory_order_release);
    }

    /// Statistics for key (nullopt if nothing was recorded)
    [[nodiscard]] std::optional<TimerSnapshot> get(std::string_view key) const {
        auto cell = cells_.find(key);
        if (!cell) return std::nullopt;
        return read(*cell);
    }

    [[nodiscard]] std::vector<std::pair<std::string, TimerSnapshot>> snapshot() const {
        std::vector<std::pair<std::string, TimerSnapshot>> values;
        cells_.for_each([&values](const std::string& key, const Cell& cell) {
            if (auto snap = read(cell)) {
                values.emplace_back(key, *snap);
            }
        });
        return values;
    }

    [[nodiscard]] size_t size() const { return cells_.size(); }

    void reset() { cells_.clear(); }

private:
    struct Cell {
        std::atomic<uint64_t> count{0};
        std::atomic<int64_t> total_nanos{0};
        std::atomic<int64_t> min_nanos{std::numeric_limits<int64_t>::max()};
        std::atomic<int64_t> max_nanos{0};
    };

    [[nodiscard]] static std::optional<TimerSnapshot> read(const Cell& cell) noexcept {
        TimerSnapshot snap;
        snap.count = cell.count.load(std::memory_order_acquire);
        if (snap.count == 0) return std::nullopt;  // Created, first record still in flight
        snap.total_nanos = cell.total_nanos.load(std::memory_order_relaxed);
        snap.min_nanos = cell.min_nanos.load(std::memory_order_relaxed);
        snap.max_nanos = cell.max_nanos.load(std::memory_order_relaxed);
        return snap;
    }

    core::ConcurrentMap<Cell> cells_;
};

/// Keyed event timeline: count plus first and last timestamp.
/// Out-of-order arrivals from different threads keep first <= last.
class EventTimeline {
public:
    EventTimeline() = default;
    ~EventTimeline() = default;

    // Non-copyable, non-movable
    EventTimeline(const EventTimeline&) = delete;
    EventTimeline& operator=(const EventTimeline&) = delete;
    EventTimeline(EventTimeline&&) = delete;
    EventTimeline& operator=(EventTimeline&&) = delete;

    void record(std::string_view key, int64_t timestamp_nanos) {
        auto cell = cells_.get_or_create(key);
        atomic_store_min(cell->first_nanos, timestamp_nanos);
        atomic_store_max(cell->last_nanos, timestamp_nanos);
        cell->count.fetch_add(1, std::memory_order_release);
    }

    [[nodiscard]] std::optional<TimelineSnapshot> get(std::string_view key) const {
        auto cell = cells_.find(key);
        if (!cell) return std::nullopt;
        return read(*cell);
    }

    [[nodiscard]] std::vector<std::pair<std::string, TimelineSnapshot>> snapshot() const {
        std::vector<std::pair<std::string, TimelineSnapshot>> values;
        cells_.for_each([&values](const std::string& key, const Cell& cell) {
            if (auto snap = read(cell)) {
                values.emplace_back(key, *snap);
            }
        });
        return values;
    }

    [[nodiscard]] size_t size() const { return cells_.size(); }

    void reset() { cells_.clear(); }

private:
    struct Cell {
        std::atomic<uint64_t> count{0};
        std::atomic<int64_t> first_nanos{std::numeric_limits<int64_t>::max()};
        std::atomic<int64_t> last_nanos{std::numeric_limits<int64_t>::min()};
    };

    [[nodiscard]] static std::optional<TimelineSnapshot> read(const Cell& cell) noexcept {
        TimelineSnapshot snap;
        snap.count = cell.count.load(std::memory_order_acquire);
        if (snap.count == 0) return std::nullopt;
        snap.first_timestamp_nanos = cell.first_nanos.load(std::memory_order_relaxed);
        snap.last_timestamp_nanos = cell.last_nanos.load(std::memory_order_relaxed);
        return snap;
    }

    core::ConcurrentMap<Cell> cells_;
};

}  // namespace tally::metrics
