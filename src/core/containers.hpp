#pragma once

#include <ankerl/unordered_dense.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <utility>

namespace tally::core {

// Container aliases over ankerl::unordered_dense.
// Dense storage with vector-like iterator invalidation (invalidates on insertion),
// so never hold an iterator or element reference across an insert.
//
// Usage:
//   tally::core::fast_set<std::string_view> seen;
//   tally::core::string_map<Series> series;  // find() accepts std::string_view

template <typename Key, typename Value, typename Hash = ankerl::unordered_dense::hash<Key>,
          typename KeyEqual = std::equal_to<Key>>
using fast_map = ankerl::unordered_dense::map<Key, Value, Hash, KeyEqual>;

template <typename Key, typename Hash = ankerl::unordered_dense::hash<Key>,
          typename KeyEqual = std::equal_to<Key>>
using fast_set = ankerl::unordered_dense::set<Key, Hash, KeyEqual>;

/// Transparent string hash: lookups by std::string_view do not allocate
struct string_hash {
    using is_transparent = void;
    using is_avalanching = void;

    [[nodiscard]] uint64_t operator()(std::string_view str) const noexcept {
        return ankerl::unordered_dense::hash<std::string_view>{}(str);
    }
};

template <typename Value>
using string_map = fast_map<std::string, Value, string_hash, std::equal_to<>>;

/// Sharded string-keyed map for keys discovered at runtime (actor classes, message types).
///
/// Each shard is a shared_mutex guarding its key index only. Values are heap allocated
/// and handed out as shared_ptr, so a value stays alive while a caller still uses it even
/// if the key is erased concurrently. Values are expected to carry their own
/// synchronization (atomics, or a mutex for compound state).
///
/// Contention is confined to keys hashing into the same shard; the steady-state path
/// for an existing key is a shared lock plus one lookup.
template <typename Value, size_t ShardCount = 16>
class ConcurrentMap {
    static_assert((ShardCount & (ShardCount - 1)) == 0, "ShardCount must be a power of two");

public:
    using ValuePtr = std::shared_ptr<Value>;

    ConcurrentMap() = default;
    ~ConcurrentMap() = default;

    // Non-copyable, non-movable (owns mutexes)
    ConcurrentMap(const ConcurrentMap&) = delete;
    ConcurrentMap& operator=(const ConcurrentMap&) = delete;
    ConcurrentMap(ConcurrentMap&&) = delete;
    ConcurrentMap& operator=(ConcurrentMap&&) = delete;

    /// Get the value for key, creating it from args if absent.
    /// Two racing first observers always end up with the same value.
    template <typename... Args>
    [[nodiscard]] ValuePtr get_or_create(std::string_view key, Args&&... args) {
        auto& shard = shard_for(key);
        {
            std::shared_lock lock(shard.mutex);
            auto it = shard.map.find(key);
            if (it != shard.map.end()) {
                return it->second;
            }
        }

        std::unique_lock lock(shard.mutex);
        auto it = shard.map.find(key);
        if (it != shard.map.end()) {
            return it->second;
        }
        auto value = std::make_shared<Value>(std::forward<Args>(args)...);
        shard.map.emplace(std::string(key), value);
        return value;
    }

    /// Lookup without creation (nullptr if absent)
    [[nodiscard]] ValuePtr find(std::string_view key) const {
        const auto& shard = shard_for(key);
        std::shared_lock lock(shard.mutex);
        auto it = shard.map.find(key);
        return it != shard.map.end() ? it->second : nullptr;
    }

    [[nodiscard]] bool contains(std::string_view key) const { return find(key) != nullptr; }

    /// Remove key (values still referenced elsewhere stay alive)
    bool erase(std::string_view key) {
        auto& shard = shard_for(key);
        std::unique_lock lock(shard.mutex);
        auto it = shard.map.find(key);
        if (it == shard.map.end()) {
            return false;
        }
        shard.map.erase(it);
        return true;
    }

    void clear() {
        for (auto& shard : shards_) {
            std::unique_lock lock(shard.mutex);
            shard.map.clear();
        }
    }

    [[nodiscard]] size_t size() const {
        size_t total = 0;
        for (const auto& shard : shards_) {
            std::shared_lock lock(shard.mutex);
            total += shard.map.size();
        }
        return total;
    }

    /// Visit every entry: fn(const std::string& key, const Value& value).
    /// Each shard is visited under its shared lock; fn must not call back into this map.
    template <typename Fn>
    void for_each(Fn&& fn) const {
        for (const auto& shard : shards_) {
            std::shared_lock lock(shard.mutex);
            for (const auto& [key, value] : shard.map) {
                fn(key, *value);
            }
        }
    }

private:
    // Middle hash bits pick the shard; the map itself uses the high bits for buckets
    // and the low byte as fingerprint.
    struct Shard {
        mutable std::shared_mutex mutex;
        string_map<ValuePtr> map;
    };

    [[nodiscard]] Shard& shard_for(std::string_view key) noexcept {
        return shards_[(string_hash{}(key) >> 32) & (ShardCount - 1)];
    }

    [[nodiscard]] const Shard& shard_for(std::string_view key) const noexcept {
        return shards_[(string_hash{}(key) >> 32) & (ShardCount - 1)];
    }

    std::array<Shard, ShardCount> shards_;
};

}  // namespace tally::core
