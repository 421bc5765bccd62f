// Tally Tags - metric dimension key/value pairs

#pragma once

#include <algorithm>
#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tally::metrics {

/// Well-known tag keys
namespace tag_keys {
inline constexpr std::string_view ACTOR_CLASS = "actor.class";
inline constexpr std::string_view MESSAGE_TYPE = "message.type";
}  // namespace tag_keys

struct Tag {
    std::string key;
    std::string value;

    bool operator==(const Tag&) const = default;
};

/// Ordered tag list. Setting an existing key replaces its value.
class Tags {
public:
    Tags() = default;

    Tags(std::initializer_list<Tag> tags) {
        for (const auto& tag : tags) {
            set(tag.key, tag.value);
        }
    }

    /// Static tags from configuration
    explicit Tags(const std::map<std::string, std::string>& tags) {
        for (const auto& [key, value] : tags) {
            set(key, value);
        }
    }

    Tags& set(std::string_view key, std::string_view value) {
        auto it = std::find_if(tags_.begin(), tags_.end(),
                               [key](const Tag& tag) { return tag.key == key; });
        if (it != tags_.end()) {
            it->value = std::string(value);
        } else {
            tags_.push_back({std::string(key), std::string(value)});
        }
        return *this;
    }

    /// Copy with one more tag
    [[nodiscard]] Tags with(std::string_view key, std::string_view value) const {
        Tags copy = *this;
        copy.set(key, value);
        return copy;
    }

    [[nodiscard]] std::optional<std::string_view> find(std::string_view key) const noexcept {
        for (const auto& tag : tags_) {
            if (tag.key == key) return std::string_view(tag.value);
        }
        return std::nullopt;
    }

    /// Stable identity of the tag set: "k1=v1,k2=v2" with keys sorted
    [[nodiscard]] std::string canonical() const {
        std::string out;
        append_canonical(out);
        return out;
    }

    /// Append the canonical form to out (no allocation once out has capacity).
    /// Keys are unique, so each pass picks the smallest key above the previous one.
    void append_canonical(std::string& out) const {
        const Tag* previous = nullptr;
        for (size_t i = 0; i < tags_.size(); ++i) {
            const Tag* next = nullptr;
            for (const auto& tag : tags_) {
                if (previous != nullptr && tag.key <= previous->key) continue;
                if (next == nullptr || tag.key < next->key) next = &tag;
            }
            if (i > 0) out += ',';
            out += next->key;
            out += '=';
            out += next->value;
            previous = next;
        }
    }

    [[nodiscard]] bool empty() const noexcept { return tags_.empty(); }
    [[nodiscard]] size_t size() const noexcept { return tags_.size(); }
    [[nodiscard]] auto begin() const noexcept { return tags_.begin(); }
    [[nodiscard]] auto end() const noexcept { return tags_.end(); }

private:
    std::vector<Tag> tags_;
};

}  // namespace tally::metrics
