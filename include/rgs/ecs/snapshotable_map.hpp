#pragma once

/// @file snapshotable_map.hpp
/// @brief Double-buffered hash map with a per-tick change log.
///
/// Writes go to the live map and are appended to the change log; readers
/// of the committed map see the state as of the last commit.  Commit
/// replays only the logged keys, so its cost is proportional to the
/// number of changes, not to the map size.

#include "rgs/ecs/snapshot_manager.hpp"

#include <functional>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace rgs::ecs {

/// Kind of a logged live-view mutation.
enum class ChangeKind : uint8_t {
    Put,
    Remove
};

/// Live / committed pair of unordered maps.
///
/// @tparam K    Key type.
/// @tparam V    Value type (copyable).
/// @tparam Hash Hash functor for K.
template <typename K, typename V, typename Hash = std::hash<K>>
class SnapshotableMap final : public ISnapshotable {
public:
    using map_type = std::unordered_map<K, V, Hash>;

    /// One entry of the change log.  For removals @c value is the value
    /// that was removed.
    struct Change {
        K key;
        V value;
        ChangeKind kind;
    };

    explicit SnapshotableMap(SnapshotManager& manager) : manager_(manager) {
        manager_.add(this);
    }

    // Registered with the manager by address.
    SnapshotableMap(const SnapshotableMap&) = delete;
    SnapshotableMap& operator=(const SnapshotableMap&) = delete;

    // ── Live mutation ───────────────────────────────────────────────────

    /// Associate @p key with @p value in the live view.
    /// @return The previous live value for @p key, if any.
    std::optional<V> put(const K& key, V value) {
        std::optional<V> previous;
        auto it = live_.find(key);
        if (it != live_.end()) {
            previous = std::move(it->second);
            it->second = value;
        } else {
            live_.emplace(key, value);
        }
        changes_.push_back(Change{key, std::move(value), ChangeKind::Put});
        manager_.markLiveChanged();
        return previous;
    }

    /// Remove @p key from the live view.
    /// @return The removed live value, or std::nullopt if absent.
    std::optional<V> remove(const K& key) {
        auto it = live_.find(key);
        if (it == live_.end()) {
            return std::nullopt;
        }
        std::optional<V> removed = std::move(it->second);
        live_.erase(it);
        changes_.push_back(Change{key, *removed, ChangeKind::Remove});
        manager_.markLiveChanged();
        return removed;
    }

    // ── Queries ─────────────────────────────────────────────────────────

    /// Committed value for @p key, or nullptr.
    [[nodiscard]] const V* get(const K& key) const {
        auto it = snapshot_.find(key);
        return it == snapshot_.end() ? nullptr : &it->second;
    }

    /// Live value for @p key, or nullptr.
    [[nodiscard]] const V* getLive(const K& key) const {
        auto it = live_.find(key);
        return it == live_.end() ? nullptr : &it->second;
    }

    /// The committed map.  Stable until the next commit.
    [[nodiscard]] const map_type& get() const noexcept { return snapshot_; }

    /// The live map.  Only valid on the owning execution context.
    [[nodiscard]] const map_type& getLive() const noexcept { return live_; }

    /// Mutations logged since the last commit, in order.
    [[nodiscard]] const std::vector<Change>& getDirtyList() const noexcept { return changes_; }

    [[nodiscard]] bool hasPendingChanges() const noexcept { return !changes_.empty(); }

    // ── Commit ──────────────────────────────────────────────────────────

    void copySnapshot() override {
        for (const auto& change : changes_) {
            auto it = live_.find(change.key);
            if (it != live_.end()) {
                snapshot_.insert_or_assign(change.key, it->second);
            } else {
                snapshot_.erase(change.key);
            }
        }
        changes_.clear();
    }

private:
    SnapshotManager& manager_;
    map_type live_;
    map_type snapshot_;
    std::vector<Change> changes_;
};

}  // namespace rgs::ecs
