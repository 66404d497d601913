#pragma once

/// @file snapshotable_list.hpp
/// @brief Double-buffered insertion-ordered set.
///
/// Elements are unique.  add() appends and remove() leaves a tombstone,
/// both O(1) amortized through a position index; tombstones are
/// compacted when the live view is committed, which preserves the
/// insertion order of the survivors.

#include "rgs/ecs/snapshot_manager.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <unordered_map>
#include <vector>

namespace rgs::ecs {

/// Live / committed pair of insertion-ordered unique sequences.
template <typename T, typename Hash = std::hash<T>>
class SnapshotableList final : public ISnapshotable {
public:
    explicit SnapshotableList(SnapshotManager& manager) : manager_(manager) {
        manager_.add(this);
    }

    SnapshotableList(const SnapshotableList&) = delete;
    SnapshotableList& operator=(const SnapshotableList&) = delete;

    /// Append @p value to the live view.
    /// @return false if it is already a live member.
    bool add(const T& value) {
        if (index_.count(value) > 0) {
            return false;
        }
        index_.emplace(value, slots_.size());
        slots_.emplace_back(value);
        ++liveSize_;
        dirty_ = true;
        manager_.markLiveChanged();
        return true;
    }

    /// Remove @p value from the live view.
    /// @return false if it is not a live member.
    bool remove(const T& value) {
        auto it = index_.find(value);
        if (it == index_.end()) {
            return false;
        }
        slots_[it->second].reset();
        index_.erase(it);
        --liveSize_;
        dirty_ = true;
        manager_.markLiveChanged();
        return true;
    }

    [[nodiscard]] bool containsLive(const T& value) const {
        return index_.count(value) > 0;
    }

    /// The committed sequence.  Stable until the next commit.
    [[nodiscard]] const std::vector<T>& get() const noexcept { return snapshot_; }

    /// A compacted copy of the live sequence.
    [[nodiscard]] std::vector<T> getLive() const {
        std::vector<T> out;
        out.reserve(liveSize_);
        for (const auto& slot : slots_) {
            if (slot) {
                out.push_back(*slot);
            }
        }
        return out;
    }

    [[nodiscard]] std::size_t liveSize() const noexcept { return liveSize_; }

    [[nodiscard]] bool hasPendingChanges() const noexcept { return dirty_; }

    void copySnapshot() override {
        if (!dirty_) {
            return;
        }
        compact();
        snapshot_.clear();
        snapshot_.reserve(slots_.size());
        for (const auto& slot : slots_) {
            snapshot_.push_back(*slot);
        }
        dirty_ = false;
    }

private:
    /// Drop tombstones and rebuild the position index.
    void compact() {
        std::size_t out = 0;
        for (std::size_t i = 0; i < slots_.size(); ++i) {
            if (!slots_[i]) {
                continue;
            }
            if (out != i) {
                slots_[out] = std::move(slots_[i]);
            }
            index_[*slots_[out]] = out;
            ++out;
        }
        slots_.resize(out);
    }

    SnapshotManager& manager_;
    std::vector<std::optional<T>> slots_;
    std::unordered_map<T, std::size_t, Hash> index_;
    std::size_t liveSize_ = 0;
    std::vector<T> snapshot_;
    bool dirty_ = false;
};

}  // namespace rgs::ecs
