#pragma once

/// @file change_log.hpp
/// @brief Append-only per-tick log, cleared on commit.

#include "rgs/ecs/snapshot_manager.hpp"

#include <vector>

namespace rgs::ecs {

/// Records values during the live phase; commit empties it.
template <typename T>
class ChangeLog final : public ISnapshotable {
public:
    explicit ChangeLog(SnapshotManager& manager) : manager_(manager) {
        manager_.add(this);
    }

    ChangeLog(const ChangeLog&) = delete;
    ChangeLog& operator=(const ChangeLog&) = delete;

    void append(T value) {
        entries_.push_back(std::move(value));
        manager_.markLiveChanged();
    }

    [[nodiscard]] const std::vector<T>& entries() const noexcept { return entries_; }

    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

    void copySnapshot() override { entries_.clear(); }

private:
    SnapshotManager& manager_;
    std::vector<T> entries_;
};

}  // namespace rgs::ecs
