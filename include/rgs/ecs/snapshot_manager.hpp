#pragma once

/// @file snapshot_manager.hpp
/// @brief Two-phase (live / snapshot) commit coordinator.
///
/// Every double-buffered container registers itself with a
/// SnapshotManager.  Mutations land in the container's live view and
/// flip the manager back to TickPhase::Live; the visibility pass marks
/// the tick reconciled, and only then may copyAllSnapshots() publish the
/// live views as the next committed baseline.

#include "rgs/foundation/game_result.hpp"

#include <cstdint>
#include <vector>

namespace rgs::ecs {

/// A structure with a mutable live view and an immutable committed view.
class ISnapshotable {
public:
    virtual ~ISnapshotable() = default;

    /// Publish the live view as the committed view and clear change logs.
    virtual void copySnapshot() = 0;
};

/// Commit state of the live views owned by one manager.
enum class TickPhase : uint8_t {
    Live,       ///< Live views changed since the last reconciliation.
    Reconciled  ///< Nothing pending, or every change has been reconciled.
};

/// Coordinates the live -> snapshot commit of a set of containers.
///
/// Thread safety: none.  The manager, and every container registered with
/// it, is driven by the owning region's execution context only.
class SnapshotManager {
public:
    SnapshotManager() = default;

    SnapshotManager(const SnapshotManager&) = delete;
    SnapshotManager& operator=(const SnapshotManager&) = delete;

    /// Register a container.  The manager does not take ownership; the
    /// container must outlive the manager or never be committed again.
    void add(ISnapshotable* snapshotable);

    /// Called by registered containers whenever their live view changes.
    void markLiveChanged() noexcept { phase_ = TickPhase::Live; }

    /// Called once the live and committed views have been compared for
    /// this tick.
    void markReconciled() noexcept {
        phase_ = TickPhase::Reconciled;
        reconciledSinceCommit_ = true;
    }

    [[nodiscard]] TickPhase phase() const noexcept { return phase_; }

    [[nodiscard]] bool canCommit() const noexcept { return phase_ == TickPhase::Reconciled; }

    /// True if markReconciled() ran after the last successful commit.
    [[nodiscard]] bool reconciledSinceCommit() const noexcept { return reconciledSinceCommit_; }

    /// Commit every registered container.
    ///
    /// @return CommitBeforeSync when live changes have not been
    ///         reconciled; nothing is committed in that case.
    foundation::GameResult<void> copyAllSnapshots();

    /// Number of successful commits so far.
    [[nodiscard]] uint64_t commitCount() const noexcept { return commits_; }

    [[nodiscard]] std::size_t size() const noexcept { return snapshotables_.size(); }

private:
    std::vector<ISnapshotable*> snapshotables_;
    TickPhase phase_ = TickPhase::Reconciled;
    bool reconciledSinceCommit_ = false;
    uint64_t commits_ = 0;
};

}  // namespace rgs::ecs
