/// @file snapshot_manager.cpp
/// @brief SnapshotManager implementation.

#include "rgs/ecs/snapshot_manager.hpp"

#include "rgs/foundation/game_logger.hpp"

#include <cassert>
#include <string>

namespace rgs::ecs {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;

void SnapshotManager::add(ISnapshotable* snapshotable) {
    assert(snapshotable != nullptr && "Cannot register null snapshotable");
    snapshotables_.push_back(snapshotable);
}

GameResult<void> SnapshotManager::copyAllSnapshots() {
    if (!canCommit()) {
        RGS_LOG_ERROR(LogCategory::Snapshot,
                      "commit refused: live changes were not reconciled");
        return GameResult<void>::err(
            GameError(ErrorCode::CommitBeforeSync,
                      "live changes must be reconciled before commit"));
    }

    for (auto* snapshotable : snapshotables_) {
        snapshotable->copySnapshot();
    }
    ++commits_;
    reconciledSinceCommit_ = false;

    RGS_LOG_TRACE(LogCategory::Snapshot,
                  "committed " + std::to_string(snapshotables_.size()) +
                  " structures (commit #" + std::to_string(commits_) + ")");
    return GameResult<void>::ok();
}

}  // namespace rgs::ecs
