#pragma once

/// @file player_roster.hpp
/// @brief Snapshot-isolated list of the players spawned in a region.

#include "rgs/ecs/snapshotable_list.hpp"
#include "rgs/world/entity.hpp"

#include <memory>
#include <vector>

namespace rgs::world {

/// Ordered collection of currently spawned player entities.
///
/// Removing a player only detaches it from the spawned bookkeeping; the
/// player object itself outlives its presence in any region.
class PlayerRoster {
public:
    explicit PlayerRoster(ecs::SnapshotManager& manager);

    /// @return false if @p player is not player-controlled or already listed.
    bool add(const std::shared_ptr<Entity>& player);

    /// @return false if @p player is not listed.
    bool remove(const std::shared_ptr<Entity>& player);

    [[nodiscard]] bool contains(const std::shared_ptr<Entity>& player) const;

    /// Committed roster.
    [[nodiscard]] const std::vector<std::shared_ptr<Entity>>& snapshot() const noexcept {
        return players_.get();
    }

    [[nodiscard]] std::vector<std::shared_ptr<Entity>> live() const { return players_.getLive(); }

    [[nodiscard]] std::size_t liveSize() const noexcept { return players_.liveSize(); }

private:
    ecs::SnapshotableList<std::shared_ptr<Entity>> players_;
};

} // namespace rgs::world
