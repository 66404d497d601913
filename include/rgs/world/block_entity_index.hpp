#pragma once

/// @file block_entity_index.hpp
/// @brief Block cell -> owning block-bound entity.

#include "rgs/ecs/snapshotable_map.hpp"
#include "rgs/world/entity.hpp"
#include "rgs/world/math_types.hpp"

#include <memory>

namespace rgs::world {

/// At most one block-bound entity per block cell.
///
/// Placing a second entity in an occupied cell evicts the occupant: it is
/// killed and dropped from the index, and the registry removes it on the
/// next finalizeRun().
class BlockEntityIndex {
public:
    using Map = ecs::SnapshotableMap<BlockPos, std::shared_ptr<Entity>>;

    explicit BlockEntityIndex(ecs::SnapshotManager& manager);

    /// Make @p entity the occupant of @p pos.
    /// @return The evicted (now dead) previous occupant, or nullptr.
    std::shared_ptr<Entity> put(const BlockPos& pos, const std::shared_ptr<Entity>& entity);

    /// Remove the occupant of @p pos if it is still @p entity.
    /// @return false for a stale removal; the index is left untouched.
    bool remove(const BlockPos& pos, const std::shared_ptr<Entity>& entity);

    /// Committed occupancy.  Stable until the next commit.
    [[nodiscard]] const Map::map_type& snapshot() const noexcept { return map_.get(); }

    /// Live occupant of @p pos, or nullptr.
    [[nodiscard]] std::shared_ptr<Entity> getLive(const BlockPos& pos) const;

    [[nodiscard]] std::size_t liveSize() const noexcept { return map_.getLive().size(); }

private:
    Map map_;
};

} // namespace rgs::world
