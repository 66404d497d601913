#pragma once

/// @file entity_table.hpp
/// @brief Snapshot-isolated id -> entity association.

#include "rgs/ecs/snapshotable_map.hpp"
#include "rgs/world/entity.hpp"

#include <cstdint>
#include <memory>
#include <vector>

namespace rgs::world {

/// Id -> entity map with a live overlay and a committed view.
///
/// get() and allSnapshot() read the committed view and are stable for
/// the duration of a tick; put()/remove() land in the live view and are
/// logged in the dirty list until the next commit.
class EntityTable {
public:
    using Map = ecs::SnapshotableMap<int32_t, std::shared_ptr<Entity>>;
    using Change = Map::Change;

    explicit EntityTable(ecs::SnapshotManager& manager);

    void put(int32_t id, const std::shared_ptr<Entity>& entity);

    /// @return The removed entity, or nullptr if @p id was not live.
    std::shared_ptr<Entity> remove(int32_t id);

    /// Committed entity for @p id, or nullptr.
    [[nodiscard]] std::shared_ptr<Entity> get(int32_t id) const;

    /// Live entity for @p id, or nullptr.
    [[nodiscard]] std::shared_ptr<Entity> getLive(int32_t id) const;

    [[nodiscard]] std::vector<std::shared_ptr<Entity>> allSnapshot() const;

    [[nodiscard]] std::vector<std::shared_ptr<Entity>> allLive() const;

    /// Entities put or removed since the last commit, in order.
    [[nodiscard]] const std::vector<Change>& dirty() const noexcept { return map_.getDirtyList(); }

    [[nodiscard]] std::size_t liveSize() const noexcept { return map_.getLive().size(); }
    [[nodiscard]] std::size_t snapshotSize() const noexcept { return map_.get().size(); }

    /// Direct access to the maps for allocation-free iteration.
    [[nodiscard]] const Map::map_type& snapshotMap() const noexcept { return map_.get(); }
    [[nodiscard]] const Map::map_type& liveMap() const noexcept { return map_.getLive(); }

private:
    Map map_;
};

} // namespace rgs::world
