/// @file block_entity_index.cpp
/// @brief BlockEntityIndex implementation.

#include "rgs/world/block_entity_index.hpp"

#include "rgs/foundation/game_logger.hpp"

#include <string>

namespace rgs::world {

using foundation::LogCategory;

BlockEntityIndex::BlockEntityIndex(ecs::SnapshotManager& manager) : map_(manager) {}

std::shared_ptr<Entity> BlockEntityIndex::put(const BlockPos& pos,
                                              const std::shared_ptr<Entity>& entity) {
    auto previous = map_.put(pos, entity);
    if (!previous || !*previous || *previous == entity) {
        return nullptr;
    }
    auto evicted = std::move(*previous);
    evicted->kill();
    RGS_LOG_INFO(LogCategory::Registry,
                 "evicted block entity " + std::to_string(evicted->id()) + " at (" +
                     std::to_string(pos.x) + "," + std::to_string(pos.y) + "," +
                     std::to_string(pos.z) + ") for " + std::to_string(entity->id()));
    return evicted;
}

bool BlockEntityIndex::remove(const BlockPos& pos, const std::shared_ptr<Entity>& entity) {
    const auto* current = map_.getLive(pos);
    if (current == nullptr || *current != entity) {
        RGS_LOG_DEBUG(LogCategory::Registry,
                      "ignoring stale block entity removal for " +
                          std::to_string(entity ? entity->id() : kNotSpawnedId));
        return false;
    }
    map_.remove(pos);
    return true;
}

std::shared_ptr<Entity> BlockEntityIndex::getLive(const BlockPos& pos) const {
    const auto* occupant = map_.getLive(pos);
    return occupant != nullptr ? *occupant : nullptr;
}

} // namespace rgs::world
