/// @file entity_table.cpp
/// @brief EntityTable implementation.

#include "rgs/world/entity_table.hpp"

namespace rgs::world {

namespace {

std::vector<std::shared_ptr<Entity>> valuesOf(const EntityTable::Map::map_type& map) {
    std::vector<std::shared_ptr<Entity>> out;
    out.reserve(map.size());
    for (const auto& [id, entity] : map) {
        out.push_back(entity);
    }
    return out;
}

} // namespace

EntityTable::EntityTable(ecs::SnapshotManager& manager) : map_(manager) {}

void EntityTable::put(int32_t id, const std::shared_ptr<Entity>& entity) {
    const auto* current = map_.getLive(id);
    if (current != nullptr && *current == entity) {
        return;
    }
    map_.put(id, entity);
}

std::shared_ptr<Entity> EntityTable::remove(int32_t id) {
    auto removed = map_.remove(id);
    return removed ? std::move(*removed) : nullptr;
}

std::shared_ptr<Entity> EntityTable::get(int32_t id) const {
    const auto* entity = map_.get(id);
    return entity != nullptr ? *entity : nullptr;
}

std::shared_ptr<Entity> EntityTable::getLive(int32_t id) const {
    const auto* entity = map_.getLive(id);
    return entity != nullptr ? *entity : nullptr;
}

std::vector<std::shared_ptr<Entity>> EntityTable::allSnapshot() const {
    return valuesOf(map_.get());
}

std::vector<std::shared_ptr<Entity>> EntityTable::allLive() const {
    return valuesOf(map_.getLive());
}

} // namespace rgs::world
