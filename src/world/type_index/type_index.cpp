/// @file type_index.cpp
/// @brief TypeIndex implementation.

#include "rgs/world/type_index.hpp"

namespace rgs::world {

TypeIndex::TypeIndex(ecs::SnapshotManager& manager) {
    for (auto& list : lists_) {
        list = std::make_unique<List>(manager);
    }
}

TypeIndex::List* TypeIndex::listFor(ControllerCategory category) const {
    auto idx = static_cast<std::size_t>(category);
    return idx < lists_.size() ? lists_[idx].get() : nullptr;
}

bool TypeIndex::add(const std::shared_ptr<Entity>& entity) {
    if (filedUnder_.count(entity.get()) > 0) {
        return false;
    }
    auto* list = listFor(entity->controller());
    if (list == nullptr) {
        return false;
    }
    list->add(entity);
    filedUnder_.emplace(entity.get(), entity->controller());
    return true;
}

bool TypeIndex::remove(const std::shared_ptr<Entity>& entity) {
    auto it = filedUnder_.find(entity.get());
    if (it == filedUnder_.end()) {
        return false;
    }
    if (auto* list = listFor(it->second)) {
        list->remove(entity);
    }
    filedUnder_.erase(it);
    return true;
}

bool TypeIndex::reindex(const std::shared_ptr<Entity>& entity) {
    auto it = filedUnder_.find(entity.get());
    if (it == filedUnder_.end() || it->second == entity->controller()) {
        return false;
    }
    auto* target = listFor(entity->controller());
    if (target == nullptr) {
        return false;
    }
    if (auto* current = listFor(it->second)) {
        current->remove(entity);
    }
    target->add(entity);
    it->second = entity->controller();
    return true;
}

const std::vector<std::shared_ptr<Entity>>& TypeIndex::getAll(ControllerCategory category) const {
    static const std::vector<std::shared_ptr<Entity>> kEmpty;
    const auto* list = listFor(category);
    return list != nullptr ? list->get() : kEmpty;
}

std::vector<std::shared_ptr<Entity>> TypeIndex::getAllLive(ControllerCategory category) const {
    const auto* list = listFor(category);
    return list != nullptr ? list->getLive() : std::vector<std::shared_ptr<Entity>>{};
}

std::optional<ControllerCategory> TypeIndex::indexedCategory(const Entity& entity) const {
    auto it = filedUnder_.find(&entity);
    if (it == filedUnder_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace rgs::world
