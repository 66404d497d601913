#pragma once

/// @file type_index.hpp
/// @brief Controller category -> snapshot-isolated entity list.

#include "rgs/ecs/snapshotable_list.hpp"
#include "rgs/world/entity.hpp"
#include "rgs/world/world_types.hpp"

#include <array>
#include <memory>
#include <optional>
#include <unordered_map>
#include <vector>

namespace rgs::world {

/// Per-category membership lists, maintained incrementally.
///
/// Membership changes are O(1) amortized; nothing is rebuilt by
/// filtering the entity table.  An entity is filed under the category it
/// had when added, and moved by reindex() once its category changes.
class TypeIndex {
public:
    using List = ecs::SnapshotableList<std::shared_ptr<Entity>>;

    explicit TypeIndex(ecs::SnapshotManager& manager);

    /// File @p entity under its current category.
    /// @return false if it is already indexed.
    bool add(const std::shared_ptr<Entity>& entity);

    /// Drop @p entity from whichever category it is filed under.
    /// @return false if it is not indexed.
    bool remove(const std::shared_ptr<Entity>& entity);

    /// Move @p entity to its current category if that differs from the
    /// one it is filed under.
    /// @return true if the entity moved.
    bool reindex(const std::shared_ptr<Entity>& entity);

    /// Committed members of @p category; empty for unknown categories.
    [[nodiscard]] const std::vector<std::shared_ptr<Entity>>& getAll(ControllerCategory category) const;

    /// Live members of @p category.
    [[nodiscard]] std::vector<std::shared_ptr<Entity>> getAllLive(ControllerCategory category) const;

    /// Category @p entity is currently filed under, if indexed.
    [[nodiscard]] std::optional<ControllerCategory> indexedCategory(const Entity& entity) const;

private:
    [[nodiscard]] List* listFor(ControllerCategory category) const;

    std::array<std::unique_ptr<List>, kControllerCategoryCount> lists_;
    std::unordered_map<const Entity*, ControllerCategory> filedUnder_;
};

} // namespace rgs::world
