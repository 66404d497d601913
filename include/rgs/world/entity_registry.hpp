#pragma once

/// @file entity_registry.hpp
/// @brief Per-region entity registry with snapshot isolation.
///
/// The registry owns every membership structure of one region (entity
/// table, type index, player roster, block-entity index, observer table)
/// and commits them together.  A tick runs, on the region's execution
/// context:
///
/// @code
///   // mutations: addEntity / removeEntity / moveEntity / setObserverDistance
///   registry.finalizeRun();
///   registry.syncEntities();
///   registry.preSnapshotRun();
///   auto committed = registry.copyAllSnapshots();
/// @endcode
///
/// Everything returned by the committed accessors (getAll, getEntity,
/// getPlayers, getBlockEntities) is stable until the next commit and may
/// be read from other threads while the tick runs.

#include "rgs/ecs/change_log.hpp"
#include "rgs/ecs/identity_allocator.hpp"
#include "rgs/ecs/snapshot_manager.hpp"
#include "rgs/foundation/game_result.hpp"
#include "rgs/world/block_entity_index.hpp"
#include "rgs/world/entity.hpp"
#include "rgs/world/entity_table.hpp"
#include "rgs/world/observer_table.hpp"
#include "rgs/world/player_roster.hpp"
#include "rgs/world/type_index.hpp"
#include "rgs/world/visibility_synchronizer.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace rgs::world {

class IChunk;
class IRegion;

class EntityRegistry {
public:
    /// @param allocator  Id source shared with every other registry of
    ///                   the world; must not be null.
    /// @param name       Region name used in log output.
    explicit EntityRegistry(std::shared_ptr<ecs::IIdentityAllocator> allocator,
                            std::string name = "region");

    EntityRegistry(const EntityRegistry&) = delete;
    EntityRegistry& operator=(const EntityRegistry&) = delete;

    // ── Lifecycle ───────────────────────────────────────────────────────

    /// Give @p entity an id and put it in the entity table.  An entity
    /// that already has an id keeps it.
    /// @return The id, or IdentitySpaceExhausted (fatal, do not retry).
    foundation::GameResult<int32_t> allocate(const std::shared_ptr<Entity>& entity,
                                             const IRegion& region);

    /// Take @p entity out of the entity table and its chunks.  Players
    /// get the not-spawned id back.
    void deallocate(const std::shared_ptr<Entity>& entity);

    /// Spawn @p entity into this region and index it by category.
    foundation::GameResult<void> addEntity(const std::shared_ptr<Entity>& entity,
                                           const IRegion& region);

    /// Despawn @p entity.  Unknown entities are ignored.
    /// @return true if the entity was registered.
    bool removeEntity(const std::shared_ptr<Entity>& entity);

    /// Move @p entity to @p position inside @p chunk (live view).
    void moveEntity(const std::shared_ptr<Entity>& entity, const Vector3& position, IChunk* chunk);

    [[nodiscard]] bool isSpawnable(const Entity& entity) const noexcept {
        return entity.id() == kNotSpawnedId;
    }

    /// Despawn every live entity, e.g. when the region unloads.
    /// @return Number of entities removed.
    std::size_t unloadAll();

    // ── Observers ───────────────────────────────────────────────────────

    void setObserverDistance(const std::shared_ptr<Entity>& observer, const IChunk* chunk,
                             int32_t distance);

    bool removeObserver(const std::shared_ptr<Entity>& observer, const IChunk* chunk);

    // ── Tick phases ─────────────────────────────────────────────────────

    /// Remove dead entities, run per-entity hooks and flush player
    /// channels.
    void finalizeRun();

    /// Send this tick's spawn / destroy / update messages and mark the
    /// live changes reconciled.
    SyncStats syncEntities();

    /// Give online players' channels a last look at the live view.
    void preSnapshotRun();

    /// Publish the live view of every entity and structure.
    /// @return CommitBeforeSync if structural changes were made after the
    ///         last syncEntities(), or if entity state changed and no
    ///         syncEntities() ran since the last commit.  SnapshotFailed
    ///         while the region is aborted.  Nothing is committed in
    ///         either case.
    foundation::GameResult<void> copyAllSnapshots();

    /// Mark the current tick as failed part way.  Commits are refused
    /// until resync().
    void abortTick(std::string_view reason);

    /// Finalize and reconcile the live state again, and lift an abort.
    SyncStats resync();

    [[nodiscard]] bool aborted() const noexcept { return aborted_; }

    // ── Queries ─────────────────────────────────────────────────────────

    [[nodiscard]] std::vector<std::shared_ptr<Entity>> getAll() const { return table_.allSnapshot(); }

    [[nodiscard]] const std::vector<std::shared_ptr<Entity>>& getAll(ControllerCategory category) const {
        return typeIndex_.getAll(category);
    }

    [[nodiscard]] std::vector<std::shared_ptr<Entity>> getAllLive() const { return table_.allLive(); }

    /// Committed entity with @p id, or nullptr.
    [[nodiscard]] std::shared_ptr<Entity> getEntity(int32_t id) const { return table_.get(id); }

    [[nodiscard]] const std::vector<std::shared_ptr<Entity>>& getPlayers() const noexcept {
        return players_.snapshot();
    }

    [[nodiscard]] const BlockEntityIndex::Map::map_type& getBlockEntities() const noexcept {
        return blocks_.snapshot();
    }

    /// Number of live entities.
    [[nodiscard]] std::size_t entityCount() const noexcept { return table_.liveSize(); }

    [[nodiscard]] ecs::TickPhase phase() const noexcept { return snapshotManager_.phase(); }

    [[nodiscard]] uint64_t commitCount() const noexcept { return snapshotManager_.commitCount(); }

    [[nodiscard]] const std::string& name() const noexcept { return name_; }

private:
    /// Bring roster and block index membership in line with the entity's
    /// current category.
    void syncMembership(const std::shared_ptr<Entity>& entity);

    [[nodiscard]] bool hasUnreconciledEntityState() const;

    std::shared_ptr<ecs::IIdentityAllocator> allocator_;
    std::string name_;

    // Must precede every structure registered with it.
    ecs::SnapshotManager snapshotManager_;

    EntityTable table_;
    TypeIndex typeIndex_;
    PlayerRoster players_;
    BlockEntityIndex blocks_;
    ObserverTable observers_;
    MoveLog moves_;

    // Cell each block-bound entity was placed in.
    std::unordered_map<const Entity*, BlockPos> blockCells_;

    VisibilitySynchronizer synchronizer_;

    bool aborted_ = false;
};

} // namespace rgs::world
