/// @file entity_registry.cpp
/// @brief EntityRegistry implementation.

#include "rgs/world/entity_registry.hpp"

#include "rgs/foundation/game_logger.hpp"
#include "rgs/world/chunk.hpp"
#include "rgs/world/network_synchronizer.hpp"
#include "rgs/world/region.hpp"

#include <cassert>
#include <string>
#include <unordered_set>

namespace rgs::world {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

EntityRegistry::EntityRegistry(std::shared_ptr<ecs::IIdentityAllocator> allocator,
                               std::string name)
    : allocator_(std::move(allocator)),
      name_(std::move(name)),
      table_(snapshotManager_),
      typeIndex_(snapshotManager_),
      players_(snapshotManager_),
      blocks_(snapshotManager_),
      observers_(snapshotManager_),
      moves_(snapshotManager_),
      synchronizer_(table_, observers_, moves_) {
    assert(allocator_ != nullptr && "EntityRegistry requires an identity allocator");
}

GameResult<int32_t> EntityRegistry::allocate(const std::shared_ptr<Entity>& entity,
                                             const IRegion& region) {
    if (!isSpawnable(*entity)) {
        // Re-added or transferred entities keep their id.
        entity->setOwningThread(region.executionAffinity());
        table_.put(entity->id(), entity);
        return GameResult<int32_t>::ok(entity->id());
    }

    auto id = allocator_->allocate();
    if (!id) {
        LogContext ctx;
        ctx.region = name_;
        foundation::GameLogger::instance().logWithContext(
            LogLevel::Critical, LogCategory::Registry, "cannot spawn entity: no ids left", ctx);
        return id;
    }

    entity->setId(id.value());
    entity->setOwningThread(region.executionAffinity());
    table_.put(id.value(), entity);
    return id;
}

void EntityRegistry::deallocate(const std::shared_ptr<Entity>& entity) {
    table_.remove(entity->id());

    IChunk* live = entity->chunkLive();
    IChunk* committed = entity->chunk();
    if (live != nullptr && live->isLoaded()) {
        live->removeEntity(*entity);
    }
    if (committed != nullptr && committed != live && committed->isLoaded()) {
        committed->removeEntity(*entity);
    }
    entity->setChunk(nullptr);

    if (entity->isPlayer()) {
        entity->setId(kNotSpawnedId);
    }
}

GameResult<void> EntityRegistry::addEntity(const std::shared_ptr<Entity>& entity,
                                           const IRegion& region) {
    if (!entity) {
        return GameResult<void>::err(
            GameError(ErrorCode::InvalidArgument, "cannot add a null entity"));
    }
    if (!isSpawnable(*entity) && table_.getLive(entity->id()) == entity) {
        RGS_LOG_DEBUG(LogCategory::Registry,
                      "entity " + std::to_string(entity->id()) + " already spawned in " + name_);
        return GameResult<void>::ok();
    }

    auto id = allocate(entity, region);
    if (!id) {
        return GameResult<void>::err(id.error());
    }

    entity->markJustSpawned();
    typeIndex_.add(entity);
    syncMembership(entity);

    if (foundation::GameLogger::instance().isEnabled(LogLevel::Debug, LogCategory::Registry)) {
        LogContext ctx;
        ctx.entityId = entity->id();
        ctx.region = name_;
        ctx.extra["category"] = std::string(controllerCategoryName(entity->controller()));
        foundation::GameLogger::instance().logWithContext(LogLevel::Debug, LogCategory::Registry,
                                                          "entity spawned", ctx);
    }
    return GameResult<void>::ok();
}

bool EntityRegistry::removeEntity(const std::shared_ptr<Entity>& entity) {
    if (!entity || isSpawnable(*entity) || table_.getLive(entity->id()) != entity) {
        return false;
    }
    const int32_t id = entity->id();

    deallocate(entity);
    typeIndex_.remove(entity);
    players_.remove(entity);
    if (auto cell = blockCells_.find(entity.get()); cell != blockCells_.end()) {
        blocks_.remove(cell->second, entity);
        blockCells_.erase(cell);
    }
    observers_.removeAll(entity);

    RGS_LOG_DEBUG(LogCategory::Registry,
                  "entity " + std::to_string(id) + " removed from " + name_);
    return true;
}

void EntityRegistry::moveEntity(const std::shared_ptr<Entity>& entity, const Vector3& position,
                                IChunk* chunk) {
    entity->setPosition(position);
    if (entity->chunkLive() != chunk) {
        entity->setChunk(chunk);
        moves_.append(entity);
    }
}

std::size_t EntityRegistry::unloadAll() {
    std::size_t removed = 0;
    for (const auto& entity : table_.allLive()) {
        if (removeEntity(entity)) {
            ++removed;
        }
    }
    RGS_LOG_INFO(LogCategory::Region,
                 "unloaded " + std::to_string(removed) + " entities from " + name_);
    return removed;
}

void EntityRegistry::setObserverDistance(const std::shared_ptr<Entity>& observer,
                                         const IChunk* chunk, int32_t distance) {
    observers_.set(observer, chunk, distance);
}

bool EntityRegistry::removeObserver(const std::shared_ptr<Entity>& observer, const IChunk* chunk) {
    return observers_.remove(observer, chunk);
}

void EntityRegistry::syncMembership(const std::shared_ptr<Entity>& entity) {
    if (entity->isPlayer()) {
        players_.add(entity);
    } else {
        players_.remove(entity);
    }

    const bool blockBound = entity->controller() == ControllerCategory::BlockBound;
    auto cell = blockCells_.find(entity.get());
    if (blockBound && cell == blockCells_.end()) {
        const auto pos = BlockPos::Containing(entity->positionLive());
        blocks_.put(pos, entity);
        blockCells_.emplace(entity.get(), pos);
    } else if (!blockBound && cell != blockCells_.end()) {
        blocks_.remove(cell->second, entity);
        blockCells_.erase(cell);
    }
}

void EntityRegistry::finalizeRun() {
    std::unordered_set<const Entity*> visited;
    for (const auto& entity : table_.allSnapshot()) {
        visited.insert(entity.get());
        if (entity->isDead()) {
            removeEntity(entity);
            continue;
        }
        entity->finalizeRun();
        if (typeIndex_.reindex(entity)) {
            syncMembership(entity);
        }
        if (entity->canReceive()) {
            entity->networkSynchronizer()->finalizeTick();
        }
    }

    // Entities spawned this tick are not committed yet but must still be
    // filed under the category they will be committed with.
    std::vector<std::shared_ptr<Entity>> spawned;
    for (const auto& change : table_.dirty()) {
        if (change.kind == ecs::ChangeKind::Put && visited.insert(change.value.get()).second &&
            table_.getLive(change.key) == change.value) {
            spawned.push_back(change.value);
        }
    }
    for (const auto& entity : spawned) {
        if (typeIndex_.reindex(entity)) {
            syncMembership(entity);
        }
    }
}

SyncStats EntityRegistry::syncEntities() {
    auto stats = synchronizer_.synchronize();
    snapshotManager_.markReconciled();
    return stats;
}

void EntityRegistry::abortTick(std::string_view reason) {
    aborted_ = true;
    LogContext ctx;
    ctx.region = name_;
    ctx.tick = snapshotManager_.commitCount();
    ctx.extra["reason"] = std::string(reason);
    foundation::GameLogger::instance().logWithContext(
        LogLevel::Critical, LogCategory::Registry,
        "tick aborted; commits suspended until resync", ctx);
}

SyncStats EntityRegistry::resync() {
    finalizeRun();
    auto stats = syncEntities();
    if (aborted_) {
        aborted_ = false;
        RGS_LOG_INFO(LogCategory::Registry, "region " + name_ + " resynced after an aborted tick");
    }
    return stats;
}

bool EntityRegistry::hasUnreconciledEntityState() const {
    for (const auto& [id, entity] : table_.liveMap()) {
        if (entity->hasPendingState()) {
            return true;
        }
    }
    return false;
}

void EntityRegistry::preSnapshotRun() {
    for (const auto& entity : table_.allSnapshot()) {
        if (entity->canReceive()) {
            entity->networkSynchronizer()->preSnapshot();
        }
    }
}

GameResult<void> EntityRegistry::copyAllSnapshots() {
    if (aborted_) {
        RGS_LOG_ERROR(LogCategory::Snapshot,
                      "commit refused: region " + name_ + " aborted its last tick");
        return GameResult<void>::err(
            GameError(ErrorCode::SnapshotFailed, "region must be resynced after an aborted tick"));
    }
    // Entity fields are not registered with the manager, so a change to
    // one of them alone never flips the phase back to Live.
    if (!snapshotManager_.reconciledSinceCommit() && hasUnreconciledEntityState()) {
        snapshotManager_.markLiveChanged();
    }
    if (!snapshotManager_.canCommit()) {
        // Reports the refusal; nothing is committed.
        return snapshotManager_.copyAllSnapshots();
    }

    std::unordered_set<const Entity*> committed;
    for (const auto* map : {&table_.snapshotMap(), &table_.liveMap()}) {
        for (const auto& [id, entity] : *map) {
            if (committed.insert(entity.get()).second) {
                entity->copySnapshot();
            }
        }
    }
    // Entities added and removed within this tick are in neither map.
    for (const auto& change : table_.dirty()) {
        if (committed.insert(change.value.get()).second) {
            change.value->copySnapshot();
        }
    }
    return snapshotManager_.copyAllSnapshots();
}

} // namespace rgs::world
