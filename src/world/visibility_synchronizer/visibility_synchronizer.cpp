/// @file visibility_synchronizer.cpp
/// @brief VisibilitySynchronizer implementation.

#include "rgs/world/visibility_synchronizer.hpp"

#include "rgs/foundation/game_logger.hpp"
#include "rgs/world/network_synchronizer.hpp"

#include <string>

namespace rgs::world {

using foundation::LogCategory;

namespace {

bool isVisible(std::optional<int32_t> distance, int32_t viewDistance) noexcept {
    return distance.has_value() && *distance != kInfiniteDistance && *distance <= viewDistance;
}

void appendUnique(std::vector<std::shared_ptr<Entity>>& out,
                  std::unordered_set<const Entity*>& seen,
                  const std::vector<std::shared_ptr<Entity>>& candidates) {
    for (const auto& candidate : candidates) {
        if (seen.insert(candidate.get()).second) {
            out.push_back(candidate);
        }
    }
}

} // namespace

std::size_t VisibilitySynchronizer::PairHash::operator()(
    const std::pair<const Entity*, const Entity*>& p) const noexcept {
    auto h = std::hash<const Entity*>{}(p.first);
    return h ^ (std::hash<const Entity*>{}(p.second) + 0x9e3779b9 + (h << 6) + (h >> 2));
}

VisibilitySynchronizer::VisibilitySynchronizer(const EntityTable& entities,
                                               const ObserverTable& observers,
                                               const MoveLog& moves)
    : entities_(entities), observers_(observers), moves_(moves) {}

Transition VisibilitySynchronizer::classify(std::optional<int32_t> distOld,
                                            std::optional<int32_t> distNew, int32_t viewOld,
                                            int32_t viewNew, bool categoryChanged) noexcept {
    const bool wasVisible = isVisible(distOld, viewOld);
    const bool nowVisible = isVisible(distNew, viewNew);

    if (wasVisible && !nowVisible) {
        return Transition::Destroy;
    }
    if (!wasVisible && nowVisible) {
        return Transition::Spawn;
    }
    if (wasVisible) {
        return categoryChanged ? Transition::Respawn : Transition::Update;
    }
    return Transition::None;
}

std::vector<std::shared_ptr<Entity>> VisibilitySynchronizer::population() const {
    std::vector<std::shared_ptr<Entity>> out;
    std::unordered_set<const Entity*> seen;
    out.reserve(entities_.snapshotSize());
    for (const auto& [id, entity] : entities_.snapshotMap()) {
        if (seen.insert(entity.get()).second) {
            out.push_back(entity);
        }
    }
    for (const auto& change : entities_.dirty()) {
        if (change.kind == ecs::ChangeKind::Put && change.value->justSpawned() &&
            seen.insert(change.value.get()).second) {
            out.push_back(change.value);
        }
    }
    return out;
}

void VisibilitySynchronizer::evaluate(const std::shared_ptr<Entity>& observer,
                                      const std::shared_ptr<Entity>& entity, SyncStats& stats) {
    if (observer == entity || !observer->canReceive()) {
        return;
    }
    if (!handled_.emplace(observer.get(), entity.get()).second) {
        return;
    }
    ++stats.pairsEvaluated;

    std::optional<int32_t> distOld;
    if (!entity->justSpawned() && entity->chunk() != nullptr) {
        distOld = observers_.distance(*observer, entity->chunk(), View::Snapshot);
    }
    std::optional<int32_t> distNew;
    if (entity->chunkLive() != nullptr) {
        distNew = observers_.distance(*observer, entity->chunkLive(), View::Live);
    }

    auto* channel = observer->networkSynchronizer();
    switch (classify(distOld, distNew, entity->previousViewDistance(), entity->viewDistance(),
                     entity->controllerChanged())) {
        case Transition::Destroy:
            channel->destroyEntity(*entity);
            ++stats.destroys;
            break;
        case Transition::Spawn:
            channel->spawnEntity(*entity);
            ++stats.spawns;
            break;
        case Transition::Respawn:
            channel->destroyEntity(*entity);
            channel->spawnEntity(*entity);
            channel->syncEntity(*entity);
            ++stats.destroys;
            ++stats.spawns;
            ++stats.updates;
            break;
        case Transition::Update:
            channel->syncEntity(*entity);
            ++stats.updates;
            break;
        case Transition::None:
            break;
    }
}

SyncStats VisibilitySynchronizer::synchronize() {
    SyncStats stats;
    handled_.clear();

    const auto everyone = population();

    // Pass 1: observers whose distances changed see the whole population.
    for (const auto& observer : observers_.dirtyObservers()) {
        for (const auto& entity : everyone) {
            evaluate(observer, entity, stats);
        }
    }

    // Pass 2: entities that moved chunk, spawned or were removed, against
    // the observers of both chunks.
    std::vector<std::shared_ptr<Entity>> changed;
    std::unordered_set<const Entity*> changedSeen;
    for (const auto& change : entities_.dirty()) {
        if (changedSeen.insert(change.value.get()).second) {
            changed.push_back(change.value);
        }
    }
    appendUnique(changed, changedSeen, moves_.entries());

    for (const auto& entity : changed) {
        std::vector<std::shared_ptr<Entity>> watchers;
        std::unordered_set<const Entity*> watcherSeen;
        if (entity->chunk() != nullptr) {
            appendUnique(watchers, watcherSeen, observers_.observersOf(entity->chunk(), View::Live));
        }
        if (entity->chunkLive() != nullptr) {
            appendUnique(watchers, watcherSeen,
                         observers_.observersOf(entity->chunkLive(), View::Live));
        }
        for (const auto& observer : watchers) {
            evaluate(observer, entity, stats);
        }
    }

    // Pass 3: every remaining pair with a distance in either view.
    for (const auto& entity : everyone) {
        std::vector<std::shared_ptr<Entity>> watchers;
        std::unordered_set<const Entity*> watcherSeen;
        if (entity->chunk() != nullptr) {
            appendUnique(watchers, watcherSeen,
                         observers_.observersOf(entity->chunk(), View::Snapshot));
        }
        if (entity->chunkLive() != nullptr) {
            appendUnique(watchers, watcherSeen,
                         observers_.observersOf(entity->chunkLive(), View::Live));
        }
        for (const auto& observer : watchers) {
            evaluate(observer, entity, stats);
        }
    }

    RGS_LOG_TRACE(LogCategory::Visibility,
                  "sync: " + std::to_string(stats.spawns) + " spawns, " +
                      std::to_string(stats.destroys) + " destroys, " +
                      std::to_string(stats.updates) + " updates over " +
                      std::to_string(stats.pairsEvaluated) + " pairs");
    return stats;
}

} // namespace rgs::world
