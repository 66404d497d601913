#pragma once

/// @file visibility_synchronizer.hpp
/// @brief Decides, per (observer, entity) pair, which network message the
///        observer needs this tick.
///
/// For each pair the observer's committed distance to the entity's
/// committed chunk is compared with its live distance to the entity's
/// live chunk, each against the matching view distance of the entity:
///
///   was visible, now hidden       -> destroy
///   was hidden, now visible       -> spawn
///   visible, category changed     -> destroy, spawn, update
///   visible, same category        -> update
///   hidden both times             -> nothing
///
/// A just-spawned entity has no committed distance.  Three passes visit
/// the pairs (dirty observers, moved/spawned/removed entities, then every
/// remaining observed pair); each pair is decided at most once per tick.

#include "rgs/ecs/change_log.hpp"
#include "rgs/world/entity.hpp"
#include "rgs/world/entity_table.hpp"
#include "rgs/world/observer_table.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <unordered_set>
#include <utility>
#include <vector>

namespace rgs::world {

/// Outcome of comparing one pair across the tick boundary.
enum class Transition : uint8_t {
    None,
    Spawn,
    Destroy,
    Respawn,  ///< destroy + spawn + update: the client must rebuild it
    Update
};

/// Messages issued by one synchronization pass.
struct SyncStats {
    uint64_t spawns = 0;
    uint64_t destroys = 0;
    uint64_t updates = 0;
    uint64_t pairsEvaluated = 0;

    SyncStats& operator+=(const SyncStats& rhs) noexcept {
        spawns += rhs.spawns;
        destroys += rhs.destroys;
        updates += rhs.updates;
        pairsEvaluated += rhs.pairsEvaluated;
        return *this;
    }
};

using MoveLog = ecs::ChangeLog<std::shared_ptr<Entity>>;

class VisibilitySynchronizer {
public:
    VisibilitySynchronizer(const EntityTable& entities, const ObserverTable& observers,
                           const MoveLog& moves);

    /// Run the three passes and send the resulting messages.
    SyncStats synchronize();

    /// The transition rule.  std::nullopt distances are infinite.
    [[nodiscard]] static Transition classify(std::optional<int32_t> distOld,
                                             std::optional<int32_t> distNew,
                                             int32_t viewOld, int32_t viewNew,
                                             bool categoryChanged) noexcept;

private:
    struct PairHash {
        std::size_t operator()(const std::pair<const Entity*, const Entity*>& p) const noexcept;
    };

    /// Committed entities plus entities spawned this tick.
    [[nodiscard]] std::vector<std::shared_ptr<Entity>> population() const;

    void evaluate(const std::shared_ptr<Entity>& observer, const std::shared_ptr<Entity>& entity,
                  SyncStats& stats);

    const EntityTable& entities_;
    const ObserverTable& observers_;
    const MoveLog& moves_;

    std::unordered_set<std::pair<const Entity*, const Entity*>, PairHash> handled_;
};

} // namespace rgs::world
