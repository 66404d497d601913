#pragma once

/// @file observer_table.hpp
/// @brief Double-buffered (observer, chunk) -> distance registry.
///
/// Chunks decide who observes them and report the distance of each
/// observer here; the visibility pass compares the committed and live
/// distances.  A missing pair reads as std::nullopt, which the pass
/// treats as infinitely far away.

#include "rgs/ecs/snapshotable_map.hpp"
#include "rgs/world/entity.hpp"
#include "rgs/world/world_types.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace rgs::world {

class IChunk;

struct ObserverKey {
    std::shared_ptr<Entity> observer;
    const IChunk* chunk = nullptr;

    bool operator==(const ObserverKey& rhs) const noexcept {
        return observer == rhs.observer && chunk == rhs.chunk;
    }
};

struct ObserverKeyHash {
    std::size_t operator()(const ObserverKey& key) const noexcept {
        auto h = std::hash<const Entity*>{}(key.observer.get());
        return h ^ (std::hash<const IChunk*>{}(key.chunk) + 0x9e3779b9 + (h << 6) + (h >> 2));
    }
};

class ObserverTable final : public ecs::ISnapshotable {
public:
    using Map = ecs::SnapshotableMap<ObserverKey, int32_t, ObserverKeyHash>;

    explicit ObserverTable(ecs::SnapshotManager& manager);

    ObserverTable(const ObserverTable&) = delete;
    ObserverTable& operator=(const ObserverTable&) = delete;

    /// Record that @p observer sees @p chunk from @p distance.
    /// Re-setting an unchanged distance is not a change.
    void set(const std::shared_ptr<Entity>& observer, const IChunk* chunk, int32_t distance);

    /// @return false if the pair was not registered.
    bool remove(const std::shared_ptr<Entity>& observer, const IChunk* chunk);

    /// Drop every chunk registered for @p observer.
    /// @return Number of pairs removed.
    std::size_t removeAll(const std::shared_ptr<Entity>& observer);

    [[nodiscard]] std::optional<int32_t> distance(const Entity& observer, const IChunk* chunk,
                                                  View view) const;

    /// Observers registered for @p chunk in the given view.
    [[nodiscard]] std::vector<std::shared_ptr<Entity>> observersOf(const IChunk* chunk,
                                                                   View view) const;

    /// Observers whose distances changed since the last commit, in order
    /// of first change.
    [[nodiscard]] const std::vector<std::shared_ptr<Entity>>& dirtyObservers() const noexcept {
        return dirtyObservers_;
    }

    [[nodiscard]] std::size_t liveSize() const noexcept { return map_.getLive().size(); }

    void copySnapshot() override;

private:
    using ChunkObservers = std::unordered_map<const Entity*, std::shared_ptr<Entity>>;

    void markDirty(const std::shared_ptr<Entity>& observer, const IChunk* chunk);

    ecs::SnapshotManager& manager_;
    Map map_;

    std::unordered_map<const IChunk*, ChunkObservers> liveByChunk_;
    std::unordered_map<const IChunk*, ChunkObservers> snapshotByChunk_;
    std::unordered_map<const Entity*, std::unordered_set<const IChunk*>> liveChunksOf_;

    std::unordered_set<const IChunk*> touchedChunks_;
    std::unordered_set<const Entity*> dirtySeen_;
    std::vector<std::shared_ptr<Entity>> dirtyObservers_;
};

} // namespace rgs::world
