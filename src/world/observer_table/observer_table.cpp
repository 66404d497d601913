/// @file observer_table.cpp
/// @brief ObserverTable implementation.

#include "rgs/world/observer_table.hpp"

namespace rgs::world {

ObserverTable::ObserverTable(ecs::SnapshotManager& manager) : manager_(manager), map_(manager) {
    manager_.add(this);
}

void ObserverTable::markDirty(const std::shared_ptr<Entity>& observer, const IChunk* chunk) {
    touchedChunks_.insert(chunk);
    if (dirtySeen_.insert(observer.get()).second) {
        dirtyObservers_.push_back(observer);
    }
    manager_.markLiveChanged();
}

void ObserverTable::set(const std::shared_ptr<Entity>& observer, const IChunk* chunk,
                        int32_t distance) {
    ObserverKey key{observer, chunk};
    if (const auto* current = map_.getLive(key); current != nullptr && *current == distance) {
        return;
    }
    map_.put(key, distance);
    liveByChunk_[chunk].insert_or_assign(observer.get(), observer);
    liveChunksOf_[observer.get()].insert(chunk);
    markDirty(observer, chunk);
}

bool ObserverTable::remove(const std::shared_ptr<Entity>& observer, const IChunk* chunk) {
    if (!map_.remove(ObserverKey{observer, chunk})) {
        return false;
    }
    if (auto it = liveByChunk_.find(chunk); it != liveByChunk_.end()) {
        it->second.erase(observer.get());
        if (it->second.empty()) {
            liveByChunk_.erase(it);
        }
    }
    if (auto it = liveChunksOf_.find(observer.get()); it != liveChunksOf_.end()) {
        it->second.erase(chunk);
        if (it->second.empty()) {
            liveChunksOf_.erase(it);
        }
    }
    markDirty(observer, chunk);
    return true;
}

std::size_t ObserverTable::removeAll(const std::shared_ptr<Entity>& observer) {
    auto it = liveChunksOf_.find(observer.get());
    if (it == liveChunksOf_.end()) {
        return 0;
    }
    // remove() edits the set being walked.
    const std::vector<const IChunk*> chunks(it->second.begin(), it->second.end());
    std::size_t removed = 0;
    for (const auto* chunk : chunks) {
        if (remove(observer, chunk)) {
            ++removed;
        }
    }
    return removed;
}

std::optional<int32_t> ObserverTable::distance(const Entity& observer, const IChunk* chunk,
                                               View view) const {
    const auto& byChunk = view == View::Snapshot ? snapshotByChunk_ : liveByChunk_;
    auto chunkIt = byChunk.find(chunk);
    if (chunkIt == byChunk.end()) {
        return std::nullopt;
    }
    auto observerIt = chunkIt->second.find(&observer);
    if (observerIt == chunkIt->second.end()) {
        return std::nullopt;
    }
    ObserverKey key{observerIt->second, chunk};
    const auto* value = view == View::Snapshot ? map_.get(key) : map_.getLive(key);
    if (value == nullptr) {
        return std::nullopt;
    }
    return *value;
}

std::vector<std::shared_ptr<Entity>> ObserverTable::observersOf(const IChunk* chunk,
                                                                View view) const {
    std::vector<std::shared_ptr<Entity>> out;
    const auto& byChunk = view == View::Snapshot ? snapshotByChunk_ : liveByChunk_;
    auto it = byChunk.find(chunk);
    if (it == byChunk.end()) {
        return out;
    }
    out.reserve(it->second.size());
    for (const auto& [raw, observer] : it->second) {
        out.push_back(observer);
    }
    return out;
}

void ObserverTable::copySnapshot() {
    for (const auto* chunk : touchedChunks_) {
        auto live = liveByChunk_.find(chunk);
        if (live == liveByChunk_.end()) {
            snapshotByChunk_.erase(chunk);
        } else {
            snapshotByChunk_.insert_or_assign(chunk, live->second);
        }
    }
    touchedChunks_.clear();
    dirtySeen_.clear();
    dirtyObservers_.clear();
}

} // namespace rgs::world
