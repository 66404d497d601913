#pragma once

/// @file entity.hpp
/// @brief Simulation actor tracked by an EntityRegistry.
///
/// Every field the visibility pass compares across ticks is double
/// buffered: setters write the live value, copySnapshot() publishes it.
/// The committed accessors (position(), chunk(), previousController(),
/// previousViewDistance()) are stable for the whole tick and may be read
/// from other threads.  Everything else belongs to the owning region's
/// execution context.

#include "rgs/world/math_types.hpp"
#include "rgs/world/world_types.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <thread>

namespace rgs::world {

class IChunk;
class INetworkSynchronizer;

class Entity {
public:
    /// Per-tick behaviour hook, run by EntityRegistry::finalizeRun().
    using TickHook = std::function<void(Entity&)>;

    explicit Entity(ControllerCategory controller = ControllerCategory::None,
                    const Vector3& position = {},
                    int32_t viewDistance = kDefaultViewDistance);

    // Entities are shared by identity; copying one would fork it.
    Entity(const Entity&) = delete;
    Entity& operator=(const Entity&) = delete;

    // ── Identity ────────────────────────────────────────────────────────

    [[nodiscard]] int32_t id() const noexcept { return id_; }
    void setId(int32_t id) noexcept { id_ = id; }
    [[nodiscard]] bool isSpawned() const noexcept { return id_ != kNotSpawnedId; }

    // ── Controller ──────────────────────────────────────────────────────

    [[nodiscard]] ControllerCategory controller() const noexcept { return controller_; }
    [[nodiscard]] ControllerCategory previousController() const noexcept { return prevController_; }
    void setController(ControllerCategory controller) noexcept { controller_ = controller; }

    [[nodiscard]] bool isPlayer() const noexcept {
        return controller_ == ControllerCategory::Player;
    }

    /// True when the category differs from the one committed last tick.
    [[nodiscard]] bool controllerChanged() const noexcept {
        return controller_ != prevController_;
    }

    // ── Position and chunk membership ───────────────────────────────────

    [[nodiscard]] const Vector3& position() const noexcept { return position_; }
    [[nodiscard]] const Vector3& positionLive() const noexcept { return positionLive_; }
    void setPosition(const Vector3& position) noexcept { positionLive_ = position; }

    /// Committed chunk (non-owning), or nullptr.
    [[nodiscard]] IChunk* chunk() const noexcept { return chunk_; }
    /// Live chunk (non-owning), or nullptr.
    [[nodiscard]] IChunk* chunkLive() const noexcept { return chunkLive_; }
    void setChunk(IChunk* chunk) noexcept { chunkLive_ = chunk; }

    [[nodiscard]] bool chunkChanged() const noexcept { return chunk_ != chunkLive_; }

    [[nodiscard]] IChunk* chunkAt(View view) const noexcept {
        return view == View::Snapshot ? chunk_ : chunkLive_;
    }

    // ── View distance ───────────────────────────────────────────────────

    [[nodiscard]] int32_t viewDistance() const noexcept { return viewDistance_; }
    [[nodiscard]] int32_t previousViewDistance() const noexcept { return prevViewDistance_; }
    void setViewDistance(int32_t distance) noexcept { viewDistance_ = distance; }

    // ── Lifecycle flags ─────────────────────────────────────────────────

    [[nodiscard]] bool isDead() const noexcept { return dead_; }
    void kill() noexcept { dead_ = true; }

    /// Set from spawn until the entity's first commit.
    [[nodiscard]] bool justSpawned() const noexcept { return justSpawned_; }
    void markJustSpawned() noexcept { justSpawned_ = true; }

    // ── Player payload (meaningful only for ControllerCategory::Player) ─

    [[nodiscard]] bool isOnline() const noexcept { return online_; }
    void setOnline(bool online) noexcept { online_ = online; }

    [[nodiscard]] INetworkSynchronizer* networkSynchronizer() const noexcept {
        return synchronizer_.get();
    }
    void setNetworkSynchronizer(std::shared_ptr<INetworkSynchronizer> synchronizer) {
        synchronizer_ = std::move(synchronizer);
    }

    /// True when this entity is a player that can be sent messages now.
    [[nodiscard]] bool canReceive() const noexcept {
        return isPlayer() && online_ && synchronizer_ != nullptr;
    }

    // ── Execution affinity ──────────────────────────────────────────────

    [[nodiscard]] std::thread::id owningThread() const noexcept { return owningThread_; }
    void setOwningThread(std::thread::id thread) noexcept { owningThread_ = thread; }

    // ── Tick ────────────────────────────────────────────────────────────

    void setTickHook(TickHook hook) { tickHook_ = std::move(hook); }

    /// Run the entity's own end-of-tick work.
    void finalizeRun();

    /// Publish every live value as the committed value and clear the
    /// just-spawned flag.
    void copySnapshot();

    /// True while a live value the visibility pass reads differs from its
    /// committed value, or the entity has not been committed yet.
    [[nodiscard]] bool hasPendingState() const noexcept {
        return justSpawned_ || controllerChanged() || chunkChanged() ||
               viewDistance_ != prevViewDistance_;
    }

private:
    int32_t id_ = kNotSpawnedId;

    ControllerCategory controller_;
    ControllerCategory prevController_;

    Vector3 position_;
    Vector3 positionLive_;

    IChunk* chunk_ = nullptr;
    IChunk* chunkLive_ = nullptr;

    int32_t viewDistance_;
    int32_t prevViewDistance_;

    bool dead_ = false;
    bool justSpawned_ = false;

    bool online_ = false;
    std::shared_ptr<INetworkSynchronizer> synchronizer_;

    std::thread::id owningThread_;
    TickHook tickHook_;
};

} // namespace rgs::world
