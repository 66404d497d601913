#pragma once

/// @file network_synchronizer.hpp
/// @brief Per-player network channel consumed by the visibility pass.
///
/// Wire encoding is the implementer's concern; the registry only decides
/// which of these calls to make and in which order.

namespace rgs::world {

class Entity;

class INetworkSynchronizer {
public:
    virtual ~INetworkSynchronizer() = default;

    /// The client must create its representation of @p entity.
    virtual void spawnEntity(const Entity& entity) = 0;

    /// The client must drop its representation of @p entity.
    virtual void destroyEntity(const Entity& entity) = 0;

    /// Incremental state update for an entity the client already has.
    virtual void syncEntity(const Entity& entity) = 0;

    /// End-of-tick flush of pending work.
    virtual void finalizeTick() = 0;

    /// Last look at the live view before it becomes the snapshot.
    virtual void preSnapshot() = 0;
};

} // namespace rgs::world
