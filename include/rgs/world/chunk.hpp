#pragma once

/// @file chunk.hpp
/// @brief Chunk collaborator interface.
///
/// Chunk storage and spatial partitioning live outside the registry.
/// The registry holds non-owning IChunk pointers on entities and only
/// needs to detach entities from a chunk's own membership on removal.

namespace rgs::world {

class Entity;

class IChunk {
public:
    virtual ~IChunk() = default;

    /// True while the chunk is resident; unloaded chunks are not touched.
    [[nodiscard]] virtual bool isLoaded() const = 0;

    /// Drop @p entity from the chunk's membership lists.
    virtual void removeEntity(Entity& entity) = 0;
};

} // namespace rgs::world
