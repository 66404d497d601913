/// @file entity.cpp
/// @brief Entity double-buffer bookkeeping.

#include "rgs/world/entity.hpp"

namespace rgs::world {

Entity::Entity(ControllerCategory controller, const Vector3& position, int32_t viewDistance)
    : controller_(controller),
      prevController_(controller),
      position_(position),
      positionLive_(position),
      viewDistance_(viewDistance),
      prevViewDistance_(viewDistance) {}

void Entity::finalizeRun() {
    if (tickHook_) {
        tickHook_(*this);
    }
}

void Entity::copySnapshot() {
    position_ = positionLive_;
    chunk_ = chunkLive_;
    prevController_ = controller_;
    prevViewDistance_ = viewDistance_;
    justSpawned_ = false;
}

} // namespace rgs::world
