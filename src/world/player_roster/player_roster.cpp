/// @file player_roster.cpp
/// @brief PlayerRoster implementation.

#include "rgs/world/player_roster.hpp"

namespace rgs::world {

PlayerRoster::PlayerRoster(ecs::SnapshotManager& manager) : players_(manager) {}

bool PlayerRoster::add(const std::shared_ptr<Entity>& player) {
    if (!player || !player->isPlayer()) {
        return false;
    }
    return players_.add(player);
}

bool PlayerRoster::remove(const std::shared_ptr<Entity>& player) {
    return player != nullptr && players_.remove(player);
}

bool PlayerRoster::contains(const std::shared_ptr<Entity>& player) const {
    return players_.containsLive(player);
}

} // namespace rgs::world
