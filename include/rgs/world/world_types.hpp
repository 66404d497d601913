#pragma once

/// @file world_types.hpp
/// @brief Enumerations and constants shared by the registry and the
///        visibility synchronizer.

#include <array>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string_view>

#include "rgs/ecs/identity_allocator.hpp"

namespace rgs::world {

using ecs::kNotSpawnedId;

/// Behavioural classification of an entity.
///
/// Switched on explicitly by the registry (roster / block index
/// membership) and by the synchronizer (who may receive messages, when
/// a client must rebuild type-specific state).
enum class ControllerCategory : uint8_t {
    None,       ///< No controller: table and type index only.
    Generic,    ///< Ordinary simulated actor.
    Player,     ///< Player-controlled; may observe and receive messages.
    BlockBound  ///< At most one per block cell.
};

inline constexpr std::size_t kControllerCategoryCount = 4;

constexpr std::string_view controllerCategoryName(ControllerCategory category) {
    constexpr std::array<std::string_view, kControllerCategoryCount> names = {
        "None", "Generic", "Player", "BlockBound"
    };
    auto idx = static_cast<std::size_t>(category);
    return idx < kControllerCategoryCount ? names[idx] : "Unknown";
}

/// Distance used for an observer with no registered distance.
inline constexpr int32_t kInfiniteDistance = std::numeric_limits<int32_t>::max();

/// View distance given to entities that do not set one (world units).
inline constexpr int32_t kDefaultViewDistance = 64;

/// Which side of a double-buffered value to read.
enum class View : uint8_t {
    Snapshot,  ///< State as of the last commit.
    Live       ///< State as modified during the current tick.
};

} // namespace rgs::world
