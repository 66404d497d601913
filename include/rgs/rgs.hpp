#pragma once

/// @file rgs.hpp
/// @brief Aggregate header for the region entity server core.

#include "rgs/version.hpp"

#include "rgs/foundation/error_code.hpp"
#include "rgs/foundation/game_error.hpp"
#include "rgs/foundation/game_result.hpp"

#include "rgs/ecs/identity_allocator.hpp"
#include "rgs/ecs/snapshot_manager.hpp"

#include "rgs/world/entity.hpp"
#include "rgs/world/entity_registry.hpp"
#include "rgs/world/visibility_synchronizer.hpp"
