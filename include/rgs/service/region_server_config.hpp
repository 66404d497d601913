#pragma once

/// @file region_server_config.hpp
/// @brief Typed settings of a region server, read from ConfigManager.

#include "rgs/ecs/identity_allocator.hpp"
#include "rgs/foundation/config_manager.hpp"
#include "rgs/foundation/game_logger.hpp"
#include "rgs/foundation/game_result.hpp"

#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

namespace rgs::service {

/// Settings of one region server process.
///
/// YAML layout:
/// @code
///   identity:
///     first_id: 1
///     max_id: 2147483647
///   regions:
///     count: 4
///   tick:
///     rate: 20
///     worker_threads: 2
///   logging:
///     registry: debug
///     visibility: trace
/// @endcode
struct RegionServerConfig {
    int32_t firstEntityId = ecs::kFirstEntityId;
    int32_t maxEntityId = ecs::kMaxEntityId;

    /// Regions the server process ticks.
    std::size_t regionCount = 1;

    /// Ticks per second.
    uint32_t tickRate = 20;

    /// Pool size of the job scheduler that ticks the regions.
    std::size_t workerThreads = 2;

    /// Per-category minimum log levels from the logging section.
    std::vector<std::pair<foundation::LogCategory, foundation::LogLevel>> logLevels;

    /// Read every setting; missing keys keep their defaults.
    ///
    /// @return ConfigTypeMismatch for a key of the wrong type,
    ///         ConfigValueOutOfRange for an unusable value or an unknown
    ///         log level name.
    static foundation::GameResult<RegionServerConfig> fromConfig(
        const foundation::ConfigManager& config);

    /// Install logLevels on @p logger.
    void applyLogLevels(foundation::GameLogger& logger) const;
};

} // namespace rgs::service
