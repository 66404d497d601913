/// @file region_server_config.cpp
/// @brief RegionServerConfig implementation.

#include "rgs/service/region_server_config.hpp"

#include <string>

namespace rgs::service {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;

namespace {

GameResult<RegionServerConfig> outOfRange(std::string_view key, const std::string& detail) {
    return GameResult<RegionServerConfig>::err(
        GameError(ErrorCode::ConfigValueOutOfRange, std::string(key) + ": " + detail));
}

} // namespace

GameResult<RegionServerConfig> RegionServerConfig::fromConfig(
    const foundation::ConfigManager& config) {
    RegionServerConfig cfg;

    auto firstId = config.getOr<int32_t>("identity.first_id", cfg.firstEntityId);
    if (!firstId) {
        return GameResult<RegionServerConfig>::err(firstId.error());
    }
    auto maxId = config.getOr<int32_t>("identity.max_id", cfg.maxEntityId);
    if (!maxId) {
        return GameResult<RegionServerConfig>::err(maxId.error());
    }
    if (firstId.value() < 0) {
        return outOfRange("identity.first_id", "must not be negative");
    }
    if (maxId.value() < firstId.value()) {
        return outOfRange("identity.max_id", "must not be below identity.first_id");
    }
    cfg.firstEntityId = firstId.value();
    cfg.maxEntityId = maxId.value();

    auto regions = config.getOr<int32_t>("regions.count", static_cast<int32_t>(cfg.regionCount));
    if (!regions) {
        return GameResult<RegionServerConfig>::err(regions.error());
    }
    if (regions.value() <= 0) {
        return outOfRange("regions.count", "must be positive");
    }
    cfg.regionCount = static_cast<std::size_t>(regions.value());

    auto rate = config.getOr<int32_t>("tick.rate", static_cast<int32_t>(cfg.tickRate));
    if (!rate) {
        return GameResult<RegionServerConfig>::err(rate.error());
    }
    if (rate.value() <= 0) {
        return outOfRange("tick.rate", "must be positive");
    }
    cfg.tickRate = static_cast<uint32_t>(rate.value());

    auto threads = config.getOr<int32_t>("tick.worker_threads",
                                         static_cast<int32_t>(cfg.workerThreads));
    if (!threads) {
        return GameResult<RegionServerConfig>::err(threads.error());
    }
    if (threads.value() <= 0) {
        return outOfRange("tick.worker_threads", "must be positive");
    }
    cfg.workerThreads = static_cast<std::size_t>(threads.value());

    for (const auto& key : config.keysUnder("logging")) {
        const auto categoryName = std::string_view(key).substr(std::string_view("logging.").size());
        auto category = foundation::parseLogCategory(categoryName);
        if (!category) {
            RGS_LOG_WARN(LogCategory::Config, "ignoring unknown log category: " + key);
            continue;
        }
        auto levelName = config.get<std::string>(key);
        if (!levelName) {
            return GameResult<RegionServerConfig>::err(levelName.error());
        }
        auto level = foundation::parseLogLevel(levelName.value());
        if (!level) {
            return outOfRange(key, "unknown log level '" + levelName.value() + "'");
        }
        cfg.logLevels.emplace_back(*category, *level);
    }

    return GameResult<RegionServerConfig>::ok(std::move(cfg));
}

void RegionServerConfig::applyLogLevels(foundation::GameLogger& logger) const {
    for (const auto& [category, level] : logLevels) {
        logger.setCategoryLevel(category, level);
    }
}

} // namespace rgs::service
