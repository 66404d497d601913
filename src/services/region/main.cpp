/// @file main.cpp
/// @brief Region server entry point.
///
/// Creates the configured number of regions sharing one identity
/// allocator and ticks them at a fixed rate until SIGINT or SIGTERM.

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include "rgs/ecs/identity_allocator.hpp"
#include "rgs/foundation/config_manager.hpp"
#include "rgs/foundation/game_logger.hpp"
#include "rgs/foundation/job_scheduler.hpp"
#include "rgs/service/region_server_config.hpp"
#include "rgs/service/region_tick_loop.hpp"
#include "rgs/service/service_runner.hpp"
#include "rgs/world/entity_registry.hpp"

int main(int argc, char* argv[]) {
    using rgs::foundation::LogCategory;

    rgs::service::ShutdownSignal stopSignal;

    const auto configPath =
        rgs::service::resolveConfigPath(argc, argv, "/etc/rgs/config.yaml");

    rgs::foundation::ConfigManager config;
    auto serverCfg = rgs::service::loadServerConfig(config, configPath);
    if (!serverCfg) {
        std::cerr << "Invalid config " << configPath << ": " << serverCfg.error().message()
                  << "\n";
        return EXIT_FAILURE;
    }
    const auto& cfg = serverCfg.value();
    cfg.applyLogLevels(rgs::foundation::GameLogger::instance());

    auto allocator =
        std::make_shared<rgs::ecs::AtomicIdentityAllocator>(cfg.firstEntityId, cfg.maxEntityId);

    rgs::foundation::JobScheduler scheduler(cfg.workerThreads);
    rgs::service::RegionTickLoop loop(scheduler, cfg.tickRate);
    for (std::size_t i = 0; i < cfg.regionCount; ++i) {
        loop.addRegistry(std::make_shared<rgs::world::EntityRegistry>(
            allocator, "region-" + std::to_string(i)));
    }

    loop.setMetricsCallback([](const rgs::service::RegionTickMetrics& m) {
        if (m.overrun) {
            RGS_LOG_WARN(LogCategory::Region,
                         "tick " + std::to_string(m.tickNumber) + " overran: " +
                             std::to_string(m.updateTime.count()) + "us");
        }
        if (m.failedCommits > 0) {
            RGS_LOG_ERROR(LogCategory::Region,
                          std::to_string(m.failedCommits) + " regions failed to commit on tick " +
                              std::to_string(m.tickNumber));
        }
    });

    if (!loop.start()) {
        std::cerr << "Failed to start region tick loop\n";
        return EXIT_FAILURE;
    }

    std::cout << "Region server started (regions: " << cfg.regionCount
              << ", tick_rate: " << cfg.tickRate << " Hz, workers: " << cfg.workerThreads
              << ")\n";

    stopSignal.wait();

    std::cout << "Shutting down region server...\n";
    loop.stop();

    auto flushed = rgs::foundation::GameLogger::instance().flush();
    if (!flushed) {
        std::cerr << "Log flush failed: " << flushed.error().message() << "\n";
    }
    std::cout << "Region server stopped\n";
    return EXIT_SUCCESS;
}
