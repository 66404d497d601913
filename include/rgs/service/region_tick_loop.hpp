#pragma once

/// @file region_tick_loop.hpp
/// @brief Fixed-rate loop that ticks every region of a world in parallel.
///
/// Each tick submits one job per registered region to the JobScheduler.
/// A job runs the region's simulation callback followed by the registry
/// phases (finalizeRun, syncEntities, preSnapshotRun, copyAllSnapshots),
/// so a region is only ever touched by one worker at a time.  The tick
/// ends when every region job has finished.
///
/// A region whose job throws before its commit is aborted: later ticks
/// skip it and count it as a failed commit until EntityRegistry::resync()
/// is called on it while no tick is running.

#include "rgs/foundation/job_scheduler.hpp"
#include "rgs/world/entity_registry.hpp"
#include "rgs/world/visibility_synchronizer.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace rgs::service {

/// Per-tick performance and synchronization metrics.
struct RegionTickMetrics {
    /// Time spent running all region jobs.
    std::chrono::microseconds updateTime{0};

    /// Total frame time including sleep.
    std::chrono::microseconds frameTime{0};

    /// Ratio of updateTime to target frame time (1.0 = full budget).
    float budgetUtilization = 0.0f;

    /// Monotonically increasing tick counter (starts at 0).
    uint64_t tickNumber = 0;

    /// True when updateTime exceeded the target frame time.
    bool overrun = false;

    /// Regions ticked.
    uint32_t regions = 0;

    /// Messages sent by all regions this tick.
    world::SyncStats sync;

    /// Regions whose commit was refused or whose job failed.
    uint32_t failedCommits = 0;
};

class RegionTickLoop {
public:
    /// Live-phase work of one region; may spawn, move and remove entities.
    using SimulationCallback = std::function<void(world::EntityRegistry&, float deltaTime)>;
    using MetricsCallback = std::function<void(const RegionTickMetrics&)>;

    /// @param scheduler  Pool the region jobs run on; must outlive the loop.
    /// @param tickRate   Ticks per second (default: 20).
    explicit RegionTickLoop(foundation::JobScheduler& scheduler, uint32_t tickRate = 20);

    ~RegionTickLoop();

    // Non-copyable, non-movable (owns a thread).
    RegionTickLoop(const RegionTickLoop&) = delete;
    RegionTickLoop& operator=(const RegionTickLoop&) = delete;
    RegionTickLoop(RegionTickLoop&&) = delete;
    RegionTickLoop& operator=(RegionTickLoop&&) = delete;

    /// Tick @p registry from the next tick on.
    void addRegistry(std::shared_ptr<world::EntityRegistry> registry);

    /// Stop ticking @p registry.
    /// @return false if it was not registered.
    bool removeRegistry(const world::EntityRegistry& registry);

    [[nodiscard]] std::size_t registryCount() const;

    void setSimulationCallback(SimulationCallback callback);

    /// Set an optional callback invoked after each tick with metrics.
    void setMetricsCallback(MetricsCallback callback);

    /// Start the loop on a dedicated thread.
    ///
    /// @return true on success, false if already running.
    [[nodiscard]] bool start();

    /// Signal the loop to stop and wait for the thread to join.
    void stop();

    /// Execute a single tick manually (for testing).
    ///
    /// The loop must not be running on a thread when calling this.
    RegionTickMetrics tick();

    [[nodiscard]] bool isRunning() const noexcept;

    [[nodiscard]] uint32_t tickRate() const noexcept;

    [[nodiscard]] std::chrono::microseconds targetFrameTime() const noexcept;

    [[nodiscard]] uint64_t tickCount() const noexcept;

    /// Metrics from the last completed tick.
    [[nodiscard]] RegionTickMetrics lastMetrics() const;

private:
    struct RegionOutcome {
        world::SyncStats sync;
        bool committed = false;
    };

    void run();

    RegionTickMetrics executeTick();

    /// Run one region's tick; executed on a scheduler worker.
    RegionOutcome tickRegion(world::EntityRegistry& registry, float deltaTime) const;

    foundation::JobScheduler& scheduler_;

    uint32_t tickRate_;
    std::chrono::microseconds targetFrameTime_;

    mutable std::mutex registriesMutex_;
    std::vector<std::shared_ptr<world::EntityRegistry>> registries_;

    SimulationCallback simulationCallback_;
    MetricsCallback metricsCallback_;
    mutable std::mutex callbackMutex_;

    std::atomic<bool> running_{false};
    std::atomic<uint64_t> tickCount_{0};
    std::thread thread_;

    mutable std::mutex metricsMutex_;
    RegionTickMetrics lastMetrics_;
};

} // namespace rgs::service
