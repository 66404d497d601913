/// @file region_tick_loop.cpp
/// @brief RegionTickLoop implementation.

#include "rgs/service/region_tick_loop.hpp"

#include "rgs/foundation/game_logger.hpp"

#include <algorithm>
#include <exception>
#include <string>

namespace rgs::service {

using foundation::LogCategory;

RegionTickLoop::RegionTickLoop(foundation::JobScheduler& scheduler, uint32_t tickRate)
    : scheduler_(scheduler),
      tickRate_(tickRate > 0 ? tickRate : 20),
      targetFrameTime_(std::chrono::microseconds(
          1'000'000 / (tickRate > 0 ? tickRate : 20))) {}

RegionTickLoop::~RegionTickLoop() {
    stop();
}

void RegionTickLoop::addRegistry(std::shared_ptr<world::EntityRegistry> registry) {
    std::lock_guard<std::mutex> lock(registriesMutex_);
    registries_.push_back(std::move(registry));
}

bool RegionTickLoop::removeRegistry(const world::EntityRegistry& registry) {
    std::lock_guard<std::mutex> lock(registriesMutex_);
    auto it = std::find_if(registries_.begin(), registries_.end(),
                           [&](const auto& r) { return r.get() == &registry; });
    if (it == registries_.end()) {
        return false;
    }
    registries_.erase(it);
    return true;
}

std::size_t RegionTickLoop::registryCount() const {
    std::lock_guard<std::mutex> lock(registriesMutex_);
    return registries_.size();
}

void RegionTickLoop::setSimulationCallback(SimulationCallback callback) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    simulationCallback_ = std::move(callback);
}

void RegionTickLoop::setMetricsCallback(MetricsCallback callback) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    metricsCallback_ = std::move(callback);
}

bool RegionTickLoop::start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        return false;
    }

    thread_ = std::thread([this] { run(); });
    return true;
}

void RegionTickLoop::stop() {
    running_.store(false);
    if (thread_.joinable()) {
        thread_.join();
    }
}

RegionTickMetrics RegionTickLoop::tick() {
    auto metrics = executeTick();
    std::lock_guard<std::mutex> lock(metricsMutex_);
    lastMetrics_ = metrics;
    return metrics;
}

bool RegionTickLoop::isRunning() const noexcept {
    return running_.load();
}

uint32_t RegionTickLoop::tickRate() const noexcept {
    return tickRate_;
}

std::chrono::microseconds RegionTickLoop::targetFrameTime() const noexcept {
    return targetFrameTime_;
}

uint64_t RegionTickLoop::tickCount() const noexcept {
    return tickCount_.load();
}

RegionTickMetrics RegionTickLoop::lastMetrics() const {
    std::lock_guard<std::mutex> lock(metricsMutex_);
    return lastMetrics_;
}

void RegionTickLoop::run() {
    auto nextTick = std::chrono::steady_clock::now();

    while (running_.load()) {
        nextTick += targetFrameTime_;

        auto metrics = executeTick();

        {
            std::lock_guard<std::mutex> lock(metricsMutex_);
            lastMetrics_ = metrics;
        }

        {
            std::lock_guard<std::mutex> lock(callbackMutex_);
            if (metricsCallback_) {
                metricsCallback_(metrics);
            }
        }

        // Sleep until next tick, but skip if we already overran.
        auto now = std::chrono::steady_clock::now();
        if (now < nextTick) {
            std::this_thread::sleep_until(nextTick);
        } else {
            nextTick = now;
        }
    }
}

RegionTickLoop::RegionOutcome RegionTickLoop::tickRegion(world::EntityRegistry& registry,
                                                         float deltaTime) const {
    RegionOutcome outcome;
    if (registry.aborted()) {
        RGS_LOG_WARN(LogCategory::Region,
                     "region " + registry.name() + " is waiting for a resync; tick skipped");
        return outcome;
    }

    SimulationCallback simulate;
    {
        std::lock_guard<std::mutex> lock(callbackMutex_);
        simulate = simulationCallback_;
    }

    try {
        if (simulate) {
            simulate(registry, deltaTime);
        }
        registry.finalizeRun();
        outcome.sync = registry.syncEntities();
        registry.preSnapshotRun();
    } catch (const std::exception& e) {
        registry.abortTick(e.what());
        throw;
    } catch (...) {
        registry.abortTick("non-standard exception");
        throw;
    }

    auto committed = registry.copyAllSnapshots();
    if (!committed) {
        RGS_LOG_WARN(LogCategory::Region, "region " + registry.name() +
                                              " skipped its commit: " +
                                              std::string(committed.error().message()));
    }
    outcome.committed = committed.hasValue();
    return outcome;
}

RegionTickMetrics RegionTickLoop::executeTick() {
    auto frameStart = std::chrono::steady_clock::now();

    std::vector<std::shared_ptr<world::EntityRegistry>> regions;
    {
        std::lock_guard<std::mutex> lock(registriesMutex_);
        regions = registries_;
    }

    auto dtSeconds = static_cast<float>(targetFrameTime_.count()) / 1'000'000.0f;

    // One slot per region; each job writes only its own.
    std::vector<RegionOutcome> outcomes(regions.size());
    std::vector<foundation::JobScheduler::JobId> jobs;
    jobs.reserve(regions.size());

    for (std::size_t i = 0; i < regions.size(); ++i) {
        auto job = scheduler_.schedule([this, &outcomes, &regions, i, dtSeconds] {
            outcomes[i] = tickRegion(*regions[i], dtSeconds);
        });
        if (!job) {
            RGS_LOG_ERROR(LogCategory::Region, "could not schedule region " +
                                                   regions[i]->name() + ": " +
                                                   std::string(job.error().message()));
            continue;
        }
        jobs.push_back(job.value());
    }

    auto waited = scheduler_.waitAll(jobs);
    if (!waited) {
        RGS_LOG_ERROR(LogCategory::Region,
                      "region job failed: " + std::string(waited.error().message()));
    }

    auto updateEnd = std::chrono::steady_clock::now();
    auto updateDuration =
        std::chrono::duration_cast<std::chrono::microseconds>(updateEnd - frameStart);

    RegionTickMetrics metrics;
    metrics.updateTime = updateDuration;
    metrics.frameTime = updateDuration;
    metrics.budgetUtilization =
        targetFrameTime_.count() > 0
            ? static_cast<float>(updateDuration.count()) /
                  static_cast<float>(targetFrameTime_.count())
            : 0.0f;
    metrics.tickNumber = tickCount_.fetch_add(1);
    metrics.overrun = updateDuration > targetFrameTime_;
    metrics.regions = static_cast<uint32_t>(regions.size());

    // Unscheduled and failed regions leave their slot uncommitted.
    for (const auto& outcome : outcomes) {
        metrics.sync += outcome.sync;
        if (!outcome.committed) {
            ++metrics.failedCommits;
        }
    }

    return metrics;
}

} // namespace rgs::service
