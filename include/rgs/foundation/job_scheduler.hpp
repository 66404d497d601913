#pragma once

/// @file job_scheduler.hpp
/// @brief JobScheduler wrapping kcenon thread_system for per-region tick jobs.

#include "rgs/foundation/game_result.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <thread>
#include <vector>

namespace rgs::foundation {

/// Thread-pool backed job scheduler.
///
/// The region tick loop submits one job per region each tick and waits
/// for all of them before the tick is considered complete. Uses PIMPL to
/// keep thread_system headers out of the public API.
///
/// Example:
/// @code
///   JobScheduler scheduler(4);
///   auto id = scheduler.schedule([&] { registry.finalizeRun(); });
///   if (id) {
///       (void)scheduler.wait(id.value());
///   }
/// @endcode
class JobScheduler {
public:
    using JobId = uint64_t;
    using JobFunc = std::function<void()>;

    explicit JobScheduler(std::size_t numThreads = std::thread::hardware_concurrency());

    ~JobScheduler();

    JobScheduler(const JobScheduler&) = delete;
    JobScheduler& operator=(const JobScheduler&) = delete;
    JobScheduler(JobScheduler&&) noexcept;
    JobScheduler& operator=(JobScheduler&&) noexcept;

    /// Enqueue a job on the pool.
    /// @return The assigned JobId, or JobScheduleFailed.
    GameResult<JobId> schedule(JobFunc job);

    /// Block until the job completes and forget it.
    /// @return Success, JobNotFound, or ThreadError if the job threw.
    GameResult<void> wait(JobId id);

    /// Wait for every job in @p ids; reports the first failure after all
    /// jobs have finished.
    GameResult<void> waitAll(const std::vector<JobId>& ids);

    /// Number of worker threads in the pool.
    [[nodiscard]] std::size_t workerCount() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace rgs::foundation
