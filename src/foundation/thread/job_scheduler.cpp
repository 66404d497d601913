/// @file job_scheduler.cpp
/// @brief JobScheduler implementation wrapping kcenon thread_system.

#include "rgs/foundation/job_scheduler.hpp"

// kcenon thread_system headers (hidden behind PIMPL)
#include <kcenon/thread/core/thread_pool.h>
#include <kcenon/thread/core/thread_worker.h>
#include <kcenon/thread/core/job_builder.h>

#include <atomic>
#include <future>
#include <mutex>
#include <string>
#include <unordered_map>

namespace rgs::foundation {

struct JobScheduler::Impl {
    std::shared_ptr<kcenon::thread::thread_pool> pool;
    std::atomic<uint64_t> nextJobId{1};
    std::size_t workers = 0;

    // JobId -> completion future, erased once waited on.
    std::unordered_map<JobId, std::shared_future<void>> futures;
    std::mutex mutex;
};

JobScheduler::JobScheduler(std::size_t numThreads)
    : impl_(std::make_unique<Impl>())
{
    if (numThreads == 0) {
        numThreads = 1;
    }
    impl_->workers = numThreads;
    impl_->pool = std::make_shared<kcenon::thread::thread_pool>("RegionJobScheduler");

    std::vector<std::unique_ptr<kcenon::thread::thread_worker>> workers;
    workers.reserve(numThreads);
    for (std::size_t i = 0; i < numThreads; ++i) {
        workers.push_back(std::make_unique<kcenon::thread::thread_worker>());
    }
    impl_->pool->enqueue_batch(std::move(workers));
    impl_->pool->start();
}

JobScheduler::~JobScheduler() {
    if (impl_ && impl_->pool) {
        impl_->pool->stop(false); // graceful: wait for running jobs
    }
}

JobScheduler::JobScheduler(JobScheduler&&) noexcept = default;
JobScheduler& JobScheduler::operator=(JobScheduler&&) noexcept = default;

GameResult<JobScheduler::JobId> JobScheduler::schedule(JobFunc job) {
    auto id = impl_->nextJobId.fetch_add(1, std::memory_order_relaxed);
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future().share();

    auto threadJob = kcenon::thread::job_builder()
        .name("rgs_job_" + std::to_string(id))
        .work([fn = std::move(job), promise]() -> kcenon::common::VoidResult {
            try {
                fn();
                promise->set_value();
            } catch (...) {
                // Surfaced to the waiter as ThreadError.
                promise->set_exception(std::current_exception());
            }
            return kcenon::common::VoidResult::ok(std::monostate{});
        })
        .build();

    {
        std::lock_guard lock(impl_->mutex);
        impl_->futures[id] = future;
    }

    auto enqResult = impl_->pool->enqueue(std::move(threadJob));
    if (enqResult.is_err()) {
        std::lock_guard lock(impl_->mutex);
        impl_->futures.erase(id);
        return GameResult<JobId>::err(
            GameError(ErrorCode::JobScheduleFailed, "failed to enqueue job"));
    }

    return GameResult<JobId>::ok(id);
}

GameResult<void> JobScheduler::wait(JobId id) {
    std::shared_future<void> future;
    {
        std::lock_guard lock(impl_->mutex);
        auto it = impl_->futures.find(id);
        if (it == impl_->futures.end()) {
            return GameResult<void>::err(
                GameError(ErrorCode::JobNotFound, "job not found"));
        }
        future = it->second;
        impl_->futures.erase(it);
    }

    try {
        future.get();
    } catch (const std::exception& e) {
        return GameResult<void>::err(
            GameError(ErrorCode::ThreadError, std::string("job execution failed: ") + e.what()));
    } catch (...) {
        return GameResult<void>::err(
            GameError(ErrorCode::ThreadError, "job execution failed"));
    }

    return GameResult<void>::ok();
}

GameResult<void> JobScheduler::waitAll(const std::vector<JobId>& ids) {
    auto first = GameResult<void>::ok();
    for (auto id : ids) {
        auto result = wait(id);
        if (!result && first) {
            first = result;
        }
    }
    return first;
}

std::size_t JobScheduler::workerCount() const noexcept {
    return impl_ ? impl_->workers : 0;
}

} // namespace rgs::foundation
