/// @file job_scheduler.cpp
/// @brief GameJobScheduler implementation wrapping kcenon thread_system.

#include "csync/foundation/job_scheduler.hpp"

// kcenon thread_system headers (hidden behind PIMPL)
#include <kcenon/thread/core/thread_pool.h>
#include <kcenon/thread/core/thread_worker.h>
#include <kcenon/thread/core/job_builder.h>

#include <atomic>
#include <future>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace csync::foundation {

// ---------------------------------------------------------------------------
// Priority mapping: csync -> kcenon
// ---------------------------------------------------------------------------
static kcenon::thread::job_priority mapPriority(JobPriority p) {
    switch (p) {
        case JobPriority::Critical: return kcenon::thread::job_priority::highest;
        case JobPriority::High:     return kcenon::thread::job_priority::high;
        case JobPriority::Normal:   return kcenon::thread::job_priority::normal;
        case JobPriority::Low:      return kcenon::thread::job_priority::low;
    }
    return kcenon::thread::job_priority::normal;
}

static bool isReady(const std::shared_future<void>& f) {
    return f.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------
struct GameJobScheduler::Impl {
    std::shared_ptr<kcenon::thread::thread_pool> pool;
    std::atomic<uint64_t> nextJobId{1};

    // JobId -> shared_future for wait()/cancel() support
    std::unordered_map<JobId, std::shared_future<void>> futures;
    std::unordered_map<JobId, std::shared_ptr<std::atomic<bool>>> cancelFlags;

    mutable std::mutex mutex;

    // Drop bookkeeping of finished jobs. Caller holds the mutex.
    void pruneFinished() {
        for (auto it = futures.begin(); it != futures.end();) {
            if (isReady(it->second)) {
                cancelFlags.erase(it->first);
                it = futures.erase(it);
            } else {
                ++it;
            }
        }
    }
};

// ---------------------------------------------------------------------------
// Construction / Destruction / Move
// ---------------------------------------------------------------------------
GameJobScheduler::GameJobScheduler(std::size_t numThreads)
    : impl_(std::make_unique<Impl>())
{
    impl_->pool = std::make_shared<kcenon::thread::thread_pool>("csync_jobs");

    std::vector<std::unique_ptr<kcenon::thread::thread_worker>> workers;
    workers.reserve(numThreads);
    for (std::size_t i = 0; i < numThreads; ++i) {
        workers.push_back(std::make_unique<kcenon::thread::thread_worker>());
    }
    impl_->pool->enqueue_batch(std::move(workers));
    impl_->pool->start();
}

GameJobScheduler::~GameJobScheduler() {
    if (impl_ && impl_->pool) {
        impl_->pool->stop(false); // graceful: wait for running jobs
    }
}

GameJobScheduler::GameJobScheduler(GameJobScheduler&&) noexcept = default;
GameJobScheduler& GameJobScheduler::operator=(GameJobScheduler&&) noexcept = default;

// ---------------------------------------------------------------------------
// schedule()
// ---------------------------------------------------------------------------
GameResult<GameJobScheduler::JobId> GameJobScheduler::schedule(
    JobFunc job, JobPriority priority)
{
    auto id = impl_->nextJobId.fetch_add(1, std::memory_order_relaxed);
    auto cancelFlag = std::make_shared<std::atomic<bool>>(false);
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future().share();

    auto threadJob = kcenon::thread::job_builder()
        .name("csync_job_" + std::to_string(id))
        .priority(mapPriority(priority))
        .work([fn = std::move(job), cancelFlag, promise]()
              -> kcenon::common::VoidResult {
            try {
                if (!cancelFlag->load(std::memory_order_acquire)) {
                    fn();
                }
                promise->set_value();
            } catch (...) {
                // Rethrown to the waiter by wait().
                promise->set_exception(std::current_exception());
            }
            return kcenon::common::VoidResult::ok(std::monostate{});
        })
        .build();

    {
        std::lock_guard lock(impl_->mutex);
        impl_->pruneFinished();
        impl_->futures[id] = future;
        impl_->cancelFlags[id] = cancelFlag;
    }

    auto enqResult = impl_->pool->enqueue(std::move(threadJob));
    if (enqResult.is_err()) {
        std::lock_guard lock(impl_->mutex);
        impl_->futures.erase(id);
        impl_->cancelFlags.erase(id);
        return GameResult<JobId>::err(
            GameError(ErrorCode::JobScheduleFailed, "failed to enqueue job"));
    }

    return GameResult<JobId>::ok(id);
}

// ---------------------------------------------------------------------------
// wait() / waitAll()
// ---------------------------------------------------------------------------
GameResult<void> GameJobScheduler::wait(JobId id) {
    std::shared_future<void> future;
    {
        std::lock_guard lock(impl_->mutex);
        auto it = impl_->futures.find(id);
        if (it == impl_->futures.end()) {
            return GameResult<void>::err(
                GameError(ErrorCode::JobNotFound, "job not found"));
        }
        future = it->second;
    }

    try {
        future.get();
    } catch (const std::exception& e) {
        return GameResult<void>::err(
            GameError(ErrorCode::ThreadError,
                      std::string("job execution failed: ") + e.what()));
    } catch (...) {
        return GameResult<void>::err(
            GameError(ErrorCode::ThreadError, "job execution failed"));
    }

    return GameResult<void>::ok();
}

void GameJobScheduler::waitAll() {
    std::vector<std::shared_future<void>> pending;
    {
        std::lock_guard lock(impl_->mutex);
        pending.reserve(impl_->futures.size());
        for (const auto& [id, future] : impl_->futures) {
            pending.push_back(future);
        }
    }
    for (auto& future : pending) {
        future.wait();
    }
}

// ---------------------------------------------------------------------------
// cancel()
// ---------------------------------------------------------------------------
GameResult<void> GameJobScheduler::cancel(JobId id) {
    std::lock_guard lock(impl_->mutex);

    auto flagIt = impl_->cancelFlags.find(id);
    if (flagIt == impl_->cancelFlags.end()) {
        return GameResult<void>::err(
            GameError(ErrorCode::JobNotFound, "job not found"));
    }

    auto futIt = impl_->futures.find(id);
    if (futIt != impl_->futures.end() && isReady(futIt->second)) {
        return GameResult<void>::err(
            GameError(ErrorCode::JobCancelled, "job already completed"));
    }

    flagIt->second->store(true, std::memory_order_release);
    return GameResult<void>::ok();
}

std::size_t GameJobScheduler::pendingCount() const {
    std::lock_guard lock(impl_->mutex);
    std::size_t count = 0;
    for (const auto& [id, future] : impl_->futures) {
        if (!isReady(future)) {
            ++count;
        }
    }
    return count;
}

} // namespace csync::foundation
