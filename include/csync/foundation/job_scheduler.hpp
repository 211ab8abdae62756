#pragma once

/// @file job_scheduler.hpp
/// @brief GameJobScheduler wrapping kcenon thread_system for blocking work
///        that must stay off the session thread.

#include "csync/foundation/game_result.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>

namespace csync::foundation {

/// Priority levels for scheduled jobs.
///
/// Maps to kcenon::thread::job_priority internally:
///   Critical -> highest, High -> high, Normal -> normal, Low -> low
enum class JobPriority { Critical, High, Normal, Low };

/// Job scheduler wrapping kcenon's thread_system.
///
/// Used by the database store to run SQL round trips on worker threads.
/// Results travel back to the session thread through a CompletionQueue,
/// never through the job itself.
///
/// Example:
/// @code
///   GameJobScheduler scheduler(2);
///   auto id = scheduler.schedule([&] { db.execute(sql); });
///   scheduler.wait(id.value());
/// @endcode
class GameJobScheduler {
public:
    using JobId = uint64_t;
    using JobFunc = std::function<void()>;

    /// Construct a scheduler backed by a thread pool with @p numThreads workers.
    explicit GameJobScheduler(std::size_t numThreads = 2);

    ~GameJobScheduler();

    // Non-copyable, movable.
    GameJobScheduler(const GameJobScheduler&) = delete;
    GameJobScheduler& operator=(const GameJobScheduler&) = delete;
    GameJobScheduler(GameJobScheduler&&) noexcept;
    GameJobScheduler& operator=(GameJobScheduler&&) noexcept;

    /// Schedule a job with the given priority.
    /// @return The assigned JobId, or JobScheduleFailed.
    GameResult<JobId> schedule(JobFunc job, JobPriority priority = JobPriority::Normal);

    /// Block until the job identified by @p id completes.
    /// @return Success, JobNotFound, or ThreadError if the job threw.
    GameResult<void> wait(JobId id);

    /// Block until every job scheduled so far has finished.
    void waitAll();

    /// Request cancellation of a pending job.
    /// Already-completed jobs return JobCancelled as a no-op error.
    GameResult<void> cancel(JobId id);

    /// Number of scheduled jobs that have not finished yet.
    [[nodiscard]] std::size_t pendingCount() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace csync::foundation
