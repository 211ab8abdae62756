#pragma once

/// @file completion_queue.hpp
/// @brief Thread-safe queue of continuations drained on the session thread.
///
/// Network receive callbacks and database jobs run on library threads.
/// They post their results here instead of touching session state; the
/// main loop drains the queue once per tick.

#include <cstddef>
#include <functional>
#include <mutex>
#include <vector>

namespace csync::foundation {

/// FIFO queue of deferred work.
///
/// Usage:
/// @code
///   CompletionQueue completions;
///
///   // Worker thread
///   completions.post([cb, result] { cb(result); });
///
///   // Session thread, once per tick
///   completions.drain();
/// @endcode
class CompletionQueue {
public:
    using Task = std::function<void()>;

    CompletionQueue() = default;

    CompletionQueue(const CompletionQueue&) = delete;
    CompletionQueue& operator=(const CompletionQueue&) = delete;

    /// Queue a task. Returns false (and drops the task) once closed.
    bool post(Task task) {
        std::lock_guard lock(mutex_);
        if (closed_) {
            return false;
        }
        queue_.push_back(std::move(task));
        return true;
    }

    /// Run every queued task in FIFO order and return how many ran.
    ///
    /// Tasks posted while draining (including by a running task) are NOT
    /// included in this cycle.
    std::size_t drain() {
        std::vector<Task> batch;
        {
            std::lock_guard lock(mutex_);
            batch.swap(queue_);
        }

        for (auto& task : batch) {
            task();
        }
        return batch.size();
    }

    /// Refuse further posts. Already queued tasks can still be drained.
    void close() {
        std::lock_guard lock(mutex_);
        closed_ = true;
    }

    [[nodiscard]] bool isClosed() const {
        std::lock_guard lock(mutex_);
        return closed_;
    }

    [[nodiscard]] std::size_t pendingCount() const {
        std::lock_guard lock(mutex_);
        return queue_.size();
    }

private:
    mutable std::mutex mutex_;
    std::vector<Task> queue_;
    bool closed_ = false;
};

} // namespace csync::foundation
