#pragma once

/// @file thread_pool.h
/// @brief Fixed-size worker pool bounding concurrent scoring work

#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

#include <absl/status/statusor.h>

namespace tracescore {

class Gauge;

/// @brief A fixed-size thread pool
///
/// The pool size is the upper bound on concurrently running tasks, which is how
/// the scoring engine caps outbound LLM and python calls regardless of batch
/// size. Queued plus running tasks are published as the gauge
/// tracescore_pool_<name>_pending.
class ThreadPool {
public:
    /// @param num_threads Worker count, 0 means hardware concurrency
    /// @param name Used in log lines and the pending gauge name
    explicit ThreadPool(size_t num_threads = 0, std::string name = "workers");

    /// @brief Drains queued tasks, then joins the workers
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool(ThreadPool&&) = delete;
    ThreadPool& operator=(ThreadPool&&) = delete;

    /// @brief Queue a task
    /// @return kFailedPrecondition once the pool is shut down. An exception
    /// thrown by the task is rethrown from the future.
    template <typename F>
    absl::StatusOr<std::future<std::invoke_result_t<F>>> Submit(F&& f);

    size_t Size() const { return size_; }

    /// @brief Queued plus running tasks
    size_t PendingTasks() const;

    /// @brief Stop accepting tasks, finish the queued ones and join workers
    void Shutdown();

    bool IsStopped() const;

    const std::string& Name() const { return name_; }

private:
    void WorkerLoop();
    absl::Status Enqueue(std::function<void()> task);
    void PublishPending();  // requires mutex_

    std::string name_;
    size_t size_;
    Gauge& pending_gauge_;
    std::vector<std::thread> workers_;

    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::queue<std::function<void()>> tasks_;  // guarded by mutex_
    size_t active_tasks_ = 0;                  // guarded by mutex_
    bool stop_ = false;                        // guarded by mutex_
};

template <typename F>
absl::StatusOr<std::future<std::invoke_result_t<F>>> ThreadPool::Submit(F&& f) {
    using return_type = std::invoke_result_t<F>;

    auto task = std::make_shared<std::packaged_task<return_type()>>(std::forward<F>(f));
    std::future<return_type> result = task->get_future();

    auto status = Enqueue([task]() { (*task)(); });
    if (!status.ok()) {
        return status;
    }
    return result;
}

}  // namespace tracescore
