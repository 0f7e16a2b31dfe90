#include "thread_pool.h"

#include <absl/strings/str_cat.h>

#include "logging.h"
#include "metrics.h"

namespace tracescore {

namespace {

size_t ResolveSize(size_t requested) {
    if (requested > 0) {
        return requested;
    }
    size_t hardware = std::thread::hardware_concurrency();
    return hardware > 0 ? hardware : 4;
}

}  // namespace

ThreadPool::ThreadPool(size_t num_threads, std::string name)
    : name_(std::move(name)),
      size_(ResolveSize(num_threads)),
      pending_gauge_(TRACESCORE_GAUGE(absl::StrCat("tracescore_pool_", name_, "_pending"))) {
    workers_.reserve(size_);
    for (size_t i = 0; i < size_; ++i) {
        workers_.emplace_back(&ThreadPool::WorkerLoop, this);
    }
    TRACESCORE_LOG_DEBUG("Thread pool '{}' started with {} workers", name_, size_);
}

ThreadPool::~ThreadPool() {
    Shutdown();
}

absl::Status ThreadPool::Enqueue(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_) {
            return absl::FailedPreconditionError(
                absl::StrCat("Thread pool '", name_, "' is shut down"));
        }
        tasks_.push(std::move(task));
        PublishPending();
    }
    condition_.notify_one();
    return absl::OkStatus();
}

void ThreadPool::WorkerLoop() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            condition_.wait(lock, [this] { return stop_ || !tasks_.empty(); });

            // Queued work still runs after a stop request
            if (tasks_.empty()) {
                return;
            }
            task = std::move(tasks_.front());
            tasks_.pop();
            ++active_tasks_;
        }

        // Tasks are packaged_tasks, so a throwing task only affects its future
        task();

        std::lock_guard<std::mutex> lock(mutex_);
        --active_tasks_;
        PublishPending();
    }
}

void ThreadPool::PublishPending() {
    pending_gauge_.Set(static_cast<double>(tasks_.size() + active_tasks_));
}

size_t ThreadPool::PendingTasks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size() + active_tasks_;
}

bool ThreadPool::IsStopped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stop_;
}

void ThreadPool::Shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_ && workers_.empty()) {
            return;
        }
        stop_ = true;
    }
    condition_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
    TRACESCORE_LOG_DEBUG("Thread pool '{}' stopped", name_);
}

}  // namespace tracescore
