#include "rdx_thread_pool.hpp"
#include "rdx_logger.hpp"

namespace rdx {

ThreadPool::ThreadPool(size_t num_threads, std::string name)
    : name_(std::move(name))
{
    if (num_threads == 0) {
        num_threads = 1;
    }

    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back([this] { worker_loop(); });
    }
    RDX_LOG_DEBUG(name_ << ": started " << num_threads << " workers");
}

ThreadPool::~ThreadPool() {
    shutdown();
}

void ThreadPool::worker_loop() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            condition_.wait(lock, [this] {
                return stop_ || !tasks_.empty();
            });
            if (stop_ && tasks_.empty()) {
                return;
            }
            task = std::move(tasks_.front());
            tasks_.pop();
            ++active_;
        }

        // packaged_task stores exceptions in the future; this only
        // catches failures of the wrapper itself
        try {
            task();
        } catch (const std::exception& e) {
            RDX_LOG_ERROR(name_ << ": task failed: " << e.what());
        }

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            --active_;
            if (tasks_.empty() && active_ == 0) {
                idle_.notify_all();
            }
        }
    }
}

void ThreadPool::wait_idle() {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    idle_.wait(lock, [this] {
        return tasks_.empty() && active_ == 0;
    });
}

void ThreadPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (stop_) return;
        stop_ = true;
    }
    condition_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    RDX_LOG_DEBUG(name_ << ": stopped");
}

size_t ThreadPool::pending_tasks() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return tasks_.size();
}

size_t ThreadPool::active_threads() const noexcept {
    return active_.load();
}

size_t ThreadPool::total_threads() const noexcept {
    return workers_.size();
}

bool ThreadPool::is_running() const noexcept {
    return !stop_.load();
}

} // namespace rdx
