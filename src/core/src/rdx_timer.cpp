#include "rdx_timer.hpp"
#include "rdx_logger.hpp"

namespace rdx {

TimerQueue::TimerQueue()
    : state_(std::make_shared<State>())
{
    std::shared_ptr<State> state = state_;
    worker_ = std::thread([state] { run(state); });
}

TimerQueue::~TimerQueue() {
    shutdown();
}

TimerQueue::TimerId TimerQueue::schedule(int64_t delay_ms, Callback cb) {
    if (delay_ms < 0) delay_ms = 0;
    TimerId id = 0;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!state_->running) return 0;
        id = state_->next_id++;
        auto deadline = Clock::now() + std::chrono::milliseconds(delay_ms);
        state_->entries.emplace(deadline, Entry{id, std::move(cb)});
    }
    state_->cv.notify_one();
    return id;
}

bool TimerQueue::cancel(TimerId id) {
    Callback dropped;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        auto& entries = state_->entries;
        auto it = entries.begin();
        while (it != entries.end() && it->second.id != id) ++it;
        if (it == entries.end()) return false;
        dropped = std::move(it->second.cb);
        entries.erase(it);
    }
    state_->cv.notify_one();
    return true;
}

size_t TimerQueue::pending() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->entries.size();
}

void TimerQueue::shutdown() {
    std::multimap<Clock::time_point, Entry> dropped;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!state_->running) return;
        state_->running = false;
        dropped.swap(state_->entries);
    }
    state_->cv.notify_all();
    if (!worker_.joinable()) return;
    if (worker_.get_id() == std::this_thread::get_id()) {
        // Destroyed from one of our own callbacks; the worker keeps the state alive
        worker_.detach();
    } else {
        worker_.join();
    }
}

void TimerQueue::run(const std::shared_ptr<State>& state) {
    std::unique_lock<std::mutex> lock(state->mutex);
    while (state->running) {
        if (state->entries.empty()) {
            state->cv.wait(lock, [&state] { return !state->running || !state->entries.empty(); });
            continue;
        }
        auto first = state->entries.begin();
        const Clock::time_point deadline = first->first;
        if (Clock::now() < deadline) {
            state->cv.wait_until(lock, deadline);
            continue;
        }

        Callback cb = std::move(first->second.cb);
        state->entries.erase(first);
        lock.unlock();
        try {
            cb();
        } catch (const std::exception& e) {
            RDX_LOG_ERROR("timer callback failed: " << e.what());
        }
        // Captures may own the queue itself; release them before relocking
        cb = nullptr;
        lock.lock();
    }
}

} // namespace rdx
