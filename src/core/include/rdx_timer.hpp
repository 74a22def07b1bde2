#pragma once

/**
 * @file rdx_timer.hpp
 * @brief Single-thread delayed callback queue
 *
 * Damage schedulers use it to expire batched regions. Callbacks run on
 * the timer thread, one at a time, and must not block for long.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <thread>

namespace rdx {

class TimerQueue {
public:
    using Callback = std::function<void()>;
    using TimerId = uint64_t;
    using Clock = std::chrono::steady_clock;

    TimerQueue();
    ~TimerQueue();

    TimerQueue(const TimerQueue&) = delete;
    TimerQueue& operator=(const TimerQueue&) = delete;

    /// Run @p cb after @p delay_ms; returns 0 once shut down
    TimerId schedule(int64_t delay_ms, Callback cb);

    /// Returns false if the timer already fired or was never scheduled
    bool cancel(TimerId id);

    size_t pending() const;

    /// Stops the thread; pending callbacks are dropped
    void shutdown();

    bool is_running() const { return state_->running.load(); }

private:
    struct Entry {
        TimerId id;
        Callback cb;
    };

    // Shared with the worker so it outlives a queue destroyed from a callback
    struct State {
        // Keyed by deadline; equal deadlines fire in schedule order
        std::multimap<Clock::time_point, Entry> entries;
        std::mutex mutex;
        std::condition_variable cv;
        std::atomic<bool> running{true};
        TimerId next_id = 1;
    };

    static void run(const std::shared_ptr<State>& state);

    std::shared_ptr<State> state_;
    std::thread worker_;
};

} // namespace rdx
