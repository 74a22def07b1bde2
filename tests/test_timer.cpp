/**
 * @file test_timer.cpp
 * @brief TimerQueue ordering, cancellation and shutdown
 */

#include <gtest/gtest.h>
#include "rdx_timer.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace rdx;

class TimerQueueTest : public ::testing::Test {
protected:
    // Waits until @p count callbacks recorded, or 2 seconds
    bool wait_for(size_t count) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, std::chrono::seconds(2), [&] { return fired_.size() >= count; });
    }

    TimerQueue::Callback record(int tag) {
        return [this, tag] {
            std::lock_guard<std::mutex> lock(mutex_);
            fired_.push_back(tag);
            cv_.notify_all();
        };
    }

    std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<int> fired_;
    // Declared last so its thread stops before the members above go away
    TimerQueue timers_;
};

TEST_F(TimerQueueTest, FiresInDeadlineOrder) {
    timers_.schedule(60, record(3));
    timers_.schedule(10, record(1));
    timers_.schedule(30, record(2));

    ASSERT_TRUE(wait_for(3));
    std::lock_guard<std::mutex> lock(mutex_);
    EXPECT_EQ(fired_, (std::vector<int>{1, 2, 3}));
}

TEST_F(TimerQueueTest, EqualDeadlinesKeepScheduleOrder) {
    for (int i = 0; i < 5; ++i) {
        timers_.schedule(0, record(i));
    }
    ASSERT_TRUE(wait_for(5));
    std::lock_guard<std::mutex> lock(mutex_);
    EXPECT_EQ(fired_, (std::vector<int>{0, 1, 2, 3, 4}));
}

TEST_F(TimerQueueTest, CancelledTimerDoesNotFire) {
    auto id = timers_.schedule(50, record(1));
    timers_.schedule(80, record(2));

    EXPECT_TRUE(timers_.cancel(id));
    EXPECT_FALSE(timers_.cancel(id));

    ASSERT_TRUE(wait_for(1));
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    std::lock_guard<std::mutex> lock(mutex_);
    EXPECT_EQ(fired_, (std::vector<int>{2}));
}

TEST_F(TimerQueueTest, ThrowingCallbackDoesNotStopQueue) {
    timers_.schedule(0, [] { throw std::runtime_error("callback failure"); });
    timers_.schedule(5, record(1));

    EXPECT_TRUE(wait_for(1));
    EXPECT_TRUE(timers_.is_running());
}

TEST_F(TimerQueueTest, ShutdownDropsPendingTimers) {
    timers_.schedule(10000, record(1));
    EXPECT_EQ(timers_.pending(), 1u);

    timers_.shutdown();

    EXPECT_FALSE(timers_.is_running());
    EXPECT_EQ(timers_.pending(), 0u);
    EXPECT_EQ(timers_.schedule(0, record(2)), 0u);
}

TEST_F(TimerQueueTest, CancelEarliestWhileWorkerWaits) {
    auto first = timers_.schedule(1000, record(1));
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    EXPECT_TRUE(timers_.cancel(first));
    timers_.schedule(20, record(2));

    ASSERT_TRUE(wait_for(1));
    std::lock_guard<std::mutex> lock(mutex_);
    EXPECT_EQ(fired_, (std::vector<int>{2}));
}

TEST_F(TimerQueueTest, ShutdownWhileWorkerWaits) {
    for (int i = 0; i < 3; ++i) {
        timers_.schedule(1000 + i, record(i));
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    timers_.shutdown();
    EXPECT_EQ(timers_.pending(), 0u);
}

TEST(TimerQueueLifetime, LastReferenceReleasedByOwnCallback) {
    std::mutex m;
    std::condition_variable cv;
    bool done = false;

    auto queue = std::make_shared<TimerQueue>();
    std::weak_ptr<TimerQueue> weak = queue;
    queue->schedule(10, [self = queue, &m, &cv, &done] {
        std::lock_guard<std::mutex> lock(m);
        done = true;
        cv.notify_all();
    });
    queue.reset();

    {
        std::unique_lock<std::mutex> lock(m);
        ASSERT_TRUE(cv.wait_for(lock, std::chrono::seconds(2), [&] { return done; }));
    }
    // The callback copy was the last owner; the queue is gone once it is released
    for (int i = 0; i < 100 && !weak.expired(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    EXPECT_TRUE(weak.expired());
}
