/**
 * @file test_batch.cpp
 * @brief DamageBatchConfig delay computation, locking and cloning
 */

#include <gtest/gtest.h>
#include "rdx_batch.hpp"

#include <cmath>
#include <limits>
#include <memory>
#include <set>
#include <string>

using namespace rdx;

class BatchConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        now_ = 5000.0;
    }

    // A config carrying history and factors, as a window would after a while
    DamageBatchConfig busy_config() {
        DamageBatchConfig bc(BatchBounds(), 7);
        bc.delay_per_megapixel = 100;
        bc.last_event = now_;
        for (int i = 0; i < 10; ++i) {
            bc.last_delays.push(now_ - 10 + i, 10 + i);
            bc.last_actual_delays.push(now_ - 10 + i, 5 + i);
        }
        Factor f;
        f.metric = "name";
        f.factor = 1.0;
        f.weight = 1.0;
        bc.factors.push_back(f);
        return bc;
    }

    double now_;
    DamageStatistics stats_;
};

// ---- History ----

TEST_F(BatchConfigTest, HistoryEvictsOldest) {
    BoundedHistory h(3);
    for (int i = 0; i < 5; ++i) h.push(i, i * 10);
    ASSERT_EQ(h.size(), 3u);
    EXPECT_DOUBLE_EQ(h[0].value, 20.0);
    EXPECT_DOUBLE_EQ(h.back().value, 40.0);

    h.set_capacity(1);
    EXPECT_EQ(h.size(), 1u);
    EXPECT_DOUBLE_EQ(h.back().value, 40.0);
}

TEST_F(BatchConfigTest, StatisticsTrackBestLatency) {
    stats_.record_client_latency(now_, 0.050);
    stats_.record_client_latency(now_, 0.020);
    stats_.record_client_latency(now_, 0.080);
    stats_.record_client_latency(now_, std::nan(""));
    EXPECT_EQ(stats_.client_latency().size(), 3u);
    EXPECT_DOUBLE_EQ(stats_.min_client_latency(), 0.020);

    stats_.record_send(now_, 1000, 0.0);
    EXPECT_TRUE(stats_.send_speed().empty());

    stats_.clear();
    EXPECT_TRUE(stats_.client_latency().empty());
}

TEST_F(BatchConfigTest, FactorNames) {
    std::set<std::string> names;
    for (const auto& f : delay_factors()) names.insert(f->name());
    EXPECT_EQ(names, (std::set<std::string>{"client-latency", "damage-packet-queue",
                                            "network-send-speed", "actual-delay",
                                            "region-size", "focus", "soft-expired"}));
}

// ---- Defaults ----

TEST_F(BatchConfigTest, DefaultsFromBounds) {
    DamageBatchConfig bc;
    EXPECT_EQ(bc.min_delay, 5);
    EXPECT_EQ(bc.max_delay, 500);
    EXPECT_EQ(bc.delay, bc.start_delay);
    EXPECT_EQ(bc.saved, bc.start_delay);
    EXPECT_FALSE(bc.locked);
    EXPECT_DOUBLE_EQ(bc.delay_per_megapixel, -1.0);
    EXPECT_EQ(bc.max_pixels, static_cast<int64_t>(bc.max_events) * 1024 * 1024);
}

// ---- Clone ----

TEST_F(BatchConfigTest, CloneReportsSameInfo) {
    DamageBatchConfig bc = busy_config();
    ASSERT_FALSE(bc.get_info().empty());
    bc.cleanup();

    DamageBatchConfig copy = bc.clone();
    EXPECT_EQ(copy.get_info(), bc.get_info());
}

TEST_F(BatchConfigTest, CloneIsIndependent) {
    DamageBatchConfig bc = busy_config();
    DamageBatchConfig copy = bc.clone();

    auto snapshot = copy.get_info();

    bc.last_delays.push(now_, 99);
    bc.delay = 321;
    bc.factors.clear();
    bc.lock();
    EXPECT_EQ(copy.get_info(), snapshot);
    EXPECT_EQ(copy.last_delays.size(), 10u);

    copy.last_actual_delays.clear();
    EXPECT_EQ(bc.last_actual_delays.size(), 10u);
}

TEST_F(BatchConfigTest, MoveCarriesHistoryAndTimers) {
    auto timers = std::make_shared<TimerQueue>();
    DamageBatchConfig bc = busy_config();
    bc.set_timer_queue(timers);
    ASSERT_NE(bc.schedule(60000, [] {}), 0u);
    auto info = bc.get_info();

    DamageBatchConfig moved(std::move(bc));
    EXPECT_EQ(moved.get_info(), info);
    EXPECT_EQ(moved.last_delays.size(), 10u);
    EXPECT_EQ(moved.pending_timers(), 1u);
    EXPECT_EQ(bc.pending_timers(), 0u);

    moved.cleanup();
    EXPECT_EQ(timers->pending(), 0u);
    timers->shutdown();
}

// ---- Locking ----

TEST_F(BatchConfigTest, LockedDelayIsReported) {
    DamageBatchConfig bc = busy_config();
    bc.locked = true;
    EXPECT_DOUBLE_EQ(bc.get_info().at("delay"), bc.delay);
}

TEST_F(BatchConfigTest, LockRaisesAndUnlockRestores) {
    DamageBatchConfig bc;
    bc.lock();
    EXPECT_TRUE(bc.locked);
    EXPECT_EQ(bc.delay, DamageBatchConfig::IDLE_DELAY);
    EXPECT_EQ(bc.saved, bc.start_delay);

    bc.lock(1000);
    EXPECT_EQ(bc.delay, DamageBatchConfig::IDLE_DELAY);

    bc.unlock();
    EXPECT_FALSE(bc.locked);
    EXPECT_EQ(bc.delay, bc.start_delay);
    bc.unlock();
    EXPECT_EQ(bc.delay, bc.start_delay);
}

TEST_F(BatchConfigTest, LockedConfigIgnoresRecompute) {
    DamageBatchConfig bc;
    bc.lock();
    int before = bc.delay;

    BatchInputs inputs;
    inputs.soft_expired = 10;
    bc.recompute(now_, 400, stats_, inputs);

    EXPECT_EQ(bc.delay, before);
    EXPECT_EQ(bc.last_actual_delays.size(), 1u);
}

// ---- Delay computation ----

TEST_F(BatchConfigTest, SlowUpdatesIncreaseDelay) {
    DamageBatchConfig bc;
    BatchInputs inputs;
    inputs.has_focus = false;
    inputs.soft_expired = 3;

    bc.recompute(now_, 200, stats_, inputs);

    EXPECT_GT(bc.delay, bc.start_delay);
    EXPECT_LE(bc.delay, bc.max_delay);
    auto info = bc.get_info();
    EXPECT_EQ(info.count("factor.soft-expired"), 1u);
    EXPECT_EQ(info.count("factor.focus"), 0u);
}

TEST_F(BatchConfigTest, FastFocusedUpdatesDropToMinimum) {
    DamageBatchConfig bc;
    BatchInputs inputs;

    bc.recompute(now_, 0, stats_, inputs);

    EXPECT_EQ(bc.delay, bc.min_delay);
    EXPECT_DOUBLE_EQ(bc.last_updated, now_);
    EXPECT_EQ(bc.get_info().count("factor.focus"), 1u);
}

TEST_F(BatchConfigTest, DelayStaysWithinBounds) {
    DamageBatchConfig bc;
    for (int i = 0; i < 200; ++i) {
        double t = now_ + i * 0.05;
        stats_.record_client_latency(t, (i % 7) * 0.1);
        stats_.record_queue_size(t, i % 13);
        stats_.record_send(t, 1000.0 * (i % 5 + 1), 0.01 * (i % 3 + 1));

        BatchInputs inputs;
        inputs.has_focus = i % 2 == 0;
        inputs.soft_expired = i % 4;
        inputs.region_pixels = 50000.0 * (i % 9);
        bc.delay_per_megapixel = i % 3 == 0 ? -1.0 : 400.0;

        bc.record_delay(t, bc.delay);
        bc.recompute(t, (i % 11) * 60.0, stats_, inputs);
        ASSERT_GE(bc.delay, bc.min_delay) << "iteration " << i;
        ASSERT_LE(bc.delay, bc.max_delay) << "iteration " << i;
    }
}

TEST_F(BatchConfigTest, InvalidSamplesAreDropped) {
    DamageBatchConfig bc;
    BatchInputs inputs;
    inputs.region_pixels = std::numeric_limits<double>::infinity();
    inputs.soft_expired = -4;

    bc.recompute(std::nan(""), 10, stats_, inputs);
    EXPECT_TRUE(bc.last_actual_delays.empty());
    EXPECT_EQ(bc.delay, bc.start_delay);

    bc.recompute(now_, -1, stats_, inputs);
    EXPECT_TRUE(bc.last_actual_delays.empty());
    EXPECT_GE(bc.delay, bc.min_delay);
    EXPECT_LE(bc.delay, bc.max_delay);

    bc.record_delay(now_, std::nan(""));
    EXPECT_TRUE(bc.last_delays.empty());
}

// ---- Batching decision ----

TEST_F(BatchConfigTest, MustBatch) {
    DamageBatchConfig bc;
    EXPECT_TRUE(bc.must_batch(now_, bc.min_delay + 1));
    EXPECT_FALSE(bc.must_batch(now_, 0));

    for (size_t i = 0; i < DamageBatchConfig::MUST_BATCH_EVENTS; ++i) {
        bc.record_delay(now_ + i * 0.001, 0);
    }
    EXPECT_TRUE(bc.must_batch(now_ + 0.005, 0));
    EXPECT_FALSE(bc.must_batch(now_ + 1.0, 0));

    bc.always = true;
    EXPECT_TRUE(bc.must_batch(now_ + 1.0, 0));
}

TEST_F(BatchConfigTest, InitialDelayScalesWithWindowSize) {
    DamageBatchConfig bc;
    EXPECT_EQ(bc.initial_delay_for(1000000.0), bc.delay);

    bc.delay_per_megapixel = 100;
    EXPECT_EQ(bc.initial_delay_for(1000000.0), 100);
    EXPECT_EQ(bc.initial_delay_for(4000000.0), 70);
    EXPECT_EQ(bc.initial_delay_for(1.0), bc.max_delay);
    EXPECT_EQ(bc.initial_delay_for(0.0), bc.delay);

    bc.delay_per_megapixel = 0;
    EXPECT_EQ(bc.initial_delay_for(1000000.0), bc.min_delay);
}

// ---- Timers ----

TEST_F(BatchConfigTest, CleanupCancelsTimersAndIsRepeatable) {
    auto timers = std::make_shared<TimerQueue>();
    DamageBatchConfig bc;
    bc.set_timer_queue(timers);

    EXPECT_NE(bc.schedule(60000, [] {}), 0u);
    EXPECT_NE(bc.schedule(60000, [] {}), 0u);
    EXPECT_EQ(bc.pending_timers(), 2u);
    EXPECT_EQ(timers->pending(), 2u);

    bc.cleanup();
    EXPECT_EQ(bc.pending_timers(), 0u);
    EXPECT_EQ(timers->pending(), 0u);
    EXPECT_TRUE(bc.factors.empty());

    bc.cleanup();
    EXPECT_EQ(bc.pending_timers(), 0u);
}

TEST_F(BatchConfigTest, ScheduleWithoutQueue) {
    DamageBatchConfig bc;
    EXPECT_EQ(bc.schedule(10, [] {}), 0u);
    EXPECT_FALSE(bc.cancel_timer(1));
}
