/**
 * @file test_stats.cpp
 * @brief Weighted averages and delay factor helpers
 */

#include <gtest/gtest.h>
#include "rdx_stats.hpp"

#include <cmath>
#include <limits>

using namespace rdx;

class StatsTest : public ::testing::Test {
protected:
    static SampleSeries constant_series(double value, int count, double now) {
        SampleSeries s;
        for (int i = 0; i < count; ++i) {
            s.push_back({now - 0.37 * i, value});
        }
        return s;
    }

    double now_ = 1000.0;
};

// ---- logp ----

TEST_F(StatsTest, Logp) {
    EXPECT_DOUBLE_EQ(logp(0.0), 0.0);
    EXPECT_DOUBLE_EQ(logp(1.0), 1.0);
    EXPECT_NEAR(logp(3.0), 2.0, 1e-12);
}

// ---- Averages ----

TEST_F(StatsTest, IdenticalValuesAverageToThatValue) {
    for (double v : {0.0, 1.0, 17.25, 123456.0, -3.5}) {
        for (int n : {1, 2, 5, 40}) {
            SampleSeries s = constant_series(v, n, now_);
            EXPECT_DOUBLE_EQ(time_weighted_average(s, now_), v) << v << " x" << n;
            EXPECT_DOUBLE_EQ(time_weighted_average(s, now_, 0.5, 1.0), v);

            WeightedAverages a = calculate_time_weighted_average(s, now_);
            EXPECT_DOUBLE_EQ(a.avg, v);
            EXPECT_DOUBLE_EQ(a.recent, v);
        }
    }
}

TEST_F(StatsTest, EmptySeriesGivesDefault) {
    EXPECT_DOUBLE_EQ(time_weighted_average({}, now_, 0.1, 2.0, 42.0), 42.0);
    WeightedAverages a = calculate_time_weighted_average({}, now_);
    EXPECT_DOUBLE_EQ(a.avg, 0.0);
    EXPECT_DOUBLE_EQ(a.recent, 0.0);
}

TEST_F(StatsTest, RecentSamplesWeighMore) {
    SampleSeries s;
    s.push_back({now_ - 10.0, 100.0});
    s.push_back({now_, 10.0});
    double avg = time_weighted_average(s, now_);
    EXPECT_LT(avg, 20.0);
    EXPECT_GT(avg, 10.0);

    WeightedAverages a = calculate_time_weighted_average(s, now_);
    EXPECT_LT(a.recent, a.avg);
}

TEST_F(StatsTest, NonFiniteSamplesSkipped) {
    SampleSeries s = constant_series(5.0, 3, now_);
    s.push_back({now_, std::numeric_limits<double>::quiet_NaN()});
    s.push_back({std::numeric_limits<double>::infinity(), 9.0});
    EXPECT_DOUBLE_EQ(time_weighted_average(s, now_), 5.0);
}

TEST_F(StatsTest, TimeSizeThroughput) {
    SizedSeries s;
    for (int i = 0; i < 4; ++i) {
        s.push_back({now_ - i, 1000.0, 0.5});
    }
    WeightedAverages a = calculate_timesize_weighted_average(s, now_);
    EXPECT_NEAR(a.avg, 2000.0, 1e-6);
    EXPECT_NEAR(a.recent, 2000.0, 1e-6);

    WeightedAverages none = calculate_timesize_weighted_average({}, now_);
    EXPECT_DOUBLE_EQ(none.avg, 0.0);
    EXPECT_DOUBLE_EQ(none.recent, 0.0);
}

// ---- Factors ----

TEST_F(StatsTest, AverageFactor) {
    Factor steady = calculate_for_average("latency", 10.0, 10.0);
    EXPECT_EQ(steady.metric, "latency");
    EXPECT_DOUBLE_EQ(steady.factor, 1.0);
    EXPECT_DOUBLE_EQ(steady.weight, 0.5);

    Factor rising = calculate_for_average("latency", 10.0, 20.0);
    EXPECT_NEAR(rising.factor, std::log2(3.0), 1e-12);
    EXPECT_GT(rising.weight, steady.weight);
}

TEST_F(StatsTest, AverageFactorRejectsInvalidInput) {
    for (const Factor& f : {calculate_for_average("m", 0.0, 5.0),
                            calculate_for_average("m", 5.0, -1.0),
                            calculate_for_average("m", std::nan(""), 5.0),
                            calculate_for_average("m", 5.0, 5.0, 0.0)}) {
        EXPECT_DOUBLE_EQ(f.factor, 1.0);
        EXPECT_DOUBLE_EQ(f.weight, 0.0);
        EXPECT_EQ(f.info, "invalid input");
    }
}

TEST_F(StatsTest, TargetFactorFollowsRecentValue) {
    Factor low = calculate_for_target("decode", 10.0, 10.0, 2.0);
    Factor high = calculate_for_target("decode", 10.0, 10.0, 50.0);
    EXPECT_LT(low.factor, 1.0);
    EXPECT_GT(high.factor, 1.0);
    EXPECT_GT(high.weight, 0.0);
    EXPECT_FALSE(high.info.empty());

    Factor bad = calculate_for_target("decode", 10.0, std::nan(""), 2.0);
    EXPECT_DOUBLE_EQ(bad.factor, 1.0);
    EXPECT_DOUBLE_EQ(bad.weight, 0.0);
}

TEST_F(StatsTest, QueueInspect) {
    Factor empty = queue_inspect("damage-queue", {}, now_);
    EXPECT_EQ(empty.metric, "damage-queue");
    EXPECT_DOUBLE_EQ(empty.factor, 1.0);
    EXPECT_DOUBLE_EQ(empty.weight, 0.0);

    Factor idle = queue_inspect("damage-queue", constant_series(0.0, 5, now_), now_);
    EXPECT_LT(idle.factor, 1.0);
    EXPECT_DOUBLE_EQ(idle.weight, 0.0);

    Factor backlog = queue_inspect("damage-queue", constant_series(10.0, 5, now_), now_);
    EXPECT_GT(backlog.factor, 1.0);
    EXPECT_GT(backlog.weight, 0.0);
}
