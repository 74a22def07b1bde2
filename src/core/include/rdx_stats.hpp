#pragma once

/**
 * @file rdx_stats.hpp
 * @brief Statistics used to drive the damage batch delay
 *
 * Samples are timestamped with a monotonic clock in seconds. Averages
 * weigh recent samples more heavily; factor helpers turn an average and
 * a recent value into a multiplicative delay adjustment plus a weight.
 */

#include <deque>
#include <functional>
#include <string>

namespace rdx {

struct Sample {
    double timestamp;   // seconds
    double value;
};

/// One transfer: elapsed is the time it took, in seconds
struct SizedSample {
    double timestamp;
    double size;
    double elapsed;
};

using SampleSeries = std::deque<Sample>;
using SizedSeries = std::deque<SizedSample>;

/**
 * @brief A proposed delay adjustment
 *
 * The new delay target is current_delay * factor; weight is the relative
 * importance among all factors.
 */
struct Factor {
    std::string metric;
    std::string info;
    double factor = 1.0;
    double weight = 0.0;
};

struct WeightedAverages {
    double avg = 0.0;
    double recent = 0.0;
};

using Smoothing = std::function<double(double)>;

/// log2(1 + x)
double logp(double x);

/// Monotonic clock in seconds
double monotonic_seconds();

/**
 * Weighted average with weight 1 / (min_offset + age^rpow).
 * Returns @p default_value when @p samples is empty.
 */
double time_weighted_average(const SampleSeries& samples, double now,
                             double min_offset = 0.1, double rpow = 2.0,
                             double default_value = 0.0);

/// avg weighs by 1/(1+age), recent by 1/(0.1+age^2); zeros when empty
WeightedAverages calculate_time_weighted_average(const SampleSeries& samples, double now);

/// Throughput (size * size_unit / elapsed) weighted by time and relative size
WeightedAverages calculate_timesize_weighted_average(const SizedSeries& samples, double now,
                                                     double size_unit = 1.0);

Factor calculate_for_target(const std::string& metric, double target_value,
                            double avg_value, double recent_value,
                            double aim = 0.5, double div = 1.0, double slope = 0.1,
                            const Smoothing& smoothing = logp,
                            double weight_multiplier = 1.0);

Factor calculate_for_average(const std::string& metric, double avg_value, double recent_value,
                             double div = 1.0, double weight_offset = 0.5, double weight_div = 1.0);

/**
 * @brief Backlog trend of a queue size series
 *
 * An empty series yields factor 1 with weight 0.
 */
Factor queue_inspect(const std::string& metric, const SampleSeries& series, double now,
                     double target = 1.0, double div = 1.0,
                     const Smoothing& smoothing = logp);

} // namespace rdx
