#include "rdx_stats.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace rdx {

namespace {

bool usable(double v) {
    return std::isfinite(v);
}

std::string describe(const char* a, double av, const char* b, double bv,
                     const char* c = nullptr, double cv = 0.0) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3) << a << "=" << av << ", " << b << "=" << bv;
    if (c) oss << ", " << c << "=" << cv;
    return oss.str();
}

} // namespace

double logp(double x) {
    static const double LOG2E = 1.4426950408889634;
    return std::log(1.0 + x) * LOG2E;
}

double monotonic_seconds() {
    using namespace std::chrono;
    return duration_cast<duration<double>>(steady_clock::now().time_since_epoch()).count();
}

double time_weighted_average(const SampleSeries& samples, double now,
                             double min_offset, double rpow, double default_value) {
    // incremental weighted mean: identical values stay exact
    double mean = 0.0;
    double total_weight = 0.0;
    for (const auto& s : samples) {
        if (!usable(s.timestamp) || !usable(s.value)) continue;
        double age = std::max(0.0, now - s.timestamp);
        double w = 1.0 / (min_offset + std::pow(age, rpow));
        if (!usable(w) || w <= 0.0) continue;
        total_weight += w;
        mean += (w / total_weight) * (s.value - mean);
    }
    if (total_weight <= 0.0) return default_value;
    return mean;
}

WeightedAverages calculate_time_weighted_average(const SampleSeries& samples, double now) {
    WeightedAverages r;
    double tw = 0.0, rw = 0.0;
    for (const auto& s : samples) {
        if (!usable(s.timestamp) || !usable(s.value)) continue;
        double age = std::max(0.0, now - s.timestamp);
        double w = 1.0 / (1.0 + age);
        tw += w;
        r.avg += (w / tw) * (s.value - r.avg);
        double w2 = 1.0 / (0.1 + age * age);
        rw += w2;
        r.recent += (w2 / rw) * (s.value - r.recent);
    }
    return r;
}

WeightedAverages calculate_timesize_weighted_average(const SizedSeries& samples, double now,
                                                     double size_unit) {
    WeightedAverages r;
    double size_total = 0.0;
    size_t count = 0;
    for (const auto& s : samples) {
        if (usable(s.size) && s.size >= 0.0) {
            size_total += s.size;
            ++count;
        }
    }
    if (count == 0 || size_total <= 0.0) return r;
    double size_avg = size_total / static_cast<double>(count);

    double tv = 0.0, tw = 0.0, rv = 0.0, rw = 0.0;
    for (const auto& s : samples) {
        if (!usable(s.elapsed) || s.elapsed <= 0.0 || !usable(s.size) || s.size < 0.0) continue;
        double pw = logp(s.size / size_avg);
        double per_second = std::max(1.0, s.size * size_unit / s.elapsed);
        double age = std::max(0.0, now - s.timestamp);
        double w = pw / (1.0 + age);
        tv += w * per_second;
        tw += w;
        w = pw / (0.1 + age * age);
        rv += w * per_second;
        rw += w;
    }
    if (tw > 0.0) r.avg = tv / tw;
    if (rw > 0.0) r.recent = rv / rw;
    return r;
}

Factor calculate_for_target(const std::string& metric, double target_value,
                            double avg_value, double recent_value,
                            double aim, double div, double slope,
                            const Smoothing& smoothing, double weight_multiplier) {
    Factor f;
    f.metric = metric;
    if (!usable(target_value) || !usable(avg_value) || !usable(recent_value) || div <= 0.0) {
        f.info = "invalid input";
        return f;
    }
    double target = target_value / div;
    double avg = avg_value / div;
    double recent = recent_value / div;

    double target_factor = recent / (slope + target);
    double avg_factor = recent / (slope + avg);
    double aimed = target_factor * (1.0 - aim) + avg_factor * aim;
    double factor = smoothing(std::max(0.0, aimed));
    double weight = smoothing(std::max({0.0, 1.0 - factor, factor - 1.0})) * weight_multiplier;

    f.factor = usable(factor) ? factor : 1.0;
    f.weight = usable(weight) ? std::max(0.0, weight) : 0.0;
    f.info = describe("target", target_value, "avg", avg_value, "recent", recent_value);
    return f;
}

Factor calculate_for_average(const std::string& metric, double avg_value, double recent_value,
                             double div, double weight_offset, double weight_div) {
    Factor f;
    f.metric = metric;
    if (!usable(avg_value) || !usable(recent_value) || avg_value <= 0.0
        || recent_value <= 0.0 || div <= 0.0 || weight_div <= 0.0) {
        f.info = "invalid input";
        return f;
    }
    double avg = avg_value / div;
    double recent = recent_value / div;
    double factor = logp(recent / avg);
    double weight = std::max(0.0, std::max(factor, 1.0 / factor) - 1.0 + weight_offset) / weight_div;

    f.factor = factor;
    f.weight = usable(weight) ? weight : 0.0;
    f.info = describe("avg", avg_value, "recent", recent_value);
    return f;
}

Factor queue_inspect(const std::string& metric, const SampleSeries& series, double now,
                     double target, double div, const Smoothing& smoothing) {
    if (series.empty() || target <= 0.0 || div <= 0.0) {
        Factor f;
        f.metric = metric;
        f.info = "no data";
        return f;
    }
    WeightedAverages a = calculate_time_weighted_average(series, now);
    double wm = std::sqrt(std::max(0.0, std::max(a.avg, a.recent)) / div / target);
    return calculate_for_target(metric, target, a.avg, a.recent, 0.25, div, 1.0, smoothing, wm);
}

} // namespace rdx
