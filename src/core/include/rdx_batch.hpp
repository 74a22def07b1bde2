#pragma once

/**
 * @file rdx_batch.hpp
 * @brief Adaptive damage batch delay controller
 *
 * One DamageBatchConfig per window pipeline decides how long screen
 * updates are coalesced before a capture is requested. recompute() feeds
 * a closed set of delay factors with the window's statistics and blends
 * their targets with the recent delay history.
 */

#include "rdx_options.hpp"
#include "rdx_stats.hpp"
#include "rdx_timer.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace rdx {

// ===== History =====

/// Deque of samples that evicts the oldest entry once full
class BoundedHistory {
public:
    explicit BoundedHistory(size_t capacity = 64);

    void push(double timestamp, double value);
    void clear() { samples_.clear(); }
    void set_capacity(size_t capacity);

    size_t size() const { return samples_.size(); }
    bool empty() const { return samples_.empty(); }
    size_t capacity() const { return capacity_; }
    const Sample& back() const { return samples_.back(); }
    const Sample& operator[](size_t i) const { return samples_[i]; }
    const SampleSeries& samples() const { return samples_; }

private:
    size_t capacity_;
    SampleSeries samples_;
};

// ===== Statistics =====

/**
 * @brief Per-window measurements read by the delay factors
 *
 * Latencies are in seconds, send sizes in bytes.
 */
class DamageStatistics {
public:
    explicit DamageStatistics(size_t capacity = 64);

    void record_client_latency(double now, double latency);
    void record_queue_size(double now, double queued);
    void record_send(double now, double bytes, double elapsed);

    const SampleSeries& client_latency() const { return client_latency_.samples(); }
    double min_client_latency() const { return min_client_latency_; }
    const SampleSeries& queue_sizes() const { return queue_sizes_.samples(); }
    const SizedSeries& send_speed() const { return send_speed_; }

    void clear();

private:
    size_t capacity_;
    BoundedHistory client_latency_;
    BoundedHistory queue_sizes_;
    SizedSeries send_speed_;
    double min_client_latency_ = 0.0;
};

/// Window state that influences batching besides the statistics
struct BatchInputs {
    bool has_focus = true;
    int soft_expired = 0;
    double region_pixels = 0.0;
    double window_pixels = 0.0;
};

class DamageBatchConfig;

struct BatchContext {
    double now;
    double current_delay;
    const DamageBatchConfig& batch;
    const DamageStatistics& statistics;
    const BatchInputs& inputs;
};

// ===== Factors =====

/// A named strategy contributing one delay adjustment
class DelayFactor {
public:
    virtual ~DelayFactor() = default;
    virtual const char* name() const = 0;

    /// nullopt when the factor has nothing to say
    virtual std::optional<Factor> compute_adjustment(const BatchContext& ctx) const = 0;
};

/// client-latency, damage-packet-queue, network-send-speed, actual-delay,
/// region-size, focus, soft-expired
const std::vector<std::unique_ptr<DelayFactor>>& delay_factors();

// ===== Controller =====

class DamageBatchConfig {
public:
    static constexpr int IDLE_DELAY = 500;
    static constexpr double MIN_FACTOR_WEIGHT = 0.01;
    static constexpr size_t MUST_BATCH_EVENTS = 5;
    static constexpr double MUST_BATCH_WINDOW = 0.010;    // seconds

    explicit DamageBatchConfig(const BatchBounds& bounds = BatchBounds(), int wid = 0);
    ~DamageBatchConfig();

    DamageBatchConfig(DamageBatchConfig&& other) noexcept;
    DamageBatchConfig& operator=(DamageBatchConfig&& other) noexcept;

    /// Independent copy of every field; timers are not carried over
    DamageBatchConfig clone() const;

    /**
     * @brief Record an observed delay and recompute the batch delay
     * @param now          monotonic seconds
     * @param actual_delay observed milliseconds from damage to send
     *
     * Never throws. A locked config only records the sample.
     */
    void recompute(double now, double actual_delay,
                   const DamageStatistics& statistics, const BatchInputs& inputs);

    /// Record a requested delay (milliseconds)
    void record_delay(double now, double requested);

    /// Whether damage arriving now with @p requested delay must be coalesced
    bool must_batch(double now, int requested) const;

    /// Freeze the delay at no less than @p idle_delay until unlock()
    void lock(int idle_delay = IDLE_DELAY);
    void unlock();

    /// Start delay for a window of @p window_pixels from delay_per_megapixel
    int initial_delay_for(double window_pixels) const;

    std::map<std::string, double> get_info() const;

    /// Cancel timers and drop factors; safe to call repeatedly
    void cleanup();

    // Timers owned on behalf of the window pipeline
    void set_timer_queue(std::shared_ptr<TimerQueue> queue);
    TimerQueue::TimerId schedule(int64_t delay_ms, TimerQueue::Callback cb);
    bool cancel_timer(TimerQueue::TimerId id);
    void forget_timer(TimerQueue::TimerId id) { timers_.erase(id); }
    size_t pending_timers() const { return timers_.size(); }

    // Settings
    bool always = false;
    int max_events;
    int64_t max_pixels;
    int time_unit;
    int min_delay;
    int start_delay;
    int max_delay;
    int expire_delay;
    int timeout_delay;
    double delay_per_megapixel = -1.0;

    // State
    int wid;
    int delay;
    int saved;
    bool locked = false;
    double last_event = 0.0;
    double last_updated = 0.0;
    BoundedHistory last_delays;
    BoundedHistory last_actual_delays;
    std::vector<Factor> factors;

private:
    DamageBatchConfig(const DamageBatchConfig& other);
    DamageBatchConfig& operator=(const DamageBatchConfig&) = delete;

    void update_delay(double now, const std::vector<Factor>& active);

    std::shared_ptr<TimerQueue> timer_queue_;
    std::set<TimerQueue::TimerId> timers_;
};

} // namespace rdx
