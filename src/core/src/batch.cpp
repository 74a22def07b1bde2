#include "rdx_batch.hpp"
#include "rdx_logger.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <utility>

namespace rdx {

namespace {

double smooth_sqrt(double v) {
    return std::sqrt(std::max(0.0, v));
}

bool valid_number(double v) {
    return std::isfinite(v) && v >= 0.0;
}

} // namespace

// ===== BoundedHistory =====

BoundedHistory::BoundedHistory(size_t capacity)
    : capacity_(std::max<size_t>(1, capacity))
{}

void BoundedHistory::push(double timestamp, double value) {
    samples_.push_back(Sample{timestamp, value});
    while (samples_.size() > capacity_) samples_.pop_front();
}

void BoundedHistory::set_capacity(size_t capacity) {
    capacity_ = std::max<size_t>(1, capacity);
    while (samples_.size() > capacity_) samples_.pop_front();
}

// ===== DamageStatistics =====

DamageStatistics::DamageStatistics(size_t capacity)
    : capacity_(capacity)
    , client_latency_(capacity)
    , queue_sizes_(capacity)
{}

void DamageStatistics::record_client_latency(double now, double latency) {
    if (!valid_number(latency)) return;
    if (client_latency_.empty() || latency < min_client_latency_) {
        min_client_latency_ = latency;
    }
    client_latency_.push(now, latency);
}

void DamageStatistics::record_queue_size(double now, double queued) {
    if (!valid_number(queued)) return;
    queue_sizes_.push(now, queued);
}

void DamageStatistics::record_send(double now, double bytes, double elapsed) {
    if (!valid_number(bytes) || !valid_number(elapsed) || elapsed <= 0.0) return;
    send_speed_.push_back(SizedSample{now, bytes, elapsed});
    while (send_speed_.size() > capacity_) send_speed_.pop_front();
}

void DamageStatistics::clear() {
    client_latency_.clear();
    queue_sizes_.clear();
    send_speed_.clear();
    min_client_latency_ = 0.0;
}

// ===== Factors =====

namespace {

class ClientLatencyFactor : public DelayFactor {
public:
    const char* name() const override { return "client-latency"; }

    std::optional<Factor> compute_adjustment(const BatchContext& ctx) const override {
        const auto& samples = ctx.statistics.client_latency();
        if (samples.empty()) return std::nullopt;
        WeightedAverages a = calculate_time_weighted_average(samples, ctx.now);
        // keep client latency as close as possible to the best seen
        double target = 0.005 + ctx.statistics.min_client_latency();
        double wm = logp(target * 20.0);
        return calculate_for_target(name(), target, a.avg, a.recent,
                                    0.8, 1.0, 0.005, smooth_sqrt, wm);
    }
};

class DamagePacketQueueFactor : public DelayFactor {
public:
    const char* name() const override { return "damage-packet-queue"; }

    std::optional<Factor> compute_adjustment(const BatchContext& ctx) const override {
        const auto& series = ctx.statistics.queue_sizes();
        if (series.empty()) return std::nullopt;
        return queue_inspect(name(), series, ctx.now, 1.0, 1.0, smooth_sqrt);
    }
};

class NetworkSendSpeedFactor : public DelayFactor {
public:
    const char* name() const override { return "network-send-speed"; }

    std::optional<Factor> compute_adjustment(const BatchContext& ctx) const override {
        const auto& series = ctx.statistics.send_speed();
        if (series.empty()) return std::nullopt;
        WeightedAverages speed = calculate_timesize_weighted_average(series, ctx.now);
        if (speed.avg <= 0.0 || speed.recent <= 0.0) return std::nullopt;

        // lower is better for the factor helpers: time to send 1MB
        const double one_mb = 1024.0 * 1024.0;
        double avg_1mb = one_mb / speed.avg;
        double recent_1mb = one_mb / speed.recent;
        // only matters much when the link is slow
        const double min_speed = 128.0 * 1024.0;
        double div = logp(std::max(speed.recent, min_speed) / min_speed);
        return calculate_for_average(name(), avg_1mb, recent_1mb, 1.0, 1.0, div);
    }
};

class ActualDelayFactor : public DelayFactor {
public:
    const char* name() const override { return "actual-delay"; }

    std::optional<Factor> compute_adjustment(const BatchContext& ctx) const override {
        const auto& samples = ctx.batch.last_actual_delays.samples();
        if (samples.empty()) return std::nullopt;
        WeightedAverages a = calculate_time_weighted_average(samples, ctx.now);
        double target = std::max(1.0, ctx.current_delay);
        return calculate_for_target(name(), target, a.avg, a.recent, 0.5, 1.0, 1.0);
    }
};

class RegionSizeFactor : public DelayFactor {
public:
    const char* name() const override { return "region-size"; }

    std::optional<Factor> compute_adjustment(const BatchContext& ctx) const override {
        double dpm = ctx.batch.delay_per_megapixel;
        double pixels = ctx.inputs.region_pixels;
        if (dpm <= 0.0 || pixels <= 0.0) return std::nullopt;

        double target = dpm * pixels / 1000000.0;
        target = std::clamp(target, static_cast<double>(ctx.batch.min_delay),
                            static_cast<double>(ctx.batch.max_delay));
        Factor f;
        f.metric = name();
        f.factor = target / std::max(1.0, ctx.current_delay);
        f.weight = 0.5;
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(3)
            << "megapixels=" << pixels / 1000000.0 << ", target=" << target;
        f.info = oss.str();
        return f;
    }
};

class FocusFactor : public DelayFactor {
public:
    const char* name() const override { return "focus"; }

    std::optional<Factor> compute_adjustment(const BatchContext& ctx) const override {
        bool focus = ctx.inputs.has_focus;
        Factor f;
        f.metric = name();
        f.info = focus ? "has_focus=1" : "has_focus=0";
        f.factor = focus ? 0.0 : 1.0;
        f.weight = focus ? 1.0 : 0.0;
        return f;
    }
};

class SoftExpiredFactor : public DelayFactor {
public:
    const char* name() const override { return "soft-expired"; }

    std::optional<Factor> compute_adjustment(const BatchContext& ctx) const override {
        int count = std::max(0, ctx.inputs.soft_expired);
        Factor f;
        f.metric = name();
        f.info = "count=" + std::to_string(count);
        f.factor = static_cast<double>(count);
        f.weight = count > 0 ? 1.0 : 0.0;
        return f;
    }
};

} // namespace

const std::vector<std::unique_ptr<DelayFactor>>& delay_factors() {
    static const std::vector<std::unique_ptr<DelayFactor>> all = [] {
        std::vector<std::unique_ptr<DelayFactor>> v;
        v.push_back(std::make_unique<ClientLatencyFactor>());
        v.push_back(std::make_unique<DamagePacketQueueFactor>());
        v.push_back(std::make_unique<NetworkSendSpeedFactor>());
        v.push_back(std::make_unique<ActualDelayFactor>());
        v.push_back(std::make_unique<RegionSizeFactor>());
        v.push_back(std::make_unique<FocusFactor>());
        v.push_back(std::make_unique<SoftExpiredFactor>());
        return v;
    }();
    return all;
}

// ===== DamageBatchConfig =====

DamageBatchConfig::DamageBatchConfig(const BatchBounds& bounds, int window_id)
    : max_events(bounds.max_events)
    , max_pixels(static_cast<int64_t>(bounds.max_events) * 1024 * 1024)
    , time_unit(bounds.time_unit)
    , min_delay(bounds.min_delay)
    , start_delay(bounds.start_delay)
    , max_delay(bounds.max_delay)
    , expire_delay(bounds.expire_delay)
    , timeout_delay(bounds.timeout_delay)
    , wid(window_id)
    , delay(bounds.start_delay)
    , saved(bounds.start_delay)
    , last_delays(static_cast<size_t>(bounds.history_size))
    , last_actual_delays(static_cast<size_t>(bounds.history_size))
{}

DamageBatchConfig::DamageBatchConfig(const DamageBatchConfig& other)
    : always(other.always)
    , max_events(other.max_events)
    , max_pixels(other.max_pixels)
    , time_unit(other.time_unit)
    , min_delay(other.min_delay)
    , start_delay(other.start_delay)
    , max_delay(other.max_delay)
    , expire_delay(other.expire_delay)
    , timeout_delay(other.timeout_delay)
    , delay_per_megapixel(other.delay_per_megapixel)
    , wid(other.wid)
    , delay(other.delay)
    , saved(other.saved)
    , locked(other.locked)
    , last_event(other.last_event)
    , last_updated(other.last_updated)
    , last_delays(other.last_delays)
    , last_actual_delays(other.last_actual_delays)
    , factors(other.factors)
{}

DamageBatchConfig::~DamageBatchConfig() {
    cleanup();
}

DamageBatchConfig::DamageBatchConfig(DamageBatchConfig&& other) noexcept
    : always(other.always)
    , max_events(other.max_events)
    , max_pixels(other.max_pixels)
    , time_unit(other.time_unit)
    , min_delay(other.min_delay)
    , start_delay(other.start_delay)
    , max_delay(other.max_delay)
    , expire_delay(other.expire_delay)
    , timeout_delay(other.timeout_delay)
    , delay_per_megapixel(other.delay_per_megapixel)
    , wid(other.wid)
    , delay(other.delay)
    , saved(other.saved)
    , locked(other.locked)
    , last_event(other.last_event)
    , last_updated(other.last_updated)
    , last_delays(std::move(other.last_delays))
    , last_actual_delays(std::move(other.last_actual_delays))
    , factors(std::move(other.factors))
    , timer_queue_(std::move(other.timer_queue_))
    , timers_(std::move(other.timers_))
{
    other.timers_.clear();
}

DamageBatchConfig& DamageBatchConfig::operator=(DamageBatchConfig&& other) noexcept {
    if (this != &other) {
        cleanup();
        always = other.always;
        max_events = other.max_events;
        max_pixels = other.max_pixels;
        time_unit = other.time_unit;
        min_delay = other.min_delay;
        start_delay = other.start_delay;
        max_delay = other.max_delay;
        expire_delay = other.expire_delay;
        timeout_delay = other.timeout_delay;
        delay_per_megapixel = other.delay_per_megapixel;
        wid = other.wid;
        delay = other.delay;
        saved = other.saved;
        locked = other.locked;
        last_event = other.last_event;
        last_updated = other.last_updated;
        last_delays = std::move(other.last_delays);
        last_actual_delays = std::move(other.last_actual_delays);
        factors = std::move(other.factors);
        timer_queue_ = std::move(other.timer_queue_);
        timers_.swap(other.timers_);
    }
    return *this;
}

DamageBatchConfig DamageBatchConfig::clone() const {
    return DamageBatchConfig(*this);
}

void DamageBatchConfig::record_delay(double now, double requested) {
    if (!std::isfinite(now) || !valid_number(requested)) return;
    last_delays.push(now, requested);
}

bool DamageBatchConfig::must_batch(double now, int requested) const {
    if (always || requested > min_delay) return true;
    if (last_delays.size() < MUST_BATCH_EVENTS) return false;
    const Sample& fifth_last = last_delays[last_delays.size() - MUST_BATCH_EVENTS];
    return now - fifth_last.timestamp < MUST_BATCH_WINDOW;
}

void DamageBatchConfig::recompute(double now, double actual_delay,
                                  const DamageStatistics& statistics, const BatchInputs& inputs) {
    if (!std::isfinite(now)) {
        RDX_LOG_DEBUG("batch " << wid << ": ignoring recompute with invalid time");
        return;
    }
    if (valid_number(actual_delay)) {
        last_actual_delays.push(now, actual_delay);
    } else {
        RDX_LOG_DEBUG("batch " << wid << ": dropping invalid actual delay sample");
    }
    if (locked) return;

    BatchInputs safe = inputs;
    if (!valid_number(safe.region_pixels)) safe.region_pixels = 0.0;
    if (!valid_number(safe.window_pixels)) safe.window_pixels = 0.0;
    if (safe.soft_expired < 0) safe.soft_expired = 0;

    BatchContext ctx{now, static_cast<double>(delay), *this, statistics, safe};
    std::vector<Factor> active;
    for (const auto& f : delay_factors()) {
        std::optional<Factor> adj = f->compute_adjustment(ctx);
        if (!adj) continue;
        if (!std::isfinite(adj->factor) || !std::isfinite(adj->weight)) continue;
        if (adj->weight <= MIN_FACTOR_WEIGHT) continue;
        active.push_back(std::move(*adj));
    }
    update_delay(now, active);
}

void DamageBatchConfig::update_delay(double now, const std::vector<Factor>& active) {
    double current = static_cast<double>(delay);
    double low = static_cast<double>(std::max(1, min_delay));
    double decay = std::max(1.0, logp(current / low) / 5.0);
    double ceiling = static_cast<double>(max_delay);

    // older samples matter less, and less so when batching a lot already
    double tv = 0.0, tw = 0.0;
    const std::pair<const BoundedHistory*, double> histories[] = {
        {&last_delays, 0.25},
        {&last_actual_delays, 0.75},
    };
    for (const auto& h : histories) {
        for (const auto& s : h.first->samples()) {
            double age = (now - s.timestamp) / decay;
            double w = h.second / (1.0 + age * age);
            tv += std::clamp(s.value, 0.0, ceiling) * w;
            tw += w;
        }
    }
    double hist_w = tw;

    factors = active;
    double all_weight = 0.0;
    for (const auto& f : active) all_weight += f.weight;
    if (all_weight <= 0.0) {
        RDX_LOG_TRACE("batch " << wid << ": no factor weights yet");
        return;
    }

    for (const auto& f : active) {
        double target = std::clamp(current * f.factor, 0.0, ceiling);
        double w = std::max(1.0, hist_w) * f.weight / all_weight;
        tv += target * w;
        tw += w;
    }

    int updated = static_cast<int>(tv / tw);
    delay = std::clamp(updated, min_delay, std::max(min_delay, max_delay));
    last_updated = now;
    RDX_LOG_TRACE("batch " << wid << ": delay " << static_cast<int>(current) << " -> " << delay
                  << " from " << active.size() << " factors");
}

void DamageBatchConfig::lock(int idle_delay) {
    if (locked) return;
    saved = delay;
    delay = std::max(delay, idle_delay);
    locked = true;
}

void DamageBatchConfig::unlock() {
    if (!locked) return;
    delay = saved;
    locked = false;
}

int DamageBatchConfig::initial_delay_for(double window_pixels) const {
    if (delay_per_megapixel < 0.0 || !valid_number(window_pixels) || window_pixels <= 0.0) {
        return delay;
    }
    // normalised to one megapixel, damped by a second sqrt
    double ratio = std::sqrt(1000000.0 / window_pixels);
    int d = static_cast<int>(delay_per_megapixel * std::sqrt(ratio));
    return std::clamp(d, min_delay, std::max(min_delay, max_delay));
}

std::map<std::string, double> DamageBatchConfig::get_info() const {
    std::map<std::string, double> info;
    info["wid"] = wid;
    info["always"] = always ? 1 : 0;
    info["locked"] = locked ? 1 : 0;
    info["delay"] = delay;
    info["saved"] = saved;
    info["min_delay"] = min_delay;
    info["start_delay"] = start_delay;
    info["max_delay"] = max_delay;
    info["expire_delay"] = expire_delay;
    info["timeout_delay"] = timeout_delay;
    info["max_events"] = max_events;
    info["max_pixels"] = static_cast<double>(max_pixels);
    info["time_unit"] = time_unit;
    info["delay_per_megapixel"] = delay_per_megapixel;
    info["last_event"] = last_event;
    info["last_updated"] = last_updated;
    info["last_delays.count"] = static_cast<double>(last_delays.size());
    info["last_actual_delays.count"] = static_cast<double>(last_actual_delays.size());
    if (!last_delays.empty()) {
        info["last_delays.last"] = last_delays.back().value;
    }
    if (!last_actual_delays.empty()) {
        info["last_actual_delays.last"] = last_actual_delays.back().value;
    }
    for (const auto& f : factors) {
        info["factor." + f.metric] = f.factor;
        info["factor." + f.metric + ".weight"] = f.weight;
    }
    return info;
}

void DamageBatchConfig::cleanup() {
    if (timer_queue_) {
        for (auto id : timers_) timer_queue_->cancel(id);
    }
    timers_.clear();
    factors.clear();
}

void DamageBatchConfig::set_timer_queue(std::shared_ptr<TimerQueue> queue) {
    if (timer_queue_) {
        for (auto id : timers_) timer_queue_->cancel(id);
        timers_.clear();
    }
    timer_queue_ = std::move(queue);
}

TimerQueue::TimerId DamageBatchConfig::schedule(int64_t delay_ms, TimerQueue::Callback cb) {
    if (!timer_queue_) return 0;
    TimerQueue::TimerId id = timer_queue_->schedule(delay_ms, std::move(cb));
    if (id != 0) timers_.insert(id);
    return id;
}

bool DamageBatchConfig::cancel_timer(TimerQueue::TimerId id) {
    if (timers_.erase(id) == 0 || !timer_queue_) return false;
    return timer_queue_->cancel(id);
}

} // namespace rdx
