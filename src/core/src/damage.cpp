#include "rdx_damage.hpp"
#include "rdx_logger.hpp"

#include <algorithm>

namespace rdx {

Region Region::united(const Region& other) const {
    if (empty()) return other;
    if (other.empty()) return *this;
    int x1 = std::min(x, other.x);
    int y1 = std::min(y, other.y);
    int x2 = std::max(x + width, other.x + other.width);
    int y2 = std::max(y + height, other.y + other.height);
    return Region{x1, y1, x2 - x1, y2 - y1};
}

std::shared_ptr<DamageScheduler> DamageScheduler::create(int wid, int width, int height,
                                                         const BatchBounds& bounds,
                                                         std::shared_ptr<TimerQueue> timers,
                                                         std::shared_ptr<CaptureSource> capture,
                                                         PacketSender sender) {
    return std::shared_ptr<DamageScheduler>(new DamageScheduler(
        wid, width, height, bounds, std::move(timers), std::move(capture), std::move(sender)));
}

DamageScheduler::DamageScheduler(int wid, int width, int height, const BatchBounds& bounds,
                                 std::shared_ptr<TimerQueue> timers,
                                 std::shared_ptr<CaptureSource> capture,
                                 PacketSender sender)
    : wid_(wid)
    , width_(width)
    , height_(height)
    , capture_(std::move(capture))
    , sender_(std::move(sender))
    , batch_(bounds, wid)
    , statistics_(static_cast<size_t>(bounds.history_size))
{
    batch_.set_timer_queue(std::move(timers));
    inputs_.window_pixels = static_cast<double>(width_) * height_;
}

DamageScheduler::~DamageScheduler() {
    cleanup();
}

// ===== Public API =====

void DamageScheduler::damage(const Region& region) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_ || region.empty()) return;

    double now = monotonic_seconds();
    batch_.last_event = now;
    note_event(now, region.pixels());

    if (delayed_) {
        auto& regions = delayed_->regions;
        if (regions.size() >= MAX_REGIONS) {
            Region all = regions.front();
            for (const auto& r : regions) all = all.united(r);
            regions.assign(1, all.united(region));
        } else {
            regions.push_back(region);
        }
        RDX_LOG_TRACE("wid " << wid_ << ": added region to delayed batch of "
                      << regions.size() << " regions");
        return;
    }

    if (!batch_.locked && batch_.delay <= batch_.min_delay && !batch_.always) {
        // too many events or pixels in the last time unit forces batching on
        double since = now - batch_.time_unit;
        double events = 0, pixels = 0;
        for (const auto& e : recent_events_) {
            if (e.first > since) {
                events += 1;
                pixels += static_cast<double>(e.second);
            }
        }
        double eratio = events / std::max(1, batch_.max_events);
        double pratio = pixels / static_cast<double>(std::max<int64_t>(1, batch_.max_pixels));
        if (eratio > 1.0 || pratio > 1.0) {
            batch_.delay = std::min(batch_.max_delay,
                                    static_cast<int>(batch_.min_delay * std::max(eratio, pratio)));
        }
    }

    int delay = batch_.delay;
    if (!batch_.must_batch(now, delay) && packets_backlog(now) == 0) {
        batch_.record_delay(now, delay);
        batch_.last_actual_delays.push(now, delay);
        inputs_.region_pixels = static_cast<double>(region.pixels());
        send_regions({region});
        return;
    }

    delayed_ = Delayed{now, {region}};
    expired_ = false;
    batch_.record_delay(now, delay);
    expire_timer_ = schedule_locked(delay, &DamageScheduler::expire_delayed_region);
    RDX_LOG_TRACE("wid " << wid_ << ": batching region, expiry in " << delay << "ms");
}

void DamageScheduler::ack(uint64_t sequence) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = unacked_.find(sequence);
    if (it == unacked_.end()) {
        RDX_LOG_DEBUG("wid " << wid_ << ": ack for unknown sequence " << sequence);
        return;
    }
    double now = monotonic_seconds();
    statistics_.record_client_latency(now, now - it->second);
    unacked_.erase(it);
    statistics_.record_queue_size(now, static_cast<double>(unacked_.size()));
    if (delayed_ && expired_) {
        may_send_delayed();
    }
}

void DamageScheduler::set_focus(bool focus) {
    std::lock_guard<std::mutex> lock(mutex_);
    inputs_.has_focus = focus;
}

void DamageScheduler::resize(int width, int height) {
    std::lock_guard<std::mutex> lock(mutex_);
    width_ = width;
    height_ = height;
    inputs_.window_pixels = static_cast<double>(width_) * height_;
}

void DamageScheduler::go_idle() {
    std::lock_guard<std::mutex> lock(mutex_);
    batch_.lock();
}

void DamageScheduler::no_idle() {
    std::lock_guard<std::mutex> lock(mutex_);
    batch_.unlock();
}

void DamageScheduler::cleanup() {
    std::lock_guard<std::mutex> lock(mutex_);
    bool was_open = !closed_;
    closed_ = true;
    delayed_.reset();
    expire_timer_ = soft_timer_ = timeout_timer_ = 0;
    batch_.cleanup();
    unacked_.clear();
    if (was_open) {
        RDX_LOG_DEBUG("wid " << wid_ << ": damage scheduler cleaned up");
    }
}

DamageBatchConfig DamageScheduler::batch_snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return batch_.clone();
}

std::map<std::string, double> DamageScheduler::get_info() const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto info = batch_.get_info();
    info["packets_sent"] = static_cast<double>(sequence_);
    info["pending_acks"] = static_cast<double>(unacked_.size());
    info["soft_expired"] = soft_expired_;
    info["delayed"] = delayed_ ? 1 : 0;
    return info;
}

uint64_t DamageScheduler::packets_sent() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sequence_;
}

size_t DamageScheduler::pending_acks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return unacked_.size();
}

bool DamageScheduler::has_delayed_region() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return delayed_.has_value();
}

// ===== Timers =====

TimerQueue::TimerId DamageScheduler::schedule_locked(int64_t delay_ms,
                                                     void (DamageScheduler::*handler)()) {
    std::weak_ptr<DamageScheduler> weak = weak_from_this();
    auto id_holder = std::make_shared<TimerQueue::TimerId>(0);
    TimerQueue::TimerId id = batch_.schedule(delay_ms, [weak, handler, id_holder] {
        auto self = weak.lock();
        if (!self) return;
        std::lock_guard<std::mutex> lock(self->mutex_);
        if (self->closed_) return;
        self->batch_.forget_timer(*id_holder);
        ((*self).*handler)();
    });
    // the callback cannot run before mutex_ is released by our caller
    *id_holder = id;
    return id;
}

void DamageScheduler::cancel_locked(TimerQueue::TimerId& id) {
    if (id != 0) {
        batch_.cancel_timer(id);
        id = 0;
    }
}

void DamageScheduler::expire_delayed_region() {
    expire_timer_ = 0;
    expired_ = true;
    may_send_delayed();
    if (!delayed_) return;

    // still waiting for acks from the client
    if (soft_expired_ < MAX_SOFT_EXPIRED) {
        ++soft_expired_;
        soft_timer_ = schedule_locked(static_cast<int64_t>(soft_expired_) * batch_.delay,
                                      &DamageScheduler::soft_timeout);
    } else {
        timeout_timer_ = schedule_locked(batch_.timeout_delay, &DamageScheduler::region_timeout);
    }
}

void DamageScheduler::soft_timeout() {
    soft_timer_ = 0;
    do_send_delayed();
}

void DamageScheduler::region_timeout() {
    timeout_timer_ = 0;
    if (!delayed_) return;
    double age = monotonic_seconds() - delayed_->damage_time;
    RDX_LOG_WARN("Warning: delayed region timeout for wid " << wid_
                 << ", region is " << static_cast<int>(age) << " seconds old, bad connection?");
    // retry with a full window refresh
    delayed_->regions.assign(1, Region{0, 0, width_, height_});
    unacked_.clear();
    do_send_delayed();
}

void DamageScheduler::may_send_delayed() {
    if (!delayed_) return;
    double now = monotonic_seconds();
    int actual_delay = static_cast<int>((now - delayed_->damage_time) * 1000.0);

    if (packets_backlog(now) > 0) {
        if (actual_delay > batch_.timeout_delay) {
            RDX_LOG_WARN("wid " << wid_ << ": delayed region waited " << actual_delay
                         << "ms, above limit of " << batch_.timeout_delay << "ms");
        }
        // an ack will call us again
        return;
    }
    if (batch_.locked && batch_.delay > actual_delay) {
        cancel_locked(expire_timer_);
        expire_timer_ = schedule_locked(batch_.delay - actual_delay,
                                        &DamageScheduler::expire_delayed_region);
        return;
    }
    soft_expired_ = 0;
    do_send_delayed();
}

void DamageScheduler::do_send_delayed() {
    cancel_locked(soft_timer_);
    cancel_locked(timeout_timer_);
    if (!delayed_) return;

    Delayed delayed = std::move(*delayed_);
    delayed_.reset();
    expired_ = false;

    double now = monotonic_seconds();
    double actual_delay = (now - delayed.damage_time) * 1000.0;
    int64_t pixels = 0;
    for (const auto& r : delayed.regions) pixels += r.pixels();
    inputs_.region_pixels = static_cast<double>(pixels);
    inputs_.soft_expired = soft_expired_;

    send_regions(delayed.regions);
    batch_.recompute(monotonic_seconds(), actual_delay, statistics_, inputs_);
}

// ===== Sending =====

void DamageScheduler::send_regions(const std::vector<Region>& regions) {
    for (const auto& region : regions) {
        std::optional<CapturedImage> image;
        try {
            image = capture_ ? capture_->capture(wid_, region) : std::nullopt;
        } catch (const std::exception& e) {
            RDX_LOG_ERROR("wid " << wid_ << ": capture failed: " << e.what());
            continue;
        }
        if (!image) continue;

        uint64_t seq = ++sequence_;
        const Region& r = image->region.empty() ? region : image->region;
        Packet packet("draw", {
            Value(wid_), Value(r.x), Value(r.y), Value(r.width), Value(r.height),
            Value(image->encoding), Value(std::move(image->data)),
            Value(static_cast<int64_t>(seq)),
        });

        double start = monotonic_seconds();
        size_t bytes = 0;
        try {
            bytes = sender_ ? sender_(packet) : 0;
        } catch (const std::exception& e) {
            RDX_LOG_ERROR("wid " << wid_ << ": failed to send draw packet: " << e.what());
            closed_ = true;
            return;
        }
        double end = monotonic_seconds();
        statistics_.record_send(end, static_cast<double>(bytes), std::max(end - start, 1e-6));
        unacked_[seq] = end;
        statistics_.record_queue_size(end, static_cast<double>(unacked_.size()));
    }
}

size_t DamageScheduler::packets_backlog(double now) const {
    double grace = batch_.expire_delay / 1000.0;
    size_t count = 0;
    for (const auto& u : unacked_) {
        if (now - u.second > grace) ++count;
    }
    return count;
}

void DamageScheduler::note_event(double now, int64_t pixels) {
    double since = now - batch_.time_unit;
    recent_events_.erase(std::remove_if(recent_events_.begin(), recent_events_.end(),
                                        [since](const std::pair<double, int64_t>& e) {
                                            return e.first <= since;
                                        }),
                         recent_events_.end());
    recent_events_.emplace_back(now, pixels);
}

} // namespace rdx
