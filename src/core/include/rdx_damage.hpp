#pragma once

/**
 * @file rdx_damage.hpp
 * @brief Per-window damage pipeline driven by a DamageBatchConfig
 *
 * damage() either sends a region straight away or coalesces it until the
 * batch delay expires on the shared TimerQueue. Client acks feed the
 * latency statistics. Timer callbacks hold a weak reference, so a
 * scheduler may be dropped at any time after cleanup().
 */

#include "rdx_batch.hpp"
#include "rdx_packet.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace rdx {

struct Region {
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;

    int64_t pixels() const { return static_cast<int64_t>(width) * height; }
    bool empty() const { return width <= 0 || height <= 0; }
    Region united(const Region& other) const;
};

/// Encoded pixels for one region; the encoding itself is opaque here
struct CapturedImage {
    std::string encoding;
    std::string data;
    Region region;
};

/// Screen or window capture back-end
class CaptureSource {
public:
    virtual ~CaptureSource() = default;

    /// nullopt when the window is gone or has nothing to show
    virtual std::optional<CapturedImage> capture(int wid, const Region& region) = 0;
};

class DamageScheduler : public std::enable_shared_from_this<DamageScheduler> {
public:
    /// Sends a packet, returns the number of bytes written
    using PacketSender = std::function<size_t(const Packet&)>;

    static constexpr int MAX_SOFT_EXPIRED = 5;
    static constexpr size_t MAX_REGIONS = 32;

    static std::shared_ptr<DamageScheduler> create(int wid, int width, int height,
                                                   const BatchBounds& bounds,
                                                   std::shared_ptr<TimerQueue> timers,
                                                   std::shared_ptr<CaptureSource> capture,
                                                   PacketSender sender);
    ~DamageScheduler();

    DamageScheduler(const DamageScheduler&) = delete;
    DamageScheduler& operator=(const DamageScheduler&) = delete;

    void damage(const Region& region);

    /// Client acknowledged draw packet @p sequence
    void ack(uint64_t sequence);

    void set_focus(bool focus);
    void resize(int width, int height);
    void go_idle();
    void no_idle();

    /// Cancel timers and stop sending; idempotent
    void cleanup();

    int wid() const { return wid_; }
    DamageBatchConfig batch_snapshot() const;
    std::map<std::string, double> get_info() const;
    uint64_t packets_sent() const;
    size_t pending_acks() const;
    bool has_delayed_region() const;

private:
    DamageScheduler(int wid, int width, int height, const BatchBounds& bounds,
                    std::shared_ptr<TimerQueue> timers,
                    std::shared_ptr<CaptureSource> capture,
                    PacketSender sender);

    struct Delayed {
        double damage_time;
        std::vector<Region> regions;
    };

    // All private helpers expect mutex_ to be held
    TimerQueue::TimerId schedule_locked(int64_t delay_ms, void (DamageScheduler::*handler)());
    void cancel_locked(TimerQueue::TimerId& id);
    void expire_delayed_region();
    void soft_timeout();
    void region_timeout();
    void may_send_delayed();
    void do_send_delayed();
    void send_regions(const std::vector<Region>& regions);
    size_t packets_backlog(double now) const;
    void note_event(double now, int64_t pixels);

    const int wid_;
    int width_;
    int height_;
    std::shared_ptr<CaptureSource> capture_;
    PacketSender sender_;

    mutable std::mutex mutex_;
    DamageBatchConfig batch_;
    DamageStatistics statistics_;
    BatchInputs inputs_;
    std::optional<Delayed> delayed_;
    bool expired_ = false;
    int soft_expired_ = 0;
    TimerQueue::TimerId expire_timer_ = 0;
    TimerQueue::TimerId soft_timer_ = 0;
    TimerQueue::TimerId timeout_timer_ = 0;
    bool closed_ = false;
    uint64_t sequence_ = 0;
    std::map<uint64_t, double> unacked_;
    std::vector<std::pair<double, int64_t>> recent_events_;
};

} // namespace rdx
