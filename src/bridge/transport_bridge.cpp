// src/bridge/transport_bridge.cpp
#include "bridge/transport_bridge.hpp"
#include "sim/errors.hpp"
#include "utils/logging.hpp"

#include <thread>
#include <variant>

namespace bridge {

TransportBridge::TransportBridge(std::unique_ptr<Transport> transport, const BridgeConfig& cfg)
    : transport_(std::move(transport)), cfg_(cfg)
{}

TransportBridge::~TransportBridge() {
    close();
}

// ============================================================================
// Setup
// ============================================================================

void TransportBridge::validate(const std::vector<ChannelSpec>& channels,
                               const std::map<std::string, sensors::SensorKind>& sensors) const {
    std::set<std::string> seen;
    for (const auto& c : channels) {
        if (c.name.empty()) {
            throw sim::ConfigurationError("channel with empty name");
        }
        if (!seen.insert(c.name).second) {
            throw sim::ConfigurationError("duplicate channel name: " + c.name);
        }
        if (c.rate_hz < 0.0) {
            throw sim::ConfigurationError("channel " + c.name + ": negative rate_hz");
        }
        if (c.reliable() && c.qos.depth == 0) {
            throw sim::ConfigurationError("channel " + c.name + ": reliable QoS needs history depth > 0");
        }
        if (is_sensor_backed(c.schema)) {
            if (c.sensor.empty()) {
                throw sim::ConfigurationError("channel " + c.name + ": schema " +
                                              to_string(c.schema) + " needs a source sensor");
            }
            auto it = sensors.find(c.sensor);
            if (it == sensors.end()) {
                throw sim::ConfigurationError("channel " + c.name + ": unknown or disabled sensor '" +
                                              c.sensor + "'");
            }
            if (it->second != source_kind(c.schema)) {
                throw sim::ConfigurationError("channel " + c.name + ": sensor '" + c.sensor +
                                              "' is " + sensors::to_string(it->second) +
                                              ", schema " + to_string(c.schema) + " needs " +
                                              sensors::to_string(source_kind(c.schema)));
            }
        }
    }
}

void TransportBridge::setup(const std::vector<ChannelSpec>& channels,
                            const std::map<std::string, sensors::SensorKind>& sensors,
                            double tf_rate_hz) {
    if (state_ != BridgeState::Uninitialized) {
        throw sim::SequencingError(std::string("TransportBridge::setup() in state ") + to_string(state_));
    }

    validate(channels, sensors);

    channels_ = channels;
    runtime_.assign(channels_.size(), ChannelRuntime{});
    scheduler_.init(channels_);
    if (tf_rate_hz > 0.0) {
        for (size_t i = 0; i < channels_.size(); ++i) {
            if (channels_[i].schema == Schema::TransformTree) {
                channels_[i].rate_hz = tf_rate_hz;
                scheduler_.set_period(i, 1.0 / tf_rate_hz);
            }
        }
    }

    if (!transport_ || !transport_->open()) {
        noop_ = true;
        stats_.degraded = true;
        warn_once(Degradation::Unavailable, "*",
                  transport_ ? "transport unavailable, running as no-op publisher"
                             : "no transport configured, running as no-op publisher");
        state_ = BridgeState::Bridging;
        return;
    }

    for (const auto& c : channels_) {
        if (!transport_->advertise(c)) {
            transport_->close();
            throw sim::ConfigurationError("transport " + transport_->name() +
                                          " rejected channel " + c.name);
        }
        LOG_DEBUG("[Bridge] Advertised %s (%s, %s/%s, depth %u, %.1f Hz)",
                  c.name.c_str(), to_string(c.schema), to_string(c.qos.reliability),
                  to_string(c.qos.durability), c.qos.depth, c.rate_hz);
    }

    LOG_INFO("[Bridge] Bridging %zu channels over %s", channels_.size(), transport_->name().c_str());
    state_ = BridgeState::Bridging;
}

// ============================================================================
// Publishing
// ============================================================================

bool TransportBridge::build(size_t i, const sim::ObservationSnapshot& snapshot,
                            const TransformTree& tree, WireMessage& out) {
    const ChannelSpec& c = channels_[i];
    ChannelRuntime& rt = runtime_[i];

    out.header.channel = c.name;
    out.header.schema = c.schema;
    out.header.stamp = SimStamp::from_seconds(snapshot.t_s);
    out.header.frame_id = c.frame_id;

    if (is_sensor_backed(c.schema)) {
        const sensors::SensorSample* s = snapshot.find(c.sensor);
        if (!s || !s->valid || s->update_count == rt.last_update) {
            return false;
        }

        if (out.header.frame_id.empty()) out.header.frame_id = c.sensor;
        out.header.stamp = SimStamp::from_seconds(s->t_s);

        switch (c.schema) {
            case Schema::RangeImage: {
                const auto* img = std::get_if<sensors::RangeImage>(&s->payload);
                if (!img) return false;
                out.body = *img;
                break;
            }
            case Schema::CameraInfo: {
                const auto* img = std::get_if<sensors::RangeImage>(&s->payload);
                if (!img) return false;
                out.body = WireCodec::camera_info_from(*img);
                break;
            }
            case Schema::Imu: {
                const auto* r = std::get_if<sensors::InertialReading>(&s->payload);
                if (!r) return false;
                out.body = *r;
                break;
            }
            case Schema::Odometry: {
                const auto* r = std::get_if<sensors::PoseVelocityReading>(&s->payload);
                if (!r) return false;
                out.body = *r;
                break;
            }
            default:
                return false;
        }
        rt.last_update = s->update_count;
    } else if (c.schema == Schema::Clock) {
        out.body = ClockTick{snapshot.t_s};
    } else {
        if (out.header.frame_id.empty()) out.header.frame_id = tree.world_frame();
        out.body = tree.transforms();
    }

    out.header.seq = rt.seq++;
    return true;
}

void TransportBridge::publish(const sim::ObservationSnapshot& snapshot, const TransformTree& tree) {
    if (state_ != BridgeState::Bridging) {
        throw sim::SequencingError(std::string("TransportBridge::publish() in state ") + to_string(state_));
    }
    if (noop_) return;

    const Budget budget = Budget::start(cfg_.publish_timeout);

    for (size_t i = 0; i < channels_.size(); ++i) {
        if (channels_[i].reliable() && !runtime_[i].pending.empty()) {
            flush_pending(i, budget);
        }
    }

    for (size_t i : scheduler_.due(snapshot.t_s)) {
        WireMessage msg;
        if (!build(i, snapshot, tree, msg)) continue;

        ++stats_.published;
        send(i, WireCodec::encode(msg), budget);
    }
}

bool TransportBridge::Budget::next(std::chrono::milliseconds& wait) const {
    if (total.count() <= 0) {
        wait = std::chrono::milliseconds(0);
        return true;
    }
    const auto now = Clock::now();
    if (now >= deadline) return false;
    wait = std::chrono::ceil<std::chrono::milliseconds>(deadline - now);
    return true;
}

void TransportBridge::send(size_t i, std::vector<uint8_t> bytes, const Budget& budget) {
    const ChannelSpec& c = channels_[i];
    ChannelRuntime& rt = runtime_[i];

    if (c.reliable() && !rt.pending.empty()) {
        // Keep order behind older undelivered messages
        buffer(i, std::move(bytes));
        return;
    }

    PublishStatus st = PublishStatus::Timeout;
    std::chrono::milliseconds wait(0);
    if (budget.next(wait)) {
        st = transport_->publish(c, bytes, wait);
        if (st == PublishStatus::Delivered) {
            ++stats_.delivered;
            return;
        }
    } else {
        ++stats_.deferred;
    }

    note_failure(i, st);

    if (c.reliable()) {
        if (st == PublishStatus::Failed) return;
        buffer(i, std::move(bytes));
    } else {
        ++stats_.best_effort_drops;
        LOG_TRACE("[Bridge] %s: best-effort drop (%s)", c.name.c_str(), to_string(st));
    }
}

size_t TransportBridge::flush_pending(size_t i, const Budget& budget) {
    const ChannelSpec& c = channels_[i];
    ChannelRuntime& rt = runtime_[i];
    size_t n = 0;

    std::chrono::milliseconds wait(0);
    while (!rt.pending.empty() && budget.next(wait)) {
        const PublishStatus st = transport_->publish(c, rt.pending.front(), wait);
        if (st == PublishStatus::Delivered) {
            rt.pending.pop_front();
            ++stats_.delivered;
            ++stats_.retransmitted;
            ++n;
            continue;
        }
        note_failure(i, st);
        if (st == PublishStatus::Failed) {
            rt.pending.pop_front();
            continue;
        }
        break;
    }
    return n;
}

void TransportBridge::buffer(size_t i, std::vector<uint8_t> bytes) {
    const ChannelSpec& c = channels_[i];
    ChannelRuntime& rt = runtime_[i];

    rt.pending.push_back(std::move(bytes));
    ++stats_.reliable_buffered;

    while (rt.pending.size() > c.qos.depth) {
        rt.pending.pop_front();
        ++stats_.evicted;
        warn_once(Degradation::Eviction, c.name, "history full, evicting oldest pending message");
    }
}

void TransportBridge::note_failure(size_t i, PublishStatus st) {
    const ChannelSpec& c = channels_[i];
    switch (st) {
        case PublishStatus::Timeout:
            ++stats_.publish_timeouts;
            warn_once(Degradation::Timeout, c.name, "publish timed out");
            break;
        case PublishStatus::Failed:
            ++stats_.publish_failures;
            warn_once(Degradation::Failure, c.name, "transport rejected message");
            break;
        default:
            LOG_TRACE("[Bridge] %s: not delivered (%s)", c.name.c_str(), to_string(st));
            break;
    }
}

void TransportBridge::warn_once(Degradation cls, const std::string& channel, const char* detail) {
    if (warned_.insert(std::make_pair(cls, channel)).second) {
        LOG_WARN("[Bridge] %s: %s", channel.c_str(), detail);
    }
}

// ============================================================================
// Drain / shutdown
// ============================================================================

size_t TransportBridge::drain(std::chrono::milliseconds timeout) {
    if (noop_ || (state_ != BridgeState::Bridging && state_ != BridgeState::ShuttingDown)) {
        return 0;
    }

    const Budget budget = Budget::start(timeout);

    while (pending_total() > 0) {
        size_t progress = 0;
        for (size_t i = 0; i < channels_.size(); ++i) {
            if (!runtime_[i].pending.empty()) {
                progress += flush_pending(i, budget);
            }
        }
        if (pending_total() == 0 || Clock::now() >= budget.deadline) break;
        if (progress == 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }

    size_t discarded = 0;
    for (size_t i = 0; i < runtime_.size(); ++i) {
        auto& rt = runtime_[i];
        if (rt.pending.empty()) continue;
        discarded += rt.pending.size();
        warn_once(Degradation::DrainDiscard, channels_[i].name, "drain timed out, discarding pending messages");
        rt.pending.clear();
    }
    stats_.drain_discards += discarded;

    if (discarded > 0) {
        LOG_DEBUG("[Bridge] Drain discarded %zu messages", discarded);
    }
    return discarded;
}

void TransportBridge::reset_schedule() {
    scheduler_.reset();
    for (auto& rt : runtime_) {
        rt.last_update = 0;
    }
}

void TransportBridge::close() {
    if (state_ == BridgeState::Closed) return;

    if (state_ == BridgeState::Uninitialized) {
        state_ = BridgeState::Closed;
        return;
    }

    state_ = BridgeState::ShuttingDown;
    drain(cfg_.drain_timeout);

    if (transport_ && transport_->is_open()) {
        transport_->close();
    }
    state_ = BridgeState::Closed;

    LOG_INFO("[Bridge] Closed (published %llu, delivered %llu, drops %llu, evicted %llu, timeouts %llu)",
             static_cast<unsigned long long>(stats_.published),
             static_cast<unsigned long long>(stats_.delivered),
             static_cast<unsigned long long>(stats_.best_effort_drops),
             static_cast<unsigned long long>(stats_.evicted),
             static_cast<unsigned long long>(stats_.publish_timeouts));
}

// ============================================================================
// Queries
// ============================================================================

size_t TransportBridge::pending(const std::string& channel) const {
    for (size_t i = 0; i < channels_.size(); ++i) {
        if (channels_[i].name == channel) return runtime_[i].pending.size();
    }
    return 0;
}

size_t TransportBridge::pending_total() const {
    size_t n = 0;
    for (const auto& rt : runtime_) n += rt.pending.size();
    return n;
}

uint64_t TransportBridge::next_seq(const std::string& channel) const {
    for (size_t i = 0; i < channels_.size(); ++i) {
        if (channels_[i].name == channel) return runtime_[i].seq;
    }
    return 0;
}

} // namespace bridge
