// src/bridge/loopback_transport.hpp
#pragma once

#include "bridge/transport.hpp"

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace bridge {

using ReceiveCallback = std::function<void(const std::string& channel, const std::vector<uint8_t>& bytes)>;

/**
 * LoopbackTransport - In-process pub/sub
 *
 * Thread-safe subscription table; callbacks run synchronously on the
 * publishing thread, outside the lock.
 *
 * Transient channels latch their last `depth` messages: a publish with
 * no subscriber is still accepted, and a late subscriber gets the history
 * replayed on subscribe().
 *
 * Fault injection:
 *   unavailable - open() fails
 *   congested   - publish() returns WouldBlock
 *   stall       - publish() blocks; Timeout if the stall exceeds the timeout
 */
class LoopbackTransport : public Transport {
public:
    struct Faults {
        bool unavailable = false;
        bool congested = false;
        std::chrono::milliseconds stall{0};
    };

    LoopbackTransport() = default;
    explicit LoopbackTransport(const Faults& faults) : faults_(faults) {}

    bool open() override;
    void close() override;
    bool is_open() const override;
    bool advertise(const ChannelSpec& channel) override;
    PublishStatus publish(const ChannelSpec& channel,
                          const std::vector<uint8_t>& bytes,
                          std::chrono::milliseconds timeout) override;
    std::string name() const override { return "loopback"; }

    /**
     * @return subscription id (>= 0)
     */
    int64_t subscribe(const std::string& channel, ReceiveCallback callback);
    bool unsubscribe(int64_t id);

    size_t subscriber_count(const std::string& channel) const;
    size_t latched_count(const std::string& channel) const;
    uint64_t delivered_count(const std::string& channel) const;

    void set_faults(const Faults& faults);
    Faults faults() const;

private:
    struct Subscription {
        int64_t id;
        std::string channel;
        ReceiveCallback callback;
    };

    struct ChannelState {
        QoS qos;
        std::deque<std::vector<uint8_t>> latched;
        uint64_t delivered = 0;
    };

    mutable std::mutex mutex_;
    Faults faults_;
    bool open_ = false;
    int64_t next_id_ = 0;
    std::map<int64_t, Subscription> subscriptions_;
    std::map<std::string, ChannelState> channels_;
};

} // namespace bridge
