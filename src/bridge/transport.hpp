// src/bridge/transport.hpp
#pragma once

#include "bridge/channel_spec.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace bridge {

enum class PublishStatus : uint8_t {
    Delivered = 0,     // Accepted by the middleware
    NoReceiver,        // Nobody listening and nothing latched it
    WouldBlock,        // Middleware congested, try later
    Timeout,           // Did not complete within the timeout
    Dropped,           // Middleware discarded it
    Failed             // Hard error (closed, unknown channel, oversize)
};

inline const char* to_string(PublishStatus s) {
    switch (s) {
        case PublishStatus::Delivered:  return "delivered";
        case PublishStatus::NoReceiver: return "no_receiver";
        case PublishStatus::WouldBlock: return "would_block";
        case PublishStatus::Timeout:    return "timeout";
        case PublishStatus::Dropped:    return "dropped";
        case PublishStatus::Failed:     return "failed";
    }
    return "unknown";
}

/**
 * Transport - Pub/sub middleware across the process boundary
 *
 * Implementations are driven from the simulation thread only; receive
 * callbacks (where supported) may run on other threads.
 */
class Transport {
public:
    virtual ~Transport() = default;

    /**
     * Connect to the middleware.
     * @return false if it is unavailable
     */
    virtual bool open() = 0;

    virtual void close() = 0;

    virtual bool is_open() const = 0;

    /**
     * Declare a channel and its QoS before the first publish.
     * @return false if the transport cannot carry this channel
     */
    virtual bool advertise(const ChannelSpec& channel) = 0;

    /**
     * Hand one encoded message to the middleware, waiting at most `timeout`.
     */
    virtual PublishStatus publish(const ChannelSpec& channel,
                                  const std::vector<uint8_t>& bytes,
                                  std::chrono::milliseconds timeout) = 0;

    virtual std::string name() const = 0;
};

} // namespace bridge
