// src/bridge/socketcan_transport.hpp
#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "bridge/can_segmenter.hpp"
#include "bridge/transport.hpp"

namespace bridge {

/**
 * SocketCanTransport - Linux SocketCAN (raw, classic frames)
 *
 * Each channel maps to one 11-bit CAN id; messages are split by
 * CanSegmenter. The socket is non-blocking: a full TX queue is waited on
 * with poll(POLLOUT) until the publish deadline, then Timeout.
 *
 * CAN has no subscriber notion, so NoReceiver is never reported.
 */
class SocketCanTransport : public Transport {
public:
    explicit SocketCanTransport(std::string ifname);
    ~SocketCanTransport() override;

    SocketCanTransport(const SocketCanTransport&) = delete;
    SocketCanTransport& operator=(const SocketCanTransport&) = delete;

    bool open() override;
    void close() override;
    bool is_open() const override { return sock_ >= 0; }

    // Requires a unique can_id in [1, 0x7FF]
    bool advertise(const ChannelSpec& channel) override;

    PublishStatus publish(const ChannelSpec& channel,
                          const std::vector<uint8_t>& bytes,
                          std::chrono::milliseconds timeout) override;

    std::string name() const override { return "socketcan:" + ifname_; }

    /**
     * Read one frame, waiting at most timeout_ms.
     * @return false on timeout or error
     */
    bool read_frame_timeout(CanFrame& out, int timeout_ms);

    // Only receive the given 11-bit ids (empty = everything)
    bool set_filters(const std::vector<uint32_t>& ids_11bit);

private:
    using Clock = std::chrono::steady_clock;

    PublishStatus write_frame_until(const CanFrame& frame, Clock::time_point deadline);

    std::string ifname_;
    int sock_ = -1;
    std::map<std::string, uint32_t> ids_;       // channel -> can id
    std::map<std::string, uint8_t> counters_;   // channel -> message counter
};

} // namespace bridge
