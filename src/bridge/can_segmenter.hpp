// src/bridge/can_segmenter.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <vector>

namespace bridge {

// Classic CAN frame, independent of <linux/can.h>
struct CanFrame {
    uint32_t id = 0;
    uint8_t dlc = 0;
    uint8_t data[8] = {0, 0, 0, 0, 0, 0, 0, 0};
};

/**
 * CanSegmenter - Split one message into classic CAN frames
 *
 * Every frame:  byte0 = message counter, byte1-2 = segment index (LE)
 * Segment 0:    byte3-6 = total payload length (LE u32), dlc 7
 * Segment n>0:  byte3-7 = up to 5 payload bytes
 *
 * All frames of one message use the channel's CAN id.
 */
class CanSegmenter {
public:
    static constexpr size_t kPayloadPerFrame = 5;
    static constexpr size_t kMaxSegments = 0xFFFF;
    static constexpr size_t kMaxPayload = kPayloadPerFrame * (kMaxSegments - 1);

    /**
     * @return false if the payload exceeds kMaxPayload
     */
    static bool segment(uint32_t can_id, uint8_t counter,
                        const std::vector<uint8_t>& payload,
                        std::vector<CanFrame>& out);

    static size_t frame_count(size_t payload_len) {
        return 1 + (payload_len + kPayloadPerFrame - 1) / kPayloadPerFrame;
    }
};

/**
 * CanReassembler - Rebuild messages from segmented frames
 *
 * One message in flight per CAN id. A segment-0 frame restarts assembly;
 * an out-of-order segment or counter change discards the partial message.
 */
class CanReassembler {
public:
    /**
     * @return true when `frame` completed a message (written to `out`)
     */
    bool feed(const CanFrame& frame, std::vector<uint8_t>& out);

    size_t discarded() const { return discarded_; }

private:
    struct Partial {
        uint8_t counter = 0;
        uint16_t next_segment = 0;
        uint32_t total = 0;
        std::vector<uint8_t> data;
        bool active = false;
    };

    std::map<uint32_t, Partial> partial_;
    size_t discarded_ = 0;
};

} // namespace bridge
