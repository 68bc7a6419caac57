// src/bridge/can_segmenter.cpp
#include "bridge/can_segmenter.hpp"

#include <algorithm>
#include <utility>

namespace bridge {

bool CanSegmenter::segment(uint32_t can_id, uint8_t counter,
                           const std::vector<uint8_t>& payload,
                           std::vector<CanFrame>& out) {
    out.clear();
    if (payload.size() > kMaxPayload) {
        return false;
    }

    out.reserve(frame_count(payload.size()));

    CanFrame head;
    head.id = can_id;
    head.dlc = 7;
    head.data[0] = counter;
    head.data[1] = 0;
    head.data[2] = 0;
    const uint32_t total = static_cast<uint32_t>(payload.size());
    for (int i = 0; i < 4; ++i) {
        head.data[3 + i] = static_cast<uint8_t>((total >> (8 * i)) & 0xFF);
    }
    out.push_back(head);

    uint16_t index = 1;
    for (size_t off = 0; off < payload.size(); off += kPayloadPerFrame, ++index) {
        const size_t n = std::min(kPayloadPerFrame, payload.size() - off);
        CanFrame f;
        f.id = can_id;
        f.dlc = static_cast<uint8_t>(3 + n);
        f.data[0] = counter;
        f.data[1] = static_cast<uint8_t>(index & 0xFF);
        f.data[2] = static_cast<uint8_t>((index >> 8) & 0xFF);
        std::copy(payload.begin() + static_cast<std::ptrdiff_t>(off),
                  payload.begin() + static_cast<std::ptrdiff_t>(off + n),
                  f.data + 3);
        out.push_back(f);
    }
    return true;
}

bool CanReassembler::feed(const CanFrame& frame, std::vector<uint8_t>& out) {
    if (frame.dlc < 3 || frame.dlc > 8) {
        return false;
    }

    const uint8_t counter = frame.data[0];
    const uint16_t index = static_cast<uint16_t>(frame.data[1] | (frame.data[2] << 8));
    Partial& p = partial_[frame.id];

    if (index == 0) {
        if (frame.dlc < 7) return false;
        if (p.active) ++discarded_;
        p = Partial{};
        p.active = true;
        p.counter = counter;
        p.next_segment = 1;
        p.total = static_cast<uint32_t>(frame.data[3]) |
                  (static_cast<uint32_t>(frame.data[4]) << 8) |
                  (static_cast<uint32_t>(frame.data[5]) << 16) |
                  (static_cast<uint32_t>(frame.data[6]) << 24);
        if (p.total > CanSegmenter::kMaxPayload) {
            p.active = false;
            ++discarded_;
            return false;
        }
        p.data.reserve(p.total);
    } else {
        if (!p.active) return false;
        if (counter != p.counter || index != p.next_segment) {
            p.active = false;
            ++discarded_;
            return false;
        }
        const size_t n = frame.dlc - 3u;
        if (p.data.size() + n > p.total) {
            p.active = false;
            ++discarded_;
            return false;
        }
        p.data.insert(p.data.end(), frame.data + 3, frame.data + 3 + n);
        ++p.next_segment;
    }

    if (p.data.size() == p.total) {
        out = std::move(p.data);
        p = Partial{};
        return true;
    }
    return false;
}

} // namespace bridge
