// src/bridge/wire_codec.hpp
#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "bridge/channel_spec.hpp"
#include "bridge/transform_tree.hpp"
#include "sensors/sensor_sample.hpp"

namespace bridge {

// Simulation-time stamp, split like a ROS time
struct SimStamp {
    int64_t sec = 0;
    uint32_t nsec = 0;

    static SimStamp from_seconds(double t_s);
    double to_seconds() const { return static_cast<double>(sec) + nsec * 1e-9; }

    bool operator==(const SimStamp& o) const { return sec == o.sec && nsec == o.nsec; }
};

struct MessageHeader {
    std::string channel;
    uint64_t seq = 0;            // Per channel, monotonic for the bridge's lifetime
    SimStamp stamp;
    std::string frame_id;
    Schema schema = Schema::Clock;
};

// Intrinsics companion of a range image
struct CameraInfo {
    uint32_t width = 0;
    uint32_t height = 0;
    double fx = 0.0;
    double fy = 0.0;
    double cx = 0.0;
    double cy = 0.0;

    bool operator==(const CameraInfo& o) const {
        return width == o.width && height == o.height &&
               fx == o.fx && fy == o.fy && cx == o.cx && cy == o.cy;
    }
};

struct ClockTick {
    double t_s = 0.0;
    bool operator==(const ClockTick& o) const { return t_s == o.t_s; }
};

using TransformList = std::vector<FrameTransform>;

// Alternative index == static_cast<size_t>(Schema)
using MessageBody = std::variant<sensors::RangeImage,
                                 CameraInfo,
                                 sensors::InertialReading,
                                 sensors::PoseVelocityReading,
                                 ClockTick,
                                 TransformList>;

struct WireMessage {
    MessageHeader header;
    MessageBody body;
};

/**
 * WireCodec - Byte layout of bridge messages
 *
 *   magic "RS" | version u8 | schema u8 | channel str | seq u64 |
 *   stamp sec i64 | stamp nsec u32 | frame_id str | body
 *
 * Little-endian throughout, strings u16-length prefixed.
 */
class WireCodec {
public:
    static constexpr uint8_t kMagic0 = 'R';
    static constexpr uint8_t kMagic1 = 'S';
    static constexpr uint8_t kVersion = 1;

    // header.schema must match the body alternative
    static std::vector<uint8_t> encode(const WireMessage& msg);

    // Returns false on truncated or malformed input
    static bool decode(const uint8_t* data, size_t len, WireMessage& out);
    static bool decode(const std::vector<uint8_t>& bytes, WireMessage& out) {
        return decode(bytes.data(), bytes.size(), out);
    }

    static CameraInfo camera_info_from(const sensors::RangeImage& img);
};

} // namespace bridge
