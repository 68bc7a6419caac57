// src/bridge/channel_spec.hpp
#pragma once

#include "sensors/sensor_spec.hpp"

#include <cstdint>
#include <string>

namespace bridge {

// Payload schema carried on a channel. Order matches MessageBody alternatives.
enum class Schema : uint8_t {
    RangeImage = 0,
    CameraInfo = 1,
    Imu = 2,
    Odometry = 3,
    Clock = 4,
    TransformTree = 5
};

enum class Reliability : uint8_t {
    Reliable = 0,
    BestEffort = 1
};

enum class Durability : uint8_t {
    Volatile = 0,
    Transient = 1      // Late subscribers receive the last `depth` messages
};

struct QoS {
    Reliability reliability = Reliability::BestEffort;
    Durability durability = Durability::Volatile;
    uint32_t depth = 1;            // History depth / pending retransmit bound
};

// Largest standard (11-bit) CAN identifier
constexpr uint32_t kMaxCanId = 0x7FF;

/**
 * ChannelSpec - One named output channel
 */
struct ChannelSpec {
    std::string name;              // e.g. "/camera/depth"
    Schema schema = Schema::Clock;
    std::string sensor;            // Source sensor (sensor-backed schemas only)
    std::string frame_id;          // Header frame id
    QoS qos;
    double rate_hz = 0.0;          // 0 = every publish call
    uint32_t can_id = 0;           // 11-bit id for the SocketCAN transport

    bool reliable() const { return qos.reliability == Reliability::Reliable; }
};

inline const char* to_string(Schema s) {
    switch (s) {
        case Schema::RangeImage:    return "range_image";
        case Schema::CameraInfo:    return "camera_info";
        case Schema::Imu:           return "imu";
        case Schema::Odometry:      return "odometry";
        case Schema::Clock:         return "clock";
        case Schema::TransformTree: return "transform_tree";
    }
    return "unknown";
}

inline bool parse_schema(const std::string& s, Schema& out) {
    if (s == "range_image")    { out = Schema::RangeImage; return true; }
    if (s == "camera_info")    { out = Schema::CameraInfo; return true; }
    if (s == "imu")            { out = Schema::Imu; return true; }
    if (s == "odometry")       { out = Schema::Odometry; return true; }
    if (s == "clock")          { out = Schema::Clock; return true; }
    if (s == "transform_tree") { out = Schema::TransformTree; return true; }
    return false;
}

inline const char* to_string(Reliability r) {
    return r == Reliability::Reliable ? "reliable" : "best_effort";
}

inline bool parse_reliability(const std::string& s, Reliability& out) {
    if (s == "reliable")    { out = Reliability::Reliable; return true; }
    if (s == "best_effort") { out = Reliability::BestEffort; return true; }
    return false;
}

inline const char* to_string(Durability d) {
    return d == Durability::Transient ? "transient" : "volatile";
}

inline bool parse_durability(const std::string& s, Durability& out) {
    if (s == "volatile")                             { out = Durability::Volatile; return true; }
    if (s == "transient" || s == "transient_local")  { out = Durability::Transient; return true; }
    return false;
}

// Schemas whose payload comes from a sensor sample
inline bool is_sensor_backed(Schema s) {
    return s == Schema::RangeImage || s == Schema::CameraInfo ||
           s == Schema::Imu || s == Schema::Odometry;
}

// Sensor kind a sensor-backed schema reads from
inline sensors::SensorKind source_kind(Schema s) {
    switch (s) {
        case Schema::Imu:      return sensors::SensorKind::Inertial;
        case Schema::Odometry: return sensors::SensorKind::PoseVelocity;
        default:               return sensors::SensorKind::RangeImage;
    }
}

} // namespace bridge
