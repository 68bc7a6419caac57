// src/bridge/wire_codec.cpp
#include "bridge/wire_codec.hpp"

#include <cmath>
#include <stdexcept>
#include <utility>

#include "utils/byte_buffer.hpp"

namespace bridge {

namespace {

void put_vec3(utils::ByteWriter& w, const world::Vec3& v) {
    w.put_f64(v.x);
    w.put_f64(v.y);
    w.put_f64(v.z);
}

void put_quat(utils::ByteWriter& w, const world::Quat& q) {
    w.put_f64(q.w);
    w.put_f64(q.x);
    w.put_f64(q.y);
    w.put_f64(q.z);
}

bool get_vec3(utils::ByteReader& r, world::Vec3& v) {
    return r.get_f64(v.x) && r.get_f64(v.y) && r.get_f64(v.z);
}

bool get_quat(utils::ByteReader& r, world::Quat& q) {
    return r.get_f64(q.w) && r.get_f64(q.x) && r.get_f64(q.y) && r.get_f64(q.z);
}

// Body encoders, one per alternative
struct BodyWriter {
    utils::ByteWriter& w;

    void operator()(const sensors::RangeImage& img) const {
        w.put_u32(img.width);
        w.put_u32(img.height);
        w.put_f64(img.fx);
        w.put_f64(img.fy);
        w.put_f64(img.cx);
        w.put_f64(img.cy);
        w.put_u32(static_cast<uint32_t>(img.depth_m.size()));
        for (float d : img.depth_m) w.put_f32(d);
        w.put_u32(static_cast<uint32_t>(img.valid_mask.size()));
        w.put_bytes(img.valid_mask.data(), img.valid_mask.size());
    }

    void operator()(const CameraInfo& ci) const {
        w.put_u32(ci.width);
        w.put_u32(ci.height);
        w.put_f64(ci.fx);
        w.put_f64(ci.fy);
        w.put_f64(ci.cx);
        w.put_f64(ci.cy);
    }

    void operator()(const sensors::InertialReading& imu) const {
        put_vec3(w, imu.accel_mps2);
        put_vec3(w, imu.gyro_rps);
        w.put_u32(imu.integrated_updates);
    }

    void operator()(const sensors::PoseVelocityReading& odom) const {
        put_vec3(w, odom.position_m);
        put_vec3(w, odom.velocity_mps);
        put_quat(w, odom.orientation);
    }

    void operator()(const ClockTick& clk) const {
        w.put_f64(clk.t_s);
    }

    void operator()(const TransformList& tfs) const {
        w.put_u16(static_cast<uint16_t>(tfs.size()));
        for (const auto& tf : tfs) {
            w.put_string(tf.parent);
            w.put_string(tf.child);
            put_vec3(w, tf.translation);
            put_quat(w, tf.rotation);
        }
    }
};

bool read_body(utils::ByteReader& r, Schema schema, MessageBody& body) {
    switch (schema) {
        case Schema::RangeImage: {
            sensors::RangeImage img;
            uint32_t n = 0;
            if (!(r.get_u32(img.width) && r.get_u32(img.height) &&
                  r.get_f64(img.fx) && r.get_f64(img.fy) &&
                  r.get_f64(img.cx) && r.get_f64(img.cy) && r.get_u32(n))) {
                return false;
            }
            if (n > r.remaining() / 4) return false;
            img.depth_m.resize(n);
            for (uint32_t i = 0; i < n; ++i) {
                if (!r.get_f32(img.depth_m[i])) return false;
            }
            if (!r.get_u32(n) || n > r.remaining()) return false;
            img.valid_mask.resize(n);
            if (n > 0 && !r.get_bytes(img.valid_mask.data(), n)) return false;
            body = std::move(img);
            return true;
        }
        case Schema::CameraInfo: {
            CameraInfo ci;
            if (!(r.get_u32(ci.width) && r.get_u32(ci.height) &&
                  r.get_f64(ci.fx) && r.get_f64(ci.fy) &&
                  r.get_f64(ci.cx) && r.get_f64(ci.cy))) {
                return false;
            }
            body = ci;
            return true;
        }
        case Schema::Imu: {
            sensors::InertialReading imu;
            if (!(get_vec3(r, imu.accel_mps2) && get_vec3(r, imu.gyro_rps) &&
                  r.get_u32(imu.integrated_updates))) {
                return false;
            }
            body = imu;
            return true;
        }
        case Schema::Odometry: {
            sensors::PoseVelocityReading odom;
            if (!(get_vec3(r, odom.position_m) && get_vec3(r, odom.velocity_mps) &&
                  get_quat(r, odom.orientation))) {
                return false;
            }
            body = odom;
            return true;
        }
        case Schema::Clock: {
            ClockTick clk;
            if (!r.get_f64(clk.t_s)) return false;
            body = clk;
            return true;
        }
        case Schema::TransformTree: {
            uint16_t n = 0;
            if (!r.get_u16(n)) return false;
            TransformList tfs(n);
            for (auto& tf : tfs) {
                if (!(r.get_string(tf.parent) && r.get_string(tf.child) &&
                      get_vec3(r, tf.translation) && get_quat(r, tf.rotation))) {
                    return false;
                }
            }
            body = std::move(tfs);
            return true;
        }
    }
    return false;
}

} // namespace

SimStamp SimStamp::from_seconds(double t_s) {
    SimStamp s;
    double whole = std::floor(t_s);
    int64_t nsec = static_cast<int64_t>(std::llround((t_s - whole) * 1e9));
    if (nsec >= 1000000000LL) {
        whole += 1.0;
        nsec -= 1000000000LL;
    }
    s.sec = static_cast<int64_t>(whole);
    s.nsec = static_cast<uint32_t>(nsec);
    return s;
}

CameraInfo WireCodec::camera_info_from(const sensors::RangeImage& img) {
    CameraInfo ci;
    ci.width = img.width;
    ci.height = img.height;
    ci.fx = img.fx;
    ci.fy = img.fy;
    ci.cx = img.cx;
    ci.cy = img.cy;
    return ci;
}

std::vector<uint8_t> WireCodec::encode(const WireMessage& msg) {
    if (msg.body.index() != static_cast<size_t>(msg.header.schema)) {
        throw std::invalid_argument(std::string("WireCodec: body does not match schema ") +
                                    to_string(msg.header.schema));
    }

    utils::ByteWriter w;
    w.put_u8(kMagic0);
    w.put_u8(kMagic1);
    w.put_u8(kVersion);
    w.put_u8(static_cast<uint8_t>(msg.header.schema));
    w.put_string(msg.header.channel);
    w.put_u64(msg.header.seq);
    w.put_i64(msg.header.stamp.sec);
    w.put_u32(msg.header.stamp.nsec);
    w.put_string(msg.header.frame_id);

    std::visit(BodyWriter{w}, msg.body);
    return w.take();
}

bool WireCodec::decode(const uint8_t* data, size_t len, WireMessage& out) {
    utils::ByteReader r(data, len);

    uint8_t m0 = 0, m1 = 0, version = 0, schema = 0;
    if (!(r.get_u8(m0) && r.get_u8(m1) && r.get_u8(version) && r.get_u8(schema))) {
        return false;
    }
    if (m0 != kMagic0 || m1 != kMagic1 || version != kVersion) return false;
    if (schema > static_cast<uint8_t>(Schema::TransformTree)) return false;

    WireMessage msg;
    msg.header.schema = static_cast<Schema>(schema);
    if (!(r.get_string(msg.header.channel) && r.get_u64(msg.header.seq) &&
          r.get_i64(msg.header.stamp.sec) && r.get_u32(msg.header.stamp.nsec) &&
          r.get_string(msg.header.frame_id))) {
        return false;
    }

    if (!read_body(r, msg.header.schema, msg.body)) return false;
    if (r.remaining() != 0) return false;

    out = std::move(msg);
    return true;
}

} // namespace bridge
