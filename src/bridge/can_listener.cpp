// src/bridge/can_listener.cpp
// Receives rapid_sim channels from SocketCAN, reassembles and decodes them.
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <map>
#include <string>
#include <variant>
#include <vector>

#include "bridge/can_segmenter.hpp"
#include "bridge/socketcan_transport.hpp"
#include "bridge/wire_codec.hpp"
#include "utils/logging.hpp"

static bool parse_u32(const std::string& s, uint32_t& out) {
    char* end = nullptr;
    errno = 0;
    unsigned long v = std::strtoul(s.c_str(), &end, 0);
    if (errno != 0 || end == s.c_str() || *end != '\0') return false;
    out = static_cast<uint32_t>(v);
    return true;
}

static std::vector<uint32_t> parse_id_list(const std::string& s) {
    // e.g. "0x200,0x210,0x220"
    std::vector<uint32_t> ids;
    std::string cur;
    auto flush = [&]() {
        uint32_t v = 0;
        if (!cur.empty() && parse_u32(cur, v) && v <= 0x7FF) ids.push_back(v);
        cur.clear();
    };
    for (char ch : s) {
        if (ch == ',') {
            flush();
        } else if (!std::isspace(static_cast<unsigned char>(ch))) {
            cur.push_back(ch);
        }
    }
    flush();
    return ids;
}

static void print_message(const bridge::WireMessage& msg, size_t bytes) {
    const auto& h = msg.header;
    std::printf("%-28s seq=%-6llu t=%10.4f frame=%-14s %-14s %6zu B  ",
                h.channel.c_str(), static_cast<unsigned long long>(h.seq),
                h.stamp.to_seconds(), h.frame_id.c_str(), bridge::to_string(h.schema), bytes);

    if (const auto* img = std::get_if<sensors::RangeImage>(&msg.body)) {
        std::printf("%ux%u valid=%zu\n", img->width, img->height, img->valid_pixels());
    } else if (const auto* ci = std::get_if<bridge::CameraInfo>(&msg.body)) {
        std::printf("fx=%.2f fy=%.2f cx=%.1f cy=%.1f\n", ci->fx, ci->fy, ci->cx, ci->cy);
    } else if (const auto* imu = std::get_if<sensors::InertialReading>(&msg.body)) {
        std::printf("a=(%.3f %.3f %.3f) w=(%.4f %.4f %.4f) n=%u\n",
                    imu->accel_mps2.x, imu->accel_mps2.y, imu->accel_mps2.z,
                    imu->gyro_rps.x, imu->gyro_rps.y, imu->gyro_rps.z, imu->integrated_updates);
    } else if (const auto* od = std::get_if<sensors::PoseVelocityReading>(&msg.body)) {
        std::printf("p=(%.3f %.3f %.3f) v=(%.3f %.3f %.3f)\n",
                    od->position_m.x, od->position_m.y, od->position_m.z,
                    od->velocity_mps.x, od->velocity_mps.y, od->velocity_mps.z);
    } else if (const auto* clk = std::get_if<bridge::ClockTick>(&msg.body)) {
        std::printf("sim_time=%.4f\n", clk->t_s);
    } else if (const auto* tf = std::get_if<bridge::TransformList>(&msg.body)) {
        std::printf("%zu transforms\n", tf->size());
    } else {
        std::printf("\n");
    }
}

int main(int argc, char** argv) {
    utils::set_level(utils::LogLevel::Info);

    const char* ifname = (argc > 1) ? argv[1] : "vcan0";

    // Flags:
    //   --filter=0x200,0x210  (optional SocketCAN filter)
    //   --quiet               (only print a count every 100 messages)
    std::vector<uint32_t> filter_ids;
    bool quiet = false;
    for (int i = 2; i < argc; ++i) {
        std::string a = argv[i];
        if (a.rfind("--filter=", 0) == 0) {
            filter_ids = parse_id_list(a.substr(std::string("--filter=").size()));
        } else if (a == "--quiet") {
            quiet = true;
        }
    }

    bridge::SocketCanTransport iface(ifname);
    if (!iface.open()) {
        LOG_ERROR("Failed to open SocketCAN iface: %s", ifname);
        return 1;
    }

    if (!filter_ids.empty()) {
        if (!iface.set_filters(filter_ids)) {
            LOG_ERROR("Failed to set CAN filters");
            return 1;
        }
        LOG_INFO("Filter enabled (%zu IDs)", filter_ids.size());
    }

    LOG_INFO("Listening on %s", ifname);

    bridge::CanReassembler reasm;
    uint64_t messages = 0;
    uint64_t decode_errors = 0;

    while (true) {
        bridge::CanFrame frame;
        if (!iface.read_frame_timeout(frame, 1000)) continue;

        std::vector<uint8_t> bytes;
        if (!reasm.feed(frame, bytes)) continue;

        bridge::WireMessage msg;
        if (!bridge::WireCodec::decode(bytes, msg)) {
            ++decode_errors;
            LOG_WARN("Undecodable message on 0x%03X (%zu bytes)", frame.id, bytes.size());
            continue;
        }

        ++messages;
        if (!quiet) {
            print_message(msg, bytes.size());
        } else if (messages % 100 == 0) {
            LOG_INFO("%llu messages (%zu partial discarded, %llu undecodable)",
                     static_cast<unsigned long long>(messages), reasm.discarded(),
                     static_cast<unsigned long long>(decode_errors));
        }
    }

    return 0;
}
