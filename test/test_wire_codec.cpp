// test/test_wire_codec.cpp
/**
 * Unit Test: WireCodec and CAN segmentation
 *
 * Test Coverage:
 *   1. Sim stamp split into sec/nsec
 *   2. Range image and transform list survive encode/decode
 *   3. Malformed input rejected
 *   4. Body/schema mismatch refused at encode
 *   5. CAN segmentation: frame layout and reassembly
 *   6. CAN reassembly: lost segment and interleaved ids
 */

#include "bridge/can_segmenter.hpp"
#include "bridge/wire_codec.hpp"
#include "test_harness.hpp"

#include <algorithm>
#include <stdexcept>
#include <vector>

namespace {

bridge::WireMessage make_image_message() {
    sensors::RangeImage img;
    img.width = 3;
    img.height = 2;
    img.fx = img.fy = 1.5;
    img.cx = 1.5;
    img.cy = 1.0;
    img.depth_m = {1.0f, 2.5f, 0.0f, 4.25f, 0.0f, 29.9f};
    img.valid_mask = {1, 1, 0, 1, 0, 1};

    bridge::WireMessage msg;
    msg.header.channel = "/camera/depth";
    msg.header.seq = 41;
    msg.header.stamp = bridge::SimStamp::from_seconds(1.25);
    msg.header.frame_id = "depth_camera";
    msg.header.schema = bridge::Schema::RangeImage;
    msg.body = img;
    return msg;
}

} // namespace

// Test 1: Stamps
void test_stamp_split(TestResult& result) {
    std::cout << "\n=== Test 1: Stamp Split ===\n";

    const auto s = bridge::SimStamp::from_seconds(12.345);
    result.check(s.sec == 12, "Whole seconds in sec");
    result.check(s.nsec == 345000000u, "Fraction in nsec: " + std::to_string(s.nsec));
    result.check(is_close(s.to_seconds(), 12.345, 1e-12), "to_seconds inverts from_seconds");

    const auto z = bridge::SimStamp::from_seconds(0.0);
    result.check(z.sec == 0 && z.nsec == 0, "t = 0 encodes as 0/0");

    const auto edge = bridge::SimStamp::from_seconds(2.9999999999);
    result.check(edge.sec == 3 && edge.nsec == 0, "Rounding up carries into sec");
}

// Test 2: Payload round trip
void test_payload_round_trip(TestResult& result) {
    std::cout << "\n=== Test 2: Payload Round Trip ===\n";

    {
        const auto msg = make_image_message();
        const auto bytes = bridge::WireCodec::encode(msg);

        bridge::WireMessage out;
        if (!bridge::WireCodec::decode(bytes, out)) {
            result.fail("Range image failed to decode");
        } else {
            result.check(out.header.channel == "/camera/depth" && out.header.seq == 41 &&
                         out.header.frame_id == "depth_camera" &&
                         out.header.stamp == msg.header.stamp,
                         "Header fields preserved");
            const auto* img = std::get_if<sensors::RangeImage>(&out.body);
            result.check(img && *img == std::get<sensors::RangeImage>(msg.body),
                         "Depth values and valid mask preserved");
        }
    }

    {
        bridge::TransformTree tree;
        tree.add_static("depth_camera", {{0.1, 0.0, 0.0}, world::Quat::identity()});
        tree.add_static("imu_link", {{0.0, 0.0, 0.05}, world::Quat::from_yaw(0.3)});
        tree.update_dynamic({{1.0, 2.0, 3.0}, world::Quat::from_yaw(1.0)});

        bridge::WireMessage msg;
        msg.header.channel = "/tf";
        msg.header.schema = bridge::Schema::TransformTree;
        msg.header.frame_id = "world";
        msg.body = tree.transforms();

        bridge::WireMessage out;
        const bool ok = bridge::WireCodec::decode(bridge::WireCodec::encode(msg), out);
        const auto* tfs = std::get_if<bridge::TransformList>(&out.body);
        result.check(ok && tfs && tfs->size() == 3, "Transform list decodes with 3 entries");
        if (tfs && tfs->size() == 3) {
            result.check((*tfs)[0].parent == "world" && (*tfs)[0].child == "base_link",
                         "Dynamic world -> base_link first");
            result.check((*tfs)[2].child == "imu_link" && (*tfs)[2] == tree.transforms()[2],
                         "Static transforms preserved in order");
        }
    }

    {
        sensors::RangeImage img;
        img.width = 64;
        img.height = 48;
        img.fx = img.fy = 32.0;
        img.cx = 32.0;
        img.cy = 24.0;
        const auto ci = bridge::WireCodec::camera_info_from(img);
        result.check(ci.width == 64 && ci.height == 48 && ci.fx == 32.0 && ci.cy == 24.0,
                     "camera_info_from copies intrinsics");
    }
}

// Test 3: Malformed input
void test_malformed_input(TestResult& result) {
    std::cout << "\n=== Test 3: Malformed Input ===\n";

    const auto bytes = bridge::WireCodec::encode(make_image_message());
    bridge::WireMessage out;

    std::vector<uint8_t> truncated(bytes.begin(), bytes.end() - 3);
    result.check(!bridge::WireCodec::decode(truncated, out), "Truncated message rejected");

    std::vector<uint8_t> bad_magic = bytes;
    bad_magic[0] = 'X';
    result.check(!bridge::WireCodec::decode(bad_magic, out), "Bad magic rejected");

    std::vector<uint8_t> bad_version = bytes;
    bad_version[2] = bridge::WireCodec::kVersion + 1;
    result.check(!bridge::WireCodec::decode(bad_version, out), "Unknown version rejected");

    std::vector<uint8_t> bad_schema = bytes;
    bad_schema[3] = 0x7F;
    result.check(!bridge::WireCodec::decode(bad_schema, out), "Unknown schema rejected");

    std::vector<uint8_t> trailing = bytes;
    trailing.push_back(0);
    result.check(!bridge::WireCodec::decode(trailing, out), "Trailing bytes rejected");

    result.check(!bridge::WireCodec::decode(std::vector<uint8_t>{}, out), "Empty buffer rejected");
}

// Test 4: Schema mismatch
void test_schema_mismatch(TestResult& result) {
    std::cout << "\n=== Test 4: Schema Mismatch ===\n";

    bridge::WireMessage msg;
    msg.header.channel = "/clock";
    msg.header.schema = bridge::Schema::Imu;
    msg.body = bridge::ClockTick{1.0};

    expect_throw<std::invalid_argument>(result, [&] { bridge::WireCodec::encode(msg); },
                                        "Clock body on an imu header refused");
}

// Test 5: Segmentation
void test_can_segmentation(TestResult& result) {
    std::cout << "\n=== Test 5: CAN Segmentation ===\n";

    std::vector<uint8_t> payload(23);
    for (size_t i = 0; i < payload.size(); ++i) payload[i] = static_cast<uint8_t>(i * 7);

    std::vector<bridge::CanFrame> frames;
    const bool ok = bridge::CanSegmenter::segment(0x210, 9, payload, frames);

    result.check(ok, "23-byte payload segmented");
    result.check(frames.size() == bridge::CanSegmenter::frame_count(23) && frames.size() == 6,
                 "1 header + 5 data frames");
    result.check(frames[0].dlc == 7 && frames[0].data[0] == 9 && frames[0].data[3] == 23,
                 "Header carries counter and total length");
    result.check(frames.back().dlc == 3 + 3, "Last frame carries the 3-byte remainder");

    bool ids_ok = true;
    for (const auto& f : frames) ids_ok = ids_ok && f.id == 0x210;
    result.check(ids_ok, "Every frame on the channel's CAN id");

    bridge::CanReassembler reasm;
    std::vector<uint8_t> out;
    size_t completed = 0;
    for (const auto& f : frames) {
        if (reasm.feed(f, out)) ++completed;
    }
    result.check(completed == 1 && out == payload, "Reassembled payload matches");

    std::vector<uint8_t> empty;
    bridge::CanSegmenter::segment(0x100, 0, empty, frames);
    out.assign(1, 0xFF);
    result.check(frames.size() == 1 && reasm.feed(frames[0], out) && out.empty(),
                 "Empty payload is a lone header frame");

    std::vector<uint8_t> huge(bridge::CanSegmenter::kMaxPayload + 1);
    result.check(!bridge::CanSegmenter::segment(0x200, 0, huge, frames) && frames.empty(),
                 "Payload beyond the segment index range refused");
}

// Test 6: Lost and interleaved frames
void test_can_reassembly_faults(TestResult& result) {
    std::cout << "\n=== Test 6: CAN Reassembly Faults ===\n";

    const auto bytes_a = bridge::WireCodec::encode(make_image_message());

    bridge::WireMessage clk;
    clk.header.channel = "/clock";
    clk.header.schema = bridge::Schema::Clock;
    clk.body = bridge::ClockTick{0.5};
    const auto bytes_b = bridge::WireCodec::encode(clk);

    std::vector<bridge::CanFrame> fa;
    std::vector<bridge::CanFrame> fb;
    bridge::CanSegmenter::segment(0x200, 1, bytes_a, fa);
    bridge::CanSegmenter::segment(0x100, 1, bytes_b, fb);

    {
        // Interleave two channels frame by frame
        bridge::CanReassembler reasm;
        std::vector<std::vector<uint8_t>> done;
        std::vector<uint8_t> out;
        const size_t n = std::max(fa.size(), fb.size());
        for (size_t i = 0; i < n; ++i) {
            if (i < fa.size() && reasm.feed(fa[i], out)) done.push_back(out);
            if (i < fb.size() && reasm.feed(fb[i], out)) done.push_back(out);
        }
        result.check(done.size() == 2, "Both interleaved messages complete");
        bridge::WireMessage m;
        bool decoded = true;
        for (const auto& d : done) decoded = decoded && bridge::WireCodec::decode(d, m);
        result.check(decoded, "Both reassembled messages decode");
    }

    {
        // Drop a middle segment, then send the next message intact
        bridge::CanReassembler reasm;
        std::vector<uint8_t> out;
        size_t completed = 0;
        for (size_t i = 0; i < fa.size(); ++i) {
            if (i == 2) continue;
            if (reasm.feed(fa[i], out)) ++completed;
        }
        result.check(completed == 0, "Message with a lost segment never completes");
        result.check(reasm.discarded() == 1, "Partial message counted as discarded");

        std::vector<bridge::CanFrame> again;
        bridge::CanSegmenter::segment(0x200, 2, bytes_a, again);
        for (const auto& f : again) {
            if (reasm.feed(f, out)) ++completed;
        }
        result.check(completed == 1 && out == bytes_a, "Next message reassembles after the loss");
    }
}

int main() {
    print_title("WireCodec / CAN Segmentation Unit Tests");

    TestResult result;

    test_stamp_split(result);
    test_payload_round_trip(result);
    test_malformed_input(result);
    test_schema_mismatch(result);
    test_can_segmentation(result);
    test_can_reassembly_faults(result);

    result.summary();

    return (result.failed == 0) ? 0 : 1;
}
