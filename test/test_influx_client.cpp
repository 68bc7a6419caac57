// test/test_influx_client.cpp
// Unit tests for InfluxDB telemetry client

#include "utils/influx.hpp"
#include "utils/logging.hpp"
#include <iostream>
#include <string>

// Test helper macros
#define TEST_ASSERT(condition, message) \
    do { \
        if (!(condition)) { \
            std::cerr << "FAILED: " << message << std::endl; \
            std::cerr << "  at " << __FILE__ << ":" << __LINE__ << std::endl; \
            return false; \
        } \
    } while (0)

#define RUN_TEST(test_func) \
    do { \
        std::cout << "Running " << #test_func << "... "; \
        if (test_func()) { \
            std::cout << "PASSED" << std::endl; \
            passed++; \
        } else { \
            std::cout << "FAILED" << std::endl; \
            failed++; \
        } \
        total++; \
    } while (0)

static bool contains(const std::string& s, const std::string& needle) {
    return s.find(needle) != std::string::npos;
}

// Helper to create a snapshot with one sensor of each kind
sim::ObservationSnapshot create_test_snapshot() {
    sim::ObservationSnapshot snap;
    snap.t_s = 1.5;

    sensors::SensorSample depth;
    depth.name = "depth";
    depth.kind = sensors::SensorKind::RangeImage;
    depth.t_s = 1.5;
    depth.valid = true;
    depth.valid_since_reset = true;
    depth.update_count = 30;
    sensors::RangeImage img;
    img.width = 2;
    img.height = 2;
    img.depth_m = {1.0f, 0.0f, 2.0f, 3.0f};
    img.valid_mask = {1, 0, 1, 1};
    depth.payload = img;
    snap.samples.emplace(depth.name, depth);

    sensors::SensorSample imu;
    imu.name = "imu";
    imu.kind = sensors::SensorKind::Inertial;
    imu.t_s = 1.5;
    imu.valid = true;
    imu.valid_since_reset = true;
    imu.update_count = 30;
    sensors::InertialReading r;
    r.accel_mps2 = {0.1, 0.2, 9.81};
    r.gyro_rps = {0.01, 0.02, 0.03};
    r.integrated_updates = 5;
    imu.payload = r;
    snap.samples.emplace(imu.name, imu);

    sensors::SensorSample odom;
    odom.name = "odom";
    odom.kind = sensors::SensorKind::PoseVelocity;
    odom.payload = sensors::PoseVelocityReading{};
    snap.samples.emplace(odom.name, odom);

    return snap;
}

// ============================================================================
// Test Cases
// ============================================================================

// Test 1: Client creation with disabled config
bool test_client_creation_disabled() {
    utils::InfluxClient::Config config;
    config.enabled = false;

    utils::InfluxClient client(config);

    TEST_ASSERT(!client.is_enabled(), "Client should be disabled");
    TEST_ASSERT(client.writes_ok() == 0, "No writes yet");

    return true;
}

// Test 2: Client creation with enabled config (no actual connection)
bool test_client_creation_enabled() {
    utils::InfluxClient::Config config;
    config.enabled = true;
    config.url = "http://localhost:8086";
    config.org = "test-org";
    config.bucket = "test-bucket";
    config.write_interval_s = 0.1;

    utils::InfluxClient client(config);

    TEST_ASSERT(client.is_enabled(), "Client should be enabled");
    TEST_ASSERT(client.get_config().bucket == "test-bucket", "Config should be kept");

    return true;
}

// Test 3: Write with disabled client (should not write)
bool test_write_disabled_client() {
    utils::InfluxClient::Config config;
    config.enabled = false;

    utils::InfluxClient client(config);

    bool result = client.write_snapshot(create_test_snapshot(), bridge::BridgeStats{}, 0.0);

    TEST_ASSERT(!result, "Write should return false for disabled client");
    TEST_ASSERT(client.writes_ok() == 0, "Disabled client never writes");

    return true;
}

// Test 4: Unreachable server fails cleanly
bool test_unreachable_server() {
    utils::InfluxClient::Config config;
    config.enabled = true;
    config.url = "http://127.0.0.1:1";   // Nothing listens here
    config.token = "fake-token";
    config.write_interval_s = 1.0;

    utils::InfluxClient client(config);

    bool result = client.write_snapshot(create_test_snapshot(), bridge::BridgeStats{}, 0.0);
    TEST_ASSERT(!result, "Write to an unreachable server should fail");

    // Within the interval: skipped without another attempt
    result = client.write_snapshot(create_test_snapshot(), bridge::BridgeStats{}, 0.5);
    TEST_ASSERT(!result, "Write should be skipped due to rate limiting");
    TEST_ASSERT(client.writes_ok() == 0, "No successful writes");

    return true;
}

// Test 5: Config defaults
bool test_config_defaults() {
    utils::InfluxClient::Config config;

    TEST_ASSERT(config.url == "http://localhost:8086", "Default URL should be localhost:8086");
    TEST_ASSERT(config.org == "rapid", "Default org should be 'rapid'");
    TEST_ASSERT(config.bucket == "rapid_sim", "Default bucket should be 'rapid_sim'");
    TEST_ASSERT(config.write_interval_s == 0.25, "Default interval should be 0.25s");
    TEST_ASSERT(!config.enabled, "Default should be disabled");

    return true;
}

// Test 6: Sensor line protocol
bool test_sensor_lines() {
    const auto snap = create_test_snapshot();

    const std::string depth = utils::InfluxClient::build_sensor_line(*snap.find("depth"), 123);
    TEST_ASSERT(contains(depth, "sensor_samples,name=depth,kind=range_image "), "Depth measurement and tags");
    TEST_ASSERT(contains(depth, "valid=true"), "Depth validity field");
    TEST_ASSERT(contains(depth, "update_count=30i"), "Integer update count");
    TEST_ASSERT(contains(depth, "valid_pixels=3i"), "Valid pixel count");
    TEST_ASSERT(depth.size() > 4 && depth.substr(depth.size() - 4) == " 123", "Timestamp last");

    const std::string imu = utils::InfluxClient::build_sensor_line(*snap.find("imu"), 123);
    TEST_ASSERT(contains(imu, "kind=inertial"), "IMU kind tag");
    TEST_ASSERT(contains(imu, "az_mps2=9.81"), "IMU accel field");
    TEST_ASSERT(contains(imu, "integrated_updates=5i"), "IMU collapse count");

    const std::string odom = utils::InfluxClient::build_sensor_line(*snap.find("odom"), 123);
    TEST_ASSERT(contains(odom, "valid=false"), "Odom invalid before first update");
    TEST_ASSERT(contains(odom, "vx_mps="), "Odom velocity field");

    return true;
}

// Test 7: Bridge and environment lines
bool test_bridge_and_environment_lines() {
    bridge::BridgeStats st;
    st.published = 10;
    st.best_effort_drops = 2;
    st.degraded = true;

    const std::string b = utils::InfluxClient::build_bridge_line(st, 7);
    TEST_ASSERT(contains(b, "bridge_stats published=10i"), "Bridge measurement");
    TEST_ASSERT(contains(b, "best_effort_drops=2i"), "Drop counter");
    TEST_ASSERT(contains(b, "degraded=true"), "Degraded flag");

    const std::string e = utils::InfluxClient::build_environment_line(create_test_snapshot(), 7);
    TEST_ASSERT(contains(e, "environment sim_time_s=1.5"), "Environment measurement");
    TEST_ASSERT(contains(e, "sensors=3i"), "Sensor count");
    TEST_ASSERT(contains(e, "valid_sensors=2i"), "Valid sensor count");
    TEST_ASSERT(contains(e, "complete=false"), "Incomplete while odom never updated");

    return true;
}

// Test 8: Tag escaping
bool test_tag_escaping() {
    TEST_ASSERT(utils::InfluxClient::escape_tag("front cam") == "front\\ cam", "Space escaped");
    TEST_ASSERT(utils::InfluxClient::escape_tag("a,b=c") == "a\\,b\\=c", "Comma and equals escaped");
    TEST_ASSERT(utils::InfluxClient::escape_tag("imu") == "imu", "Plain tag unchanged");

    return true;
}

// ============================================================================
// Main Test Runner
// ============================================================================

int main() {
    utils::set_level(utils::LogLevel::Error);

    std::cout << "========================================" << std::endl;
    std::cout << "InfluxDB Client Unit Tests" << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << std::endl;

    int total = 0;
    int passed = 0;
    int failed = 0;

    // Run all tests
    RUN_TEST(test_client_creation_disabled);
    RUN_TEST(test_client_creation_enabled);
    RUN_TEST(test_write_disabled_client);
    RUN_TEST(test_unreachable_server);
    RUN_TEST(test_config_defaults);
    RUN_TEST(test_sensor_lines);
    RUN_TEST(test_bridge_and_environment_lines);
    RUN_TEST(test_tag_escaping);

    // Print summary
    std::cout << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << "Test Summary" << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << "Total:  " << total << std::endl;
    std::cout << "Passed: " << passed << std::endl;
    std::cout << "Failed: " << failed << std::endl;
    std::cout << "========================================" << std::endl;

    if (failed == 0) {
        std::cout << "✓ All tests passed!" << std::endl;
        return 0;
    } else {
        std::cout << "✗ Some tests failed!" << std::endl;
        return 1;
    }
}
