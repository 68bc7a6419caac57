// utils/influx.cpp
#include "influx.hpp"
#include "logging.hpp"
#include <curl/curl.h>
#include <chrono>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <variant>

namespace utils {

// ============================================================================
// Private Implementation (Pimpl)
// ============================================================================

struct InfluxClient::Impl {
    CURL* curl = nullptr;
    struct curl_slist* headers = nullptr;
    std::string write_url;
    std::string auth_header;

    Impl() {
        curl = curl_easy_init();
        if (!curl) {
            throw std::runtime_error("Failed to initialize libcurl");
        }
    }

    ~Impl() {
        if (headers) {
            curl_slist_free_all(headers);
        }
        if (curl) {
            curl_easy_cleanup(curl);
        }
    }
};

static size_t discard_body(void* contents, size_t size, size_t nmemb, void* userp) {
    (void)contents;
    (void)userp;
    return size * nmemb;
}

// ============================================================================
// Constructor / Destructor
// ============================================================================

InfluxClient::InfluxClient(const Config& config)
    : config_(config)
    , last_write_time_(-std::numeric_limits<double>::infinity())
{
    if (!config_.enabled) {
        LOG_DEBUG("[InfluxDB] Client disabled");
        return;
    }

    impl_ = std::make_unique<Impl>();

    // http://host:8086/api/v2/write?org=...&bucket=...&precision=ns
    std::ostringstream url_builder;
    url_builder << config_.url << "/api/v2/write"
                << "?org=" << config_.org
                << "&bucket=" << config_.bucket
                << "&precision=ns";
    impl_->write_url = url_builder.str();

    impl_->headers = curl_slist_append(impl_->headers, "Content-Type: text/plain; charset=utf-8");
    if (!config_.token.empty()) {
        impl_->auth_header = "Authorization: Token " + config_.token;
        impl_->headers = curl_slist_append(impl_->headers, impl_->auth_header.c_str());
    } else {
        LOG_WARN("[InfluxDB] No authentication token provided - writes may fail!");
    }

    curl_easy_setopt(impl_->curl, CURLOPT_URL, impl_->write_url.c_str());
    curl_easy_setopt(impl_->curl, CURLOPT_HTTPHEADER, impl_->headers);
    curl_easy_setopt(impl_->curl, CURLOPT_WRITEFUNCTION, discard_body);
    curl_easy_setopt(impl_->curl, CURLOPT_TIMEOUT_MS, 500L);

    LOG_INFO("[InfluxDB] Client initialized: url=%s org=%s bucket=%s interval=%.0fms (sim time)",
             config_.url.c_str(), config_.org.c_str(), config_.bucket.c_str(),
             config_.write_interval_s * 1000.0);
}

InfluxClient::~InfluxClient() {
    if (config_.enabled) {
        LOG_INFO("[InfluxDB] Client shutdown (%zu writes)", writes_ok_);
    }
}

// ============================================================================
// Public Interface
// ============================================================================

bool InfluxClient::write_snapshot(const sim::ObservationSnapshot& snapshot,
                                  const bridge::BridgeStats& stats,
                                  double sim_time)
{
    if (!config_.enabled) {
        return false;
    }

    if (sim_time < last_write_time_) {
        last_write_time_ = -std::numeric_limits<double>::infinity();
    }
    if ((sim_time - last_write_time_) < config_.write_interval_s) {
        return false;
    }
    last_write_time_ = sim_time;

    const int64_t ts = wall_clock_time_ns();

    std::ostringstream lp;
    lp << build_environment_line(snapshot, ts) << "\n";
    for (const auto& [name, sample] : snapshot.samples) {
        (void)name;
        lp << build_sensor_line(sample, ts) << "\n";
    }
    lp << build_bridge_line(stats, ts) << "\n";

    return send_to_influx(lp.str());
}

// ============================================================================
// Line Protocol Builders
// ============================================================================

std::string InfluxClient::escape_tag(const std::string& v) {
    std::string out;
    out.reserve(v.size());
    for (char c : v) {
        if (c == ',' || c == '=' || c == ' ') out.push_back('\\');
        out.push_back(c);
    }
    return out;
}

std::string InfluxClient::build_sensor_line(const sensors::SensorSample& s, int64_t timestamp_ns) {
    std::ostringstream line;

    line << "sensor_samples"
         << ",name=" << escape_tag(s.name)
         << ",kind=" << sensors::to_string(s.kind);

    line << " "
         << "valid=" << (s.valid ? "true" : "false") << ","
         << "update_count=" << s.update_count << "i,"
         << "t_s=" << s.t_s;

    if (const auto* img = std::get_if<sensors::RangeImage>(&s.payload)) {
        line << ",valid_pixels=" << img->valid_pixels() << "i";
    } else if (const auto* imu = std::get_if<sensors::InertialReading>(&s.payload)) {
        line << ",ax_mps2=" << imu->accel_mps2.x
             << ",ay_mps2=" << imu->accel_mps2.y
             << ",az_mps2=" << imu->accel_mps2.z
             << ",gx_rps=" << imu->gyro_rps.x
             << ",gy_rps=" << imu->gyro_rps.y
             << ",gz_rps=" << imu->gyro_rps.z
             << ",integrated_updates=" << imu->integrated_updates << "i";
    } else if (const auto* pv = std::get_if<sensors::PoseVelocityReading>(&s.payload)) {
        line << ",x_m=" << pv->position_m.x
             << ",y_m=" << pv->position_m.y
             << ",z_m=" << pv->position_m.z
             << ",vx_mps=" << pv->velocity_mps.x
             << ",vy_mps=" << pv->velocity_mps.y
             << ",vz_mps=" << pv->velocity_mps.z;
    }

    line << " " << timestamp_ns;
    return line.str();
}

std::string InfluxClient::build_bridge_line(const bridge::BridgeStats& st, int64_t timestamp_ns) {
    std::ostringstream line;

    line << "bridge_stats";
    line << " "
         << "published=" << st.published << "i,"
         << "delivered=" << st.delivered << "i,"
         << "best_effort_drops=" << st.best_effort_drops << "i,"
         << "reliable_buffered=" << st.reliable_buffered << "i,"
         << "retransmitted=" << st.retransmitted << "i,"
         << "evicted=" << st.evicted << "i,"
         << "publish_timeouts=" << st.publish_timeouts << "i,"
         << "deferred=" << st.deferred << "i,"
         << "publish_failures=" << st.publish_failures << "i,"
         << "drain_discards=" << st.drain_discards << "i,"
         << "degraded=" << (st.degraded ? "true" : "false");

    line << " " << timestamp_ns;
    return line.str();
}

std::string InfluxClient::build_environment_line(const sim::ObservationSnapshot& snap, int64_t timestamp_ns) {
    std::ostringstream line;

    line << "environment";
    line << " "
         << "sim_time_s=" << snap.t_s << ","
         << "sensors=" << snap.samples.size() << "i,"
         << "valid_sensors=" << snap.valid_count() << "i,"
         << "complete=" << (snap.complete() ? "true" : "false");

    line << " " << timestamp_ns;
    return line.str();
}

// ============================================================================
// HTTP
// ============================================================================

bool InfluxClient::send_to_influx(const std::string& line_protocol) {
    curl_easy_setopt(impl_->curl, CURLOPT_POSTFIELDS, line_protocol.c_str());
    curl_easy_setopt(impl_->curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(line_protocol.size()));

    CURLcode res = curl_easy_perform(impl_->curl);
    if (res != CURLE_OK) {
        LOG_ERROR("[InfluxDB] Write failed: CURL error: %s", curl_easy_strerror(res));
        return false;
    }

    long http_code = 0;
    curl_easy_getinfo(impl_->curl, CURLINFO_RESPONSE_CODE, &http_code);
    if (http_code != 204) {  // 204 No Content on success
        LOG_ERROR("[InfluxDB] Write failed: HTTP %ld (expected 204)", http_code);
        return false;
    }

    writes_ok_++;
    if (writes_ok_ == 1) {
        LOG_INFO("[InfluxDB] First write successful");
    } else if (writes_ok_ % 100 == 0) {
        LOG_DEBUG("[InfluxDB] %zu writes", writes_ok_);
    }
    return true;
}

int64_t InfluxClient::wall_clock_time_ns() {
    const auto now = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::nanoseconds>(now).count();
}

} // namespace utils
