// src/bridge/transport_bridge.hpp
#pragma once

#include "bridge/channel_scheduler.hpp"
#include "bridge/channel_spec.hpp"
#include "bridge/transform_tree.hpp"
#include "bridge/transport.hpp"
#include "bridge/wire_codec.hpp"
#include "sensors/sensor_spec.hpp"
#include "sim/observation.hpp"

#include <chrono>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace bridge {

enum class BridgeState : uint8_t {
    Uninitialized = 0,
    Bridging,
    ShuttingDown,
    Closed
};

inline const char* to_string(BridgeState s) {
    switch (s) {
        case BridgeState::Uninitialized: return "uninitialized";
        case BridgeState::Bridging:      return "bridging";
        case BridgeState::ShuttingDown:  return "shutting_down";
        case BridgeState::Closed:        return "closed";
    }
    return "unknown";
}

// Degradation counters. Never reset for the bridge's lifetime.
struct BridgeStats {
    uint64_t published = 0;            // New messages produced
    uint64_t delivered = 0;            // Accepted by the transport (incl. retransmits)
    uint64_t best_effort_drops = 0;
    uint64_t reliable_buffered = 0;    // Reliable messages queued for retransmit
    uint64_t retransmitted = 0;        // Queued messages later accepted
    uint64_t evicted = 0;              // Dropped from a full history
    uint64_t publish_timeouts = 0;     // Timed out, or skipped once the step's budget ran out
    uint64_t deferred = 0;             // Skipped without a transport call (budget spent)
    uint64_t publish_failures = 0;     // Hard transport errors
    uint64_t drain_discards = 0;
    bool degraded = false;             // Running as a no-op publisher
};

struct BridgeConfig {
    std::chrono::milliseconds publish_timeout{50};   // Budget for one whole publish() call
    std::chrono::milliseconds drain_timeout{100};
};

/**
 * TransportBridge - Observation snapshots -> wire messages on named channels
 *
 * State machine:
 *   Uninitialized --setup()--> Bridging --close()--> ShuttingDown --> Closed
 *
 * Per publish():
 *   1. Flush pending retransmissions on every reliable channel (in order)
 *   2. For each channel due at the snapshot time:
 *        sensor-backed -> publish the sample if valid and new
 *        clock         -> snapshot time
 *        transforms    -> world->body + body->mounts
 *   3. reliable:    undelivered messages are kept up to qos.depth
 *      best-effort: one attempt, drops counted
 *
 * All transport calls of one publish() share a single publish_timeout
 * budget. Once it is spent, the remaining channels are not attempted this
 * step: reliable messages are buffered, best-effort ones dropped.
 *
 * If the transport is missing or cannot be opened, setup() succeeds and the
 * bridge runs as a no-op publisher (stats.degraded).
 */
class TransportBridge {
public:
    // transport may be null (no middleware configured)
    explicit TransportBridge(std::unique_ptr<Transport> transport,
                             const BridgeConfig& cfg = BridgeConfig{});
    ~TransportBridge();

    TransportBridge(const TransportBridge&) = delete;
    TransportBridge& operator=(const TransportBridge&) = delete;

    /**
     * Validate and advertise channels, open the transport.
     *
     * @param sensors     enabled sensor name -> kind
     * @param tf_rate_hz  cadence forced on transform_tree channels (0 = keep)
     * @throws sim::SequencingError unless Uninitialized
     * @throws sim::ConfigurationError on invalid channel specs
     */
    void setup(const std::vector<ChannelSpec>& channels,
               const std::map<std::string, sensors::SensorKind>& sensors,
               double tf_rate_hz = 0.0);

    /**
     * @throws sim::SequencingError unless Bridging
     */
    void publish(const sim::ObservationSnapshot& snapshot, const TransformTree& tree);

    /**
     * Retry pending reliable messages until none remain or `timeout`
     * expires; the rest are discarded.
     * @return number of discarded messages
     */
    size_t drain(std::chrono::milliseconds timeout);

    // Restart channel cadence and sample tracking (episode reset)
    void reset_schedule();

    // Idempotent
    void close();

    BridgeState state() const { return state_; }
    const BridgeStats& stats() const { return stats_; }
    const BridgeConfig& config() const { return cfg_; }
    const std::vector<ChannelSpec>& channels() const { return channels_; }
    bool noop() const { return noop_; }

    size_t pending(const std::string& channel) const;
    size_t pending_total() const;

    // Next sequence number to be assigned on `channel`
    uint64_t next_seq(const std::string& channel) const;

private:
    enum class Degradation : uint8_t {
        Unavailable,
        Timeout,
        Eviction,
        Failure,
        DrainDiscard
    };

    using Clock = std::chrono::steady_clock;

    // Wall-time allowance shared by consecutive transport calls
    struct Budget {
        Clock::time_point deadline;
        std::chrono::milliseconds total;

        static Budget start(std::chrono::milliseconds total) {
            return Budget{Clock::now() + total, total};
        }

        // Wait allowed for the next call; false once a non-zero budget is spent.
        // A zero budget allows any number of non-blocking attempts.
        bool next(std::chrono::milliseconds& wait) const;
    };

    struct ChannelRuntime {
        uint64_t seq = 0;
        uint64_t last_update = 0;      // update_count of the last published sample
        std::deque<std::vector<uint8_t>> pending;
    };

    void validate(const std::vector<ChannelSpec>& channels,
                  const std::map<std::string, sensors::SensorKind>& sensors) const;

    // Build the message for channel i; false if there is nothing to send
    bool build(size_t i, const sim::ObservationSnapshot& snapshot,
               const TransformTree& tree, WireMessage& out);

    void send(size_t i, std::vector<uint8_t> bytes, const Budget& budget);

    // Deliver queued messages in order, stop at the first refusal or when
    // the budget is spent. Returns the number delivered.
    size_t flush_pending(size_t i, const Budget& budget);

    void buffer(size_t i, std::vector<uint8_t> bytes);
    void note_failure(size_t i, PublishStatus st);
    void warn_once(Degradation cls, const std::string& channel, const char* detail);

    std::unique_ptr<Transport> transport_;
    BridgeConfig cfg_;
    BridgeState state_ = BridgeState::Uninitialized;
    BridgeStats stats_;
    bool noop_ = false;

    std::vector<ChannelSpec> channels_;
    std::vector<ChannelRuntime> runtime_;
    ChannelScheduler scheduler_;
    std::set<std::pair<Degradation, std::string>> warned_;
};

} // namespace bridge
