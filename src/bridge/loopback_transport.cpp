// src/bridge/loopback_transport.cpp
#include "bridge/loopback_transport.hpp"
#include "utils/logging.hpp"

#include <algorithm>
#include <thread>

namespace bridge {

bool LoopbackTransport::open() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (faults_.unavailable) {
        LOG_DEBUG("[Loopback] open() refused (unavailable)");
        open_ = false;
        return false;
    }
    open_ = true;
    return true;
}

void LoopbackTransport::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    open_ = false;
}

bool LoopbackTransport::is_open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return open_;
}

bool LoopbackTransport::advertise(const ChannelSpec& channel) {
    std::lock_guard<std::mutex> lock(mutex_);
    channels_[channel.name].qos = channel.qos;
    return true;
}

PublishStatus LoopbackTransport::publish(const ChannelSpec& channel,
                                         const std::vector<uint8_t>& bytes,
                                         std::chrono::milliseconds timeout) {
    std::vector<ReceiveCallback> targets;
    std::chrono::milliseconds stall{0};

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!open_) return PublishStatus::Failed;

        auto it = channels_.find(channel.name);
        if (it == channels_.end()) return PublishStatus::Failed;

        if (faults_.congested) return PublishStatus::WouldBlock;
        stall = faults_.stall;
    }

    // Blocked middleware: wait out the stall or the timeout, whichever first
    if (stall.count() > 0) {
        std::this_thread::sleep_for(std::min(stall, timeout));
        if (stall > timeout) return PublishStatus::Timeout;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& state = channels_[channel.name];

        if (state.qos.durability == Durability::Transient) {
            state.latched.push_back(bytes);
            while (state.latched.size() > std::max<uint32_t>(state.qos.depth, 1)) {
                state.latched.pop_front();
            }
        }

        for (const auto& [id, sub] : subscriptions_) {
            (void)id;
            if (sub.channel == channel.name) {
                targets.push_back(sub.callback);
            }
        }

        if (targets.empty() && state.qos.durability != Durability::Transient) {
            return PublishStatus::NoReceiver;
        }
        ++state.delivered;
    }

    for (const auto& cb : targets) {
        cb(channel.name, bytes);
    }
    return PublishStatus::Delivered;
}

int64_t LoopbackTransport::subscribe(const std::string& channel, ReceiveCallback callback) {
    int64_t id = 0;
    std::vector<std::vector<uint8_t>> replay;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        id = next_id_++;
        subscriptions_[id] = Subscription{id, channel, callback};

        auto it = channels_.find(channel);
        if (it != channels_.end() && it->second.qos.durability == Durability::Transient) {
            replay.assign(it->second.latched.begin(), it->second.latched.end());
        }
    }

    for (const auto& bytes : replay) {
        callback(channel, bytes);
    }
    return id;
}

bool LoopbackTransport::unsubscribe(int64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscriptions_.erase(id) > 0;
}

size_t LoopbackTransport::subscriber_count(const std::string& channel) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t n = 0;
    for (const auto& [id, sub] : subscriptions_) {
        (void)id;
        n += (sub.channel == channel) ? 1 : 0;
    }
    return n;
}

size_t LoopbackTransport::latched_count(const std::string& channel) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = channels_.find(channel);
    return it == channels_.end() ? 0 : it->second.latched.size();
}

uint64_t LoopbackTransport::delivered_count(const std::string& channel) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = channels_.find(channel);
    return it == channels_.end() ? 0 : it->second.delivered;
}

void LoopbackTransport::set_faults(const Faults& faults) {
    std::lock_guard<std::mutex> lock(mutex_);
    faults_ = faults;
}

LoopbackTransport::Faults LoopbackTransport::faults() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return faults_;
}

} // namespace bridge
