// src/bridge/socketcan_transport.cpp
#include "bridge/socketcan_transport.hpp"
#include "utils/logging.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <utility>

#include <fcntl.h>
#include <poll.h>
#include <linux/can.h>
#include <linux/can/raw.h>
#include <net/if.h>
#include <sys/ioctl.h>
#include <sys/socket.h>
#include <unistd.h>

namespace bridge {

SocketCanTransport::SocketCanTransport(std::string ifname)
    : ifname_(std::move(ifname))
{}

SocketCanTransport::~SocketCanTransport() {
    close();
}

bool SocketCanTransport::open() {
    close();

    sock_ = ::socket(PF_CAN, SOCK_RAW, CAN_RAW);
    if (sock_ < 0) {
        LOG_ERROR("[SocketCAN] socket() failed: %s", std::strerror(errno));
        return false;
    }

    struct ifreq ifr{};
    std::snprintf(ifr.ifr_name, IFNAMSIZ, "%s", ifname_.c_str());
    if (::ioctl(sock_, SIOCGIFINDEX, &ifr) < 0) {
        LOG_ERROR("[SocketCAN] ioctl(SIOCGIFINDEX) failed for %s: %s",
                  ifname_.c_str(), std::strerror(errno));
        close();
        return false;
    }

    struct sockaddr_can addr{};
    addr.can_family  = AF_CAN;
    addr.can_ifindex = ifr.ifr_ifindex;

    if (::bind(sock_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        LOG_ERROR("[SocketCAN] bind() failed: %s", std::strerror(errno));
        close();
        return false;
    }

    // Writes never block the simulation thread; publish() polls instead
    int flags = ::fcntl(sock_, F_GETFL, 0);
    if (flags < 0 || ::fcntl(sock_, F_SETFL, flags | O_NONBLOCK) < 0) {
        LOG_ERROR("[SocketCAN] fcntl(O_NONBLOCK) failed: %s", std::strerror(errno));
        close();
        return false;
    }

    LOG_INFO("[SocketCAN] Opened %s", ifname_.c_str());
    return true;
}

void SocketCanTransport::close() {
    if (sock_ >= 0) {
        ::close(sock_);
        sock_ = -1;
    }
}

bool SocketCanTransport::advertise(const ChannelSpec& channel) {
    if (channel.can_id == 0 || channel.can_id > CAN_SFF_MASK) {
        LOG_ERROR("[SocketCAN] Channel %s needs a can_id in [0x001, 0x7FF] (got 0x%X)",
                  channel.name.c_str(), channel.can_id);
        return false;
    }
    for (const auto& [name, id] : ids_) {
        if (id == channel.can_id && name != channel.name) {
            LOG_ERROR("[SocketCAN] can_id 0x%X used by both %s and %s",
                      channel.can_id, name.c_str(), channel.name.c_str());
            return false;
        }
    }
    ids_[channel.name] = channel.can_id;
    counters_[channel.name] = 0;
    return true;
}

PublishStatus SocketCanTransport::write_frame_until(const CanFrame& frame, Clock::time_point deadline) {
    struct can_frame cf{};
    cf.can_id = frame.id & CAN_SFF_MASK;
    cf.can_dlc = frame.dlc;
    std::memcpy(cf.data, frame.data, sizeof(cf.data));

    for (;;) {
        const ssize_t n = ::write(sock_, &cf, sizeof(cf));
        if (n == static_cast<ssize_t>(sizeof(cf))) {
            return PublishStatus::Delivered;
        }
        if (n >= 0) {
            LOG_ERROR("[SocketCAN] Short write: %zd bytes", n);
            return PublishStatus::Failed;
        }
        if (errno != EAGAIN && errno != EWOULDBLOCK && errno != ENOBUFS) {
            LOG_ERROR("[SocketCAN] write() failed: %s", std::strerror(errno));
            return PublishStatus::Failed;
        }

        // TX queue full: wait for room until the deadline
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - Clock::now()).count();
        if (remaining <= 0) {
            return PublishStatus::Timeout;
        }

        struct pollfd pfd;
        pfd.fd = sock_;
        pfd.events = POLLOUT;
        pfd.revents = 0;
        const int ret = ::poll(&pfd, 1, static_cast<int>(remaining));
        if (ret < 0 && errno != EINTR) {
            LOG_ERROR("[SocketCAN] poll() failed: %s", std::strerror(errno));
            return PublishStatus::Failed;
        }
        if (ret == 0) {
            return PublishStatus::Timeout;
        }
    }
}

PublishStatus SocketCanTransport::publish(const ChannelSpec& channel,
                                          const std::vector<uint8_t>& bytes,
                                          std::chrono::milliseconds timeout) {
    if (sock_ < 0) return PublishStatus::Failed;

    auto id_it = ids_.find(channel.name);
    if (id_it == ids_.end()) return PublishStatus::Failed;

    std::vector<CanFrame> frames;
    uint8_t& counter = counters_[channel.name];
    if (!CanSegmenter::segment(id_it->second, counter, bytes, frames)) {
        LOG_ERROR("[SocketCAN] %s: message of %zu bytes exceeds the segmentation limit",
                  channel.name.c_str(), bytes.size());
        return PublishStatus::Failed;
    }
    ++counter;

    const auto deadline = Clock::now() + timeout;
    for (const auto& f : frames) {
        const PublishStatus st = write_frame_until(f, deadline);
        if (st != PublishStatus::Delivered) {
            // Partial message on the bus; receivers drop it on the next segment 0
            return st;
        }
    }
    return PublishStatus::Delivered;
}

bool SocketCanTransport::read_frame_timeout(CanFrame& out, int timeout_ms) {
    if (sock_ < 0) return false;

    struct pollfd pfd;
    pfd.fd = sock_;
    pfd.events = POLLIN;
    pfd.revents = 0;

    const int ret = ::poll(&pfd, 1, timeout_ms);
    if (ret < 0) {
        if (errno != EINTR) {
            LOG_ERROR("[SocketCAN] poll() failed: %s", std::strerror(errno));
        }
        return false;
    }
    if (ret == 0 || !(pfd.revents & POLLIN)) {
        return false;
    }

    struct can_frame cf{};
    const ssize_t n = ::read(sock_, &cf, sizeof(cf));
    if (n < 0) {
        if (errno != EAGAIN && errno != EWOULDBLOCK) {
            LOG_ERROR("[SocketCAN] read() failed: %s", std::strerror(errno));
        }
        return false;
    }
    if (n != static_cast<ssize_t>(sizeof(cf))) {
        LOG_ERROR("[SocketCAN] Incomplete CAN frame read: %zd bytes", n);
        return false;
    }

    out.id = cf.can_id & CAN_SFF_MASK;
    out.dlc = cf.can_dlc > 8 ? 8 : cf.can_dlc;
    std::memcpy(out.data, cf.data, sizeof(out.data));
    return true;
}

bool SocketCanTransport::set_filters(const std::vector<uint32_t>& ids_11bit) {
    if (sock_ < 0) return false;

    if (ids_11bit.empty()) {
        return ::setsockopt(sock_, SOL_CAN_RAW, CAN_RAW_FILTER, nullptr, 0) == 0;
    }

    std::vector<struct can_filter> filters;
    filters.reserve(ids_11bit.size());
    for (uint32_t id : ids_11bit) {
        struct can_filter f{};
        f.can_id   = id & CAN_SFF_MASK;
        f.can_mask = CAN_SFF_MASK;
        filters.push_back(f);
    }

    if (::setsockopt(sock_, SOL_CAN_RAW, CAN_RAW_FILTER,
                     filters.data(),
                     static_cast<socklen_t>(filters.size() * sizeof(struct can_filter))) < 0) {
        LOG_ERROR("[SocketCAN] setsockopt(CAN_RAW_FILTER) failed: %s", std::strerror(errno));
        return false;
    }
    return true;
}

} // namespace bridge
