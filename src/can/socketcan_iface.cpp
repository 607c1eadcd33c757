// src/can/socketcan_iface.cpp
#include "can/socketcan_iface.hpp"
#include "utils/logging.hpp"

#include <chrono>
#include <cstdio>
#include <cstring>
#include <cerrno>

#include <poll.h>
#include <linux/can/raw.h>
#include <net/if.h>
#include <sys/ioctl.h>
#include <sys/socket.h>
#include <unistd.h>

namespace can {

SocketCanIface::~SocketCanIface() {
    close();
}

bool SocketCanIface::open(const std::string& ifname) {
    close();

    sock_ = ::socket(PF_CAN, SOCK_RAW, CAN_RAW);
    if (sock_ < 0) {
        LOG_ERROR("socket() failed: %s", std::strerror(errno));
        return false;
    }

    struct ifreq ifr{};
    std::snprintf(ifr.ifr_name, IFNAMSIZ, "%s", ifname.c_str());
    if (::ioctl(sock_, SIOCGIFINDEX, &ifr) < 0) {
        LOG_ERROR("ioctl(SIOCGIFINDEX) failed for %s: %s",
                  ifname.c_str(), std::strerror(errno));
        close();
        return false;
    }

    struct sockaddr_can addr{};
    addr.can_family  = AF_CAN;
    addr.can_ifindex = ifr.ifr_ifindex;

    if (::bind(sock_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        LOG_ERROR("bind() failed: %s", std::strerror(errno));
        close();
        return false;
    }

    ifname_ = ifname;
    return true;
}

void SocketCanIface::close() {
    if (sock_ >= 0) {
        ::close(sock_);
        sock_ = -1;
    }
}

RawFrame SocketCanIface::from_linux(const struct can_frame& f, double timestamp, const std::string& channel) {
    RawFrame out;
    out.timestamp = timestamp;
    out.channel = channel;
    out.arbitration_id = (f.can_id & CAN_EFF_FLAG) ? (f.can_id & CAN_EFF_MASK)
                                                   : (f.can_id & CAN_SFF_MASK);
    out.length = f.can_dlc > CAN_MAX_DLEN ? CAN_MAX_DLEN : f.can_dlc;
    std::memcpy(out.payload.data(), f.data, out.length);
    return out;
}

struct can_frame SocketCanIface::to_linux(const RawFrame& f) {
    struct can_frame out{};
    out.can_id = f.arbitration_id;
    if (f.arbitration_id > CAN_SFF_MASK) {
        out.can_id |= CAN_EFF_FLAG;
    }
    out.can_dlc = static_cast<__u8>(f.size());
    std::memcpy(out.data, f.payload.data(), f.size());
    return out;
}

bool SocketCanIface::read_timeout(RawFrame& out, int timeout_ms) {
    if (sock_ < 0) {
        return false;
    }

    struct pollfd pfd;
    pfd.fd = sock_;
    pfd.events = POLLIN;

    int ret = ::poll(&pfd, 1, timeout_ms);
    if (ret < 0) {
        if (errno != EINTR) {
            LOG_ERROR("poll() failed: %s", std::strerror(errno));
        }
        return false;
    }
    if (ret == 0 || !(pfd.revents & POLLIN)) {
        return false;
    }

    struct can_frame frame{};
    const ssize_t nbytes = ::read(sock_, &frame, sizeof(frame));
    if (nbytes < 0) {
        LOG_ERROR("read() failed: %s", std::strerror(errno));
        return false;
    }
    if (nbytes != static_cast<ssize_t>(sizeof(frame))) {
        LOG_ERROR("Incomplete CAN frame read: %zd bytes (expected %zu)",
                  nbytes, sizeof(frame));
        return false;
    }
    if (frame.can_id & (CAN_ERR_FLAG | CAN_RTR_FLAG)) {
        return false;
    }

    const auto now = std::chrono::system_clock::now().time_since_epoch();
    const double ts = std::chrono::duration_cast<std::chrono::microseconds>(now).count() / 1e6;
    out = from_linux(frame, ts, ifname_);
    return true;
}

bool SocketCanIface::write_frame(const RawFrame& frame) {
    if (sock_ < 0) return false;
    const struct can_frame f = to_linux(frame);
    const ssize_t n = ::write(sock_, &f, sizeof(f));
    if (n < 0) {
        LOG_ERROR("write() failed: %s", std::strerror(errno));
        return false;
    }
    return n == static_cast<ssize_t>(sizeof(f));
}

} // namespace can
