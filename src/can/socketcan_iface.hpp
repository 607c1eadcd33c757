// src/can/socketcan_iface.hpp
#pragma once

#include <cstdint>
#include <string>

#include <linux/can.h>

#include "can/raw_frame.hpp"

namespace can {

/**
 * SocketCanIface - raw SocketCAN socket bound to one interface
 *
 * Frames read from the socket are stamped with the wall-clock receive time
 * and the interface name as their channel.
 */
class SocketCanIface {
public:
    SocketCanIface() = default;
    ~SocketCanIface();

    SocketCanIface(const SocketCanIface&) = delete;
    SocketCanIface& operator=(const SocketCanIface&) = delete;

    bool open(const std::string& ifname);
    void close();

    bool is_open() const { return sock_ >= 0; }
    const std::string& ifname() const { return ifname_; }

    /**
     * Read a frame, waiting at most timeout_ms
     *
     * @return true if a frame was received, false on timeout or error
     */
    bool read_timeout(RawFrame& out, int timeout_ms);

    bool write_frame(const RawFrame& frame);

    static RawFrame from_linux(const struct can_frame& f, double timestamp, const std::string& channel);
    static struct can_frame to_linux(const RawFrame& f);

private:
    int sock_ = -1;
    std::string ifname_;
};

} // namespace can
