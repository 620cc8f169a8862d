#pragma once

#include "DatagramChannel.h"

#include <cstdint>
#include <netinet/in.h>
#include <string>
#include <vector>

// DatagramChannel over a UDP socket connected to one server address.
class UdpChannel : public DatagramChannel {
public:
    UdpChannel() = default;
    ~UdpChannel() override;

    UdpChannel(const UdpChannel&) = delete;
    UdpChannel& operator=(const UdpChannel&) = delete;

    bool open(const sockaddr_in& server, int rcvbuf);

    bool send(const std::vector<uint8_t>& bytes) override;
    RecvResult receive(int timeout_ms) override;
    uint32_t now_ms() override;

private:
    int fd = -1;
    std::vector<uint8_t> buf;
};
