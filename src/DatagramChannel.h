#pragma once

#include <cstdint>
#include <vector>

struct RecvResult {
    enum Kind { Datagram, Timeout, Failure };
    Kind kind = Timeout;
    std::vector<uint8_t> bytes;
};

// Connected datagram endpoint as seen by the client session. receive() is
// the only place the client blocks.
class DatagramChannel {
public:
    virtual ~DatagramChannel() = default;

    virtual bool send(const std::vector<uint8_t>& bytes) = 0;

    // Waits at most `timeout_ms` for one datagram.
    virtual RecvResult receive(int timeout_ms) = 0;

    // Monotonic milliseconds on the same clock receive() waits on.
    virtual uint32_t now_ms() = 0;
};
