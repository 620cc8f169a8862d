#pragma once

#include <chrono>
#include <cstdint>

// Receives per-segment outcomes from a download; never drives the protocol.
class TransferObserver {
public:
    virtual ~TransferObserver() = default;

    virtual void segment_delivered(uint32_t seq) = 0;
    virtual void segment_lost(uint32_t seq) = 0;
    virtual void segment_recovered(uint32_t seq) = 0;
    virtual void summarize(uint32_t total_segments, std::chrono::milliseconds elapsed) = 0;
};
