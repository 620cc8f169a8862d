#pragma once

#include "FileReader.h"
#include "fetch_protocol.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

enum class SenderState {
    AwaitingRequest,
    Sending,
    RecoveryWindow,
    Closed,
    Aborted,
};

const char* sender_state_str(SenderState s);

struct SenderConfig {
    size_t segment_size = kFetchDefaultSegment; // payload bytes per DATA
    int rto_ms = 1000;                           // retransmission timeout
    int retries = 3;                             // max retransmissions per segment
    int recover_ms = 5000;                       // idle time before the recovery window closes
};

// Server side of one transfer: stop-and-wait delivery of a single file to
// a single peer. Driven entirely by on_frame() and on_tick(); all output
// goes through the send callback.
class SenderSession {
public:
    using SendFn = std::function<bool(const std::vector<uint8_t>&)>;

    SenderSession(std::string peer, const SenderConfig& cfg, SendFn send);

    SenderSession(const SenderSession&) = delete;
    SenderSession& operator=(const SenderSession&) = delete;

    // Opens `path` and sends segment 0. false if the file cannot be opened;
    // the session then stays in AwaitingRequest and should be discarded.
    bool start(const std::string& path, uint32_t now);

    // `f` must already have passed fetch_validate().
    void on_frame(const FetchFrame& f, uint32_t now);

    // Fires retransmissions and closes the recovery window.
    void on_tick(uint32_t now);

    bool done() const { return phase == SenderState::Closed || phase == SenderState::Aborted; }

    SenderState state() const { return phase; }
    uint32_t total() const { return total_segs; }
    uint32_t current() const { return cursor; }
    int retries() const { return retry_count; }
    uint64_t frames_sent() const { return data_frames; }
    const std::string& peer() const { return who; }

private:
    void handle_ack(uint32_t seq, uint32_t now);
    void handle_request(const FetchFrame& f);
    bool send_segment(uint32_t seq);
    bool send_current(uint32_t now);
    void finish(SenderState final_state);

private:
    std::string who;
    SenderConfig C;
    SendFn send;
    FileReader file;

    SenderState phase = SenderState::AwaitingRequest;
    uint32_t total_segs = 0;
    uint32_t cursor = 0;     // next segment awaiting ACK
    int retry_count = 0;     // consecutive timeouts since the cursor last moved
    uint32_t last_send = 0;
    uint32_t last_activity = 0;
    uint32_t finished_at = 0;
    uint64_t data_frames = 0;
};
