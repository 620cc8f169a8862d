#pragma once

#include "DatagramChannel.h"
#include "SegmentStore.h"
#include "TransferObserver.h"
#include "fetch_protocol.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

enum class ReceiverState {
    Requesting,
    Collecting,
    Recovering,
    Assembled,
    Failed,
};

const char* receiver_state_str(ReceiverState s);

struct ReceiverConfig {
    int reply_timeout_ms = 2000;  // wait for the first reply to GET
    int idle_timeout_ms = 5000;   // silence that ends collection
    int resend_timeout_ms = 1000; // wait per RESEND attempt
    int resend_attempts = 3;      // RESEND tries per missing segment
    bool auto_recover = true;
    std::string out_dir = ".";
};

// Client side of one download. run() walks the whole state machine; the
// individual steps are public so they can be driven one at a time.
class ReceiverSession {
public:
    // Returns true to drop an inbound DATA frame as if it were lost.
    using DropFn = std::function<bool(uint32_t seq)>;
    // Operator decision on whether to recover the listed segments.
    using RecoverPromptFn = std::function<bool(const std::vector<uint32_t>& missing)>;

    ReceiverSession(DatagramChannel& ch, const ReceiverConfig& cfg,
                    DropFn drop = nullptr, TransferObserver* observer = nullptr);

    ReceiverSession(const ReceiverSession&) = delete;
    ReceiverSession& operator=(const ReceiverSession&) = delete;

    void set_recover_prompt(RecoverPromptFn fn) { prompt = std::move(fn); }

    // Full download of `file_name`; true once output was written (complete
    // or partial), false if the session failed.
    bool run(const std::string& file_name);

    bool request(const std::string& file_name);
    void collect();
    std::vector<uint32_t> detect_gaps();
    void recover();
    bool assemble();

    // Handles one valid DATA frame while collecting: loss decision, store, ACK.
    // Returns true if the segment was newly stored.
    bool on_data(const FetchFrame& f);

    ReceiverState state() const { return phase; }
    bool complete() const { return phase == ReceiverState::Assembled && lost_for_good.empty(); }
    uint32_t total() const { return total_segs; }
    bool total_known() const { return have_total; }
    const SegmentStore& store() const { return segments; }
    const std::vector<uint32_t>& missing() const { return gaps; }
    const std::vector<uint32_t>& permanently_lost() const { return lost_for_good; }
    const std::vector<uint32_t>& dropped() const { return dropped_seqs; }
    const std::string& output_path() const { return out_path; }
    const std::string& error() const { return err; }

private:
    bool accept_data(const FetchFrame& f);
    bool send_frame(const FetchFrame& f);
    bool wait_for_segment(uint32_t seq);
    void fail(const std::string& why);

private:
    DatagramChannel& ch;
    ReceiverConfig C;
    DropFn drop;
    TransferObserver* obs;
    RecoverPromptFn prompt;

    ReceiverState phase = ReceiverState::Requesting;
    std::string name;
    bool have_total = false;
    uint32_t total_segs = 0;
    SegmentStore segments;
    std::vector<uint32_t> gaps;
    std::vector<uint32_t> lost_for_good;
    std::vector<uint32_t> dropped_seqs;
    std::string out_path;
    std::string err;
    std::chrono::steady_clock::time_point started{};
};
