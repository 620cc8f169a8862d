#include "ReceiverSession.h"

#include <fstream>
#include <iostream>
#include <utility>

namespace {

std::string base_name(const std::string& path) {
    size_t pos = path.find_last_of('/');
    return pos == std::string::npos ? path : path.substr(pos + 1);
}

std::string seq_list(const std::vector<uint32_t>& v) {
    std::string s = "[";
    for (size_t i = 0; i < v.size(); ++i) {
        if (i) s += ", ";
        s += std::to_string(v[i]);
    }
    return s + "]";
}

} // namespace

const char* receiver_state_str(ReceiverState s) {
    switch (s) {
    case ReceiverState::Requesting: return "REQUESTING";
    case ReceiverState::Collecting: return "COLLECTING";
    case ReceiverState::Recovering: return "RECOVERING";
    case ReceiverState::Assembled: return "ASSEMBLED";
    case ReceiverState::Failed: return "FAILED";
    }
    return "?";
}

ReceiverSession::ReceiverSession(DatagramChannel& channel, const ReceiverConfig& cfg,
                                 DropFn drop_fn, TransferObserver* observer)
    : ch(channel), C(cfg), drop(std::move(drop_fn)), obs(observer) {}

bool ReceiverSession::run(const std::string& file_name) {
    if (!request(file_name)) return false;

    collect();
    if (phase == ReceiverState::Failed) return false;

    detect_gaps();
    if (phase == ReceiverState::Recovering) recover();
    if (phase == ReceiverState::Failed) return false;

    return assemble();
}

bool ReceiverSession::request(const std::string& file_name) {
    name = file_name;
    started = std::chrono::steady_clock::now();

    if (!send_frame(fetch_make_request("GET /" + file_name))) {
        fail("failed to send request");
        return false;
    }

    uint32_t deadline = ch.now_ms() + (uint32_t)C.reply_timeout_ms;
    while (true) {
        int remaining = (int)(deadline - ch.now_ms());
        if (remaining <= 0) break;

        RecvResult r = ch.receive(remaining);
        if (r.kind == RecvResult::Timeout) break;
        if (r.kind == RecvResult::Failure) {
            fail("receive failed while waiting for reply");
            return false;
        }

        FetchFrame f;
        FrameError e = fetch_parse(r.bytes.data(), r.bytes.size(), f);
        if (e != FrameError::None) {
            std::cerr << "Discarding reply: " << fetch_frame_error_str(e) << "\n";
            continue;
        }
        if (f.type == TYPE_ERROR) {
            fail("server error: " + f.text());
            return false;
        }
        if (f.type == TYPE_DATA) {
            phase = ReceiverState::Collecting;
            on_data(f);
            return true;
        }
        std::cerr << "Ignoring packet type " << (int)f.type << " while requesting\n";
    }

    fail("timed out waiting for server reply");
    return false;
}

void ReceiverSession::collect() {
    if (phase != ReceiverState::Collecting) return;

    while (!(have_total && segments.count() >= total_segs)) {
        RecvResult r = ch.receive(C.idle_timeout_ms);
        if (r.kind == RecvResult::Timeout) {
            std::cerr << "No traffic for " << C.idle_timeout_ms << " ms, ending collection\n";
            break;
        }
        if (r.kind == RecvResult::Failure) {
            fail("receive failed while collecting");
            return;
        }

        FetchFrame f;
        FrameError e = fetch_parse(r.bytes.data(), r.bytes.size(), f);
        if (e != FrameError::None) {
            std::cerr << "Discarding segment: " << fetch_frame_error_str(e) << "\n";
            continue;
        }
        if (f.type == TYPE_DATA) {
            on_data(f);
        } else if (f.type == TYPE_ERROR) {
            fail("server error: " + f.text());
            return;
        } else {
            std::cerr << "Ignoring packet type " << (int)f.type << " while collecting\n";
        }
    }

    if (!have_total) fail("no segments received");
}

std::vector<uint32_t> ReceiverSession::detect_gaps() {
    if (phase != ReceiverState::Collecting) return gaps;

    gaps = segments.missing(total_segs);
    if (gaps.empty()) {
        phase = ReceiverState::Assembled;
        return gaps;
    }

    std::cerr << "Missing segments: " << seq_list(gaps) << "\n";
    if (obs) {
        for (uint32_t seq : gaps) obs->segment_lost(seq);
    }

    bool go = C.auto_recover;
    if (prompt) go = prompt(gaps);
    if (go) {
        phase = ReceiverState::Recovering;
    } else {
        lost_for_good = gaps;
        phase = ReceiverState::Assembled;
    }
    return gaps;
}

void ReceiverSession::recover() {
    if (phase != ReceiverState::Recovering) return;

    for (uint32_t seq : gaps) {
        bool got = segments.has(seq);
        for (int attempt = 1; !got && attempt <= C.resend_attempts; ++attempt) {
            std::cerr << "RESEND " << seq << " (try " << attempt << "/"
                      << C.resend_attempts << ")\n";
            if (!send_frame(fetch_make_request("RESEND " + std::to_string(seq)))) continue;
            got = wait_for_segment(seq);
            if (phase == ReceiverState::Failed) return;
        }

        if (got) {
            std::cerr << "Recovered segment " << seq << "\n";
            if (obs) obs->segment_recovered(seq);
        } else {
            std::cerr << "Segment " << seq << " permanently lost\n";
            lost_for_good.push_back(seq);
        }
    }
    phase = ReceiverState::Assembled;
}

bool ReceiverSession::assemble() {
    if (phase != ReceiverState::Assembled) return false;

    bool partial = !lost_for_good.empty();
    out_path = C.out_dir.empty() ? std::string() : C.out_dir + "/";
    out_path += "received_" + base_name(name);
    if (partial) out_path += ".partial";

    std::ofstream out(out_path, std::ios::binary | std::ios::trunc);
    if (!out) {
        fail("failed to open output file " + out_path);
        return false;
    }
    int64_t written = segments.write_to(out);
    out.close();
    if (written < 0 || !out) {
        fail("failed to write output file " + out_path);
        return false;
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    std::cerr << (partial ? "Partial file" : "File") << " saved as " << out_path
              << " (" << written << " bytes)\n";
    std::cerr << "Transfer finished in " << (elapsed.count() / 1000.0) << "s, "
              << segments.count() << "/" << total_segs << " segments, "
              << lost_for_good.size() << " lost\n";
    if (partial) std::cerr << "Permanently lost: " << seq_list(lost_for_good) << "\n";

    if (obs) obs->summarize(total_segs, elapsed);
    return true;
}

bool ReceiverSession::on_data(const FetchFrame& f) {
    if (drop && drop(f.seq)) {
        std::cerr << "Dropped segment " << f.seq << " (simulated loss)\n";
        dropped_seqs.push_back(f.seq);
        return false;
    }
    return accept_data(f);
}

bool ReceiverSession::accept_data(const FetchFrame& f) {
    if (!have_total) {
        if (f.total == 0) {
            std::cerr << "Discarding segment " << f.seq << ": zero segment count\n";
            return false;
        }
        have_total = true;
        total_segs = f.total;
        std::cerr << "Expecting " << total_segs << " segments\n";
    }
    if (f.total != total_segs || f.seq >= total_segs) {
        std::cerr << "Discarding segment " << f.seq << "/" << f.total
                  << ": inconsistent with " << total_segs << " segments\n";
        return false;
    }

    bool fresh = segments.put(f.seq, f.payload);
    send_frame(fetch_make_ack(f.seq));
    if (fresh) {
        std::cerr << "Received segment " << f.seq << "/" << (total_segs - 1) << "\n";
        if (obs) obs->segment_delivered(f.seq);
    } else {
        std::cerr << "Duplicate segment " << f.seq << " -> re-ACK\n";
    }
    return fresh;
}

bool ReceiverSession::send_frame(const FetchFrame& f) {
    if (!ch.send(fetch_encode(f))) {
        std::cerr << "Send failed (type " << (int)f.type << ", seq " << f.seq << ")\n";
        return false;
    }
    return true;
}

bool ReceiverSession::wait_for_segment(uint32_t seq) {
    uint32_t deadline = ch.now_ms() + (uint32_t)C.resend_timeout_ms;
    while (true) {
        int remaining = (int)(deadline - ch.now_ms());
        if (remaining <= 0) return false;

        RecvResult r = ch.receive(remaining);
        if (r.kind == RecvResult::Timeout) return false;
        if (r.kind == RecvResult::Failure) {
            fail("receive failed while recovering");
            return false;
        }

        FetchFrame f;
        FrameError e = fetch_parse(r.bytes.data(), r.bytes.size(), f);
        if (e != FrameError::None) {
            std::cerr << "Discarding segment: " << fetch_frame_error_str(e) << "\n";
            continue;
        }
        if (f.type == TYPE_ERROR) {
            fail("server error: " + f.text());
            return false;
        }
        if (f.type != TYPE_DATA) continue;

        accept_data(f);
        if (segments.has(seq)) return true;
    }
}

void ReceiverSession::fail(const std::string& why) {
    phase = ReceiverState::Failed;
    err = why;
    std::cerr << "Transfer failed: " << why << "\n";
}
