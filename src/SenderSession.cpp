#include "SenderSession.h"

#include <iostream>
#include <utility>

const char* sender_state_str(SenderState s) {
    switch (s) {
    case SenderState::AwaitingRequest: return "AWAITING_REQUEST";
    case SenderState::Sending: return "SENDING";
    case SenderState::RecoveryWindow: return "RECOVERY_WINDOW";
    case SenderState::Closed: return "CLOSED";
    case SenderState::Aborted: return "ABORTED";
    }
    return "?";
}

SenderSession::SenderSession(std::string peer, const SenderConfig& cfg, SendFn send_fn)
    : who(std::move(peer)), C(cfg), send(std::move(send_fn)) {
    if (C.segment_size == 0) C.segment_size = kFetchDefaultSegment;
}

bool SenderSession::start(const std::string& path, uint32_t now) {
    if (phase != SenderState::AwaitingRequest) return false;
    if (!file.open(path)) return false;

    uint64_t size = file.size();
    uint64_t segs = (size + C.segment_size - 1) / C.segment_size;
    if (segs == 0) segs = 1; // empty file still needs one LAST segment
    if (segs > 0xFFFFFFFFull) {
        std::cerr << who << ": '" << path << "' too large (" << size << " bytes)\n";
        file.close();
        return false;
    }
    total_segs = (uint32_t)segs;
    cursor = 0;
    retry_count = 0;
    phase = SenderState::Sending;

    std::cerr << who << ": sending '" << path << "' (" << size << "B in "
              << total_segs << " segs)\n";
    send_current(now);
    return true;
}

void SenderSession::on_frame(const FetchFrame& f, uint32_t now) {
    if (done()) return;
    last_activity = now;

    switch (f.type) {
    case TYPE_ACK:
        handle_ack(f.seq, now);
        break;
    case TYPE_REQUEST:
        handle_request(f);
        break;
    default:
        std::cerr << who << ": unexpected packet type " << (int)f.type << " ignored\n";
        break;
    }
}

void SenderSession::on_tick(uint32_t now) {
    if (phase == SenderState::Sending) {
        if (now - last_send < (uint32_t)C.rto_ms) return;

        ++retry_count;
        if (retry_count > C.retries) {
            std::cerr << who << ": retries exceeded on seg " << cursor << ", aborting\n";
            finish(SenderState::Aborted);
            return;
        }
        std::cerr << who << ": timeout seg " << cursor << ", retry "
                  << retry_count << "/" << C.retries << "\n";
        send_current(now);
    } else if (phase == SenderState::RecoveryWindow) {
        if (now - last_activity >= (uint32_t)C.recover_ms) {
            std::cerr << who << ": recovery window elapsed "
                      << (now - finished_at) << " ms after completion\n";
            finish(SenderState::Closed);
        }
    }
}

void SenderSession::handle_ack(uint32_t seq, uint32_t now) {
    if (phase != SenderState::Sending) return;
    if (seq != cursor) {
        std::cerr << who << ": stale ACK seq=" << seq << " (waiting for " << cursor << ")\n";
        return;
    }

    retry_count = 0;
    ++cursor;
    if (cursor == total_segs) {
        phase = SenderState::RecoveryWindow;
        finished_at = now;
        last_activity = now;
        std::cerr << who << ": LAST segment acknowledged, accepting RESEND for "
                  << C.recover_ms << " ms\n";
        return;
    }
    send_current(now);
}

void SenderSession::handle_request(const FetchFrame& f) {
    FetchRequest req;
    std::string err;
    if (!fetch_parse_request(f.text(), req, err)) {
        std::cerr << who << ": " << err << "\n";
        return;
    }
    if (req.kind != RequestKind::Resend) {
        std::cerr << who << ": unexpected REQUEST '" << f.text() << "' ignored\n";
        return;
    }
    if (phase != SenderState::RecoveryWindow) {
        std::cerr << who << ": RESEND " << req.seq << " before transfer completed, ignored\n";
        return;
    }
    if (req.seq >= total_segs) {
        std::cerr << who << ": RESEND " << req.seq << " out of range (total "
                  << total_segs << ")\n";
        return;
    }

    std::cerr << who << ": RESEND seq=" << req.seq << "\n";
    if (!send_segment(req.seq)) finish(SenderState::Aborted);
}

bool SenderSession::send_segment(uint32_t seq) {
    std::vector<uint8_t> chunk;
    if (!file.read_at((uint64_t)seq * C.segment_size, C.segment_size, chunk)) {
        std::cerr << who << ": failed to read seg " << seq << "\n";
        return false;
    }

    bool last = (seq == total_segs - 1);
    FetchFrame f = fetch_make_data(seq, total_segs, last, std::move(chunk));
    if (!send(fetch_encode(f))) {
        std::cerr << who << ": send failed for seg " << seq << "\n";
    }
    ++data_frames;
    return true;
}

bool SenderSession::send_current(uint32_t now) {
    last_send = now;
    if (!send_segment(cursor)) {
        finish(SenderState::Aborted);
        return false;
    }
    return true;
}

void SenderSession::finish(SenderState final_state) {
    phase = final_state;
    file.close();
    std::cerr << who << ": session " << sender_state_str(final_state) << "\n";
}
