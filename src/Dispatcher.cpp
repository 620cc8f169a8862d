#include "Dispatcher.h"

#include <iostream>
#include <utility>

namespace {

PeerKey key_of(const sockaddr_in& a) {
    return PeerKey{ a.sin_addr.s_addr, a.sin_port };
}

} // namespace

Dispatcher::Dispatcher(const ServerConfig& cfg, SendToFn send_fn)
    : C(cfg), send_to(std::move(send_fn)) {}

void Dispatcher::on_datagram(const sockaddr_in& from, const uint8_t* data, size_t len,
                             uint32_t now) {
    FetchFrame f;
    FrameError e = fetch_parse(data, len, f);
    if (e != FrameError::None) {
        std::cerr << fetch_addr_to_string(from) << ": dropped, " << fetch_frame_error_str(e) << "\n";
        return;
    }

    auto it = sessions.find(key_of(from));
    if (it != sessions.end()) {
        it->second->on_frame(f, now);
        return;
    }
    open_session(from, f, now);
}

void Dispatcher::on_tick(uint32_t now) {
    for (auto it = sessions.begin(); it != sessions.end();) {
        it->second->on_tick(now);
        if (it->second->done()) {
            std::cerr << it->second->peer() << ": handler finished ("
                      << sender_state_str(it->second->state()) << ")\n";
            it = sessions.erase(it);
        } else {
            ++it;
        }
    }
}

const SenderSession* Dispatcher::session_for(const sockaddr_in& peer) const {
    auto it = sessions.find(key_of(peer));
    return it == sessions.end() ? nullptr : it->second.get();
}

void Dispatcher::open_session(const sockaddr_in& from, const FetchFrame& f, uint32_t now) {
    std::string who = fetch_addr_to_string(from);
    if (f.type != TYPE_REQUEST) {
        std::cerr << who << ": no active transfer, packet type " << (int)f.type << " dropped\n";
        return;
    }

    FetchRequest req;
    std::string err;
    if (!fetch_parse_request(f.text(), req, err)) {
        std::cerr << who << ": " << err << "\n";
        send_error(from, err);
        return;
    }
    if (req.kind != RequestKind::Get) {
        std::cerr << who << ": RESEND " << req.seq << " with no active transfer, dropped\n";
        return;
    }

    sockaddr_in peer = from;
    auto session = std::make_unique<SenderSession>(
        who, C.sender,
        [this, peer](const std::vector<uint8_t>& bytes) { return send_to(peer, bytes); });

    std::string path = C.directory + "/" + req.name;
    if (!session->start(path, now)) {
        send_error(from, "'" + req.name + "' not found");
        return;
    }
    if (session->done()) return;
    sessions.emplace(key_of(from), std::move(session));
}

void Dispatcher::send_error(const sockaddr_in& to, const std::string& msg) {
    if (send_to(to, fetch_encode(fetch_make_error(msg)))) {
        std::cerr << fetch_addr_to_string(to) << ": error '" << msg << "' sent\n";
    }
}
