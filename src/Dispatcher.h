#pragma once

#include "SenderSession.h"
#include "fetch_protocol.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <netinet/in.h>
#include <string>
#include <unordered_map>
#include <vector>

struct PeerKey {
    uint32_t ip;   // network order
    uint16_t port; // network order
    bool operator==(const PeerKey& o) const { return ip == o.ip && port == o.port; }
};

struct PeerKeyHash {
    size_t operator()(const PeerKey& k) const {
        return static_cast<size_t>(k.ip) * 1315423911u + k.port;
    }
};

struct ServerConfig {
    std::string directory = "files"; // files served by GET
    SenderConfig sender;
};

// Routes datagrams from the shared socket to one SenderSession per peer.
// Single-threaded: on_datagram() and on_tick() are the only mutators.
class Dispatcher {
public:
    using SendToFn = std::function<bool(const sockaddr_in&, const std::vector<uint8_t>&)>;

    Dispatcher(const ServerConfig& cfg, SendToFn send_to);

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    void on_datagram(const sockaddr_in& from, const uint8_t* data, size_t len, uint32_t now);
    void on_tick(uint32_t now);

    size_t active() const { return sessions.size(); }
    const SenderSession* session_for(const sockaddr_in& peer) const;

private:
    void open_session(const sockaddr_in& from, const FetchFrame& f, uint32_t now);
    void send_error(const sockaddr_in& to, const std::string& msg);

private:
    ServerConfig C;
    SendToFn send_to;
    std::unordered_map<PeerKey, std::unique_ptr<SenderSession>, PeerKeyHash> sessions;
};
