#pragma once

#include "DatagramChannel.h"
#include "Dispatcher.h"
#include "TransferObserver.h"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <stdlib.h>
#include <unistd.h>

#include <cstdint>
#include <cstdio>
#include <deque>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <set>
#include <string>
#include <system_error>
#include <vector>

// mkdtemp() directory, removed with its files on destruction.
class TempDir {
public:
    TempDir() {
        char tmpl[] = "/tmp/fetch_test_XXXXXX";
        char* p = mkdtemp(tmpl);
        if (p) path = p;
    }
    ~TempDir() {
        std::error_code ec;
        if (!path.empty()) std::filesystem::remove_all(path, ec);
    }
    std::string file(const std::string& name) const { return path + "/" + name; }

    std::string path;
};

inline std::vector<uint8_t> pattern_bytes(size_t n, uint32_t salt = 0) {
    std::vector<uint8_t> v(n);
    for (size_t i = 0; i < n; ++i) v[i] = (uint8_t)((i * 131 + salt * 7 + (i >> 8)) & 0xFF);
    return v;
}

inline bool write_file(const std::string& path, const std::vector<uint8_t>& bytes) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(bytes.data()), (std::streamsize)bytes.size());
    return (bool)out;
}

inline std::vector<uint8_t> read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

inline bool file_exists(const std::string& path) {
    return ::access(path.c_str(), F_OK) == 0;
}

inline sockaddr_in make_addr(const char* ip, uint16_t port) {
    sockaddr_in a{};
    a.sin_family = AF_INET;
    a.sin_port = htons(port);
    inet_pton(AF_INET, ip, &a.sin_addr);
    return a;
}

// Client end of an in-memory link to a Dispatcher, on a virtual clock.
// Time only moves while the client waits in receive(); the server side is
// ticked every `step_ms` of virtual time.
class LoopbackChannel : public DatagramChannel {
public:
    // Return false to lose a server -> client datagram.
    using LinkFilter = std::function<bool(const std::vector<uint8_t>&)>;

    LoopbackChannel(const ServerConfig& cfg, sockaddr_in client_addr)
        : me(client_addr),
          server(cfg, [this](const sockaddr_in&, const std::vector<uint8_t>& bytes) {
              if (!to_client || to_client(bytes)) inbox.push_back(bytes);
              return true;
          }) {}

    bool send(const std::vector<uint8_t>& bytes) override {
        ++sent_count;
        if (to_server && !to_server(bytes)) return true;
        server.on_datagram(me, bytes.data(), bytes.size(), clock);
        return true;
    }

    RecvResult receive(int timeout_ms) override {
        RecvResult r;
        uint32_t waited = 0;
        while (inbox.empty() && (int)waited < timeout_ms) {
            clock += step_ms;
            waited += step_ms;
            server.on_tick(clock);
        }
        if (inbox.empty()) {
            r.kind = RecvResult::Timeout;
            return r;
        }
        r.kind = RecvResult::Datagram;
        r.bytes = std::move(inbox.front());
        inbox.pop_front();
        return r;
    }

    uint32_t now_ms() override { return clock; }

    // Lets the server run on without the client.
    void idle(uint32_t ms) {
        for (uint32_t t = 0; t < ms; t += step_ms) {
            clock += step_ms;
            server.on_tick(clock);
        }
    }

    sockaddr_in me;
    Dispatcher server;
    std::deque<std::vector<uint8_t>> inbox;
    LinkFilter to_client;
    LinkFilter to_server;
    uint32_t clock = 1000;
    uint32_t step_ms = 10;
    int sent_count = 0;
};

class RecordingObserver : public TransferObserver {
public:
    void segment_delivered(uint32_t seq) override { delivered.insert(seq); }
    void segment_lost(uint32_t seq) override { lost.insert(seq); }
    void segment_recovered(uint32_t seq) override { recovered.insert(seq); }
    void summarize(uint32_t total_segments, std::chrono::milliseconds) override {
        ++summaries;
        total = total_segments;
    }

    std::set<uint32_t> delivered;
    std::set<uint32_t> lost;
    std::set<uint32_t> recovered;
    int summaries = 0;
    uint32_t total = 0;
};
