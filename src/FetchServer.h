#pragma once

#include "Dispatcher.h"

#include <atomic>
#include <cstdint>
#include <memory>
#include <netinet/in.h>

struct FetchServerArgs {
    uint16_t port = 5000;         // UDP listen port
    std::string bind_ip;          // optional local IPv4, default any
    std::string directory = "files";
    size_t chunk = kFetchDefaultSegment;
    int rto_ms = 1000;
    int retries = 3;
    int recover_ms = 5000;
    int tick_ms = 50;             // poll interval for retransmission sweeps
};

class FetchServer {
public:
    explicit FetchServer(const FetchServerArgs& args);
    ~FetchServer();

    FetchServer(const FetchServer&) = delete;
    FetchServer& operator=(const FetchServer&) = delete;

    bool init();
    bool run();          // until stop() or a fatal socket error
    void stop() { running = false; }

    uint16_t local_port() const;

private:
    bool xmit(const sockaddr_in& to, const std::vector<uint8_t>& bytes);

private:
    FetchServerArgs A;
    int fd = -1;
    std::unique_ptr<Dispatcher> dispatcher;
    std::atomic<bool> running{false};
};
