#include "FetchServer.h"

#include <arpa/inet.h>
#include <errno.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <cstring>
#include <iostream>
#include <vector>

FetchServer::FetchServer(const FetchServerArgs& args) : A(args) {}

FetchServer::~FetchServer() {
    if (fd >= 0) close(fd);
}

bool FetchServer::init() {
    if (::mkdir(A.directory.c_str(), 0755) < 0 && errno != EEXIST) {
        perror(("mkdir " + A.directory).c_str());
        return false;
    }

    fd = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (fd < 0) { perror("socket"); return false; }

    int yes = 1;
    if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes)) < 0) {
        perror("setsockopt SO_REUSEADDR");
        return false;
    }

    sockaddr_in local{};
    local.sin_family = AF_INET;
    local.sin_port = htons(A.port);
    if (A.bind_ip.empty()) {
        local.sin_addr.s_addr = htonl(INADDR_ANY);
    } else if (inet_pton(AF_INET, A.bind_ip.c_str(), &local.sin_addr) != 1) {
        std::cerr << "Invalid --bind IP: " << A.bind_ip << "\n";
        return false;
    }
    if (bind(fd, (sockaddr*)&local, sizeof(local)) < 0) {
        perror("bind");
        return false;
    }

    ServerConfig cfg;
    cfg.directory = A.directory;
    cfg.sender.segment_size = A.chunk;
    cfg.sender.rto_ms = A.rto_ms;
    cfg.sender.retries = A.retries;
    cfg.sender.recover_ms = A.recover_ms;
    dispatcher = std::make_unique<Dispatcher>(
        cfg, [this](const sockaddr_in& to, const std::vector<uint8_t>& bytes) {
            return xmit(to, bytes);
        });

    std::cerr << "Server listening on UDP " << fetch_addr_to_string(local)
              << ", serving '" << A.directory << "/' (chunk=" << A.chunk
              << ", rto=" << A.rto_ms << "ms, retries=" << A.retries << ")\n";
    running = true;
    return true;
}

bool FetchServer::run() {
    if (fd < 0 || !dispatcher) return false;

    std::vector<uint8_t> buf(kFetchHeaderSize + kFetchMaxSegment);
    while (running) {
        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLIN;
        int pr = ::poll(&pfd, 1, A.tick_ms);
        if (pr < 0) {
            if (errno == EINTR) continue;
            perror("poll");
            return false;
        }

        if (pr > 0 && (pfd.revents & POLLIN)) {
            sockaddr_in peer{};
            socklen_t alen = sizeof(peer);
            ssize_t n = recvfrom(fd, buf.data(), buf.size(), 0, (sockaddr*)&peer, &alen);
            if (n < 0) {
                // ICMP port unreachable from a departed client surfaces here.
                if (errno != EINTR && errno != ECONNREFUSED && errno != EAGAIN) {
                    perror("recvfrom");
                }
            } else {
                dispatcher->on_datagram(peer, buf.data(), (size_t)n, fetch_now_ms());
            }
        }
        dispatcher->on_tick(fetch_now_ms());
    }
    return true;
}

uint16_t FetchServer::local_port() const {
    sockaddr_in sa{};
    socklen_t sl = sizeof(sa);
    if (getsockname(fd, (sockaddr*)&sa, &sl) == 0) return ntohs(sa.sin_port);
    return 0;
}

bool FetchServer::xmit(const sockaddr_in& to, const std::vector<uint8_t>& bytes) {
    ssize_t n = sendto(fd, bytes.data(), bytes.size(), 0, (const sockaddr*)&to, sizeof(to));
    if (n < 0) { perror("sendto"); return false; }
    if ((size_t)n != bytes.size()) {
        std::cerr << "Partial send!? sent=" << n << " expected=" << bytes.size() << "\n";
        return false;
    }
    return true;
}
