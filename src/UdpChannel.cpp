#include "UdpChannel.h"

#include "fetch_protocol.h"

#include <arpa/inet.h>
#include <errno.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include <cstdio>
#include <iostream>

UdpChannel::~UdpChannel() {
    if (fd >= 0) close(fd);
}

bool UdpChannel::open(const sockaddr_in& server, int rcvbuf) {
    fd = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (fd < 0) { perror("socket"); return false; }

    if (rcvbuf > 0 && setsockopt(fd, SOL_SOCKET, SO_RCVBUF, &rcvbuf, sizeof(rcvbuf)) < 0) {
        perror("setsockopt SO_RCVBUF"); /* non-fatal */
    }
    // connect() filters out datagrams from anyone but the server.
    if (connect(fd, (const sockaddr*)&server, sizeof(server)) < 0) {
        perror("connect");
        return false;
    }
    buf.resize(kFetchHeaderSize + kFetchMaxSegment);
    return true;
}

bool UdpChannel::send(const std::vector<uint8_t>& bytes) {
    ssize_t n = ::send(fd, bytes.data(), bytes.size(), 0);
    if (n < 0) {
        // A refused earlier datagram is reported on the next call; retry once.
        if (errno == ECONNREFUSED) n = ::send(fd, bytes.data(), bytes.size(), 0);
        if (n < 0) { perror("send"); return false; }
    }
    if ((size_t)n != bytes.size()) {
        std::cerr << "Partial send!? sent=" << n << " expected=" << bytes.size() << "\n";
        return false;
    }
    return true;
}

RecvResult UdpChannel::receive(int timeout_ms) {
    RecvResult r;
    uint32_t deadline = now_ms() + (uint32_t)(timeout_ms > 0 ? timeout_ms : 0);

    while (true) {
        int remaining = (int)(deadline - now_ms());
        if (remaining < 0) remaining = 0;

        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLIN;
        int pr = ::poll(&pfd, 1, remaining);
        if (pr < 0) {
            if (errno == EINTR) continue;
            perror("poll");
            r.kind = RecvResult::Failure;
            return r;
        }
        if (pr == 0) {
            r.kind = RecvResult::Timeout;
            return r;
        }

        ssize_t n = ::recv(fd, buf.data(), buf.size(), 0);
        if (n < 0) {
            // ICMP port unreachable: nobody listening yet, keep waiting.
            if (errno == EINTR || errno == ECONNREFUSED || errno == EAGAIN) {
                if (remaining == 0) {
                    r.kind = RecvResult::Timeout;
                    return r;
                }
                continue;
            }
            perror("recv");
            r.kind = RecvResult::Failure;
            return r;
        }

        r.kind = RecvResult::Datagram;
        r.bytes.assign(buf.begin(), buf.begin() + n);
        return r;
    }
}

uint32_t UdpChannel::now_ms() {
    return fetch_now_ms();
}
