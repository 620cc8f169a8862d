#pragma once

#include "ReceiverSession.h"
#include "UdpChannel.h"

#include <cstdint>
#include <netinet/in.h>
#include <optional>
#include <string>

struct FetchClientArgs {
    std::string host = "127.0.0.1";
    uint16_t port = 5000;
    std::string file;                  // name requested with GET
    int loss = 0;                      // simulated loss, percent
    std::optional<uint32_t> seed;      // loss RNG seed, random if unset
    std::string out_dir = ".";
    std::string report_dir = "logs";   // empty disables the report
    bool recover = true;               // RESEND missing segments
    bool ask = false;                  // prompt before recovering
    int reply_ms = 2000;
    int idle_ms = 5000;
    int resend_ms = 1000;
    int resend_attempts = 3;
    int rcvbuf = 4 * 1024 * 1024;
};

// "host:port/file" -> parts. false on any missing piece or a bad port.
bool fetch_parse_target(const std::string& target, std::string& host, uint16_t& port,
                        std::string& file);

class FetchClient {
public:
    explicit FetchClient(const FetchClientArgs& args);

    FetchClient(const FetchClient&) = delete;
    FetchClient& operator=(const FetchClient&) = delete;

    bool init();
    bool run();

    const std::string& output_path() const { return out_path; }

private:
    FetchClientArgs A;
    sockaddr_in server{};
    UdpChannel channel;
    std::string out_path;
};
