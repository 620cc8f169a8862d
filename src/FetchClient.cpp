#include "FetchClient.h"

#include "LossSimulator.h"
#include "TransferReport.h"

#include <arpa/inet.h>
#include <netdb.h>
#include <sys/socket.h>
#include <sys/types.h>

#include <cstring>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

bool fetch_parse_target(const std::string& target, std::string& host, uint16_t& port,
                        std::string& file) {
    size_t slash = target.find('/');
    if (slash == std::string::npos) return false;
    std::string hostport = target.substr(0, slash);
    std::string name = target.substr(slash + 1);

    size_t colon = hostport.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 == hostport.size()) return false;
    std::string port_str = hostport.substr(colon + 1);
    if (port_str.size() > 5 || port_str.find_first_not_of("0123456789") != std::string::npos) {
        return false;
    }
    unsigned long p = std::stoul(port_str);
    if (p == 0 || p > 65535) return false;
    if (name.empty()) return false;

    host = hostport.substr(0, colon);
    port = (uint16_t)p;
    file = name;
    return true;
}

FetchClient::FetchClient(const FetchClientArgs& args) : A(args) {}

bool FetchClient::init() {
    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_DGRAM;
    addrinfo* res = nullptr;
    int rc = getaddrinfo(A.host.c_str(), nullptr, &hints, &res);
    if (rc != 0 || !res) {
        std::cerr << "Cannot resolve " << A.host << ": " << gai_strerror(rc) << "\n";
        return false;
    }
    std::memcpy(&server, res->ai_addr, sizeof(server));
    freeaddrinfo(res);
    server.sin_port = htons(A.port);

    if (!channel.open(server, A.rcvbuf)) return false;

    std::cerr << "Connecting to " << fetch_addr_to_string(server)
              << " to download '" << A.file << "'"
              << (A.loss > 0 ? " with " + std::to_string(A.loss) + "% simulated loss" : "")
              << "\n";
    return true;
}

bool FetchClient::run() {
    ReceiverConfig cfg;
    cfg.reply_timeout_ms = A.reply_ms;
    cfg.idle_timeout_ms = A.idle_ms;
    cfg.resend_timeout_ms = A.resend_ms;
    cfg.resend_attempts = A.resend_attempts;
    cfg.auto_recover = A.recover;
    cfg.out_dir = A.out_dir;

    auto loss = A.seed ? std::make_unique<LossSimulator>(A.loss, *A.seed)
                       : std::make_unique<LossSimulator>(A.loss);
    LossSimulator* sim = loss.get();

    std::unique_ptr<TransferReport> report;
    if (!A.report_dir.empty()) report = std::make_unique<TransferReport>(A.file, A.report_dir);

    ReceiverSession session(channel, cfg, [sim](uint32_t) { return sim->should_drop(); },
                            report.get());
    if (A.ask) {
        session.set_recover_prompt([](const std::vector<uint32_t>& missing) {
            std::cout << missing.size() << " segment(s) missing. Recover? (y/n): " << std::flush;
            std::string ans;
            if (!std::getline(std::cin, ans)) return false;
            return !ans.empty() && (ans[0] == 'y' || ans[0] == 'Y');
        });
    }

    bool ok = session.run(A.file);
    out_path = session.output_path();
    return ok;
}
