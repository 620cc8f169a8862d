#include "FetchServer.h"

#include <csignal>
#include <iostream>
#include <stdexcept>
#include <string>

static FetchServer* g_server = nullptr;

static void on_signal(int) {
    if (g_server) g_server->stop();
}

static void usage(const char* prog) {
    std::cerr << "Usage: " << prog
              << " <port> [--dir path] [--bind X.Y.Z.W] [--chunk BYTES]"
              << " [--rto-ms MS] [--retries K] [--recover-ms MS]\n";
}

static bool parse_args(int argc, char** argv, FetchServerArgs& a) {
    bool have_port = false;
    for (int i = 1; i < argc; ++i) {
        std::string s = argv[i];
        auto need = [&](int more) {
            if (i + more >= argc) { usage(argv[0]); return false; }
            return true;
        };

        if (s == "--dir" && need(1)) a.directory = argv[++i];
        else if (s == "--bind" && need(1)) a.bind_ip = argv[++i];
        else if (s == "--chunk" && need(1)) a.chunk = (size_t)std::stoul(argv[++i]);
        else if (s == "--rto-ms" && need(1)) a.rto_ms = std::stoi(argv[++i]);
        else if (s == "--retries" && need(1)) a.retries = std::stoi(argv[++i]);
        else if (s == "--recover-ms" && need(1)) a.recover_ms = std::stoi(argv[++i]);
        else if (s == "-h" || s == "--help") { usage(argv[0]); return false; }
        else if (!have_port && !s.empty() && s[0] != '-') {
            a.port = (uint16_t)std::stoi(s);
            have_port = true;
        }
        else { std::cerr << "Unknown arg: " << s << "\n"; usage(argv[0]); return false; }
    }

    if (!have_port) { usage(argv[0]); return false; }
    if (a.chunk < 1 || a.chunk > kFetchMaxSegment) {
        std::cerr << "--chunk invalid; must be 1.." << kFetchMaxSegment << "\n";
        return false;
    }
    if (a.rto_ms <= 0 || a.recover_ms <= 0 || a.retries < 0) {
        std::cerr << "--rto-ms and --recover-ms must be > 0, --retries >= 0\n";
        return false;
    }
    return true;
}

int main(int argc, char** argv) {
    FetchServerArgs args;
    try {
        if (!parse_args(argc, argv, args)) return 1;
    } catch (const std::exception& e) {
        std::cerr << "Invalid number: " << e.what() << "\n";
        usage(argv[0]);
        return 1;
    }

    FetchServer s(args);
    if (!s.init()) return 2;

    g_server = &s;
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    if (!s.run()) return 3;
    return 0;
}
