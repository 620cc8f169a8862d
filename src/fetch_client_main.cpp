#include "FetchClient.h"

#include <iostream>
#include <stdexcept>
#include <string>

static void usage(const char* prog) {
    std::cerr << "Usage: " << prog
              << " GET host:port/file [--loss PCT] [--seed N] [--out dir] [--report dir]"
              << " [--no-report] [--no-recover] [--ask] [--reply-ms MS] [--idle-ms MS]"
              << " [--resend-ms MS] [--resend-tries K]\n";
}

static bool parse_args(int argc, char** argv, FetchClientArgs& a) {
    if (argc < 3) { usage(argv[0]); return false; }

    std::string verb = argv[1];
    if (verb != "GET" && verb != "get") {
        std::cerr << "Invalid command: " << verb << ". Use GET.\n";
        return false;
    }
    if (!fetch_parse_target(argv[2], a.host, a.port, a.file)) {
        std::cerr << "Invalid target '" << argv[2] << "', expected host:port/file\n";
        return false;
    }

    for (int i = 3; i < argc; ++i) {
        std::string s = argv[i];
        auto need = [&](int more) {
            if (i + more >= argc) { usage(argv[0]); return false; }
            return true;
        };

        if (s == "--loss" && need(1)) a.loss = std::stoi(argv[++i]);
        else if (s == "--seed" && need(1)) a.seed = (uint32_t)std::stoul(argv[++i]);
        else if (s == "--out" && need(1)) a.out_dir = argv[++i];
        else if (s == "--report" && need(1)) a.report_dir = argv[++i];
        else if (s == "--no-report") a.report_dir.clear();
        else if (s == "--no-recover") a.recover = false;
        else if (s == "--ask") a.ask = true;
        else if (s == "--reply-ms" && need(1)) a.reply_ms = std::stoi(argv[++i]);
        else if (s == "--idle-ms" && need(1)) a.idle_ms = std::stoi(argv[++i]);
        else if (s == "--resend-ms" && need(1)) a.resend_ms = std::stoi(argv[++i]);
        else if (s == "--resend-tries" && need(1)) a.resend_attempts = std::stoi(argv[++i]);
        else if (s == "-h" || s == "--help") { usage(argv[0]); return false; }
        else { std::cerr << "Unknown arg: " << s << "\n"; usage(argv[0]); return false; }
    }

    if (a.loss < 0 || a.loss > 100) { std::cerr << "--loss must be 0..100\n"; return false; }
    return true;
}

int main(int argc, char** argv) {
    FetchClientArgs args;
    try {
        if (!parse_args(argc, argv, args)) return 1;
    } catch (const std::exception& e) {
        std::cerr << "Invalid number: " << e.what() << "\n";
        usage(argv[0]);
        return 1;
    }

    FetchClient c(args);
    if (!c.init()) return 2;
    if (!c.run()) return 3;
    return 0;
}
