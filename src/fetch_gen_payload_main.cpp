#include "fetch_payload.h"

#include <cstdint>
#include <ctime>
#include <iostream>
#include <string>

static void print_help(const char* prog) {
    std::cout << "Usage: " << prog << " <size> <output_filename> [--seed N]\n";
    std::cout << "  size formats accepted:\n";
    std::cout << "    - B, KB, MB, GB, TB (e.g., 100B, 200KB, 10MB, 1GB)\n";
    std::cout << "    - K, M, G, T (e.g., 10M, 5G)\n";
    std::cout << "    - Binary units: KiB, MiB, GiB, TiB (e.g., 20MiB)\n";
    std::cout << "    - Default unit: MB if unspecified (e.g., 15 == 15MB)\n";
    std::cout << "\nExample:\n";
    std::cout << "  " << prog << " 15MB files/test_15mb.dat\n";
}

int main(int argc, char* argv[]) {
    if (argc < 3 || std::string(argv[1]) == "-h" || std::string(argv[1]) == "--help") {
        print_help(argv[0]);
        return 1;
    }

    uint32_t seed = static_cast<uint32_t>(std::time(nullptr));
    for (int i = 3; i < argc; ++i) {
        std::string s = argv[i];
        if (s == "--seed" && i + 1 < argc) seed = (uint32_t)std::stoul(argv[++i]);
        else { std::cerr << "Unknown arg: " << s << "\n"; print_help(argv[0]); return 1; }
    }

    std::string size_str = argv[1];
    std::size_t total_bytes = fetch_parse_size(size_str);
    if (total_bytes == 0) {
        std::cerr << "Invalid size: " << size_str << "\n";
        return 1;
    }

    const char* filename = argv[2];
    std::cout << "Generating " << filename << " with size: " << total_bytes << " bytes\n";
    if (!fetch_write_payload(filename, total_bytes, seed, true)) return 1;
    std::cout << "File " << filename << " generated\n";
    return 0;
}
