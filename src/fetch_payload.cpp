#include "fetch_payload.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <random>
#include <stdexcept>
#include <vector>

#define CHUNK_SIZE (1024 * 1024) // 1 MB

namespace {

const char charset[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";

} // namespace

std::size_t fetch_parse_size(const std::string& str) {
    std::string unit = "MB"; // default unit
    std::size_t i = 0;

    while (i < str.size() && (std::isdigit(static_cast<unsigned char>(str[i])) || str[i] == '.')) {
        ++i;
    }
    if (i == 0) return 0;

    double value = 0;
    try {
        value = std::stod(str.substr(0, i));
    } catch (const std::exception&) {
        return 0;
    }
    if (value <= 0) return 0;

    if (i < str.size()) unit = str.substr(i);
    std::transform(unit.begin(), unit.end(), unit.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    double mult = 0;
    if (unit == "B") mult = 1;
    else if (unit == "KB" || unit == "K" || unit == "KIB") mult = 1024.0;
    else if (unit == "MB" || unit == "M" || unit == "MIB") mult = 1024.0 * 1024;
    else if (unit == "GB" || unit == "G" || unit == "GIB") mult = 1024.0 * 1024 * 1024;
    else if (unit == "TB" || unit == "T" || unit == "TIB") mult = 1024.0 * 1024 * 1024 * 1024;
    else {
        std::cerr << "Unknown unit: " << unit
                  << ". Use B, KB, MB, GB, TB, KiB, MiB, etc.\n";
        return 0;
    }
    return static_cast<std::size_t>(value * mult);
}

bool fetch_write_payload(const std::string& path, std::size_t total_bytes, uint32_t seed,
                         bool show_progress) {
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    if (!ofs) {
        std::perror(("open " + path).c_str());
        return false;
    }

    std::mt19937 rng(seed);
    std::uniform_int_distribution<std::size_t> pick(0, sizeof(charset) - 2);
    std::vector<char> buffer(std::min<std::size_t>(CHUNK_SIZE, total_bytes));

    for (std::size_t written = 0; written < total_bytes;) {
        std::size_t chunk = std::min<std::size_t>(CHUNK_SIZE, total_bytes - written);
        for (std::size_t k = 0; k < chunk; ++k) buffer[k] = charset[pick(rng)];

        ofs.write(buffer.data(), static_cast<std::streamsize>(chunk));
        if (!ofs) {
            std::cerr << "Error writing to " << path << "\n";
            return false;
        }
        written += chunk;
        if (show_progress) {
            std::cout << "\rProgress: " << (100.0 * (double)written / (double)total_bytes) << "%"
                      << std::flush;
        }
    }
    if (show_progress) std::cout << "\n";
    return true;
}
