#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

// "10MB", "1.5GiB", "300K", "500" (MB) -> bytes. 0 if invalid.
std::size_t fetch_parse_size(const std::string& str);

// Writes `total_bytes` of alphanumeric filler to `path`, 1 MiB at a time.
bool fetch_write_payload(const std::string& path, std::size_t total_bytes, uint32_t seed,
                         bool show_progress = false);
