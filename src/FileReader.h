#pragma once

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <string>
#include <vector>

// Read handle on a source file; closed on destruction.
class FileReader {
public:
    FileReader() = default;
    ~FileReader();

    FileReader(const FileReader&) = delete;
    FileReader& operator=(const FileReader&) = delete;

    // false if the path does not name a readable regular file.
    bool open(const std::string& path);
    bool is_open() const { return f.is_open(); }
    uint64_t size() const { return file_size; }

    // Reads up to `length` bytes at `offset`; short only at end of file.
    bool read_at(uint64_t offset, size_t length, std::vector<uint8_t>& out);

    void close();

private:
    std::ifstream f;
    uint64_t file_size = 0;
};
