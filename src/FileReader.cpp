#include "FileReader.h"

#include <sys/stat.h>

#include <algorithm>
#include <iostream>

FileReader::~FileReader() {
    close();
}

bool FileReader::open(const std::string& path) {
    close();

    struct stat st{};
    if (::stat(path.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) return false;

    f.open(path, std::ios::binary);
    if (!f) return false;
    file_size = (uint64_t)st.st_size;
    return true;
}

bool FileReader::read_at(uint64_t offset, size_t length, std::vector<uint8_t>& out) {
    out.clear();
    if (!f.is_open()) return false;
    if (offset >= file_size) return true;

    uint64_t avail = file_size - offset;
    size_t want = (size_t)std::min<uint64_t>(avail, length);
    out.resize(want);

    f.clear();
    f.seekg((std::streamoff)offset, std::ios::beg);
    f.read(reinterpret_cast<char*>(out.data()), (std::streamsize)want);
    std::streamsize got = f.gcount();
    if (got != (std::streamsize)want) {
        std::cerr << "Short read at offset " << offset << ": got " << got
                  << " of " << want << " bytes\n";
        out.resize(got > 0 ? (size_t)got : 0);
        return false;
    }
    return true;
}

void FileReader::close() {
    if (f.is_open()) f.close();
    file_size = 0;
}
