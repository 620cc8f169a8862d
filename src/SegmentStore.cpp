#include "SegmentStore.h"

bool SegmentStore::put(uint32_t seq, const std::vector<uint8_t>& bytes) {
    auto res = segs.emplace(seq, bytes);
    if (!res.second) return false;
    total_bytes += bytes.size();
    return true;
}

const std::vector<uint8_t>* SegmentStore::get(uint32_t seq) const {
    auto it = segs.find(seq);
    if (it == segs.end()) return nullptr;
    return &it->second;
}

std::vector<uint32_t> SegmentStore::missing(uint32_t total) const {
    std::vector<uint32_t> out;
    auto it = segs.begin();
    for (uint32_t seq = 0; seq < total; ++seq) {
        while (it != segs.end() && it->first < seq) ++it;
        if (it == segs.end() || it->first != seq) out.push_back(seq);
    }
    return out;
}

int64_t SegmentStore::write_to(std::ostream& os) const {
    int64_t written = 0;
    for (auto& kv : segs) {
        const auto& b = kv.second;
        if (b.empty()) continue;
        os.write(reinterpret_cast<const char*>(b.data()), (std::streamsize)b.size());
        if (!os) return -1;
        written += (int64_t)b.size();
    }
    return written;
}

void SegmentStore::clear() {
    segs.clear();
    total_bytes = 0;
}
