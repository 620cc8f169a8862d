#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <ostream>
#include <vector>

// Sequence number -> payload, kept in ascending order for assembly.
class SegmentStore {
public:
    // Returns false if `seq` is already stored; the first copy wins.
    bool put(uint32_t seq, const std::vector<uint8_t>& bytes);

    bool has(uint32_t seq) const { return segs.count(seq) != 0; }
    const std::vector<uint8_t>* get(uint32_t seq) const;
    size_t count() const { return segs.size(); }
    uint64_t bytes() const { return total_bytes; }

    // Sequences in [0, total) not yet stored, ascending.
    std::vector<uint32_t> missing(uint32_t total) const;

    // Writes stored segments in sequence order; returns bytes written or -1.
    int64_t write_to(std::ostream& os) const;

    void clear();

private:
    std::map<uint32_t, std::vector<uint8_t>> segs;
    uint64_t total_bytes = 0;
};
