#pragma once

#include "TransferObserver.h"

#include <chrono>
#include <cstdint>
#include <ctime>
#include <set>
#include <string>

// Collects segment outcomes for one download and, on summarize(), writes
// log_<file>_<stamp>.json and report_<file>_<stamp>.txt under `dir`.
class TransferReport : public TransferObserver {
public:
    TransferReport(std::string file_name, std::string dir);

    void segment_delivered(uint32_t seq) override;
    void segment_lost(uint32_t seq) override;
    void segment_recovered(uint32_t seq) override;
    void summarize(uint32_t total_segments, std::chrono::milliseconds elapsed) override;

    const std::set<uint32_t>& delivered() const { return delivered_set; }
    const std::set<uint32_t>& lost() const { return lost_set; }
    const std::set<uint32_t>& recovered() const { return recovered_set; }
    std::set<uint32_t> unrecovered() const;

    bool written() const { return ok; }
    const std::string& json_path() const { return json_out; }
    const std::string& text_path() const { return text_out; }

private:
    bool write_json(uint32_t total, double seconds, std::time_t end) const;
    bool write_text(uint32_t total, double seconds, std::time_t end) const;

private:
    std::string name;
    std::string dir;
    std::time_t started;
    std::set<uint32_t> delivered_set;
    std::set<uint32_t> lost_set;
    std::set<uint32_t> recovered_set;

    std::string json_out;
    std::string text_out;
    bool ok = false;
};
