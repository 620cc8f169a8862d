#include "TransferReport.h"

#include <errno.h>
#include <sys/stat.h>
#include <sys/types.h>

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <sstream>
#include <utility>

namespace {

std::string format_time(std::time_t t, const char* fmt) {
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[64];
    std::strftime(buf, sizeof(buf), fmt, &tm);
    return buf;
}

std::string base_name(const std::string& path) {
    size_t pos = path.find_last_of('/');
    return pos == std::string::npos ? path : path.substr(pos + 1);
}

std::string json_escape(const std::string& s) {
    std::ostringstream oss;
    for (unsigned char c : s) {
        switch (c) {
        case '"': oss << "\\\""; break;
        case '\\': oss << "\\\\"; break;
        case '\n': oss << "\\n"; break;
        case '\r': oss << "\\r"; break;
        case '\t': oss << "\\t"; break;
        default:
            if (c < 0x20) {
                oss << "\\u" << std::hex << std::setw(4) << std::setfill('0') << (int)c
                    << std::dec << std::setfill(' ');
            } else {
                oss << c;
            }
        }
    }
    return oss.str();
}

std::string json_list(const std::set<uint32_t>& s) {
    std::ostringstream oss;
    oss << "[";
    bool first = true;
    for (uint32_t v : s) {
        if (!first) oss << ", ";
        oss << v;
        first = false;
    }
    oss << "]";
    return oss.str();
}

double percent(size_t part, size_t whole, double if_empty) {
    if (whole == 0) return if_empty;
    return 100.0 * (double)part / (double)whole;
}

bool ensure_dir(const std::string& dir) {
    if (dir.empty()) return true;
    if (::mkdir(dir.c_str(), 0755) == 0 || errno == EEXIST) return true;
    perror(("mkdir " + dir).c_str());
    return false;
}

} // namespace

TransferReport::TransferReport(std::string file_name, std::string report_dir)
    : name(std::move(file_name)), dir(std::move(report_dir)), started(std::time(nullptr)) {}

void TransferReport::segment_delivered(uint32_t seq) {
    delivered_set.insert(seq);
}

void TransferReport::segment_lost(uint32_t seq) {
    lost_set.insert(seq);
}

void TransferReport::segment_recovered(uint32_t seq) {
    recovered_set.insert(seq);
}

std::set<uint32_t> TransferReport::unrecovered() const {
    std::set<uint32_t> out;
    std::set_difference(lost_set.begin(), lost_set.end(),
                        recovered_set.begin(), recovered_set.end(),
                        std::inserter(out, out.end()));
    return out;
}

void TransferReport::summarize(uint32_t total_segments, std::chrono::milliseconds elapsed) {
    std::time_t end = std::time(nullptr);
    double seconds = (double)elapsed.count() / 1000.0;

    if (!ensure_dir(dir)) {
        ok = false;
        return;
    }

    std::string stamp = format_time(started, "%Y%m%d_%H%M%S");
    std::string prefix = dir.empty() ? std::string() : dir + "/";
    json_out = prefix + "log_" + base_name(name) + "_" + stamp + ".json";
    text_out = prefix + "report_" + base_name(name) + "_" + stamp + ".txt";

    ok = write_json(total_segments, seconds, end) && write_text(total_segments, seconds, end);
    if (ok) std::cerr << "Report written to " << text_out << "\n";
}

bool TransferReport::write_json(uint32_t total, double seconds, std::time_t end) const {
    std::ofstream out(json_out, std::ios::trunc);
    if (!out) {
        std::cerr << "Failed to open report file: " << json_out << "\n";
        return false;
    }

    std::set<uint32_t> missing = unrecovered();
    out << std::fixed << std::setprecision(3);
    out << "{\n"
        << "    \"file\": \"" << json_escape(name) << "\",\n"
        << "    \"started_at\": \"" << format_time(started, "%Y-%m-%dT%H:%M:%S") << "\",\n"
        << "    \"finished_at\": \"" << format_time(end, "%Y-%m-%dT%H:%M:%S") << "\",\n"
        << "    \"duration_seconds\": " << seconds << ",\n"
        << "    \"total_segments\": " << total << ",\n"
        << "    \"segments_delivered\": " << delivered_set.size() << ",\n"
        << "    \"segments_lost\": " << lost_set.size() << ",\n"
        << "    \"segments_recovered\": " << recovered_set.size() << ",\n"
        << "    \"segments_unrecovered\": " << missing.size() << ",\n"
        << "    \"success_percent\": " << percent(delivered_set.size(), total, 0.0) << ",\n"
        << "    \"lost_percent\": " << percent(lost_set.size(), total, 0.0) << ",\n"
        << "    \"recovered_percent\": " << percent(recovered_set.size(), lost_set.size(), 100.0) << ",\n"
        << "    \"delivered\": " << json_list(delivered_set) << ",\n"
        << "    \"lost\": " << json_list(lost_set) << ",\n"
        << "    \"recovered\": " << json_list(recovered_set) << ",\n"
        << "    \"unrecovered\": " << json_list(missing) << "\n"
        << "}\n";
    return (bool)out;
}

bool TransferReport::write_text(uint32_t total, double seconds, std::time_t end) const {
    std::ofstream out(text_out, std::ios::trunc);
    if (!out) {
        std::cerr << "Failed to open report file: " << text_out << "\n";
        return false;
    }

    out << std::fixed << std::setprecision(1);
    out << "Transfer report - " << name << "\n"
        << "Started:  " << format_time(started, "%Y-%m-%d %H:%M:%S") << "\n"
        << "Finished: " << format_time(end, "%Y-%m-%d %H:%M:%S") << "\n"
        << std::setprecision(2) << "Duration: " << seconds << " seconds\n\n"
        << std::setprecision(1)
        << "Statistics:\n"
        << "- Total segments:       " << total << "\n"
        << "- Segments delivered:   " << delivered_set.size()
        << " (" << percent(delivered_set.size(), total, 0.0) << "%)\n"
        << "- Segments lost:        " << lost_set.size()
        << " (" << percent(lost_set.size(), total, 0.0) << "%)\n"
        << "- Segments recovered:   " << recovered_set.size()
        << " (" << percent(recovered_set.size(), lost_set.size(), 100.0) << "% of lost)\n"
        << "- Segments unrecovered: " << unrecovered().size() << "\n";
    return (bool)out;
}
