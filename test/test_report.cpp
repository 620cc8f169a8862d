#include "TransferReport.h"
#include "test_util.h"

#include <gtest/gtest.h>

#include <chrono>
#include <string>

namespace {

std::string slurp(const std::string& path) {
    std::vector<uint8_t> b = read_file(path);
    return std::string(b.begin(), b.end());
}

} // namespace

TEST(TransferReport, UnrecoveredIsLostMinusRecovered) {
    TransferReport r("file.bin", "");
    r.segment_lost(2);
    r.segment_lost(5);
    r.segment_lost(9);
    r.segment_recovered(5);

    EXPECT_EQ(r.unrecovered(), (std::set<uint32_t>{2, 9}));
    EXPECT_FALSE(r.written());
}

TEST(TransferReport, WritesJsonAndTextReports) {
    TempDir tmp;
    std::string dir = tmp.file("logs");
    TransferReport r("sub/teste.dat", dir);
    for (uint32_t seq : {0u, 1u, 3u}) r.segment_delivered(seq);
    r.segment_lost(2);
    r.segment_lost(3);
    r.segment_recovered(3);

    r.summarize(4, std::chrono::milliseconds(1500));
    ASSERT_TRUE(r.written());

    EXPECT_EQ(r.json_path().rfind(dir + "/log_teste.dat_", 0), 0u);
    EXPECT_EQ(r.text_path().rfind(dir + "/report_teste.dat_", 0), 0u);
    ASSERT_TRUE(file_exists(r.json_path()));
    ASSERT_TRUE(file_exists(r.text_path()));

    std::string json = slurp(r.json_path());
    EXPECT_NE(json.find("\"file\": \"sub/teste.dat\""), std::string::npos);
    EXPECT_NE(json.find("\"duration_seconds\": 1.500"), std::string::npos);
    EXPECT_NE(json.find("\"total_segments\": 4"), std::string::npos);
    EXPECT_NE(json.find("\"segments_delivered\": 3"), std::string::npos);
    EXPECT_NE(json.find("\"success_percent\": 75.000"), std::string::npos);
    EXPECT_NE(json.find("\"recovered_percent\": 50.000"), std::string::npos);
    EXPECT_NE(json.find("\"lost\": [2, 3]"), std::string::npos);
    EXPECT_NE(json.find("\"unrecovered\": [2]"), std::string::npos);

    std::string text = slurp(r.text_path());
    EXPECT_NE(text.find("Transfer report - sub/teste.dat"), std::string::npos);
    EXPECT_NE(text.find("- Total segments:       4"), std::string::npos);
    EXPECT_NE(text.find("- Segments lost:        2 (50.0%)"), std::string::npos);
    EXPECT_NE(text.find("- Segments unrecovered: 1"), std::string::npos);
}

TEST(TransferReport, NothingLostCountsAsFullyRecovered) {
    TempDir tmp;
    TransferReport r("clean.bin", tmp.path);
    r.segment_delivered(0);
    r.summarize(1, std::chrono::milliseconds(10));

    ASSERT_TRUE(r.written());
    std::string json = slurp(r.json_path());
    EXPECT_NE(json.find("\"recovered_percent\": 100.000"), std::string::npos);
    EXPECT_NE(json.find("\"lost\": []"), std::string::npos);
}

TEST(TransferReport, UnwritableDirectoryIsReported) {
    TempDir tmp;
    std::string blocker = tmp.file("plain");
    ASSERT_TRUE(write_file(blocker, {'x'}));

    TransferReport r("x.bin", blocker + "/logs");
    r.summarize(1, std::chrono::milliseconds(1));
    EXPECT_FALSE(r.written());
}
