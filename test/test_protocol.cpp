#include "fetch_protocol.h"

#include <gtest/gtest.h>

#include <string>
#include <vector>

TEST(FetchProtocol, HeaderLayoutIsBigEndian) {
    FetchFrame f = fetch_make_data(0x01020304, 0x0A0B0C0D, true, {0xAA, 0xBB});
    std::vector<uint8_t> b = fetch_encode(f);

    ASSERT_EQ(b.size(), kFetchHeaderSize + 2);
    EXPECT_EQ(b[0], 0x00);                       // magic
    EXPECT_EQ(b[1], 0x00);
    EXPECT_EQ(b[2], TYPE_DATA);
    EXPECT_EQ(b[3], 0x01);                       // seq
    EXPECT_EQ(b[6], 0x04);
    EXPECT_EQ(b[7], 0x00);                       // payload size
    EXPECT_EQ(b[8], 0x02);
    EXPECT_EQ(b[9], 0x0A);                       // total
    EXPECT_EQ(b[12], 0x0D);
    EXPECT_EQ(b[13], FLAG_LAST);
    EXPECT_EQ(b[18], 0xAA);
    EXPECT_EQ(b[19], 0xBB);

    // CRC32 over header bytes [0, 14) followed by the payload.
    std::vector<uint8_t> covered(b.begin(), b.begin() + 14);
    covered.push_back(0xAA);
    covered.push_back(0xBB);
    uint32_t crc = fetch_crc32(covered.data(), covered.size());
    uint32_t wire = (uint32_t)b[14] << 24 | (uint32_t)b[15] << 16 | (uint32_t)b[16] << 8 | b[17];
    EXPECT_EQ(wire, crc);
    EXPECT_EQ(wire, f.checksum);
}

TEST(FetchProtocol, RoundTrip) {
    std::vector<FetchFrame> frames = {
        fetch_make_request("GET /teste_1mb.dat"),
        fetch_make_request("RESEND 17"),
        fetch_make_data(0, 1, true, {}),
        fetch_make_data(41, 99, false, std::vector<uint8_t>(kFetchDefaultSegment, 0x5A)),
        fetch_make_ack(12345),
        fetch_make_error("'missing.bin' not found"),
    };

    for (const auto& f : frames) {
        std::vector<uint8_t> bytes = fetch_encode(f);
        FetchFrame back;
        ASSERT_EQ(fetch_parse(bytes.data(), bytes.size(), back), FrameError::None);
        EXPECT_EQ(back, f);
    }
}

TEST(FetchProtocol, EverySingleBitFlipIsRejected) {
    FetchFrame f = fetch_make_data(7, 20, false, {'s', 'e', 'g', 'm', 'e', 'n', 't', '-', '7'});
    std::vector<uint8_t> good = fetch_encode(f);

    for (size_t bit = 0; bit < good.size() * 8; ++bit) {
        std::vector<uint8_t> bad = good;
        bad[bit / 8] ^= (uint8_t)(1u << (bit % 8));
        FetchFrame out;
        EXPECT_NE(fetch_parse(bad.data(), bad.size(), out), FrameError::None) << "bit " << bit;
    }
}

TEST(FetchProtocol, ShortInputIsMalformed) {
    std::vector<uint8_t> bytes = fetch_encode(fetch_make_ack(3));
    FetchFrame out;
    EXPECT_EQ(fetch_decode(bytes.data(), kFetchHeaderSize - 1, out), FrameError::Malformed);
    EXPECT_EQ(fetch_decode(bytes.data(), 0, out), FrameError::Malformed);
}

TEST(FetchProtocol, MissingPayloadBytesAreTruncated) {
    std::vector<uint8_t> bytes = fetch_encode(fetch_make_data(1, 2, true, {1, 2, 3, 4}));
    FetchFrame out;
    EXPECT_EQ(fetch_decode(bytes.data(), bytes.size() - 1, out), FrameError::Truncated);
}

TEST(FetchProtocol, BytesBeyondPayloadSizeAreIgnored) {
    FetchFrame f = fetch_make_data(1, 2, true, {1, 2, 3, 4});
    std::vector<uint8_t> bytes = fetch_encode(f);
    bytes.push_back(0xEE);
    bytes.push_back(0xFF);

    FetchFrame out;
    ASSERT_EQ(fetch_parse(bytes.data(), bytes.size(), out), FrameError::None);
    EXPECT_EQ(out, f);
}

TEST(FetchProtocol, ForeignMagicIsRejected) {
    FetchFrame f = fetch_make_ack(9);
    f.magic = 0xBEEF;
    fetch_seal(f);
    std::vector<uint8_t> bytes = fetch_encode(f);

    FetchFrame out;
    EXPECT_EQ(fetch_parse(bytes.data(), bytes.size(), out), FrameError::InvalidMagic);
}

TEST(FetchProtocol, UnknownTypeIsReportedAfterChecksum) {
    FetchFrame f = fetch_make_ack(9);
    f.type = 9;
    std::vector<uint8_t> bytes = fetch_encode(f);

    FetchFrame out;
    EXPECT_EQ(fetch_parse(bytes.data(), bytes.size(), out), FrameError::UnknownType);
}

TEST(FetchProtocol, ParsesGetRequests) {
    FetchRequest req;
    std::string err;

    ASSERT_TRUE(fetch_parse_request("GET /teste_1mb.dat", req, err));
    EXPECT_EQ(req.kind, RequestKind::Get);
    EXPECT_EQ(req.name, "teste_1mb.dat");

    ASSERT_TRUE(fetch_parse_request("  get   report.txt \n", req, err));
    EXPECT_EQ(req.name, "report.txt");
}

TEST(FetchProtocol, ParsesResendRequests) {
    FetchRequest req;
    std::string err;

    ASSERT_TRUE(fetch_parse_request("RESEND 42", req, err));
    EXPECT_EQ(req.kind, RequestKind::Resend);
    EXPECT_EQ(req.seq, 42u);

    ASSERT_TRUE(fetch_parse_request("resend 4294967295", req, err));
    EXPECT_EQ(req.seq, 4294967295u);
}

TEST(FetchProtocol, RejectsBadRequests) {
    FetchRequest req;
    std::string err;
    const char* bad[] = {
        "", "GET", "GET /a b", "PUT /a", "GET /", "GET /../etc/passwd", "GET /dir/file",
        "GET ..", "RESEND", "RESEND -1", "RESEND x1", "RESEND 4294967296", "RESEND 1 2",
    };
    for (const char* text : bad) {
        EXPECT_FALSE(fetch_parse_request(text, req, err)) << text;
        EXPECT_FALSE(err.empty()) << text;
    }
}

TEST(FetchProtocol, DefaultSegmentFitsEthernetMtu) {
    EXPECT_EQ(kFetchDefaultSegment, 1454u);
    EXPECT_EQ(kFetchDefaultSegment + kFetchHeaderSize + 8 + 20, 1500u);
}
