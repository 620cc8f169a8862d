#pragma once

#include <cstddef>
#include <cstdint>
#include <netinet/in.h>
#include <string>
#include <vector>

#pragma pack(push, 1)
struct FetchHeader {
    uint16_t magic;        // Sentinel (network order)
    uint8_t  type;         // REQUEST / DATA / ACK / ERROR
    uint32_t seq;          // Segment index (network order)
    uint16_t payload_size; // Bytes following the header (network order)
    uint32_t total;        // Segment count, DATA only (network order)
    uint8_t  flags;        // Bit flags
    uint32_t checksum;     // CRC32 over the fields above + payload (network order)
};
#pragma pack(pop)

static_assert(sizeof(FetchHeader) == 18, "FetchHeader must be 18 bytes");

constexpr uint16_t kFetchMagic = 0x0000;
constexpr size_t kFetchHeaderSize = sizeof(FetchHeader);
constexpr size_t kFetchCheckedHeaderSize = kFetchHeaderSize - sizeof(uint32_t);

// 1500 (MTU) - 20 (IPv4) - 8 (UDP) - 18 (header)
constexpr size_t kFetchDefaultSegment = 1500 - 20 - 8 - kFetchHeaderSize;
constexpr size_t kFetchMaxSegment = 65507 - kFetchHeaderSize;

enum : uint8_t {
    TYPE_REQUEST = 0,
    TYPE_DATA    = 1,
    TYPE_ACK     = 2,
    TYPE_ERROR   = 3,
};

// Flags
enum : uint8_t {
    FLAG_NORMAL = 0x00,
    FLAG_LAST   = 0x01,
};

struct FetchFrame {
    uint16_t magic = kFetchMagic;
    uint8_t type = TYPE_REQUEST;
    uint32_t seq = 0;
    uint16_t payload_size = 0;
    uint32_t total = 0;
    uint8_t flags = FLAG_NORMAL;
    uint32_t checksum = 0;
    std::vector<uint8_t> payload;

    bool is_last() const { return (flags & FLAG_LAST) != 0; }
    std::string text() const { return std::string(payload.begin(), payload.end()); }

    bool operator==(const FetchFrame& o) const {
        return magic == o.magic && type == o.type && seq == o.seq &&
               payload_size == o.payload_size && total == o.total &&
               flags == o.flags && checksum == o.checksum && payload == o.payload;
    }
    bool operator!=(const FetchFrame& o) const { return !(*this == o); }
};

enum class FrameError {
    None,
    Malformed,        // shorter than the fixed header
    Truncated,        // shorter than header + payload_size
    InvalidMagic,     // foreign traffic
    ChecksumMismatch, // corrupted in transit
    UnknownType,
};

const char* fetch_frame_error_str(FrameError e);

// Utilities
uint32_t fetch_now_ms();
uint32_t fetch_crc32(const uint8_t* data, size_t len);
std::string fetch_addr_to_string(const sockaddr_in& a);

// CRC32 over the header (checksum field excluded) followed by the payload.
uint32_t fetch_frame_checksum(const FetchFrame& f);

// Fills in payload_size and checksum from the payload and header fields.
void fetch_seal(FetchFrame& f);

std::vector<uint8_t> fetch_encode(const FetchFrame& f);

// Structural decode only. Bytes beyond payload_size are ignored.
FrameError fetch_decode(const uint8_t* buf, size_t len, FetchFrame& out);
FrameError fetch_validate(const FetchFrame& f);
FrameError fetch_parse(const uint8_t* buf, size_t len, FetchFrame& out);

FetchFrame fetch_make_request(const std::string& text);
FetchFrame fetch_make_data(uint32_t seq, uint32_t total, bool last,
                           std::vector<uint8_t> bytes);
FetchFrame fetch_make_ack(uint32_t seq);
FetchFrame fetch_make_error(const std::string& message);

enum class RequestKind { Get, Resend };

struct FetchRequest {
    RequestKind kind = RequestKind::Get;
    std::string name; // GET: file name without leading '/'
    uint32_t seq = 0; // RESEND: segment to re-serve
};

// "GET /<name>" | "RESEND <seq>". On failure `error` says why.
bool fetch_parse_request(const std::string& text, FetchRequest& out, std::string& error);
