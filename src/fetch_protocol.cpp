#include "fetch_protocol.h"

#include <arpa/inet.h>
#include <zlib.h>

#include <cctype>
#include <chrono>
#include <cstring>
#include <sstream>

using Clock = std::chrono::steady_clock;

namespace {

// Header in network order with the checksum field zeroed.
FetchHeader wire_header(const FetchFrame& f, uint16_t payload_size) {
    FetchHeader h{};
    h.magic = htons(f.magic);
    h.type = f.type;
    h.seq = htonl(f.seq);
    h.payload_size = htons(payload_size);
    h.total = htonl(f.total);
    h.flags = f.flags;
    h.checksum = 0;
    return h;
}

uint32_t checksum_over(const FetchHeader& h, const std::vector<uint8_t>& payload) {
    uLong crc = crc32(0L, Z_NULL, 0);
    crc = crc32(crc, reinterpret_cast<const Bytef*>(&h), (uInt)kFetchCheckedHeaderSize);
    if (!payload.empty()) {
        crc = crc32(crc, payload.data(), (uInt)payload.size());
    }
    return static_cast<uint32_t>(crc & 0xFFFFFFFFu);
}

std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

std::string upper(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return s;
}

} // namespace

const char* fetch_frame_error_str(FrameError e) {
    switch (e) {
    case FrameError::None: return "ok";
    case FrameError::Malformed: return "malformed packet";
    case FrameError::Truncated: return "truncated payload";
    case FrameError::InvalidMagic: return "invalid magic";
    case FrameError::ChecksumMismatch: return "checksum mismatch";
    case FrameError::UnknownType: return "unknown packet type";
    }
    return "?";
}

uint32_t fetch_now_ms() {
    auto now = Clock::now().time_since_epoch();
    return static_cast<uint32_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(now).count()
    );
}

uint32_t fetch_crc32(const uint8_t* data, size_t len) {
    uLong crc = crc32(0L, Z_NULL, 0);
    crc = crc32(crc, data, (uInt)len);
    return static_cast<uint32_t>(crc & 0xFFFFFFFFu);
}

std::string fetch_addr_to_string(const sockaddr_in& a) {
    char buf[INET_ADDRSTRLEN];
    inet_ntop(AF_INET, &a.sin_addr, buf, sizeof(buf));
    std::ostringstream oss;
    oss << buf << ":" << ntohs(a.sin_port);
    return oss.str();
}

uint32_t fetch_frame_checksum(const FetchFrame& f) {
    return checksum_over(wire_header(f, f.payload_size), f.payload);
}

void fetch_seal(FetchFrame& f) {
    f.payload_size = static_cast<uint16_t>(f.payload.size());
    f.checksum = fetch_frame_checksum(f);
}

std::vector<uint8_t> fetch_encode(const FetchFrame& f) {
    const uint16_t size = static_cast<uint16_t>(f.payload.size());
    FetchHeader h = wire_header(f, size);
    h.checksum = htonl(checksum_over(h, f.payload));

    std::vector<uint8_t> out(kFetchHeaderSize + size);
    std::memcpy(out.data(), &h, kFetchHeaderSize);
    if (size > 0) std::memcpy(out.data() + kFetchHeaderSize, f.payload.data(), size);
    return out;
}

FrameError fetch_decode(const uint8_t* buf, size_t len, FetchFrame& out) {
    if (len < kFetchHeaderSize) return FrameError::Malformed;

    FetchHeader h{};
    std::memcpy(&h, buf, kFetchHeaderSize);

    out.magic = ntohs(h.magic);
    out.type = h.type;
    out.seq = ntohl(h.seq);
    out.payload_size = ntohs(h.payload_size);
    out.total = ntohl(h.total);
    out.flags = h.flags;
    out.checksum = ntohl(h.checksum);

    if (len < kFetchHeaderSize + out.payload_size) return FrameError::Truncated;
    out.payload.assign(buf + kFetchHeaderSize, buf + kFetchHeaderSize + out.payload_size);
    return FrameError::None;
}

FrameError fetch_validate(const FetchFrame& f) {
    if (f.magic != kFetchMagic) return FrameError::InvalidMagic;
    if (fetch_frame_checksum(f) != f.checksum) return FrameError::ChecksumMismatch;
    if (f.type > TYPE_ERROR) return FrameError::UnknownType;
    return FrameError::None;
}

FrameError fetch_parse(const uint8_t* buf, size_t len, FetchFrame& out) {
    FrameError e = fetch_decode(buf, len, out);
    if (e != FrameError::None) return e;
    return fetch_validate(out);
}

FetchFrame fetch_make_request(const std::string& text) {
    FetchFrame f;
    f.type = TYPE_REQUEST;
    f.payload.assign(text.begin(), text.end());
    fetch_seal(f);
    return f;
}

FetchFrame fetch_make_data(uint32_t seq, uint32_t total, bool last,
                           std::vector<uint8_t> bytes) {
    FetchFrame f;
    f.type = TYPE_DATA;
    f.seq = seq;
    f.total = total;
    f.flags = last ? FLAG_LAST : FLAG_NORMAL;
    f.payload = std::move(bytes);
    fetch_seal(f);
    return f;
}

FetchFrame fetch_make_ack(uint32_t seq) {
    FetchFrame f;
    f.type = TYPE_ACK;
    f.seq = seq;
    fetch_seal(f);
    return f;
}

FetchFrame fetch_make_error(const std::string& message) {
    FetchFrame f;
    f.type = TYPE_ERROR;
    f.payload.assign(message.begin(), message.end());
    fetch_seal(f);
    return f;
}

bool fetch_parse_request(const std::string& text, FetchRequest& out, std::string& error) {
    std::istringstream iss(trim(text));
    std::string verb, arg, extra;
    if (!(iss >> verb >> arg) || (iss >> extra)) {
        error = "malformed request: '" + text + "'";
        return false;
    }

    verb = upper(verb);
    if (verb == "GET") {
        size_t start = arg.find_first_not_of('/');
        std::string name = (start == std::string::npos) ? std::string() : arg.substr(start);
        if (name.empty() || name == "." || name == ".." ||
            name.find('/') != std::string::npos) {
            error = "invalid file name: '" + arg + "'";
            return false;
        }
        out.kind = RequestKind::Get;
        out.name = name;
        return true;
    }

    if (verb == "RESEND") {
        if (arg.empty() || arg.size() > 10 ||
            arg.find_first_not_of("0123456789") != std::string::npos) {
            error = "invalid segment number: '" + arg + "'";
            return false;
        }
        unsigned long long v = std::stoull(arg);
        if (v > 0xFFFFFFFFull) {
            error = "invalid segment number: '" + arg + "'";
            return false;
        }
        out.kind = RequestKind::Resend;
        out.seq = static_cast<uint32_t>(v);
        return true;
    }

    error = "unknown command: '" + verb + "'";
    return false;
}
