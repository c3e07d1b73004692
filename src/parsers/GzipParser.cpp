#include "Parsers.h"
#include "ByteReader.h"

namespace {
    constexpr uint8_t ID1 = 0x1F;
    constexpr uint8_t ID2 = 0x8B;
    constexpr uint8_t CM_DEFLATE = 8;

    constexpr uint8_t FHCRC = 0x02;
    constexpr uint8_t FEXTRA = 0x04;
    constexpr uint8_t FNAME = 0x08;
    constexpr uint8_t FCOMMENT = 0x10;

    constexpr size_t BASE_HDR_LEN = 10;
}

std::optional<size_t> GzipParser::header_end(const uint8_t* data, size_t n, bool& name_present) {
    name_present = false;
    if (n < BASE_HDR_LEN) return std::nullopt;
    const uint8_t flg = data[3];
    size_t pos = BASE_HDR_LEN;

    if (flg & FEXTRA) {
        if (pos + 2 > n) return std::nullopt;
        pos += 2 + read_le16(data + pos);
        if (pos > n) return std::nullopt;
    }

    if (flg & FNAME) {
        const size_t start = pos;
        while (pos < n && data[pos] != 0) ++pos;
        if (pos >= n) return std::nullopt;
        name_present = pos > start;
        ++pos;
    }

    if (flg & FCOMMENT) {
        while (pos < n && data[pos] != 0) ++pos;
        if (pos >= n) return std::nullopt;
        ++pos;
    }

    if (flg & FHCRC) {
        if (pos + 2 > n) return std::nullopt;
        pos += 2;
    }
    return pos;
}

ParseResult<GzipRecord> GzipParser::run(const std::string& path) const {
    const std::string buf = read_window(path, 0, MAX_READ);
    if (buf.size() < BASE_HDR_LEN)
        return ParseResult<GzipRecord>::failure("shorter than the 10-byte member header", buf.size());

    const uint8_t* data = as_bytes(buf);
    const size_t n = buf.size();

    GzipRecord r;
    r.header_ok = data[0] == ID1 && data[1] == ID2 && data[2] == CM_DEFLATE;
    r.mtime_present = read_le32(data + 4) != 0;
    r.parser_ok = r.header_ok;
    r.structure_consistent = r.header_ok;

    // features read before a truncated optional field stand, so the
    // header end itself is not needed here
    header_end(data, n, r.name_present);
    return ParseResult<GzipRecord>::success(r);
}
