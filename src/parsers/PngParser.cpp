#include "Parsers.h"
#include "ByteReader.h"
#include "Signatures.h"
#include <cstring>

namespace {
    constexpr size_t HEADER_LEN = 8;
    constexpr uint32_t IHDR_LEN = 13;

    bool chunk_type_is(const uint8_t* p, const char* type) {
        return std::memcmp(p, type, 4) == 0;
    }
}

ParseResult<PngRecord> PngParser::run(const std::string& path) const {
    MappedFile file(path);
    const uint8_t* data = file.data();
    const uint64_t n = file.size();

    if (n < HEADER_LEN + 12 || std::memcmp(data, Sig::Bin::PNG.data(), HEADER_LEN) != 0)
        return ParseResult<PngRecord>::failure("missing PNG signature or truncated");

    PngRecord r;
    r.header_ok = true;

    // First chunk must be IHDR with a 13-byte body. The walk moves past it
    // whatever it turns out to be.
    uint64_t pos = HEADER_LEN;
    const uint32_t first_len = read_be32(data + pos);
    if (chunk_type_is(data + pos + 4, "IHDR") && first_len == IHDR_LEN && pos + 12 + first_len <= n)
        r.ihdr_ok = true;
    pos += 12 + static_cast<uint64_t>(first_len);
    r.chunks_count = 1;

    int steps = 0;
    while (pos + 8 <= n && steps < MAX_CHUNKS) {
        ++steps;
        const uint32_t length = read_be32(data + pos);
        const uint8_t* type = data + pos + 4;
        const uint64_t next_pos = pos + 12 + static_cast<uint64_t>(length);
        if (next_pos > n) break;

        ++r.chunks_count;
        if (chunk_type_is(type, "IDAT")) {
            ++r.idat_count;
        }
        else if (chunk_type_is(type, "IEND")) {
            r.end_iend_ok = true;
            break;
        }
        pos = next_pos;
    }

    r.parser_ok = r.header_ok && r.ihdr_ok && r.chunks_count >= 2;
    r.structure_consistent = r.parser_ok && r.idat_count >= 1 && r.end_iend_ok;
    return ParseResult<PngRecord>::success(r);
}
