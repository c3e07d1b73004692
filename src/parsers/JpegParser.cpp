#include "Parsers.h"
#include "ByteReader.h"
#include <cstring>

namespace {
    constexpr uint8_t SOI = 0xD8;
    constexpr uint8_t EOI = 0xD9;
    constexpr uint8_t SOS = 0xDA;
    constexpr uint8_t TEM = 0x01;
    constexpr uint8_t RST0 = 0xD0;
    constexpr uint8_t RST7 = 0xD7;
    constexpr uint8_t APP1 = 0xE1;

    bool is_sof(uint8_t m) {
        // C4 (DHT), C8 (JPG) and CC (DAC) share the range but are not frames
        return m >= 0xC0 && m <= 0xCF && m != 0xC4 && m != 0xC8 && m != 0xCC;
    }
}

ParseResult<JpegRecord> JpegParser::run(const std::string& path) const {
    MappedFile file(path);
    const uint8_t* data = file.data();
    const size_t n = file.size();

    if (n < 2 || data[0] != 0xFF || data[1] != SOI)
        return ParseResult<JpegRecord>::failure("missing SOI");

    JpegRecord r;
    r.header_ok = true;

    size_t pos = 2;
    int steps = 0;
    while (pos < n && steps < MAX_STEPS) {
        ++steps;

        if (data[pos] != 0xFF) {
            // entropy-coded data after SOS is not walked
            if (r.sos_present) break;
            const void* ff = std::memchr(data + pos, 0xFF, n - pos);
            if (!ff) break;
            pos = static_cast<size_t>(static_cast<const uint8_t*>(ff) - data);
        }

        while (pos < n && data[pos] == 0xFF) ++pos;  // fill bytes
        if (pos >= n) break;

        const uint8_t marker = data[pos++];

        if ((marker >= RST0 && marker <= RST7) || marker == TEM || marker == SOI) {
            ++r.segments_count;
            continue;
        }
        if (marker == EOI) {
            ++r.segments_count;
            break;
        }

        if (pos + 2 > n) break;
        const uint16_t seg_len = read_be16(data + pos);
        const size_t seg_data_start = pos + 2;
        if (seg_len < 2) break;
        const size_t seg_data_end = seg_data_start + (seg_len - 2);
        if (seg_data_end > n) break;

        if (is_sof(marker)) r.sof_present = true;
        if (marker == SOS) r.sos_present = true;
        if (marker == APP1 && seg_data_start + 6 <= n &&
            std::memcmp(data + seg_data_start, "Exif\0\0", 6) == 0)
            r.exif_present = true;

        ++r.segments_count;
        if (marker == SOS) break;
        pos = seg_data_end;
    }

    r.parser_ok = r.header_ok && (r.sof_present || r.sos_present) && r.segments_count >= 3;
    r.structure_consistent = r.header_ok && r.sof_present && r.sos_present && r.segments_count >= 4;
    return ParseResult<JpegRecord>::success(r);
}
