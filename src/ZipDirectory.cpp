#include "ZipDirectory.h"
#include "ByteReader.h"
#include <algorithm>
#include <cstring>

namespace ZipDirectory {

std::optional<ZipEocd> find_eocd(const uint8_t* data, size_t size) {
    if (size < sizeof(ZipEocdRecord)) return std::nullopt;
    const size_t search = size < MAX_EOCD_SEARCH ? size : MAX_EOCD_SEARCH;
    const size_t base = size - search;

    // reverse scan for "PK\x05\x06"
    for (size_t i = search - 4 + 1; i-- > 0;) {
        const uint8_t* p = data + base + i;
        if (read_le32(p) != ZipSig::EOCD) continue;
        size_t pos = base + i;
        if (pos + sizeof(ZipEocdRecord) > size) return std::nullopt;
        ZipEocd e;
        e.position = pos;
        std::memcpy(&e.record, data + pos, sizeof(ZipEocdRecord));
        return e;
    }
    return std::nullopt;
}

std::vector<ZipCdEntry> read_entries(const uint8_t* data, size_t size, const ZipEocdRecord& eocd,
                                     bool* complete) {
    std::vector<ZipCdEntry> out;
    if (complete) *complete = false;
    if (eocd.cd_offset >= size) return out;
    const uint8_t* cd = data + eocd.cd_offset;
    const size_t len = static_cast<size_t>(std::min<uint64_t>(eocd.cd_size, size - eocd.cd_offset));

    size_t pos = 0;
    bool clean = false;
    while (true) {
        if (pos >= len) { clean = true; break; }
        if (pos + sizeof(ZipCentralDirHeader) > len) break;
        ZipCentralDirHeader h;
        std::memcpy(&h, cd + pos, sizeof(h));
        if (h.signature != ZipSig::CDH) break;

        size_t name_start = pos + sizeof(ZipCentralDirHeader);
        size_t name_end = name_start + h.filename_length;
        if (name_end > len) break;

        ZipCdEntry entry;
        entry.flags = h.flags;
        entry.crc32 = h.crc32;
        entry.name.assign(reinterpret_cast<const char*>(cd + name_start), h.filename_length);
        size_t extra_end = std::min(name_end + h.extra_length, len);
        entry.extra.assign(reinterpret_cast<const char*>(cd + name_end), extra_end - name_end);
        out.push_back(std::move(entry));

        pos += sizeof(ZipCentralDirHeader) + h.filename_length + h.extra_length + h.comment_length;
        if (eocd.entries_total != 0 && out.size() >= eocd.entries_total) { clean = true; break; }
    }
    if (complete) *complete = clean;
    return out;
}

}
