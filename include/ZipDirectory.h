#pragma once
// ZipDirectory.h: End-Of-Central-Directory lookup and central-directory walk.
// Layout per PKWARE APPNOTE 4.3.12 / 4.3.16.

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#pragma pack(push, 1)
struct ZipEocdRecord {
    uint32_t signature;            // 0x06054b50
    uint16_t disk_number;
    uint16_t cd_start_disk;
    uint16_t entries_on_disk;
    uint16_t entries_total;
    uint32_t cd_size;
    uint32_t cd_offset;
    uint16_t comment_length;
};

struct ZipCentralDirHeader {
    uint32_t signature;            // 0x02014b50
    uint16_t version_made_by;
    uint16_t version_needed;
    uint16_t flags;
    uint16_t compression;
    uint16_t mod_time;
    uint16_t mod_date;
    uint32_t crc32;
    uint32_t compressed_size;
    uint32_t uncompressed_size;
    uint16_t filename_length;
    uint16_t extra_length;
    uint16_t comment_length;
    uint16_t disk_number_start;
    uint16_t internal_attrs;
    uint32_t external_attrs;
    uint32_t local_header_offset;
};
#pragma pack(pop)

static_assert(sizeof(ZipEocdRecord) == 22, "EOCD fixed part is 22 bytes");
static_assert(sizeof(ZipCentralDirHeader) == 46, "CDH fixed part is 46 bytes");

namespace ZipSig {
    constexpr uint32_t EOCD = 0x06054B50;
    constexpr uint32_t CDH = 0x02014B50;
    constexpr uint32_t LFH = 0x04034B50;
}

struct ZipCdEntry {
    uint16_t flags = 0;
    uint32_t crc32 = 0;
    std::string name;
    std::string extra;
};

struct ZipEocd {
    uint64_t position = 0;  // file offset of the record
    ZipEocdRecord record{};
};

namespace ZipDirectory {
    constexpr size_t MAX_EOCD_SEARCH = 0x10000 + 22;

    // Last EOCD signature within the final MAX_EOCD_SEARCH bytes, with its
    // full 22-byte body in bounds.
    std::optional<ZipEocd> find_eocd(const uint8_t* data, size_t size);

    // Central-directory records inside [cd_offset, cd_offset + cd_size),
    // stopping at the first bad signature, a name running out of bounds, or
    // entries_total records (when nonzero). `complete`, when given, is set to
    // whether the walk reached entries_total or the end of the directory
    // without such a stop.
    std::vector<ZipCdEntry> read_entries(const uint8_t* data, size_t size, const ZipEocdRecord& eocd,
                                         bool* complete = nullptr);
}
