#pragma once
// CompoundFile.h: read-only view of an OLE2 / Compound File Binary container.
//
// Sectors are addressed by index into an in-memory image; the FAT is decoded
// once into a flat table and every chain walk is bounded by MAX_SECTORS and a
// visited set, so crafted next-pointers cannot loop.

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "ParseResult.h"

struct CfbHeader {
    uint32_t sector_size = 512;
    uint32_t mini_sector_size = 64;
    uint32_t num_dir_sectors = 0;
    uint32_t num_fat_sectors = 0;
    uint32_t first_dir_sector = 0;
    uint32_t mini_stream_cutoff = 4096;
    uint32_t first_minifat = 0;
    uint32_t num_minifat_sectors = 0;
    uint32_t first_difat = 0;
    uint32_t num_difat_sectors = 0;
    std::array<uint32_t, 109> difat{};
};

enum class CfbObjectType : uint8_t { UNUSED = 0, STORAGE = 1, STREAM = 2, ROOT = 5 };

struct CfbDirEntry {
    std::string name;  // UTF-16LE decoded to Latin-1, trailing NULs stripped
    CfbObjectType type = CfbObjectType::UNUSED;
    uint32_t start_sector = 0;
    uint64_t size = 0;
};

struct CfbDirectory {
    bool ok = false;  // false on a short stream or an unknown object type
    std::vector<CfbDirEntry> entries;  // up to (not including) the first bad entry
};

class CompoundFile {
public:
    static constexpr uint32_t FREESECT = 0xFFFFFFFF;
    static constexpr uint32_t ENDOFCHAIN = 0xFFFFFFFE;
    static constexpr uint32_t FATSECT = 0xFFFFFFFD;
    static constexpr uint32_t DIFSECT = 0xFFFFFFFC;
    static constexpr size_t HEADER_SIZE = 512;
    static constexpr size_t DIR_ENTRY_SIZE = 128;
    static constexpr size_t MAX_SECTORS = 8192;

    // Parses the header and builds the FAT. Fails only on a missing signature,
    // a short header or an unusable sector shift; a broken FAT is reported
    // through fat_ok().
    static ParseResult<CompoundFile> open(const uint8_t* data, size_t size);

    const CfbHeader& header() const { return m_header; }
    bool fat_ok() const { return m_fat_ok; }
    const std::vector<uint32_t>& fat() const { return m_fat; }

    // Whole sector `index`, empty if it lies outside the image.
    std::string read_sector(uint32_t index) const;

    // Concatenation of the FAT chain starting at `start`.
    std::string follow_chain(uint32_t start, size_t max_bytes = SIZE_MAX) const;

    // Directory stream split into 128-byte entries.
    CfbDirectory directory() const;

    // No MiniFAT declared, or its first sector is readable.
    bool mini_fat_ok() const;

    // First `max_bytes` of a stream entry, from the mini stream when the
    // stream is smaller than the cutoff.
    std::string read_stream(const CfbDirEntry& entry, size_t max_bytes) const;

private:
    CompoundFile(const uint8_t* data, size_t size) : m_data(data), m_size(size) {}
    void build_fat();
    std::string read_mini_stream(const CfbDirEntry& entry, size_t max_bytes) const;

    const uint8_t* m_data;
    size_t m_size;
    CfbHeader m_header;
    std::vector<uint32_t> m_fat;
    bool m_fat_ok = false;
};
