#include "CompoundFile.h"
#include "ByteReader.h"
#include "Signatures.h"
#include <algorithm>
#include <cstring>
#include <unordered_set>

namespace {
    // Sector shifts outside this range never describe a readable image.
    constexpr uint16_t MIN_SECTOR_SHIFT = 7;
    constexpr uint16_t MAX_SECTOR_SHIFT = 30;

    bool is_terminal(uint32_t s) {
        return s == CompoundFile::FREESECT || s == CompoundFile::ENDOFCHAIN;
    }

    std::string decode_utf16_name(const uint8_t* p, size_t len) {
        std::string out;
        for (size_t i = 0; i + 1 < len; i += 2) {
            uint16_t unit = read_le16(p + i);
            out.push_back(unit < 0x100 ? static_cast<char>(unit) : '?');
        }
        while (!out.empty() && out.back() == '\0') out.pop_back();
        return out;
    }

    // Sector indices of a FAT chain, cycle-guarded.
    std::vector<uint32_t> chain_indices(const std::vector<uint32_t>& fat, uint32_t start) {
        std::vector<uint32_t> out;
        std::unordered_set<uint32_t> seen;
        uint32_t cur = start;
        while (!is_terminal(cur) && out.size() < CompoundFile::MAX_SECTORS) {
            if (cur >= fat.size() || !seen.insert(cur).second) break;
            out.push_back(cur);
            cur = fat[cur];
        }
        return out;
    }
}

ParseResult<CompoundFile> CompoundFile::open(const uint8_t* data, size_t size) {
    if (size < HEADER_SIZE)
        return ParseResult<CompoundFile>::failure("CFB header truncated", size);
    if (std::memcmp(data, Sig::Bin::OLE.data(), Sig::Bin::OLE.size()) != 0)
        return ParseResult<CompoundFile>::failure("CFB signature missing");

    CompoundFile cf(data, size);
    CfbHeader& h = cf.m_header;
    uint16_t sector_shift = read_le16(data + 0x1E);
    uint16_t mini_shift = read_le16(data + 0x20);
    h.sector_size = (sector_shift >= MIN_SECTOR_SHIFT && sector_shift <= MAX_SECTOR_SHIFT)
                    ? (1u << sector_shift) : 0;
    h.mini_sector_size = (mini_shift > 0 && mini_shift < sector_shift && mini_shift <= MAX_SECTOR_SHIFT)
                         ? (1u << mini_shift) : 0;
    h.num_dir_sectors = read_le32(data + 0x28);
    h.num_fat_sectors = read_le32(data + 0x2C);
    h.first_dir_sector = read_le32(data + 0x30);
    h.mini_stream_cutoff = read_le32(data + 0x38);
    h.first_minifat = read_le32(data + 0x3C);
    h.num_minifat_sectors = read_le32(data + 0x40);
    h.first_difat = read_le32(data + 0x44);
    h.num_difat_sectors = read_le32(data + 0x48);
    for (size_t i = 0; i < h.difat.size(); ++i) h.difat[i] = read_le32(data + 0x4C + i * 4);

    cf.build_fat();
    return ParseResult<CompoundFile>::success(std::move(cf));
}

std::string CompoundFile::read_sector(uint32_t index) const {
    const uint64_t ss = m_header.sector_size;
    if (ss == 0) return "";
    uint64_t off = HEADER_SIZE + static_cast<uint64_t>(index) * ss;
    if (off + ss > m_size) return "";
    return std::string(reinterpret_cast<const char*>(m_data + off), static_cast<size_t>(ss));
}

void CompoundFile::build_fat() {
    const uint32_t ss = m_header.sector_size;
    m_fat.clear();
    m_fat_ok = false;
    if (ss == 0) return;

    std::vector<uint32_t> fat_sectors;
    for (uint32_t s : m_header.difat)
        if (s != FREESECT) fat_sectors.push_back(s);

    uint32_t difat_sect = m_header.first_difat;
    uint32_t remaining = m_header.num_difat_sectors;
    std::unordered_set<uint32_t> visited;
    while (!is_terminal(difat_sect) && remaining > 0 && visited.size() < MAX_SECTORS) {
        if (!visited.insert(difat_sect).second) break;
        std::string buf = read_sector(difat_sect);
        if (buf.size() != ss) break;
        const uint8_t* p = as_bytes(buf);
        const uint32_t count = ss / 4 - 1;
        for (uint32_t i = 0; i < count; ++i) {
            uint32_t s = read_le32(p + i * 4);
            if (s != FREESECT) fat_sectors.push_back(s);
        }
        difat_sect = read_le32(p + ss - 4);
        --remaining;
    }

    // Unreadable FAT sectors end the walk; at most MAX_SECTORS are loaded.
    bool ok = true;
    for (size_t n = 0; n < fat_sectors.size() && n < MAX_SECTORS; ++n) {
        std::string sbuf = read_sector(fat_sectors[n]);
        if (sbuf.size() != ss) { ok = false; break; }
        const uint8_t* p = as_bytes(sbuf);
        for (uint32_t i = 0; i < ss / 4; ++i) m_fat.push_back(read_le32(p + i * 4));
    }
    m_fat_ok = ok && !m_fat.empty();
}

std::string CompoundFile::follow_chain(uint32_t start, size_t max_bytes) const {
    std::string out;
    const uint32_t ss = m_header.sector_size;
    for (uint32_t idx : chain_indices(m_fat, start)) {
        if (out.size() >= max_bytes) break;
        std::string sec = read_sector(idx);
        if (sec.size() != ss) break;
        out += sec;
    }
    if (out.size() > max_bytes) out.resize(max_bytes);
    return out;
}

CfbDirectory CompoundFile::directory() const {
    CfbDirectory dir;
    std::string bytes = follow_chain(m_header.first_dir_sector);
    if (bytes.size() < DIR_ENTRY_SIZE) return dir;

    const size_t n_entries = bytes.size() / DIR_ENTRY_SIZE;
    for (size_t i = 0; i < n_entries; ++i) {
        const uint8_t* e = as_bytes(bytes) + i * DIR_ENTRY_SIZE;

        size_t name_len = read_le16(e + 0x40);  // bytes, including the terminator
        if (name_len > 128) name_len = 128;
        if (name_len % 2 == 1) name_len -= 1;

        uint8_t obj_type = e[0x42];
        if (obj_type != 0 && obj_type != 1 && obj_type != 2 && obj_type != 5) return dir;

        CfbDirEntry entry;
        entry.type = static_cast<CfbObjectType>(obj_type);
        entry.name = decode_utf16_name(e, name_len);
        entry.start_sector = read_le32(e + 0x74);
        entry.size = m_header.sector_size == 512 ? read_le32(e + 0x78)
                                                 : (static_cast<uint64_t>(read_le32(e + 0x7C)) << 32) | read_le32(e + 0x78);
        dir.entries.push_back(std::move(entry));
    }
    dir.ok = true;
    return dir;
}

bool CompoundFile::mini_fat_ok() const {
    if (m_header.num_minifat_sectors == 0 || is_terminal(m_header.first_minifat)) return true;
    std::string buf = read_sector(m_header.first_minifat);
    return !buf.empty() && buf.size() == m_header.sector_size && buf.size() % 4 == 0;
}

std::string CompoundFile::read_stream(const CfbDirEntry& entry, size_t max_bytes) const {
    size_t want = static_cast<size_t>(std::min<uint64_t>(entry.size, max_bytes));
    if (want == 0) return "";
    if (entry.type != CfbObjectType::ROOT && entry.size < m_header.mini_stream_cutoff)
        return read_mini_stream(entry, want);
    return follow_chain(entry.start_sector, want);
}

std::string CompoundFile::read_mini_stream(const CfbDirEntry& entry, size_t max_bytes) const {
    const uint32_t ss = m_header.sector_size;
    const uint32_t ms = m_header.mini_sector_size;
    if (ss == 0 || ms == 0) return "";

    CfbDirectory dir = directory();
    auto root = std::find_if(dir.entries.begin(), dir.entries.end(),
        [](const CfbDirEntry& e) { return e.type == CfbObjectType::ROOT; });
    if (root == dir.entries.end()) return "";

    const std::vector<uint32_t> container = chain_indices(m_fat, root->start_sector);
    const std::vector<uint32_t> minifat_sectors = chain_indices(m_fat, m_header.first_minifat);
    const uint32_t per_sector = ss / 4;

    auto minifat_next = [&](uint32_t idx) -> std::optional<uint32_t> {
        size_t s = idx / per_sector;
        if (s >= minifat_sectors.size()) return std::nullopt;
        uint64_t off = HEADER_SIZE + static_cast<uint64_t>(minifat_sectors[s]) * ss + (idx % per_sector) * 4;
        if (off + 4 > m_size) return std::nullopt;
        return read_le32(m_data + off);
    };

    std::string out;
    std::unordered_set<uint32_t> seen;
    uint32_t cur = entry.start_sector;
    while (!is_terminal(cur) && out.size() < max_bytes && seen.size() < MAX_SECTORS) {
        if (!seen.insert(cur).second) break;
        uint64_t pos = static_cast<uint64_t>(cur) * ms;
        size_t s = static_cast<size_t>(pos / ss);
        if (s >= container.size()) break;
        uint64_t off = HEADER_SIZE + static_cast<uint64_t>(container[s]) * ss + pos % ss;
        if (off + ms > m_size) break;
        out.append(reinterpret_cast<const char*>(m_data + off), ms);
        auto next = minifat_next(cur);
        if (!next) break;
        cur = *next;
    }
    if (out.size() > max_bytes) out.resize(max_bytes);
    return out;
}
