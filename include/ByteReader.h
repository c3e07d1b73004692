#pragma once
// ByteReader.h: bounded file reads and endian helpers shared by the sniffer and parsers.
//
// Two access styles:
//  - read_window() / read_tail(): copy a bounded slice through std::ifstream
//    (sniffer, GZIP, PDF, encryption parsers);
//  - MappedFile: read-only memory map of the whole file for parsers that
//    jump around (JPEG, PNG, MP4, OLE2, ZIP, RAR).

#include <cstdint>
#include <string>
#include <string_view>
#include <boost/iostreams/device/mapped_file.hpp>

inline uint16_t read_le16(const uint8_t* p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

inline uint32_t read_le32(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

inline uint16_t read_be16(const uint8_t* p) {
    return static_cast<uint16_t>((p[0] << 8) | p[1]);
}

inline uint32_t read_be32(const uint8_t* p) {
    return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
}

inline uint64_t read_be64(const uint8_t* p) {
    return (static_cast<uint64_t>(read_be32(p)) << 32) | read_be32(p + 4);
}

inline const uint8_t* as_bytes(std::string_view s) {
    return reinterpret_cast<const uint8_t*>(s.data());
}

// Size of a regular file. Throws std::filesystem::filesystem_error.
uint64_t file_size_of(const std::string& path);

// Up to `len` bytes starting at `offset`; shorter (possibly empty) near EOF.
// Throws std::runtime_error if the file cannot be opened.
std::string read_window(const std::string& path, uint64_t offset, size_t len);

// Last min(len, size) bytes of the file.
std::string read_tail(const std::string& path, size_t len);

// Read-only mapping of a whole file. A zero-length file is not mapped
// (mmap rejects it) and shows up as an empty view.
class MappedFile {
public:
    explicit MappedFile(const std::string& path);

    const uint8_t* data() const { return m_size ? reinterpret_cast<const uint8_t*>(m_map.data()) : nullptr; }
    size_t size() const { return m_size; }
    bool empty() const { return m_size == 0; }
    std::string_view view() const { return m_size ? std::string_view(m_map.data(), m_size) : std::string_view(); }

private:
    boost::iostreams::mapped_file_source m_map;
    size_t m_size = 0;
};
