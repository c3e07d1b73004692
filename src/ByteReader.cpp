#include "ByteReader.h"
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

uint64_t file_size_of(const std::string& path) {
    return static_cast<uint64_t>(fs::file_size(path));
}

std::string read_window(const std::string& path, uint64_t offset, size_t len) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) throw std::runtime_error("cannot open " + path);

    std::string buf;
    if (len == 0) return buf;
    f.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    if (!f) return buf;  // offset beyond EOF

    buf.resize(len);
    f.read(&buf[0], static_cast<std::streamsize>(len));
    buf.resize(static_cast<size_t>(f.gcount()));
    return buf;
}

std::string read_tail(const std::string& path, size_t len) {
    uint64_t size = file_size_of(path);
    uint64_t start = size > len ? size - len : 0;
    return read_window(path, start, static_cast<size_t>(size - start));
}

MappedFile::MappedFile(const std::string& path) {
    m_size = static_cast<size_t>(file_size_of(path));
    if (m_size == 0) return;
    m_map.open(path);
    if (!m_map.is_open()) throw std::runtime_error("cannot map " + path);
    m_size = m_map.size();
}
