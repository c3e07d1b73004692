#pragma once
// ZipArchive.h: thin RAII wrapper over libzip for archive listing.
// Used by the sniffer's OOXML check and by the OOXML parser; nothing here
// decompresses more than a bounded prefix of one entry.

#include <optional>
#include <string>
#include <vector>

struct zip;

class ZipArchive {
public:
    // Returns nullopt if libzip cannot open the file as an archive.
    static std::optional<ZipArchive> open(const std::string& path);

    ZipArchive(ZipArchive&& other) noexcept;
    ZipArchive& operator=(ZipArchive&& other) noexcept;
    ZipArchive(const ZipArchive&) = delete;
    ZipArchive& operator=(const ZipArchive&) = delete;
    ~ZipArchive();

    // Entry names in central-directory order (raw encoding).
    std::vector<std::string> names() const;

    // First `max_bytes` of the decompressed entry, nullopt if missing or unreadable.
    std::optional<std::string> read_prefix(const std::string& name, size_t max_bytes) const;

private:
    explicit ZipArchive(zip* handle) : m_zip(handle) {}
    zip* m_zip = nullptr;
};

// [Content_Types].xml plus at least one entry under word/, xl/ or ppt/.
bool looks_like_ooxml(const std::vector<std::string>& names);
