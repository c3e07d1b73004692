#include "Parsers.h"
#include "ByteReader.h"
#include "ZipDirectory.h"
#include <set>

namespace {
    constexpr uint16_t FLAG_ENCRYPTED = 0x0001;

    // Walks (id, size) records of an extra field looking for `id`.
    bool has_extra_record(const std::string& extra, uint16_t id) {
        const uint8_t* p = as_bytes(extra);
        const size_t n = extra.size();
        size_t i = 0;
        while (i + 4 <= n) {
            const uint16_t header_id = read_le16(p + i);
            const uint16_t sz = read_le16(p + i + 2);
            i += 4;
            if (i + sz > n) break;
            if (header_id == id) return true;
            i += sz;
        }
        return false;
    }
}

ParseResult<ZipEncRecord> ZipEncParser::run(const std::string& path) const {
    MappedFile file(path);
    const std::optional<ZipEocd> eocd = ZipDirectory::find_eocd(file.data(), file.size());
    if (!eocd) return ParseResult<ZipEncRecord>::failure("EOCD not found");

    bool complete = false;
    const std::vector<ZipCdEntry> entries =
        ZipDirectory::read_entries(file.data(), file.size(), eocd->record, &complete);
    if (!complete) return ParseResult<ZipEncRecord>::failure("central directory truncated");
    if (entries.empty()) return ParseResult<ZipEncRecord>::failure("archive has no entries");

    ZipEncRecord r;
    bool all = true;
    std::set<std::string> methods;
    for (const ZipCdEntry& e : entries) {
        const bool encrypted = (e.flags & FLAG_ENCRYPTED) != 0;
        r.any_entry_encrypted = r.any_entry_encrypted || encrypted;
        all = all && encrypted;
        if (encrypted) methods.insert(has_extra_record(e.extra, AES_EXTRA_ID) ? "AES" : "ZipCrypto");
    }

    if (!r.any_entry_encrypted) {
        r.method.reset();
        r.all_headers_encrypted = false;
    }
    else {
        r.method = methods.size() == 1 ? *methods.begin() : std::string("Mixed");
        r.all_headers_encrypted = all;
    }
    return ParseResult<ZipEncRecord>::success(r);
}
