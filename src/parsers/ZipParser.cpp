#include "Parsers.h"
#include "ByteReader.h"
#include "Signatures.h"
#include "ZipDirectory.h"
#include <cmath>

namespace {
    constexpr uint16_t FLAG_UTF8 = 0x0800;

    double round6(double x) { return std::round(x * 1e6) / 1e6; }
}

ParseResult<ZipRecord> ZipParser::run(const std::string& path) const {
    MappedFile file(path);
    const uint8_t* data = file.data();
    const uint64_t fsize = file.size();

    const std::optional<ZipEocd> eocd = ZipDirectory::find_eocd(data, fsize);
    if (!eocd) return ParseResult<ZipRecord>::failure("EOCD not found");
    const ZipEocdRecord& rec = eocd->record;

    const uint64_t cd_offset = rec.cd_offset;
    if (cd_offset + 4 > fsize)
        return ParseResult<ZipRecord>::failure("central directory offset out of range", cd_offset);

    ZipRecord r;
    r.comment_len = rec.comment_length;
    r.cd_offset_ok = cd_offset + rec.cd_size <= fsize && read_le32(data + cd_offset) == ZipSig::CDH;

    const std::vector<ZipCdEntry> entries = ZipDirectory::read_entries(data, fsize, rec);
    int64_t utf8 = 0, with_crc = 0;
    for (const ZipCdEntry& e : entries) {
        if (e.flags & FLAG_UTF8) ++utf8;
        if (e.crc32 != 0) ++with_crc;
        if (e.name == Sig::Bin::XML_CONTENT_TYPES) r.has_content_types = true;
    }

    r.entry_count = static_cast<int64_t>(entries.size());
    const int64_t total = rec.entries_total;
    r.central_dir_ok = (total == 0 && r.entry_count == 0) || r.entry_count == total;

    if (r.entry_count > 0) {
        r.names_utf8_fraction = round6(static_cast<double>(utf8) / r.entry_count);
        r.crc_present_fraction = round6(static_cast<double>(with_crc) / r.entry_count);
    }

    r.parser_ok = r.central_dir_ok && r.cd_offset_ok && r.entry_count >= 1;
    r.structure_consistent = r.parser_ok && r.crc_present_fraction >= 0.65;
    return ParseResult<ZipRecord>::success(r);
}
