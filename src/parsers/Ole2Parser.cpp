#include "Parsers.h"
#include "ByteReader.h"
#include "CompoundFile.h"
#include "Signatures.h"

ParseResult<Ole2Record> Ole2Parser::run(const std::string& path) const {
    MappedFile file(path);
    ParseResult<CompoundFile> opened = CompoundFile::open(file.data(), file.size());
    if (!opened) return ParseResult<Ole2Record>::failure(opened.error().message, opened.error().offset);
    const CompoundFile& cfb = opened.value();

    Ole2Record r;
    r.fat_ok = cfb.fat_ok();

    const CfbDirectory dir = cfb.directory();
    r.dir_ok = dir.ok;
    for (const CfbDirEntry& e : dir.entries) {
        if (e.type == CfbObjectType::STREAM) ++r.stream_count;
        if (e.type == CfbObjectType::ROOT) r.root_entry_present = true;
        if (e.name == Sig::Bin::OLE_SUMMARY) r.summaryinfo_present = true;
        if (e.name == Sig::Bin::OLE_WORD || e.name == Sig::Bin::OLE_XL || e.name == Sig::Bin::OLE_PPT)
            r.expected_streams_present = true;
    }

    r.mini_fat_ok = cfb.mini_fat_ok();

    r.parser_ok = r.dir_ok && r.root_entry_present && r.fat_ok && r.stream_count >= 1;
    r.structure_consistent = r.parser_ok &&
                             (r.expected_streams_present || r.summaryinfo_present) &&
                             (r.mini_fat_ok || r.stream_count <= 1);
    return ParseResult<Ole2Record>::success(r);
}
