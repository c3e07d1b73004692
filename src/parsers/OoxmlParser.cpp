#include "Parsers.h"
#include "Signatures.h"
#include "ZipArchive.h"

namespace {
    const char* const CORE_PARTS[] = {"word/document.xml", "xl/workbook.xml", "ppt/presentation.xml"};

    bool ends_with(const std::string& s, const std::string& suffix) {
        return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
    }

    bool starts_with(const std::string& s, const std::string& prefix) {
        return s.rfind(prefix, 0) == 0;
    }
}

ParseResult<OoxmlRecord> OoxmlParser::run(const std::string& path) const {
    std::optional<ZipArchive> archive = ZipArchive::open(path);
    if (!archive) return ParseResult<OoxmlRecord>::failure("not a readable ZIP archive");

    const std::vector<std::string> names = archive->names();

    bool content_types = false, office_dirs = false;
    OoxmlRecord r;
    for (const std::string& n : names) {
        if (n == Sig::Bin::XML_CONTENT_TYPES) content_types = true;
        for (const char* core : CORE_PARTS)
            if (n == core) r.coreparts_present = true;
        if (starts_with(n, Sig::Bin::XML_WORD) || starts_with(n, Sig::Bin::XML_XL) ||
            starts_with(n, Sig::Bin::XML_PPT))
            office_dirs = true;
        if (r.rel_count <= RELS_EARLY_STOP && (ends_with(n, ".rels") || ends_with(n, ".RELS")))
            ++r.rel_count;
    }

    r.detected = content_types && (r.coreparts_present || office_dirs);

    if (r.detected) {
        std::optional<std::string> ct = archive->read_prefix(Sig::Bin::XML_CONTENT_TYPES, CT_SCAN_BYTES);
        r.pkg_ok = ct && (ct->find("<Types") != std::string::npos || ct->find(":Types") != std::string::npos);
    }

    r.parser_ok = r.detected && r.pkg_ok && (r.coreparts_present || r.rel_count > 0);
    r.structure_consistent = r.parser_ok && r.coreparts_present && r.rel_count >= 2;
    return ParseResult<OoxmlRecord>::success(r);
}
