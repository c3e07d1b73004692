#include "Parsers.h"
#include "ByteReader.h"
#include "CompoundFile.h"
#include <algorithm>
#include <cctype>
#include <boost/regex.hpp>

namespace {
    const char* const PROVIDER_HINTS[] = {
        "Microsoft Enhanced Cryptographic Provider",
        "Microsoft Base Cryptographic Provider",
        "Microsoft Strong Cryptographic Provider",
        "Microsoft Enhanced RSA and AES Cryptographic Provider",
    };

    const char* const AGILE_MARKERS[] = {
        "http://schemas.microsoft.com/office/2006/encryption",
        "http://schemas.microsoft.com/office/2006/keyEncryptor/password",
        "keyData",
    };

    const std::string BIFF_FILEPASS("\x2F\x00", 2);

    constexpr size_t TRIPLET_LEN = 48;

    bool contains(const std::string& hay, const std::string& needle) {
        return hay.find(needle) != std::string::npos;
    }

    std::string to_utf16le(const std::string& ascii) {
        std::string out;
        out.reserve(ascii.size() * 2);
        for (char c : ascii) {
            out.push_back(c);
            out.push_back('\0');
        }
        return out;
    }

    // UTF-16LE bytes to a narrow string: ASCII code units kept, others become '?'.
    // A dangling odd byte is dropped.
    std::string narrow_utf16le(const std::string& blob) {
        std::string out;
        out.reserve(blob.size() / 2);
        for (size_t i = 0; i + 1 < blob.size(); i += 2) {
            const uint16_t unit = read_le16(as_bytes(blob) + i);
            out.push_back(unit < 0x80 ? static_cast<char>(unit) : '?');
        }
        return out;
    }

    std::string strip_non_ascii(const std::string& s) {
        std::string out;
        for (char c : s)
            if (static_cast<unsigned char>(c) < 0x80) out.push_back(c);
        return out;
    }

    std::string to_lower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    // Stream entries of one compound file, looked up by case-insensitive
    // name suffix ("book" also finds "Workbook").
    class StreamIndex {
    public:
        explicit StreamIndex(const CompoundFile& cfb) : m_cfb(cfb) {
            const CfbDirectory dir = cfb.directory();
            for (const CfbDirEntry& e : dir.entries)
                if (e.type == CfbObjectType::STREAM) m_streams.push_back(e);
        }

        const CfbDirEntry* find(const std::string& target) const {
            const std::string t = to_lower(target);
            for (const CfbDirEntry& e : m_streams) {
                const std::string name = to_lower(e.name);
                if (name.size() >= t.size() && name.compare(name.size() - t.size(), t.size(), t) == 0)
                    return &e;
            }
            return nullptr;
        }

        std::string head(const CfbDirEntry& entry) const {
            return m_cfb.read_stream(entry, Ole2EncParser::HEAD_LEN);
        }

    private:
        const CompoundFile& m_cfb;
        std::vector<CfbDirEntry> m_streams;
    };

    bool has_biff_filepass(const std::string& blob) {
        return blob.size() >= 4 && contains(blob, BIFF_FILEPASS);
    }

    bool has_ppt_enc_marker(const std::string& blob) {
        if (blob.empty()) return false;
        if (contains(blob, "DocumentEncryption") || contains(blob, "Encryption")) return true;
        return contains(narrow_utf16le(blob), "Encryption");
    }
}

std::optional<std::string> Ole2EncParser::detect_encryption_type(const std::string& blob) {
    if (blob.empty()) return std::nullopt;
    size_t start = 0;
    while (start < blob.size() && std::isspace(static_cast<unsigned char>(blob[start]))) ++start;
    const std::string b = blob.substr(start);

    if (b.rfind("<", 0) == 0) {
        if (contains(b, "<encryption")) {
            for (const char* marker : AGILE_MARKERS)
                if (contains(b, marker)) return std::string("Agile");
        }
        return std::string("Extensible");
    }
    return std::string("Standard");
}

std::optional<std::string> Ole2EncParser::detect_provider(const std::string& blob) {
    if (blob.empty()) return std::nullopt;

    for (const char* hint : PROVIDER_HINTS)
        if (contains(blob, hint)) return std::string(hint);
    for (const char* hint : PROVIDER_HINTS)
        if (contains(blob, to_utf16le(hint))) return std::string(hint);

    static const boost::regex ascii_re(
        R"(Microsoft[^\x00\r\n]{0,64}Cryptographic Provider[^\x00\r\n]{0,32})");
    boost::smatch m;
    if (boost::regex_search(blob, m, ascii_re)) return strip_non_ascii(m.str());

    static const boost::regex wide_re(R"(Microsoft[^\n]{0,64}Cryptographic Provider[^\n]{0,32})");
    const std::string text = narrow_utf16le(blob);
    if (boost::regex_search(text, m, wide_re)) return m.str();

    return std::nullopt;
}

bool Ole2EncParser::has_rc4_triplet(const std::string& blob) {
    // salt + verifier + verifier hash, 16 bytes each; any blob with room past
    // one such triplet counts as carrying it
    return blob.size() > TRIPLET_LEN;
}

ParseResult<Ole2EncRecord> Ole2EncParser::run(const std::string& path) const {
    MappedFile file(path);
    ParseResult<CompoundFile> opened = CompoundFile::open(file.data(), file.size());
    if (!opened) return ParseResult<Ole2EncRecord>::failure(opened.error().message, opened.error().offset);
    const StreamIndex streams(opened.value());

    Ole2EncRecord r;
    const CfbDirEntry* enc_pkg = streams.find("EncryptedPackage");
    const CfbDirEntry* enc_info = streams.find("EncryptionInfo");
    r.encrypted_package_present = enc_pkg != nullptr;
    r.encryption_info_present = enc_info != nullptr;

    if (enc_info) {
        r.encryption_type = detect_encryption_type(streams.head(*enc_info));
        if (!r.encryption_type) r.encryption_type = "Unknown";
    }
    if (!r.encryption_type && enc_pkg) r.encryption_type = "Unknown";

    // Excel: BIFF FILEPASS record
    for (const char* cand : {"Workbook", "Book"}) {
        const CfbDirEntry* s = streams.find(cand);
        if (!s) continue;
        const std::string blob = streams.head(*s);
        if (has_biff_filepass(blob)) {
            r.rc4_meta_present = true;
            if (auto prov = detect_provider(blob)) r.crypto_provider = prov;
            break;
        }
    }

    // PowerPoint: textual markers
    if (!r.rc4_meta_present) {
        if (const CfbDirEntry* s = streams.find("PowerPoint Document")) {
            const std::string blob = streams.head(*s);
            if (has_ppt_enc_marker(blob)) {
                r.rc4_meta_present = true;
                if (auto prov = detect_provider(blob)) r.crypto_provider = prov;
            }
        }
    }

    // Word: provider name alone is the marker
    if (!r.rc4_meta_present) {
        if (const CfbDirEntry* s = streams.find("WordDocument")) {
            if (auto prov = detect_provider(streams.head(*s))) {
                r.crypto_provider = prov;
                r.rc4_meta_present = true;
            }
        }
    }

    for (const char* cand : {"WordDocument", "Workbook", "Book", "PowerPoint Document"}) {
        const CfbDirEntry* s = streams.find(cand);
        if (s && has_rc4_triplet(streams.head(*s))) {
            r.rc4_triplet_present = true;
            break;
        }
    }

    return ParseResult<Ole2EncRecord>::success(r);
}
