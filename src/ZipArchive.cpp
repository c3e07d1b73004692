#include "ZipArchive.h"
#include "Signatures.h"
#include "Logger.h"
#include <zip.h>

std::optional<ZipArchive> ZipArchive::open(const std::string& path) {
    int errcode = 0;
    zip_t* archive = zip_open(path.c_str(), ZIP_RDONLY, &errcode);
    if (!archive) {
        zip_error_t ze;
        zip_error_init_with_code(&ze, errcode);
        Logger::info("libzip cannot open " + path + ": " + zip_error_strerror(&ze));
        zip_error_fini(&ze);
        return std::nullopt;
    }
    return ZipArchive(archive);
}

ZipArchive::ZipArchive(ZipArchive&& other) noexcept : m_zip(other.m_zip) {
    other.m_zip = nullptr;
}

ZipArchive& ZipArchive::operator=(ZipArchive&& other) noexcept {
    if (this != &other) {
        if (m_zip) zip_discard(m_zip);
        m_zip = other.m_zip;
        other.m_zip = nullptr;
    }
    return *this;
}

ZipArchive::~ZipArchive() {
    // read-only: discard instead of zip_close, nothing to write back
    if (m_zip) zip_discard(m_zip);
}

std::vector<std::string> ZipArchive::names() const {
    std::vector<std::string> out;
    zip_int64_t num_entries = zip_get_num_entries(m_zip, 0);
    for (zip_int64_t i = 0; i < num_entries; ++i) {
        const char* name = zip_get_name(m_zip, static_cast<zip_uint64_t>(i), ZIP_FL_ENC_RAW);
        if (name) out.emplace_back(name);
    }
    return out;
}

std::optional<std::string> ZipArchive::read_prefix(const std::string& name, size_t max_bytes) const {
    zip_file_t* zf = zip_fopen(m_zip, name.c_str(), 0);
    if (!zf) return std::nullopt;

    std::string buf(max_bytes, '\0');
    size_t got = 0;
    while (got < max_bytes) {
        zip_int64_t n = zip_fread(zf, &buf[got], max_bytes - got);
        if (n < 0) { zip_fclose(zf); return std::nullopt; }
        if (n == 0) break;
        got += static_cast<size_t>(n);
    }
    zip_fclose(zf);
    buf.resize(got);
    return buf;
}

bool looks_like_ooxml(const std::vector<std::string>& names) {
    bool content_types = false, office_dir = false;
    for (const auto& n : names) {
        if (n == Sig::Bin::XML_CONTENT_TYPES) content_types = true;
        if (n.rfind(Sig::Bin::XML_WORD, 0) == 0 || n.rfind(Sig::Bin::XML_XL, 0) == 0 ||
            n.rfind(Sig::Bin::XML_PPT, 0) == 0)
            office_dir = true;
        if (content_types && office_dir) return true;
    }
    return false;
}
