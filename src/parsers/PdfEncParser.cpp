#include "Parsers.h"
#include "ByteReader.h"
#include <boost/algorithm/string/predicate.hpp>
#include <boost/regex.hpp>

namespace {
    const boost::regex& filter_re() {
        static const boost::regex re(R"(/Filter\s*/([A-Za-z0-9]+))");
        return re;
    }

    const boost::regex& encrypt_metadata_re() {
        static const boost::regex re(R"(/EncryptMetadata\s+(true|false))", boost::regex::perl | boost::regex::icase);
        return re;
    }

    std::optional<std::string> find_filter(const std::string& buf) {
        boost::smatch m;
        if (boost::regex_search(buf, m, filter_re())) return m[1].str();
        return std::nullopt;
    }

    std::optional<bool> find_encrypt_metadata(const std::string& buf) {
        boost::smatch m;
        if (boost::regex_search(buf, m, encrypt_metadata_re()))
            return boost::algorithm::iequals(m[1].str(), "true");
        return std::nullopt;
    }

    // Looks for /Encrypt and reads its parameters from a window around the
    // first hit, falling back to the whole buffer for each value.
    PdfEncRecord scan_encrypt(const std::string& buf) {
        PdfEncRecord r;
        const size_t pos = buf.find("/Encrypt");
        if (pos == std::string::npos) return r;
        r.encrypt_dict_present = true;

        const size_t start = pos > PdfEncParser::WINDOW_BEFORE ? pos - PdfEncParser::WINDOW_BEFORE : 0;
        const std::string window = buf.substr(start, pos + PdfEncParser::WINDOW_AFTER - start);

        r.filter = find_filter(window);
        r.encrypt_metadata = find_encrypt_metadata(window);
        if (!r.filter) r.filter = find_filter(buf);
        if (!r.encrypt_metadata) r.encrypt_metadata = find_encrypt_metadata(buf);
        return r;
    }
}

ParseResult<PdfEncRecord> PdfEncParser::run(const std::string& path) const {
    PdfEncRecord r = scan_encrypt(read_tail(path, TAIL_READ));
    if (r.encrypt_dict_present) return ParseResult<PdfEncRecord>::success(r);

    r = scan_encrypt(read_window(path, 0, HEAD_READ));
    return ParseResult<PdfEncRecord>::success(r);
}
