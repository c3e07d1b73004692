#include "Parsers.h"
#include "ByteReader.h"
#include "Signatures.h"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <boost/regex.hpp>

namespace {
    const std::string KW_STARTXREF = "startxref";
    constexpr size_t STARTXREF_DIGITS_SCAN = 64;
    constexpr size_t XREF_BACKOFF = 16;
    constexpr size_t CLASSIC_XREF_SCAN = 128;

    bool contains(const std::string& buf, const char* needle) {
        return buf.find(needle) != std::string::npos;
    }

    bool is_digit(char c) { return c >= '0' && c <= '9'; }

    // "%PDF-1.7" -> 1.7; extended headers keep only the leading digits and dots.
    std::optional<double> parse_version(const std::string& head) {
        if (!Sig::starts_with(head, Sig::Bin::PDF)) return std::nullopt;
        std::string s;
        for (size_t i = Sig::Bin::PDF.size(); i < head.size() && i < Sig::Bin::PDF.size() + 3; ++i) {
            const char c = head[i];
            if (!is_digit(c) && c != '.') break;
            s.push_back(c);
        }
        if (s.empty()) return std::nullopt;
        char* end = nullptr;
        const double v = std::strtod(s.c_str(), &end);
        if (end != s.c_str() + s.size() || v == 0.0) return std::nullopt;
        return v;
    }

    struct StartXref {
        bool found = false;
        std::optional<uint64_t> offset;
    };

    StartXref find_startxref(const std::string& tail) {
        StartXref sx;
        const size_t idx = tail.rfind(KW_STARTXREF);
        if (idx == std::string::npos) return sx;
        sx.found = true;

        const std::string after = tail.substr(idx + KW_STARTXREF.size(), STARTXREF_DIGITS_SCAN);
        std::string digits;
        for (char c : after) {
            if (is_digit(c)) digits.push_back(c);
            else if (!digits.empty()) break;
        }
        // 20 digits can overflow; such an offset is past any real file anyway
        if (!digits.empty() && digits.size() < 20) sx.offset = std::stoull(digits);
        return sx;
    }

    struct XrefCheck {
        bool xref_ok = false;
        bool trailer_keyword = false;
        std::optional<int64_t> size;
    };

    int64_t saturating_add(int64_t a, uint64_t b) {
        const uint64_t room = static_cast<uint64_t>(std::numeric_limits<int64_t>::max() - a);
        return b >= room ? std::numeric_limits<int64_t>::max() : a + static_cast<int64_t>(b);
    }

    uint64_t to_u64(const std::string& digits) {
        if (digits.size() >= 20) return std::numeric_limits<uint64_t>::max();
        return std::stoull(digits);
    }

    XrefCheck check_xref(const std::string& path, uint64_t file_size, uint64_t xref_off) {
        XrefCheck p;
        const uint64_t start = xref_off > XREF_BACKOFF ? xref_off - XREF_BACKOFF : 0;
        if (start >= file_size) return p;
        const std::string buf = read_window(path, start, PdfParser::NEAR_WINDOW);
        if (buf.empty()) return p;

        const bool classic = buf.substr(0, CLASSIC_XREF_SCAN).find("xref") != std::string::npos;
        const bool stream = contains(buf, "/Type") && contains(buf, "/XRef");
        p.trailer_keyword = contains(buf, "trailer");
        p.xref_ok = classic || stream;

        if (classic) {
            static const boost::regex table(R"(xref\s+((?:\d+\s+\d+\s*)+))", boost::regex::perl | boost::regex::icase);
            static const boost::regex pair(R"((\d+)\s+(\d+))");
            boost::smatch m;
            if (boost::regex_search(buf, m, table)) {
                const std::string body = m[1].str();
                int64_t total = 0;
                bool any = false;
                for (boost::sregex_iterator it(body.begin(), body.end(), pair), end; it != end; ++it) {
                    total = saturating_add(total, to_u64((*it)[2].str()));
                    any = true;
                }
                if (any) p.size = total;
            }
        }
        else if (stream) {
            static const boost::regex size_re(R"(/Size\s+(\d+))");
            boost::smatch m;
            if (boost::regex_search(buf, m, size_re)) {
                const uint64_t v = to_u64(m[1].str());
                p.size = v > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())
                             ? std::numeric_limits<int64_t>::max()
                             : static_cast<int64_t>(v);
            }
        }
        return p;
    }

    // "N 0 obj" tokens over bounded head and tail buffers.
    int64_t count_obj_tokens(const std::string& path, uint64_t total) {
        const uint64_t cap_kib = std::max<uint64_t>(512, std::min<uint64_t>(4096, total / 4096));
        const uint64_t max_bytes = cap_kib * 1024;

        const uint64_t head_n = std::min(max_bytes, total);
        const uint64_t tail_n = std::min(max_bytes, total - head_n);

        std::string combined = read_window(path, 0, static_cast<size_t>(head_n));
        combined.push_back('\n');
        if (tail_n > 0) combined += read_window(path, total - tail_n, static_cast<size_t>(tail_n));

        static const boost::regex obj(R"(\d+\s+0\s+obj)");
        return static_cast<int64_t>(std::distance(
            boost::sregex_iterator(combined.begin(), combined.end(), obj), boost::sregex_iterator()));
    }
}

ParseResult<PdfRecord> PdfParser::run(const std::string& path) const {
    const uint64_t size = file_size_of(path);
    const std::string head = read_window(path, 0, HEAD_READ);

    PdfRecord r;
    r.version = parse_version(head);

    const StartXref sx = find_startxref(read_tail(path, STARTXREF_SCAN));
    r.startxref_found = sx.found;

    std::optional<int64_t> xref_size;
    if (sx.found && sx.offset) {
        const XrefCheck xref = check_xref(path, size, *sx.offset);
        r.xref_ok = xref.xref_ok;
        r.has_trailer = xref.trailer_keyword;
        xref_size = xref.size;
    }

    const std::string tail = read_tail(path, TAIL_READ);
    r.root_present = contains(tail, "/Root");
    r.ids_present = contains(tail, "/ID");

    r.trailer_ok = r.startxref_found && r.xref_ok && (r.has_trailer || r.root_present);

    int64_t obj_count = 0;
    if (r.xref_ok && xref_size && *xref_size > 0)
        obj_count = *xref_size;
    else
        obj_count = count_obj_tokens(path, size);
    r.obj_count_est = std::log1p(static_cast<double>(obj_count));

    r.parser_ok = (r.has_trailer && r.startxref_found) || r.xref_ok || r.trailer_ok;
    r.structure_consistent = r.parser_ok &&
                             ((r.xref_ok && r.trailer_ok && r.root_present) ||
                              (r.trailer_ok && r.root_present && r.ids_present));
    return ParseResult<PdfRecord>::success(r);
}
