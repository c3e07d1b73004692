#include "Sniffer.h"
#include "ByteReader.h"
#include "Logger.h"
#include "Signatures.h"
#include "ZipArchive.h"
#include <algorithm>
#include <cmath>
#include <optional>

FeatureMap SniffResult::to_features() const {
    FeatureMap m;
    m.set("size_bytes", static_cast<int64_t>(size_bytes));
    m.set("log_size", log_size);
    m.set("magic_ok", magic_ok);
    m.set("format_family", format_family);
    m.set("magic_family", magic_family);
    return m;
}

Sniffer::Sniffer(SnifferConfig config)
    : m_config(std::move(config)), m_scanner(Scanner::create(m_config.engine)) {
    m_sigs = m_config.signatures.empty() ? Sig::builtin() : m_config.signatures;
    std::stable_sort(m_sigs.begin(), m_sigs.end(),
        [](const auto& a, const auto& b) { return a.priority > b.priority; });
    m_scanner->prepare(m_sigs);
}

SniffResult Sniffer::sniff(const std::string& path) const {
    SniffWindows windows;
    return sniff(path, windows);
}

SniffResult Sniffer::sniff(const std::string& path, SniffWindows& windows) const {
    SniffResult r;
    r.size_bytes = file_size_of(path);
    r.log_size = r.size_bytes == 0 ? 0.0 : std::log10(static_cast<double>(r.size_bytes) + 1.0);

    windows.head = read_window(path, 0, m_config.head_bytes);
    windows.tail = r.size_bytes >= m_config.tail_bytes ? read_tail(path, m_config.tail_bytes)
                                                       : windows.head;

    MagicHits hits;
    m_scanner->scan(windows.head.data(), windows.head.size(), hits);
    if (hits.empty()) return r;

    // The archive check opens the file through libzip; do it at most once.
    std::optional<bool> ooxml;
    auto is_ooxml = [&]() {
        if (!ooxml) {
            auto archive = ZipArchive::open(path);
            ooxml = archive && looks_like_ooxml(archive->names());
        }
        return *ooxml;
    };

    for (const auto& s : m_sigs) {
        if (!s.parser || !hits.contains(s.name)) continue;
        if (s.name == "zip") {
            if (enabled("ooxml") && is_ooxml()) r.format_family = "ooxml";
            else if (enabled("zip")) r.format_family = "zip";
            break;
        }
        if (enabled(s.name)) {
            r.format_family = s.name;
            break;
        }
    }

    for (const auto& s : m_sigs) {
        if (!hits.contains(s.name)) continue;
        r.magic_ok = true;
        r.magic_family = (s.name == "zip" && is_ooxml()) ? "ooxml" : s.name;
        break;
    }
    return r;
}
