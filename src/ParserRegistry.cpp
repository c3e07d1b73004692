#include "ParserRegistry.h"

const ParserRegistry& ParserRegistry::structural() {
    static const ParserRegistry reg = [] {
        ParserRegistry r;
        r.add(std::make_unique<GzipParser>());
        r.add(std::make_unique<JpegParser>());
        r.add(std::make_unique<PngParser>());
        r.add(std::make_unique<Mp4Parser>());
        r.add(std::make_unique<Ole2Parser>());
        r.add(std::make_unique<ZipParser>());
        r.add(std::make_unique<OoxmlParser>());
        r.add(std::make_unique<RarParser>());
        r.add(std::make_unique<PdfParser>());
        return r;
    }();
    return reg;
}

const ParserRegistry& ParserRegistry::encryption() {
    static const ParserRegistry reg = [] {
        ParserRegistry r;
        r.add(std::make_unique<Ole2EncParser>());
        r.add(std::make_unique<PdfEncParser>());
        r.add(std::make_unique<ZipEncParser>());
        return r;
    }();
    return reg;
}

const FormatParser* ParserRegistry::get(const std::string& family) const {
    auto it = m_parsers.find(family);
    return it == m_parsers.end() ? nullptr : it->second.get();
}

std::vector<std::string> ParserRegistry::families() const {
    std::vector<std::string> out;
    for (const auto& [name, parser] : m_parsers) out.push_back(name);
    return out;
}

void ParserRegistry::add(std::unique_ptr<FormatParser> parser) {
    const std::string family = parser->family();
    m_parsers.emplace(family, std::move(parser));
}
