#pragma once
// ParserRegistry.h: format-family name -> parser, built once on first use.

#include <map>
#include <memory>
#include <string>
#include <vector>
#include "Parsers.h"

class ParserRegistry {
public:
    // gzip, jpeg, png, mp4, ole2, zip, ooxml, rar, pdf
    static const ParserRegistry& structural();
    // ole2_enc, pdf_enc, zip_enc
    static const ParserRegistry& encryption();

    // nullptr for a family with no parser ("other", "ooxml_enc", ...).
    const FormatParser* get(const std::string& family) const;
    std::vector<std::string> families() const;

private:
    ParserRegistry() = default;
    void add(std::unique_ptr<FormatParser> parser);

    std::map<std::string, std::unique_ptr<FormatParser>> m_parsers;
};
