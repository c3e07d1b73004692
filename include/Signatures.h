#pragma once
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>
#include "Scanner.h"

namespace Sig {
    namespace Bin {
        const std::string PDF = "%PDF-";
        const std::string PNG = "\x89\x50\x4E\x47\x0D\x0A\x1A\x0A";
        const std::string JPG = "\xFF\xD8\xFF";
        const std::string GZIP = "\x1F\x8B\x08";
        const std::string OLE = "\xD0\xCF\x11\xE0\xA1\xB1\x1A\xE1";
        const std::string RAR4("\x52\x61\x72\x21\x1A\x07\x00", 7);
        const std::string RAR5("\x52\x61\x72\x21\x1A\x07\x01\x00", 8);
        const std::string MP4_FTYP = "ftyp";  // at offset 4
        const std::string ZIP = "\x50\x4B\x03\x04";
        const std::string ZIP_EMPTY = "\x50\x4B\x05\x06";
        const std::string ZIP_SPANNED = "\x50\x4B\x07\x08";

        const std::string GIF87 = "GIF87a";
        const std::string GIF89 = "GIF89a";
        const std::string RIFF = "RIFF";
        const std::string ID3 = "ID3";
        const std::string FLAC = "fLaC";
        const std::string BZIP2 = "BZh";
        const std::string LZ4("\x04\x22\x4D\x18", 4);
        const std::string ZSTD("\x28\xB5\x2F\xFD", 4);
        const std::string SQLITE("SQLite format 3\0", 16);
        const std::string TAR_POSIX("ustar\0", 6);  // at offset 257
        const std::string TAR_GNU = "ustar ";
        const std::string PE = "MZ";
        const std::string ELF = "\x7F" "ELF";
        const std::string SEVEN_ZIP("\x37\x7A\xBC\xAF\x27\x1C", 6);

        // OLE2 stream names
        const std::string OLE_WORD = "WordDocument";
        const std::string OLE_XL = "Workbook";
        const std::string OLE_PPT = "PowerPoint Document";
        const std::string OLE_SUMMARY = "\x05SummaryInformation";

        // OpenXML markers (internal ZIP paths)
        const std::string XML_CONTENT_TYPES = "[Content_Types].xml";
        const std::string XML_WORD = "word/";
        const std::string XML_XL = "xl/";
        const std::string XML_PPT = "ppt/";
    }

    // Raw bytes -> upper-case hex, e.g. "%PDF" -> "25504446".
    inline std::string raw_to_hex(const std::string& raw) {
        std::ostringstream ss;
        ss << std::uppercase << std::hex << std::setfill('0');
        for (unsigned char c : raw) ss << std::setw(2) << static_cast<int>(c);
        return ss.str();
    }

    inline bool starts_with(const std::string& data, const std::string& magic) {
        return data.size() >= magic.size() && data.compare(0, magic.size(), magic) == 0;
    }

    // Compiled-in magic table, used when no signatures.json is supplied.
    // Priorities reproduce the sniffer's resolution order: parser families
    // first (pdf .. zip), then diagnostic-only families.
    inline std::vector<SignatureDefinition> builtin() {
        auto def = [](const std::string& name, std::vector<std::string> raw_heads,
                      int priority, bool parser, size_t offset = 0, const std::string& pattern = "") {
            SignatureDefinition s;
            s.name = name;
            for (const auto& r : raw_heads) s.hex_heads.push_back(raw_to_hex(r));
            s.offset = offset;
            s.pattern = pattern;
            s.priority = priority;
            s.parser = parser;
            return s;
        };

        // FF followed by a byte with the top three bits set (MPEG frame sync).
        std::string mp3_sync = "\\xFF[";
        for (int b = 0xE0; b <= 0xFF; ++b) {
            std::ostringstream ss;
            ss << "\\x" << std::uppercase << std::hex << b;
            mp3_sync += ss.str();
        }
        mp3_sync += "]";

        return {
            def("pdf",    {Bin::PDF}, 100, true),
            def("png",    {Bin::PNG}, 99, true),
            def("jpeg",   {Bin::JPG}, 98, true),
            def("gzip",   {Bin::GZIP}, 97, true),
            def("ole2",   {Bin::OLE}, 96, true),
            def("rar",    {Bin::RAR4, Bin::RAR5}, 95, true),
            def("mp4",    {Bin::MP4_FTYP}, 94, true, 4, ".{4}"),
            def("zip",    {Bin::ZIP, Bin::ZIP_EMPTY, Bin::ZIP_SPANNED}, 93, true),
            def("gif",    {Bin::GIF87, Bin::GIF89}, 50, false),
            def("webp",   {}, 49, false, 0, "RIFF.{4}WEBP"),
            def("mp3",    {}, 48, false, 0, "ID3|" + mp3_sync),
            def("wav",    {}, 47, false, 0, "RIFF.{4}WAVE"),
            def("flac",   {Bin::FLAC}, 46, false),
            def("bzip2",  {Bin::BZIP2}, 45, false),
            def("lz4",    {Bin::LZ4}, 44, false),
            def("zstd",   {Bin::ZSTD}, 43, false),
            def("sqlite", {Bin::SQLITE}, 42, false),
            def("tar",    {Bin::TAR_POSIX, Bin::TAR_GNU}, 41, false, 257),
            def("pe",     {Bin::PE}, 40, false),
            def("elf",    {Bin::ELF}, 39, false),
            def("7z",     {Bin::SEVEN_ZIP}, 38, false),
        };
    }
}
