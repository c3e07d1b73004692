#include "generator/SampleGenerator.h"
#include "Signatures.h"
#include <algorithm>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace {

// Little-endian field writers over a growing byte string.
void put8(std::string& out, uint8_t v) { out.push_back(static_cast<char>(v)); }

void put16(std::string& out, uint16_t v) {
    put8(out, v & 0xFF);
    put8(out, (v >> 8) & 0xFF);
}

void put32(std::string& out, uint32_t v) {
    put16(out, v & 0xFFFF);
    put16(out, (v >> 16) & 0xFFFF);
}

void put32be(std::string& out, uint32_t v) {
    put8(out, (v >> 24) & 0xFF);
    put8(out, (v >> 16) & 0xFF);
    put8(out, (v >> 8) & 0xFF);
    put8(out, v & 0xFF);
}

void poke16(std::string& out, size_t off, uint16_t v) {
    out[off] = static_cast<char>(v & 0xFF);
    out[off + 1] = static_cast<char>((v >> 8) & 0xFF);
}

void poke32(std::string& out, size_t off, uint32_t v) {
    poke16(out, off, v & 0xFFFF);
    poke16(out, off + 2, (v >> 16) & 0xFFFF);
}

// Printable filler without NUL or '/', so it never looks like a record marker.
std::string letters(size_t n, char first = 'A') {
    std::string s(n, '\0');
    for (size_t i = 0; i < n; ++i) s[i] = static_cast<char>(first + (i % 26));
    return s;
}

std::string png_chunk(const char* type, const std::string& data) {
    std::string out;
    put32be(out, static_cast<uint32_t>(data.size()));
    std::string body(type, 4);
    body += data;
    out += body;
    put32be(out, SampleGenerator::crc32(body));
    return out;
}

std::string mp4_box(const char* type, const std::string& payload) {
    std::string out;
    put32be(out, static_cast<uint32_t>(8 + payload.size()));
    out.append(type, 4);
    out += payload;
    return out;
}

std::string jpeg_segment(uint8_t marker, const std::string& data) {
    std::string out;
    put8(out, 0xFF);
    put8(out, marker);
    const uint16_t len = static_cast<uint16_t>(data.size() + 2);
    put8(out, len >> 8);
    put8(out, len & 0xFF);
    return out + data;
}

uint32_t sectors_for(size_t bytes, size_t unit) {
    return static_cast<uint32_t>((bytes + unit - 1) / unit);
}

} // namespace

static uint32_t crc32_table[256];
static bool crc_initialized = false;

static void init_crc32() {
    for (uint32_t i = 0; i < 256; i++) {
        uint32_t c = i;
        for (int j = 0; j < 8; j++) c = (c & 1) ? (0xEDB88320 ^ (c >> 1)) : (c >> 1);
        crc32_table[i] = c;
    }
    crc_initialized = true;
}

uint32_t SampleGenerator::crc32(const std::string& data) {
    if (!crc_initialized) init_crc32();
    uint32_t c = 0xFFFFFFFF;
    for (unsigned char b : data) c = crc32_table[(c ^ b) & 0xFF] ^ (c >> 8);
    return c ^ 0xFFFFFFFF;
}

SampleGenerator::SampleGenerator(uint32_t seed) : rng(seed) {}

std::string SampleGenerator::gzip(bool with_name, uint32_t mtime) const {
    std::string out = Sig::Bin::GZIP;     // includes CM = deflate
    put8(out, with_name ? 0x08 : 0x00);   // FNAME
    put32(out, mtime);
    put8(out, 0x00);                      // XFL
    put8(out, 0x03);                      // OS: unix
    if (with_name) {
        out += "sample.txt";
        put8(out, 0x00);
    }
    // Final fixed-Huffman block with only end-of-block: empty payload.
    put8(out, 0x03);
    put8(out, 0x00);
    put32(out, crc32(""));
    put32(out, 0);
    return out;
}

std::string SampleGenerator::jpeg(bool exif) const {
    std::string out = "\xFF\xD8";
    out += jpeg_segment(0xE0, std::string("JFIF\0\x01\x01\x00\x00\x01\x00\x01\x00\x00", 14));
    if (exif) out += jpeg_segment(0xE1, std::string("Exif\0\0II*\0\x08\0\0\0", 14));

    std::string dqt(1, '\0');
    for (int i = 0; i < 64; ++i) dqt.push_back(static_cast<char>(1 + i % 16));
    out += jpeg_segment(0xDB, dqt);

    // 8-bit, 16x16, one component
    out += jpeg_segment(0xC0, std::string("\x08\x00\x10\x00\x10\x01\x01\x11\x00", 9));

    std::string dht(1, '\0');
    dht.push_back('\x01');
    dht.append(15, '\0');
    dht.push_back('\0');
    out += jpeg_segment(0xC4, dht);

    out += jpeg_segment(0xDA, std::string("\x01\x01\x00\x00\x3F\x00", 6));
    out += std::string("\x12\x34\x56\x78\x9A\xBC", 6);
    out += "\xFF\xD9";
    return out;
}

std::string SampleGenerator::png() const {
    std::string out = Sig::Bin::PNG;

    std::string ihdr;
    put32be(ihdr, 1);        // width
    put32be(ihdr, 1);        // height
    put8(ihdr, 8);           // bit depth
    put8(ihdr, 0);           // grayscale
    put8(ihdr, 0);
    put8(ihdr, 0);
    put8(ihdr, 0);
    out += png_chunk("IHDR", ihdr);

    // zlib stored block: filter byte 0 plus one pixel
    std::string raw("\x00\x7F", 2);
    uint32_t a = 1, b = 0;
    for (unsigned char c : raw) {
        a = (a + c) % 65521;
        b = (b + a) % 65521;
    }
    std::string idat("\x78\x01\x01\x02\x00\xFD\xFF", 7);
    idat += raw;
    put32be(idat, (b << 16) | a);
    out += png_chunk("IDAT", idat);
    out += png_chunk("IEND", "");
    return out;
}

std::string SampleGenerator::mp4(const std::string& brand) const {
    std::string ftyp = brand.substr(0, 4);
    ftyp.resize(4, ' ');
    put32be(ftyp, 0x200);
    ftyp += "isommp41";

    std::string mvhd(100, '\0');
    std::string moov = mp4_box("mvhd", mvhd);
    moov += mp4_box("trak", mp4_box("tkhd", std::string(84, '\0')));

    std::string out = mp4_box("ftyp", ftyp);
    out += mp4_box("moov", moov);
    out += mp4_box("mdat", letters(64));
    return out;
}

std::string SampleGenerator::build_cfb(const std::vector<CfbStream>& streams) {
    constexpr uint32_t SECTOR = 512;
    constexpr uint32_t MINI_SECTOR = 64;
    constexpr uint32_t CUTOFF = 4096;
    constexpr uint32_t FREESECT = 0xFFFFFFFF;
    constexpr uint32_t ENDOFCHAIN = 0xFFFFFFFE;
    constexpr uint32_t FATSECT = 0xFFFFFFFD;
    constexpr uint32_t NOSTREAM = 0xFFFFFFFF;

    // Small streams are packed into the mini stream first.
    std::vector<uint32_t> start(streams.size(), ENDOFCHAIN);
    std::vector<uint32_t> minifat;
    std::string mini;
    for (size_t i = 0; i < streams.size(); ++i) {
        const std::string& data = streams[i].data;
        if (data.empty() || data.size() >= CUTOFF) continue;
        const uint32_t first = static_cast<uint32_t>(minifat.size());
        const uint32_t n = sectors_for(data.size(), MINI_SECTOR);
        for (uint32_t k = 0; k < n; ++k) minifat.push_back(k + 1 < n ? first + k + 1 : ENDOFCHAIN);
        start[i] = first;
        mini += data;
        mini.resize(static_cast<size_t>(first + n) * MINI_SECTOR, '\0');
    }

    const uint32_t n_dir = sectors_for(streams.size() + 1, SECTOR / 128);
    const uint32_t n_minifat = sectors_for(minifat.size() * 4, SECTOR);
    const uint32_t n_ministream = sectors_for(mini.size(), SECTOR);
    uint32_t n_regular = 0;
    for (const auto& s : streams)
        if (s.data.size() >= CUTOFF) n_regular += sectors_for(s.data.size(), SECTOR);

    const uint32_t body = n_dir + n_minifat + n_ministream + n_regular;
    uint32_t n_fat = 1;
    while (n_fat * (SECTOR / 4) < n_fat + body) ++n_fat;

    // Sectors are allocated in file order: FAT, directory, MiniFAT, mini stream, regular streams.
    std::vector<uint32_t> fat(static_cast<size_t>(n_fat) * (SECTOR / 4), FREESECT);
    uint32_t next = 0;
    for (uint32_t k = 0; k < n_fat; ++k) fat[next++] = FATSECT;
    auto chain = [&](uint32_t count) -> uint32_t {
        if (count == 0) return ENDOFCHAIN;
        const uint32_t first = next;
        for (uint32_t k = 0; k < count; ++k, ++next) fat[next] = (k + 1 < count) ? next + 1 : ENDOFCHAIN;
        return first;
    };
    const uint32_t dir_start = chain(n_dir);
    const uint32_t minifat_start = chain(n_minifat);
    const uint32_t ministream_start = chain(n_ministream);
    for (size_t i = 0; i < streams.size(); ++i)
        if (streams[i].data.size() >= CUTOFF) start[i] = chain(sectors_for(streams[i].data.size(), SECTOR));

    auto dir_entry = [](const std::string& name, uint8_t type, uint32_t right, uint32_t child,
                        uint32_t first, uint32_t size) {
        std::string e(128, '\0');
        const size_t len = std::min<size_t>(name.size(), 31);
        for (size_t k = 0; k < len; ++k) e[k * 2] = name[k];
        poke16(e, 0x40, static_cast<uint16_t>((len + 1) * 2));
        e[0x42] = static_cast<char>(type);
        e[0x43] = 1;  // black
        poke32(e, 0x44, NOSTREAM);
        poke32(e, 0x48, right);
        poke32(e, 0x4C, child);
        poke32(e, 0x74, first);
        poke32(e, 0x78, size);
        return e;
    };

    // Root's child is the first stream; siblings form a right-leaning chain.
    std::string dir = dir_entry("Root Entry", 5, NOSTREAM, streams.empty() ? NOSTREAM : 1,
                                mini.empty() ? ENDOFCHAIN : ministream_start,
                                static_cast<uint32_t>(mini.size()));
    for (size_t i = 0; i < streams.size(); ++i) {
        const uint32_t right = (i + 1 < streams.size()) ? static_cast<uint32_t>(i + 2) : NOSTREAM;
        dir += dir_entry(streams[i].name, 2, right, NOSTREAM, start[i],
                         static_cast<uint32_t>(streams[i].data.size()));
    }
    dir.resize(static_cast<size_t>(n_dir) * SECTOR, '\0');

    std::string header(SECTOR, '\0');
    std::memcpy(&header[0], Sig::Bin::OLE.data(), Sig::Bin::OLE.size());
    poke16(header, 0x18, 0x003E);   // minor version
    poke16(header, 0x1A, 0x0003);   // major version 3
    poke16(header, 0x1C, 0xFFFE);   // little-endian
    poke16(header, 0x1E, 9);        // 512-byte sectors
    poke16(header, 0x20, 6);        // 64-byte mini sectors
    poke32(header, 0x2C, n_fat);
    poke32(header, 0x30, dir_start);
    poke32(header, 0x38, CUTOFF);
    poke32(header, 0x3C, minifat_start);
    poke32(header, 0x40, n_minifat);
    poke32(header, 0x44, ENDOFCHAIN);
    poke32(header, 0x48, 0);
    for (uint32_t k = 0; k < 109; ++k) poke32(header, 0x4C + k * 4, k < n_fat ? k : FREESECT);

    std::string out = header;
    for (uint32_t v : fat) put32(out, v);
    out += dir;

    std::string mf;
    for (uint32_t v : minifat) put32(mf, v);
    while (mf.size() < static_cast<size_t>(n_minifat) * SECTOR) put32(mf, FREESECT);
    out += mf;

    mini.resize(static_cast<size_t>(n_ministream) * SECTOR, '\0');
    out += mini;

    for (const auto& s : streams) {
        if (s.data.size() < CUTOFF) continue;
        std::string padded = s.data;
        padded.resize(static_cast<size_t>(sectors_for(s.data.size(), SECTOR)) * SECTOR, '\0');
        out += padded;
    }
    return out;
}

std::string SampleGenerator::cfb(const CfbSampleOptions& opt) const {
    std::vector<CfbStream> streams;
    if (opt.word_document)
        streams.push_back({ Sig::Bin::OLE_WORD, letters(4608) + opt.word_payload });
    if (opt.summary_info)
        streams.push_back({ Sig::Bin::OLE_SUMMARY, letters(200, 'a') });
    if (opt.workbook)
        streams.push_back({ Sig::Bin::OLE_XL, letters(300) + opt.workbook_payload });
    if (!opt.encryption_info.empty())
        streams.push_back({ "EncryptionInfo", opt.encryption_info });
    if (opt.encrypted_package)
        streams.push_back({ "EncryptedPackage", letters(5000, 'b') });
    return build_cfb(streams);
}

std::string SampleGenerator::zip(const std::vector<ZipSampleEntry>& entries, const std::string& comment) const {
    struct Written {
        uint16_t flags;
        uint16_t method;
        uint32_t crc;
        uint32_t size;
        uint32_t offset;
        std::string extra;
    };
    std::vector<Written> written;
    std::string out;

    for (const auto& e : entries) {
        Written w;
        w.flags = static_cast<uint16_t>((e.encrypted ? 0x0001 : 0) | (e.utf8_name ? 0x0800 : 0));
        w.method = e.aes ? 99 : 0;
        w.crc = crc32(e.data);
        w.size = static_cast<uint32_t>(e.data.size());
        w.offset = static_cast<uint32_t>(out.size());
        if (e.aes) {
            // WinZip AES: vendor version 2, "AE", strength 3 (256-bit), actual method stored
            put16(w.extra, 0x9901);
            put16(w.extra, 7);
            put16(w.extra, 2);
            w.extra += "AE";
            put8(w.extra, 3);
            put16(w.extra, 0);
        }

        // Local File Header
        put32(out, 0x04034b50);
        put16(out, 20);           // version needed
        put16(out, w.flags);
        put16(out, w.method);
        put16(out, 0);            // time
        put16(out, 0);            // date
        put32(out, w.crc);
        put32(out, w.size);       // compressed
        put32(out, w.size);       // uncompressed
        put16(out, static_cast<uint16_t>(e.name.size()));
        put16(out, static_cast<uint16_t>(w.extra.size()));
        out += e.name;
        out += w.extra;
        out += e.data;
        written.push_back(w);
    }

    const uint32_t cd_start = static_cast<uint32_t>(out.size());
    for (size_t i = 0; i < entries.size(); ++i) {
        const Written& w = written[i];
        put32(out, 0x02014b50);
        put16(out, 20);           // version made by
        put16(out, 20);           // version needed
        put16(out, w.flags);
        put16(out, w.method);
        put32(out, 0);            // time + date
        put32(out, w.crc);
        put32(out, w.size);
        put32(out, w.size);
        put16(out, static_cast<uint16_t>(entries[i].name.size()));
        put16(out, static_cast<uint16_t>(w.extra.size()));
        put16(out, 0);            // comment
        put16(out, 0);            // disk start
        put16(out, 0);            // internal attr
        put32(out, 0);            // external attr
        put32(out, w.offset);
        out += entries[i].name;
        out += w.extra;
    }
    const uint32_t cd_size = static_cast<uint32_t>(out.size()) - cd_start;

    put32(out, 0x06054b50);
    put16(out, 0);
    put16(out, 0);
    put16(out, static_cast<uint16_t>(entries.size()));  // entries on this disk
    put16(out, static_cast<uint16_t>(entries.size()));  // total entries
    put32(out, cd_size);
    put32(out, cd_start);
    put16(out, static_cast<uint16_t>(comment.size()));
    out += comment;
    return out;
}

std::string SampleGenerator::ooxml() const {
    const std::string content_types =
        "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n"
        "<Types xmlns=\"http://schemas.openxmlformats.org/package/2006/content-types\">"
        "<Default Extension=\"rels\" ContentType=\"application/vnd.openxmlformats-package.relationships+xml\"/>"
        "<Default Extension=\"xml\" ContentType=\"application/xml\"/>"
        "<Override PartName=\"/word/document.xml\" "
        "ContentType=\"application/vnd.openxmlformats-officedocument.wordprocessingml.document.main+xml\"/>"
        "</Types>";
    const std::string rels =
        "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n"
        "<Relationships xmlns=\"http://schemas.openxmlformats.org/package/2006/relationships\">"
        "<Relationship Id=\"rId1\" Type=\"http://schemas.openxmlformats.org/officeDocument/2006/"
        "relationships/officeDocument\" Target=\"word/document.xml\"/></Relationships>";
    const std::string document =
        "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n"
        "<w:document xmlns:w=\"http://schemas.openxmlformats.org/wordprocessingml/2006/main\">"
        "<w:body><w:p><w:r><w:t>lorem ipsum</w:t></w:r></w:p></w:body></w:document>";
    const std::string document_rels =
        "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n"
        "<Relationships xmlns=\"http://schemas.openxmlformats.org/package/2006/relationships\"/>";

    return zip({
        { "[Content_Types].xml", content_types },
        { "_rels/.rels", rels },
        { "word/document.xml", document },
        { "word/_rels/document.xml.rels", document_rels },
    });
}

std::string SampleGenerator::rar4(int file_records) const {
    std::string out = Sig::Bin::RAR4;

    // MAIN_HEAD: crc, type, flags, size, 6 reserved bytes
    put16(out, 0x90CF);
    put8(out, 0x73);
    put16(out, 0x0000);
    put16(out, 13);
    put16(out, 0);
    put32(out, 0);

    for (int i = 0; i < file_records; ++i) {
        const std::string name = "file_" + std::to_string(i) + ".txt";
        const std::string data = letters(40 + i * 8);
        put16(out, 0);                                           // header crc
        put8(out, 0x74);
        put16(out, 0x8000);                                      // LONG_BLOCK
        put16(out, static_cast<uint16_t>(32 + name.size()));
        put32(out, static_cast<uint32_t>(data.size()));          // packed size
        put32(out, static_cast<uint32_t>(data.size()));          // unpacked size
        put8(out, 3);                                            // host os
        put32(out, crc32(data));
        put32(out, 0);                                           // ftime
        put8(out, 20);                                           // unpack version
        put8(out, 0x30);                                         // method: store
        put16(out, static_cast<uint16_t>(name.size()));
        put32(out, 0x20);                                        // attributes
        out += name;
        out += data;
    }

    // ENDARC_HEAD
    put16(out, 0x3DC4);
    put8(out, 0x7B);
    put16(out, 0x4000);
    put16(out, 7);
    return out;
}

std::string SampleGenerator::rar5() const {
    std::string out = Sig::Bin::RAR5;
    // Main archive header: crc32 (left small, not computed), size vint, type 1, flags, archive flags
    put32(out, 0x00001D2A);
    put8(out, 0x03);
    put8(out, 0x01);
    put8(out, 0x00);
    put8(out, 0x00);
    // End of archive header
    put32(out, 0x00001C4F);
    put8(out, 0x03);
    put8(out, 0x05);
    put8(out, 0x00);
    put8(out, 0x00);
    return out;
}

std::string SampleGenerator::pdf(const PdfSampleOptions& opt) const {
    std::string out = "%PDF-" + opt.version + "\n%\xE2\xE3\xCF\xD3\n";
    std::vector<size_t> offsets;

    auto add_object = [&](const std::string& body) {
        offsets.push_back(out.size());
        out += std::to_string(offsets.size()) + " 0 obj\n" + body + "\nendobj\n";
        return static_cast<int>(offsets.size());
    };

    add_object("<< /Type /Catalog /Pages 2 0 R >>");
    add_object("<< /Type /Pages /Kids [3 0 R] /Count 1 >>");
    add_object("<< /Type /Page /Parent 2 0 R /MediaBox [0 0 612 792] >>");
    for (int i = 3; i < opt.objects; ++i)
        add_object("<< /Producer (featscan sample " + std::to_string(i) + ") >>");

    int encrypt_obj = 0;
    if (opt.encrypt) {
        std::string dict = "<< /Filter /" + opt.filter + " /V 2 /R 3 /Length 128 /P -3904"
                           " /O <" + std::string(64, 'A') + "> /U <" + std::string(64, 'B') + ">";
        if (opt.encrypt_metadata) dict += *opt.encrypt_metadata ? " /EncryptMetadata true" : " /EncryptMetadata false";
        dict += " >>";
        encrypt_obj = add_object(dict);
    }

    std::string trailer_keys = " /Root 1 0 R";
    if (encrypt_obj) trailer_keys += " /Encrypt " + std::to_string(encrypt_obj) + " 0 R";
    if (opt.with_id)
        trailer_keys += " /ID [<0123456789ABCDEF0123456789ABCDEF> <0123456789ABCDEF0123456789ABCDEF>]";

    size_t xref_offset = 0;
    if (!opt.xref_stream) {
        xref_offset = out.size();
        out += "xref\n0 " + std::to_string(offsets.size() + 1) + "\n";
        out += "0000000000 65535 f \n";
        for (size_t off : offsets) {
            std::ostringstream line;
            line << std::setw(10) << std::setfill('0') << off << " 00000 n \n";
            out += line.str();
        }
        out += "trailer\n<< /Size " + std::to_string(offsets.size() + 1) + trailer_keys + " >>\n";
    } else {
        // Cross-reference stream, /W [1 4 1], uncompressed.
        const size_t size = offsets.size() + 2;
        xref_offset = out.size();
        std::string data;
        put8(data, 0);
        put32be(data, 0);
        put8(data, 0xFF);
        for (size_t off : offsets) {
            put8(data, 1);
            put32be(data, static_cast<uint32_t>(off));
            put8(data, 0);
        }
        put8(data, 1);
        put32be(data, static_cast<uint32_t>(xref_offset));
        put8(data, 0);
        out += std::to_string(size - 1) + " 0 obj\n<< /Type /XRef /Size " + std::to_string(size) +
               " /W [1 4 1]" + trailer_keys + " /Length " + std::to_string(data.size()) +
               " >>\nstream\n" + data + "\nendstream\nendobj\n";
    }
    out += "startxref\n" + std::to_string(xref_offset) + "\n%%EOF\n";
    return out;
}

std::string SampleGenerator::random_bytes(size_t n) {
    std::uniform_int_distribution<int> byte(0, 255);
    std::string out(n, '\0');
    for (auto& c : out) c = static_cast<char>(byte(rng));
    return out;
}

void SampleGenerator::write_file(const fs::path& path, const std::string& bytes) {
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f.is_open()) throw std::runtime_error("cannot create " + path.string());
    f.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    if (!f) throw std::runtime_error("write failed: " + path.string());
}

GenStats SampleGenerator::generate_folder(const std::string& dir, int copies) {
    GenStats stats;
    fs::create_directories(dir);

    const std::string agile_info =
        "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\r\n"
        "<encryption xmlns=\"http://schemas.microsoft.com/office/2006/encryption\">"
        "<keyData saltSize=\"16\" blockSize=\"16\" keyBits=\"256\" cipherAlgorithm=\"AES\" "
        "hashAlgorithm=\"SHA512\"/><keyEncryptors><keyEncryptor "
        "uri=\"http://schemas.microsoft.com/office/2006/keyEncryption/password\"/>"
        "</keyEncryptors></encryption>";

    PdfSampleOptions xref_stream;
    xref_stream.xref_stream = true;
    PdfSampleOptions encrypted_pdf;
    encrypted_pdf.encrypt = true;
    encrypted_pdf.encrypt_metadata = false;

    CfbSampleOptions encrypted_doc;
    encrypted_doc.encryption_info = agile_info;
    encrypted_doc.encrypted_package = true;
    CfbSampleOptions xls;
    xls.word_document = false;
    xls.workbook = true;

    for (int i = 0; i < copies; ++i) {
        std::vector<std::pair<std::string, std::string>> files = {
            { "gzip_plain.gz",        gzip(false, 0) },
            { "gzip_named.gz",        gzip(true, 1700000000u) },
            { "jpeg_exif.jpg",        jpeg(true) },
            { "jpeg_jfif.jpg",        jpeg(false) },
            { "png.png",              png() },
            { "mp4.mp4",              mp4("isom") },
            { "ole2_doc.doc",         cfb() },
            { "ole2_xls.xls",         cfb(xls) },
            { "ole2_encrypted.docx",  cfb(encrypted_doc) },
            { "zip_plain.zip",        zip({ { "a.txt", letters(120) }, { "b.txt", random_bytes(256) } }) },
            { "zip_crypto.zip",       zip({ { "secret.txt", random_bytes(128), true } }) },
            { "zip_aes.zip",          zip({ { "secret.bin", random_bytes(128), true, true } }) },
            { "ooxml.docx",           ooxml() },
            { "rar4.rar",             rar4(2) },
            { "rar5.rar",             rar5() },
            { "pdf_classic.pdf",      pdf() },
            { "pdf_xref_stream.pdf",  pdf(xref_stream) },
            { "pdf_encrypted.pdf",    pdf(encrypted_pdf) },
            { "random.bin",           random_bytes(65536) },
            { "empty.dat",            std::string() },
        };

        for (const auto& [name, bytes] : files) {
            const fs::path stem = fs::path(name).stem();
            const fs::path target = fs::path(dir) / (stem.string() + "_" + std::to_string(i) +
                                                     fs::path(name).extension().string());
            write_file(target, bytes);
            stats.per_label[stem.string()]++;
            stats.total_files++;
            stats.total_bytes += bytes.size();
        }
    }
    return stats;
}
