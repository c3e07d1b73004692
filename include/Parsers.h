#pragma once
// Parsers.h: structural and encryption-marker parsers.
//
// Every parser walks one container format without decoding its payload and
// reports a small fixed record. Records are plain structs; to_features()
// turns them into FeatureMap rows keyed by schema column name.
//
// FormatParser (abstract, what the registry stores)
// └── RecordParser<Record> (typed; parse() never throws)
//     ├── GzipParser, JpegParser, PngParser, Mp4Parser, Ole2Parser,
//     │   ZipParser, OoxmlParser, RarParser, PdfParser        (structural)
//     └── Ole2EncParser, PdfEncParser, ZipEncParser           (encryption)
//
// All loops are bounded by per-format caps, so adversarial input costs at
// most a fixed amount of work.

#include <cstdint>
#include <exception>
#include <optional>
#include <string>
#include "FeatureValue.h"
#include "Logger.h"
#include "ParseResult.h"

class FormatParser {
public:
    virtual ~FormatParser() = default;

    // Registry key: "gzip", "ole2", ... or "<family>_enc".
    virtual std::string family() const = 0;

    // Feature record for one file. Never throws: any failure is reported as
    // default_record().
    virtual FeatureMap parse(const std::string& path) const = 0;

    // All booleans false, counts zero, optional values null.
    virtual FeatureMap default_record() const = 0;
};

template <typename Record>
class RecordParser : public FormatParser {
public:
    FeatureMap parse(const std::string& path) const override {
        return parse_record(path).to_features();
    }

    FeatureMap default_record() const override { return Record{}.to_features(); }

    Record parse_record(const std::string& path) const {
        try {
            ParseResult<Record> r = run(path);
            if (r) return r.value();
            Logger::info(family() + ": " + path + ": " + r.error().to_string());
        }
        catch (const std::exception& e) {
            Logger::info(family() + ": " + path + ": " + e.what());
        }
        return Record{};
    }

protected:
    virtual ParseResult<Record> run(const std::string& path) const = 0;
};

// ---------------------------------------------------------------------------
// Structural records
// ---------------------------------------------------------------------------

struct GzipRecord {
    bool header_ok = false;
    bool mtime_present = false;
    bool name_present = false;
    bool parser_ok = false;
    bool structure_consistent = false;
    FeatureMap to_features() const;
};

struct JpegRecord {
    bool header_ok = false;
    bool sof_present = false;
    bool sos_present = false;
    bool exif_present = false;
    int64_t segments_count = 0;
    bool parser_ok = false;
    bool structure_consistent = false;
    FeatureMap to_features() const;
};

struct PngRecord {
    bool header_ok = false;
    bool ihdr_ok = false;
    int64_t chunks_count = 0;
    int64_t idat_count = 0;
    bool end_iend_ok = false;
    bool parser_ok = false;
    bool structure_consistent = false;
    FeatureMap to_features() const;
};

struct Mp4Record {
    bool ftyp_present = false;
    bool moov_present = false;
    bool mdat_present = false;
    std::string brand;  // ASCII bytes of the major brand, "" without ftyp
    bool box_tree_ok = false;
    bool parser_ok = false;
    bool structure_consistent = false;
    FeatureMap to_features() const;
};

struct Ole2Record {
    bool dir_ok = false;
    int64_t stream_count = 0;
    bool fat_ok = false;
    bool mini_fat_ok = false;
    bool root_entry_present = false;
    bool summaryinfo_present = false;
    bool expected_streams_present = false;
    bool parser_ok = false;
    bool structure_consistent = false;
    FeatureMap to_features() const;
};

struct ZipRecord {
    bool central_dir_ok = false;
    bool cd_offset_ok = false;
    int64_t entry_count = 0;
    bool has_content_types = false;
    int64_t comment_len = 0;
    double names_utf8_fraction = 0.0;
    double crc_present_fraction = 0.0;
    bool parser_ok = false;
    bool structure_consistent = false;
    FeatureMap to_features() const;
};

struct OoxmlRecord {
    bool detected = false;
    bool coreparts_present = false;
    int64_t rel_count = 0;
    bool pkg_ok = false;
    bool parser_ok = false;
    bool structure_consistent = false;
    FeatureMap to_features() const;
};

struct RarRecord {
    bool header_ok = false;
    bool main_header_flags_ok = false;
    int64_t file_records_count = 0;
    bool version_5 = false;
    bool parser_ok = false;
    bool structure_consistent = false;
    FeatureMap to_features() const;
};

struct PdfRecord {
    std::optional<double> version;
    bool has_trailer = false;
    bool startxref_found = false;
    bool xref_ok = false;
    bool ids_present = false;
    bool root_present = false;
    bool trailer_ok = false;
    double obj_count_est = 0.0;
    bool parser_ok = false;
    bool structure_consistent = false;
    FeatureMap to_features() const;
};

// ---------------------------------------------------------------------------
// Encryption records
// ---------------------------------------------------------------------------

struct Ole2EncRecord {
    bool encrypted_package_present = false;
    bool encryption_info_present = false;
    std::optional<std::string> encryption_type;  // Agile | Extensible | Standard | Unknown
    std::optional<std::string> crypto_provider;
    bool rc4_meta_present = false;
    bool rc4_triplet_present = false;
    FeatureMap to_features() const;
};

struct PdfEncRecord {
    bool encrypt_dict_present = false;
    std::optional<std::string> filter;
    std::optional<bool> encrypt_metadata;
    FeatureMap to_features() const;
};

struct ZipEncRecord {
    bool any_entry_encrypted = false;
    std::optional<std::string> method;  // AES | ZipCrypto | Mixed
    bool all_headers_encrypted = false;
    FeatureMap to_features() const;
};

// ---------------------------------------------------------------------------
// Parsers
// ---------------------------------------------------------------------------

// RFC 1952 member header, first 64 KiB only.
class GzipParser : public RecordParser<GzipRecord> {
public:
    static constexpr size_t MAX_READ = 64 * 1024;
    std::string family() const override { return "gzip"; }

    // Offset just past the optional member-header fields, nullopt when one
    // of them runs past `n`. Sets `name_present` for a non-empty FNAME
    // terminated inside the buffer.
    static std::optional<size_t> header_end(const uint8_t* data, size_t n, bool& name_present);
protected:
    ParseResult<GzipRecord> run(const std::string& path) const override;
};

// Marker walk up to the first SOS.
class JpegParser : public RecordParser<JpegRecord> {
public:
    static constexpr int MAX_STEPS = 200000;
    std::string family() const override { return "jpeg"; }
protected:
    ParseResult<JpegRecord> run(const std::string& path) const override;
};

class PngParser : public RecordParser<PngRecord> {
public:
    static constexpr int MAX_CHUNKS = 100000;
    std::string family() const override { return "png"; }
protected:
    ParseResult<PngRecord> run(const std::string& path) const override;
};

// ISO-BMFF box tree: top level and the direct children of moov.
class Mp4Parser : public RecordParser<Mp4Record> {
public:
    static constexpr int MAX_STEPS = 1000000;
    std::string family() const override { return "mp4"; }
protected:
    ParseResult<Mp4Record> run(const std::string& path) const override;
};

// Compound File Binary: header, FAT/DIFAT, directory stream, MiniFAT.
class Ole2Parser : public RecordParser<Ole2Record> {
public:
    std::string family() const override { return "ole2"; }
protected:
    ParseResult<Ole2Record> run(const std::string& path) const override;
};

// EOCD + central directory.
class ZipParser : public RecordParser<ZipRecord> {
public:
    std::string family() const override { return "zip"; }
protected:
    ParseResult<ZipRecord> run(const std::string& path) const override;
};

// OPC package checks on top of the ZIP listing (libzip).
class OoxmlParser : public RecordParser<OoxmlRecord> {
public:
    static constexpr int64_t RELS_EARLY_STOP = 20;
    static constexpr size_t CT_SCAN_BYTES = 4096;
    std::string family() const override { return "ooxml"; }
protected:
    ParseResult<OoxmlRecord> run(const std::string& path) const override;
};

// RAR 4.x block walk, RAR 5.x shallow check.
class RarParser : public RecordParser<RarRecord> {
public:
    static constexpr uint16_t FLAG_ADD_SIZE = 0x8000;
    std::string family() const override { return "rar"; }
protected:
    ParseResult<RarRecord> run(const std::string& path) const override;
};

// startxref / xref / trailer consistency and an object-count estimate.
class PdfParser : public RecordParser<PdfRecord> {
public:
    static constexpr size_t HEAD_READ = 64 * 1024;
    static constexpr size_t TAIL_READ = 128 * 1024;
    static constexpr size_t STARTXREF_SCAN = 256 * 1024;
    static constexpr size_t NEAR_WINDOW = 4096;
    std::string family() const override { return "pdf"; }
protected:
    ParseResult<PdfRecord> run(const std::string& path) const override;
};

// OOXML-in-CFB encryption streams and legacy RC4/CryptoAPI markers.
class Ole2EncParser : public RecordParser<Ole2EncRecord> {
public:
    static constexpr size_t HEAD_LEN = 16384;
    std::string family() const override { return "ole2_enc"; }

    // Exposed for tests.
    // Agile / Extensible / Standard from the EncryptionInfo stream, nullopt if empty.
    static std::optional<std::string> detect_encryption_type(const std::string& blob);
    static std::optional<std::string> detect_provider(const std::string& blob);
    static bool has_rc4_triplet(const std::string& blob);
protected:
    ParseResult<Ole2EncRecord> run(const std::string& path) const override;
};

// /Encrypt dictionary: presence, /Filter, /EncryptMetadata.
class PdfEncParser : public RecordParser<PdfEncRecord> {
public:
    static constexpr size_t TAIL_READ = 256 * 1024;
    static constexpr size_t HEAD_READ = 1024 * 1024;
    static constexpr size_t WINDOW_BEFORE = 2 * 1024;
    static constexpr size_t WINDOW_AFTER = 8 * 1024;
    std::string family() const override { return "pdf_enc"; }
protected:
    ParseResult<PdfEncRecord> run(const std::string& path) const override;
};

// Per-entry encryption bit and WinZip AES extra field.
class ZipEncParser : public RecordParser<ZipEncRecord> {
public:
    static constexpr uint16_t AES_EXTRA_ID = 0x9901;
    std::string family() const override { return "zip_enc"; }
protected:
    ParseResult<ZipEncRecord> run(const std::string& path) const override;
};
