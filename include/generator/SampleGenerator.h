#pragma once
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <map>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace fs = std::filesystem;

// Counts of generated files per label, printed by tools/generate_dataset.
struct GenStats {
    std::map<std::string, int> per_label;
    int total_files = 0;
    size_t total_bytes = 0;

    void print() const {
        std::cout << "===== GENERATION REPORT (Ground Truth) =====" << std::endl;
        for (const auto& [label, count] : per_label)
            std::cout << label << ": " << count << std::endl;
        std::cout << "----------------" << std::endl;
        std::cout << "Total Files: " << total_files
                  << " | Total Size: " << (total_bytes / 1024) << " KB" << std::endl;
        std::cout << "============================================" << std::endl;
    }
};

struct ZipSampleEntry {
    std::string name;
    std::string data;
    bool encrypted = false;  // general-purpose bit 0
    bool aes = false;        // adds a 0x9901 extra record
    bool utf8_name = false;  // general-purpose bit 11
};

struct CfbSampleOptions {
    bool word_document = true;
    bool summary_info = true;
    bool workbook = false;
    // Non-empty: adds EncryptedPackage plus an EncryptionInfo stream with these bytes.
    std::string encryption_info;
    bool encrypted_package = false;
    // Appended to the WordDocument stream (provider names, markers).
    std::string word_payload;
    std::string workbook_payload;
};

struct PdfSampleOptions {
    std::string version = "1.7";
    bool xref_stream = false;
    bool with_id = true;
    bool encrypt = false;
    std::string filter = "Standard";
    std::optional<bool> encrypt_metadata;
    int objects = 3;
};

// Builds small, structurally valid files for every parser family. All
// builders are deterministic; random filler comes from the seeded rng.
class SampleGenerator {
public:
    explicit SampleGenerator(uint32_t seed = 1234);

    std::string gzip(bool with_name = false, uint32_t mtime = 0) const;
    std::string jpeg(bool exif = true) const;
    std::string png() const;
    std::string mp4(const std::string& brand = "isom") const;
    std::string cfb(const CfbSampleOptions& opt = {}) const;
    std::string zip(const std::vector<ZipSampleEntry>& entries, const std::string& comment = "") const;
    std::string ooxml() const;
    std::string rar4(int file_records = 2) const;
    std::string rar5() const;
    std::string pdf(const PdfSampleOptions& opt = {}) const;

    std::string random_bytes(size_t n);

    // One labelled file per family and variant, `copies` times over.
    GenStats generate_folder(const std::string& dir, int copies);

    static void write_file(const fs::path& path, const std::string& bytes);
    static uint32_t crc32(const std::string& data);

    // CFB stream as laid out by cfb(): name plus content.
    struct CfbStream {
        std::string name;
        std::string data;
    };
    static std::string build_cfb(const std::vector<CfbStream>& streams);

private:
    std::mt19937 rng;
};
