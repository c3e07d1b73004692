#pragma once
// Sniffer.h: container-family classification from header bytes.

#include <cstdint>
#include <memory>
#include <set>
#include <string>
#include <vector>
#include "FeatureValue.h"
#include "Scanner.h"

struct SnifferConfig {
    size_t head_bytes = 16384;
    size_t tail_bytes = 16384;
    std::set<std::string> enabled_families = {
        "pdf", "png", "jpeg", "gzip", "ole2", "rar", "mp4", "zip", "ooxml"
    };
    EngineType engine = EngineType::HYPERSCAN;
    std::vector<SignatureDefinition> signatures;  // empty -> Sig::builtin()
};

struct SniffResult {
    std::string format_family = "other";
    bool magic_ok = false;
    std::string magic_family = "unknown";
    uint64_t size_bytes = 0;
    double log_size = 0.0;

    // The five sniffer columns, in this order.
    FeatureMap to_features() const;
};

// Bytes the sniffer looked at. tail == head when the file is shorter than tail_bytes.
struct SniffWindows {
    std::string head;
    std::string tail;
};

// Owns its matching engine, so one Sniffer per thread.
class Sniffer {
public:
    explicit Sniffer(SnifferConfig config);

    // Throws std::filesystem::filesystem_error / std::runtime_error if the
    // file cannot be stat'ed or opened.
    SniffResult sniff(const std::string& path) const;
    SniffResult sniff(const std::string& path, SniffWindows& windows) const;

    const SnifferConfig& config() const { return m_config; }
    std::string engine_name() const { return m_scanner->name(); }

private:
    bool enabled(const std::string& family) const { return m_config.enabled_families.count(family) != 0; }

    SnifferConfig m_config;
    std::vector<SignatureDefinition> m_sigs;  // sorted, highest priority first
    std::unique_ptr<Scanner> m_scanner;
};
