#include <benchmark/benchmark.h>
#include <iostream>
#include <vector>
#include <string>
#include <filesystem>
#include <fstream>
#include <memory>
#include <iomanip>
#include <map>
#include <algorithm>

#include "ByteStatistics.h"
#include "ConfigLoader.h"
#include "Extractor.h"
#include "Scanner.h"
#include "Signatures.h"
#include "generator/SampleGenerator.h"

namespace fs = std::filesystem;

static std::vector<SignatureDefinition> g_sigs;
static FeaturesConfig g_features;

struct FileEntry {
    std::string path;
    std::string label;     // generator stem without the copy index
    std::string content;
};

static std::vector<FileEntry> g_files;
static size_t g_total_bytes = 0;

// "rar4_3.rar" -> "rar4"
std::string label_of(const fs::path& p) {
    std::string stem = p.stem().string();
    const size_t us = stem.rfind('_');
    return us == std::string::npos ? stem : stem.substr(0, us);
}

// format_family the sniffer should report for a generator label.
std::string expected_family(const std::string& label) {
    static const std::map<std::string, std::string> families = {
        { "gzip_plain", "gzip" }, { "gzip_named", "gzip" },
        { "jpeg_exif", "jpeg" }, { "jpeg_jfif", "jpeg" },
        { "png", "png" }, { "mp4", "mp4" },
        { "ole2_doc", "ole2" }, { "ole2_xls", "ole2" }, { "ole2_encrypted", "ole2" },
        { "zip_plain", "zip" }, { "zip_crypto", "zip" }, { "zip_aes", "zip" },
        { "ooxml", "ooxml" }, { "rar4", "rar" }, { "rar5", "rar" },
        { "pdf_classic", "pdf" }, { "pdf_xref_stream", "pdf" }, { "pdf_encrypted", "pdf" },
    };
    auto it = families.find(label);
    return it != families.end() ? it->second : "other";
}

void LoadDataset(const fs::path& folder, int copies) {
    if (fs::exists(folder)) fs::remove_all(folder);

    std::cout << "[Setup] Generating dataset in " << folder << " (copies: " << copies << ")...\n";
    SampleGenerator gen;
    gen.generate_folder(folder.string(), copies);

    g_files.clear();
    g_total_bytes = 0;

    for (const auto& entry : fs::directory_iterator(folder)) {
        if (!entry.is_regular_file()) continue;
        std::ifstream f(entry.path(), std::ios::binary | std::ios::ate);
        if (!f) continue;
        auto size = f.tellg();
        std::string str(static_cast<size_t>(size), '\0');
        f.seekg(0);
        f.read(&str[0], size);

        FileEntry fe;
        fe.path = entry.path().string();
        fe.label = label_of(entry.path());
        fe.content = std::move(str);
        g_total_bytes += fe.content.size();
        g_files.push_back(std::move(fe));
    }
    std::cout << "[Setup] Loaded " << g_files.size() << " files, "
        << (g_total_bytes / 1024) << " KB.\n";
}

// Per-label sniffing accuracy for one engine.
void VerifyEngine(EngineType engine) {
    SnifferConfig cfg = g_features.sniffer;
    cfg.engine = engine;
    cfg.signatures = g_sigs;
    Sniffer sniffer(cfg);

    std::map<std::string, std::pair<int, int>> per_label;  // label -> (generated, matched)
    for (const auto& file : g_files) {
        auto& row = per_label[file.label];
        row.first++;
        if (sniffer.sniff(file.path).format_family == expected_family(file.label)) row.second++;
    }

    std::cout << "\n--- Accuracy: " << sniffer.engine_name() << " ---\n";
    std::cout << "| LABEL            | GEN    | MATCH  | STATUS\n";
    std::cout << "|------------------|--------|--------|-------\n";
    for (const auto& [label, counts] : per_label) {
        std::string status = (counts.second == counts.first) ? "OK" : "MISS";
        std::cout << "| " << std::left << std::setw(16) << label
            << " | " << std::setw(6) << counts.first
            << " | " << std::setw(6) << counts.second
            << " | " << status << "\n";
    }
    std::cout << "------------------------------------------\n";
}

template <typename ScannerT>
void BM_Scan(benchmark::State& state) {
    auto scanner = std::make_unique<ScannerT>();
    scanner->prepare(g_sigs);

    size_t total_files = g_files.size();
    size_t batch_size = (total_files + state.threads() - 1) / state.threads();
    size_t start_idx = std::min(state.thread_index() * batch_size, total_files);
    size_t end_idx = std::min(start_idx + batch_size, total_files);

    for (auto _ : state) {
        for (size_t i = start_idx; i < end_idx; ++i) {
            MagicHits hits;
            const size_t head = std::min(g_files[i].content.size(), g_features.sniffer.head_bytes);
            scanner->scan(g_files[i].content.data(), head, hits);
            benchmark::DoNotOptimize(hits);
        }
    }

    size_t bytes_processed = 0;
    for (size_t i = start_idx; i < end_idx; ++i)
        bytes_processed += std::min(g_files[i].content.size(), g_features.sniffer.head_bytes);
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * bytes_processed);
}

void BM_ByteStatistics(benchmark::State& state) {
    for (auto _ : state) {
        for (const auto& file : g_files) {
            ByteStatistics s = compute_byte_statistics(
                reinterpret_cast<const uint8_t*>(file.content.data()), file.content.size());
            benchmark::DoNotOptimize(s);
        }
    }
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * g_total_bytes);
}

void BM_Extract(benchmark::State& state) {
    SnifferConfig cfg = g_features.sniffer;
    cfg.signatures = g_sigs;
    Extractor extractor(g_features.schema, cfg);

    size_t total_files = g_files.size();
    size_t batch_size = (total_files + state.threads() - 1) / state.threads();
    size_t start_idx = std::min(state.thread_index() * batch_size, total_files);
    size_t end_idx = std::min(start_idx + batch_size, total_files);

    for (auto _ : state) {
        for (size_t i = start_idx; i < end_idx; ++i) {
            FeatureMap record = extractor.extract(g_files[i].path);
            benchmark::DoNotOptimize(record);
        }
    }

    size_t bytes_processed = 0;
    for (size_t i = start_idx; i < end_idx; ++i) bytes_processed += g_files[i].content.size();
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * bytes_processed);
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations() * (end_idx - start_idx)));
}

BENCHMARK_TEMPLATE(BM_Scan, Re2Scanner)->Name("Sniff/RE2")->Unit(benchmark::kMicrosecond)->Threads(1)->Threads(8);
BENCHMARK_TEMPLATE(BM_Scan, BoostScanner)->Name("Sniff/Boost")->Unit(benchmark::kMicrosecond)->Threads(1)->Threads(8);
BENCHMARK_TEMPLATE(BM_Scan, HsScanner)->Name("Sniff/Hyperscan")->Unit(benchmark::kMicrosecond)->Threads(1)->Threads(8);
BENCHMARK(BM_ByteStatistics)->Name("ByteStatistics")->Unit(benchmark::kMillisecond);
BENCHMARK(BM_Extract)->Name("Extract")->Unit(benchmark::kMillisecond)->Threads(1)->Threads(8);

int main(int argc, char** argv) {
    g_sigs = ConfigLoader::load_signatures("signatures.json");
    if (g_sigs.empty()) {
        std::cerr << "[Warn] signatures.json not loaded, using built-in table\n";
        g_sigs = Sig::builtin();
    }
    g_features = ConfigLoader::load_features("features.json");
    if (g_features.schema.empty()) {
        std::cerr << "[Fatal] Failed to load features.json\n";
        return 1;
    }

    std::cout << ">>> Preparing Benchmark Data...\n";
    LoadDataset("bench_data_stress", 25);

    VerifyEngine(EngineType::RE2);
    VerifyEngine(EngineType::BOOST);
    VerifyEngine(EngineType::HYPERSCAN);

    std::cout << "\n[Benchmark] Running performance tests...\n";
    ::benchmark::Initialize(&argc, argv);
    if (::benchmark::ReportUnrecognizedArguments(argc, argv)) return 1;
    ::benchmark::RunSpecifiedBenchmarks();

    return 0;
}
