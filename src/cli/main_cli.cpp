#include <iostream>
#include <filesystem>
#include <vector>
#include <string>
#include <iomanip>
#include <thread>
#include <future>
#include <atomic>
#include <chrono>
#include <algorithm>
#include <optional>
#include "ConfigLoader.h"
#include "Extractor.h"
#include "FeatureSchema.h"
#include "Logger.h"
#include "ReportWriter.h"
#include "Signatures.h"
#include "Sniffer.h"

namespace fs = std::filesystem;

static constexpr const char* FEATSCAN_VERSION = "FeatScan 1.0.0";

void print_ui_help() {
    std::cout << "\n"
        << "==================================================================\n"
        << "              FEATSCAN: FILE FEATURE EXTRACTOR\n"
        << "==================================================================\n\n"
        << "  featscan <INPUT_DIR|FILE> [options]\n\n"
        << "OPTIONS:\n"
        << "  -c, --config <file>        Feature schema (default: features.json)\n"
        << "  -s, --signatures <file>    Signatures file (default: signatures.json)\n"
        << "  -e, --engine <type>        Engine: hs (Hyperscan), re2, boost\n"
        << "  -j, --threads <N>          Thread count (default: CPU cores)\n"
        << "  -o, --output <csv>         Feature table (default: features.csv)\n"
        << "  --output-json <path>       Export JSON summary to path\n"
        << "  --sniff                    Only print the sniff result per file\n"
        << "  -h, --help                 Show this help\n"
        << "  --version                  Show version\n"
        << "==================================================================\n";
}

static std::string relative_path(const fs::path& file, const fs::path& root, bool root_is_dir) {
    if (!root_is_dir) return file.filename().generic_string();
    std::error_code ec;
    fs::path rel = fs::relative(file, root, ec);
    if (ec || rel.empty()) return file.generic_string();
    return rel.generic_string();
}

static std::string printable_preview(const std::string& bytes, size_t n) {
    std::string out;
    for (size_t i = 0; i < bytes.size() && i < n; ++i) {
        unsigned char c = static_cast<unsigned char>(bytes[i]);
        out += (c >= 0x20 && c < 0x7F) ? static_cast<char>(c) : '.';
    }
    return out;
}

static int run_sniff(const std::vector<fs::path>& files, const fs::path& root, bool root_is_dir,
                     const SnifferConfig& config)
{
    Sniffer sniffer(config);
    int failures = 0;
    for (const auto& p : files) {
        const std::string rel = relative_path(p, root, root_is_dir);
        try {
            SniffWindows windows;
            SniffResult r = sniffer.sniff(p.string(), windows);
            std::cout << rel
                      << "  family=" << r.format_family
                      << " magic_ok=" << (r.magic_ok ? "True" : "False")
                      << " magic_family=" << r.magic_family
                      << " size=" << r.size_bytes
                      << " head=\"" << printable_preview(windows.head, 16) << "\""
                      << " tail=\"" << printable_preview(windows.tail.substr(
                             windows.tail.size() > 16 ? windows.tail.size() - 16 : 0), 16) << "\"\n";
        }
        catch (const std::exception& e) {
            Logger::warn("Cannot sniff " + rel + ": " + e.what());
            failures++;
        }
    }
    return failures == 0 ? 0 : 1;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_ui_help();
        return 0;
    }

    {
        std::string first = argv[1];
        if (first == "-h" || first == "--help") {
            print_ui_help();
            return 0;
        }
        if (first == "--version") {
            std::cout << FEATSCAN_VERSION << "\n";
            return 0;
        }
    }

    Logger::init();
    Logger::info("FeatScan started");

    std::string target_path = argv[1];
    std::string config_path = "features.json";
    std::string signatures_path = "signatures.json";
    std::string output_csv = "features.csv";
    std::string output_json;
    std::optional<EngineType> engine_override;
    unsigned int num_threads = std::thread::hardware_concurrency();
    if (num_threads == 0) num_threads = 4;
    bool sniff_only = false;

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            config_path = argv[++i];
        }
        else if ((arg == "-s" || arg == "--signatures") && i + 1 < argc) {
            signatures_path = argv[++i];
        }
        else if ((arg == "-e" || arg == "--engine") && i + 1 < argc) {
            std::string e = argv[++i];
            engine_override = engine_from_string(e);
            if (!engine_override) {
                std::cerr << "[Error] Unknown engine: " << e << "\n";
                return 1;
            }
        }
        else if ((arg == "-j" || arg == "--threads") && i + 1 < argc) {
            try {
                num_threads = static_cast<unsigned int>(std::stoi(argv[++i]));
            }
            catch (const std::exception&) {
                std::cerr << "[Error] Invalid thread count: " << argv[i] << "\n";
                return 1;
            }
            if (num_threads == 0) num_threads = 1;
        }
        else if ((arg == "-o" || arg == "--output") && i + 1 < argc) {
            output_csv = argv[++i];
        }
        else if (arg == "--output-json" && i + 1 < argc) {
            output_json = argv[++i];
        }
        else if (arg == "--sniff") {
            sniff_only = true;
        }
        else {
            std::cerr << "[Warn] Ignoring unknown option: " << arg << "\n";
        }
    }

    Logger::info("Loading config: " + config_path);
    FeaturesConfig cfg = ConfigLoader::load_features(config_path);
    if (cfg.schema.empty()) {
        Logger::error("No feature schema loaded from " + config_path);
        return 1;
    }
    Logger::info("Schema columns: " + std::to_string(cfg.schema.size()));

    cfg.sniffer.signatures = ConfigLoader::load_signatures(signatures_path);
    if (cfg.sniffer.signatures.empty()) {
        Logger::warn("Using built-in signature table (" + signatures_path + " not usable)");
        cfg.sniffer.signatures = Sig::builtin();
    }
    Logger::info("Signatures loaded: " + std::to_string(cfg.sniffer.signatures.size()));
    if (engine_override) cfg.sniffer.engine = *engine_override;

    // Collect file paths
    std::vector<fs::path> file_paths;
    auto opts = fs::directory_options::skip_permission_denied;
    const fs::path root = target_path;
    bool root_is_dir = false;

    try {
        if (fs::is_directory(root)) {
            root_is_dir = true;
            for (auto const& entry : fs::recursive_directory_iterator(root, opts)) {
                if (entry.is_regular_file() && !entry.is_symlink())
                    file_paths.push_back(entry.path());
            }
            std::sort(file_paths.begin(), file_paths.end());
        }
        else if (fs::exists(root)) {
            file_paths.push_back(root);
        }
        else {
            Logger::error("Input does not exist: " + target_path);
            return 1;
        }
    }
    catch (const std::exception& e) {
        Logger::error("Directory traversal error: " + std::string(e.what()));
        return 1;
    }

    if (sniff_only) return run_sniff(file_paths, root, root_is_dir, cfg.sniffer);

    const std::string engine_name_str = engine_display_name(cfg.sniffer.engine);
    std::cerr << "[Info] Extracting: " << target_path << " (" << file_paths.size()
              << " files, " << num_threads << " threads, engine: " << engine_name_str << ")\n";
    Logger::info("Extraction started: " + target_path + " (" + std::to_string(file_paths.size())
                 + " files, " + std::to_string(num_threads) + " threads)");

    std::atomic<size_t> processed{0};
    std::atomic<bool> aborted{false};
    const size_t total_files = file_paths.size();

    if (num_threads > total_files && total_files > 0) num_threads = static_cast<unsigned int>(total_files);
    if (num_threads == 0) num_threads = 1;

    // Slot i holds the record for file_paths[i]; nullopt for a failed file.
    std::vector<std::optional<FeatureMap>> records(total_files);

    struct ChunkResult {
        BatchStats stats;
        std::string schema_error;
    };

    auto extract_chunk = [&](size_t start, size_t end) -> ChunkResult {
        Extractor extractor(cfg.schema, cfg.sniffer);
        ChunkResult local;

        for (size_t i = start; i < end; ++i) {
            if (aborted.load()) break;
            const std::string path = file_paths[i].string();
            try {
                FeatureMap record = extractor.extract(path);
                local.stats.add(record);
                records[i] = std::move(record);
            }
            catch (const ExtractionError& e) {
                Logger::warn("Extraction failed: " + std::string(e.what()));
                local.stats.failed++;
            }
            catch (const SchemaMismatchError& e) {
                Logger::error(e.what());
                local.schema_error = e.what();
                aborted = true;
                break;
            }
            catch (const std::exception& e) {
                Logger::warn("Extraction failed: " + path + ": " + e.what());
                local.stats.failed++;
            }
            processed++;
        }
        return local;
    };

    auto t_start = std::chrono::high_resolution_clock::now();
    std::vector<std::future<ChunkResult>> futures;
    size_t chunk_size = (total_files + num_threads - 1) / num_threads;

    for (unsigned int t = 0; t < num_threads; ++t) {
        size_t start = t * chunk_size;
        size_t end = std::min(start + chunk_size, total_files);
        if (start >= total_files) break;
        futures.push_back(std::async(std::launch::async, extract_chunk, start, end));
    }

    // Progress indicator (print to stderr every 500ms)
    if (total_files > 10) {
        while (true) {
            bool all_done = true;
            for (auto& f : futures) {
                if (f.wait_for(std::chrono::milliseconds(500)) != std::future_status::ready) {
                    all_done = false;
                    break;
                }
            }
            size_t p = processed.load();
            std::cerr << "\r[" << p << "/" << total_files << "] "
                      << (total_files > 0 ? (p * 100 / total_files) : 100) << "%   " << std::flush;
            if (all_done) break;
        }
        std::cerr << "\n";
    }

    BatchStats results;
    std::string schema_error;
    for (auto& f : futures) {
        ChunkResult r = f.get();
        results += r.stats;
        if (schema_error.empty()) schema_error = r.schema_error;
    }

    auto t_end = std::chrono::high_resolution_clock::now();
    double elapsed = std::chrono::duration<double>(t_end - t_start).count();

    if (!schema_error.empty()) {
        Logger::error("Aborted on schema mismatch after " + std::to_string(results.processed) + " files");
        std::cerr << "[Error] " << schema_error << "\n";
        std::cout << "[Log]     " << Logger::path() << "\n";
        return 2;
    }

    std::vector<FeatureRow> rows;
    rows.reserve(total_files);
    for (size_t i = 0; i < total_files; ++i) {
        if (records[i]) rows.emplace_back(relative_path(file_paths[i], root, root_is_dir), std::move(*records[i]));
    }

    if (fs::path(output_csv).has_parent_path()) fs::create_directories(fs::path(output_csv).parent_path());
    if (!ReportWriter::write_csv(output_csv, cfg.schema, rows)) {
        Logger::error("Cannot write " + output_csv);
        return 1;
    }
    Logger::info("Extraction complete. Rows: " + std::to_string(rows.size())
                 + ", failed: " + std::to_string(results.failed)
                 + ", time: " + std::to_string(elapsed) + "s");

    std::cout << "\n--- EXTRACTION RESULTS ---\n";
    for (const auto& [family, count] : results.format_families)
        std::cout << "found " << count << " " << family << "\n";
    std::cout << "Files processed: " << results.processed
              << "  failed: " << results.failed
              << "  (" << std::fixed << std::setprecision(2) << elapsed << "s)\n";
    std::cout << "Wrote " << rows.size() << " rows to " << output_csv << "\n";

    if (!output_json.empty()) {
        if (fs::path(output_json).has_parent_path()) fs::create_directories(fs::path(output_json).parent_path());
        if (ReportWriter::write_json(output_json, results, target_path, engine_name_str, output_csv)) {
            Logger::info("Summary saved: " + output_json);
            std::cout << "[Report]  " << output_json << "\n";
        } else {
            Logger::error("Cannot write " + output_json);
        }
    }

    std::cout << "[Log]     " << Logger::path() << "\n";
    return 0;
}
