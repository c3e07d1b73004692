#pragma once
#include <string>
#include <fstream>
#include <map>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "FeatureSchema.h"
#include "FeatureValue.h"

// Per-run counters, merged across worker threads.
struct BatchStats {
    size_t processed = 0;
    size_t failed = 0;
    std::map<std::string, size_t> format_families;
    std::map<std::string, size_t> parser_ok;  // "true" / "false" / "null"

    void add(const FeatureMap& record) {
        processed++;
        if (auto fam = get_string(record, "format_family")) format_families[*fam]++;
        const FeatureValue* ok = record.find("parser_ok");
        if (!ok || is_null(*ok)) parser_ok["null"]++;
        else if (auto b = get_bool(record, "parser_ok")) parser_ok[*b ? "true" : "false"]++;
        else parser_ok["null"]++;
    }

    BatchStats& operator+=(const BatchStats& other) {
        processed += other.processed;
        failed += other.failed;
        for (const auto& [k, v] : other.format_families) format_families[k] += v;
        for (const auto& [k, v] : other.parser_ok) parser_ok[k] += v;
        return *this;
    }
};

// One CSV row: path relative to the input root plus the normalized record.
using FeatureRow = std::pair<std::string, FeatureMap>;

class ReportWriter {
public:
    // Empty for null, True/False for bools, shortest round-trip for floats.
    static std::string format_cell(const FeatureValue& v) {
        struct Visitor {
            std::string operator()(std::monostate) const { return ""; }
            std::string operator()(bool b) const { return b ? "True" : "False"; }
            std::string operator()(int64_t i) const { return std::to_string(i); }
            std::string operator()(double d) const { return format_float(d); }
            std::string operator()(const std::string& s) const { return s; }
        };
        return quote(std::visit(Visitor{}, v));
    }

    // Header "path,<schema columns>", then one line per row. Returns false
    // if the file cannot be opened.
    static bool write_csv(const std::string& path,
                          const FeatureSchema& schema,
                          const std::vector<FeatureRow>& rows)
    {
        std::ofstream f(path, std::ios::out | std::ios::trunc | std::ios::binary);
        if (!f.is_open()) return false;

        f << "path";
        for (const auto& c : schema.columns()) f << "," << quote(c.name);
        f << "\n";

        for (const auto& [rel, record] : rows) {
            f << quote(rel);
            for (const auto& c : schema.columns()) {
                const FeatureValue* v = record.find(c.name);
                f << "," << (v ? format_cell(*v) : std::string());
            }
            f << "\n";
        }
        return static_cast<bool>(f);
    }

    static bool write_json(const std::string& path,
                           const BatchStats& stats,
                           const std::string& target,
                           const std::string& engine_name,
                           const std::string& csv_path)
    {
        nlohmann::json j;
        j["input"] = target;
        j["engine"] = engine_name;
        j["output_csv"] = csv_path;
        j["processed"] = stats.processed;
        j["failed"] = stats.failed;

        nlohmann::json fam = nlohmann::json::object();
        for (const auto& [name, count] : stats.format_families) fam[name] = count;
        j["format_family"] = fam;

        nlohmann::json ok = nlohmann::json::object();
        for (const auto& [name, count] : stats.parser_ok) ok[name] = count;
        j["parser_ok"] = ok;

        std::ofstream f(path, std::ios::out | std::ios::trunc);
        if (!f.is_open()) return false;
        f << j.dump(2) << "\n";
        return static_cast<bool>(f);
    }

private:
    // Minimal CSV quoting: only cells with a separator, quote or line break.
    static std::string quote(const std::string& cell) {
        if (cell.find_first_of(",\"\r\n") == std::string::npos) return cell;
        std::string out = "\"";
        for (char c : cell) {
            if (c == '"') out += "\"\"";
            else out += c;
        }
        return out + "\"";
    }
};
