#pragma once

#include <vector>
#include <string>
#include <set>
#include <fstream>
#include <iostream>
#include <algorithm>
#include <cctype>
#include <nlohmann/json.hpp>
#include "FeatureSchema.h"
#include "Scanner.h"
#include "Sniffer.h"

// features.json: sniffer settings plus the ordered feature schema.
struct FeaturesConfig {
    SnifferConfig sniffer;
    FeatureSchema schema;  // empty on any load error
};

class ConfigLoader {
public:
    // signatures.json: array of {name, hex_head, offset, pattern, priority, parser}.
    // Returns an empty vector on error; the caller falls back to Sig::builtin().
    static std::vector<SignatureDefinition> load_signatures(const std::string& filepath) {
        std::vector<SignatureDefinition> sigs;
        std::ifstream f(filepath);

        if (!f.is_open()) {
            std::cerr << "[ConfigLoader] Warning: Could not open " << filepath << "\n";
            return sigs;
        }

        try {
            nlohmann::json j;
            f >> j;

            if (!j.is_array()) {
                std::cerr << "[ConfigLoader] Error: Root must be an array []\n";
                return sigs;
            }

            for (size_t idx = 0; idx < j.size(); ++idx) {
                const auto& item = j[idx];
                SignatureDefinition def;

                if (!item.contains("name")) {
                    std::cerr << "[ConfigLoader] Warning: entry #" << idx << " has no 'name', skipped\n";
                    continue;
                }
                def.name = item["name"].get<std::string>();

                if (item.contains("hex_head")) {
                    const auto& h = item["hex_head"];
                    if (h.is_array()) {
                        for (const auto& e : h) def.hex_heads.push_back(e.get<std::string>());
                    } else {
                        def.hex_heads.push_back(h.get<std::string>());
                    }
                }
                for (auto& hex : def.hex_heads) {
                    if (!validate_hex(hex, def.name, "hex_head")) hex.clear();
                }
                def.hex_heads.erase(std::remove(def.hex_heads.begin(), def.hex_heads.end(), std::string()),
                                    def.hex_heads.end());

                def.offset = item.value("offset", static_cast<size_t>(0));
                def.pattern = item.value("pattern", std::string());
                def.priority = item.value("priority", 0);
                def.parser = item.value("parser", false);

                if (def.hex_heads.empty() && def.pattern.empty()) {
                    std::cerr << "[ConfigLoader] Warning: '" << def.name
                              << "' has neither hex_head nor pattern\n";
                }

                sigs.push_back(def);
            }

            std::set<std::string> names;
            for (const auto& s : sigs) {
                if (!names.insert(s.name).second) {
                    std::cerr << "[ConfigLoader] Warning: duplicate signature name '"
                              << s.name << "'\n";
                }
            }
        }
        catch (const std::exception& e) {
            std::cerr << "[ConfigLoader] JSON Error: " << e.what() << "\n";
            sigs.clear();
        }
        return sigs;
    }

    // features.json:
    // {
    //   "global":   { "sniffer": { "head_bytes": 16384, "tail_bytes": 16384,
    //                              "enabled_families": [...], "engine": "hyperscan" } },
    //   "features": { "<section>": [ { "name": ..., "type": ... }, ... ], ... }
    // }
    static FeaturesConfig load_features(const std::string& filepath) {
        FeaturesConfig cfg;
        std::ifstream f(filepath);

        if (!f.is_open()) {
            std::cerr << "[ConfigLoader] Error: Could not open " << filepath << "\n";
            return cfg;
        }

        try {
            // ordered_json keeps the declaration order of sections
            nlohmann::ordered_json j;
            f >> j;

            if (!j.is_object()) {
                std::cerr << "[ConfigLoader] Error: Root must be an object {}\n";
                return cfg;
            }

            if (j.contains("global") && j["global"].contains("sniffer")) {
                const auto& s = j["global"]["sniffer"];
                cfg.sniffer.head_bytes = s.value("head_bytes", cfg.sniffer.head_bytes);
                cfg.sniffer.tail_bytes = s.value("tail_bytes", cfg.sniffer.tail_bytes);
                if (s.contains("enabled_families")) {
                    cfg.sniffer.enabled_families.clear();
                    for (const auto& fam : s["enabled_families"])
                        cfg.sniffer.enabled_families.insert(fam.get<std::string>());
                }
                if (s.contains("engine")) {
                    const std::string e = s["engine"].get<std::string>();
                    if (auto engine = engine_from_string(e)) {
                        cfg.sniffer.engine = *engine;
                    } else {
                        std::cerr << "[ConfigLoader] Warning: unknown engine '" << e
                                  << "', using hyperscan\n";
                    }
                }
            }

            if (!j.contains("features") || !j["features"].is_object()) {
                std::cerr << "[ConfigLoader] Error: 'features' section missing\n";
                return cfg;
            }

            for (const auto& [section, items] : j["features"].items()) {
                if (!items.is_array()) continue;
                for (size_t idx = 0; idx < items.size(); ++idx) {
                    const auto& it = items[idx];
                    if (!it.is_object()) continue;
                    const std::string name = it.value("name", std::string());
                    if (name.empty()) {
                        std::cerr << "[ConfigLoader] Warning: " << section << " #" << idx
                                  << " has no 'name', skipped\n";
                        continue;
                    }
                    const std::string type_str = it.value("type", std::string());
                    ColumnType type = ColumnType::RAW;
                    if (auto t = column_type_from_string(type_str)) {
                        type = *t;
                    } else {
                        std::cerr << "[ConfigLoader] Warning: '" << name << "' has unknown type '"
                                  << type_str << "', kept unconverted\n";
                    }
                    cfg.schema.add(section, name, type);
                }
            }
        }
        catch (const std::exception& e) {
            std::cerr << "[ConfigLoader] JSON Error: " << e.what() << "\n";
            cfg.schema = FeatureSchema{};
        }
        return cfg;
    }

private:
    static bool validate_hex(const std::string& hex, const std::string& sig_name, const char* field) {
        if (hex.empty()) return true;
        if (hex.length() % 2 != 0) {
            std::cerr << "[ConfigLoader] Warning: '" << sig_name << "' " << field
                      << " has odd length (" << hex.length() << ")\n";
            return false;
        }
        for (size_t i = 0; i < hex.length(); ++i) {
            if (!std::isxdigit(static_cast<unsigned char>(hex[i]))) {
                std::cerr << "[ConfigLoader] Warning: '" << sig_name << "' " << field
                          << " has non-hex char at pos " << i << "\n";
                return false;
            }
        }
        return true;
    }
};
