#include "Scanner.h"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <sstream>
#include <re2/re2.h>
#include <re2/set.h>
#include <hs/hs.h>

namespace {
    std::string hex_to_regex_str(const std::string& hex) {
        if (hex.empty()) return "";
        if (hex.length() % 2 != 0) {
            std::cerr << "[Scanner] Warning: odd-length hex string '" << hex
                      << "', last nibble dropped\n";
        }
        std::ostringstream ss;
        for (size_t i = 0; i + 1 < hex.length(); i += 2) {
            char c1 = hex[i], c2 = hex[i + 1];
            if (!std::isxdigit(static_cast<unsigned char>(c1)) ||
                !std::isxdigit(static_cast<unsigned char>(c2))) {
                std::cerr << "[Scanner] Warning: non-hex chars at pos " << i
                          << " in '" << hex << "'\n";
                return "";
            }
            ss << "\\x" << c1 << c2;
        }
        return ss.str();
    }

    std::vector<SignatureDefinition> by_priority(const std::vector<SignatureDefinition>& sigs) {
        std::vector<SignatureDefinition> sorted_sigs = sigs;
        std::stable_sort(sorted_sigs.begin(), sorted_sigs.end(),
            [](const auto& a, const auto& b) { return a.priority > b.priority; });
        return sorted_sigs;
    }
}

std::optional<EngineType> engine_from_string(const std::string& s) {
    if (s == "hs" || s == "hyperscan") return EngineType::HYPERSCAN;
    if (s == "re2") return EngineType::RE2;
    if (s == "boost") return EngineType::BOOST;
    return std::nullopt;
}

std::string engine_display_name(EngineType type) {
    switch (type) {
    case EngineType::BOOST: return "Boost.Regex";
    case EngineType::RE2:   return "Google RE2";
    case EngineType::HYPERSCAN: return "Hyperscan";
    }
    return "Hyperscan";
}

std::string build_pattern(const SignatureDefinition& def) {
    std::string heads;
    for (const auto& h : def.hex_heads) {
        std::string re = hex_to_regex_str(h);
        if (re.empty()) continue;
        if (!heads.empty()) heads += "|";
        heads += re;
    }
    if (heads.empty() && def.pattern.empty()) return "";

    std::string body;
    if (def.offset > 0) body += ".{" + std::to_string(def.offset) + "}";
    if (!heads.empty()) body += "(?:" + heads + ")";
    if (!def.pattern.empty()) body += "(?:" + def.pattern + ")";
    return "^" + body;
}

std::unique_ptr<Scanner> Scanner::create(EngineType type) {
    switch (type) {
    case EngineType::BOOST: return std::make_unique<BoostScanner>();
    case EngineType::RE2:   return std::make_unique<Re2Scanner>();
    case EngineType::HYPERSCAN: return std::make_unique<HsScanner>();
    }
    return std::make_unique<HsScanner>();
}

// === Boost ===
std::string BoostScanner::name() const { return engine_display_name(EngineType::BOOST); }

void BoostScanner::prepare(const std::vector<SignatureDefinition>& sigs) {
    m_regexes.clear();
    for (const auto& s : by_priority(sigs)) {
        std::string pat = build_pattern(s);
        if (pat.empty()) continue;
        try {
            auto flags = boost::regex::perl | boost::regex::mod_s | boost::regex::no_mod_m;
            m_regexes.emplace_back(boost::regex(pat, flags), s.name);
        }
        catch (const std::exception& e) {
            std::cerr << "[BoostScanner] Failed to compile pattern for '"
                      << s.name << "': " << e.what() << "\n";
        }
    }
}

void BoostScanner::scan(const char* data, size_t size, MagicHits& hits) {
    const char* end = data + size;
    for (const auto& [re, name] : m_regexes) {
        boost::cmatch m;
        if (boost::regex_search(data, end, m, re, boost::match_continuous))
            hits.add(name);
    }
}

// === RE2 ===
void Re2SetDeleter::operator()(void* p) const noexcept {
    delete static_cast<re2::RE2::Set*>(p);
}

Re2Scanner::Re2Scanner() = default;
Re2Scanner::~Re2Scanner() = default;

std::string Re2Scanner::name() const { return engine_display_name(EngineType::RE2); }

void Re2Scanner::prepare(const std::vector<SignatureDefinition>& sigs) {
    m_set.reset();
    m_sig_names.clear();

    re2::RE2::Options opt;
    opt.set_encoding(re2::RE2::Options::EncodingLatin1);
    opt.set_dot_nl(true);
    opt.set_log_errors(false);
    std::unique_ptr<void, Re2SetDeleter> new_set(new re2::RE2::Set(opt, re2::RE2::ANCHOR_START));
    auto* raw = static_cast<re2::RE2::Set*>(new_set.get());

    for (const auto& s : by_priority(sigs)) {
        std::string pat = build_pattern(s);
        if (pat.empty()) continue;
        std::string err;
        if (raw->Add(pat, &err) < 0) {
            std::cerr << "[Re2Scanner] Failed to compile pattern for '"
                      << s.name << "': " << err << "\n";
            continue;
        }
        m_sig_names.push_back(s.name);
    }
    if (m_sig_names.empty()) return;
    if (!raw->Compile()) {
        std::cerr << "[Re2Scanner] RE2::Set compile failed\n";
        return;
    }
    m_set = std::move(new_set);
}

void Re2Scanner::scan(const char* data, size_t size, MagicHits& hits) {
    auto* set = static_cast<re2::RE2::Set*>(m_set.get());
    if (!set) return;
    std::vector<int> matched_ids;
    set->Match(re2::StringPiece(data, size), &matched_ids);
    for (int id : matched_ids) {
        if (id >= 0 && static_cast<size_t>(id) < m_sig_names.size())
            hits.add(m_sig_names[static_cast<size_t>(id)]);
    }
}

// === Hyperscan ===
HsScanner::HsScanner() = default;
HsScanner::~HsScanner() { release(); }

void HsScanner::release() {
    if (scratch) { hs_free_scratch(scratch); scratch = nullptr; }
    if (db) { hs_free_database(db); db = nullptr; }
}

std::string HsScanner::name() const { return engine_display_name(EngineType::HYPERSCAN); }

void HsScanner::prepare(const std::vector<SignatureDefinition>& sigs) {
    release();
    m_temp_patterns.clear(); m_sig_names.clear();

    std::vector<SignatureDefinition> sorted_sigs = by_priority(sigs);
    for (const auto& s : sorted_sigs) {
        std::string pat = build_pattern(s);
        if (pat.empty()) continue;
        m_temp_patterns.push_back(pat);
        m_sig_names.push_back(s.name);
    }
    if (m_temp_patterns.empty()) return;

    std::vector<const char*> exprs;
    std::vector<unsigned int> flags, ids;
    for (size_t i = 0; i < m_temp_patterns.size(); ++i) {
        exprs.push_back(m_temp_patterns[i].c_str());
        ids.push_back(static_cast<unsigned int>(i));
        flags.push_back(HS_FLAG_DOTALL | HS_FLAG_SINGLEMATCH);
    }

    hs_compile_error_t* err = nullptr;
    if (hs_compile_multi(exprs.data(), flags.data(), ids.data(), static_cast<unsigned int>(exprs.size()),
                         HS_MODE_BLOCK, nullptr, &db, &err) != HS_SUCCESS) {
        std::cerr << "[HsScanner] Compile error";
        if (err) {
            if (err->expression >= 0 && static_cast<size_t>(err->expression) < m_sig_names.size())
                std::cerr << " in '" << m_sig_names[static_cast<size_t>(err->expression)] << "'";
            std::cerr << ": " << err->message;
            hs_free_compile_error(err);
        }
        std::cerr << "\n";
        db = nullptr;
        return;
    }
    if (hs_alloc_scratch(db, &scratch) != HS_SUCCESS) {
        std::cerr << "[HsScanner] Failed to allocate scratch\n";
        release();
    }
}

void HsScanner::scan(const char* data, size_t size, MagicHits& hits) {
    if (!db || !scratch) return;
    struct Ctx { MagicHits* h; const std::vector<std::string>* n; } ctx = { &hits, &m_sig_names };
    auto on_match = [](unsigned int id, unsigned long long, unsigned long long, unsigned int, void* ptr) -> int {
        auto* c = static_cast<Ctx*>(ptr);
        if (id < c->n->size()) c->h->add((*c->n)[id]);
        return 0;
    };
    if (hs_scan(db, data, static_cast<unsigned int>(size), 0, scratch, on_match, &ctx) != HS_SUCCESS) {
        std::cerr << "[HsScanner] hs_scan failed\n";
    }
}
