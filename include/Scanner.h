#pragma once
// Scanner.h: magic-byte matching engines used by the Sniffer.
//
// A signature is an anchored byte pattern: optional fixed offset, one or more
// alternative hex heads, or a raw Latin-1 regex. All signatures are compiled
// into one engine; a scan over the head window reports the set of matching
// signature names, and the Sniffer resolves them by priority.
//
// Engines:
// Scanner (abstract)
// ├── BoostScanner  : Boost.Regex, one regex per signature
// ├── Re2Scanner    : RE2::Set, single pass
// └── HsScanner     : Hyperscan block-mode database, single pass

#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <boost/regex.hpp>

struct hs_database;
struct hs_scratch;

enum class EngineType { BOOST, RE2, HYPERSCAN };

// "hs" / "hyperscan", "re2", "boost"; nullopt for anything else.
std::optional<EngineType> engine_from_string(const std::string& s);

// Human-readable engine name, as reported by Scanner::name().
std::string engine_display_name(EngineType type);

// One entry of signatures.json, e.g.
// {
//   "name": "rar",
//   "hex_head": ["526172211A0700", "526172211A070100"],
//   "priority": 95,
//   "parser": true
// }
struct SignatureDefinition {
    std::string name;                    // family name, lower case ("pdf", "webp")
    std::vector<std::string> hex_heads;  // alternatives, any one matches
    size_t offset = 0;                   // bytes skipped before the head
    std::string pattern;                 // raw regex, used after the head (or alone)
    int priority = 0;                    // higher is tested first
    bool parser = false;                 // a structural parser exists for this family
};

// Signature names that matched one buffer.
struct MagicHits {
    std::set<std::string> names;

    void add(const std::string& name) { names.insert(name); }
    bool contains(const std::string& name) const { return names.count(name) != 0; }
    bool empty() const { return names.empty(); }
};

// Builds the anchored regex text for one signature, "" if it has nothing to match.
std::string build_pattern(const SignatureDefinition& def);

class Scanner {
public:
    virtual ~Scanner() = default;

    // Compiles the signature table. Signatures that fail to compile are reported
    // on stderr and left out. Call once, before scan().
    virtual void prepare(const std::vector<SignatureDefinition>& sigs) = 0;

    // Matches every signature at the start of [data, data+size).
    virtual void scan(const char* data, size_t size, MagicHits& hits) = 0;

    virtual std::string name() const = 0;

    static std::unique_ptr<Scanner> create(EngineType type);
};

class BoostScanner : public Scanner {
public:
    void prepare(const std::vector<SignatureDefinition>& sigs) override;
    void scan(const char* data, size_t size, MagicHits& hits) override;
    std::string name() const override;
private:
    std::vector<std::pair<boost::regex, std::string>> m_regexes;
};

// RE2::Set cannot be forward declared; the deleter keeps re2/set.h out of this header.
struct Re2SetDeleter { void operator()(void* p) const noexcept; };

class Re2Scanner : public Scanner {
public:
    Re2Scanner();
    ~Re2Scanner() override;
    void prepare(const std::vector<SignatureDefinition>& sigs) override;
    void scan(const char* data, size_t size, MagicHits& hits) override;
    std::string name() const override;
private:
    std::unique_ptr<void, Re2SetDeleter> m_set;
    std::vector<std::string> m_sig_names;  // index = RE2::Set pattern id
};

// NOT thread-safe: hs_scratch belongs to one thread. Each worker owns its
// own Sniffer and therefore its own HsScanner.
class HsScanner : public Scanner {
public:
    HsScanner();
    ~HsScanner() override;
    HsScanner(const HsScanner&) = delete;
    HsScanner& operator=(const HsScanner&) = delete;
    void prepare(const std::vector<SignatureDefinition>& sigs) override;
    void scan(const char* data, size_t size, MagicHits& hits) override;
    std::string name() const override;
private:
    void release();

    hs_database* db = nullptr;
    hs_scratch* scratch = nullptr;
    std::vector<std::string> m_sig_names;
    std::vector<std::string> m_temp_patterns;  // hs_compile_multi keeps no copy
};
