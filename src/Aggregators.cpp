#include "Aggregators.h"
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>

const char* const SNIFF_KEYS[5] = {"size_bytes", "log_size", "magic_ok", "format_family", "magic_family"};

namespace {
    bool owned_by_structural(const ColumnSpec& c) {
        return !is_encryption_section(c.section) && !is_statistic_section(c.section);
    }

    std::optional<int64_t> parse_int(const std::string& s) {
        if (s.empty()) return std::nullopt;
        errno = 0;
        char* end = nullptr;
        const long long v = std::strtoll(s.c_str(), &end, 10);
        if (errno != 0 || end != s.c_str() + s.size()) return std::nullopt;
        return static_cast<int64_t>(v);
    }

    std::optional<double> parse_float(const std::string& s) {
        if (s.empty()) return std::nullopt;
        char* end = nullptr;
        const double v = std::strtod(s.c_str(), &end);
        if (end != s.c_str() + s.size()) return std::nullopt;
        return v;
    }

    struct ToInt {
        FeatureValue raw;
        FeatureValue operator()(std::monostate) const { return FeatureValue{}; }
        FeatureValue operator()(bool b) const { return FeatureValue{static_cast<int64_t>(b ? 1 : 0)}; }
        FeatureValue operator()(int64_t i) const { return FeatureValue{i}; }
        FeatureValue operator()(double d) const {
            if (!std::isfinite(d) || d >= 9.2233720368547758e18 || d < -9.2233720368547758e18) return raw;
            return FeatureValue{static_cast<int64_t>(std::trunc(d))};
        }
        FeatureValue operator()(const std::string& s) const {
            if (auto v = parse_int(s)) return FeatureValue{*v};
            return raw;
        }
    };

    struct ToFloat {
        FeatureValue raw;
        FeatureValue operator()(std::monostate) const { return FeatureValue{}; }
        FeatureValue operator()(bool b) const { return FeatureValue{b ? 1.0 : 0.0}; }
        FeatureValue operator()(int64_t i) const { return FeatureValue{static_cast<double>(i)}; }
        FeatureValue operator()(double d) const { return FeatureValue{d}; }
        FeatureValue operator()(const std::string& s) const {
            if (auto v = parse_float(s)) return FeatureValue{*v};
            return raw;
        }
    };

    struct ToString {
        FeatureValue operator()(std::monostate) const { return FeatureValue{}; }
        FeatureValue operator()(bool b) const { return FeatureValue{std::string(b ? "True" : "False")}; }
        FeatureValue operator()(int64_t i) const { return FeatureValue{std::to_string(i)}; }
        FeatureValue operator()(double d) const { return FeatureValue{format_float(d)}; }
        FeatureValue operator()(const std::string& s) const { return FeatureValue{s}; }
    };
}

FeatureMap aggregate_structural(const FeatureSchema& schema,
                                const FeatureMap& sniff,
                                const std::optional<FeatureMap>& parser_features) {
    FeatureMap merged;
    for (const char* key : SNIFF_KEYS) {
        const FeatureValue* v = sniff.find(key);
        merged.set(key, v ? *v : FeatureValue{});
    }
    if (parser_features) merged.merge(*parser_features);
    if (!merged.contains("parser_ok")) merged.set("parser_ok", FeatureValue{});
    if (!merged.contains("structure_consistent")) merged.set("structure_consistent", FeatureValue{});

    FeatureMap out;
    for (const ColumnSpec& c : schema.columns()) {
        if (!owned_by_structural(c)) continue;
        const FeatureValue* v = merged.find(c.name);
        out.set(c.name, v ? *v : FeatureValue{});
    }
    return out;
}

FeatureMap aggregate_encryption(const FeatureSchema& schema,
                                const std::string& enc_family,
                                const FeatureMap& enc_features) {
    FeatureMap out;
    for (const ColumnSpec& c : schema.columns())
        if (is_encryption_section(c.section)) out.set(c.name, FeatureValue{});

    for (const std::string& name : schema.section_columns(enc_family)) {
        if (const FeatureValue* v = enc_features.find(name)) out.set(name, *v);
        else out.set(name, FeatureValue{});
    }
    return out;
}

FeatureMap aggregate_statistics(const FeatureSchema& schema, const FeatureMap& stats) {
    FeatureMap out;
    for (const ColumnSpec& c : schema.columns()) {
        if (!is_statistic_section(c.section)) continue;
        const FeatureValue* v = stats.find(c.name);
        out.set(c.name, v ? *v : FeatureValue{});
    }
    return out;
}

void reconcile(const FeatureSchema& schema, const FeatureMap& merged, const std::string& path) {
    std::vector<std::string> missing, extra;
    for (const ColumnSpec& c : schema.columns())
        if (!merged.contains(c.name)) missing.push_back(c.name);
    for (const auto& [key, value] : merged)
        if (!schema.contains(key)) extra.push_back(key);
    if (!missing.empty() || !extra.empty())
        throw SchemaMismatchError(path, std::move(missing), std::move(extra));
}

FeatureValue normalize_value(const FeatureValue& value, ColumnType type) {
    switch (type) {
        case ColumnType::INT:    return std::visit(ToInt{value}, value);
        case ColumnType::FLOAT:  return std::visit(ToFloat{value}, value);
        case ColumnType::STRING: return std::visit(ToString{}, value);
        case ColumnType::BOOL:
        case ColumnType::RAW:    break;
    }
    return value;
}

FeatureMap normalize(const FeatureSchema& schema, const FeatureMap& merged) {
    FeatureMap out;
    for (const ColumnSpec& c : schema.columns()) {
        const FeatureValue* v = merged.find(c.name);
        out.set(c.name, v ? normalize_value(*v, c.type) : FeatureValue{});
    }
    return out;
}
