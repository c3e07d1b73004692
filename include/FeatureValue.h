#pragma once
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

// One cell of a feature record. monostate is the null value.
// Always construct from an exact type (bool, int64_t, double, std::string):
// int and const char* would pick the wrong alternative.
using FeatureValue = std::variant<std::monostate, bool, int64_t, double, std::string>;

inline bool is_null(const FeatureValue& v) { return std::holds_alternative<std::monostate>(v); }

inline FeatureValue optional_value(const std::optional<double>& v) {
    if (!v) return FeatureValue{};
    return FeatureValue{*v};
}

inline FeatureValue optional_value(const std::optional<std::string>& v) {
    if (!v) return FeatureValue{};
    return FeatureValue{*v};
}

inline FeatureValue optional_value(const std::optional<bool>& v) {
    if (!v) return FeatureValue{};
    return FeatureValue{*v};
}

// Shortest decimal that reads back to the same double: "0.5", "3.0", "1e-05".
std::string format_float(double v);

// Debug/diagnostic rendering, e.g. "null", "true", "42", "3.5", "\"AES\"".
std::string describe(const FeatureValue& v);

// Name -> value map that remembers insertion order.
// Records hold a few dozen keys at most, lookups are linear.
class FeatureMap {
public:
    using Entry = std::pair<std::string, FeatureValue>;
    using const_iterator = std::vector<Entry>::const_iterator;

    FeatureMap() = default;
    FeatureMap(std::initializer_list<Entry> init) {
        for (const auto& e : init) set(e.first, e.second);
    }

    // Overwrites an existing key in place, appends a new one.
    void set(const std::string& key, FeatureValue value) {
        for (auto& e : m_entries) {
            if (e.first == key) { e.second = std::move(value); return; }
        }
        m_entries.emplace_back(key, std::move(value));
    }

    const FeatureValue* find(const std::string& key) const {
        for (const auto& e : m_entries)
            if (e.first == key) return &e.second;
        return nullptr;
    }

    bool contains(const std::string& key) const { return find(key) != nullptr; }

    // Throws std::out_of_range for a missing key.
    const FeatureValue& at(const std::string& key) const {
        if (const auto* v = find(key)) return *v;
        throw std::out_of_range("FeatureMap: no key '" + key + "'");
    }

    // Overlay: every key of other is set on this map.
    void merge(const FeatureMap& other) {
        for (const auto& e : other.m_entries) set(e.first, e.second);
    }

    std::vector<std::string> keys() const {
        std::vector<std::string> out;
        out.reserve(m_entries.size());
        for (const auto& e : m_entries) out.push_back(e.first);
        return out;
    }

    size_t size() const { return m_entries.size(); }
    bool empty() const { return m_entries.empty(); }
    const_iterator begin() const { return m_entries.begin(); }
    const_iterator end() const { return m_entries.end(); }

private:
    std::vector<Entry> m_entries;
};

// Typed accessors for tests and the CLI summary; nullopt on null or type mismatch.
inline std::optional<bool> get_bool(const FeatureMap& m, const std::string& key) {
    const auto* v = m.find(key);
    if (!v || !std::holds_alternative<bool>(*v)) return std::nullopt;
    return std::get<bool>(*v);
}

inline std::optional<int64_t> get_int(const FeatureMap& m, const std::string& key) {
    const auto* v = m.find(key);
    if (!v || !std::holds_alternative<int64_t>(*v)) return std::nullopt;
    return std::get<int64_t>(*v);
}

inline std::optional<double> get_float(const FeatureMap& m, const std::string& key) {
    const auto* v = m.find(key);
    if (!v || !std::holds_alternative<double>(*v)) return std::nullopt;
    return std::get<double>(*v);
}

inline std::optional<std::string> get_string(const FeatureMap& m, const std::string& key) {
    const auto* v = m.find(key);
    if (!v || !std::holds_alternative<std::string>(*v)) return std::nullopt;
    return std::get<std::string>(*v);
}
