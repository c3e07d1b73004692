#pragma once
// FeatureSchema.h: the declared output columns, grouped by section.
//
// Loaded once from features.json and then only read. Section names carry
// meaning: "<family>_enc" sections belong to the encryption aggregator,
// "statistic" to the byte-statistics aggregator, all others to the
// structural aggregator.

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

enum class ColumnType { BOOL, INT, FLOAT, STRING, RAW };

// "bool" / "int" / "float" / "string" (case-insensitive); nullopt otherwise.
std::optional<ColumnType> column_type_from_string(const std::string& s);
std::string to_string(ColumnType type);

struct ColumnSpec {
    std::string name;
    ColumnType type = ColumnType::RAW;  // RAW: passed through unconverted
    std::string section;                // section of the first declaration
};

inline bool is_encryption_section(const std::string& section) {
    const std::string suffix = "_enc";
    return section.size() >= suffix.size() &&
           section.compare(section.size() - suffix.size(), suffix.size(), suffix) == 0;
}

inline bool is_statistic_section(const std::string& section) { return section == "statistic"; }

class FeatureSchema {
public:
    // A name already declared keeps its first type and section; the repeat
    // is still listed under `section` (parser_ok appears in every family).
    void add(const std::string& section, const std::string& name, ColumnType type);

    const std::vector<ColumnSpec>& columns() const { return m_columns; }
    std::vector<std::string> column_names() const;
    const ColumnSpec* find(const std::string& name) const;
    bool contains(const std::string& name) const { return find(name) != nullptr; }

    // Every name listed under `section`, duplicates across sections included.
    const std::vector<std::string>& section_columns(const std::string& section) const;
    std::vector<std::string> section_names() const;

    size_t size() const { return m_columns.size(); }
    bool empty() const { return m_columns.empty(); }

private:
    std::vector<ColumnSpec> m_columns;
    std::vector<std::pair<std::string, std::vector<std::string>>> m_sections;
};

// Merged record does not match the declared columns. This is a
// configuration bug, never a property of the input file.
class SchemaMismatchError : public std::runtime_error {
public:
    SchemaMismatchError(const std::string& path,
                        std::vector<std::string> missing,
                        std::vector<std::string> extra);

    const std::vector<std::string>& missing() const { return m_missing; }
    const std::vector<std::string>& extra() const { return m_extra; }

private:
    static std::string build_message(const std::string& path,
                                     const std::vector<std::string>& missing,
                                     const std::vector<std::string>& extra);

    std::vector<std::string> m_missing;
    std::vector<std::string> m_extra;
};
