#include "FeatureSchema.h"
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/join.hpp>

std::optional<ColumnType> column_type_from_string(const std::string& s) {
    const std::string t = boost::algorithm::to_lower_copy(s);
    if (t == "bool") return ColumnType::BOOL;
    if (t == "int") return ColumnType::INT;
    if (t == "float") return ColumnType::FLOAT;
    if (t == "string") return ColumnType::STRING;
    return std::nullopt;
}

std::string to_string(ColumnType type) {
    switch (type) {
        case ColumnType::BOOL:   return "bool";
        case ColumnType::INT:    return "int";
        case ColumnType::FLOAT:  return "float";
        case ColumnType::STRING: return "string";
        case ColumnType::RAW:    break;
    }
    return "raw";
}

void FeatureSchema::add(const std::string& section, const std::string& name, ColumnType type) {
    auto it = m_sections.begin();
    for (; it != m_sections.end(); ++it)
        if (it->first == section) break;
    if (it == m_sections.end()) {
        m_sections.emplace_back(section, std::vector<std::string>{});
        it = m_sections.end() - 1;
    }
    it->second.push_back(name);

    if (!contains(name)) m_columns.push_back(ColumnSpec{name, type, section});
}

std::vector<std::string> FeatureSchema::column_names() const {
    std::vector<std::string> out;
    out.reserve(m_columns.size());
    for (const auto& c : m_columns) out.push_back(c.name);
    return out;
}

const ColumnSpec* FeatureSchema::find(const std::string& name) const {
    for (const auto& c : m_columns)
        if (c.name == name) return &c;
    return nullptr;
}

const std::vector<std::string>& FeatureSchema::section_columns(const std::string& section) const {
    static const std::vector<std::string> none;
    for (const auto& s : m_sections)
        if (s.first == section) return s.second;
    return none;
}

std::vector<std::string> FeatureSchema::section_names() const {
    std::vector<std::string> out;
    for (const auto& s : m_sections) out.push_back(s.first);
    return out;
}

SchemaMismatchError::SchemaMismatchError(const std::string& path,
                                         std::vector<std::string> missing,
                                         std::vector<std::string> extra)
    : std::runtime_error(build_message(path, missing, extra)),
      m_missing(std::move(missing)),
      m_extra(std::move(extra)) {}

std::string SchemaMismatchError::build_message(const std::string& path,
                                               const std::vector<std::string>& missing,
                                               const std::vector<std::string>& extra) {
    std::string msg = "schema mismatch for " + path;
    if (!missing.empty()) msg += ": missing [" + boost::algorithm::join(missing, ", ") + "]";
    if (!extra.empty()) msg += (missing.empty() ? ": " : ", ") + std::string("unexpected [") +
                               boost::algorithm::join(extra, ", ") + "]";
    return msg;
}
