#pragma once
// Extractor.h: per-file pipeline from path to schema-shaped record.
//
//   sniff -> structural parser -> A -> (parser_ok) encryption parser -> B
//         -> byte statistics -> C -> reconcile -> normalize

#include <stdexcept>
#include <string>
#include "FeatureSchema.h"
#include "FeatureValue.h"
#include "Sniffer.h"

// The file could not be read at all (vanished, permission denied).
class ExtractionError : public std::runtime_error {
public:
    ExtractionError(const std::string& path, const std::string& reason)
        : std::runtime_error(path + ": " + reason), m_path(path) {}
    const std::string& path() const { return m_path; }

private:
    std::string m_path;
};

// One per worker thread: the sniffer owns a matching engine.
class Extractor {
public:
    Extractor(FeatureSchema schema, SnifferConfig config);

    // Throws ExtractionError for an unreadable file and SchemaMismatchError
    // when the merged record does not match the schema.
    FeatureMap extract(const std::string& path) const;

    const FeatureSchema& schema() const { return m_schema; }
    const Sniffer& sniffer() const { return m_sniffer; }

private:
    FeatureSchema m_schema;
    Sniffer m_sniffer;
};
