#pragma once
// Aggregators.h: pure functions that assemble one feature record.
//
//   A: sniffer + structural parser  -> every column outside *_enc / statistic
//   B: encryption parser            -> every *_enc column
//   C: byte statistics              -> every statistic column
//
// Each fills its columns with null first and overlays only declared keys,
// so undeclared keys never reach the merged record.

#include <optional>
#include <string>
#include "FeatureSchema.h"
#include "FeatureValue.h"

// The five sniffer keys; anything else in `sniff` is ignored.
extern const char* const SNIFF_KEYS[5];

// `parser_features` is nullopt when no structural parser exists for the
// family; parser_ok and structure_consistent then stay null.
FeatureMap aggregate_structural(const FeatureSchema& schema,
                                const FeatureMap& sniff,
                                const std::optional<FeatureMap>& parser_features);

// Overlays keys listed under section `enc_family` ("zip_enc", ...).
FeatureMap aggregate_encryption(const FeatureSchema& schema,
                                const std::string& enc_family,
                                const FeatureMap& enc_features);

FeatureMap aggregate_statistics(const FeatureSchema& schema, const FeatureMap& stats);

// Throws SchemaMismatchError naming missing and undeclared columns.
void reconcile(const FeatureSchema& schema, const FeatureMap& merged, const std::string& path);

// Converts a value to the column type. Nulls stay null; a value that does
// not convert is returned unchanged.
FeatureValue normalize_value(const FeatureValue& value, ColumnType type);

// Record in schema column order with every value normalized.
FeatureMap normalize(const FeatureSchema& schema, const FeatureMap& merged);
