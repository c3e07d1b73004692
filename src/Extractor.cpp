#include "Extractor.h"
#include "Aggregators.h"
#include "ByteStatistics.h"
#include "ParserRegistry.h"

Extractor::Extractor(FeatureSchema schema, SnifferConfig config)
    : m_schema(std::move(schema)), m_sniffer(std::move(config)) {}

FeatureMap Extractor::extract(const std::string& path) const {
    SniffResult snf;
    try {
        snf = m_sniffer.sniff(path);
    }
    catch (const std::runtime_error& e) {
        throw ExtractionError(path, e.what());
    }
    const std::string& family = snf.format_family;

    std::optional<FeatureMap> parser_features;
    if (const FormatParser* parser = ParserRegistry::structural().get(family))
        parser_features = parser->parse(path);

    FeatureMap merged = aggregate_structural(m_schema, snf.to_features(), parser_features);

    const std::string enc_family = family + "_enc";
    FeatureMap enc_features;
    if (get_bool(merged, "parser_ok") == true) {
        if (const FormatParser* enc = ParserRegistry::encryption().get(enc_family))
            enc_features = enc->parse(path);
    }
    merged.merge(aggregate_encryption(m_schema, enc_family, enc_features));

    ByteStatistics stats;
    try {
        stats = compute_byte_statistics(path);
    }
    catch (const std::runtime_error& e) {
        throw ExtractionError(path, e.what());
    }
    merged.merge(aggregate_statistics(m_schema, stats.to_features()));

    reconcile(m_schema, merged, path);
    return normalize(m_schema, merged);
}
