#pragma once
// ByteStatistics.h: single-pass byte histogram and the metrics derived from it.

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <boost/circular_buffer.hpp>
#include "FeatureValue.h"

using ByteHistogram = std::array<uint64_t, 256>;

// All metrics are null for an empty input.
struct ByteStatistics {
    std::optional<double> entropy_global;
    std::optional<double> min_entropy_global;
    std::optional<double> entropy_head;
    std::optional<double> entropy_tail;
    std::optional<double> byte_chi2;
    std::optional<double> ic_index;

    FeatureMap to_features() const;
};

// Shannon entropy in bits per byte.
std::optional<double> shannon_entropy(const ByteHistogram& counts, uint64_t total);
std::optional<double> shannon_entropy(const std::string& bytes);
std::optional<double> min_entropy(const ByteHistogram& counts, uint64_t total);
// Pearson chi-square against a flat 256-bin distribution.
std::optional<double> chi_square(const ByteHistogram& counts, uint64_t total);
// Probability that two bytes drawn without replacement are equal.
std::optional<double> index_of_coincidence(const ByteHistogram& counts, uint64_t total);

// Feed chunks in file order, then finish(). Keeps the first SEGMENT_SIZE
// bytes as head and the last SEGMENT_SIZE bytes as tail.
class ByteStatsAccumulator {
public:
    static constexpr size_t CHUNK_SIZE = 64 * 1024;
    static constexpr size_t SEGMENT_SIZE = 32 * 1024;

    ByteStatsAccumulator() : m_tail(SEGMENT_SIZE) {}

    void update(const uint8_t* data, size_t len);
    ByteStatistics finish() const;

    uint64_t total() const { return m_total; }
    const ByteHistogram& counts() const { return m_counts; }

private:
    ByteHistogram m_counts{};
    uint64_t m_total = 0;
    std::string m_head;
    boost::circular_buffer<uint8_t> m_tail;
};

// Streams the file in CHUNK_SIZE reads. Throws std::runtime_error if the
// file cannot be opened or a read fails.
ByteStatistics compute_byte_statistics(const std::string& path);
ByteStatistics compute_byte_statistics(const uint8_t* data, size_t size);
