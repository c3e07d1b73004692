#include "ByteStatistics.h"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <stdexcept>
#include <vector>

FeatureMap ByteStatistics::to_features() const {
    FeatureMap m;
    m.set("entropy_global", optional_value(entropy_global));
    m.set("min_entropy_global", optional_value(min_entropy_global));
    m.set("entropy_head", optional_value(entropy_head));
    m.set("entropy_tail", optional_value(entropy_tail));
    m.set("byte_chi2", optional_value(byte_chi2));
    m.set("ic_index", optional_value(ic_index));
    return m;
}

std::optional<double> shannon_entropy(const ByteHistogram& counts, uint64_t total) {
    if (total == 0) return std::nullopt;
    const double n = static_cast<double>(total);
    double h = 0.0;
    for (uint64_t c : counts) {
        if (c == 0) continue;
        const double p = static_cast<double>(c) / n;
        h -= p * std::log2(p);
    }
    return h;
}

std::optional<double> shannon_entropy(const std::string& bytes) {
    ByteHistogram counts{};
    for (unsigned char b : bytes) ++counts[b];
    return shannon_entropy(counts, bytes.size());
}

std::optional<double> min_entropy(const ByteHistogram& counts, uint64_t total) {
    if (total == 0) return std::nullopt;
    const uint64_t peak = *std::max_element(counts.begin(), counts.end());
    if (peak == 0) return std::nullopt;
    return -std::log2(static_cast<double>(peak) / static_cast<double>(total));
}

std::optional<double> chi_square(const ByteHistogram& counts, uint64_t total) {
    if (total == 0) return std::nullopt;
    const double expected = static_cast<double>(total) / 256.0;
    double chi2 = 0.0;
    for (uint64_t c : counts) {
        const double diff = static_cast<double>(c) - expected;
        chi2 += diff * diff / expected;
    }
    return chi2;
}

std::optional<double> index_of_coincidence(const ByteHistogram& counts, uint64_t total) {
    if (total <= 1) return std::nullopt;
    double numerator = 0.0;
    for (uint64_t c : counts)
        numerator += static_cast<double>(c) * static_cast<double>(c == 0 ? 0 : c - 1);
    const double n = static_cast<double>(total);
    return numerator / (n * (n - 1.0));
}

void ByteStatsAccumulator::update(const uint8_t* data, size_t len) {
    m_total += len;
    for (size_t i = 0; i < len; ++i) ++m_counts[data[i]];

    if (m_head.size() < SEGMENT_SIZE) {
        const size_t need = std::min(SEGMENT_SIZE - m_head.size(), len);
        m_head.append(reinterpret_cast<const char*>(data), need);
    }
    // older bytes fall off the front
    const size_t keep = std::min(len, SEGMENT_SIZE);
    for (size_t i = len - keep; i < len; ++i) m_tail.push_back(data[i]);
}

ByteStatistics ByteStatsAccumulator::finish() const {
    ByteStatistics s;
    s.entropy_global = shannon_entropy(m_counts, m_total);
    s.min_entropy_global = min_entropy(m_counts, m_total);
    s.entropy_head = shannon_entropy(m_head);
    s.entropy_tail = shannon_entropy(std::string(m_tail.begin(), m_tail.end()));
    s.byte_chi2 = chi_square(m_counts, m_total);
    s.ic_index = index_of_coincidence(m_counts, m_total);
    return s;
}

ByteStatistics compute_byte_statistics(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) throw std::runtime_error("cannot open " + path);

    ByteStatsAccumulator acc;
    std::vector<char> buf(ByteStatsAccumulator::CHUNK_SIZE);
    while (f) {
        f.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        const std::streamsize got = f.gcount();
        if (got <= 0) break;
        acc.update(reinterpret_cast<const uint8_t*>(buf.data()), static_cast<size_t>(got));
    }
    if (f.bad()) throw std::runtime_error("read error on " + path);
    return acc.finish();
}

ByteStatistics compute_byte_statistics(const uint8_t* data, size_t size) {
    ByteStatsAccumulator acc;
    for (size_t off = 0; off < size; off += ByteStatsAccumulator::CHUNK_SIZE)
        acc.update(data + off, std::min(ByteStatsAccumulator::CHUNK_SIZE, size - off));
    return acc.finish();
}
