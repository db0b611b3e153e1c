#include "EntropyAnalyzer.h"
#include <cmath>

std::array<std::size_t, 256> EntropyAnalyzer::byteFrequencies(const std::vector<unsigned char>& data) {
    std::array<std::size_t, 256> counts{};
    for (unsigned char byte : data) {
        counts[byte]++;
    }
    return counts;
}

double EntropyAnalyzer::entropy(const std::vector<unsigned char>& data) {
    if (data.empty()) {
        return 0.0;
    }

    const auto counts = byteFrequencies(data);
    const double total = static_cast<double>(data.size());

    double result = 0.0;
    for (std::size_t count : counts) {
        if (count == 0) continue;
        double p = static_cast<double>(count) / total;
        result -= p * std::log2(p);
    }
    return result;
}
