#ifndef ENTROPY_ANALYZER_H
#define ENTROPY_ANALYZER_H

#include <vector>
#include <array>
#include <cstddef>

class EntropyAnalyzer {
public:
    /**
     * @brief Shannon entropy of the byte-value distribution, in bits/byte.
     * @return A value in [0, 8]; 0.0 for empty input.
     */
    static double entropy(const std::vector<unsigned char>& data);

    // Occurrence count of every byte value.
    static std::array<std::size_t, 256> byteFrequencies(const std::vector<unsigned char>& data);
};

#endif // ENTROPY_ANALYZER_H
