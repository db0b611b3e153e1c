#ifndef REGULARITY_DETECTOR_H
#define REGULARITY_DETECTOR_H

#include <vector>
#include <cstddef>

/**
 * @class RegularityDetector
 * @brief Screens key material for structure a weakened generator would leave.
 *
 * Two independent heuristics, either one flags the data:
 * - bit balance: a set-bit fraction within 0.01 of exactly 0.5 is treated as
 *   too perfect to come from a physical source.
 * - repetition: any 2, 3 or 4 byte substring occurring more than 10x as often
 *   as uniformly random data of the same length would predict.
 */
class RegularityDetector {
public:
    static constexpr std::size_t kMinimumLength = 100;
    // Allowed distance of the set-bit fraction from 0.5, in percent (bounds included).
    static constexpr std::size_t kBitBalanceTolerancePercent = 1;
    static constexpr double kRepetitionFactor = 10.0;

    /**
     * @brief Runs both heuristics, stopping at the first positive one.
     * @return false for inputs shorter than kMinimumLength.
     */
    static bool detect(const std::vector<unsigned char>& data);

    static std::size_t countSetBits(const std::vector<unsigned char>& data);

    // Fraction of set bits over all bits; 0.0 for empty input.
    static double setBitFraction(const std::vector<unsigned char>& data);

    // Exact integer comparison, so 0.49 and 0.51 both count as balanced.
    static bool hasPerfectBitBalance(const std::vector<unsigned char>& data);

    /**
     * @brief True if some substring of patternLength bytes occurs more than
     * kRepetitionFactor times its expected count len / 256^patternLength.
     */
    static bool hasExcessiveRepetition(const std::vector<unsigned char>& data, std::size_t patternLength);
};

#endif // REGULARITY_DETECTOR_H
