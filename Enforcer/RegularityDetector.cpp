#include "RegularityDetector.h"
#include <unordered_map>
#include <cmath>
#include <cstdint>

std::size_t RegularityDetector::countSetBits(const std::vector<unsigned char>& data) {
    std::size_t setBits = 0;
    for (unsigned char byte : data) {
        for (int i = 0; i < 8; ++i) {
            if ((byte >> i) & 1) {
                setBits++;
            }
        }
    }
    return setBits;
}

double RegularityDetector::setBitFraction(const std::vector<unsigned char>& data) {
    if (data.empty()) {
        return 0.0;
    }
    return static_cast<double>(countSetBits(data)) / static_cast<double>(data.size() * 8);
}

bool RegularityDetector::hasPerfectBitBalance(const std::vector<unsigned char>& data) {
    if (data.empty()) {
        return false;
    }

    // |set / total - 1/2| <= p / 100  <=>  |2 * set - total| * 100 <= 2 * p * total
    const std::size_t totalBits = data.size() * 8;
    const std::size_t doubledSet = countSetBits(data) * 2;
    const std::size_t distance = doubledSet > totalBits ? doubledSet - totalBits : totalBits - doubledSet;
    return distance * 100 <= 2 * kBitBalanceTolerancePercent * totalBits;
}

bool RegularityDetector::hasExcessiveRepetition(const std::vector<unsigned char>& data, std::size_t patternLength) {
    if (patternLength == 0 || patternLength > 4 || data.size() < patternLength) {
        return false;
    }

    // Patterns of up to 4 bytes are packed into one integer key.
    std::unordered_map<std::uint32_t, std::size_t> counts;
    counts.reserve(data.size());
    for (std::size_t i = 0; i + patternLength <= data.size(); ++i) {
        std::uint32_t key = 0;
        for (std::size_t j = 0; j < patternLength; ++j) {
            key = (key << 8) | data[i + j];
        }
        counts[key]++;
    }

    const double expected = static_cast<double>(data.size()) / std::pow(256.0, static_cast<double>(patternLength));
    const double limit = expected * kRepetitionFactor;

    for (const auto& entry : counts) {
        if (static_cast<double>(entry.second) > limit) {
            return true;
        }
    }
    return false;
}

bool RegularityDetector::detect(const std::vector<unsigned char>& data) {
    if (data.size() < kMinimumLength) {
        return false;
    }

    if (hasPerfectBitBalance(data)) {
        return true;
    }

    for (std::size_t patternLength = 2; patternLength <= 4; ++patternLength) {
        if (hasExcessiveRepetition(data, patternLength)) {
            return true;
        }
    }
    return false;
}
