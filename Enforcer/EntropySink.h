#ifndef ENTROPY_SINK_H
#define ENTROPY_SINK_H

#include <array>
#include <cstdint>
#include <vector>

/**
 * @class EntropySink
 * @brief Mixes decoy content ("complexity traps") into payloads and detects
 * payloads that carry it.
 *
 * The transform is deterministic: the seed is taken from a BLAKE2s-256 digest
 * of the payload, so the same input always yields the same output. Each
 * poisoned payload carries one of five fixed 5-byte markers.
 */
class EntropySink {
public:
    static constexpr std::size_t kMarkerLength = 5;
    static const std::array<std::array<unsigned char, kMarkerLength>, 5> kMarkers;

    /**
     * @param poisonRatio Trap size relative to the payload, clamped to [0, 1].
     * @param complexityLevel Trap generator, clamped to 1..5.
     */
    explicit EntropySink(double poisonRatio = 0.1, int complexityLevel = 3);

    std::vector<unsigned char> poison(const std::vector<unsigned char>& data) const;

    // True if any of the markers occurs in the data.
    static bool containsMarker(const std::vector<unsigned char>& data);

    /**
     * @brief Builds a trap of up to `size` bytes for the configured level.
     * Levels 1, 2 and 5 are derived from the first size/4 primes; levels 3
     * and 4 produce exactly `size` bytes.
     */
    std::vector<unsigned char> complexityTrap(std::uint32_t seed, std::size_t size) const;

    // First four bytes (big-endian) of the BLAKE2s-256 digest of the data.
    static std::uint32_t seedFor(const std::vector<unsigned char>& data);

    double getPoisonRatio() const { return poisonRatio_; }
    int getComplexityLevel() const { return complexityLevel_; }

private:
    double poisonRatio_;
    int complexityLevel_;
};

#endif // ENTROPY_SINK_H
