#include "EntropySink.h"
#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <openssl/evp.h>

const std::array<std::array<unsigned char, EntropySink::kMarkerLength>, 5> EntropySink::kMarkers = {{
    {{0x00, 0xDE, 0xAD, 0xFA, 0x11}},
    {{0xCA, 0xFE, 0xBA, 0xBE, 0x01}},
    {{0xFE, 0xED, 0xFA, 0xCE, 0x02}},
    {{0xC0, 0xDE, 0xC0, 0xDE, 0x03}},
    {{0x10, 0xAD, 0xBA, 0x11, 0x04}},
}};

namespace {

std::vector<std::uint32_t> firstPrimes(std::size_t count) {
    std::vector<std::uint32_t> primes;
    primes.reserve(count);
    for (std::uint32_t n = 2; primes.size() < count; ++n) {
        bool isPrime = true;
        for (std::uint32_t p : primes) {
            if (p * p > n) break;
            if (n % p == 0) {
                isPrime = false;
                break;
            }
        }
        if (isPrime) {
            primes.push_back(n);
        }
    }
    return primes;
}

} // namespace

EntropySink::EntropySink(double poisonRatio, int complexityLevel)
    : poisonRatio_(std::min(1.0, std::max(0.0, poisonRatio))),
      complexityLevel_(std::min(5, std::max(1, complexityLevel))) {}

std::uint32_t EntropySink::seedFor(const std::vector<unsigned char>& data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;

    if (1 != EVP_Digest(data.data(), data.size(), digest, &digest_len, EVP_blake2s256(), NULL)) {
        throw std::runtime_error("BLAKE2s digest failed.");
    }

    return (static_cast<std::uint32_t>(digest[0]) << 24) |
           (static_cast<std::uint32_t>(digest[1]) << 16) |
           (static_cast<std::uint32_t>(digest[2]) << 8) |
           static_cast<std::uint32_t>(digest[3]);
}

std::vector<unsigned char> EntropySink::complexityTrap(std::uint32_t seed, std::size_t size) const {
    std::vector<unsigned char> result;

    switch (complexityLevel_) {
        case 1: {
            // Primes XORed with the low seed byte
            for (std::uint32_t p : firstPrimes(size / 4)) {
                result.push_back(static_cast<unsigned char>((p ^ (seed & 0xFF)) & 0xFF));
            }
            break;
        }
        case 2: {
            for (std::uint32_t p : firstPrimes(size / 4)) {
                result.push_back(static_cast<unsigned char>((p + (p >> 1)) & 0xFF));
            }
            break;
        }
        case 3: {
            // Logistic map in its chaotic regime, started strictly inside (0, 1)
            double x = static_cast<double>(seed % 254 + 1) / 255.0;
            for (std::size_t i = 0; i < size; ++i) {
                x = 3.9 * x * (1.0 - x);
                result.push_back(static_cast<unsigned char>(x * 255.0));
            }
            break;
        }
        case 4: {
            std::uint32_t x = seed;
            for (std::size_t i = 0; i < size; ++i) {
                x = x * 1664525u + 1013904223u;
                result.push_back(static_cast<unsigned char>(x % 256));
            }
            break;
        }
        default: {
            // Big-endian float32 of p / (seed + 1)
            const float divisor = static_cast<float>(static_cast<double>(seed) + 1.0);
            for (std::uint32_t p : firstPrimes(size / 4)) {
                float value = static_cast<float>(p) / divisor;
                std::uint32_t bits = 0;
                std::memcpy(&bits, &value, sizeof(bits));
                result.push_back(static_cast<unsigned char>(bits >> 24));
                result.push_back(static_cast<unsigned char>(bits >> 16));
                result.push_back(static_cast<unsigned char>(bits >> 8));
                result.push_back(static_cast<unsigned char>(bits));
            }
            result.resize(std::min(result.size(), size));
            break;
        }
    }
    return result;
}

std::vector<unsigned char> EntropySink::poison(const std::vector<unsigned char>& data) const {
    const std::uint32_t seed = seedFor(data);
    const std::size_t poisonSize = static_cast<std::size_t>(static_cast<double>(data.size()) * poisonRatio_);

    const std::vector<unsigned char> trap = complexityTrap(seed, poisonSize);
    const auto& marker = kMarkers[seed % kMarkers.size()];

    std::vector<unsigned char> result;
    result.reserve(data.size() + marker.size() + trap.size());

    switch (seed % 3) {
        case 0:
            result.insert(result.end(), trap.begin(), trap.end());
            result.insert(result.end(), marker.begin(), marker.end());
            result.insert(result.end(), data.begin(), data.end());
            break;
        case 1:
            result.insert(result.end(), data.begin(), data.end());
            result.insert(result.end(), marker.begin(), marker.end());
            result.insert(result.end(), trap.begin(), trap.end());
            break;
        default: {
            const std::size_t insertPoint = data.empty() ? 0 : seed % data.size();
            result.insert(result.end(), data.begin(), data.begin() + insertPoint);
            result.insert(result.end(), marker.begin(), marker.end());
            result.insert(result.end(), trap.begin(), trap.end());
            result.insert(result.end(), data.begin() + insertPoint, data.end());
            break;
        }
    }
    return result;
}

bool EntropySink::containsMarker(const std::vector<unsigned char>& data) {
    for (const auto& marker : kMarkers) {
        if (std::search(data.begin(), data.end(), marker.begin(), marker.end()) != data.end()) {
            return true;
        }
    }
    return false;
}
