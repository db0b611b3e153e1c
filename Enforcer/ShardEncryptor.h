#ifndef SHARD_ENCRYPTOR_H
#define SHARD_ENCRYPTOR_H

#include <string>
#include <vector>
#include <stdexcept>

// Thrown when a produced ciphertext does not reach the entropy threshold.
class EntropyThresholdError : public std::runtime_error {
public:
    EntropyThresholdError(double entropy, double threshold)
        : std::runtime_error("Encryption failed to meet entropy threshold"),
          entropy_(entropy), threshold_(threshold) {}
    double entropy() const { return entropy_; }
    double threshold() const { return threshold_; }

private:
    double entropy_;
    double threshold_;
};

/**
 * @class ShardEncryptor
 * @brief Envelope encryption of shard payloads with an entropy gate on the
 * resulting ciphertext.
 *
 * A fresh data key (DEK) encrypts the payload with AES-256-GCM, and the key
 * encryption key (KEK) wraps the DEK. The sealed form is a JSON bundle of hex
 * fields. A ciphertext whose Shannon entropy falls below the threshold is
 * rejected rather than returned.
 */
class ShardEncryptor {
public:
    static constexpr double kDefaultEntropyThreshold = 7.9;

    /**
     * @param kek 32-byte key encryption key.
     * @param entropyThreshold Minimum ciphertext entropy in bits/byte.
     * @throws std::invalid_argument if the KEK is not 32 bytes.
     */
    explicit ShardEncryptor(const std::vector<unsigned char>& kek,
                            double entropyThreshold = kDefaultEntropyThreshold);

    /**
     * @brief Encrypts a payload into a JSON bundle.
     * @throws EntropyThresholdError if the ciphertext entropy is too low.
     */
    std::string seal(const std::vector<unsigned char>& plaintext) const;

    /**
     * @brief Decrypts a bundle produced by seal().
     * @throws std::runtime_error on a malformed bundle or a failed tag check.
     */
    std::vector<unsigned char> open(const std::string& bundle) const;

    double getEntropyThreshold() const { return entropyThreshold_; }

private:
    std::vector<unsigned char> kek_;
    double entropyThreshold_;
};

#endif // SHARD_ENCRYPTOR_H
