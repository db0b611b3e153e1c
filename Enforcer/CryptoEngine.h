#ifndef CRYPTO_ENGINE_H
#define CRYPTO_ENGINE_H

#include <vector>
#include <string>
#include <cstddef>

class CryptoEngine {
public:
    static constexpr std::size_t kAesKeySize = 32;
    static constexpr std::size_t kGcmIvSize = 12;
    static constexpr std::size_t kGcmTagSize = 16;

    // Cryptographically strong random bytes (OpenSSL RAND_bytes).
    static std::vector<unsigned char> generateRandomBytes(std::size_t length);

    // AES-256-GCM Encryption
    static void encryptAesGcm(const std::vector<unsigned char>& plaintext,
                              const std::vector<unsigned char>& key,
                              const std::vector<unsigned char>& iv,
                              std::vector<unsigned char>& ciphertext,
                              std::vector<unsigned char>& tag);

    // AES-256-GCM Decryption, throws if the tag does not verify
    static std::vector<unsigned char> decryptAesGcm(const std::vector<unsigned char>& ciphertext,
                                                    const std::vector<unsigned char>& key,
                                                    const std::vector<unsigned char>& iv,
                                                    const std::vector<unsigned char>& tag);

    static std::string bytesToHex(const std::vector<unsigned char>& bytes);
    static std::vector<unsigned char> hexToBytes(const std::string& hex);
};

#endif // CRYPTO_ENGINE_H
