#include "CryptoEngine.h"
#include <stdexcept>
#include <sstream>
#include <iomanip>
#include <climits>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/err.h>

std::vector<unsigned char> CryptoEngine::generateRandomBytes(std::size_t length) {
    std::vector<unsigned char> bytes(length);
    if (length == 0) {
        return bytes;
    }
    if (length > static_cast<std::size_t>(INT_MAX)) {
        throw std::invalid_argument("Requested random length is too large.");
    }
    if (RAND_bytes(bytes.data(), static_cast<int>(length)) != 1) {
        throw std::runtime_error("Failed to generate random bytes.");
    }
    return bytes;
}

// --- Symmetric Encryption (AES-256-GCM) ---

void CryptoEngine::encryptAesGcm(const std::vector<unsigned char>& plaintext,
                                 const std::vector<unsigned char>& key,
                                 const std::vector<unsigned char>& iv,
                                 std::vector<unsigned char>& ciphertext,
                                 std::vector<unsigned char>& tag) {
    if (key.size() != kAesKeySize) throw std::invalid_argument("Invalid key size for AES-256.");
    if (iv.size() != kGcmIvSize) throw std::invalid_argument("Invalid IV size for AES-GCM.");

    EVP_CIPHER_CTX *ctx = EVP_CIPHER_CTX_new();
    if (!ctx) throw std::runtime_error("Failed to create cipher context.");

    int len = 0;
    ciphertext.assign(plaintext.size() + kGcmTagSize, 0);

    if (1 != EVP_EncryptInit_ex(ctx, EVP_aes_256_gcm(), NULL, key.data(), iv.data())) {
        EVP_CIPHER_CTX_free(ctx);
        throw std::runtime_error("EncryptInit failed.");
    }

    if (1 != EVP_EncryptUpdate(ctx, ciphertext.data(), &len, plaintext.data(), static_cast<int>(plaintext.size()))) {
        EVP_CIPHER_CTX_free(ctx);
        throw std::runtime_error("EncryptUpdate failed.");
    }
    int ciphertext_len = len;

    if (1 != EVP_EncryptFinal_ex(ctx, ciphertext.data() + len, &len)) {
        EVP_CIPHER_CTX_free(ctx);
        throw std::runtime_error("EncryptFinal failed.");
    }
    ciphertext_len += len;
    ciphertext.resize(ciphertext_len);

    tag.assign(kGcmTagSize, 0);
    if (1 != EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_GET_TAG, static_cast<int>(kGcmTagSize), tag.data())) {
        EVP_CIPHER_CTX_free(ctx);
        throw std::runtime_error("Failed to read GCM tag.");
    }

    EVP_CIPHER_CTX_free(ctx);
}

std::vector<unsigned char> CryptoEngine::decryptAesGcm(const std::vector<unsigned char>& ciphertext,
                                                       const std::vector<unsigned char>& key,
                                                       const std::vector<unsigned char>& iv,
                                                       const std::vector<unsigned char>& tag) {
    if (key.size() != kAesKeySize) throw std::invalid_argument("Invalid key size for AES-256.");
    if (iv.size() != kGcmIvSize) throw std::invalid_argument("Invalid IV size for AES-GCM.");
    if (tag.size() != kGcmTagSize) throw std::invalid_argument("Invalid GCM tag size.");

    EVP_CIPHER_CTX *ctx = EVP_CIPHER_CTX_new();
    if (!ctx) throw std::runtime_error("Failed to create cipher context.");

    int len = 0;
    std::vector<unsigned char> plaintext(ciphertext.size() + kGcmTagSize, 0);

    if (1 != EVP_DecryptInit_ex(ctx, EVP_aes_256_gcm(), NULL, key.data(), iv.data())) {
        EVP_CIPHER_CTX_free(ctx);
        throw std::runtime_error("DecryptInit failed.");
    }

    if (1 != EVP_DecryptUpdate(ctx, plaintext.data(), &len, ciphertext.data(), static_cast<int>(ciphertext.size()))) {
        EVP_CIPHER_CTX_free(ctx);
        throw std::runtime_error("DecryptUpdate failed.");
    }
    int plaintext_len = len;

    std::vector<unsigned char> expectedTag(tag);
    if (1 != EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_TAG, static_cast<int>(expectedTag.size()), expectedTag.data())) {
        EVP_CIPHER_CTX_free(ctx);
        throw std::runtime_error("Failed to set GCM tag.");
    }

    if (1 != EVP_DecryptFinal_ex(ctx, plaintext.data() + len, &len)) {
        EVP_CIPHER_CTX_free(ctx);
        throw std::runtime_error("DecryptFinal failed. Tag verification error?");
    }
    plaintext_len += len;

    EVP_CIPHER_CTX_free(ctx);
    plaintext.resize(plaintext_len);
    return plaintext;
}

std::string CryptoEngine::bytesToHex(const std::vector<unsigned char>& bytes) {
    std::stringstream ss;
    ss << std::hex << std::setfill('0');
    for (unsigned char byte : bytes) {
        ss << std::setw(2) << static_cast<int>(byte);
    }
    return ss.str();
}

std::vector<unsigned char> CryptoEngine::hexToBytes(const std::string& hex) {
    if (hex.length() % 2 != 0) {
        throw std::invalid_argument("Hex string has odd length.");
    }
    std::vector<unsigned char> bytes;
    bytes.reserve(hex.length() / 2);
    for (std::size_t i = 0; i < hex.length(); i += 2) {
        std::string byteString = hex.substr(i, 2);
        std::size_t consumed = 0;
        int value = std::stoi(byteString, &consumed, 16);
        if (consumed != 2 || value < 0) {
            throw std::invalid_argument("Invalid hex digit in: " + byteString);
        }
        bytes.push_back(static_cast<unsigned char>(value));
    }
    return bytes;
}
