#include "ShardEncryptor.h"
#include "AuditLog.h"
#include "CryptoEngine.h"
#include "EntropyAnalyzer.h"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

ShardEncryptor::ShardEncryptor(const std::vector<unsigned char>& kek, double entropyThreshold)
    : kek_(kek), entropyThreshold_(entropyThreshold) {
    if (kek_.size() != CryptoEngine::kAesKeySize) {
        throw std::invalid_argument("Key encryption key must be 32 bytes.");
    }
}

std::string ShardEncryptor::seal(const std::vector<unsigned char>& plaintext) const {
    // 1. Generate a new Data Encryption Key (DEK)
    auto dek = CryptoEngine::generateRandomBytes(CryptoEngine::kAesKeySize);

    // 2. Encrypt the plaintext with the DEK
    auto data_iv = CryptoEngine::generateRandomBytes(CryptoEngine::kGcmIvSize);
    std::vector<unsigned char> data_ciphertext;
    std::vector<unsigned char> data_tag;
    CryptoEngine::encryptAesGcm(plaintext, dek, data_iv, data_ciphertext, data_tag);

    // 3. Refuse weak output before anything leaves this function
    double entropy = EntropyAnalyzer::entropy(data_ciphertext);
    AuditLog::debug("ShardEncryptor", "Calculated entropy: " + AuditLog::formatValue(entropy) + " bits/byte");
    if (entropy < entropyThreshold_) {
        throw EntropyThresholdError(entropy, entropyThreshold_);
    }

    // 4. Wrap (encrypt) the DEK with the KEK
    auto dek_iv = CryptoEngine::generateRandomBytes(CryptoEngine::kGcmIvSize);
    std::vector<unsigned char> wrapped_dek;
    std::vector<unsigned char> dek_tag;
    CryptoEngine::encryptAesGcm(dek, kek_, dek_iv, wrapped_dek, dek_tag);

    // 5. Create the output bundle
    json bundle;
    bundle["wrapped_dek"] = CryptoEngine::bytesToHex(wrapped_dek);
    bundle["dek_iv"] = CryptoEngine::bytesToHex(dek_iv);
    bundle["dek_tag"] = CryptoEngine::bytesToHex(dek_tag);
    bundle["ciphertext"] = CryptoEngine::bytesToHex(data_ciphertext);
    bundle["data_iv"] = CryptoEngine::bytesToHex(data_iv);
    bundle["data_tag"] = CryptoEngine::bytesToHex(data_tag);
    bundle["entropy"] = entropy;

    return bundle.dump();
}

std::vector<unsigned char> ShardEncryptor::open(const std::string& bundleText) const {
    json bundle;
    try {
        bundle = json::parse(bundleText);
    } catch (const json::parse_error& e) {
        throw std::runtime_error(std::string("Invalid bundle format: ") + e.what());
    }

    // 1. Parse the bundle
    std::vector<unsigned char> wrapped_dek, dek_iv, dek_tag, data_ciphertext, data_iv, data_tag;
    try {
        wrapped_dek = CryptoEngine::hexToBytes(bundle.at("wrapped_dek").get<std::string>());
        dek_iv = CryptoEngine::hexToBytes(bundle.at("dek_iv").get<std::string>());
        dek_tag = CryptoEngine::hexToBytes(bundle.at("dek_tag").get<std::string>());
        data_ciphertext = CryptoEngine::hexToBytes(bundle.at("ciphertext").get<std::string>());
        data_iv = CryptoEngine::hexToBytes(bundle.at("data_iv").get<std::string>());
        data_tag = CryptoEngine::hexToBytes(bundle.at("data_tag").get<std::string>());
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Incomplete bundle: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(std::string("Corrupt bundle field: ") + e.what());
    }

    // 2. Unwrap (decrypt) the DEK with the KEK, then decrypt the data
    try {
        std::vector<unsigned char> dek = CryptoEngine::decryptAesGcm(wrapped_dek, kek_, dek_iv, dek_tag);
        return CryptoEngine::decryptAesGcm(data_ciphertext, dek, data_iv, data_tag);
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(std::string("Corrupt bundle field: ") + e.what());
    }
}
