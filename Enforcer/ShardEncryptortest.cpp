#include <iostream>
#include <string>
#include <vector>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include "ShardEncryptor.h"
#include "CryptoEngine.h"

using json = nlohmann::json;

// Helper function to print test results
bool check(const std::string& testName, bool condition) {
    std::cout << "  [TEST] " << testName << "... "
              << (condition ? "PASSED" : "FAILED") << std::endl;
    return condition;
}

template <typename Error>
bool throwsOnOpen(const ShardEncryptor& encryptor, const std::string& bundle) {
    try {
        encryptor.open(bundle);
    } catch (const Error&) {
        return true;
    }
    return false;
}

int main() {
    std::cout << "--- Starting Shard Encryptor Test ---" << std::endl;
    bool allTestsPassed = true;

    const std::vector<unsigned char> kek = CryptoEngine::generateRandomBytes(CryptoEngine::kAesKeySize);
    ShardEncryptor encryptor(kek);
    const std::vector<unsigned char> payload = CryptoEngine::generateRandomBytes(8192);

    // --- 1. Seal and Open ---
    std::cout << "\n--- 1. Seal and Open ---" << std::endl;
    std::string bundle = encryptor.seal(payload);
    json parsed = json::parse(bundle);

    allTestsPassed &= check("Bundle carries every field",
                            parsed.contains("wrapped_dek") && parsed.contains("dek_iv") && parsed.contains("dek_tag") &&
                            parsed.contains("ciphertext") && parsed.contains("data_iv") && parsed.contains("data_tag") &&
                            parsed.contains("entropy"));
    allTestsPassed &= check("Reported entropy meets the threshold", parsed["entropy"].get<double>() >= 7.9);
    allTestsPassed &= check("Ciphertext has the payload length", parsed["ciphertext"].get<std::string>().size() == payload.size() * 2);
    allTestsPassed &= check("Open restores the payload", encryptor.open(bundle) == payload);
    allTestsPassed &= check("Each seal uses a fresh data key", encryptor.seal(payload) != bundle);

    // --- 2. Entropy Gate ---
    std::cout << "\n--- 2. Entropy Gate ---" << std::endl;
    bool gated = false;
    try {
        encryptor.seal(std::vector<unsigned char>(16, 0x41));
    } catch (const EntropyThresholdError& e) {
        gated = e.entropy() < e.threshold() && e.threshold() == 7.9;
    }
    allTestsPassed &= check("Short ciphertext is rejected", gated);

    ShardEncryptor lenient(kek, 0.0);
    std::vector<unsigned char> small = {'s', 'h', 'a', 'r', 'd'};
    allTestsPassed &= check("Threshold zero accepts short payloads", lenient.open(lenient.seal(small)) == small);

    // --- 3. Rejections ---
    std::cout << "\n--- 3. Rejections ---" << std::endl;
    bool badKek = false;
    try {
        ShardEncryptor invalid(std::vector<unsigned char>(16, 0x01));
    } catch (const std::invalid_argument&) {
        badKek = true;
    }
    allTestsPassed &= check("16-byte KEK is rejected", badKek);

    json tampered = parsed;
    std::string ciphertext = tampered["ciphertext"].get<std::string>();
    ciphertext[0] = (ciphertext[0] == '0') ? '1' : '0';
    tampered["ciphertext"] = ciphertext;
    allTestsPassed &= check("Tampered ciphertext fails the tag check", throwsOnOpen<std::runtime_error>(encryptor, tampered.dump()));

    json truncated = parsed;
    truncated.erase("data_tag");
    allTestsPassed &= check("Missing field is rejected", throwsOnOpen<std::runtime_error>(encryptor, truncated.dump()));

    json badHex = parsed;
    badHex["data_iv"] = "zz";
    allTestsPassed &= check("Corrupt hex field is rejected", throwsOnOpen<std::runtime_error>(encryptor, badHex.dump()));

    allTestsPassed &= check("Malformed JSON is rejected", throwsOnOpen<std::runtime_error>(encryptor, "{not json"));

    ShardEncryptor other(CryptoEngine::generateRandomBytes(CryptoEngine::kAesKeySize));
    allTestsPassed &= check("Wrong KEK cannot open the bundle", throwsOnOpen<std::runtime_error>(other, bundle));

    std::cout << "\n--- Test Summary ---" << std::endl;
    std::cout << (allTestsPassed ? "RESULT: All tests PASSED!" : "RESULT: One or more tests FAILED!") << std::endl;
    return allTestsPassed ? 0 : 1;
}
