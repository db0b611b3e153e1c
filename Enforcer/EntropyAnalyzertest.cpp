#include <iostream>
#include <string>
#include <vector>
#include <cmath>
#include "EntropyAnalyzer.h"
#include "CryptoEngine.h"

// Helper function to print test results
bool check(const std::string& testName, bool condition) {
    std::cout << "  [TEST] " << testName << "... "
              << (condition ? "PASSED" : "FAILED") << std::endl;
    return condition;
}

bool near(double a, double b, double tolerance = 1e-9) {
    return std::fabs(a - b) <= tolerance;
}

int main() {
    std::cout << "--- Starting Entropy Analyzer Test ---" << std::endl;
    bool allTestsPassed = true;

    // --- 1. Degenerate inputs ---
    std::cout << "\n--- 1. Degenerate Inputs ---" << std::endl;
    std::vector<unsigned char> empty;
    if (!check("Empty input has zero entropy", EntropyAnalyzer::entropy(empty) == 0.0)) allTestsPassed = false;

    std::vector<unsigned char> constant(500, 0x41);
    if (!check("Constant input has zero entropy", near(EntropyAnalyzer::entropy(constant), 0.0))) allTestsPassed = false;

    // --- 2. Known distributions ---
    std::cout << "\n--- 2. Known Distributions ---" << std::endl;
    std::vector<unsigned char> everyByte;
    for (int i = 0; i < 256; ++i) everyByte.push_back(static_cast<unsigned char>(i));
    if (!check("Each byte value once gives 8 bits/byte", near(EntropyAnalyzer::entropy(everyByte), 8.0))) allTestsPassed = false;

    std::vector<unsigned char> twoValues;
    for (int i = 0; i < 64; ++i) twoValues.push_back(i % 2 ? 0x00 : 0xFF);
    if (!check("Two equally likely values give 1 bit/byte", near(EntropyAnalyzer::entropy(twoValues), 1.0))) allTestsPassed = false;

    std::string pattern;
    for (int i = 0; i < 300; ++i) pattern += "abc";
    std::vector<unsigned char> abc(pattern.begin(), pattern.end());
    if (!check("Repeating 'abc' gives log2(3) bits/byte", near(EntropyAnalyzer::entropy(abc), std::log2(3.0)))) allTestsPassed = false;

    // --- 3. Range ---
    std::cout << "\n--- 3. Range ---" << std::endl;
    std::vector<unsigned char> random = CryptoEngine::generateRandomBytes(4096);
    double randomEntropy = EntropyAnalyzer::entropy(random);
    std::cout << "  Random 4096-byte entropy: " << randomEntropy << std::endl;
    if (!check("Random data entropy is within [0, 8]", randomEntropy >= 0.0 && randomEntropy <= 8.0)) allTestsPassed = false;
    if (!check("Random data entropy is above 7.9", randomEntropy > 7.9)) allTestsPassed = false;

    std::vector<unsigned char> single(1, 0x7F);
    if (!check("Single byte has zero entropy", near(EntropyAnalyzer::entropy(single), 0.0))) allTestsPassed = false;

    auto counts = EntropyAnalyzer::byteFrequencies(abc);
    if (!check("Frequencies count each byte value", counts['a'] == 300 && counts['b'] == 300 && counts['c'] == 300 && counts['d'] == 0)) allTestsPassed = false;

    // --- Summary ---
    std::cout << "\n--- Test Summary ---" << std::endl;
    std::cout << (allTestsPassed ? "RESULT: All tests PASSED!" : "RESULT: One or more tests FAILED!") << std::endl;
    return allTestsPassed ? 0 : 1;
}
