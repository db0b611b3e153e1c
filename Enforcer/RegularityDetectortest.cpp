#include <iostream>
#include <string>
#include <vector>
#include "RegularityDetector.h"
#include "CryptoEngine.h"

// Helper function to print test results
bool check(const std::string& testName, bool condition) {
    std::cout << "  [TEST] " << testName << "... "
              << (condition ? "PASSED" : "FAILED") << std::endl;
    return condition;
}

int main() {
    std::cout << "--- Starting Regularity Detector Test ---" << std::endl;
    bool allTestsPassed = true;

    // --- 1. Short inputs are never judged ---
    std::cout << "\n--- 1. Short Inputs ---" << std::endl;
    std::vector<unsigned char> shortBalanced(99, 0x0F);
    if (!check("99 perfectly balanced bytes are not flagged", !RegularityDetector::detect(shortBalanced))) allTestsPassed = false;

    std::vector<unsigned char> shortZeros(99, 0x00);
    if (!check("99 zero bytes are not flagged", !RegularityDetector::detect(shortZeros))) allTestsPassed = false;

    std::vector<unsigned char> empty;
    if (!check("Empty input is not flagged", !RegularityDetector::detect(empty))) allTestsPassed = false;

    // --- 2. Bit balance ---
    std::cout << "\n--- 2. Bit Balance ---" << std::endl;
    // 0x0F has exactly four set bits, so the fraction is exactly 0.5
    std::vector<unsigned char> balanced(200, 0x0F);
    if (!check("Set-bit fraction of 0x0F fill is 0.5", RegularityDetector::setBitFraction(balanced) == 0.5)) allTestsPassed = false;
    if (!check("Perfect balance is reported", RegularityDetector::hasPerfectBitBalance(balanced))) allTestsPassed = false;
    if (!check("Perfectly balanced data is flagged", RegularityDetector::detect(balanced))) allTestsPassed = false;

    // 0x07 (3 bits) and 0x1F (5 bits) alternate: still exactly 0.5, no single repeated byte
    std::vector<unsigned char> mixedBalanced;
    for (int i = 0; i < 128; ++i) mixedBalanced.push_back(i % 2 ? 0x07 : 0x1F);
    if (!check("Alternating 3-bit/5-bit bytes are balanced", RegularityDetector::hasPerfectBitBalance(mixedBalanced))) allTestsPassed = false;

    // 100 bytes of 0x0F hold 400 of 800 bits; each 0x07 removes one, each 0x1F adds one
    std::vector<unsigned char> lowerBound(100, 0x0F);
    std::vector<unsigned char> upperBound(100, 0x0F);
    for (int i = 0; i < 8; ++i) {
        lowerBound[i * 10] = 0x07;
        upperBound[i * 10] = 0x1F;
    }
    if (!check("392 of 800 set bits is counted exactly", RegularityDetector::countSetBits(lowerBound) == 392)) allTestsPassed = false;
    if (!check("Fraction 0.49 is balanced", RegularityDetector::hasPerfectBitBalance(lowerBound))) allTestsPassed = false;
    if (!check("Fraction 0.51 is balanced", RegularityDetector::hasPerfectBitBalance(upperBound))) allTestsPassed = false;

    std::vector<unsigned char> belowBound = lowerBound;
    std::vector<unsigned char> aboveBound = upperBound;
    belowBound[95] = 0x07;
    aboveBound[95] = 0x1F;
    if (!check("391 of 800 set bits is not balanced", !RegularityDetector::hasPerfectBitBalance(belowBound))) allTestsPassed = false;
    if (!check("409 of 800 set bits is not balanced", !RegularityDetector::hasPerfectBitBalance(aboveBound))) allTestsPassed = false;

    std::vector<unsigned char> ones(200, 0xFF);
    if (!check("Set-bit fraction of 0xFF fill is 1.0", RegularityDetector::setBitFraction(ones) == 1.0)) allTestsPassed = false;
    if (!check("All-ones data is not balanced", !RegularityDetector::hasPerfectBitBalance(ones))) allTestsPassed = false;

    // --- 3. Repetition ---
    std::cout << "\n--- 3. Repetition ---" << std::endl;
    // 0x01 0x03 carries 3 set bits in 16, far from balanced
    std::vector<unsigned char> pairPattern;
    for (int i = 0; i < 150; ++i) {
        pairPattern.push_back(0x01);
        pairPattern.push_back(0x03);
    }
    if (!check("Pair pattern is not balanced", !RegularityDetector::hasPerfectBitBalance(pairPattern))) allTestsPassed = false;
    if (!check("Pair pattern repeats too often for length 2", RegularityDetector::hasExcessiveRepetition(pairPattern, 2))) allTestsPassed = false;
    if (!check("Repeated 2-byte pattern is flagged", RegularityDetector::detect(pairPattern))) allTestsPassed = false;

    if (!check("All-ones data is flagged by repetition", RegularityDetector::detect(ones))) allTestsPassed = false;

    // With one million bytes the 2-byte expectation is ~15 per pattern; random data stays below 10x that
    std::vector<unsigned char> large = CryptoEngine::generateRandomBytes(1000000);
    if (!check("Large random input has no excessive 2-byte repetition", !RegularityDetector::hasExcessiveRepetition(large, 2))) allTestsPassed = false;

    if (!check("Unsupported pattern length is ignored", !RegularityDetector::hasExcessiveRepetition(pairPattern, 5))) allTestsPassed = false;

    // --- Summary ---
    std::cout << "\n--- Test Summary ---" << std::endl;
    std::cout << (allTestsPassed ? "RESULT: All tests PASSED!" : "RESULT: One or more tests FAILED!") << std::endl;
    return allTestsPassed ? 0 : 1;
}
