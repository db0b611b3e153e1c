#include <iostream>
#include <string>
#include <vector>
#include "EntropySink.h"

// Helper function to print test results
bool check(const std::string& testName, bool condition) {
    std::cout << "  [TEST] " << testName << "... "
              << (condition ? "PASSED" : "FAILED") << std::endl;
    return condition;
}

std::vector<unsigned char> toBytes(const std::string& text) {
    return std::vector<unsigned char>(text.begin(), text.end());
}

int main() {
    std::cout << "--- Starting Entropy Sink Test ---" << std::endl;
    bool allTestsPassed = true;

    const std::vector<unsigned char> payload = toBytes("key shard payload that is long enough to carry a decoy trap");

    // --- 1. Markers ---
    std::cout << "\n--- 1. Markers ---" << std::endl;
    EntropySink sink;
    std::vector<unsigned char> poisoned = sink.poison(payload);
    allTestsPassed &= check("Poisoned payload carries a marker", EntropySink::containsMarker(poisoned));
    allTestsPassed &= check("Plain text carries no marker", !EntropySink::containsMarker(payload));
    allTestsPassed &= check("Empty payload carries no marker", !EntropySink::containsMarker({}));
    allTestsPassed &= check("Empty payload can still be poisoned", EntropySink::containsMarker(sink.poison({})));

    // --- 2. Determinism and Size ---
    std::cout << "\n--- 2. Determinism and Size ---" << std::endl;
    allTestsPassed &= check("Same input yields the same output", sink.poison(payload) == poisoned);
    allTestsPassed &= check("Seed is stable", EntropySink::seedFor(payload) == EntropySink::seedFor(payload));

    const std::size_t poisonSize = static_cast<std::size_t>(payload.size() * sink.getPoisonRatio());
    std::vector<unsigned char> trap = sink.complexityTrap(EntropySink::seedFor(payload), poisonSize);
    allTestsPassed &= check("Output is payload, marker and trap",
                            poisoned.size() == payload.size() + EntropySink::kMarkerLength + trap.size());

    EntropySink noTrap(0.0, 3);
    allTestsPassed &= check("Ratio zero adds only the marker",
                            noTrap.poison(payload).size() == payload.size() + EntropySink::kMarkerLength);

    // --- 3. Complexity Levels ---
    std::cout << "\n--- 3. Complexity Levels ---" << std::endl;
    EntropySink primes(1.0, 1);
    allTestsPassed &= check("Level 1 yields one byte per prime", primes.complexityTrap(7, 400).size() == 100);
    std::vector<unsigned char> primeTrap = EntropySink(1.0, 1).complexityTrap(0, 8);
    allTestsPassed &= check("Level 1 with seed 0 is the primes", primeTrap == std::vector<unsigned char>({2, 3}));

    EntropySink lcg(1.0, 4);
    allTestsPassed &= check("Level 4 fills the requested size", lcg.complexityTrap(12345, 333).size() == 333);
    allTestsPassed &= check("Level 3 fills the requested size", EntropySink(1.0, 3).complexityTrap(99, 64).size() == 64);
    allTestsPassed &= check("Level 5 never exceeds the requested size", EntropySink(1.0, 5).complexityTrap(3, 10).size() == 8);

    // --- 4. Clamping ---
    std::cout << "\n--- 4. Clamping ---" << std::endl;
    EntropySink high(5.0, 9);
    EntropySink low(-1.0, 0);
    allTestsPassed &= check("Ratio above one is clamped", high.getPoisonRatio() == 1.0);
    allTestsPassed &= check("Level above five is clamped", high.getComplexityLevel() == 5);
    allTestsPassed &= check("Negative ratio is clamped", low.getPoisonRatio() == 0.0);
    allTestsPassed &= check("Level below one is clamped", low.getComplexityLevel() == 1);

    std::cout << "\n--- Test Summary ---" << std::endl;
    std::cout << (allTestsPassed ? "RESULT: All tests PASSED!" : "RESULT: One or more tests FAILED!") << std::endl;
    return allTestsPassed ? 0 : 1;
}
