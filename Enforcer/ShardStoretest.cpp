#include <iostream>
#include <string>
#include <vector>
#include <filesystem> // For final cleanup
#include "ShardStore.h"

namespace fs = std::filesystem;

// Helper function to print test results
bool check(const std::string& testName, bool condition) {
    std::cout << "  [TEST] " << testName << "... "
              << (condition ? "PASSED" : "FAILED") << std::endl;
    return condition;
}

int main() {
    const std::string STORE_PATH = (fs::temp_directory_path() / "thermoguard_shardstore_test").string();
    std::cout << "--- Starting Shard Store Test ---" << std::endl;
    std::cout << "Using store path: " << STORE_PATH << "\n" << std::endl;

    fs::remove_all(STORE_PATH);
    bool allTestsPassed = true;

    // --- 1. Initialization ---
    std::cout << "--- 1. Initialization ---" << std::endl;
    FileShardStore store(STORE_PATH);
    if (!check("Storage directory is created", fs::is_directory(STORE_PATH))) allTestsPassed = false;
    if (!check("Relative ids resolve under the store", store.resolvePath("a.bin") == (fs::path(STORE_PATH) / "a.bin").string())) allTestsPassed = false;
    if (!check("Absolute ids are kept", store.resolvePath("/tmp/x.bin") == "/tmp/x.bin")) allTestsPassed = false;

    // --- 2. Create and Read ---
    std::cout << "\n--- 2. Creating and Reading Shards ---" << std::endl;
    std::vector<unsigned char> content = {0x00, 0x01, 0xFF, 0x7F, 0x0A, 0x0D, 0x00};
    if (!check("Create 'shard_a.bin'", store.createShard("shard_a.bin", content))) allTestsPassed = false;
    if (!check("Create nested 'vault/shard_b.bin'", store.createShard("vault/shard_b.bin", {0x42}))) allTestsPassed = false;
    if (!check("Shard exists after creation", store.shardExists("shard_a.bin"))) allTestsPassed = false;
    if (!check("Binary content reads back unchanged", store.readAll("shard_a.bin") == content)) allTestsPassed = false;
    if (!check("Duplicate creation fails", !store.createShard("shard_a.bin", content))) allTestsPassed = false;

    std::vector<unsigned char> emptyContent;
    if (!check("Create empty shard", store.createShard("empty.bin", emptyContent))) allTestsPassed = false;
    if (!check("Empty shard reads as empty", store.readAll("empty.bin").empty())) allTestsPassed = false;

    // --- 3. Overwrite ---
    std::cout << "\n--- 3. Overwriting ---" << std::endl;
    std::vector<unsigned char> replacement(1024, 0xAB);
    bool overwriteThrew = false;
    try {
        store.overwrite("shard_a.bin", replacement);
    } catch (const ShardIOError& e) {
        overwriteThrew = true;
        std::cerr << e.what() << std::endl;
    }
    if (!check("Overwrite succeeds", !overwriteThrew)) allTestsPassed = false;
    if (!check("Overwrite fully replaces content", store.readAll("shard_a.bin") == replacement)) allTestsPassed = false;

    std::vector<unsigned char> shorter = {0x01, 0x02};
    store.overwrite("shard_a.bin", shorter);
    if (!check("Shorter overwrite truncates", store.readAll("shard_a.bin") == shorter)) allTestsPassed = false;

    // --- 4. Failure Cases ---
    std::cout << "\n--- 4. Testing Failure Cases ---" << std::endl;
    bool notFound = false;
    try {
        store.readAll("does_not_exist.bin");
    } catch (const ShardNotFoundError& e) {
        notFound = e.shardId() == "does_not_exist.bin";
    }
    if (!check("Missing shard raises ShardNotFoundError", notFound)) allTestsPassed = false;

    bool directoryNotFound = false;
    try {
        store.readAll("vault");
    } catch (const ShardNotFoundError&) {
        directoryNotFound = true;
    }
    if (!check("Directory is not a shard", directoryNotFound)) allTestsPassed = false;

    bool ioError = false;
    try {
        store.overwrite("no_such_dir/shard.bin", shorter);
    } catch (const ShardIOError& e) {
        ioError = e.shardId() == "no_such_dir/shard.bin";
    }
    if (!check("Overwrite into missing directory raises ShardIOError", ioError)) allTestsPassed = false;

    // --- Summary ---
    std::cout << "\n--- Test Summary ---" << std::endl;
    std::cout << (allTestsPassed ? "RESULT: All tests PASSED!" : "RESULT: One or more tests FAILED!") << std::endl;

    // Final cleanup
    std::cout << "Cleaning up test directory..." << std::endl;
    try {
        fs::remove_all(STORE_PATH);
    } catch (const fs::filesystem_error& e) {
        std::cerr << "Cleanup failed: " << e.what() << std::endl;
    }

    return allTestsPassed ? 0 : 1;
}
