#include <iostream>
#include <fstream>
#include <string>
#include <vector>
#include <stdexcept>
#include <filesystem>
#include <sstream>
#include <thread>
#include "AuditLog.h"

namespace fs = std::filesystem;

// Helper function to print test results
bool check(const std::string& testName, bool condition) {
    std::cout << "  [TEST] " << testName << "... "
              << (condition ? "PASSED" : "FAILED") << std::endl;
    return condition;
}

std::vector<std::string> readLines(const fs::path& path) {
    std::vector<std::string> lines;
    std::ifstream in(path);
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

int main() {
    std::cout << "--- Starting Audit Log Test ---" << std::endl;
    bool allTestsPassed = true;
    const fs::path logPath = fs::temp_directory_path() / "thermoguard_auditlog_test.log";
    fs::remove(logPath);

    // --- 1. Level Names ---
    std::cout << "\n--- 1. Level Names ---" << std::endl;
    allTestsPassed &= check("debug parses", AuditLog::parseLevel("debug") == AuditLog::Level::DEBUG);
    allTestsPassed &= check("critical parses", AuditLog::parseLevel("critical") == AuditLog::Level::CRITICAL);
    bool rejected = false;
    try {
        AuditLog::parseLevel("verbose");
    } catch (const std::invalid_argument&) {
        rejected = true;
    }
    allTestsPassed &= check("Unknown level is rejected", rejected);
    allTestsPassed &= check("Default level is INFO", AuditLog::getLevel() == AuditLog::Level::INFO);

    // --- 2. File Sink ---
    std::cout << "\n--- 2. File Sink ---" << std::endl;
    allTestsPassed &= check("Log file opens", AuditLog::setLogFile(logPath.string()));
    AuditLog::debug("AuditLogtest", "hidden below INFO");
    AuditLog::info("AuditLogtest", "shard checked");
    AuditLog::setLevel(AuditLog::Level::ERROR);
    AuditLog::warning("AuditLogtest", "hidden below ERROR");
    AuditLog::critical("AuditLogtest", "apoptosis");
    AuditLog::setLevel(AuditLog::Level::INFO);
    allTestsPassed &= check("Log file closes", AuditLog::setLogFile(""));

    std::vector<std::string> lines = readLines(logPath);
    allTestsPassed &= check("Only lines at or above the level are written", lines.size() == 2);
    if (lines.size() == 2) {
        // Timestamp "YYYY-MM-DD HH:MM:SS" takes the first 19 characters
        allTestsPassed &= check("Line starts with a timestamp", lines[0].size() > 19 && lines[0][4] == '-' && lines[0][13] == ':');
        allTestsPassed &= check("Line carries component, level and message",
                                lines[0].substr(19) == " - AuditLogtest - INFO - shard checked");
        allTestsPassed &= check("Critical line is written",
                                lines[1].substr(19) == " - AuditLogtest - CRITICAL - apoptosis");
    }

    allTestsPassed &= check("Unwritable path is reported", !AuditLog::setLogFile("/nonexistent_dir/thermoguard.log"));

    // --- 3. Value Formatting ---
    std::cout << "\n--- 3. Value Formatting ---" << std::endl;
    allTestsPassed &= check("Two decimals by default", AuditLog::formatValue(7.2149) == "7.21");
    allTestsPassed &= check("Precision is configurable", AuditLog::formatValue(2.7, 0) == "3");

    // --- 4. Console Blocks ---
    std::cout << "\n--- 4. Console Blocks ---" << std::endl;
    std::ostringstream captured;
    std::streambuf* original = std::cout.rdbuf(captured.rdbuf());
    std::thread printer([] {
        for (int i = 0; i < 200; ++i) {
            AuditLog::print("block-begin\nblock-end");
        }
    });
    for (int i = 0; i < 200; ++i) {
        AuditLog::info("AuditLogtest", "concurrent line");
    }
    printer.join();
    std::cout.rdbuf(original);

    std::vector<std::string> consoleLines;
    std::istringstream in(captured.str());
    for (std::string line; std::getline(in, line);) {
        consoleLines.push_back(line);
    }
    size_t blocks = 0;
    bool intact = consoleLines.size() == 600;
    for (size_t i = 0; i < consoleLines.size(); ++i) {
        if (consoleLines[i] == "block-begin") {
            blocks++;
            intact &= i + 1 < consoleLines.size() && consoleLines[i + 1] == "block-end";
        }
    }
    allTestsPassed &= check("Printed blocks are never split by log lines", intact && blocks == 200);

    fs::remove(logPath);

    std::cout << "\n--- Test Summary ---" << std::endl;
    std::cout << (allTestsPassed ? "RESULT: All tests PASSED!" : "RESULT: One or more tests FAILED!") << std::endl;
    return allTestsPassed ? 0 : 1;
}
