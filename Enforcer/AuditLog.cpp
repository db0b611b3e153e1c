#include "AuditLog.h"
#include <iostream>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <mutex>
#include <atomic>
#include <ctime>
#include <chrono>
#include <stdexcept>

namespace {

std::mutex logMutex;
std::ofstream logFile;
std::atomic<AuditLog::Level> minLevel{AuditLog::Level::INFO};

const char* levelName(AuditLog::Level level) {
    switch (level) {
        case AuditLog::Level::DEBUG:    return "DEBUG";
        case AuditLog::Level::INFO:     return "INFO";
        case AuditLog::Level::WARNING:  return "WARNING";
        case AuditLog::Level::ERROR:    return "ERROR";
        case AuditLog::Level::CRITICAL: return "CRITICAL";
    }
    return "UNKNOWN";
}

std::string timestamp() {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&now, &local);
    std::ostringstream ss;
    ss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

} // namespace

void AuditLog::setLevel(Level level) {
    minLevel.store(level);
}

AuditLog::Level AuditLog::getLevel() {
    return minLevel.load();
}

AuditLog::Level AuditLog::parseLevel(const std::string& name) {
    if (name == "debug") return Level::DEBUG;
    if (name == "info") return Level::INFO;
    if (name == "warning") return Level::WARNING;
    if (name == "error") return Level::ERROR;
    if (name == "critical") return Level::CRITICAL;
    throw std::invalid_argument("Unknown log level: " + name);
}

bool AuditLog::setLogFile(const std::string& path) {
    std::lock_guard<std::mutex> lock(logMutex);
    if (logFile.is_open()) {
        logFile.close();
    }
    if (path.empty()) {
        return true;
    }
    logFile.open(path, std::ios::app);
    if (!logFile) {
        std::cerr << "Error: Could not open log file " << path << std::endl;
        return false;
    }
    return true;
}

void AuditLog::write(Level level, const std::string& component, const std::string& message) {
    if (level < minLevel.load()) {
        return;
    }

    std::string line = timestamp() + " - " + component + " - " + levelName(level) + " - " + message;

    std::lock_guard<std::mutex> lock(logMutex);
    if (level >= Level::WARNING) {
        std::cerr << line << std::endl;
    } else {
        std::cout << line << std::endl;
    }
    if (logFile.is_open()) {
        logFile << line << std::endl;
    }
}

void AuditLog::print(const std::string& text) {
    std::lock_guard<std::mutex> lock(logMutex);
    std::cout << text << std::endl;
}

std::string AuditLog::formatValue(double value, int precision) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(precision) << value;
    return ss.str();
}
