#ifndef AUDIT_LOG_H
#define AUDIT_LOG_H

#include <string>

/**
 * @class AuditLog
 * @brief Process-wide, thread-safe audit trail.
 *
 * Lines are written as "YYYY-MM-DD HH:MM:SS - component - LEVEL - message".
 * INFO and DEBUG go to std::cout, everything above to std::cerr. When a log
 * file is configured every line is appended to it as well.
 */
class AuditLog {
public:
    enum class Level { DEBUG, INFO, WARNING, ERROR, CRITICAL };

    static void setLevel(Level level);
    static Level getLevel();

    /**
     * @brief Parses "debug", "info", "warning", "error" or "critical".
     * @throws std::invalid_argument for any other name.
     */
    static Level parseLevel(const std::string& name);

    /**
     * @brief Opens (append mode) a file that receives a copy of every line.
     * @param path The log file path. An empty path closes the current file.
     * @return false if the file could not be opened.
     */
    static bool setLogFile(const std::string& path);

    static void write(Level level, const std::string& component, const std::string& message);

    // Writes text to std::cout under the same lock as log lines, without a prefix.
    static void print(const std::string& text);

    static void debug(const std::string& component, const std::string& message) { write(Level::DEBUG, component, message); }
    static void info(const std::string& component, const std::string& message) { write(Level::INFO, component, message); }
    static void warning(const std::string& component, const std::string& message) { write(Level::WARNING, component, message); }
    static void error(const std::string& component, const std::string& message) { write(Level::ERROR, component, message); }
    static void critical(const std::string& component, const std::string& message) { write(Level::CRITICAL, component, message); }

    // Fixed-point formatting for measured values ("7.21").
    static std::string formatValue(double value, int precision = 2);
};

#endif // AUDIT_LOG_H
