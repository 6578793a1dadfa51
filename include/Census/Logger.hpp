// =================================================================
// include/Census/Logger.hpp
// =================================================================
// Header for the console and file logging facility.

#pragma once

#include <string>
#include <fstream>
#include <chrono>
#include <memory>
#include <mutex>

namespace Census {

/**
 * @brief Log levels for message classification
 */
enum class LogLevel {
    DEBUG,      ///< Detailed debug information
    INFO,       ///< General information
    WARNING,    ///< Warning conditions
    ERROR,      ///< Error conditions
    CRITICAL    ///< Critical conditions
};

/**
 * @brief Log entry structure
 */
struct LogEntry {
    std::chrono::system_clock::time_point timestamp;
    LogLevel level;
    std::string component;
    std::string message;
    std::string context;

    LogEntry(LogLevel lvl, const std::string& comp, const std::string& msg, const std::string& ctx = "")
        : timestamp(std::chrono::system_clock::now()), level(lvl), component(comp), message(msg), context(ctx) {}
};

/**
 * @brief Process-wide logger with console and optional file output
 *
 * Console output goes to stderr so that stdout only carries the scan
 * report. File output is disabled until enableFileLogging() is called.
 * All public methods may be called from any thread.
 */
class Logger {
public:
    /**
     * @brief Get the singleton logger instance
     * @return Reference to logger instance
     */
    static Logger& getInstance();

    /**
     * @brief Start writing log entries to files in a directory
     * @param log_dir Directory for log files
     * @param max_log_size Maximum size per log file (bytes)
     * @param max_log_files Maximum number of log files to keep
     */
    void enableFileLogging(const std::string& log_dir,
                           size_t max_log_size = 10 * 1024 * 1024,  // 10MB
                           size_t max_log_files = 5);

    /**
     * @brief Set minimum log level for console output
     * @param level Minimum level to display on console
     */
    void setConsoleLogLevel(LogLevel level);

    /**
     * @brief Set minimum log level for file output
     * @param level Minimum level to write to files
     */
    void setFileLogLevel(LogLevel level);

    /**
     * @brief Enable or disable console logging
     * @param enabled True to enable console output
     */
    void setConsoleLogging(bool enabled);

    void debug(const std::string& component, const std::string& message, const std::string& context = "");
    void info(const std::string& component, const std::string& message, const std::string& context = "");
    void warning(const std::string& component, const std::string& message, const std::string& context = "");
    void error(const std::string& component, const std::string& message, const std::string& context = "");
    void critical(const std::string& component, const std::string& message, const std::string& context = "");

    /**
     * @brief Log the outcome of one scan invocation
     * @param root Scanned root directory
     * @param files_scanned Candidate files processed
     * @param files_with_findings Files that produced at least one name
     * @param total_declarations Sum of names across all findings
     * @param duration_ms Scan duration in milliseconds
     */
    void logScanSummary(const std::string& root, size_t files_scanned,
                        size_t files_with_findings, size_t total_declarations,
                        long duration_ms);

    /**
     * @brief Flush all log buffers
     */
    void flush();

    /**
     * @brief Get log level name as string
     * @param level Log level
     * @return String representation
     */
    static std::string getLevelName(LogLevel level);

    /**
     * @brief Parse a level name such as "debug" or "WARN"
     * @param name Level name, case-insensitive
     * @param level Receives the parsed level on success
     * @return true if the name was recognized
     */
    static bool parseLevelName(const std::string& name, LogLevel& level);

    /**
     * @brief Get log level color for console output
     * @param level Log level
     * @return ANSI color code
     */
    static std::string getLevelColor(LogLevel level);

private:
    Logger() = default;
    ~Logger();

    // Prevent copying
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::string m_log_dir;
    size_t m_max_log_size = 10 * 1024 * 1024;
    size_t m_max_log_files = 5;
    LogLevel m_console_level = LogLevel::WARNING;
    LogLevel m_file_level = LogLevel::DEBUG;
    bool m_console_enabled = true;

    std::unique_ptr<std::ofstream> m_current_log_file;
    std::string m_current_log_filename;
    size_t m_current_log_size = 0;

    std::mutex m_mutex;

    /**
     * @brief Log an entry to all configured outputs
     * @param entry Log entry to write
     */
    void logEntry(const LogEntry& entry);

    void writeToConsole(const LogEntry& entry);
    void writeToFile(const LogEntry& entry);

    /**
     * @brief Format log entry for output
     * @param entry Log entry
     * @param include_color Whether to include color codes
     * @return Formatted string
     */
    std::string formatEntry(const LogEntry& entry, bool include_color = false);

    /**
     * @brief Rotate log files if needed
     */
    void rotateLogsIfNeeded();

    std::string formatTimestamp(const std::chrono::system_clock::time_point& time_point);

    /**
     * @brief Ensure log directory exists
     * @return true if the directory exists or was created
     */
    bool ensureLogDirectory();

    std::string generateLogFilename();
};

// Convenience macros for logging
#define LOG_DEBUG(component, message) \
    Census::Logger::getInstance().debug(component, message)

#define LOG_INFO(component, message) \
    Census::Logger::getInstance().info(component, message)

#define LOG_WARNING(component, message) \
    Census::Logger::getInstance().warning(component, message)

#define LOG_ERROR(component, message) \
    Census::Logger::getInstance().error(component, message)

#define LOG_CRITICAL(component, message) \
    Census::Logger::getInstance().critical(component, message)

} // namespace Census
