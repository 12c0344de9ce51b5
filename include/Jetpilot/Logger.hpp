// =================================================================
// include/Jetpilot/Logger.hpp
// =================================================================
// Header for logging and the audit trail of executed operations.

#pragma once

#include <string>
#include <vector>
#include <fstream>
#include <chrono>
#include <memory>

namespace Jetpilot {

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
 * @brief Process-wide logger with console and rotating file output
 * 
 * Console output is written to stderr: stdout carries command results
 * and protocol frames and must not be interleaved with log lines.
 */
class Logger {
public:
    /**
     * @brief Get the singleton logger instance
     * @return Reference to logger instance
     */
    static Logger& getInstance();

    /**
     * @brief Initialize logger with configuration
     * @param log_dir Directory for log files, empty for console-only logging
     * @param max_log_size Maximum size per log file (bytes)
     * @param max_log_files Maximum number of log files to keep
     */
    void initialize(const std::string& log_dir = ".jetpilot/logs",
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
     * @brief Log the outcome of a template render
     * @param target_path File the rendered text is written to
     * @param replaced_count Base keys replaced in place
     * @param appended_count Override keys appended at the anchor
     * @param skipped_keys Base keys absent from the sample
     */
    void logRender(const std::string& target_path, size_t replaced_count,
                   size_t appended_count, const std::vector<std::string>& skipped_keys);

    /**
     * @brief Log a finished subprocess
     * @param command_line Shell-quoted command line
     * @param exit_code Exit code reported by the process
     * @param duration_ms Wall time in milliseconds
     */
    void logCommandExecution(const std::string& command_line, int exit_code, long duration_ms);

    /**
     * @brief Log a dispatched tool call
     * @param tool Tool name
     * @param success Whether the operation produced a value
     * @param duration_ms Duration in milliseconds
     * @param detail Error description when the call failed
     */
    void logToolCall(const std::string& tool, bool success, long duration_ms,
                     const std::string& detail = "");

    /**
     * @brief Log session start
     * @param command Command being executed
     * @param detail Short description of the request
     */
    void logSessionStart(const std::string& command, const std::string& detail);

    /**
     * @brief Log session end
     * @param command Command that was executed
     * @param exit_code Exit code
     * @param duration_ms Session duration in milliseconds
     */
    void logSessionEnd(const std::string& command, int exit_code, long duration_ms);

    /**
     * @brief Flush all log buffers
     */
    void flush();

    static std::string getLevelName(LogLevel level);

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
    LogLevel m_console_level = LogLevel::INFO;
    LogLevel m_file_level = LogLevel::DEBUG;
    bool m_console_enabled = true;
    bool m_initialized = false;
    
    std::unique_ptr<std::ofstream> m_current_log_file;
    std::string m_current_log_filename;
    size_t m_current_log_size = 0;

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
     * @return False if the directory could not be created
     */
    bool ensureLogDirectory();

    std::string generateLogFilename();
};

// Convenience macros for logging
#define LOG_DEBUG(component, message) \
    Jetpilot::Logger::getInstance().debug(component, message)

#define LOG_INFO(component, message) \
    Jetpilot::Logger::getInstance().info(component, message)

#define LOG_WARNING(component, message) \
    Jetpilot::Logger::getInstance().warning(component, message)

#define LOG_ERROR(component, message) \
    Jetpilot::Logger::getInstance().error(component, message)

#define LOG_CRITICAL(component, message) \
    Jetpilot::Logger::getInstance().critical(component, message)

} // namespace Jetpilot
