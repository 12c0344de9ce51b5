// =================================================================
// src/Jetpilot/Logger.cpp
// =================================================================
// Implementation for the logging system.

#include "Jetpilot/Logger.hpp"
#include <iostream>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <algorithm>

namespace Jetpilot {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    flush();
}

void Logger::initialize(const std::string& log_dir, size_t max_log_size, size_t max_log_files) {
    m_log_dir = log_dir;
    m_max_log_size = max_log_size;
    m_max_log_files = max_log_files;
    m_current_log_size = 0;
    m_current_log_file.reset();
    m_initialized = true;

    if (m_log_dir.empty()) {
        // Console-only logging
        return;
    }

    if (!ensureLogDirectory()) {
        m_log_dir.clear();
        return;
    }

    m_current_log_filename = generateLogFilename();
    m_current_log_file = std::make_unique<std::ofstream>(m_current_log_filename, std::ios::app);
    if (!m_current_log_file->is_open()) {
        std::cerr << "[WARN] Cannot open log file: " << m_current_log_filename << std::endl;
        m_current_log_file.reset();
        return;
    }

    debug("Logger", "Logging system initialized", m_log_dir);
}

void Logger::setConsoleLogLevel(LogLevel level) {
    m_console_level = level;
}

void Logger::setFileLogLevel(LogLevel level) {
    m_file_level = level;
}

void Logger::setConsoleLogging(bool enabled) {
    m_console_enabled = enabled;
}

void Logger::debug(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::DEBUG, component, message, context));
}

void Logger::info(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::INFO, component, message, context));
}

void Logger::warning(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::WARNING, component, message, context));
}

void Logger::error(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::ERROR, component, message, context));
}

void Logger::critical(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::CRITICAL, component, message, context));
}

void Logger::logRender(const std::string& target_path, size_t replaced_count,
                       size_t appended_count, const std::vector<std::string>& skipped_keys) {
    std::ostringstream context;
    context << "Replaced: " << replaced_count << ", ";
    context << "Appended: " << appended_count << ", ";
    context << "Skipped: " << skipped_keys.size();

    info("ConfigTemplateEngine", "Rendered " + target_path, context.str());

    for (const auto& key : skipped_keys) {
        warning("ConfigTemplateEngine", "Key not present in sample, left out: " + key);
    }
}

void Logger::logCommandExecution(const std::string& command_line, int exit_code, long duration_ms) {
    std::ostringstream context;
    context << "Exit code: " << exit_code << ", ";
    context << "Duration: " << duration_ms << "ms";

    if (exit_code == 0) {
        info("SysInteraction", "Command finished", context.str());
    } else {
        warning("SysInteraction", "Command exited with non-zero status", context.str());
    }
    debug("SysInteraction", "Command line: " + command_line);
}

void Logger::logToolCall(const std::string& tool, bool success, long duration_ms,
                         const std::string& detail) {
    std::ostringstream context;
    context << "Duration: " << duration_ms << "ms";
    if (!detail.empty()) {
        context << ", " << detail;
    }

    if (success) {
        info("ToolDispatcher", "Tool call completed: " + tool, context.str());
    } else {
        error("ToolDispatcher", "Tool call failed: " + tool, context.str());
    }
}

void Logger::logSessionStart(const std::string& command, const std::string& detail) {
    std::ostringstream context;
    context << "Command: " << command;

    info("Session", "Session started", context.str());
    if (!detail.empty()) {
        debug("Session", "Request: " + detail);
    }
}

void Logger::logSessionEnd(const std::string& command, int exit_code, long duration_ms) {
    std::ostringstream context;
    context << "Command: " << command << ", ";
    context << "Exit code: " << exit_code << ", ";
    context << "Duration: " << duration_ms << "ms";

    if (exit_code == 0) {
        info("Session", "Session completed successfully", context.str());
    } else {
        error("Session", "Session completed with errors", context.str());
    }
}

void Logger::flush() {
    if (m_current_log_file && m_current_log_file->is_open()) {
        m_current_log_file->flush();
    }
    std::cerr.flush();
}

std::string Logger::getLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::CRITICAL: return "CRIT";
        default: return "UNKNOWN";
    }
}

std::string Logger::getLevelColor(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "\033[90m";     // Dark gray
        case LogLevel::INFO: return "\033[36m";      // Cyan
        case LogLevel::WARNING: return "\033[33m";   // Yellow
        case LogLevel::ERROR: return "\033[31m";     // Red
        case LogLevel::CRITICAL: return "\033[91m";  // Bright red
        default: return "\033[0m";                   // Reset
    }
}

void Logger::logEntry(const LogEntry& entry) {
    if (!m_initialized) {
        // Console-only until a log directory is configured
        initialize("");
    }

    writeToConsole(entry);
    writeToFile(entry);
}

void Logger::writeToConsole(const LogEntry& entry) {
    if (!m_console_enabled || entry.level < m_console_level) {
        return;
    }

    std::string formatted = formatEntry(entry, true);
    std::cerr << formatted << std::endl;
}

void Logger::writeToFile(const LogEntry& entry) {
    if (!m_current_log_file || entry.level < m_file_level) {
        return;
    }

    rotateLogsIfNeeded();
    if (!m_current_log_file) {
        return;
    }

    std::string formatted = formatEntry(entry, false);
    *m_current_log_file << formatted << std::endl;
    m_current_log_size += formatted.length() + 1; // +1 for newline
}

std::string Logger::formatEntry(const LogEntry& entry, bool include_color) {
    std::ostringstream formatted;

    formatted << formatTimestamp(entry.timestamp) << " ";

    if (include_color) {
        formatted << getLevelColor(entry.level);
    }
    formatted << "[" << getLevelName(entry.level) << "]";
    if (include_color) {
        formatted << "\033[0m"; // Reset color
    }
    formatted << " ";

    formatted << entry.component << ": ";
    formatted << entry.message;

    if (!entry.context.empty()) {
        formatted << " (" << entry.context << ")";
    }

    return formatted.str();
}

void Logger::rotateLogsIfNeeded() {
    if (m_current_log_size < m_max_log_size) {
        return;
    }

    m_current_log_file.reset();

    m_current_log_filename = generateLogFilename();
    m_current_log_file = std::make_unique<std::ofstream>(m_current_log_filename);
    if (!m_current_log_file->is_open()) {
        std::cerr << "[WARN] Cannot open log file: " << m_current_log_filename << std::endl;
        m_current_log_file.reset();
        return;
    }
    m_current_log_size = 0;

    // Clean up old log files
    try {
        std::vector<std::filesystem::path> log_files;
        for (const auto& entry : std::filesystem::directory_iterator(m_log_dir)) {
            if (entry.is_regular_file() && entry.path().extension() == ".log") {
                log_files.push_back(entry.path());
            }
        }

        // Newest first
        std::sort(log_files.begin(), log_files.end(),
                 [](const std::filesystem::path& a, const std::filesystem::path& b) {
                     return std::filesystem::last_write_time(a) > std::filesystem::last_write_time(b);
                 });

        for (size_t i = m_max_log_files; i < log_files.size(); i++) {
            std::filesystem::remove(log_files[i]);
        }
    } catch (const std::filesystem::filesystem_error& e) {
        std::cerr << "[WARN] Log rotation failed: " << e.what() << std::endl;
    }
}

std::string Logger::formatTimestamp(const std::chrono::system_clock::time_point& time_point) {
    auto time_t = std::chrono::system_clock::to_time_t(time_point);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        time_point.time_since_epoch()) % 1000;

    std::ostringstream oss;
    oss << std::put_time(std::localtime(&time_t), "%Y-%m-%d %H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();

    return oss.str();
}

bool Logger::ensureLogDirectory() {
    std::error_code ec;
    std::filesystem::create_directories(m_log_dir, ec);
    if (ec) {
        std::cerr << "[WARN] Cannot create log directory " << m_log_dir
                  << ": " << ec.message() << ", logging to console only" << std::endl;
        return false;
    }
    return true;
}

std::string Logger::generateLogFilename() {
    static unsigned int sequence = 0;
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);

    std::ostringstream filename;
    filename << m_log_dir << "/jetpilot_";
    filename << std::put_time(std::localtime(&time_t), "%Y%m%d_%H%M%S");
    if (sequence > 0) {
        filename << "_" << sequence;
    }
    filename << ".log";
    sequence++;

    return filename.str();
}

} // namespace Jetpilot
