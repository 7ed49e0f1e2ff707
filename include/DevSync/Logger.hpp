// =================================================================
// include/DevSync/Logger.hpp
// =================================================================
// Header for diagnostic logging and audit trails.

#pragma once

#include <string>
#include <vector>
#include <fstream>
#include <chrono>
#include <memory>

namespace DevSync {

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
 * @brief Process-wide logger with a console sink and an optional file sink
 *
 * The file sink is only opened when a log directory is configured, so the
 * tool never leaves log files inside the repository it synchronizes.
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
     * @param log_dir Directory for log files; empty disables the file sink
     * @param max_log_size Maximum size per log file (bytes)
     * @param max_log_files Maximum number of log files to keep
     */
    void initialize(const std::string& log_dir = "",
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
     * @brief Log one external command invocation
     * @param command_line Command as it would be typed in a shell
     * @param exit_code Exit status (-1 when the process did not exit normally)
     * @param duration_ms Wall-clock duration in milliseconds
     */
    void logCommand(const std::string& command_line, int exit_code, long duration_ms);

    /**
     * @brief Log the outcome of a customization pass
     * @param files_modified Number of rewritten files
     * @param files_removed Number of deleted scripts
     * @param warnings Warnings produced by the pass
     */
    void logCustomization(size_t files_modified, size_t files_removed,
                          const std::vector<std::string>& warnings);

    /**
     * @brief Log session start
     * @param command Workflow being executed
     * @param working_dir Repository the workflow runs in
     */
    void logSessionStart(const std::string& command, const std::string& working_dir);

    /**
     * @brief Log session end
     * @param command Workflow that was executed
     * @param exit_code Exit code
     * @param duration_ms Session duration in milliseconds
     */
    void logSessionEnd(const std::string& command, int exit_code, long duration_ms);

    /**
     * @brief Flush all log buffers
     */
    void flush();

    static std::string getLevelName(LogLevel level);
    static std::string getLevelColor(LogLevel level);

private:
    Logger() = default;
    ~Logger();

    // Prevent copying
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::string m_log_dir;
    size_t m_max_log_size = 0;
    size_t m_max_log_files = 0;
    LogLevel m_console_level = LogLevel::WARNING;
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
    DevSync::Logger::getInstance().debug(component, message)

#define LOG_INFO(component, message) \
    DevSync::Logger::getInstance().info(component, message)

#define LOG_WARNING(component, message) \
    DevSync::Logger::getInstance().warning(component, message)

#define LOG_ERROR(component, message) \
    DevSync::Logger::getInstance().error(component, message)

#define LOG_CRITICAL(component, message) \
    DevSync::Logger::getInstance().critical(component, message)

} // namespace DevSync
