// =================================================================
// include/Persona/Logger.hpp
// =================================================================
// Header for application logging and audit trails.

#pragma once

#include <string>
#include <vector>
#include <fstream>
#include <chrono>
#include <memory>

namespace Persona {

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
 * @brief Process-wide logger with a console sink and a rotating file sink
 *
 * Until initialize() is called only the console sink is active, so library
 * code and tests can log without creating files.
 */
class Logger {
public:
    /**
     * @brief Get the singleton logger instance
     * @return Reference to logger instance
     */
    static Logger& getInstance();

    /**
     * @brief Initialize logger with a file sink
     * @param log_dir Directory for log files
     * @param max_log_size Maximum size per log file (bytes)
     * @param max_log_files Maximum number of log files to keep
     */
    void initialize(const std::string& log_dir,
                   size_t max_log_size = 1024 * 1024,  // 1MB
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
     * @brief Log the per-step outcome of a profile activation
     * @param profile_name Profile that was applied
     * @param report Activation report
     */
    void logActivation(const std::string& profile_name, const struct ActivationReport& report);

    /**
     * @brief Log session start
     * @param command Command being executed
     * @param target Profile name or file the command acts on
     */
    void logSessionStart(const std::string& command, const std::string& target);

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

    /**
     * @brief Path of the log file currently written, empty without a file sink
     */
    std::string currentLogFile() const;

    /**
     * @brief Parse a level name ("debug", "INFO", "warn", ...)
     * @param name Level name, case-insensitive
     * @param fallback Returned when the name is not recognised
     */
    static LogLevel parseLevel(const std::string& name, LogLevel fallback);

    /**
     * @brief Get log level name as string
     * @param level Log level
     * @return String representation
     */
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
    size_t m_max_log_size = 1024 * 1024;
    size_t m_max_log_files = 5;
    LogLevel m_console_level = LogLevel::INFO;
    LogLevel m_file_level = LogLevel::DEBUG;
    bool m_console_enabled = true;

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
     * @return False if the directory cannot be created
     */
    bool ensureLogDirectory();

    std::string generateLogFilename();
};

// Convenience macros for logging
#define LOG_DEBUG(component, message) \
    Persona::Logger::getInstance().debug(component, message)

#define LOG_INFO(component, message) \
    Persona::Logger::getInstance().info(component, message)

#define LOG_WARNING(component, message) \
    Persona::Logger::getInstance().warning(component, message)

#define LOG_ERROR(component, message) \
    Persona::Logger::getInstance().error(component, message)

#define LOG_CRITICAL(component, message) \
    Persona::Logger::getInstance().critical(component, message)

} // namespace Persona
