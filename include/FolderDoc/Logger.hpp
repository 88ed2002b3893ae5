// =================================================================
// include/FolderDoc/Logger.hpp
// =================================================================
// Header for console progress logging and optional log files.

#pragma once

#include <string>
#include <vector>
#include <fstream>
#include <chrono>
#include <memory>

namespace FolderDoc {

/**
 * @brief Log levels for message classification
 */
enum class LogLevel {
    DEBUG,      ///< Per-file progress and diagnostics
    INFO,       ///< Run milestones
    WARNING,    ///< Recovered failures (unreadable file or directory, bad pattern)
    ERROR,      ///< Failures that end the run with an error code
    CRITICAL    ///< Run-aborting precondition failures
};

/**
 * @brief One log record
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
 * @brief Process-wide logger
 *
 * Console lines are colored; WARNING and above go to stderr so that
 * progress output on stdout stays clean. When a log directory is set,
 * plain lines are also appended to `folderdoc_<timestamp>.log`, which is
 * replaced by a fresh file once it reaches the size limit. Only the
 * newest files up to the file limit are kept.
 */
class Logger {
public:
    static Logger& getInstance();

    /**
     * @brief (Re)configure file output
     * @param log_dir Directory for log files, empty for console only
     * @param max_log_size Size in bytes after which a new file is started
     * @param max_log_files Number of log files kept in log_dir
     */
    void initialize(const std::string& log_dir = "",
                    size_t max_log_size = 10 * 1024 * 1024,
                    size_t max_log_files = 5);

    void setConsoleLogLevel(LogLevel level);

    void setConsoleLogging(bool enabled);

    void log(LogLevel level, const std::string& component, const std::string& message,
             const std::string& context = "");

    void debug(const std::string& component, const std::string& message, const std::string& context = "") {
        log(LogLevel::DEBUG, component, message, context);
    }

    void info(const std::string& component, const std::string& message, const std::string& context = "") {
        log(LogLevel::INFO, component, message, context);
    }

    void warning(const std::string& component, const std::string& message, const std::string& context = "") {
        log(LogLevel::WARNING, component, message, context);
    }

    void error(const std::string& component, const std::string& message, const std::string& context = "") {
        log(LogLevel::ERROR, component, message, context);
    }

    void critical(const std::string& component, const std::string& message, const std::string& context = "") {
        log(LogLevel::CRITICAL, component, message, context);
    }

    /**
     * @brief Log the totals of a finished document
     * @param file_count Files written to the document
     * @param line_count Lines written to the document
     * @param output_path Where the document was saved
     */
    void logDocumentSummary(size_t file_count, size_t line_count, const std::string& output_path);

    /**
     * @brief Log the start of a run
     * @param root_path Directory being documented
     * @param patterns Active include patterns
     */
    void logSessionStart(const std::string& root_path, const std::vector<std::string>& patterns);

    /**
     * @brief Log the end of a run
     * @param exit_code Process exit code
     * @param duration_ms Run duration in milliseconds
     */
    void logSessionEnd(int exit_code, long duration_ms);

    void flush();

    /**
     * @brief Parse a level name such as "info" or "warning"
     * @param name Level name, case-insensitive, "warn" accepted
     * @param level Receives the parsed level
     * @return false if the name is unknown; level is left untouched
     */
    static bool parseLevel(const std::string& name, LogLevel& level);

    static std::string getLevelName(LogLevel level);

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::string m_log_dir;
    size_t m_max_log_size = 10 * 1024 * 1024;
    size_t m_max_log_files = 5;
    LogLevel m_console_level = LogLevel::INFO;
    LogLevel m_file_level = LogLevel::DEBUG;
    bool m_console_enabled = true;
    bool m_configured = false;

    std::unique_ptr<std::ofstream> m_log_file;
    size_t m_log_file_size = 0;

    std::string render(const LogEntry& entry, bool colored) const;

    void appendToFile(const std::string& line, LogLevel level);

    bool openNextLogFile();

    void pruneLogFiles() const;

    static std::string formatTime(const std::chrono::system_clock::time_point& time_point,
                                  const char* pattern, const char* millis_separator);
};

} // namespace FolderDoc
