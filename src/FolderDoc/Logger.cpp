// =================================================================
// src/FolderDoc/Logger.cpp
// =================================================================
// Implementation for the logging system.

#include "FolderDoc/Logger.hpp"
#include "FolderDoc/StringUtils.hpp"
#include <algorithm>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <system_error>

namespace FolderDoc {

namespace {

struct LevelStyle {
    const char* name;
    const char* color;
};

// Indexed by LogLevel
const LevelStyle kLevelStyles[] = {
    {"DEBUG", "\033[90m"},
    {"INFO",  "\033[36m"},
    {"WARN",  "\033[33m"},
    {"ERROR", "\033[31m"},
    {"CRIT",  "\033[1;31m"}
};

const char* const kResetColor = "\033[0m";
const char* const kLogFilePrefix = "folderdoc_";

const LevelStyle& styleOf(LogLevel level) {
    return kLevelStyles[static_cast<size_t>(level)];
}

} // namespace

Logger& Logger::getInstance() {
    static Logger logger;
    return logger;
}

Logger::~Logger() {
    flush();
}

void Logger::initialize(const std::string& log_dir, size_t max_log_size, size_t max_log_files) {
    m_configured = true;
    m_log_dir = log_dir;
    m_max_log_size = max_log_size;
    m_max_log_files = max_log_files;
    m_log_file.reset();
    m_log_file_size = 0;

    if (m_log_dir.empty()) {
        return;
    }

    std::error_code ec;
    std::filesystem::create_directories(m_log_dir, ec);
    if (ec) {
        std::cerr << "[WARN] Cannot create log directory " << m_log_dir << ": " << ec.message() << std::endl;
        m_log_dir.clear();
        return;
    }

    if (openNextLogFile()) {
        debug("Logger", "Writing log file", m_log_dir);
    }
}

void Logger::setConsoleLogLevel(LogLevel level) {
    m_console_level = level;
}

void Logger::setConsoleLogging(bool enabled) {
    m_console_enabled = enabled;
}

void Logger::log(LogLevel level, const std::string& component, const std::string& message,
                 const std::string& context) {
    if (!m_configured) {
        initialize();
    }

    LogEntry entry(level, component, message, context);

    if (m_console_enabled && level >= m_console_level) {
        std::ostream& stream = level >= LogLevel::WARNING ? std::cerr : std::cout;
        stream << render(entry, true) << std::endl;
    }

    if (m_log_file && level >= m_file_level) {
        appendToFile(render(entry, false), level);
    }
}

void Logger::logDocumentSummary(size_t file_count, size_t line_count, const std::string& output_path) {
    std::ostringstream totals;
    totals << file_count << " files, " << line_count << " lines";

    info("DocumentAssembler", "Document written to " + output_path, totals.str());

    if (file_count == 0) {
        warning("DocumentAssembler", "No files matched the include patterns");
    }
}

void Logger::logSessionStart(const std::string& root_path, const std::vector<std::string>& patterns) {
    info("Session", "Documenting " + root_path,
         patterns.empty() ? "all files" : std::to_string(patterns.size()) + " include pattern(s)");

    for (const auto& pattern : patterns) {
        debug("Session", "Include pattern", pattern);
    }
}

void Logger::logSessionEnd(int exit_code, long duration_ms) {
    std::string context = "exit code " + std::to_string(exit_code) + ", " + std::to_string(duration_ms) + "ms";
    if (exit_code == 0) {
        info("Session", "Finished", context);
    } else {
        error("Session", "Finished with errors", context);
    }
}

void Logger::flush() {
    if (m_log_file) {
        m_log_file->flush();
    }
    std::cout.flush();
}

bool Logger::parseLevel(const std::string& name, LogLevel& level) {
    std::string lowered = toLower(trim(name));
    if (lowered == "warn") {
        level = LogLevel::WARNING;
        return true;
    }

    static const char* const names[] = {"debug", "info", "warning", "error", "critical"};
    for (size_t i = 0; i < sizeof(names) / sizeof(names[0]); ++i) {
        if (lowered == names[i]) {
            level = static_cast<LogLevel>(i);
            return true;
        }
    }
    return false;
}

std::string Logger::getLevelName(LogLevel level) {
    return styleOf(level).name;
}

std::string Logger::render(const LogEntry& entry, bool colored) const {
    std::ostringstream line;
    line << formatTime(entry.timestamp, "%Y-%m-%d %H:%M:%S", ".") << " ";

    if (colored) {
        line << styleOf(entry.level).color << "[" << styleOf(entry.level).name << "]" << kResetColor;
    } else {
        line << "[" << styleOf(entry.level).name << "]";
    }

    line << " " << entry.component << ": " << entry.message;
    if (!entry.context.empty()) {
        line << " (" << entry.context << ")";
    }
    return line.str();
}

void Logger::appendToFile(const std::string& line, LogLevel level) {
    if (m_log_file_size >= m_max_log_size && !openNextLogFile()) {
        return;
    }

    *m_log_file << line << '\n';
    m_log_file_size += line.size() + 1;

    if (level >= LogLevel::ERROR) {
        m_log_file->flush();
    }
}

bool Logger::openNextLogFile() {
    std::filesystem::path file_path = std::filesystem::path(m_log_dir) /
        (kLogFilePrefix + formatTime(std::chrono::system_clock::now(), "%Y%m%d_%H%M%S", "_") + ".log");

    m_log_file = std::make_unique<std::ofstream>(file_path, std::ios::app);
    m_log_file_size = 0;
    if (!m_log_file->is_open()) {
        std::cerr << "[WARN] Cannot open log file: " << file_path.string() << std::endl;
        m_log_file.reset();
        return false;
    }

    pruneLogFiles();
    return true;
}

void Logger::pruneLogFiles() const {
    std::vector<std::filesystem::path> files;
    std::error_code ec;
    for (std::filesystem::directory_iterator it(m_log_dir, ec), end; !ec && it != end; it.increment(ec)) {
        std::string name = it->path().filename().string();
        if (startsWith(name, kLogFilePrefix) && it->path().extension() == ".log") {
            files.push_back(it->path());
        }
    }
    if (ec) {
        std::cerr << "[WARN] Cannot list log directory: " << ec.message() << std::endl;
        return;
    }

    // File names embed the creation time, so name order is age order
    std::sort(files.begin(), files.end());
    while (files.size() > m_max_log_files) {
        std::filesystem::remove(files.front(), ec);
        files.erase(files.begin());
    }
}

std::string Logger::formatTime(const std::chrono::system_clock::time_point& time_point,
                               const char* pattern, const char* millis_separator) {
    std::time_t seconds = std::chrono::system_clock::to_time_t(time_point);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        time_point.time_since_epoch()).count() % 1000;

    std::ostringstream text;
    text << std::put_time(std::localtime(&seconds), pattern)
         << millis_separator << std::setfill('0') << std::setw(3) << millis;
    return text.str();
}

} // namespace FolderDoc
