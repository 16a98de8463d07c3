/**
 * @file backup_log.hpp
 * @brief Log sink for the VaultKeeper backup engine.
 *
 * Every component writes through a BackupLog instance owned by the host. Entries are
 * timestamped, echoed to the console and appended to the activity log; warnings and
 * errors are additionally appended to the error log.
 */

#ifndef BACKUP_LOG_HPP
#define BACKUP_LOG_HPP

#include <string>
#include <mutex>

/**
 * @brief Severity of a log entry.
 */
enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error
};

/**
 * @brief Parses "debug", "info", "warning" or "error".
 *
 * @return LogLevel Parsed level, or LogLevel::Info for unknown names.
 */
LogLevel parseLogLevel(const std::string& name);

/**
 * @brief Thread-safe activity/error log.
 */
class BackupLog {
public:
    /**
     * @brief Constructs a log writing to the given files.
     *
     * @param logFile Activity log path; empty disables file output.
     * @param errorLogFile Error log path; empty disables file output.
     * @param level Minimum level written.
     * @param echo If true, entries are also printed to stdout/stderr.
     * @note Parent directories are created on first write.
     */
    BackupLog(const std::string& logFile, const std::string& errorLogFile,
              LogLevel level = LogLevel::Info, bool echo = true);

    void logDebug(const std::string& message) const;
    void logMessage(const std::string& message) const;
    void logWarning(const std::string& message) const;
    void logError(const std::string& message) const;

    const std::string& logFile() const { return logPath; }
    const std::string& errorLogFile() const { return errorLogPath; }

private:
    void write(LogLevel level, const std::string& message) const;

    std::string logPath;        ///< Activity log.
    std::string errorLogPath;   ///< Error log.
    LogLevel minLevel;          ///< Entries below this level are dropped.
    bool echo;                  ///< Console output enabled.
    mutable std::mutex mutex;   ///< Serializes writers across job threads.
};

#endif // BACKUP_LOG_HPP
