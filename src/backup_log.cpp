#include "backup_log.hpp"
#include <fstream>
#include <iostream>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace {

std::string levelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:   return "DEBUG";
        case LogLevel::Info:    return "INFO";
        case LogLevel::Warning: return "WARNING";
        case LogLevel::Error:   return "ERROR";
    }
    return "INFO";
}

void appendLine(const std::string& path, const std::string& line) {
    if (path.empty()) {
        return;
    }
    fs::path parent = fs::path(path).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
    }
    std::ofstream log(path, std::ios::app);
    if (log.is_open()) {
        log << line << '\n';
        log.flush();
    } else {
        std::cerr << "Error: Cannot write to log file: " << path << std::endl;
    }
}

} // namespace

LogLevel parseLogLevel(const std::string& name) {
    if (name == "debug") return LogLevel::Debug;
    if (name == "warning" || name == "warn") return LogLevel::Warning;
    if (name == "error") return LogLevel::Error;
    return LogLevel::Info;
}

BackupLog::BackupLog(const std::string& logFile, const std::string& errorLogFile,
                     LogLevel level, bool echo)
    : logPath(logFile), errorLogPath(errorLogFile), minLevel(level), echo(echo) {}

void BackupLog::logDebug(const std::string& message) const {
    write(LogLevel::Debug, message);
}

void BackupLog::logMessage(const std::string& message) const {
    write(LogLevel::Info, message);
}

void BackupLog::logWarning(const std::string& message) const {
    write(LogLevel::Warning, message);
}

void BackupLog::logError(const std::string& message) const {
    write(LogLevel::Error, message);
}

void BackupLog::write(LogLevel level, const std::string& message) const {
    if (level < minLevel) {
        return;
    }

    auto now = std::chrono::system_clock::now();
    auto timeT = std::chrono::system_clock::to_time_t(now);
    std::tm tmNow{};
    localtime_r(&timeT, &tmNow);
    char timeBuf[32];
    std::strftime(timeBuf, sizeof(timeBuf), "%Y-%m-%d %H:%M:%S", &tmNow);
    std::string logEntry = std::string("[") + timeBuf + "] " + levelName(level) + ": " + message;

    std::lock_guard<std::mutex> lock(mutex);
    if (echo) {
        if (level >= LogLevel::Warning) {
            std::cerr << logEntry << std::endl;
        } else {
            std::cout << logEntry << std::endl;
        }
    }
    appendLine(logPath, logEntry);
    if (level >= LogLevel::Warning) {
        appendLine(errorLogPath, logEntry);
    }
}
