#include "backup_config.hpp"
#include "backup_error.hpp"
#include "cron_schedule.hpp"
#include <fstream>
#include <sstream>
#include <iomanip>
#include <cstdlib>
#include <ctime>
#include <cmath>
#include <filesystem>
#include <system_error>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

bool readBool(const Json::Value& obj, const char* key, bool fallback) {
    if (!obj.isMember(key)) {
        return fallback;
    }
    if (!obj[key].isBool()) {
        throw ConfigError(std::string("'") + key + "' must be a boolean");
    }
    return obj[key].asBool();
}

int readInt(const Json::Value& obj, const char* key, int fallback) {
    if (!obj.isMember(key)) {
        return fallback;
    }
    if (!obj[key].isInt()) {
        throw ConfigError(std::string("'") + key + "' must be an integer");
    }
    return obj[key].asInt();
}

std::string readString(const Json::Value& obj, const char* key, const std::string& fallback) {
    if (!obj.isMember(key)) {
        return fallback;
    }
    if (!obj[key].isString()) {
        throw ConfigError(std::string("'") + key + "' must be a string");
    }
    return obj[key].asString();
}

std::vector<std::string> readStringList(const Json::Value& obj, const char* key, const std::vector<std::string>& fallback) {
    if (!obj.isMember(key)) {
        return fallback;
    }
    if (!obj[key].isArray()) {
        throw ConfigError(std::string("'") + key + "' must be an array of strings");
    }
    std::vector<std::string> values;
    for (const auto& item : obj[key]) {
        if (!item.isString()) {
            throw ConfigError(std::string("'") + key + "' must be an array of strings");
        }
        values.push_back(item.asString());
    }
    return values;
}

RetentionPolicy readRetention(const Json::Value& obj, const RetentionPolicy& fallback) {
    RetentionPolicy retention = fallback;
    retention.daily = readInt(obj, "daily", fallback.daily);
    retention.weekly = readInt(obj, "weekly", fallback.weekly);
    retention.monthly = readInt(obj, "monthly", fallback.monthly);
    return retention;
}

void validateCadence(const std::string& label, const std::string& expression) {
    auto parsed = CronSchedule::parse(expression);
    if (!parsed) {
        throw ConfigError("Invalid " + label + " backup schedule: " + parsed.error());
    }
}

void validateRetention(const std::string& label, const RetentionPolicy& retention) {
    if (retention.daily < 1) {
        throw ConfigError(label + " daily retention must be at least 1");
    }
    if (retention.weekly < 0 || retention.monthly < 0) {
        throw ConfigError(label + " weekly/monthly retention must not be negative");
    }
}

const Json::Value& section(const Json::Value& json, const char* key) {
    const Json::Value& value = json[key];
    if (!value.isNull() && !value.isObject()) {
        throw ConfigError(std::string("'") + key + "' must be a JSON object");
    }
    return value;
}

const char* env(const char* name) {
    const char* value = std::getenv(name);
    return (value && *value) ? value : nullptr;
}

} // namespace

std::string toString(BackupType type) {
    return type == BackupType::Database ? "database" : "files";
}

std::optional<BackupType> parseBackupType(const std::string& name) {
    if (name == "database") return BackupType::Database;
    if (name == "files") return BackupType::Files;
    return std::nullopt;
}

BackupConfig::BackupConfig(const std::string& configFile) {
    std::ifstream file(configFile);
    if (!file.is_open()) {
        throw ConfigError("Failed to open config file: " + configFile);
    }
    Json::Value configJson;
    Json::CharReaderBuilder builder;
    std::string errors;
    if (!Json::parseFromStream(builder, file, &configJson, &errors)) {
        throw ConfigError("Failed to parse config file: " + configFile + " (" + errors + ")");
    }

    *this = fromJson(configJson);
    applyEnvironment();
    validate();
}

BackupConfig BackupConfig::fromJson(const Json::Value& json) {
    if (!json.isObject()) {
        throw ConfigError("configuration root must be a JSON object");
    }
    BackupConfig config;

    const Json::Value& db = section(json, "database");
    if (!db.isNull()) {
        config.database.enabled = readBool(db, "enabled", config.database.enabled);
        config.database.schedule = readString(db, "schedule", config.database.schedule);
        config.database.compression = readBool(db, "compression", config.database.compression);
        config.database.path = readString(db, "path", config.database.path);
        if (db.isMember("retention")) {
            config.database.retention = readRetention(section(db, "retention"), config.database.retention);
        }
    }

    const Json::Value& files = section(json, "files");
    if (!files.isNull()) {
        config.files.enabled = readBool(files, "enabled", config.files.enabled);
        config.files.schedule = readString(files, "schedule", config.files.schedule);
        config.files.directories = readStringList(files, "directories", config.files.directories);
        config.files.exclusions = readStringList(files, "exclusions", config.files.exclusions);
        config.files.compression = readBool(files, "compression", config.files.compression);
        config.files.root = readString(files, "root", config.files.root);
        if (files.isMember("retention")) {
            config.files.retention = readRetention(section(files, "retention"), config.database.retention);
        }
    }

    const Json::Value& storage = section(json, "storage");
    if (!storage.isNull() && storage.isMember("local")) {
        config.storage.localPath = readString(section(storage, "local"), "path", config.storage.localPath);
    }

    const Json::Value& notifications = section(json, "notifications");
    if (!notifications.isNull()) {
        config.notifications.enabled = readBool(notifications, "enabled", config.notifications.enabled);
        config.notifications.onSuccess = readBool(notifications, "onSuccess", config.notifications.onSuccess);
        config.notifications.onFailure = readBool(notifications, "onFailure", config.notifications.onFailure);
        if (notifications.isMember("email")) {
            config.notifications.email = readString(notifications, "email", "");
        }
        if (notifications.isMember("webhook")) {
            config.notifications.webhook = readString(notifications, "webhook", "");
        }
    }

    const Json::Value& logging = section(json, "logging");
    if (!logging.isNull()) {
        config.logging.logFile = readString(logging, "file", config.logging.logFile);
        config.logging.errorLogFile = readString(logging, "errorFile", config.logging.errorLogFile);
        config.logging.level = readString(logging, "level", config.logging.level);
    }

    return config;
}

void BackupConfig::applyEnvironment() {
    if (const char* value = env("BACKUP_ENABLED"); value && std::string(value) == "false") {
        database.enabled = false;
        files.enabled = false;
    }
    if (const char* value = env("BACKUP_DATABASE_SCHEDULE")) {
        database.schedule = value;
    }
    if (const char* value = env("BACKUP_FILES_SCHEDULE")) {
        files.schedule = value;
    }
    if (const char* value = env("BACKUP_RETENTION_DAILY")) {
        try {
            database.retention.daily = std::stoi(value);
        } catch (const std::exception&) {
            throw ConfigError(std::string("BACKUP_RETENTION_DAILY is not a number: ") + value);
        }
    }
    if (const char* value = env("BACKUP_LOCAL_PATH")) {
        storage.localPath = value;
    }
    if (const char* value = env("BACKUP_NOTIFICATION_EMAIL")) {
        notifications.email = value;
        notifications.enabled = true;
    }
    if (const char* value = env("DATABASE_URL")) {
        std::string url = value;
        if (url.rfind("file:", 0) == 0) {
            url = url.substr(5);
        }
        database.path = url;
    }
}

void BackupConfig::validate() const {
    if (database.enabled) {
        validateCadence("database", database.schedule);
    }
    if (files.enabled) {
        validateCadence("files", files.schedule);
    }
    validateRetention("Database", database.retention);
    if (files.retention) {
        validateRetention("Files", *files.retention);
    }

    if (storage.localPath.empty()) {
        throw ConfigError("storage.local.path must not be empty");
    }
    std::error_code ec;
    fs::create_directories(storage.localPath, ec);
    if (ec || !fs::is_directory(storage.localPath)) {
        throw ConfigError("Cannot create backup directory: " + storage.localPath +
                          (ec ? " (" + ec.message() + ")" : ""));
    }
    fs::path probe = fs::path(storage.localPath) / (".write_probe_" + std::to_string(::getpid()));
    {
        std::ofstream out(probe);
        if (!out.is_open()) {
            throw ConfigError("Backup directory is not writable: " + storage.localPath);
        }
    }
    fs::remove(probe, ec);
}

RetentionPolicy BackupConfig::retentionFor(BackupType type) const {
    if (type == BackupType::Files && files.retention) {
        return *files.retention;
    }
    return database.retention;
}

std::string BackupConfig::filesRoot() const {
    if (!files.root.empty()) {
        return files.root;
    }
    return fs::current_path().string();
}

std::string BackupConfig::logFile() const {
    if (!logging.logFile.empty()) {
        return logging.logFile;
    }
    return (fs::path(storage.localPath) / "backup.log").string();
}

std::string BackupConfig::errorLogFile() const {
    if (!logging.errorLogFile.empty()) {
        return logging.errorLogFile;
    }
    return (fs::path(storage.localPath) / "errors.log").string();
}

std::string getBackupFileName(BackupType type, std::chrono::system_clock::time_point timestamp) {
    auto timeT = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tmLocal{};
    localtime_r(&timeT, &tmLocal);
    char timestampBuf[32];
    std::strftime(timestampBuf, sizeof(timestampBuf), "%Y-%m-%d_%H-%M-%S", &tmLocal);
    return toString(type) + "_backup_" + timestampBuf;
}

std::string getBackupExtension(BackupType type, bool compression) {
    if (type == BackupType::Database) {
        return compression ? ".db.zip" : ".db";
    }
    return ".zip";
}

std::string getBackupFilePath(const BackupConfig& config, const std::string& fileName, const std::string& extension) {
    fs::path base(config.storage.localPath);
    fs::path candidate = base / (fileName + extension);
    for (int suffix = 2; fs::exists(candidate); ++suffix) {
        candidate = base / (fileName + "_" + std::to_string(suffix) + extension);
    }
    return candidate.string();
}

std::string formatBackupSize(std::uintmax_t bytes) {
    static const char* sizes[] = {"Bytes", "KB", "MB", "GB", "TB"};
    if (bytes == 0) {
        return "0 Bytes";
    }
    int i = static_cast<int>(std::floor(std::log(static_cast<double>(bytes)) / std::log(1024.0)));
    if (i > 4) i = 4;
    double size = static_cast<double>(bytes) / std::pow(1024.0, i);
    std::ostringstream ss;
    ss << std::round(size * 100) / 100 << ' ' << sizes[i];
    return ss.str();
}
