#include "backup_metadata.hpp"
#include <fstream>
#include <ctime>
#include <cstdio>
#include <memory>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace {

Json::Value toJsonArray(const std::vector<std::string>& values) {
    Json::Value array(Json::arrayValue);
    for (const auto& value : values) {
        array.append(value);
    }
    return array;
}

std::vector<std::string> fromJsonArray(const Json::Value& array) {
    std::vector<std::string> values;
    if (array.isArray()) {
        for (const auto& item : array) {
            if (item.isString()) {
                values.push_back(item.asString());
            }
        }
    }
    return values;
}

std::optional<std::chrono::system_clock::time_point> parseTimestamp(const std::string& text) {
    std::tm tmUtc{};
    const char* rest = strptime(text.c_str(), "%Y-%m-%dT%H:%M:%S", &tmUtc);
    if (!rest) {
        return std::nullopt;
    }
    auto point = std::chrono::system_clock::from_time_t(timegm(&tmUtc));
    int millis = 0;
    if (*rest == '.' && std::sscanf(rest + 1, "%3d", &millis) == 1) {
        point += std::chrono::milliseconds(millis);
    }
    return point;
}

} // namespace

std::string getSidecarPath(const std::string& artifactPath) {
    return artifactPath + ".meta.json";
}

std::string formatTimestamp(std::chrono::system_clock::time_point timestamp) {
    auto timeT = std::chrono::system_clock::to_time_t(timestamp);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch()).count() % 1000;
    if (millis < 0) {
        millis += 1000;
    }
    std::tm tmUtc{};
    gmtime_r(&timeT, &tmUtc);
    char buf[40];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tmUtc);
    char full[48];
    std::snprintf(full, sizeof(full), "%s.%03dZ", buf, static_cast<int>(millis));
    return full;
}

Json::Value toJson(const BackupMetadata& metadata) {
    Json::Value json(Json::objectValue);
    json["timestamp"] = formatTimestamp(metadata.timestamp);
    json["type"] = toString(metadata.type);
    json["version"] = metadata.version;
    json["backupPath"] = metadata.backupPath;
    json["checksum"] = metadata.checksum;

    if (const auto* db = std::get_if<DatabaseDetails>(&metadata.details)) {
        json["tables"] = toJsonArray(db->tables);
        Json::Value counts(Json::objectValue);
        for (const auto& [table, count] : db->recordCounts) {
            counts[table] = Json::Int64(count);
        }
        json["recordCounts"] = counts;
    } else if (const auto* files = std::get_if<FilesDetails>(&metadata.details)) {
        json["directories"] = toJsonArray(files->directories);
        json["exclusions"] = toJsonArray(files->exclusions);
        json["fileCount"] = Json::UInt64(files->fileCount);
        json["totalSize"] = Json::UInt64(files->totalSize);
        json["skippedFiles"] = toJsonArray(files->skippedFiles);
    }
    return json;
}

std::expected<BackupMetadata, std::string> metadataFromJson(const Json::Value& json) {
    if (!json.isObject()) {
        return std::unexpected("sidecar is not a JSON object");
    }
    auto type = parseBackupType(json.get("type", "").asString());
    if (!type) {
        return std::unexpected("sidecar has unknown type '" + json.get("type", "").asString() + "'");
    }
    if (!json["checksum"].isString()) {
        return std::unexpected("sidecar has no checksum");
    }

    BackupMetadata metadata;
    metadata.type = *type;
    metadata.version = json.get("version", "1.0").asString();
    metadata.backupPath = json.get("backupPath", "").asString();
    metadata.checksum = json["checksum"].asString();
    auto timestamp = parseTimestamp(json.get("timestamp", "").asString());
    if (!timestamp) {
        return std::unexpected("sidecar has malformed timestamp");
    }
    metadata.timestamp = *timestamp;

    if (*type == BackupType::Database) {
        DatabaseDetails db;
        db.tables = fromJsonArray(json["tables"]);
        const Json::Value& counts = json["recordCounts"];
        if (counts.isObject()) {
            for (const auto& table : counts.getMemberNames()) {
                db.recordCounts[table] = counts[table].asInt64();
            }
        }
        metadata.details = db;
    } else {
        FilesDetails files;
        files.directories = fromJsonArray(json["directories"]);
        files.exclusions = fromJsonArray(json["exclusions"]);
        files.fileCount = json.get("fileCount", 0).asUInt64();
        files.totalSize = json.get("totalSize", 0).asUInt64();
        files.skippedFiles = fromJsonArray(json["skippedFiles"]);
        metadata.details = files;
    }
    return metadata;
}

std::expected<void, BackupError> writeSidecar(const BackupMetadata& metadata) {
    std::string sidecarPath = getSidecarPath(metadata.backupPath);
    std::string tempPath = sidecarPath + ".tmp";
    {
        std::ofstream out(tempPath, std::ios::trunc);
        if (!out.is_open()) {
            return std::unexpected(makeError(BackupErrorCode::IOFailure, "Failed to open sidecar for writing: " + tempPath));
        }
        Json::StreamWriterBuilder builder;
        builder["indentation"] = "  ";
        std::unique_ptr<Json::StreamWriter> writer(builder.newStreamWriter());
        writer->write(toJson(metadata), &out);
        out << '\n';
        out.flush();
        if (!out) {
            out.close();
            std::error_code ec;
            fs::remove(tempPath, ec);
            return std::unexpected(makeError(BackupErrorCode::IOFailure, "Failed to write sidecar: " + sidecarPath));
        }
    }
    std::error_code ec;
    fs::rename(tempPath, sidecarPath, ec);
    if (ec) {
        fs::remove(tempPath, ec);
        return std::unexpected(makeError(BackupErrorCode::IOFailure, "Failed to move sidecar into place: " + sidecarPath));
    }
    return {};
}

std::expected<BackupMetadata, BackupError> readSidecar(const std::string& artifactPath) {
    std::string sidecarPath = getSidecarPath(artifactPath);
    std::ifstream file(sidecarPath);
    if (!file.is_open()) {
        return std::unexpected(makeError(BackupErrorCode::NotFound, "Sidecar not found: " + sidecarPath));
    }
    Json::Value json;
    Json::CharReaderBuilder builder;
    std::string errors;
    if (!Json::parseFromStream(builder, file, &json, &errors)) {
        return std::unexpected(makeError(BackupErrorCode::ChecksumMismatch, "Malformed sidecar " + sidecarPath + ": " + errors));
    }
    auto metadata = metadataFromJson(json);
    if (!metadata) {
        return std::unexpected(makeError(BackupErrorCode::ChecksumMismatch, "Malformed sidecar " + sidecarPath + ": " + metadata.error()));
    }
    return *metadata;
}
