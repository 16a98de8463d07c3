#include "backup_engine.hpp"
#include <iostream>
#include <iomanip>
#include <sstream>
#include <thread>
#include <csignal>
#include <ctime>

volatile std::sig_atomic_t gShutdownFlag = 0;

void signalHandler(int /*sig*/) {
    gShutdownFlag = 1;
}

namespace {

void installSignalHandlers() {
    struct sigaction sa;
    sa.sa_handler = signalHandler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

std::string formatLocal(std::chrono::system_clock::time_point timePoint) {
    std::time_t t = std::chrono::system_clock::to_time_t(timePoint);
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " [--config <path>] [--daemon] <command> [args]\n"
              << "Commands:\n"
              << "  database                     Create a database backup\n"
              << "  files                        Create a files backup\n"
              << "  list [database|files]        List stored backups\n"
              << "  verify <path> <type>         Verify a backup\n"
              << "  restore-db <path>            Restore the database from a backup\n"
              << "  restore-files <path> [dir]   Restore files from a backup\n"
              << "  cleanup [database|files]     Delete backups past retention\n"
              << "  status                       Show scheduled jobs\n"
              << "  trigger <job>                Run a scheduled job now" << std::endl;
}

int fail(const BackupError& error) {
    std::cerr << "Error: " << error.describe() << std::endl;
    return 1;
}

std::optional<BackupType> typeArgument(const std::vector<std::string>& args, size_t index, bool& valid) {
    valid = true;
    if (index >= args.size()) {
        return std::nullopt;
    }
    auto type = parseBackupType(args[index]);
    valid = type.has_value();
    return type;
}

int runDaemon(BackupEngine& engine) {
    installSignalHandlers();
    auto started = engine.startScheduler();
    if (!started) {
        return fail(started.error());
    }
    std::cout << "Daemon mode started. Check " << engine.log().logFile() << " for logs." << std::endl;
    while (!gShutdownFlag) {
        std::this_thread::sleep_for(std::chrono::milliseconds(500));
    }
    engine.log().logMessage("Daemon shutting down gracefully");
    engine.shutdown();
    return 0;
}

int runCommand(BackupEngine& engine, const std::vector<std::string>& args) {
    const std::string& command = args[0];

    if (command == "database") {
        auto result = engine.createDatabaseBackup();
        if (!result) {
            return fail(result.error());
        }
        std::cout << "Database backup created: " << result->backupPath << " (" << formatBackupSize(result->size) << ")" << std::endl;
        return 0;
    }

    if (command == "files") {
        auto result = engine.createFilesBackup();
        if (!result) {
            return fail(result.error());
        }
        std::cout << "Files backup created: " << result->backupPath << " (" << result->fileCount << " files, "
                  << formatBackupSize(result->size) << ")" << std::endl;
        return 0;
    }

    if (command == "list") {
        bool valid;
        auto type = typeArgument(args, 1, valid);
        if (!valid) {
            std::cerr << "Error: Unknown backup type: " << args[1] << std::endl;
            return 1;
        }
        auto entries = engine.listBackups(type);
        if (entries.empty()) {
            std::cout << "No backups found in " << engine.config().storage.localPath << std::endl;
        }
        for (const auto& entry : entries) {
            std::cout << formatLocal(entry.modified) << "  " << std::setw(10) << formatBackupSize(entry.size) << "  "
                      << std::setw(8) << toString(entry.type) << "  " << entry.path
                      << (entry.metadata ? "" : "  (no metadata)") << std::endl;
        }
        return 0;
    }

    if (command == "verify") {
        if (args.size() < 3) {
            std::cerr << "Error: verify requires <path> <type>" << std::endl;
            return 1;
        }
        auto type = parseBackupType(args[2]);
        if (!type) {
            std::cerr << "Error: Unknown backup type: " << args[2] << std::endl;
            return 1;
        }
        auto result = engine.verifyBackup(args[1], *type);
        if (!result.valid) {
            return fail(result.error.value_or(makeError(BackupErrorCode::CorruptArchive, "Verification failed")));
        }
        std::cout << "Backup is valid (" << result.fileCount << " file(s), checksum "
                  << (result.checksumMatch ? "verified" : "not recorded") << ")" << std::endl;
        return 0;
    }

    if (command == "restore-db") {
        if (args.size() < 2) {
            std::cerr << "Error: restore-db requires <path>" << std::endl;
            return 1;
        }
        auto result = engine.restoreDatabase(args[1]);
        if (!result) {
            return fail(result.error());
        }
        std::cout << "Database restored. Restart the application to reopen the database." << std::endl;
        return 0;
    }

    if (command == "restore-files") {
        if (args.size() < 2) {
            std::cerr << "Error: restore-files requires <path>" << std::endl;
            return 1;
        }
        std::optional<std::string> target;
        if (args.size() > 2) {
            target = args[2];
        }
        auto result = engine.restoreFiles(args[1], target);
        if (!result) {
            return fail(result.error());
        }
        std::cout << "Restored " << result->extractedFileCount << " file(s)";
        if (!result->skippedEntries.empty()) {
            std::cout << ", skipped " << result->skippedEntries.size();
        }
        std::cout << std::endl;
        return 0;
    }

    if (command == "cleanup") {
        bool valid;
        auto type = typeArgument(args, 1, valid);
        if (!valid) {
            std::cerr << "Error: Unknown backup type: " << args[1] << std::endl;
            return 1;
        }
        auto result = engine.cleanup(type);
        std::cout << "Deleted " << result.deletedCount << " old backup(s)" << std::endl;
        for (const auto& error : result.errors) {
            std::cerr << "Error: " << error << std::endl;
        }
        return result.errors.empty() ? 0 : 1;
    }

    if (command == "status" || command == "trigger") {
        auto started = engine.startScheduler();
        if (!started) {
            return fail(started.error());
        }
        if (command == "trigger") {
            if (args.size() < 2) {
                std::cerr << "Error: trigger requires <job>" << std::endl;
                return 1;
            }
            auto result = engine.triggerJob(args[1]);
            if (result.outcome != JobOutcome::Completed) {
                return fail(*result.error);
            }
            std::cout << result.summary << std::endl;
            return 0;
        }
        for (const auto& status : engine.getSchedulerStatus()) {
            std::cout << std::left << std::setw(18) << status.name << std::setw(14) << status.schedule
                      << std::setw(9) << toString(status.status)
                      << "next: " << (status.nextRun ? formatLocal(*status.nextRun) : std::string("-")) << std::endl;
        }
        std::cout << "Health: " << engine.health().status << std::endl;
        return 0;
    }

    std::cerr << "Error: Unknown command: " << command << std::endl;
    return 1;
}

} // namespace

int main(int argc, char* argv[]) {
    bool daemonMode = false;
    std::string configFile = "backup_config.json";
    std::vector<std::string> args;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--daemon") {
            daemonMode = true;
        } else if (arg == "--config" && i + 1 < argc) {
            configFile = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else {
            args.push_back(arg);
        }
    }

    if (!daemonMode && args.empty()) {
        printUsage(argv[0]);
        return 1;
    }

    std::optional<BackupConfig> config;
    try {
        config.emplace(configFile);
    } catch (const ConfigError& e) {
        std::cerr << "Error: Failed to load config: " << e.what() << std::endl;
        return 1;
    }

    BackupEngine engine(*config);
    if (daemonMode) {
        return runDaemon(engine);
    }
    return runCommand(engine, args);
}
