#include "test_helpers.hpp"
#include "file_backup.hpp"
#include "archive_io.hpp"
#include "backup_metadata.hpp"
#include <algorithm>
#include <sstream>

class FileBackupTest : public TempDirTest {
protected:
    std::vector<std::string> entryNames(const std::string& archivePath) {
        std::vector<std::string> names;
        auto entries = scanArchive(archivePath);
        EXPECT_TRUE(entries.has_value());
        if (entries) {
            for (const auto& entry : *entries) {
                if (!entry.directory) {
                    names.push_back(entry.path);
                }
            }
        }
        std::sort(names.begin(), names.end());
        return names;
    }

    OperationLocks locks;
};

TEST_F(FileBackupTest, ExcludedFilesNeverReachTheArchive) {
    config.files.directories = {"uploads"};
    config.files.exclusions = {"*.tmp"};
    writeFile(app("uploads/a.png"), "png bytes");
    writeFile(app("uploads/b.tmp"), "scratch");

    auto log = quietLog();
    FilesBackupService service(config, log, locks);
    auto result = service.createBackup();
    ASSERT_TRUE(result.has_value()) << result.error().describe();

    EXPECT_TRUE(result->backupPath.ends_with(".zip"));
    EXPECT_TRUE(fs::path(result->backupPath).filename().string().starts_with("files_backup_"));
    EXPECT_EQ(entryNames(result->backupPath), std::vector<std::string>{"uploads/a.png"});
    EXPECT_EQ(result->fileCount, 1u);

    auto sidecar = readSidecar(result->backupPath);
    ASSERT_TRUE(sidecar.has_value());
    const auto& details = std::get<FilesDetails>(sidecar->details);
    EXPECT_EQ(details.directories, std::vector<std::string>{"uploads"});
    EXPECT_EQ(details.exclusions, std::vector<std::string>{"*.tmp"});
    EXPECT_EQ(details.fileCount, 1u);
    EXPECT_EQ(details.totalSize, 9u);
    EXPECT_TRUE(details.skippedFiles.empty());
}

TEST_F(FileBackupTest, CollectSkipsHiddenAndExcludedTrees) {
    config.files.directories = {"uploads", "config"};
    config.files.exclusions = {"node_modules", ".git", "*.log"};
    writeFile(app("uploads/photo.jpg"), "1");
    writeFile(app("uploads/nested/deep/doc.pdf"), "2");
    writeFile(app("uploads/node_modules/pkg/index.js"), "3");
    writeFile(app("uploads/.git/HEAD"), "4");
    writeFile(app("uploads/.env"), "5");
    writeFile(app("uploads/.cache/blob"), "6");
    writeFile(app("config/app.json"), "7");
    writeFile(app("config/debug.log"), "8");

    auto log = quietLog();
    auto files = collectFiles(config, log);

    std::vector<std::string> expected = {
        app("config/app.json").lexically_normal().string(),
        app("uploads/nested/deep/doc.pdf").lexically_normal().string(),
        app("uploads/photo.jpg").lexically_normal().string(),
    };
    std::sort(expected.begin(), expected.end());
    EXPECT_EQ(files, expected);
}

TEST_F(FileBackupTest, CollectDeduplicatesOverlappingDirectories) {
    config.files.directories = {"uploads", "uploads/nested", "missing"};
    config.files.exclusions = {};
    writeFile(app("uploads/one.txt"), "1");
    writeFile(app("uploads/nested/two.txt"), "2");

    auto log = quietLog();
    auto files = collectFiles(config, log);
    ASSERT_EQ(files.size(), 2u);
    EXPECT_TRUE(std::is_sorted(files.begin(), files.end()));
}

TEST_F(FileBackupTest, ExclusionGlobsMatchNameComponentOrPath) {
    std::vector<std::string> exclusions = {"*.log", "node_modules", "cache/*.bin"};
    EXPECT_TRUE(isExcluded("server.log", exclusions));
    EXPECT_TRUE(isExcluded("2025/01/server.log", exclusions));
    EXPECT_TRUE(isExcluded("node_modules/pkg/index.js", exclusions));
    EXPECT_TRUE(isExcluded("web/node_modules", exclusions));
    EXPECT_TRUE(isExcluded("cache/blob.bin", exclusions));
    EXPECT_FALSE(isExcluded("logbook.txt", exclusions));
    EXPECT_FALSE(isExcluded("images/photo.png", exclusions));
    EXPECT_FALSE(isExcluded("anything", {}));
}

TEST_F(FileBackupTest, MissingDirectoryIsSkipped) {
    config.files.directories = {"uploads", "does-not-exist"};
    writeFile(app("uploads/a.txt"), "a");

    auto log = quietLog();
    FilesBackupService service(config, log, locks);
    auto result = service.createBackup();
    ASSERT_TRUE(result.has_value()) << result.error().describe();
    EXPECT_EQ(entryNames(result->backupPath), std::vector<std::string>{"uploads/a.txt"});
}

TEST_F(FileBackupTest, VanishedFileIsSkippedNotFatal) {
    std::vector<std::string> files;
    for (int i = 0; i < 100; ++i) {
        fs::path path = app("uploads/file_" + std::to_string(100 + i) + ".txt");
        writeFile(path, "content " + std::to_string(i));
        files.push_back(path.string());
    }
    fs::remove(files[42]);

    auto log = quietLog();
    ZipFileBackupStrategy strategy(app().string(), true, log);
    std::string output = (root / "backups" / "files_backup_test.zip").string();
    auto stats = strategy.execute(files, output, nullptr);
    ASSERT_TRUE(stats.has_value()) << stats.error().describe();

    EXPECT_EQ(stats->fileCount, 99u);
    ASSERT_EQ(stats->skippedFiles.size(), 1u);
    EXPECT_EQ(stats->skippedFiles[0], files[42]);
    EXPECT_EQ(entryNames(output).size(), 99u);
}

class TruncatingZipStrategy : public ZipFileBackupStrategy {
public:
    TruncatingZipStrategy(const std::string& root, const BackupLog& log, std::string shortFile)
        : ZipFileBackupStrategy(root, true, log), shortFile(std::move(shortFile)) {}

protected:
    std::unique_ptr<std::istream> openSource(const std::string& path) const override {
        if (path == shortFile) {
            return std::make_unique<std::istringstream>("only part");
        }
        return ZipFileBackupStrategy::openSource(path);
    }

private:
    std::string shortFile;
};

TEST_F(FileBackupTest, FileShrinkingMidReadFailsTheArchive) {
    writeFile(app("uploads/a.txt"), "steady content");
    writeFile(app("uploads/b.txt"), "this file is much longer than what the reader will deliver");
    auto log = quietLog();
    TruncatingZipStrategy strategy(app().string(), log, app("uploads/b.txt").string());
    std::string output = (root / "backups" / "files_backup_short.zip").string();

    auto stats = strategy.execute({app("uploads/a.txt").string(), app("uploads/b.txt").string()}, output, nullptr);
    ASSERT_FALSE(stats.has_value());
    EXPECT_EQ(stats.error().code, BackupErrorCode::IOFailure);
    EXPECT_NE(stats.error().message.find("b.txt"), std::string::npos);
    EXPECT_FALSE(fs::exists(output));
}

TEST_F(FileBackupTest, StoredArchiveKeepsContent) {
    writeFile(app("uploads/a.txt"), "hello world");
    auto log = quietLog();
    ZipFileBackupStrategy strategy(app().string(), false, log);
    std::string output = (root / "backups" / "stored.zip").string();

    auto stats = strategy.execute({app("uploads/a.txt").string()}, output, nullptr);
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->totalSize, 11u);

    auto extracted = extractFirstEntry(output, (root / "out.txt").string());
    ASSERT_TRUE(extracted.has_value());
    EXPECT_EQ(*extracted, "uploads/a.txt");
    EXPECT_EQ(readFile(root / "out.txt"), "hello world");
}

TEST_F(FileBackupTest, CancellationRemovesPartialArchive) {
    config.files.directories = {"uploads"};
    writeFile(app("uploads/a.txt"), "a");
    writeFile(app("uploads/b.txt"), "b");

    auto log = quietLog();
    FilesBackupService service(config, log, locks);
    std::atomic<bool> cancel{true};
    auto result = service.createBackup(&cancel);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, BackupErrorCode::Cancelled);
    EXPECT_TRUE(artifactsIn(config.storage.localPath).empty());
}

TEST_F(FileBackupTest, UnwritableStorageIsIOFailure) {
    config.files.directories = {"uploads"};
    writeFile(app("uploads/a.txt"), "a");
    config.storage.localPath = (root / "backups" / "missing" / "deeper").string();
    writeFile(root / "backups" / "missing", "blocks the directory");

    auto log = quietLog();
    FilesBackupService service(config, log, locks);
    auto result = service.createBackup();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, BackupErrorCode::IOFailure);
}

TEST_F(FileBackupTest, RefusedWhileFilesLockIsHeld) {
    auto log = quietLog();
    FilesBackupService service(config, log, locks);
    auto restoreGuard = locks.tryAcquire(BackupType::Files, OperationKind::Restore, "files restore");
    ASSERT_TRUE(restoreGuard.has_value());

    auto result = service.createBackup();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, BackupErrorCode::RestoreConflict);
}
