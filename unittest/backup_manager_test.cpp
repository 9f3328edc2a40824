#include <gtest/gtest.h>
#include <iterator>
#include "backup_manager.hpp"
#include "test_support.hpp"

class BackupManagerTest : public ::testing::Test {
protected:
    BackupManagerTest() : backups_((tmp_.path() / "backups").string()) {}

    Operation operation(const std::string& remotePath) const {
        Operation op;
        op.mappingName = "raid";
        op.localName = "BBP_Raid_on.json";
        op.remotePath = remotePath;
        op.backup = true;
        return op;
    }

    TempDir tmp_;
    BackupManager backups_;
    FakeRemote remote_;
    FakeSession session_{remote_};
};

TEST_F(BackupManagerTest, ExistingRemoteFileIsCopiedByteForByte) {
    const std::string original = std::string("{\"raid\":false}\r\n") + '\0' + "\xff tail";
    remote_.files["/srv/config/BBP_Settings.json"] = original;

    auto outcome = backups_.backup(session_, "Main", "raid_on", "20261019_101500",
                                   operation("config/BBP_Settings.json"), "/srv/config/BBP_Settings.json");

    ASSERT_EQ(outcome.status, BackupStatus::BackedUp);
    fs::path expected = tmp_.path() / "backups" / "Main" / "raid_on" / "20261019_101500" / "config" / "BBP_Settings.json";
    EXPECT_EQ(fs::path(outcome.path), expected);
    EXPECT_EQ(readFile(expected), original);
}

TEST_F(BackupManagerTest, MissingRemoteFileCreatesNoBackup) {
    auto outcome = backups_.backup(session_, "Main", "raid_on", "20261019_101500",
                                   operation("config/new.json"), "/srv/config/new.json");

    EXPECT_EQ(outcome.status, BackupStatus::SkippedNoRemoteFile);
    EXPECT_TRUE(outcome.path.empty());
    EXPECT_FALSE(fs::exists(backups_.backupPath("Main", "raid_on", "20261019_101500", "config/new.json")));
}

TEST_F(BackupManagerTest, DownloadFailureIsReported) {
    remote_.files["/srv/types.xml"] = "<types/>";
    remote_.failDownload.insert("/srv/types.xml");

    auto outcome = backups_.backup(session_, "Main", "raid_on", "20261019_101500", operation("types.xml"), "/srv/types.xml");

    EXPECT_EQ(outcome.status, BackupStatus::Failed);
    EXPECT_EQ(outcome.reason, "connection reset by peer");
    EXPECT_FALSE(fs::exists(backups_.backupPath("Main", "raid_on", "20261019_101500", "types.xml")));
}

TEST_F(BackupManagerTest, BackupIsWrittenOncePerRun) {
    remote_.files["/srv/mode.json"] = "first";
    auto first = backups_.backup(session_, "Main", "raid_on", "20261019_101500", operation("mode.json"), "/srv/mode.json");
    ASSERT_EQ(first.status, BackupStatus::BackedUp);

    remote_.files["/srv/mode.json"] = "second";
    remote_.calls.clear();
    auto second = backups_.backup(session_, "Main", "raid_on", "20261019_101500", operation("mode.json"), "/srv/mode.json");

    EXPECT_EQ(second.status, BackupStatus::AlreadyCaptured);
    EXPECT_EQ(second.path, first.path);
    EXPECT_EQ(readFile(first.path), "first");
    EXPECT_EQ(remote_.count("download"), 0);
}

TEST_F(BackupManagerTest, PartSuffixedRemotePathsKeepTheirBackups) {
    remote_.files["/srv/cfg/a.json.part"] = "remote part file";
    remote_.files["/srv/cfg/a.json"] = "remote json file";

    auto first = backups_.backup(session_, "Main", "raid_on", "20261019_101500",
                                 operation("cfg/a.json.part"), "/srv/cfg/a.json.part");
    auto second = backups_.backup(session_, "Main", "raid_on", "20261019_101500",
                                  operation("cfg/a.json"), "/srv/cfg/a.json");

    ASSERT_EQ(first.status, BackupStatus::BackedUp);
    ASSERT_EQ(second.status, BackupStatus::BackedUp);
    EXPECT_NE(first.path, second.path);
    EXPECT_EQ(readFile(first.path), "remote part file");
    EXPECT_EQ(readFile(second.path), "remote json file");

    fs::path runDir = backups_.runDirectory("Main", "raid_on", "20261019_101500");
    int files = 0;
    for (const auto& entry : fs::recursive_directory_iterator(runDir)) {
        if (entry.is_regular_file()) ++files;
    }
    EXPECT_EQ(files, 2);
    EXPECT_EQ(std::distance(fs::directory_iterator(runDir.parent_path()), fs::directory_iterator()), 1);
}

TEST_F(BackupManagerTest, RunTimestampsNeverShareADirectory) {
    std::string first = backups_.allocateRunTimestamp("Main", "raid_on");
    ASSERT_EQ(first.size(), 15u);
    EXPECT_EQ(first[8], '_');
    fs::create_directories(backups_.runDirectory("Main", "raid_on", first));

    std::string second = backups_.allocateRunTimestamp("Main", "raid_on");
    EXPECT_NE(second, first);
    EXPECT_FALSE(fs::exists(backups_.runDirectory("Main", "raid_on", second)));
}

TEST_F(BackupManagerTest, NamesAreSanitisedIntoSingleComponents) {
    EXPECT_EQ(BackupManager::sanitizeComponent("EU #1: Main/PvP"), "EU #1_ Main_PvP");
    EXPECT_EQ(BackupManager::sanitizeComponent(".."), "_..");
    EXPECT_EQ(BackupManager::sanitizeComponent(""), "_");

    fs::path dir = backups_.runDirectory("a/b", "raid_on", "20261019_101500");
    EXPECT_EQ(dir, tmp_.path() / "backups" / "a_b" / "raid_on" / "20261019_101500");
}
