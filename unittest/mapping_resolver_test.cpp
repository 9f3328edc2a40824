#include <gtest/gtest.h>
#include "mapping_resolver.hpp"
#include "preset_catalog.hpp"
#include "test_support.hpp"

class MappingResolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        presetDir_ = tmp_.path() / "presets" / "raid_on";
        writeFile(presetDir_ / "BBP_Raid_on.json", "{\"raid\":true}");
        writeFile(presetDir_ / "types.xml", "<types/>");
        writeFile(presetDir_ / "db" / "messages.xml", "<messages/>");
        preset_ = Preset{"raid_on", presetDir_.string()};
    }

    TempDir tmp_;
    fs::path presetDir_;
    Preset preset_;
};

TEST_F(MappingResolverTest, EnabledMappingsResolveInMappingOrder) {
    std::vector<Mapping> mappings = {
        {"types", "types.xml", "mpmissions/dayzOffline.chernarusplus/db/types.xml", false, true},
        {"raid", "BBP_Raid_on.json", "config/BaseBuildingPlus/BBP_Settings.json", true, true},
    };
    auto resolution = MappingResolver::resolve(preset_, mappings);
    ASSERT_TRUE(resolution.has_value());
    ASSERT_EQ(resolution->operations.size(), 2u);
    EXPECT_TRUE(resolution->findings.empty());

    EXPECT_EQ(resolution->operations[0].mappingIndex, 0u);
    EXPECT_EQ(resolution->operations[0].remotePath, "mpmissions/dayzOffline.chernarusplus/db/types.xml");
    EXPECT_FALSE(resolution->operations[0].backup);
    EXPECT_EQ(resolution->operations[1].localPath, (presetDir_ / "BBP_Raid_on.json").string());
    EXPECT_EQ(resolution->operations[1].remotePath, "config/BaseBuildingPlus/BBP_Settings.json");
    EXPECT_TRUE(resolution->operations[1].backup);
}

TEST_F(MappingResolverTest, DisabledMappingsProduceNothing) {
    std::vector<Mapping> mappings = {
        {"off", "BBP_Raid_on.json", "a.json", true, false},
        {"missing but off", "nope.json", "b.json", true, false},
        {"on", "types.xml", "types.xml", true, true},
    };
    auto resolution = MappingResolver::resolve(preset_, mappings);
    ASSERT_TRUE(resolution.has_value());
    ASSERT_EQ(resolution->operations.size(), 1u);
    EXPECT_EQ(resolution->operations[0].mappingIndex, 2u);
    EXPECT_TRUE(resolution->findings.empty());
}

TEST_F(MappingResolverTest, CaseMismatchIsReportedMissing) {
    std::vector<Mapping> mappings = {{"raid", "bbp_raid_on.json", "config/BBP_Settings.json", true, true}};
    auto resolution = MappingResolver::resolve(preset_, mappings);
    ASSERT_TRUE(resolution.has_value());
    EXPECT_TRUE(resolution->operations.empty());
    ASSERT_EQ(resolution->findings.size(), 1u);
    EXPECT_EQ(resolution->findings[0].reason, FailureReason::MissingLocalFile);
    EXPECT_EQ(resolution->findings[0].message, "missing local file for mapping config/BBP_Settings.json");
}

TEST_F(MappingResolverTest, MissingFileDoesNotStopOtherMappings) {
    std::vector<Mapping> mappings = {
        {"typo", "BBP_Raid_on_typo.json", "config/BBP_Settings.json", true, true},
        {"types", "types.xml", "db/types.xml", true, true},
    };
    auto resolution = MappingResolver::resolve(preset_, mappings);
    ASSERT_TRUE(resolution.has_value());
    ASSERT_EQ(resolution->operations.size(), 1u);
    EXPECT_EQ(resolution->operations[0].localName, "types.xml");
    ASSERT_EQ(resolution->findings.size(), 1u);
    EXPECT_EQ(resolution->findings[0].mappingIndex, 0u);
}

TEST_F(MappingResolverTest, SameRemoteTargetIsNotDeduplicated) {
    std::vector<Mapping> mappings = {
        {"mode a", "types.xml", "config/mode.json", false, true},
        {"mode b", "BBP_Raid_on.json", "config/mode.json", false, true},
    };
    auto resolution = MappingResolver::resolve(preset_, mappings);
    ASSERT_TRUE(resolution.has_value());
    ASSERT_EQ(resolution->operations.size(), 2u);
    EXPECT_EQ(resolution->operations[0].localName, "types.xml");
    EXPECT_EQ(resolution->operations[1].localName, "BBP_Raid_on.json");
}

TEST_F(MappingResolverTest, SubfolderLocalNamesMatch) {
    std::vector<Mapping> mappings = {{"messages", "db/messages.xml", "mpmissions/x/db/messages.xml", true, true}};
    auto resolution = MappingResolver::resolve(preset_, mappings);
    ASSERT_TRUE(resolution.has_value());
    ASSERT_EQ(resolution->operations.size(), 1u);
    EXPECT_EQ(resolution->operations[0].localPath, (presetDir_ / "db" / "messages.xml").string());
}

TEST_F(MappingResolverTest, RemotePathsAreNormalised) {
    std::vector<Mapping> mappings = {{"raid", "BBP_Raid_on.json", "\\config\\BaseBuildingPlus\\BBP_Settings.json", true, true}};
    auto resolution = MappingResolver::resolve(preset_, mappings);
    ASSERT_TRUE(resolution.has_value());
    ASSERT_EQ(resolution->operations.size(), 1u);
    EXPECT_EQ(resolution->operations[0].remotePath, "config/BaseBuildingPlus/BBP_Settings.json");
}

TEST_F(MappingResolverTest, UnusableRemotePathsAreFindings) {
    std::vector<Mapping> mappings = {
        {"empty", "types.xml", "", true, true},
        {"escape", "types.xml", "../../etc/passwd", true, true},
        {"dir", "types.xml", "config/", true, true},
    };
    auto resolution = MappingResolver::resolve(preset_, mappings);
    ASSERT_TRUE(resolution.has_value());
    EXPECT_TRUE(resolution->operations.empty());
    ASSERT_EQ(resolution->findings.size(), 3u);
    for (const auto& finding : resolution->findings) {
        EXPECT_EQ(finding.reason, FailureReason::InvalidRemotePath);
    }
}

TEST_F(MappingResolverTest, ResolutionIsDeterministic) {
    std::vector<Mapping> mappings = {
        {"a", "types.xml", "a.xml", true, true},
        {"b", "missing.json", "b.json", true, true},
        {"c", "BBP_Raid_on.json", "c.json", false, true},
    };
    auto first = MappingResolver::resolve(preset_, mappings);
    auto second = MappingResolver::resolve(preset_, mappings);
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    ASSERT_EQ(first->operations.size(), second->operations.size());
    for (std::size_t i = 0; i < first->operations.size(); ++i) {
        EXPECT_EQ(first->operations[i].mappingIndex, second->operations[i].mappingIndex);
        EXPECT_EQ(first->operations[i].localPath, second->operations[i].localPath);
        EXPECT_EQ(first->operations[i].remotePath, second->operations[i].remotePath);
        EXPECT_EQ(first->operations[i].backup, second->operations[i].backup);
    }
    ASSERT_EQ(first->findings.size(), second->findings.size());
    EXPECT_EQ(first->findings[0].message, second->findings[0].message);
}

TEST_F(MappingResolverTest, ReadsCurrentFolderStateOnEveryCall) {
    std::vector<Mapping> mappings = {{"raid", "BBP_Raid_on.json", "config/BBP_Settings.json", true, true}};
    auto before = MappingResolver::resolve(preset_, mappings);
    ASSERT_TRUE(before.has_value());
    EXPECT_EQ(before->operations.size(), 1u);

    fs::rename(presetDir_ / "BBP_Raid_on.json", presetDir_ / "BBP_Raid_on_typo.json");
    auto after = MappingResolver::resolve(preset_, mappings);
    ASSERT_TRUE(after.has_value());
    EXPECT_TRUE(after->operations.empty());
    ASSERT_EQ(after->findings.size(), 1u);
    EXPECT_EQ(after->findings[0].reason, FailureReason::MissingLocalFile);
}

TEST_F(MappingResolverTest, MissingPresetFolderIsAnError) {
    Preset gone{"gone", (tmp_.path() / "presets" / "gone").string()};
    auto resolution = MappingResolver::resolve(gone, {{"a", "a.json", "a.json", true, true}});
    EXPECT_FALSE(resolution.has_value());
}

TEST(RemotePathTest, JoinsRootAndRelativePath) {
    EXPECT_EQ(remoteFullPath("/dayzstandalone", "config/BaseBuildingPlus/BBP_Settings.json"),
              "/dayzstandalone/config/BaseBuildingPlus/BBP_Settings.json");
    EXPECT_EQ(remoteFullPath("/dayzstandalone/", "/config/a.json"), "/dayzstandalone/config/a.json");
    EXPECT_EQ(remoteFullPath("/", "a.json"), "/a.json");
    EXPECT_EQ(remoteFullPath("", "Config\\A.json"), "/Config/A.json");
}

TEST(PresetCatalogTest, ListsPresetFoldersSorted) {
    TempDir tmp;
    writeFile(tmp.path() / "raid_off" / "BBP_Raid_off.json", "{}");
    writeFile(tmp.path() / "raid_on" / "BBP_Raid_on.json", "{}");
    writeFile(tmp.path() / "stray.txt", "not a preset");

    PresetCatalog catalog(tmp.path().string());
    EXPECT_EQ(catalog.list(), (std::vector<std::string>{"raid_off", "raid_on"}));

    auto preset = catalog.find("raid_on");
    ASSERT_TRUE(preset.has_value());
    EXPECT_EQ(preset->name, "raid_on");
    EXPECT_FALSE(catalog.find("RAID_ON").has_value());
    EXPECT_FALSE(catalog.find("../raid_on").has_value());
}
