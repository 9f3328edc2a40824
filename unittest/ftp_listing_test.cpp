#include <gtest/gtest.h>
#include "ftp_listing.hpp"

TEST(FtpListingTest, MlsdFileEntry) {
    auto entry = parseMlsdLine("type=file;size=1834;modify=20261019101500; BBP_Settings.json");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->name, "BBP_Settings.json");
    EXPECT_EQ(entry->size, 1834u);
    EXPECT_FALSE(entry->isDirectory);
}

TEST(FtpListingTest, MlsdKeepsSpacesInNames) {
    auto entry = parseMlsdLine("Type=dir;Modify=20261019101500; Base Building Plus");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->name, "Base Building Plus");
    EXPECT_TRUE(entry->isDirectory);
    EXPECT_EQ(entry->size, 0u);
}

TEST(FtpListingTest, MlsdSkipsCurrentAndParentDirectories) {
    EXPECT_FALSE(parseMlsdLine("type=cdir;modify=20261019101500; .").has_value());
    EXPECT_FALSE(parseMlsdLine("type=pdir;modify=20261019101500; ..").has_value());
    EXPECT_FALSE(parseMlsdLine("type=file;size=1;").has_value());
    EXPECT_FALSE(parseMlsdLine("garbage").has_value());
}

TEST(FtpListingTest, MlsdBadSizeIsZero) {
    auto entry = parseMlsdLine("type=file;size=lots; types.xml");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->size, 0u);
}

TEST(FtpListingTest, SplitLinesHandlesCrlf) {
    auto lines = splitLines("a.json\r\nb.json\r\n\r\nc.json\n");
    EXPECT_EQ(lines, (std::vector<std::string>{"a.json", "b.json", "c.json"}));
    EXPECT_TRUE(splitLines("").empty());
}

TEST(FtpListingTest, NlstKeepsLastPathComponent) {
    auto entry = parseNlstLine("/dayzstandalone/config/BBP_Settings.json");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->name, "BBP_Settings.json");
    EXPECT_FALSE(parseNlstLine(".").has_value());
    EXPECT_FALSE(parseNlstLine("config/..").has_value());
}

TEST(FtpListingTest, UrlIsAbsoluteAndEscapedPerSegment) {
    EXPECT_EQ(ftpUrl("ftp.example.net", 21, "/dayzstandalone/config/BBP_Settings.json"),
              "ftp://ftp.example.net:21/%2Fdayzstandalone/config/BBP_Settings.json");
    EXPECT_EQ(ftpUrl("ftp.example.net", 2121, "/Base Building/#1 mode.json"),
              "ftp://ftp.example.net:2121/%2FBase%20Building/%231%20mode.json");
}

TEST(FtpListingTest, UrlForDirectoriesAndRoot) {
    EXPECT_EQ(ftpUrl("10.0.0.5", 21, "/srv/config", true), "ftp://10.0.0.5:21/%2Fsrv/config/");
    EXPECT_EQ(ftpUrl("10.0.0.5", 21, "/", true), "ftp://10.0.0.5:21/");
    EXPECT_EQ(ftpUrl("10.0.0.5", 21, ""), "ftp://10.0.0.5:21/");
}
