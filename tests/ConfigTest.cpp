// tests/ConfigTest.cpp
#include "TestSupport.hpp"

#include <Zipkit/Config.hpp>
#include <Zipkit/Error.hpp>

using namespace Zipkit;
using Zipkit::Testing::TempDirTest;

class ConfigTest : public TempDirTest {};

TEST(ConfigDefaults, ExcludesVersionControlMetadata) {
    Config config;
    EXPECT_TRUE(config.isExcluded(".git"));
    EXPECT_TRUE(config.isExcluded("project/.svn"));
    EXPECT_TRUE(config.isExcluded("project/.hg/"));
    EXPECT_TRUE(config.isExcluded(".DS_Store"));
    EXPECT_FALSE(config.isExcluded("src"));
    EXPECT_FALSE(config.isExcluded(".gitignore"));
}

TEST(ConfigDefaults, DefaultPermissionIsOwnerWritable) {
    Config config;
    using std::filesystem::perms;
    EXPECT_EQ(config.defaultPermission, perms::owner_read | perms::owner_write | perms::group_read | perms::others_read);
    EXPECT_TRUE(config.verbose);
}

TEST(ConfigFromJson, OverridesGivenFields) {
    json j = {
        {"verbose", false},
        {"scratchRoot", "/var/tmp/zk"},
        {"excludeNames", {"node_modules"}},
        {"permission", "0600"},
        {"log", {{"dir", "/var/log/zipkit"}, {"file", "session.log"}, {"consoleLevel", "warn"}}}
    };
    Config config = Config::from_json(j);

    EXPECT_FALSE(config.verbose);
    EXPECT_EQ(config.scratchRoot, std::filesystem::path("/var/tmp/zk"));
    ASSERT_EQ(config.excludeNames.size(), 1u);
    EXPECT_TRUE(config.isExcluded("node_modules"));
    EXPECT_FALSE(config.isExcluded(".git"));
    EXPECT_EQ(config.defaultPermission, std::filesystem::perms::owner_read | std::filesystem::perms::owner_write);
    EXPECT_EQ(config.log.logDir, std::filesystem::path("/var/log/zipkit"));
    EXPECT_EQ(config.log.logFileName, "session.log");
    EXPECT_EQ(config.log.consoleLevel, spdlog::level::warn);
    EXPECT_EQ(config.log.fileLevel, spdlog::level::trace);
}

TEST(ConfigFromJson, AcceptsNumericPermission) {
    Config config = Config::from_json(json{{"permission", 0755}});
    using std::filesystem::perms;
    EXPECT_EQ(config.defaultPermission, perms::owner_all | perms::group_read | perms::group_exec |
                                                perms::others_read | perms::others_exec);
}

TEST(ConfigFromJson, EmptyObjectKeepsDefaults) {
    Config defaults;
    Config config = Config::from_json(json::object());
    EXPECT_EQ(config.verbose, defaults.verbose);
    EXPECT_EQ(config.excludeNames, defaults.excludeNames);
    EXPECT_EQ(config.defaultPermission, defaults.defaultPermission);
}

TEST(ConfigFromJson, WrongTypesKeepDefaultsWithoutThrowing) {
    json j = {
        {"verbose", "yes"},
        {"scratchRoot", 42},
        {"excludeNames", {"build", 7}},
        {"permission", -1},
        {"log", "everything"}
    };
    Config defaults;
    Config config;
    std::vector<std::string> problems;
    EXPECT_NO_THROW(config = Config::from_json(j, &problems));

    EXPECT_EQ(config.verbose, defaults.verbose);
    EXPECT_EQ(config.scratchRoot, defaults.scratchRoot);
    EXPECT_EQ(config.excludeNames, defaults.excludeNames);
    EXPECT_EQ(config.defaultPermission, defaults.defaultPermission);
    EXPECT_EQ(config.log.logDir, defaults.log.logDir);
    ASSERT_EQ(problems.size(), 5u);
    EXPECT_NE(problems.front().find("verbose"), std::string::npos);
}

TEST(ConfigFromJson, RejectsPermissionWithTrailingGarbage) {
    std::vector<std::string> problems;
    Config config = Config::from_json(json{{"permission", "0644x"}}, &problems);
    EXPECT_EQ(config.defaultPermission, Config{}.defaultPermission);
    EXPECT_EQ(problems.size(), 1u);
}

TEST(ConfigDefaults, ScratchRootIsNeverEmpty) {
    EXPECT_FALSE(Config::defaultScratchRoot().empty());
    EXPECT_FALSE(Config{}.scratchRoot.empty());
}

TEST_F(ConfigTest, LoadFromFileReadsJson) {
    auto path = writeFile("zipkit.json", R"({"verbose": false, "excludeNames": ["build"]})");
    Config config;
    std::string error;
    ASSERT_TRUE(Config::loadFromFile(path, config, &error)) << error;
    EXPECT_FALSE(config.verbose);
    EXPECT_TRUE(config.isExcluded("build"));
}

TEST_F(ConfigTest, LoadFromFileRejectsMalformedJson) {
    auto path = writeFile("broken.json", "{ \"verbose\": ");
    Config config;
    std::string error;
    EXPECT_FALSE(Config::loadFromFile(path, config, &error));
    EXPECT_NE(error.find("broken.json"), std::string::npos);
}

TEST_F(ConfigTest, LoadFromFileRejectsBadPermission) {
    auto path = writeFile("perm.json", R"({"permission": "rw-r--r--"})");
    Config config;
    std::string error;
    EXPECT_FALSE(Config::loadFromFile(path, config, &error));
    EXPECT_FALSE(error.empty());
}

TEST_F(ConfigTest, LoadFromFileRejectsWrongTypeAndKeepsTarget) {
    auto path = writeFile("typed.json", R"({"verbose": "yes", "excludeNames": ["build"]})");
    Config config;
    config.excludeNames = {"kept"};
    std::string error;
    bool loaded = true;
    EXPECT_NO_THROW(loaded = Config::loadFromFile(path, config, &error));
    EXPECT_FALSE(loaded);
    EXPECT_NE(error.find("verbose"), std::string::npos);
    EXPECT_EQ(config.excludeNames, (std::vector<std::string>{"kept"}));
}

TEST_F(ConfigTest, LoadFromFileReportsMissingFile) {
    Config config;
    std::string error;
    EXPECT_FALSE(Config::loadFromFile(root() / "absent.json", config, &error));
    EXPECT_NE(error.find("absent.json"), std::string::npos);
}

TEST(ErrorTest, DescribeNamesTheKind) {
    EXPECT_EQ(Error{}.describe(), "ok");
    EXPECT_TRUE(Error{}.ok());

    Error err = Error::notFound("a.txt");
    EXPECT_FALSE(err.ok());
    EXPECT_EQ(err.kind(), ErrorKind::NotFound);
    EXPECT_EQ(err.describe(), "not found: a.txt");
    EXPECT_EQ(err, Error::notFound("a.txt"));
    EXPECT_NE(err, Error::io("a.txt"));
}
