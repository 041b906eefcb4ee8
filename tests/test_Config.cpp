#include <gtest/gtest.h>
#include "app/Config.h"
#include "TestHelpers.h"

using namespace taggraph;

namespace {

class ConfigTest : public test::TempTreeTest {
protected:
    void TearDown() override {
        Config::instance().reset();
        TempTreeTest::TearDown();
    }
};

} // namespace

TEST_F(ConfigTest, MissingFileGivesDefaults) {
    Config& config = Config::instance();
    config.verbose = true;
    config.loadFrom((root_ / "absent.json").string());

    EXPECT_FALSE(config.verbose);
    EXPECT_EQ(config.tagFileExtension, ".tags");
    EXPECT_EQ(config.dirTagFileName, "dir.tags");
    EXPECT_TRUE(config.inheritTags);
    EXPECT_TRUE(config.defaultRootPath.empty());
}

TEST_F(ConfigTest, SaveThenLoad) {
    Config& config = Config::instance();
    config.reset();
    config.defaultRootPath = "/srv/media";
    config.lastRootPath = "/home/me";
    config.tagFileExtension = ".labels";
    config.dirTagFileName = "folder.labels";
    config.verbose = true;
    config.inheritTags = false;

    std::string path = (root_ / "nested" / "config.json").string();
    ASSERT_TRUE(config.saveTo(path));

    config.reset();
    config.loadFrom(path);
    EXPECT_EQ(config.defaultRootPath, "/srv/media");
    EXPECT_EQ(config.lastRootPath, "/home/me");
    EXPECT_EQ(config.tagFileExtension, ".labels");
    EXPECT_EQ(config.dirTagFileName, "folder.labels");
    EXPECT_TRUE(config.verbose);
    EXPECT_FALSE(config.inheritTags);

    ScanOptions options = config.scanOptions();
    EXPECT_EQ(options.tagFileExtension, ".labels");
    EXPECT_EQ(options.dirTagFileName, "folder.labels");
    EXPECT_TRUE(options.verbose);
}

TEST_F(ConfigTest, MalformedFileFallsBackToDefaults) {
    auto path = writeFile("config.json", "{ \"verbose\": true, ");
    Config& config = Config::instance();
    config.loadFrom(path.string());
    EXPECT_FALSE(config.verbose);
    EXPECT_EQ(config.tagFileExtension, ".tags");
}

TEST_F(ConfigTest, WrongTypesKeepDefaults) {
    auto path = writeFile("config.json",
        "{ \"verbose\": \"yes\", \"defaultRootPath\": 3,"
        "  \"tags\": { \"fileExtension\": \"\", \"dirFileName\": 7, \"inherit\": false } }");
    Config& config = Config::instance();
    config.loadFrom(path.string());
    EXPECT_FALSE(config.verbose);
    EXPECT_TRUE(config.defaultRootPath.empty());
    EXPECT_EQ(config.tagFileExtension, ".tags");
    EXPECT_EQ(config.dirTagFileName, "dir.tags");
    EXPECT_FALSE(config.inheritTags);
}
