#include <gtest/gtest.h>
#include "core/ConfigManager.hpp"
#include "utils/Logger.hpp"
#include "TestUtils.hpp"

using namespace configdesk;
using configdesk::test::TempDir;

class ConfigManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        previousDir = Configs::Get().GetConfigDir();
        Configs::Get().SetConfigDir(temp.path().string());
        // Nothing written yet, so this starts from an empty config
        Configs::Get().Load();
    }

    void TearDown() override {
        Configs::Get().SetConfigDir(previousDir);
    }

    TempDir temp;
    std::string previousDir;
};

TEST_F(ConfigManagerTest, CreatesDefaultConfigFile) {
    auto& config = Configs::Get();
    config.EnsureConfigFile();
    ASSERT_TRUE(std::filesystem::exists(config.getPath()));

    config.Load();
    EXPECT_EQ(config.Get<std::string>(Configs::LOG_LEVEL_KEY, ""), "info");
    EXPECT_EQ(config.Get<int>(Configs::LOG_MAX_DAYS_KEY, 0), Configs::DEFAULT_LOG_MAX_DAYS);
    EXPECT_TRUE(config.GetCheckUpdatesOnStartup());
    EXPECT_EQ(config.GetUpdateTimeoutMs(), Configs::DEFAULT_HTTP_TIMEOUT_MS);
    EXPECT_TRUE(config.GetResourceDir().empty());
    EXPECT_TRUE(config.Validate().empty());
}

TEST_F(ConfigManagerTest, ParsesSectionsAndComments) {
    temp.write("main.cfg",
               "# comment\r\n"
               "[Updater]\r\n"
               "CheckOnStartup=false\r\n"
               "Endpoints= https://a.example/{{target}}/{{current_version}} , ,https://b.example/latest.json\r\n"
               "[Paths]\n"
               "ResourceDir=/opt/configdesk\n");
    auto& config = Configs::Get();
    config.Load();

    EXPECT_FALSE(config.GetCheckUpdatesOnStartup());
    EXPECT_EQ(config.GetResourceDir(), "/opt/configdesk");

    auto endpoints = config.GetUpdateEndpoints();
    ASSERT_EQ(endpoints.size(), 2u);
    EXPECT_EQ(endpoints[0], "https://a.example/{{target}}/{{current_version}}");
    EXPECT_EQ(endpoints[1], "https://b.example/latest.json");
}

TEST_F(ConfigManagerTest, FallsBackOnInvalidOrOutOfRangeValues) {
    temp.write("main.cfg",
               "[Logging]\n"
               "MaxDays=lots\n"
               "[Updater]\n"
               "TimeoutMs=5\n");
    auto& config = Configs::Get();
    config.Load();

    EXPECT_EQ(config.Get<int>(Configs::LOG_MAX_DAYS_KEY, 7), 7);
    EXPECT_EQ(config.GetUpdateTimeoutMs(), Configs::DEFAULT_HTTP_TIMEOUT_MS);
}

TEST_F(ConfigManagerTest, ReportsUnknownKeys) {
    temp.write("main.cfg",
               "[Logging]\n"
               "Level=debug\n"
               "Colour=true\n");
    auto& config = Configs::Get();
    config.Load();

    auto unknown = config.Validate();
    ASSERT_EQ(unknown.size(), 1u);
    EXPECT_EQ(unknown[0], "Logging.Colour");
}

TEST_F(ConfigManagerTest, ReloadDropsPreviousSettings) {
    temp.write("main.cfg",
               "[Paths]\n"
               "ResourceDir=/opt/configdesk\n");
    auto& config = Configs::Get();
    config.Load();
    ASSERT_EQ(config.GetResourceDir(), "/opt/configdesk");

    temp.write("main.cfg", "[Updater]\nTimeoutMs=4000\n");
    config.Load();
    EXPECT_TRUE(config.GetResourceDir().empty());
    EXPECT_EQ(config.GetUpdateTimeoutMs(), 4000);
}

TEST(LoggerLevelTest, ParsesConfiguredLevelNames) {
    EXPECT_EQ(Logger::parseLevel("debug"), Logger::LOG_DEBUG);
    EXPECT_EQ(Logger::parseLevel("INFO"), Logger::LOG_INFO);
    EXPECT_EQ(Logger::parseLevel("warn"), Logger::LOG_WARNING);
    EXPECT_EQ(Logger::parseLevel("Warning"), Logger::LOG_WARNING);
    EXPECT_EQ(Logger::parseLevel("error"), Logger::LOG_ERROR);
    EXPECT_EQ(Logger::parseLevel("fatal"), Logger::LOG_FATAL);
    EXPECT_EQ(Logger::parseLevel("verbose"), Logger::LOG_INFO);
    EXPECT_EQ(Logger::parseLevel("", Logger::LOG_ERROR), Logger::LOG_ERROR);
}
