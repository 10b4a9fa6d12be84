#include "core/ConfigLoader.h"
#include "core/evolution/TrainingConfig.h"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>

using namespace DashSim;

class ConfigLoaderTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        testDir_ = std::filesystem::temp_directory_path() / "dashsim_config_loader_test";
        std::filesystem::create_directories(testDir_);
    }

    void TearDown() override
    {
        std::filesystem::remove_all(testDir_);
        ConfigLoader::clearConfigDir();
    }

    void writeConfigFile(const std::string& filename, const std::string& content)
    {
        std::filesystem::path path = testDir_ / filename;
        std::ofstream file(path);
        file << content;
    }

    std::filesystem::path testDir_;
};

TEST_F(ConfigLoaderTest, LoadReturnsErrorWhenFileNotFound)
{
    ConfigLoader::setConfigDir(testDir_.string());
    auto result = ConfigLoader::load<TrainingConfig>("nonexistent.json");
    EXPECT_TRUE(result.isError());
    EXPECT_TRUE(result.errorValue().find("not found") != std::string::npos);
}

TEST_F(ConfigLoaderTest, LoadAppliesFileOverDefaults)
{
    writeConfigFile("training.json", R"({"evolution": {"populationSize": 64}})");
    ConfigLoader::setConfigDir(testDir_.string());

    auto result = ConfigLoader::load<TrainingConfig>("training.json");
    ASSERT_TRUE(result.isValue());
    EXPECT_EQ(result.value().evolution.populationSize, 64);
    EXPECT_EQ(result.value().evolution.maxGenerations, 100);
}

TEST_F(ConfigLoaderTest, LocalFileTakesPrecedenceOverBase)
{
    writeConfigFile("training.json", R"({"mutation": {"rate": 0.2}})");
    writeConfigFile("training.json.local", R"({"mutation": {"rate": 0.3}})");
    ConfigLoader::setConfigDir(testDir_.string());

    auto result = ConfigLoader::load<TrainingConfig>("training.json");
    ASSERT_TRUE(result.isValue());
    EXPECT_DOUBLE_EQ(result.value().mutation.rate, 0.3);
}

TEST_F(ConfigLoaderTest, FindConfigFileReturnsLocalPathWhenBothExist)
{
    writeConfigFile("training.json", "{}");
    writeConfigFile("training.json.local", "{}");
    ConfigLoader::setConfigDir(testDir_.string());

    auto path = ConfigLoader::findConfigFile("training.json");
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(path.value(), testDir_ / "training.json.local");
}

TEST_F(ConfigLoaderTest, ExplicitDirectoryIsSearchedFirst)
{
    ConfigLoader::setConfigDir(testDir_.string());
    const auto paths = ConfigLoader::getSearchPaths();
    ASSERT_FALSE(paths.empty());
    EXPECT_EQ(paths.front(), testDir_);
}

TEST_F(ConfigLoaderTest, InvalidJsonReturnsError)
{
    writeConfigFile("bad.json", "not valid json {{{");
    ConfigLoader::setConfigDir(testDir_.string());

    auto result = ConfigLoader::load<TrainingConfig>("bad.json");
    EXPECT_TRUE(result.isError());
    EXPECT_TRUE(result.errorValue().find("Parse error") != std::string::npos);
}

TEST_F(ConfigLoaderTest, EmptyFileReturnsError)
{
    writeConfigFile("empty.json", "");
    ConfigLoader::setConfigDir(testDir_.string());

    auto result = ConfigLoader::load<TrainingConfig>("empty.json");
    EXPECT_TRUE(result.isError());
    EXPECT_TRUE(result.errorValue().find("Empty config file") != std::string::npos);
}

TEST_F(ConfigLoaderTest, WrongTypeReturnsError)
{
    writeConfigFile("training.json", R"({"evolution": {"populationSize": "lots"}})");
    ConfigLoader::setConfigDir(testDir_.string());

    auto result = ConfigLoader::load<TrainingConfig>("training.json");
    EXPECT_TRUE(result.isError());
    EXPECT_TRUE(result.errorValue().find("training.json") != std::string::npos);
}

TEST_F(ConfigLoaderTest, ParseOverrideAppliesOnTopOfBase)
{
    TrainingConfig base;
    base.evolution.populationSize = 30;
    base.seed = 5;

    auto result = ConfigLoader::parseOverride<TrainingConfig>(
        R"({"evolution": {"maxGenerations": 7}})", base);

    ASSERT_TRUE(result.isValue());
    EXPECT_EQ(result.value().evolution.populationSize, 30);
    EXPECT_EQ(result.value().evolution.maxGenerations, 7);
    EXPECT_EQ(result.value().seed, std::optional<uint32_t>(5));
}

TEST_F(ConfigLoaderTest, ParseOverrideRejectsNonObject)
{
    auto result = ConfigLoader::parseOverride<TrainingConfig>("[1, 2, 3]", TrainingConfig{});
    EXPECT_TRUE(result.isError());

    auto garbage = ConfigLoader::parseOverride<TrainingConfig>("{oops", TrainingConfig{});
    EXPECT_TRUE(garbage.isError());
    EXPECT_TRUE(garbage.errorValue().find("Parse error") != std::string::npos);
}

TEST_F(ConfigLoaderTest, LoadOrDefaultFallsBackWhenMissing)
{
    ConfigLoader::setConfigDir(testDir_.string());
    TrainingConfig defaults;
    defaults.evolution.populationSize = 12;

    auto result = ConfigLoader::loadOrDefault("missing-training.json", defaults);
    ASSERT_TRUE(result.isValue());
    EXPECT_EQ(result.value().evolution.populationSize, 12);
}

TEST_F(ConfigLoaderTest, LoadOrDefaultStillReportsBrokenFiles)
{
    writeConfigFile("training.json", "{ \"evolution\": ");
    ConfigLoader::setConfigDir(testDir_.string());

    auto result = ConfigLoader::loadOrDefault("training.json", TrainingConfig{});
    EXPECT_TRUE(result.isError());
}

TEST_F(ConfigLoaderTest, CommentsAreAllowed)
{
    writeConfigFile("training.json", R"({
        // Quick smoke-test run.
        "evolution": { "maxGenerations": 3 } /* keep the rest */
    })");
    ConfigLoader::setConfigDir(testDir_.string());

    auto result = ConfigLoader::load<TrainingConfig>("training.json");
    ASSERT_TRUE(result.isValue());
    EXPECT_EQ(result.value().evolution.maxGenerations, 3);
}

TEST_F(ConfigLoaderTest, EnvironmentDirectoryIsSearched)
{
    writeConfigFile("env-only.json", R"({"seed": 17})");
    ::setenv("DASHSIM_CONFIG_DIR", testDir_.c_str(), 1);

    auto result = ConfigLoader::load<TrainingConfig>("env-only.json");
    ::unsetenv("DASHSIM_CONFIG_DIR");

    ASSERT_TRUE(result.isValue());
    EXPECT_EQ(result.value().seed, std::optional<uint32_t>(17));
}
