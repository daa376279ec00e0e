// FORESIGHT - Configuration File Parser Tests
// Copyright (c) 2024 FORESIGHT Developers
// MIT License

#include <gtest/gtest.h>

#include "foresight/util/config.h"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <unistd.h>

namespace foresight {
namespace util {
namespace test {

// ============================================================================
// Test Fixtures
// ============================================================================

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.Clear();
    }

    void TearDown() override {
        for (const auto& file : tempFiles_) {
            std::remove(file.c_str());
        }
        tempFiles_.clear();
    }

    std::string CreateTempFile(const std::string& content) {
        char filename[] = "/tmp/foresight_config_test_XXXXXX";
        int fd = mkstemp(filename);
        if (fd < 0) {
            throw std::runtime_error("Failed to create temp file");
        }
        close(fd);

        std::ofstream file(filename);
        file << content;
        file.close();

        tempFiles_.push_back(filename);
        return filename;
    }

    ConfigManager config_;
    std::vector<std::string> tempFiles_;
};

// ============================================================================
// Basic Parsing Tests
// ============================================================================

TEST_F(ConfigTest, ParseEmptyString) {
    auto result = config_.ParseString("");
    EXPECT_TRUE(result.success);
    EXPECT_EQ(config_.Size(), 0u);
}

TEST_F(ConfigTest, ParseCommentsAndBlankLines) {
    auto result = config_.ParseString("# comment\n; another\n\n   \nminstake=5\n");
    ASSERT_TRUE(result.success);
    EXPECT_EQ(config_.Size(), 1u);
    EXPECT_EQ(config_.GetString("minstake", ""), "5");
}

TEST_F(ConfigTest, ParseQuotedValue) {
    ASSERT_TRUE(config_.ParseString("a=\"hello world\"\nb='raw\\n'\nc=\"tab\\there\"").success);
    EXPECT_EQ(config_.GetString("a", ""), "hello world");
    EXPECT_EQ(config_.GetString("b", ""), "raw\\n");
    EXPECT_EQ(config_.GetString("c", ""), "tab\there");
}

TEST_F(ConfigTest, ParseBooleanFlags) {
    ASSERT_TRUE(config_.ParseString("memdb\nnodbsync\n").success);
    EXPECT_TRUE(config_.GetBool("memdb", false));
    EXPECT_FALSE(config_.GetBool("dbsync", true));
}

TEST_F(ConfigTest, SectionsRejected) {
    auto result = config_.ParseString("feepercent=5\n[test]\nfeepercent=7\n", "market.conf");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorLine, 2);
    EXPECT_EQ(result.Describe(), "market.conf:2: Sections are not supported: [test]");
}

TEST_F(ConfigTest, LineContinuation) {
    ASSERT_TRUE(config_.ParseString("debug=market,\\\nledger\n").success);
    EXPECT_EQ(config_.GetList("debug"), (std::vector<std::string>{"market", "ledger"}));
}

// ============================================================================
// Typed Retrieval Tests
// ============================================================================

TEST_F(ConfigTest, GetIntWithSuffix) {
    ASSERT_TRUE(config_.ParseString("a=4k\nb=2M\nc=1g\nd=12x\ne=-3\n").success);
    EXPECT_EQ(config_.GetInt("a", 0), 4096);
    EXPECT_EQ(config_.GetInt("b", 0), 2 * 1024 * 1024);
    EXPECT_EQ(config_.GetInt("c", 0), 1024LL * 1024 * 1024);
    EXPECT_FALSE(config_.TryGetInt("d").has_value());
    EXPECT_EQ(config_.GetInt("e", 0), -3);
}

TEST_F(ConfigTest, GetIntRejectsOverflow) {
    ASSERT_TRUE(config_.ParseString("huge=99999999999999999999\nbig=9223372036854775807k\n").success);
    EXPECT_FALSE(config_.TryGetInt("huge").has_value());
    EXPECT_FALSE(config_.TryGetInt("big").has_value());
}

TEST_F(ConfigTest, GetUIntRejectsNegative) {
    ASSERT_TRUE(config_.ParseString("neg=-1\npos=10\n").success);
    EXPECT_FALSE(config_.TryGetUInt("neg").has_value());
    EXPECT_EQ(config_.GetUInt("neg", 42), 42u);
    EXPECT_EQ(config_.GetUInt("pos", 0), 10u);
}

TEST_F(ConfigTest, GetBool) {
    ASSERT_TRUE(config_.ParseString("a=yes\nb=off\nc=1\nd=maybe\n").success);
    EXPECT_TRUE(config_.GetBool("a", false));
    EXPECT_FALSE(config_.GetBool("b", true));
    EXPECT_TRUE(config_.GetBool("c", false));
    EXPECT_FALSE(config_.TryGetBool("d").has_value());
    EXPECT_TRUE(config_.GetBool("missing", true));
}

TEST_F(ConfigTest, GetListCombinesRepeatsAndCommas) {
    ASSERT_TRUE(config_.ParseString("debug=market, scoring\ndebug=ledger\n").success);
    EXPECT_EQ(config_.GetList("debug"),
              (std::vector<std::string>{"market", "scoring", "ledger"}));
    EXPECT_TRUE(config_.GetList("missing").empty());
}

// ============================================================================
// Expansion Tests
// ============================================================================

TEST_F(ConfigTest, ExpandEnvVars) {
    setenv("FORESIGHT_TEST_VAR", "value", 1);
    EXPECT_EQ(ConfigManager::ExpandEnvVars("${FORESIGHT_TEST_VAR}/x"), "value/x");
    EXPECT_EQ(ConfigManager::ExpandEnvVars("$FORESIGHT_TEST_VAR-y"), "value-y");
    EXPECT_EQ(ConfigManager::ExpandEnvVars("$FORESIGHT_UNDEFINED_VAR_XYZ"), "");
    unsetenv("FORESIGHT_TEST_VAR");
}

TEST_F(ConfigTest, ExpandTilde) {
    const char* savedHome = std::getenv("HOME");
    std::string previous = savedHome ? savedHome : "";

    setenv("HOME", "/home/tester", 1);
    EXPECT_EQ(ConfigManager::ExpandTilde("~/data"), "/home/tester/data");
    EXPECT_EQ(ConfigManager::ExpandTilde("~"), "/home/tester");
    EXPECT_EQ(ConfigManager::ExpandTilde("/a/~b"), "/a/~b");
    EXPECT_EQ(ConfigManager::ExpandTilde("~other"), "~other");

    if (savedHome) {
        setenv("HOME", previous.c_str(), 1);
    } else {
        unsetenv("HOME");
    }
}

// ============================================================================
// File and Command-Line Tests
// ============================================================================

TEST_F(ConfigTest, ParseFile) {
    std::string path = CreateTempFile("owner=00112233445566778899aabbccddeeff00112233\n"
                                      "feepercent=3\n");
    auto result = config_.ParseFile(path);
    ASSERT_TRUE(result.success) << result.Describe();
    EXPECT_EQ(config_.GetUInt(ConfigKeys::FEEPERCENT, 0), 3u);
    EXPECT_TRUE(config_.HasKey(ConfigKeys::OWNER));
}

TEST_F(ConfigTest, ParseNonexistentFile) {
    auto result = config_.ParseFile("/nonexistent/foresight.conf");
    EXPECT_FALSE(result.success);
    EXPECT_FALSE(result.errorMessage.empty());
}

TEST_F(ConfigTest, IncludeFile) {
    std::string inner = CreateTempFile("minstake=777\n");
    std::string outer = CreateTempFile("include " + inner + "\nfeepercent=9\n");

    ASSERT_TRUE(config_.ParseFile(outer).success);
    EXPECT_EQ(config_.GetInt("minstake", 0), 777);
    EXPECT_EQ(config_.GetInt("feepercent", 0), 9);
}

TEST_F(ConfigTest, ErrorsCarryLocation) {
    auto result = config_.ParseString("good=1\n\nbad key!=1\n", "test.conf");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorLine, 3);
    EXPECT_EQ(result.Describe(), "test.conf:3: Invalid key: bad key!");

    result = config_.ParseString("=value\n");
    EXPECT_FALSE(result.success);
}

TEST_F(ConfigTest, LineTooLong) {
    std::string longLine = "key=" + std::string(MAX_LINE_LENGTH + 1, 'x');
    EXPECT_FALSE(config_.ParseString(longLine).success);
}

TEST_F(ConfigTest, ParseCommandLine) {
    const char* argv[] = {"foresight-replay", "-memdb", "--feepercent=7", "-nodbsync",
                          "script.txt"};
    auto result = config_.ParseCommandLine(5, argv);
    ASSERT_TRUE(result.success);

    EXPECT_TRUE(config_.GetBool(ConfigKeys::MEMDB, false));
    EXPECT_EQ(config_.GetUInt(ConfigKeys::FEEPERCENT, 0), 7u);
    EXPECT_FALSE(config_.GetBool(ConfigKeys::DBSYNC, true));
    ASSERT_EQ(config_.GetPositional().size(), 1u);
    EXPECT_EQ(config_.GetPositional()[0], "script.txt");
}

TEST_F(ConfigTest, ParseCommandLineRejectsBadKey) {
    const char* argv[] = {"foresight-replay", "-bad$key=1"};
    EXPECT_FALSE(config_.ParseCommandLine(2, argv).success);
}

TEST_F(ConfigTest, CommandLineOverridesConfig) {
    ASSERT_TRUE(config_.ParseString("feepercent=5\n", "file.conf").success);
    const char* argv[] = {"foresight-replay", "-feepercent=10"};
    ASSERT_TRUE(config_.ParseCommandLine(2, argv).success);
    EXPECT_EQ(config_.GetInt("feepercent", 0), 10);
}

TEST_F(ConfigTest, LaterSourceOverwritesOnlyWhenAsked) {
    ASSERT_TRUE(config_.ParseString("minstake=1\n", "first").success);
    ASSERT_TRUE(config_.ParseString("minstake=2\n", "second").success);
    EXPECT_EQ(config_.GetInt("minstake", 0), 1);

    ASSERT_TRUE(config_.ParseString("minstake=3\n", "third", true).success);
    EXPECT_EQ(config_.GetInt("minstake", 0), 3);
}

TEST_F(ConfigTest, LoadAllConfigsReadsDataDirConfig) {
    char dirTemplate[] = "/tmp/foresight_datadir_XXXXXX";
    ASSERT_NE(mkdtemp(dirTemplate), nullptr);
    std::string dataDir = dirTemplate;
    std::string confPath = dataDir + "/" + DEFAULT_CONFIG_FILENAME;
    {
        std::ofstream conf(confPath);
        conf << "feepercent=12\n";
    }
    tempFiles_.push_back(confPath);

    auto result = config_.LoadAllConfigs(dataDir);
    ASSERT_TRUE(result.success) << result.Describe();
    EXPECT_EQ(config_.GetDataDir(), dataDir);
    EXPECT_EQ(config_.GetInt(ConfigKeys::FEEPERCENT, 0), 12);

    std::remove(confPath.c_str());
    tempFiles_.clear();
    rmdir(dataDir.c_str());
}

TEST_F(ConfigTest, ExplicitConfMustExist) {
    config_.Set(ConfigKeys::CONF, "/nonexistent/explicit.conf");
    EXPECT_FALSE(config_.LoadAllConfigs("/nonexistent").success);
}

// ============================================================================
// Setting and Validation Tests
// ============================================================================

TEST_F(ConfigTest, SetReplacesAllValues) {
    ASSERT_TRUE(config_.ParseString("debug=market\ndebug=db\n").success);
    config_.Set(ConfigKeys::DEBUG, "journal");
    EXPECT_EQ(config_.GetList(ConfigKeys::DEBUG), (std::vector<std::string>{"journal"}));
    EXPECT_EQ(config_.GetOrigin(ConfigKeys::DEBUG)->source, "<programmatic>");
}

TEST_F(ConfigTest, OriginTracksSourceAndLine) {
    ASSERT_TRUE(config_.ParseString("\nminstake=5\n", "market.conf").success);
    auto origin = config_.GetOrigin(ConfigKeys::MINSTAKE);
    ASSERT_TRUE(origin.has_value());
    EXPECT_EQ(origin->source, "market.conf");
    EXPECT_EQ(origin->line, 2);
    EXPECT_FALSE(config_.GetOrigin("missing").has_value());
}

TEST_F(ConfigTest, FindUnknownKeys) {
    ASSERT_TRUE(config_.ParseString("feepercent=1\nfeepercnet=2\n", "market.conf").success);
    const char* argv[] = {"foresight-replay", "-memdb", "-verbose"};
    ASSERT_TRUE(config_.ParseCommandLine(3, argv).success);

    auto unknown = config_.FindUnknownKeys();
    ASSERT_EQ(unknown.size(), 2u);
    EXPECT_EQ(unknown[0], "feepercnet (market.conf:2)");
    EXPECT_EQ(unknown[1], "verbose (<command-line>)");
}

TEST_F(ConfigTest, IncludeDepthLimited) {
    std::string path = CreateTempFile("");
    {
        std::ofstream self(path);
        self << "include " << path << "\n";
    }
    auto result = config_.ParseFile(path);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorMessage, "Maximum include depth exceeded");
}

TEST_F(ConfigTest, ClearResetsEverything) {
    ASSERT_TRUE(config_.ParseString("a=1\nb=2\n").success);
    config_.SetDataDir("/tmp/x");
    config_.Clear();
    EXPECT_EQ(config_.Size(), 0u);
    EXPECT_EQ(config_.GetDataDir(), ConfigManager::GetDefaultDataDir());
}

TEST_F(ConfigTest, GenerateSampleConfigParses) {
    std::string sample = ConfigManager::GenerateSampleConfig();
    EXPECT_NE(sample.find("feepercent"), std::string::npos);
    EXPECT_TRUE(config_.ParseString(sample).success);
    EXPECT_EQ(config_.Size(), 0u);
}

} // namespace test
} // namespace util
} // namespace foresight
