// VFACE - Configuration Tests
// Copyright (c) 2024 VFACE Developers
// MIT License

#include <gtest/gtest.h>

#include "vface/util/config.h"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

#include <unistd.h>

namespace vface {
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
        char filename[] = "/tmp/vface_config_test_XXXXXX";
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
// File Parsing
// ============================================================================

TEST_F(ConfigTest, ParsesRegistryOptions) {
    auto result = config_.ParseString(
        "# registry\n"
        "dimension=512\n"
        "precision = 6\n"
        "sybilthreshold=0.95\n"
        "enforcefingerprint\n"
        "; rpc\n"
        "rpcuser = \"operator\"\n");
    ASSERT_TRUE(result.success) << result.ToString();

    EXPECT_EQ(config_.GetInt(ConfigKeys::DIMENSION, 128), 512);
    EXPECT_EQ(config_.GetInt(ConfigKeys::PRECISION, 4), 6);
    EXPECT_DOUBLE_EQ(config_.GetDouble(ConfigKeys::SYBILTHRESHOLD, 0.92), 0.95);
    EXPECT_TRUE(config_.GetBool(ConfigKeys::ENFORCEFINGERPRINT, false));
    EXPECT_EQ(config_.GetString(ConfigKeys::RPCUSER), "operator");
    EXPECT_EQ(config_.GetInt(ConfigKeys::MAXTOPK, 100), 100);
}

TEST_F(ConfigTest, TypedGettersRejectGarbage) {
    ASSERT_TRUE(config_.ParseString("dbcache=64M\nrpcport=84x5\nserver=maybe\n"
                                    "verifythreshold=0.8.5\n").success);
    EXPECT_EQ(config_.GetInt(ConfigKeys::DBCACHE), 64 * 1024 * 1024);
    EXPECT_FALSE(config_.TryGetInt(ConfigKeys::RPCPORT).has_value());
    EXPECT_FALSE(config_.TryGetBool(ConfigKeys::SERVER).has_value());
    EXPECT_TRUE(config_.GetBool(ConfigKeys::SERVER, true));
    EXPECT_FALSE(config_.TryGetDouble(ConfigKeys::VERIFYTHRESHOLD).has_value());
}

TEST_F(ConfigTest, Sections) {
    ASSERT_TRUE(config_.ParseString("rpcport=1\n[test]\nrpcport=2\n").success);
    EXPECT_EQ(config_.GetInt(ConfigKeys::RPCPORT), 1);
    EXPECT_EQ(config_.GetInt(ConfigKeys::RPCPORT, 0, "test"), 2);
    EXPECT_EQ(config_.GetSections(), std::vector<std::string>{"test"});

    auto bad = config_.ParseString("[broken\n");
    EXPECT_FALSE(bad.success);
    EXPECT_EQ(bad.errorLine, 1);
}

TEST_F(ConfigTest, RepeatedKeysAndCommaLists) {
    ASSERT_TRUE(config_.ParseString("debug=registry\ndebug=chain,consent\n").success);
    EXPECT_EQ(config_.GetList(ConfigKeys::DEBUG),
              (std::vector<std::string>{"registry", "chain", "consent"}));
}

TEST_F(ConfigTest, ExpandsEnvironmentAndTilde) {
    const char* oldHome = std::getenv("HOME");
    std::string savedHome = oldHome ? oldHome : "";
    setenv("VFACE_TEST_DIR", "/srv/vface", 1);
    setenv("HOME", "/home/op", 1);
    ASSERT_TRUE(config_.ParseString("keystore=${VFACE_TEST_DIR}/keys.json\n"
                                    "logfile=~/vface.log\n").success);
    EXPECT_EQ(config_.GetPath(ConfigKeys::KEYSTORE), "/srv/vface/keys.json");
    EXPECT_EQ(config_.GetPath(ConfigKeys::LOGFILE), "/home/op/vface.log");
    EXPECT_EQ(ConfigManager::ExpandTilde("a/~b"), "a/~b");
    unsetenv("VFACE_TEST_DIR");
    if (oldHome) {
        setenv("HOME", savedHome.c_str(), 1);
    } else {
        unsetenv("HOME");
    }
}

TEST_F(ConfigTest, ParseFileAndInclude) {
    std::string inner = CreateTempFile("rpcthreads=8\n");
    std::string outer = CreateTempFile("include " + inner + "\nrpcport=9000\n");

    auto result = config_.ParseFile(outer);
    ASSERT_TRUE(result.success) << result.ToString();
    EXPECT_EQ(config_.GetInt(ConfigKeys::RPCTHREADS), 8);
    EXPECT_EQ(config_.GetInt(ConfigKeys::RPCPORT), 9000);

    EXPECT_FALSE(config_.ParseFile("/nonexistent/vface.conf").success);
}

// ============================================================================
// Command Line
// ============================================================================

TEST_F(ConfigTest, CommandLineOptionsAndPositionals) {
    const char* argv[] = {"vface-admin", "-datadir=/tmp/vf", "--dry-run", "-noserver",
                          "rotate-keys", "--", "-0.5,0.5"};
    auto result = config_.ParseCommandLine(7, argv);
    ASSERT_TRUE(result.success) << result.ToString();

    EXPECT_EQ(config_.GetString(ConfigKeys::DATADIR), "/tmp/vf");
    EXPECT_TRUE(config_.GetBool("dry-run", false));
    EXPECT_FALSE(config_.GetBool(ConfigKeys::SERVER, true));
    EXPECT_EQ(config_.GetPositionalArgs(),
              (std::vector<std::string>{"rotate-keys", "-0.5,0.5"}));
}

TEST_F(ConfigTest, CommandLineRejectsInvalidKeys) {
    const char* argv[] = {"vfaced", "-rpc$port=1"};
    EXPECT_FALSE(config_.ParseCommandLine(2, argv).success);
}

TEST_F(ConfigTest, CommandLineOverridesConfigFile) {
    std::string dir = "/tmp/vface_config_dir_" + std::to_string(getpid());
    std::string conf = CreateTempFile("rpcport=7000\nrpcthreads=2\n");

    std::string confArg = "-conf=" + conf;
    std::string dirArg = "-datadir=" + dir;
    const char* argv[] = {"vfaced", dirArg.c_str(), confArg.c_str(), "-rpcport=7100"};
    ASSERT_TRUE(config_.ParseCommandLine(4, argv).success);

    auto loaded = config_.LoadAllConfigs();
    ASSERT_TRUE(loaded.success) << loaded.ToString();
    EXPECT_EQ(config_.GetDataDir(), dir);
    EXPECT_EQ(config_.GetInt(ConfigKeys::RPCPORT), 7100);
    EXPECT_EQ(config_.GetInt(ConfigKeys::RPCTHREADS), 2);
}

TEST_F(ConfigTest, MissingExplicitConfIsAnError) {
    const char* argv[] = {"vfaced", "-datadir=/tmp", "-conf=/nonexistent/vface.conf"};
    ASSERT_TRUE(config_.ParseCommandLine(3, argv).success);
    EXPECT_FALSE(config_.LoadAllConfigs().success);
}

// ============================================================================
// Validation
// ============================================================================

TEST_F(ConfigTest, ValidateReportsUnknownKeys) {
    config_.AllowStandardKeys();
    ASSERT_TRUE(config_.ParseString("rpcport=1\nrpcprot=2\n").success);
    auto errors = config_.Validate();
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_NE(errors[0].find("rpcprot"), std::string::npos);
}

TEST_F(ConfigTest, SampleConfigParses) {
    std::string sample = config_.GenerateSampleConfig();
    EXPECT_NE(sample.find("sybilthreshold"), std::string::npos);

    ConfigManager reparsed;
    reparsed.AllowStandardKeys();
    ASSERT_TRUE(reparsed.ParseString(sample).success);
    EXPECT_TRUE(reparsed.Validate().empty());
}

} // namespace test
} // namespace util
} // namespace vface
