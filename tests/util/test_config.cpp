// AGORA - Configuration File Parser Tests
// Copyright (c) 2024 AGORA Developers
// MIT License

#include <gtest/gtest.h>

#include "agora/util/config.h"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <unistd.h>

namespace agora {
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
        char filename[] = "/tmp/agora_config_test_XXXXXX";
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
// Parsing
// ============================================================================

TEST_F(ConfigTest, ParsesKeysAndSections) {
    auto result = config_.ParseString(
        "# governance node\n"
        "datadir = /var/lib/agora\n"
        "\n"
        "[governance]\n"
        "quorum = 0.1\n"
        "; legacy comment style\n"
        "voting_period = 100\n");
    
    ASSERT_TRUE(result.success) << result.errorMessage;
    EXPECT_EQ(config_.GetString("datadir", ""), "/var/lib/agora");
    EXPECT_EQ(config_.GetString("quorum", "", "governance"), "0.1");
    EXPECT_EQ(config_.GetInt("voting_period", 0, "governance"), 100);
    EXPECT_FALSE(config_.HasKey("quorum"));
    EXPECT_EQ(config_.Size(), 3u);
}

TEST_F(ConfigTest, LaterDefinitionWins) {
    ASSERT_TRUE(config_.ParseString("a = 1\na = 2\n").success);
    EXPECT_EQ(config_.GetInt("a", 0), 2);
}

TEST_F(ConfigTest, QuotedValues) {
    ASSERT_TRUE(config_.ParseString(
        "title = \"Raise \\\"quorum\\\"\"\n"
        "raw = 'no \\n escapes'\n").success);
    EXPECT_EQ(config_.GetString("title", ""), "Raise \"quorum\"");
    EXPECT_EQ(config_.GetString("raw", ""), "no \\n escapes");
}

TEST_F(ConfigTest, LineWithoutEqualsIsError) {
    auto result = config_.ParseString("[log]\nverbose\n", "node.conf");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorFile, "node.conf");
    EXPECT_EQ(result.errorLine, 2);
}

TEST_F(ConfigTest, UnclosedSectionIsError) {
    EXPECT_FALSE(config_.ParseString("[governance\n").success);
}

TEST_F(ConfigTest, InvalidKeyCharacter) {
    EXPECT_FALSE(config_.ParseString("bad key = 1\n").success);
}

TEST_F(ConfigTest, ParseFile) {
    std::string path = CreateTempFile("[governance]\nthreshold = 0.5\n");
    ASSERT_TRUE(config_.ParseFile(path).success);
    EXPECT_DOUBLE_EQ(config_.GetDouble("threshold", 0.0, "governance"), 0.5);
}

TEST_F(ConfigTest, MissingFile) {
    auto result = config_.ParseFile("/nonexistent/agora.conf");
    EXPECT_FALSE(result.success);
}

// ============================================================================
// Typed Getters
// ============================================================================

TEST_F(ConfigTest, IntRejectsTrailingGarbage) {
    config_.Set("n", "12blocks");
    EXPECT_FALSE(config_.TryGetInt("n").has_value());
    EXPECT_EQ(config_.GetInt("n", 7), 7);
}

TEST_F(ConfigTest, BoolSpellings) {
    ASSERT_TRUE(config_.ParseString("a = yes\nb = OFF\nc = 1\nd = maybe\n").success);
    EXPECT_TRUE(config_.GetBool("a", false));
    EXPECT_FALSE(config_.GetBool("b", true));
    EXPECT_TRUE(config_.GetBool("c", false));
    EXPECT_FALSE(config_.TryGetBool("d").has_value());
}

TEST_F(ConfigTest, DefaultsDoNotOverride) {
    config_.Set("level", "debug", "log");
    config_.SetDefault("level", "info", "log");
    config_.SetDefault("file", "agora.log", "log");
    EXPECT_EQ(config_.GetString("level", "", "log"), "debug");
    EXPECT_EQ(config_.GetString("file", "", "log"), "agora.log");
}

TEST_F(ConfigTest, ExpandsEnvironment) {
    setenv("AGORA_TEST_DIR", "/data", 1);
    ASSERT_TRUE(config_.ParseString("path = ${AGORA_TEST_DIR}/state\n").success);
    EXPECT_EQ(config_.GetString("path", ""), "/data/state");
    unsetenv("AGORA_TEST_DIR");
}

// ============================================================================
// Validation
// ============================================================================

TEST_F(ConfigTest, RequiredAndUnknownKeys) {
    ASSERT_TRUE(config_.ParseString(
        "[governance]\nquorum = 0.1\nquorom = 0.2\n[other]\nanything = 1\n").success);
    config_.AllowKey(ConfigKeys::QUORUM, ConfigKeys::GOVERNANCE_SECTION);
    config_.RequireKey(ConfigKeys::VOTING_PERIOD, ConfigKeys::GOVERNANCE_SECTION);
    
    auto errors = config_.Validate();
    ASSERT_EQ(errors.size(), 2u);
    
    bool sawMissing = false;
    bool sawUnknown = false;
    for (const auto& error : errors) {
        sawMissing |= error.find("voting_period") != std::string::npos;
        sawUnknown |= error.find("quorom") != std::string::npos;
    }
    EXPECT_TRUE(sawMissing);
    EXPECT_TRUE(sawUnknown);
}

TEST_F(ConfigTest, SectionsAndDump) {
    ASSERT_TRUE(config_.ParseString("[log]\nlevel = warn\n[governance]\nquorum = 0.1\n").success);
    
    auto sections = config_.GetSections();
    ASSERT_EQ(sections.size(), 2u);
    EXPECT_EQ(sections[0], "governance");
    EXPECT_EQ(sections[1], "log");
    
    ConfigManager reparsed;
    ASSERT_TRUE(reparsed.ParseString(config_.Dump()).success);
    EXPECT_EQ(reparsed.GetString("level", "", "log"), "warn");
}

} // namespace test
} // namespace util
} // namespace agora
