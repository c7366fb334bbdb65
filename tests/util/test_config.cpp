// Satchel - Configuration File Parser Tests
// Copyright (c) 2024 Satchel Developers
// MIT License

#include <gtest/gtest.h>

#include "satchel/util/config.h"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <unistd.h>

namespace satchel {
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
        char filename[] = "/tmp/satchel_config_test_XXXXXX";
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

TEST_F(ConfigTest, ParseComments) {
    std::string content = R"(
# This is a comment
; This is also a comment
# derivation=strict
)";
    auto result = config_.ParseString(content);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(config_.Size(), 0u);
}

TEST_F(ConfigTest, ParseKeyValuePair) {
    auto result = config_.ParseString("key=value");
    EXPECT_TRUE(result.success);
    EXPECT_TRUE(config_.HasKey("key"));
    EXPECT_EQ(config_.GetString("key"), "value");
}

TEST_F(ConfigTest, ParseKeyWithSpaces) {
    auto result = config_.ParseString("  key   =   value with spaces  ");
    EXPECT_TRUE(result.success);
    EXPECT_EQ(config_.GetString("key"), "value with spaces");
}

TEST_F(ConfigTest, ParseQuotedValue) {
    config_.ParseString("a=\"quoted value\"\nb='single # quoted'");
    EXPECT_EQ(config_.GetString("a"), "quoted value");
    EXPECT_EQ(config_.GetString("b"), "single # quoted");
}

TEST_F(ConfigTest, ParseEscapeSequences) {
    config_.ParseString(R"(key="line1\nline2\t\"q\"")");
    EXPECT_EQ(config_.GetString("key"), "line1\nline2\t\"q\"");
}

TEST_F(ConfigTest, LaterDefinitionWins) {
    config_.ParseString("key=one\nkey=two");
    EXPECT_EQ(config_.GetString("key"), "two");
    EXPECT_EQ(config_.Size(), 1u);
}

// ============================================================================
// Sections
// ============================================================================

TEST_F(ConfigTest, ParseSection) {
    std::string content = R"(
global=1

[policy]
derivation=strict

[size.legacy]
input=148
)";
    auto result = config_.ParseString(content);
    ASSERT_TRUE(result.success) << result.ToString();

    EXPECT_EQ(config_.GetString("global"), "1");
    EXPECT_EQ(config_.GetString("derivation", "", "policy"), "strict");
    EXPECT_EQ(config_.GetUInt("input", 0, "size.legacy"), 148u);
    EXPECT_FALSE(config_.HasKey("derivation"));
    EXPECT_FALSE(config_.HasKey("input", "size.segwit"));
}

TEST_F(ConfigTest, GetSectionsAndKeys) {
    config_.ParseString("[dust]\np2pkh=546\np2wpkh=294\n[policy]\nderivation=strict\n");
    EXPECT_EQ(config_.GetSections(), (std::vector<std::string>{"dust", "policy"}));

    auto keys = config_.GetKeys("dust");
    ASSERT_EQ(keys.size(), 2u);
    EXPECT_EQ(keys[0], "p2pkh");
    EXPECT_EQ(keys[1], "p2wpkh");
    EXPECT_TRUE(config_.GetKeys("").empty());
}

// ============================================================================
// Typed Access
// ============================================================================

TEST_F(ConfigTest, GetInt) {
    config_.ParseString("pos=42\nneg=-7\nbad=12abc\nempty=");
    EXPECT_EQ(config_.GetInt("pos", 0), 42);
    EXPECT_EQ(config_.GetInt("neg", 0), -7);
    EXPECT_FALSE(config_.TryGetInt("bad").has_value());
    EXPECT_FALSE(config_.TryGetInt("empty").has_value());
    EXPECT_EQ(config_.GetInt("missing", 5), 5);
}

TEST_F(ConfigTest, GetUInt) {
    config_.ParseString("pos=546\nneg=-1");
    EXPECT_EQ(config_.GetUInt("pos", 0), 546u);
    EXPECT_FALSE(config_.TryGetUInt("neg").has_value());
    EXPECT_EQ(config_.GetUInt("neg", 9), 9u);
}

TEST_F(ConfigTest, GetBool) {
    config_.ParseString("a=true\nb=no\nc=ON\nd=0\ne=maybe");
    EXPECT_TRUE(config_.GetBool("a", false));
    EXPECT_FALSE(config_.GetBool("b", true));
    EXPECT_TRUE(config_.GetBool("c", false));
    EXPECT_FALSE(config_.GetBool("d", true));
    EXPECT_FALSE(config_.TryGetBool("e").has_value());
    EXPECT_TRUE(config_.GetBool("e", true));
}

TEST_F(ConfigTest, GetDouble) {
    config_.ParseString("ratio=0.2\nint=3\nbad=0.2x");
    EXPECT_DOUBLE_EQ(config_.GetDouble("ratio", 0), 0.2);
    EXPECT_DOUBLE_EQ(config_.GetDouble("int", 0), 3.0);
    EXPECT_FALSE(config_.TryGetDouble("bad").has_value());
    EXPECT_DOUBLE_EQ(config_.GetDouble("missing", 1.5), 1.5);
}

// ============================================================================
// Environment Variables
// ============================================================================

TEST_F(ConfigTest, ExpandEnvVars) {
    setenv("SATCHEL_TEST_VAR", "expanded", 1);
    EXPECT_EQ(ConfigManager::ExpandEnvVars("pre_${SATCHEL_TEST_VAR}_post"), "pre_expanded_post");
    unsetenv("SATCHEL_TEST_VAR");
}

TEST_F(ConfigTest, ExpandEnvVarsUndefined) {
    unsetenv("SATCHEL_UNDEFINED_VAR");
    EXPECT_EQ(ConfigManager::ExpandEnvVars("a${SATCHEL_UNDEFINED_VAR}b"), "ab");
    EXPECT_EQ(ConfigManager::ExpandEnvVars("${unterminated"), "${unterminated");
}

TEST_F(ConfigTest, ExpandEnvVarsInConfig) {
    setenv("SATCHEL_TEST_MODE", "retry", 1);
    config_.ParseString("[policy]\nderivation=${SATCHEL_TEST_MODE}");
    EXPECT_EQ(config_.GetString("derivation", "", "policy"), "retry");
    unsetenv("SATCHEL_TEST_MODE");
}

// ============================================================================
// Files
// ============================================================================

TEST_F(ConfigTest, ParseFile) {
    std::string filename = CreateTempFile("[dust]\np2wpkh = 330\n");
    auto result = config_.ParseFile(filename);
    ASSERT_TRUE(result.success) << result.ToString();
    EXPECT_EQ(config_.GetUInt("p2wpkh", 0, "dust"), 330u);
}

TEST_F(ConfigTest, ParseNonexistentFile) {
    auto result = config_.ParseFile("/nonexistent/path/satchel.conf");
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.errorMessage.find("Cannot open"), std::string::npos);
}

TEST_F(ConfigTest, ErrorReportsFileAndLine) {
    std::string filename = CreateTempFile("[policy]\nderivation=strict\nnot a pair\n");
    auto result = config_.ParseFile(filename);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorFile, filename);
    EXPECT_EQ(result.errorLine, 3);
    EXPECT_EQ(result.ToString(), filename + ":3: Expected key=value");
    // Entries before the error are kept
    EXPECT_TRUE(config_.HasKey("derivation", "policy"));
}

// ============================================================================
// Programmatic Access
// ============================================================================

TEST_F(ConfigTest, SetValue) {
    config_.Set("key", "value");
    config_.Set("key", "other", "section");
    EXPECT_EQ(config_.GetString("key"), "value");
    EXPECT_EQ(config_.GetString("key", "", "section"), "other");
    EXPECT_EQ(config_.Size(), 2u);
}

TEST_F(ConfigTest, Clear) {
    config_.ParseString("a=1\nb=2");
    config_.Clear();
    EXPECT_EQ(config_.Size(), 0u);
    EXPECT_FALSE(config_.HasKey("a"));
}

// ============================================================================
// Error Handling
// ============================================================================

TEST_F(ConfigTest, InvalidSectionHeader) {
    auto result = config_.ParseString("[unclosed\nkey=value");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorLine, 1);
}

TEST_F(ConfigTest, EmptySectionName) {
    EXPECT_FALSE(config_.ParseString("[  ]").success);
}

TEST_F(ConfigTest, EmptyKey) {
    auto result = config_.ParseString("=value");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorMessage, "Empty key");
}

TEST_F(ConfigTest, InvalidKeyCharacter) {
    auto result = config_.ParseString("bad key=value");
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.errorMessage.find("Invalid character"), std::string::npos);
}

TEST_F(ConfigTest, LineTooLong) {
    std::string content = "key=" + std::string(MAX_LINE_LENGTH + 1, 'x');
    auto result = config_.ParseString(content);
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.errorMessage.find("too long"), std::string::npos);
}

TEST_F(ConfigTest, ParseBool) {
    EXPECT_EQ(ConfigManager::ParseBool("Yes"), true);
    EXPECT_EQ(ConfigManager::ParseBool("off"), false);
    EXPECT_FALSE(ConfigManager::ParseBool("2").has_value());
}

} // namespace test
} // namespace util
} // namespace satchel
