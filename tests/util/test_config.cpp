// CHAMA - Configuration File Parser Tests
// Copyright (c) 2024 CHAMA Developers
// MIT License

#include <gtest/gtest.h>

#include "chama/util/config.h"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <unistd.h>

namespace chama {
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
        char filename[] = "/tmp/chama_config_test_XXXXXX";
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
    auto result = config_.ParseString(
        "# comment\n"
        "; another comment\n"
        "\n"
        "   \n"
        "name=Savers\n");
    EXPECT_TRUE(result.success);
    EXPECT_EQ(config_.Size(), 1u);
    EXPECT_EQ(config_.GetString("name", ""), "Savers");
}

TEST_F(ConfigTest, ParseSections) {
    auto result = config_.ParseString(
        "level=info\n"
        "[group]\n"
        "name = Savers\n"
        "maxmembers = 12\n"
        "[engine]\n"
        "quorumpercent=60\n");
    ASSERT_TRUE(result.success);

    EXPECT_EQ(config_.GetString("level", ""), "info");
    EXPECT_EQ(config_.GetString("name", "", "group"), "Savers");
    EXPECT_EQ(config_.GetInt("maxmembers", 0, "group"), 12);
    EXPECT_EQ(config_.GetInt("quorumpercent", 0, "engine"), 60);
    EXPECT_FALSE(config_.HasKey("name"));

    auto sections = config_.GetSections();
    ASSERT_EQ(sections.size(), 2u);
    EXPECT_EQ(sections[0], "engine");
    EXPECT_EQ(sections[1], "group");
}

TEST_F(ConfigTest, KeysAreLowercased) {
    ASSERT_TRUE(config_.ParseString("[group]\nMaxMembers=5\n").success);
    EXPECT_TRUE(config_.HasKey("maxmembers", "group"));
}

TEST_F(ConfigTest, QuotedValues) {
    ASSERT_TRUE(config_.ParseString("name=\"Market Women\"\nother='single'\n").success);
    EXPECT_EQ(config_.GetString("name", ""), "Market Women");
    EXPECT_EQ(config_.GetString("other", ""), "single");
}

TEST_F(ConfigTest, BareFlagsAndNegation) {
    ASSERT_TRUE(config_.ParseString("[group]\napprovalrequired\nnoemergencywithdraw\n").success);
    EXPECT_EQ(config_.TryGetBool("approvalrequired", "group"), true);
    EXPECT_EQ(config_.TryGetBool("emergencywithdraw", "group"), false);
}

TEST_F(ConfigTest, ContinuationLines) {
    ASSERT_TRUE(config_.ParseString("members=alice,\\\nbob,\\\ncarol\n").success);
    auto list = config_.GetList("members");
    ASSERT_EQ(list.size(), 3u);
    EXPECT_EQ(list[2], "carol");
}

TEST_F(ConfigTest, DuplicateKeyWarns) {
    auto result = config_.ParseString("name=a\nname=b\n", "dup.conf");
    EXPECT_TRUE(result.success);
    ASSERT_EQ(result.warnings.size(), 1u);
    EXPECT_NE(result.warnings[0].find("dup.conf:2"), std::string::npos);
    EXPECT_EQ(config_.GetString("name", ""), "b");
}

TEST_F(ConfigTest, EntryRecordsSource) {
    ASSERT_TRUE(config_.ParseString("\n[group]\nname=x\n", "chama.conf").success);
    auto entry = config_.GetEntry("name", "group");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->source, "chama.conf");
    EXPECT_EQ(entry->lineNumber, 3);
    EXPECT_EQ(entry->section, "group");
}

// ============================================================================
// Error Tests
// ============================================================================

TEST_F(ConfigTest, MissingBracket) {
    auto result = config_.ParseString("[group\nname=x\n", "bad.conf");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorLine, 1);
    EXPECT_EQ(result.ToString(), "bad.conf:1: Missing closing bracket in section header");
}

TEST_F(ConfigTest, InvalidKey) {
    auto result = config_.ParseString("bad key=1\n");
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.errorMessage.find("Invalid key"), std::string::npos);
}

TEST_F(ConfigTest, LineTooLong) {
    auto result = config_.ParseString("name=" + std::string(MAX_LINE_LENGTH, 'x') + "\n");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorLine, 1);
}

TEST_F(ConfigTest, MissingFile) {
    auto result = config_.ParseFile("/nonexistent/chama.conf");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.ToString(), "Cannot open file: /nonexistent/chama.conf");
}

// ============================================================================
// Typed Values
// ============================================================================

TEST_F(ConfigTest, Integers) {
    ASSERT_TRUE(config_.ParseString("a=42\nb=-7\nc=12abc\nd=\n").success);
    EXPECT_EQ(config_.TryGetInt("a"), 42);
    EXPECT_EQ(config_.TryGetInt("b"), -7);
    EXPECT_FALSE(config_.TryGetInt("c").has_value());
    EXPECT_FALSE(config_.TryGetInt("d").has_value());
    EXPECT_EQ(config_.GetInt("missing", 9), 9);
}

TEST_F(ConfigTest, Booleans) {
    ASSERT_TRUE(config_.ParseString("a=yes\nb=Off\nc=1\nd=maybe\n").success);
    EXPECT_EQ(config_.TryGetBool("a"), true);
    EXPECT_EQ(config_.TryGetBool("b"), false);
    EXPECT_EQ(config_.TryGetBool("c"), true);
    EXPECT_FALSE(config_.TryGetBool("d").has_value());
    EXPECT_TRUE(config_.GetBool("d", true));
}

TEST_F(ConfigTest, Durations) {
    ASSERT_TRUE(config_.ParseString("a=90\nb=2h\nc=1w\nd=3x\n").success);
    EXPECT_EQ(config_.TryGetDuration("a"), 90);
    EXPECT_EQ(config_.TryGetDuration("b"), 7200);
    EXPECT_EQ(config_.TryGetDuration("c"), 604800);
    EXPECT_FALSE(config_.TryGetDuration("d").has_value());
}

TEST_F(ConfigTest, Lists) {
    ASSERT_TRUE(config_.ParseString("cats = group , contrib,payout\n").success);
    auto list = config_.GetList("cats");
    ASSERT_EQ(list.size(), 3u);
    EXPECT_EQ(list[0], "group");
    EXPECT_EQ(list[1], "contrib");
    EXPECT_TRUE(config_.GetList("missing").empty());
}

// ============================================================================
// Overrides and Files
// ============================================================================

TEST_F(ConfigTest, OverrideReplacesFileValue) {
    ASSERT_TRUE(config_.ParseString("[group]\nmaxmembers=5\n").success);
    ASSERT_TRUE(config_.ParseOverride("group.maxmembers=8").success);
    ASSERT_TRUE(config_.ParseOverride("level=debug").success);

    EXPECT_EQ(config_.GetInt("maxmembers", 0, "group"), 8);
    EXPECT_EQ(config_.GetEntry("maxmembers", "group")->source, "<override>");
    EXPECT_EQ(config_.GetString("level", ""), "debug");

    EXPECT_FALSE(config_.ParseOverride("group.maxmembers").success);
}

TEST_F(ConfigTest, ParseFile) {
    std::string path = CreateTempFile("[engine]\nmaxmissed=4\n");
    auto result = config_.ParseFile(path);
    ASSERT_TRUE(result.success);
    EXPECT_EQ(config_.GetInt("maxmissed", 0, "engine"), 4);
    EXPECT_EQ(config_.GetEntry("maxmissed", "engine")->source, path);
}

TEST_F(ConfigTest, EnvironmentExpansion) {
    setenv("CHAMA_TEST_NAME", "Savers", 1);
    EXPECT_EQ(ConfigManager::ExpandEnvVars("${CHAMA_TEST_NAME} club"), "Savers club");
    EXPECT_EQ(ConfigManager::ExpandEnvVars("$CHAMA_TEST_NAME!"), "Savers!");
    EXPECT_EQ(ConfigManager::ExpandEnvVars("${CHAMA_TEST_UNSET_VAR}x"), "x");
    EXPECT_EQ(ConfigManager::ExpandEnvVars("cost $"), "cost $");
    unsetenv("CHAMA_TEST_NAME");
}

TEST_F(ConfigTest, SetAndDump) {
    config_.Set("level", "info");
    config_.Set("name", "Savers", "group");

    std::string dump = config_.Dump();
    EXPECT_NE(dump.find("level=info"), std::string::npos);
    EXPECT_NE(dump.find("[group]"), std::string::npos);
    EXPECT_NE(dump.find("name=Savers  # <set>"), std::string::npos);
    EXPECT_LT(dump.find("level=info"), dump.find("[group]"));

    EXPECT_EQ(config_.GetKeys("group"), std::vector<std::string>{"name"});
}

} // namespace test
} // namespace util
} // namespace chama
