// ZKDROP - Configuration File Parser Tests
// Copyright (c) 2024 ZKDROP Developers
// MIT License

#include <gtest/gtest.h>

#include "zkdrop/util/config.h"

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

#include <unistd.h>

namespace zkdrop {
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
        char filename[] = "/tmp/zkdrop_config_test_XXXXXX";
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

    static bool Contains(const std::vector<std::string>& errors, const std::string& needle) {
        return std::any_of(errors.begin(), errors.end(), [&](const std::string& e) {
            return e.find(needle) != std::string::npos;
        });
    }

    ConfigManager config_;
    std::vector<std::string> tempFiles_;
};

/// Restores an environment variable when the test ends
class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value) : name_(name) {
        if (const char* old = std::getenv(name)) {
            had_ = true;
            old_ = old;
        }
        if (value) {
            setenv(name, value, 1);
        } else {
            unsetenv(name);
        }
    }

    ~ScopedEnv() {
        if (had_) {
            setenv(name_.c_str(), old_.c_str(), 1);
        } else {
            unsetenv(name_.c_str());
        }
    }

private:
    std::string name_;
    std::string old_;
    bool had_{false};
};

// ============================================================================
// Basic Parsing
// ============================================================================

TEST_F(ConfigTest, ParseEmptyString) {
    auto result = config_.ParseString("");
    EXPECT_TRUE(result.success);
    EXPECT_EQ(config_.Size(), 0u);
}

TEST_F(ConfigTest, ParseKeyValue) {
    auto result = config_.ParseString(
        "datadir=/var/lib/zkdrop\n"
        "dbcache = 16\n"
        "  loglevel=debug  \n");
    ASSERT_TRUE(result.success) << result.ToString();

    EXPECT_EQ(config_.GetString(ConfigKeys::DATADIR, ""), "/var/lib/zkdrop");
    EXPECT_EQ(config_.GetInt(ConfigKeys::DBCACHE, 0), 16);
    EXPECT_EQ(config_.GetString(ConfigKeys::LOGLEVEL, ""), "debug");
    EXPECT_EQ(config_.Size(), 3u);
}

TEST_F(ConfigTest, CommentsAndBlankLines) {
    auto result = config_.ParseString(
        "# a comment\n"
        "; another comment\n"
        "\n"
        "   \n"
        "memory=1\n");
    ASSERT_TRUE(result.success);
    EXPECT_EQ(config_.Size(), 1u);
    EXPECT_TRUE(config_.GetBool(ConfigKeys::MEMORY, false));
}

TEST_F(ConfigTest, BareKeyIsTrue) {
    ASSERT_TRUE(config_.ParseString("printtoconsole\n").success);
    EXPECT_EQ(config_.TryGetBool(ConfigKeys::PRINTTOCONSOLE), true);
}

TEST_F(ConfigTest, NegatedBareKeyIsFalse) {
    ASSERT_TRUE(config_.ParseString("nomemory\n").success);
    EXPECT_TRUE(config_.HasKey(ConfigKeys::MEMORY));
    EXPECT_FALSE(config_.HasKey("nomemory"));
    EXPECT_EQ(config_.TryGetBool(ConfigKeys::MEMORY), false);
}

TEST_F(ConfigTest, QuotedValues) {
    ASSERT_TRUE(config_.ParseString(
        "a=\"hello world\"\n"
        "b='single \\n quoted'\n"
        "c=\"tab\\there\"\n"
        "d=\"unterminated\n").success);

    EXPECT_EQ(config_.GetString("a", ""), "hello world");
    EXPECT_EQ(config_.GetString("b", ""), "single \\n quoted");
    EXPECT_EQ(config_.GetString("c", ""), "tab\there");
    EXPECT_EQ(config_.GetString("d", ""), "\"unterminated");
}

TEST_F(ConfigTest, Sections) {
    ASSERT_TRUE(config_.ParseString(
        "contract=0x01\n"
        "[rpc]\n"
        "port=8545\n"
        "[ storage ]\n"
        "dbcache=32\n").success);

    EXPECT_TRUE(config_.HasKey("contract"));
    EXPECT_TRUE(config_.HasKey("port", "rpc"));
    EXPECT_FALSE(config_.HasKey("port"));
    EXPECT_EQ(config_.GetInt("port", 0, "rpc"), 8545);
    EXPECT_EQ(config_.GetInt("dbcache", 0, "storage"), 32);
    EXPECT_EQ(config_.GetInt("dbcache", 7), 7);
}

TEST_F(ConfigTest, RepeatedKeyLastValueWins) {
    ASSERT_TRUE(config_.ParseString(
        "debug=claim\n"
        "debug=rpc,db\n").success);

    EXPECT_EQ(config_.GetString(ConfigKeys::DEBUG, ""), "rpc,db");

    auto list = config_.GetList(ConfigKeys::DEBUG);
    ASSERT_EQ(list.size(), 3u);
    EXPECT_EQ(list[0], "claim");
    EXPECT_EQ(list[1], "rpc");
    EXPECT_EQ(list[2], "db");
}

TEST_F(ConfigTest, GetListSkipsEmptyItems) {
    ASSERT_TRUE(config_.ParseString("debug= a , ,b,\n").success);
    auto list = config_.GetList(ConfigKeys::DEBUG);
    ASSERT_EQ(list.size(), 2u);
    EXPECT_EQ(list[0], "a");
    EXPECT_EQ(list[1], "b");
    EXPECT_TRUE(config_.GetList("missing").empty());
}

// ============================================================================
// Parse Errors
// ============================================================================

TEST_F(ConfigTest, MissingSectionBracket) {
    auto result = config_.ParseString("a=1\n[broken\nb=2\n", "test.conf");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorFile, "test.conf");
    EXPECT_EQ(result.errorLine, 2);
    EXPECT_NE(result.ToString().find("test.conf:2"), std::string::npos);
}

TEST_F(ConfigTest, InvalidKey) {
    auto result = config_.ParseString("bad key=1\n");
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.errorMessage.find("Invalid key"), std::string::npos);
    EXPECT_EQ(result.errorLine, 1);
}

TEST_F(ConfigTest, LineTooLong) {
    std::string line = "key=" + std::string(MAX_LINE_LENGTH, 'x') + "\n";
    auto result = config_.ParseString(line);
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.errorMessage.find("Line too long"), std::string::npos);
}

TEST_F(ConfigTest, SuccessToString) {
    EXPECT_EQ(ConfigParseResult::Success().ToString(), "OK");
    EXPECT_EQ(ConfigParseResult::Error("boom").ToString(), "boom");
    EXPECT_EQ(ConfigParseResult::Error("boom", "f.conf").ToString(), "boom (f.conf)");
}

// ============================================================================
// Typed Getters
// ============================================================================

TEST_F(ConfigTest, IntegerSuffixes) {
    ASSERT_TRUE(config_.ParseString(
        "a=4k\n"
        "b=2M\n"
        "c=1g\n"
        "d=12x\n"
        "e=-5\n"
        "f=abc\n").success);

    EXPECT_EQ(config_.TryGetInt("a"), 4096);
    EXPECT_EQ(config_.TryGetInt("b"), 2 * 1024 * 1024);
    EXPECT_EQ(config_.TryGetInt("c"), 1024LL * 1024 * 1024);
    EXPECT_FALSE(config_.TryGetInt("d").has_value());
    EXPECT_EQ(config_.TryGetInt("e"), -5);
    EXPECT_FALSE(config_.TryGetInt("f").has_value());
    EXPECT_FALSE(config_.TryGetInt("missing").has_value());
}

TEST_F(ConfigTest, UnsignedRejectsNegative) {
    ASSERT_TRUE(config_.ParseString("neg=-1\npos=42\n").success);
    EXPECT_FALSE(config_.TryGetUInt("neg").has_value());
    EXPECT_EQ(config_.GetUInt("neg", 9), 9u);
    EXPECT_EQ(config_.GetUInt("pos", 0), 42u);
}

TEST_F(ConfigTest, BooleanValues) {
    ASSERT_TRUE(config_.ParseString(
        "t1=true\nt2=YES\nt3=on\nt4=1\n"
        "f1=false\nf2=No\nf3=off\nf4=0\n"
        "bad=maybe\n").success);

    for (const char* key : {"t1", "t2", "t3", "t4"}) {
        EXPECT_EQ(config_.TryGetBool(key), true) << key;
    }
    for (const char* key : {"f1", "f2", "f3", "f4"}) {
        EXPECT_EQ(config_.TryGetBool(key), false) << key;
    }
    EXPECT_FALSE(config_.TryGetBool("bad").has_value());
    EXPECT_TRUE(config_.GetBool("bad", true));
    EXPECT_FALSE(config_.GetBool("missing", false));
}

// ============================================================================
// Expansion
// ============================================================================

TEST_F(ConfigTest, ExpandEnvVars) {
    ScopedEnv var("ZKDROP_TEST_VAR", "value");
    ScopedEnv unset("ZKDROP_TEST_UNSET", nullptr);

    EXPECT_EQ(ConfigManager::ExpandEnvVars("${ZKDROP_TEST_VAR}/x"), "value/x");
    EXPECT_EQ(ConfigManager::ExpandEnvVars("a${ZKDROP_TEST_UNSET}b"), "ab");
    EXPECT_EQ(ConfigManager::ExpandEnvVars("$ZKDROP_TEST_VAR"), "$ZKDROP_TEST_VAR");
    EXPECT_EQ(ConfigManager::ExpandEnvVars("${unclosed"), "${unclosed");
}

TEST_F(ConfigTest, EnvVarsExpandedInFileValues) {
    ScopedEnv var("ZKDROP_TEST_DIR", "/srv/drop");
    ASSERT_TRUE(config_.ParseString("datadir=${ZKDROP_TEST_DIR}/data\n").success);
    EXPECT_EQ(config_.GetString(ConfigKeys::DATADIR, ""), "/srv/drop/data");
}

TEST_F(ConfigTest, ExpandTilde) {
    ScopedEnv home("HOME", "/home/tester");

    EXPECT_EQ(ConfigManager::ExpandTilde("~/data"), "/home/tester/data");
    EXPECT_EQ(ConfigManager::ExpandTilde("~"), "/home/tester");
    EXPECT_EQ(ConfigManager::ExpandTilde("~other/data"), "~other/data");
    EXPECT_EQ(ConfigManager::ExpandTilde("/abs/path"), "/abs/path");
    EXPECT_EQ(ConfigManager::ExpandTilde(""), "");
}

TEST_F(ConfigTest, GetPathExpandsTilde) {
    ScopedEnv home("HOME", "/home/tester");
    config_.Set(ConfigKeys::LOGFILE, "~/zkdrop.log");
    EXPECT_EQ(config_.GetPath(ConfigKeys::LOGFILE), "/home/tester/zkdrop.log");
    EXPECT_EQ(config_.GetPath("missing", "~/fallback"), "/home/tester/fallback");
    EXPECT_EQ(config_.GetPath("missing"), "");
}

TEST_F(ConfigTest, DefaultDataDir) {
    {
        ScopedEnv home("HOME", "/home/tester");
        EXPECT_EQ(ConfigManager::GetDefaultDataDir(), "/home/tester/.zkdrop");
    }
    {
        ScopedEnv home("HOME", nullptr);
        EXPECT_EQ(ConfigManager::GetDefaultDataDir(), ".zkdrop");
    }
}

// ============================================================================
// Command Line
// ============================================================================

TEST_F(ConfigTest, CommandLineForms) {
    const char* argv[] = {
        "zkdropd",
        "-datadir=/tmp/drop",
        "--dbcache=64",
        "-loglevel", "trace",
        "-printtoconsole",
        "-nomemory",
        "positional",
    };
    int argc = static_cast<int>(sizeof(argv) / sizeof(argv[0]));

    auto result = config_.ParseCommandLine(argc, argv);
    ASSERT_TRUE(result.success) << result.ToString();

    EXPECT_EQ(config_.GetString(ConfigKeys::DATADIR, ""), "/tmp/drop");
    EXPECT_EQ(config_.GetInt(ConfigKeys::DBCACHE, 0), 64);
    EXPECT_EQ(config_.GetString(ConfigKeys::LOGLEVEL, ""), "trace");
    EXPECT_TRUE(config_.GetBool(ConfigKeys::PRINTTOCONSOLE, false));
    EXPECT_FALSE(config_.GetBool(ConfigKeys::MEMORY, true));
    EXPECT_FALSE(config_.HasKey("positional"));
}

TEST_F(ConfigTest, CommandLineFlagBeforeOption) {
    const char* argv[] = {"zkdropd", "-memory", "-dbcache=1"};
    ASSERT_TRUE(config_.ParseCommandLine(3, argv).success);
    EXPECT_EQ(config_.GetString(ConfigKeys::MEMORY, ""), "true");
    EXPECT_EQ(config_.GetInt(ConfigKeys::DBCACHE, 0), 1);
}

TEST_F(ConfigTest, CommandLineInvalidOption) {
    const char* argv[] = {"zkdropd", "-bad!key=1"};
    auto result = config_.ParseCommandLine(2, argv);
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.errorMessage.find("Invalid option"), std::string::npos);
}

// ============================================================================
// Precedence
// ============================================================================

TEST_F(ConfigTest, CommandLineOverridesFile) {
    const char* argv[] = {"zkdropd", "-dbcache=16"};
    ASSERT_TRUE(config_.ParseCommandLine(2, argv).success);
    ASSERT_TRUE(config_.ParseString("dbcache=4\nloglevel=warn\n").success);

    EXPECT_EQ(config_.GetInt(ConfigKeys::DBCACHE, 0), 16);
    EXPECT_EQ(config_.GetString(ConfigKeys::LOGLEVEL, ""), "warn");
}

TEST_F(ConfigTest, FileOverridesDefault) {
    config_.SetDefault(ConfigKeys::DBCACHE, "8");
    EXPECT_EQ(config_.GetInt(ConfigKeys::DBCACHE, 0), 8);

    ASSERT_TRUE(config_.ParseString("dbcache=4\n").success);
    EXPECT_EQ(config_.GetInt(ConfigKeys::DBCACHE, 0), 4);

    config_.SetDefault(ConfigKeys::DBCACHE, "2");
    EXPECT_EQ(config_.GetInt(ConfigKeys::DBCACHE, 0), 4);
}

TEST_F(ConfigTest, SetOverridesEverything) {
    const char* argv[] = {"zkdropd", "-loglevel=debug"};
    ASSERT_TRUE(config_.ParseCommandLine(2, argv).success);

    config_.Set(ConfigKeys::LOGLEVEL, "error");
    EXPECT_EQ(config_.GetString(ConfigKeys::LOGLEVEL, ""), "error");

    config_.Set(ConfigKeys::LOGLEVEL, "info");
    EXPECT_EQ(config_.GetString(ConfigKeys::LOGLEVEL, ""), "info");
    EXPECT_EQ(config_.GetList(ConfigKeys::LOGLEVEL).size(), 1u);
}

// ============================================================================
// Validation
// ============================================================================

TEST_F(ConfigTest, ValidateUnknownKeys) {
    config_.AllowKey(ConfigKeys::DATADIR);
    config_.Set(ConfigKeys::DATADIR, "/tmp");
    EXPECT_TRUE(config_.Validate().empty());

    config_.Set("bogus", "1");
    auto errors = config_.Validate();
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_TRUE(Contains(errors, "Unknown key: bogus"));
}

TEST_F(ConfigTest, ValidateWithoutAllowListAcceptsAnyKey) {
    config_.Set("anything", "goes");
    EXPECT_TRUE(config_.Validate().empty());
}

TEST_F(ConfigTest, ValidateMalformedValues) {
    ASSERT_TRUE(config_.ParseString(
        "dbcache=lots\n"
        "memory=maybe\n"
        "printtoconsole=sure\n").success);

    auto errors = config_.Validate();
    EXPECT_EQ(errors.size(), 3u);
    EXPECT_TRUE(Contains(errors, "Invalid dbcache value: lots"));
    EXPECT_TRUE(Contains(errors, "Invalid boolean for memory: maybe"));
    EXPECT_TRUE(Contains(errors, "Invalid boolean for printtoconsole: sure"));
}

TEST_F(ConfigTest, ValidateNegativeDbCache) {
    config_.Set(ConfigKeys::DBCACHE, "-4");
    EXPECT_TRUE(Contains(config_.Validate(), "Invalid dbcache value"));
}

// ============================================================================
// Files
// ============================================================================

TEST_F(ConfigTest, ParseFile) {
    std::string path = CreateTempFile(
        "# zkdrop configuration\n"
        "contract=0x00000000000000000000000000000000000000aa\n"
        "memory=1\n");

    auto result = config_.ParseFile(path);
    ASSERT_TRUE(result.success) << result.ToString();
    EXPECT_TRUE(config_.GetBool(ConfigKeys::MEMORY, false));
    EXPECT_EQ(config_.GetString(ConfigKeys::CONTRACT, ""),
              "0x00000000000000000000000000000000000000aa");
}

TEST_F(ConfigTest, ParseFileErrorReportsPath) {
    std::string path = CreateTempFile("ok=1\n[oops\n");
    auto result = config_.ParseFile(path);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorFile, path);
    EXPECT_EQ(result.errorLine, 2);
}

TEST_F(ConfigTest, ParseMissingFile) {
    auto result = config_.ParseFile("/nonexistent/zkdrop/zkdrop.conf");
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.errorMessage.find("Cannot open file"), std::string::npos);
}

// ============================================================================
// Utilities
// ============================================================================

TEST_F(ConfigTest, ClearRemovesEverything) {
    config_.Set("a", "1");
    config_.AllowKey("b");
    config_.Clear();
    EXPECT_EQ(config_.Size(), 0u);
    config_.Set("c", "1");
    EXPECT_TRUE(config_.Validate().empty());
}

TEST_F(ConfigTest, DumpListsSections) {
    ASSERT_TRUE(config_.ParseString("a=1\n[rpc]\nport=8545\n", "x.conf").success);
    std::string dump = config_.Dump();

    EXPECT_NE(dump.find("a=1  # x.conf:1"), std::string::npos);
    EXPECT_NE(dump.find("[rpc]\n"), std::string::npos);
    EXPECT_NE(dump.find("port=8545  # x.conf:3"), std::string::npos);
    EXPECT_LT(dump.find("a=1"), dump.find("[rpc]"));
}

} // namespace test
} // namespace util
} // namespace zkdrop
