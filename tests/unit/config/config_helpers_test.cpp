#include "../../common/test_helpers.h"
#include <gtest/gtest.h>
#include <chatmine/config/config_helpers.h>

#include <cstdlib>

using namespace chatmine;
using namespace chatmine::config;
using namespace chatmine::test;

class ConfigHelpersTest : public ChatmineTest {};

TEST_F(ConfigHelpersTest, ParsesSectionValues) {
    auto path = write_file(tempDir / "config.toml", R"(
# comment
[other]
max_threads_per_db = 5

[extractor]
max_threads_per_db = 10   # trailing comment
cursor_user_dir = "/data/Cursor # not a comment"
)");
    EXPECT_EQ(parse_config_value(path, "extractor", "max_threads_per_db"), "10");
    EXPECT_EQ(parse_config_value(path, "other", "max_threads_per_db"), "5");
    EXPECT_EQ(parse_config_value(path, "extractor", "cursor_user_dir"),
              "/data/Cursor # not a comment");
    EXPECT_EQ(parse_config_value(path, "extractor", "missing"), "");
    EXPECT_EQ(parse_config_value(tempDir / "absent.toml", "extractor", "x"), "");
}

TEST_F(ConfigHelpersTest, DottedKeysWorkOutsideTheSection) {
    auto path = write_file(tempDir / "config.toml", "extractor.prefer_composer = false\n");
    EXPECT_EQ(parse_config_value(path, "extractor", "prefer_composer"), "false");
}

TEST(ConfigParseTest, Booleans) {
    EXPECT_EQ(parse_bool("TRUE"), true);
    EXPECT_EQ(parse_bool(" off "), false);
    EXPECT_EQ(parse_bool("1"), true);
    EXPECT_FALSE(parse_bool("maybe").has_value());
}

TEST(ConfigParseTest, Sizes) {
    EXPECT_EQ(parse_size("0"), 0u);
    EXPECT_EQ(parse_size("250"), 250u);
    EXPECT_FALSE(parse_size("-1").has_value());
    EXPECT_FALSE(parse_size("12abc").has_value());
    EXPECT_FALSE(parse_size("").has_value());
    EXPECT_FALSE(parse_size("99999999999999999999999999").has_value());
}

TEST_F(ConfigHelpersTest, MissingFileGivesDefaults) {
    auto cfg = loadExtractorConfig(tempDir / "none.toml");
    ASSERT_TRUE(cfg);
    const auto& opts = cfg.value().normalizer;
    EXPECT_TRUE(opts.preferModern);
    EXPECT_EQ(opts.maxThreadsPerDb, normalize::kDefaultMaxThreadsPerDb);
    EXPECT_EQ(opts.maxMessagesPerThread, normalize::kDefaultMaxMessagesPerThread);
    EXPECT_FALSE(opts.redactSecrets);
    EXPECT_FALSE(cfg.value().cursorUserDir.has_value());

    auto required = loadExtractorConfig(tempDir / "none.toml", /*mustExist=*/true);
    ASSERT_FALSE(required);
    EXPECT_EQ(required.error().code, ErrorCode::FileNotFound);
}

TEST_F(ConfigHelpersTest, LoadsEveryExtractorKey) {
    auto path = write_file(tempDir / "config.toml", R"([extractor]
enable_composer = false
enable_chatdata = yes
prefer_composer = false
max_threads_per_db = 0
max_messages_per_thread = 25
redact_secrets = true
cursor_user_dir = '/srv/cursor/User'
)");
    auto cfg = loadExtractorConfig(path);
    ASSERT_TRUE(cfg);
    const auto& opts = cfg.value().normalizer;
    EXPECT_FALSE(opts.isAdapterEnabled("composer"));
    EXPECT_TRUE(opts.isAdapterEnabled("chatdata"));
    EXPECT_FALSE(opts.preferModern);
    EXPECT_EQ(opts.maxThreadsPerDb, 0u);
    EXPECT_EQ(opts.maxMessagesPerThread, 25u);
    EXPECT_TRUE(opts.redactSecrets);
    EXPECT_EQ(cfg.value().cursorUserDir, std::filesystem::path("/srv/cursor/User"));
}

TEST_F(ConfigHelpersTest, BadValueIsRejected) {
    auto path = write_file(tempDir / "config.toml", "[extractor]\nmax_threads_per_db = lots\n");
    auto cfg = loadExtractorConfig(path);
    ASSERT_FALSE(cfg);
    EXPECT_EQ(cfg.error().code, ErrorCode::InvalidArgument);
    EXPECT_NE(cfg.error().message.find("max_threads_per_db"), std::string::npos);
}

TEST_F(ConfigHelpersTest, ConfigPathResolutionOrder) {
    const char* savedConfig = std::getenv("CHATMINE_CONFIG");
    const std::string saved = savedConfig ? savedConfig : "";

    EXPECT_EQ(get_config_path("/explicit.toml"), std::filesystem::path("/explicit.toml"));

    ::setenv("CHATMINE_CONFIG", "/from/env.toml", 1);
    EXPECT_EQ(get_config_path(), std::filesystem::path("/from/env.toml"));
    ::unsetenv("CHATMINE_CONFIG");

    const char* savedXdg = std::getenv("XDG_CONFIG_HOME");
    const std::string xdg = savedXdg ? savedXdg : "";
    ::setenv("XDG_CONFIG_HOME", tempDir.c_str(), 1);
    EXPECT_EQ(get_config_path(), tempDir / "chatmine" / "config.toml");

    if (savedXdg)
        ::setenv("XDG_CONFIG_HOME", xdg.c_str(), 1);
    else
        ::unsetenv("XDG_CONFIG_HOME");
    if (savedConfig)
        ::setenv("CHATMINE_CONFIG", saved.c_str(), 1);
}
