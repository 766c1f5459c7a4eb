#include <gtest/gtest.h>
#include <langlint/config.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace langlint;
namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = fs::temp_directory_path() / "langlint_config_test";
        fs::remove_all(test_dir_);
        fs::create_directories(test_dir_);
        unsetenv("LANGLINT_TARGET_LANG");
        unsetenv("LANGLINT_SOURCE_LANG");
        unsetenv("LANGLINT_TRANSLATOR");
    }

    void TearDown() override {
        unsetenv("LANGLINT_TARGET_LANG");
        unsetenv("LANGLINT_SOURCE_LANG");
        unsetenv("LANGLINT_TRANSLATOR");
        fs::remove_all(test_dir_);
    }

    void write(const fs::path& path, const std::string& content) {
        std::ofstream out(path, std::ios::binary);
        out << content;
    }

    fs::path test_dir_;
};

TEST_F(ConfigTest, Defaults) {
    Config config;
    EXPECT_EQ(config.source_lang, std::vector<std::string>{"auto"});
    EXPECT_EQ(config.target_lang, "en");
    EXPECT_EQ(config.translator, "google");
    EXPECT_FALSE(config.dry_run);
    EXPECT_TRUE(config.backup);
    EXPECT_EQ(config.primary_source_lang(), "auto");
}

TEST_F(ConfigTest, ParsesJson) {
    auto config = Config::from_json_string(R"({
        "include": ["src", "lib"],
        "exclude": "*.min.js",
        "source_lang": ["zh", "ja"],
        "target_lang": "fr",
        "translator": "mock",
        "dry_run": true,
        "max_concurrency": 5,
        "retry_count": 2,
        "delay_min_ms": 10,
        "delay_max_ms": 20,
        "unknown_key": {"ignored": true}
    })");
    ASSERT_TRUE(config.ok());
    EXPECT_EQ(config.value().include, (std::vector<std::string>{"src", "lib"}));
    EXPECT_EQ(config.value().exclude, std::vector<std::string>{"*.min.js"});
    EXPECT_EQ(config.value().primary_source_lang(), "zh");
    EXPECT_EQ(config.value().target_lang, "fr");
    EXPECT_EQ(config.value().translator, "mock");
    EXPECT_TRUE(config.value().dry_run);
    EXPECT_TRUE(config.value().backup);
    EXPECT_EQ(config.value().max_concurrency, 5u);

    PacingConfig pacing = config.value().pacing();
    EXPECT_EQ(pacing.retry_count, 2u);
    EXPECT_EQ(pacing.delay_min_ms, 10u);
    EXPECT_EQ(pacing.delay_max_ms, 20u);
    EXPECT_EQ(config.value().google_config().pacing.max_concurrency, 5u);
    EXPECT_EQ(config.value().mock_config().pacing.max_concurrency, 5u);
}

TEST_F(ConfigTest, RejectsMalformedJson) {
    EXPECT_EQ(Config::from_json_string("{").error_code(), ErrorCode::PARSE_ERROR);
    EXPECT_EQ(Config::from_json_string("[1, 2]").error_code(), ErrorCode::PARSE_ERROR);
    EXPECT_EQ(Config::from_json_string(R"({"max_concurrency": "many"})").error_code(),
              ErrorCode::PARSE_ERROR);
    EXPECT_EQ(Config::from_json_string(R"({"dry_run": "yes"})").error_code(),
              ErrorCode::PARSE_ERROR);
}

TEST_F(ConfigTest, RejectsNegativeCounts) {
    for (const char* key : {"retry_count", "max_concurrency", "delay_min_ms", "delay_max_ms"}) {
        auto config = Config::from_json_string(std::string("{\"") + key + "\": -1}");
        ASSERT_FALSE(config.ok()) << key;
        EXPECT_EQ(config.error_code(), ErrorCode::INVALID_INPUT) << key;
        EXPECT_NE(config.error().message().find(key), std::string::npos);
    }

    auto zero = Config::from_json_string(R"({"retry_count": 0, "max_concurrency": 1})");
    ASSERT_TRUE(zero.ok());
    EXPECT_EQ(zero.value().retry_count, 0u);
    EXPECT_EQ(zero.value().max_concurrency, 1u);
}

TEST_F(ConfigTest, LoadFromFile) {
    fs::path path = test_dir_ / "custom.json";
    write(path, R"({"target_lang": "de"})");
    auto config = Config::load_from_file(path);
    ASSERT_TRUE(config.ok());
    EXPECT_EQ(config.value().target_lang, "de");

    auto missing = Config::load_from_file(test_dir_ / "missing.json");
    EXPECT_EQ(missing.error_code(), ErrorCode::NOT_FOUND);

    fs::path broken = test_dir_ / "broken.json";
    write(broken, "{\"target_lang\": ");
    auto bad = Config::load_from_file(broken);
    ASSERT_FALSE(bad.ok());
    EXPECT_EQ(bad.error_code(), ErrorCode::PARSE_ERROR);
    EXPECT_EQ(bad.error().detail(), broken.string());
}

TEST_F(ConfigTest, FindAndLoad) {
    auto defaults = Config::find_and_load(test_dir_);
    ASSERT_TRUE(defaults.ok());
    EXPECT_EQ(defaults.value().target_lang, "en");

    write(test_dir_ / "langlint.json", R"({"target_lang": "ja"})");
    EXPECT_EQ(Config::find_and_load(test_dir_).value().target_lang, "ja");

    // The dotfile takes precedence
    write(test_dir_ / ".langlint.json", R"({"target_lang": "ko"})");
    EXPECT_EQ(Config::find_and_load(test_dir_).value().target_lang, "ko");
}

TEST_F(ConfigTest, EnvironmentOverrides) {
    setenv("LANGLINT_TARGET_LANG", "zh-CN", 1);
    setenv("LANGLINT_SOURCE_LANG", "en", 1);
    setenv("LANGLINT_TRANSLATOR", "mock", 1);

    Config config;
    config.apply_env();
    EXPECT_EQ(config.target_lang, "zh-CN");
    EXPECT_EQ(config.source_lang, std::vector<std::string>{"en"});
    EXPECT_EQ(config.translator, "mock");
}

TEST_F(ConfigTest, EmptyEnvironmentIsIgnored) {
    setenv("LANGLINT_TARGET_LANG", "", 1);
    Config config;
    config.apply_env();
    EXPECT_EQ(config.target_lang, "en");
}

TEST_F(ConfigTest, IncludeAndExclude) {
    Config config;
    EXPECT_TRUE(config.is_included("anything/at/all.py"));

    config.include = {"src"};
    config.exclude = {"*.min.js", "node_modules"};
    EXPECT_TRUE(config.is_included("src/app.js"));
    EXPECT_FALSE(config.is_included("lib/app.js"));
    EXPECT_FALSE(config.is_included("src/app.min.js"));
    EXPECT_FALSE(config.is_included("src/node_modules/pkg/index.js"));

    config.include = {"*.py"};
    config.exclude.clear();
    EXPECT_TRUE(config.is_included("tools/build.py"));
    EXPECT_FALSE(config.is_included("tools/build.sh"));
}

TEST_F(ConfigTest, MergeKeepsNonDefaultFields) {
    Config base;
    base.target_lang = "fr";
    base.include = {"src"};

    Config overrides;
    overrides.translator = "mock";
    overrides.max_concurrency = 8;

    Config merged = base.merge(overrides);
    EXPECT_EQ(merged.target_lang, "fr");
    EXPECT_EQ(merged.include, std::vector<std::string>{"src"});
    EXPECT_EQ(merged.translator, "mock");
    EXPECT_EQ(merged.max_concurrency, 8u);
}
