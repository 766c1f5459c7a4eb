#include <gtest/gtest.h>
#include <langlint/pipeline.hpp>
#include <langlint/translate/mock_translator.hpp>

using namespace langlint;

namespace {

MockConfig quiet_mock() {
    MockConfig config;
    config.pacing.delay_min_ms = 0;
    config.pacing.delay_max_ms = 0;
    config.pacing.seed = 3;
    config.pacing.sleep = [](std::chrono::milliseconds) {};
    return config;
}

}  // namespace

class PipelineTest : public ::testing::Test {
protected:
    ParserRegistry registry = ParserRegistry::with_defaults();
    MockTranslator translator{quiet_mock()};
    Cache cache;
};

TEST_F(PipelineTest, TranslatesPythonComment) {
    Pipeline pipeline(registry, &translator);
    std::string original = "# 这是中文注释\ndef f():\n    pass\n";

    auto result = pipeline.translate(original, "f.py", "zh", "en");
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value().content, "# [EN] 这是中文注释\ndef f():\n    pass\n");
    EXPECT_EQ(result.value().units_total, 1u);
    EXPECT_EQ(result.value().units_translated, 1u);
    EXPECT_EQ(result.value().units_failed, 0u);
    EXPECT_TRUE(result.value().changed());
    EXPECT_EQ(result.value().parse.units[0].content, "[EN] 这是中文注释");
}

TEST_F(PipelineTest, AutoSourceGroupsByDetectedLanguage) {
    Pipeline pipeline(registry, &translator);
    std::string original =
        "# 这是中文注释\n"
        "# これは日本語のコメントです\n"
        "# abc\n"
        "x = 1\n";

    auto result = pipeline.translate(original, "mixed.py", "auto", "en");
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value().content,
              "# [EN] 这是中文注释\n"
              "# [EN] これは日本語のコメントです\n"
              "# abc\n"
              "x = 1\n");
    EXPECT_EQ(result.value().units_total, 3u);
    EXPECT_EQ(result.value().units_translated, 2u);
    EXPECT_EQ(result.value().units_skipped, 1u);
}

TEST_F(PipelineTest, FilterByUnitType) {
    Pipeline pipeline(registry, &translator);
    std::string original = "# 模块注释\ndef f():\n    \"\"\"函数说明文字\"\"\"\n";

    UnitFilter filter;
    filter.unit_types = {UnitType::DOCSTRING};
    auto result = pipeline.translate(original, "m.py", "zh", "fr", filter);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value().content,
              "# 模块注释\ndef f():\n    \"\"\"[Français] 函数说明文字\"\"\"\n");
    EXPECT_EQ(result.value().units_skipped, 1u);
}

TEST_F(PipelineTest, FilterByLanguage) {
    Pipeline pipeline(registry, &translator);
    std::string original = "// 这是中文注释\n// これは日本語のコメントです\n";

    UnitFilter filter;
    filter.languages = {"zh"};
    auto result = pipeline.translate(original, "a.js", "auto", "en", filter);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value().content, "// [EN] 这是中文注释\n// これは日本語のコメントです\n");
    EXPECT_EQ(result.value().units_translated, 1u);
}

TEST_F(PipelineTest, FailedTranslationLeavesFileUntouched) {
    MockConfig config = quiet_mock();
    config.forced_failures = {"这是中文注释"};
    MockTranslator failing(config);
    Pipeline pipeline(registry, &failing);

    std::string original = "# 这是中文注释\nx = 1\n";
    auto result = pipeline.translate(original, "f.py", "zh", "en");
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value().content, original);
    EXPECT_EQ(result.value().units_failed, 1u);
    EXPECT_FALSE(result.value().changed());
}

TEST_F(PipelineTest, Errors) {
    Pipeline without_translator(registry, nullptr);
    EXPECT_EQ(without_translator.translate("# 注释文字\n", "f.py", "zh", "en").error_code(),
              ErrorCode::INVALID_ARGUMENT);

    Pipeline pipeline(registry, &translator);
    EXPECT_EQ(pipeline.translate("text", "notes.txt", "zh", "en").error_code(),
              ErrorCode::UNSUPPORTED_FORMAT);
    EXPECT_EQ(pipeline.translate("# 这是中文注释\n", "f.py", "zh", "xx").error_code(),
              ErrorCode::UNSUPPORTED_LANGUAGE);
    EXPECT_EQ(pipeline.scan("{not json", "n.ipynb").error_code(), ErrorCode::PARSE_ERROR);
}

TEST_F(PipelineTest, ScanUsesCache) {
    Pipeline pipeline(registry, &translator, &cache);
    std::string content = "// Hello world\n";

    auto first = pipeline.scan(content, "a.js");
    auto second = pipeline.scan(content, "a.js");
    ASSERT_TRUE(first.ok());
    ASSERT_TRUE(second.ok());
    EXPECT_EQ(first.value(), second.value());
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_TRUE(cache.contains(Cache::generate_key("a.js", content)));

    ASSERT_TRUE(pipeline.scan("// Hello again\n", "a.js").ok());
    EXPECT_EQ(cache.size(), 2u);
}

TEST(UnitFilterTest, Accepts) {
    TranslatableUnit unit("这是中文注释", UnitType::COMMENT, 1, 1);
    unit.priority = Priority::MEDIUM;
    unit.detected_language = "zh-CN";

    UnitFilter filter;
    EXPECT_TRUE(filter.accepts(unit));

    filter.min_priority = Priority::HIGH;
    EXPECT_FALSE(filter.accepts(unit));
    filter.min_priority = Priority::LOW;
    EXPECT_TRUE(filter.accepts(unit));

    filter.languages = {"ZH"};
    EXPECT_TRUE(filter.accepts(unit));
    filter.languages = {"ja"};
    EXPECT_FALSE(filter.accepts(unit));

    unit.detected_language.reset();
    filter.languages = {"zh"};
    EXPECT_FALSE(filter.accepts(unit));
}
