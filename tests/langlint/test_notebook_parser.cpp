#include <gtest/gtest.h>
#include <langlint/parsers/notebook_parser.hpp>

#include <nlohmann/json.hpp>

using namespace langlint;
using ordered_json = nlohmann::ordered_json;

class NotebookParserTest : public ::testing::Test {
protected:
    void SetUp() override {
        ordered_json doc;
        doc["cells"] = ordered_json::array({
            {{"cell_type", "markdown"}, {"metadata", ordered_json::object()},
             {"source", {"# 数据分析\n", "介绍"}}},
            {{"cell_type", "code"}, {"execution_count", nullptr}, {"metadata", ordered_json::object()},
             {"outputs", ordered_json::array()},
             {"source", {"import pandas as pd\n", "# 读取数据文件\n", "# load data\n",
                         "df = pd.read_csv('a.csv')"}}},
            {{"cell_type", "markdown"}, {"metadata", ordered_json::object()},
             {"source", "```python\nprint(1)\n```"}},
            {{"cell_type", "markdown"}, {"metadata", ordered_json::object()},
             {"source", "   "}},
            {{"cell_type", "markdown"}, {"metadata", ordered_json::object()},
             {"source", "普通的说明文字"}}
        });
        doc["metadata"] = {{"kernelspec", {{"name", "python3"}}}};
        doc["nbformat"] = 4;
        doc["nbformat_minor"] = 5;
        notebook = doc.dump(1) + "\n";
    }

    std::vector<TranslatableUnit> extract(const std::string& content) {
        auto result = parser.extract_units(content, "analysis.ipynb");
        EXPECT_TRUE(result.ok());
        return result.ok() ? result.value().units : std::vector<TranslatableUnit>{};
    }

    NotebookParser parser;
    std::string notebook;
};

TEST_F(NotebookParserTest, ExtractsMarkdownAndCodeComments) {
    auto result = parser.extract_units(notebook, "analysis.ipynb");
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value().file_type, "jupyter_notebook");
    EXPECT_EQ(result.value().metadata["cell_count"], 5);

    const auto& units = result.value().units;
    ASSERT_EQ(units.size(), 3u);

    EXPECT_EQ(units[0].unit_type, UnitType::TEXT_NODE);
    EXPECT_EQ(units[0].content, "# 数据分析\n介绍");
    EXPECT_EQ(units[0].position.line, 0u);
    EXPECT_EQ(units[0].priority, Priority::HIGH);

    EXPECT_EQ(units[1].unit_type, UnitType::COMMENT);
    EXPECT_EQ(units[1].content, "读取数据文件");
    EXPECT_EQ(units[1].position.line, 1 * NotebookParser::CELL_LINE_STRIDE + 1);
    EXPECT_EQ(units[1].metadata["cell_index"], 1);
    EXPECT_EQ(units[1].metadata["line_offset"], 1);

    EXPECT_EQ(units[2].content, "普通的说明文字");
    EXPECT_EQ(units[2].position.line, 4u);
    EXPECT_EQ(units[2].priority, Priority::MEDIUM);
}

TEST_F(NotebookParserTest, RewritesChangedCells) {
    auto units = extract(notebook);
    ASSERT_EQ(units.size(), 3u);
    units[0].content = "# Data analysis\nIntroduction";
    units[1].content = "Read the data file";

    auto rebuilt = parser.reconstruct(notebook, units, "analysis.ipynb");
    ASSERT_TRUE(rebuilt.ok());
    EXPECT_EQ(rebuilt.value().back(), '\n');

    auto doc = ordered_json::parse(rebuilt.value());
    const auto& cells = doc["cells"];
    ASSERT_EQ(cells.size(), 5u);

    ASSERT_TRUE(cells[0]["source"].is_array());
    EXPECT_EQ(cells[0]["source"], ordered_json({"# Data analysis\n", "Introduction"}));

    ASSERT_TRUE(cells[1]["source"].is_array());
    EXPECT_EQ(cells[1]["source"][0], "import pandas as pd\n");
    EXPECT_EQ(cells[1]["source"][1], "# Read the data file\n");
    EXPECT_EQ(cells[1]["source"][2], "# load data\n");

    // Untouched cells and document metadata survive
    EXPECT_EQ(cells[4]["source"], "普通的说明文字");
    EXPECT_EQ(doc["nbformat"], 4);
    EXPECT_EQ(doc["metadata"]["kernelspec"]["name"], "python3");
}

TEST_F(NotebookParserTest, StringSourceStaysString) {
    auto units = extract(notebook);
    ASSERT_EQ(units.size(), 3u);
    units[2].content = "Plain explanation";

    auto rebuilt = parser.reconstruct(notebook, units, "analysis.ipynb");
    ASSERT_TRUE(rebuilt.ok());
    auto doc = ordered_json::parse(rebuilt.value());
    ASSERT_TRUE(doc["cells"][4]["source"].is_string());
    EXPECT_EQ(doc["cells"][4]["source"], "Plain explanation");
}

TEST_F(NotebookParserTest, UnchangedUnitsReturnOriginal) {
    auto units = extract(notebook);
    auto rebuilt = parser.reconstruct(notebook, units, "analysis.ipynb");
    ASSERT_TRUE(rebuilt.ok());
    EXPECT_EQ(rebuilt.value(), notebook);
}

TEST_F(NotebookParserTest, MalformedJsonIsParseError) {
    auto result = parser.extract_units("{\"cells\": [", "broken.ipynb");
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error_code(), ErrorCode::PARSE_ERROR);
    EXPECT_EQ(result.error().detail(), "broken.ipynb");

    auto array_root = parser.extract_units("[1, 2]", "array.ipynb");
    ASSERT_FALSE(array_root.ok());
    EXPECT_EQ(array_root.error_code(), ErrorCode::PARSE_ERROR);

    auto rebuilt = parser.reconstruct("not json", {}, "broken.ipynb");
    ASSERT_FALSE(rebuilt.ok());
    EXPECT_EQ(rebuilt.error_code(), ErrorCode::PARSE_ERROR);
}

TEST_F(NotebookParserTest, MissingCellListIsEmptyNotebook) {
    for (const std::string content : {"{}", "{\"metadata\": {}}", "{\"cells\": 3}"}) {
        auto result = parser.extract_units(content, "empty.ipynb");
        ASSERT_TRUE(result.ok()) << content;
        EXPECT_TRUE(result.value().units.empty());
        EXPECT_EQ(result.value().metadata["cell_count"], 0);

        TranslatableUnit unit("翻译", UnitType::TEXT_NODE, 0, 0);
        auto rebuilt = parser.reconstruct(content, {unit}, "empty.ipynb");
        ASSERT_TRUE(rebuilt.ok()) << content;
        EXPECT_EQ(rebuilt.value(), content);
    }
}

TEST_F(NotebookParserTest, NonIntegerCellMetadataFallsBackToLine) {
    auto units = extract(notebook);
    ASSERT_EQ(units.size(), 3u);

    units[0].content = "# Data analysis";
    units[0].metadata = {{"cell_index", "zero"}};
    units[1].content = "Load the data";
    units[1].metadata = {{"cell_index", -1}, {"line_offset", 1.5}};

    auto rebuilt = parser.reconstruct(notebook, units, "analysis.ipynb");
    ASSERT_TRUE(rebuilt.ok());
    auto doc = ordered_json::parse(rebuilt.value());
    EXPECT_EQ(doc["cells"][0]["source"], ordered_json::array({"# Data analysis"}));
    EXPECT_EQ(doc["cells"][1]["source"][1], "# Load the data\n");
    EXPECT_EQ(doc["cells"][4]["source"], "普通的说明文字");
}

TEST_F(NotebookParserTest, CommentFilter) {
    EXPECT_TRUE(NotebookParser::is_translatable("读取数据"));
    EXPECT_FALSE(NotebookParser::is_translatable("load the data"));
    EXPECT_FALSE(NotebookParser::is_translatable("x = 数据"));
    EXPECT_FALSE(NotebookParser::is_translatable("数"));
}

TEST_F(NotebookParserTest, CanParseByExtension) {
    EXPECT_TRUE(parser.can_parse("analysis.ipynb"));
    EXPECT_FALSE(parser.can_parse("analysis.json"));
}
