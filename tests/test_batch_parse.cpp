// =============================================================================
// Batch parsing tests (line selection, joined and per-line modes)
// =============================================================================

#include <gtest/gtest.h>
#include "ingredient/BatchParse.hpp"

#include <string>
#include <vector>

using namespace ingredient;

static const char* kFile =
    "1 cup water\n"
    "\n"
    "2 eggs\n"
    "   \n"
    "salt\n";

static std::vector<int> numbers(const std::vector<SourceLine>& lines) {
    std::vector<int> out;
    for (const auto& l : lines) out.push_back(l.number);
    return out;
}

TEST(SelectLinesTest, BlankLinesKeepFileNumbering) {
    auto lines = select_lines(kFile, 0, -1);

    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(numbers(lines), (std::vector<int>{1, 3, 5}));
    EXPECT_EQ(lines[0].text, "1 cup water");
    EXPECT_EQ(lines[1].text, "2 eggs");
    EXPECT_EQ(lines[2].text, "salt");
}

TEST(SelectLinesTest, HalfOpenRange) {
    EXPECT_EQ(numbers(select_lines(kFile, 2, 4)), (std::vector<int>{3}));
    EXPECT_EQ(numbers(select_lines(kFile, 2, 100)), (std::vector<int>{3, 5}));
    EXPECT_EQ(numbers(select_lines(kFile, 0, 1)), (std::vector<int>{1}));
    EXPECT_TRUE(select_lines(kFile, 3, 3).empty());
    EXPECT_TRUE(select_lines(kFile, 50, -1).empty());
}

TEST(SelectLinesTest, TrimsCarriageReturnsAndSpaces) {
    auto lines = select_lines("  1 cup water \r\n2 eggs\r\n", 0, -1);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0].text, "1 cup water");
    EXPECT_EQ(lines[1].text, "2 eggs");
}

TEST(ParseBatchTest, PerLineIssuesNameTheFileLine) {
    IngredientParser parser;
    auto result = parse_batch(parser, select_lines(kFile, 0, -1), true);

    std::vector<Ingredient> expected = {
        {"1", "cup", "water"},
        {"2", "eggs", ""},
    };
    EXPECT_EQ(result.ingredients, expected);
    ASSERT_EQ(result.entries.size(), 2u);
    EXPECT_EQ(result.entries[1].line, "2 eggs");

    ASSERT_EQ(result.issues.size(), 1u);
    EXPECT_EQ(result.issues[0].message.rfind("line 5: ", 0), 0u) << result.issues[0].message;
    EXPECT_EQ(result.issues[0].tokens, (std::vector<std::string>{"salt"}));
}

TEST(ParseBatchTest, JoinedModePairsLinesInOrder) {
    IngredientParser parser;
    auto result = parse_batch(parser, select_lines(kFile, 0, -1), false);

    // "salt" has no quantity, so it joins the "2 eggs" group
    std::vector<Ingredient> expected = {
        {"1", "cup", "water"},
        {"2", "eggs", "salt"},
    };
    EXPECT_EQ(result.ingredients, expected);
    EXPECT_TRUE(result.issues.empty());
    EXPECT_EQ(result.line_count, 3u);
    EXPECT_FALSE(result.counts_match());

    ASSERT_EQ(result.entries.size(), 2u);
    EXPECT_EQ(result.entries[0].line, "1 cup water");
    EXPECT_EQ(result.entries[1].line, "2 eggs");
}

TEST(ParseBatchTest, JoinedModeCountsMatchForCleanInput) {
    IngredientParser parser;
    auto result = parse_batch(parser, select_lines("1 cup water\n1 1/2 teaspoon salt\n", 0, -1), false);

    EXPECT_TRUE(result.counts_match());
    ASSERT_EQ(result.entries.size(), 2u);
    EXPECT_EQ(result.entries[1].ingredient, (Ingredient{"(1, 1/2)", "teaspoon", "salt"}));
}

TEST(ParseBatchTest, StrictPerLineErrorCarriesLineNumber) {
    ParserOptions opts;
    opts.strict = true;
    IngredientParser parser(opts);

    try {
        parse_batch(parser, select_lines(kFile, 0, -1), true);
        FAIL() << "expected MalformedIngredientLine";
    } catch (const MalformedIngredientLine& e) {
        EXPECT_NE(std::string(e.what()).find("line 5: "), std::string::npos) << e.what();
        EXPECT_EQ(e.issue().tokens, (std::vector<std::string>{"salt"}));
    }
}

TEST(ParseBatchTest, EmptySelection) {
    IngredientParser parser;
    auto result = parse_batch(parser, {}, false);
    EXPECT_TRUE(result.ingredients.empty());
    EXPECT_TRUE(result.entries.empty());
    EXPECT_TRUE(result.counts_match());
}
