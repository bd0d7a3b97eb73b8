#include <gtest/gtest.h>

#include "table/MarkdownTable.hpp"

using table::Table;
using table::render_markdown_table;

TEST(MarkdownTableTest, EmptyTablePlaceholder) {
    EXPECT_EQ(render_markdown_table(Table{}), "_(Empty table)_\n");
}

TEST(MarkdownTableTest, NumericColumnsRightAligned) {
    Table t;
    t.columns = {"A", "B"};
    t.rows = {{"1", "2"}, {"3", "4"}};

    EXPECT_EQ(render_markdown_table(t),
              "|   A |   B |\n"
              "|----:|----:|\n"
              "|   1 |   2 |\n"
              "|   3 |   4 |");
}

TEST(MarkdownTableTest, TextColumnsLeftAligned) {
    Table t;
    t.columns = {"Name"};
    t.rows = {{"Al"}, {"Bo"}};

    EXPECT_EQ(render_markdown_table(t),
              "| Name |\n"
              "|:-----|\n"
              "| Al   |\n"
              "| Bo   |");
}

TEST(MarkdownTableTest, EmptyColumnNameIsEmptyHeaderCell) {
    Table t;
    t.columns = {"", "x"};
    t.rows = {{"a", "b"}};

    EXPECT_EQ(render_markdown_table(t),
              "|     | x   |\n"
              "|:----|:----|\n"
              "| a   | b   |");
}

TEST(MarkdownTableTest, HeaderOnlyTable) {
    Table t;
    t.columns = {"A"};
    EXPECT_EQ(render_markdown_table(t), "| A   |\n|:----|");
}

TEST(MarkdownTableTest, ShortRowsArePadded) {
    Table t;
    t.columns = {"A", "B"};
    t.rows = {{"1"}};

    EXPECT_EQ(render_markdown_table(t),
              "|   A | B   |\n"
              "|----:|:----|\n"
              "|   1 |     |");
}

TEST(MarkdownTableTest, PipesAreEscaped) {
    Table t;
    t.columns = {"cmd"};
    t.rows = {{"a|b"}};

    EXPECT_EQ(render_markdown_table(t),
              "| cmd  |\n"
              "|:-----|\n"
              "| a\\|b |");
}

TEST(MarkdownTableTest, WidthCountsCodePoints) {
    Table t;
    t.columns = {"\xC3\xA9t\xC3\xA9"};
    t.rows = {{"x"}};

    EXPECT_EQ(render_markdown_table(t),
              "| \xC3\xA9t\xC3\xA9 |\n"
              "|:----|\n"
              "| x   |");
}

TEST(MarkdownTableTest, LineBreakInCellFallsBackToCodeBlock) {
    Table t;
    t.columns = {"A", "B"};
    t.rows = {{"x\ny", "2"}};

    EXPECT_FALSE(table::fits_pipe_table(t));
    EXPECT_EQ(render_markdown_table(t),
              "```\n"
              "   A  B\n"
              "x\\ny  2\n"
              "```");
}

TEST(MarkdownTableTest, RowWiderThanHeaderFallsBack) {
    Table t;
    t.columns = {"A"};
    t.rows = {{"1", "2"}};

    EXPECT_EQ(render_markdown_table(t),
              "```\n"
              "A   \n"
              "1  2\n"
              "```");
}
