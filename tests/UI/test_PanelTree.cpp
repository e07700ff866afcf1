// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
#include "UI/PanelTree.h"
#include "UI/Style.h"

#include <gtest/gtest.h>

namespace UI
{
namespace
{

TEST(PanelTreeTest, KeepsPaintOrder)
{
    PanelTree tree;
    tree.add(BlockElement{.area = {}, .title = "outer", .titleStyle = {}, .borderStyle = {}, .borders = true});
    tree.add(ParagraphElement{.area = {}, .lines = {}});
    tree.add(BlockElement{.area = {}, .title = "inner", .titleStyle = {}, .borderStyle = {}, .borders = false});

    EXPECT_EQ(tree.size(), 3U);
    const auto blocks = tree.blocks();
    ASSERT_EQ(blocks.size(), 2U);
    EXPECT_EQ(blocks[0]->title, "outer");
    EXPECT_EQ(blocks[1]->title, "inner");
    EXPECT_EQ(tree.paragraphs().size(), 1U);
    EXPECT_TRUE(tree.lists().empty());
    EXPECT_TRUE(tree.sparklines().empty());
}

TEST(PanelTreeTest, EmptyTree)
{
    const PanelTree tree;
    EXPECT_TRUE(tree.empty());
    EXPECT_EQ(tree.size(), 0U);
}

TEST(SparklineElementTest, BarHeightsScaleToMax)
{
    const SparklineElement strip{.area = {}, .title = {}, .data = {0, 50, 100, 200}, .max = 100, .style = {}};

    EXPECT_EQ(strip.barEighths(0, 2), 0U);
    EXPECT_EQ(strip.barEighths(1, 2), 8U);
    EXPECT_EQ(strip.barEighths(2, 2), 16U);
    EXPECT_EQ(strip.barEighths(3, 2), 16U); // saturates
}

TEST(SparklineElementTest, BarHeightOutOfRange)
{
    const SparklineElement strip{.area = {}, .title = {}, .data = {10}, .max = 10, .style = {}};

    EXPECT_EQ(strip.barEighths(5, 4), 0U);
    EXPECT_EQ(strip.barEighths(0, 0), 0U);
}

TEST(SparklineElementTest, ZeroMaxIsTreatedAsOne)
{
    const SparklineElement strip{.area = {}, .title = {}, .data = {0, 1}, .max = 0, .style = {}};

    EXPECT_EQ(strip.barEighths(0, 1), 0U);
    EXPECT_EQ(strip.barEighths(1, 1), 8U);
}

TEST(StyleTest, PlainTextJoinsSpans)
{
    const Line line{Span::raw("Size: "), Span::styled("1.0 KB", Style::colored(Color::Green))};
    EXPECT_EQ(plainText(line), "Size: 1.0 KB");
}

TEST(StyleTest, WithBoldKeepsColor)
{
    const Style style = Style::colored(Color::Red).withBold();
    EXPECT_EQ(style.fg, Color::Red);
    EXPECT_TRUE(style.bold);
}

} // namespace
} // namespace UI
// NOLINTEND(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
