// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
#include "UI/ImGuiPainter.h"
#include "UI/Palette.h"
#include "UI/PanelTree.h"
#include "UI/Style.h"

#include <gtest/gtest.h>
#include <imgui.h>
#include <implot.h>

#include <vector>

namespace UI
{
namespace
{

/// Headless ImGui + ImPlot frame: no window, no renderer, just draw lists.
class ImGuiFrameTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        ImGui::CreateContext();
        ImPlot::CreateContext();

        ImGuiIO& io = ImGui::GetIO();
        io.DisplaySize = ImVec2(800.0F, 600.0F);
        io.DeltaTime = 1.0F / 60.0F;
        io.IniFilename = nullptr;
        io.Fonts->Build();

        ImGui::NewFrame();
    }

    void TearDown() override
    {
        ImGui::Render();
        ImPlot::DestroyContext();
        ImGui::DestroyContext();
    }
};

TEST(PaletteTest, ResolvesNamedColors)
{
    const Palette& palette = Palette::defaults();

    const ImVec4 red = palette.resolve(Color::Red);
    EXPECT_FLOAT_EQ(red.x, palette.red.x);
    EXPECT_FLOAT_EQ(red.y, palette.red.y);

    const ImVec4 fallback{0.1F, 0.2F, 0.3F, 1.0F};
    EXPECT_FLOAT_EQ(palette.resolve(Color::Default, fallback).z, 0.3F);
    EXPECT_FLOAT_EQ(palette.resolve(Color::Default).x, palette.text.x);
}

TEST(ImGuiPainterTest, CellsForFloorsToWholeCells)
{
    const Rect area = ImGuiPainter::cellsFor(ImVec2(105.0F, 47.0F), ImVec2(10.0F, 15.0F));
    EXPECT_EQ(area.x, 0);
    EXPECT_EQ(area.y, 0);
    EXPECT_EQ(area.width, 10);
    EXPECT_EQ(area.height, 3);
}

TEST(ImGuiPainterTest, CellsForNegativeSizeIsEmpty)
{
    EXPECT_TRUE(ImGuiPainter::cellsFor(ImVec2(-20.0F, 100.0F), ImVec2(8.0F, 16.0F)).empty());
}

TEST(ImGuiPainterTest, CellsForSubPixelCellIsTreatedAsOnePixel)
{
    const Rect area = ImGuiPainter::cellsFor(ImVec2(30.0F, 12.0F), ImVec2(0.0F, 0.0F));
    EXPECT_EQ(area.width, 30);
    EXPECT_EQ(area.height, 12);
}

TEST(ImGuiPainterTest, BarHeightsKeepNewestSamplesThatFit)
{
    const SparklineElement strip{.area = {.x = 0, .y = 0, .width = 2, .height = 3},
                                 .title = "R",
                                 .data = {0, 50, 100, 200},
                                 .max = 100};

    // Two rows of bars: 16 eighths is a full column, larger samples saturate.
    EXPECT_EQ(ImGuiPainter::barHeights(strip, 2), (std::vector<double>{16.0, 16.0}));
}

TEST(ImGuiPainterTest, BarHeightsScaleToEighthsOfACell)
{
    const SparklineElement strip{.area = {.x = 0, .y = 0, .width = 10, .height = 2},
                                 .title = "W",
                                 .data = {0, 50},
                                 .max = 100};

    EXPECT_EQ(ImGuiPainter::barHeights(strip, 1), (std::vector<double>{0.0, 4.0}));
    EXPECT_EQ(ImGuiPainter::barHeights(strip, 2), (std::vector<double>{0.0, 8.0}));
    EXPECT_EQ(ImGuiPainter::barHeights(strip, 0), (std::vector<double>{0.0, 0.0}));
}

TEST_F(ImGuiFrameTest, CurrentCellSizeIsPositive)
{
    const ImVec2 cell = ImGuiPainter::currentCellSize();
    EXPECT_GT(cell.x, 0.0F);
    EXPECT_GT(cell.y, 0.0F);
}

TEST_F(ImGuiFrameTest, PaintEmitsDrawCommands)
{
    PanelTree tree;
    tree.add(BlockElement{.area = {.x = 0, .y = 0, .width = 40, .height = 12},
                          .title = "Disk",
                          .titleStyle = Style::plain(),
                          .borderStyle = Style::plain(),
                          .borders = true});
    tree.add(ListElement{.area = {.x = 0, .y = 0, .width = 20, .height = 12},
                         .title = "File Systems",
                         .borderStyle = Style::plain(),
                         .items = {Span::styled("→ 50%: /", Style::colored(Color::Green))}});
    tree.add(SparklineElement{.area = {.x = 21, .y = 1, .width = 18, .height = 5},
                              .title = "R",
                              .data = {1, 5, 3},
                              .max = 5,
                              .style = Style::colored(Color::LightYellow)});
    tree.add(ParagraphElement{.area = {.x = 21, .y = 6, .width = 18, .height = 5},
                              .lines = {{Span::raw("Name: "), Span::styled("/dev/sda1", Style::colored(Color::Green).withBold())}}});

    ImGui::Begin("painter");
    const ImDrawList* drawList = ImGui::GetWindowDrawList();
    const int before = drawList->VtxBuffer.Size;

    const ImGuiPainter painter;
    painter.paint(tree, ImGui::GetCursorScreenPos(), ImGuiPainter::currentCellSize());

    EXPECT_GT(drawList->VtxBuffer.Size, before);
    ImGui::End();
}

} // namespace
} // namespace UI
// NOLINTEND(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
