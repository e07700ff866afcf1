#pragma once

#include "UI/Layout.h"
#include "UI/Palette.h"
#include "UI/PanelTree.h"

#include <imgui.h>

#include <cstdint>
#include <string>
#include <vector>

namespace UI
{

/// Paints a PanelTree into the current ImGui window.
/// Cell (0, 0) of the tree maps to origin; every cell is cellSize pixels.
class ImGuiPainter
{
  public:
    explicit ImGuiPainter(const Palette& palette = Palette::defaults()) : m_Palette(palette)
    {
    }

    /// Cell size for the current font (monospace assumption: width of 'M', one line high).
    [[nodiscard]] static ImVec2 currentCellSize();

    /// Largest cell rectangle that fits in size pixels.
    [[nodiscard]] static Rect cellsFor(ImVec2 size, ImVec2 cellSize);

    /// Bar heights (eighths of a cell) for the newest samples that fit strip.area.width,
    /// in a strip rows cells tall.
    [[nodiscard]] static std::vector<double> barHeights(const SparklineElement& strip, std::uint16_t rows);

    /// Must be called between ImGui::Begin/End (and with an ImPlot context for strips).
    void paint(const PanelTree& tree, ImVec2 origin, ImVec2 cellSize) const;

  private:
    void paintBlock(const BlockElement& block) const;
    void paintList(const ListElement& list) const;
    void paintSparkline(const SparklineElement& strip, int id) const;
    void paintParagraph(const ParagraphElement& paragraph) const;

    void drawFrame(const Rect& area, const ImVec4& color) const;
    void drawTitle(const Rect& area, const std::string& title, const Style& style) const;
    /// Draw text starting at a cell, clipped to maxCells columns. Returns columns used.
    int drawText(int cellX, int cellY, const std::string& text, const Style& style, int maxCells) const;

    [[nodiscard]] ImVec2 toPixels(int cellX, int cellY) const;

    const Palette& m_Palette;

    // Valid only during paint()
    mutable ImVec2 m_Origin{};
    mutable ImVec2 m_CellSize{1.0F, 1.0F};
    mutable ImDrawList* m_DrawList = nullptr;
};

} // namespace UI
