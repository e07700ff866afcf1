#include "ImGuiPainter.h"

#include "UI/Numeric.h"

#include <imgui.h>
#include <implot.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace UI
{

namespace
{

constexpr double STRIP_BAR_WIDTH = 1.0; // bars touch, like a terminal sparkline

/// Byte length of the UTF-8 sequence starting with lead.
[[nodiscard]] std::size_t utf8Length(unsigned char lead)
{
    if ((lead & 0x80U) == 0)
    {
        return 1;
    }
    if ((lead & 0xE0U) == 0xC0U)
    {
        return 2;
    }
    if ((lead & 0xF0U) == 0xE0U)
    {
        return 3;
    }
    if ((lead & 0xF8U) == 0xF0U)
    {
        return 4;
    }
    return 1; // stray continuation byte: treat as one cell
}

/// Byte offset after at most maxCells code points of text.
[[nodiscard]] std::size_t clipToCells(const std::string& text, int maxCells, int& cellsUsed)
{
    std::size_t offset = 0;
    cellsUsed = 0;
    while (offset < text.size() && cellsUsed < maxCells)
    {
        offset = std::min(text.size(), offset + utf8Length(static_cast<unsigned char>(text[offset])));
        ++cellsUsed;
    }
    return offset;
}

} // namespace

ImVec2 ImGuiPainter::currentCellSize()
{
    const float width = ImGui::CalcTextSize("M").x;
    const float height = ImGui::GetTextLineHeight();
    return {std::max(width, 1.0F), std::max(height, 1.0F)};
}

Rect ImGuiPainter::cellsFor(ImVec2 size, ImVec2 cellSize)
{
    const auto cols = static_cast<int>(std::max(0.0F, size.x) / std::max(cellSize.x, 1.0F));
    const auto rows = static_cast<int>(std::max(0.0F, size.y) / std::max(cellSize.y, 1.0F));
    return {.x = 0,
            .y = 0,
            .width = static_cast<std::uint16_t>(std::clamp(cols, 0, 0xFFFF)),
            .height = static_cast<std::uint16_t>(std::clamp(rows, 0, 0xFFFF))};
}

void ImGuiPainter::paint(const PanelTree& tree, ImVec2 origin, ImVec2 cellSize) const
{
    m_Origin = origin;
    m_CellSize = cellSize;
    m_DrawList = ImGui::GetWindowDrawList();

    int stripId = 0;
    for (const auto& element : tree.elements())
    {
        std::visit(
            [&](const auto& typed)
            {
                using T = std::decay_t<decltype(typed)>;
                if constexpr (std::is_same_v<T, BlockElement>)
                {
                    paintBlock(typed);
                }
                else if constexpr (std::is_same_v<T, ListElement>)
                {
                    paintList(typed);
                }
                else if constexpr (std::is_same_v<T, SparklineElement>)
                {
                    paintSparkline(typed, stripId++);
                }
                else if constexpr (std::is_same_v<T, ParagraphElement>)
                {
                    paintParagraph(typed);
                }
            },
            element);
    }

    m_DrawList = nullptr;
}

ImVec2 ImGuiPainter::toPixels(int cellX, int cellY) const
{
    return {m_Origin.x + (static_cast<float>(cellX) * m_CellSize.x), m_Origin.y + (static_cast<float>(cellY) * m_CellSize.y)};
}

void ImGuiPainter::drawFrame(const Rect& area, const ImVec4& color) const
{
    if (area.empty())
    {
        return;
    }

    // Border runs through the middle of the outer cells, as box-drawing glyphs would.
    const ImVec2 halfCell(m_CellSize.x * 0.5F, m_CellSize.y * 0.5F);
    const ImVec2 topLeft = toPixels(area.x, area.y);
    const ImVec2 bottomRight = toPixels(area.x + area.width, area.y + area.height);
    m_DrawList->AddRect(ImVec2(topLeft.x + halfCell.x, topLeft.y + halfCell.y),
                        ImVec2(bottomRight.x - halfCell.x, bottomRight.y - halfCell.y),
                        ImGui::ColorConvertFloat4ToU32(color));
}

int ImGuiPainter::drawText(int cellX, int cellY, const std::string& text, const Style& style, int maxCells) const
{
    if (maxCells <= 0 || text.empty())
    {
        return 0;
    }

    int cellsUsed = 0;
    const std::size_t bytes = clipToCells(text, maxCells, cellsUsed);
    const ImU32 color = ImGui::ColorConvertFloat4ToU32(m_Palette.resolve(style.fg));
    const ImVec2 pos = toPixels(cellX, cellY);
    const char* begin = text.data();
    const char* end = text.data() + bytes;

    // Clear the border line behind the text so titles read cleanly.
    const ImVec2 extent(pos.x + (static_cast<float>(cellsUsed) * m_CellSize.x), pos.y + m_CellSize.y);
    m_DrawList->AddRectFilled(pos, extent, ImGui::GetColorU32(ImGuiCol_WindowBg));

    m_DrawList->AddText(pos, color, begin, end);
    if (style.bold)
    {
        // Faux bold: the default ImGui font has no bold face.
        m_DrawList->AddText(ImVec2(pos.x + 1.0F, pos.y), color, begin, end);
    }

    return cellsUsed;
}

void ImGuiPainter::drawTitle(const Rect& area, const std::string& title, const Style& style) const
{
    if (title.empty() || area.width <= 2 || area.height == 0)
    {
        return;
    }
    drawText(area.x + 1, area.y, title, style, area.width - 2);
}

void ImGuiPainter::paintBlock(const BlockElement& block) const
{
    if (block.borders)
    {
        drawFrame(block.area, m_Palette.resolve(block.borderStyle.fg, m_Palette.border));
    }
    drawTitle(block.area, block.title, block.titleStyle);
}

void ImGuiPainter::paintList(const ListElement& list) const
{
    drawFrame(list.area, m_Palette.resolve(list.borderStyle.fg, m_Palette.border));
    drawTitle(list.area, list.title, list.borderStyle);

    const Rect inner = list.area.inner(1);
    const std::size_t visible = std::min<std::size_t>(list.items.size(), inner.height);
    for (std::size_t i = 0; i < visible; ++i)
    {
        const auto& item = list.items[i];
        drawText(inner.x, inner.y + static_cast<int>(i), item.text, item.style, inner.width);
    }
}

std::vector<double> ImGuiPainter::barHeights(const SparklineElement& strip, std::uint16_t rows)
{
    // One column per sample; keep the newest samples that fit.
    // Heights are in eighths of a cell, like block-glyph sparklines.
    const std::size_t columns = std::min<std::size_t>(strip.data.size(), strip.area.width);
    const std::size_t first = strip.data.size() - columns;

    std::vector<double> heights;
    heights.reserve(columns);
    for (std::size_t i = first; i < strip.data.size(); ++i)
    {
        heights.push_back(Numeric::toDouble(strip.barEighths(i, rows)));
    }
    return heights;
}

void ImGuiPainter::paintSparkline(const SparklineElement& strip, int id) const
{
    if (strip.area.empty())
    {
        return;
    }

    drawText(strip.area.x, strip.area.y, strip.title, Style::plain(), strip.area.width);
    if (strip.area.height < 2 || strip.data.empty())
    {
        return;
    }

    const auto barRows = static_cast<std::uint16_t>(strip.area.height - 1);
    const std::vector<double> values = barHeights(strip, barRows);
    const std::size_t columns = values.size();

    const ImVec2 plotPos = toPixels(strip.area.x, strip.area.y + 1);
    const ImVec2 plotSize(static_cast<float>(columns) * m_CellSize.x, static_cast<float>(barRows) * m_CellSize.y);

    constexpr ImPlotFlags plotFlags = ImPlotFlags_CanvasOnly | ImPlotFlags_NoInputs | ImPlotFlags_NoFrame;
    constexpr ImPlotAxisFlags axisFlags = ImPlotAxisFlags_NoDecorations;

    ImGui::PushID(id);
    ImGui::SetCursorScreenPos(plotPos);
    ImPlot::PushStyleVar(ImPlotStyleVar_PlotPadding, ImVec2(0.0F, 0.0F));
    if (ImPlot::BeginPlot("##strip", plotSize, plotFlags))
    {
        ImPlot::SetupAxes(nullptr, nullptr, axisFlags, axisFlags);
        ImPlot::SetupAxisLimits(ImAxis_X1, -0.5, static_cast<double>(columns) - 0.5, ImPlotCond_Always);
        ImPlot::SetupAxisLimits(ImAxis_Y1, 0.0, Numeric::toDouble(barRows) * 8.0, ImPlotCond_Always);

        ImPlot::SetNextFillStyle(m_Palette.resolve(strip.style.fg));
        ImPlot::SetNextLineStyle(m_Palette.resolve(strip.style.fg));
        ImPlot::PlotBars("##bars", values.data(), Numeric::checkedCount(values.size()), STRIP_BAR_WIDTH);
        ImPlot::EndPlot();
    }
    ImPlot::PopStyleVar();
    ImGui::PopID();
}

void ImGuiPainter::paintParagraph(const ParagraphElement& paragraph) const
{
    const std::size_t visible = std::min<std::size_t>(paragraph.lines.size(), paragraph.area.height);
    for (std::size_t row = 0; row < visible; ++row)
    {
        int cellX = paragraph.area.x;
        int remaining = paragraph.area.width;
        for (const auto& span : paragraph.lines[row])
        {
            const int used = drawText(cellX, paragraph.area.y + static_cast<int>(row), span.text, span.style, remaining);
            cellX += used;
            remaining -= used;
            if (remaining <= 0)
            {
                break;
            }
        }
    }
}

} // namespace UI
