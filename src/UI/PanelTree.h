#pragma once

#include "UI/Layout.h"
#include "UI/Style.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace UI
{

/// Bordered, optionally titled frame.
struct BlockElement
{
    Rect area;
    std::string title;
    Style titleStyle;
    Style borderStyle;
    bool borders = true;
};

/// Selectable list inside a bordered block. One item per line.
struct ListElement
{
    Rect area;
    std::string title;
    Style borderStyle;
    std::vector<Span> items;
};

/// Intensity strip (sparkline): one column per sample, scaled to max.
/// Title is drawn on the top row; bars fill the rows below it.
struct SparklineElement
{
    Rect area;
    std::string title;
    std::vector<std::uint64_t> data;
    std::uint64_t max = 1;
    Style style;

    /// Filled height of sample index in eighths of a cell, for a strip rows cells tall.
    /// Values above max saturate at the full height.
    [[nodiscard]] std::uint32_t barEighths(std::size_t index, std::uint16_t rows) const;
};

/// Multi-line styled text, top-left aligned, clipped to area.
struct ParagraphElement
{
    Rect area;
    std::vector<Line> lines;
};

using Element = std::variant<BlockElement, ListElement, SparklineElement, ParagraphElement>;

/// Everything one panel draws in one frame, in paint order.
class PanelTree
{
  public:
    void add(Element element)
    {
        m_Elements.push_back(std::move(element));
    }

    [[nodiscard]] const std::vector<Element>& elements() const noexcept
    {
        return m_Elements;
    }

    [[nodiscard]] bool empty() const noexcept
    {
        return m_Elements.empty();
    }

    [[nodiscard]] std::size_t size() const noexcept
    {
        return m_Elements.size();
    }

    [[nodiscard]] std::vector<const BlockElement*> blocks() const;
    [[nodiscard]] std::vector<const ListElement*> lists() const;
    [[nodiscard]] std::vector<const SparklineElement*> sparklines() const;
    [[nodiscard]] std::vector<const ParagraphElement*> paragraphs() const;

  private:
    std::vector<Element> m_Elements;
};

} // namespace UI
