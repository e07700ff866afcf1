#include "PanelTree.h"

#include "UI/Numeric.h"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <variant>
#include <vector>

namespace UI
{

namespace
{

template<typename T> [[nodiscard]] std::vector<const T*> collect(const std::vector<Element>& elements)
{
    std::vector<const T*> out;
    for (const auto& element : elements)
    {
        if (const auto* typed = std::get_if<T>(&element))
        {
            out.push_back(typed);
        }
    }
    return out;
}

} // namespace

std::uint32_t SparklineElement::barEighths(std::size_t index, std::uint16_t rows) const
{
    if (index >= data.size() || rows == 0)
    {
        return 0;
    }

    const double fraction = Numeric::fraction01(data[index], max);
    const double eighths = fraction * static_cast<double>(rows) * 8.0;
    return static_cast<std::uint32_t>(std::floor(eighths));
}

std::vector<const BlockElement*> PanelTree::blocks() const
{
    return collect<BlockElement>(m_Elements);
}

std::vector<const ListElement*> PanelTree::lists() const
{
    return collect<ListElement>(m_Elements);
}

std::vector<const SparklineElement*> PanelTree::sparklines() const
{
    return collect<SparklineElement>(m_Elements);
}

std::vector<const ParagraphElement*> PanelTree::paragraphs() const
{
    return collect<ParagraphElement>(m_Elements);
}

} // namespace UI
