#include "Layout.h"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <vector>

namespace UI
{

Rect Rect::inner(std::uint16_t margin) const noexcept
{
    const std::uint32_t twice = static_cast<std::uint32_t>(margin) * 2U;
    if (width < twice || height < twice)
    {
        return {.x = x, .y = y, .width = 0, .height = 0};
    }

    return {.x = static_cast<std::uint16_t>(x + margin),
            .y = static_cast<std::uint16_t>(y + margin),
            .width = static_cast<std::uint16_t>(width - twice),
            .height = static_cast<std::uint16_t>(height - twice)};
}

namespace Layout
{

std::vector<Rect> split(const Rect& area, Direction direction, std::uint16_t margin, std::initializer_list<Constraint> constraints)
{
    const Rect inner = area.inner(margin);
    const bool horizontal = (direction == Direction::Horizontal);
    const std::uint32_t total = horizontal ? inner.width : inner.height;

    // First pass: fixed and percentage sizes, clamped to what remains.
    std::vector<std::uint32_t> sizes;
    sizes.reserve(constraints.size());
    std::uint32_t used = 0;
    std::size_t minIndex = constraints.size();

    for (const auto& constraint : constraints)
    {
        std::uint32_t want = 0;
        switch (constraint.kind)
        {
        case Constraint::Kind::Percentage:
            want = (total * std::min<std::uint32_t>(constraint.value, 100U)) / 100U;
            break;
        case Constraint::Kind::Length:
        case Constraint::Kind::Min:
            want = constraint.value;
            break;
        }

        const std::uint32_t size = std::min(want, total - used);
        if (constraint.kind == Constraint::Kind::Min && minIndex == constraints.size())
        {
            minIndex = sizes.size();
        }
        sizes.push_back(size);
        used += size;
    }

    // Leftover goes to the first Min chunk, or to the last chunk otherwise.
    if (!sizes.empty() && used < total)
    {
        const std::size_t growIndex = (minIndex < sizes.size()) ? minIndex : sizes.size() - 1;
        sizes[growIndex] += total - used;
    }

    std::vector<Rect> chunks;
    chunks.reserve(sizes.size());
    std::uint32_t offset = 0;
    for (const std::uint32_t size : sizes)
    {
        Rect chunk = inner;
        if (horizontal)
        {
            chunk.x = static_cast<std::uint16_t>(inner.x + offset);
            chunk.width = static_cast<std::uint16_t>(size);
        }
        else
        {
            chunk.y = static_cast<std::uint16_t>(inner.y + offset);
            chunk.height = static_cast<std::uint16_t>(size);
        }
        chunks.push_back(chunk);
        offset += size;
    }

    return chunks;
}

std::vector<Rect> splitEven(const Rect& area, Direction direction, std::uint16_t margin)
{
    return split(area, direction, margin, {Constraint::percentage(50), Constraint::percentage(50)});
}

} // namespace Layout

} // namespace UI
