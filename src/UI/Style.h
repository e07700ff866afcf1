#pragma once

#include <string>
#include <utility>
#include <vector>

namespace UI
{

/// Terminal-style named colors. Painters map these to concrete colors.
enum class Color
{
    Default,
    Red,
    Green,
    LightYellow,
    LightMagenta,
};

struct Style
{
    Color fg = Color::Default;
    bool bold = false;

    [[nodiscard]] bool operator==(const Style&) const = default;

    [[nodiscard]] static constexpr Style plain() noexcept
    {
        return {};
    }

    [[nodiscard]] static constexpr Style colored(Color color) noexcept
    {
        return {.fg = color, .bold = false};
    }

    [[nodiscard]] constexpr Style withBold() const noexcept
    {
        return {.fg = fg, .bold = true};
    }
};

/// A run of text sharing one style.
struct Span
{
    std::string text;
    Style style;

    [[nodiscard]] static Span raw(std::string text)
    {
        return {.text = std::move(text), .style = Style::plain()};
    }

    [[nodiscard]] static Span styled(std::string text, Style style)
    {
        return {.text = std::move(text), .style = style};
    }
};

using Line = std::vector<Span>;

/// Concatenated text of a line, ignoring styles.
[[nodiscard]] inline std::string plainText(const Line& line)
{
    std::string out;
    for (const auto& span : line)
    {
        out += span.text;
    }
    return out;
}

} // namespace UI
