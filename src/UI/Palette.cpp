#include "Palette.h"

#include <imgui.h>

namespace UI
{

auto Palette::defaults() -> const Palette&
{
    static const Palette palette;
    return palette;
}

auto Palette::resolve(Color color, const ImVec4& fallback) const -> ImVec4
{
    switch (color)
    {
    case Color::Default:
        return fallback;
    case Color::Red:
        return red;
    case Color::Green:
        return green;
    case Color::LightYellow:
        return lightYellow;
    case Color::LightMagenta:
        return lightMagenta;
    }
    return fallback;
}

} // namespace UI
