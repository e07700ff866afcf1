#pragma once

#include "UI/Style.h"

#include <imgui.h>

namespace UI
{

/// Concrete colors for the named terminal colors used by panel trees.
struct Palette
{
    ImVec4 text{0.90F, 0.92F, 0.96F, 1.0F};
    ImVec4 red{1.0F, 0.0F, 0.0F, 1.0F};
    ImVec4 green{0.0F, 1.0F, 0.0F, 1.0F};
    ImVec4 lightYellow{1.0F, 1.0F, 0.6F, 1.0F};
    ImVec4 lightMagenta{1.0F, 0.5F, 1.0F, 1.0F};
    ImVec4 border{0.43F, 0.43F, 0.50F, 0.50F};

    /// Default palette (dark background)
    [[nodiscard]] static auto defaults() -> const Palette&;

    /// Color for a named color; Default maps to fallback.
    [[nodiscard]] auto resolve(Color color, const ImVec4& fallback) const -> ImVec4;

    [[nodiscard]] auto resolve(Color color) const -> ImVec4
    {
        return resolve(color, text);
    }
};

} // namespace UI
