// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <tui/TerminalOutput.hpp>

#include <string_view>

namespace llmtui::tui
{

/// @brief A screen rectangle in 1-based cell coordinates.
struct Rect
{
    int row = 1;
    int col = 1;
    int width = 0;
    int height = 0;

    [[nodiscard]] auto empty() const noexcept -> bool { return width <= 0 || height <= 0; }

    /// @brief Returns the area inside a one-cell border.
    [[nodiscard]] auto inner() const noexcept -> Rect
    {
        return Rect { .row = row + 1, .col = col + 1, .width = width - 2, .height = height - 2 };
    }
};

/// @brief Rounded border glyphs.
struct BorderChars
{
    static constexpr std::string_view Horizontal = "─";
    static constexpr std::string_view Vertical = "│";
    static constexpr std::string_view TopLeft = "╭";
    static constexpr std::string_view TopRight = "╮";
    static constexpr std::string_view BottomLeft = "╰";
    static constexpr std::string_view BottomRight = "╯";
};

/// @brief Draws a bordered frame with an optional title embedded in the top edge.
///
/// The interior is cleared. Frames smaller than 2x2 are not drawn.
void drawBox(TerminalOutput& output,
             Rect const& area,
             std::string_view title,
             Style const& borderStyle,
             Style const& titleStyle);

/// @brief Fills @p area with spaces in @p style.
void fillRect(TerminalOutput& output, Rect const& area, Style const& style = {});

} // namespace llmtui::tui
