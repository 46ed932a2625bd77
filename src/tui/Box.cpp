// SPDX-License-Identifier: Apache-2.0
#include <tui/Box.hpp>
#include <tui/Text.hpp>

#include <algorithm>
#include <format>
#include <string>

namespace llmtui::tui
{

namespace
{
    auto repeat(std::string_view glyph, int count) -> std::string
    {
        auto result = std::string {};
        for (auto i = 0; i < count; ++i)
            result.append(glyph);
        return result;
    }
} // namespace

void drawBox(TerminalOutput& output,
             Rect const& area,
             std::string_view title,
             Style const& borderStyle,
             Style const& titleStyle)
{
    if (area.width < 2 || area.height < 2)
        return;

    auto const innerWidth = area.width - 2;

    // Top edge: ╭─ Title ───╮
    output.moveTo(area.row, area.col);
    output.write(BorderChars::TopLeft, borderStyle);
    auto used = 0;
    if (!title.empty() && innerWidth >= 4)
    {
        auto const label = truncate(title, innerWidth - 3);
        output.write(BorderChars::Horizontal, borderStyle);
        output.write(std::format(" {} ", label), titleStyle);
        used = displayWidth(label) + 3;
    }
    output.write(repeat(BorderChars::Horizontal, innerWidth - used), borderStyle);
    output.write(BorderChars::TopRight, borderStyle);

    auto const blank = std::string(static_cast<std::size_t>(innerWidth), ' ');
    for (auto row = area.row + 1; row < area.row + area.height - 1; ++row)
    {
        output.moveTo(row, area.col);
        output.write(BorderChars::Vertical, borderStyle);
        output.writeRaw(blank);
        output.write(BorderChars::Vertical, borderStyle);
    }

    output.moveTo(area.row + area.height - 1, area.col);
    output.write(BorderChars::BottomLeft, borderStyle);
    output.write(repeat(BorderChars::Horizontal, innerWidth), borderStyle);
    output.write(BorderChars::BottomRight, borderStyle);
}

void fillRect(TerminalOutput& output, Rect const& area, Style const& style)
{
    if (area.empty())
        return;
    auto const blank = std::string(static_cast<std::size_t>(area.width), ' ');
    for (auto row = area.row; row < area.row + area.height; ++row)
    {
        output.moveTo(row, area.col);
        output.write(blank, style);
    }
}

} // namespace llmtui::tui
