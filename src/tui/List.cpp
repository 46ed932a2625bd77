// SPDX-License-Identifier: Apache-2.0
#include <tui/List.hpp>
#include <tui/Text.hpp>

#include <algorithm>
#include <format>

namespace llmtui::tui
{

auto listScrollOffset(std::size_t count, std::optional<std::size_t> highlighted, int rows) -> std::size_t
{
    if (rows <= 0 || count <= static_cast<std::size_t>(rows))
        return 0;

    auto const visible = static_cast<std::size_t>(rows);
    auto const target = highlighted.value_or(0);
    auto const half = visible / 2;
    auto const maxOffset = count - visible;
    return std::min(target > half ? target - half : 0, maxOffset);
}

void renderList(TerminalOutput& output,
                Rect const& area,
                std::vector<ListItem> const& items,
                std::optional<std::size_t> highlighted,
                ListStyle const& style)
{
    if (area.empty())
        return;

    auto const offset = listScrollOffset(items.size(), highlighted, area.height);
    auto const labelWidth = area.width - displayWidth(style.marker);
    auto row = area.row;

    for (auto i = offset; i < items.size() && row < area.row + area.height; ++i, ++row)
    {
        auto const& item = items[i];
        auto const isHighlighted = highlighted && *highlighted == i;
        auto const& rowStyle = isHighlighted ? style.highlighted : (item.marked ? style.marked : style.normal);

        output.moveTo(row, area.col);
        output.write(std::format("{}{}", item.marked ? style.marker : style.noMarker, fitWidth(item.label, labelWidth)),
                     rowStyle);
    }
}

} // namespace llmtui::tui
