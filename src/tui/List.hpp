// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <tui/Box.hpp>
#include <tui/TerminalOutput.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace llmtui::tui
{

/// @brief A single row in a List.
struct ListItem
{
    std::string label;
    bool marked = false; ///< Drawn with a leading marker (e.g. the active entry).
};

/// @brief Styles for rendering a List.
struct ListStyle
{
    Style normal;
    Style highlighted;
    Style marked;
    std::string_view marker = "● ";
    std::string_view noMarker = "  ";
};

/// @brief Returns the index of the first row to show so that @p highlighted stays visible.
///
/// Keeps the highlighted row roughly centred once the list is longer than @p rows.
[[nodiscard]] auto listScrollOffset(std::size_t count, std::optional<std::size_t> highlighted, int rows)
    -> std::size_t;

/// @brief Renders @p items into @p area, highlighting one row.
///
/// Selection state lives with the caller; this only draws.
void renderList(TerminalOutput& output,
                Rect const& area,
                std::vector<ListItem> const& items,
                std::optional<std::size_t> highlighted,
                ListStyle const& style);

} // namespace llmtui::tui
