// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace llmtui::tui
{

/// @brief Returns true if @p text contains C0, DEL or C1 control characters.
[[nodiscard]] auto hasControlCharacters(std::string_view text) -> bool;

/// @brief Makes untrusted text safe to print.
///
/// Tabs become spaces. Other C0 controls, DEL and C1 controls become U+FFFD,
/// so no escape sequence survives. With @p keepNewlines, "\n" and "\r\n" are
/// kept as "\n".
[[nodiscard]] auto sanitize(std::string_view text, bool keepNewlines = false) -> std::string;

/// @brief Returns the number of terminal cells @p text occupies.
///
/// Wide East Asian characters and emoji take two cells, combining marks none.
[[nodiscard]] auto displayWidth(std::string_view text) -> int;

/// @brief Cuts sanitized @p text to at most @p width cells, ending in "…" when shortened.
[[nodiscard]] auto truncate(std::string_view text, int width) -> std::string;

/// @brief Returns @p text without the grapheme clusters covering its first @p cells cells.
[[nodiscard]] auto dropColumns(std::string_view text, int cells) -> std::string_view;

/// @brief Pads @p text with spaces on the right up to @p width cells, truncating if longer.
[[nodiscard]] auto fitWidth(std::string_view text, int width) -> std::string;

/// @brief Word-wraps @p text into lines of at most @p width cells.
///
/// The text is sanitized first. Explicit newlines start a new line and are
/// kept as empty lines.
/// Words wider than @p width are split at grapheme boundaries.
[[nodiscard]] auto wordWrap(std::string_view text, int width) -> std::vector<std::string>;

} // namespace llmtui::tui
