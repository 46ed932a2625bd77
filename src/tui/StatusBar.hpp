// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <tui/TerminalOutput.hpp>

#include <string>
#include <vector>

namespace llmtui::tui
{

/// @brief A keyboard shortcut hint displayed in the status bar.
struct KeyHint
{
    std::string key;    ///< The key combination (e.g., "Tab").
    std::string action; ///< What it does (e.g., "focus").
};

/// @brief One-row bar with a left message (or key hints) and right-aligned info.
///
/// The left message takes precedence over hints. When both sides do not fit,
/// the left side is truncated.
class StatusBar
{
  public:
    void setHints(std::vector<KeyHint> hints) { _hints = std::move(hints); }

    /// @brief Shows @p text instead of the hints, in @p style.
    void setMessage(std::string text, Style const& style);
    void clearMessage();

    void setRightText(std::string text) { _rightText = std::move(text); }

    void render(TerminalOutput& output, int row, int width, Style const& background, Style const& keyStyle) const;

  private:
    std::vector<KeyHint> _hints;
    std::string _message;
    Style _messageStyle;
    std::string _rightText;
};

} // namespace llmtui::tui
