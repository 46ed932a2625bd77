// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <tui/TerminalOutput.hpp>

namespace llmtui::tui
{

/// @brief Styles shared by all panels.
struct Theme
{
    Style text;
    Style muted;

    Style border;
    Style borderFocused; ///< Border of the panel holding keyboard focus.
    Style title;
    Style titleFocused;

    Style selected;          ///< Highlighted row in a focused list.
    Style selectedUnfocused; ///< Highlighted row in a list without focus.
    Style active;            ///< Marker for the active conversation or bound model.

    Style userLabel;
    Style modelLabel;
    Style pending;
    Style failed;

    Style positive;
    Style negative;
    Style statusBar;
    Style statusKey;

    Style logError;
    Style logWarning;
    Style logInfo;
    Style logDebug;
};

/// @brief Returns the built-in dark theme.
[[nodiscard]] auto defaultTheme() -> Theme;

} // namespace llmtui::tui
