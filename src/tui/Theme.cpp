// SPDX-License-Identifier: Apache-2.0
#include <tui/Theme.hpp>

namespace llmtui::tui
{

namespace
{
    constexpr auto Text = RgbColor { .r = 230, .g = 230, .b = 225 };
    constexpr auto Muted = RgbColor { .r = 140, .g = 140, .b = 150 };
    constexpr auto Border = RgbColor { .r = 90, .g = 94, .b = 115 };
    constexpr auto Focus = RgbColor { .r = 241, .g = 200, .b = 60 }; // Yellow
    constexpr auto Accent = RgbColor { .r = 130, .g = 180, .b = 255 };
    constexpr auto Surface = RgbColor { .r = 40, .g = 42, .b = 54 };
    constexpr auto Green = RgbColor { .r = 80, .g = 220, .b = 120 };
    constexpr auto Red = RgbColor { .r = 255, .g = 85, .b = 85 };
    constexpr auto Orange = RgbColor { .r = 255, .g = 184, .b = 108 };
    constexpr auto Cyan = RgbColor { .r = 139, .g = 233, .b = 253 };
} // namespace

auto defaultTheme() -> Theme
{
    auto theme = Theme {};

    theme.text.fg = Text;
    theme.muted.fg = Muted;

    theme.border.fg = Border;
    theme.borderFocused.fg = Focus;
    theme.borderFocused.bold = true;
    theme.title.fg = Muted;
    theme.titleFocused.fg = Focus;
    theme.titleFocused.bold = true;

    theme.selected.fg = Surface;
    theme.selected.bg = Focus;
    theme.selected.bold = true;
    theme.selectedUnfocused.inverse = true;
    theme.active.fg = Accent;
    theme.active.bold = true;

    theme.userLabel.fg = Cyan;
    theme.userLabel.bold = true;
    theme.modelLabel.fg = Green;
    theme.modelLabel.bold = true;
    theme.pending.fg = Muted;
    theme.pending.italic = true;
    theme.failed.fg = Red;

    theme.positive.fg = Green;
    theme.positive.bg = Surface;
    theme.negative.fg = Red;
    theme.negative.bg = Surface;
    theme.negative.bold = true;
    theme.statusBar.fg = Muted;
    theme.statusBar.bg = Surface;
    theme.statusKey.fg = Accent;
    theme.statusKey.bg = Surface;
    theme.statusKey.bold = true;

    theme.logError.fg = Red;
    theme.logWarning.fg = Orange;
    theme.logInfo.fg = Text;
    theme.logDebug.fg = Muted;

    return theme;
}

} // namespace llmtui::tui
