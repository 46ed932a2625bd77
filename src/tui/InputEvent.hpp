// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <string>
#include <variant>

#include <tui/KeyCode.hpp>
#include <tui/Modifier.hpp>

namespace llmtui::tui
{

/// @brief Keyboard input event.
struct KeyEvent
{
    KeyCode key {};                      ///< Key code (printable uses codepoint, special keys use enum).
    Modifier modifiers = Modifier::None; ///< Active modifier keys.
    char32_t codepoint = 0;              ///< Original Unicode codepoint (0 for non-printable keys).
};

/// @brief Terminal resize event.
struct ResizeEvent
{
    int columns; ///< New terminal width in columns.
    int rows;    ///< New terminal height in rows.
};

/// @brief Bracketed paste event.
struct PasteEvent
{
    std::string text; ///< Pasted text content.
};

/// @brief Discriminated union of all terminal input events the application consumes.
using InputEvent = std::variant<KeyEvent, ResizeEvent, PasteEvent>;

/// @brief Convenience constructor for a printable key press.
[[nodiscard]] constexpr auto charKey(char32_t cp, Modifier modifiers = Modifier::None) noexcept -> KeyEvent
{
    return KeyEvent { .key = keyCodeFromCodepoint(cp), .modifiers = modifiers, .codepoint = cp };
}

} // namespace llmtui::tui
