// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <tui/InputEvent.hpp>

namespace llmtui::tui
{

/// @brief Result of processing an input event in InputField.
enum class InputFieldAction : std::uint8_t
{
    Changed, ///< Buffer content or cursor changed, re-render needed.
    None,    ///< Event not consumed by InputField.
};

/// @brief Single-line prompt editor with Emacs keybindings and history.
///
/// Pure model: accepts events and updates internal state; the caller renders
/// based on text() and cursor(). Cursor movement and deletion operate on
/// grapheme cluster boundaries using libunicode. Pasted line breaks become
/// spaces, since a prompt is always a single line.
class InputField
{
  public:
    /// @brief Processes an input event and returns the resulting action.
    [[nodiscard]] auto processEvent(InputEvent const& event) -> InputFieldAction;

    /// @brief Returns the current buffer content.
    [[nodiscard]] auto text() const noexcept -> std::string_view { return _buffer; }

    /// @brief Returns the cursor position as a byte offset into text().
    [[nodiscard]] auto cursor() const noexcept -> std::size_t { return _cursor; }

    /// @brief Returns the number of terminal cells before the cursor.
    [[nodiscard]] auto cursorColumn() const -> int;

    /// @brief Clears the buffer and resets cursor to position 0.
    void clear();

    /// @brief Sets the buffer content programmatically, placing the cursor at the end.
    void setText(std::string_view text);

    /// @brief Adds an entry to the history ring, skipping consecutive duplicates.
    void addHistory(std::string entry);

    /// @brief Sets the maximum number of history entries to retain.
    void setMaxHistory(std::size_t n);

    [[nodiscard]] auto history() const noexcept -> std::vector<std::string> const& { return _history; }

  private:
    std::string _buffer;
    std::size_t _cursor = 0;

    std::vector<std::string> _history;
    std::size_t _historyIndex = 0;
    std::string _savedLine;
    std::size_t _maxHistory = 100;

    [[nodiscard]] auto handleKey(KeyEvent const& key) -> InputFieldAction;

    void insertText(std::string_view text);
    void deleteChar();
    void deleteCharBackward();
    void killToEnd();
    void killToStart();
    void killWordBackward();
    void moveForwardWord();
    void moveBackwardWord();
    void historyPrev();
    void historyNext();

    [[nodiscard]] auto nextGraphemeCluster(std::size_t pos) const -> std::size_t;
    [[nodiscard]] auto prevGraphemeCluster(std::size_t pos) const -> std::size_t;
};

/// @brief Encodes a Unicode codepoint as UTF-8.
[[nodiscard]] auto encodeUtf8(char32_t cp) -> std::string;

} // namespace llmtui::tui
