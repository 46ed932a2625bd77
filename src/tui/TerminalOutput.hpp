// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace llmtui::tui
{

/// @brief RGB color representation.
struct RgbColor
{
    std::uint8_t r = 0;
    std::uint8_t g = 0;
    std::uint8_t b = 0;
};

/// @brief Color representation: default, 256-color index, or true color (RGB).
using Color = std::variant<std::monostate, std::uint8_t, RgbColor>;

/// @brief Text styling attributes for terminal output.
struct Style
{
    Color fg;
    Color bg;
    bool bold = false;
    bool italic = false;
    bool underline = false;
    bool dim = false;
    bool inverse = false;
};

/// @brief Buffered writer for styled text and cursor control.
///
/// Everything is appended to an in-memory buffer; nothing reaches the
/// terminal until flush(). A frame bracketed by beginFrame()/endFrame() is
/// wrapped in synchronized-output mode (CSI ?2026) so it appears at once.
class TerminalOutput
{
  public:
    /// @brief Binds the writer to a descriptor and queries its size.
    [[nodiscard]] auto initialize(int fd) -> VoidResult;

    void write(std::string_view text, Style const& style = {});
    void writeRaw(std::string_view text);

    /// @brief Moves the cursor to an absolute position (1-based).
    void moveTo(int row, int col);

    void clearToEndOfLine();
    void clearScreen();

    void enterAltScreen();
    void leaveAltScreen();

    void showCursor();
    void hideCursor();

    void beginFrame();
    void endFrame();

    /// @brief Writes the buffered bytes, retrying on partial writes.
    [[nodiscard]] auto flush() -> VoidResult;

    [[nodiscard]] auto columns() const noexcept -> int { return _cols; }
    [[nodiscard]] auto rows() const noexcept -> int { return _rows; }

    /// @brief Re-reads the terminal size. Returns true when it changed.
    auto updateDimensions() -> bool;

    /// @brief Returns the bytes not yet flushed.
    [[nodiscard]] auto pending() const noexcept -> std::string_view { return _buffer; }

  private:
    std::string _buffer;
    int _fd = 1;
    int _cols = 80;
    int _rows = 24;

    void appendSgr(Style const& style);
};

} // namespace llmtui::tui
