// SPDX-License-Identifier: Apache-2.0
#include <sys/ioctl.h>

#include <cerrno>
#include <cstring>
#include <format>

#include <unistd.h>

#include <tui/TerminalOutput.hpp>
#include <tui/Text.hpp>

namespace llmtui::tui
{

namespace
{
    auto isDefault(Style const& style) -> bool
    {
        return std::holds_alternative<std::monostate>(style.fg) && std::holds_alternative<std::monostate>(style.bg)
               && !style.bold && !style.italic && !style.underline && !style.dim && !style.inverse;
    }

    void appendColor(std::string& out, Color const& color, int base)
    {
        if (auto const* idx = std::get_if<std::uint8_t>(&color))
            out += std::format(";{};5;{}", base, *idx);
        else if (auto const* rgb = std::get_if<RgbColor>(&color))
            out += std::format(";{};2;{};{};{}", base, rgb->r, rgb->g, rgb->b);
    }
} // namespace

auto TerminalOutput::initialize(int fd) -> VoidResult
{
    _fd = fd;
    if (isatty(_fd) == 0)
        return makeError(ErrorCode::TerminalError, "stdout is not a terminal");
    updateDimensions();
    return {};
}

void TerminalOutput::write(std::string_view text, Style const& style)
{
    // Escape sequences only go out through writeRaw() and the cursor helpers.
    auto clean = std::string {};
    if (hasControlCharacters(text))
    {
        clean = sanitize(text);
        text = clean;
    }

    if (isDefault(style))
    {
        _buffer.append(text);
        return;
    }
    appendSgr(style);
    _buffer.append(text);
    _buffer += "\033[m";
}

void TerminalOutput::writeRaw(std::string_view text)
{
    _buffer.append(text);
}

void TerminalOutput::moveTo(int row, int col)
{
    _buffer += std::format("\033[{};{}H", row, col);
}

void TerminalOutput::clearToEndOfLine()
{
    _buffer += "\033[K";
}

void TerminalOutput::clearScreen()
{
    _buffer += "\033[2J\033[H";
}

void TerminalOutput::enterAltScreen()
{
    _buffer += "\033[?1049h";
}

void TerminalOutput::leaveAltScreen()
{
    _buffer += "\033[?1049l";
}

void TerminalOutput::showCursor()
{
    _buffer += "\033[?25h";
}

void TerminalOutput::hideCursor()
{
    _buffer += "\033[?25l";
}

void TerminalOutput::beginFrame()
{
    _buffer += "\033[?2026h";
}

void TerminalOutput::endFrame()
{
    _buffer += "\033[?2026l";
}

auto TerminalOutput::flush() -> VoidResult
{
    auto remaining = std::string_view { _buffer };
    while (!remaining.empty())
    {
        auto const n = ::write(_fd, remaining.data(), remaining.size());
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            _buffer.clear();
            return makeError(ErrorCode::IoError, std::format("terminal write failed: {}", std::strerror(errno)));
        }
        remaining.remove_prefix(static_cast<size_t>(n));
    }
    _buffer.clear();
    return {};
}

auto TerminalOutput::updateDimensions() -> bool
{
    auto ws = winsize {};
    if (ioctl(_fd, TIOCGWINSZ, &ws) != 0 || ws.ws_col == 0 || ws.ws_row == 0)
        return false;
    auto const changed = ws.ws_col != _cols || ws.ws_row != _rows;
    _cols = ws.ws_col;
    _rows = ws.ws_row;
    return changed;
}

void TerminalOutput::appendSgr(Style const& style)
{
    // Leading 0 resets, so every attribute after it is joined with ';'.
    _buffer += "\033[0";
    if (style.bold)
        _buffer += ";1";
    if (style.dim)
        _buffer += ";2";
    if (style.italic)
        _buffer += ";3";
    if (style.underline)
        _buffer += ";4";
    if (style.inverse)
        _buffer += ";7";
    appendColor(_buffer, style.fg, 38);
    appendColor(_buffer, style.bg, 48);
    _buffer += 'm';
}

} // namespace llmtui::tui
