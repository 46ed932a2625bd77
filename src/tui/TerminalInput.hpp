// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <array>
#include <vector>

#include <termios.h>

#include <tui/InputEvent.hpp>
#include <tui/VtParser.hpp>

namespace llmtui::tui
{

/// @brief Raw-mode keyboard reader.
///
/// Switches stdin into raw mode, turns on the Kitty keyboard protocol and
/// bracketed paste, and turns bytes into InputEvents. poll() waits on stdin,
/// the SIGWINCH self-pipe and an optional external wake descriptor, so
/// background producers can interrupt a blocking wait.
class TerminalInput
{
  public:
    TerminalInput();
    ~TerminalInput();

    TerminalInput(TerminalInput const&) = delete;
    auto operator=(TerminalInput const&) -> TerminalInput& = delete;
    TerminalInput(TerminalInput&&) = delete;
    auto operator=(TerminalInput&&) -> TerminalInput& = delete;

    /// @brief Enters raw mode and enables the input protocols.
    /// @return TerminalError when stdin is not a terminal or its attributes cannot be changed.
    [[nodiscard]] auto initialize() -> VoidResult;

    /// @brief Restores the original terminal state. Idempotent.
    void shutdown();

    /// @brief Waits for input.
    /// @param timeoutMs -1 = block, 0 = non-blocking, >0 = timeout in milliseconds.
    /// @return Parsed events; empty on timeout or when only the wake descriptor fired.
    [[nodiscard]] auto poll(int timeoutMs = -1) -> std::vector<InputEvent>;

    /// @brief Additional descriptor whose readability ends a poll() early. The caller drains it.
    void setWakeFd(int fd) noexcept { _wakeFd = fd; }

    /// @brief Signals a resize. Async-signal-safe.
    void notifyResize() noexcept;

  private:
    VtParser _parser;
    int _fd = 0; // STDIN_FILENO
    int _wakeFd = -1;
    struct termios _origTermios {};
    bool _rawMode = false;
    std::array<int, 2> _resizePipe = { -1, -1 };

    [[nodiscard]] auto enableRawMode() -> VoidResult;
    void disableRawMode();
    void writeSequence(char const* sequence) const;
};

} // namespace llmtui::tui
