// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <vector>

#include <tui/InputEvent.hpp>
#include <tui/TerminalInput.hpp>
#include <tui/TerminalOutput.hpp>

namespace llmtui::tui
{

/// @brief Owns the terminal session: raw input, the alternate screen and SIGWINCH.
///
/// initialize() is all-or-nothing; on failure the terminal is left as it was.
/// shutdown() (also run by the destructor) restores the primary screen,
/// the cursor and the original termios settings.
class Terminal
{
  public:
    Terminal();
    ~Terminal();

    Terminal(Terminal const&) = delete;
    auto operator=(Terminal const&) -> Terminal& = delete;
    Terminal(Terminal&&) = delete;
    auto operator=(Terminal&&) -> Terminal& = delete;

    [[nodiscard]] auto initialize() -> VoidResult;
    void shutdown();

    [[nodiscard]] auto input() noexcept -> TerminalInput& { return _input; }
    [[nodiscard]] auto output() noexcept -> TerminalOutput& { return _output; }

    /// @brief Polls for input events. Resize events also refresh the cached size.
    [[nodiscard]] auto poll(int timeoutMs = -1) -> std::vector<InputEvent>;

    [[nodiscard]] auto columns() const noexcept -> int { return _output.columns(); }
    [[nodiscard]] auto rows() const noexcept -> int { return _output.rows(); }

  private:
    TerminalInput _input;
    TerminalOutput _output;
    bool _initialized = false;
};

} // namespace llmtui::tui
