// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>

#include <csignal>
#include <variant>

#include <unistd.h>

#include <tui/Terminal.hpp>

namespace llmtui::tui
{

namespace
{
    // Only one Terminal is active at a time; the handler forwards to it.
    TerminalInput* gActiveInput = nullptr; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)
    struct sigaction gPrevSigwinch {};     // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)

    void sigwinchHandler(int /*sig*/)
    {
        if (gActiveInput != nullptr)
            gActiveInput->notifyResize();
    }
} // namespace

Terminal::Terminal() = default;

Terminal::~Terminal()
{
    shutdown();
}

auto Terminal::initialize() -> VoidResult
{
    if (_initialized)
        return {};

    if (auto result = _output.initialize(STDOUT_FILENO); !result)
        return result;

    if (auto result = _input.initialize(); !result)
    {
        _input.shutdown();
        return result;
    }

    gActiveInput = &_input;
    struct sigaction sa {};
    sa.sa_handler = sigwinchHandler;
    sa.sa_flags = SA_RESTART;
    sigemptyset(&sa.sa_mask);
    if (sigaction(SIGWINCH, &sa, &gPrevSigwinch) == -1)
        log::warning("Failed to install SIGWINCH handler; resizes will not be noticed");

    _output.enterAltScreen();
    _output.hideCursor();
    _output.clearScreen();
    if (auto result = _output.flush(); !result)
    {
        sigaction(SIGWINCH, &gPrevSigwinch, nullptr);
        gActiveInput = nullptr;
        _input.shutdown();
        return makeError(ErrorCode::TerminalError, result.error().message);
    }

    _initialized = true;
    return {};
}

void Terminal::shutdown()
{
    if (!_initialized)
        return;

    sigaction(SIGWINCH, &gPrevSigwinch, nullptr);
    gActiveInput = nullptr;

    _output.showCursor();
    _output.leaveAltScreen();
    if (auto result = _output.flush(); !result)
        log::warning("Failed to restore the terminal screen: {}", result.error());

    _input.shutdown();
    _initialized = false;
}

auto Terminal::poll(int timeoutMs) -> std::vector<InputEvent>
{
    auto events = _input.poll(timeoutMs);
    for (auto const& event: events)
    {
        if (std::holds_alternative<ResizeEvent>(event))
            _output.updateDimensions();
    }
    return events;
}

} // namespace llmtui::tui
