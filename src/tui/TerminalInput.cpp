// SPDX-License-Identifier: Apache-2.0
#include <sys/ioctl.h>

#include <core/Log.hpp>

#include <array>
#include <cerrno>
#include <cstring>
#include <format>
#include <iterator>
#include <string_view>

#include <fcntl.h>
#include <poll.h>
#include <termios.h>
#include <unistd.h>

#include <tui/TerminalInput.hpp>

namespace llmtui::tui
{

namespace
{
    // Kitty keyboard protocol flags 1|8: disambiguate escape codes and report
    // all keys as escape codes, so Enter and Escape carry their modifiers.
    constexpr auto EnableCsiU = "\033[>9u";
    constexpr auto DisableCsiU = "\033[<u";
    constexpr auto EnableBracketedPaste = "\033[?2004h";
    constexpr auto DisableBracketedPaste = "\033[?2004l";

    void drain(int fd)
    {
        auto buf = std::array<char, 64> {};
        while (read(fd, buf.data(), buf.size()) > 0)
            ;
    }
} // namespace

TerminalInput::TerminalInput() = default;

TerminalInput::~TerminalInput()
{
    shutdown();
}

auto TerminalInput::initialize() -> VoidResult
{
    _fd = STDIN_FILENO;

    if (isatty(_fd) == 0)
        return makeError(ErrorCode::TerminalError, "stdin is not a terminal");

    if (pipe2(_resizePipe.data(), O_NONBLOCK | O_CLOEXEC) == -1)
        return makeError(ErrorCode::TerminalError,
                         std::format("Failed to create resize pipe: {}", std::strerror(errno)));

    if (auto result = enableRawMode(); !result)
        return result;

    writeSequence(EnableCsiU);
    writeSequence(EnableBracketedPaste);
    return {};
}

void TerminalInput::shutdown()
{
    if (_rawMode)
    {
        writeSequence(DisableBracketedPaste);
        writeSequence(DisableCsiU);
        disableRawMode();
    }

    for (auto& fd: _resizePipe)
    {
        if (fd != -1)
        {
            close(fd);
            fd = -1;
        }
    }
}

auto TerminalInput::poll(int timeoutMs) -> std::vector<InputEvent>
{
    auto fds = std::array<struct pollfd, 3> {};
    auto nfds = nfds_t { 0 };
    fds[nfds++] = { .fd = _fd, .events = POLLIN, .revents = 0 };
    fds[nfds++] = { .fd = _resizePipe[0], .events = POLLIN, .revents = 0 };
    if (_wakeFd != -1)
        fds[nfds++] = { .fd = _wakeFd, .events = POLLIN, .revents = 0 };

    auto const pollResult = ::poll(fds.data(), nfds, timeoutMs);
    if (pollResult == 0)
        return _parser.timeout();
    if (pollResult < 0)
    {
        if (errno != EINTR)
            log::warning("poll on terminal input failed: {}", std::strerror(errno));
        return {};
    }

    auto events = std::vector<InputEvent> {};

    if ((fds[1].revents & POLLIN) != 0)
    {
        drain(_resizePipe[0]);
        auto ws = winsize {};
        if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0)
            events.emplace_back(ResizeEvent { .columns = ws.ws_col, .rows = ws.ws_row });
    }

    if ((fds[0].revents & POLLIN) != 0)
    {
        auto buf = std::array<char, 512> {};
        auto const n = read(_fd, buf.data(), buf.size());
        if (n > 0)
        {
            auto parsed = _parser.feed(std::string_view(buf.data(), static_cast<size_t>(n)));
            events.insert(
                events.end(), std::make_move_iterator(parsed.begin()), std::make_move_iterator(parsed.end()));
        }
    }

    return events;
}

void TerminalInput::notifyResize() noexcept
{
    if (_resizePipe[1] != -1)
    {
        auto const byte = char { 1 };
        [[maybe_unused]] auto const result = write(_resizePipe[1], &byte, 1);
    }
}

auto TerminalInput::enableRawMode() -> VoidResult
{
    if (tcgetattr(_fd, &_origTermios) == -1)
        return makeError(ErrorCode::TerminalError,
                         std::format("Failed to read terminal attributes: {}", std::strerror(errno)));

    auto raw = _origTermios;
    raw.c_lflag &= ~static_cast<tcflag_t>(ICANON | ECHO | ISIG | IEXTEN);
    raw.c_iflag &= ~static_cast<tcflag_t>(IXON | ICRNL);
    raw.c_cc[VMIN] = 0;
    raw.c_cc[VTIME] = 0;
    if (tcsetattr(_fd, TCSAFLUSH, &raw) == -1)
        return makeError(ErrorCode::TerminalError,
                         std::format("Failed to enter raw mode: {}", std::strerror(errno)));

    _rawMode = true;
    return {};
}

void TerminalInput::disableRawMode()
{
    if (tcsetattr(_fd, TCSAFLUSH, &_origTermios) == -1)
        log::warning("Failed to restore terminal attributes: {}", std::strerror(errno));
    _rawMode = false;
}

void TerminalInput::writeSequence(char const* sequence) const
{
    if (write(STDOUT_FILENO, sequence, std::strlen(sequence)) == -1)
        log::debug("Failed to write terminal control sequence: {}", std::strerror(errno));
}

} // namespace llmtui::tui
