// SPDX-License-Identifier: Apache-2.0
#include "Subprocess.hpp"

#include <core/Log.hpp>

#include <sys/wait.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <format>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <unistd.h>

extern char** environ;

namespace llmtui
{

namespace
{
    void closeFd(int& fd)
    {
        if (fd >= 0)
        {
            ::close(fd);
            fd = -1;
        }
    }

    constexpr auto ReapPollInterval = std::chrono::milliseconds(20);

    auto decodeWaitStatus(int status) -> ExitStatus
    {
        if (WIFSIGNALED(status))
            return ExitStatus { .code = -1, .signal = WTERMSIG(status) };
        return ExitStatus { .code = WEXITSTATUS(status), .signal = 0 };
    }
} // namespace

struct Subprocess::Impl
{
    pid_t childPid = -1;
    pid_t groupId = -1;
    int stdoutRead = -1;
    int stderrRead = -1;
    std::optional<ExitStatus> exitStatus;

    ~Impl()
    {
        closeFd(stdoutRead);
        closeFd(stderrRead);
    }

    void signalGroup(int sig) const
    {
        if (groupId <= 0)
            return;
        if (kill(-groupId, sig) != 0 && errno != ESRCH && childPid > 0)
            kill(childPid, sig);
    }

    auto reaped(int status) -> ExitStatus
    {
        childPid = -1;
        exitStatus = decodeWaitStatus(status);
        return *exitStatus;
    }

    void release()
    {
        groupId = -1;
        closeFd(stdoutRead);
        closeFd(stderrRead);
    }
};

Subprocess::Subprocess(): _impl(std::make_unique<Impl>())
{
}

Subprocess::~Subprocess()
{
    if (_impl->childPid > 0 || _impl->groupId > 0)
    {
        auto const result = stop(std::chrono::seconds(1));
        if (!result)
            log::warning("Failed to reap child process: {}", result.error().message);
    }
}

auto Subprocess::start(const SubprocessConfig& config) -> VoidResult
{
    if (_impl->childPid > 0 || _impl->exitStatus)
        return makeError(ErrorCode::InvalidArgument, "Process already started");

    int stdoutPipe[2];
    int stderrPipe[2];

    if (pipe2(stdoutPipe, O_CLOEXEC) != 0)
        return makeError(ErrorCode::SpawnFailure, "Failed to create stdout pipe");
    if (pipe2(stderrPipe, O_CLOEXEC) != 0)
    {
        ::close(stdoutPipe[0]);
        ::close(stdoutPipe[1]);
        return makeError(ErrorCode::SpawnFailure, "Failed to create stderr pipe");
    }

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    posix_spawn_file_actions_adddup2(&actions, stdoutPipe[1], STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&actions, stderrPipe[1], STDERR_FILENO);

    // Build argv
    auto argvStorage = std::vector<std::string> {};
    argvStorage.reserve(config.args.size() + 1);
    argvStorage.push_back(config.command);
    argvStorage.insert(argvStorage.end(), config.args.begin(), config.args.end());

    auto argv = std::vector<char*> {};
    for (auto& arg: argvStorage)
        argv.push_back(arg.data());
    argv.push_back(nullptr);

    posix_spawnattr_t attributes;
    posix_spawnattr_init(&attributes);
    posix_spawnattr_setflags(&attributes, POSIX_SPAWN_SETPGROUP);
    posix_spawnattr_setpgroup(&attributes, 0);

    pid_t pid;
    auto const status = posix_spawnp(&pid, config.command.c_str(), &actions, &attributes, argv.data(), environ);
    posix_spawnattr_destroy(&attributes);
    posix_spawn_file_actions_destroy(&actions);

    ::close(stdoutPipe[1]);
    ::close(stderrPipe[1]);

    if (status != 0)
    {
        ::close(stdoutPipe[0]);
        ::close(stderrPipe[0]);
        return makeError(ErrorCode::SpawnFailure,
                         std::format("Failed to spawn process '{}': {}", config.command, strerror(status)));
    }

    _impl->childPid = pid;
    _impl->groupId = pid;
    _impl->stdoutRead = stdoutPipe[0];
    _impl->stderrRead = stderrPipe[0];

    log::debug("Spawned pid {}: {}", pid, formatCommandLine(config));
    return {};
}

auto Subprocess::pump(std::chrono::milliseconds timeout,
                      const OutputCallback& onStdout,
                      const OutputCallback& onStderr) -> Result<bool>
{
    auto fds = std::array<struct pollfd, 2> {};
    fds[0] = { .fd = _impl->stdoutRead, .events = POLLIN, .revents = 0 };
    fds[1] = { .fd = _impl->stderrRead, .events = POLLIN, .revents = 0 };

    if (fds[0].fd < 0 && fds[1].fd < 0)
        return false;

    // poll() ignores negative descriptors.
    auto const pollResult = ::poll(fds.data(), fds.size(), static_cast<int>(timeout.count()));
    if (pollResult < 0)
    {
        if (errno == EINTR)
            return true;
        return makeError(ErrorCode::StreamFailure, std::format("poll() failed: {}", strerror(errno)));
    }

    auto const drain = [](int& fd, short revents, const OutputCallback& callback) -> VoidResult {
        if (fd < 0 || (revents & (POLLIN | POLLHUP | POLLERR)) == 0)
            return {};

        auto buf = std::array<char, 4096> {};
        auto const bytesRead = ::read(fd, buf.data(), buf.size());
        if (bytesRead > 0)
        {
            if (callback)
                callback(std::string_view(buf.data(), static_cast<size_t>(bytesRead)));
            return {};
        }
        if (bytesRead < 0 && errno == EINTR)
            return {};

        auto const readError = errno;
        closeFd(fd);
        if (bytesRead < 0)
            return makeError(ErrorCode::StreamFailure, std::format("read() failed: {}", strerror(readError)));
        return {};
    };

    if (auto result = drain(_impl->stdoutRead, fds[0].revents, onStdout); !result)
        return std::unexpected(result.error());
    if (auto result = drain(_impl->stderrRead, fds[1].revents, onStderr); !result)
        return std::unexpected(result.error());

    return _impl->stdoutRead >= 0 || _impl->stderrRead >= 0;
}

auto Subprocess::wait() -> Result<ExitStatus>
{
    if (_impl->exitStatus)
    {
        _impl->release();
        return *_impl->exitStatus;
    }
    if (_impl->childPid <= 0)
        return makeError(ErrorCode::InvalidArgument, "No child process to wait for");

    int status = 0;
    while (waitpid(_impl->childPid, &status, 0) < 0)
    {
        if (errno != EINTR)
        {
            auto const waitError = errno;
            _impl->childPid = -1;
            _impl->release();
            return makeError(ErrorCode::StreamFailure, std::format("waitpid() failed: {}", strerror(waitError)));
        }
    }

    auto const exitStatus = _impl->reaped(status);
    _impl->release();
    return exitStatus;
}

auto Subprocess::tryWait() -> Result<std::optional<ExitStatus>>
{
    if (_impl->exitStatus)
        return _impl->exitStatus;
    if (_impl->childPid <= 0)
        return makeError(ErrorCode::InvalidArgument, "No child process to wait for");

    int status = 0;
    auto const result = waitpid(_impl->childPid, &status, WNOHANG);
    if (result == 0 || (result < 0 && errno == EINTR))
        return std::nullopt;
    if (result < 0)
    {
        auto const waitError = errno;
        _impl->childPid = -1;
        return makeError(ErrorCode::StreamFailure, std::format("waitpid() failed: {}", strerror(waitError)));
    }
    return _impl->reaped(status);
}

void Subprocess::terminate()
{
    if (_impl->childPid > 0 || _impl->groupId > 0)
        _impl->signalGroup(SIGTERM);
}

auto Subprocess::stop(std::chrono::milliseconds grace) -> Result<ExitStatus>
{
    terminate();

    auto const deadline = std::chrono::steady_clock::now() + grace;
    while (_impl->childPid > 0 && std::chrono::steady_clock::now() < deadline)
    {
        auto exited = tryWait();
        if (!exited)
        {
            _impl->release();
            return std::unexpected(exited.error());
        }
        if (*exited)
            break;
        std::this_thread::sleep_for(ReapPollInterval);
    }

    if (_impl->childPid > 0)
        log::debug("pid {} ignored SIGTERM for {}ms, killing it", _impl->childPid, grace.count());

    // Also reaches descendants that kept running after the child exited.
    _impl->signalGroup(SIGKILL);
    return wait();
}

auto Subprocess::isRunning() const noexcept -> bool
{
    return _impl->childPid > 0;
}

auto Subprocess::pid() const noexcept -> int
{
    return _impl->childPid;
}

auto captureOutput(const SubprocessConfig& config, std::chrono::milliseconds timeout) -> Result<std::string>
{
    auto process = Subprocess {};
    if (auto started = process.start(config); !started)
        return std::unexpected(started.error());

    auto output = std::string {};
    auto diagnostics = std::string {};
    auto const deadline = std::chrono::steady_clock::now() + timeout;

    while (true)
    {
        if (std::chrono::steady_clock::now() >= deadline)
        {
            if (auto reaped = process.stop(std::chrono::seconds(1)); !reaped)
                log::warning("Failed to reap '{}': {}", config.command, reaped.error().message);
            return makeError(ErrorCode::TimeoutError,
                             std::format("'{}' did not finish within {}ms", config.command, timeout.count()));
        }

        auto open = process.pump(
            std::chrono::milliseconds(100),
            [&](std::string_view chunk) { output.append(chunk); },
            [&](std::string_view chunk) { diagnostics.append(chunk); });
        if (!open)
            return std::unexpected(open.error());
        if (!*open)
            break;
    }

    auto const status = process.wait();
    if (!status)
        return std::unexpected(status.error());
    if (!status->success())
        return makeError(ErrorCode::StreamFailure,
                         std::format("'{}' exited with status {}: {}", config.command, status->code, diagnostics));
    return output;
}

auto shellQuote(std::string_view argument) -> std::string
{
    if (argument.empty())
        return "''";

    constexpr auto safe = std::string_view { "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789@%+=:,./-_" };
    if (argument.find_first_not_of(safe) == std::string_view::npos)
        return std::string(argument);

    auto quoted = std::string { "'" };
    for (auto const ch: argument)
    {
        if (ch == '\'')
            quoted += "'\\''";
        else
            quoted += ch;
    }
    quoted += '\'';
    return quoted;
}

auto formatCommandLine(const SubprocessConfig& config) -> std::string
{
    auto line = shellQuote(config.command);
    for (auto const& arg: config.args)
    {
        line += ' ';
        line += shellQuote(arg);
    }
    return line;
}

} // namespace llmtui
