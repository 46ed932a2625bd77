// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace llmtui
{

/// @brief Command line of a child process. No shell is involved.
struct SubprocessConfig
{
    std::string command;
    std::vector<std::string> args;
};

/// @brief How a child process ended.
struct ExitStatus
{
    int code = 0;        ///< Exit code, valid when signal == 0.
    int signal = 0;      ///< Terminating signal, or 0 for a normal exit.

    [[nodiscard]] auto success() const noexcept -> bool { return signal == 0 && code == 0; }
};

/// @brief Receives a chunk of bytes read from one of the child's output streams.
using OutputCallback = std::function<void(std::string_view chunk)>;

/// @brief A child process with captured stdout and stderr.
///
/// stdin of the child is connected to /dev/null. Output is read incrementally
/// through pump(), which multiplexes both streams with poll(). The child leads
/// its own process group, so signals reach anything it spawned as well.
class Subprocess
{
  public:
    Subprocess();
    ~Subprocess();

    Subprocess(const Subprocess&) = delete;
    Subprocess& operator=(const Subprocess&) = delete;

    /// @brief Spawns the child process.
    /// @return Success, or a SpawnFailure if the executable cannot be started.
    [[nodiscard]] auto start(const SubprocessConfig& config) -> VoidResult;

    /// @brief Waits up to @p timeout for output and forwards whatever is available.
    /// @return true while at least one stream is still open, false once both reached EOF.
    [[nodiscard]] auto pump(std::chrono::milliseconds timeout,
                            const OutputCallback& onStdout,
                            const OutputCallback& onStderr) -> Result<bool>;

    /// @brief Reaps the child, blocking until it exits.
    [[nodiscard]] auto wait() -> Result<ExitStatus>;

    /// @brief Reaps the child if it already exited.
    /// @return The exit status, or std::nullopt while the child is still running.
    [[nodiscard]] auto tryWait() -> Result<std::optional<ExitStatus>>;

    /// @brief Sends SIGTERM to the child's process group.
    void terminate();

    /// @brief Terminates the process group and reaps the child.
    ///
    /// Escalates to SIGKILL when the child is still alive after @p grace.
    /// Members of the group that outlive the child are killed too.
    [[nodiscard]] auto stop(std::chrono::milliseconds grace) -> Result<ExitStatus>;

    [[nodiscard]] auto isRunning() const noexcept -> bool;
    [[nodiscard]] auto pid() const noexcept -> int;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

/// @brief Runs a process to completion and returns its stdout.
///
/// Fails with SpawnFailure if the process cannot be started and with
/// StreamFailure if it exits unsuccessfully or exceeds @p timeout.
[[nodiscard]] auto captureOutput(const SubprocessConfig& config, std::chrono::milliseconds timeout)
    -> Result<std::string>;

/// @brief Quotes a single argument for display as a POSIX shell word.
[[nodiscard]] auto shellQuote(std::string_view argument) -> std::string;

/// @brief Renders a command line as a shell-quoted string, for logging.
[[nodiscard]] auto formatCommandLine(const SubprocessConfig& config) -> std::string;

} // namespace llmtui
