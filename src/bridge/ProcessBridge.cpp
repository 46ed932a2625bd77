// SPDX-License-Identifier: Apache-2.0
#include "ProcessBridge.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <format>
#include <map>
#include <mutex>
#include <optional>
#include <string_view>
#include <thread>

#include <llmtui/EventBus.hpp>

namespace llmtui
{

namespace
{
    constexpr auto PumpInterval = std::chrono::milliseconds(100);

    /// Time a tool gets to exit after SIGTERM before it is killed.
    constexpr auto TerminateGrace = std::chrono::milliseconds(1500);

    /// How long output is still read after the tool exited while a
    /// descendant keeps its pipes open.
    constexpr auto ExitLinger = std::chrono::milliseconds(500);

    /// Limits how much stderr is carried into a failure reason.
    constexpr auto MaxDiagnosticLength = std::size_t { 2048 };

    auto trimmed(std::string_view text) -> std::string_view
    {
        auto const first = text.find_first_not_of(" \t\r\n");
        if (first == std::string_view::npos)
            return {};
        auto const last = text.find_last_not_of(" \t\r\n");
        return text.substr(first, last - first + 1);
    }

    auto describeExit(const ExitStatus& status, std::string_view diagnostics) -> std::string
    {
        auto reason = status.signal != 0 ? std::format("terminated by signal {}", status.signal)
                                         : std::format("exit status {}", status.code);
        auto const detail = trimmed(diagnostics);
        if (!detail.empty())
            reason += std::format(": {}", detail.substr(0, MaxDiagnosticLength));
        return reason;
    }
} // namespace

auto buildToolArguments(const ProcessBridgeConfig& config, const BridgeRequest& request)
    -> std::vector<std::string>
{
    auto args = config.extraArgs;
    if (!request.modelId.empty())
    {
        args.emplace_back("-m");
        args.push_back(request.modelId);
    }
    if (config.useArgumentSeparator)
        args.emplace_back("--");
    args.push_back(request.prompt);
    return args;
}

struct ProcessBridge::Impl
{
    struct Worker
    {
        std::jthread thread;
        std::shared_ptr<std::atomic<bool>> finished;
    };

    ProcessBridgeConfig config;
    EventBus& bus;

    mutable std::mutex mutex;
    std::map<RequestHandle, Worker> workers;
    RequestHandle nextHandle = 1;

    Impl(ProcessBridgeConfig cfg, EventBus& eventBus): config(std::move(cfg)), bus(eventBus) {}

    /// @brief Joins workers whose request already finished. Caller holds the mutex.
    void reapFinished()
    {
        std::erase_if(workers, [](auto const& entry) { return entry.second.finished->load(); });
    }

    void run(const std::stop_token& stopToken, const BridgeRequest& request)
    {
        auto const messageId = request.messageId;
        auto process = Subprocess {};
        auto const processConfig = SubprocessConfig {
            .command = config.command,
            .args = buildToolArguments(config, request),
        };

        if (auto started = process.start(processConfig); !started)
        {
            log::warning("Request for message {} failed to start: {}", messageId, started.error().message);
            bus.push(ReplyFailed { .messageId = messageId, .error = started.error() });
            return;
        }

        auto const deadline = config.requestTimeoutSeconds > 0
                                  ? std::chrono::steady_clock::now() + std::chrono::seconds(config.requestTimeoutSeconds)
                                  : std::chrono::steady_clock::time_point::max();

        auto diagnostics = std::string {};
        auto streamError = std::optional<Error> {};
        auto timedOut = false;

        auto const onStdout = [&](std::string_view chunk) {
            bus.push(ReplyChunk { .messageId = messageId, .bytes = std::string(chunk) });
        };
        auto const onStderr = [&](std::string_view chunk) {
            if (diagnostics.size() < MaxDiagnosticLength)
                diagnostics.append(chunk);
        };

        auto exitedAt = std::optional<std::chrono::steady_clock::time_point> {};
        auto mustStop = false;

        while (true)
        {
            if (stopToken.stop_requested())
            {
                log::debug("Stopping request for message {} (pid {})", messageId, process.pid());
                mustStop = true;
                break;
            }
            if (std::chrono::steady_clock::now() >= deadline)
            {
                log::warning("Request for message {} timed out after {}s", messageId, config.requestTimeoutSeconds);
                timedOut = true;
                mustStop = true;
                break;
            }

            auto open = process.pump(PumpInterval, onStdout, onStderr);
            if (!open)
            {
                streamError = open.error();
                mustStop = true;
                break;
            }
            if (!*open)
                break;

            if (!exitedAt)
            {
                auto exited = process.tryWait();
                if (!exited)
                {
                    streamError = exited.error();
                    mustStop = true;
                    break;
                }
                if (*exited)
                    exitedAt = std::chrono::steady_clock::now();
            }
            else if (std::chrono::steady_clock::now() - *exitedAt >= ExitLinger)
            {
                log::debug("Tool for message {} exited but its output is still open; stopping leftovers", messageId);
                mustStop = true;
                break;
            }
        }

        auto const status = mustStop ? process.stop(TerminateGrace) : process.wait();
        if (stopToken.stop_requested())
            return;

        if (!status)
        {
            bus.push(ReplyFailed { .messageId = messageId, .error = status.error() });
            return;
        }
        if (timedOut)
        {
            bus.push(ReplyFailed {
                .messageId = messageId,
                .error = Error { ErrorCode::StreamFailure,
                                 std::format("timed out after {}s", config.requestTimeoutSeconds) },
            });
            return;
        }
        if (streamError)
        {
            bus.push(ReplyFailed { .messageId = messageId, .error = *streamError });
            return;
        }
        if (!status->success())
        {
            auto reason = describeExit(*status, diagnostics);
            log::warning("Request for message {} failed: {}", messageId, reason);
            bus.push(ReplyFailed {
                .messageId = messageId,
                .error = Error { ErrorCode::StreamFailure, std::move(reason) },
            });
            return;
        }

        bus.push(ReplyDone { .messageId = messageId, .exitStatus = status->code });
    }
};

ProcessBridge::ProcessBridge(ProcessBridgeConfig config, EventBus& bus):
    _impl(std::make_unique<Impl>(std::move(config), bus))
{
}

ProcessBridge::~ProcessBridge()
{
    shutdown();
}

auto ProcessBridge::submit(BridgeRequest request) -> RequestHandle
{
    auto lock = std::lock_guard(_impl->mutex);
    _impl->reapFinished();

    auto const handle = _impl->nextHandle++;
    auto finished = std::make_shared<std::atomic<bool>>(false);

    log::debug("Submitting message {} for conversation {} (model '{}')",
               request.messageId,
               request.conversationId,
               request.modelId);

    auto thread = std::jthread([impl = _impl.get(), finished, request = std::move(request)](
                                   std::stop_token stopToken) {
        impl->run(stopToken, request);
        finished->store(true);
    });
    _impl->workers.emplace(handle, Impl::Worker { .thread = std::move(thread), .finished = std::move(finished) });
    return handle;
}

auto ProcessBridge::activeCount() const -> std::size_t
{
    auto lock = std::lock_guard(_impl->mutex);
    return static_cast<std::size_t>(
        std::ranges::count_if(_impl->workers, [](auto const& entry) { return !entry.second.finished->load(); }));
}

void ProcessBridge::shutdown()
{
    auto workers = std::map<RequestHandle, Impl::Worker> {};
    {
        auto lock = std::lock_guard(_impl->mutex);
        workers.swap(_impl->workers);
    }

    for (auto& [handle, worker]: workers)
        worker.thread.request_stop();

    if (!workers.empty())
        log::debug("Waiting for {} request worker(s) to stop", workers.size());
    workers.clear(); // jthread joins
}

auto ProcessBridge::config() const -> const ProcessBridgeConfig&
{
    return _impl->config;
}

} // namespace llmtui
