// SPDX-License-Identifier: Apache-2.0
#include "App.hpp"

#include <core/Log.hpp>

#include <atomic>
#include <chrono>
#include <format>
#include <print>
#include <thread>
#include <utility>

#include <bridge/ProcessBridge.hpp>
#include <llmtui/EventBus.hpp>
#include <llmtui/Orchestrator.hpp>
#include <llmtui/View.hpp>
#include <remote/RemoteControlListener.hpp>
#include <session/ModelRegistry.hpp>
#include <tui/Clipboard.hpp>
#include <tui/LogPanel.hpp>
#include <tui/Terminal.hpp>

namespace llmtui
{

namespace
{
    constexpr auto PollTimeoutMs = 100;

    /// Lists the tool's aliases and appends the configured models.
    auto discoverModels(AppConfig const& config) -> Result<std::vector<Model>>
    {
        return loadModels(ModelSource {
            .command = config.tool.command,
            .aliasesArgs = config.tool.aliasesArgs,
            .configured = config.models,
        });
    }
} // namespace

struct App::Impl
{
    AppConfig config;
    tui::LogPanel logPanel;
    std::atomic<bool> logDirty { false };

    EventBus bus;
    ProcessBridge bridge;
    std::unique_ptr<RemoteControlListener> listener;
    std::unique_ptr<Orchestrator> orchestrator;

    tui::Terminal terminal;
    tui::Clipboard clipboard { terminal.output() };
    View view { tui::defaultTheme() };

    std::jthread reloadWorker;

    explicit Impl(AppConfig cfg):
        config(std::move(cfg)),
        bridge(
            ProcessBridgeConfig {
                .command = config.tool.command,
                .extraArgs = config.tool.extraArgs,
                .useArgumentSeparator = config.tool.useArgumentSeparator,
                .requestTimeoutSeconds = config.tool.requestTimeoutSeconds,
            },
            bus)
    {
    }

    auto initialModels() -> ModelRegistry
    {
        auto models = discoverModels(config);
        if (models)
        {
            log::info("Found {} model(s)", models->size());
            return ModelRegistry(std::move(*models));
        }
        log::warning("Could not list models: {}", models.error());
        return ModelRegistry(config.models);
    }

    void startRemoteControl()
    {
        if (!config.remote.enabled)
        {
            orchestrator->setRemoteStatus("off");
            return;
        }

        listener = std::make_unique<RemoteControlListener>(
            RemoteControlConfig {
                .host = config.remote.host,
                .port = static_cast<std::uint16_t>(config.remote.port),
            },
            bus);
        if (auto result = listener->start(); !result)
        {
            log::warning("Remote control disabled: {}", result.error());
            orchestrator->setRemoteStatus("unavailable");
            listener.reset();
            return;
        }
        orchestrator->setRemoteStatus(listener->address());
    }

    void startModelReload()
    {
        // The orchestrator never starts a second reload before the first one reported back.
        reloadWorker = std::jthread([this](std::stop_token const& stop) {
            auto models = discoverModels(config);
            if (stop.stop_requested())
                return;
            if (models)
                bus.push(ModelsReloaded { .models = std::move(*models) });
            else
                bus.push(ModelsReloadFailed { .error = models.error() });
        });
    }

    void installLogCallback()
    {
        log::setCallback([this](log::Level level, std::string_view message) {
            logPanel.addLog(level, std::string(message));
            logDirty.store(true, std::memory_order_relaxed);
        });
    }

    void render()
    {
        view.render(terminal.output(), *orchestrator, logPanel);
        if (auto result = terminal.output().flush(); !result)
            log::error("Failed to draw: {}", result.error());
    }

    void shutdown()
    {
        bridge.shutdown();
        if (listener)
            listener->stop();
        if (reloadWorker.joinable())
        {
            reloadWorker.request_stop();
            reloadWorker.join();
        }
        bus.close();
    }
};

App::App(AppConfig config): _impl(std::make_unique<Impl>(std::move(config)))
{
}

App::~App()
{
    _impl->shutdown();
}

auto App::initialize() -> VoidResult
{
    if (auto result = _impl->bus.initialize(); !result)
        return result;

    auto& config = _impl->config;
    _impl->orchestrator = std::make_unique<Orchestrator>(
        OrchestratorConfig {
            .defaultModel = config.defaultModel,
            .batchSize = static_cast<std::size_t>(config.ui.eventBatchSize),
            .feedbackDuration = std::chrono::seconds(config.ui.feedbackSeconds),
            .showConversationList = config.ui.showConversationList,
            .showLogPanel = config.ui.showLogPanel,
        },
        _impl->bridge,
        _impl->initialModels());

    _impl->orchestrator->setClipboardWriter(
        [this](std::string_view text) -> VoidResult { return _impl->clipboard.copy(text); });
    _impl->orchestrator->setModelReloader([this]() { _impl->startModelReload(); });

    _impl->startRemoteControl();
    return {};
}

auto App::run() -> int
{
    auto& terminal = _impl->terminal;
    if (auto result = terminal.initialize(); !result)
    {
        std::println(stderr, "Failed to initialize terminal: {}", result.error().message);
        return 1;
    }

    _impl->installLogCallback();
    terminal.input().setWakeFd(_impl->bus.wakeFd());

    auto& orchestrator = *_impl->orchestrator;
    auto& bus = _impl->bus;
    log::info("Tool: {}", _impl->config.tool.command);
    _impl->render();

    while (!orchestrator.quitRequested())
    {
        auto const timeout = bus.empty() ? PollTimeoutMs : 0;
        for (auto& input: terminal.poll(timeout))
            bus.push(TerminalInput { .input = std::move(input) });

        orchestrator.processBatch(bus);
        orchestrator.tick(std::chrono::steady_clock::now());

        auto const logChanged = _impl->logDirty.exchange(false, std::memory_order_relaxed);
        if (orchestrator.consumeDirty() || (logChanged && orchestrator.isLogVisible()))
            _impl->render();
    }

    if (auto const pending = orchestrator.pendingRequests().size(); pending > 0)
        log::info("Abandoning {} unfinished request(s)", pending);

    log::setCallback(nullptr);
    _impl->shutdown();
    terminal.shutdown();
    return 0;
}

} // namespace llmtui
