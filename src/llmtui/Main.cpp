// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <llmtui/App.hpp>
#include <llmtui/Config.hpp>

#include <CLI/CLI.hpp>

#include <string>
#include <utility>

int main(int argc, char** argv)
{
    auto app = CLI::App { "llm-tui - terminal chat front end for the llm command line tool" };

    auto configPath = std::string {};
    auto tool = std::string {};
    auto host = std::string {};
    auto port = -1;
    auto timeout = -1;
    auto noRemote = false;
    auto showLog = false;
    auto verbose = false;
    auto logLevel = std::string {};
    auto writeConfig = false;

    app.add_option("-c,--config", configPath, "Path to config file");
    app.add_option("--tool", tool, "Command used to talk to models (default: llm)");
    app.add_option("--host", host, "Remote control listen address (127.0.0.0/8 only)");
    app.add_option("--port", port, "Remote control port (0 = any free port)")->check(CLI::Range(0, 65535));
    app.add_flag("--no-remote", noRemote, "Disable the remote control listener");
    app.add_option("--timeout", timeout, "Seconds before a request is abandoned (0 = never)")
        ->check(CLI::NonNegativeNumber);
    app.add_flag("--log", showLog, "Show the log panel on startup");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging (same as --log-level debug)");
    app.add_option("--log-level", logLevel, "Log verbosity")
        ->check(CLI::IsMember({ "error", "warning", "warn", "info", "debug", "trace" }));
    app.add_flag("--write-config", writeConfig, "Write the effective configuration to the config file and exit");

    CLI11_PARSE(app, argc, argv);

    if (verbose)
        llmtui::log::setLevel(llmtui::log::Level::Debug);
    if (auto const level = llmtui::log::parseLevel(logLevel))
        llmtui::log::setLevel(*level);

    auto configResult = configPath.empty() ? llmtui::loadConfig() : llmtui::loadConfigFromFile(configPath);
    if (!configResult)
    {
        llmtui::log::error("Failed to load config: {}", configResult.error().message);
        return 1;
    }

    auto& config = *configResult;

    // Apply CLI overrides
    if (!tool.empty())
        config.tool.command = tool;
    if (!host.empty())
        config.remote.host = host;
    if (port >= 0)
        config.remote.port = port;
    if (noRemote)
        config.remote.enabled = false;
    if (timeout >= 0)
        config.tool.requestTimeoutSeconds = timeout;
    if (showLog)
        config.ui.showLogPanel = true;

    if (auto valid = llmtui::validateConfig(config); !valid)
    {
        llmtui::log::error("Invalid configuration: {}", valid.error().message);
        return 1;
    }

    if (writeConfig)
    {
        auto const path = configPath.empty() ? llmtui::defaultConfigPath() : configPath;
        if (auto saved = llmtui::saveConfigToFile(path, config); !saved)
        {
            llmtui::log::error("Failed to write config: {}", saved.error().message);
            return 1;
        }
        llmtui::log::info("Configuration written to {}", path);
        return 0;
    }

    auto application = llmtui::App(std::move(config));
    if (auto initResult = application.initialize(); !initResult)
    {
        llmtui::log::error("Initialization failed: {}", initResult.error().message);
        return 1;
    }

    return application.run();
}
