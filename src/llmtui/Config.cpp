// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <remote/RemoteControlListener.hpp>

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

namespace llmtui
{

namespace
{
    auto section(const nlohmann::json& root, std::string_view name) -> const nlohmann::json&
    {
        static auto const empty = nlohmann::json::object();
        auto const it = root.find(std::string(name));
        return it != root.end() && it->is_object() ? *it : empty;
    }

    auto readTool(const nlohmann::json& node) -> ToolConfig
    {
        auto const defaults = ToolConfig {};
        return ToolConfig {
            .command = json::valueOr(node, "command", defaults.command),
            .extraArgs = json::stringArrayOr(node, "extraArgs", defaults.extraArgs),
            .aliasesArgs = json::stringArrayOr(node, "aliasesArgs", defaults.aliasesArgs),
            .useArgumentSeparator = json::valueOr(node, "useArgumentSeparator", defaults.useArgumentSeparator),
            .requestTimeoutSeconds = json::valueOr(node, "requestTimeoutSeconds", defaults.requestTimeoutSeconds),
        };
    }

    auto readRemote(const nlohmann::json& node) -> RemoteConfig
    {
        auto const defaults = RemoteConfig {};
        return RemoteConfig {
            .enabled = json::valueOr(node, "enabled", defaults.enabled),
            .host = json::valueOr(node, "host", defaults.host),
            .port = json::valueOr(node, "port", defaults.port),
        };
    }

    auto readUi(const nlohmann::json& node) -> UiConfig
    {
        auto const defaults = UiConfig {};
        return UiConfig {
            .showConversationList = json::valueOr(node, "showConversationList", defaults.showConversationList),
            .showLogPanel = json::valueOr(node, "showLogPanel", defaults.showLogPanel),
            .eventBatchSize = json::valueOr(node, "eventBatchSize", defaults.eventBatchSize),
            .feedbackSeconds = json::valueOr(node, "feedbackSeconds", defaults.feedbackSeconds),
        };
    }

    auto readModels(const nlohmann::json& root) -> std::vector<Model>
    {
        auto models = std::vector<Model> {};
        auto const it = root.find("models");
        if (it == root.end() || !it->is_array())
            return models;

        for (auto const& entry: *it)
        {
            auto model = Model { .id = json::valueOr(entry, "id", ""), .name = json::valueOr(entry, "name", "") };
            if (model.id.empty())
            {
                log::warning("Ignoring configured model without an id");
                continue;
            }
            if (model.name.empty())
                model.name = model.id;
            models.push_back(std::move(model));
        }
        return models;
    }

    auto toJson(const AppConfig& config) -> nlohmann::json
    {
        auto root = nlohmann::json::object();

        root["tool"] = {
            { "command", config.tool.command },
            { "aliasesArgs", config.tool.aliasesArgs },
            { "useArgumentSeparator", config.tool.useArgumentSeparator },
            { "requestTimeoutSeconds", config.tool.requestTimeoutSeconds },
        };
        if (!config.tool.extraArgs.empty())
            root["tool"]["extraArgs"] = config.tool.extraArgs;

        root["remote"] = {
            { "enabled", config.remote.enabled },
            { "host", config.remote.host },
            { "port", config.remote.port },
        };

        root["ui"] = {
            { "showConversationList", config.ui.showConversationList },
            { "showLogPanel", config.ui.showLogPanel },
            { "eventBatchSize", config.ui.eventBatchSize },
            { "feedbackSeconds", config.ui.feedbackSeconds },
        };

        if (!config.models.empty())
        {
            auto models = nlohmann::json::array();
            for (auto const& model: config.models)
                models.push_back({ { "id", model.id }, { "name", model.name } });
            root["models"] = std::move(models);
        }

        if (!config.defaultModel.empty())
            root["defaultModel"] = config.defaultModel;
        return root;
    }
} // namespace

auto defaultConfigDir() -> std::string
{
    if (auto const* const xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
        return std::format("{}/llm-tui", xdg);
    if (auto const* const home = std::getenv("HOME"); home && *home)
        return std::format("{}/.config/llm-tui", home);
    return ".";
}

auto defaultConfigPath() -> std::string
{
    return defaultConfigDir() + "/config.json";
}

auto parseConfig(std::string_view content) -> Result<AppConfig>
{
    auto parsed = json::parse(content);
    if (!parsed)
        return std::unexpected(parsed.error());

    auto const& root = *parsed;
    if (!root.is_object())
        return makeError(ErrorCode::ConfigError, "Configuration must be a JSON object");

    auto config = AppConfig {
        .tool = readTool(section(root, "tool")),
        .remote = readRemote(section(root, "remote")),
        .ui = readUi(section(root, "ui")),
        .models = readModels(root),
        .defaultModel = json::valueOr(root, "defaultModel", ""),
    };

    if (auto valid = validateConfig(config); !valid)
        return std::unexpected(valid.error());
    return config;
}

auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>
{
    auto file = std::ifstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot open config file: {}", path));

    auto contents = std::stringstream {};
    contents << file.rdbuf();

    auto config = parseConfig(contents.str());
    if (!config)
        return makeError(config.error().code, std::format("{}: {}", path, config.error().message));
    log::debug("Loaded configuration from {}", path);
    return config;
}

auto validateConfig(const AppConfig& config) -> VoidResult
{
    if (config.tool.command.empty())
        return makeError(ErrorCode::ConfigError, "tool.command must not be empty");
    if (config.tool.requestTimeoutSeconds < 0)
        return makeError(ErrorCode::ConfigError, "tool.requestTimeoutSeconds must not be negative");
    if (config.remote.port < 0 || config.remote.port > 65535)
        return makeError(ErrorCode::ConfigError, std::format("remote.port {} is out of range", config.remote.port));
    if (config.remote.enabled && !isLoopbackAddress(config.remote.host))
        return makeError(ErrorCode::ConfigError,
                         std::format("remote.host '{}' must be a loopback IPv4 address", config.remote.host));
    if (config.ui.eventBatchSize < 1)
        return makeError(ErrorCode::ConfigError, "ui.eventBatchSize must be at least 1");
    if (config.ui.feedbackSeconds < 0)
        return makeError(ErrorCode::ConfigError, "ui.feedbackSeconds must not be negative");
    return {};
}

auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult
{
    auto const dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        auto ec = std::error_code {};
        std::filesystem::create_directories(dir, ec);
        if (ec)
            return makeError(ErrorCode::ConfigError,
                             std::format("Failed to create config directory '{}': {}", dir.string(), ec.message()));
    }

    auto file = std::ofstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot write config file: {}", path));

    file << toJson(config).dump(4) << '\n';
    if (!file)
        return makeError(ErrorCode::IoError, std::format("Failed to write config file: {}", path));
    return {};
}

auto loadConfig() -> Result<AppConfig>
{
    auto const path = defaultConfigPath();
    if (!std::filesystem::exists(path))
    {
        log::info("No config file found at {}, using defaults", path);
        return AppConfig {};
    }
    return loadConfigFromFile(path);
}

} // namespace llmtui
