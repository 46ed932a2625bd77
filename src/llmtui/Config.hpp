// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace llmtui
{

/// @brief External tool section.
struct ToolConfig
{
    std::string command = "llm";
    std::vector<std::string> extraArgs;
    std::vector<std::string> aliasesArgs = { "aliases" };

    /// @brief Whether to pass "--" between the options and the prompt.
    /// Disable for tools that do not follow the POSIX convention.
    bool useArgumentSeparator = true;

    /// @brief Seconds before an unanswered request is terminated (0 = never).
    int requestTimeoutSeconds = 0;
};

/// @brief Remote control section.
struct RemoteConfig
{
    bool enabled = true;
    std::string host = "127.0.0.1";
    int port = 8080;
};

/// @brief User interface section.
struct UiConfig
{
    bool showConversationList = true;
    bool showLogPanel = false;
    int eventBatchSize = 64;
    int feedbackSeconds = 5;
};

/// @brief Top-level application configuration.
struct AppConfig
{
    ToolConfig tool;
    RemoteConfig remote;
    UiConfig ui;

    /// @brief Models offered in addition to the tool's aliases.
    std::vector<Model> models;

    /// @brief Model bound to new conversations (empty = tool default).
    std::string defaultModel;
};

/// @brief Loads the application configuration from the default config path.
/// A missing file yields the defaults.
/// @return The loaded configuration or an error.
[[nodiscard]] auto loadConfig() -> Result<AppConfig>;

/// @brief Loads the application configuration from a specific file path.
/// @param path The path to the config file.
/// @return The loaded configuration or an error.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>;

/// @brief Parses configuration from JSON text.
[[nodiscard]] auto parseConfig(std::string_view content) -> Result<AppConfig>;

/// @brief Saves the application configuration to a file.
/// @param path The path to the config file.
/// @param config The configuration to save.
/// @return Success or an error.
[[nodiscard]] auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult;

/// @brief Checks value ranges that JSON typing cannot express.
[[nodiscard]] auto validateConfig(const AppConfig& config) -> VoidResult;

/// @brief Returns the default config directory path.
/// $XDG_CONFIG_HOME/llm-tui or ~/.config/llm-tui
[[nodiscard]] auto defaultConfigDir() -> std::string;

/// @brief Returns the default config file path.
[[nodiscard]] auto defaultConfigPath() -> std::string;

} // namespace llmtui
