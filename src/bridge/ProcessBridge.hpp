// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <bridge/Bridge.hpp>
#include <bridge/Subprocess.hpp>

#include <memory>
#include <string>
#include <vector>

namespace llmtui
{

class EventBus;

/// @brief How the external tool is invoked for each prompt.
struct ProcessBridgeConfig
{
    std::string command = "llm";
    std::vector<std::string> extraArgs;   ///< Inserted right after the command.
    bool useArgumentSeparator = true;     ///< Pass "--" before the prompt.
    int requestTimeoutSeconds = 0;        ///< 0 disables the timeout.
};

/// @brief Builds the argv used to answer @p request, without the command itself.
[[nodiscard]] auto buildToolArguments(const ProcessBridgeConfig& config, const BridgeRequest& request)
    -> std::vector<std::string>;

/// @brief Bridge that spawns one external tool process per request.
///
/// Each request runs on its own worker thread that owns the child process,
/// streams stdout as ReplyChunk events and reports the exit as ReplyDone or
/// ReplyFailed on the event bus.
class ProcessBridge: public Bridge
{
  public:
    ProcessBridge(ProcessBridgeConfig config, EventBus& bus);
    ~ProcessBridge() override;

    ProcessBridge(const ProcessBridge&) = delete;
    ProcessBridge& operator=(const ProcessBridge&) = delete;

    auto submit(BridgeRequest request) -> RequestHandle override;
    [[nodiscard]] auto activeCount() const -> std::size_t override;
    void shutdown() override;

    [[nodiscard]] auto config() const -> const ProcessBridgeConfig&;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace llmtui
