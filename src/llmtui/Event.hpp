// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <future>
#include <memory>
#include <string>
#include <variant>
#include <vector>

#include <remote/RemoteCommand.hpp>
#include <tui/InputEvent.hpp>

namespace llmtui
{

/// @brief A terminal input event, forwarded onto the bus in arrival order.
struct TerminalInput
{
    tui::InputEvent input;
};

/// @brief A chunk of stdout produced by the subprocess serving @p messageId.
struct ReplyChunk
{
    MessageId messageId = 0;
    std::string bytes;
};

/// @brief The subprocess serving @p messageId exited successfully.
struct ReplyDone
{
    MessageId messageId = 0;
    int exitStatus = 0;
};

/// @brief The request for @p messageId failed to spawn or exited unsuccessfully.
///
/// error.code is SpawnFailure or StreamFailure.
struct ReplyFailed
{
    MessageId messageId = 0;
    Error error;
};

/// @brief One-shot slot the orchestrator fills with the reply line of a remote command.
using RemoteReply = std::shared_ptr<std::promise<std::string>>;

/// @brief A command received over the remote control channel.
struct RemoteRequest
{
    remote::Command command;
    RemoteReply reply; ///< May be null if the sender does not wait for an answer.
};

/// @brief A model registry reload finished.
struct ModelsReloaded
{
    std::vector<Model> models;
};

/// @brief A model registry reload failed; the previous snapshot stays in place.
struct ModelsReloadFailed
{
    Error error;
};

/// @brief Everything the orchestrator thread consumes.
using Event =
    std::variant<TerminalInput, ReplyChunk, ReplyDone, ReplyFailed, RemoteRequest, ModelsReloaded, ModelsReloadFailed>;

} // namespace llmtui
