// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <variant>

namespace llmtui::remote
{

/// @brief `NEW`: create a conversation and make it active.
struct NewConversation
{
};

/// @brief `SEND <text>`: send text to the active conversation.
struct SendText
{
    std::string text;
};

/// @brief `MODEL <id>`: bind a model to the active conversation.
struct SwitchModel
{
    std::string modelId;
};

/// @brief `STATUS`: request a one-line status report.
struct StatusQuery
{
};

/// @brief A line that does not match the command grammar.
struct Ignored
{
    std::string reason;
};

/// @brief A parsed remote control line.
using Command = std::variant<NewConversation, SendText, SwitchModel, StatusQuery, Ignored>;

/// @brief Longest accepted command line, in bytes.
constexpr auto MaxLineLength = std::size_t { 64 * 1024 };

/// @brief Parses one line of the remote control protocol.
///
/// Keywords are matched case-sensitively. The line must not contain the
/// terminating newline; a single trailing carriage return is tolerated.
/// Anything that does not match the grammar yields Ignored.
[[nodiscard]] auto parseCommand(std::string_view line) -> Command;

/// @brief Returns the protocol keyword of a command ("NEW", "SEND", ...).
[[nodiscard]] auto commandName(const Command& command) -> std::string_view;

} // namespace llmtui::remote
