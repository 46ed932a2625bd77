// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace llmtui
{

/// @brief Opaque conversation identifier, assigned monotonically starting at 1.
using ConversationId = std::uint64_t;

/// @brief Message identifier, unique across all conversations.
using MessageId = std::uint64_t;

/// @brief The author of a message within a conversation.
enum class Role
{
    User,
    Model,
};

/// @brief Converts a Role enum to its string representation.
/// @param role The role to convert.
/// @return The string representation.
[[nodiscard]] constexpr auto roleToString(Role role) -> std::string_view
{
    switch (role)
    {
        case Role::User: return "user";
        case Role::Model: return "model";
    }
    return "unknown";
}

/// @brief Parses a string to a Role enum value.
/// @param str The string to parse.
/// @return The corresponding Role, or Role::User if unknown.
[[nodiscard]] constexpr auto roleFromString(std::string_view str) -> Role
{
    if (str == "model")
        return Role::Model;
    return Role::User;
}

/// @brief Lifecycle state of a message.
enum class MessageState
{
    Pending,
    Complete,
    Failed,
};

/// @brief Completion status of a message. `reason` is only meaningful for Failed.
struct MessageStatus
{
    MessageState state = MessageState::Complete;
    std::string reason;

    [[nodiscard]] static auto pending() -> MessageStatus { return { MessageState::Pending, {} }; }
    [[nodiscard]] static auto complete() -> MessageStatus { return { MessageState::Complete, {} }; }
    [[nodiscard]] static auto failed(std::string reason) -> MessageStatus
    {
        return { MessageState::Failed, std::move(reason) };
    }

    [[nodiscard]] auto isPending() const noexcept -> bool { return state == MessageState::Pending; }
    [[nodiscard]] auto isFailed() const noexcept -> bool { return state == MessageState::Failed; }
};

/// @brief A model available through the external tool.
struct Model
{
    std::string id;   ///< Alias passed to the tool (e.g. "4o").
    std::string name; ///< Full display name (e.g. "gpt-4o").
};

} // namespace llmtui
