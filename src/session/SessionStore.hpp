// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace llmtui
{

/// @brief A single message within a conversation.
struct Message
{
    MessageId id = 0;
    Role role = Role::User;
    std::string text;
    MessageStatus status;
};

/// @brief A named, ordered thread of messages bound to one model.
struct Conversation
{
    ConversationId id = 0;
    std::string name;
    std::string modelId; ///< Empty means the tool's default model.
    std::vector<Message> messages;

    /// @brief Returns the pending message of this conversation, if any.
    [[nodiscard]] auto pendingMessage() const -> const Message*;
};

/// @brief Owns all conversations and their messages.
///
/// The store is not thread-safe. It is owned by the orchestrator thread and
/// every other thread reaches it only through events. Each mutation marks the
/// store dirty; the render pass consumes that flag.
class SessionStore
{
  public:
    /// @brief Constructs an empty store.
    /// @param defaultModel Model bound to newly created conversations.
    explicit SessionStore(std::string defaultModel = "");

    /// @brief Creates a new conversation, appends it to the list and selects it.
    /// @return The identifier of the new conversation.
    auto createConversation() -> ConversationId;

    /// @brief Makes the given conversation the active one.
    [[nodiscard]] auto selectConversation(ConversationId id) -> VoidResult;

    /// @brief Appends a completed user message.
    /// @return The new message identifier.
    [[nodiscard]] auto appendUserMessage(ConversationId id, std::string text) -> Result<MessageId>;

    /// @brief Appends an empty, pending model message.
    ///
    /// Fails with ConversationBusy if the conversation already has a pending reply.
    [[nodiscard]] auto beginModelReply(ConversationId id) -> Result<MessageId>;

    /// @brief Appends a chunk of streamed text to a pending model message.
    ///
    /// Unknown or already finished messages are left untouched and a warning is logged.
    [[nodiscard]] auto appendToReply(MessageId messageId, std::string_view chunk) -> VoidResult;

    /// @brief Finalizes a pending model message with the given status.
    ///
    /// Unknown or already finished messages are left untouched and a warning is logged.
    [[nodiscard]] auto completeReply(MessageId messageId, MessageStatus status) -> VoidResult;

    /// @brief Binds a model identifier to a conversation.
    [[nodiscard]] auto setModel(ConversationId id, std::string modelId) -> VoidResult;

    /// @brief Conversations in creation order.
    [[nodiscard]] auto conversations() const noexcept -> const std::vector<Conversation>& { return _conversations; }

    [[nodiscard]] auto find(ConversationId id) const -> const Conversation*;
    [[nodiscard]] auto findMessage(MessageId messageId) const -> const Message*;

    /// @brief Position of a conversation in creation order.
    [[nodiscard]] auto indexOf(ConversationId id) const -> std::optional<std::size_t>;

    [[nodiscard]] auto activeConversationId() const noexcept -> std::optional<ConversationId> { return _active; }
    [[nodiscard]] auto activeConversation() const -> const Conversation*;

    [[nodiscard]] auto hasPendingReply(ConversationId id) const -> bool;

    /// @brief Number of pending model messages across all conversations.
    [[nodiscard]] auto pendingCount() const -> std::size_t;

    [[nodiscard]] auto defaultModel() const noexcept -> const std::string& { return _defaultModel; }
    void setDefaultModel(std::string modelId) { _defaultModel = std::move(modelId); }

    [[nodiscard]] auto isDirty() const noexcept -> bool { return _dirty; }

    /// @brief Returns whether the store changed since the last call, and clears the flag.
    auto consumeDirty() noexcept -> bool;

  private:
    struct MessageLocation
    {
        std::size_t conversation = 0;
        std::size_t message = 0;
    };

    auto findMutable(ConversationId id) -> Conversation*;
    auto locatePending(MessageId messageId, std::string_view operation) -> Message*;
    auto appendMessage(Conversation& conversation, Role role, std::string text, MessageStatus status)
        -> MessageId;

    std::string _defaultModel;
    std::vector<Conversation> _conversations;
    std::unordered_map<MessageId, MessageLocation> _messageIndex;
    std::optional<ConversationId> _active;
    ConversationId _nextConversationId = 1;
    MessageId _nextMessageId = 1;
    std::size_t _pendingCount = 0;
    bool _dirty = false;
};

} // namespace llmtui
