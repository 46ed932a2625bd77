// SPDX-License-Identifier: Apache-2.0
#include "SessionStore.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <format>
#include <iterator>
#include <utility>

namespace llmtui
{

auto Conversation::pendingMessage() const -> const Message*
{
    // Only the most recent model message can still be pending.
    for (auto it = messages.rbegin(); it != messages.rend(); ++it)
        if (it->status.isPending())
            return &*it;
    return nullptr;
}

SessionStore::SessionStore(std::string defaultModel): _defaultModel(std::move(defaultModel))
{
}

auto SessionStore::createConversation() -> ConversationId
{
    auto const id = _nextConversationId++;
    _conversations.push_back(Conversation {
        .id = id,
        .name = std::format("New Conversation {}", id),
        .modelId = _defaultModel,
        .messages = {},
    });
    _active = id;
    _dirty = true;
    log::debug("Created conversation {}", id);
    return id;
}

auto SessionStore::selectConversation(ConversationId id) -> VoidResult
{
    if (!find(id))
        return makeError(ErrorCode::InvalidArgument, std::format("Unknown conversation {}", id));
    if (_active != id)
    {
        _active = id;
        _dirty = true;
    }
    return {};
}

auto SessionStore::appendUserMessage(ConversationId id, std::string text) -> Result<MessageId>
{
    auto* conversation = findMutable(id);
    if (!conversation)
        return makeError(ErrorCode::InvalidArgument, std::format("Unknown conversation {}", id));
    return appendMessage(*conversation, Role::User, std::move(text), MessageStatus::complete());
}

auto SessionStore::beginModelReply(ConversationId id) -> Result<MessageId>
{
    auto* conversation = findMutable(id);
    if (!conversation)
        return makeError(ErrorCode::InvalidArgument, std::format("Unknown conversation {}", id));
    if (conversation->pendingMessage())
        return makeError(ErrorCode::ConversationBusy,
                         std::format("Conversation {} is still waiting for a reply", id));

    ++_pendingCount;
    return appendMessage(*conversation, Role::Model, {}, MessageStatus::pending());
}

auto SessionStore::appendToReply(MessageId messageId, std::string_view chunk) -> VoidResult
{
    auto* message = locatePending(messageId, "append to");
    if (!message)
        return makeError(ErrorCode::UnknownMessageTarget, std::format("No pending message {}", messageId));

    if (!chunk.empty())
    {
        message->text.append(chunk);
        _dirty = true;
    }
    return {};
}

auto SessionStore::completeReply(MessageId messageId, MessageStatus status) -> VoidResult
{
    auto* message = locatePending(messageId, "complete");
    if (!message)
        return makeError(ErrorCode::UnknownMessageTarget, std::format("No pending message {}", messageId));
    if (status.isPending())
        return makeError(ErrorCode::InvalidArgument, "A reply cannot be completed as pending");

    message->status = std::move(status);
    --_pendingCount;
    _dirty = true;
    return {};
}

auto SessionStore::setModel(ConversationId id, std::string modelId) -> VoidResult
{
    auto* conversation = findMutable(id);
    if (!conversation)
        return makeError(ErrorCode::InvalidArgument, std::format("Unknown conversation {}", id));
    conversation->modelId = std::move(modelId);
    _dirty = true;
    return {};
}

auto SessionStore::find(ConversationId id) const -> const Conversation*
{
    auto const it = std::ranges::find(_conversations, id, &Conversation::id);
    return it != _conversations.end() ? &*it : nullptr;
}

auto SessionStore::findMessage(MessageId messageId) const -> const Message*
{
    auto const it = _messageIndex.find(messageId);
    if (it == _messageIndex.end())
        return nullptr;
    return &_conversations[it->second.conversation].messages[it->second.message];
}

auto SessionStore::indexOf(ConversationId id) const -> std::optional<std::size_t>
{
    auto const it = std::ranges::find(_conversations, id, &Conversation::id);
    if (it == _conversations.end())
        return std::nullopt;
    return static_cast<std::size_t>(std::distance(_conversations.begin(), it));
}

auto SessionStore::activeConversation() const -> const Conversation*
{
    return _active ? find(*_active) : nullptr;
}

auto SessionStore::hasPendingReply(ConversationId id) const -> bool
{
    auto const* conversation = find(id);
    return conversation && conversation->pendingMessage();
}

auto SessionStore::pendingCount() const -> std::size_t
{
    return _pendingCount;
}

auto SessionStore::consumeDirty() noexcept -> bool
{
    return std::exchange(_dirty, false);
}

auto SessionStore::findMutable(ConversationId id) -> Conversation*
{
    return const_cast<Conversation*>(std::as_const(*this).find(id));
}

auto SessionStore::locatePending(MessageId messageId, std::string_view operation) -> Message*
{
    auto const it = _messageIndex.find(messageId);
    if (it == _messageIndex.end())
    {
        log::warning("Cannot {} reply {}: unknown message", operation, messageId);
        return nullptr;
    }

    auto& message = _conversations[it->second.conversation].messages[it->second.message];
    if (!message.status.isPending())
    {
        log::warning("Cannot {} reply {}: message is no longer pending", operation, messageId);
        return nullptr;
    }
    return &message;
}

auto SessionStore::appendMessage(Conversation& conversation, Role role, std::string text, MessageStatus status)
    -> MessageId
{
    auto const id = _nextMessageId++;
    auto const conversationIndex = static_cast<std::size_t>(&conversation - _conversations.data());
    _messageIndex.emplace(id, MessageLocation { conversationIndex, conversation.messages.size() });
    conversation.messages.push_back(Message {
        .id = id,
        .role = role,
        .text = std::move(text),
        .status = std::move(status),
    });
    _dirty = true;
    return id;
}

} // namespace llmtui
