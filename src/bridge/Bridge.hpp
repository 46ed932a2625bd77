// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>

#include <cstddef>
#include <cstdint>
#include <string>

namespace llmtui
{

/// @brief Identifies one in-flight request of a Bridge.
using RequestHandle = std::uint64_t;

/// @brief One outgoing prompt to be answered by a model.
struct BridgeRequest
{
    ConversationId conversationId = 0;
    MessageId messageId = 0; ///< Pending model message that receives the reply.
    std::string prompt;
    std::string modelId;     ///< Empty selects the tool's default model.
};

/// @brief Abstract interface for turning prompts into streamed replies.
///
/// Implementations report progress asynchronously as ReplyChunk, ReplyDone
/// and ReplyFailed events keyed by BridgeRequest::messageId.
class Bridge
{
  public:
    virtual ~Bridge() = default;

    /// @brief Starts answering a request in the background.
    /// @return A handle identifying the request.
    virtual auto submit(BridgeRequest request) -> RequestHandle = 0;

    /// @brief Number of requests that have not finished yet.
    [[nodiscard]] virtual auto activeCount() const -> std::size_t = 0;

    /// @brief Stops all outstanding requests and waits for their workers.
    virtual void shutdown() = 0;
};

} // namespace llmtui
