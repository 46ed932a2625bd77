// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include <bridge/Bridge.hpp>
#include <llmtui/Event.hpp>
#include <llmtui/FocusStateMachine.hpp>
#include <session/ModelRegistry.hpp>
#include <session/SessionStore.hpp>
#include <tui/InputField.hpp>

namespace llmtui
{

class EventBus;

/// @brief Tunables of the orchestrator loop.
struct OrchestratorConfig
{
    std::string defaultModel;                           ///< Bound to new conversations.
    std::size_t batchSize = 64;                         ///< Events handled per loop tick.
    std::chrono::milliseconds feedbackDuration { 5'000 };
    bool showConversationList = true;
    bool showLogPanel = false;
};

/// @brief Tone of a transient status bar notice.
enum class FeedbackKind
{
    Positive,
    Negative,
};

/// @brief A transient status bar notice.
struct Feedback
{
    FeedbackKind kind = FeedbackKind::Positive;
    std::string text;
    std::chrono::steady_clock::time_point expiresAt;
};

/// @brief A prompt whose reply is still being produced by the bridge.
struct PendingRequest
{
    ConversationId conversationId = 0;
    MessageId messageId = 0;
    std::string prompt;
    RequestHandle handle = 0;
};

/// @brief Owns all application state and applies events to it.
///
/// Every method must be called from the orchestrator thread. Other threads
/// reach the orchestrator exclusively by pushing events onto the EventBus,
/// which processBatch() drains in arrival order.
class Orchestrator
{
  public:
    /// @brief Writes text to the system clipboard.
    using ClipboardWriter = std::function<VoidResult(std::string_view text)>;

    /// @brief Starts an asynchronous model registry reload that reports back via events.
    using ModelReloader = std::function<void()>;

    Orchestrator(OrchestratorConfig config, Bridge& bridge, ModelRegistry registry);

    void setClipboardWriter(ClipboardWriter writer);
    void setModelReloader(ModelReloader reloader);

    /// @brief Sets the remote control description shown in STATUS replies and the status bar.
    void setRemoteStatus(std::string status);

    /// @brief Handles up to batchSize queued events.
    /// @return The number of events handled.
    auto processBatch(EventBus& bus) -> std::size_t;

    /// @brief Applies a single event.
    void handle(Event event);

    /// @brief Expires stale feedback notices.
    void tick(std::chrono::steady_clock::time_point now);

    /// @brief Returns whether anything visible changed since the last call, and clears the flag.
    [[nodiscard]] auto consumeDirty() -> bool;

    [[nodiscard]] auto quitRequested() const noexcept -> bool { return _quit; }

    /// @name Operations shared by keyboard and remote control.
    /// @{

    /// @brief Creates a conversation, selects it and returns its id.
    auto newConversation() -> ConversationId;

    /// @brief Sends @p text to the active conversation, creating one if none is active.
    /// @return The id of the pending model message.
    [[nodiscard]] auto sendMessage(std::string text) -> Result<MessageId>;

    /// @brief Binds @p modelId to the active conversation.
    [[nodiscard]] auto switchModel(const std::string& modelId) -> VoidResult;

    /// @brief One-line summary used as the STATUS reply.
    [[nodiscard]] auto statusLine() const -> std::string;
    /// @}

    /// @name Read-only state for rendering and tests.
    /// @{
    [[nodiscard]] auto store() const noexcept -> const SessionStore& { return _store; }
    [[nodiscard]] auto focus() const noexcept -> const FocusStateMachine& { return _focus; }
    [[nodiscard]] auto registry() const noexcept -> const ModelRegistry& { return _registry; }
    [[nodiscard]] auto input() const noexcept -> const tui::InputField& { return _input; }
    [[nodiscard]] auto pendingRequests() const noexcept -> const std::map<MessageId, PendingRequest>&
    {
        return _pending;
    }
    [[nodiscard]] auto listCursor() const noexcept -> std::size_t { return _listCursor; }
    [[nodiscard]] auto modelCursor() const noexcept -> std::size_t { return _modelCursor; }
    [[nodiscard]] auto chatSelection() const noexcept -> std::optional<std::size_t> { return _chatSelection; }
    [[nodiscard]] auto feedback() const noexcept -> const std::optional<Feedback>& { return _feedback; }
    [[nodiscard]] auto isLogVisible() const noexcept -> bool { return _logVisible; }
    [[nodiscard]] auto isReloadingModels() const noexcept -> bool { return _reloadingModels; }
    [[nodiscard]] auto remoteStatus() const noexcept -> const std::string& { return _remoteStatus; }
    /// @}

  private:
    void handleKey(const tui::KeyEvent& key);
    void handleTerminalInput(const tui::InputEvent& input);
    void handleReplyChunk(const ReplyChunk& chunk);
    void handleReplyDone(const ReplyDone& done);
    void handleReplyFailed(const ReplyFailed& failed);
    void handleRemoteRequest(RemoteRequest& request);
    void handleModelsReloaded(ModelsReloaded& reloaded);
    /// Binds the configured default model when the registry knows it, the tool default otherwise.
    void applyDefaultModel();

    [[nodiscard]] auto executeRemoteCommand(const remote::Command& command) -> std::string;

    void navigate(int delta);
    void activateSelection();
    void copySelectedMessage();
    void submitInput();
    void reloadModels();
    void syncCursorsToActive();

    void notify(FeedbackKind kind, std::string text);

    OrchestratorConfig _config;
    Bridge& _bridge;
    ModelRegistry _registry;
    SessionStore _store;
    FocusStateMachine _focus;
    tui::InputField _input;

    std::map<MessageId, PendingRequest> _pending;
    ClipboardWriter _clipboardWriter;
    ModelReloader _modelReloader;
    std::string _remoteStatus = "off";

    std::size_t _listCursor = 0;
    std::size_t _modelCursor = 0;
    std::optional<std::size_t> _chatSelection;
    std::optional<Feedback> _feedback;
    bool _logVisible = false;
    bool _reloadingModels = false;
    bool _quit = false;
    bool _uiDirty = true;
};

} // namespace llmtui
