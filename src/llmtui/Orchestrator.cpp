// SPDX-License-Identifier: Apache-2.0
#include "Orchestrator.hpp"

#include <core/Log.hpp>

#include <format>
#include <future>
#include <utility>
#include <variant>

#include <llmtui/EventBus.hpp>

namespace llmtui
{

namespace
{
    auto trimmed(std::string_view text) -> std::string_view
    {
        auto const first = text.find_first_not_of(" \t\r\n");
        if (first == std::string_view::npos)
            return {};
        auto const last = text.find_last_not_of(" \t\r\n");
        return text.substr(first, last - first + 1);
    }

    /// Moves @p index by @p delta within [0, count), wrapping at both ends.
    auto wrapIndex(std::size_t index, int delta, std::size_t count) -> std::size_t
    {
        if (count == 0)
            return 0;
        auto const n = static_cast<long long>(count);
        auto const next = (static_cast<long long>(index) + delta) % n;
        return static_cast<std::size_t>(next < 0 ? next + n : next);
    }
} // namespace

Orchestrator::Orchestrator(OrchestratorConfig config, Bridge& bridge, ModelRegistry registry):
    _config(std::move(config)), _bridge(bridge), _registry(std::move(registry))
{
    applyDefaultModel();
    if (!_config.showConversationList)
        _focus.toggleListVisibility();
    _logVisible = _config.showLogPanel;
}

void Orchestrator::setClipboardWriter(ClipboardWriter writer)
{
    _clipboardWriter = std::move(writer);
}

void Orchestrator::setModelReloader(ModelReloader reloader)
{
    _modelReloader = std::move(reloader);
}

void Orchestrator::setRemoteStatus(std::string status)
{
    _remoteStatus = std::move(status);
    _uiDirty = true;
}

auto Orchestrator::processBatch(EventBus& bus) -> std::size_t
{
    auto events = bus.drain(_config.batchSize);
    for (auto& event: events)
        handle(std::move(event));
    return events.size();
}

void Orchestrator::handle(Event event)
{
    if (auto* input = std::get_if<TerminalInput>(&event))
        handleTerminalInput(input->input);
    else if (auto const* chunk = std::get_if<ReplyChunk>(&event))
        handleReplyChunk(*chunk);
    else if (auto const* done = std::get_if<ReplyDone>(&event))
        handleReplyDone(*done);
    else if (auto const* failed = std::get_if<ReplyFailed>(&event))
        handleReplyFailed(*failed);
    else if (auto* request = std::get_if<RemoteRequest>(&event))
        handleRemoteRequest(*request);
    else if (auto* reloaded = std::get_if<ModelsReloaded>(&event))
        handleModelsReloaded(*reloaded);
    else if (auto const* reloadFailed = std::get_if<ModelsReloadFailed>(&event))
    {
        _reloadingModels = false;
        log::warning("Model reload failed: {}", reloadFailed->error.message);
        notify(FeedbackKind::Negative, std::format("Model reload failed: {}", reloadFailed->error.message));
    }
}

void Orchestrator::tick(std::chrono::steady_clock::time_point now)
{
    if (_feedback && now >= _feedback->expiresAt)
    {
        _feedback.reset();
        _uiDirty = true;
    }
}

auto Orchestrator::consumeDirty() -> bool
{
    auto const storeDirty = _store.consumeDirty();
    return storeDirty || std::exchange(_uiDirty, false);
}

auto Orchestrator::newConversation() -> ConversationId
{
    auto const id = _store.createConversation();
    syncCursorsToActive();
    return id;
}

auto Orchestrator::sendMessage(std::string text) -> Result<MessageId>
{
    auto const prompt = std::string(trimmed(text));
    if (prompt.empty())
        return makeError(ErrorCode::InvalidArgument, "Nothing to send");

    auto conversationId = _store.activeConversationId();
    if (!conversationId)
    {
        conversationId = newConversation();
        log::info("No active conversation; created conversation {}", *conversationId);
    }

    if (_store.hasPendingReply(*conversationId))
        return makeError(ErrorCode::ConversationBusy,
                         std::format("Conversation {} is still waiting for a reply", *conversationId));

    if (auto user = _store.appendUserMessage(*conversationId, prompt); !user)
        return std::unexpected(user.error());

    auto reply = _store.beginModelReply(*conversationId);
    if (!reply)
        return std::unexpected(reply.error());

    auto const* conversation = _store.find(*conversationId);
    auto request = BridgeRequest {
        .conversationId = *conversationId,
        .messageId = *reply,
        .prompt = prompt,
        .modelId = conversation ? conversation->modelId : std::string {},
    };
    auto const handle = _bridge.submit(request);

    _pending.emplace(*reply,
                     PendingRequest {
                         .conversationId = *conversationId,
                         .messageId = *reply,
                         .prompt = prompt,
                         .handle = handle,
                     });
    log::debug("Message {} pending for conversation {}", *reply, *conversationId);
    return *reply;
}

auto Orchestrator::switchModel(const std::string& modelId) -> VoidResult
{
    auto const conversationId = _store.activeConversationId();
    if (!conversationId)
        return makeError(ErrorCode::InvalidArgument, "No active conversation");

    auto const index = _registry.indexOf(modelId);
    if (!index)
        return makeError(ErrorCode::UnknownModel, std::format("Unknown model '{}'", modelId));

    if (auto result = _store.setModel(*conversationId, modelId); !result)
        return result;

    _modelCursor = *index;
    _uiDirty = true;
    return {};
}

auto Orchestrator::statusLine() const -> std::string
{
    auto const* active = _store.activeConversation();
    auto const activeText = active ? std::to_string(active->id) : std::string("none");
    auto const modelText = active && !active->modelId.empty() ? active->modelId : std::string("default");
    return std::format("OK conversations={} active={} model={} pending={} focus={}",
                       _store.conversations().size(),
                       activeText,
                       modelText,
                       _store.pendingCount(),
                       focusName(_focus.focus()));
}

void Orchestrator::handleTerminalInput(const tui::InputEvent& input)
{
    if (auto const* key = std::get_if<tui::KeyEvent>(&input))
    {
        handleKey(*key);
        return;
    }

    if (auto const* paste = std::get_if<tui::PasteEvent>(&input))
    {
        if (!_focus.isEditing())
            _focus.enterEdit();
        static_cast<void>(_input.processEvent(*paste));
        _uiDirty = true;
        return;
    }

    if (std::holds_alternative<tui::ResizeEvent>(input))
        _uiDirty = true;
}

void Orchestrator::handleKey(const tui::KeyEvent& key)
{
    auto const action = _focus.route(key);
    log::trace("Key routed to {} (focus: {})", keyActionName(action), focusName(_focus.focus()));

    switch (action)
    {
        case KeyAction::None: return;
        case KeyAction::Quit: _quit = true; break;
        case KeyAction::ToggleLog: _logVisible = !_logVisible; break;
        case KeyAction::CycleFocus:
        case KeyAction::ToggleList:
        case KeyAction::EnterEdit:
        case KeyAction::ExitEdit: break;
        case KeyAction::NavigateUp: navigate(-1); break;
        case KeyAction::NavigateDown: navigate(+1); break;
        case KeyAction::Select: activateSelection(); break;
        case KeyAction::NewConversation: newConversation(); break;
        case KeyAction::Copy: copySelectedMessage(); break;
        case KeyAction::Submit: submitInput(); break;
        case KeyAction::ReloadModels: reloadModels(); break;
        case KeyAction::EditText:
            if (_input.processEvent(key) == tui::InputFieldAction::None)
                return;
            break;
    }
    _uiDirty = true;
}

void Orchestrator::handleReplyChunk(const ReplyChunk& chunk)
{
    if (!_pending.contains(chunk.messageId))
    {
        log::warning("Dropping output for untracked message {}", chunk.messageId);
        return;
    }

    if (auto result = _store.appendToReply(chunk.messageId, chunk.bytes); !result)
        log::debug("{}", result.error());
}

void Orchestrator::handleReplyDone(const ReplyDone& done)
{
    auto const node = _pending.extract(done.messageId);
    if (node.empty())
    {
        log::warning("Completion for untracked message {}", done.messageId);
        return;
    }

    if (auto result = _store.completeReply(done.messageId, MessageStatus::complete()); !result)
        log::debug("{}", result.error());
    log::debug("Message {} complete (exit status {})", done.messageId, done.exitStatus);
}

void Orchestrator::handleReplyFailed(const ReplyFailed& failed)
{
    auto const node = _pending.extract(failed.messageId);
    if (node.empty())
    {
        log::warning("Failure for untracked message {}: {}", failed.messageId, failed.error.message);
        return;
    }

    if (auto result = _store.completeReply(failed.messageId, MessageStatus::failed(failed.error.message)); !result)
        log::debug("{}", result.error());

    auto const kind = failed.error.code == ErrorCode::SpawnFailure ? "Could not start model tool" : "Request failed";
    notify(FeedbackKind::Negative,
           std::format("{} (conversation {}): {}", kind, node.mapped().conversationId, failed.error.message));
}

void Orchestrator::handleRemoteRequest(RemoteRequest& request)
{
    auto answer = executeRemoteCommand(request.command);
    log::info("Remote {}: {}", remote::commandName(request.command), answer);

    if (!request.reply)
        return;
    try
    {
        request.reply->set_value(std::move(answer));
    }
    catch (const std::future_error& e)
    {
        log::warning("Remote reply could not be delivered: {}", e.what());
    }
}

auto Orchestrator::executeRemoteCommand(const remote::Command& command) -> std::string
{
    if (std::holds_alternative<remote::NewConversation>(command))
    {
        auto const id = newConversation();
        notify(FeedbackKind::Positive, std::format("Remote: created conversation {}", id));
        return std::format("OK conversation {}", id);
    }

    if (auto const* send = std::get_if<remote::SendText>(&command))
    {
        auto const result = sendMessage(send->text);
        if (!result)
        {
            notify(FeedbackKind::Negative, std::format("Remote: {}", result.error().message));
            return std::format("ERROR {}", result.error().message);
        }
        auto const conversationId = _pending.at(*result).conversationId;
        notify(FeedbackKind::Positive, std::format("Remote: message sent to conversation {}", conversationId));
        return std::format("OK sent to conversation {}", conversationId);
    }

    if (auto const* model = std::get_if<remote::SwitchModel>(&command))
    {
        if (auto result = switchModel(model->modelId); !result)
        {
            notify(FeedbackKind::Negative, std::format("Remote: {}", result.error().message));
            return std::format("ERROR {}", result.error().message);
        }
        auto const conversationId = *_store.activeConversationId();
        notify(FeedbackKind::Positive, std::format("Remote: model set to {}", model->modelId));
        return std::format("OK model {} for conversation {}", model->modelId, conversationId);
    }

    if (std::holds_alternative<remote::StatusQuery>(command))
        return statusLine();

    // Ignored lines are filtered by the listener.
    return "ERROR malformed command";
}

void Orchestrator::handleModelsReloaded(ModelsReloaded& reloaded)
{
    _reloadingModels = false;
    _registry = ModelRegistry(std::move(reloaded.models));
    applyDefaultModel();
    syncCursorsToActive();
    notify(FeedbackKind::Positive, std::format("Loaded {} model(s)", _registry.size()));
}

void Orchestrator::applyDefaultModel()
{
    auto const& wanted = _config.defaultModel;
    if (wanted.empty())
    {
        _store.setDefaultModel({});
        return;
    }

    if (auto const index = _registry.indexOf(wanted))
    {
        _store.setDefaultModel(wanted);
        _modelCursor = *index;
        return;
    }

    log::warning("Default model '{}' is not available; using the tool default", wanted);
    _store.setDefaultModel({});
}

void Orchestrator::navigate(int delta)
{
    switch (_focus.focus())
    {
        case Focus::ConversationList:
            _listCursor = wrapIndex(_listCursor, delta, _store.conversations().size());
            break;
        case Focus::ModelSelect: _modelCursor = wrapIndex(_modelCursor, delta, _registry.size()); break;
        case Focus::Chat:
        {
            auto const* active = _store.activeConversation();
            if (!active || active->messages.empty())
                break;
            if (!_chatSelection)
                _chatSelection = delta < 0 ? active->messages.size() - 1 : 0;
            else
                _chatSelection = wrapIndex(*_chatSelection, delta, active->messages.size());
            break;
        }
        case Focus::Input: break;
    }
}

void Orchestrator::activateSelection()
{
    if (_focus.focus() == Focus::ModelSelect)
    {
        if (_registry.empty())
        {
            notify(FeedbackKind::Negative, "No models available");
            return;
        }
        auto const& model = _registry.models()[_modelCursor];
        if (auto result = switchModel(model.id); !result)
        {
            notify(FeedbackKind::Negative, result.error().message);
            return;
        }
        notify(FeedbackKind::Positive, std::format("Model set to {}", model.name));
        return;
    }

    auto const& conversations = _store.conversations();
    if (_listCursor >= conversations.size())
        return;

    if (auto result = _store.selectConversation(conversations[_listCursor].id); !result)
    {
        log::warning("{}", result.error());
        return;
    }
    syncCursorsToActive();
}

void Orchestrator::copySelectedMessage()
{
    auto const* active = _store.activeConversation();
    if (!active || !_chatSelection || *_chatSelection >= active->messages.size())
    {
        notify(FeedbackKind::Negative, "No message selected");
        return;
    }
    if (!_clipboardWriter)
    {
        notify(FeedbackKind::Negative, "Clipboard is not available");
        return;
    }

    if (auto result = _clipboardWriter(active->messages[*_chatSelection].text); !result)
    {
        notify(FeedbackKind::Negative, std::format("Failed to copy: {}", result.error().message));
        return;
    }
    notify(FeedbackKind::Positive, "Message copied");
}

void Orchestrator::submitInput()
{
    auto text = std::string(_input.text());
    if (trimmed(text).empty())
        return;

    auto const result = sendMessage(text);
    if (!result)
    {
        // Keep the text so it can be sent again once the conversation is idle.
        notify(FeedbackKind::Negative, result.error().message);
        return;
    }

    _input.addHistory(std::move(text));
    _input.clear();
}

void Orchestrator::reloadModels()
{
    if (_reloadingModels)
        return;
    if (!_modelReloader)
    {
        notify(FeedbackKind::Negative, "Model reload is not available");
        return;
    }

    _reloadingModels = true;
    notify(FeedbackKind::Positive, "Reloading models...");
    _modelReloader();
}

void Orchestrator::syncCursorsToActive()
{
    if (auto const id = _store.activeConversationId())
    {
        if (auto const index = _store.indexOf(*id))
            _listCursor = *index;
        if (auto const* active = _store.activeConversation())
            if (auto const modelIndex = _registry.indexOf(active->modelId))
                _modelCursor = *modelIndex;
    }
    if (_modelCursor >= _registry.size())
        _modelCursor = 0;
    _chatSelection.reset();
    _uiDirty = true;
}

void Orchestrator::notify(FeedbackKind kind, std::string text)
{
    _feedback = Feedback {
        .kind = kind,
        .text = std::move(text),
        .expiresAt = std::chrono::steady_clock::now() + _config.feedbackDuration,
    };
    _uiDirty = true;
}

} // namespace llmtui
