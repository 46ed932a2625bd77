// SPDX-License-Identifier: Apache-2.0
#include <bridge/ProcessBridge.hpp>
#include <llmtui/EventBus.hpp>
#include <llmtui/Orchestrator.hpp>

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <future>
#include <memory>
#include <string>
#include <vector>

using namespace llmtui;
using namespace std::chrono_literals;
using tui::charKey;
using tui::KeyCode;
using tui::KeyEvent;

namespace
{
/// Records submitted requests; replies are injected by the test through events.
class FakeBridge: public Bridge
{
  public:
    auto submit(BridgeRequest request) -> RequestHandle override
    {
        requests.push_back(std::move(request));
        return requests.size();
    }

    [[nodiscard]] auto activeCount() const -> std::size_t override { return requests.size(); }

    void shutdown() override { shutdownCalled = true; }

    std::vector<BridgeRequest> requests;
    bool shutdownCalled = false;
};

auto testRegistry() -> ModelRegistry
{
    return ModelRegistry({ Model { "4o", "gpt-4o" }, Model { "mini", "gpt-4o-mini" }, Model { "local", "llama" } });
}

void press(Orchestrator& orchestrator, KeyEvent key)
{
    orchestrator.handle(TerminalInput { .input = key });
}

void press(Orchestrator& orchestrator, KeyCode code)
{
    press(orchestrator, KeyEvent { .key = code });
}

void type(Orchestrator& orchestrator, std::u32string_view text)
{
    for (auto const ch: text)
        press(orchestrator, charKey(ch));
}

auto sendRemote(Orchestrator& orchestrator, remote::Command command) -> std::string
{
    auto reply = std::make_shared<std::promise<std::string>>();
    auto future = reply->get_future();
    orchestrator.handle(RemoteRequest { .command = std::move(command), .reply = std::move(reply) });
    REQUIRE(future.wait_for(0s) == std::future_status::ready);
    return future.get();
}
} // namespace

TEST_CASE("A sent prompt is answered with the streamed reply", "[orchestrator]")
{
    auto bridge = FakeBridge {};
    auto orchestrator = Orchestrator(OrchestratorConfig {}, bridge, testRegistry());

    auto const conversationId = orchestrator.newConversation();
    auto const messageId = orchestrator.sendMessage("2+2?");
    REQUIRE(messageId.has_value());

    REQUIRE(bridge.requests.size() == 1);
    CHECK(bridge.requests[0].prompt == "2+2?");
    CHECK(bridge.requests[0].conversationId == conversationId);
    CHECK(bridge.requests[0].messageId == *messageId);
    CHECK(orchestrator.pendingRequests().contains(*messageId));

    orchestrator.handle(ReplyChunk { .messageId = *messageId, .bytes = "4" });
    orchestrator.handle(ReplyDone { .messageId = *messageId });

    auto const* conversation = orchestrator.store().find(conversationId);
    REQUIRE(conversation != nullptr);
    REQUIRE(conversation->messages.size() == 2);
    CHECK(conversation->messages[0].role == Role::User);
    CHECK(conversation->messages[0].text == "2+2?");
    CHECK(conversation->messages[1].role == Role::Model);
    CHECK(conversation->messages[1].text == "4");
    CHECK(conversation->messages[1].status.state == MessageState::Complete);
    CHECK(orchestrator.pendingRequests().empty());
}

TEST_CASE("Sending creates a conversation when none is active", "[orchestrator]")
{
    auto bridge = FakeBridge {};
    auto orchestrator = Orchestrator(OrchestratorConfig { .defaultModel = "mini" }, bridge, testRegistry());

    REQUIRE(orchestrator.sendMessage("hello").has_value());
    CHECK(orchestrator.store().conversations().size() == 1);
    CHECK(orchestrator.store().activeConversationId() == ConversationId { 1 });
    REQUIRE(bridge.requests.size() == 1);
    CHECK(bridge.requests[0].modelId == "mini");
}

TEST_CASE("An unknown default model falls back to the tool default", "[orchestrator]")
{
    auto bridge = FakeBridge {};
    auto orchestrator = Orchestrator(OrchestratorConfig { .defaultModel = "nope" }, bridge, testRegistry());

    CHECK(orchestrator.store().defaultModel().empty());

    auto const conversationId = orchestrator.newConversation();
    auto const* conversation = orchestrator.store().find(conversationId);
    REQUIRE(conversation != nullptr);
    CHECK(conversation->modelId.empty());

    REQUIRE(orchestrator.sendMessage("hi").has_value());
    REQUIRE(bridge.requests.size() == 1);
    CHECK(bridge.requests[0].modelId.empty());

    auto const args = buildToolArguments(ProcessBridgeConfig {}, bridge.requests[0]);
    CHECK(std::ranges::find(args, "-m") == args.end());

    SECTION("a reload that provides the model binds it again")
    {
        orchestrator.handle(ModelsReloaded { .models = { Model { "nope", "nope-model" } } });
        CHECK(orchestrator.store().defaultModel() == "nope");
        auto const next = orchestrator.store().find(orchestrator.newConversation());
        REQUIRE(next != nullptr);
        CHECK(next->modelId == "nope");
    }
}

TEST_CASE("A conversation waiting for a reply rejects new prompts", "[orchestrator]")
{
    auto bridge = FakeBridge {};
    auto orchestrator = Orchestrator(OrchestratorConfig {}, bridge, testRegistry());

    auto const first = orchestrator.sendMessage("first");
    REQUIRE(first.has_value());

    auto const second = orchestrator.sendMessage("second");
    REQUIRE_FALSE(second.has_value());
    CHECK(second.error().code == ErrorCode::ConversationBusy);
    CHECK(bridge.requests.size() == 1);

    orchestrator.handle(ReplyDone { .messageId = *first });
    CHECK(orchestrator.sendMessage("second").has_value());
}

TEST_CASE("Blank prompts are not sent", "[orchestrator]")
{
    auto bridge = FakeBridge {};
    auto orchestrator = Orchestrator(OrchestratorConfig {}, bridge, testRegistry());

    auto const result = orchestrator.sendMessage("   \n");
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == ErrorCode::InvalidArgument);
    CHECK(bridge.requests.empty());
}

TEST_CASE("Replies for different conversations interleave without mixing", "[orchestrator]")
{
    auto bridge = FakeBridge {};
    auto orchestrator = Orchestrator(OrchestratorConfig {}, bridge, testRegistry());

    auto const a = orchestrator.newConversation();
    auto const replyA = orchestrator.sendMessage("first question");
    auto const b = orchestrator.newConversation();
    auto const replyB = orchestrator.sendMessage("second question");
    REQUIRE(replyA.has_value());
    REQUIRE(replyB.has_value());
    CHECK(orchestrator.store().pendingCount() == 2);

    orchestrator.handle(ReplyChunk { .messageId = *replyB, .bytes = "B1 " });
    orchestrator.handle(ReplyChunk { .messageId = *replyA, .bytes = "A1 " });
    orchestrator.handle(ReplyChunk { .messageId = *replyB, .bytes = "B2" });
    orchestrator.handle(ReplyChunk { .messageId = *replyA, .bytes = "A2" });
    orchestrator.handle(ReplyDone { .messageId = *replyA });
    orchestrator.handle(ReplyFailed { .messageId = *replyB, .error = Error { ErrorCode::StreamFailure, "exit status 1" } });

    auto const& messagesA = orchestrator.store().find(a)->messages;
    auto const& messagesB = orchestrator.store().find(b)->messages;
    CHECK(messagesA.back().text == "A1 A2");
    CHECK(messagesA.back().status.state == MessageState::Complete);
    CHECK(messagesB.back().text == "B1 B2");
    CHECK(messagesB.back().status.isFailed());
    CHECK(messagesB.back().status.reason == "exit status 1");

    REQUIRE(orchestrator.feedback().has_value());
    CHECK(orchestrator.feedback()->kind == FeedbackKind::Negative);
    CHECK(orchestrator.store().pendingCount() == 0);
}

TEST_CASE("Events for unknown messages are dropped", "[orchestrator]")
{
    auto bridge = FakeBridge {};
    auto orchestrator = Orchestrator(OrchestratorConfig {}, bridge, testRegistry());
    static_cast<void>(orchestrator.newConversation());

    orchestrator.handle(ReplyChunk { .messageId = 99, .bytes = "stray" });
    orchestrator.handle(ReplyDone { .messageId = 99 });
    CHECK(orchestrator.store().activeConversation()->messages.empty());
}

TEST_CASE("processBatch handles queued events in order", "[orchestrator]")
{
    auto bus = EventBus {};
    auto bridge = FakeBridge {};
    auto orchestrator = Orchestrator(OrchestratorConfig { .batchSize = 2 }, bridge, testRegistry());

    auto const messageId = orchestrator.sendMessage("count");
    REQUIRE(messageId.has_value());
    bus.push(ReplyChunk { .messageId = *messageId, .bytes = "1" });
    bus.push(ReplyChunk { .messageId = *messageId, .bytes = "2" });
    bus.push(ReplyChunk { .messageId = *messageId, .bytes = "3" });

    CHECK(orchestrator.processBatch(bus) == 2);
    CHECK(orchestrator.store().findMessage(*messageId)->text == "12");
    CHECK(orchestrator.processBatch(bus) == 1);
    CHECK(orchestrator.store().findMessage(*messageId)->text == "123");
    CHECK(orchestrator.processBatch(bus) == 0);
}

TEST_CASE("Remote commands are answered through the reply slot", "[orchestrator]")
{
    auto bridge = FakeBridge {};
    auto orchestrator = Orchestrator(OrchestratorConfig {}, bridge, testRegistry());
    orchestrator.setRemoteStatus("127.0.0.1:8080");

    CHECK(sendRemote(orchestrator, remote::SwitchModel { "4o" }) == "ERROR No active conversation");
    CHECK(sendRemote(orchestrator, remote::NewConversation {}) == "OK conversation 1");
    CHECK(sendRemote(orchestrator, remote::SwitchModel { "nope" }) == "ERROR Unknown model 'nope'");
    CHECK(sendRemote(orchestrator, remote::SwitchModel { "local" }) == "OK model local for conversation 1");
    CHECK(sendRemote(orchestrator, remote::SendText { "hi" }) == "OK sent to conversation 1");
    CHECK(sendRemote(orchestrator, remote::SendText { "again" }).starts_with("ERROR"));
    CHECK(sendRemote(orchestrator, remote::StatusQuery {})
          == "OK conversations=1 active=1 model=local pending=1 focus=conversations");

    REQUIRE(bridge.requests.size() == 1);
    CHECK(bridge.requests[0].modelId == "local");
    CHECK(orchestrator.modelCursor() == 2);
}

TEST_CASE("Remote requests without a reply slot are still executed", "[orchestrator]")
{
    auto bridge = FakeBridge {};
    auto orchestrator = Orchestrator(OrchestratorConfig {}, bridge, testRegistry());

    orchestrator.handle(RemoteRequest { .command = remote::NewConversation {} });
    CHECK(orchestrator.store().conversations().size() == 1);
}

TEST_CASE("Switching to an unknown model is rejected", "[orchestrator]")
{
    auto bridge = FakeBridge {};
    auto orchestrator = Orchestrator(OrchestratorConfig {}, bridge, testRegistry());
    static_cast<void>(orchestrator.newConversation());

    auto const result = orchestrator.switchModel("gpt-9");
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == ErrorCode::UnknownModel);
    CHECK(orchestrator.store().activeConversation()->modelId.empty());
}

TEST_CASE("Feedback notices expire", "[orchestrator]")
{
    auto bridge = FakeBridge {};
    auto orchestrator = Orchestrator(OrchestratorConfig { .feedbackDuration = 1s }, bridge, testRegistry());

    static_cast<void>(sendRemote(orchestrator, remote::NewConversation {}));
    REQUIRE(orchestrator.feedback().has_value());
    CHECK(orchestrator.feedback()->kind == FeedbackKind::Positive);
    static_cast<void>(orchestrator.consumeDirty());

    orchestrator.tick(std::chrono::steady_clock::now());
    CHECK(orchestrator.feedback().has_value());
    CHECK_FALSE(orchestrator.consumeDirty());

    orchestrator.tick(std::chrono::steady_clock::now() + 2s);
    CHECK_FALSE(orchestrator.feedback().has_value());
    CHECK(orchestrator.consumeDirty());
}

TEST_CASE("Keyboard drives a conversation from the list to a reply", "[orchestrator]")
{
    auto bridge = FakeBridge {};
    auto orchestrator = Orchestrator(OrchestratorConfig {}, bridge, testRegistry());

    press(orchestrator, charKey(U'n'));
    CHECK(orchestrator.store().conversations().size() == 1);
    CHECK(orchestrator.focus().isEditing());

    type(orchestrator, U"2+2?");
    CHECK(orchestrator.input().text() == "2+2?");

    press(orchestrator, KeyCode::Enter);
    CHECK_FALSE(orchestrator.focus().isEditing());
    CHECK(orchestrator.input().text().empty());
    REQUIRE(bridge.requests.size() == 1);
    CHECK(bridge.requests[0].prompt == "2+2?");

    SECTION("a rejected prompt stays in the input")
    {
        press(orchestrator, KeyCode::Enter);
        type(orchestrator, U"more");
        press(orchestrator, KeyCode::Enter);
        CHECK(orchestrator.input().text() == "more");
        CHECK(bridge.requests.size() == 1);
        REQUIRE(orchestrator.feedback().has_value());
        CHECK(orchestrator.feedback()->kind == FeedbackKind::Negative);
    }

    SECTION("pasted text enters editing mode")
    {
        orchestrator.handle(TerminalInput { .input = tui::PasteEvent { .text = "pasted" } });
        CHECK(orchestrator.focus().isEditing());
        CHECK(orchestrator.input().text() == "pasted");
    }
}

TEST_CASE("Keyboard navigation selects conversations and models", "[orchestrator]")
{
    auto bridge = FakeBridge {};
    auto orchestrator = Orchestrator(OrchestratorConfig {}, bridge, testRegistry());
    static_cast<void>(orchestrator.newConversation());
    static_cast<void>(orchestrator.newConversation());
    CHECK(orchestrator.listCursor() == 1);

    press(orchestrator, charKey(U'k'));
    CHECK(orchestrator.listCursor() == 0);
    CHECK(orchestrator.store().activeConversationId() == ConversationId { 2 });
    press(orchestrator, KeyCode::Enter);
    CHECK(orchestrator.store().activeConversationId() == ConversationId { 1 });
    CHECK(orchestrator.focus().focus() == Focus::Chat);

    // Chat -> Input -> ModelSelect
    press(orchestrator, KeyCode::Tab);
    press(orchestrator, KeyCode::Tab);
    REQUIRE(orchestrator.focus().focus() == Focus::ModelSelect);
    press(orchestrator, KeyCode::Up);
    CHECK(orchestrator.modelCursor() == 2);
    press(orchestrator, KeyCode::Enter);
    CHECK(orchestrator.store().activeConversation()->modelId == "local");
    CHECK(orchestrator.store().find(2)->modelId.empty());
}

TEST_CASE("Copy sends the selected message to the clipboard", "[orchestrator]")
{
    auto bridge = FakeBridge {};
    auto orchestrator = Orchestrator(OrchestratorConfig {}, bridge, testRegistry());
    auto copied = std::string {};
    orchestrator.setClipboardWriter([&](std::string_view text) -> VoidResult {
        copied = text;
        return {};
    });

    auto const messageId = orchestrator.sendMessage("question");
    REQUIRE(messageId.has_value());
    orchestrator.handle(ReplyChunk { .messageId = *messageId, .bytes = "answer" });
    orchestrator.handle(ReplyDone { .messageId = *messageId });

    press(orchestrator, KeyCode::Tab);
    REQUIRE(orchestrator.focus().focus() == Focus::Chat);

    press(orchestrator, charKey(U'y'));
    REQUIRE(orchestrator.feedback().has_value());
    CHECK(orchestrator.feedback()->text == "No message selected");

    press(orchestrator, charKey(U'k'));
    CHECK(orchestrator.chatSelection() == std::size_t { 1 });
    press(orchestrator, charKey(U'y'));
    CHECK(copied == "answer");
    CHECK(orchestrator.feedback()->text == "Message copied");

    SECTION("clipboard failures are reported")
    {
        orchestrator.setClipboardWriter(
            [](std::string_view) -> VoidResult { return makeError(ErrorCode::IoError, "disabled"); });
        press(orchestrator, charKey(U'y'));
        CHECK(orchestrator.feedback()->kind == FeedbackKind::Negative);
        CHECK(orchestrator.feedback()->text == "Failed to copy: disabled");
    }
}

TEST_CASE("Model reload goes through the reloader and replaces the registry", "[orchestrator]")
{
    auto bridge = FakeBridge {};
    auto orchestrator = Orchestrator(OrchestratorConfig {}, bridge, testRegistry());
    auto reloads = 0;
    orchestrator.setModelReloader([&] { ++reloads; });

    press(orchestrator, KeyCode::Tab);
    press(orchestrator, KeyCode::Tab);
    press(orchestrator, KeyCode::Tab);
    REQUIRE(orchestrator.focus().focus() == Focus::ModelSelect);

    press(orchestrator, charKey(U'r'));
    press(orchestrator, charKey(U'r'));
    CHECK(reloads == 1);
    CHECK(orchestrator.isReloadingModels());

    SECTION("success")
    {
        orchestrator.handle(ModelsReloaded { .models = { Model { "only", "only-model" } } });
        CHECK_FALSE(orchestrator.isReloadingModels());
        CHECK(orchestrator.registry().size() == 1);
        CHECK(orchestrator.modelCursor() == 0);
    }

    SECTION("failure keeps the previous registry")
    {
        orchestrator.handle(ModelsReloadFailed { .error = Error { ErrorCode::SpawnFailure, "no llm" } });
        CHECK_FALSE(orchestrator.isReloadingModels());
        CHECK(orchestrator.registry().size() == 3);
        CHECK(orchestrator.feedback()->kind == FeedbackKind::Negative);
    }
}

TEST_CASE("Global keys toggle panels and quit", "[orchestrator]")
{
    auto bridge = FakeBridge {};
    auto orchestrator =
        Orchestrator(OrchestratorConfig { .showConversationList = false }, bridge, testRegistry());
    CHECK_FALSE(orchestrator.focus().isListVisible());
    CHECK_FALSE(orchestrator.isLogVisible());

    press(orchestrator, charKey(U'l', tui::Modifier::Ctrl));
    CHECK(orchestrator.isLogVisible());
    press(orchestrator, charKey(U'h'));
    CHECK(orchestrator.focus().isListVisible());

    CHECK_FALSE(orchestrator.quitRequested());
    press(orchestrator, charKey(U'q'));
    CHECK(orchestrator.quitRequested());
}
