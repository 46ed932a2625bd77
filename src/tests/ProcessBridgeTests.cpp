// SPDX-License-Identifier: Apache-2.0
#include <bridge/ProcessBridge.hpp>
#include <llmtui/EventBus.hpp>

#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>

#include <optional>
#include <string>
#include <thread>

using namespace llmtui;
using namespace std::chrono_literals;

namespace
{
/// Collects events for one message until it completes or fails.
struct Outcome
{
    std::string reply;
    std::optional<ReplyDone> done;
    std::optional<ReplyFailed> failed;
};

auto awaitOutcome(EventBus& bus, MessageId messageId) -> Outcome
{
    auto outcome = Outcome {};
    while (!outcome.done && !outcome.failed)
    {
        auto event = bus.waitPop(10s);
        if (!event)
            break;
        if (auto const* chunk = std::get_if<ReplyChunk>(&*event); chunk && chunk->messageId == messageId)
            outcome.reply += chunk->bytes;
        else if (auto const* done = std::get_if<ReplyDone>(&*event); done && done->messageId == messageId)
            outcome.done = *done;
        else if (auto const* failed = std::get_if<ReplyFailed>(&*event); failed && failed->messageId == messageId)
            outcome.failed = *failed;
    }
    return outcome;
}

/// A tool that ignores its arguments and runs a shell script instead.
auto shellTool(std::string script) -> ProcessBridgeConfig
{
    return ProcessBridgeConfig {
        .command = "sh",
        .extraArgs = { "-c", std::move(script), "sh" },
        .useArgumentSeparator = false,
    };
}
} // namespace

TEST_CASE("buildToolArguments places model and separator before the prompt", "[bridge]")
{
    auto config = ProcessBridgeConfig { .extraArgs = { "--no-log" } };
    auto request = BridgeRequest { .conversationId = 1, .messageId = 2, .prompt = "-v what?", .modelId = "4o" };

    CHECK(buildToolArguments(config, request) == std::vector<std::string> { "--no-log", "-m", "4o", "--", "-v what?" });

    request.modelId.clear();
    config.useArgumentSeparator = false;
    CHECK(buildToolArguments(config, request) == std::vector<std::string> { "--no-log", "-v what?" });
}

TEST_CASE("ProcessBridge streams stdout and reports completion", "[bridge]")
{
    auto bus = EventBus {};
    auto bridge = ProcessBridge(shellTool("printf 4"), bus);

    static_cast<void>(bridge.submit(BridgeRequest { .conversationId = 1, .messageId = 10, .prompt = "2+2?" }));
    auto const outcome = awaitOutcome(bus, 10);

    CHECK(outcome.reply == "4");
    REQUIRE(outcome.done.has_value());
    CHECK(outcome.done->exitStatus == 0);
    CHECK_FALSE(outcome.failed.has_value());
}

TEST_CASE("ProcessBridge passes the prompt as the final argument", "[bridge]")
{
    auto bus = EventBus {};
    auto bridge = ProcessBridge(shellTool("printf '%s' \"$1\""), bus);

    static_cast<void>(bridge.submit(BridgeRequest { .messageId = 11, .prompt = "it's $HOME" }));
    auto const outcome = awaitOutcome(bus, 11);

    CHECK(outcome.reply == "it's $HOME");
    CHECK(outcome.done.has_value());
}

TEST_CASE("ProcessBridge reports a missing tool as SpawnFailure", "[bridge]")
{
    auto bus = EventBus {};
    auto bridge = ProcessBridge(ProcessBridgeConfig { .command = "/nonexistent/llm" }, bus);

    static_cast<void>(bridge.submit(BridgeRequest { .messageId = 12, .prompt = "hi" }));
    auto const outcome = awaitOutcome(bus, 12);

    REQUIRE(outcome.failed.has_value());
    CHECK(outcome.failed->error.code == ErrorCode::SpawnFailure);
}

TEST_CASE("ProcessBridge reports a failing tool as StreamFailure", "[bridge]")
{
    auto bus = EventBus {};
    auto bridge = ProcessBridge(shellTool("printf partial; echo 'no key' >&2; exit 3"), bus);

    static_cast<void>(bridge.submit(BridgeRequest { .messageId = 13, .prompt = "hi" }));
    auto const outcome = awaitOutcome(bus, 13);

    CHECK(outcome.reply == "partial");
    REQUIRE(outcome.failed.has_value());
    CHECK(outcome.failed->error.code == ErrorCode::StreamFailure);
    CHECK(outcome.failed->error.message.find("exit status 3") != std::string::npos);
    CHECK(outcome.failed->error.message.find("no key") != std::string::npos);
}

TEST_CASE("ProcessBridge enforces the request timeout", "[bridge]")
{
    auto bus = EventBus {};
    auto config = shellTool("exec sleep 5");
    config.requestTimeoutSeconds = 1;
    auto bridge = ProcessBridge(config, bus);

    static_cast<void>(bridge.submit(BridgeRequest { .messageId = 14, .prompt = "hi" }));
    auto const outcome = awaitOutcome(bus, 14);

    REQUIRE(outcome.failed.has_value());
    CHECK(outcome.failed->error.message.find("timed out") != std::string::npos);
}

TEST_CASE("ProcessBridge kills a tool that ignores SIGTERM after the timeout", "[bridge]")
{
    auto bus = EventBus {};
    auto config = shellTool("trap '' TERM; sleep 30");
    config.requestTimeoutSeconds = 1;
    auto bridge = ProcessBridge(config, bus);

    auto const started = std::chrono::steady_clock::now();
    static_cast<void>(bridge.submit(BridgeRequest { .messageId = 15, .prompt = "hi" }));
    auto const outcome = awaitOutcome(bus, 15);

    REQUIRE(outcome.failed.has_value());
    CHECK(outcome.failed->error.message.find("timed out") != std::string::npos);
    CHECK(std::chrono::steady_clock::now() - started < 5s);
}

TEST_CASE("ProcessBridge completes when a background child keeps stdout open", "[bridge]")
{
    auto bus = EventBus {};
    auto bridge = ProcessBridge(shellTool("printf hi; sleep 30 & exit 0"), bus);

    auto const started = std::chrono::steady_clock::now();
    static_cast<void>(bridge.submit(BridgeRequest { .messageId = 16, .prompt = "hi" }));
    auto const outcome = awaitOutcome(bus, 16);

    REQUIRE(outcome.done.has_value());
    CHECK(outcome.reply == "hi");
    CHECK(std::chrono::steady_clock::now() - started < 5s);
}

TEST_CASE("ProcessBridge runs requests concurrently", "[bridge]")
{
    auto bus = EventBus {};
    auto bridge = ProcessBridge(shellTool("sleep 1; printf done"), bus);

    auto const started = std::chrono::steady_clock::now();
    static_cast<void>(bridge.submit(BridgeRequest { .conversationId = 1, .messageId = 20, .prompt = "a" }));
    static_cast<void>(bridge.submit(BridgeRequest { .conversationId = 2, .messageId = 21, .prompt = "b" }));
    CHECK(bridge.activeCount() == 2);

    auto completed = 0;
    while (completed < 2)
    {
        auto event = bus.waitPop(10s);
        REQUIRE(event.has_value());
        if (std::holds_alternative<ReplyDone>(*event))
            ++completed;
    }
    CHECK(std::chrono::steady_clock::now() - started < 1900ms);
}

TEST_CASE("ProcessBridge shutdown stops outstanding requests silently", "[bridge]")
{
    auto bus = EventBus {};
    auto const script = GENERATE(std::string("exec sleep 30"), std::string("trap '' TERM; sleep 30"));
    auto bridge = ProcessBridge(shellTool(script), bus);

    static_cast<void>(bridge.submit(BridgeRequest { .messageId = 30, .prompt = "hi" }));
    std::this_thread::sleep_for(200ms);

    auto const started = std::chrono::steady_clock::now();
    bridge.shutdown();

    CHECK(std::chrono::steady_clock::now() - started < 5s);
    CHECK(bridge.activeCount() == 0);
    CHECK(bus.empty());
}
