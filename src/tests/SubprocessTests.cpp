// SPDX-License-Identifier: Apache-2.0
#include <bridge/Subprocess.hpp>

#include <catch2/catch_test_macros.hpp>

#include <csignal>
#include <string>
#include <thread>

using namespace llmtui;
using namespace std::chrono_literals;

TEST_CASE("captureOutput returns stdout of a successful process", "[subprocess]")
{
    auto const output = captureOutput(SubprocessConfig { .command = "sh", .args = { "-c", "echo hello; echo oops >&2" } },
                                      5s);
    REQUIRE(output.has_value());
    CHECK(*output == "hello\n");
}

TEST_CASE("captureOutput reports a missing executable", "[subprocess]")
{
    auto const output = captureOutput(SubprocessConfig { .command = "/nonexistent/binary" }, 5s);
    REQUIRE_FALSE(output.has_value());
    CHECK(output.error().code == ErrorCode::SpawnFailure);
}

TEST_CASE("captureOutput reports a non-zero exit with diagnostics", "[subprocess]")
{
    auto const output =
        captureOutput(SubprocessConfig { .command = "sh", .args = { "-c", "echo broken >&2; exit 3" } }, 5s);
    REQUIRE_FALSE(output.has_value());
    CHECK(output.error().code == ErrorCode::StreamFailure);
    CHECK(output.error().message.find("exited with status 3") != std::string::npos);
    CHECK(output.error().message.find("broken") != std::string::npos);
}

TEST_CASE("captureOutput terminates a process that runs too long", "[subprocess]")
{
    auto const output = captureOutput(SubprocessConfig { .command = "sleep", .args = { "5" } }, 200ms);
    REQUIRE_FALSE(output.has_value());
    CHECK(output.error().code == ErrorCode::TimeoutError);
}

TEST_CASE("Subprocess pumps both streams until EOF", "[subprocess]")
{
    auto process = Subprocess {};
    REQUIRE(process.start(SubprocessConfig { .command = "sh", .args = { "-c", "printf out; printf err >&2" } }).has_value());
    CHECK(process.isRunning());
    CHECK(process.pid() > 0);

    auto out = std::string {};
    auto err = std::string {};
    while (true)
    {
        auto const open = process.pump(
            100ms, [&](std::string_view chunk) { out += chunk; }, [&](std::string_view chunk) { err += chunk; });
        REQUIRE(open.has_value());
        if (!*open)
            break;
    }

    auto const status = process.wait();
    REQUIRE(status.has_value());
    CHECK(status->success());
    CHECK(out == "out");
    CHECK(err == "err");
    CHECK_FALSE(process.isRunning());
}

TEST_CASE("Subprocess reports termination by signal", "[subprocess]")
{
    auto process = Subprocess {};
    REQUIRE(process.start(SubprocessConfig { .command = "sleep", .args = { "5" } }).has_value());
    process.terminate();
    auto const status = process.wait();
    REQUIRE(status.has_value());
    CHECK_FALSE(status->success());
    CHECK(status->signal != 0);
}

TEST_CASE("Subprocess stop escalates to SIGKILL", "[subprocess]")
{
    auto process = Subprocess {};
    REQUIRE(process.start(SubprocessConfig { .command = "sh", .args = { "-c", "trap '' TERM; sleep 30" } })
                .has_value());
    std::this_thread::sleep_for(200ms);

    auto const started = std::chrono::steady_clock::now();
    auto const status = process.stop(300ms);
    REQUIRE(status.has_value());
    CHECK(status->signal == SIGKILL);
    CHECK(std::chrono::steady_clock::now() - started < 3s);
    CHECK_FALSE(process.isRunning());
}

TEST_CASE("Subprocess tryWait reaps an exited child without blocking", "[subprocess]")
{
    auto process = Subprocess {};
    REQUIRE(process.start(SubprocessConfig { .command = "sh", .args = { "-c", "read line; exit 4" } }).has_value());

    auto exited = process.tryWait();
    REQUIRE(exited.has_value());

    // stdin is /dev/null, so the read fails at once and the shell exits.
    auto const deadline = std::chrono::steady_clock::now() + 5s;
    while (!*exited && std::chrono::steady_clock::now() < deadline)
    {
        std::this_thread::sleep_for(20ms);
        exited = process.tryWait();
        REQUIRE(exited.has_value());
    }

    REQUIRE(exited->has_value());
    CHECK((*exited)->code == 4);

    auto const status = process.wait();
    REQUIRE(status.has_value());
    CHECK(status->code == 4);
}

TEST_CASE("shellQuote quotes only when needed", "[subprocess]")
{
    CHECK(shellQuote("") == "''");
    CHECK(shellQuote("gpt-4o") == "gpt-4o");
    CHECK(shellQuote("/usr/bin/llm") == "/usr/bin/llm");
    CHECK(shellQuote("two words") == "'two words'");
    CHECK(shellQuote("it's") == R"('it'\''s')");
}

TEST_CASE("formatCommandLine joins quoted arguments", "[subprocess]")
{
    auto const line = formatCommandLine(SubprocessConfig { .command = "llm", .args = { "-m", "4o", "--", "hi there" } });
    CHECK(line == "llm -m 4o -- 'hi there'");
}
