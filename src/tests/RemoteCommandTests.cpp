// SPDX-License-Identifier: Apache-2.0
#include <remote/RemoteCommand.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>

using namespace llmtui::remote;

TEST_CASE("parseCommand recognizes NEW and STATUS", "[remote]")
{
    CHECK(std::holds_alternative<NewConversation>(parseCommand("NEW")));
    CHECK(std::holds_alternative<StatusQuery>(parseCommand("STATUS")));
    CHECK(std::holds_alternative<StatusQuery>(parseCommand("STATUS\r")));
}

TEST_CASE("parseCommand extracts SEND text verbatim", "[remote]")
{
    auto const command = parseCommand("SEND What is 2+2?  ");
    REQUIRE(std::holds_alternative<SendText>(command));
    CHECK(std::get<SendText>(command).text == "What is 2+2?  ");
}

TEST_CASE("parseCommand extracts MODEL identifier", "[remote]")
{
    auto const command = parseCommand("MODEL gpt-4o");
    REQUIRE(std::holds_alternative<SwitchModel>(command));
    CHECK(std::get<SwitchModel>(command).modelId == "gpt-4o");
}

TEST_CASE("parseCommand ignores malformed lines", "[remote]")
{
    for (auto const* line: { "", "   ", "FOO bar", "new", "NEW extra", "STATUS now", "SEND", "SEND   ",
                              "MODEL", "MODEL a b" })
    {
        INFO(line);
        CHECK(std::holds_alternative<Ignored>(parseCommand(line)));
    }
}

TEST_CASE("parseCommand rejects oversized lines", "[remote]")
{
    auto const line = "SEND " + std::string(MaxLineLength, 'x');
    CHECK(std::holds_alternative<Ignored>(parseCommand(line)));
}

TEST_CASE("commandName reports protocol keywords", "[remote]")
{
    CHECK(commandName(parseCommand("NEW")) == "NEW");
    CHECK(commandName(parseCommand("SEND hi")) == "SEND");
    CHECK(commandName(parseCommand("MODEL x")) == "MODEL");
    CHECK(commandName(parseCommand("STATUS")) == "STATUS");
    CHECK(commandName(parseCommand("bogus")) == "IGNORED");
}
