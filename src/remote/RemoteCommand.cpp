// SPDX-License-Identifier: Apache-2.0
#include "RemoteCommand.hpp"

#include <format>
#include <utility>

namespace llmtui::remote
{

namespace
{
    /// Splits "KEYWORD rest" at the first space. The argument excludes that space.
    auto splitKeyword(std::string_view line) -> std::pair<std::string_view, std::string_view>
    {
        auto const space = line.find(' ');
        if (space == std::string_view::npos)
            return { line, {} };
        return { line.substr(0, space), line.substr(space + 1) };
    }

    auto isBlank(std::string_view text) -> bool
    {
        return text.find_first_not_of(" \t") == std::string_view::npos;
    }
} // namespace

auto parseCommand(std::string_view line) -> Command
{
    if (!line.empty() && line.back() == '\r')
        line.remove_suffix(1);

    if (line.size() > MaxLineLength)
        return Ignored { std::format("line exceeds {} bytes", MaxLineLength) };
    if (isBlank(line))
        return Ignored { "empty line" };

    auto const hasArgument = line.find(' ') != std::string_view::npos;
    auto const [keyword, argument] = splitKeyword(line);

    if (keyword == "NEW" || keyword == "STATUS")
    {
        if (hasArgument)
            return Ignored { std::format("{} takes no argument", keyword) };
        if (keyword == "NEW")
            return NewConversation {};
        return StatusQuery {};
    }

    if (keyword == "SEND")
    {
        if (isBlank(argument))
            return Ignored { "SEND requires text" };
        return SendText { std::string(argument) };
    }

    if (keyword == "MODEL")
    {
        if (argument.empty() || argument.find_first_of(" \t") != std::string_view::npos)
            return Ignored { "MODEL requires exactly one model identifier" };
        return SwitchModel { std::string(argument) };
    }

    return Ignored { std::format("unknown command '{}'", keyword.substr(0, 32)) };
}

auto commandName(const Command& command) -> std::string_view
{
    if (std::holds_alternative<NewConversation>(command))
        return "NEW";
    if (std::holds_alternative<SendText>(command))
        return "SEND";
    if (std::holds_alternative<SwitchModel>(command))
        return "MODEL";
    if (std::holds_alternative<StatusQuery>(command))
        return "STATUS";
    return "IGNORED";
}

} // namespace llmtui::remote
