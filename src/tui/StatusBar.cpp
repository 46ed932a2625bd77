// SPDX-License-Identifier: Apache-2.0
#include <tui/StatusBar.hpp>
#include <tui/Text.hpp>

#include <algorithm>
#include <format>

namespace llmtui::tui
{

void StatusBar::setMessage(std::string text, Style const& style)
{
    _message = std::move(text);
    _messageStyle = style;
}

void StatusBar::clearMessage()
{
    _message.clear();
}

void StatusBar::render(TerminalOutput& output, int row, int width, Style const& background, Style const& keyStyle) const
{
    if (width <= 0)
        return;

    output.moveTo(row, 1);
    output.write(std::string(static_cast<std::size_t>(width), ' '), background);

    auto const right = truncate(_rightText, std::max(0, width / 2));
    auto const rightWidth = displayWidth(right);
    auto const leftBudget = width - rightWidth - 2;

    output.moveTo(row, 2);
    if (!_message.empty())
    {
        output.write(truncate(_message, leftBudget), _messageStyle);
    }
    else
    {
        auto used = 0;
        for (auto const& hint: _hints)
        {
            auto const hintWidth = displayWidth(hint.key) + 1 + displayWidth(hint.action) + 2;
            if (used + hintWidth > leftBudget)
                break;
            output.write(hint.key, keyStyle);
            output.write(std::format(" {}  ", hint.action), background);
            used += hintWidth;
        }
    }

    if (rightWidth > 0)
    {
        output.moveTo(row, width - rightWidth);
        output.write(right, background);
    }
}

} // namespace llmtui::tui
