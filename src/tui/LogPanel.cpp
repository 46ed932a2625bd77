// SPDX-License-Identifier: Apache-2.0
#include <algorithm>
#include <format>
#include <string>

#include <tui/LogPanel.hpp>
#include <tui/Text.hpp>

namespace llmtui::tui
{

namespace
{
    auto styleFor(log::Level level, Theme const& theme) -> Style const&
    {
        switch (level)
        {
            case log::Level::Error: return theme.logError;
            case log::Level::Warning: return theme.logWarning;
            case log::Level::Info: return theme.logInfo;
            case log::Level::Debug:
            case log::Level::Trace: break;
        }
        return theme.logDebug;
    }
} // namespace

void LogPanel::addLog(log::Level level, std::string message)
{
    auto const lock = std::lock_guard(_mutex);
    _entries.push_back(LogEntry { .level = level, .message = std::move(message) });
    while (_entries.size() > _capacity)
        _entries.pop_front();
}

auto LogPanel::entries() const -> std::vector<LogEntry>
{
    auto const lock = std::lock_guard(_mutex);
    return { _entries.begin(), _entries.end() };
}

auto LogPanel::entryCount() const -> std::size_t
{
    auto const lock = std::lock_guard(_mutex);
    return _entries.size();
}

void LogPanel::render(TerminalOutput& output, Rect const& area, Theme const& theme) const
{
    auto const snapshot = entries();
    drawBox(output, area, std::format("Log ({})", snapshot.size()), theme.border, theme.title);

    auto const inner = area.inner();
    if (inner.empty())
        return;

    auto const visible = std::min(snapshot.size(), static_cast<std::size_t>(inner.height));
    auto row = inner.row;
    for (auto i = snapshot.size() - visible; i < snapshot.size(); ++i, ++row)
    {
        auto const& entry = snapshot[i];
        output.moveTo(row, inner.col);
        output.write(truncate(std::format("{} {}", log::levelTag(entry.level), entry.message), inner.width),
                     styleFor(entry.level, theme));
    }
}

} // namespace llmtui::tui
