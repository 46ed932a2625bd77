// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Log.hpp>

#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

#include <tui/Box.hpp>
#include <tui/Theme.hpp>

namespace llmtui::tui
{

/// @brief A single log entry with level and message text.
struct LogEntry
{
    log::Level level;
    std::string message;
};

/// @brief Bounded, thread-safe store of recent log lines with a renderer.
///
/// addLog() may be called from any thread; render() and entries() take a
/// snapshot under the same lock.
class LogPanel
{
  public:
    explicit LogPanel(std::size_t capacity = DefaultCapacity): _capacity(capacity) {}

    void addLog(log::Level level, std::string message);

    [[nodiscard]] auto entries() const -> std::vector<LogEntry>;
    [[nodiscard]] auto entryCount() const -> std::size_t;

    /// @brief Draws a bordered panel showing the newest entries that fit in @p area.
    void render(TerminalOutput& output, Rect const& area, Theme const& theme) const;

    static constexpr std::size_t DefaultCapacity = 200;

  private:
    mutable std::mutex _mutex;
    std::deque<LogEntry> _entries;
    std::size_t _capacity;
};

} // namespace llmtui::tui
