// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <format>
#include <functional>
#include <optional>
#include <string_view>

namespace llmtui::log
{

/// @brief Severity of a log record, ordered from most to least important.
enum class Level
{
    Error,
    Warning,
    Info,
    Debug,
    Trace,
};

/// @brief Receives every record that passes the level filter.
using Sink = std::function<void(Level level, std::string_view message)>;

/// @brief Routes records to @p sink instead of stderr; an empty sink restores stderr.
///
/// Records may come from any thread. The sink runs under the logger's lock and
/// must not log itself.
void setCallback(Sink sink);

/// @brief Records above @p level are dropped.
void setLevel(Level level);
[[nodiscard]] auto getLevel() -> Level;

/// @brief Whether a record at @p level would currently be written.
[[nodiscard]] inline auto enabled(Level level) -> bool
{
    return level <= getLevel();
}

/// @brief Fixed-width tag used in the log panel and on stderr ("ERROR", "WARN ", ...).
[[nodiscard]] auto levelTag(Level level) -> std::string_view;

/// @brief Parses "error", "warning", "info", "debug" or "trace".
[[nodiscard]] auto parseLevel(std::string_view name) -> std::optional<Level>;

/// @brief Writes an already formatted record.
void write(Level level, std::string_view message);

template <typename... Args>
void error(std::format_string<Args...> fmt, Args&&... args)
{
    write(Level::Error, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void warning(std::format_string<Args...> fmt, Args&&... args)
{
    write(Level::Warning, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void info(std::format_string<Args...> fmt, Args&&... args)
{
    if (enabled(Level::Info))
        write(Level::Info, std::format(fmt, std::forward<Args>(args)...));
}

/// @brief Debug and trace records skip formatting entirely when filtered out.
template <typename... Args>
void debug(std::format_string<Args...> fmt, Args&&... args)
{
    if (enabled(Level::Debug))
        write(Level::Debug, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void trace(std::format_string<Args...> fmt, Args&&... args)
{
    if (enabled(Level::Trace))
        write(Level::Trace, std::format(fmt, std::forward<Args>(args)...));
}

} // namespace llmtui::log
