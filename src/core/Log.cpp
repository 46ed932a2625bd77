// SPDX-License-Identifier: Apache-2.0
#include "Log.hpp"

#include <array>
#include <atomic>
#include <mutex>
#include <print>
#include <utility>

namespace llmtui::log
{

namespace
{
    constexpr auto LevelNames = std::array<std::pair<std::string_view, Level>, 6> { {
        { "error", Level::Error },
        { "warning", Level::Warning },
        { "warn", Level::Warning },
        { "info", Level::Info },
        { "debug", Level::Debug },
        { "trace", Level::Trace },
    } };

    struct Logger
    {
        std::atomic<Level> level { Level::Info };
        std::mutex mutex;
        Sink sink;
    };

    auto logger() -> Logger&
    {
        static auto instance = Logger {};
        return instance;
    }
} // namespace

void setCallback(Sink sink)
{
    auto& state = logger();
    auto const lock = std::lock_guard { state.mutex };
    state.sink = std::move(sink);
}

void setLevel(Level level)
{
    logger().level.store(level);
}

auto getLevel() -> Level
{
    return logger().level.load();
}

auto levelTag(Level level) -> std::string_view
{
    switch (level)
    {
        case Level::Error: return "ERROR";
        case Level::Warning: return "WARN ";
        case Level::Info: return "INFO ";
        case Level::Debug: return "DEBUG";
        case Level::Trace: return "TRACE";
    }
    return "?????";
}

auto parseLevel(std::string_view name) -> std::optional<Level>
{
    for (auto const& [candidate, level]: LevelNames)
        if (candidate == name)
            return level;
    return std::nullopt;
}

void write(Level level, std::string_view message)
{
    if (!enabled(level))
        return;

    auto& state = logger();
    auto const lock = std::lock_guard { state.mutex };
    if (state.sink)
        state.sink(level, message);
    else
        std::println(stderr, "{} {}", levelTag(level), message);
}

} // namespace llmtui::log
