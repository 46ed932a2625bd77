// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include <tui/Box.hpp>
#include <tui/StatusBar.hpp>
#include <tui/TerminalOutput.hpp>
#include <tui/Theme.hpp>

namespace llmtui
{

class Orchestrator;
struct Conversation;

namespace tui
{
    class LogPanel;
}

/// @brief Screen regions for one frame.
struct Layout
{
    tui::Rect list;  ///< Empty when the conversation list is hidden.
    tui::Rect model;
    tui::Rect chat;
    tui::Rect input;
    tui::Rect log;   ///< Empty when the log panel is hidden.
    int statusRow = 0;
    int columns = 0;
};

/// @brief Splits a @p columns x @p rows screen into panels.
///
/// The conversation list takes 30% of the width on the left with the model
/// selector below it. The chat fills the right column above the input box.
/// When the list is hidden, the model selector moves above the chat.
[[nodiscard]] auto computeLayout(int columns, int rows, bool showList, bool showLog) -> Layout;

/// @brief One rendered row of the chat transcript.
struct ChatLine
{
    std::string text;
    tui::Style style;
    std::size_t messageIndex = 0;
};

/// @brief Flattens a conversation into wrapped, styled rows of at most @p width cells.
[[nodiscard]] auto layoutTranscript(Conversation const& conversation,
                                    std::optional<std::size_t> selection,
                                    int width,
                                    tui::Theme const& theme) -> std::vector<ChatLine>;

/// @brief Draws the whole screen from orchestrator state.
class View
{
  public:
    explicit View(tui::Theme theme);

    /// @brief Renders a frame into @p output. Does not flush.
    void render(tui::TerminalOutput& output, Orchestrator const& orchestrator, tui::LogPanel const& logPanel);

  private:
    tui::Theme _theme;
    tui::StatusBar _statusBar;

    void renderList(tui::TerminalOutput& output, Orchestrator const& orchestrator, tui::Rect const& area);
    void renderModel(tui::TerminalOutput& output, Orchestrator const& orchestrator, tui::Rect const& area);
    void renderChat(tui::TerminalOutput& output, Orchestrator const& orchestrator, tui::Rect const& area);
    void renderInput(tui::TerminalOutput& output, Orchestrator const& orchestrator, tui::Rect const& area);
    void renderStatus(tui::TerminalOutput& output, Orchestrator const& orchestrator, Layout const& layout);
    void placeCursor(tui::TerminalOutput& output, Orchestrator const& orchestrator, tui::Rect const& area);

    [[nodiscard]] auto borderFor(bool focused) const -> tui::Style const&;
    [[nodiscard]] auto titleFor(bool focused) const -> tui::Style const&;
};

} // namespace llmtui
