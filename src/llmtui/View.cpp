// SPDX-License-Identifier: Apache-2.0
#include "View.hpp"

#include <algorithm>
#include <format>
#include <iterator>
#include <string_view>
#include <utility>

#include <llmtui/Orchestrator.hpp>
#include <tui/List.hpp>
#include <tui/LogPanel.hpp>
#include <tui/Text.hpp>

namespace llmtui
{

namespace
{
    constexpr auto InputHeight = 3;
    constexpr auto ModelHeight = 3;
    constexpr auto MaxLogHeight = 10;
    constexpr auto MinListWidth = 20;
    constexpr auto Prompt = std::string_view { "> " };

    auto hintsFor(FocusStateMachine const& focus) -> std::vector<tui::KeyHint>
    {
        if (focus.isEditing())
            return { { "Enter", "send" }, { "Esc", "done" }, { "Tab", "focus" }, { "Ctrl+C", "quit" } };

        auto hints = std::vector<tui::KeyHint> {};
        switch (focus.focus())
        {
            case Focus::ConversationList:
                hints = { { "↑↓", "select" }, { "Enter", "open" }, { "n", "new" }, { "h", "hide list" } };
                break;
            case Focus::ModelSelect:
                hints = { { "↑↓", "choose" }, { "Enter", "use model" }, { "r", "reload" } };
                break;
            case Focus::Chat: hints = { { "↑↓", "select" }, { "y", "copy" } }; break;
            case Focus::Input: hints = { { "i", "type" } }; break;
        }
        hints.push_back({ "Tab", "focus" });
        hints.push_back({ "Ctrl+L", "log" });
        hints.push_back({ "q", "quit" });
        return hints;
    }

    auto modelLabel(ModelRegistry const& registry, std::string const& modelId) -> std::string
    {
        if (modelId.empty())
            return "default";
        if (auto const* model = registry.find(modelId); model && model->name != model->id)
            return std::format("{} ({})", model->name, model->id);
        return modelId;
    }
} // namespace

auto computeLayout(int columns, int rows, bool showList, bool showLog) -> Layout
{
    auto layout = Layout {};
    layout.columns = columns;
    layout.statusRow = rows;

    auto contentHeight = std::max(0, rows - 1);
    if (showLog && contentHeight >= 12)
    {
        auto const logHeight = std::min(MaxLogHeight, contentHeight / 3);
        contentHeight -= logHeight;
        layout.log = tui::Rect { .row = contentHeight + 1, .col = 1, .width = columns, .height = logHeight };
    }

    auto leftWidth = 0;
    if (showList && columns >= 2 * MinListWidth)
        leftWidth = std::max(MinListWidth, columns * 30 / 100);
    auto const rightCol = leftWidth + 1;
    auto const rightWidth = columns - leftWidth;

    layout.input = tui::Rect {
        .row = std::max(1, contentHeight - InputHeight + 1), .col = rightCol, .width = rightWidth, .height = InputHeight
    };

    if (leftWidth > 0)
    {
        layout.list = tui::Rect { .row = 1, .col = 1, .width = leftWidth, .height = contentHeight - ModelHeight };
        layout.model = tui::Rect {
            .row = std::max(1, contentHeight - ModelHeight + 1), .col = 1, .width = leftWidth, .height = ModelHeight
        };
        layout.chat = tui::Rect { .row = 1, .col = rightCol, .width = rightWidth, .height = contentHeight - InputHeight };
    }
    else
    {
        layout.model = tui::Rect { .row = 1, .col = 1, .width = columns, .height = ModelHeight };
        layout.chat = tui::Rect {
            .row = ModelHeight + 1, .col = 1, .width = columns, .height = contentHeight - InputHeight - ModelHeight
        };
    }
    return layout;
}

auto layoutTranscript(Conversation const& conversation,
                      std::optional<std::size_t> selection,
                      int width,
                      tui::Theme const& theme) -> std::vector<ChatLine>
{
    auto lines = std::vector<ChatLine> {};
    auto const bodyWidth = std::max(1, width - 2);

    for (auto i = std::size_t { 0 }; i < conversation.messages.size(); ++i)
    {
        auto const& message = conversation.messages[i];
        if (i > 0)
            lines.push_back(ChatLine { .text = {}, .style = {}, .messageIndex = i });

        auto header = std::string(message.role == Role::User ? "You" : "Model");
        if (message.status.isPending())
            header += " · thinking…";
        else if (message.status.isFailed())
            header += " · failed";

        auto const isSelected = selection && *selection == i;
        auto const& headerStyle = isSelected ? theme.selected
                                  : message.role == Role::User ? theme.userLabel
                                                               : theme.modelLabel;
        lines.push_back(ChatLine { .text = std::move(header), .style = headerStyle, .messageIndex = i });

        if (!message.text.empty())
        {
            for (auto& row: tui::wordWrap(message.text, bodyWidth))
                lines.push_back(ChatLine { .text = std::format("  {}", row), .style = theme.text, .messageIndex = i });
        }
        else if (message.status.isPending())
        {
            lines.push_back(ChatLine { .text = "  …", .style = theme.pending, .messageIndex = i });
        }

        if (message.status.isFailed())
        {
            for (auto& row: tui::wordWrap(message.status.reason, bodyWidth))
                lines.push_back(ChatLine { .text = std::format("  {}", row), .style = theme.failed, .messageIndex = i });
        }
    }
    return lines;
}

View::View(tui::Theme theme): _theme(std::move(theme))
{
}

auto View::borderFor(bool focused) const -> tui::Style const&
{
    return focused ? _theme.borderFocused : _theme.border;
}

auto View::titleFor(bool focused) const -> tui::Style const&
{
    return focused ? _theme.titleFocused : _theme.title;
}

void View::render(tui::TerminalOutput& output, Orchestrator const& orchestrator, tui::LogPanel const& logPanel)
{
    auto const layout = computeLayout(
        output.columns(), output.rows(), orchestrator.focus().isListVisible(), orchestrator.isLogVisible());

    output.beginFrame();
    output.hideCursor();
    output.clearScreen();

    if (!layout.list.empty())
        renderList(output, orchestrator, layout.list);
    renderModel(output, orchestrator, layout.model);
    renderChat(output, orchestrator, layout.chat);
    renderInput(output, orchestrator, layout.input);
    if (!layout.log.empty())
        logPanel.render(output, layout.log, _theme);
    renderStatus(output, orchestrator, layout);
    placeCursor(output, orchestrator, layout.input);

    output.endFrame();
}

void View::renderList(tui::TerminalOutput& output, Orchestrator const& orchestrator, tui::Rect const& area)
{
    auto const focused = orchestrator.focus().focus() == Focus::ConversationList;
    auto const& store = orchestrator.store();
    tui::drawBox(output, area, "Conversations", borderFor(focused), titleFor(focused));

    auto items = std::vector<tui::ListItem> {};
    for (auto const& conversation: store.conversations())
    {
        auto label = conversation.name;
        if (conversation.pendingMessage() != nullptr)
            label += " …";
        items.push_back(tui::ListItem {
            .label = std::move(label),
            .marked = store.activeConversationId() == conversation.id,
        });
    }

    auto const inner = area.inner();
    if (inner.empty())
        return;
    if (items.empty())
    {
        output.moveTo(inner.row, inner.col);
        output.write(tui::truncate("Press n to start", inner.width), _theme.muted);
        return;
    }

    auto const style = tui::ListStyle {
        .normal = _theme.text,
        .highlighted = focused ? _theme.selected : _theme.selectedUnfocused,
        .marked = _theme.active,
    };
    tui::renderList(output, inner, items, orchestrator.listCursor(), style);
}

void View::renderModel(tui::TerminalOutput& output, Orchestrator const& orchestrator, tui::Rect const& area)
{
    auto const focused = orchestrator.focus().focus() == Focus::ModelSelect;
    auto const title = orchestrator.isReloadingModels() ? std::string("Model (reloading…)") : std::string("Model");
    tui::drawBox(output, area, title, borderFor(focused), titleFor(focused));

    auto const inner = area.inner();
    if (inner.empty())
        return;
    output.moveTo(inner.row, inner.col);

    auto const& registry = orchestrator.registry();
    if (focused)
    {
        if (registry.empty())
        {
            output.write(tui::truncate("No models (r to reload)", inner.width), _theme.muted);
            return;
        }
        auto const index = std::min(orchestrator.modelCursor(), registry.size() - 1);
        auto const& model = registry.models()[index];
        auto const text = std::format("◂ {} ▸ {}/{}", model.name, index + 1, registry.size());
        output.write(tui::truncate(text, inner.width), _theme.selected);
        return;
    }

    auto const* active = orchestrator.store().activeConversation();
    auto const modelId = active ? active->modelId : orchestrator.store().defaultModel();
    output.write(tui::truncate(modelLabel(registry, modelId), inner.width), _theme.text);
}

void View::renderChat(tui::TerminalOutput& output, Orchestrator const& orchestrator, tui::Rect const& area)
{
    auto const focused = orchestrator.focus().focus() == Focus::Chat;
    auto const* conversation = orchestrator.store().activeConversation();
    auto const title = conversation ? conversation->name : std::string("Chat");
    tui::drawBox(output, area, title, borderFor(focused), titleFor(focused));

    auto const inner = area.inner();
    if (inner.empty())
        return;

    if (!conversation || conversation->messages.empty())
    {
        output.moveTo(inner.row, inner.col);
        output.write(tui::truncate("Type a message below and press Enter.", inner.width), _theme.muted);
        return;
    }

    auto const lines = layoutTranscript(*conversation, orchestrator.chatSelection(), inner.width, _theme);
    auto const height = static_cast<std::size_t>(inner.height);

    // Follow the newest output unless a message is selected.
    auto offset = lines.size() > height ? lines.size() - height : std::size_t { 0 };
    if (auto const selection = orchestrator.chatSelection())
    {
        auto const first = std::ranges::find_if(lines, [&](ChatLine const& line) {
            return line.messageIndex == *selection && !line.text.empty();
        });
        auto const firstRow = static_cast<std::size_t>(std::distance(lines.begin(), first));
        if (firstRow < offset || firstRow >= offset + height)
            offset = std::min(firstRow, lines.size() > height ? lines.size() - height : std::size_t { 0 });
    }

    auto row = inner.row;
    for (auto i = offset; i < lines.size() && row < inner.row + inner.height; ++i, ++row)
    {
        output.moveTo(row, inner.col);
        output.write(tui::truncate(lines[i].text, inner.width), lines[i].style);
    }
}

void View::renderInput(tui::TerminalOutput& output, Orchestrator const& orchestrator, tui::Rect const& area)
{
    auto const& focus = orchestrator.focus();
    auto const focused = focus.focus() == Focus::Input;
    auto const title = focus.isEditing() ? std::string("Message (editing)") : std::string("Message");
    tui::drawBox(output, area, title, borderFor(focused || focus.isEditing()), titleFor(focused || focus.isEditing()));

    auto const inner = area.inner();
    if (inner.empty())
        return;

    output.moveTo(inner.row, inner.col);
    output.write(Prompt, _theme.active);

    auto const& input = orchestrator.input();
    auto const available = inner.width - tui::displayWidth(Prompt);
    if (input.text().empty() && !focus.isEditing())
    {
        output.write(tui::truncate("Press i to write", available), _theme.muted);
        return;
    }

    auto const column = input.cursorColumn();
    auto const scroll = column >= available ? column - available + 1 : 0;
    output.write(tui::truncate(tui::dropColumns(input.text(), scroll), available), _theme.text);
}

void View::renderStatus(tui::TerminalOutput& output, Orchestrator const& orchestrator, Layout const& layout)
{
    _statusBar.setHints(hintsFor(orchestrator.focus()));
    _statusBar.setRightText(std::format("remote: {}", orchestrator.remoteStatus()));

    if (auto const& feedback = orchestrator.feedback())
    {
        auto const& style = feedback->kind == FeedbackKind::Positive ? _theme.positive : _theme.negative;
        _statusBar.setMessage(feedback->text, style);
    }
    else if (auto const pending = orchestrator.store().pendingCount(); pending > 0)
    {
        _statusBar.setMessage(std::format("Thinking… ({})", pending), _theme.statusKey);
    }
    else
    {
        _statusBar.clearMessage();
    }

    _statusBar.render(output, layout.statusRow, layout.columns, _theme.statusBar, _theme.statusKey);
}

void View::placeCursor(tui::TerminalOutput& output, Orchestrator const& orchestrator, tui::Rect const& area)
{
    if (!orchestrator.focus().isEditing())
        return;

    auto const inner = area.inner();
    auto const available = inner.width - tui::displayWidth(Prompt);
    if (inner.empty() || available <= 0)
        return;

    auto const column = orchestrator.input().cursorColumn();
    auto const visibleColumn = column >= available ? available - 1 : column;
    output.moveTo(inner.row, inner.col + tui::displayWidth(Prompt) + visibleColumn);
    output.showCursor();
}

} // namespace llmtui
