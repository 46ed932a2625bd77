// SPDX-License-Identifier: Apache-2.0
#include "FocusStateMachine.hpp"

namespace llmtui
{

namespace
{
    auto nextFocus(Focus focus) -> Focus
    {
        switch (focus)
        {
            case Focus::ConversationList: return Focus::Chat;
            case Focus::Chat: return Focus::Input;
            case Focus::Input: return Focus::ModelSelect;
            case Focus::ModelSelect: return Focus::ConversationList;
        }
        return Focus::ConversationList;
    }

    auto isChar(const tui::KeyEvent& key, char32_t ch) -> bool
    {
        return key.key == tui::keyCodeFromCodepoint(ch) && !tui::hasModifier(key.modifiers, tui::Modifier::Ctrl)
               && !tui::hasModifier(key.modifiers, tui::Modifier::Alt);
    }

    auto isCtrl(const tui::KeyEvent& key, char32_t ch) -> bool
    {
        return key.key == tui::keyCodeFromCodepoint(ch) && tui::hasModifier(key.modifiers, tui::Modifier::Ctrl);
    }
} // namespace

auto focusName(Focus focus) -> std::string_view
{
    switch (focus)
    {
        case Focus::ConversationList: return "conversations";
        case Focus::ModelSelect: return "model";
        case Focus::Chat: return "chat";
        case Focus::Input: return "input";
    }
    return "unknown";
}

auto keyActionName(KeyAction action) -> std::string_view
{
    switch (action)
    {
        case KeyAction::None: return "None";
        case KeyAction::Quit: return "Quit";
        case KeyAction::CycleFocus: return "CycleFocus";
        case KeyAction::ToggleList: return "ToggleList";
        case KeyAction::ToggleLog: return "ToggleLog";
        case KeyAction::NavigateUp: return "NavigateUp";
        case KeyAction::NavigateDown: return "NavigateDown";
        case KeyAction::Select: return "Select";
        case KeyAction::NewConversation: return "NewConversation";
        case KeyAction::Copy: return "Copy";
        case KeyAction::EnterEdit: return "EnterEdit";
        case KeyAction::ExitEdit: return "ExitEdit";
        case KeyAction::Submit: return "Submit";
        case KeyAction::EditText: return "EditText";
        case KeyAction::ReloadModels: return "ReloadModels";
    }
    return "Unknown";
}

void FocusStateMachine::cycle()
{
    _focus = nextFocus(_focus);
    _inputMode = InputMode::Normal;
}

void FocusStateMachine::toggleListVisibility()
{
    _listVisible = !_listVisible;
}

void FocusStateMachine::focusOn(Focus focus)
{
    _focus = focus;
    _inputMode = InputMode::Normal;
}

void FocusStateMachine::enterEdit()
{
    _focus = Focus::Input;
    _inputMode = InputMode::Editing;
}

void FocusStateMachine::exitEdit()
{
    _inputMode = InputMode::Normal;
}

auto FocusStateMachine::route(const tui::KeyEvent& key) -> KeyAction
{
    if (isCtrl(key, 'c'))
        return KeyAction::Quit;
    if (isCtrl(key, 'l'))
        return KeyAction::ToggleLog;

    if (isEditing())
        return routeEditing(key);

    if (key.key == tui::KeyCode::Tab)
    {
        cycle();
        return KeyAction::CycleFocus;
    }
    if (isChar(key, 'q'))
        return KeyAction::Quit;
    if (isChar(key, 'h'))
    {
        toggleListVisibility();
        return KeyAction::ToggleList;
    }
    if (isChar(key, 'i'))
    {
        enterEdit();
        return KeyAction::EnterEdit;
    }

    return routeRegion(key);
}

auto FocusStateMachine::routeEditing(const tui::KeyEvent& key) -> KeyAction
{
    switch (key.key)
    {
        case tui::KeyCode::Enter: exitEdit(); return KeyAction::Submit;
        case tui::KeyCode::Escape: exitEdit(); return KeyAction::ExitEdit;
        case tui::KeyCode::Tab: cycle(); return KeyAction::CycleFocus;
        default: return KeyAction::EditText;
    }
}

auto FocusStateMachine::routeRegion(const tui::KeyEvent& key) -> KeyAction
{
    auto const up = key.key == tui::KeyCode::Up || isChar(key, 'k');
    auto const down = key.key == tui::KeyCode::Down || isChar(key, 'j');

    switch (_focus)
    {
        case Focus::ConversationList:
            if (up)
                return KeyAction::NavigateUp;
            if (down)
                return KeyAction::NavigateDown;
            if (key.key == tui::KeyCode::Enter)
            {
                focusOn(Focus::Chat);
                return KeyAction::Select;
            }
            if (isChar(key, 'n'))
            {
                enterEdit();
                return KeyAction::NewConversation;
            }
            break;

        case Focus::ModelSelect:
            if (up)
                return KeyAction::NavigateUp;
            if (down)
                return KeyAction::NavigateDown;
            if (key.key == tui::KeyCode::Enter)
                return KeyAction::Select;
            if (isChar(key, 'r'))
                return KeyAction::ReloadModels;
            break;

        case Focus::Chat:
            if (up)
                return KeyAction::NavigateUp;
            if (down)
                return KeyAction::NavigateDown;
            if (isChar(key, 'y'))
                return KeyAction::Copy;
            break;

        case Focus::Input:
            if (key.key == tui::KeyCode::Enter)
            {
                enterEdit();
                return KeyAction::EnterEdit;
            }
            break;
    }

    return KeyAction::None;
}

} // namespace llmtui
