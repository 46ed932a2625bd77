// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <string_view>

#include <tui/InputEvent.hpp>

namespace llmtui
{

/// @brief UI region that currently receives keyboard input.
enum class Focus
{
    ConversationList,
    ModelSelect,
    Chat,
    Input,
};

/// @brief Sub-mode of the Input region.
enum class InputMode
{
    Normal,
    Editing,
};

/// @brief What the orchestrator should do in response to a key.
enum class KeyAction
{
    None,
    Quit,
    CycleFocus,
    ToggleList,
    ToggleLog,
    NavigateUp,
    NavigateDown,
    Select,
    NewConversation,
    Copy,
    EnterEdit,
    ExitEdit,
    Submit,
    EditText,
    ReloadModels,
};

[[nodiscard]] auto focusName(Focus focus) -> std::string_view;
[[nodiscard]] auto keyActionName(KeyAction action) -> std::string_view;

/// @brief Tracks focus and translates key presses into actions.
///
/// Focus cycles ConversationList -> Chat -> Input -> ModelSelect and wraps.
/// Hiding the conversation list only affects layout, never this order.
/// route() applies the focus transition that belongs to a key and returns the
/// action for the orchestrator; it has no side effects beyond focus state.
class FocusStateMachine
{
  public:
    [[nodiscard]] auto focus() const noexcept -> Focus { return _focus; }
    [[nodiscard]] auto inputMode() const noexcept -> InputMode { return _inputMode; }
    [[nodiscard]] auto isEditing() const noexcept -> bool
    {
        return _focus == Focus::Input && _inputMode == InputMode::Editing;
    }
    [[nodiscard]] auto isListVisible() const noexcept -> bool { return _listVisible; }

    /// @brief Advances to the next region and leaves editing mode.
    void cycle();

    /// @brief Shows or hides the conversation list pane.
    void toggleListVisibility();

    /// @brief Moves focus directly to @p focus, leaving editing mode.
    void focusOn(Focus focus);

    /// @brief Focuses the input region in editing mode.
    void enterEdit();

    /// @brief Returns the input region to normal mode.
    void exitEdit();

    /// @brief Routes a key press for the focused region.
    [[nodiscard]] auto route(const tui::KeyEvent& key) -> KeyAction;

  private:
    [[nodiscard]] auto routeEditing(const tui::KeyEvent& key) -> KeyAction;
    [[nodiscard]] auto routeRegion(const tui::KeyEvent& key) -> KeyAction;

    Focus _focus = Focus::ConversationList;
    InputMode _inputMode = InputMode::Normal;
    bool _listVisible = true;
};

} // namespace llmtui
