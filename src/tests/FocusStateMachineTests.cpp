// SPDX-License-Identifier: Apache-2.0
#include <llmtui/FocusStateMachine.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace llmtui;
using tui::charKey;
using tui::KeyCode;
using tui::KeyEvent;
using tui::Modifier;

namespace
{
auto key(KeyCode code) -> KeyEvent
{
    return KeyEvent { .key = code };
}
} // namespace

TEST_CASE("Focus starts on the conversation list", "[focus]")
{
    auto const fsm = FocusStateMachine {};
    CHECK(fsm.focus() == Focus::ConversationList);
    CHECK(fsm.inputMode() == InputMode::Normal);
    CHECK(fsm.isListVisible());
}

TEST_CASE("Tab cycles through all regions and wraps", "[focus]")
{
    auto fsm = FocusStateMachine {};
    CHECK(fsm.route(key(KeyCode::Tab)) == KeyAction::CycleFocus);
    CHECK(fsm.focus() == Focus::Chat);
    static_cast<void>(fsm.route(key(KeyCode::Tab)));
    CHECK(fsm.focus() == Focus::Input);
    static_cast<void>(fsm.route(key(KeyCode::Tab)));
    CHECK(fsm.focus() == Focus::ModelSelect);
    static_cast<void>(fsm.route(key(KeyCode::Tab)));
    CHECK(fsm.focus() == Focus::ConversationList);
}

TEST_CASE("Hiding the list does not change the focus order", "[focus]")
{
    auto fsm = FocusStateMachine {};
    CHECK(fsm.route(charKey(U'h')) == KeyAction::ToggleList);
    CHECK_FALSE(fsm.isListVisible());
    CHECK(fsm.focus() == Focus::ConversationList);

    fsm.focusOn(Focus::ModelSelect);
    fsm.cycle();
    CHECK(fsm.focus() == Focus::ConversationList);
}

TEST_CASE("Editing mode captures printable keys", "[focus]")
{
    auto fsm = FocusStateMachine {};
    CHECK(fsm.route(charKey(U'i')) == KeyAction::EnterEdit);
    CHECK(fsm.isEditing());

    CHECK(fsm.route(charKey(U'q')) == KeyAction::EditText);
    CHECK(fsm.route(charKey(U'h')) == KeyAction::EditText);
    CHECK(fsm.isListVisible());
    CHECK(fsm.route(key(KeyCode::Backspace)) == KeyAction::EditText);

    CHECK(fsm.route(key(KeyCode::Escape)) == KeyAction::ExitEdit);
    CHECK_FALSE(fsm.isEditing());
    CHECK(fsm.focus() == Focus::Input);
}

TEST_CASE("Enter in editing mode submits and leaves editing", "[focus]")
{
    auto fsm = FocusStateMachine {};
    fsm.enterEdit();
    CHECK(fsm.route(key(KeyCode::Enter)) == KeyAction::Submit);
    CHECK(fsm.focus() == Focus::Input);
    CHECK_FALSE(fsm.isEditing());

    CHECK(fsm.route(key(KeyCode::Enter)) == KeyAction::EnterEdit);
    CHECK(fsm.isEditing());
}

TEST_CASE("Tab leaves editing mode", "[focus]")
{
    auto fsm = FocusStateMachine {};
    fsm.enterEdit();
    CHECK(fsm.route(key(KeyCode::Tab)) == KeyAction::CycleFocus);
    CHECK(fsm.focus() == Focus::ModelSelect);
    CHECK(fsm.inputMode() == InputMode::Normal);
}

TEST_CASE("Global shortcuts work in every mode", "[focus]")
{
    auto fsm = FocusStateMachine {};
    fsm.enterEdit();
    CHECK(fsm.route(charKey(U'c', Modifier::Ctrl)) == KeyAction::Quit);
    CHECK(fsm.route(charKey(U'l', Modifier::Ctrl)) == KeyAction::ToggleLog);
    CHECK(fsm.isEditing());

    fsm.exitEdit();
    CHECK(fsm.route(charKey(U'q')) == KeyAction::Quit);
}

TEST_CASE("Region keys depend on the focused region", "[focus]")
{
    auto fsm = FocusStateMachine {};

    SECTION("conversation list")
    {
        CHECK(fsm.route(charKey(U'j')) == KeyAction::NavigateDown);
        CHECK(fsm.route(key(KeyCode::Up)) == KeyAction::NavigateUp);
        CHECK(fsm.route(charKey(U'y')) == KeyAction::None);
        CHECK(fsm.route(key(KeyCode::Enter)) == KeyAction::Select);
        CHECK(fsm.focus() == Focus::Chat);
    }

    SECTION("new conversation jumps into the input")
    {
        CHECK(fsm.route(charKey(U'n')) == KeyAction::NewConversation);
        CHECK(fsm.isEditing());
    }

    SECTION("model selector")
    {
        fsm.focusOn(Focus::ModelSelect);
        CHECK(fsm.route(charKey(U'k')) == KeyAction::NavigateUp);
        CHECK(fsm.route(charKey(U'r')) == KeyAction::ReloadModels);
        CHECK(fsm.route(key(KeyCode::Enter)) == KeyAction::Select);
        CHECK(fsm.focus() == Focus::ModelSelect);
    }

    SECTION("chat")
    {
        fsm.focusOn(Focus::Chat);
        CHECK(fsm.route(key(KeyCode::Down)) == KeyAction::NavigateDown);
        CHECK(fsm.route(charKey(U'y')) == KeyAction::Copy);
        CHECK(fsm.route(charKey(U'n')) == KeyAction::None);
    }
}

TEST_CASE("Focus and action names", "[focus]")
{
    CHECK(focusName(Focus::ConversationList) == "conversations");
    CHECK(focusName(Focus::Input) == "input");
    CHECK(keyActionName(KeyAction::Submit) == "Submit");
}
