// SPDX-License-Identifier: Apache-2.0
#include <charconv>
#include <cstdint>
#include <optional>
#include <ranges>
#include <string_view>
#include <vector>

#include <tui/VtParser.hpp>

namespace llmtui::tui
{

namespace
{
    constexpr auto PasteStart = std::string_view { "200" };
    constexpr auto PasteEnd = std::string_view { "\033[201~" };

    /// @brief Parses semicolon-separated integer parameters ("1;5" -> {1, 5}).
    /// Kitty sub-parameters after ':' are ignored.
    auto parseCsiParams(std::string_view buf) -> std::vector<int>
    {
        auto result = std::vector<int> {};
        for (auto const part: buf | std::views::split(';'))
        {
            auto sv = std::string_view(part.begin(), part.end());
            sv = sv.substr(0, sv.find(':'));
            auto value = 0;
            if (auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value); ec != std::errc {})
                value = 0;
            result.push_back(value);
        }
        return result;
    }

    auto cursorKey(char finalByte) -> std::optional<KeyCode>
    {
        switch (finalByte)
        {
            case 'A': return KeyCode::Up;
            case 'B': return KeyCode::Down;
            case 'C': return KeyCode::Right;
            case 'D': return KeyCode::Left;
            case 'H': return KeyCode::Home;
            case 'F': return KeyCode::End;
            default: return std::nullopt;
        }
    }

    auto tildeKey(int param) -> std::optional<KeyCode>
    {
        switch (param)
        {
            case 1:
            case 7: return KeyCode::Home;
            case 3: return KeyCode::Delete;
            case 4:
            case 8: return KeyCode::End;
            case 5: return KeyCode::PageUp;
            case 6: return KeyCode::PageDown;
            default: return std::nullopt;
        }
    }

    auto decodeUtf8(std::string_view bytes) -> char32_t
    {
        auto const* const b = reinterpret_cast<std::uint8_t const*>(bytes.data());
        switch (bytes.size())
        {
            case 2: return ((b[0] & 0x1F) << 6) | (b[1] & 0x3F);
            case 3: return ((b[0] & 0x0F) << 12) | ((b[1] & 0x3F) << 6) | (b[2] & 0x3F);
            case 4:
                return ((b[0] & 0x07) << 18) | ((b[1] & 0x3F) << 12) | ((b[2] & 0x3F) << 6) | (b[3] & 0x3F);
            default: return 0;
        }
    }
} // namespace

auto VtParser::feed(std::string_view data) -> std::vector<InputEvent>
{
    auto events = std::vector<InputEvent> {};
    for (auto const ch: data)
    {
        auto const byte = static_cast<std::uint8_t>(ch);
        switch (_state)
        {
            case State::Ground: processGround(byte, events); break;
            case State::Escape: processEscape(byte, events); break;
            case State::Csi: processCsi(byte, events); break;
            case State::Ss3: processSs3(byte, events); break;
            case State::PasteBody: processPaste(byte, events); break;
            case State::Utf8Sequence: processUtf8(byte, events); break;
        }
    }
    return events;
}

auto VtParser::timeout() -> std::vector<InputEvent>
{
    auto events = std::vector<InputEvent> {};
    if (_state == State::Escape)
    {
        events.emplace_back(KeyEvent { .key = KeyCode::Escape });
        _state = State::Ground;
    }
    return events;
}

void VtParser::processGround(std::uint8_t byte, std::vector<InputEvent>& events)
{
    switch (byte)
    {
        case 0x1B: _state = State::Escape; return;
        case '\r':
        case '\n': events.emplace_back(KeyEvent { .key = KeyCode::Enter }); return;
        case '\t': events.emplace_back(KeyEvent { .key = KeyCode::Tab }); return;
        case 0x7F:
        case 0x08: events.emplace_back(KeyEvent { .key = KeyCode::Backspace }); return;
        default: break;
    }

    if (byte < 0x20)
    {
        // Ctrl+letter: byte = letter - 'a' + 1
        events.emplace_back(charKey(static_cast<char32_t>(byte + 'a' - 1), Modifier::Ctrl));
        return;
    }

    if ((byte & 0x80) != 0)
    {
        if ((byte & 0xE0) == 0xC0)
            _utf8Remaining = 1;
        else if ((byte & 0xF0) == 0xE0)
            _utf8Remaining = 2;
        else if ((byte & 0xF8) == 0xF0)
            _utf8Remaining = 3;
        else
            return; // Stray continuation or invalid lead byte.

        _utf8Buf.assign(1, static_cast<char>(byte));
        _state = State::Utf8Sequence;
        return;
    }

    events.emplace_back(charKey(static_cast<char32_t>(byte)));
}

void VtParser::processEscape(std::uint8_t byte, std::vector<InputEvent>& events)
{
    if (byte == '[')
    {
        _paramBuf.clear();
        _state = State::Csi;
        return;
    }

    if (byte == 'O')
    {
        _state = State::Ss3;
        return;
    }

    // Alt+character: ESC followed by printable ASCII
    if (byte >= 0x20 && byte < 0x7F)
    {
        events.emplace_back(charKey(static_cast<char32_t>(byte), Modifier::Alt));
        _state = State::Ground;
        return;
    }

    // ESC ESC or ESC + control: emit ESC then reprocess
    events.emplace_back(KeyEvent { .key = KeyCode::Escape });
    _state = State::Ground;
    processGround(byte, events);
}

void VtParser::processCsi(std::uint8_t byte, std::vector<InputEvent>& events)
{
    // Parameter and intermediate bytes
    if (byte >= 0x20 && byte <= 0x3F)
    {
        _paramBuf += static_cast<char>(byte);
        return;
    }

    _state = State::Ground;
    if (byte >= 0x40 && byte <= 0x7E)
        dispatchCsi(static_cast<char>(byte), events);
}

void VtParser::processSs3(std::uint8_t byte, std::vector<InputEvent>& events)
{
    _state = State::Ground;
    if (auto const key = cursorKey(static_cast<char>(byte)))
        events.emplace_back(KeyEvent { .key = *key });
}

void VtParser::processPaste(std::uint8_t byte, std::vector<InputEvent>& events)
{
    _pasteBuf += static_cast<char>(byte);
    if (_pasteBuf.ends_with(PasteEnd))
    {
        _pasteBuf.resize(_pasteBuf.size() - PasteEnd.size());
        events.emplace_back(PasteEvent { .text = std::move(_pasteBuf) });
        _pasteBuf.clear();
        _state = State::Ground;
    }
}

void VtParser::processUtf8(std::uint8_t byte, std::vector<InputEvent>& events)
{
    if ((byte & 0xC0) != 0x80)
    {
        // Truncated sequence: drop it and reprocess the byte.
        _utf8Buf.clear();
        _state = State::Ground;
        processGround(byte, events);
        return;
    }

    _utf8Buf += static_cast<char>(byte);
    if (--_utf8Remaining > 0)
        return;

    if (auto const cp = decodeUtf8(_utf8Buf); cp != 0)
        events.emplace_back(charKey(cp));
    _utf8Buf.clear();
    _state = State::Ground;
}

void VtParser::dispatchCsi(char finalByte, std::vector<InputEvent>& events)
{
    if (finalByte == '~' && _paramBuf == PasteStart)
    {
        _pasteBuf.clear();
        _state = State::PasteBody;
        return;
    }

    // Replies and private-mode reports (e.g. CSI ? flags u) are not key presses.
    if (!_paramBuf.empty() && (_paramBuf[0] == '<' || _paramBuf[0] == '>' || _paramBuf[0] == '?'))
        return;

    auto const params = parseCsiParams(_paramBuf);
    auto const modifiers = params.size() >= 2 ? decodeModifierParam(params[1]) : Modifier::None;

    // Kitty keyboard protocol: CSI keycode ; modifiers u
    if (finalByte == 'u')
    {
        auto const keycode = params.empty() ? 0 : params[0];
        switch (keycode)
        {
            case 13: events.emplace_back(KeyEvent { .key = KeyCode::Enter, .modifiers = modifiers }); return;
            case 9: events.emplace_back(KeyEvent { .key = KeyCode::Tab, .modifiers = modifiers }); return;
            case 127: events.emplace_back(KeyEvent { .key = KeyCode::Backspace, .modifiers = modifiers }); return;
            case 27: events.emplace_back(KeyEvent { .key = KeyCode::Escape, .modifiers = modifiers }); return;
            default: break;
        }
        if (keycode >= 32 && keycode < 0x10000)
            events.emplace_back(charKey(static_cast<char32_t>(keycode), modifiers));
        return;
    }

    if (finalByte == '~')
    {
        if (auto const key = tildeKey(params.empty() ? 0 : params[0]))
            events.emplace_back(KeyEvent { .key = *key, .modifiers = modifiers });
        return;
    }

    if (auto const key = cursorKey(finalByte))
        events.emplace_back(KeyEvent { .key = *key, .modifiers = modifiers });
}

} // namespace llmtui::tui
