// SPDX-License-Identifier: Apache-2.0
#include <cctype>
#include <string>
#include <string_view>

#include <libunicode/utf8_grapheme_segmenter.h>
#include <tui/InputField.hpp>
#include <tui/Text.hpp>

namespace llmtui::tui
{

namespace
{
    /// @brief Advances past one UTF-8 codepoint.
    auto nextUtf8(std::string_view s, std::size_t pos) -> std::size_t
    {
        if (pos >= s.size())
            return pos;
        ++pos;
        while (pos < s.size() && (static_cast<unsigned char>(s[pos]) & 0xC0) == 0x80)
            ++pos;
        return pos;
    }

    auto isWordChar(char c) -> bool
    {
        auto const uc = static_cast<unsigned char>(c);
        return uc >= 0x80 || std::isalnum(uc) != 0 || c == '_';
    }
} // namespace

auto encodeUtf8(char32_t cp) -> std::string
{
    auto result = std::string {};
    if (cp < 0x80)
    {
        result += static_cast<char>(cp);
    }
    else if (cp < 0x800)
    {
        result += static_cast<char>(0xC0 | (cp >> 6));
        result += static_cast<char>(0x80 | (cp & 0x3F));
    }
    else if (cp < 0x10000)
    {
        result += static_cast<char>(0xE0 | (cp >> 12));
        result += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        result += static_cast<char>(0x80 | (cp & 0x3F));
    }
    else if (cp < 0x110000)
    {
        result += static_cast<char>(0xF0 | (cp >> 18));
        result += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        result += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        result += static_cast<char>(0x80 | (cp & 0x3F));
    }
    return result;
}

auto InputField::processEvent(InputEvent const& event) -> InputFieldAction
{
    if (auto const* key = std::get_if<KeyEvent>(&event))
        return handleKey(*key);

    if (auto const* paste = std::get_if<PasteEvent>(&event))
    {
        auto text = paste->text;
        for (auto& ch: text)
            if (ch == '\n' || ch == '\r' || ch == '\t')
                ch = ' ';
        insertText(text);
        return InputFieldAction::Changed;
    }

    return InputFieldAction::None;
}

auto InputField::cursorColumn() const -> int
{
    return displayWidth(std::string_view { _buffer }.substr(0, _cursor));
}

void InputField::clear()
{
    _buffer.clear();
    _cursor = 0;
    _historyIndex = _history.size();
}

void InputField::setText(std::string_view text)
{
    _buffer = std::string(text);
    _cursor = _buffer.size();
}

void InputField::addHistory(std::string entry)
{
    if (entry.empty())
        return;
    if (!_history.empty() && _history.back() == entry)
    {
        _historyIndex = _history.size();
        return;
    }
    _history.push_back(std::move(entry));
    if (_history.size() > _maxHistory)
        _history.erase(_history.begin());
    _historyIndex = _history.size();
}

void InputField::setMaxHistory(std::size_t n)
{
    _maxHistory = n;
    while (_history.size() > _maxHistory)
        _history.erase(_history.begin());
    _historyIndex = _history.size();
}

auto InputField::handleKey(KeyEvent const& key) -> InputFieldAction
{
    auto const ctrl = hasModifier(key.modifiers, Modifier::Ctrl);
    auto const alt = hasModifier(key.modifiers, Modifier::Alt);

    switch (key.key)
    {
        case KeyCode::Backspace:
            if (ctrl || alt)
                killWordBackward();
            else
                deleteCharBackward();
            return InputFieldAction::Changed;
        case KeyCode::Delete: deleteChar(); return InputFieldAction::Changed;
        case KeyCode::Up: historyPrev(); return InputFieldAction::Changed;
        case KeyCode::Down: historyNext(); return InputFieldAction::Changed;
        case KeyCode::Left:
            if (ctrl)
                moveBackwardWord();
            else
                _cursor = prevGraphemeCluster(_cursor);
            return InputFieldAction::Changed;
        case KeyCode::Right:
            if (ctrl)
                moveForwardWord();
            else
                _cursor = nextGraphemeCluster(_cursor);
            return InputFieldAction::Changed;
        case KeyCode::Home: _cursor = 0; return InputFieldAction::Changed;
        case KeyCode::End: _cursor = _buffer.size(); return InputFieldAction::Changed;
        default: break;
    }

    if (ctrl && key.codepoint != 0)
    {
        switch (key.codepoint)
        {
            case 'a': _cursor = 0; return InputFieldAction::Changed;
            case 'e': _cursor = _buffer.size(); return InputFieldAction::Changed;
            case 'b': _cursor = prevGraphemeCluster(_cursor); return InputFieldAction::Changed;
            case 'f': _cursor = nextGraphemeCluster(_cursor); return InputFieldAction::Changed;
            case 'k': killToEnd(); return InputFieldAction::Changed;
            case 'u': killToStart(); return InputFieldAction::Changed;
            case 'w': killWordBackward(); return InputFieldAction::Changed;
            case 'd': deleteChar(); return InputFieldAction::Changed;
            default: return InputFieldAction::None;
        }
    }

    if (alt && key.codepoint != 0)
    {
        switch (key.codepoint)
        {
            case 'b': moveBackwardWord(); return InputFieldAction::Changed;
            case 'f': moveForwardWord(); return InputFieldAction::Changed;
            default: return InputFieldAction::None;
        }
    }

    if (isPrintable(key.key))
    {
        auto const cp = key.codepoint != 0 ? key.codepoint : codepointFromKeyCode(key.key);
        insertText(encodeUtf8(cp));
        return InputFieldAction::Changed;
    }

    return InputFieldAction::None;
}

void InputField::insertText(std::string_view text)
{
    _buffer.insert(_cursor, text);
    _cursor += text.size();
}

void InputField::deleteChar()
{
    if (_cursor >= _buffer.size())
        return;
    auto const next = nextGraphemeCluster(_cursor);
    _buffer.erase(_cursor, next - _cursor);
}

void InputField::deleteCharBackward()
{
    if (_cursor == 0)
        return;
    auto const prev = prevGraphemeCluster(_cursor);
    _buffer.erase(prev, _cursor - prev);
    _cursor = prev;
}

void InputField::killToEnd()
{
    _buffer.erase(_cursor);
}

void InputField::killToStart()
{
    _buffer.erase(0, _cursor);
    _cursor = 0;
}

void InputField::killWordBackward()
{
    auto const end = _cursor;
    moveBackwardWord();
    _buffer.erase(_cursor, end - _cursor);
}

void InputField::moveForwardWord()
{
    while (_cursor < _buffer.size() && !isWordChar(_buffer[_cursor]))
        ++_cursor;
    while (_cursor < _buffer.size() && isWordChar(_buffer[_cursor]))
        ++_cursor;
}

void InputField::moveBackwardWord()
{
    while (_cursor > 0 && !isWordChar(_buffer[_cursor - 1]))
        --_cursor;
    while (_cursor > 0 && isWordChar(_buffer[_cursor - 1]))
        --_cursor;
}

void InputField::historyPrev()
{
    if (_history.empty() || _historyIndex == 0)
        return;
    if (_historyIndex == _history.size())
        _savedLine = _buffer;
    --_historyIndex;
    setText(_history[_historyIndex]);
}

void InputField::historyNext()
{
    if (_historyIndex >= _history.size())
        return;
    ++_historyIndex;
    setText(_historyIndex == _history.size() ? _savedLine : _history[_historyIndex]);
}

auto InputField::nextGraphemeCluster(std::size_t pos) const -> std::size_t
{
    if (pos >= _buffer.size())
        return _buffer.size();

    // The iterator's _clusterStart points into the segmented string_view.
    auto const sv = std::string_view(_buffer).substr(pos);
    auto segmenter = unicode::utf8_grapheme_segmenter(sv);
    auto it = segmenter.begin();
    if (it == segmenter.end())
        return nextUtf8(_buffer, pos);

    ++it;
    if (it != segmenter.end())
        return pos + static_cast<std::size_t>(it._clusterStart - sv.data());
    return _buffer.size();
}

auto InputField::prevGraphemeCluster(std::size_t pos) const -> std::size_t
{
    if (pos == 0)
        return 0;

    auto const sv = std::string_view(_buffer).substr(0, pos);
    auto segmenter = unicode::utf8_grapheme_segmenter(sv);

    auto lastBoundary = std::size_t { 0 };
    for (auto it = segmenter.begin(); it != segmenter.end(); ++it)
        lastBoundary = static_cast<std::size_t>(it._clusterStart - sv.data());
    return lastBoundary;
}

} // namespace llmtui::tui
