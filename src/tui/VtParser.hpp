// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <tui/InputEvent.hpp>

namespace llmtui::tui
{

/// @brief Feed-based incremental state machine for parsing VT keyboard input.
///
/// Accepts raw bytes from stdin via feed() and produces InputEvent objects.
/// Handles cursor-key CSI and SS3 sequences, CSI u (Kitty keyboard protocol),
/// bracketed paste and UTF-8 multi-byte sequences. A bare ESC is ambiguous
/// until timeout() resolves it.
class VtParser
{
  public:
    /// @brief Feeds raw bytes and produces zero or more parsed events.
    [[nodiscard]] auto feed(std::string_view data) -> std::vector<InputEvent>;

    /// @brief Call after a poll timeout with no new data.
    ///
    /// Resolves a pending bare ESC into an Escape key event.
    [[nodiscard]] auto timeout() -> std::vector<InputEvent>;

  private:
    enum class State : std::uint8_t
    {
        Ground,
        Escape,
        Csi,
        Ss3,
        PasteBody,
        Utf8Sequence,
    };

    State _state = State::Ground;
    std::string _paramBuf;
    std::string _utf8Buf;
    std::string _pasteBuf;
    int _utf8Remaining = 0;

    void processGround(std::uint8_t byte, std::vector<InputEvent>& events);
    void processEscape(std::uint8_t byte, std::vector<InputEvent>& events);
    void processCsi(std::uint8_t byte, std::vector<InputEvent>& events);
    void processSs3(std::uint8_t byte, std::vector<InputEvent>& events);
    void processPaste(std::uint8_t byte, std::vector<InputEvent>& events);
    void processUtf8(std::uint8_t byte, std::vector<InputEvent>& events);

    /// @brief Interprets a complete CSI sequence from _paramBuf and its final byte.
    void dispatchCsi(char finalByte, std::vector<InputEvent>& events);
};

} // namespace llmtui::tui
