// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>

#include <array>
#include <cstdint>
#include <cstdlib>
#include <format>

#include <tui/Clipboard.hpp>

namespace llmtui::tui
{

namespace
{
    constexpr auto Alphabet = std::string_view { "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/" };

    auto isDisabled() -> bool
    {
        auto const* value = std::getenv(DisableOsc52EnvVar);
        return value != nullptr && *value != '\0';
    }
} // namespace

auto base64Encode(std::string_view data) -> std::string
{
    auto result = std::string {};
    result.reserve(((data.size() + 2) / 3) * 4);

    auto i = std::size_t { 0 };
    for (; i + 3 <= data.size(); i += 3)
    {
        auto const chunk = (static_cast<std::uint32_t>(static_cast<std::uint8_t>(data[i])) << 16)
                           | (static_cast<std::uint32_t>(static_cast<std::uint8_t>(data[i + 1])) << 8)
                           | static_cast<std::uint32_t>(static_cast<std::uint8_t>(data[i + 2]));
        result += Alphabet[(chunk >> 18) & 0x3F];
        result += Alphabet[(chunk >> 12) & 0x3F];
        result += Alphabet[(chunk >> 6) & 0x3F];
        result += Alphabet[chunk & 0x3F];
    }

    auto const rest = data.size() - i;
    if (rest == 0)
        return result;

    auto chunk = static_cast<std::uint32_t>(static_cast<std::uint8_t>(data[i])) << 16;
    if (rest == 2)
        chunk |= static_cast<std::uint32_t>(static_cast<std::uint8_t>(data[i + 1])) << 8;

    result += Alphabet[(chunk >> 18) & 0x3F];
    result += Alphabet[(chunk >> 12) & 0x3F];
    result += rest == 2 ? Alphabet[(chunk >> 6) & 0x3F] : '=';
    result += '=';
    return result;
}

auto osc52Sequence(std::string_view text) -> std::string
{
    return std::format("\033]52;c;{}\a", base64Encode(text));
}

auto Clipboard::copy(std::string_view text) -> VoidResult
{
    if (isDisabled())
        return makeError(ErrorCode::IoError, std::format("clipboard disabled by {}", DisableOsc52EnvVar));

    if (text.size() > MaxPayload)
        return makeError(ErrorCode::IoError,
                         std::format("message too large for the clipboard ({} bytes)", text.size()));

    _output.writeRaw(osc52Sequence(text));
    if (auto result = _output.flush(); !result)
        return result;

    log::debug("Copied {} bytes to the clipboard", text.size());
    return {};
}

} // namespace llmtui::tui
