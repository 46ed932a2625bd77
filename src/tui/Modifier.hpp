// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstdint>

namespace llmtui::tui
{

/// @brief Bitmask enumeration for keyboard modifier keys.
enum class Modifier : std::uint8_t
{
    None = 0,
    Shift = 1 << 0,
    Alt = 1 << 1,
    Ctrl = 1 << 2,
    Super = 1 << 3,
};

[[nodiscard]] constexpr auto operator|(Modifier lhs, Modifier rhs) noexcept -> Modifier
{
    return static_cast<Modifier>(static_cast<std::uint8_t>(lhs) | static_cast<std::uint8_t>(rhs));
}

[[nodiscard]] constexpr auto operator&(Modifier lhs, Modifier rhs) noexcept -> Modifier
{
    return static_cast<Modifier>(static_cast<std::uint8_t>(lhs) & static_cast<std::uint8_t>(rhs));
}

constexpr auto operator|=(Modifier& lhs, Modifier rhs) noexcept -> Modifier&
{
    lhs = lhs | rhs;
    return lhs;
}

/// @brief Tests whether a modifier flag is set.
[[nodiscard]] constexpr auto hasModifier(Modifier mods, Modifier flag) noexcept -> bool
{
    return (mods & flag) != Modifier::None;
}

/// @brief Decodes the xterm/Kitty modifier parameter (1 + bitmask) into a Modifier.
[[nodiscard]] constexpr auto decodeModifierParam(int param) noexcept -> Modifier
{
    if (param <= 1)
        return Modifier::None;
    auto const bits = param - 1;
    auto mods = Modifier::None;
    if (bits & 1)
        mods |= Modifier::Shift;
    if (bits & 2)
        mods |= Modifier::Alt;
    if (bits & 4)
        mods |= Modifier::Ctrl;
    if (bits & 8)
        mods |= Modifier::Super;
    return mods;
}

} // namespace llmtui::tui
