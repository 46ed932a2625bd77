// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <cstddef>
#include <string>
#include <string_view>

#include <tui/TerminalOutput.hpp>

namespace llmtui::tui
{

/// @brief Environment variable that, when set to a non-empty value, disables clipboard writes.
constexpr auto DisableOsc52EnvVar = "LLMTUI_DISABLE_OSC52";

/// @brief Standard (RFC 4648) base64 encoding with padding.
[[nodiscard]] auto base64Encode(std::string_view data) -> std::string;

/// @brief Builds the OSC 52 sequence that sets the system clipboard to @p text.
[[nodiscard]] auto osc52Sequence(std::string_view text) -> std::string;

/// @brief Copies text to the system clipboard through the terminal (OSC 52).
///
/// Works over SSH and inside multiplexers that forward OSC 52. Whether the
/// terminal honours the request cannot be observed; only local write errors
/// are reported.
class Clipboard
{
  public:
    explicit Clipboard(TerminalOutput& output): _output(output) {}

    /// @brief Writes @p text to the clipboard.
    /// @return IoError if clipboard writes are disabled or the terminal write fails.
    [[nodiscard]] auto copy(std::string_view text) -> VoidResult;

    /// @brief Largest payload accepted, in bytes before encoding.
    static constexpr std::size_t MaxPayload = 100'000;

  private:
    TerminalOutput& _output;
};

} // namespace llmtui::tui
