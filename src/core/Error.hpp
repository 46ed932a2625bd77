// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <expected>
#include <format>
#include <string>
#include <string_view>

namespace llmtui
{

/// @brief Error codes for categorizing failures across the application.
enum class ErrorCode
{
    Unknown,
    InvalidArgument,
    IoError,
    ConfigError,
    SpawnFailure,
    StreamFailure,
    MalformedRemoteCommand,
    UnknownMessageTarget,
    ListenerBindFailure,
    ConversationBusy,
    UnknownModel,
    TimeoutError,
    TerminalError,
};

/// @brief Returns a short, stable name for the given error code.
[[nodiscard]] constexpr auto errorCodeName(ErrorCode code) noexcept -> std::string_view
{
    switch (code)
    {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::IoError: return "IoError";
        case ErrorCode::ConfigError: return "ConfigError";
        case ErrorCode::SpawnFailure: return "SpawnFailure";
        case ErrorCode::StreamFailure: return "StreamFailure";
        case ErrorCode::MalformedRemoteCommand: return "MalformedRemoteCommand";
        case ErrorCode::UnknownMessageTarget: return "UnknownMessageTarget";
        case ErrorCode::ListenerBindFailure: return "ListenerBindFailure";
        case ErrorCode::ConversationBusy: return "ConversationBusy";
        case ErrorCode::UnknownModel: return "UnknownModel";
        case ErrorCode::TimeoutError: return "TimeoutError";
        case ErrorCode::TerminalError: return "TerminalError";
    }
    return "Unknown";
}

/// @brief Represents an error with a code and descriptive message.
struct Error
{
    ErrorCode code = ErrorCode::Unknown;
    std::string message;
};

/// @brief Result type for operations that return a value or an error.
/// @tparam T The success value type.
template <typename T>
using Result = std::expected<T, Error>;

/// @brief Result type for operations that return no value on success.
using VoidResult = std::expected<void, Error>;

/// @brief Creates an unexpected Error value for use with std::expected.
/// @param code The error code.
/// @param message A descriptive error message.
/// @return An unexpected Error.
[[nodiscard]] inline auto makeError(ErrorCode code, std::string message) -> std::unexpected<Error>
{
    return std::unexpected<Error>(Error { code, std::move(message) });
}

} // namespace llmtui

template <>
struct std::formatter<llmtui::Error>: std::formatter<std::string>
{
    auto format(const llmtui::Error& error, auto& ctx) const
    {
        return std::formatter<std::string>::format(
            std::format("[{}] {}", llmtui::errorCodeName(error.code), error.message), ctx);
    }
};
