// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <expected>
#include <format>
#include <string>
#include <string_view>

namespace meetlink
{

/// @brief Error codes for categorizing failures across the session core.
enum class ErrorCode
{
    Unknown,
    InvalidArgument,
    IoError,
    ConfigError,
    CaptureError,   ///< Audio device unavailable or failed.
    PlaybackError,  ///< Response audio could not be decoded or played.
    TransportError, ///< Connection refused, dropped, or not open.
    ParseError,     ///< Malformed inbound message.
    StateError,     ///< Operation not valid in the current lifecycle state.
    AlreadyActive,  ///< start() while a session is already running.
};

/// @brief Returns a short, stable name for an error code (used in log output).
[[nodiscard]] constexpr auto errorCodeName(ErrorCode code) -> std::string_view
{
    switch (code)
    {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::IoError: return "IoError";
        case ErrorCode::ConfigError: return "ConfigError";
        case ErrorCode::CaptureError: return "CaptureError";
        case ErrorCode::PlaybackError: return "PlaybackError";
        case ErrorCode::TransportError: return "TransportError";
        case ErrorCode::ParseError: return "ParseError";
        case ErrorCode::StateError: return "StateError";
        case ErrorCode::AlreadyActive: return "AlreadyActive";
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

} // namespace meetlink

template <>
struct std::formatter<meetlink::Error>: std::formatter<std::string>
{
    auto format(const meetlink::Error& error, auto& ctx) const
    {
        return std::formatter<std::string>::format(
            std::format("[{}] {}", meetlink::errorCodeName(error.code), error.message), ctx);
    }
};
