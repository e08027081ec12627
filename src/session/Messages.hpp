// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace meetlink::messages
{

// Outbound message types.
inline constexpr std::string_view AudioChunkType = "audio_chunk";
inline constexpr std::string_view ControlType = "control";

// Inbound message types.
inline constexpr std::string_view TranscriptUpdateType = "transcript_update";
inline constexpr std::string_view AiResponseType = "ai_response";
inline constexpr std::string_view StatusType = "status";
inline constexpr std::string_view ControlResponseType = "control_response";
inline constexpr std::string_view ErrorType = "error";

enum class ControlAction : std::uint8_t
{
    Mute,
    Unmute,
    Pause,
    Resume,
};

[[nodiscard]] constexpr auto controlActionToString(ControlAction action) -> std::string_view
{
    switch (action)
    {
        case ControlAction::Mute: return "mute";
        case ControlAction::Unmute: return "unmute";
        case ControlAction::Pause: return "pause";
        case ControlAction::Resume: return "resume";
    }
    return "unknown";
}

struct TranscriptUpdate
{
    std::string transcript;
    std::optional<float> confidence;
    int64_t timestamp = 0;
};

struct AiResponse
{
    std::string aiText;
    std::string transcript;
    std::optional<std::vector<std::byte>> audioData; ///< Encoded (MP3 or WAV) speech.
    std::optional<float> confidence;
};

struct StatusUpdate
{
    std::string status;
    nlohmann::json details = nlohmann::json::object();
};

struct ControlResponse
{
    std::string status;
    std::string action;
};

struct ErrorNotice
{
    std::string message;
    std::optional<std::string> code;
};

/// @brief Parses one text frame into a typed message.
///
/// The wire form is a flat JSON object whose `type` member names the message and whose
/// remaining members become the payload.
/// @return The message, or a ParseError for malformed JSON, a non-object root or a missing `type`.
[[nodiscard]] auto parseMessage(std::string_view text) -> Result<TypedMessage>;

/// @brief Serializes a message into its flat JSON wire form.
[[nodiscard]] auto serialize(const TypedMessage& message) -> std::string;

/// @brief Builds an `audio_chunk` message carrying the chunk as base64 PCM16LE.
[[nodiscard]] auto makeAudioChunk(const AudioChunk& chunk) -> TypedMessage;

/// @brief Builds a `control` message.
[[nodiscard]] auto makeControl(ControlAction action) -> TypedMessage;

[[nodiscard]] auto decodeTranscriptUpdate(const TypedMessage& message) -> Result<TranscriptUpdate>;

/// @brief Decodes an `ai_response`; a malformed `audio_data` field is a ParseError.
[[nodiscard]] auto decodeAiResponse(const TypedMessage& message) -> Result<AiResponse>;

[[nodiscard]] auto decodeStatus(const TypedMessage& message) -> Result<StatusUpdate>;
[[nodiscard]] auto decodeControlResponse(const TypedMessage& message) -> Result<ControlResponse>;
[[nodiscard]] auto decodeError(const TypedMessage& message) -> Result<ErrorNotice>;

} // namespace meetlink::messages
