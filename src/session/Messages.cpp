// SPDX-License-Identifier: Apache-2.0
#include "Messages.hpp"

#include <core/Base64.hpp>
#include <core/JsonUtils.hpp>

#include <format>

namespace meetlink::messages
{

namespace
{

    auto expectType(const TypedMessage& message, std::string_view type) -> VoidResult
    {
        if (message.type != type)
            return makeError(ErrorCode::ParseError,
                             std::format("Expected message type '{}', got '{}'", type, message.type));
        return {};
    }

    auto optionalFloat(const nlohmann::json& payload, std::string_view key) -> std::optional<float>
    {
        auto const it = payload.find(std::string(key));
        if (it != payload.end() && it->is_number())
            return it->get<float>();
        return std::nullopt;
    }

} // namespace

auto parseMessage(std::string_view text) -> Result<TypedMessage>
{
    auto parsed = json::parse(text);
    if (!parsed)
        return std::unexpected(parsed.error());

    if (!parsed->is_object())
        return makeError(ErrorCode::ParseError, "Message is not a JSON object");

    auto type = json::getString(*parsed, "type");
    if (!type)
        return std::unexpected(type.error());

    auto message = TypedMessage { .type = std::move(*type), .payload = std::move(*parsed) };
    message.payload.erase("type");
    return message;
}

auto serialize(const TypedMessage& message) -> std::string
{
    auto wire = message.payload.is_object() ? message.payload : nlohmann::json::object();
    wire["type"] = message.type;
    // Invalid UTF-8 in a string field becomes U+FFFD instead of throwing on the capture thread.
    return wire.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

auto makeAudioChunk(const AudioChunk& chunk) -> TypedMessage
{
    auto payload = nlohmann::json {
        { "data", base64::encode(chunk.payload) },
        { "timestamp", chunk.capturedAtMs },
        { "sequence", chunk.sequenceId },
    };

    if (chunk.speakerHint)
        payload["speaker"] = *chunk.speakerHint;

    return TypedMessage { .type = std::string(AudioChunkType), .payload = std::move(payload) };
}

auto makeControl(ControlAction action) -> TypedMessage
{
    return TypedMessage {
        .type = std::string(ControlType),
        .payload = { { "action", controlActionToString(action) } },
    };
}

auto decodeTranscriptUpdate(const TypedMessage& message) -> Result<TranscriptUpdate>
{
    if (auto result = expectType(message, TranscriptUpdateType); !result)
        return std::unexpected(result.error());

    auto transcript = json::getString(message.payload, "transcript");
    if (!transcript)
        return std::unexpected(transcript.error());

    return TranscriptUpdate {
        .transcript = std::move(*transcript),
        .confidence = optionalFloat(message.payload, "confidence"),
        .timestamp = json::getInt64Or(message.payload, "timestamp", 0),
    };
}

auto decodeAiResponse(const TypedMessage& message) -> Result<AiResponse>
{
    if (auto result = expectType(message, AiResponseType); !result)
        return std::unexpected(result.error());

    auto aiText = json::getString(message.payload, "ai_text");
    if (!aiText)
        return std::unexpected(aiText.error());

    auto response = AiResponse {
        .aiText = std::move(*aiText),
        .transcript = json::getStringOr(message.payload, "transcript", ""),
        .audioData = std::nullopt,
        .confidence = optionalFloat(message.payload, "confidence"),
    };

    if (auto encoded = json::getOptionalString(message.payload, "audio_data"); encoded && !encoded->empty())
    {
        auto audio = base64::decode(*encoded);
        if (!audio)
            return makeError(ErrorCode::ParseError, std::format("Invalid audio_data: {}", audio.error().message));
        response.audioData = std::move(*audio);
    }

    return response;
}

auto decodeStatus(const TypedMessage& message) -> Result<StatusUpdate>
{
    if (auto result = expectType(message, StatusType); !result)
        return std::unexpected(result.error());

    auto status = json::getString(message.payload, "status");
    if (!status)
        return std::unexpected(status.error());

    auto update = StatusUpdate { .status = std::move(*status) };
    if (auto const it = message.payload.find("details"); it != message.payload.end() && it->is_object())
        update.details = *it;
    return update;
}

auto decodeControlResponse(const TypedMessage& message) -> Result<ControlResponse>
{
    if (auto result = expectType(message, ControlResponseType); !result)
        return std::unexpected(result.error());

    return ControlResponse {
        .status = json::getStringOr(message.payload, "status", "unknown"),
        .action = json::getStringOr(message.payload, "action", ""),
    };
}

auto decodeError(const TypedMessage& message) -> Result<ErrorNotice>
{
    if (auto result = expectType(message, ErrorType); !result)
        return std::unexpected(result.error());

    return ErrorNotice {
        .message = json::getStringOr(message.payload, "message", "Unknown error"),
        .code = json::getOptionalString(message.payload, "code"),
    };
}

} // namespace meetlink::messages
