// SPDX-License-Identifier: Apache-2.0
#include <core/Base64.hpp>
#include <session/Messages.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using namespace meetlink;

TEST_CASE("parseMessage splits the type from the payload", "[messages]")
{
    auto message = messages::parseMessage(R"({"type":"transcript_update","transcript":"hello","confidence":0.9})");
    REQUIRE(message.has_value());
    CHECK(message->type == "transcript_update");
    CHECK(!message->payload.contains("type"));
    CHECK(message->payload["transcript"] == "hello");
}

TEST_CASE("parseMessage rejects malformed frames", "[messages]")
{
    SECTION("invalid JSON")
    {
        auto result = messages::parseMessage("{not json");
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ParseError);
    }

    SECTION("non-object root")
    {
        auto result = messages::parseMessage("[1,2,3]");
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ParseError);
    }

    SECTION("missing type")
    {
        auto result = messages::parseMessage(R"({"transcript":"hello"})");
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ParseError);
    }

    SECTION("non-string type")
    {
        auto result = messages::parseMessage(R"({"type":42})");
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ParseError);
    }
}

TEST_CASE("serialize produces the flat wire form", "[messages]")
{
    auto const text = messages::serialize(messages::makeControl(messages::ControlAction::Pause));
    auto const wire = nlohmann::json::parse(text);
    CHECK(wire["type"] == "control");
    CHECK(wire["action"] == "pause");
    CHECK(wire.size() == 2);
}

TEST_CASE("makeAudioChunk carries base64 PCM, timestamp, sequence and speaker", "[messages]")
{
    auto chunk = AudioChunk {
        .sequenceId = 12,
        .capturedAtMs = 1700000000123,
        .payload = { std::byte { 0x01 }, std::byte { 0x02 }, std::byte { 0x03 }, std::byte { 0x04 } },
        .speakerHint = std::nullopt,
        .sampleRate = 16000,
    };

    auto message = messages::makeAudioChunk(chunk);
    CHECK(message.type == "audio_chunk");
    CHECK(message.payload["data"] == base64::encode(chunk.payload));
    CHECK(message.payload["timestamp"] == 1700000000123);
    CHECK(message.payload["sequence"] == 12);
    CHECK(!message.payload.contains("speaker"));

    chunk.speakerHint = "alice";
    CHECK(messages::makeAudioChunk(chunk).payload["speaker"] == "alice");
}

TEST_CASE("decodeTranscriptUpdate reads the transcript fields", "[messages]")
{
    auto message = messages::parseMessage(R"({"type":"transcript_update","transcript":"hi there","timestamp":1500})");
    REQUIRE(message.has_value());

    auto update = messages::decodeTranscriptUpdate(*message);
    REQUIRE(update.has_value());
    CHECK(update->transcript == "hi there");
    CHECK(update->timestamp == 1500);
    CHECK(!update->confidence.has_value());

    auto wrongType = messages::decodeTranscriptUpdate(TypedMessage { .type = "status" });
    CHECK(!wrongType.has_value());
}

TEST_CASE("decodeAiResponse decodes optional audio", "[messages]")
{
    auto message = TypedMessage {
        .type = "ai_response",
        .payload = {
            { "ai_text", "Sounds good." },
            { "transcript", "shall we start" },
            { "audio_data", "AAEC" },
            { "confidence", 0.8 },
        },
    };

    auto response = messages::decodeAiResponse(message);
    REQUIRE(response.has_value());
    CHECK(response->aiText == "Sounds good.");
    CHECK(response->transcript == "shall we start");
    REQUIRE(response->audioData.has_value());
    auto const expectedAudio = std::vector<std::byte> { std::byte { 0x00 }, std::byte { 0x01 }, std::byte { 0x02 } };
    CHECK(*response->audioData == expectedAudio);
    REQUIRE(response->confidence.has_value());
    CHECK(*response->confidence > 0.79f);

    SECTION("null audio is absent")
    {
        message.payload["audio_data"] = nullptr;
        auto withoutAudio = messages::decodeAiResponse(message);
        REQUIRE(withoutAudio.has_value());
        CHECK(!withoutAudio->audioData.has_value());
    }

    SECTION("corrupt audio is a parse error")
    {
        message.payload["audio_data"] = "@@@@";
        auto corrupt = messages::decodeAiResponse(message);
        REQUIRE(!corrupt.has_value());
        CHECK(corrupt.error().code == ErrorCode::ParseError);
    }

    SECTION("missing text is a parse error")
    {
        message.payload.erase("ai_text");
        CHECK(!messages::decodeAiResponse(message).has_value());
    }
}

TEST_CASE("decode status, control_response and error", "[messages]")
{
    auto status = messages::decodeStatus(TypedMessage {
        .type = "status",
        .payload = { { "status", "processing" }, { "details", { { "queue", 2 } } } },
    });
    REQUIRE(status.has_value());
    CHECK(status->status == "processing");
    CHECK(status->details["queue"] == 2);

    auto control = messages::decodeControlResponse(TypedMessage {
        .type = "control_response",
        .payload = { { "action", "mute" }, { "status", "success" } },
    });
    REQUIRE(control.has_value());
    CHECK(control->action == "mute");
    CHECK(control->status == "success");

    auto error = messages::decodeError(TypedMessage {
        .type = "error",
        .payload = { { "message", "transcriber unavailable" }, { "code", nullptr } },
    });
    REQUIRE(error.has_value());
    CHECK(error->message == "transcriber unavailable");
    CHECK(!error->code.has_value());
}

TEST_CASE("serialize replaces invalid UTF-8 instead of throwing", "[messages]")
{
    auto const chunk = AudioChunk {
        .sequenceId = 1,
        .capturedAtMs = 10,
        .payload = std::vector<std::byte>(4, std::byte { 0 }),
        .speakerHint = std::string("bad\xff"),
        .sampleRate = 16000,
    };

    auto text = std::string {};
    CHECK_NOTHROW(text = messages::serialize(messages::makeAudioChunk(chunk)));

    auto parsed = messages::parseMessage(text);
    REQUIRE(parsed.has_value());
    CHECK(parsed->payload["speaker"] == "bad\xEF\xBF\xBD");
}
