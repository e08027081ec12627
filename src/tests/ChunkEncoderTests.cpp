// SPDX-License-Identifier: Apache-2.0
#include <audio/ChunkEncoder.hpp>

#include <catch2/catch_test_macros.hpp>

#include <vector>

using namespace meetlink;

namespace
{

    auto hundredMsEncoder(std::optional<std::string> speaker = std::nullopt) -> ChunkEncoder
    {
        return ChunkEncoder { ChunkEncoderConfig {
            .sampleRate = 16000,
            .chunkDurationMs = 100,
            .speakerHint = std::move(speaker),
        } };
    }

} // namespace

TEST_CASE("ChunkEncoder derives the slice size from rate and duration", "[encoder]")
{
    CHECK(hundredMsEncoder().samplesPerChunk() == 1600);
    CHECK(ChunkEncoder {}.samplesPerChunk() == 16000);
}

TEST_CASE("ChunkEncoder::encode writes clamped PCM16LE", "[encoder]")
{
    auto const encoder = hundredMsEncoder();
    auto const samples = std::vector<float> { 0.0f, 1.0f, -1.0f, 2.0f };

    auto chunk = encoder.encode(samples, 7, 1234);
    REQUIRE(chunk.has_value());

    CHECK(chunk->sequenceId == 7);
    CHECK(chunk->capturedAtMs == 1234);
    CHECK(chunk->sampleCount() == 4);

    auto const expected = std::vector<std::byte> {
        std::byte { 0x00 }, std::byte { 0x00 }, // 0
        std::byte { 0xFF }, std::byte { 0x7F }, // +32767
        std::byte { 0x01 }, std::byte { 0x80 }, // -32767
        std::byte { 0xFF }, std::byte { 0x7F }, // clamped
    };
    CHECK(chunk->payload == expected);
}

TEST_CASE("ChunkEncoder::encode rejects an empty slice", "[encoder]")
{
    auto result = hundredMsEncoder().encode({}, 0, 0);
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::InvalidArgument);
}

TEST_CASE("ChunkEncoder::feed emits fixed-size chunks in sequence", "[encoder]")
{
    auto encoder = hundredMsEncoder("alice");

    CHECK(encoder.feed(std::vector<float>(1000, 0.25f), 500).empty());
    CHECK(encoder.pendingSamples() == 1000);

    auto const chunks = encoder.feed(std::vector<float>(2500, 0.25f), 1000);
    REQUIRE(chunks.size() == 2);
    CHECK(encoder.pendingSamples() == 300);

    CHECK(chunks[0].sequenceId == 0);
    CHECK(chunks[1].sequenceId == 1);
    CHECK(chunks[0].sampleCount() == 1600);
    CHECK(chunks[0].durationMs() == 100);

    // Timestamps count back from the newest sample.
    CHECK(chunks[0].capturedAtMs == 1000 - 218);
    CHECK(chunks[1].capturedAtMs == 1000 - 118);
    CHECK(chunks[0].capturedAtMs < chunks[1].capturedAtMs);

    CHECK(chunks[0].speakerHint == std::optional<std::string> { "alice" });
    CHECK(encoder.nextSequenceId() == 2);
}

TEST_CASE("ChunkEncoder::flush emits the partial slice once", "[encoder]")
{
    auto encoder = hundredMsEncoder();
    CHECK(!encoder.flush(0).has_value());

    CHECK(encoder.feed(std::vector<float>(800, 0.5f), 2000).empty());

    auto const tail = encoder.flush(2000);
    REQUIRE(tail.has_value());
    CHECK(tail->sampleCount() == 800);
    CHECK(tail->sequenceId == 0);
    CHECK(tail->capturedAtMs == 1950);

    CHECK(!encoder.flush(2100).has_value());
}

TEST_CASE("ChunkEncoder discards and resets", "[encoder]")
{
    auto encoder = hundredMsEncoder();
    CHECK(encoder.feed(std::vector<float>(2000, 0.1f), 100).size() == 1);

    SECTION("discardPending drops buffered samples but keeps the sequence")
    {
        encoder.discardPending();
        CHECK(encoder.pendingSamples() == 0);
        CHECK(encoder.nextSequenceId() == 1);
    }

    SECTION("reset restarts the sequence")
    {
        encoder.reset();
        CHECK(encoder.pendingSamples() == 0);
        CHECK(encoder.nextSequenceId() == 0);
    }
}
