// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace meetlink
{

/// @brief A time-bounded slice of encoded audio (16-bit little-endian PCM, mono).
///
/// Immutable once produced by the ChunkEncoder.
struct AudioChunk
{
    uint64_t sequenceId = 0;
    int64_t capturedAtMs = 0;
    std::vector<std::byte> payload;
    std::optional<std::string> speakerHint;
    uint32_t sampleRate = 16000;

    /// @brief Number of PCM samples carried by the payload.
    [[nodiscard]] auto sampleCount() const noexcept -> std::size_t { return payload.size() / 2; }

    /// @brief Duration of the chunk in milliseconds.
    [[nodiscard]] auto durationMs() const noexcept -> int64_t
    {
        return sampleRate == 0 ? 0 : static_cast<int64_t>(sampleCount()) * 1000 / sampleRate;
    }
};

/// @brief Normalized activity signal for one analyzed frame.
struct ActivityLevel
{
    float level = 0.0f; ///< 0..100
    bool isActive = false;
};

enum class SegmentState : std::uint8_t
{
    Open,
    Closed,
    Dispatched,
};

enum class SegmentCloseReason : std::uint8_t
{
    Silence,
    MaxDuration,
    Forced,
};

[[nodiscard]] constexpr auto segmentCloseReasonToString(SegmentCloseReason reason) -> std::string_view
{
    switch (reason)
    {
        case SegmentCloseReason::Silence: return "silence";
        case SegmentCloseReason::MaxDuration: return "max-duration";
        case SegmentCloseReason::Forced: return "forced";
    }
    return "unknown";
}

/// @brief An accumulated run of chunks for one speaker, the unit handed to transcription.
struct Segment
{
    uint64_t id = 0;
    std::string speakerId;
    int64_t startMs = 0;
    int64_t endMs = 0;
    std::vector<std::shared_ptr<const AudioChunk>> chunks;
    SegmentState state = SegmentState::Open;
    SegmentCloseReason closeReason = SegmentCloseReason::Silence;

    /// @brief Total payload size in bytes across all chunks.
    [[nodiscard]] auto byteSize() const -> std::size_t
    {
        auto total = std::size_t { 0 };
        for (auto const& chunk: chunks)
            total += chunk->payload.size();
        return total;
    }
};

enum class EpochState : std::uint8_t
{
    Connecting,
    Open,
    Closing,
    Closed,
};

[[nodiscard]] constexpr auto epochStateToString(EpochState state) -> std::string_view
{
    switch (state)
    {
        case EpochState::Connecting: return "connecting";
        case EpochState::Open: return "open";
        case EpochState::Closing: return "closing";
        case EpochState::Closed: return "closed";
    }
    return "unknown";
}

/// @brief One continuous connection attempt of the session transport.
struct SessionEpoch
{
    uint64_t epochId = 0;
    int64_t connectedAtMs = 0;
    EpochState state = EpochState::Connecting;
};

/// @brief Typed envelope flowing over the session transport in both directions.
struct TypedMessage
{
    std::string type;
    nlohmann::json payload = nlohmann::json::object();
};

} // namespace meetlink
