// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace meetlink
{

/// @brief Configuration for the chunk encoder.
struct ChunkEncoderConfig
{
    uint32_t sampleRate = 16000;
    int chunkDurationMs = 1000;
    std::optional<std::string> speakerHint;
};

/// @brief Packages fixed-duration slices of captured audio into AudioChunks.
///
/// feed() accepts device frames of any size and emits a chunk every chunkDurationMs
/// worth of samples. Sequence numbers are strictly increasing per session and advance
/// even when a slice is dropped, so gaps stay detectable downstream. The encoder never
/// reorders; callers feed frames in capture order.
class ChunkEncoder
{
  public:
    explicit ChunkEncoder(ChunkEncoderConfig config = {});

    /// @brief Encodes one raw slice as PCM16LE.
    /// @param rawSlice Float32 samples in [-1, 1]; values outside are clamped.
    /// @param sequenceId The sequence number to stamp.
    /// @param capturedAtMs Capture time of the first sample.
    /// @return The chunk, or InvalidArgument when the slice is empty.
    [[nodiscard]] auto encode(std::span<const float> rawSlice, uint64_t sequenceId, int64_t capturedAtMs) const
        -> Result<AudioChunk>;

    /// @brief Appends capture frames and returns every chunk completed by them.
    /// @param samples Float32 samples in capture order.
    /// @param nowMs Capture time of the last sample in @p samples.
    [[nodiscard]] auto feed(std::span<const float> samples, int64_t nowMs) -> std::vector<AudioChunk>;

    /// @brief Emits the partially filled slice, if any.
    [[nodiscard]] auto flush(int64_t nowMs) -> std::optional<AudioChunk>;

    /// @brief Discards buffered samples without emitting them (e.g. on mute).
    void discardPending();

    /// @brief Restarts the sequence at zero and drops buffered samples (new session).
    void reset();

    [[nodiscard]] auto samplesPerChunk() const noexcept -> std::size_t { return _samplesPerChunk; }
    [[nodiscard]] auto nextSequenceId() const noexcept -> uint64_t { return _nextSequenceId; }
    [[nodiscard]] auto pendingSamples() const noexcept -> std::size_t { return _pending.size(); }

    /// @brief Duration of the buffered samples that have not been emitted yet.
    [[nodiscard]] auto pendingMs() const -> int64_t { return samplesToMs(_pending.size()); }

  private:
    /// @brief Takes a sequence number and encodes the slice; drops it (with a log line) on failure.
    auto emit(std::span<const float> slice, int64_t capturedAtMs) -> std::optional<AudioChunk>;

    [[nodiscard]] auto samplesToMs(std::size_t samples) const -> int64_t;

    ChunkEncoderConfig _config;
    std::size_t _samplesPerChunk = 0;
    std::vector<float> _pending;
    uint64_t _nextSequenceId = 0;
};

} // namespace meetlink
