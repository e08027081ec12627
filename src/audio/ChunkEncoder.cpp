// SPDX-License-Identifier: Apache-2.0
#include "ChunkEncoder.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <cmath>

namespace meetlink
{

ChunkEncoder::ChunkEncoder(ChunkEncoderConfig config): _config(std::move(config))
{
    auto const durationMs = static_cast<std::size_t>(std::max(1, _config.chunkDurationMs));
    auto const samples = static_cast<std::size_t>(_config.sampleRate) * durationMs / 1000;
    _samplesPerChunk = std::max<std::size_t>(1, samples);
    _pending.reserve(_samplesPerChunk * 2);
}

auto ChunkEncoder::encode(std::span<const float> rawSlice, uint64_t sequenceId, int64_t capturedAtMs) const
    -> Result<AudioChunk>
{
    if (rawSlice.empty())
        return makeError(ErrorCode::InvalidArgument, std::format("Chunk #{} has no samples", sequenceId));

    auto chunk = AudioChunk {
        .sequenceId = sequenceId,
        .capturedAtMs = capturedAtMs,
        .payload = {},
        .speakerHint = _config.speakerHint,
        .sampleRate = _config.sampleRate,
    };

    chunk.payload.reserve(rawSlice.size() * 2);
    for (auto const sample: rawSlice)
    {
        auto const scaled = std::lround(std::clamp(sample, -1.0f, 1.0f) * 32767.0f);
        auto const value = static_cast<uint16_t>(static_cast<int16_t>(scaled));
        chunk.payload.push_back(static_cast<std::byte>(value & 0xFF));
        chunk.payload.push_back(static_cast<std::byte>(value >> 8));
    }

    return chunk;
}

auto ChunkEncoder::emit(std::span<const float> slice, int64_t capturedAtMs) -> std::optional<AudioChunk>
{
    auto const sequenceId = _nextSequenceId++;
    auto chunk = encode(slice, sequenceId, capturedAtMs);
    if (!chunk)
    {
        log::debug("Dropping chunk: {}", chunk.error().message);
        return std::nullopt;
    }
    return std::move(*chunk);
}

auto ChunkEncoder::feed(std::span<const float> samples, int64_t nowMs) -> std::vector<AudioChunk>
{
    auto chunks = std::vector<AudioChunk> {};
    _pending.insert(_pending.end(), samples.begin(), samples.end());

    while (_pending.size() >= _samplesPerChunk)
    {
        // nowMs is the time of the newest pending sample; the slice starts pending.size() samples earlier.
        auto const capturedAtMs = nowMs - samplesToMs(_pending.size());
        if (auto chunk = emit(std::span<const float>(_pending.data(), _samplesPerChunk), capturedAtMs))
            chunks.push_back(std::move(*chunk));
        _pending.erase(_pending.begin(), _pending.begin() + static_cast<std::ptrdiff_t>(_samplesPerChunk));
    }

    return chunks;
}

auto ChunkEncoder::flush(int64_t nowMs) -> std::optional<AudioChunk>
{
    if (_pending.empty())
        return std::nullopt;

    auto const capturedAtMs = nowMs - samplesToMs(_pending.size());
    auto chunk = emit(_pending, capturedAtMs);
    _pending.clear();
    return chunk;
}

void ChunkEncoder::discardPending()
{
    _pending.clear();
}

void ChunkEncoder::reset()
{
    _pending.clear();
    _nextSequenceId = 0;
}

auto ChunkEncoder::samplesToMs(std::size_t samples) const -> int64_t
{
    if (_config.sampleRate == 0)
        return 0;
    return static_cast<int64_t>(samples) * 1000 / static_cast<int64_t>(_config.sampleRate);
}

} // namespace meetlink
