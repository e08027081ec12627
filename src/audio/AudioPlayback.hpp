// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <cstddef>
#include <memory>
#include <span>
#include <vector>

namespace meetlink
{

/// @brief Streams float32 PCM clips to the default playback device using miniaudio.
///
/// The device runs continuously once initialized and outputs silence while nothing is
/// queued, so consecutive clips play back to back. Uses PIMPL to keep miniaudio out
/// of consumers.
class AudioPlayback
{
  public:
    AudioPlayback();
    ~AudioPlayback();

    AudioPlayback(const AudioPlayback&) = delete;
    AudioPlayback& operator=(const AudioPlayback&) = delete;

    /// @brief Opens and starts the playback device.
    /// @param sampleRate Audio sample rate in Hz (e.g. 24000).
    /// @param channels Number of audio channels (e.g. 1 for mono).
    /// @return Success or a PlaybackError.
    [[nodiscard]] auto initialize(unsigned sampleRate, unsigned channels) -> VoidResult;

    /// @brief Queues interleaved samples behind any clip still playing.
    [[nodiscard]] auto submit(std::vector<float> samples) -> VoidResult;

    /// @brief Blocks until every queued sample has been played or cancel() was called.
    void drain();

    /// @brief Drops everything queued, including the rest of the clip playing now.
    void cancel();

    /// @brief Number of samples still queued.
    [[nodiscard]] auto pendingSamples() const -> std::size_t;

    /// @brief Decodes an encoded audio file held in memory (MP3, WAV or FLAC).
    /// @param encoded The encoded bytes.
    /// @param sampleRate Output sample rate to resample to.
    /// @param channels Output channel count to remix to.
    /// @return Interleaved float32 PCM, or a PlaybackError if the data cannot be decoded.
    [[nodiscard]] static auto decode(std::span<const std::byte> encoded, unsigned sampleRate, unsigned channels)
        -> Result<std::vector<float>>;

    struct Impl;

  private:
    std::unique_ptr<Impl> _impl;
};

} // namespace meetlink
