// SPDX-License-Identifier: Apache-2.0
#include "AudioPlayback.hpp"

#include <core/Log.hpp>

#include <miniaudio.h>

#include <algorithm>
#include <array>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <format>
#include <mutex>

namespace meetlink
{

struct AudioPlayback::Impl
{
    ma_device device {};
    bool initialized = false;

    // Guarded by mutex; the device callback consumes from the front.
    mutable std::mutex mutex;
    std::condition_variable drained;
    std::deque<std::vector<float>> clips;
    std::size_t readPos = 0;
    uint64_t generation = 0;

    /// Copies up to @p count queued samples into @p out. Requires mutex.
    auto consume(float* out, std::size_t count) -> std::size_t
    {
        auto written = std::size_t { 0 };
        while (written < count && !clips.empty())
        {
            auto const& clip = clips.front();
            auto const n = std::min(count - written, clip.size() - readPos);
            std::copy_n(clip.data() + readPos, n, out + written);
            written += n;
            readPos += n;
            if (readPos >= clip.size())
            {
                clips.pop_front();
                readPos = 0;
            }
        }
        return written;
    }

    [[nodiscard]] auto pending() const -> std::size_t
    {
        auto total = std::size_t { 0 };
        for (auto const& clip: clips)
            total += clip.size();
        return total - readPos;
    }
};

namespace
{

    void playbackDataCallback(ma_device* device, void* output, const void* /*input*/, ma_uint32 frameCount)
    {
        auto* impl = static_cast<AudioPlayback::Impl*>(device->pUserData);
        auto* out = static_cast<float*>(output);
        auto const total = static_cast<std::size_t>(frameCount) * device->playback.channels;

        auto lock = std::unique_lock(impl->mutex);
        auto const hadAudio = !impl->clips.empty();
        auto const written = impl->consume(out, total);
        auto const finished = hadAudio && impl->clips.empty();
        lock.unlock();

        std::fill_n(out + written, total - written, 0.0f);

        if (finished)
            impl->drained.notify_all();
    }

} // namespace

AudioPlayback::AudioPlayback(): _impl(std::make_unique<Impl>())
{
}

AudioPlayback::~AudioPlayback()
{
    cancel();
    if (_impl->initialized)
        ma_device_uninit(&_impl->device);
}

auto AudioPlayback::initialize(unsigned sampleRate, unsigned channels) -> VoidResult
{
    auto config = ma_device_config_init(ma_device_type_playback);
    config.playback.format = ma_format_f32;
    config.playback.channels = channels;
    config.sampleRate = sampleRate;
    config.dataCallback = playbackDataCallback;
    config.pUserData = _impl.get();

    if (auto const result = ma_device_init(nullptr, &config, &_impl->device); result != MA_SUCCESS)
        return makeError(ErrorCode::PlaybackError,
                         std::format("Failed to initialize playback device: {}", static_cast<int>(result)));
    _impl->initialized = true;

    if (auto const result = ma_device_start(&_impl->device); result != MA_SUCCESS)
        return makeError(ErrorCode::PlaybackError,
                         std::format("Failed to start playback device: {}", static_cast<int>(result)));

    log::info("Audio playback started ({}Hz, {} channel(s), f32)", sampleRate, channels);
    return {};
}

auto AudioPlayback::submit(std::vector<float> samples) -> VoidResult
{
    if (!_impl->initialized)
        return makeError(ErrorCode::PlaybackError, "Playback device not initialized");

    if (samples.empty())
        return {};

    auto lock = std::lock_guard(_impl->mutex);
    _impl->clips.push_back(std::move(samples));
    return {};
}

void AudioPlayback::drain()
{
    auto lock = std::unique_lock(_impl->mutex);
    auto const generation = _impl->generation;
    _impl->drained.wait(lock, [&] { return _impl->clips.empty() || _impl->generation != generation; });
}

void AudioPlayback::cancel()
{
    {
        auto lock = std::lock_guard(_impl->mutex);
        _impl->clips.clear();
        _impl->readPos = 0;
        ++_impl->generation;
    }
    _impl->drained.notify_all();
}

auto AudioPlayback::pendingSamples() const -> std::size_t
{
    auto lock = std::lock_guard(_impl->mutex);
    return _impl->pending();
}

auto AudioPlayback::decode(std::span<const std::byte> encoded, unsigned sampleRate, unsigned channels)
    -> Result<std::vector<float>>
{
    if (encoded.empty())
        return makeError(ErrorCode::PlaybackError, "No audio data to decode");

    auto config = ma_decoder_config_init(ma_format_f32, channels, sampleRate);
    auto decoder = ma_decoder {};
    auto const initResult = ma_decoder_init_memory(encoded.data(), encoded.size(), &config, &decoder);
    if (initResult != MA_SUCCESS)
        return makeError(ErrorCode::PlaybackError,
                         std::format("Unsupported or corrupt audio data ({} bytes): {}",
                                     encoded.size(),
                                     static_cast<int>(initResult)));

    auto samples = std::vector<float> {};
    auto block = std::array<float, 4096> {};
    auto const framesPerBlock = static_cast<ma_uint64>(block.size() / channels);

    while (true)
    {
        auto framesRead = ma_uint64 { 0 };
        auto const readResult = ma_decoder_read_pcm_frames(&decoder, block.data(), framesPerBlock, &framesRead);
        auto const count = static_cast<std::ptrdiff_t>(framesRead * channels);
        samples.insert(samples.end(), block.begin(), block.begin() + count);
        if (readResult != MA_SUCCESS || framesRead < framesPerBlock)
            break;
    }

    ma_decoder_uninit(&decoder);

    if (samples.empty())
        return makeError(ErrorCode::PlaybackError, "Decoded audio contains no samples");

    return samples;
}

} // namespace meetlink
