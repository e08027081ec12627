// SPDX-License-Identifier: Apache-2.0
#include "ResponsePlayer.hpp"

#include <core/Log.hpp>

#include <condition_variable>
#include <deque>
#include <mutex>
#include <thread>

#include "AudioPlayback.hpp"

namespace meetlink
{

namespace
{

    /// @brief Output format for response audio: float32 PCM, 24 kHz, mono.
    constexpr auto PlaybackSampleRate = 24000u;
    constexpr auto PlaybackChannels = 1u;

} // namespace

struct ResponsePlayer::Impl
{
    ResponsePlayer* owner = nullptr;
    AudioPlayback playback;

    std::jthread worker;
    mutable std::mutex mutex;
    std::condition_variable_any cv;
    std::deque<std::vector<std::byte>> queue;
    bool shutdownRequested = false;
    bool busy = false;

    void run(const std::stop_token& stopToken)
    {
        while (!stopToken.stop_requested())
        {
            auto clip = std::vector<std::byte> {};
            {
                auto lock = std::unique_lock(mutex);
                cv.wait(lock, stopToken, [this] { return !queue.empty() || shutdownRequested; });

                if (stopToken.stop_requested() || shutdownRequested)
                    return;

                clip = std::move(queue.front());
                queue.pop_front();
                busy = true;
            }

            decodeAndPlay(clip);

            auto lock = std::lock_guard(mutex);
            busy = false;
        }
    }

    void decodeAndPlay(const std::vector<std::byte>& clip)
    {
        auto samples = AudioPlayback::decode(clip, PlaybackSampleRate, PlaybackChannels);
        if (!samples)
        {
            log::warning("Response audio skipped: {}", samples.error());
            return;
        }

        log::debug("Playing response audio ({:.1f} s)",
                   static_cast<double>(samples->size()) / (PlaybackSampleRate * PlaybackChannels));

        if (auto submitted = playback.submit(std::move(*samples)); !submitted)
        {
            log::error("Response playback failed: {}", submitted.error());
            return;
        }

        owner->playbackStarted.emit();
        playback.drain();
        owner->playbackFinished.emit();
    }
};

ResponsePlayer::ResponsePlayer(): _impl(std::make_unique<Impl>())
{
    _impl->owner = this;
}

ResponsePlayer::~ResponsePlayer()
{
    shutdown();
}

auto ResponsePlayer::initialize() -> VoidResult
{
    if (auto result = _impl->playback.initialize(PlaybackSampleRate, PlaybackChannels); !result)
        return result;

    _impl->worker = std::jthread([this](const std::stop_token& token) { _impl->run(token); });
    return {};
}

void ResponsePlayer::enqueue(std::vector<std::byte> encodedAudio)
{
    if (encodedAudio.empty())
        return;

    auto lock = std::lock_guard(_impl->mutex);
    _impl->queue.push_back(std::move(encodedAudio));
    _impl->cv.notify_one();
}

auto ResponsePlayer::idle() const -> bool
{
    auto lock = std::lock_guard(_impl->mutex);
    return _impl->queue.empty() && !_impl->busy;
}

void ResponsePlayer::cancel()
{
    {
        auto lock = std::lock_guard(_impl->mutex);
        _impl->queue.clear();
    }

    _impl->playback.cancel();
}

void ResponsePlayer::shutdown()
{
    {
        auto lock = std::lock_guard(_impl->mutex);
        _impl->shutdownRequested = true;
        _impl->queue.clear();
    }

    _impl->playback.cancel();
    _impl->cv.notify_all();

    if (_impl->worker.joinable())
    {
        _impl->worker.request_stop();
        _impl->worker.join();
    }
}

} // namespace meetlink
