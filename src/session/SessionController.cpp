// SPDX-License-Identifier: Apache-2.0
#include "SessionController.hpp"

#include <core/Log.hpp>

#include <session/Messages.hpp>

#include <atomic>
#include <chrono>
#include <format>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace meetlink
{

namespace
{

    auto wallClockMs() -> int64_t
    {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
                   std::chrono::system_clock::now().time_since_epoch())
            .count();
    }

    /// Expands a PCM16LE payload back to float samples for activity classification.
    auto toFloatSamples(const AudioChunk& chunk) -> std::vector<float>
    {
        auto samples = std::vector<float>(chunk.sampleCount());
        for (auto i = std::size_t { 0 }; i < samples.size(); ++i)
        {
            auto const lo = std::to_integer<uint16_t>(chunk.payload[2 * i]);
            auto const hi = std::to_integer<uint16_t>(chunk.payload[2 * i + 1]);
            auto const value = static_cast<int16_t>(static_cast<uint16_t>(lo | (hi << 8)));
            samples[i] = static_cast<float>(value) / 32768.0f;
        }
        return samples;
    }

} // namespace

struct SessionController::Impl
{
    SessionController* owner = nullptr;
    SessionControllerConfig config;
    CaptureDevice& capture;
    SessionTransport& transport;
    Clock clock;
    std::string localSpeaker;

    std::mutex lifecycleMutex;
    std::atomic<SessionState> state { SessionState::Idle };
    std::atomic<bool> muted { false };
    std::atomic<bool> paused { false };
    std::atomic<float> activity { 0.0f };

    // Guarded by pipelineMutex.
    std::mutex pipelineMutex;
    LevelAnalyzer analyzer;
    ChunkEncoder encoder;
    SegmentationBuffer segmentation;
    bool admitting = false;

    SubscriptionId transportSubscription = 0;

    Impl(SessionControllerConfig config,
         CaptureDevice& capture,
         SessionTransport& transport,
         SegmentSink sink,
         Clock clock):
        config(config),
        capture(capture),
        transport(transport),
        clock(clock ? std::move(clock) : Clock { wallClockMs }),
        localSpeaker(config.encoder.speakerHint.value_or(std::string {})),
        analyzer(config.level),
        encoder(config.encoder),
        segmentation(config.segmentation, std::move(sink))
    {
    }

    void setState(SessionState next)
    {
        auto const previous = state.exchange(next);
        if (previous == next)
            return;
        log::debug("Session {} -> {}", sessionStateToString(previous), sessionStateToString(next));
        owner->stateChanged.emit(next);
    }

    /// Sends one chunk and hands it to segmentation. Requires pipelineMutex.
    void admitChunk(AudioChunk chunk)
    {
        auto shared = std::make_shared<const AudioChunk>(std::move(chunk));
        auto const active = analyzer.measure(toFloatSamples(*shared)).isActive;

        if (auto sent = transport.send(messages::makeAudioChunk(*shared)); !sent)
            log::debug("Chunk #{} not delivered: {}", shared->sequenceId, sent.error().message);

        segmentation.push(std::move(shared), active);
    }

    void onAudio(std::span<const float> samples)
    {
        auto const now = clock();
        auto level = ActivityLevel {};
        {
            auto lock = std::lock_guard(pipelineMutex);
            level = analyzer.sample(samples);

            if (admitting && !muted.load())
            {
                for (auto& chunk: encoder.feed(samples, now))
                    admitChunk(std::move(chunk));
            }

            // Audio still buffered in the encoder has not been classified yet, so
            // segmentation only sees time up to the end of the last emitted chunk.
            segmentation.poll(now - encoder.pendingMs());
        }

        activity.store(level.level);
        owner->levelChanged.emit(level.level);
    }

    void onTransportState(TransportState transportState, const SessionEpoch& epoch)
    {
        if (transportState == TransportState::Open)
        {
            {
                auto lock = std::lock_guard(pipelineMutex);
                admitting = true;
            }
            log::info("Streaming audio (epoch {})", epoch.epochId);

            // The back-end keeps control state per connection.
            if (muted.load())
                sendControl(messages::ControlAction::Mute);
            if (paused.load())
                sendControl(messages::ControlAction::Pause);
            return;
        }

        auto lock = std::lock_guard(pipelineMutex);
        if (!admitting)
            return;

        admitting = false;
        encoder.discardPending();
        segmentation.flush();
        log::debug("Epoch {} ended; open segments flushed", epoch.epochId);
    }

    void sendControl(messages::ControlAction action)
    {
        if (transport.state() != TransportState::Open)
        {
            log::debug("Control '{}' not sent: transport is not open", messages::controlActionToString(action));
            return;
        }

        if (auto sent = transport.send(messages::makeControl(action)); !sent)
            log::warning("Control '{}' not sent: {}", messages::controlActionToString(action), sent.error());
    }

    auto requireActive(std::string_view operation) const -> VoidResult
    {
        if (state.load() != SessionState::Active)
            return makeError(ErrorCode::StateError,
                             std::format("Cannot {}: no active session ({})",
                                         operation,
                                         sessionStateToString(state.load())));
        return {};
    }
};

SessionController::SessionController(SessionControllerConfig config,
                                     CaptureDevice& capture,
                                     SessionTransport& transport,
                                     SegmentSink sink,
                                     Clock clock):
    _impl(std::make_unique<Impl>(std::move(config), capture, transport, std::move(sink), std::move(clock)))
{
    _impl->owner = this;
    _impl->transportSubscription = transport.stateChanged.connect(
        [this](TransportState state, const SessionEpoch& epoch) { _impl->onTransportState(state, epoch); });
}

SessionController::~SessionController()
{
    stop();
    _impl->transport.stateChanged.disconnect(_impl->transportSubscription);
}

auto SessionController::start() -> VoidResult
{
    auto lifecycle = std::lock_guard(_impl->lifecycleMutex);

    if (_impl->state.load() != SessionState::Idle)
        return makeError(ErrorCode::AlreadyActive, "A session is already active");

    _impl->setState(SessionState::Starting);
    {
        auto lock = std::lock_guard(_impl->pipelineMutex);
        _impl->encoder.reset();
        _impl->analyzer.reset();
        _impl->admitting = _impl->transport.state() == TransportState::Open;
    }
    _impl->muted = false;
    _impl->paused = false;
    _impl->activity = 0.0f;

    _impl->transport.open();

    if (auto started = _impl->capture.start([this](std::span<const float> samples) { _impl->onAudio(samples); });
        !started)
    {
        log::error("Cannot start capture: {}", started.error());
        _impl->transport.close();
        _impl->setState(SessionState::Idle);
        if (started.error().code == ErrorCode::CaptureError)
            return started;
        return makeError(ErrorCode::CaptureError, started.error().message);
    }

    _impl->setState(SessionState::Active);
    log::info("Session started");
    return {};
}

void SessionController::stop()
{
    auto lifecycle = std::lock_guard(_impl->lifecycleMutex);

    auto const current = _impl->state.load();
    if (current == SessionState::Idle || current == SessionState::Stopping)
        return;

    _impl->setState(SessionState::Stopping);

    // Blocks until the capture callback has returned.
    _impl->capture.stop();

    {
        auto lock = std::lock_guard(_impl->pipelineMutex);
        if (_impl->admitting && !_impl->muted.load())
        {
            if (auto tail = _impl->encoder.flush(_impl->clock()))
                _impl->admitChunk(std::move(*tail));
        }
        _impl->admitting = false;
        _impl->encoder.discardPending();
        _impl->segmentation.flush();
    }

    _impl->transport.close();
    _impl->activity = 0.0f;

    _impl->setState(SessionState::Idle);
    log::info("Session stopped ({} segment(s) dispatched)", dispatchedSegments());
}

auto SessionController::mute() -> VoidResult
{
    auto lifecycle = std::lock_guard(_impl->lifecycleMutex);
    if (auto active = _impl->requireActive("mute"); !active)
        return active;

    if (_impl->muted.exchange(true))
        return {};

    {
        auto lock = std::lock_guard(_impl->pipelineMutex);
        _impl->encoder.discardPending();
        _impl->segmentation.closeSpeaker(_impl->localSpeaker);
    }

    _impl->sendControl(messages::ControlAction::Mute);
    log::info("Microphone muted");
    return {};
}

auto SessionController::unmute() -> VoidResult
{
    auto lifecycle = std::lock_guard(_impl->lifecycleMutex);
    if (auto active = _impl->requireActive("unmute"); !active)
        return active;

    if (!_impl->muted.exchange(false))
        return {};

    _impl->sendControl(messages::ControlAction::Unmute);
    log::info("Microphone unmuted");
    return {};
}

auto SessionController::pause() -> VoidResult
{
    auto lifecycle = std::lock_guard(_impl->lifecycleMutex);
    if (auto active = _impl->requireActive("pause"); !active)
        return active;

    if (_impl->paused.exchange(true))
        return {};

    _impl->sendControl(messages::ControlAction::Pause);
    return {};
}

auto SessionController::resume() -> VoidResult
{
    auto lifecycle = std::lock_guard(_impl->lifecycleMutex);
    if (auto active = _impl->requireActive("resume"); !active)
        return active;

    if (!_impl->paused.exchange(false))
        return {};

    _impl->sendControl(messages::ControlAction::Resume);
    return {};
}

auto SessionController::state() const -> SessionState
{
    return _impl->state.load();
}

auto SessionController::isMuted() const -> bool
{
    return _impl->muted.load();
}

auto SessionController::isPaused() const -> bool
{
    return _impl->paused.load();
}

auto SessionController::activityLevel() const -> float
{
    return _impl->activity.load();
}

auto SessionController::dispatchedSegments() const -> uint64_t
{
    auto lock = std::lock_guard(_impl->pipelineMutex);
    return _impl->segmentation.dispatchedCount();
}

} // namespace meetlink
