// SPDX-License-Identifier: Apache-2.0
#include "App.hpp"

#include <audio/AudioCapture.hpp>
#include <audio/ResponsePlayer.hpp>
#include <audio/SegmentSpool.hpp>
#include <core/Log.hpp>

#include <session/MessageRouter.hpp>
#include <session/Messages.hpp>
#include <session/SessionController.hpp>
#include <session/SessionTransport.hpp>
#include <session/WebSocketConnection.hpp>

#include <atomic>
#include <chrono>
#include <format>
#include <iostream>
#include <mutex>
#include <optional>
#include <print>
#include <string>
#include <vector>

namespace meetlink
{

namespace
{

    auto makeControllerConfig(const AppConfig& config) -> SessionControllerConfig
    {
        auto speakerHint = std::optional<std::string> {};
        if (!config.audio.speakerName.empty())
            speakerHint = config.audio.speakerName;

        return SessionControllerConfig {
            .level = LevelAnalyzerConfig {
                .activityThreshold = config.audio.activityThreshold,
                .smoothingWindow = static_cast<std::size_t>(config.audio.smoothingWindow),
            },
            .encoder = ChunkEncoderConfig {
                .sampleRate = config.audio.sampleRate,
                .chunkDurationMs = config.audio.chunkDurationMs,
                .speakerHint = std::move(speakerHint),
            },
            .segmentation = SegmentationConfig {
                .silenceTimeoutMs = config.segmentation.silenceTimeoutMs,
                .maxSegmentMs = config.segmentation.maxSegmentMs,
            },
        };
    }

    void printHelp()
    {
        std::println("Commands: m = mute, u = unmute, p = pause AI, r = resume AI, s = status, q = quit");
    }

} // namespace

struct App::Impl
{
    AppConfig config;

    MessageRouter router;
    SessionTransport transport;
    AudioCapture capture;
    SegmentSpool spool;
    SessionController controller;
    std::unique_ptr<ResponsePlayer> player;

    std::vector<MessageRouter::Subscription> subscriptions;
    std::atomic<bool> autoMuted { false };
    std::mutex consoleMutex;

    explicit Impl(AppConfig cfg):
        config(std::move(cfg)),
        transport(
            SessionTransportConfig { .reconnectDelay = std::chrono::milliseconds(config.session.reconnectDelayMs) },
            makeWebSocketConnectionFactory(WebSocketConnectionConfig { .url = config.server.url }),
            router),
        capture(AudioCaptureConfig {
            .deviceName = config.audio.deviceName,
            .sampleRate = config.audio.sampleRate,
        }),
        spool(config.segmentation.spoolDirectory),
        controller(makeControllerConfig(config),
                   capture,
                   transport,
                   [this](const Segment& segment) { return spool.write(segment); })
    {
    }

    template <typename... Args>
    void print(std::format_string<Args...> fmt, Args&&... args)
    {
        auto lock = std::lock_guard(consoleMutex);
        std::println(fmt, std::forward<Args>(args)...);
    }

    void subscribe()
    {
        subscriptions.push_back(router.subscribe(messages::TranscriptUpdateType, [this](const TypedMessage& message) {
            auto update = messages::decodeTranscriptUpdate(message);
            if (!update)
            {
                log::warning("Bad transcript_update: {}", update.error());
                return;
            }
            print("[transcript] {}", update->transcript);
        }));

        subscriptions.push_back(router.subscribe(messages::AiResponseType, [this](const TypedMessage& message) {
            auto response = messages::decodeAiResponse(message);
            if (!response)
            {
                log::warning("Bad ai_response: {}", response.error());
                return;
            }

            if (response->confidence)
                print("[ai] {} (confidence {:.2f})", response->aiText, *response->confidence);
            else
                print("[ai] {}", response->aiText);

            if (player && response->audioData)
                player->enqueue(std::move(*response->audioData));
        }));

        subscriptions.push_back(router.subscribe(messages::StatusType, [](const TypedMessage& message) {
            if (auto status = messages::decodeStatus(message))
                log::info("Back-end status: {} {}", status->status, status->details.dump());
        }));

        subscriptions.push_back(router.subscribe(messages::ControlResponseType, [](const TypedMessage& message) {
            if (auto response = messages::decodeControlResponse(message))
                log::debug("Control '{}' acknowledged: {}", response->action, response->status);
        }));

        subscriptions.push_back(router.subscribe(messages::ErrorType, [this](const TypedMessage& message) {
            if (auto notice = messages::decodeError(message))
            {
                log::error("Back-end error: {}", notice->message);
                print("[error] {}{}", notice->message, notice->code ? std::format(" ({})", *notice->code) : "");
            }
        }));

        transport.stateChanged.connect([this](TransportState state, const SessionEpoch& epoch) {
            switch (state)
            {
                case TransportState::Open: print("[session] connected (epoch {})", epoch.epochId); break;
                case TransportState::Disconnected:
                    if (controller.state() == SessionState::Active)
                        print("[session] disconnected, reconnecting in {} ms", config.session.reconnectDelayMs);
                    else
                        print("[session] disconnected");
                    break;
                case TransportState::Connecting:
                case TransportState::Closing: break;
            }
        });
    }

    /// Wires mute-while-speaking: the microphone is muted while response audio plays,
    /// unless the user already muted it.
    void wirePlayback()
    {
        if (!player || !config.playback.muteWhileSpeaking)
            return;

        player->playbackStarted.connect([this] {
            if (controller.state() != SessionState::Active || controller.isMuted())
                return;
            if (controller.mute())
                autoMuted = true;
        });

        player->playbackFinished.connect([this] {
            if (!autoMuted.exchange(false))
                return;
            if (auto result = controller.unmute(); !result)
                log::debug("Auto-unmute skipped: {}", result.error());
        });
    }

    void printStatus()
    {
        auto const epoch = transport.currentEpoch();
        print("session: {}, transport: {} (epoch {}), muted: {}, paused: {}, level: {:.0f} (peak {:.2f}), "
              "segments: {}",
              sessionStateToString(controller.state()),
              transportStateToString(transport.state()),
              epoch.epochId,
              controller.isMuted(),
              controller.isPaused(),
              controller.activityLevel(),
              capture.peakLevel(),
              controller.dispatchedSegments());
    }

    void report(const VoidResult& result)
    {
        if (!result)
            print("{}", result.error());
    }

    /// @return false when the command loop should end.
    auto handleCommand(std::string_view line) -> bool
    {
        if (line.empty())
            return true;

        switch (line.front())
        {
            case 'm':
                autoMuted = false;
                report(controller.mute());
                break;
            case 'u':
                autoMuted = false;
                report(controller.unmute());
                break;
            case 'p': report(controller.pause()); break;
            case 'r': report(controller.resume()); break;
            case 's': printStatus(); break;
            case 'q': return false;
            default: printHelp(); break;
        }
        return true;
    }
};

App::App(AppConfig config): _impl(std::make_unique<Impl>(std::move(config)))
{
}

App::~App()
{
    if (_impl->player)
        _impl->player->shutdown();
    _impl->controller.stop();
    for (auto const& subscription: _impl->subscriptions)
        _impl->router.unsubscribe(subscription);
}

auto App::initialize() -> VoidResult
{
    if (_impl->config.playback.enabled)
    {
        _impl->player = std::make_unique<ResponsePlayer>();
        if (auto result = _impl->player->initialize(); !result)
        {
            log::warning("Response playback disabled: {}", result.error());
            _impl->player.reset();
        }
    }

    _impl->subscribe();
    _impl->wirePlayback();

    if (_impl->config.segmentation.spoolDirectory.empty())
        log::info("No spool directory configured; closed segments are only logged");
    else
        log::info("Writing segments to {}", _impl->config.segmentation.spoolDirectory);

    return {};
}

auto App::run() -> int
{
    if (auto started = _impl->controller.start(); !started)
    {
        log::error("Cannot start session: {}", started.error());
        return 1;
    }

    _impl->print("Streaming to {}", _impl->config.server.url);
    printHelp();

    auto line = std::string {};
    while (std::getline(std::cin, line))
    {
        if (!_impl->handleCommand(line))
            break;
    }

    if (_impl->player)
        _impl->player->cancel();
    _impl->controller.stop();
    _impl->print("Session ended ({} segment(s))", _impl->controller.dispatchedSegments());
    return 0;
}

} // namespace meetlink
