// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/CaptureDevice.hpp>
#include <audio/ChunkEncoder.hpp>
#include <audio/LevelAnalyzer.hpp>
#include <audio/SegmentationBuffer.hpp>
#include <core/Error.hpp>
#include <core/Signal.hpp>

#include <session/SessionTransport.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <string_view>

namespace meetlink
{

enum class SessionState : std::uint8_t
{
    Idle,
    Starting,
    Active,
    Stopping,
};

[[nodiscard]] constexpr auto sessionStateToString(SessionState state) -> std::string_view
{
    switch (state)
    {
        case SessionState::Idle: return "idle";
        case SessionState::Starting: return "starting";
        case SessionState::Active: return "active";
        case SessionState::Stopping: return "stopping";
    }
    return "unknown";
}

/// @brief Configuration for the session controller.
struct SessionControllerConfig
{
    LevelAnalyzerConfig level;
    ChunkEncoderConfig encoder;
    SegmentationConfig segmentation;
};

/// @brief Millisecond clock used to timestamp captured audio.
using Clock = std::function<int64_t()>;

/// @brief Owns the lifecycle of one live session.
///
/// Wires capture → level analysis → chunk encoding → transport and segmentation. Chunks
/// are admitted only while the transport is open. Lifecycle operations are serialized;
/// chunk processing runs on the capture thread under a separate pipeline lock that
/// also guards the segmentation state against the transport's epoch changes.
class SessionController
{
  public:
    /// @param config Pipeline configuration.
    /// @param capture The microphone source.
    /// @param transport The session transport (opened and closed by this controller).
    /// @param sink Receives closed segments.
    /// @param clock Time source; defaults to the wall clock.
    SessionController(SessionControllerConfig config,
                      CaptureDevice& capture,
                      SessionTransport& transport,
                      SegmentSink sink,
                      Clock clock = {});
    ~SessionController();

    SessionController(const SessionController&) = delete;
    SessionController& operator=(const SessionController&) = delete;

    /// @brief Opens the transport and starts capture.
    /// @return AlreadyActive if a session is running, or the CaptureError of a failed start
    ///         (the controller then stays Idle with the transport closed).
    [[nodiscard]] auto start() -> VoidResult;

    /// @brief Stops capture, closes open segments and closes the transport. Idempotent.
    void stop();

    /// @brief Suspends chunk production and closes the local speaker's open segment.
    /// @return StateError when no session is active.
    [[nodiscard]] auto mute() -> VoidResult;

    [[nodiscard]] auto unmute() -> VoidResult;

    /// @brief Asks the back-end to hold AI responses. Capture continues.
    /// @return StateError when no session is active.
    [[nodiscard]] auto pause() -> VoidResult;

    [[nodiscard]] auto resume() -> VoidResult;

    [[nodiscard]] auto state() const -> SessionState;
    [[nodiscard]] auto isMuted() const -> bool;
    [[nodiscard]] auto isPaused() const -> bool;

    /// @brief Latest smoothed capture level (0..100).
    [[nodiscard]] auto activityLevel() const -> float;

    /// @brief Number of segments handed to the sink since construction.
    [[nodiscard]] auto dispatchedSegments() const -> uint64_t;

    Signal<SessionState> stateChanged;
    Signal<float> levelChanged;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace meetlink
