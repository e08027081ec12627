// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Signal.hpp>

#include <cstddef>
#include <memory>
#include <vector>

namespace meetlink
{

/// @brief Plays synthesized AI responses (encoded MP3/WAV) in arrival order.
///
/// Maintains a background worker thread that dequeues encoded clips, decodes them
/// and plays them through AudioPlayback. Playback never blocks the caller.
class ResponsePlayer
{
  public:
    ResponsePlayer();
    ~ResponsePlayer();

    ResponsePlayer(const ResponsePlayer&) = delete;
    ResponsePlayer& operator=(const ResponsePlayer&) = delete;

    /// @brief Opens the playback device and starts the worker thread.
    [[nodiscard]] auto initialize() -> VoidResult;

    /// @brief Enqueues an encoded clip for playback (non-blocking).
    void enqueue(std::vector<std::byte> encodedAudio);

    /// @brief Returns true when nothing is queued or playing.
    [[nodiscard]] auto idle() const -> bool;

    /// @brief Drops queued clips and cuts off the clip currently playing.
    void cancel();

    /// @brief Cancels pending work and joins the worker thread.
    void shutdown();

    /// @brief Emitted on the worker thread right before a clip starts playing.
    Signal<> playbackStarted;

    /// @brief Emitted on the worker thread after a clip finished or was cut off.
    Signal<> playbackFinished;

    struct Impl;

  private:
    std::unique_ptr<Impl> _impl;
};

} // namespace meetlink
