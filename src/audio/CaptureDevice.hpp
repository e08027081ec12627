// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <cstdint>
#include <functional>
#include <span>

namespace meetlink
{

/// @brief Callback invoked with captured audio, on the device's thread.
/// @param samples Float32 PCM samples, mono, at the device sample rate.
using AudioCallback = std::function<void(std::span<const float> samples)>;

/// @brief Abstract microphone source driven by the SessionController.
class CaptureDevice
{
  public:
    virtual ~CaptureDevice() = default;

    /// @brief Opens the device (on first use) and starts delivering audio to @p callback.
    /// @return Success, or a CaptureError when the device is unavailable.
    [[nodiscard]] virtual auto start(AudioCallback callback) -> VoidResult = 0;

    /// @brief Stops delivery. Blocks until no callback is running. Idempotent.
    virtual void stop() = 0;

    /// @brief Returns true while audio is being delivered.
    [[nodiscard]] virtual auto isCapturing() const -> bool = 0;

    /// @brief Sample rate of delivered audio in Hz.
    [[nodiscard]] virtual auto sampleRate() const -> uint32_t = 0;
};

} // namespace meetlink
