// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/CaptureDevice.hpp>

#include <memory>
#include <string>

namespace meetlink
{

/// @brief Configuration for microphone capture.
struct AudioCaptureConfig
{
    /// @brief Case-insensitive substring matched against capture device names.
    /// Empty selects the first non-monitor device, or the system default.
    std::string deviceName;

    uint32_t sampleRate = 16000;
};

/// @brief Captures float32 mono PCM from the microphone using miniaudio.
class AudioCapture: public CaptureDevice
{
  public:
    explicit AudioCapture(AudioCaptureConfig config = {});
    ~AudioCapture() override;

    AudioCapture(const AudioCapture&) = delete;
    AudioCapture& operator=(const AudioCapture&) = delete;

    [[nodiscard]] auto start(AudioCallback callback) -> VoidResult override;
    void stop() override;
    [[nodiscard]] auto isCapturing() const -> bool override;
    [[nodiscard]] auto sampleRate() const -> uint32_t override;

    /// @brief Returns the peak amplitude (0.0 to 1.0) of the most recent device buffer.
    ///
    /// Updated atomically from the audio callback thread. Safe to call from any thread.
    [[nodiscard]] auto peakLevel() const -> float;

    // Impl must be accessible from the C audio callback
    struct Impl;

  private:
    [[nodiscard]] auto openDevice() -> VoidResult;

    std::unique_ptr<Impl> _impl;
};

} // namespace meetlink
