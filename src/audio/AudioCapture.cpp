// SPDX-License-Identifier: Apache-2.0

#include "AudioCapture.hpp"

#include <core/Log.hpp>

#include <miniaudio.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cmath>
#include <optional>
#include <string>

namespace meetlink
{

struct AudioCapture::Impl
{
    AudioCaptureConfig config;
    ma_context context {};
    ma_device device {};
    AudioCallback callback;
    std::atomic<float> peakLevel { 0.0f };
    std::atomic<bool> capturing { false };
    bool contextInitialized = false;
    bool deviceInitialized = false;
};

namespace
{

    void audioDataCallback(ma_device* device, void* /*output*/, const void* input, ma_uint32 frameCount)
    {
        auto* impl = static_cast<AudioCapture::Impl*>(device->pUserData);
        if (!impl || !input || !impl->capturing.load(std::memory_order_acquire))
            return;

        auto const* samples = static_cast<const float*>(input);

        auto peak = 0.0f;
        for (auto i = ma_uint32 { 0 }; i < frameCount; ++i)
            peak = std::max(peak, std::abs(samples[i]));
        impl->peakLevel.store(peak, std::memory_order_relaxed);

        if (impl->callback)
            impl->callback(std::span<const float>(samples, frameCount));
    }

    auto toLower(std::string_view text) -> std::string
    {
        auto s = std::string(text);
        std::ranges::transform(s, s.begin(), [](unsigned char c) { return std::tolower(c); });
        return s;
    }

} // namespace

AudioCapture::AudioCapture(AudioCaptureConfig config): _impl(std::make_unique<Impl>())
{
    _impl->config = std::move(config);
}

AudioCapture::~AudioCapture()
{
    stop();
    if (_impl->deviceInitialized)
        ma_device_uninit(&_impl->device);
    if (_impl->contextInitialized)
        ma_context_uninit(&_impl->context);
}

auto AudioCapture::openDevice() -> VoidResult
{
    // The context must outlive the device
    auto const ctxResult = ma_context_init(nullptr, 0, nullptr, &_impl->context);
    if (ctxResult != MA_SUCCESS)
        return makeError(ErrorCode::CaptureError,
                         std::format("Failed to initialize audio context: {}", static_cast<int>(ctxResult)));
    _impl->contextInitialized = true;

    ma_device_info* pCaptureDevices = nullptr;
    auto captureCount = ma_uint32 { 0 };
    auto const enumResult =
        ma_context_get_devices(&_impl->context, nullptr, nullptr, &pCaptureDevices, &captureCount);

    auto const& deviceName = _impl->config.deviceName;
    auto matchedDeviceId = std::optional<ma_device_id> {};
    if (enumResult == MA_SUCCESS)
    {
        log::debug("Available capture devices:");
        for (auto i = ma_uint32 { 0 }; i < captureCount; ++i)
            log::debug("  [{}] {}", i, pCaptureDevices[i].name);

        if (!deviceName.empty())
        {
            auto const lowerTarget = toLower(deviceName);
            for (auto i = ma_uint32 { 0 }; i < captureCount; ++i)
            {
                if (toLower(pCaptureDevices[i].name).find(lowerTarget) != std::string::npos)
                {
                    log::info("Matched capture device '{}' for filter '{}'", pCaptureDevices[i].name, deviceName);
                    matchedDeviceId = pCaptureDevices[i].id;
                    break;
                }
            }

            if (!matchedDeviceId)
                log::warning("No capture device matching '{}' found, falling back to auto-select", deviceName);
        }

        // Monitor sources are loopbacks of the speaker output, not microphones
        if (!matchedDeviceId)
        {
            for (auto i = ma_uint32 { 0 }; i < captureCount; ++i)
            {
                if (!toLower(pCaptureDevices[i].name).starts_with("monitor"))
                {
                    matchedDeviceId = pCaptureDevices[i].id;
                    break;
                }
            }
        }
    }
    else
    {
        log::warning("Failed to enumerate capture devices (code: {}), using default",
                     static_cast<int>(enumResult));
    }

    auto deviceConfig = ma_device_config_init(ma_device_type_capture);
    deviceConfig.capture.format = ma_format_f32;
    deviceConfig.capture.channels = 1;
    deviceConfig.sampleRate = _impl->config.sampleRate;
    deviceConfig.dataCallback = audioDataCallback;
    deviceConfig.pUserData = _impl.get();

    if (matchedDeviceId)
        deviceConfig.capture.pDeviceID = &*matchedDeviceId;

    auto const result = ma_device_init(&_impl->context, &deviceConfig, &_impl->device);
    if (result != MA_SUCCESS)
        return makeError(ErrorCode::CaptureError,
                         std::format("Failed to initialize capture device: {}", static_cast<int>(result)));

    _impl->deviceInitialized = true;
    log::info("Audio capture device: {} ({} Hz, mono, float32)",
              _impl->device.capture.name,
              _impl->config.sampleRate);
    return {};
}

auto AudioCapture::start(AudioCallback callback) -> VoidResult
{
    if (_impl->capturing.load())
        return makeError(ErrorCode::StateError, "Audio capture already running");

    if (!_impl->deviceInitialized)
    {
        if (auto result = openDevice(); !result)
            return result;
    }

    _impl->callback = std::move(callback);
    _impl->capturing.store(true, std::memory_order_release);

    auto const result = ma_device_start(&_impl->device);
    if (result != MA_SUCCESS)
    {
        _impl->capturing.store(false);
        return makeError(ErrorCode::CaptureError,
                         std::format("Failed to start audio capture: {}", static_cast<int>(result)));
    }

    log::info("Audio capture started");
    return {};
}

void AudioCapture::stop()
{
    if (!_impl->capturing.exchange(false))
        return;

    // ma_device_stop() waits for an in-flight data callback to return
    ma_device_stop(&_impl->device);
    _impl->peakLevel.store(0.0f, std::memory_order_relaxed);
    log::info("Audio capture stopped");
}

auto AudioCapture::isCapturing() const -> bool
{
    return _impl->capturing.load();
}

auto AudioCapture::sampleRate() const -> uint32_t
{
    return _impl->config.sampleRate;
}

auto AudioCapture::peakLevel() const -> float
{
    return _impl->peakLevel.load(std::memory_order_relaxed);
}

} // namespace meetlink
