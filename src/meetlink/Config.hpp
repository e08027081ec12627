// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace meetlink
{

/// @brief Back-end endpoint section.
struct ServerConfig
{
    std::string url = "ws://localhost:8000/ws";
};

/// @brief Session transport section.
struct SessionConfig
{
    int reconnectDelayMs = 5000;
};

/// @brief Audio capture section.
struct AudioConfig
{
    std::string deviceName;
    uint32_t sampleRate = 16000;
    int chunkDurationMs = 1000;
    float activityThreshold = 30.0f;
    int smoothingWindow = 1;

    /// @brief Attached to every chunk as its speaker hint; empty for the implicit speaker.
    std::string speakerName;
};

/// @brief Utterance segmentation section.
struct SegmentationSection
{
    int silenceTimeoutMs = 500;
    int maxSegmentMs = 10000;

    /// @brief Directory closed segments are written to as WAV files. Empty: log only.
    std::string spoolDirectory;
};

/// @brief Response audio playback section.
struct PlaybackConfig
{
    bool enabled = true;

    /// @brief Mutes the microphone while response audio plays, so the mic does not pick it up.
    bool muteWhileSpeaking = true;
};

/// @brief Top-level application configuration.
struct AppConfig
{
    ServerConfig server;
    SessionConfig session;
    AudioConfig audio;
    SegmentationSection segmentation;
    PlaybackConfig playback;
    std::string logLevel = "info";
};

/// @brief Loads the application configuration from the default config path.
///
/// A missing file is not an error; the defaults are returned instead.
/// @return The loaded configuration or an error.
[[nodiscard]] auto loadConfig() -> Result<AppConfig>;

/// @brief Loads the application configuration from a specific file path.
/// @param path The path to the config file.
/// @return The loaded configuration, or a ConfigError / ParseError.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>;

/// @brief Saves the application configuration to a file, creating its directory if needed.
[[nodiscard]] auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult;

/// @brief Checks value ranges and the server URL.
/// @return Success or a ConfigError naming the first offending field.
[[nodiscard]] auto validateConfig(const AppConfig& config) -> VoidResult;

/// @brief Returns the default config directory path for the current platform.
/// On Linux: $XDG_CONFIG_HOME/meetlink or ~/.config/meetlink
[[nodiscard]] auto defaultConfigDir() -> std::string;

/// @brief Returns the default config file path for the current platform.
[[nodiscard]] auto defaultConfigPath() -> std::string;

} // namespace meetlink
