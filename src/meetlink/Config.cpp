// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <session/WebSocketConnection.hpp>

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

namespace meetlink
{

namespace
{

    /// Text fields end up in JSON frames and files, which must be valid UTF-8.
    auto isValidUtf8(const std::string& text) -> bool
    {
        try
        {
            (void) nlohmann::json(text).dump();
            return true;
        }
        catch (const nlohmann::json::type_error&)
        {
            return false;
        }
    }

} // namespace

auto defaultConfigDir() -> std::string
{
#ifdef _WIN32
    auto const* const appData = std::getenv("APPDATA");
    if (appData)
        return std::string(appData) + "\\meetlink";
    return ".";
#elif defined(__APPLE__)
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/Library/Application Support/meetlink";
    return ".";
#else
    auto const* const xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig)
        return std::string(xdgConfig) + "/meetlink";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.config/meetlink";
    return ".";
#endif
}

auto defaultConfigPath() -> std::string
{
    return defaultConfigDir() + "/config.json";
}

auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>
{
    auto file = std::ifstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot open config file: {}", path));

    auto ss = std::stringstream {};
    ss << file.rdbuf();

    auto parseResult = json::parse(ss.str());
    if (!parseResult)
        return std::unexpected(parseResult.error());

    auto const& root = *parseResult;
    if (!root.is_object())
        return makeError(ErrorCode::ConfigError, std::format("Config file {} is not a JSON object", path));

    auto config = AppConfig {};
    auto const defaults = AppConfig {};

    if (root.contains("server"))
    {
        auto const& server = root["server"];
        config.server.url = json::getStringOr(server, "url", defaults.server.url);
    }

    if (root.contains("session"))
    {
        auto const& session = root["session"];
        config.session.reconnectDelayMs =
            json::getIntOr(session, "reconnectDelayMs", defaults.session.reconnectDelayMs);
    }

    if (root.contains("audio"))
    {
        auto const& audio = root["audio"];
        config.audio.deviceName = json::getStringOr(audio, "deviceName", "");
        config.audio.sampleRate = static_cast<uint32_t>(
            json::getIntOr(audio, "sampleRate", static_cast<int>(defaults.audio.sampleRate)));
        config.audio.chunkDurationMs = json::getIntOr(audio, "chunkDurationMs", defaults.audio.chunkDurationMs);
        config.audio.activityThreshold =
            json::getFloatOr(audio, "activityThreshold", defaults.audio.activityThreshold);
        config.audio.smoothingWindow = json::getIntOr(audio, "smoothingWindow", defaults.audio.smoothingWindow);
        config.audio.speakerName = json::getStringOr(audio, "speakerName", "");
    }

    if (root.contains("segmentation"))
    {
        auto const& segmentation = root["segmentation"];
        config.segmentation.silenceTimeoutMs =
            json::getIntOr(segmentation, "silenceTimeoutMs", defaults.segmentation.silenceTimeoutMs);
        config.segmentation.maxSegmentMs =
            json::getIntOr(segmentation, "maxSegmentMs", defaults.segmentation.maxSegmentMs);
        config.segmentation.spoolDirectory = json::getStringOr(segmentation, "spoolDirectory", "");
    }

    if (root.contains("playback"))
    {
        auto const& playback = root["playback"];
        config.playback.enabled = json::getBoolOr(playback, "enabled", defaults.playback.enabled);
        config.playback.muteWhileSpeaking =
            json::getBoolOr(playback, "muteWhileSpeaking", defaults.playback.muteWhileSpeaking);
    }

    if (root.contains("log"))
        config.logLevel = json::getStringOr(root["log"], "level", defaults.logLevel);

    return config;
}

auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult
{
    auto root = nlohmann::json::object();

    root["server"] = { { "url", config.server.url } };
    root["session"] = { { "reconnectDelayMs", config.session.reconnectDelayMs } };

    auto audio = nlohmann::json::object();
    if (!config.audio.deviceName.empty())
        audio["deviceName"] = config.audio.deviceName;
    audio["sampleRate"] = config.audio.sampleRate;
    audio["chunkDurationMs"] = config.audio.chunkDurationMs;
    audio["activityThreshold"] = config.audio.activityThreshold;
    audio["smoothingWindow"] = config.audio.smoothingWindow;
    if (!config.audio.speakerName.empty())
        audio["speakerName"] = config.audio.speakerName;
    root["audio"] = std::move(audio);

    auto segmentation = nlohmann::json::object();
    segmentation["silenceTimeoutMs"] = config.segmentation.silenceTimeoutMs;
    segmentation["maxSegmentMs"] = config.segmentation.maxSegmentMs;
    if (!config.segmentation.spoolDirectory.empty())
        segmentation["spoolDirectory"] = config.segmentation.spoolDirectory;
    root["segmentation"] = std::move(segmentation);

    root["playback"] = {
        { "enabled", config.playback.enabled },
        { "muteWhileSpeaking", config.playback.muteWhileSpeaking },
    };
    root["log"] = { { "level", config.logLevel } };

    auto const dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        auto ec = std::error_code {};
        std::filesystem::create_directories(dir, ec);
        if (ec)
            return makeError(
                ErrorCode::ConfigError,
                std::format("Failed to create config directory '{}': {}", dir.string(), ec.message()));
    }

    auto file = std::ofstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot write config file: {}", path));

    file << root.dump(4, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
    return {};
}

auto validateConfig(const AppConfig& config) -> VoidResult
{
    if (auto url = parseWebSocketUrl(config.server.url); !url)
        return makeError(ErrorCode::ConfigError, std::format("server.url: {}", url.error().message));

    if (config.session.reconnectDelayMs <= 0)
        return makeError(ErrorCode::ConfigError, "session.reconnectDelayMs must be positive");

    if (config.audio.sampleRate < 8000 || config.audio.sampleRate > 192000)
        return makeError(ErrorCode::ConfigError,
                         std::format("audio.sampleRate {} is out of range", config.audio.sampleRate));

    if (config.audio.chunkDurationMs <= 0)
        return makeError(ErrorCode::ConfigError, "audio.chunkDurationMs must be positive");

    if (config.audio.activityThreshold < 0.0f || config.audio.activityThreshold > 100.0f)
        return makeError(ErrorCode::ConfigError, "audio.activityThreshold must be within 0..100");

    if (config.audio.smoothingWindow <= 0)
        return makeError(ErrorCode::ConfigError, "audio.smoothingWindow must be positive");

    if (config.segmentation.silenceTimeoutMs <= 0)
        return makeError(ErrorCode::ConfigError, "segmentation.silenceTimeoutMs must be positive");

    if (config.segmentation.maxSegmentMs <= 0)
        return makeError(ErrorCode::ConfigError, "segmentation.maxSegmentMs must be positive");

    if (!isValidUtf8(config.audio.speakerName))
        return makeError(ErrorCode::ConfigError, "audio.speakerName is not valid UTF-8");

    if (!isValidUtf8(config.audio.deviceName))
        return makeError(ErrorCode::ConfigError, "audio.deviceName is not valid UTF-8");

    if (!log::parseLevel(config.logLevel))
        return makeError(ErrorCode::ConfigError, std::format("log.level '{}' is not a log level", config.logLevel));

    return {};
}

auto loadConfig() -> Result<AppConfig>
{
    auto const path = defaultConfigPath();
    if (!std::filesystem::exists(path))
    {
        log::info("No config file found at {}, using defaults", path);
        return AppConfig {};
    }

    return loadConfigFromFile(path);
}

} // namespace meetlink
