// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <meetlink/App.hpp>
#include <meetlink/Config.hpp>

#include <CLI/CLI.hpp>

#include <format>

int main(int argc, char** argv)
{
    auto app = CLI::App { "meetlink: stream live microphone audio to a meeting assistant back-end" };

    auto configPath = std::string {};
    auto url = std::string {};
    auto deviceName = std::string {};
    auto chunkMs = 0;
    auto silenceMs = 0;
    auto maxSegmentMs = 0;
    auto reconnectMs = 0;
    auto spoolDirectory = std::string {};
    auto noPlayback = false;
    auto verbose = false;
    auto writeConfig = false;

    app.add_option("-c,--config", configPath, "Path to config file");
    app.add_option("-u,--url", url, "Back-end WebSocket URL (ws:// or wss://)");
    app.add_option("--device", deviceName, "Capture device name (substring match)");
    app.add_option("--chunk-ms", chunkMs, "Audio chunk duration in milliseconds");
    app.add_option("--silence-ms", silenceMs, "Silence that closes a segment, in milliseconds");
    app.add_option("--max-segment-ms", maxSegmentMs, "Maximum segment duration in milliseconds");
    app.add_option("--reconnect-ms", reconnectMs, "Delay before reconnecting, in milliseconds");
    app.add_option("--spool", spoolDirectory, "Directory to write closed segments to as WAV files");
    app.add_flag("--no-playback", noPlayback, "Do not play response audio");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");
    app.add_flag("--write-config", writeConfig, "Write the effective configuration to the config file and exit");

    CLI11_PARSE(app, argc, argv);

    if (verbose)
        meetlink::log::setLevel(meetlink::log::Level::Debug);

    auto configResult = configPath.empty() ? meetlink::loadConfig() : meetlink::loadConfigFromFile(configPath);
    if (!configResult)
    {
        meetlink::log::error("Failed to load config: {}", configResult.error().message);
        return 1;
    }

    auto& config = *configResult;

    // Apply CLI overrides
    if (!url.empty())
        config.server.url = url;
    if (!deviceName.empty())
        config.audio.deviceName = deviceName;
    if (chunkMs > 0)
        config.audio.chunkDurationMs = chunkMs;
    if (silenceMs > 0)
        config.segmentation.silenceTimeoutMs = silenceMs;
    if (maxSegmentMs > 0)
        config.segmentation.maxSegmentMs = maxSegmentMs;
    if (reconnectMs > 0)
        config.session.reconnectDelayMs = reconnectMs;
    if (!spoolDirectory.empty())
        config.segmentation.spoolDirectory = spoolDirectory;
    if (noPlayback)
        config.playback.enabled = false;

    if (auto valid = meetlink::validateConfig(config); !valid)
    {
        meetlink::log::error("Invalid configuration: {}", valid.error().message);
        return 1;
    }

    if (!verbose)
    {
        if (auto const level = meetlink::log::parseLevel(config.logLevel))
            meetlink::log::setLevel(*level);
    }

    if (writeConfig)
    {
        auto const path = configPath.empty() ? meetlink::defaultConfigPath() : configPath;
        if (auto saved = meetlink::saveConfigToFile(path, config); !saved)
        {
            meetlink::log::error("Failed to write config: {}", saved.error().message);
            return 1;
        }
        meetlink::log::info("Configuration written to {}", path);
        return 0;
    }

    auto application = meetlink::App(std::move(config));
    auto initResult = application.initialize();
    if (!initResult)
    {
        meetlink::log::error("Initialization failed: {}", initResult.error().message);
        return 1;
    }

    return application.run();
}
