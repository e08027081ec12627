// SPDX-License-Identifier: Apache-2.0
#include <meetlink/Config.hpp>

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>

using namespace meetlink;

TEST_CASE("defaultConfigDir returns a non-empty path", "[config]")
{
    auto const dir = defaultConfigDir();
    REQUIRE(!dir.empty());
}

TEST_CASE("defaultConfigPath returns a path ending with config.json", "[config]")
{
    auto const path = defaultConfigPath();
    REQUIRE(path.ends_with("config.json"));
}

TEST_CASE("AppConfig has expected defaults", "[config]")
{
    auto const config = AppConfig {};
    CHECK(config.session.reconnectDelayMs == 5000);
    CHECK(config.audio.sampleRate == 16000);
    CHECK(config.audio.chunkDurationMs == 1000);
    CHECK(config.segmentation.silenceTimeoutMs == 500);
    CHECK(config.segmentation.maxSegmentMs == 10000);
    CHECK(config.playback.enabled);
    CHECK(config.playback.muteWhileSpeaking);
    CHECK(config.logLevel == "info");
    CHECK(validateConfig(config).has_value());
}

TEST_CASE("loadConfigFromFile parses valid JSON config", "[config]")
{
    auto const tempPath = std::filesystem::temp_directory_path() / "meetlink_test_config.json";
    {
        auto file = std::ofstream(tempPath);
        file << R"({
            "server": { "url": "wss://assistant.example.org/ws" },
            "session": { "reconnectDelayMs": 2500 },
            "audio": {
                "deviceName": "USB",
                "sampleRate": 48000,
                "chunkDurationMs": 250,
                "activityThreshold": 45.5,
                "smoothingWindow": 4,
                "speakerName": "alice"
            },
            "segmentation": {
                "silenceTimeoutMs": 700,
                "maxSegmentMs": 8000,
                "spoolDirectory": "/tmp/segments"
            },
            "playback": { "enabled": false, "muteWhileSpeaking": false },
            "log": { "level": "debug" }
        })";
    }

    auto result = loadConfigFromFile(tempPath.string());
    REQUIRE(result.has_value());

    auto const& config = *result;

    SECTION("server and session")
    {
        CHECK(config.server.url == "wss://assistant.example.org/ws");
        CHECK(config.session.reconnectDelayMs == 2500);
    }

    SECTION("audio")
    {
        CHECK(config.audio.deviceName == "USB");
        CHECK(config.audio.sampleRate == 48000);
        CHECK(config.audio.chunkDurationMs == 250);
        CHECK(config.audio.activityThreshold == 45.5f);
        CHECK(config.audio.smoothingWindow == 4);
        CHECK(config.audio.speakerName == "alice");
    }

    SECTION("segmentation and playback")
    {
        CHECK(config.segmentation.silenceTimeoutMs == 700);
        CHECK(config.segmentation.maxSegmentMs == 8000);
        CHECK(config.segmentation.spoolDirectory == "/tmp/segments");
        CHECK(!config.playback.enabled);
        CHECK(!config.playback.muteWhileSpeaking);
        CHECK(config.logLevel == "debug");
    }

    std::filesystem::remove(tempPath);
}

TEST_CASE("loadConfigFromFile keeps defaults for missing sections", "[config]")
{
    auto const tempPath = std::filesystem::temp_directory_path() / "meetlink_test_partial.json";
    {
        auto file = std::ofstream(tempPath);
        file << R"({ "segmentation": { "silenceTimeoutMs": 300 } })";
    }

    auto result = loadConfigFromFile(tempPath.string());
    REQUIRE(result.has_value());
    CHECK(result->segmentation.silenceTimeoutMs == 300);
    CHECK(result->segmentation.maxSegmentMs == 10000);
    CHECK(result->server.url == AppConfig {}.server.url);

    std::filesystem::remove(tempPath);
}

TEST_CASE("loadConfigFromFile reports missing and malformed files", "[config]")
{
    auto missing = loadConfigFromFile("/nonexistent/path/config.json");
    REQUIRE(!missing.has_value());
    CHECK(missing.error().code == ErrorCode::ConfigError);

    auto const tempPath = std::filesystem::temp_directory_path() / "meetlink_test_malformed.json";
    {
        auto file = std::ofstream(tempPath);
        file << "{ this is not json";
    }

    auto malformed = loadConfigFromFile(tempPath.string());
    REQUIRE(!malformed.has_value());
    CHECK(malformed.error().code == ErrorCode::ParseError);

    std::filesystem::remove(tempPath);
}

TEST_CASE("saveConfigToFile round-trips through loadConfigFromFile", "[config]")
{
    auto const tempDir = std::filesystem::temp_directory_path() / "meetlink_test_save";
    auto const tempPath = tempDir / "config.json";
    std::filesystem::remove_all(tempDir);

    auto config = AppConfig {};
    config.server.url = "ws://10.0.0.5:9000/live";
    config.audio.speakerName = "bob";
    config.segmentation.maxSegmentMs = 6000;
    config.playback.muteWhileSpeaking = false;

    REQUIRE(saveConfigToFile(tempPath.string(), config).has_value());

    auto loaded = loadConfigFromFile(tempPath.string());
    REQUIRE(loaded.has_value());
    CHECK(loaded->server.url == "ws://10.0.0.5:9000/live");
    CHECK(loaded->audio.speakerName == "bob");
    CHECK(loaded->segmentation.maxSegmentMs == 6000);
    CHECK(!loaded->playback.muteWhileSpeaking);

    std::filesystem::remove_all(tempDir);
}

TEST_CASE("validateConfig rejects out-of-range values", "[config]")
{
    auto config = AppConfig {};

    SECTION("non-WebSocket URL")
    {
        config.server.url = "http://localhost:8000";
    }
    SECTION("non-positive reconnect delay")
    {
        config.session.reconnectDelayMs = 0;
    }
    SECTION("non-positive chunk duration")
    {
        config.audio.chunkDurationMs = -5;
    }
    SECTION("threshold above 100")
    {
        config.audio.activityThreshold = 120.0f;
    }
    SECTION("zero silence timeout")
    {
        config.segmentation.silenceTimeoutMs = 0;
    }
    SECTION("speaker name that is not UTF-8")
    {
        config.audio.speakerName = "caf\xe9";
    }
    SECTION("unknown log level")
    {
        config.logLevel = "chatty";
    }

    auto result = validateConfig(config);
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConfigError);
}
