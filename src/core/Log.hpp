// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <format>
#include <functional>
#include <optional>
#include <string_view>

namespace meetlink::log
{

enum class Level
{
    Error,
    Warning,
    Info,
    Debug,
    Trace,
};

/// @brief Sink for formatted log lines; receives the text without timestamp or level tag.
using LogCallback = std::function<void(Level level, std::string_view message)>;

/// @brief Routes log lines to @p callback instead of stderr. An empty callback restores stderr.
void setCallback(LogCallback callback);

void setLevel(Level level);
[[nodiscard]] auto getLevel() -> Level;

/// @brief True if messages at @p level pass the current threshold.
[[nodiscard]] inline auto enabled(Level level) -> bool
{
    return level <= getLevel();
}

/// @brief Parses a level name ("error", "warning"/"warn", "info", "debug", "trace"), case-insensitive.
[[nodiscard]] auto parseLevel(std::string_view name) -> std::optional<Level>;

/// @brief Writes one line. Safe from any thread; capture, connection and playback threads all log.
void write(Level level, std::string_view message);

/// @brief Formats and writes at @p level; formatting is skipped when the level is filtered out.
template <typename... Args>
void at(Level level, std::format_string<Args...> fmt, Args&&... args)
{
    if (enabled(level))
        write(level, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void error(std::format_string<Args...> fmt, Args&&... args)
{
    at(Level::Error, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void warning(std::format_string<Args...> fmt, Args&&... args)
{
    at(Level::Warning, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void info(std::format_string<Args...> fmt, Args&&... args)
{
    at(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void debug(std::format_string<Args...> fmt, Args&&... args)
{
    at(Level::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void trace(std::format_string<Args...> fmt, Args&&... args)
{
    at(Level::Trace, fmt, std::forward<Args>(args)...);
}

} // namespace meetlink::log
