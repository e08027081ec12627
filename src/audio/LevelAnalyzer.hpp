// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>

#include <cstddef>
#include <deque>
#include <span>

namespace meetlink
{

/// @brief Configuration for the level analyzer.
struct LevelAnalyzerConfig
{
    /// @brief Level (0..100) at or above which a frame counts as active speech.
    float activityThreshold = 30.0f;

    /// @brief Number of recent frames averaged into the reported level (1 = no smoothing).
    std::size_t smoothingWindow = 1;
};

/// @brief Energy-based activity meter for raw capture frames.
///
/// The RMS magnitude of a frame is converted to dBFS against the float full-scale range
/// and mapped linearly from [-60 dBFS, 0 dBFS] onto [0, 100].
class LevelAnalyzer
{
  public:
    static constexpr auto FloorDb = -60.0f;

    explicit LevelAnalyzer(LevelAnalyzerConfig config = {});

    /// @brief Analyzes one frame and updates the smoothing history.
    /// @param frame Float32 PCM samples in [-1, 1].
    /// @return The smoothed level. Empty or all-zero input yields level 0, inactive.
    [[nodiscard]] auto sample(std::span<const float> frame) -> ActivityLevel;

    /// @brief Analyzes a frame without touching the smoothing history.
    [[nodiscard]] auto measure(std::span<const float> frame) const -> ActivityLevel;

    /// @brief Clears the smoothing history (call between sessions).
    void reset();

    [[nodiscard]] auto config() const noexcept -> const LevelAnalyzerConfig& { return _config; }

    /// @brief Maps a frame to a raw 0..100 level without smoothing or thresholding.
    [[nodiscard]] static auto rawLevel(std::span<const float> frame) -> float;

  private:
    LevelAnalyzerConfig _config;
    std::deque<float> _history;
};

} // namespace meetlink
