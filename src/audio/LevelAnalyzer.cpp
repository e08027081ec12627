// SPDX-License-Identifier: Apache-2.0
#include "LevelAnalyzer.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace meetlink
{

LevelAnalyzer::LevelAnalyzer(LevelAnalyzerConfig config): _config(config)
{
    _config.smoothingWindow = std::max<std::size_t>(1, _config.smoothingWindow);
}

auto LevelAnalyzer::rawLevel(std::span<const float> frame) -> float
{
    if (frame.empty())
        return 0.0f;

    auto energy = 0.0;
    for (auto const sample: frame)
    {
        auto const clamped = std::clamp(static_cast<double>(sample), -1.0, 1.0);
        energy += clamped * clamped;
    }

    auto const rms = std::sqrt(energy / static_cast<double>(frame.size()));
    if (rms <= 0.0)
        return 0.0f;

    auto const db = static_cast<float>(20.0 * std::log10(rms));
    auto const normalized = (db - FloorDb) / -FloorDb;
    return std::clamp(normalized * 100.0f, 0.0f, 100.0f);
}

auto LevelAnalyzer::measure(std::span<const float> frame) const -> ActivityLevel
{
    auto const level = rawLevel(frame);
    return ActivityLevel { .level = level, .isActive = level > 0.0f && level >= _config.activityThreshold };
}

auto LevelAnalyzer::sample(std::span<const float> frame) -> ActivityLevel
{
    _history.push_back(rawLevel(frame));
    while (_history.size() > _config.smoothingWindow)
        _history.pop_front();

    auto const level = std::accumulate(_history.begin(), _history.end(), 0.0f)
                       / static_cast<float>(_history.size());

    return ActivityLevel { .level = level, .isActive = level > 0.0f && level >= _config.activityThreshold };
}

void LevelAnalyzer::reset()
{
    _history.clear();
}

} // namespace meetlink
