#include "wkvm_quality.hpp"

#include <algorithm>
#include <map>

namespace wkvm
{

static const std::map<std::string, QualitySettings> presets = {
    {"high-quality", {0, 0}},
    {"balanced", {6, 2}},
    {"high-performance", {9, 9}},
    {"mobile", {7, 5}},
};

static int clampLevel(int level)
{
    return std::clamp(level, Quality::minLevel, Quality::maxLevel);
}

Quality::Quality(int q, int c) :
    settings{clampLevel(q), clampLevel(c)}, degradedSamples(0),
    excellentSamples(0)
{}

bool Quality::improveQuality()
{
    return set(settings.qualityLevel - 1, settings.compressionLevel - 1);
}

bool Quality::improvePerformance()
{
    return set(settings.qualityLevel + 1, settings.compressionLevel + 1);
}

bool Quality::set(int q, int c)
{
    QualitySettings next{clampLevel(q), clampLevel(c)};

    if (next == settings)
    {
        return false;
    }

    settings = next;
    return true;
}

bool Quality::applyPreset(const std::string& name)
{
    auto it = presets.find(name);

    if (it == presets.end())
    {
        return false;
    }

    set(it->second.qualityLevel, it->second.compressionLevel);
    return true;
}

bool Quality::adapt(ConnectionQuality sample)
{
    switch (sample)
    {
        case ConnectionQuality::poor:
        case ConnectionQuality::critical:
            excellentSamples = 0;
            if (++degradedSamples >= degradeAfter)
            {
                degradedSamples = 0;
                return improvePerformance();
            }
            break;
        case ConnectionQuality::excellent:
            degradedSamples = 0;
            if (++excellentSamples >= recoverAfter)
            {
                excellentSamples = 0;
                return improveQuality();
            }
            break;
        case ConnectionQuality::good:
            degradedSamples = 0;
            excellentSamples = 0;
            break;
    }

    return false;
}

} // namespace wkvm
