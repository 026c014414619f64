#pragma once

/*
    ALKAHEST RENDER CORE

    FILE: shadow_quality.hpp
    MODULE: render
    PURPOSE: Shadow quality tiers and their PCF sample count / map resolution.
*/


#include <cstdint>
#include <optional>
#include <string_view>

namespace alk
{
    enum class ShadowQuality : uint8_t
    {
        Off = 0,
        Lowest = 1,
        Low = 2,
        Medium = 3,
        High = 4,
        Highest = 5
    };

    enum class ShadowPcfSamples : uint8_t
    {
        Samples13 = 13,
        Samples17 = 17,
        Samples21 = 21
    };

    inline ShadowPcfSamples shadow_pcf_samples(ShadowQuality q)
    {
        switch (q)
        {
            case ShadowQuality::Off:
            case ShadowQuality::Lowest:
            case ShadowQuality::Low:
                return ShadowPcfSamples::Samples13;
            case ShadowQuality::Medium:
                return ShadowPcfSamples::Samples17;
            case ShadowQuality::High:
            case ShadowQuality::Highest:
                return ShadowPcfSamples::Samples21;
        }
        return ShadowPcfSamples::Samples13;
    }

    inline uint32_t shadow_resolution(ShadowQuality q)
    {
        switch (q)
        {
            case ShadowQuality::Off:
            case ShadowQuality::Lowest:
                return 256;
            case ShadowQuality::Low: return 512;
            case ShadowQuality::Medium: return 1024;
            case ShadowQuality::High: return 2048;
            case ShadowQuality::Highest: return 4096;
        }
        return 256;
    }

    inline const char* shadow_quality_name(ShadowQuality q)
    {
        switch (q)
        {
            case ShadowQuality::Off: return "off";
            case ShadowQuality::Lowest: return "lowest";
            case ShadowQuality::Low: return "low";
            case ShadowQuality::Medium: return "medium";
            case ShadowQuality::High: return "high";
            case ShadowQuality::Highest: return "highest";
        }
        return "unknown";
    }

    inline std::optional<ShadowQuality> parse_shadow_quality(std::string_view s)
    {
        for (uint8_t i = 0; i <= static_cast<uint8_t>(ShadowQuality::Highest); ++i)
        {
            const ShadowQuality q = static_cast<ShadowQuality>(i);
            if (s == shadow_quality_name(q)) return q;
        }
        return std::nullopt;
    }
}
