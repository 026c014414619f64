#pragma once

/*
    ALKAHEST RENDER CORE

    FILE: extent.hpp
    MODULE: gfx
    PURPOSE: 2D pixel extent and zero-size clamping for device resources.
*/


#include <cstdint>
#include <string>

#include "alk/core/log.hpp"

namespace alk
{
    struct Extent2D
    {
        uint32_t width = 0;
        uint32_t height = 0;

        constexpr bool empty() const { return width == 0 || height == 0; }

        friend constexpr bool operator==(Extent2D a, Extent2D b) { return a.width == b.width && a.height == b.height; }
        friend constexpr bool operator!=(Extent2D a, Extent2D b) { return !(a == b); }
    };

    inline std::string to_string(Extent2D e)
    {
        return std::to_string(e.width) + "x" + std::to_string(e.height);
    }

    // Zero dimensions are accepted and clamped to the format minimum.
    inline Extent2D clamp_extent(Extent2D requested, uint32_t minimum, const std::string& resource_name)
    {
        if (!requested.empty()) return requested;
        log_warn("Zero size render target requested for " + resource_name + ", using " +
            std::to_string(minimum) + "x" + std::to_string(minimum));
        return Extent2D{minimum, minimum};
    }
}
