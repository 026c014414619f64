#pragma once

/*
    ALKAHEST RENDER CORE

    FILE: pixel_format.hpp
    MODULE: gfx
    PURPOSE: Texture formats used by the G-buffer, shadow maps and lookup targets.
*/


#include <cstdint>

namespace alk
{
    enum class PixelFormat : uint8_t
    {
        Unknown = 0,
        R8_UNORM,
        R32_FLOAT,
        R32_TYPELESS,
        D32_FLOAT,
        R10G10B10A2_UNORM,
        R11G11B10_FLOAT,
        B8G8R8A8_UNORM,
        B8G8R8A8_UNORM_SRGB,
        R8G8B8A8_UNORM,
        R8G8B8A8_UNORM_SRGB,
        R16G16B16A16_FLOAT,
        R32G32B32A32_FLOAT
    };

    inline const char* pixel_format_name(PixelFormat f)
    {
        switch (f)
        {
            case PixelFormat::R8_UNORM: return "R8_UNORM";
            case PixelFormat::R32_FLOAT: return "R32_FLOAT";
            case PixelFormat::R32_TYPELESS: return "R32_TYPELESS";
            case PixelFormat::D32_FLOAT: return "D32_FLOAT";
            case PixelFormat::R10G10B10A2_UNORM: return "R10G10B10A2_UNORM";
            case PixelFormat::R11G11B10_FLOAT: return "R11G11B10_FLOAT";
            case PixelFormat::B8G8R8A8_UNORM: return "B8G8R8A8_UNORM";
            case PixelFormat::B8G8R8A8_UNORM_SRGB: return "B8G8R8A8_UNORM_SRGB";
            case PixelFormat::R8G8B8A8_UNORM: return "R8G8B8A8_UNORM";
            case PixelFormat::R8G8B8A8_UNORM_SRGB: return "R8G8B8A8_UNORM_SRGB";
            case PixelFormat::R16G16B16A16_FLOAT: return "R16G16B16A16_FLOAT";
            case PixelFormat::R32G32B32A32_FLOAT: return "R32G32B32A32_FLOAT";
            case PixelFormat::Unknown:
            default:
                return "Unknown";
        }
    }

    // Number of stored components per texel.
    inline uint32_t pixel_format_channels(PixelFormat f)
    {
        switch (f)
        {
            case PixelFormat::R8_UNORM:
            case PixelFormat::R32_FLOAT:
            case PixelFormat::R32_TYPELESS:
            case PixelFormat::D32_FLOAT:
                return 1;
            case PixelFormat::R11G11B10_FLOAT:
                return 3;
            case PixelFormat::Unknown:
                return 0;
            default:
                return 4;
        }
    }

    inline uint32_t pixel_format_bytes(PixelFormat f)
    {
        switch (f)
        {
            case PixelFormat::R8_UNORM: return 1;
            case PixelFormat::R16G16B16A16_FLOAT: return 8;
            case PixelFormat::R32G32B32A32_FLOAT: return 16;
            case PixelFormat::Unknown: return 0;
            default: return 4;
        }
    }

    inline bool pixel_format_is_depth(PixelFormat f)
    {
        return f == PixelFormat::D32_FLOAT || f == PixelFormat::R32_TYPELESS;
    }
}
