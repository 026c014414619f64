#pragma once

/*
    ALKAHEST RENDER CORE

    FILE: gpu_handles.hpp
    MODULE: gfx
    PURPOSE: Type-safe ids for device-owned objects instead of raw native pointers.
*/


#include <cstdint>

namespace alk
{
    struct GpuHandle
    {
        uint32_t id = 0; // 0 = invalid
        constexpr bool valid() const { return id != 0; }
    };

    // Compile-time type separation only
    struct TextureHandle : GpuHandle {};
    struct ViewHandle : GpuHandle {};
    struct BufferHandle : GpuHandle {};
    struct ShaderHandle : GpuHandle {};
    struct DepthStencilStateHandle : GpuHandle {};

    template<typename H>
    constexpr bool same_handle(H a, H b)
    {
        return a.id == b.id;
    }
}
