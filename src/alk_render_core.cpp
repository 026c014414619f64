/*
    ALKAHEST RENDER CORE

    FILE: alk_render_core.cpp
    MODULE: alk-render-core
    PURPOSE: Compiled library target anchor translation unit.
*/

#include "alk/render/renderer.hpp"
#include "alk/render/shadow_scheduler.hpp"
#include "alk/gfx/sw_gpu_device.hpp"
#include "alk/gfx/vulkan/vk_gpu_device.hpp"

namespace alk
{
    int alk_render_core_compiled_target_anchor()
    {
        return 0;
    }
}
