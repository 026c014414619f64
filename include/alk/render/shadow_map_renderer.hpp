#pragma once

/*
    ALKAHEST RENDER CORE

    FILE: shadow_map_renderer.hpp
    MODULE: render
    PURPOSE: Per-light shadow state: update bookkeeping, light camera and a
            two-layer depth map (stationary cache, stationary + moving).
*/


#include <cstdint>
#include <string>
#include <utility>

#include "alk/core/result.hpp"
#include "alk/gfx/shadow_depth_map.hpp"
#include "alk/render/render_context.hpp"
#include "alk/render/shadow_quality.hpp"
#include "alk/tfx/externs.hpp"

namespace alk
{
    constexpr uint32_t kShadowStationaryLayer = 0;
    constexpr uint32_t kShadowCombinedLayer = 1;

    class ShadowMapRenderer
    {
    public:
        ShadowMapRenderer() = default;

        ShadowMapRenderer(uint32_t view_slot_, const ViewExtern& light_view_)
            : view_slot(view_slot_), light_view(light_view_)
        {}

        // Recreates the depth map when the quality tier changes the resolution.
        Status ensure_resolution(IGpuDevice& gpu, ShadowQuality quality, const std::string& name)
        {
            const uint32_t res = shadow_resolution(quality);
            if (depth.valid() && depth.resolution() == res) return Status::success();

            auto created = ShadowDepthMap::create(gpu, res, 2, name);
            if (!created.ok) return Status::failure(created.error);
            depth = std::move(created.value);
            stationary_needs_update = true;
            return Status::success();
        }

        void mark_stationary_dirty() { stationary_needs_update = true; }

        // Binds the light camera and the layer the given pass renders into.
        void bind_for_generation(RenderContext& ctx, ShadowGenerationMode mode) const
        {
            ctx.bind_view(view_slot, light_view);
            ctx.active_shadow_generation_mode = mode;

            const bool flipped = ctx.depth_mode == DepthMode::Flipped;
            const float far_depth = flipped ? 1.0f : 0.0f;

            uint32_t layer = kShadowCombinedLayer;
            if (mode == ShadowGenerationMode::StationaryOnly)
            {
                layer = kShadowStationaryLayer;
                depth.clear_layer(layer, far_depth);
            }
            else
            {
                depth.copy_layer(kShadowCombinedLayer, kShadowStationaryLayer);
            }

            ctx.gpu.unbind_shader_resources();
            ctx.gpu.set_render_targets({}, depth.layer_dsv(layer));
            ctx.gpu.set_depth_stencil_state(depth.state(flipped));
            ctx.gpu.set_viewport(depth.viewport());
        }

        uint64_t last_update = 0;
        bool stationary_needs_update = true;
        uint32_t view_slot = 1;
        ViewExtern light_view{};
        ShadowDepthMap depth{};
    };
}
