#pragma once

/*
    ALKAHEST RENDER CORE

    FILE: render_context.hpp
    MODULE: render
    PURPOSE: Frame state passed by reference through every drawer: device, asset
            source, settings, the locked G-buffer/extern group and frame counters.
*/


#include <cstdint>
#include <utility>

#include <glm/glm.hpp>

#include "alk/assets/asset_source.hpp"
#include "alk/core/guarded.hpp"
#include "alk/core/tag_hash.hpp"
#include "alk/gfx/gbuffer.hpp"
#include "alk/gfx/gpu_device.hpp"
#include "alk/render/renderer_settings.hpp"
#include "alk/scene/components.hpp"
#include "alk/scene/scene.hpp"
#include "alk/tfx/externs.hpp"
#include "alk/tfx/scope_registry.hpp"
#include "alk/tfx/technique.hpp"

namespace alk
{
    enum class ShadowGenerationMode : uint8_t
    {
        StationaryOnly = 0,
        MovingOnly = 1
    };

    enum class DepthMode : uint8_t
    {
        Normal = 0,
        Flipped = 1
    };

    // Resources accessed only while the data lock is held.
    struct RenderData
    {
        GBuffer gbuffer{};
        Externs externs{};
    };

    // Programs owned by the shader loader and referenced by handle.
    struct UtilityShaders
    {
        ShaderHandle entity_vs_override{};
        ShaderHandle fullscreen_vs{};
        ShaderHandle fxaa_ps{};
        ShaderHandle fxaa_noise_ps{};
        ShaderHandle ssao_ps{};
        ShaderHandle ssao_blur_ps{};
        ShaderHandle debug_shape_vs{};
        TagHash debug_shape_technique{};
    };

    class RenderContext
    {
    public:
        RenderContext(IGpuDevice& gpu_, IAssetSource& assets_, ScopeRegistry scopes_, GBuffer gbuffer)
            : gpu(gpu_), assets(assets_), scopes(std::move(scopes_))
        {
            auto d = data.lock();
            d->gbuffer = std::move(gbuffer);
        }

        RenderContext(const RenderContext&) = delete;
        RenderContext& operator=(const RenderContext&) = delete;

        // Makes `view` the active camera for visibility tests and the view scope.
        void bind_view(uint32_t view, const ViewExtern& extern_data)
        {
            active_view = view;
            active_view_position = glm::vec3(extern_data.position);
            auto d = data.lock();
            d->externs.view = extern_data;
        }

        IGpuDevice& gpu;
        IAssetSource& assets;
        RendererSettings settings{};
        Guarded<RenderData> data{};
        ScopeRegistry scopes{};
        UtilityShaders shaders{};

        uint64_t frame_index = 0;
        uint32_t active_view = kMainView;
        glm::vec3 active_view_position{0.0f};
        ShadowGenerationMode active_shadow_generation_mode = ShadowGenerationMode::MovingOnly;
        DepthMode depth_mode = DepthMode::Normal;
    };

    // Everything a drawable needs for one draw; built under the data lock.
    struct DrawContext
    {
        IGpuDevice& gpu;
        IAssetSource& assets;
        TechniqueBindContext& bind;
        ShaderHandle entity_vs_override{};
        Entity entity{};
    };
}
