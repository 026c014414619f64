#pragma once

/*
    ALKAHEST RENDER CORE

    FILE: renderer_settings.hpp
    MODULE: render
    PURPOSE: User-facing renderer toggles, consumed read-only once per frame,
            with ALK_* environment overrides.
*/


#include <cstdint>
#include <cstdlib>
#include <string>

#include "alk/core/env.hpp"
#include "alk/core/log.hpp"
#include "alk/render/shadow_quality.hpp"
#include "alk/tfx/feature_renderer.hpp"
#include "alk/tfx/render_stage.hpp"

namespace alk
{
    struct RendererSettings
    {
        bool vsync = true;
        bool ssao = true;
        // Preview-material mode: flat shading, no shadows.
        bool matcap = false;
        bool shadows = true;
        bool debug_view = false;

        bool feature_statics = true;
        bool feature_terrain = true;
        bool feature_dynamics = true;
        bool feature_sky = true;
        bool feature_decorators = true;
        bool feature_atmosphere = true;
        bool feature_cubemaps = true;

        bool stage_transparent = true;
        bool stage_decals = true;
        bool stage_decals_additive = true;

        bool feature_fxaa = true;
        bool fxaa_noise = false;

        uint32_t shadow_updates_per_frame = 4;
        ShadowQuality shadow_quality = ShadowQuality::Medium;
    };

    inline bool stage_enabled(const RendererSettings& s, RenderStage stage)
    {
        switch (stage)
        {
            case RenderStage::Transparents: return s.stage_transparent;
            case RenderStage::Decals: return s.stage_decals;
            case RenderStage::DecalsAdditive: return s.stage_decals_additive;
            default: return true;
        }
    }

    inline bool feature_enabled(const RendererSettings& s, FeatureRenderer feature)
    {
        switch (feature)
        {
            case FeatureRenderer::StaticObjects: return s.feature_statics;
            case FeatureRenderer::TerrainPatch: return s.feature_terrain;
            case FeatureRenderer::RigidObject:
            case FeatureRenderer::DynamicObjects:
            case FeatureRenderer::Water:
                return s.feature_dynamics;
            case FeatureRenderer::SkyTransparent: return s.feature_sky;
            case FeatureRenderer::SpeedtreeTrees:
            case FeatureRenderer::Decorators:
                return s.feature_decorators;
            case FeatureRenderer::Atmosphere: return s.feature_atmosphere;
            case FeatureRenderer::Cubemaps: return s.feature_cubemaps;
            default: return true;
        }
    }

    inline bool should_render(const RendererSettings& s, RenderStage stage, FeatureRenderer feature)
    {
        return stage_enabled(s, stage) && feature_enabled(s, feature);
    }

    inline bool shadows_active(const RendererSettings& s)
    {
        return s.shadows && s.shadow_quality != ShadowQuality::Off && !s.matcap;
    }

    inline void apply_renderer_settings_env(RendererSettings& s)
    {
        s.vsync = parse_env_bool(std::getenv("ALK_VSYNC"), s.vsync);
        s.ssao = parse_env_bool(std::getenv("ALK_SSAO"), s.ssao);
        s.matcap = parse_env_bool(std::getenv("ALK_MATCAP"), s.matcap);
        s.shadows = parse_env_bool(std::getenv("ALK_SHADOWS"), s.shadows);
        s.debug_view = parse_env_bool(std::getenv("ALK_DEBUG_VIEW"), s.debug_view);
        s.feature_fxaa = parse_env_bool(std::getenv("ALK_FXAA"), s.feature_fxaa);
        s.fxaa_noise = parse_env_bool(std::getenv("ALK_FXAA_NOISE"), s.fxaa_noise);
        s.stage_transparent = parse_env_bool(std::getenv("ALK_STAGE_TRANSPARENT"), s.stage_transparent);
        s.stage_decals = parse_env_bool(std::getenv("ALK_STAGE_DECALS"), s.stage_decals);
        s.stage_decals_additive = parse_env_bool(std::getenv("ALK_STAGE_DECALS_ADDITIVE"), s.stage_decals_additive);
        s.shadow_updates_per_frame = parse_env_u32(
            std::getenv("ALK_SHADOW_UPDATES_PER_FRAME"),
            s.shadow_updates_per_frame,
            1u);

        if (const char* q = std::getenv("ALK_SHADOW_QUALITY"))
        {
            if (const auto parsed = parse_shadow_quality(to_lower(q)))
            {
                s.shadow_quality = *parsed;
            }
            else
            {
                log_warn(std::string("ALK_SHADOW_QUALITY: unknown quality '") + q + "', keeping " +
                    shadow_quality_name(s.shadow_quality));
            }
        }
    }
}
