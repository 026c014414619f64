#pragma once

/*
    ALKAHEST RENDER CORE

    FILE: render_stage.hpp
    MODULE: tfx
    PURPOSE: Frame phases of the title's effect system and the per-mesh
            subscription set derived from authored part ranges.
*/


#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <utility>

namespace alk
{
    enum class RenderStage : uint8_t
    {
        GenerateGbuffer = 0,
        Decals = 1,
        InvestmentDecals = 2,
        ShadowGenerate = 3,
        LightingApply = 4,
        LightProbeApply = 5,
        DepthPrepass = 6,
        Reflections = 7,
        DecalsAdditive = 8,
        Transparents = 9,
        Distortion = 10,
        LightShaftOcclusion = 11,
        SkinPrepass = 12,
        LensFlares = 13,
        WaterReflection = 14,
        PostprocessTransparentStencil = 15,
        Impulse = 16,
        Reticle = 17,
        WaterRipples = 18,
        MaskSunLight = 19,
        Volumetrics = 20,
        Cubemaps = 21,
        PostprocessScreen = 22,
        WorldForces = 23,
        ComputeSkinning = 24
    };

    constexpr uint32_t kRenderStageCount = 25;

    inline const char* render_stage_name(RenderStage s)
    {
        switch (s)
        {
            case RenderStage::GenerateGbuffer: return "generate_gbuffer";
            case RenderStage::Decals: return "decals";
            case RenderStage::InvestmentDecals: return "investment_decals";
            case RenderStage::ShadowGenerate: return "shadow_generate";
            case RenderStage::LightingApply: return "lighting_apply";
            case RenderStage::LightProbeApply: return "light_probe_apply";
            case RenderStage::DepthPrepass: return "depth_prepass";
            case RenderStage::Reflections: return "reflections";
            case RenderStage::DecalsAdditive: return "decals_additive";
            case RenderStage::Transparents: return "transparents";
            case RenderStage::Distortion: return "distortion";
            case RenderStage::LightShaftOcclusion: return "light_shaft_occlusion";
            case RenderStage::SkinPrepass: return "skin_prepass";
            case RenderStage::LensFlares: return "lens_flares";
            case RenderStage::WaterReflection: return "water_reflection";
            case RenderStage::PostprocessTransparentStencil: return "postprocess_transparent_stencil";
            case RenderStage::Impulse: return "impulse";
            case RenderStage::Reticle: return "reticle";
            case RenderStage::WaterRipples: return "water_ripples";
            case RenderStage::MaskSunLight: return "mask_sun_light";
            case RenderStage::Volumetrics: return "volumetrics";
            case RenderStage::Cubemaps: return "cubemaps";
            case RenderStage::PostprocessScreen: return "postprocess_screen";
            case RenderStage::WorldForces: return "world_forces";
            case RenderStage::ComputeSkinning: return "compute_skinning";
        }
        return "unknown";
    }

    inline std::optional<RenderStage> parse_render_stage(std::string_view s)
    {
        for (uint32_t i = 0; i < kRenderStageCount; ++i)
        {
            const RenderStage stage = static_cast<RenderStage>(i);
            if (s == render_stage_name(stage)) return stage;
        }
        return std::nullopt;
    }

    // Stages whose drawables also include terrain and shader-ball previews.
    inline bool is_geometry_stage(RenderStage s)
    {
        return s == RenderStage::GenerateGbuffer || s == RenderStage::ShadowGenerate || s == RenderStage::DepthPrepass;
    }

    class RenderStageSubscriptions
    {
    public:
        static constexpr uint32_t bit(RenderStage s) { return 1u << static_cast<uint32_t>(s); }

        static constexpr uint32_t COMPUTE_SKINNING = 1u << static_cast<uint32_t>(RenderStage::ComputeSkinning);

        constexpr RenderStageSubscriptions() = default;
        constexpr explicit RenderStageSubscriptions(uint32_t bits) : bits_(bits) {}

        // A stage is subscribed when its authored part range is non-empty. The
        // list holds one start offset per stage plus a trailing end offset.
        static RenderStageSubscriptions from_partrange_list(std::span<const uint16_t> part_ranges)
        {
            uint32_t bits = 0;
            for (uint32_t i = 0; i < kRenderStageCount && i + 1 < part_ranges.size(); ++i)
            {
                if (part_ranges[i + 1] > part_ranges[i]) bits |= 1u << i;
            }
            return RenderStageSubscriptions(bits);
        }

        constexpr bool contains(RenderStage s) const { return (bits_ & bit(s)) != 0; }
        constexpr bool contains_bits(uint32_t mask) const { return (bits_ & mask) == mask; }
        constexpr bool empty() const { return bits_ == 0; }
        constexpr uint32_t bits() const { return bits_; }

        constexpr RenderStageSubscriptions operator|(RenderStageSubscriptions o) const
        {
            return RenderStageSubscriptions(bits_ | o.bits_);
        }

        RenderStageSubscriptions& operator|=(RenderStageSubscriptions o)
        {
            bits_ |= o.bits_;
            return *this;
        }

        friend constexpr bool operator==(RenderStageSubscriptions a, RenderStageSubscriptions b) { return a.bits_ == b.bits_; }
        friend constexpr bool operator!=(RenderStageSubscriptions a, RenderStageSubscriptions b) { return a.bits_ != b.bits_; }

    private:
        uint32_t bits_ = 0;
    };

    // Part index range [first, second) active for one stage.
    inline std::pair<uint16_t, uint16_t> part_range_for_stage(std::span<const uint16_t> part_ranges, RenderStage s)
    {
        const size_t i = static_cast<size_t>(s);
        if (i + 1 >= part_ranges.size()) return {0, 0};
        if (part_ranges[i + 1] < part_ranges[i]) return {part_ranges[i], part_ranges[i]};
        return {part_ranges[i], part_ranges[i + 1]};
    }
}
