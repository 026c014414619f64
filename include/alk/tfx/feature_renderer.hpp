#pragma once

/*
    ALKAHEST RENDER CORE

    FILE: feature_renderer.hpp
    MODULE: tfx
    PURPOSE: Feature type of a drawable and the draw-priority bucket it falls in.
*/


#include <cstdint>

namespace alk
{
    enum class FeatureRenderer : uint8_t
    {
        StaticObjects = 0,
        TerrainPatch = 1,
        RigidObject = 2,
        DynamicObjects = 3,
        Water = 4,
        SkyTransparent = 5,
        SpeedtreeTrees = 6,
        Decals = 7,
        Cubemaps = 8,
        Atmosphere = 9,
        Lights = 10,
        Decorators = 11
    };

    inline const char* feature_renderer_name(FeatureRenderer f)
    {
        switch (f)
        {
            case FeatureRenderer::StaticObjects: return "static_objects";
            case FeatureRenderer::TerrainPatch: return "terrain_patch";
            case FeatureRenderer::RigidObject: return "rigid_object";
            case FeatureRenderer::DynamicObjects: return "dynamic_objects";
            case FeatureRenderer::Water: return "water";
            case FeatureRenderer::SkyTransparent: return "sky_transparent";
            case FeatureRenderer::SpeedtreeTrees: return "speedtree_trees";
            case FeatureRenderer::Decals: return "decals";
            case FeatureRenderer::Cubemaps: return "cubemaps";
            case FeatureRenderer::Atmosphere: return "atmosphere";
            case FeatureRenderer::Lights: return "lights";
            case FeatureRenderer::Decorators: return "decorators";
        }
        return "unknown";
    }

    // Water goes ahead of generic rigid/dynamic objects; everything else follows.
    inline uint32_t feature_draw_priority(FeatureRenderer f)
    {
        switch (f)
        {
            case FeatureRenderer::Water: return 1;
            case FeatureRenderer::RigidObject:
            case FeatureRenderer::DynamicObjects:
                return 2;
            default:
                return 99;
        }
    }
}
