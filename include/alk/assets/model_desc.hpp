#pragma once

/*
    ALKAHEST RENDER CORE

    FILE: model_desc.hpp
    MODULE: assets
    PURPOSE: Decoded, read-only model descriptions handed over by the package
            loader. Buffers and techniques are referenced by content hash.
*/


#include <cstdint>
#include <vector>

#include <glm/glm.hpp>

#include "alk/core/tag_hash.hpp"
#include "alk/gfx/gpu_device.hpp"
#include "alk/tfx/feature_renderer.hpp"
#include "alk/tfx/variant_table.hpp"

namespace alk
{
    enum class LodCategory : uint8_t
    {
        MainGeom0 = 0,
        GripStock0 = 1,
        Stickers0 = 2,
        InternalGeom0 = 3,
        LowPolyGeom1 = 4,
        LowPolyGeom2 = 7,
        LowPolyGeom3 = 8,
        Detail0 = 9
    };

    // Only the highest-detail categories are drawn; LOD selection lives elsewhere.
    inline bool lod_is_highest_detail(LodCategory c)
    {
        switch (c)
        {
            case LodCategory::MainGeom0:
            case LodCategory::GripStock0:
            case LodCategory::Stickers0:
            case LodCategory::InternalGeom0:
            case LodCategory::Detail0:
                return true;
            default:
                return false;
        }
    }

    struct MeshPartDesc
    {
        uint32_t index_start = 0;
        uint32_t index_count = 0;
        TagHash technique{};
        uint16_t variant_shader_index = kNoVariant;
        uint16_t external_identifier = 0;
        LodCategory lod_category = LodCategory::MainGeom0;
        PrimitiveTopology topology = PrimitiveTopology::TriangleList;
    };

    struct MeshDesc
    {
        TagHash vertex0{};
        TagHash vertex1{};
        TagHash color{};
        TagHash index{};
        std::vector<MeshPartDesc> parts{};
        // One start offset per render stage followed by the end offset.
        std::vector<uint16_t> part_range_per_render_stage{};
        std::vector<uint8_t> input_layout_per_render_stage{};
    };

    struct DynamicModelDesc
    {
        TagHash hash{};
        std::vector<MeshDesc> meshes{};
        VariantTable variants{};
        glm::vec4 model_scale{1.0f};
        glm::vec4 model_offset{0.0f};
        glm::vec2 texcoord_scale{1.0f};
        glm::vec2 texcoord_offset{0.0f};
        FeatureRenderer feature_type = FeatureRenderer::RigidObject;
    };

    struct StaticModelDesc
    {
        TagHash hash{};
        std::vector<MeshDesc> meshes{};
        glm::vec4 model_scale{1.0f};
        glm::vec4 model_offset{0.0f};
        glm::vec2 texcoord_scale{1.0f};
        glm::vec2 texcoord_offset{0.0f};
    };

    struct TerrainPartDesc
    {
        uint32_t index_start = 0;
        uint32_t index_count = 0;
        uint16_t group_index = 0;
        // 0 = highest detail
        uint8_t detail_level = 0;
    };

    struct TerrainGroupDesc
    {
        TagHash technique{};
        glm::vec4 position_offset{0.0f};
        glm::vec4 texcoord_transform{1.0f, 1.0f, 0.0f, 0.0f};
    };

    struct TerrainDesc
    {
        TagHash hash{};
        TagHash vertex0{};
        TagHash vertex1{};
        TagHash index{};
        std::vector<TerrainGroupDesc> groups{};
        std::vector<TerrainPartDesc> parts{};
        glm::vec4 offset{0.0f};
    };
}
