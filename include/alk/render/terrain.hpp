#pragma once

/*
    ALKAHEST RENDER CORE

    FILE: terrain.hpp
    MODULE: render
    PURPOSE: Terrain patch component: shared buffers, per-group technique and
            terrain-scope constants, highest-detail parts only.
*/


#include <string>
#include <utility>
#include <vector>

#include <glm/glm.hpp>

#include "alk/assets/asset_source.hpp"
#include "alk/assets/model_desc.hpp"
#include "alk/core/result.hpp"
#include "alk/render/loaded_mesh.hpp"
#include "alk/render/render_context.hpp"
#include "alk/tfx/scope_registry.hpp"
#include "alk/tfx/technique_binder.hpp"

namespace alk
{
    struct TerrainScope
    {
        glm::vec4 position_offset{0.0f};
        glm::vec4 texcoord_transform{1.0f, 1.0f, 0.0f, 0.0f};
        glm::vec4 patch_offset{0.0f};
    };

    class TerrainPatchesComponent
    {
    public:
        TerrainPatchesComponent() = default;

        static Result<TerrainPatchesComponent> create(IGpuDevice& gpu, IAssetSource& assets, const TerrainDesc& desc)
        {
            const std::string name = "terrain_" + to_string(desc.hash);

            TerrainPatchesComponent out{};
            out.gpu_ = &gpu;
            out.hash_ = desc.hash;
            out.parts_ = desc.parts;

            out.vertex0_ = assets.buffer(desc.vertex0);
            if (!out.vertex0_) return Result<TerrainPatchesComponent>::failure(name + ": vertex buffer unavailable");
            out.index_ = assets.buffer(desc.index);
            if (!out.index_) return Result<TerrainPatchesComponent>::failure(name + ": index buffer unavailable");
            if (desc.vertex1.is_some()) out.vertex1_ = assets.buffer(desc.vertex1);

            for (size_t i = 0; i < desc.groups.size(); ++i)
            {
                const TerrainGroupDesc& g = desc.groups[i];
                TerrainScope scope{g.position_offset, g.texcoord_transform, desc.offset};

                BufferDesc bd{};
                bd.kind = BufferKind::Constant;
                bd.size_bytes = sizeof(TerrainScope);
                bd.debug_name = name + "_group" + std::to_string(i);
                auto buf = gpu.create_buffer(bd, &scope);
                if (!buf.ok) return Result<TerrainPatchesComponent>::failure(bd.debug_name + ": " + buf.error);
                out.groups_.push_back(Group{g.technique, buf.value});
            }
            return Result<TerrainPatchesComponent>::success(std::move(out));
        }

        ~TerrainPatchesComponent() { release(); }

        TerrainPatchesComponent(TerrainPatchesComponent&& o) noexcept { take(std::move(o)); }
        TerrainPatchesComponent& operator=(TerrainPatchesComponent&& o) noexcept
        {
            if (this != &o)
            {
                release();
                take(std::move(o));
            }
            return *this;
        }
        TerrainPatchesComponent(const TerrainPatchesComponent&) = delete;
        TerrainPatchesComponent& operator=(const TerrainPatchesComponent&) = delete;

        void draw(DrawContext& dc, RenderStage stage) const
        {
            (void)stage;
            vertex0_->bind_vertex(dc.gpu, 0);
            if (vertex1_) vertex1_->bind_vertex(dc.gpu, 1);
            index_->bind_index(dc.gpu);

            for (const TerrainPartDesc& part : parts_)
            {
                if (part.detail_level != 0) continue;
                if (part.group_index >= groups_.size()) continue;

                const Group& group = groups_[part.group_index];
                const TechniqueHandle technique = dc.assets.technique(group.technique);
                if (!technique) continue;

                dc.gpu.bind_constant_buffer(ShaderStage::Vertex, scope_slot(Scope::Terrain), group.cbuffer);
                dc.gpu.bind_constant_buffer(ShaderStage::Pixel, scope_slot(Scope::Terrain), group.cbuffer);

                const PartBindResult bound = bind_part_techniques(dc.bind, technique.get(), nullptr, nullptr);
                report_bind_errors(dc.entity, bound);

                dc.gpu.set_topology(PrimitiveTopology::TriangleStrip);
                dc.gpu.draw_indexed(part.index_count, part.index_start, 0);
            }
        }

        TagHash hash() const { return hash_; }
        size_t group_count() const { return groups_.size(); }

    private:
        struct Group
        {
            TagHash technique{};
            BufferHandle cbuffer{};
        };

        void release()
        {
            if (gpu_)
            {
                for (const Group& g : groups_)
                {
                    if (g.cbuffer.valid()) gpu_->destroy_buffer(g.cbuffer);
                }
            }
            groups_.clear();
        }

        void take(TerrainPatchesComponent&& o)
        {
            gpu_ = std::exchange(o.gpu_, nullptr);
            hash_ = o.hash_;
            vertex0_ = std::move(o.vertex0_);
            vertex1_ = std::move(o.vertex1_);
            index_ = std::move(o.index_);
            groups_ = std::move(o.groups_);
            o.groups_.clear();
            parts_ = std::move(o.parts_);
        }

        IGpuDevice* gpu_ = nullptr;
        TagHash hash_{};
        GpuBufferHandle vertex0_{};
        GpuBufferHandle vertex1_{};
        GpuBufferHandle index_{};
        std::vector<Group> groups_{};
        std::vector<TerrainPartDesc> parts_{};
    };
}
