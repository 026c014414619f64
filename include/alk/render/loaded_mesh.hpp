#pragma once

/*
    ALKAHEST RENDER CORE

    FILE: loaded_mesh.hpp
    MODULE: render
    PURPOSE: Mesh with its shared GPU buffers resolved and its stage
            subscriptions computed once at load time.
*/


#include <string>
#include <utility>
#include <vector>

#include "alk/assets/asset_source.hpp"
#include "alk/assets/model_desc.hpp"
#include "alk/core/log.hpp"
#include "alk/core/result.hpp"
#include "alk/render/render_context.hpp"
#include "alk/tfx/render_stage.hpp"
#include "alk/tfx/technique_binder.hpp"

namespace alk
{
    class LoadedMesh
    {
    public:
        static Result<LoadedMesh> load(IAssetSource& assets, const MeshDesc& desc)
        {
            LoadedMesh out{};
            out.vertex0_ = assets.buffer(desc.vertex0);
            if (!out.vertex0_) return Result<LoadedMesh>::failure("vertex buffer " + to_string(desc.vertex0) + " unavailable");
            out.index_ = assets.buffer(desc.index);
            if (!out.index_) return Result<LoadedMesh>::failure("index buffer " + to_string(desc.index) + " unavailable");
            if (desc.vertex1.is_some()) out.vertex1_ = assets.buffer(desc.vertex1);
            if (desc.color.is_some()) out.color_ = assets.buffer(desc.color);

            out.parts_ = desc.parts;
            out.part_ranges_ = desc.part_range_per_render_stage;
            out.input_layouts_ = desc.input_layout_per_render_stage;
            out.stages_ = RenderStageSubscriptions::from_partrange_list(out.part_ranges_);
            return Result<LoadedMesh>::success(std::move(out));
        }

        void bind_buffers(IGpuDevice& gpu, RenderStage stage) const
        {
            vertex0_->bind_vertex(gpu, 0);
            if (vertex1_) vertex1_->bind_vertex(gpu, 1);
            if (color_) color_->bind_vertex(gpu, 2);
            index_->bind_index(gpu);

            const size_t s = static_cast<size_t>(stage);
            if (s < input_layouts_.size()) gpu.set_input_layout(input_layouts_[s]);
        }

        std::pair<uint16_t, uint16_t> part_range(RenderStage stage) const
        {
            auto r = part_range_for_stage(part_ranges_, stage);
            if (r.second > parts_.size()) r.second = (uint16_t)parts_.size();
            if (r.first > r.second) r.first = r.second;
            return r;
        }

        RenderStageSubscriptions stages() const { return stages_; }
        const std::vector<MeshPartDesc>& parts() const { return parts_; }

    private:
        GpuBufferHandle vertex0_{};
        GpuBufferHandle vertex1_{};
        GpuBufferHandle color_{};
        GpuBufferHandle index_{};
        std::vector<MeshPartDesc> parts_{};
        std::vector<uint16_t> part_ranges_{};
        std::vector<uint8_t> input_layouts_{};
        RenderStageSubscriptions stages_{};
    };

    inline void report_bind_errors(Entity entity, const PartBindResult& result)
    {
        for (const std::string& e : result.errors)
        {
            log_error("Failed to bind technique for entity " + std::to_string(entity.id) + ": " + e);
        }
    }
}
