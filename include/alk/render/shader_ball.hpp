#pragma once

/*
    ALKAHEST RENDER CORE

    FILE: shader_ball.hpp
    MODULE: render
    PURPOSE: Preview sphere drawn with an arbitrary technique, for inspecting
            materials outside of their authored models.
*/


#include <string>
#include <utility>

#include "alk/assets/asset_source.hpp"
#include "alk/core/result.hpp"
#include "alk/render/dynamic_model.hpp"
#include "alk/render/render_context.hpp"
#include "alk/scene/components.hpp"
#include "alk/tfx/scope_registry.hpp"
#include "alk/tfx/technique_binder.hpp"

namespace alk
{
    struct ShaderBallMesh
    {
        TagHash vertex{};
        TagHash index{};
        uint32_t index_count = 0;
    };

    class ShaderBallComponent
    {
    public:
        ShaderBallComponent() = default;

        static Result<ShaderBallComponent> create(
            IGpuDevice& gpu,
            IAssetSource& assets,
            const ShaderBallMesh& mesh,
            TagHash technique,
            const Transform& transform)
        {
            ShaderBallComponent out{};
            out.gpu_ = &gpu;
            out.technique = technique;
            out.index_count_ = mesh.index_count;

            out.vertex_ = assets.buffer(mesh.vertex);
            if (!out.vertex_) return Result<ShaderBallComponent>::failure("shaderball: vertex buffer unavailable");
            out.index_ = assets.buffer(mesh.index);
            if (!out.index_) return Result<ShaderBallComponent>::failure("shaderball: index buffer unavailable");

            RigidModelScope scope{};
            scope.mesh_to_world = transform.local_to_world();
            BufferDesc bd{};
            bd.kind = BufferKind::Constant;
            bd.size_bytes = sizeof(RigidModelScope);
            bd.debug_name = "shaderball_rigid";
            auto buf = gpu.create_buffer(bd, &scope);
            if (!buf.ok) return Result<ShaderBallComponent>::failure("shaderball: " + buf.error);
            out.cbuffer_ = buf.value;
            return Result<ShaderBallComponent>::success(std::move(out));
        }

        ~ShaderBallComponent()
        {
            if (gpu_ && cbuffer_.valid()) gpu_->destroy_buffer(cbuffer_);
        }

        ShaderBallComponent(ShaderBallComponent&& o) noexcept
            : technique(o.technique),
              gpu_(std::exchange(o.gpu_, nullptr)),
              vertex_(std::move(o.vertex_)),
              index_(std::move(o.index_)),
              cbuffer_(std::exchange(o.cbuffer_, BufferHandle{})),
              index_count_(o.index_count_)
        {}

        ShaderBallComponent& operator=(ShaderBallComponent&& o) noexcept
        {
            if (this != &o)
            {
                if (gpu_ && cbuffer_.valid()) gpu_->destroy_buffer(cbuffer_);
                technique = o.technique;
                gpu_ = std::exchange(o.gpu_, nullptr);
                vertex_ = std::move(o.vertex_);
                index_ = std::move(o.index_);
                cbuffer_ = std::exchange(o.cbuffer_, BufferHandle{});
                index_count_ = o.index_count_;
            }
            return *this;
        }

        ShaderBallComponent(const ShaderBallComponent&) = delete;
        ShaderBallComponent& operator=(const ShaderBallComponent&) = delete;

        void draw(DrawContext& dc) const
        {
            const TechniqueHandle t = dc.assets.technique(technique);
            if (!t) return;

            vertex_->bind_vertex(dc.gpu, 0);
            index_->bind_index(dc.gpu);
            dc.gpu.bind_constant_buffer(ShaderStage::Vertex, scope_slot(Scope::RigidModel), cbuffer_);
            dc.gpu.bind_constant_buffer(ShaderStage::Pixel, scope_slot(Scope::RigidModel), cbuffer_);

            const PartBindResult bound = bind_part_techniques(dc.bind, t.get(), nullptr, nullptr);
            report_bind_errors(dc.entity, bound);

            dc.gpu.set_topology(PrimitiveTopology::TriangleList);
            dc.gpu.draw_indexed(index_count_, 0, 0);
        }

        TagHash technique{};

    private:
        IGpuDevice* gpu_ = nullptr;
        GpuBufferHandle vertex_{};
        GpuBufferHandle index_{};
        BufferHandle cbuffer_{};
        uint32_t index_count_ = 0;
    };
}
