#pragma once

/*
    ALKAHEST RENDER CORE

    FILE: dynamic_model.hpp
    MODULE: render
    PURPOSE: Rigid/skinned entity model with selectable mesh and material variant,
            and the scene component that owns its per-object constant buffers.
*/


#include <algorithm>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <glm/glm.hpp>

#include "alk/assets/asset_source.hpp"
#include "alk/assets/model_desc.hpp"
#include "alk/core/result.hpp"
#include "alk/render/loaded_mesh.hpp"
#include "alk/render/render_context.hpp"
#include "alk/scene/components.hpp"
#include "alk/tfx/render_stage.hpp"
#include "alk/tfx/scope_registry.hpp"
#include "alk/tfx/technique_binder.hpp"
#include "alk/tfx/variant_table.hpp"

namespace alk
{
    constexpr uint16_t kAllIdentifiers = 0xFFFF;

    class DynamicModel
    {
    public:
        DynamicModel() = default;

        static Result<DynamicModel> load(IAssetSource& assets, const DynamicModelDesc& desc)
        {
            DynamicModel out{};
            out.hash_ = desc.hash;
            out.variants_ = desc.variants;
            out.feature_type_ = desc.feature_type;
            out.model_scale_ = desc.model_scale;
            out.model_offset_ = desc.model_offset;
            out.texcoord_scale_ = desc.texcoord_scale;
            out.texcoord_offset_ = desc.texcoord_offset;

            out.meshes_.reserve(desc.meshes.size());
            for (size_t i = 0; i < desc.meshes.size(); ++i)
            {
                auto mesh = LoadedMesh::load(assets, desc.meshes[i]);
                if (!mesh.ok)
                {
                    return Result<DynamicModel>::failure(
                        "dynamic model " + to_string(desc.hash) + " mesh " + std::to_string(i) + ": " + mesh.error);
                }
                out.meshes_.push_back(std::move(mesh.value));
            }

            for (const LoadedMesh& m : out.meshes_)
            {
                out.subscribed_stages_ |= m.stages();
                for (const MeshPartDesc& p : m.parts())
                {
                    out.identifier_count_ = std::max<uint32_t>(out.identifier_count_, (uint32_t)p.external_identifier + 1);
                }
            }
            return Result<DynamicModel>::success(std::move(out));
        }

        Status select_mesh(size_t mesh)
        {
            if (mesh >= meshes_.size())
            {
                return Status::failure("no such mesh " + std::to_string(mesh) + " (model has " +
                    std::to_string(meshes_.size()) + ")");
            }
            selected_mesh_ = mesh;
            return Status::success();
        }

        Status select_variant(uint32_t variant)
        {
            const uint32_t count = variants_.variant_count();
            if (variant != 0 && variant >= count)
            {
                return Status::failure("no such variant " + std::to_string(variant) + " (model has " +
                    std::to_string(count) + ")");
            }
            selected_variant_ = variant;
            return Status::success();
        }

        // Draws the selected mesh's parts for `stage`. `identifier` restricts the
        // draw to parts of one logical sub-object; kAllIdentifiers draws all.
        void draw(DrawContext& dc, RenderStage stage, uint16_t identifier, const ObjectChannels* channels) const
        {
            // selected_mesh_ is validated by select_mesh and load.
            if (selected_mesh_ >= meshes_.size()) return;
            const LoadedMesh& mesh = meshes_[selected_mesh_];
            if (!mesh.stages().contains(stage)) return;

            mesh.bind_buffers(dc.gpu, stage);

            const bool compute_skinned = mesh.stages().contains(RenderStage::ComputeSkinning);
            const auto [first, last] = mesh.part_range(stage);
            for (uint16_t i = first; i < last; ++i)
            {
                const MeshPartDesc& part = mesh.parts()[i];
                if (identifier != kAllIdentifiers && part.external_identifier != identifier) continue;
                if (!lod_is_highest_detail(part.lod_category)) continue;

                const TechniqueHandle base = dc.assets.technique(part.technique);
                TechniqueHandle variant{};
                const TagHash variant_hash = variants_.resolve(part.variant_shader_index, selected_variant_);
                if (variant_hash.is_some()) variant = dc.assets.technique(variant_hash);
                if (!base && !variant) continue;

                const PartBindResult bound = bind_part_techniques(dc.bind, base.get(), variant.get(), channels);
                report_bind_errors(dc.entity, bound);

                if (compute_skinned || bound.scopes.contains(Scope::Skinning))
                {
                    dc.gpu.bind_vertex_shader_override(dc.entity_vs_override);
                }

                dc.gpu.set_topology(part.topology);
                dc.gpu.draw_indexed(part.index_count, part.index_start, 0);
            }
        }

        TagHash hash() const { return hash_; }
        size_t mesh_count() const { return meshes_.size(); }
        const LoadedMesh& mesh(size_t i) const { return meshes_[i]; }
        size_t selected_mesh() const { return selected_mesh_; }
        uint32_t selected_variant() const { return selected_variant_; }
        uint32_t variant_count() const { return variants_.variant_count(); }
        uint32_t identifier_count() const { return identifier_count_; }
        RenderStageSubscriptions subscribed_stages() const { return subscribed_stages_; }
        FeatureRenderer feature_type() const { return feature_type_; }
        const glm::vec4& model_scale() const { return model_scale_; }
        const glm::vec4& model_offset() const { return model_offset_; }
        const glm::vec2& texcoord_scale() const { return texcoord_scale_; }
        const glm::vec2& texcoord_offset() const { return texcoord_offset_; }

    private:
        TagHash hash_{};
        std::vector<LoadedMesh> meshes_{};
        VariantTable variants_{};
        RenderStageSubscriptions subscribed_stages_{};
        FeatureRenderer feature_type_ = FeatureRenderer::RigidObject;
        uint32_t identifier_count_ = 0;
        size_t selected_mesh_ = 0;
        uint32_t selected_variant_ = 0;
        glm::vec4 model_scale_{1.0f};
        glm::vec4 model_offset_{0.0f};
        glm::vec2 texcoord_scale_{1.0f};
        glm::vec2 texcoord_offset_{0.0f};
    };

    struct RigidModelScope
    {
        glm::mat4 mesh_to_world{1.0f};
        glm::vec4 position_scale{1.0f};
        glm::vec4 position_offset{0.0f};
        glm::vec4 texcoord0_scale_offset{1.0f, 1.0f, 0.0f, 0.0f};
        glm::vec4 dynamic_sh_ao_values{1.0f, 1.0f, 1.0f, 0.0f};
    };

    struct SkinningScope
    {
        glm::vec4 offset_scale{0.0f, 0.0f, 0.0f, 1.0f};
        glm::vec4 texcoord0_scale_offset{1.0f, 1.0f, 0.0f, 0.0f};
        glm::vec4 dynamic_sh_ao_values{1.0f, 1.0f, 1.0f, 0.0f};
    };

    class DynamicModelComponent
    {
    public:
        DynamicModelComponent() = default;

        static Result<DynamicModelComponent> create(
            IGpuDevice& gpu,
            IAssetSource& assets,
            const DynamicModelDesc& desc,
            const Transform& transform)
        {
            auto model = DynamicModel::load(assets, desc);
            if (!model.ok) return Result<DynamicModelComponent>::failure(model.error);

            DynamicModelComponent out{};
            out.gpu_ = &gpu;
            out.model = std::move(model.value);
            out.ext.position_scale = out.model.model_scale();
            out.ext.position_offset = out.model.model_offset();
            out.ext.texcoord0_scale_offset = glm::vec4(out.model.texcoord_scale(), out.model.texcoord_offset());
            out.ext.mesh_to_world = transform.local_to_world();
            out.last_transform_ = transform;

            BufferDesc cb{};
            cb.kind = BufferKind::Constant;
            cb.size_bytes = sizeof(RigidModelScope);
            cb.debug_name = "dynamic_model_" + to_string(desc.hash) + "_rigid";
            auto buf = gpu.create_buffer(cb, &out.ext);
            if (!buf.ok) return Result<DynamicModelComponent>::failure(cb.debug_name + ": " + buf.error);
            out.cbuffer_ = buf.value;

            if (out.model.subscribed_stages().contains(RenderStage::ComputeSkinning))
            {
                SkinningScope skin{};
                skin.offset_scale = glm::vec4(glm::vec3(out.model.model_offset()), out.model.model_scale().x);
                skin.texcoord0_scale_offset = out.ext.texcoord0_scale_offset;
                skin.dynamic_sh_ao_values = out.ext.dynamic_sh_ao_values;

                BufferDesc sb{};
                sb.kind = BufferKind::Constant;
                sb.size_bytes = sizeof(SkinningScope);
                sb.debug_name = "dynamic_model_" + to_string(desc.hash) + "_skinning";
                auto sbuf = gpu.create_buffer(sb, &skin);
                if (!sbuf.ok) return Result<DynamicModelComponent>::failure(sb.debug_name + ": " + sbuf.error);
                out.cbuffer_skinning_ = sbuf.value;
            }

            return Result<DynamicModelComponent>::success(std::move(out));
        }

        ~DynamicModelComponent() { release(); }

        DynamicModelComponent(DynamicModelComponent&& o) noexcept { take(std::move(o)); }
        DynamicModelComponent& operator=(DynamicModelComponent&& o) noexcept
        {
            if (this != &o)
            {
                release();
                take(std::move(o));
            }
            return *this;
        }
        DynamicModelComponent(const DynamicModelComponent&) = delete;
        DynamicModelComponent& operator=(const DynamicModelComponent&) = delete;

        void update_cbuffer(const Transform& transform)
        {
            ext.mesh_to_world = transform.local_to_world();
            last_transform_ = transform;
            dirty_ = false;
            if (!gpu_) return;
            const Status st = gpu_->write_buffer(cbuffer_, &ext, sizeof(RigidModelScope));
            if (!st.ok) log_error("dynamic model " + to_string(model.hash()) + ": " + st.error);
        }

        // Forces a constant-buffer refresh on the next draw (e.g. after editing ext).
        void mark_dirty() { dirty_ = true; }

        void draw(DrawContext& dc, RenderStage stage, const Transform& transform, const ObjectChannels* channels)
        {
            if (dirty_ || !(transform == last_transform_)) update_cbuffer(transform);

            dc.gpu.bind_constant_buffer(ShaderStage::Vertex, scope_slot(Scope::RigidModel), cbuffer_);
            dc.gpu.bind_constant_buffer(ShaderStage::Pixel, scope_slot(Scope::RigidModel), cbuffer_);
            if (cbuffer_skinning_.valid())
            {
                dc.gpu.bind_constant_buffer(ShaderStage::Vertex, scope_slot(Scope::Skinning), cbuffer_skinning_);
            }

            model.draw(dc, stage, identifier, channels);
        }

        DynamicModel model{};
        RigidModelScope ext{};
        uint16_t identifier = kAllIdentifiers;

        bool has_skinning_buffer() const { return cbuffer_skinning_.valid(); }

    private:
        void release()
        {
            if (gpu_)
            {
                if (cbuffer_skinning_.valid()) gpu_->destroy_buffer(cbuffer_skinning_);
                if (cbuffer_.valid()) gpu_->destroy_buffer(cbuffer_);
            }
            cbuffer_skinning_ = BufferHandle{};
            cbuffer_ = BufferHandle{};
        }

        void take(DynamicModelComponent&& o)
        {
            gpu_ = std::exchange(o.gpu_, nullptr);
            model = std::move(o.model);
            ext = o.ext;
            identifier = o.identifier;
            cbuffer_ = std::exchange(o.cbuffer_, BufferHandle{});
            cbuffer_skinning_ = std::exchange(o.cbuffer_skinning_, BufferHandle{});
            last_transform_ = o.last_transform_;
            dirty_ = o.dirty_;
        }

        IGpuDevice* gpu_ = nullptr;
        BufferHandle cbuffer_{};
        BufferHandle cbuffer_skinning_{};
        Transform last_transform_{};
        bool dirty_ = false;
    };
}
