#pragma once

/*
    ALKAHEST RENDER CORE

    FILE: static_instances.hpp
    MODULE: render
    PURPOSE: Shared static models drawn instanced, the per-group instance data
            block, and the scene components for static instances and decorators.
*/


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
#include "alk/tfx/render_stage.hpp"
#include "alk/tfx/scope_registry.hpp"
#include "alk/tfx/technique_binder.hpp"

namespace alk
{
    class StaticModel
    {
    public:
        static Result<std::shared_ptr<const StaticModel>> load(IAssetSource& assets, const StaticModelDesc& desc)
        {
            std::shared_ptr<StaticModel> out(new StaticModel());
            out->hash_ = desc.hash;
            out->model_scale_ = desc.model_scale;
            out->model_offset_ = desc.model_offset;
            out->texcoord_scale_offset_ = glm::vec4(desc.texcoord_scale, desc.texcoord_offset);

            for (size_t i = 0; i < desc.meshes.size(); ++i)
            {
                auto mesh = LoadedMesh::load(assets, desc.meshes[i]);
                if (!mesh.ok)
                {
                    return Result<std::shared_ptr<const StaticModel>>::failure(
                        "static model " + to_string(desc.hash) + " mesh " + std::to_string(i) + ": " + mesh.error);
                }
                out->subscribed_stages_ |= mesh.value.stages();
                out->meshes_.push_back(std::move(mesh.value));
            }
            return Result<std::shared_ptr<const StaticModel>>::success(std::move(out));
        }

        void draw(DrawContext& dc, RenderStage stage, uint32_t instance_count, const ObjectChannels* channels) const
        {
            if (instance_count == 0 || !subscribed_stages_.contains(stage)) return;

            for (const LoadedMesh& mesh : meshes_)
            {
                if (!mesh.stages().contains(stage)) continue;
                mesh.bind_buffers(dc.gpu, stage);

                const auto [first, last] = mesh.part_range(stage);
                for (uint16_t i = first; i < last; ++i)
                {
                    const MeshPartDesc& part = mesh.parts()[i];
                    if (!lod_is_highest_detail(part.lod_category)) continue;

                    const TechniqueHandle technique = dc.assets.technique(part.technique);
                    if (!technique) continue;

                    const PartBindResult bound = bind_part_techniques(dc.bind, technique.get(), nullptr, channels);
                    report_bind_errors(dc.entity, bound);

                    dc.gpu.set_topology(part.topology);
                    dc.gpu.draw_indexed_instanced(part.index_count, instance_count, part.index_start, 0, 0);
                }
            }
        }

        TagHash hash() const { return hash_; }
        size_t mesh_count() const { return meshes_.size(); }
        const LoadedMesh& mesh(size_t i) const { return meshes_[i]; }
        RenderStageSubscriptions subscribed_stages() const { return subscribed_stages_; }
        const glm::vec4& model_scale() const { return model_scale_; }
        const glm::vec4& model_offset() const { return model_offset_; }
        const glm::vec4& texcoord_scale_offset() const { return texcoord_scale_offset_; }

    private:
        StaticModel() = default;

        TagHash hash_{};
        std::vector<LoadedMesh> meshes_{};
        RenderStageSubscriptions subscribed_stages_{};
        glm::vec4 model_scale_{1.0f};
        glm::vec4 model_offset_{0.0f};
        glm::vec4 texcoord_scale_offset_{1.0f, 1.0f, 0.0f, 0.0f};
    };

    using StaticModelHandle = std::shared_ptr<const StaticModel>;

    // Constant block: model transform header followed by one matrix per instance.
    class InstanceBlock
    {
    public:
        InstanceBlock() = default;

        static Result<InstanceBlock> create(
            IGpuDevice& gpu,
            const StaticModel& model,
            const std::vector<glm::mat4>& transforms,
            const std::string& name)
        {
            InstanceBlock out{};
            out.gpu_ = &gpu;
            out.count_ = (uint32_t)transforms.size();

            std::vector<glm::vec4> data{};
            data.reserve(4 + transforms.size() * 4);
            data.push_back(model.model_scale());
            data.push_back(model.model_offset());
            data.push_back(model.texcoord_scale_offset());
            data.push_back(glm::vec4((float)out.count_, 0.0f, 0.0f, 0.0f));
            for (const glm::mat4& m : transforms)
            {
                for (int c = 0; c < 4; ++c) data.push_back(m[c]);
            }

            BufferDesc desc{};
            desc.kind = BufferKind::Constant;
            desc.size_bytes = data.size() * sizeof(glm::vec4);
            desc.debug_name = name;
            auto buf = gpu.create_buffer(desc, data.data());
            if (!buf.ok) return Result<InstanceBlock>::failure(name + ": " + buf.error);
            out.buffer_ = buf.value;
            return Result<InstanceBlock>::success(std::move(out));
        }

        ~InstanceBlock() { release(); }

        InstanceBlock(InstanceBlock&& o) noexcept
            : gpu_(std::exchange(o.gpu_, nullptr)),
              buffer_(std::exchange(o.buffer_, BufferHandle{})),
              count_(o.count_)
        {}

        InstanceBlock& operator=(InstanceBlock&& o) noexcept
        {
            if (this != &o)
            {
                release();
                gpu_ = std::exchange(o.gpu_, nullptr);
                buffer_ = std::exchange(o.buffer_, BufferHandle{});
                count_ = o.count_;
            }
            return *this;
        }

        InstanceBlock(const InstanceBlock&) = delete;
        InstanceBlock& operator=(const InstanceBlock&) = delete;

        void bind(IGpuDevice& gpu, Scope scope) const
        {
            gpu.bind_constant_buffer(ShaderStage::Vertex, scope_slot(scope), buffer_);
            gpu.bind_constant_buffer(ShaderStage::Pixel, scope_slot(scope), buffer_);
        }

        uint32_t count() const { return count_; }

    private:
        void release()
        {
            if (gpu_ && buffer_.valid()) gpu_->destroy_buffer(buffer_);
            buffer_ = BufferHandle{};
        }

        IGpuDevice* gpu_ = nullptr;
        BufferHandle buffer_{};
        uint32_t count_ = 0;
    };

    class StaticInstancesComponent
    {
    public:
        StaticInstancesComponent() = default;

        static Result<StaticInstancesComponent> create(
            IGpuDevice& gpu,
            StaticModelHandle model,
            const std::vector<glm::mat4>& transforms,
            FeatureRenderer feature_type = FeatureRenderer::StaticObjects)
        {
            if (!model) return Result<StaticInstancesComponent>::failure("static instances without a model");
            auto block = InstanceBlock::create(gpu, *model, transforms, "static_instances_" + to_string(model->hash()));
            if (!block.ok) return Result<StaticInstancesComponent>::failure(block.error);

            StaticInstancesComponent out{};
            out.model = std::move(model);
            out.instances = std::move(block.value);
            out.feature_type = feature_type;
            return Result<StaticInstancesComponent>::success(std::move(out));
        }

        void draw(DrawContext& dc, RenderStage stage, const ObjectChannels* channels) const
        {
            if (!model) return;
            instances.bind(dc.gpu, Scope::Instances);
            model->draw(dc, stage, instances.count(), channels);
        }

        StaticModelHandle model{};
        InstanceBlock instances{};
        FeatureRenderer feature_type = FeatureRenderer::StaticObjects;
    };

    // Speedtree decorator placement; drawn after dynamic models.
    class DecoratorComponent
    {
    public:
        DecoratorComponent() = default;

        static Result<DecoratorComponent> create(
            IGpuDevice& gpu,
            StaticModelHandle model,
            const std::vector<glm::mat4>& transforms)
        {
            if (!model) return Result<DecoratorComponent>::failure("decorator without a model");
            auto block = InstanceBlock::create(gpu, *model, transforms, "decorator_" + to_string(model->hash()));
            if (!block.ok) return Result<DecoratorComponent>::failure(block.error);

            DecoratorComponent out{};
            out.model = std::move(model);
            out.instances = std::move(block.value);
            return Result<DecoratorComponent>::success(std::move(out));
        }

        void draw(DrawContext& dc, RenderStage stage) const
        {
            if (!model) return;
            instances.bind(dc.gpu, Scope::Speedtree);
            model->draw(dc, stage, instances.count(), nullptr);
        }

        StaticModelHandle model{};
        InstanceBlock instances{};
    };
}
