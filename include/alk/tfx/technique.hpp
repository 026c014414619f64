#pragma once

/*
    ALKAHEST RENDER CORE

    FILE: technique.hpp
    MODULE: tfx
    PURPOSE: Shader + constant + texture package shared by every drawable that
            references it. Immutable after load; binding never edits its GPU state.
*/


#include <array>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <glm/glm.hpp>

#include "alk/core/result.hpp"
#include "alk/core/tag_hash.hpp"
#include "alk/gfx/gpu_device.hpp"
#include "alk/tfx/externs.hpp"
#include "alk/tfx/scope.hpp"
#include "alk/tfx/scope_registry.hpp"

namespace alk
{
    struct TechniqueTexture
    {
        uint32_t slot = 0;
        ViewHandle view{};
    };

    // Constant vec4 that an object channel may override.
    struct TechniqueChannel
    {
        uint32_t channel_id = 0;
        uint32_t vec4_index = 0;
    };

    struct TechniqueShaderDesc
    {
        ShaderHandle shader{};
        uint32_t constant_slot = 0;
        std::vector<glm::vec4> constants{};
        std::vector<TechniqueTexture> textures{};
        std::vector<TechniqueChannel> channels{};
    };

    struct TechniqueDesc
    {
        TagHash hash{};
        std::string name{};
        ScopeBits used_scopes{};
        std::array<std::optional<TechniqueShaderDesc>, kShaderStageCount> stages{};
    };

    // Per-object values keyed by channel id.
    struct ObjectChannels
    {
        std::unordered_map<uint32_t, glm::vec4> values{};
    };

    struct TechniqueBindContext
    {
        IGpuDevice& gpu;
        ScopeRegistry& scopes;
        const Externs& externs;
    };

    class Technique
    {
    public:
        static Result<std::shared_ptr<const Technique>> create(IGpuDevice& gpu, TechniqueDesc desc)
        {
            std::shared_ptr<Technique> t(new Technique());
            t->gpu_ = &gpu;
            t->desc_ = std::move(desc);

            for (uint32_t i = 0; i < kShaderStageCount; ++i)
            {
                const auto& stage = t->desc_.stages[i];
                if (!stage || stage->constants.empty()) continue;

                BufferDesc bd{};
                bd.kind = BufferKind::Constant;
                bd.size_bytes = stage->constants.size() * sizeof(glm::vec4);
                bd.debug_name = t->desc_.name + "_" + shader_stage_name(static_cast<ShaderStage>(i)) + "_cb";
                auto buf = gpu.create_buffer(bd, stage->constants.data());
                if (!buf.ok)
                {
                    return Result<std::shared_ptr<const Technique>>::failure(
                        "technique " + t->desc_.name + " (" + to_string(t->desc_.hash) + "): " + buf.error);
                }
                t->constant_buffers_[i] = buf.value;
            }

            return Result<std::shared_ptr<const Technique>>::success(std::move(t));
        }

        ~Technique()
        {
            if (!gpu_) return;
            for (BufferHandle b : constant_buffers_)
            {
                if (b.valid()) gpu_->destroy_buffer(b);
            }
        }

        Technique(const Technique&) = delete;
        Technique& operator=(const Technique&) = delete;

        // Binds every present shader stage with its constants and textures, then
        // every scope the technique requires. Scope failures do not stop the
        // remaining scopes from being bound; the first one is returned.
        Status bind(TechniqueBindContext& ctx, const ObjectChannels* channels) const
        {
            Status result = Status::success();

            for (uint32_t i = 0; i < kShaderStageCount; ++i)
            {
                const auto& stage = desc_.stages[i];
                if (!stage) continue;
                const ShaderStage s = static_cast<ShaderStage>(i);

                ctx.gpu.bind_shader(s, stage->shader);

                if (channels && !stage->channels.empty() && has_channel_override(*stage, *channels))
                {
                    std::vector<glm::vec4> patched = stage->constants;
                    for (const TechniqueChannel& ch : stage->channels)
                    {
                        auto it = channels->values.find(ch.channel_id);
                        if (it == channels->values.end() || ch.vec4_index >= patched.size()) continue;
                        patched[ch.vec4_index] = it->second;
                    }
                    const std::span<const uint8_t> bytes(
                        reinterpret_cast<const uint8_t*>(patched.data()),
                        patched.size() * sizeof(glm::vec4));
                    const Status st = ctx.scopes.bind_channel_constants(s, stage->constant_slot, bytes);
                    if (!st.ok && result.ok) result = Status::failure(st.error);
                }
                else if (constant_buffers_[i].valid())
                {
                    ctx.gpu.bind_constant_buffer(s, stage->constant_slot, constant_buffers_[i]);
                }

                for (const TechniqueTexture& tex : stage->textures)
                {
                    ctx.gpu.bind_shader_resource(s, tex.slot, tex.view);
                }
            }

            for (uint32_t i = 0; i < kScopeCount; ++i)
            {
                const Scope scope = static_cast<Scope>(i);
                if (!desc_.used_scopes.contains(scope)) continue;
                const Status st = ctx.scopes.bind(scope, ctx.externs);
                if (!st.ok && result.ok) result = Status::failure(st.error);
            }

            if (!result.ok) return std::move(result).with_context("technique " + desc_.name);
            return result;
        }

        TagHash hash() const { return desc_.hash; }
        const std::string& name() const { return desc_.name; }
        ScopeBits used_scopes() const { return desc_.used_scopes; }
        bool has_stage(ShaderStage s) const { return desc_.stages[(size_t)s].has_value(); }

        ShaderHandle shader(ShaderStage s) const
        {
            const auto& stage = desc_.stages[(size_t)s];
            return stage ? stage->shader : ShaderHandle{};
        }

    private:
        Technique() = default;

        static bool has_channel_override(const TechniqueShaderDesc& stage, const ObjectChannels& channels)
        {
            for (const TechniqueChannel& ch : stage.channels)
            {
                if (channels.values.count(ch.channel_id) != 0) return true;
            }
            return false;
        }

        IGpuDevice* gpu_ = nullptr;
        TechniqueDesc desc_{};
        std::array<BufferHandle, kShaderStageCount> constant_buffers_{};
    };

    using TechniqueHandle = std::shared_ptr<const Technique>;
}
