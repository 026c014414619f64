#pragma once

/*
    ALKAHEST RENDER CORE

    FILE: scope_registry.hpp
    MODULE: tfx
    PURPOSE: Constant buffers for render-global scopes. Binding a scope fills its
            buffer from the current externs and binds it to vertex and pixel stages.
*/


#include <array>
#include <cstring>
#include <span>
#include <utility>

#include <glm/glm.hpp>

#include "alk/core/result.hpp"
#include "alk/gfx/gpu_device.hpp"
#include "alk/tfx/externs.hpp"
#include "alk/tfx/scope.hpp"

namespace alk
{
    // Scopes whose data belongs to the drawable; the drawable binds them itself.
    inline bool scope_is_object_bound(Scope s)
    {
        switch (s)
        {
            case Scope::RigidModel:
            case Scope::Skinning:
            case Scope::Instances:
            case Scope::Speedtree:
            case Scope::SpeedtreeLodDrawcallData:
            case Scope::Terrain:
            case Scope::ChunkModel:
            case Scope::Decal:
            case Scope::EditorMesh:
            case Scope::EditorTerrain:
                return true;
            default:
                return false;
        }
    }

    inline uint32_t scope_slot(Scope s)
    {
        switch (s)
        {
            case Scope::Frame: return 13;
            case Scope::View: return 12;
            case Scope::Transparent: return 11;
            case Scope::Skinning: return 2;
            case Scope::RigidModel:
            case Scope::Instances:
            case Scope::Speedtree:
            case Scope::Terrain:
            case Scope::ChunkModel:
            case Scope::Decal:
                return 1;
            default:
                return 10;
        }
    }

    // Texture slots the transparent scope binds its atmosphere lookups to.
    constexpr uint32_t kTransparentScopeTextureSlot = 14;

    // Channel overrides are written here instead of into a shared technique's buffer.
    constexpr size_t kChannelScratchBytes = 4096;

    class ScopeRegistry
    {
    public:
        ScopeRegistry() = default;

        static Result<ScopeRegistry> create(IGpuDevice& gpu)
        {
            ScopeRegistry out{};
            out.gpu_ = &gpu;

            const auto make = [&gpu](size_t size, const char* name) -> Result<BufferHandle>
            {
                BufferDesc desc{};
                desc.kind = BufferKind::Constant;
                desc.size_bytes = size;
                desc.debug_name = name;
                return gpu.create_buffer(desc, nullptr).with_context(name);
            };

            auto frame = make(sizeof(glm::vec4) * 2, "scope_frame");
            if (!frame.ok) return Result<ScopeRegistry>::failure(frame.error);
            out.frame_ = frame.value;

            auto view = make(sizeof(ViewExtern), "scope_view");
            if (!view.ok) return Result<ScopeRegistry>::failure(view.error);
            out.view_ = view.value;

            auto transparent = make(sizeof(glm::vec4), "scope_transparent");
            if (!transparent.ok) return Result<ScopeRegistry>::failure(transparent.error);
            out.transparent_ = transparent.value;

            for (uint32_t i = 0; i < kShaderStageCount; ++i)
            {
                auto scratch = make(kChannelScratchBytes, "technique_channel_scratch");
                if (!scratch.ok) return Result<ScopeRegistry>::failure(scratch.error);
                out.channel_scratch_[i] = scratch.value;
            }

            return Result<ScopeRegistry>::success(std::move(out));
        }

        ~ScopeRegistry() { release(); }

        ScopeRegistry(ScopeRegistry&& o) noexcept { take(std::move(o)); }
        ScopeRegistry& operator=(ScopeRegistry&& o) noexcept
        {
            if (this != &o)
            {
                release();
                take(std::move(o));
            }
            return *this;
        }
        ScopeRegistry(const ScopeRegistry&) = delete;
        ScopeRegistry& operator=(const ScopeRegistry&) = delete;

        Status bind(Scope scope, const Externs& externs)
        {
            if (!gpu_) return Status::failure("scope registry not created");
            if (scope_is_object_bound(scope)) return Status::success();

            switch (scope)
            {
                case Scope::Frame:
                {
                    if (!externs.frame) return missing_extern(scope);
                    const FrameExtern& f = *externs.frame;
                    const glm::vec4 data[2] = {
                        glm::vec4(f.game_time, f.render_time, f.delta_game_time, f.exposure_scale),
                        glm::vec4(0.0f)
                    };
                    return write_and_bind(scope, frame_, data, sizeof(data));
                }
                case Scope::View:
                {
                    if (!externs.view) return missing_extern(scope);
                    return write_and_bind(scope, view_, &*externs.view, sizeof(ViewExtern));
                }
                case Scope::Transparent:
                {
                    if (!externs.transparent) return missing_extern(scope);
                    const TransparentExtern& t = *externs.transparent;
                    const Status st = write_and_bind(scope, transparent_, &t.atmosphere_params, sizeof(glm::vec4));
                    if (!st.ok) return st;
                    gpu_->bind_shader_resource(ShaderStage::Pixel, kTransparentScopeTextureSlot + 0, t.atmos_far_lookup);
                    gpu_->bind_shader_resource(ShaderStage::Pixel, kTransparentScopeTextureSlot + 1, t.atmos_near_lookup);
                    gpu_->bind_shader_resource(ShaderStage::Pixel, kTransparentScopeTextureSlot + 2, t.depth_angle_density_lookup);
                    return Status::success();
                }
                default:
                    // Scopes this core does not provide data for are left to whatever is bound.
                    return Status::success();
            }
        }

        Status bind_channel_constants(ShaderStage stage, uint32_t slot, std::span<const uint8_t> bytes)
        {
            if (!gpu_) return Status::failure("scope registry not created");
            if (bytes.size() > kChannelScratchBytes)
            {
                return Status::failure("channel constants of " + std::to_string(bytes.size()) + " bytes exceed scratch buffer");
            }
            const BufferHandle buf = channel_scratch_[(size_t)stage];
            const Status st = gpu_->write_buffer(buf, bytes.data(), bytes.size());
            if (!st.ok) return st;
            gpu_->bind_constant_buffer(stage, slot, buf);
            return Status::success();
        }

    private:
        static Status missing_extern(Scope scope)
        {
            return Status::failure(std::string("scope ") + scope_name(scope) + ": extern not set");
        }

        Status write_and_bind(Scope scope, BufferHandle buf, const void* data, size_t size)
        {
            const Status st = gpu_->write_buffer(buf, data, size);
            if (!st.ok) return Status(st).with_context(std::string("scope ") + scope_name(scope));
            gpu_->bind_constant_buffer(ShaderStage::Vertex, scope_slot(scope), buf);
            gpu_->bind_constant_buffer(ShaderStage::Pixel, scope_slot(scope), buf);
            return Status::success();
        }

        void release()
        {
            if (gpu_)
            {
                for (BufferHandle& b : channel_scratch_)
                {
                    if (b.valid()) gpu_->destroy_buffer(b);
                    b = BufferHandle{};
                }
                if (transparent_.valid()) gpu_->destroy_buffer(transparent_);
                if (view_.valid()) gpu_->destroy_buffer(view_);
                if (frame_.valid()) gpu_->destroy_buffer(frame_);
            }
            transparent_ = BufferHandle{};
            view_ = BufferHandle{};
            frame_ = BufferHandle{};
        }

        void take(ScopeRegistry&& o)
        {
            gpu_ = std::exchange(o.gpu_, nullptr);
            frame_ = std::exchange(o.frame_, BufferHandle{});
            view_ = std::exchange(o.view_, BufferHandle{});
            transparent_ = std::exchange(o.transparent_, BufferHandle{});
            channel_scratch_ = o.channel_scratch_;
            o.channel_scratch_ = {};
        }

        IGpuDevice* gpu_ = nullptr;
        BufferHandle frame_{};
        BufferHandle view_{};
        BufferHandle transparent_{};
        std::array<BufferHandle, kShaderStageCount> channel_scratch_{};
    };
}
