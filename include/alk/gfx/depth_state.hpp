#pragma once

/*
    ALKAHEST RENDER CORE

    FILE: depth_state.hpp
    MODULE: gfx
    PURPOSE: Scene depth buffer with writeable and read-only bindings plus a
            colour-viewable copy for sampling depth in later passes.
*/


#include <string>
#include <utility>

#include "alk/core/result.hpp"
#include "alk/gfx/extent.hpp"
#include "alk/gfx/gpu_device.hpp"
#include "alk/gfx/staging_buffer.hpp"

namespace alk
{
    // Smallest extent the typeless depth format is created at.
    constexpr uint32_t kMinDepthExtent = 4;

    class DepthState
    {
    public:
        DepthState() = default;

        static Result<DepthState> create(IGpuDevice& gpu, Extent2D size, std::string name = "gbuffer_depth")
        {
            size = clamp_extent(size, kMinDepthExtent, name);

            DepthState out{};
            out.gpu_ = &gpu;
            out.size_ = size;
            out.name_ = std::move(name);

            TextureDesc desc{};
            desc.width = size.width;
            desc.height = size.height;
            desc.format = PixelFormat::R32_TYPELESS;
            desc.usage = TextureUsage_DepthStencil | TextureUsage_ShaderResource;
            desc.debug_name = out.name_;
            const auto tex = gpu.create_texture(desc);
            if (!tex.ok) return Result<DepthState>::failure(out.name_ + ": depth texture: " + tex.error);
            out.texture_ = tex.value;

            // Reverse-Z: nearer fragments carry larger depth values.
            const auto state = gpu.create_depth_stencil_state(DepthStencilDesc{true, true, CompareFunc::GreaterEqual});
            if (!state.ok) return Result<DepthState>::failure(out.name_ + ": depth state: " + state.error);
            out.state_ = state.value;

            const auto state_ro = gpu.create_depth_stencil_state(DepthStencilDesc{true, false, CompareFunc::GreaterEqual});
            if (!state_ro.ok) return Result<DepthState>::failure(out.name_ + ": read-only depth state: " + state_ro.error);
            out.state_readonly_ = state_ro.value;

            const auto dsv = gpu.create_view(ViewDesc{out.texture_, ViewKind::DepthStencil, PixelFormat::D32_FLOAT, 0, 1});
            if (!dsv.ok) return Result<DepthState>::failure(out.name_ + ": depth view: " + dsv.error);
            out.dsv_ = dsv.value;

            const auto dsv_ro = gpu.create_view(ViewDesc{out.texture_, ViewKind::DepthStencilReadOnly, PixelFormat::D32_FLOAT, 0, 1});
            if (!dsv_ro.ok) return Result<DepthState>::failure(out.name_ + ": read-only depth view: " + dsv_ro.error);
            out.dsv_readonly_ = dsv_ro.value;

            const auto srv = gpu.create_view(ViewDesc{out.texture_, ViewKind::ShaderResource, PixelFormat::R32_FLOAT, 0, 1});
            if (!srv.ok) return Result<DepthState>::failure(out.name_ + ": depth shader view: " + srv.error);
            out.srv_ = srv.value;

            TextureDesc copy_desc{};
            copy_desc.width = size.width;
            copy_desc.height = size.height;
            copy_desc.format = PixelFormat::R32_FLOAT;
            copy_desc.usage = TextureUsage_ShaderResource;
            copy_desc.debug_name = out.name_ + "_copy";
            const auto copy = gpu.create_texture(copy_desc);
            if (!copy.ok) return Result<DepthState>::failure(out.name_ + ": depth copy texture: " + copy.error);
            out.texture_copy_ = copy.value;

            const auto copy_srv = gpu.create_view(ViewDesc{out.texture_copy_, ViewKind::ShaderResource, PixelFormat::R32_FLOAT, 0, 1});
            if (!copy_srv.ok) return Result<DepthState>::failure(out.name_ + ": depth copy view: " + copy_srv.error);
            out.texture_copy_srv_ = copy_srv.value;

            return Result<DepthState>::success(std::move(out));
        }

        ~DepthState() { release(); }

        DepthState(DepthState&& o) noexcept { take(std::move(o)); }
        DepthState& operator=(DepthState&& o) noexcept
        {
            if (this != &o)
            {
                release();
                take(std::move(o));
            }
            return *this;
        }
        DepthState(const DepthState&) = delete;
        DepthState& operator=(const DepthState&) = delete;

        Status resize(Extent2D size)
        {
            if (!gpu_) return Status::failure(name_ + ": resize of an uncreated depth buffer");
            auto fresh = create(*gpu_, size, name_);
            if (!fresh.ok) return Status::failure(fresh.error);
            *this = std::move(fresh.value);
            return Status::success();
        }

        // Refreshes the sampleable copy from the live depth buffer.
        void copy_depth() const
        {
            if (gpu_) gpu_->copy_texture(texture_copy_, texture_);
        }

        void copy_to_staging(const CpuStagingBuffer& dst) const
        {
            if (gpu_) gpu_->copy_texture(dst.texture(), texture_);
        }

        void clear(float depth, uint8_t stencil) const
        {
            if (gpu_) gpu_->clear_depth_stencil(dsv_, depth, stencil);
        }

        bool valid() const { return texture_.valid(); }
        TextureHandle texture() const { return texture_; }
        TextureHandle texture_copy() const { return texture_copy_; }
        ViewHandle dsv() const { return dsv_; }
        ViewHandle dsv_readonly() const { return dsv_readonly_; }
        ViewHandle srv() const { return srv_; }
        ViewHandle texture_copy_srv() const { return texture_copy_srv_; }
        DepthStencilStateHandle state() const { return state_; }
        DepthStencilStateHandle state_readonly() const { return state_readonly_; }
        Extent2D size() const { return size_; }
        const std::string& name() const { return name_; }

    private:
        void release()
        {
            if (gpu_)
            {
                if (texture_copy_srv_.valid()) gpu_->destroy_view(texture_copy_srv_);
                if (texture_copy_.valid()) gpu_->destroy_texture(texture_copy_);
                if (srv_.valid()) gpu_->destroy_view(srv_);
                if (dsv_readonly_.valid()) gpu_->destroy_view(dsv_readonly_);
                if (dsv_.valid()) gpu_->destroy_view(dsv_);
                if (state_readonly_.valid()) gpu_->destroy_depth_stencil_state(state_readonly_);
                if (state_.valid()) gpu_->destroy_depth_stencil_state(state_);
                if (texture_.valid()) gpu_->destroy_texture(texture_);
            }
            texture_copy_srv_ = ViewHandle{};
            texture_copy_ = TextureHandle{};
            srv_ = ViewHandle{};
            dsv_readonly_ = ViewHandle{};
            dsv_ = ViewHandle{};
            state_readonly_ = DepthStencilStateHandle{};
            state_ = DepthStencilStateHandle{};
            texture_ = TextureHandle{};
        }

        void take(DepthState&& o)
        {
            gpu_ = std::exchange(o.gpu_, nullptr);
            texture_ = std::exchange(o.texture_, TextureHandle{});
            state_ = std::exchange(o.state_, DepthStencilStateHandle{});
            state_readonly_ = std::exchange(o.state_readonly_, DepthStencilStateHandle{});
            dsv_ = std::exchange(o.dsv_, ViewHandle{});
            dsv_readonly_ = std::exchange(o.dsv_readonly_, ViewHandle{});
            srv_ = std::exchange(o.srv_, ViewHandle{});
            texture_copy_ = std::exchange(o.texture_copy_, TextureHandle{});
            texture_copy_srv_ = std::exchange(o.texture_copy_srv_, ViewHandle{});
            size_ = o.size_;
            name_ = std::move(o.name_);
        }

        IGpuDevice* gpu_ = nullptr;
        TextureHandle texture_{};
        DepthStencilStateHandle state_{};
        DepthStencilStateHandle state_readonly_{};
        ViewHandle dsv_{};
        ViewHandle dsv_readonly_{};
        ViewHandle srv_{};
        TextureHandle texture_copy_{};
        ViewHandle texture_copy_srv_{};
        Extent2D size_{};
        std::string name_{};
    };
}
