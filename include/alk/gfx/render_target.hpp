#pragma once

/*
    ALKAHEST RENDER CORE

    FILE: render_target.hpp
    MODULE: gfx
    PURPOSE: Owned colour target: texture plus its render-target and shader views.
            Format and size are fixed at creation; resize replaces the whole set.
*/


#include <string>
#include <utility>

#include <glm/glm.hpp>

#include "alk/core/result.hpp"
#include "alk/gfx/extent.hpp"
#include "alk/gfx/gpu_device.hpp"
#include "alk/gfx/staging_buffer.hpp"

namespace alk
{
    class RenderTarget
    {
    public:
        RenderTarget() = default;

        static Result<RenderTarget> create(IGpuDevice& gpu, Extent2D size, PixelFormat format, std::string name)
        {
            size = clamp_extent(size, 1, name);

            RenderTarget out{};
            out.gpu_ = &gpu;
            out.format_ = format;
            out.size_ = size;
            out.name_ = std::move(name);

            TextureDesc desc{};
            desc.width = size.width;
            desc.height = size.height;
            desc.format = format;
            desc.usage = TextureUsage_RenderTarget | TextureUsage_ShaderResource;
            desc.debug_name = out.name_;

            const auto tex = gpu.create_texture(desc);
            if (!tex.ok) return Result<RenderTarget>::failure(out.name_ + ": texture: " + tex.error);
            out.texture_ = tex.value;

            const auto rtv = gpu.create_view(ViewDesc{out.texture_, ViewKind::RenderTarget, format, 0, 1});
            if (!rtv.ok) return Result<RenderTarget>::failure(out.name_ + ": render target view: " + rtv.error);
            out.rtv_ = rtv.value;

            const auto srv = gpu.create_view(ViewDesc{out.texture_, ViewKind::ShaderResource, format, 0, 1});
            if (!srv.ok) return Result<RenderTarget>::failure(out.name_ + ": shader resource view: " + srv.error);
            out.srv_ = srv.value;

            return Result<RenderTarget>::success(std::move(out));
        }

        ~RenderTarget() { release(); }

        RenderTarget(RenderTarget&& o) noexcept { take(std::move(o)); }
        RenderTarget& operator=(RenderTarget&& o) noexcept
        {
            if (this != &o)
            {
                release();
                take(std::move(o));
            }
            return *this;
        }
        RenderTarget(const RenderTarget&) = delete;
        RenderTarget& operator=(const RenderTarget&) = delete;

        // New resources are created before the old ones are released.
        Status resize(Extent2D size)
        {
            if (!gpu_) return Status::failure(name_ + ": resize of an uncreated render target");
            auto fresh = create(*gpu_, size, format_, name_);
            if (!fresh.ok) return Status::failure(fresh.error);
            *this = std::move(fresh.value);
            return Status::success();
        }

        void copy_to(const RenderTarget& dst) const
        {
            if (gpu_) gpu_->copy_texture(dst.texture_, texture_);
        }

        void copy_to_staging(const CpuStagingBuffer& dst) const
        {
            if (gpu_) gpu_->copy_texture(dst.texture(), texture_);
        }

        void clear(const glm::vec4& color) const
        {
            if (gpu_) gpu_->clear_render_target(rtv_, color);
        }

        Viewport viewport() const
        {
            Viewport vp{};
            vp.width = (float)size_.width;
            vp.height = (float)size_.height;
            return vp;
        }

        // Binds as RT0 without a depth target.
        void bind() const
        {
            if (!gpu_) return;
            const ViewHandle targets[] = {rtv_};
            gpu_->set_render_targets(targets, ViewHandle{});
            gpu_->set_viewport(viewport());
        }

        bool valid() const { return texture_.valid(); }
        TextureHandle texture() const { return texture_; }
        ViewHandle rtv() const { return rtv_; }
        ViewHandle srv() const { return srv_; }
        PixelFormat format() const { return format_; }
        Extent2D size() const { return size_; }
        const std::string& name() const { return name_; }

    private:
        void release()
        {
            if (gpu_)
            {
                if (srv_.valid()) gpu_->destroy_view(srv_);
                if (rtv_.valid()) gpu_->destroy_view(rtv_);
                if (texture_.valid()) gpu_->destroy_texture(texture_);
            }
            srv_ = ViewHandle{};
            rtv_ = ViewHandle{};
            texture_ = TextureHandle{};
        }

        void take(RenderTarget&& o)
        {
            gpu_ = std::exchange(o.gpu_, nullptr);
            texture_ = std::exchange(o.texture_, TextureHandle{});
            rtv_ = std::exchange(o.rtv_, ViewHandle{});
            srv_ = std::exchange(o.srv_, ViewHandle{});
            format_ = o.format_;
            size_ = o.size_;
            name_ = std::move(o.name_);
        }

        IGpuDevice* gpu_ = nullptr;
        TextureHandle texture_{};
        ViewHandle rtv_{};
        ViewHandle srv_{};
        PixelFormat format_ = PixelFormat::Unknown;
        Extent2D size_{};
        std::string name_{};
    };
}
