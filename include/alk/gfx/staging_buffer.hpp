#pragma once

/*
    ALKAHEST RENDER CORE

    FILE: staging_buffer.hpp
    MODULE: gfx
    PURPOSE: CPU-readable copy target used for single-texel readbacks.
*/


#include <functional>
#include <string>
#include <utility>

#include "alk/core/result.hpp"
#include "alk/gfx/extent.hpp"
#include "alk/gfx/gpu_device.hpp"

namespace alk
{
    class CpuStagingBuffer
    {
    public:
        CpuStagingBuffer() = default;

        static Result<CpuStagingBuffer> create(IGpuDevice& gpu, Extent2D size, PixelFormat format, std::string name)
        {
            size = clamp_extent(size, 1, name);

            CpuStagingBuffer out{};
            out.gpu_ = &gpu;
            out.format_ = format;
            out.size_ = size;
            out.name_ = std::move(name);

            TextureDesc desc{};
            desc.width = size.width;
            desc.height = size.height;
            desc.format = format;
            desc.usage = TextureUsage_CpuRead;
            desc.debug_name = out.name_;
            const auto tex = gpu.create_texture(desc);
            if (!tex.ok) return Result<CpuStagingBuffer>::failure(out.name_ + ": staging texture: " + tex.error);
            out.texture_ = tex.value;
            return Result<CpuStagingBuffer>::success(std::move(out));
        }

        ~CpuStagingBuffer() { release(); }

        CpuStagingBuffer(CpuStagingBuffer&& o) noexcept { take(std::move(o)); }
        CpuStagingBuffer& operator=(CpuStagingBuffer&& o) noexcept
        {
            if (this != &o)
            {
                release();
                take(std::move(o));
            }
            return *this;
        }
        CpuStagingBuffer(const CpuStagingBuffer&) = delete;
        CpuStagingBuffer& operator=(const CpuStagingBuffer&) = delete;

        Status resize(Extent2D size)
        {
            if (!gpu_) return Status::failure(name_ + ": resize of an uncreated staging buffer");
            auto fresh = create(*gpu_, size, format_, name_);
            if (!fresh.ok) return Status::failure(fresh.error);
            *this = std::move(fresh.value);
            return Status::success();
        }

        Status map(const std::function<void(const MappedTexture&)>& fn) const
        {
            if (!gpu_) return Status::failure(name_ + ": map of an uncreated staging buffer");
            return gpu_->map_read(texture_, fn).with_context(name_);
        }

        bool valid() const { return texture_.valid(); }
        TextureHandle texture() const { return texture_; }
        PixelFormat format() const { return format_; }
        Extent2D size() const { return size_; }
        const std::string& name() const { return name_; }

    private:
        void release()
        {
            if (gpu_ && texture_.valid()) gpu_->destroy_texture(texture_);
            texture_ = TextureHandle{};
        }

        void take(CpuStagingBuffer&& o)
        {
            gpu_ = std::exchange(o.gpu_, nullptr);
            texture_ = std::exchange(o.texture_, TextureHandle{});
            format_ = o.format_;
            size_ = o.size_;
            name_ = std::move(o.name_);
        }

        IGpuDevice* gpu_ = nullptr;
        TextureHandle texture_{};
        PixelFormat format_ = PixelFormat::Unknown;
        Extent2D size_{};
        std::string name_{};
    };
}
