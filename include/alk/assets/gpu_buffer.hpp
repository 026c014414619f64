#pragma once

/*
    ALKAHEST RENDER CORE

    FILE: gpu_buffer.hpp
    MODULE: assets
    PURPOSE: Owned vertex/index buffer shared by every model that references it.
*/


#include <memory>
#include <string>
#include <utility>

#include "alk/core/result.hpp"
#include "alk/gfx/gpu_device.hpp"

namespace alk
{
    class GpuBuffer
    {
    public:
        static Result<std::shared_ptr<const GpuBuffer>> create(
            IGpuDevice& gpu,
            const BufferDesc& desc,
            const void* data,
            IndexFormat index_format = IndexFormat::U16)
        {
            auto buf = gpu.create_buffer(desc, data);
            if (!buf.ok) return Result<std::shared_ptr<const GpuBuffer>>::failure(desc.debug_name + ": " + buf.error);

            std::shared_ptr<GpuBuffer> out(new GpuBuffer());
            out->gpu_ = &gpu;
            out->buffer_ = buf.value;
            out->desc_ = desc;
            out->index_format_ = index_format;
            return Result<std::shared_ptr<const GpuBuffer>>::success(std::move(out));
        }

        ~GpuBuffer()
        {
            if (gpu_ && buffer_.valid()) gpu_->destroy_buffer(buffer_);
        }

        GpuBuffer(const GpuBuffer&) = delete;
        GpuBuffer& operator=(const GpuBuffer&) = delete;

        BufferHandle handle() const { return buffer_; }
        uint32_t stride() const { return desc_.stride; }
        BufferKind kind() const { return desc_.kind; }
        IndexFormat index_format() const { return index_format_; }
        size_t size_bytes() const { return desc_.size_bytes; }

        void bind_vertex(IGpuDevice& gpu, uint32_t slot) const
        {
            gpu.bind_vertex_buffer(slot, buffer_, desc_.stride, 0);
        }

        void bind_index(IGpuDevice& gpu) const
        {
            gpu.bind_index_buffer(buffer_, index_format_);
        }

    private:
        GpuBuffer() = default;

        IGpuDevice* gpu_ = nullptr;
        BufferHandle buffer_{};
        BufferDesc desc_{};
        IndexFormat index_format_ = IndexFormat::U16;
    };

    using GpuBufferHandle = std::shared_ptr<const GpuBuffer>;
}
