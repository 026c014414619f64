#pragma once

/*
    ALKAHEST RENDER CORE

    FILE: gpu_device.hpp
    MODULE: gfx
    PURPOSE: Graphics device interface. The render core issues every resource
            operation and draw call through IGpuDevice; drivers implement it.
*/


#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>
#include <string>
#include <string_view>

#include <glm/glm.hpp>

#include "alk/core/result.hpp"
#include "alk/gfx/gpu_handles.hpp"
#include "alk/gfx/pixel_format.hpp"

namespace alk
{
    enum class ShaderStage : uint8_t
    {
        Vertex = 0,
        Pixel = 1,
        Geometry = 2,
        Compute = 3
    };

    constexpr uint32_t kShaderStageCount = 4;

    inline const char* shader_stage_name(ShaderStage s)
    {
        switch (s)
        {
            case ShaderStage::Vertex: return "vs";
            case ShaderStage::Pixel: return "ps";
            case ShaderStage::Geometry: return "gs";
            case ShaderStage::Compute: return "cs";
        }
        return "unknown";
    }

    enum class PrimitiveTopology : uint8_t
    {
        TriangleList = 0,
        TriangleStrip = 1,
        LineList = 2,
        LineStrip = 3,
        PointList = 4
    };

    enum class IndexFormat : uint8_t
    {
        U16 = 0,
        U32 = 1
    };

    enum class CompareFunc : uint8_t
    {
        Never,
        Less,
        Equal,
        LessEqual,
        Greater,
        NotEqual,
        GreaterEqual,
        Always
    };

    enum class BlendMode : uint8_t
    {
        Opaque = 0,
        AlphaBlend = 1,
        Additive = 2,
        Multiply = 3
    };

    enum TextureUsageBits : uint32_t
    {
        TextureUsage_RenderTarget = 1u << 0,
        TextureUsage_ShaderResource = 1u << 1,
        TextureUsage_DepthStencil = 1u << 2,
        TextureUsage_CpuRead = 1u << 3
    };

    struct TextureDesc
    {
        uint32_t width = 0;
        uint32_t height = 0;
        uint32_t layers = 1;
        PixelFormat format = PixelFormat::Unknown;
        uint32_t usage = 0;
        std::string debug_name{};
    };

    enum class ViewKind : uint8_t
    {
        RenderTarget = 0,
        ShaderResource = 1,
        DepthStencil = 2,
        DepthStencilReadOnly = 3
    };

    struct ViewDesc
    {
        TextureHandle texture{};
        ViewKind kind = ViewKind::ShaderResource;
        PixelFormat format = PixelFormat::Unknown; // Unknown = texture format
        uint32_t first_layer = 0;
        uint32_t layer_count = 0;                  // 0 = all remaining layers
    };

    enum class BufferKind : uint8_t
    {
        Vertex = 0,
        Index = 1,
        Constant = 2,
        Instance = 3
    };

    struct BufferDesc
    {
        BufferKind kind = BufferKind::Constant;
        size_t size_bytes = 0;
        uint32_t stride = 0;
        std::string debug_name{};
    };

    struct DepthStencilDesc
    {
        bool depth_enable = true;
        bool depth_write = true;
        CompareFunc compare = CompareFunc::GreaterEqual;
    };

    struct Viewport
    {
        float x = 0.0f;
        float y = 0.0f;
        float width = 0.0f;
        float height = 0.0f;
        float min_depth = 0.0f;
        float max_depth = 1.0f;
    };

    struct MappedTexture
    {
        const uint8_t* data = nullptr;
        uint32_t row_pitch = 0;
        uint32_t width = 0;
        uint32_t height = 0;
        PixelFormat format = PixelFormat::Unknown;
    };

    struct GpuDeviceStats
    {
        uint64_t draw_calls = 0;
        uint64_t indexed_draw_calls = 0;
        uint64_t instanced_draw_calls = 0;
        uint64_t vertex_shader_overrides = 0;
        uint64_t clears = 0;
        uint64_t copies = 0;
        uint64_t blits = 0;
        uint64_t cpu_reads = 0;
        uint32_t live_textures = 0;
        uint32_t live_views = 0;
        uint32_t live_buffers = 0;
    };

    class IGpuDevice
    {
    public:
        virtual ~IGpuDevice() = default;

        virtual const char* name() const = 0;
        virtual const GpuDeviceStats& stats() const = 0;

        // Resources
        virtual Result<TextureHandle> create_texture(const TextureDesc& desc) = 0;
        virtual Result<ViewHandle> create_view(const ViewDesc& desc) = 0;
        virtual Result<BufferHandle> create_buffer(const BufferDesc& desc, const void* initial_data) = 0;
        virtual Result<DepthStencilStateHandle> create_depth_stencil_state(const DepthStencilDesc& desc) = 0;
        virtual void destroy_texture(TextureHandle h) = 0;
        virtual void destroy_view(ViewHandle h) = 0;
        virtual void destroy_buffer(BufferHandle h) = 0;
        virtual void destroy_depth_stencil_state(DepthStencilStateHandle h) = 0;
        virtual TextureDesc texture_desc(TextureHandle h) const = 0;
        virtual TextureHandle view_texture(ViewHandle h) const = 0;
        virtual Status write_buffer(BufferHandle h, const void* data, size_t size_bytes) = 0;
        // Tightly packed texels in the texture's own format, one full layer.
        virtual Status write_texture(TextureHandle h, uint32_t layer, const void* data, size_t size_bytes) = 0;

        // Pipeline state
        virtual void bind_shader(ShaderStage stage, ShaderHandle shader) = 0;
        // Replaces whatever vertex shader the bound technique selected.
        virtual void bind_vertex_shader_override(ShaderHandle shader) = 0;
        virtual void set_input_layout(uint32_t layout_index) = 0;
        virtual void set_topology(PrimitiveTopology topology) = 0;
        virtual void bind_vertex_buffer(uint32_t slot, BufferHandle buffer, uint32_t stride, uint32_t offset) = 0;
        virtual void bind_index_buffer(BufferHandle buffer, IndexFormat format) = 0;
        virtual void bind_constant_buffer(ShaderStage stage, uint32_t slot, BufferHandle buffer) = 0;
        virtual void bind_shader_resource(ShaderStage stage, uint32_t slot, ViewHandle view) = 0;
        virtual void set_render_targets(std::span<const ViewHandle> colors, ViewHandle depth) = 0;
        virtual void set_depth_stencil_state(DepthStencilStateHandle state) = 0;
        virtual void set_blend_mode(BlendMode mode) = 0;
        virtual void set_viewport(const Viewport& vp) = 0;
        virtual void unbind_render_targets() = 0;
        virtual void unbind_shader_resources() = 0;

        // Draws
        virtual void draw(uint32_t vertex_count, uint32_t start_vertex) = 0;
        virtual void draw_indexed(uint32_t index_count, uint32_t start_index, int32_t base_vertex) = 0;
        virtual void draw_indexed_instanced(
            uint32_t index_count,
            uint32_t instance_count,
            uint32_t start_index,
            int32_t base_vertex,
            uint32_t start_instance) = 0;

        // Transfers
        virtual void clear_render_target(ViewHandle rtv, const glm::vec4& color) = 0;
        virtual void clear_depth_stencil(ViewHandle dsv, float depth, uint8_t stencil) = 0;
        virtual void copy_texture(TextureHandle dst, TextureHandle src) = 0;
        virtual void copy_texture_layer(TextureHandle dst, uint32_t dst_layer, TextureHandle src, uint32_t src_layer) = 0;
        virtual void blit(ViewHandle src_srv, ViewHandle dst_rtv) = 0;
        // Blocks until preceding copies into the staging texture have completed.
        virtual Status map_read(TextureHandle staging, const std::function<void(const MappedTexture&)>& fn) = 0;

        virtual void begin_event(std::string_view label) { (void)label; }
        virtual void end_event() {}
    };

    class GpuEventScope
    {
    public:
        GpuEventScope(IGpuDevice& gpu, std::string_view label)
            : gpu_(gpu)
        {
            gpu_.begin_event(label);
        }

        ~GpuEventScope()
        {
            gpu_.end_event();
        }

        GpuEventScope(const GpuEventScope&) = delete;
        GpuEventScope& operator=(const GpuEventScope&) = delete;

    private:
        IGpuDevice& gpu_;
    };
}
