#pragma once

/*
    ALKAHEST RENDER CORE

    FILE: sw_gpu_device.hpp
    MODULE: gfx
    PURPOSE: CPU-memory IGpuDevice. Resource lifetime, clears, copies, blits and
            staging reads operate on real texel storage; draws are recorded
            with the pipeline state they were issued under.
*/


#include <algorithm>
#include <cstring>
#include <string>
#include <unordered_map>
#include <vector>

#include "alk/core/log.hpp"
#include "alk/gfx/gpu_device.hpp"

namespace alk
{
    enum class SwDrawKind : uint8_t
    {
        Draw = 0,
        Indexed = 1,
        IndexedInstanced = 2
    };

    struct SwDrawRecord
    {
        SwDrawKind kind = SwDrawKind::Draw;
        ShaderHandle vertex_shader{};
        ShaderHandle pixel_shader{};
        bool vertex_shader_overridden = false;
        PrimitiveTopology topology = PrimitiveTopology::TriangleList;
        BlendMode blend = BlendMode::Opaque;
        uint32_t input_layout = 0;
        uint32_t count = 0;
        uint32_t instance_count = 1;
        uint32_t start = 0;
        int32_t base_vertex = 0;
        std::vector<ViewHandle> color_targets{};
        ViewHandle depth_target{};
        std::string event{};
    };

    class SoftwareGpuDevice : public IGpuDevice
    {
    public:
        const char* name() const override { return "software"; }
        const GpuDeviceStats& stats() const override { return stats_; }

        const std::vector<SwDrawRecord>& draws() const { return draws_; }
        void clear_draw_log() { draws_.clear(); }

        // Makes the next texture creation whose debug name matches fail, once.
        void fail_next_texture_named(std::string name) { fail_texture_name_ = std::move(name); }

        Result<TextureHandle> create_texture(const TextureDesc& desc) override
        {
            if (!fail_texture_name_.empty() && desc.debug_name == fail_texture_name_)
            {
                fail_texture_name_.clear();
                return Result<TextureHandle>::failure("out of device memory");
            }
            if (desc.width == 0 || desc.height == 0 || desc.layers == 0)
            {
                return Result<TextureHandle>::failure("invalid texture extent");
            }
            if (desc.format == PixelFormat::Unknown)
            {
                return Result<TextureHandle>::failure("unknown pixel format");
            }

            SwTexture tex{};
            tex.desc = desc;
            tex.channels = pixel_format_channels(desc.format);
            tex.texels.assign(
                (size_t)desc.width * (size_t)desc.height * (size_t)desc.layers * (size_t)tex.channels,
                0.0f);

            TextureHandle h{};
            h.id = next_id_++;
            textures_.emplace(h.id, std::move(tex));
            ++stats_.live_textures;
            return Result<TextureHandle>::success(h);
        }

        Result<ViewHandle> create_view(const ViewDesc& desc) override
        {
            const SwTexture* tex = find_texture(desc.texture);
            if (!tex) return Result<ViewHandle>::failure("view of unknown texture");
            if (desc.first_layer >= tex->desc.layers)
            {
                return Result<ViewHandle>::failure("view layer out of range");
            }

            const bool is_depth_view = desc.kind == ViewKind::DepthStencil || desc.kind == ViewKind::DepthStencilReadOnly;
            if (is_depth_view && (tex->desc.usage & TextureUsage_DepthStencil) == 0)
            {
                return Result<ViewHandle>::failure("depth view of texture without depth usage");
            }
            if (desc.kind == ViewKind::RenderTarget && (tex->desc.usage & TextureUsage_RenderTarget) == 0)
            {
                return Result<ViewHandle>::failure("render-target view of texture without render-target usage");
            }

            SwView view{};
            view.desc = desc;
            if (view.desc.layer_count == 0) view.desc.layer_count = tex->desc.layers - desc.first_layer;

            ViewHandle h{};
            h.id = next_id_++;
            views_.emplace(h.id, view);
            ++stats_.live_views;
            return Result<ViewHandle>::success(h);
        }

        Result<BufferHandle> create_buffer(const BufferDesc& desc, const void* initial_data) override
        {
            if (desc.size_bytes == 0) return Result<BufferHandle>::failure("zero-sized buffer");
            std::vector<uint8_t> bytes(desc.size_bytes, 0);
            if (initial_data) std::memcpy(bytes.data(), initial_data, desc.size_bytes);

            BufferHandle h{};
            h.id = next_id_++;
            buffers_.emplace(h.id, SwBuffer{desc, std::move(bytes)});
            ++stats_.live_buffers;
            return Result<BufferHandle>::success(h);
        }

        Result<DepthStencilStateHandle> create_depth_stencil_state(const DepthStencilDesc& desc) override
        {
            DepthStencilStateHandle h{};
            h.id = next_id_++;
            depth_states_.emplace(h.id, desc);
            return Result<DepthStencilStateHandle>::success(h);
        }

        void destroy_texture(TextureHandle h) override
        {
            if (textures_.erase(h.id) > 0) --stats_.live_textures;
        }

        void destroy_view(ViewHandle h) override
        {
            if (views_.erase(h.id) > 0) --stats_.live_views;
        }

        void destroy_buffer(BufferHandle h) override
        {
            if (buffers_.erase(h.id) > 0) --stats_.live_buffers;
        }

        void destroy_depth_stencil_state(DepthStencilStateHandle h) override
        {
            depth_states_.erase(h.id);
        }

        TextureDesc texture_desc(TextureHandle h) const override
        {
            const SwTexture* tex = find_texture(h);
            return tex ? tex->desc : TextureDesc{};
        }

        TextureHandle view_texture(ViewHandle h) const override
        {
            auto it = views_.find(h.id);
            return it == views_.end() ? TextureHandle{} : it->second.desc.texture;
        }

        Status write_buffer(BufferHandle h, const void* data, size_t size_bytes) override
        {
            auto it = buffers_.find(h.id);
            if (it == buffers_.end()) return Status::failure("write to unknown buffer");
            if (size_bytes > it->second.bytes.size())
            {
                return Status::failure("write of " + std::to_string(size_bytes) + " bytes overflows buffer '" +
                    it->second.desc.debug_name + "'");
            }
            std::memcpy(it->second.bytes.data(), data, size_bytes);
            return Status::success();
        }

        // Only 32-bit float formats carry an upload path here.
        Status write_texture(TextureHandle h, uint32_t layer, const void* data, size_t size_bytes) override
        {
            SwTexture* tex = find_texture(h);
            if (!tex) return Status::failure("write to unknown texture");
            if (layer >= tex->desc.layers) return Status::failure("write to missing layer of '" + tex->desc.debug_name + "'");
            if (pixel_format_bytes(tex->desc.format) != tex->channels * sizeof(float))
            {
                return Status::failure(std::string("no upload path for ") + pixel_format_name(tex->desc.format));
            }
            const size_t expected = tex->layer_stride() * sizeof(float);
            if (size_bytes != expected)
            {
                return Status::failure("texture upload of " + std::to_string(size_bytes) + " bytes, expected " +
                    std::to_string(expected));
            }
            std::memcpy(tex->texel(layer, 0, 0), data, size_bytes);
            return Status::success();
        }

        const std::vector<uint8_t>* buffer_bytes(BufferHandle h) const
        {
            auto it = buffers_.find(h.id);
            return it == buffers_.end() ? nullptr : &it->second.bytes;
        }

        void bind_shader(ShaderStage stage, ShaderHandle shader) override
        {
            shaders_[(size_t)stage] = shader;
            if (stage == ShaderStage::Vertex) vs_overridden_ = false;
        }

        void bind_vertex_shader_override(ShaderHandle shader) override
        {
            shaders_[(size_t)ShaderStage::Vertex] = shader;
            vs_overridden_ = true;
            ++stats_.vertex_shader_overrides;
        }

        void set_input_layout(uint32_t layout_index) override { input_layout_ = layout_index; }
        void set_topology(PrimitiveTopology topology) override { topology_ = topology; }

        void bind_vertex_buffer(uint32_t slot, BufferHandle buffer, uint32_t stride, uint32_t offset) override
        {
            (void)slot; (void)buffer; (void)stride; (void)offset;
        }

        void bind_index_buffer(BufferHandle buffer, IndexFormat format) override
        {
            (void)buffer; (void)format;
        }

        void bind_constant_buffer(ShaderStage stage, uint32_t slot, BufferHandle buffer) override
        {
            constant_bindings_[binding_key(stage, slot)] = buffer;
        }

        void bind_shader_resource(ShaderStage stage, uint32_t slot, ViewHandle view) override
        {
            resource_bindings_[binding_key(stage, slot)] = view;
        }

        BufferHandle bound_constant_buffer(ShaderStage stage, uint32_t slot) const
        {
            auto it = constant_bindings_.find(binding_key(stage, slot));
            return it == constant_bindings_.end() ? BufferHandle{} : it->second;
        }

        ViewHandle bound_shader_resource(ShaderStage stage, uint32_t slot) const
        {
            auto it = resource_bindings_.find(binding_key(stage, slot));
            return it == resource_bindings_.end() ? ViewHandle{} : it->second;
        }

        void set_render_targets(std::span<const ViewHandle> colors, ViewHandle depth) override
        {
            color_targets_.assign(colors.begin(), colors.end());
            depth_target_ = depth;
        }

        const std::vector<ViewHandle>& bound_render_targets() const { return color_targets_; }
        ViewHandle bound_depth_target() const { return depth_target_; }

        void set_depth_stencil_state(DepthStencilStateHandle state) override { depth_state_ = state; }
        void set_blend_mode(BlendMode mode) override { blend_ = mode; }
        void set_viewport(const Viewport& vp) override { viewport_ = vp; }
        const Viewport& viewport() const { return viewport_; }

        void unbind_render_targets() override
        {
            color_targets_.clear();
            depth_target_ = ViewHandle{};
        }

        void unbind_shader_resources() override
        {
            resource_bindings_.clear();
        }

        void draw(uint32_t vertex_count, uint32_t start_vertex) override
        {
            SwDrawRecord r = make_record(SwDrawKind::Draw);
            r.count = vertex_count;
            r.start = start_vertex;
            draws_.push_back(std::move(r));
            ++stats_.draw_calls;
        }

        void draw_indexed(uint32_t index_count, uint32_t start_index, int32_t base_vertex) override
        {
            SwDrawRecord r = make_record(SwDrawKind::Indexed);
            r.count = index_count;
            r.start = start_index;
            r.base_vertex = base_vertex;
            draws_.push_back(std::move(r));
            ++stats_.draw_calls;
            ++stats_.indexed_draw_calls;
        }

        void draw_indexed_instanced(
            uint32_t index_count,
            uint32_t instance_count,
            uint32_t start_index,
            int32_t base_vertex,
            uint32_t start_instance) override
        {
            (void)start_instance;
            SwDrawRecord r = make_record(SwDrawKind::IndexedInstanced);
            r.count = index_count;
            r.instance_count = instance_count;
            r.start = start_index;
            r.base_vertex = base_vertex;
            draws_.push_back(std::move(r));
            ++stats_.draw_calls;
            ++stats_.instanced_draw_calls;
        }

        void clear_render_target(ViewHandle rtv, const glm::vec4& color) override
        {
            const float c[4] = {color.r, color.g, color.b, color.a};
            fill_view(rtv, c);
            ++stats_.clears;
        }

        void clear_depth_stencil(ViewHandle dsv, float depth, uint8_t stencil) override
        {
            (void)stencil;
            const float c[4] = {depth, depth, depth, depth};
            fill_view(dsv, c);
            ++stats_.clears;
        }

        void copy_texture(TextureHandle dst, TextureHandle src) override
        {
            SwTexture* d = find_texture(dst);
            const SwTexture* s = find_texture(src);
            if (!d || !s) return;
            if (d->desc.width != s->desc.width || d->desc.height != s->desc.height || d->desc.layers != s->desc.layers)
            {
                log_error("copy_texture: extent mismatch '" + s->desc.debug_name + "' -> '" + d->desc.debug_name + "'");
                return;
            }
            for (uint32_t layer = 0; layer < s->desc.layers; ++layer) copy_layer(*d, layer, *s, layer);
            ++stats_.copies;
        }

        void copy_texture_layer(TextureHandle dst, uint32_t dst_layer, TextureHandle src, uint32_t src_layer) override
        {
            SwTexture* d = find_texture(dst);
            const SwTexture* s = find_texture(src);
            if (!d || !s) return;
            if (d->desc.width != s->desc.width || d->desc.height != s->desc.height ||
                dst_layer >= d->desc.layers || src_layer >= s->desc.layers)
            {
                log_error("copy_texture_layer: extent mismatch '" + s->desc.debug_name + "' -> '" + d->desc.debug_name + "'");
                return;
            }
            copy_layer(*d, dst_layer, *s, src_layer);
            ++stats_.copies;
        }

        void blit(ViewHandle src_srv, ViewHandle dst_rtv) override
        {
            const SwView* sv = find_view(src_srv);
            const SwView* dv = find_view(dst_rtv);
            if (!sv || !dv) return;
            const SwTexture* s = find_texture(sv->desc.texture);
            SwTexture* d = find_texture(dv->desc.texture);
            if (!s || !d) return;

            // Nearest sampling into the destination extent.
            const uint32_t channels = std::min(s->channels, d->channels);
            for (uint32_t y = 0; y < d->desc.height; ++y)
            {
                const uint32_t sy = (uint32_t)(((uint64_t)y * s->desc.height) / d->desc.height);
                for (uint32_t x = 0; x < d->desc.width; ++x)
                {
                    const uint32_t sx = (uint32_t)(((uint64_t)x * s->desc.width) / d->desc.width);
                    const float* sp = s->texel(sv->desc.first_layer, sx, sy);
                    float* dp = d->texel(dv->desc.first_layer, x, y);
                    for (uint32_t c = 0; c < channels; ++c) dp[c] = sp[c];
                }
            }
            ++stats_.blits;
        }

        Status map_read(TextureHandle staging, const std::function<void(const MappedTexture&)>& fn) override
        {
            const SwTexture* tex = find_texture(staging);
            if (!tex) return Status::failure("map of unknown texture");
            if ((tex->desc.usage & TextureUsage_CpuRead) == 0)
            {
                return Status::failure("texture '" + tex->desc.debug_name + "' is not CPU readable");
            }

            MappedTexture m{};
            m.data = reinterpret_cast<const uint8_t*>(tex->texels.data());
            m.row_pitch = tex->desc.width * tex->channels * (uint32_t)sizeof(float);
            m.width = tex->desc.width;
            m.height = tex->desc.height;
            m.format = tex->desc.format;
            fn(m);
            ++stats_.cpu_reads;
            return Status::success();
        }

        void begin_event(std::string_view label) override { events_.emplace_back(label); }
        void end_event() override
        {
            if (!events_.empty()) events_.pop_back();
        }

        // Direct texel access for inspection.
        bool read_texel(TextureHandle h, uint32_t layer, uint32_t x, uint32_t y, float out[4]) const
        {
            const SwTexture* tex = find_texture(h);
            if (!tex || layer >= tex->desc.layers || x >= tex->desc.width || y >= tex->desc.height) return false;
            const float* p = tex->texel(layer, x, y);
            for (uint32_t c = 0; c < 4; ++c) out[c] = c < tex->channels ? p[c] : 0.0f;
            return true;
        }

        bool write_texel(TextureHandle h, uint32_t layer, uint32_t x, uint32_t y, const float in[4])
        {
            SwTexture* tex = find_texture(h);
            if (!tex || layer >= tex->desc.layers || x >= tex->desc.width || y >= tex->desc.height) return false;
            float* p = tex->texel(layer, x, y);
            for (uint32_t c = 0; c < tex->channels; ++c) p[c] = in[c];
            return true;
        }

    private:
        struct SwTexture
        {
            TextureDesc desc{};
            uint32_t channels = 0;
            std::vector<float> texels{};

            size_t layer_stride() const { return (size_t)desc.width * (size_t)desc.height * (size_t)channels; }

            float* texel(uint32_t layer, uint32_t x, uint32_t y)
            {
                return texels.data() + layer * layer_stride() + ((size_t)y * desc.width + x) * channels;
            }

            const float* texel(uint32_t layer, uint32_t x, uint32_t y) const
            {
                return texels.data() + layer * layer_stride() + ((size_t)y * desc.width + x) * channels;
            }
        };

        struct SwView
        {
            ViewDesc desc{};
        };

        struct SwBuffer
        {
            BufferDesc desc{};
            std::vector<uint8_t> bytes{};
        };

        static uint64_t binding_key(ShaderStage stage, uint32_t slot)
        {
            return ((uint64_t)stage << 32) | slot;
        }

        SwTexture* find_texture(TextureHandle h)
        {
            auto it = textures_.find(h.id);
            return it == textures_.end() ? nullptr : &it->second;
        }

        const SwTexture* find_texture(TextureHandle h) const
        {
            auto it = textures_.find(h.id);
            return it == textures_.end() ? nullptr : &it->second;
        }

        const SwView* find_view(ViewHandle h) const
        {
            auto it = views_.find(h.id);
            return it == views_.end() ? nullptr : &it->second;
        }

        void fill_view(ViewHandle h, const float value[4])
        {
            const SwView* view = find_view(h);
            if (!view) return;
            SwTexture* tex = find_texture(view->desc.texture);
            if (!tex) return;
            const uint32_t last = std::min(tex->desc.layers, view->desc.first_layer + view->desc.layer_count);
            for (uint32_t layer = view->desc.first_layer; layer < last; ++layer)
            {
                for (uint32_t y = 0; y < tex->desc.height; ++y)
                {
                    for (uint32_t x = 0; x < tex->desc.width; ++x)
                    {
                        float* p = tex->texel(layer, x, y);
                        for (uint32_t c = 0; c < tex->channels; ++c) p[c] = value[c];
                    }
                }
            }
        }

        static void copy_layer(SwTexture& dst, uint32_t dst_layer, const SwTexture& src, uint32_t src_layer)
        {
            const uint32_t channels = std::min(src.channels, dst.channels);
            for (uint32_t y = 0; y < src.desc.height; ++y)
            {
                for (uint32_t x = 0; x < src.desc.width; ++x)
                {
                    const float* sp = src.texel(src_layer, x, y);
                    float* dp = dst.texel(dst_layer, x, y);
                    for (uint32_t c = 0; c < channels; ++c) dp[c] = sp[c];
                }
            }
        }

        SwDrawRecord make_record(SwDrawKind kind) const
        {
            SwDrawRecord r{};
            r.kind = kind;
            r.vertex_shader = shaders_[(size_t)ShaderStage::Vertex];
            r.pixel_shader = shaders_[(size_t)ShaderStage::Pixel];
            r.vertex_shader_overridden = vs_overridden_;
            r.topology = topology_;
            r.blend = blend_;
            r.input_layout = input_layout_;
            r.color_targets = color_targets_;
            r.depth_target = depth_target_;
            if (!events_.empty()) r.event = events_.back();
            return r;
        }

        uint32_t next_id_ = 1;
        std::unordered_map<uint32_t, SwTexture> textures_{};
        std::unordered_map<uint32_t, SwView> views_{};
        std::unordered_map<uint32_t, SwBuffer> buffers_{};
        std::unordered_map<uint32_t, DepthStencilDesc> depth_states_{};
        std::string fail_texture_name_{};

        ShaderHandle shaders_[kShaderStageCount]{};
        bool vs_overridden_ = false;
        uint32_t input_layout_ = 0;
        PrimitiveTopology topology_ = PrimitiveTopology::TriangleList;
        std::unordered_map<uint64_t, BufferHandle> constant_bindings_{};
        std::unordered_map<uint64_t, ViewHandle> resource_bindings_{};
        std::vector<ViewHandle> color_targets_{};
        ViewHandle depth_target_{};
        DepthStencilStateHandle depth_state_{};
        BlendMode blend_ = BlendMode::Opaque;
        Viewport viewport_{};
        std::vector<std::string> events_{};
        std::vector<SwDrawRecord> draws_{};
        GpuDeviceStats stats_{};
    };
}
