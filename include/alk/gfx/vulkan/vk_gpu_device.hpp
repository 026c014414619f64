#pragma once

/*
    ALKAHEST RENDER CORE

    FILE: vk_gpu_device.hpp
    MODULE: gfx/vulkan
    PURPOSE: Vulkan 1.3 IGpuDevice over a host-provided device and queue.
            Dynamic rendering, GENERAL image layouts, per-draw descriptor sets
            and host-registered pipelines keyed by shader pair, input layout
            and blend mode.
*/


#include <algorithm>
#include <array>
#include <cstdint>
#include <cstring>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include "alk/core/log.hpp"
#include "alk/core/result.hpp"
#include "alk/gfx/gpu_device.hpp"
#include "alk/gfx/pixel_format.hpp"
#include "alk/gfx/vulkan/vk_cmd_utils.hpp"
#include "alk/gfx/vulkan/vk_descriptor_allocator.hpp"
#include "alk/gfx/vulkan/vk_memory_utils.hpp"

#ifdef ALK_HAS_VULKAN
#include <vulkan/vulkan.h>
#endif

namespace alk
{
#ifdef ALK_HAS_VULKAN
    // Descriptor set 0 layout shared by every registered pipeline layout.
    constexpr uint32_t kVkConstantSlots = 14;
    constexpr uint32_t kVkResourceSlots = 16;
    constexpr uint32_t kVkVertexBufferSlots = 4;

    inline uint32_t vk_constant_binding(ShaderStage stage, uint32_t slot)
    {
        return (stage == ShaderStage::Pixel ? kVkConstantSlots : 0u) + slot;
    }

    inline uint32_t vk_resource_binding(ShaderStage stage, uint32_t slot)
    {
        return kVkConstantSlots * 2 + (stage == ShaderStage::Pixel ? kVkResourceSlots : 0u) + slot;
    }

    struct VulkanDeviceInfo
    {
        VkPhysicalDevice physical_device = VK_NULL_HANDLE;
        VkDevice device = VK_NULL_HANDLE;
        VkQueue queue = VK_NULL_HANDLE;
        uint32_t queue_family = 0;
    };

    struct VulkanProgramKey
    {
        uint32_t vertex_shader = 0;
        uint32_t pixel_shader = 0;
        uint32_t input_layout = 0;
        BlendMode blend = BlendMode::Opaque;

        friend bool operator==(const VulkanProgramKey& a, const VulkanProgramKey& b)
        {
            return a.vertex_shader == b.vertex_shader && a.pixel_shader == b.pixel_shader &&
                a.input_layout == b.input_layout && a.blend == b.blend;
        }
    };

    struct VulkanProgramKeyHash
    {
        size_t operator()(const VulkanProgramKey& k) const
        {
            uint64_t h = k.vertex_shader;
            h = h * 0x9E3779B97F4A7C15ull + k.pixel_shader;
            h = h * 0x9E3779B97F4A7C15ull + k.input_layout;
            h = h * 0x9E3779B97F4A7C15ull + (uint64_t)k.blend;
            return (size_t)h;
        }
    };

    // Owned by the shader loader; must be created with dynamic rendering, the
    // topology and depth test/write/compare dynamic states, and a layout whose
    // set 0 is descriptor_set_layout().
    struct VulkanProgram
    {
        VkPipeline pipeline = VK_NULL_HANDLE;
        VkPipelineLayout layout = VK_NULL_HANDLE;
    };

    class VulkanGpuDevice final : public IGpuDevice
    {
    public:
        static Result<std::unique_ptr<VulkanGpuDevice>> create(const VulkanDeviceInfo& info)
        {
            using R = Result<std::unique_ptr<VulkanGpuDevice>>;
            if (info.device == VK_NULL_HANDLE || info.physical_device == VK_NULL_HANDLE || info.queue == VK_NULL_HANDLE)
            {
                return R::failure("vulkan device: incomplete device info");
            }

            std::unique_ptr<VulkanGpuDevice> out(new VulkanGpuDevice(info));
            const Status st = out->init();
            if (!st.ok) return R::failure("vulkan device: " + st.error);
            return R::success(std::move(out));
        }

        ~VulkanGpuDevice() override { shutdown(); }

        VulkanGpuDevice(const VulkanGpuDevice&) = delete;
        VulkanGpuDevice& operator=(const VulkanGpuDevice&) = delete;

        const char* name() const override { return "vulkan"; }
        const GpuDeviceStats& stats() const override { return stats_; }

        VkDescriptorSetLayout descriptor_set_layout() const { return set_layout_; }

        void register_program(const VulkanProgramKey& key, const VulkanProgram& program)
        {
            programs_[key] = program;
        }

        VkImage native_image(TextureHandle h) const
        {
            auto it = textures_.find(h.id);
            return it == textures_.end() ? VK_NULL_HANDLE : it->second.image;
        }

        // Ends recording, submits, waits for completion and starts a new
        // command buffer. Deferred destroys and descriptor pools are released.
        Status submit_and_wait()
        {
            end_rendering();
            VkResult r = vkEndCommandBuffer(cmd_);
            if (r != VK_SUCCESS) return Status::failure("vkEndCommandBuffer: " + vk_result_name(r));
            recording_ = false;

            VkSubmitInfo si{};
            si.sType = VK_STRUCTURE_TYPE_SUBMIT_INFO;
            si.commandBufferCount = 1;
            si.pCommandBuffers = &cmd_;
            r = vkQueueSubmit(info_.queue, 1, &si, fence_);
            if (r != VK_SUCCESS) return Status::failure("vkQueueSubmit: " + vk_result_name(r));

            r = vkWaitForFences(info_.device, 1, &fence_, VK_TRUE, UINT64_MAX);
            if (r != VK_SUCCESS) return Status::failure("vkWaitForFences: " + vk_result_name(r));
            vkResetFences(info_.device, 1, &fence_);

            flush_deferred();
            descriptors_.reset_pools();
            vkResetCommandBuffer(cmd_, 0);
            return begin_recording();
        }

        // Resources
        Result<TextureHandle> create_texture(const TextureDesc& desc) override
        {
            if (desc.width == 0 || desc.height == 0 || desc.layers == 0)
            {
                return Result<TextureHandle>::failure("invalid texture extent");
            }
            const bool depth = (desc.usage & TextureUsage_DepthStencil) != 0;
            const VkFormat format = vk_format(desc.format, depth);
            if (format == VK_FORMAT_UNDEFINED) return Result<TextureHandle>::failure("unknown pixel format");

            VkImageCreateInfo ici{};
            ici.sType = VK_STRUCTURE_TYPE_IMAGE_CREATE_INFO;
            ici.imageType = VK_IMAGE_TYPE_2D;
            ici.format = format;
            ici.extent = {desc.width, desc.height, 1};
            ici.mipLevels = 1;
            ici.arrayLayers = desc.layers;
            ici.samples = VK_SAMPLE_COUNT_1_BIT;
            ici.tiling = VK_IMAGE_TILING_OPTIMAL;
            ici.usage = VK_IMAGE_USAGE_TRANSFER_SRC_BIT | VK_IMAGE_USAGE_TRANSFER_DST_BIT;
            if (desc.usage & TextureUsage_RenderTarget) ici.usage |= VK_IMAGE_USAGE_COLOR_ATTACHMENT_BIT;
            if (desc.usage & TextureUsage_ShaderResource) ici.usage |= VK_IMAGE_USAGE_SAMPLED_BIT;
            if (depth) ici.usage |= VK_IMAGE_USAGE_DEPTH_STENCIL_ATTACHMENT_BIT;
            ici.sharingMode = VK_SHARING_MODE_EXCLUSIVE;
            ici.initialLayout = VK_IMAGE_LAYOUT_UNDEFINED;

            VkTexture tex{};
            tex.desc = desc;
            tex.depth = depth;
            tex.aspect = depth ? VK_IMAGE_ASPECT_DEPTH_BIT : VK_IMAGE_ASPECT_COLOR_BIT;
            const Status st = vk_create_image(
                info_.device, info_.physical_device, ici, VK_MEMORY_PROPERTY_DEVICE_LOCAL_BIT, tex.image, tex.memory);
            if (!st.ok) return Result<TextureHandle>::failure(desc.debug_name + ": " + st.error);

            if (desc.usage & TextureUsage_CpuRead)
            {
                const Status rb = vk_create_buffer(
                    info_.device,
                    info_.physical_device,
                    texel_bytes(tex) * desc.width * desc.height,
                    VK_BUFFER_USAGE_TRANSFER_DST_BIT,
                    VK_MEMORY_PROPERTY_HOST_VISIBLE_BIT | VK_MEMORY_PROPERTY_HOST_COHERENT_BIT,
                    tex.readback,
                    tex.readback_memory);
                if (!rb.ok)
                {
                    vk_destroy_image(info_.device, tex.image, tex.memory);
                    return Result<TextureHandle>::failure(desc.debug_name + ": readback: " + rb.error);
                }
            }

            end_rendering();
            vk_cmd_to_general(cmd_, tex.image, tex.aspect, desc.layers);

            TextureHandle h{};
            h.id = next_id_++;
            textures_.emplace(h.id, tex);
            ++stats_.live_textures;
            return Result<TextureHandle>::success(h);
        }

        Result<ViewHandle> create_view(const ViewDesc& desc) override
        {
            auto it = textures_.find(desc.texture.id);
            if (it == textures_.end()) return Result<ViewHandle>::failure("view of unknown texture");
            const VkTexture& tex = it->second;
            if (desc.first_layer >= tex.desc.layers) return Result<ViewHandle>::failure("view layer out of range");

            const bool is_depth_view = desc.kind == ViewKind::DepthStencil || desc.kind == ViewKind::DepthStencilReadOnly;
            if (is_depth_view && !tex.depth)
            {
                return Result<ViewHandle>::failure("depth view of texture without depth usage");
            }
            if (desc.kind == ViewKind::RenderTarget && (tex.desc.usage & TextureUsage_RenderTarget) == 0)
            {
                return Result<ViewHandle>::failure("render-target view of texture without render-target usage");
            }

            VkView view{};
            view.desc = desc;
            if (view.desc.layer_count == 0) view.desc.layer_count = tex.desc.layers - desc.first_layer;

            VkImageViewCreateInfo vci{};
            vci.sType = VK_STRUCTURE_TYPE_IMAGE_VIEW_CREATE_INFO;
            vci.image = tex.image;
            vci.viewType = view.desc.layer_count > 1 ? VK_IMAGE_VIEW_TYPE_2D_ARRAY : VK_IMAGE_VIEW_TYPE_2D;
            vci.format = vk_format(desc.format, tex.depth);
            vci.subresourceRange.aspectMask = tex.aspect;
            vci.subresourceRange.levelCount = 1;
            vci.subresourceRange.baseArrayLayer = desc.first_layer;
            vci.subresourceRange.layerCount = view.desc.layer_count;
            const VkResult r = vkCreateImageView(info_.device, &vci, nullptr, &view.view);
            if (r != VK_SUCCESS) return Result<ViewHandle>::failure("vkCreateImageView: " + vk_result_name(r));

            ViewHandle h{};
            h.id = next_id_++;
            views_.emplace(h.id, view);
            ++stats_.live_views;
            return Result<ViewHandle>::success(h);
        }

        Result<BufferHandle> create_buffer(const BufferDesc& desc, const void* initial_data) override
        {
            if (desc.size_bytes == 0) return Result<BufferHandle>::failure("zero-sized buffer");

            VkBufferUsageFlags usage = VK_BUFFER_USAGE_TRANSFER_DST_BIT;
            switch (desc.kind)
            {
                case BufferKind::Index: usage |= VK_BUFFER_USAGE_INDEX_BUFFER_BIT; break;
                case BufferKind::Constant: usage |= VK_BUFFER_USAGE_UNIFORM_BUFFER_BIT; break;
                case BufferKind::Vertex:
                case BufferKind::Instance:
                default:
                    usage |= VK_BUFFER_USAGE_VERTEX_BUFFER_BIT;
                    break;
            }

            VkBufferRes buf{};
            buf.desc = desc;
            const VkDeviceSize size = (desc.size_bytes + 15u) & ~(VkDeviceSize)15u;
            const Status st = vk_create_buffer(
                info_.device, info_.physical_device, size, usage, VK_MEMORY_PROPERTY_DEVICE_LOCAL_BIT, buf.buffer, buf.memory);
            if (!st.ok) return Result<BufferHandle>::failure(desc.debug_name + ": " + st.error);

            if (initial_data)
            {
                const Status up = upload_buffer(buf.buffer, initial_data, desc.size_bytes);
                if (!up.ok)
                {
                    vk_destroy_buffer(info_.device, buf.buffer, buf.memory);
                    return Result<BufferHandle>::failure(desc.debug_name + ": " + up.error);
                }
            }

            BufferHandle h{};
            h.id = next_id_++;
            buffers_.emplace(h.id, buf);
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
            auto it = textures_.find(h.id);
            if (it == textures_.end()) return;
            deferred_textures_.push_back(it->second);
            textures_.erase(it);
            --stats_.live_textures;
        }

        void destroy_view(ViewHandle h) override
        {
            auto it = views_.find(h.id);
            if (it == views_.end()) return;
            deferred_views_.push_back(it->second.view);
            views_.erase(it);
            --stats_.live_views;
        }

        void destroy_buffer(BufferHandle h) override
        {
            auto it = buffers_.find(h.id);
            if (it == buffers_.end()) return;
            deferred_buffers_.push_back(std::make_pair(it->second.buffer, it->second.memory));
            buffers_.erase(it);
            --stats_.live_buffers;
        }

        void destroy_depth_stencil_state(DepthStencilStateHandle h) override
        {
            depth_states_.erase(h.id);
        }

        TextureDesc texture_desc(TextureHandle h) const override
        {
            auto it = textures_.find(h.id);
            return it == textures_.end() ? TextureDesc{} : it->second.desc;
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
            if (size_bytes > it->second.desc.size_bytes)
            {
                return Status::failure("write of " + std::to_string(size_bytes) + " bytes overflows buffer '" +
                    it->second.desc.debug_name + "'");
            }
            return upload_buffer(it->second.buffer, data, size_bytes);
        }

        Status write_texture(TextureHandle h, uint32_t layer, const void* data, size_t size_bytes) override
        {
            auto it = textures_.find(h.id);
            if (it == textures_.end()) return Status::failure("write to unknown texture");
            const VkTexture& tex = it->second;
            if (layer >= tex.desc.layers) return Status::failure("write to missing layer of '" + tex.desc.debug_name + "'");
            const size_t expected = (size_t)texel_bytes(tex) * tex.desc.width * tex.desc.height;
            if (size_bytes != expected)
            {
                return Status::failure("texture upload of " + std::to_string(size_bytes) + " bytes, expected " +
                    std::to_string(expected));
            }

            VkBuffer staging = VK_NULL_HANDLE;
            VkDeviceMemory staging_memory = VK_NULL_HANDLE;
            const Status st = make_staging(data, size_bytes, staging, staging_memory);
            if (!st.ok) return st;

            begin_transfer();
            const VkBufferImageCopy region = layer_region(tex, layer);
            vkCmdCopyBufferToImage(cmd_, staging, tex.image, VK_IMAGE_LAYOUT_GENERAL, 1, &region);
            end_transfer();
            return Status::success();
        }

        // Pipeline state
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
            (void)stride;
            if (slot >= kVkVertexBufferSlots) return;
            vertex_buffers_[slot] = VertexBinding{buffer, offset};
        }

        void bind_index_buffer(BufferHandle buffer, IndexFormat format) override
        {
            index_buffer_ = buffer;
            index_format_ = format;
        }

        void bind_constant_buffer(ShaderStage stage, uint32_t slot, BufferHandle buffer) override
        {
            if (slot >= kVkConstantSlots || !graphics_stage(stage)) return;
            constant_bindings_[vk_constant_binding(stage, slot)] = buffer;
        }

        void bind_shader_resource(ShaderStage stage, uint32_t slot, ViewHandle view) override
        {
            if (slot >= kVkResourceSlots || !graphics_stage(stage)) return;
            resource_bindings_[vk_resource_binding(stage, slot) - kVkConstantSlots * 2] = view;
        }

        void set_render_targets(std::span<const ViewHandle> colors, ViewHandle depth) override
        {
            end_rendering();
            color_targets_.assign(colors.begin(), colors.end());
            depth_target_ = depth;
        }

        void set_depth_stencil_state(DepthStencilStateHandle state) override { depth_state_ = state; }
        void set_blend_mode(BlendMode mode) override { blend_ = mode; }

        void set_viewport(const Viewport& vp) override
        {
            viewport_ = vp;
            if (rendering_) vk_cmd_set_viewport_scissor(cmd_, viewport_);
        }

        void unbind_render_targets() override
        {
            end_rendering();
            color_targets_.clear();
            depth_target_ = ViewHandle{};
        }

        void unbind_shader_resources() override
        {
            resource_bindings_.fill(ViewHandle{});
        }

        // Draws
        void draw(uint32_t vertex_count, uint32_t start_vertex) override
        {
            if (!prepare_draw(false)) return;
            vkCmdDraw(cmd_, vertex_count, 1, start_vertex, 0);
            ++stats_.draw_calls;
        }

        void draw_indexed(uint32_t index_count, uint32_t start_index, int32_t base_vertex) override
        {
            if (!prepare_draw(true)) return;
            vkCmdDrawIndexed(cmd_, index_count, 1, start_index, base_vertex, 0);
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
            if (!prepare_draw(true)) return;
            vkCmdDrawIndexed(cmd_, index_count, instance_count, start_index, base_vertex, start_instance);
            ++stats_.draw_calls;
            ++stats_.instanced_draw_calls;
        }

        // Transfers
        void clear_render_target(ViewHandle rtv, const glm::vec4& color) override
        {
            const VkView* view = find_view(rtv);
            const VkTexture* tex = view ? find_texture(view->desc.texture) : nullptr;
            if (!tex) return;

            VkClearColorValue c{};
            c.float32[0] = color.r;
            c.float32[1] = color.g;
            c.float32[2] = color.b;
            c.float32[3] = color.a;
            const VkImageSubresourceRange range = view_range(*tex, *view);

            begin_transfer();
            vkCmdClearColorImage(cmd_, tex->image, VK_IMAGE_LAYOUT_GENERAL, &c, 1, &range);
            end_transfer();
            ++stats_.clears;
        }

        void clear_depth_stencil(ViewHandle dsv, float depth, uint8_t stencil) override
        {
            const VkView* view = find_view(dsv);
            const VkTexture* tex = view ? find_texture(view->desc.texture) : nullptr;
            if (!tex || !tex->depth) return;

            VkClearDepthStencilValue v{};
            v.depth = depth;
            v.stencil = stencil;
            const VkImageSubresourceRange range = view_range(*tex, *view);

            begin_transfer();
            vkCmdClearDepthStencilImage(cmd_, tex->image, VK_IMAGE_LAYOUT_GENERAL, &v, 1, &range);
            end_transfer();
            ++stats_.clears;
        }

        void copy_texture(TextureHandle dst, TextureHandle src) override
        {
            const VkTexture* d = find_texture(dst);
            const VkTexture* s = find_texture(src);
            if (!d || !s) return;
            const uint32_t layers = std::min(d->desc.layers, s->desc.layers);
            for (uint32_t layer = 0; layer < layers; ++layer) copy_layer(*d, layer, *s, layer);
            ++stats_.copies;
        }

        void copy_texture_layer(TextureHandle dst, uint32_t dst_layer, TextureHandle src, uint32_t src_layer) override
        {
            const VkTexture* d = find_texture(dst);
            const VkTexture* s = find_texture(src);
            if (!d || !s || dst_layer >= d->desc.layers || src_layer >= s->desc.layers) return;
            copy_layer(*d, dst_layer, *s, src_layer);
            ++stats_.copies;
        }

        void blit(ViewHandle src_srv, ViewHandle dst_rtv) override
        {
            const VkView* sv = find_view(src_srv);
            const VkView* dv = find_view(dst_rtv);
            const VkTexture* s = sv ? find_texture(sv->desc.texture) : nullptr;
            const VkTexture* d = dv ? find_texture(dv->desc.texture) : nullptr;
            if (!s || !d) return;
            if (s->depth || d->depth)
            {
                log_warn("vulkan blit: depth textures cannot be blitted");
                return;
            }

            VkImageBlit region{};
            region.srcSubresource = {VK_IMAGE_ASPECT_COLOR_BIT, 0, sv->desc.first_layer, 1};
            region.srcOffsets[1] = {(int32_t)s->desc.width, (int32_t)s->desc.height, 1};
            region.dstSubresource = {VK_IMAGE_ASPECT_COLOR_BIT, 0, dv->desc.first_layer, 1};
            region.dstOffsets[1] = {(int32_t)d->desc.width, (int32_t)d->desc.height, 1};

            begin_transfer();
            vkCmdBlitImage(
                cmd_,
                s->image, VK_IMAGE_LAYOUT_GENERAL,
                d->image, VK_IMAGE_LAYOUT_GENERAL,
                1, &region,
                VK_FILTER_LINEAR);
            end_transfer();
            ++stats_.blits;
        }

        Status map_read(TextureHandle staging, const std::function<void(const MappedTexture&)>& fn) override
        {
            const VkTexture* tex = find_texture(staging);
            if (!tex) return Status::failure("map of unknown texture");
            if (tex->readback == VK_NULL_HANDLE)
            {
                return Status::failure("texture '" + tex->desc.debug_name + "' is not CPU readable");
            }

            begin_transfer();
            const VkBufferImageCopy region = layer_region(*tex, 0);
            vkCmdCopyImageToBuffer(cmd_, tex->image, VK_IMAGE_LAYOUT_GENERAL, tex->readback, 1, &region);
            end_transfer();

            const Status st = submit_and_wait();
            if (!st.ok) return st;

            // submit_and_wait may have flushed deferred destroys.
            tex = find_texture(staging);
            if (!tex) return Status::failure("staging texture destroyed during readback");

            void* ptr = nullptr;
            const VkResult r = vkMapMemory(info_.device, tex->readback_memory, 0, VK_WHOLE_SIZE, 0, &ptr);
            if (r != VK_SUCCESS) return Status::failure("vkMapMemory: " + vk_result_name(r));

            MappedTexture m{};
            m.data = static_cast<const uint8_t*>(ptr);
            m.row_pitch = texel_bytes(*tex) * tex->desc.width;
            m.width = tex->desc.width;
            m.height = tex->desc.height;
            m.format = tex->desc.format;
            fn(m);
            vkUnmapMemory(info_.device, tex->readback_memory);
            ++stats_.cpu_reads;
            return Status::success();
        }

        void begin_event(std::string_view label) override
        {
            if (!cmd_begin_label_) return;
            const std::string name(label);
            VkDebugUtilsLabelEXT l{};
            l.sType = VK_STRUCTURE_TYPE_DEBUG_UTILS_LABEL_EXT;
            l.pLabelName = name.c_str();
            cmd_begin_label_(cmd_, &l);
        }

        void end_event() override
        {
            if (cmd_end_label_) cmd_end_label_(cmd_);
        }

    private:
        struct VkTexture
        {
            TextureDesc desc{};
            bool depth = false;
            VkImageAspectFlags aspect = VK_IMAGE_ASPECT_COLOR_BIT;
            VkImage image = VK_NULL_HANDLE;
            VkDeviceMemory memory = VK_NULL_HANDLE;
            VkBuffer readback = VK_NULL_HANDLE;
            VkDeviceMemory readback_memory = VK_NULL_HANDLE;
        };

        struct VkView
        {
            ViewDesc desc{};
            VkImageView view = VK_NULL_HANDLE;
        };

        struct VkBufferRes
        {
            BufferDesc desc{};
            VkBuffer buffer = VK_NULL_HANDLE;
            VkDeviceMemory memory = VK_NULL_HANDLE;
        };

        struct VertexBinding
        {
            BufferHandle buffer{};
            uint32_t offset = 0;
        };

        explicit VulkanGpuDevice(const VulkanDeviceInfo& info) : info_(info) {}

        static bool graphics_stage(ShaderStage s)
        {
            return s == ShaderStage::Vertex || s == ShaderStage::Pixel;
        }

        static uint32_t texel_bytes(const VkTexture& tex)
        {
            return tex.depth ? 4u : pixel_format_bytes(tex.desc.format);
        }

        static VkBufferImageCopy layer_region(const VkTexture& tex, uint32_t layer)
        {
            VkBufferImageCopy region{};
            region.imageSubresource = {tex.aspect, 0, layer, 1};
            region.imageExtent = {tex.desc.width, tex.desc.height, 1};
            return region;
        }

        static VkImageSubresourceRange view_range(const VkTexture& tex, const VkView& view)
        {
            VkImageSubresourceRange range{};
            range.aspectMask = tex.aspect;
            range.levelCount = 1;
            range.baseArrayLayer = view.desc.first_layer;
            range.layerCount = view.desc.layer_count;
            return range;
        }

        const VkTexture* find_texture(TextureHandle h) const
        {
            auto it = textures_.find(h.id);
            return it == textures_.end() ? nullptr : &it->second;
        }

        const VkView* find_view(ViewHandle h) const
        {
            auto it = views_.find(h.id);
            return it == views_.end() ? nullptr : &it->second;
        }

        const VkBufferRes* find_buffer(BufferHandle h) const
        {
            auto it = buffers_.find(h.id);
            return it == buffers_.end() ? nullptr : &it->second;
        }

        Status init()
        {
            VkCommandPoolCreateInfo pci{};
            pci.sType = VK_STRUCTURE_TYPE_COMMAND_POOL_CREATE_INFO;
            pci.flags = VK_COMMAND_POOL_CREATE_RESET_COMMAND_BUFFER_BIT;
            pci.queueFamilyIndex = info_.queue_family;
            VkResult r = vkCreateCommandPool(info_.device, &pci, nullptr, &cmd_pool_);
            if (r != VK_SUCCESS) return Status::failure("vkCreateCommandPool: " + vk_result_name(r));

            VkCommandBufferAllocateInfo cai{};
            cai.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO;
            cai.commandPool = cmd_pool_;
            cai.level = VK_COMMAND_BUFFER_LEVEL_PRIMARY;
            cai.commandBufferCount = 1;
            r = vkAllocateCommandBuffers(info_.device, &cai, &cmd_);
            if (r != VK_SUCCESS) return Status::failure("vkAllocateCommandBuffers: " + vk_result_name(r));

            VkFenceCreateInfo fci{};
            fci.sType = VK_STRUCTURE_TYPE_FENCE_CREATE_INFO;
            r = vkCreateFence(info_.device, &fci, nullptr, &fence_);
            if (r != VK_SUCCESS) return Status::failure("vkCreateFence: " + vk_result_name(r));

            VkSamplerCreateInfo sci{};
            sci.sType = VK_STRUCTURE_TYPE_SAMPLER_CREATE_INFO;
            sci.magFilter = VK_FILTER_LINEAR;
            sci.minFilter = VK_FILTER_LINEAR;
            sci.mipmapMode = VK_SAMPLER_MIPMAP_MODE_NEAREST;
            sci.addressModeU = VK_SAMPLER_ADDRESS_MODE_CLAMP_TO_EDGE;
            sci.addressModeV = VK_SAMPLER_ADDRESS_MODE_CLAMP_TO_EDGE;
            sci.addressModeW = VK_SAMPLER_ADDRESS_MODE_CLAMP_TO_EDGE;
            sci.maxLod = 0.0f;
            r = vkCreateSampler(info_.device, &sci, nullptr, &sampler_);
            if (r != VK_SUCCESS) return Status::failure("vkCreateSampler: " + vk_result_name(r));

            std::vector<VkDescriptorSetLayoutBinding> bindings{};
            const ShaderStage stages[] = {ShaderStage::Vertex, ShaderStage::Pixel};
            for (ShaderStage stage : stages)
            {
                for (uint32_t slot = 0; slot < kVkConstantSlots; ++slot)
                {
                    VkDescriptorSetLayoutBinding b{};
                    b.binding = vk_constant_binding(stage, slot);
                    b.descriptorType = VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER;
                    b.descriptorCount = 1;
                    b.stageFlags = vk_stage_flags(stage);
                    bindings.push_back(b);
                }
            }
            for (ShaderStage stage : stages)
            {
                for (uint32_t slot = 0; slot < kVkResourceSlots; ++slot)
                {
                    VkDescriptorSetLayoutBinding b{};
                    b.binding = vk_resource_binding(stage, slot);
                    b.descriptorType = VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER;
                    b.descriptorCount = 1;
                    b.stageFlags = vk_stage_flags(stage);
                    bindings.push_back(b);
                }
            }

            VkDescriptorSetLayoutCreateInfo lci{};
            lci.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_LAYOUT_CREATE_INFO;
            lci.bindingCount = (uint32_t)bindings.size();
            lci.pBindings = bindings.data();
            r = vkCreateDescriptorSetLayout(info_.device, &lci, nullptr, &set_layout_);
            if (r != VK_SUCCESS) return Status::failure("vkCreateDescriptorSetLayout: " + vk_result_name(r));

            descriptors_.init(info_.device);

            cmd_begin_label_ = (PFN_vkCmdBeginDebugUtilsLabelEXT)vkGetDeviceProcAddr(info_.device, "vkCmdBeginDebugUtilsLabelEXT");
            cmd_end_label_ = (PFN_vkCmdEndDebugUtilsLabelEXT)vkGetDeviceProcAddr(info_.device, "vkCmdEndDebugUtilsLabelEXT");

            return begin_recording();
        }

        void shutdown()
        {
            if (info_.device == VK_NULL_HANDLE) return;
            vkDeviceWaitIdle(info_.device);

            flush_deferred();
            for (auto& [_, v] : views_) vkDestroyImageView(info_.device, v.view, nullptr);
            for (auto& [_, t] : textures_)
            {
                vk_destroy_image(info_.device, t.image, t.memory);
                vk_destroy_buffer(info_.device, t.readback, t.readback_memory);
            }
            for (auto& [_, b] : buffers_) vk_destroy_buffer(info_.device, b.buffer, b.memory);
            views_.clear();
            textures_.clear();
            buffers_.clear();

            descriptors_.cleanup();
            if (set_layout_ != VK_NULL_HANDLE) vkDestroyDescriptorSetLayout(info_.device, set_layout_, nullptr);
            if (sampler_ != VK_NULL_HANDLE) vkDestroySampler(info_.device, sampler_, nullptr);
            if (fence_ != VK_NULL_HANDLE) vkDestroyFence(info_.device, fence_, nullptr);
            if (cmd_pool_ != VK_NULL_HANDLE) vkDestroyCommandPool(info_.device, cmd_pool_, nullptr);
            info_.device = VK_NULL_HANDLE;
        }

        Status begin_recording()
        {
            VkCommandBufferBeginInfo bi{};
            bi.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO;
            bi.flags = VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT;
            const VkResult r = vkBeginCommandBuffer(cmd_, &bi);
            if (r != VK_SUCCESS) return Status::failure("vkBeginCommandBuffer: " + vk_result_name(r));
            recording_ = true;
            return Status::success();
        }

        void flush_deferred()
        {
            for (VkImageView v : deferred_views_) vkDestroyImageView(info_.device, v, nullptr);
            for (VkTexture& t : deferred_textures_)
            {
                vk_destroy_image(info_.device, t.image, t.memory);
                vk_destroy_buffer(info_.device, t.readback, t.readback_memory);
            }
            for (auto& [buffer, memory] : deferred_buffers_) vk_destroy_buffer(info_.device, buffer, memory);
            deferred_views_.clear();
            deferred_textures_.clear();
            deferred_buffers_.clear();
        }

        void begin_transfer()
        {
            end_rendering();
            vk_cmd_full_barrier(cmd_);
        }

        void end_transfer()
        {
            vk_cmd_full_barrier(cmd_);
        }

        // Host-visible copy source, released after the next submission.
        Status make_staging(const void* data, size_t size, VkBuffer& out_buffer, VkDeviceMemory& out_memory)
        {
            const Status st = vk_create_buffer(
                info_.device,
                info_.physical_device,
                size,
                VK_BUFFER_USAGE_TRANSFER_SRC_BIT,
                VK_MEMORY_PROPERTY_HOST_VISIBLE_BIT | VK_MEMORY_PROPERTY_HOST_COHERENT_BIT,
                out_buffer,
                out_memory);
            if (!st.ok) return Status::failure("staging: " + st.error);

            void* ptr = nullptr;
            const VkResult r = vkMapMemory(info_.device, out_memory, 0, VK_WHOLE_SIZE, 0, &ptr);
            if (r != VK_SUCCESS)
            {
                vk_destroy_buffer(info_.device, out_buffer, out_memory);
                return Status::failure("staging: vkMapMemory: " + vk_result_name(r));
            }
            std::memcpy(ptr, data, size);
            vkUnmapMemory(info_.device, out_memory);
            deferred_buffers_.push_back(std::make_pair(out_buffer, out_memory));
            return Status::success();
        }

        Status upload_buffer(VkBuffer dst, const void* data, size_t size)
        {
            if (size == 0) return Status::success();
            VkBuffer staging = VK_NULL_HANDLE;
            VkDeviceMemory staging_memory = VK_NULL_HANDLE;
            const Status st = make_staging(data, size, staging, staging_memory);
            if (!st.ok) return st;

            begin_transfer();
            VkBufferCopy region{};
            region.size = size;
            vkCmdCopyBuffer(cmd_, staging, dst, 1, &region);
            end_transfer();
            return Status::success();
        }

        void copy_layer(const VkTexture& dst, uint32_t dst_layer, const VkTexture& src, uint32_t src_layer)
        {
            if (dst.desc.width != src.desc.width || dst.desc.height != src.desc.height)
            {
                log_warn("vulkan copy: size mismatch between '" + src.desc.debug_name + "' and '" + dst.desc.debug_name + "'");
                return;
            }

            begin_transfer();
            if (dst.aspect == src.aspect)
            {
                VkImageCopy region{};
                region.srcSubresource = {src.aspect, 0, src_layer, 1};
                region.dstSubresource = {dst.aspect, 0, dst_layer, 1};
                region.extent = {src.desc.width, src.desc.height, 1};
                vkCmdCopyImage(cmd_, src.image, VK_IMAGE_LAYOUT_GENERAL, dst.image, VK_IMAGE_LAYOUT_GENERAL, 1, &region);
                end_transfer();
                return;
            }

            // Depth and colour aspects only meet through a buffer.
            VkBuffer scratch = VK_NULL_HANDLE;
            VkDeviceMemory scratch_memory = VK_NULL_HANDLE;
            const Status st = vk_create_buffer(
                info_.device,
                info_.physical_device,
                (VkDeviceSize)4 * src.desc.width * src.desc.height,
                VK_BUFFER_USAGE_TRANSFER_SRC_BIT | VK_BUFFER_USAGE_TRANSFER_DST_BIT,
                VK_MEMORY_PROPERTY_DEVICE_LOCAL_BIT,
                scratch,
                scratch_memory);
            if (!st.ok)
            {
                log_error("vulkan copy: scratch buffer: " + st.error);
                end_transfer();
                return;
            }
            deferred_buffers_.push_back(std::make_pair(scratch, scratch_memory));

            const VkBufferImageCopy from = layer_region(src, src_layer);
            vkCmdCopyImageToBuffer(cmd_, src.image, VK_IMAGE_LAYOUT_GENERAL, scratch, 1, &from);
            vk_cmd_full_barrier(cmd_);
            const VkBufferImageCopy to = layer_region(dst, dst_layer);
            vkCmdCopyBufferToImage(cmd_, scratch, dst.image, VK_IMAGE_LAYOUT_GENERAL, 1, &to);
            end_transfer();
        }

        bool ensure_rendering()
        {
            if (rendering_) return true;
            if (color_targets_.empty() && !depth_target_.valid()) return false;

            uint32_t width = 0;
            uint32_t height = 0;
            std::vector<VkRenderingAttachmentInfo> colors{};
            colors.reserve(color_targets_.size());
            for (ViewHandle h : color_targets_)
            {
                const VkView* v = find_view(h);
                const VkTexture* t = v ? find_texture(v->desc.texture) : nullptr;
                if (!t) return false;
                width = t->desc.width;
                height = t->desc.height;

                VkRenderingAttachmentInfo a{};
                a.sType = VK_STRUCTURE_TYPE_RENDERING_ATTACHMENT_INFO;
                a.imageView = v->view;
                a.imageLayout = VK_IMAGE_LAYOUT_GENERAL;
                a.loadOp = VK_ATTACHMENT_LOAD_OP_LOAD;
                a.storeOp = VK_ATTACHMENT_STORE_OP_STORE;
                colors.push_back(a);
            }

            VkRenderingAttachmentInfo depth{};
            const VkView* dv = find_view(depth_target_);
            if (dv)
            {
                const VkTexture* t = find_texture(dv->desc.texture);
                if (!t) return false;
                width = t->desc.width;
                height = t->desc.height;
                depth.sType = VK_STRUCTURE_TYPE_RENDERING_ATTACHMENT_INFO;
                depth.imageView = dv->view;
                depth.imageLayout = VK_IMAGE_LAYOUT_GENERAL;
                depth.loadOp = VK_ATTACHMENT_LOAD_OP_LOAD;
                depth.storeOp = dv->desc.kind == ViewKind::DepthStencilReadOnly
                    ? VK_ATTACHMENT_STORE_OP_NONE
                    : VK_ATTACHMENT_STORE_OP_STORE;
            }

            vk_cmd_full_barrier(cmd_);

            VkRenderingInfo ri{};
            ri.sType = VK_STRUCTURE_TYPE_RENDERING_INFO;
            ri.renderArea.extent = {width, height};
            ri.layerCount = 1;
            ri.colorAttachmentCount = (uint32_t)colors.size();
            ri.pColorAttachments = colors.data();
            ri.pDepthAttachment = dv ? &depth : nullptr;
            vkCmdBeginRendering(cmd_, &ri);
            rendering_ = true;

            Viewport vp = viewport_;
            if (vp.width <= 0.0f || vp.height <= 0.0f)
            {
                vp.width = (float)width;
                vp.height = (float)height;
            }
            vk_cmd_set_viewport_scissor(cmd_, vp);
            return true;
        }

        void end_rendering()
        {
            if (!rendering_) return;
            vkCmdEndRendering(cmd_);
            rendering_ = false;
        }

        bool prepare_draw(bool indexed)
        {
            VulkanProgramKey key{};
            key.vertex_shader = shaders_[(size_t)ShaderStage::Vertex].id;
            key.pixel_shader = shaders_[(size_t)ShaderStage::Pixel].id;
            key.input_layout = input_layout_;
            key.blend = blend_;

            auto pit = programs_.find(key);
            if (pit == programs_.end())
            {
                if (warned_programs_.insert(key).second)
                {
                    log_warn("vulkan: no pipeline registered for vs " + std::to_string(key.vertex_shader) +
                        " ps " + std::to_string(key.pixel_shader) + " layout " + std::to_string(key.input_layout));
                }
                return false;
            }
            if (!ensure_rendering()) return false;

            const VulkanProgram& program = pit->second;
            vkCmdBindPipeline(cmd_, VK_PIPELINE_BIND_POINT_GRAPHICS, program.pipeline);

            const auto set = descriptors_.allocate(set_layout_);
            if (!set.ok)
            {
                log_error("vulkan: " + set.error);
                return false;
            }
            write_descriptors(set.value);
            vkCmdBindDescriptorSets(cmd_, VK_PIPELINE_BIND_POINT_GRAPHICS, program.layout, 0, 1, &set.value, 0, nullptr);

            vkCmdSetPrimitiveTopology(cmd_, vk_topology(topology_));
            auto dit = depth_states_.find(depth_state_.id);
            const DepthStencilDesc ds = dit == depth_states_.end() ? DepthStencilDesc{false, false, CompareFunc::Always} : dit->second;
            vkCmdSetDepthTestEnable(cmd_, ds.depth_enable ? VK_TRUE : VK_FALSE);
            vkCmdSetDepthWriteEnable(cmd_, ds.depth_write ? VK_TRUE : VK_FALSE);
            vkCmdSetDepthCompareOp(cmd_, vk_compare(ds.compare));

            for (uint32_t slot = 0; slot < kVkVertexBufferSlots; ++slot)
            {
                const VkBufferRes* b = find_buffer(vertex_buffers_[slot].buffer);
                if (!b) continue;
                const VkDeviceSize offset = vertex_buffers_[slot].offset;
                vkCmdBindVertexBuffers(cmd_, slot, 1, &b->buffer, &offset);
            }

            if (indexed)
            {
                const VkBufferRes* ib = find_buffer(index_buffer_);
                if (!ib) return false;
                vkCmdBindIndexBuffer(
                    cmd_,
                    ib->buffer,
                    0,
                    index_format_ == IndexFormat::U32 ? VK_INDEX_TYPE_UINT32 : VK_INDEX_TYPE_UINT16);
            }
            return true;
        }

        void write_descriptors(VkDescriptorSet set)
        {
            std::vector<VkDescriptorBufferInfo> buffer_infos{};
            std::vector<VkDescriptorImageInfo> image_infos{};
            buffer_infos.reserve(constant_bindings_.size());
            image_infos.reserve(resource_bindings_.size());
            std::vector<VkWriteDescriptorSet> writes{};

            for (uint32_t binding = 0; binding < constant_bindings_.size(); ++binding)
            {
                const VkBufferRes* b = find_buffer(constant_bindings_[binding]);
                if (!b) continue;
                buffer_infos.push_back(VkDescriptorBufferInfo{b->buffer, 0, VK_WHOLE_SIZE});

                VkWriteDescriptorSet w{};
                w.sType = VK_STRUCTURE_TYPE_WRITE_DESCRIPTOR_SET;
                w.dstSet = set;
                w.dstBinding = binding;
                w.descriptorCount = 1;
                w.descriptorType = VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER;
                w.pBufferInfo = &buffer_infos.back();
                writes.push_back(w);
            }

            for (uint32_t i = 0; i < resource_bindings_.size(); ++i)
            {
                const VkView* v = find_view(resource_bindings_[i]);
                if (!v) continue;
                image_infos.push_back(VkDescriptorImageInfo{sampler_, v->view, VK_IMAGE_LAYOUT_GENERAL});

                VkWriteDescriptorSet w{};
                w.sType = VK_STRUCTURE_TYPE_WRITE_DESCRIPTOR_SET;
                w.dstSet = set;
                w.dstBinding = kVkConstantSlots * 2 + i;
                w.descriptorCount = 1;
                w.descriptorType = VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER;
                w.pImageInfo = &image_infos.back();
                writes.push_back(w);
            }

            if (!writes.empty())
            {
                vkUpdateDescriptorSets(info_.device, (uint32_t)writes.size(), writes.data(), 0, nullptr);
            }
        }

        VulkanDeviceInfo info_{};
        VkCommandPool cmd_pool_ = VK_NULL_HANDLE;
        VkCommandBuffer cmd_ = VK_NULL_HANDLE;
        VkFence fence_ = VK_NULL_HANDLE;
        VkSampler sampler_ = VK_NULL_HANDLE;
        VkDescriptorSetLayout set_layout_ = VK_NULL_HANDLE;
        VulkanDescriptorAllocator descriptors_{};
        PFN_vkCmdBeginDebugUtilsLabelEXT cmd_begin_label_ = nullptr;
        PFN_vkCmdEndDebugUtilsLabelEXT cmd_end_label_ = nullptr;
        bool recording_ = false;
        bool rendering_ = false;

        uint32_t next_id_ = 1;
        GpuDeviceStats stats_{};
        std::unordered_map<uint32_t, VkTexture> textures_{};
        std::unordered_map<uint32_t, VkView> views_{};
        std::unordered_map<uint32_t, VkBufferRes> buffers_{};
        std::unordered_map<uint32_t, DepthStencilDesc> depth_states_{};
        std::unordered_map<VulkanProgramKey, VulkanProgram, VulkanProgramKeyHash> programs_{};
        std::unordered_set<VulkanProgramKey, VulkanProgramKeyHash> warned_programs_{};

        std::vector<VkTexture> deferred_textures_{};
        std::vector<VkImageView> deferred_views_{};
        std::vector<std::pair<VkBuffer, VkDeviceMemory>> deferred_buffers_{};

        std::array<ShaderHandle, kShaderStageCount> shaders_{};
        bool vs_overridden_ = false;
        uint32_t input_layout_ = 0;
        PrimitiveTopology topology_ = PrimitiveTopology::TriangleList;
        std::array<VertexBinding, kVkVertexBufferSlots> vertex_buffers_{};
        BufferHandle index_buffer_{};
        IndexFormat index_format_ = IndexFormat::U16;
        std::array<BufferHandle, kVkConstantSlots * 2> constant_bindings_{};
        std::array<ViewHandle, kVkResourceSlots * 2> resource_bindings_{};
        std::vector<ViewHandle> color_targets_{};
        ViewHandle depth_target_{};
        DepthStencilStateHandle depth_state_{};
        BlendMode blend_ = BlendMode::Opaque;
        Viewport viewport_{};
    };
#endif
}
