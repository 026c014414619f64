#pragma once

/*
    ALKAHEST RENDER CORE

    FILE: vk_cmd_utils.hpp
    MODULE: gfx/vulkan
    PURPOSE: Command recording helpers and the PixelFormat/enum translations
            used by the Vulkan device.
*/


#include <cstdint>

#include "alk/gfx/gpu_device.hpp"
#include "alk/gfx/pixel_format.hpp"

#ifdef ALK_HAS_VULKAN
#include <vulkan/vulkan.h>
#endif

namespace alk
{
#ifdef ALK_HAS_VULKAN
    inline VkViewport vk_make_viewport(const Viewport& v)
    {
        VkViewport vp{};
        vp.x = v.x;
        vp.y = v.y;
        vp.width = v.width;
        vp.height = v.height;
        vp.minDepth = v.min_depth;
        vp.maxDepth = v.max_depth;
        return vp;
    }

    inline VkRect2D vk_make_scissor(const Viewport& v)
    {
        VkRect2D sc{};
        sc.offset = {(int32_t)v.x, (int32_t)v.y};
        sc.extent = {(uint32_t)v.width, (uint32_t)v.height};
        return sc;
    }

    inline void vk_cmd_set_viewport_scissor(VkCommandBuffer cmd, const Viewport& v)
    {
        const VkViewport vp = vk_make_viewport(v);
        const VkRect2D sc = vk_make_scissor(v);
        vkCmdSetViewport(cmd, 0, 1, &vp);
        vkCmdSetScissor(cmd, 0, 1, &sc);
    }

    // Every image lives in GENERAL layout; a full memory barrier orders
    // transfers and rendering against each other.
    inline void vk_cmd_full_barrier(VkCommandBuffer cmd)
    {
        VkMemoryBarrier mb{};
        mb.sType = VK_STRUCTURE_TYPE_MEMORY_BARRIER;
        mb.srcAccessMask = VK_ACCESS_MEMORY_WRITE_BIT;
        mb.dstAccessMask = VK_ACCESS_MEMORY_READ_BIT | VK_ACCESS_MEMORY_WRITE_BIT;
        vkCmdPipelineBarrier(
            cmd,
            VK_PIPELINE_STAGE_ALL_COMMANDS_BIT,
            VK_PIPELINE_STAGE_ALL_COMMANDS_BIT,
            0,
            1, &mb,
            0, nullptr,
            0, nullptr);
    }

    inline void vk_cmd_to_general(VkCommandBuffer cmd, VkImage image, VkImageAspectFlags aspect, uint32_t layers)
    {
        VkImageMemoryBarrier b{};
        b.sType = VK_STRUCTURE_TYPE_IMAGE_MEMORY_BARRIER;
        b.srcAccessMask = 0;
        b.dstAccessMask = VK_ACCESS_MEMORY_READ_BIT | VK_ACCESS_MEMORY_WRITE_BIT;
        b.oldLayout = VK_IMAGE_LAYOUT_UNDEFINED;
        b.newLayout = VK_IMAGE_LAYOUT_GENERAL;
        b.srcQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
        b.dstQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
        b.image = image;
        b.subresourceRange.aspectMask = aspect;
        b.subresourceRange.levelCount = 1;
        b.subresourceRange.layerCount = layers;
        vkCmdPipelineBarrier(
            cmd,
            VK_PIPELINE_STAGE_TOP_OF_PIPE_BIT,
            VK_PIPELINE_STAGE_ALL_COMMANDS_BIT,
            0,
            0, nullptr,
            0, nullptr,
            1, &b);
    }

    // Typeless and R32 views of depth textures resolve to D32 so the depth
    // aspect stays viewable.
    inline VkFormat vk_format(PixelFormat f, bool depth_texture = false)
    {
        switch (f)
        {
            case PixelFormat::R8_UNORM: return VK_FORMAT_R8_UNORM;
            case PixelFormat::R32_FLOAT: return depth_texture ? VK_FORMAT_D32_SFLOAT : VK_FORMAT_R32_SFLOAT;
            case PixelFormat::R32_TYPELESS: return depth_texture ? VK_FORMAT_D32_SFLOAT : VK_FORMAT_R32_SFLOAT;
            case PixelFormat::D32_FLOAT: return VK_FORMAT_D32_SFLOAT;
            case PixelFormat::R10G10B10A2_UNORM: return VK_FORMAT_A2B10G10R10_UNORM_PACK32;
            case PixelFormat::R11G11B10_FLOAT: return VK_FORMAT_B10G11R11_UFLOAT_PACK32;
            case PixelFormat::B8G8R8A8_UNORM: return VK_FORMAT_B8G8R8A8_UNORM;
            case PixelFormat::B8G8R8A8_UNORM_SRGB: return VK_FORMAT_B8G8R8A8_SRGB;
            case PixelFormat::R8G8B8A8_UNORM: return VK_FORMAT_R8G8B8A8_UNORM;
            case PixelFormat::R8G8B8A8_UNORM_SRGB: return VK_FORMAT_R8G8B8A8_SRGB;
            case PixelFormat::R16G16B16A16_FLOAT: return VK_FORMAT_R16G16B16A16_SFLOAT;
            case PixelFormat::R32G32B32A32_FLOAT: return VK_FORMAT_R32G32B32A32_SFLOAT;
            default: return VK_FORMAT_UNDEFINED;
        }
    }

    inline VkPrimitiveTopology vk_topology(PrimitiveTopology t)
    {
        switch (t)
        {
            case PrimitiveTopology::TriangleStrip: return VK_PRIMITIVE_TOPOLOGY_TRIANGLE_STRIP;
            case PrimitiveTopology::LineList: return VK_PRIMITIVE_TOPOLOGY_LINE_LIST;
            case PrimitiveTopology::LineStrip: return VK_PRIMITIVE_TOPOLOGY_LINE_STRIP;
            case PrimitiveTopology::PointList: return VK_PRIMITIVE_TOPOLOGY_POINT_LIST;
            case PrimitiveTopology::TriangleList:
            default:
                return VK_PRIMITIVE_TOPOLOGY_TRIANGLE_LIST;
        }
    }

    inline VkCompareOp vk_compare(CompareFunc f)
    {
        switch (f)
        {
            case CompareFunc::Never: return VK_COMPARE_OP_NEVER;
            case CompareFunc::Less: return VK_COMPARE_OP_LESS;
            case CompareFunc::Equal: return VK_COMPARE_OP_EQUAL;
            case CompareFunc::LessEqual: return VK_COMPARE_OP_LESS_OR_EQUAL;
            case CompareFunc::Greater: return VK_COMPARE_OP_GREATER;
            case CompareFunc::NotEqual: return VK_COMPARE_OP_NOT_EQUAL;
            case CompareFunc::GreaterEqual: return VK_COMPARE_OP_GREATER_OR_EQUAL;
            case CompareFunc::Always:
            default:
                return VK_COMPARE_OP_ALWAYS;
        }
    }

    inline VkShaderStageFlags vk_stage_flags(ShaderStage s)
    {
        switch (s)
        {
            case ShaderStage::Vertex: return VK_SHADER_STAGE_VERTEX_BIT;
            case ShaderStage::Pixel: return VK_SHADER_STAGE_FRAGMENT_BIT;
            case ShaderStage::Geometry: return VK_SHADER_STAGE_GEOMETRY_BIT;
            case ShaderStage::Compute:
            default:
                return VK_SHADER_STAGE_COMPUTE_BIT;
        }
    }
#endif
}
