#pragma once

/*
    ALKAHEST RENDER CORE

    FILE: vk_memory_utils.hpp
    MODULE: gfx/vulkan
    PURPOSE: Vulkan memory-type lookup and buffer/image allocation helpers with
            failures reported as Status.
*/


#include <cstdint>
#include <string>

#include "alk/core/result.hpp"

#ifdef ALK_HAS_VULKAN
#include <vulkan/vulkan.h>
#endif

namespace alk
{
#ifdef ALK_HAS_VULKAN
    inline std::string vk_result_name(VkResult r)
    {
        switch (r)
        {
            case VK_SUCCESS: return "VK_SUCCESS";
            case VK_NOT_READY: return "VK_NOT_READY";
            case VK_TIMEOUT: return "VK_TIMEOUT";
            case VK_ERROR_OUT_OF_HOST_MEMORY: return "VK_ERROR_OUT_OF_HOST_MEMORY";
            case VK_ERROR_OUT_OF_DEVICE_MEMORY: return "VK_ERROR_OUT_OF_DEVICE_MEMORY";
            case VK_ERROR_INITIALIZATION_FAILED: return "VK_ERROR_INITIALIZATION_FAILED";
            case VK_ERROR_DEVICE_LOST: return "VK_ERROR_DEVICE_LOST";
            case VK_ERROR_MEMORY_MAP_FAILED: return "VK_ERROR_MEMORY_MAP_FAILED";
            case VK_ERROR_FORMAT_NOT_SUPPORTED: return "VK_ERROR_FORMAT_NOT_SUPPORTED";
            default: return "VkResult(" + std::to_string((int)r) + ")";
        }
    }

    inline uint32_t vk_find_memory_type(
        VkPhysicalDevice physical_device,
        uint32_t type_bits,
        VkMemoryPropertyFlags required_props)
    {
        if (physical_device == VK_NULL_HANDLE) return UINT32_MAX;

        VkPhysicalDeviceMemoryProperties mp{};
        vkGetPhysicalDeviceMemoryProperties(physical_device, &mp);
        for (uint32_t i = 0; i < mp.memoryTypeCount; ++i)
        {
            if ((type_bits & (1u << i)) == 0) continue;
            if ((mp.memoryTypes[i].propertyFlags & required_props) == required_props) return i;
        }
        return UINT32_MAX;
    }

    inline Status vk_allocate_for(
        VkDevice device,
        VkPhysicalDevice physical_device,
        const VkMemoryRequirements& req,
        VkMemoryPropertyFlags memory_props,
        VkDeviceMemory& out_memory)
    {
        const uint32_t memory_type = vk_find_memory_type(physical_device, req.memoryTypeBits, memory_props);
        if (memory_type == UINT32_MAX) return Status::failure("no compatible memory type");

        VkMemoryAllocateInfo mai{};
        mai.sType = VK_STRUCTURE_TYPE_MEMORY_ALLOCATE_INFO;
        mai.allocationSize = req.size;
        mai.memoryTypeIndex = memory_type;
        const VkResult r = vkAllocateMemory(device, &mai, nullptr, &out_memory);
        if (r != VK_SUCCESS)
        {
            out_memory = VK_NULL_HANDLE;
            return Status::failure("vkAllocateMemory: " + vk_result_name(r));
        }
        return Status::success();
    }

    inline void vk_destroy_buffer(VkDevice device, VkBuffer& buffer, VkDeviceMemory& memory)
    {
        if (device != VK_NULL_HANDLE)
        {
            if (buffer != VK_NULL_HANDLE) vkDestroyBuffer(device, buffer, nullptr);
            if (memory != VK_NULL_HANDLE) vkFreeMemory(device, memory, nullptr);
        }
        buffer = VK_NULL_HANDLE;
        memory = VK_NULL_HANDLE;
    }

    inline void vk_destroy_image(VkDevice device, VkImage& image, VkDeviceMemory& memory)
    {
        if (device != VK_NULL_HANDLE)
        {
            if (image != VK_NULL_HANDLE) vkDestroyImage(device, image, nullptr);
            if (memory != VK_NULL_HANDLE) vkFreeMemory(device, memory, nullptr);
        }
        image = VK_NULL_HANDLE;
        memory = VK_NULL_HANDLE;
    }

    inline Status vk_create_buffer(
        VkDevice device,
        VkPhysicalDevice physical_device,
        VkDeviceSize size,
        VkBufferUsageFlags usage,
        VkMemoryPropertyFlags memory_props,
        VkBuffer& out_buffer,
        VkDeviceMemory& out_memory)
    {
        out_buffer = VK_NULL_HANDLE;
        out_memory = VK_NULL_HANDLE;
        if (device == VK_NULL_HANDLE || physical_device == VK_NULL_HANDLE) return Status::failure("no device");
        if (size == 0) return Status::failure("zero sized buffer");

        VkBufferCreateInfo bci{};
        bci.sType = VK_STRUCTURE_TYPE_BUFFER_CREATE_INFO;
        bci.size = size;
        bci.usage = usage;
        bci.sharingMode = VK_SHARING_MODE_EXCLUSIVE;
        const VkResult r = vkCreateBuffer(device, &bci, nullptr, &out_buffer);
        if (r != VK_SUCCESS) return Status::failure("vkCreateBuffer: " + vk_result_name(r));

        VkMemoryRequirements req{};
        vkGetBufferMemoryRequirements(device, out_buffer, &req);
        const Status mem = vk_allocate_for(device, physical_device, req, memory_props, out_memory);
        if (!mem.ok)
        {
            vk_destroy_buffer(device, out_buffer, out_memory);
            return mem;
        }

        const VkResult br = vkBindBufferMemory(device, out_buffer, out_memory, 0);
        if (br != VK_SUCCESS)
        {
            vk_destroy_buffer(device, out_buffer, out_memory);
            return Status::failure("vkBindBufferMemory: " + vk_result_name(br));
        }
        return Status::success();
    }

    inline Status vk_create_image(
        VkDevice device,
        VkPhysicalDevice physical_device,
        const VkImageCreateInfo& ici,
        VkMemoryPropertyFlags memory_props,
        VkImage& out_image,
        VkDeviceMemory& out_memory)
    {
        out_image = VK_NULL_HANDLE;
        out_memory = VK_NULL_HANDLE;
        if (device == VK_NULL_HANDLE || physical_device == VK_NULL_HANDLE) return Status::failure("no device");

        const VkResult r = vkCreateImage(device, &ici, nullptr, &out_image);
        if (r != VK_SUCCESS) return Status::failure("vkCreateImage: " + vk_result_name(r));

        VkMemoryRequirements req{};
        vkGetImageMemoryRequirements(device, out_image, &req);
        const Status mem = vk_allocate_for(device, physical_device, req, memory_props, out_memory);
        if (!mem.ok)
        {
            vk_destroy_image(device, out_image, out_memory);
            return mem;
        }

        const VkResult br = vkBindImageMemory(device, out_image, out_memory, 0);
        if (br != VK_SUCCESS)
        {
            vk_destroy_image(device, out_image, out_memory);
            return Status::failure("vkBindImageMemory: " + vk_result_name(br));
        }
        return Status::success();
    }
#endif
}
