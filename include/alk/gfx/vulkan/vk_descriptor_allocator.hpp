#pragma once

/*
    ALKAHEST RENDER CORE

    FILE: vk_descriptor_allocator.hpp
    MODULE: gfx/vulkan
    PURPOSE: Growable descriptor-set allocator. Sets live until the pools are
            reset after a submission completes.
*/


#include <cstdint>
#include <utility>
#include <vector>

#include "alk/core/result.hpp"
#include "alk/gfx/vulkan/vk_memory_utils.hpp"

#ifdef ALK_HAS_VULKAN
#include <vulkan/vulkan.h>
#endif

namespace alk
{
#ifdef ALK_HAS_VULKAN
    class VulkanDescriptorAllocator
    {
    public:
        // Descriptors per set, by type, used to size each pool.
        struct PoolRatios
        {
            std::vector<std::pair<VkDescriptorType, uint32_t>> per_set =
            {
                {VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER, 28},
                {VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER, 32},
            };
        };

        void init(VkDevice device, uint32_t sets_per_pool = 256)
        {
            device_ = device;
            sets_per_pool_ = sets_per_pool;
        }

        void cleanup()
        {
            for (VkDescriptorPool p : free_pools_) vkDestroyDescriptorPool(device_, p, nullptr);
            for (VkDescriptorPool p : used_pools_) vkDestroyDescriptorPool(device_, p, nullptr);
            free_pools_.clear();
            used_pools_.clear();
            current_pool_ = VK_NULL_HANDLE;
        }

        void reset_pools()
        {
            for (VkDescriptorPool p : used_pools_)
            {
                vkResetDescriptorPool(device_, p, 0);
                free_pools_.push_back(p);
            }
            used_pools_.clear();
            current_pool_ = VK_NULL_HANDLE;
        }

        Result<VkDescriptorSet> allocate(VkDescriptorSetLayout layout)
        {
            if (current_pool_ == VK_NULL_HANDLE)
            {
                const Status st = next_pool();
                if (!st.ok) return Result<VkDescriptorSet>::failure(st.error);
            }

            VkDescriptorSetAllocateInfo ai{};
            ai.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_ALLOCATE_INFO;
            ai.descriptorPool = current_pool_;
            ai.descriptorSetCount = 1;
            ai.pSetLayouts = &layout;

            VkDescriptorSet set = VK_NULL_HANDLE;
            VkResult res = vkAllocateDescriptorSets(device_, &ai, &set);
            if (res == VK_ERROR_FRAGMENTED_POOL || res == VK_ERROR_OUT_OF_POOL_MEMORY)
            {
                const Status st = next_pool();
                if (!st.ok) return Result<VkDescriptorSet>::failure(st.error);
                ai.descriptorPool = current_pool_;
                res = vkAllocateDescriptorSets(device_, &ai, &set);
            }
            if (res != VK_SUCCESS) return Result<VkDescriptorSet>::failure("vkAllocateDescriptorSets: " + vk_result_name(res));
            return Result<VkDescriptorSet>::success(set);
        }

    private:
        Status next_pool()
        {
            if (!free_pools_.empty())
            {
                current_pool_ = free_pools_.back();
                free_pools_.pop_back();
                used_pools_.push_back(current_pool_);
                return Status::success();
            }

            std::vector<VkDescriptorPoolSize> sizes{};
            sizes.reserve(ratios_.per_set.size());
            for (const auto& [type, per_set] : ratios_.per_set)
            {
                sizes.push_back(VkDescriptorPoolSize{type, per_set * sets_per_pool_});
            }

            VkDescriptorPoolCreateInfo ci{};
            ci.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_POOL_CREATE_INFO;
            ci.maxSets = sets_per_pool_;
            ci.poolSizeCount = (uint32_t)sizes.size();
            ci.pPoolSizes = sizes.data();

            VkDescriptorPool pool = VK_NULL_HANDLE;
            const VkResult r = vkCreateDescriptorPool(device_, &ci, nullptr, &pool);
            if (r != VK_SUCCESS) return Status::failure("vkCreateDescriptorPool: " + vk_result_name(r));
            current_pool_ = pool;
            used_pools_.push_back(pool);
            return Status::success();
        }

        VkDevice device_ = VK_NULL_HANDLE;
        uint32_t sets_per_pool_ = 256;
        VkDescriptorPool current_pool_ = VK_NULL_HANDLE;
        PoolRatios ratios_{};
        std::vector<VkDescriptorPool> used_pools_{};
        std::vector<VkDescriptorPool> free_pools_{};
    };
#endif
}
