#include <cstdint>
#include <cstdio>
#include <memory>
#include <vector>

#include <vulkan/vulkan.h>

#include "alk/core/result.hpp"
#include "alk/gfx/gbuffer.hpp"
#include "alk/gfx/vulkan/vk_gpu_device.hpp"

#include "alk_test_fixtures.hpp"

namespace
{
    using namespace alk;

    // Surface-less 1.3 device with dynamic rendering, enough for offscreen work.
    struct HeadlessVulkan
    {
        VkInstance instance = VK_NULL_HANDLE;
        VkPhysicalDevice physical = VK_NULL_HANDLE;
        VkDevice device = VK_NULL_HANDLE;
        VkQueue queue = VK_NULL_HANDLE;
        uint32_t queue_family = 0;

        ~HeadlessVulkan()
        {
            if (device != VK_NULL_HANDLE)
            {
                vkDeviceWaitIdle(device);
                vkDestroyDevice(device, nullptr);
            }
            if (instance != VK_NULL_HANDLE) vkDestroyInstance(instance, nullptr);
        }

        Status init()
        {
            VkApplicationInfo app{};
            app.sType = VK_STRUCTURE_TYPE_APPLICATION_INFO;
            app.pApplicationName = "alk-vk-device-tests";
            app.pEngineName = "alkahest";
            app.apiVersion = VK_API_VERSION_1_3;

            VkInstanceCreateInfo ci{};
            ci.sType = VK_STRUCTURE_TYPE_INSTANCE_CREATE_INFO;
            ci.pApplicationInfo = &app;
            if (vkCreateInstance(&ci, nullptr, &instance) != VK_SUCCESS) return Status::failure("vkCreateInstance");

            uint32_t count = 0;
            vkEnumeratePhysicalDevices(instance, &count, nullptr);
            std::vector<VkPhysicalDevice> gpus(count);
            if (count) vkEnumeratePhysicalDevices(instance, &count, gpus.data());
            for (VkPhysicalDevice gpu : gpus)
            {
                VkPhysicalDeviceProperties props{};
                vkGetPhysicalDeviceProperties(gpu, &props);
                if (props.apiVersion < VK_API_VERSION_1_3) continue;

                VkPhysicalDeviceVulkan13Features f13{};
                f13.sType = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_VULKAN_1_3_FEATURES;
                VkPhysicalDeviceFeatures2 f2{};
                f2.sType = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_FEATURES_2;
                f2.pNext = &f13;
                vkGetPhysicalDeviceFeatures2(gpu, &f2);
                if (!f13.dynamicRendering) continue;

                uint32_t nq = 0;
                vkGetPhysicalDeviceQueueFamilyProperties(gpu, &nq, nullptr);
                std::vector<VkQueueFamilyProperties> qprops(nq);
                vkGetPhysicalDeviceQueueFamilyProperties(gpu, &nq, qprops.data());
                for (uint32_t i = 0; i < nq; ++i)
                {
                    if ((qprops[i].queueFlags & VK_QUEUE_GRAPHICS_BIT) == 0) continue;
                    physical = gpu;
                    queue_family = i;
                    break;
                }
                if (physical != VK_NULL_HANDLE) break;
            }
            if (physical == VK_NULL_HANDLE) return Status::failure("no Vulkan 1.3 device with dynamic rendering");

            float prio = 1.0f;
            VkDeviceQueueCreateInfo qci{};
            qci.sType = VK_STRUCTURE_TYPE_DEVICE_QUEUE_CREATE_INFO;
            qci.queueFamilyIndex = queue_family;
            qci.queueCount = 1;
            qci.pQueuePriorities = &prio;

            VkPhysicalDeviceVulkan13Features enable13{};
            enable13.sType = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_VULKAN_1_3_FEATURES;
            enable13.dynamicRendering = VK_TRUE;

            VkDeviceCreateInfo dci{};
            dci.sType = VK_STRUCTURE_TYPE_DEVICE_CREATE_INFO;
            dci.pNext = &enable13;
            dci.queueCreateInfoCount = 1;
            dci.pQueueCreateInfos = &qci;
            if (vkCreateDevice(physical, &dci, nullptr, &device) != VK_SUCCESS) return Status::failure("vkCreateDevice");
            vkGetDeviceQueue(device, queue_family, 0, &queue);
            return Status::success();
        }

        VulkanDeviceInfo info() const
        {
            VulkanDeviceInfo out{};
            out.physical_device = physical;
            out.device = device;
            out.queue = queue;
            out.queue_family = queue_family;
            return out;
        }
    };

    bool test_incomplete_info_rejected()
    {
        return !VulkanGpuDevice::create(VulkanDeviceInfo{}).ok;
    }

    bool test_gbuffer_depth_readback(VulkanGpuDevice& gpu)
    {
        auto gb = GBuffer::create(gpu, Extent2D{16, 8});
        if (!gb.ok)
        {
            std::fprintf(stderr, "[alk-tests] gbuffer create: %s\n", gb.error.c_str());
            return false;
        }
        GBuffer& g = gb.value;
        if (g.size() != Extent2D{16, 8} || g.rt0.size() != g.size()) return false;

        g.depth.clear(0.25f, 0);
        g.stage_depth_readback();
        if (!alk_test::approx_eq(g.depth_buffer_read_center(), 0.25f)) return false;
        return gpu.stats().cpu_reads >= 1 && gpu.stats().clears >= 1;
    }

    bool test_resize_replaces_resources(VulkanGpuDevice& gpu)
    {
        auto gb = GBuffer::create(gpu, Extent2D{8, 8});
        if (!gb.ok) return false;
        const uint32_t textures = gpu.stats().live_textures;

        if (!gb.value.resize(Extent2D{32, 16}).ok) return false;
        if (!gpu.submit_and_wait().ok) return false;
        return gb.value.size() == Extent2D{32, 16} && gb.value.rt0.size() == Extent2D{32, 16} &&
            gpu.stats().live_textures == textures;
    }
}

int main()
{
    const bool ok_info = test_incomplete_info_rejected();

    HeadlessVulkan vk{};
    const Status st = vk.init();
    if (!st.ok)
    {
        std::fprintf(stderr, "[alk-tests] skipping Vulkan device tests: %s\n", st.error.c_str());
        return ok_info ? 0 : 1;
    }

    auto created = VulkanGpuDevice::create(vk.info());
    if (!created.ok)
    {
        std::fprintf(stderr, "[alk-tests] vulkan device create failed: %s\n", created.error.c_str());
        return 1;
    }
    std::unique_ptr<VulkanGpuDevice> gpu = std::move(created.value);

    const bool ok_readback = test_gbuffer_depth_readback(*gpu);
    const bool ok_resize = test_resize_replaces_resources(*gpu);
    gpu.reset();

    if (!ok_info) std::fprintf(stderr, "[alk-tests] incomplete device info accepted\n");
    if (!ok_readback) std::fprintf(stderr, "[alk-tests] vulkan depth readback failed\n");
    if (!ok_resize) std::fprintf(stderr, "[alk-tests] vulkan gbuffer resize failed\n");

    if (!(ok_info && ok_readback && ok_resize)) return 1;
    std::fprintf(stderr, "[alk-tests] vulkan device tests passed\n");
    return 0;
}
