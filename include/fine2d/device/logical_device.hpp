#pragma once

#include "fine2d/core/types.hpp"
#include "fine2d/device/physical_device.hpp"

#include <vulkan/vulkan.h>
#include <vector>
#include <memory>

namespace fine2d {

class MemoryAllocator;

/**
 * @brief Vulkan queue wrapper
 */
class Queue {
public:
    VkQueue handle() const { return queue_; }
    uint32_t familyIndex() const { return familyIndex_; }

    /// Submit command buffers
    void submit(const VkSubmitInfo& submitInfo, VkFence fence = VK_NULL_HANDLE);

    /// Convenience: submit single command buffer
    void submit(
        VkCommandBuffer commandBuffer,
        const std::vector<VkSemaphore>& waitSemaphores = {},
        const std::vector<VkPipelineStageFlags>& waitStages = {},
        const std::vector<VkSemaphore>& signalSemaphores = {},
        VkFence fence = VK_NULL_HANDLE);

    void waitIdle();

    /// Present a swap chain image; the result is returned so callers can react to OUT_OF_DATE
    VkResult present(
        VkSwapchainKHR swapChain,
        uint32_t imageIndex,
        const std::vector<VkSemaphore>& waitSemaphores = {});

private:
    friend class LogicalDeviceBuilder;
    Queue(VkQueue queue, uint32_t familyIndex);

    VkQueue queue_ = VK_NULL_HANDLE;
    uint32_t familyIndex_ = 0;
};

/**
 * @brief Represents a Vulkan logical device
 *
 * LogicalDevice wraps VkDevice, the graphics and present queues, the memory
 * allocator and a shared command pool. It must outlive every object created
 * from it.
 */
class LogicalDevice {
public:
    VkDevice handle() const { return device_; }

    PhysicalDevice* physicalDevice() const { return physical_; }

    Queue* graphicsQueue() const { return graphicsQueue_; }

    /// Present queue (may be same as graphics)
    Queue* presentQueue() const { return presentQueue_; }

    MemoryAllocator& allocator() { return *allocator_; }

    /**
     * @brief Get the default command pool
     *
     * Created lazily on the graphics queue family with the
     * RESET_COMMAND_BUFFER flag, so per-frame command buffers can be
     * re-recorded individually.
     */
    CommandPool* defaultCommandPool();

    void waitIdle();

    ~LogicalDevice();

    LogicalDevice(const LogicalDevice&) = delete;
    LogicalDevice& operator=(const LogicalDevice&) = delete;

private:
    friend class LogicalDeviceBuilder;
    LogicalDevice() = default;

    VkDevice device_ = VK_NULL_HANDLE;
    PhysicalDevice* physical_ = nullptr;

    std::vector<std::unique_ptr<Queue>> ownedQueues_;
    Queue* graphicsQueue_ = nullptr;
    Queue* presentQueue_ = nullptr;

    std::unique_ptr<MemoryAllocator> allocator_;
    CommandPoolPtr defaultCommandPool_;
};

} // namespace fine2d
