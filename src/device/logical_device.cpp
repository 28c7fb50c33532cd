#include "fine2d/device/logical_device.hpp"
#include "fine2d/device/physical_device.hpp"
#include "fine2d/device/memory.hpp"
#include "fine2d/device/command.hpp"
#include "fine2d/core/surface.hpp"
#include "fine2d/core/logging.hpp"
#include "fine2d/core/error.hpp"

#include <set>

namespace fine2d {

// ============================================================================
// Queue implementation
// ============================================================================

Queue::Queue(VkQueue queue, uint32_t familyIndex)
    : queue_(queue), familyIndex_(familyIndex) {
}

void Queue::submit(const VkSubmitInfo& submitInfo, VkFence fence) {
    VkResult result = vkQueueSubmit(queue_, 1, &submitInfo, fence);
    if (result != VK_SUCCESS) {
        FINE2D_ERROR(LogCategory::Vulkan, "vkQueueSubmit failed");
        throw RenderError("Failed to submit command buffer to queue", result);
    }
}

void Queue::submit(
    VkCommandBuffer commandBuffer,
    const std::vector<VkSemaphore>& waitSemaphores,
    const std::vector<VkPipelineStageFlags>& waitStages,
    const std::vector<VkSemaphore>& signalSemaphores,
    VkFence fence) {

    VkSubmitInfo submitInfo{};
    submitInfo.sType = VK_STRUCTURE_TYPE_SUBMIT_INFO;
    submitInfo.commandBufferCount = 1;
    submitInfo.pCommandBuffers = &commandBuffer;

    submitInfo.waitSemaphoreCount = static_cast<uint32_t>(waitSemaphores.size());
    submitInfo.pWaitSemaphores = waitSemaphores.empty() ? nullptr : waitSemaphores.data();
    submitInfo.pWaitDstStageMask = waitStages.empty() ? nullptr : waitStages.data();

    submitInfo.signalSemaphoreCount = static_cast<uint32_t>(signalSemaphores.size());
    submitInfo.pSignalSemaphores = signalSemaphores.empty() ? nullptr : signalSemaphores.data();

    submit(submitInfo, fence);
}

void Queue::waitIdle() {
    VkResult result = vkQueueWaitIdle(queue_);
    if (result != VK_SUCCESS) {
        throw RenderError("vkQueueWaitIdle failed", result);
    }
}

VkResult Queue::present(
    VkSwapchainKHR swapChain,
    uint32_t imageIndex,
    const std::vector<VkSemaphore>& waitSemaphores) {

    VkPresentInfoKHR presentInfo{};
    presentInfo.sType = VK_STRUCTURE_TYPE_PRESENT_INFO_KHR;
    presentInfo.waitSemaphoreCount = static_cast<uint32_t>(waitSemaphores.size());
    presentInfo.pWaitSemaphores = waitSemaphores.empty() ? nullptr : waitSemaphores.data();
    presentInfo.swapchainCount = 1;
    presentInfo.pSwapchains = &swapChain;
    presentInfo.pImageIndices = &imageIndex;

    return vkQueuePresentKHR(queue_, &presentInfo);
}

// ============================================================================
// LogicalDevice implementation
// ============================================================================

LogicalDevice::~LogicalDevice() {
    if (device_ != VK_NULL_HANDLE) {
        vkDeviceWaitIdle(device_);

        defaultCommandPool_.reset();
        allocator_.reset();
        ownedQueues_.clear();

        vkDestroyDevice(device_, nullptr);
        device_ = VK_NULL_HANDLE;

        FINE2D_DEBUG(LogCategory::Core, "Logical device destroyed");
    }
}

CommandPool* LogicalDevice::defaultCommandPool() {
    if (!defaultCommandPool_) {
        defaultCommandPool_ = std::make_unique<CommandPool>(
            this, graphicsQueue_, CommandPoolFlags::Resettable);
    }
    return defaultCommandPool_.get();
}

void LogicalDevice::waitIdle() {
    if (device_ != VK_NULL_HANDLE) {
        VkResult result = vkDeviceWaitIdle(device_);
        if (result != VK_SUCCESS) {
            throw RenderError("vkDeviceWaitIdle failed", result);
        }
    }
}

// ============================================================================
// LogicalDeviceBuilder::build() implementation
// ============================================================================

LogicalDevicePtr LogicalDeviceBuilder::build() {
    const auto& caps = physical_->capabilities();
    VkSurfaceKHR vkSurface = surface_ ? surface_->handle() : VK_NULL_HANDLE;

    auto graphicsFamily = caps.graphicsQueueFamily();
    if (!graphicsFamily) {
        throw RenderError("No graphics queue family found");
    }

    auto presentFamily = vkSurface ?
        caps.presentQueueFamily(physical_->handle(), vkSurface) :
        graphicsFamily;
    if (!presentFamily) {
        throw RenderError("No present queue family found");
    }

    std::set<uint32_t> uniqueFamilies = { *graphicsFamily, *presentFamily };

    std::vector<VkDeviceQueueCreateInfo> queueCreateInfos;
    float queuePriority = 1.0f;
    for (uint32_t family : uniqueFamilies) {
        VkDeviceQueueCreateInfo queueCreateInfo{};
        queueCreateInfo.sType = VK_STRUCTURE_TYPE_DEVICE_QUEUE_CREATE_INFO;
        queueCreateInfo.queueFamilyIndex = family;
        queueCreateInfo.queueCount = 1;
        queueCreateInfo.pQueuePriorities = &queuePriority;
        queueCreateInfos.push_back(queueCreateInfo);
    }

    // 2D rendering needs no optional device features
    VkPhysicalDeviceFeatures enabledFeatures{};

    VkDeviceCreateInfo createInfo{};
    createInfo.sType = VK_STRUCTURE_TYPE_DEVICE_CREATE_INFO;
    createInfo.queueCreateInfoCount = static_cast<uint32_t>(queueCreateInfos.size());
    createInfo.pQueueCreateInfos = queueCreateInfos.data();
    createInfo.pEnabledFeatures = &enabledFeatures;
    createInfo.enabledExtensionCount = static_cast<uint32_t>(extensions_.size());
    createInfo.ppEnabledExtensionNames = extensions_.data();

    VkDevice vkDevice;
    VkResult result = vkCreateDevice(physical_->handle(), &createInfo, nullptr, &vkDevice);
    if (result != VK_SUCCESS) {
        throw RenderError("Failed to create logical device", result);
    }

    auto device = LogicalDevicePtr(new LogicalDevice());
    device->device_ = vkDevice;
    device->physical_ = physical_;

    VkQueue vkGraphicsQueue;
    vkGetDeviceQueue(vkDevice, *graphicsFamily, 0, &vkGraphicsQueue);
    device->ownedQueues_.push_back(
        std::unique_ptr<Queue>(new Queue(vkGraphicsQueue, *graphicsFamily)));
    device->graphicsQueue_ = device->ownedQueues_.back().get();

    if (*presentFamily == *graphicsFamily) {
        device->presentQueue_ = device->graphicsQueue_;
    } else {
        VkQueue vkPresentQueue;
        vkGetDeviceQueue(vkDevice, *presentFamily, 0, &vkPresentQueue);
        device->ownedQueues_.push_back(
            std::unique_ptr<Queue>(new Queue(vkPresentQueue, *presentFamily)));
        device->presentQueue_ = device->ownedQueues_.back().get();
    }

    device->allocator_ = std::make_unique<MemoryAllocator>(device.get());

    FINE2D_INFO(LogCategory::Core, "Logical device created successfully");
    return device;
}

} // namespace fine2d
