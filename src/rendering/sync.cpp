#include "fine2d/rendering/sync.hpp"
#include "fine2d/device/logical_device.hpp"
#include "fine2d/core/error.hpp"

namespace fine2d {

// ============================================================================
// Semaphore implementation
// ============================================================================

Semaphore::Semaphore(LogicalDevice* device)
    : device_(device) {
    VkSemaphoreCreateInfo semaphoreInfo{};
    semaphoreInfo.sType = VK_STRUCTURE_TYPE_SEMAPHORE_CREATE_INFO;

    VkResult result = vkCreateSemaphore(device_->handle(), &semaphoreInfo, nullptr, &semaphore_);
    if (result != VK_SUCCESS) {
        throw RenderError("Failed to create semaphore", result);
    }
}

Semaphore::~Semaphore() {
    if (semaphore_ != VK_NULL_HANDLE) {
        vkDestroySemaphore(device_->handle(), semaphore_, nullptr);
    }
}

// ============================================================================
// Fence implementation
// ============================================================================

Fence::Fence(LogicalDevice* device, bool signaled)
    : device_(device) {
    VkFenceCreateInfo fenceInfo{};
    fenceInfo.sType = VK_STRUCTURE_TYPE_FENCE_CREATE_INFO;
    if (signaled) {
        fenceInfo.flags = VK_FENCE_CREATE_SIGNALED_BIT;
    }

    VkResult result = vkCreateFence(device_->handle(), &fenceInfo, nullptr, &fence_);
    if (result != VK_SUCCESS) {
        throw RenderError("Failed to create fence", result);
    }
}

Fence::~Fence() {
    if (fence_ != VK_NULL_HANDLE) {
        vkDestroyFence(device_->handle(), fence_, nullptr);
    }
}

void Fence::wait(uint64_t timeout) {
    VkResult result = vkWaitForFences(device_->handle(), 1, &fence_, VK_TRUE, timeout);
    if (result != VK_SUCCESS) {
        throw RenderError("Failed waiting for fence", result);
    }
}

void Fence::reset() {
    VkResult result = vkResetFences(device_->handle(), 1, &fence_);
    if (result != VK_SUCCESS) {
        throw RenderError("Failed to reset fence", result);
    }
}

bool Fence::isSignaled() const {
    return vkGetFenceStatus(device_->handle(), fence_) == VK_SUCCESS;
}

} // namespace fine2d
