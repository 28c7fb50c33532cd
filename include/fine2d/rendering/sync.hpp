#pragma once

#include "fine2d/core/types.hpp"

#include <vulkan/vulkan.h>
#include <cstdint>

namespace fine2d {

class LogicalDevice;

/**
 * @brief Vulkan semaphore wrapper (GPU-GPU ordering of acquire, render and present)
 */
class Semaphore {
public:
    explicit Semaphore(LogicalDevice* device);

    VkSemaphore handle() const { return semaphore_; }

    ~Semaphore();

    Semaphore(const Semaphore&) = delete;
    Semaphore& operator=(const Semaphore&) = delete;

private:
    LogicalDevice* device_ = nullptr;
    VkSemaphore semaphore_ = VK_NULL_HANDLE;
};

/**
 * @brief Vulkan fence wrapper (CPU waits for a frame slot's submission)
 */
class Fence {
public:
    /// Create a fence (optionally already signaled)
    explicit Fence(LogicalDevice* device, bool signaled = false);

    VkFence handle() const { return fence_; }

    void wait(uint64_t timeout = UINT64_MAX);
    void reset();
    bool isSignaled() const;

    ~Fence();

    Fence(const Fence&) = delete;
    Fence& operator=(const Fence&) = delete;

private:
    LogicalDevice* device_ = nullptr;
    VkFence fence_ = VK_NULL_HANDLE;
};

} // namespace fine2d
