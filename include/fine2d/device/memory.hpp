#pragma once

#include <vulkan/vulkan.h>
#include <cstddef>
#include <cstdint>

namespace fine2d {

class LogicalDevice;

/**
 * @brief Memory usage hint for allocation
 */
enum class MemoryUsage {
    GpuOnly,    // Device local; textures, mesh geometry
    CpuToGpu,   // Host visible + coherent; staging, per-frame streams
    GpuToCpu    // Host visible, cached when available; pixel readback
};

/**
 * @brief One dedicated device memory block
 */
struct AllocationInfo {
    VkDeviceMemory memory = VK_NULL_HANDLE;
    VkDeviceSize offset = 0;
    VkDeviceSize size = 0;
    void* mappedPtr = nullptr;  // persistently mapped for host-visible usages
};

/**
 * @brief Dedicated-allocation memory allocator
 *
 * 2D workloads allocate few, long-lived resources (textures, canvases,
 * streams), so every buffer and image gets its own VkDeviceMemory.
 * Host-visible memory stays mapped for its whole lifetime.
 */
class MemoryAllocator {
public:
    explicit MemoryAllocator(LogicalDevice* device);
    ~MemoryAllocator();

    AllocationInfo allocate(const VkMemoryRequirements& requirements, MemoryUsage usage);
    void free(const AllocationInfo& allocation);

    size_t totalAllocated() const { return totalAllocated_; }
    size_t allocationCount() const { return allocationCount_; }

    MemoryAllocator(const MemoryAllocator&) = delete;
    MemoryAllocator& operator=(const MemoryAllocator&) = delete;

private:
    uint32_t findMemoryType(uint32_t typeFilter, VkMemoryPropertyFlags required,
                            VkMemoryPropertyFlags preferred) const;

    LogicalDevice* device_;
    size_t totalAllocated_ = 0;
    size_t allocationCount_ = 0;
};

} // namespace fine2d
