#pragma once

#include "fine2d/device/memory.hpp"
#include "fine2d/core/types.hpp"

#include <vulkan/vulkan.h>
#include <memory>

namespace fine2d {

class LogicalDevice;
class CommandPool;

/**
 * @brief Vulkan buffer wrapper with memory management
 *
 * Host-visible buffers are persistently mapped; GPU-only buffers are filled
 * through a staging copy on a command pool.
 */
class Buffer {
public:
    /**
     * @brief Builder for creating Buffer objects
     */
    class Builder {
    public:
        explicit Builder(LogicalDevice* device);

        /// Set buffer size in bytes
        Builder& size(VkDeviceSize bytes);

        /// Set buffer usage flags
        Builder& usage(VkBufferUsageFlags usage);

        /// Set memory usage hint
        Builder& memoryUsage(MemoryUsage memUsage);

        BufferPtr build();

    private:
        LogicalDevice* device_;
        VkDeviceSize size_ = 0;
        VkBufferUsageFlags usage_ = 0;
        MemoryUsage memUsage_ = MemoryUsage::GpuOnly;
    };

    static Builder create(LogicalDevice* device);

    /// GPU-only vertex buffer, filled with upload()
    static BufferPtr createVertexBuffer(LogicalDevice* device, VkDeviceSize size);

    /// GPU-only index buffer, filled with upload()
    static BufferPtr createIndexBuffer(LogicalDevice* device, VkDeviceSize size);

    /// Host-visible buffer rewritten every frame (instance data, shader uniforms)
    static BufferPtr createStreamBuffer(LogicalDevice* device, VkDeviceSize size,
                                        VkBufferUsageFlags usage);

    /// Host-visible transfer source
    static BufferPtr createStagingBuffer(LogicalDevice* device, VkDeviceSize size);

    /// Host-visible transfer destination for pixel readback
    static BufferPtr createReadbackBuffer(LogicalDevice* device, VkDeviceSize size);

    VkBuffer handle() const { return buffer_; }
    LogicalDevice* device() const { return device_; }
    VkDeviceSize size() const { return size_; }

    bool isMappable() const { return allocation_.mappedPtr != nullptr; }

    /// Persistent mapping (nullptr for GPU-only buffers)
    void* mappedPtr() const { return allocation_.mappedPtr; }

    /// Copy into a host-visible buffer
    void write(const void* data, VkDeviceSize size, VkDeviceSize offset = 0);

    /// Copy into any buffer; GPU-only buffers go through a staging buffer on commandPool
    void upload(const void* data, VkDeviceSize size, CommandPool* commandPool);

    ~Buffer();

    Buffer(const Buffer&) = delete;
    Buffer& operator=(const Buffer&) = delete;

private:
    friend class Builder;
    Buffer() = default;

    LogicalDevice* device_ = nullptr;
    VkBuffer buffer_ = VK_NULL_HANDLE;
    VkDeviceSize size_ = 0;
    AllocationInfo allocation_;
};

} // namespace fine2d
