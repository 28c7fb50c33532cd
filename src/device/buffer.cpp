#include "fine2d/device/buffer.hpp"
#include "fine2d/device/logical_device.hpp"
#include "fine2d/device/command.hpp"
#include "fine2d/core/logging.hpp"
#include "fine2d/core/error.hpp"

#include <cstring>

namespace fine2d {

// ============================================================================
// Buffer::Builder implementation
// ============================================================================

Buffer::Builder::Builder(LogicalDevice* device)
    : device_(device) {
}

Buffer::Builder& Buffer::Builder::size(VkDeviceSize bytes) {
    size_ = bytes;
    return *this;
}

Buffer::Builder& Buffer::Builder::usage(VkBufferUsageFlags usage) {
    usage_ = usage;
    return *this;
}

Buffer::Builder& Buffer::Builder::memoryUsage(MemoryUsage memUsage) {
    memUsage_ = memUsage;
    return *this;
}

BufferPtr Buffer::Builder::build() {
    if (size_ == 0) {
        throw std::logic_error("Buffer size must be greater than 0");
    }
    if (usage_ == 0) {
        throw std::logic_error("Buffer usage must be specified");
    }

    VkBufferCreateInfo bufferInfo{};
    bufferInfo.sType = VK_STRUCTURE_TYPE_BUFFER_CREATE_INFO;
    bufferInfo.size = size_;
    bufferInfo.usage = usage_;
    bufferInfo.sharingMode = VK_SHARING_MODE_EXCLUSIVE;

    VkBuffer vkBuffer;
    VkResult result = vkCreateBuffer(device_->handle(), &bufferInfo, nullptr, &vkBuffer);
    if (result != VK_SUCCESS) {
        throw RenderError("Failed to create buffer", result);
    }

    VkMemoryRequirements memRequirements;
    vkGetBufferMemoryRequirements(device_->handle(), vkBuffer, &memRequirements);

    AllocationInfo allocation;
    try {
        allocation = device_->allocator().allocate(memRequirements, memUsage_);
    } catch (const RenderError&) {
        vkDestroyBuffer(device_->handle(), vkBuffer, nullptr);
        throw;
    }

    result = vkBindBufferMemory(device_->handle(), vkBuffer, allocation.memory, allocation.offset);
    if (result != VK_SUCCESS) {
        device_->allocator().free(allocation);
        vkDestroyBuffer(device_->handle(), vkBuffer, nullptr);
        throw RenderError("Failed to bind buffer memory", result);
    }

    auto buffer = BufferPtr(new Buffer());
    buffer->device_ = device_;
    buffer->buffer_ = vkBuffer;
    buffer->size_ = size_;
    buffer->allocation_ = allocation;
    return buffer;
}

// ============================================================================
// Buffer implementation
// ============================================================================

Buffer::Builder Buffer::create(LogicalDevice* device) {
    return Builder(device);
}

BufferPtr Buffer::createVertexBuffer(LogicalDevice* device, VkDeviceSize size) {
    return create(device)
        .size(size)
        .usage(VK_BUFFER_USAGE_VERTEX_BUFFER_BIT | VK_BUFFER_USAGE_TRANSFER_DST_BIT)
        .memoryUsage(MemoryUsage::GpuOnly)
        .build();
}

BufferPtr Buffer::createIndexBuffer(LogicalDevice* device, VkDeviceSize size) {
    return create(device)
        .size(size)
        .usage(VK_BUFFER_USAGE_INDEX_BUFFER_BIT | VK_BUFFER_USAGE_TRANSFER_DST_BIT)
        .memoryUsage(MemoryUsage::GpuOnly)
        .build();
}

BufferPtr Buffer::createStreamBuffer(LogicalDevice* device, VkDeviceSize size,
                                     VkBufferUsageFlags usage) {
    return create(device)
        .size(size)
        .usage(usage)
        .memoryUsage(MemoryUsage::CpuToGpu)
        .build();
}

BufferPtr Buffer::createStagingBuffer(LogicalDevice* device, VkDeviceSize size) {
    return create(device)
        .size(size)
        .usage(VK_BUFFER_USAGE_TRANSFER_SRC_BIT)
        .memoryUsage(MemoryUsage::CpuToGpu)
        .build();
}

BufferPtr Buffer::createReadbackBuffer(LogicalDevice* device, VkDeviceSize size) {
    return create(device)
        .size(size)
        .usage(VK_BUFFER_USAGE_TRANSFER_DST_BIT)
        .memoryUsage(MemoryUsage::GpuToCpu)
        .build();
}

Buffer::~Buffer() {
    if (buffer_ != VK_NULL_HANDLE) {
        vkDestroyBuffer(device_->handle(), buffer_, nullptr);
        device_->allocator().free(allocation_);
    }
}

void Buffer::write(const void* data, VkDeviceSize dataSize, VkDeviceSize offset) {
    if (!isMappable()) {
        throw std::logic_error("Buffer::write on a GPU-only buffer");
    }
    if (offset + dataSize > size_) {
        throw std::logic_error("Buffer::write past the end of the buffer");
    }
    std::memcpy(static_cast<char*>(allocation_.mappedPtr) + offset, data, dataSize);
}

void Buffer::upload(const void* data, VkDeviceSize dataSize, CommandPool* commandPool) {
    if (isMappable()) {
        write(data, dataSize);
        return;
    }

    auto staging = createStagingBuffer(device_, dataSize);
    staging->write(data, dataSize);

    auto imm = commandPool->beginImmediate();
    imm.cmd().copyBuffer(*staging, *this, dataSize);
    imm.submit();
}

} // namespace fine2d
