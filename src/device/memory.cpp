#include "fine2d/device/memory.hpp"
#include "fine2d/device/logical_device.hpp"
#include "fine2d/device/physical_device.hpp"
#include "fine2d/core/logging.hpp"
#include "fine2d/core/error.hpp"

namespace fine2d {

MemoryAllocator::MemoryAllocator(LogicalDevice* device)
    : device_(device) {
}

MemoryAllocator::~MemoryAllocator() {
    if (allocationCount_ > 0) {
        FINE2D_WARN(LogCategory::Core,
            "MemoryAllocator destroyed with " + std::to_string(allocationCount_) +
            " allocations still active (" + std::to_string(totalAllocated_) + " bytes)");
    }
}

uint32_t MemoryAllocator::findMemoryType(uint32_t typeFilter, VkMemoryPropertyFlags required,
                                         VkMemoryPropertyFlags preferred) const {
    const auto& memProps = device_->physicalDevice()->capabilities().memory;

    // First pass with the preferred extras, second pass with only the required bits
    for (VkMemoryPropertyFlags wanted : {required | preferred, required}) {
        for (uint32_t i = 0; i < memProps.memoryTypeCount; i++) {
            if ((typeFilter & (1u << i)) &&
                (memProps.memoryTypes[i].propertyFlags & wanted) == wanted) {
                return i;
            }
        }
    }

    throw RenderError("Failed to find suitable memory type");
}

AllocationInfo MemoryAllocator::allocate(const VkMemoryRequirements& requirements, MemoryUsage usage) {
    VkMemoryPropertyFlags required = 0;
    VkMemoryPropertyFlags preferred = 0;
    switch (usage) {
        case MemoryUsage::GpuOnly:
            required = VK_MEMORY_PROPERTY_DEVICE_LOCAL_BIT;
            break;
        case MemoryUsage::CpuToGpu:
            required = VK_MEMORY_PROPERTY_HOST_VISIBLE_BIT | VK_MEMORY_PROPERTY_HOST_COHERENT_BIT;
            break;
        case MemoryUsage::GpuToCpu:
            required = VK_MEMORY_PROPERTY_HOST_VISIBLE_BIT | VK_MEMORY_PROPERTY_HOST_COHERENT_BIT;
            preferred = VK_MEMORY_PROPERTY_HOST_CACHED_BIT;
            break;
    }

    VkMemoryAllocateInfo allocInfo{};
    allocInfo.sType = VK_STRUCTURE_TYPE_MEMORY_ALLOCATE_INFO;
    allocInfo.allocationSize = requirements.size;
    allocInfo.memoryTypeIndex = findMemoryType(requirements.memoryTypeBits, required, preferred);

    AllocationInfo info;
    VkResult result = vkAllocateMemory(device_->handle(), &allocInfo, nullptr, &info.memory);
    if (result != VK_SUCCESS) {
        throw RenderError("Failed to allocate device memory (" +
                          std::to_string(requirements.size) + " bytes)", result);
    }
    info.size = requirements.size;

    if (required & VK_MEMORY_PROPERTY_HOST_VISIBLE_BIT) {
        result = vkMapMemory(device_->handle(), info.memory, 0, info.size, 0, &info.mappedPtr);
        if (result != VK_SUCCESS) {
            vkFreeMemory(device_->handle(), info.memory, nullptr);
            throw RenderError("Failed to map device memory", result);
        }
    }

    totalAllocated_ += info.size;
    allocationCount_++;
    return info;
}

void MemoryAllocator::free(const AllocationInfo& allocation) {
    if (allocation.memory == VK_NULL_HANDLE) {
        return;
    }

    if (allocation.mappedPtr) {
        vkUnmapMemory(device_->handle(), allocation.memory);
    }
    vkFreeMemory(device_->handle(), allocation.memory, nullptr);

    totalAllocated_ -= allocation.size;
    allocationCount_--;
}

} // namespace fine2d
