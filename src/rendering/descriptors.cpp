#include "fine2d/rendering/descriptors.hpp"
#include "fine2d/device/logical_device.hpp"
#include "fine2d/device/image.hpp"
#include "fine2d/device/sampler.hpp"
#include "fine2d/core/logging.hpp"
#include "fine2d/core/error.hpp"

namespace fine2d {

// ============================================================================
// DescriptorSetLayout::Builder implementation
// ============================================================================

DescriptorSetLayout::Builder::Builder(LogicalDevice* device)
    : device_(device) {
}

DescriptorSetLayout::Builder& DescriptorSetLayout::Builder::binding(
    uint32_t binding, VkDescriptorType type,
    VkShaderStageFlags stageFlags, uint32_t count) {

    VkDescriptorSetLayoutBinding layoutBinding{};
    layoutBinding.binding = binding;
    layoutBinding.descriptorType = type;
    layoutBinding.descriptorCount = count;
    layoutBinding.stageFlags = stageFlags;
    layoutBinding.pImmutableSamplers = nullptr;

    bindings_.push_back(layoutBinding);
    return *this;
}

DescriptorSetLayout::Builder& DescriptorSetLayout::Builder::dynamicUniformBuffer(
    uint32_t binding, VkShaderStageFlags stageFlags) {
    return this->binding(binding, VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER_DYNAMIC, stageFlags);
}

DescriptorSetLayout::Builder& DescriptorSetLayout::Builder::combinedImageSampler(
    uint32_t binding, VkShaderStageFlags stageFlags) {
    return this->binding(binding, VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER, stageFlags);
}

DescriptorSetLayoutPtr DescriptorSetLayout::Builder::build() {
    VkDescriptorSetLayoutCreateInfo layoutInfo{};
    layoutInfo.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_LAYOUT_CREATE_INFO;
    layoutInfo.bindingCount = static_cast<uint32_t>(bindings_.size());
    layoutInfo.pBindings = bindings_.empty() ? nullptr : bindings_.data();

    VkDescriptorSetLayout vkLayout;
    VkResult result = vkCreateDescriptorSetLayout(device_->handle(), &layoutInfo, nullptr, &vkLayout);
    if (result != VK_SUCCESS) {
        throw RenderError("Failed to create descriptor set layout", result);
    }

    auto layout = DescriptorSetLayoutPtr(new DescriptorSetLayout());
    layout->device_ = device_;
    layout->layout_ = vkLayout;
    return layout;
}

// ============================================================================
// DescriptorSetLayout implementation
// ============================================================================

DescriptorSetLayout::Builder DescriptorSetLayout::create(LogicalDevice* device) {
    return Builder(device);
}

DescriptorSetLayout::~DescriptorSetLayout() {
    if (layout_ != VK_NULL_HANDLE) {
        vkDestroyDescriptorSetLayout(device_->handle(), layout_, nullptr);
    }
}

// ============================================================================
// DescriptorPool::Builder implementation
// ============================================================================

DescriptorPool::Builder::Builder(LogicalDevice* device)
    : device_(device) {
}

DescriptorPool::Builder& DescriptorPool::Builder::maxSets(uint32_t count) {
    maxSets_ = count;
    return *this;
}

DescriptorPool::Builder& DescriptorPool::Builder::poolSize(VkDescriptorType type, uint32_t count) {
    VkDescriptorPoolSize size{};
    size.type = type;
    size.descriptorCount = count;
    poolSizes_.push_back(size);
    return *this;
}

DescriptorPool::Builder& DescriptorPool::Builder::allowFree(bool allow) {
    allowFree_ = allow;
    return *this;
}

DescriptorPoolPtr DescriptorPool::Builder::build() {
    VkDescriptorPoolCreateInfo poolInfo{};
    poolInfo.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_POOL_CREATE_INFO;
    poolInfo.poolSizeCount = static_cast<uint32_t>(poolSizes_.size());
    poolInfo.pPoolSizes = poolSizes_.empty() ? nullptr : poolSizes_.data();
    poolInfo.maxSets = maxSets_;
    if (allowFree_) {
        poolInfo.flags = VK_DESCRIPTOR_POOL_CREATE_FREE_DESCRIPTOR_SET_BIT;
    }

    VkDescriptorPool vkPool;
    VkResult result = vkCreateDescriptorPool(device_->handle(), &poolInfo, nullptr, &vkPool);
    if (result != VK_SUCCESS) {
        throw RenderError("Failed to create descriptor pool", result);
    }

    auto pool = DescriptorPoolPtr(new DescriptorPool());
    pool->device_ = device_;
    pool->pool_ = vkPool;
    pool->allowFree_ = allowFree_;
    return pool;
}

// ============================================================================
// DescriptorPool implementation
// ============================================================================

DescriptorPool::Builder DescriptorPool::create(LogicalDevice* device) {
    return Builder(device);
}

DescriptorPool::~DescriptorPool() {
    if (pool_ != VK_NULL_HANDLE) {
        vkDestroyDescriptorPool(device_->handle(), pool_, nullptr);
    }
}

VkDescriptorSet DescriptorPool::allocate(DescriptorSetLayout* layout) {
    VkDescriptorSetAllocateInfo allocInfo{};
    allocInfo.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_ALLOCATE_INFO;
    allocInfo.descriptorPool = pool_;
    allocInfo.descriptorSetCount = 1;
    VkDescriptorSetLayout vkLayout = layout->handle();
    allocInfo.pSetLayouts = &vkLayout;

    VkDescriptorSet set;
    VkResult result = vkAllocateDescriptorSets(device_->handle(), &allocInfo, &set);
    if (result != VK_SUCCESS) {
        throw RenderError("Failed to allocate descriptor set", result);
    }
    return set;
}

void DescriptorPool::free(VkDescriptorSet set) {
    if (!allowFree_) {
        FINE2D_ERROR(LogCategory::Vulkan, "Descriptor set freed from a pool created without allowFree");
        return;
    }
    VkResult result = vkFreeDescriptorSets(device_->handle(), pool_, 1, &set);
    if (result != VK_SUCCESS) {
        FINE2D_WARN(LogCategory::Vulkan, "vkFreeDescriptorSets returned " + std::to_string(result));
    }
}

// ============================================================================
// DescriptorWriter implementation
// ============================================================================

DescriptorWriter::DescriptorWriter(LogicalDevice* device)
    : device_(device) {
}

DescriptorWriter& DescriptorWriter::writeBuffer(
    VkDescriptorSet set, uint32_t binding, VkDescriptorType type,
    VkBuffer buffer, VkDeviceSize offset, VkDeviceSize range) {

    bufferInfos_.push_back({buffer, offset, range});

    VkWriteDescriptorSet write{};
    write.sType = VK_STRUCTURE_TYPE_WRITE_DESCRIPTOR_SET;
    write.dstSet = set;
    write.dstBinding = binding;
    write.dstArrayElement = 0;
    write.descriptorType = type;
    write.descriptorCount = 1;
    write.pBufferInfo = &bufferInfos_.back();

    writes_.push_back(write);
    return *this;
}

DescriptorWriter& DescriptorWriter::writeImage(
    VkDescriptorSet set, uint32_t binding,
    ImageView* imageView, Sampler* sampler, VkImageLayout layout) {

    imageInfos_.push_back({sampler->handle(), imageView->handle(), layout});

    VkWriteDescriptorSet write{};
    write.sType = VK_STRUCTURE_TYPE_WRITE_DESCRIPTOR_SET;
    write.dstSet = set;
    write.dstBinding = binding;
    write.dstArrayElement = 0;
    write.descriptorType = VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER;
    write.descriptorCount = 1;
    write.pImageInfo = &imageInfos_.back();

    writes_.push_back(write);
    return *this;
}

void DescriptorWriter::update() {
    if (!writes_.empty()) {
        vkUpdateDescriptorSets(
            device_->handle(),
            static_cast<uint32_t>(writes_.size()),
            writes_.data(),
            0, nullptr);
    }
    writes_.clear();
    bufferInfos_.clear();
    imageInfos_.clear();
}

} // namespace fine2d
