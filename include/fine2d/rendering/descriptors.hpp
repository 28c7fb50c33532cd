#pragma once

#include "fine2d/core/types.hpp"

#include <vulkan/vulkan.h>
#include <deque>
#include <vector>
#include <memory>

namespace fine2d {

class LogicalDevice;
class Buffer;
class ImageView;
class Sampler;

/**
 * @brief Vulkan descriptor set layout wrapper
 */
class DescriptorSetLayout {
public:
    /**
     * @brief Builder for creating DescriptorSetLayout objects
     */
    class Builder {
    public:
        explicit Builder(LogicalDevice* device);

        /// Add a generic binding
        Builder& binding(uint32_t binding, VkDescriptorType type,
                         VkShaderStageFlags stageFlags, uint32_t count = 1);

        /// Add a dynamic-offset uniform buffer binding
        Builder& dynamicUniformBuffer(uint32_t binding, VkShaderStageFlags stageFlags);

        /// Add a combined image sampler binding
        Builder& combinedImageSampler(uint32_t binding, VkShaderStageFlags stageFlags);

        DescriptorSetLayoutPtr build();

    private:
        LogicalDevice* device_;
        std::vector<VkDescriptorSetLayoutBinding> bindings_;
    };

    static Builder create(LogicalDevice* device);

    VkDescriptorSetLayout handle() const { return layout_; }

    ~DescriptorSetLayout();

    DescriptorSetLayout(const DescriptorSetLayout&) = delete;
    DescriptorSetLayout& operator=(const DescriptorSetLayout&) = delete;

private:
    friend class Builder;
    DescriptorSetLayout() = default;

    LogicalDevice* device_ = nullptr;
    VkDescriptorSetLayout layout_ = VK_NULL_HANDLE;
};

/**
 * @brief Vulkan descriptor pool wrapper
 */
class DescriptorPool {
public:
    /**
     * @brief Builder for creating DescriptorPool objects
     */
    class Builder {
    public:
        explicit Builder(LogicalDevice* device);

        Builder& maxSets(uint32_t count);
        Builder& poolSize(VkDescriptorType type, uint32_t count);

        /// Allow freeing individual descriptor sets
        Builder& allowFree(bool allow = true);

        DescriptorPoolPtr build();

    private:
        LogicalDevice* device_;
        uint32_t maxSets_ = 100;
        std::vector<VkDescriptorPoolSize> poolSizes_;
        bool allowFree_ = false;
    };

    static Builder create(LogicalDevice* device);

    VkDescriptorPool handle() const { return pool_; }

    /// Allocate a single descriptor set
    VkDescriptorSet allocate(DescriptorSetLayout* layout);

    /// Free a descriptor set (only if pool was created with allowFree)
    void free(VkDescriptorSet set);

    ~DescriptorPool();

    DescriptorPool(const DescriptorPool&) = delete;
    DescriptorPool& operator=(const DescriptorPool&) = delete;

private:
    friend class Builder;
    DescriptorPool() = default;

    LogicalDevice* device_ = nullptr;
    VkDescriptorPool pool_ = VK_NULL_HANDLE;
    bool allowFree_ = false;
};

/**
 * @brief Helper for writing descriptor sets
 *
 * Buffer and image infos live in deques so the pointers held by pending
 * writes stay valid as more writes are queued.
 */
class DescriptorWriter {
public:
    explicit DescriptorWriter(LogicalDevice* device);

    DescriptorWriter& writeBuffer(VkDescriptorSet set, uint32_t binding,
                                  VkDescriptorType type,
                                  VkBuffer buffer, VkDeviceSize offset,
                                  VkDeviceSize range);

    DescriptorWriter& writeImage(VkDescriptorSet set, uint32_t binding,
                                 ImageView* imageView, Sampler* sampler,
                                 VkImageLayout layout = VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL);

    /// Apply all pending writes
    void update();

private:
    LogicalDevice* device_;
    std::vector<VkWriteDescriptorSet> writes_;
    std::deque<VkDescriptorBufferInfo> bufferInfos_;
    std::deque<VkDescriptorImageInfo> imageInfos_;
};

} // namespace fine2d
