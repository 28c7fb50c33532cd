#pragma once

#include "fine2d/core/types.hpp"

#include <vulkan/vulkan.h>
#include <cstdint>
#include <vector>
#include <memory>

namespace fine2d {

class LogicalDevice;
class RenderPass;

/**
 * @brief Vulkan shader module wrapper
 */
class ShaderModule {
public:
    /// Create from SPIR-V words
    static ShaderModulePtr fromSPIRV(LogicalDevice* device, const uint32_t* words, size_t wordCount);
    static ShaderModulePtr fromSPIRV(LogicalDevice* device, const std::vector<uint32_t>& spirv) {
        return fromSPIRV(device, spirv.data(), spirv.size());
    }

    /// Create from a SPIR-V file image; rejects data that is not SPIR-V with ResourceLoadError
    static ShaderModulePtr fromBytes(LogicalDevice* device, const std::vector<uint8_t>& bytes);

    VkShaderModule handle() const { return module_; }

    ~ShaderModule();

    ShaderModule(const ShaderModule&) = delete;
    ShaderModule& operator=(const ShaderModule&) = delete;

private:
    ShaderModule() = default;

    LogicalDevice* device_ = nullptr;
    VkShaderModule module_ = VK_NULL_HANDLE;
};

/**
 * @brief Vulkan pipeline layout wrapper
 */
class PipelineLayout {
public:
    /**
     * @brief Builder for creating PipelineLayout objects
     */
    class Builder {
    public:
        explicit Builder(LogicalDevice* device);

        /// Add a descriptor set layout (set index = order of addition)
        Builder& addDescriptorSetLayout(VkDescriptorSetLayout layout);

        Builder& addPushConstantRange(VkShaderStageFlags stages,
                                      uint32_t offset, uint32_t size);

        PipelineLayoutPtr build();

    private:
        LogicalDevice* device_;
        std::vector<VkDescriptorSetLayout> setLayouts_;
        std::vector<VkPushConstantRange> pushConstantRanges_;
    };

    static Builder create(LogicalDevice* device);

    VkPipelineLayout handle() const { return layout_; }

    ~PipelineLayout();

    PipelineLayout(const PipelineLayout&) = delete;
    PipelineLayout& operator=(const PipelineLayout&) = delete;

private:
    friend class Builder;
    PipelineLayout() = default;

    LogicalDevice* device_ = nullptr;
    VkPipelineLayout layout_ = VK_NULL_HANDLE;
};

/**
 * @brief Vulkan graphics pipeline wrapper
 *
 * Pipelines are 2D only: triangle lists, no culling, no depth, one color
 * attachment, dynamic viewport and scissor.
 */
class GraphicsPipeline {
public:
    /**
     * @brief Builder for creating GraphicsPipeline objects
     */
    class Builder {
    public:
        Builder(LogicalDevice* device, RenderPass* renderPass, PipelineLayout* layout);

        // Shader stages
        Builder& vertexShader(ShaderModule* module);
        Builder& fragmentShader(ShaderModule* module);

        // Vertex input
        Builder& vertexBinding(uint32_t binding, uint32_t stride,
                               VkVertexInputRate inputRate = VK_VERTEX_INPUT_RATE_VERTEX);
        Builder& vertexAttribute(uint32_t location, uint32_t binding,
                                 VkFormat format, uint32_t offset);

        Builder& samples(VkSampleCountFlagBits count);

        /// Color blend state of the single attachment
        Builder& blend(const VkPipelineColorBlendAttachmentState& state);

        GraphicsPipelinePtr build();

    private:
        LogicalDevice* device_;
        RenderPass* renderPass_;
        PipelineLayout* layout_;

        std::vector<VkPipelineShaderStageCreateInfo> shaderStages_;
        std::vector<VkVertexInputBindingDescription> vertexBindings_;
        std::vector<VkVertexInputAttributeDescription> vertexAttributes_;

        VkSampleCountFlagBits samples_ = VK_SAMPLE_COUNT_1_BIT;
        VkPipelineColorBlendAttachmentState blend_{};
    };

    static Builder create(LogicalDevice* device, RenderPass* renderPass, PipelineLayout* layout);

    VkPipeline handle() const { return pipeline_; }

    ~GraphicsPipeline();

    GraphicsPipeline(const GraphicsPipeline&) = delete;
    GraphicsPipeline& operator=(const GraphicsPipeline&) = delete;

private:
    friend class Builder;
    GraphicsPipeline() = default;

    LogicalDevice* device_ = nullptr;
    VkPipeline pipeline_ = VK_NULL_HANDLE;
};

} // namespace fine2d
