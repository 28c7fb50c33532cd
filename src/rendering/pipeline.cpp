#include "fine2d/rendering/pipeline.hpp"
#include "fine2d/rendering/renderpass.hpp"
#include "fine2d/device/logical_device.hpp"
#include "fine2d/core/logging.hpp"
#include "fine2d/core/error.hpp"

#include <cstring>

namespace fine2d {

static const uint32_t SPIRV_MAGIC = 0x07230203;

// ============================================================================
// ShaderModule implementation
// ============================================================================

ShaderModulePtr ShaderModule::fromSPIRV(LogicalDevice* device, const uint32_t* words, size_t wordCount) {
    VkShaderModuleCreateInfo createInfo{};
    createInfo.sType = VK_STRUCTURE_TYPE_SHADER_MODULE_CREATE_INFO;
    createInfo.codeSize = wordCount * sizeof(uint32_t);
    createInfo.pCode = words;

    VkShaderModule vkModule;
    VkResult result = vkCreateShaderModule(device->handle(), &createInfo, nullptr, &vkModule);
    if (result != VK_SUCCESS) {
        throw RenderError("Failed to create shader module", result);
    }

    auto module = ShaderModulePtr(new ShaderModule());
    module->device_ = device;
    module->module_ = vkModule;
    return module;
}

ShaderModulePtr ShaderModule::fromBytes(LogicalDevice* device, const std::vector<uint8_t>& bytes) {
    if (bytes.size() < sizeof(uint32_t) * 5 || bytes.size() % sizeof(uint32_t) != 0) {
        throw ResourceLoadError("Shader code is not a whole number of SPIR-V words (" +
                                std::to_string(bytes.size()) + " bytes)");
    }

    std::vector<uint32_t> words(bytes.size() / sizeof(uint32_t));
    std::memcpy(words.data(), bytes.data(), bytes.size());
    if (words[0] != SPIRV_MAGIC) {
        throw ResourceLoadError("Shader code does not start with the SPIR-V magic number");
    }

    return fromSPIRV(device, words);
}

ShaderModule::~ShaderModule() {
    if (module_ != VK_NULL_HANDLE) {
        vkDestroyShaderModule(device_->handle(), module_, nullptr);
    }
}

// ============================================================================
// PipelineLayout::Builder implementation
// ============================================================================

PipelineLayout::Builder::Builder(LogicalDevice* device)
    : device_(device) {
}

PipelineLayout::Builder& PipelineLayout::Builder::addDescriptorSetLayout(VkDescriptorSetLayout layout) {
    setLayouts_.push_back(layout);
    return *this;
}

PipelineLayout::Builder& PipelineLayout::Builder::addPushConstantRange(
    VkShaderStageFlags stages, uint32_t offset, uint32_t size) {
    VkPushConstantRange range{};
    range.stageFlags = stages;
    range.offset = offset;
    range.size = size;
    pushConstantRanges_.push_back(range);
    return *this;
}

PipelineLayoutPtr PipelineLayout::Builder::build() {
    VkPipelineLayoutCreateInfo layoutInfo{};
    layoutInfo.sType = VK_STRUCTURE_TYPE_PIPELINE_LAYOUT_CREATE_INFO;
    layoutInfo.setLayoutCount = static_cast<uint32_t>(setLayouts_.size());
    layoutInfo.pSetLayouts = setLayouts_.empty() ? nullptr : setLayouts_.data();
    layoutInfo.pushConstantRangeCount = static_cast<uint32_t>(pushConstantRanges_.size());
    layoutInfo.pPushConstantRanges = pushConstantRanges_.empty() ? nullptr : pushConstantRanges_.data();

    VkPipelineLayout vkLayout;
    VkResult result = vkCreatePipelineLayout(device_->handle(), &layoutInfo, nullptr, &vkLayout);
    if (result != VK_SUCCESS) {
        throw RenderError("Failed to create pipeline layout", result);
    }

    auto layout = PipelineLayoutPtr(new PipelineLayout());
    layout->device_ = device_;
    layout->layout_ = vkLayout;
    return layout;
}

// ============================================================================
// PipelineLayout implementation
// ============================================================================

PipelineLayout::Builder PipelineLayout::create(LogicalDevice* device) {
    return Builder(device);
}

PipelineLayout::~PipelineLayout() {
    if (layout_ != VK_NULL_HANDLE) {
        vkDestroyPipelineLayout(device_->handle(), layout_, nullptr);
    }
}

// ============================================================================
// GraphicsPipeline::Builder implementation
// ============================================================================

GraphicsPipeline::Builder::Builder(LogicalDevice* device, RenderPass* renderPass,
                                   PipelineLayout* layout)
    : device_(device), renderPass_(renderPass), layout_(layout) {
    blend_.colorWriteMask = VK_COLOR_COMPONENT_R_BIT | VK_COLOR_COMPONENT_G_BIT |
                            VK_COLOR_COMPONENT_B_BIT | VK_COLOR_COMPONENT_A_BIT;
    blend_.blendEnable = VK_FALSE;
}

GraphicsPipeline::Builder& GraphicsPipeline::Builder::vertexShader(ShaderModule* module) {
    VkPipelineShaderStageCreateInfo stageInfo{};
    stageInfo.sType = VK_STRUCTURE_TYPE_PIPELINE_SHADER_STAGE_CREATE_INFO;
    stageInfo.stage = VK_SHADER_STAGE_VERTEX_BIT;
    stageInfo.module = module->handle();
    stageInfo.pName = "main";
    shaderStages_.push_back(stageInfo);
    return *this;
}

GraphicsPipeline::Builder& GraphicsPipeline::Builder::fragmentShader(ShaderModule* module) {
    VkPipelineShaderStageCreateInfo stageInfo{};
    stageInfo.sType = VK_STRUCTURE_TYPE_PIPELINE_SHADER_STAGE_CREATE_INFO;
    stageInfo.stage = VK_SHADER_STAGE_FRAGMENT_BIT;
    stageInfo.module = module->handle();
    stageInfo.pName = "main";
    shaderStages_.push_back(stageInfo);
    return *this;
}

GraphicsPipeline::Builder& GraphicsPipeline::Builder::vertexBinding(
    uint32_t binding, uint32_t stride, VkVertexInputRate inputRate) {
    VkVertexInputBindingDescription desc{};
    desc.binding = binding;
    desc.stride = stride;
    desc.inputRate = inputRate;
    vertexBindings_.push_back(desc);
    return *this;
}

GraphicsPipeline::Builder& GraphicsPipeline::Builder::vertexAttribute(
    uint32_t location, uint32_t binding, VkFormat format, uint32_t offset) {
    VkVertexInputAttributeDescription desc{};
    desc.location = location;
    desc.binding = binding;
    desc.format = format;
    desc.offset = offset;
    vertexAttributes_.push_back(desc);
    return *this;
}

GraphicsPipeline::Builder& GraphicsPipeline::Builder::samples(VkSampleCountFlagBits count) {
    samples_ = count;
    return *this;
}

GraphicsPipeline::Builder& GraphicsPipeline::Builder::blend(
    const VkPipelineColorBlendAttachmentState& state) {
    blend_ = state;
    return *this;
}

GraphicsPipelinePtr GraphicsPipeline::Builder::build() {
    if (shaderStages_.size() != 2) {
        throw std::logic_error("Graphics pipeline needs a vertex and a fragment shader");
    }

    VkPipelineVertexInputStateCreateInfo vertexInputInfo{};
    vertexInputInfo.sType = VK_STRUCTURE_TYPE_PIPELINE_VERTEX_INPUT_STATE_CREATE_INFO;
    vertexInputInfo.vertexBindingDescriptionCount = static_cast<uint32_t>(vertexBindings_.size());
    vertexInputInfo.pVertexBindingDescriptions = vertexBindings_.empty() ? nullptr : vertexBindings_.data();
    vertexInputInfo.vertexAttributeDescriptionCount = static_cast<uint32_t>(vertexAttributes_.size());
    vertexInputInfo.pVertexAttributeDescriptions = vertexAttributes_.empty() ? nullptr : vertexAttributes_.data();

    VkPipelineInputAssemblyStateCreateInfo inputAssembly{};
    inputAssembly.sType = VK_STRUCTURE_TYPE_PIPELINE_INPUT_ASSEMBLY_STATE_CREATE_INFO;
    inputAssembly.topology = VK_PRIMITIVE_TOPOLOGY_TRIANGLE_LIST;
    inputAssembly.primitiveRestartEnable = VK_FALSE;

    // Viewport and scissor are dynamic
    VkPipelineViewportStateCreateInfo viewportState{};
    viewportState.sType = VK_STRUCTURE_TYPE_PIPELINE_VIEWPORT_STATE_CREATE_INFO;
    viewportState.viewportCount = 1;
    viewportState.scissorCount = 1;

    // Projections may mirror either axis, so nothing is culled
    VkPipelineRasterizationStateCreateInfo rasterizer{};
    rasterizer.sType = VK_STRUCTURE_TYPE_PIPELINE_RASTERIZATION_STATE_CREATE_INFO;
    rasterizer.depthClampEnable = VK_FALSE;
    rasterizer.rasterizerDiscardEnable = VK_FALSE;
    rasterizer.polygonMode = VK_POLYGON_MODE_FILL;
    rasterizer.lineWidth = 1.0f;
    rasterizer.cullMode = VK_CULL_MODE_NONE;
    rasterizer.frontFace = VK_FRONT_FACE_COUNTER_CLOCKWISE;
    rasterizer.depthBiasEnable = VK_FALSE;

    VkPipelineMultisampleStateCreateInfo multisampling{};
    multisampling.sType = VK_STRUCTURE_TYPE_PIPELINE_MULTISAMPLE_STATE_CREATE_INFO;
    multisampling.rasterizationSamples = samples_;
    multisampling.sampleShadingEnable = VK_FALSE;
    multisampling.minSampleShading = 1.0f;

    VkPipelineDepthStencilStateCreateInfo depthStencil{};
    depthStencil.sType = VK_STRUCTURE_TYPE_PIPELINE_DEPTH_STENCIL_STATE_CREATE_INFO;
    depthStencil.depthTestEnable = VK_FALSE;
    depthStencil.depthWriteEnable = VK_FALSE;

    VkPipelineColorBlendStateCreateInfo colorBlending{};
    colorBlending.sType = VK_STRUCTURE_TYPE_PIPELINE_COLOR_BLEND_STATE_CREATE_INFO;
    colorBlending.logicOpEnable = VK_FALSE;
    colorBlending.attachmentCount = 1;
    colorBlending.pAttachments = &blend_;

    const VkDynamicState dynamicStates[] = {VK_DYNAMIC_STATE_VIEWPORT, VK_DYNAMIC_STATE_SCISSOR};
    VkPipelineDynamicStateCreateInfo dynamicState{};
    dynamicState.sType = VK_STRUCTURE_TYPE_PIPELINE_DYNAMIC_STATE_CREATE_INFO;
    dynamicState.dynamicStateCount = 2;
    dynamicState.pDynamicStates = dynamicStates;

    VkGraphicsPipelineCreateInfo pipelineInfo{};
    pipelineInfo.sType = VK_STRUCTURE_TYPE_GRAPHICS_PIPELINE_CREATE_INFO;
    pipelineInfo.stageCount = static_cast<uint32_t>(shaderStages_.size());
    pipelineInfo.pStages = shaderStages_.data();
    pipelineInfo.pVertexInputState = &vertexInputInfo;
    pipelineInfo.pInputAssemblyState = &inputAssembly;
    pipelineInfo.pViewportState = &viewportState;
    pipelineInfo.pRasterizationState = &rasterizer;
    pipelineInfo.pMultisampleState = &multisampling;
    pipelineInfo.pDepthStencilState = &depthStencil;
    pipelineInfo.pColorBlendState = &colorBlending;
    pipelineInfo.pDynamicState = &dynamicState;
    pipelineInfo.layout = layout_->handle();
    pipelineInfo.renderPass = renderPass_->handle();
    pipelineInfo.subpass = 0;

    VkPipeline vkPipeline;
    VkResult result = vkCreateGraphicsPipelines(device_->handle(), VK_NULL_HANDLE, 1,
                                                &pipelineInfo, nullptr, &vkPipeline);
    if (result != VK_SUCCESS) {
        FINE2D_ERROR(LogCategory::Shader, "vkCreateGraphicsPipelines failed");
        throw RenderError("Failed to create graphics pipeline", result);
    }

    auto pipeline = GraphicsPipelinePtr(new GraphicsPipeline());
    pipeline->device_ = device_;
    pipeline->pipeline_ = vkPipeline;
    return pipeline;
}

// ============================================================================
// GraphicsPipeline implementation
// ============================================================================

GraphicsPipeline::Builder GraphicsPipeline::create(LogicalDevice* device, RenderPass* renderPass,
                                                   PipelineLayout* layout) {
    return Builder(device, renderPass, layout);
}

GraphicsPipeline::~GraphicsPipeline() {
    if (pipeline_ != VK_NULL_HANDLE) {
        vkDestroyPipeline(device_->handle(), pipeline_, nullptr);
    }
}

} // namespace fine2d
