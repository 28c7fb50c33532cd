#include "fine2d/rendering/renderpass.hpp"
#include "fine2d/device/logical_device.hpp"
#include "fine2d/core/logging.hpp"
#include "fine2d/core/error.hpp"

namespace fine2d {

// ============================================================================
// RenderPass::Builder implementation
// ============================================================================

RenderPass::Builder::Builder(LogicalDevice* device)
    : device_(device) {
}

RenderPass::Builder& RenderPass::Builder::addColorAttachment(
    VkFormat format,
    VkSampleCountFlagBits samples,
    VkAttachmentLoadOp loadOp,
    VkAttachmentStoreOp storeOp,
    VkImageLayout initialLayout,
    VkImageLayout finalLayout) {

    VkAttachmentDescription attachment{};
    attachment.format = format;
    attachment.samples = samples;
    attachment.loadOp = loadOp;
    attachment.storeOp = storeOp;
    attachment.stencilLoadOp = VK_ATTACHMENT_LOAD_OP_DONT_CARE;
    attachment.stencilStoreOp = VK_ATTACHMENT_STORE_OP_DONT_CARE;
    attachment.initialLayout = initialLayout;
    attachment.finalLayout = finalLayout;

    attachments_.push_back(attachment);
    return *this;
}

RenderPass::Builder& RenderPass::Builder::subpassColorAttachment(uint32_t attachmentIndex) {
    colorRefs_.push_back({attachmentIndex, VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL});
    return *this;
}

RenderPass::Builder& RenderPass::Builder::subpassResolveAttachment(uint32_t attachmentIndex) {
    resolveRefs_.push_back({attachmentIndex, VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL});
    return *this;
}

RenderPass::Builder& RenderPass::Builder::addDependency(const VkSubpassDependency& dependency) {
    dependencies_.push_back(dependency);
    return *this;
}

RenderPassPtr RenderPass::Builder::build() {
    if (attachments_.empty()) {
        throw std::logic_error("Render pass must have at least one attachment");
    }

    VkSubpassDescription subpass{};
    subpass.pipelineBindPoint = VK_PIPELINE_BIND_POINT_GRAPHICS;
    subpass.colorAttachmentCount = static_cast<uint32_t>(colorRefs_.size());
    subpass.pColorAttachments = colorRefs_.empty() ? nullptr : colorRefs_.data();
    subpass.pResolveAttachments = resolveRefs_.empty() ? nullptr : resolveRefs_.data();

    VkRenderPassCreateInfo renderPassInfo{};
    renderPassInfo.sType = VK_STRUCTURE_TYPE_RENDER_PASS_CREATE_INFO;
    renderPassInfo.attachmentCount = static_cast<uint32_t>(attachments_.size());
    renderPassInfo.pAttachments = attachments_.data();
    renderPassInfo.subpassCount = 1;
    renderPassInfo.pSubpasses = &subpass;
    renderPassInfo.dependencyCount = static_cast<uint32_t>(dependencies_.size());
    renderPassInfo.pDependencies = dependencies_.empty() ? nullptr : dependencies_.data();

    VkRenderPass vkRenderPass;
    VkResult result = vkCreateRenderPass(device_->handle(), &renderPassInfo, nullptr, &vkRenderPass);
    if (result != VK_SUCCESS) {
        throw RenderError("Failed to create render pass", result);
    }

    auto renderPass = RenderPassPtr(new RenderPass());
    renderPass->device_ = device_;
    renderPass->renderPass_ = vkRenderPass;
    return renderPass;
}

// ============================================================================
// RenderPass implementation
// ============================================================================

RenderPass::Builder RenderPass::create(LogicalDevice* device) {
    return Builder(device);
}

RenderPassPtr RenderPass::createResume(
    LogicalDevice* device,
    VkFormat colorFormat,
    VkSampleCountFlagBits samples,
    VkImageLayout restingLayout) {

    auto builder = create(device);

    if (samples > VK_SAMPLE_COUNT_1_BIT) {
        builder.addColorAttachment(colorFormat, samples,
            VK_ATTACHMENT_LOAD_OP_LOAD, VK_ATTACHMENT_STORE_OP_STORE,
            VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL, VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL);
        builder.subpassColorAttachment(0);

        // Fully overwritten by the resolve
        builder.addColorAttachment(colorFormat, VK_SAMPLE_COUNT_1_BIT,
            VK_ATTACHMENT_LOAD_OP_DONT_CARE, VK_ATTACHMENT_STORE_OP_STORE,
            restingLayout, restingLayout);
        builder.subpassResolveAttachment(1);
    } else {
        builder.addColorAttachment(colorFormat, VK_SAMPLE_COUNT_1_BIT,
            VK_ATTACHMENT_LOAD_OP_LOAD, VK_ATTACHMENT_STORE_OP_STORE,
            restingLayout, restingLayout);
        builder.subpassColorAttachment(0);
    }

    // Earlier passes, uploads and samplers of this target finish before we write
    VkSubpassDependency in{};
    in.srcSubpass = VK_SUBPASS_EXTERNAL;
    in.dstSubpass = 0;
    in.srcStageMask = VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT |
                      VK_PIPELINE_STAGE_FRAGMENT_SHADER_BIT |
                      VK_PIPELINE_STAGE_TRANSFER_BIT;
    in.srcAccessMask = VK_ACCESS_COLOR_ATTACHMENT_WRITE_BIT | VK_ACCESS_TRANSFER_WRITE_BIT;
    in.dstStageMask = VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT;
    in.dstAccessMask = VK_ACCESS_COLOR_ATTACHMENT_READ_BIT | VK_ACCESS_COLOR_ATTACHMENT_WRITE_BIT;
    builder.addDependency(in);

    // Our writes are visible to later sampling, copies and passes
    VkSubpassDependency out{};
    out.srcSubpass = 0;
    out.dstSubpass = VK_SUBPASS_EXTERNAL;
    out.srcStageMask = VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT;
    out.srcAccessMask = VK_ACCESS_COLOR_ATTACHMENT_WRITE_BIT;
    out.dstStageMask = VK_PIPELINE_STAGE_FRAGMENT_SHADER_BIT |
                       VK_PIPELINE_STAGE_TRANSFER_BIT |
                       VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT;
    out.dstAccessMask = VK_ACCESS_SHADER_READ_BIT |
                        VK_ACCESS_TRANSFER_READ_BIT |
                        VK_ACCESS_COLOR_ATTACHMENT_READ_BIT |
                        VK_ACCESS_COLOR_ATTACHMENT_WRITE_BIT;
    builder.addDependency(out);

    auto renderPass = builder.build();
    FINE2D_DEBUG(LogCategory::Render, "Resume render pass created (" +
        std::to_string(static_cast<int>(samples)) + "x)");
    return renderPass;
}

RenderPass::~RenderPass() {
    if (renderPass_ != VK_NULL_HANDLE) {
        vkDestroyRenderPass(device_->handle(), renderPass_, nullptr);
    }
}

} // namespace fine2d
