#pragma once

#include "fine2d/core/types.hpp"

#include <vulkan/vulkan.h>
#include <vector>
#include <memory>

namespace fine2d {

class LogicalDevice;

/**
 * @brief Vulkan render pass wrapper
 */
class RenderPass {
public:
    /**
     * @brief Builder for creating RenderPass objects
     */
    class Builder {
    public:
        explicit Builder(LogicalDevice* device);

        /// Add a color attachment
        Builder& addColorAttachment(
            VkFormat format,
            VkSampleCountFlagBits samples,
            VkAttachmentLoadOp loadOp,
            VkAttachmentStoreOp storeOp,
            VkImageLayout initialLayout,
            VkImageLayout finalLayout);

        /// Reference a color attachment in the subpass
        Builder& subpassColorAttachment(uint32_t attachmentIndex);

        /// Reference a resolve attachment in the subpass (for MSAA)
        Builder& subpassResolveAttachment(uint32_t attachmentIndex);

        Builder& addDependency(const VkSubpassDependency& dependency);

        RenderPassPtr build();

    private:
        LogicalDevice* device_;
        std::vector<VkAttachmentDescription> attachments_;
        std::vector<VkAttachmentReference> colorRefs_;
        std::vector<VkAttachmentReference> resolveRefs_;
        std::vector<VkSubpassDependency> dependencies_;
    };

    static Builder create(LogicalDevice* device);

    /**
     * @brief Render pass that resumes drawing on a target with existing content
     *
     * Color is loaded and stored. The single-sample image (the resolve target
     * when samples > 1) starts and ends the pass in restingLayout, so a pass
     * can be ended and begun again any number of times per frame. The
     * multisample image rests in COLOR_ATTACHMENT_OPTIMAL.
     */
    static RenderPassPtr createResume(
        LogicalDevice* device,
        VkFormat colorFormat,
        VkSampleCountFlagBits samples,
        VkImageLayout restingLayout);

    VkRenderPass handle() const { return renderPass_; }

    ~RenderPass();

    RenderPass(const RenderPass&) = delete;
    RenderPass& operator=(const RenderPass&) = delete;

private:
    friend class Builder;
    RenderPass() = default;

    LogicalDevice* device_ = nullptr;
    VkRenderPass renderPass_ = VK_NULL_HANDLE;
};

} // namespace fine2d
