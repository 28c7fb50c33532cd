#include "fine2d/rendering/framebuffer.hpp"
#include "fine2d/rendering/renderpass.hpp"
#include "fine2d/rendering/swapchain.hpp"
#include "fine2d/device/logical_device.hpp"
#include "fine2d/device/image.hpp"
#include "fine2d/core/error.hpp"

namespace fine2d {

// ============================================================================
// Framebuffer::Builder implementation
// ============================================================================

Framebuffer::Builder::Builder(LogicalDevice* device, RenderPass* renderPass)
    : device_(device), renderPass_(renderPass) {
}

Framebuffer::Builder& Framebuffer::Builder::attachment(ImageView* view) {
    attachments_.push_back(view->handle());
    return *this;
}

Framebuffer::Builder& Framebuffer::Builder::extent(uint32_t width, uint32_t height) {
    width_ = width;
    height_ = height;
    return *this;
}

FramebufferPtr Framebuffer::Builder::build() {
    if (attachments_.empty()) {
        throw std::logic_error("Framebuffer must have at least one attachment");
    }
    if (width_ == 0 || height_ == 0) {
        throw std::logic_error("Framebuffer extent must be non-zero");
    }

    VkFramebufferCreateInfo framebufferInfo{};
    framebufferInfo.sType = VK_STRUCTURE_TYPE_FRAMEBUFFER_CREATE_INFO;
    framebufferInfo.renderPass = renderPass_->handle();
    framebufferInfo.attachmentCount = static_cast<uint32_t>(attachments_.size());
    framebufferInfo.pAttachments = attachments_.data();
    framebufferInfo.width = width_;
    framebufferInfo.height = height_;
    framebufferInfo.layers = 1;

    VkFramebuffer vkFramebuffer;
    VkResult result = vkCreateFramebuffer(device_->handle(), &framebufferInfo, nullptr, &vkFramebuffer);
    if (result != VK_SUCCESS) {
        throw RenderError("Failed to create framebuffer", result);
    }

    auto framebuffer = FramebufferPtr(new Framebuffer());
    framebuffer->device_ = device_;
    framebuffer->framebuffer_ = vkFramebuffer;
    framebuffer->extent_ = {width_, height_};
    return framebuffer;
}

// ============================================================================
// Framebuffer implementation
// ============================================================================

Framebuffer::Builder Framebuffer::create(LogicalDevice* device, RenderPass* renderPass) {
    return Builder(device, renderPass);
}

std::vector<FramebufferPtr> Framebuffer::forSwapChain(
    LogicalDevice* device, RenderPass* renderPass, SwapChain& swapChain, ImageView* msaaView) {

    std::vector<FramebufferPtr> framebuffers;
    framebuffers.reserve(swapChain.imageCount());

    VkExtent2D extent = swapChain.extent();
    for (uint32_t i = 0; i < swapChain.imageCount(); i++) {
        auto builder = create(device, renderPass);
        if (msaaView) {
            builder.attachment(msaaView);
        }
        builder.attachment(swapChain.image(i).view());
        framebuffers.push_back(builder.extent(extent.width, extent.height).build());
    }
    return framebuffers;
}

Framebuffer::~Framebuffer() {
    if (framebuffer_ != VK_NULL_HANDLE) {
        vkDestroyFramebuffer(device_->handle(), framebuffer_, nullptr);
    }
}

} // namespace fine2d
