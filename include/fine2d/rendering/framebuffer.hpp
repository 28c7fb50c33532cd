#pragma once

#include "fine2d/core/types.hpp"

#include <vulkan/vulkan.h>
#include <vector>
#include <memory>

namespace fine2d {

class LogicalDevice;
class RenderPass;
class SwapChain;
class ImageView;

/**
 * @brief Vulkan framebuffer wrapper
 *
 * Attachment order follows RenderPass::createResume:
 * - single sample: [color]
 * - multisample:   [color MSAA, resolve]
 */
class Framebuffer {
public:
    /**
     * @brief Builder for creating Framebuffer objects
     */
    class Builder {
    public:
        Builder(LogicalDevice* device, RenderPass* renderPass);

        Builder& attachment(ImageView* view);
        Builder& extent(uint32_t width, uint32_t height);

        FramebufferPtr build();

    private:
        LogicalDevice* device_;
        RenderPass* renderPass_;
        std::vector<VkImageView> attachments_;
        uint32_t width_ = 0;
        uint32_t height_ = 0;
    };

    static Builder create(LogicalDevice* device, RenderPass* renderPass);

    /// One framebuffer per swap chain image; msaaView is null for single-sample rendering
    static std::vector<FramebufferPtr> forSwapChain(
        LogicalDevice* device, RenderPass* renderPass, SwapChain& swapChain, ImageView* msaaView);

    VkFramebuffer handle() const { return framebuffer_; }
    VkExtent2D extent() const { return extent_; }

    ~Framebuffer();

    Framebuffer(const Framebuffer&) = delete;
    Framebuffer& operator=(const Framebuffer&) = delete;

private:
    friend class Builder;
    Framebuffer() = default;

    LogicalDevice* device_ = nullptr;
    VkFramebuffer framebuffer_ = VK_NULL_HANDLE;
    VkExtent2D extent_{};
};

} // namespace fine2d
