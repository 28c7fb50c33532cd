#pragma once

#include "fine2d/core/types.hpp"

#include <vulkan/vulkan.h>
#include <cstdint>
#include <vector>
#include <memory>

namespace fine2d {

class LogicalDevice;
class Surface;

/**
 * @brief Result of swap chain image acquisition
 */
struct AcquireResult {
    uint32_t imageIndex = 0;
    bool outOfDate = false;
    bool suboptimal = false;
};

/**
 * @brief Vulkan swap chain wrapper
 *
 * Images are exposed as non-owning DeviceImages so the screen can be read
 * back like any other render target.
 */
class SwapChain {
public:
    /**
     * @brief Builder for creating SwapChain objects
     */
    class Builder {
    public:
        Builder(LogicalDevice* device, Surface* surface);

        /// Framebuffer size used when the surface does not dictate one
        Builder& extent(uint32_t width, uint32_t height);

        /// FIFO when enabled, otherwise MAILBOX or IMMEDIATE when available
        Builder& vsync(bool enabled);

        /// Prefer an sRGB surface format (default: true)
        Builder& srgb(bool enabled);

        /// Preferred minimum image count
        Builder& imageCount(uint32_t count);

        SwapChainPtr build();

    private:
        LogicalDevice* device_;
        Surface* surface_;
        VkExtent2D extent_ = {800, 600};
        bool vsync_ = true;
        bool srgb_ = true;
        uint32_t imageCount_ = 3;
    };

    static Builder create(LogicalDevice* device, Surface* surface);

    VkSwapchainKHR handle() const { return swapChain_; }
    VkSurfaceFormatKHR format() const { return format_; }
    VkExtent2D extent() const { return extent_; }
    bool vsync() const { return vsync_; }

    uint32_t imageCount() const { return static_cast<uint32_t>(images_.size()); }
    DeviceImage& image(uint32_t index) { return *images_[index]; }

    /// Acquire the next image; OUT_OF_DATE and SUBOPTIMAL are reported, other failures throw
    AcquireResult acquireNextImage(VkSemaphore signalSemaphore, uint64_t timeout = UINT64_MAX);

    /**
     * @brief Recreate after a resize or present mode change
     *
     * The caller must have waited for the device to go idle. Views of the old
     * images are invalid afterwards.
     */
    void recreate(uint32_t width, uint32_t height, bool vsync);

    ~SwapChain();

    SwapChain(const SwapChain&) = delete;
    SwapChain& operator=(const SwapChain&) = delete;

private:
    friend class Builder;
    SwapChain() = default;

    void createSwapChain(VkExtent2D requested, VkSwapchainKHR oldSwapChain);

    LogicalDevice* device_ = nullptr;
    Surface* surface_ = nullptr;
    VkSwapchainKHR swapChain_ = VK_NULL_HANDLE;
    VkSurfaceFormatKHR format_{};
    VkExtent2D extent_{};
    bool vsync_ = true;
    bool srgb_ = true;
    uint32_t preferredImageCount_ = 3;

    std::vector<DeviceImagePtr> images_;
};

} // namespace fine2d
