#pragma once

#include "fine2d/device/memory.hpp"
#include "fine2d/core/types.hpp"

#include <vulkan/vulkan.h>
#include <cstdint>
#include <memory>
#include <vector>

namespace fine2d {

class LogicalDevice;
class CommandPool;
class ImageView;

/**
 * @brief Vulkan 2D color image wrapper with memory management
 *
 * Layouts are not tracked here; callers state the layout an image is in
 * when they transition, upload or read it back.
 */
class DeviceImage {
public:
    /**
     * @brief Builder for creating DeviceImage objects
     */
    class Builder {
    public:
        explicit Builder(LogicalDevice* device);

        Builder& extent(uint32_t width, uint32_t height);
        Builder& format(VkFormat format);
        Builder& usage(VkImageUsageFlags usage);

        /// Set sample count for multisampling
        Builder& samples(VkSampleCountFlagBits samples);

        DeviceImagePtr build();

    private:
        LogicalDevice* device_;
        VkExtent2D extent_ = {0, 0};
        VkFormat format_ = VK_FORMAT_R8G8B8A8_SRGB;
        VkImageUsageFlags usage_ = VK_IMAGE_USAGE_SAMPLED_BIT;
        VkSampleCountFlagBits samples_ = VK_SAMPLE_COUNT_1_BIT;
    };

    static Builder create(LogicalDevice* device);

    /// Sampled image filled from pixel data and readable back
    static DeviceImagePtr createTexture2D(LogicalDevice* device, uint32_t width, uint32_t height,
                                          VkFormat format);

    /// Single-sample image that is rendered into, sampled, and copied from
    static DeviceImagePtr createRenderTarget(LogicalDevice* device, uint32_t width, uint32_t height,
                                             VkFormat format);

    /// Multisample color attachment resolved into a render target; keeps its contents between passes
    static DeviceImagePtr createMultisampleTarget(LogicalDevice* device, uint32_t width, uint32_t height,
                                                  VkFormat format, VkSampleCountFlagBits samples);

    VkImage handle() const { return image_; }
    LogicalDevice* device() const { return device_; }
    VkFormat format() const { return format_; }
    VkExtent2D extent() const { return extent_; }
    uint32_t width() const { return extent_.width; }
    uint32_t height() const { return extent_.height; }
    VkSampleCountFlagBits samples() const { return samples_; }

    /// Whole-image color view, created on first access and owned by the image
    ImageView* view();

    /**
     * @brief Fill the image with tightly packed 4-byte pixels
     *
     * The image is taken from UNDEFINED through TRANSFER_DST to finalLayout
     * in one immediate submission.
     */
    void upload(const void* pixels, VkDeviceSize size, CommandPool* commandPool,
                VkImageLayout finalLayout);

    /// One-shot layout transition
    void transition(CommandPool* commandPool, VkImageLayout from, VkImageLayout to);

    /**
     * @brief Copy the pixels back to the host, 4 bytes per pixel, rows top to bottom
     *
     * The image must be single-sampled. It is returned to currentLayout.
     */
    std::vector<uint8_t> readback(CommandPool* commandPool, VkImageLayout currentLayout);

    ~DeviceImage();

    DeviceImage(const DeviceImage&) = delete;
    DeviceImage& operator=(const DeviceImage&) = delete;

private:
    friend class Builder;
    friend class SwapChain;
    DeviceImage() = default;

    // Swap chain images: memory is owned by the swap chain
    DeviceImage(LogicalDevice* device, VkImage image, VkFormat format, VkExtent2D extent);

    LogicalDevice* device_ = nullptr;
    VkImage image_ = VK_NULL_HANDLE;
    VkFormat format_ = VK_FORMAT_UNDEFINED;
    VkExtent2D extent_ = {0, 0};
    VkSampleCountFlagBits samples_ = VK_SAMPLE_COUNT_1_BIT;
    AllocationInfo allocation_;
    bool ownsMemory_ = true;
    ImageViewPtr defaultView_;
};

/**
 * @brief Vulkan image view wrapper
 */
class ImageView {
public:
    VkImageView handle() const { return view_; }
    DeviceImage* image() const { return image_; }

    ~ImageView();

    ImageView(const ImageView&) = delete;
    ImageView& operator=(const ImageView&) = delete;

private:
    friend class DeviceImage;
    ImageView(LogicalDevice* device, DeviceImage* image, VkImageView view);

    LogicalDevice* device_ = nullptr;
    DeviceImage* image_ = nullptr;
    VkImageView view_ = VK_NULL_HANDLE;
};

} // namespace fine2d
