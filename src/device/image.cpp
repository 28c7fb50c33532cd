#include "fine2d/device/image.hpp"
#include "fine2d/device/logical_device.hpp"
#include "fine2d/device/buffer.hpp"
#include "fine2d/device/command.hpp"
#include "fine2d/core/logging.hpp"
#include "fine2d/core/error.hpp"

#include <cstring>

namespace fine2d {

// ============================================================================
// DeviceImage::Builder implementation
// ============================================================================

DeviceImage::Builder::Builder(LogicalDevice* device)
    : device_(device) {
}

DeviceImage::Builder& DeviceImage::Builder::extent(uint32_t width, uint32_t height) {
    extent_ = {width, height};
    return *this;
}

DeviceImage::Builder& DeviceImage::Builder::format(VkFormat fmt) {
    format_ = fmt;
    return *this;
}

DeviceImage::Builder& DeviceImage::Builder::usage(VkImageUsageFlags usg) {
    usage_ = usg;
    return *this;
}

DeviceImage::Builder& DeviceImage::Builder::samples(VkSampleCountFlagBits smp) {
    samples_ = smp;
    return *this;
}

DeviceImagePtr DeviceImage::Builder::build() {
    if (extent_.width == 0 || extent_.height == 0) {
        throw std::logic_error("Image extent must be non-zero");
    }

    VkImageCreateInfo imageInfo{};
    imageInfo.sType = VK_STRUCTURE_TYPE_IMAGE_CREATE_INFO;
    imageInfo.imageType = VK_IMAGE_TYPE_2D;
    imageInfo.extent = {extent_.width, extent_.height, 1};
    imageInfo.mipLevels = 1;
    imageInfo.arrayLayers = 1;
    imageInfo.format = format_;
    imageInfo.tiling = VK_IMAGE_TILING_OPTIMAL;
    imageInfo.initialLayout = VK_IMAGE_LAYOUT_UNDEFINED;
    imageInfo.usage = usage_;
    imageInfo.sharingMode = VK_SHARING_MODE_EXCLUSIVE;
    imageInfo.samples = samples_;

    VkImage vkImage;
    VkResult result = vkCreateImage(device_->handle(), &imageInfo, nullptr, &vkImage);
    if (result != VK_SUCCESS) {
        throw RenderError("Failed to create image " + std::to_string(extent_.width) + "x" +
                          std::to_string(extent_.height), result);
    }

    VkMemoryRequirements memRequirements;
    vkGetImageMemoryRequirements(device_->handle(), vkImage, &memRequirements);

    AllocationInfo allocation;
    try {
        allocation = device_->allocator().allocate(memRequirements, MemoryUsage::GpuOnly);
    } catch (const RenderError&) {
        vkDestroyImage(device_->handle(), vkImage, nullptr);
        throw;
    }

    result = vkBindImageMemory(device_->handle(), vkImage, allocation.memory, allocation.offset);
    if (result != VK_SUCCESS) {
        device_->allocator().free(allocation);
        vkDestroyImage(device_->handle(), vkImage, nullptr);
        throw RenderError("Failed to bind image memory", result);
    }

    auto image = DeviceImagePtr(new DeviceImage());
    image->device_ = device_;
    image->image_ = vkImage;
    image->format_ = format_;
    image->extent_ = extent_;
    image->samples_ = samples_;
    image->allocation_ = allocation;
    image->ownsMemory_ = true;
    return image;
}

// ============================================================================
// DeviceImage implementation
// ============================================================================

DeviceImage::Builder DeviceImage::create(LogicalDevice* device) {
    return Builder(device);
}

DeviceImagePtr DeviceImage::createTexture2D(LogicalDevice* device, uint32_t width, uint32_t height,
                                            VkFormat format) {
    return create(device)
        .extent(width, height)
        .format(format)
        .usage(VK_IMAGE_USAGE_TRANSFER_DST_BIT | VK_IMAGE_USAGE_TRANSFER_SRC_BIT |
               VK_IMAGE_USAGE_SAMPLED_BIT)
        .build();
}

DeviceImagePtr DeviceImage::createRenderTarget(LogicalDevice* device, uint32_t width, uint32_t height,
                                               VkFormat format) {
    return create(device)
        .extent(width, height)
        .format(format)
        .usage(VK_IMAGE_USAGE_COLOR_ATTACHMENT_BIT | VK_IMAGE_USAGE_SAMPLED_BIT |
               VK_IMAGE_USAGE_TRANSFER_SRC_BIT | VK_IMAGE_USAGE_TRANSFER_DST_BIT)
        .build();
}

DeviceImagePtr DeviceImage::createMultisampleTarget(LogicalDevice* device, uint32_t width, uint32_t height,
                                                    VkFormat format, VkSampleCountFlagBits samples) {
    return create(device)
        .extent(width, height)
        .format(format)
        .usage(VK_IMAGE_USAGE_COLOR_ATTACHMENT_BIT)
        .samples(samples)
        .build();
}

DeviceImage::DeviceImage(LogicalDevice* device, VkImage image, VkFormat format, VkExtent2D extent)
    : device_(device)
    , image_(image)
    , format_(format)
    , extent_(extent)
    , ownsMemory_(false) {
}

DeviceImage::~DeviceImage() {
    // The view references the image
    defaultView_.reset();

    if (image_ != VK_NULL_HANDLE && ownsMemory_) {
        vkDestroyImage(device_->handle(), image_, nullptr);
        device_->allocator().free(allocation_);
    }
}

ImageView* DeviceImage::view() {
    if (!defaultView_) {
        VkImageViewCreateInfo viewInfo{};
        viewInfo.sType = VK_STRUCTURE_TYPE_IMAGE_VIEW_CREATE_INFO;
        viewInfo.image = image_;
        viewInfo.viewType = VK_IMAGE_VIEW_TYPE_2D;
        viewInfo.format = format_;
        viewInfo.subresourceRange.aspectMask = VK_IMAGE_ASPECT_COLOR_BIT;
        viewInfo.subresourceRange.baseMipLevel = 0;
        viewInfo.subresourceRange.levelCount = 1;
        viewInfo.subresourceRange.baseArrayLayer = 0;
        viewInfo.subresourceRange.layerCount = 1;

        VkImageView view;
        VkResult result = vkCreateImageView(device_->handle(), &viewInfo, nullptr, &view);
        if (result != VK_SUCCESS) {
            throw RenderError("Failed to create image view", result);
        }
        defaultView_ = ImageViewPtr(new ImageView(device_, this, view));
    }
    return defaultView_.get();
}

void DeviceImage::upload(const void* pixels, VkDeviceSize size, CommandPool* commandPool,
                         VkImageLayout finalLayout) {
    VkDeviceSize expected = static_cast<VkDeviceSize>(extent_.width) * extent_.height * 4;
    if (size != expected) {
        throw std::logic_error("DeviceImage::upload size does not match the extent");
    }

    auto staging = Buffer::createStagingBuffer(device_, size);
    staging->write(pixels, size);

    auto imm = commandPool->beginImmediate();
    imm.cmd().transitionImageLayout(image_, VK_IMAGE_LAYOUT_UNDEFINED,
                                    VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL);
    imm.cmd().copyBufferToImage(*staging, image_, extent_);
    imm.cmd().transitionImageLayout(image_, VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL, finalLayout);
    imm.submit();
}

void DeviceImage::transition(CommandPool* commandPool, VkImageLayout from, VkImageLayout to) {
    auto imm = commandPool->beginImmediate();
    imm.cmd().transitionImageLayout(image_, from, to);
    imm.submit();
}

std::vector<uint8_t> DeviceImage::readback(CommandPool* commandPool, VkImageLayout currentLayout) {
    if (samples_ != VK_SAMPLE_COUNT_1_BIT) {
        throw std::logic_error("Cannot read back a multisampled image");
    }

    VkDeviceSize size = static_cast<VkDeviceSize>(extent_.width) * extent_.height * 4;
    auto readbackBuffer = Buffer::createReadbackBuffer(device_, size);

    auto imm = commandPool->beginImmediate();
    imm.cmd().transitionImageLayout(image_, currentLayout, VK_IMAGE_LAYOUT_TRANSFER_SRC_OPTIMAL);
    imm.cmd().copyImageToBuffer(image_, extent_, *readbackBuffer);
    imm.cmd().transitionImageLayout(image_, VK_IMAGE_LAYOUT_TRANSFER_SRC_OPTIMAL, currentLayout);
    imm.submit();

    std::vector<uint8_t> pixels(static_cast<size_t>(size));
    std::memcpy(pixels.data(), readbackBuffer->mappedPtr(), pixels.size());
    return pixels;
}

// ============================================================================
// ImageView implementation
// ============================================================================

ImageView::ImageView(LogicalDevice* device, DeviceImage* image, VkImageView view)
    : device_(device), image_(image), view_(view) {
}

ImageView::~ImageView() {
    if (view_ != VK_NULL_HANDLE) {
        vkDestroyImageView(device_->handle(), view_, nullptr);
    }
}

} // namespace fine2d
