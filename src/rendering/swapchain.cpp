#include "fine2d/rendering/swapchain.hpp"
#include "fine2d/device/logical_device.hpp"
#include "fine2d/device/physical_device.hpp"
#include "fine2d/device/image.hpp"
#include "fine2d/core/surface.hpp"
#include "fine2d/core/logging.hpp"
#include "fine2d/core/error.hpp"

#include <algorithm>

namespace fine2d {

namespace {

VkSurfaceFormatKHR chooseSurfaceFormat(const std::vector<VkSurfaceFormatKHR>& formats, bool srgb) {
    const VkFormat wanted[] = {
        srgb ? VK_FORMAT_B8G8R8A8_SRGB : VK_FORMAT_B8G8R8A8_UNORM,
        srgb ? VK_FORMAT_R8G8B8A8_SRGB : VK_FORMAT_R8G8B8A8_UNORM,
    };
    for (VkFormat format : wanted) {
        for (const auto& available : formats) {
            if (available.format == format &&
                available.colorSpace == VK_COLOR_SPACE_SRGB_NONLINEAR_KHR) {
                return available;
            }
        }
    }
    return formats[0];
}

VkPresentModeKHR choosePresentMode(const std::vector<VkPresentModeKHR>& modes, bool vsync) {
    if (!vsync) {
        for (VkPresentModeKHR wanted : {VK_PRESENT_MODE_MAILBOX_KHR, VK_PRESENT_MODE_IMMEDIATE_KHR}) {
            if (std::find(modes.begin(), modes.end(), wanted) != modes.end()) {
                return wanted;
            }
        }
    }
    return VK_PRESENT_MODE_FIFO_KHR;  // Always available
}

} // namespace

// ============================================================================
// SwapChain::Builder implementation
// ============================================================================

SwapChain::Builder::Builder(LogicalDevice* device, Surface* surface)
    : device_(device), surface_(surface) {
}

SwapChain::Builder& SwapChain::Builder::extent(uint32_t width, uint32_t height) {
    extent_ = {width, height};
    return *this;
}

SwapChain::Builder& SwapChain::Builder::vsync(bool enabled) {
    vsync_ = enabled;
    return *this;
}

SwapChain::Builder& SwapChain::Builder::srgb(bool enabled) {
    srgb_ = enabled;
    return *this;
}

SwapChain::Builder& SwapChain::Builder::imageCount(uint32_t count) {
    imageCount_ = count;
    return *this;
}

SwapChainPtr SwapChain::Builder::build() {
    auto swapChain = SwapChainPtr(new SwapChain());
    swapChain->device_ = device_;
    swapChain->surface_ = surface_;
    swapChain->vsync_ = vsync_;
    swapChain->srgb_ = srgb_;
    swapChain->preferredImageCount_ = imageCount_;
    swapChain->createSwapChain(extent_, VK_NULL_HANDLE);
    return swapChain;
}

// ============================================================================
// SwapChain implementation
// ============================================================================

SwapChain::Builder SwapChain::create(LogicalDevice* device, Surface* surface) {
    return Builder(device, surface);
}

SwapChain::~SwapChain() {
    images_.clear();
    if (swapChain_ != VK_NULL_HANDLE) {
        vkDestroySwapchainKHR(device_->handle(), swapChain_, nullptr);
        FINE2D_DEBUG(LogCategory::Core, "Swap chain destroyed");
    }
}

void SwapChain::createSwapChain(VkExtent2D requested, VkSwapchainKHR oldSwapChain) {
    SwapChainSupport support = device_->physicalDevice()->querySwapChainSupport(surface_->handle());
    if (!support.isAdequate()) {
        throw RenderError("Swap chain support is not adequate");
    }
    const auto& caps = support.capabilities;

    VkSurfaceFormatKHR surfaceFormat = chooseSurfaceFormat(support.formats, srgb_);
    VkPresentModeKHR presentMode = choosePresentMode(support.presentModes, vsync_);

    VkExtent2D extent;
    if (caps.currentExtent.width != UINT32_MAX) {
        extent = caps.currentExtent;
    } else {
        extent.width = std::clamp(requested.width, caps.minImageExtent.width, caps.maxImageExtent.width);
        extent.height = std::clamp(requested.height, caps.minImageExtent.height, caps.maxImageExtent.height);
    }

    uint32_t imageCount = std::max(preferredImageCount_, caps.minImageCount);
    if (caps.maxImageCount > 0) {
        imageCount = std::min(imageCount, caps.maxImageCount);
    }

    // Screenshots copy out of the presented image
    VkImageUsageFlags usage = VK_IMAGE_USAGE_COLOR_ATTACHMENT_BIT;
    if (caps.supportedUsageFlags & VK_IMAGE_USAGE_TRANSFER_SRC_BIT) {
        usage |= VK_IMAGE_USAGE_TRANSFER_SRC_BIT;
    } else {
        FINE2D_WARN(LogCategory::Vulkan, "Swap chain images cannot be copied; screenshots will fail");
    }

    VkSwapchainCreateInfoKHR createInfo{};
    createInfo.sType = VK_STRUCTURE_TYPE_SWAPCHAIN_CREATE_INFO_KHR;
    createInfo.surface = surface_->handle();
    createInfo.minImageCount = imageCount;
    createInfo.imageFormat = surfaceFormat.format;
    createInfo.imageColorSpace = surfaceFormat.colorSpace;
    createInfo.imageExtent = extent;
    createInfo.imageArrayLayers = 1;
    createInfo.imageUsage = usage;

    Queue* graphicsQueue = device_->graphicsQueue();
    Queue* presentQueue = device_->presentQueue();
    uint32_t queueFamilyIndices[] = {
        graphicsQueue->familyIndex(),
        presentQueue->familyIndex()
    };

    if (graphicsQueue->familyIndex() != presentQueue->familyIndex()) {
        createInfo.imageSharingMode = VK_SHARING_MODE_CONCURRENT;
        createInfo.queueFamilyIndexCount = 2;
        createInfo.pQueueFamilyIndices = queueFamilyIndices;
    } else {
        createInfo.imageSharingMode = VK_SHARING_MODE_EXCLUSIVE;
    }

    createInfo.preTransform = caps.currentTransform;
    createInfo.compositeAlpha = VK_COMPOSITE_ALPHA_OPAQUE_BIT_KHR;
    createInfo.presentMode = presentMode;
    createInfo.clipped = VK_TRUE;
    createInfo.oldSwapchain = oldSwapChain;

    VkSwapchainKHR vkSwapChain;
    VkResult result = vkCreateSwapchainKHR(device_->handle(), &createInfo, nullptr, &vkSwapChain);
    if (result != VK_SUCCESS) {
        throw RenderError("Failed to create swap chain", result);
    }

    swapChain_ = vkSwapChain;
    format_ = surfaceFormat;
    extent_ = extent;

    uint32_t actualImageCount = 0;
    vkGetSwapchainImagesKHR(device_->handle(), swapChain_, &actualImageCount, nullptr);
    std::vector<VkImage> handles(actualImageCount);
    vkGetSwapchainImagesKHR(device_->handle(), swapChain_, &actualImageCount, handles.data());

    images_.clear();
    for (VkImage handle : handles) {
        images_.push_back(DeviceImagePtr(new DeviceImage(device_, handle, format_.format, extent_)));
    }

    FINE2D_INFO(LogCategory::Render, "Swap chain created: " +
        std::to_string(extent.width) + "x" + std::to_string(extent.height) +
        ", " + std::to_string(actualImageCount) + " images" +
        (presentMode == VK_PRESENT_MODE_FIFO_KHR ? ", vsync" : ""));
}

AcquireResult SwapChain::acquireNextImage(VkSemaphore signalSemaphore, uint64_t timeout) {
    AcquireResult result;

    VkResult vkResult = vkAcquireNextImageKHR(
        device_->handle(), swapChain_, timeout,
        signalSemaphore, VK_NULL_HANDLE, &result.imageIndex);

    if (vkResult == VK_ERROR_OUT_OF_DATE_KHR) {
        result.outOfDate = true;
    } else if (vkResult == VK_SUBOPTIMAL_KHR) {
        result.suboptimal = true;
    } else if (vkResult != VK_SUCCESS) {
        throw RenderError("Failed to acquire swap chain image", vkResult);
    }

    return result;
}

void SwapChain::recreate(uint32_t width, uint32_t height, bool vsync) {
    VkSwapchainKHR oldSwapChain = swapChain_;
    vsync_ = vsync;

    images_.clear();
    createSwapChain({width, height}, oldSwapChain);
    vkDestroySwapchainKHR(device_->handle(), oldSwapChain, nullptr);
}

} // namespace fine2d
