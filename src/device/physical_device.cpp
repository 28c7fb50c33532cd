#include "fine2d/device/physical_device.hpp"
#include "fine2d/device/logical_device.hpp"
#include "fine2d/core/instance.hpp"
#include "fine2d/core/surface.hpp"
#include "fine2d/core/logging.hpp"
#include "fine2d/core/error.hpp"

#include <cstring>

namespace fine2d {

// ============================================================================
// DeviceCapabilities implementation
// ============================================================================

std::optional<uint32_t> DeviceCapabilities::graphicsQueueFamily() const {
    for (uint32_t i = 0; i < queueFamilies.size(); i++) {
        if (queueFamilies[i].queueFlags & VK_QUEUE_GRAPHICS_BIT) {
            return i;
        }
    }
    return std::nullopt;
}

std::optional<uint32_t> DeviceCapabilities::presentQueueFamily(
    VkPhysicalDevice device, VkSurfaceKHR surface) const {
    // Prefer the graphics family so a single queue serves both
    auto graphics = graphicsQueueFamily();
    if (graphics) {
        VkBool32 supported = VK_FALSE;
        vkGetPhysicalDeviceSurfaceSupportKHR(device, *graphics, surface, &supported);
        if (supported) {
            return graphics;
        }
    }

    for (uint32_t i = 0; i < queueFamilies.size(); i++) {
        VkBool32 supported = VK_FALSE;
        vkGetPhysicalDeviceSurfaceSupportKHR(device, i, surface, &supported);
        if (supported) {
            return i;
        }
    }
    return std::nullopt;
}

bool DeviceCapabilities::supportsExtension(const char* extensionName) const {
    for (const auto& ext : extensions) {
        if (std::strcmp(ext.extensionName, extensionName) == 0) {
            return true;
        }
    }
    return false;
}

VkSampleCountFlagBits DeviceCapabilities::maxColorSamples() const {
    VkSampleCountFlags counts = properties.limits.framebufferColorSampleCounts;
    for (VkSampleCountFlagBits bit : {VK_SAMPLE_COUNT_64_BIT, VK_SAMPLE_COUNT_32_BIT,
                                      VK_SAMPLE_COUNT_16_BIT, VK_SAMPLE_COUNT_8_BIT,
                                      VK_SAMPLE_COUNT_4_BIT, VK_SAMPLE_COUNT_2_BIT}) {
        if (counts & bit) {
            return bit;
        }
    }
    return VK_SAMPLE_COUNT_1_BIT;
}

VkSampleCountFlagBits DeviceCapabilities::clampSamples(VkSampleCountFlagBits requested) const {
    VkSampleCountFlags counts = properties.limits.framebufferColorSampleCounts;
    uint32_t bit = static_cast<uint32_t>(requested);
    while (bit > 1 && !(counts & bit)) {
        bit >>= 1;
    }
    return static_cast<VkSampleCountFlagBits>(bit);
}

VkFormatFeatureFlags DeviceCapabilities::formatFeatures(VkPhysicalDevice device, VkFormat format) const {
    auto it = formatCache_.find(format);
    if (it != formatCache_.end()) {
        return it->second;
    }

    VkFormatProperties props;
    vkGetPhysicalDeviceFormatProperties(device, format, &props);
    formatCache_[format] = props.optimalTilingFeatures;
    return props.optimalTilingFeatures;
}

int DeviceCapabilities::score() const {
    int score = 0;
    if (properties.deviceType == VK_PHYSICAL_DEVICE_TYPE_DISCRETE_GPU) {
        score += 10000;
    } else if (properties.deviceType == VK_PHYSICAL_DEVICE_TYPE_INTEGRATED_GPU) {
        score += 1000;
    }
    score += static_cast<int>(properties.limits.maxImageDimension2D / 1024);
    return score;
}

// ============================================================================
// PhysicalDevice implementation
// ============================================================================

PhysicalDevice::PhysicalDevice(VkPhysicalDevice device)
    : device_(device) {
    vkGetPhysicalDeviceProperties(device_, &capabilities_.properties);
    vkGetPhysicalDeviceFeatures(device_, &capabilities_.features);
    vkGetPhysicalDeviceMemoryProperties(device_, &capabilities_.memory);

    uint32_t familyCount = 0;
    vkGetPhysicalDeviceQueueFamilyProperties(device_, &familyCount, nullptr);
    capabilities_.queueFamilies.resize(familyCount);
    vkGetPhysicalDeviceQueueFamilyProperties(device_, &familyCount, capabilities_.queueFamilies.data());

    uint32_t extensionCount = 0;
    vkEnumerateDeviceExtensionProperties(device_, nullptr, &extensionCount, nullptr);
    capabilities_.extensions.resize(extensionCount);
    vkEnumerateDeviceExtensionProperties(device_, nullptr, &extensionCount, capabilities_.extensions.data());
}

std::vector<PhysicalDevice> PhysicalDevice::enumerate(Instance& instance) {
    uint32_t deviceCount = 0;
    vkEnumeratePhysicalDevices(instance.handle(), &deviceCount, nullptr);
    if (deviceCount == 0) {
        throw RenderError("No Vulkan-capable GPUs found");
    }

    std::vector<VkPhysicalDevice> handles(deviceCount);
    vkEnumeratePhysicalDevices(instance.handle(), &deviceCount, handles.data());

    std::vector<PhysicalDevice> devices;
    devices.reserve(deviceCount);
    for (VkPhysicalDevice handle : handles) {
        devices.push_back(PhysicalDevice(handle));
    }

    FINE2D_DEBUG(LogCategory::Core, "Found " + std::to_string(deviceCount) + " physical device(s)");
    return devices;
}

PhysicalDevice PhysicalDevice::selectBest(Instance& instance, Surface& surface) {
    auto devices = enumerate(instance);

    const PhysicalDevice* best = nullptr;
    int bestScore = -1;

    for (const auto& device : devices) {
        const auto& caps = device.capabilities();
        if (!caps.graphicsQueueFamily() ||
            !caps.supportsExtension(VK_KHR_SWAPCHAIN_EXTENSION_NAME) ||
            !caps.presentQueueFamily(device.handle(), surface.handle())) {
            continue;
        }
        if (!device.querySwapChainSupport(surface.handle()).isAdequate()) {
            continue;
        }

        int score = caps.score();
        if (score > bestScore) {
            bestScore = score;
            best = &device;
        }
    }

    if (!best) {
        throw RenderError("No suitable GPU found");
    }

    FINE2D_INFO(LogCategory::Core, std::string("Selected GPU: ") + best->name());
    return *best;
}

SwapChainSupport PhysicalDevice::querySwapChainSupport(VkSurfaceKHR surface) const {
    SwapChainSupport support;
    vkGetPhysicalDeviceSurfaceCapabilitiesKHR(device_, surface, &support.capabilities);

    uint32_t formatCount = 0;
    vkGetPhysicalDeviceSurfaceFormatsKHR(device_, surface, &formatCount, nullptr);
    support.formats.resize(formatCount);
    if (formatCount > 0) {
        vkGetPhysicalDeviceSurfaceFormatsKHR(device_, surface, &formatCount, support.formats.data());
    }

    uint32_t modeCount = 0;
    vkGetPhysicalDeviceSurfacePresentModesKHR(device_, surface, &modeCount, nullptr);
    support.presentModes.resize(modeCount);
    if (modeCount > 0) {
        vkGetPhysicalDeviceSurfacePresentModesKHR(device_, surface, &modeCount, support.presentModes.data());
    }

    return support;
}

LogicalDeviceBuilder PhysicalDevice::createLogicalDevice() {
    return LogicalDeviceBuilder(this);
}

// ============================================================================
// LogicalDeviceBuilder implementation
// ============================================================================

LogicalDeviceBuilder::LogicalDeviceBuilder(PhysicalDevice* physical)
    : physical_(physical) {
    extensions_.push_back(VK_KHR_SWAPCHAIN_EXTENSION_NAME);

#ifdef VK_USE_PLATFORM_MACOS_MVK
    if (physical_->capabilities().supportsExtension("VK_KHR_portability_subset")) {
        extensions_.push_back("VK_KHR_portability_subset");
    }
#endif
}

LogicalDeviceBuilder& LogicalDeviceBuilder::addExtension(const char* extension) {
    extensions_.push_back(extension);
    return *this;
}

LogicalDeviceBuilder& LogicalDeviceBuilder::surface(Surface* surface) {
    surface_ = surface;
    return *this;
}

} // namespace fine2d
