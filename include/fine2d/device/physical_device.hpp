#pragma once

#include "fine2d/core/types.hpp"

#include <vulkan/vulkan.h>
#include <vector>
#include <optional>
#include <unordered_map>

namespace fine2d {

/**
 * @brief Cached device capabilities for quick queries
 */
struct DeviceCapabilities {
    VkPhysicalDeviceProperties properties{};
    VkPhysicalDeviceFeatures features{};
    VkPhysicalDeviceMemoryProperties memory{};
    std::vector<VkQueueFamilyProperties> queueFamilies;
    std::vector<VkExtensionProperties> extensions;

    std::optional<uint32_t> graphicsQueueFamily() const;
    std::optional<uint32_t> presentQueueFamily(VkPhysicalDevice device, VkSurfaceKHR surface) const;

    bool supportsExtension(const char* extensionName) const;

    /// Highest color attachment sample count
    VkSampleCountFlagBits maxColorSamples() const;

    /// Largest supported sample count that does not exceed the request
    VkSampleCountFlagBits clampSamples(VkSampleCountFlagBits requested) const;

    /// Optimal-tiling features of a format (cached per format)
    VkFormatFeatureFlags formatFeatures(VkPhysicalDevice device, VkFormat format) const;

    /// Preference score; discrete GPUs first, then integrated, then by 2D texture limit
    int score() const;

private:
    mutable std::unordered_map<VkFormat, VkFormatFeatureFlags> formatCache_;
};

/**
 * @brief Swap chain support details
 */
struct SwapChainSupport {
    VkSurfaceCapabilitiesKHR capabilities{};
    std::vector<VkSurfaceFormatKHR> formats;
    std::vector<VkPresentModeKHR> presentModes;

    bool isAdequate() const {
        return !formats.empty() && !presentModes.empty();
    }
};

/**
 * @brief A Vulkan physical device (GPU) with cached capabilities
 */
class PhysicalDevice {
public:
    /// All physical devices of an instance
    static std::vector<PhysicalDevice> enumerate(Instance& instance);

    /**
     * @brief Select the best device able to render and present to a surface
     *
     * Devices without a graphics queue, without swap chain support, or unable
     * to present to the surface are skipped. Throws RenderError when none is left.
     */
    static PhysicalDevice selectBest(Instance& instance, Surface& surface);

    VkPhysicalDevice handle() const { return device_; }
    const DeviceCapabilities& capabilities() const { return capabilities_; }
    const char* name() const { return capabilities_.properties.deviceName; }

    SwapChainSupport querySwapChainSupport(VkSurfaceKHR surface) const;

    /// Start building a logical device on this GPU
    class LogicalDeviceBuilder createLogicalDevice();

    PhysicalDevice() = default;

private:
    explicit PhysicalDevice(VkPhysicalDevice device);

    VkPhysicalDevice device_ = VK_NULL_HANDLE;
    DeviceCapabilities capabilities_;
};

/**
 * @brief Builder for a LogicalDevice with graphics and present queues
 */
class LogicalDeviceBuilder {
public:
    explicit LogicalDeviceBuilder(PhysicalDevice* physical);

    LogicalDeviceBuilder& addExtension(const char* extension);

    /// Surface used to pick the present queue family
    LogicalDeviceBuilder& surface(Surface* surface);

    LogicalDevicePtr build();

private:
    PhysicalDevice* physical_;
    Surface* surface_ = nullptr;
    std::vector<const char*> extensions_;
};

} // namespace fine2d
