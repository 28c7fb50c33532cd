#pragma once

#include "fine2d/core/types.hpp"

#include <vulkan/vulkan.h>

namespace fine2d {

/**
 * @brief Routes Vulkan validation layer output into the Logger
 *
 * Created by Instance when validation is enabled. The severities requested
 * from the layer follow the logger's minimum level at creation time, so
 * verbose layer chatter is only produced when Trace logging is on.
 */
class DebugMessenger {
public:
    /// Create a messenger for an instance with validation enabled
    static DebugMessengerPtr create(Instance& instance);

    /// Fill a create info (also chained into VkInstanceCreateInfo to cover instance creation)
    static void populateCreateInfo(VkDebugUtilsMessengerCreateInfoEXT& createInfo);

    VkDebugUtilsMessengerEXT handle() const { return messenger_; }

    ~DebugMessenger();

    DebugMessenger(const DebugMessenger&) = delete;
    DebugMessenger& operator=(const DebugMessenger&) = delete;

private:
    DebugMessenger(VkInstance instance, VkDebugUtilsMessengerEXT messenger)
        : instance_(instance), messenger_(messenger) {}

    VkInstance instance_ = VK_NULL_HANDLE;
    VkDebugUtilsMessengerEXT messenger_ = VK_NULL_HANDLE;
};

} // namespace fine2d
