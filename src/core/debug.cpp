#include "fine2d/core/debug.hpp"
#include "fine2d/core/instance.hpp"
#include "fine2d/core/logging.hpp"
#include "fine2d/core/error.hpp"

namespace fine2d {

static VKAPI_ATTR VkBool32 VKAPI_CALL validationCallback(
    VkDebugUtilsMessageSeverityFlagBitsEXT severity,
    VkDebugUtilsMessageTypeFlagsEXT type,
    const VkDebugUtilsMessengerCallbackDataEXT* data,
    void* /*userData*/)
{
    Logger::global().vulkanMessage(severity, type, data);
    return VK_FALSE;
}

void DebugMessenger::populateCreateInfo(VkDebugUtilsMessengerCreateInfoEXT& createInfo) {
    createInfo = {};
    createInfo.sType = VK_STRUCTURE_TYPE_DEBUG_UTILS_MESSENGER_CREATE_INFO_EXT;
    createInfo.messageSeverity =
        VK_DEBUG_UTILS_MESSAGE_SEVERITY_WARNING_BIT_EXT |
        VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT;
    if (Logger::global().minLevel() <= LogLevel::Trace) {
        createInfo.messageSeverity |= VK_DEBUG_UTILS_MESSAGE_SEVERITY_VERBOSE_BIT_EXT |
                                      VK_DEBUG_UTILS_MESSAGE_SEVERITY_INFO_BIT_EXT;
    }
    createInfo.messageType =
        VK_DEBUG_UTILS_MESSAGE_TYPE_GENERAL_BIT_EXT |
        VK_DEBUG_UTILS_MESSAGE_TYPE_VALIDATION_BIT_EXT |
        VK_DEBUG_UTILS_MESSAGE_TYPE_PERFORMANCE_BIT_EXT;
    createInfo.pfnUserCallback = validationCallback;
}

DebugMessengerPtr DebugMessenger::create(Instance& instance) {
    VkDebugUtilsMessengerCreateInfoEXT createInfo;
    populateCreateInfo(createInfo);

    auto createFn = reinterpret_cast<PFN_vkCreateDebugUtilsMessengerEXT>(
        vkGetInstanceProcAddr(instance.handle(), "vkCreateDebugUtilsMessengerEXT"));
    if (!createFn) {
        throw RenderError("Failed to create debug messenger", VK_ERROR_EXTENSION_NOT_PRESENT);
    }

    VkDebugUtilsMessengerEXT messenger;
    VkResult result = createFn(instance.handle(), &createInfo, nullptr, &messenger);
    if (result != VK_SUCCESS) {
        throw RenderError("Failed to create debug messenger", result);
    }

    return DebugMessengerPtr(new DebugMessenger(instance.handle(), messenger));
}

DebugMessenger::~DebugMessenger() {
    if (messenger_ == VK_NULL_HANDLE) {
        return;
    }
    auto destroyFn = reinterpret_cast<PFN_vkDestroyDebugUtilsMessengerEXT>(
        vkGetInstanceProcAddr(instance_, "vkDestroyDebugUtilsMessengerEXT"));
    if (destroyFn) {
        destroyFn(instance_, messenger_, nullptr);
    }
}

} // namespace fine2d
