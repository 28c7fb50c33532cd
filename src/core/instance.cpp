#include "fine2d/core/instance.hpp"
#include "fine2d/core/logging.hpp"
#include "fine2d/core/error.hpp"

#include <GLFW/glfw3.h>

#include <cstring>

namespace fine2d {

static const char* const VALIDATION_LAYER = "VK_LAYER_KHRONOS_validation";

// ============================================================================
// Builder implementation
// ============================================================================

Instance::Builder& Instance::Builder::applicationName(std::string_view name) {
    appName_ = std::string(name);
    return *this;
}

Instance::Builder& Instance::Builder::apiVersion(uint32_t version) {
    apiVersion_ = version;
    return *this;
}

Instance::Builder& Instance::Builder::enableValidation(bool enable) {
    validationEnabled_ = enable;
    return *this;
}

Instance::Builder& Instance::Builder::addExtension(const char* extension) {
    extensions_.push_back(extension);
    return *this;
}

std::vector<const char*> Instance::Builder::getRequiredExtensions() const {
    uint32_t glfwExtensionCount = 0;
    const char** glfwExtensions = glfwGetRequiredInstanceExtensions(&glfwExtensionCount);
    if (!glfwExtensions) {
        throw RenderError("GLFW found no Vulkan surface support on this system");
    }

    std::vector<const char*> extensions(glfwExtensions, glfwExtensions + glfwExtensionCount);
    extensions.insert(extensions.end(), extensions_.begin(), extensions_.end());

    if (validationEnabled_) {
        extensions.push_back(VK_EXT_DEBUG_UTILS_EXTENSION_NAME);
    }

#ifdef VK_USE_PLATFORM_MACOS_MVK
    extensions.push_back(VK_KHR_PORTABILITY_ENUMERATION_EXTENSION_NAME);
    extensions.push_back("VK_KHR_get_physical_device_properties2");
#endif

    return extensions;
}

bool Instance::Builder::checkValidationLayerSupport() const {
    uint32_t layerCount = 0;
    vkEnumerateInstanceLayerProperties(&layerCount, nullptr);

    std::vector<VkLayerProperties> availableLayers(layerCount);
    vkEnumerateInstanceLayerProperties(&layerCount, availableLayers.data());

    for (const auto& layerProperties : availableLayers) {
        if (std::strcmp(VALIDATION_LAYER, layerProperties.layerName) == 0) {
            return true;
        }
    }
    return false;
}

InstancePtr Instance::Builder::build() {
    if (!glfwInit()) {
        throw RenderError("Failed to initialize GLFW");
    }

    if (validationEnabled_ && !checkValidationLayerSupport()) {
        FINE2D_WARN(LogCategory::Core, "Validation layers requested but not available");
        validationEnabled_ = false;
    }

    VkApplicationInfo appInfo{};
    appInfo.sType = VK_STRUCTURE_TYPE_APPLICATION_INFO;
    appInfo.pApplicationName = appName_.c_str();
    appInfo.applicationVersion = VK_MAKE_VERSION(1, 0, 0);
    appInfo.pEngineName = "fine2d";
    appInfo.engineVersion = VK_MAKE_VERSION(0, 1, 0);
    appInfo.apiVersion = apiVersion_;

    auto extensions = getRequiredExtensions();

    VkInstanceCreateInfo createInfo{};
    createInfo.sType = VK_STRUCTURE_TYPE_INSTANCE_CREATE_INFO;
    createInfo.pApplicationInfo = &appInfo;
    createInfo.enabledExtensionCount = static_cast<uint32_t>(extensions.size());
    createInfo.ppEnabledExtensionNames = extensions.data();

#ifdef VK_USE_PLATFORM_MACOS_MVK
    createInfo.flags |= VK_INSTANCE_CREATE_ENUMERATE_PORTABILITY_BIT_KHR;
#endif

    // Chaining the messenger info also reports problems in vkCreateInstance itself
    VkDebugUtilsMessengerCreateInfoEXT debugCreateInfo{};
    if (validationEnabled_) {
        createInfo.enabledLayerCount = 1;
        createInfo.ppEnabledLayerNames = &VALIDATION_LAYER;
        DebugMessenger::populateCreateInfo(debugCreateInfo);
        createInfo.pNext = &debugCreateInfo;
        FINE2D_INFO(LogCategory::Core, "Validation layers enabled");
    }

    VkInstance vkInstance;
    VkResult result = vkCreateInstance(&createInfo, nullptr, &vkInstance);
    if (result != VK_SUCCESS) {
        throw RenderError("Failed to create Vulkan instance", result);
    }

    FINE2D_INFO(LogCategory::Core, "Vulkan instance created successfully");

    auto instance = InstancePtr(new Instance());
    instance->instance_ = vkInstance;
    instance->validationEnabled_ = validationEnabled_;
    instance->apiVersion_ = apiVersion_;

    if (validationEnabled_) {
        instance->debugMessenger_ = DebugMessenger::create(*instance);
    }

    return instance;
}

// ============================================================================
// Instance implementation
// ============================================================================

Instance::Builder Instance::create() {
    return Builder();
}

Instance::~Instance() {
    debugMessenger_.reset();

    if (instance_ != VK_NULL_HANDLE) {
        vkDestroyInstance(instance_, nullptr);
        FINE2D_DEBUG(LogCategory::Core, "Vulkan instance destroyed");
    }
}

} // namespace fine2d
