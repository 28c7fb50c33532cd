#pragma once

#include "fine2d/core/types.hpp"
#include "fine2d/core/debug.hpp"

#include <vulkan/vulkan.h>
#include <string>
#include <string_view>
#include <vector>
#include <memory>

namespace fine2d {

/**
 * @brief Vulkan Instance wrapper - the entry point to Vulkan
 *
 * Usage:
 * @code
 * auto instance = Instance::create()
 *     .applicationName("My Game")
 *     .enableValidation(conf.backend.enableValidation)
 *     .build();
 * @endcode
 */
class Instance {
public:
    /**
     * @brief Builder for creating Instance objects
     */
    class Builder {
    public:
        Builder() = default;

        /// Set application name (default: "fine2d application")
        Builder& applicationName(std::string_view name);

        /// Set target Vulkan API version (default: VK_API_VERSION_1_1)
        Builder& apiVersion(uint32_t version);

        /// Request the Khronos validation layer; silently unavailable layers only log a warning
        Builder& enableValidation(bool enable = true);

        /// Add a required instance extension
        Builder& addExtension(const char* extension);

        /// Initializes GLFW, then creates the instance with the surface extensions GLFW needs
        InstancePtr build();

    private:
        std::string appName_ = "fine2d application";
        uint32_t apiVersion_ = VK_API_VERSION_1_1;
        bool validationEnabled_ = false;
        std::vector<const char*> extensions_;

        std::vector<const char*> getRequiredExtensions() const;
        bool checkValidationLayerSupport() const;
    };

    static Builder create();

    VkInstance handle() const { return instance_; }
    bool validationEnabled() const { return validationEnabled_; }
    uint32_t apiVersion() const { return apiVersion_; }

    ~Instance();

    Instance(const Instance&) = delete;
    Instance& operator=(const Instance&) = delete;

private:
    friend class Builder;
    Instance() = default;

    VkInstance instance_ = VK_NULL_HANDLE;
    bool validationEnabled_ = false;
    uint32_t apiVersion_ = 0;
    DebugMessengerPtr debugMessenger_;
};

} // namespace fine2d
