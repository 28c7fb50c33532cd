#pragma once

#include "fine2d/core/types.hpp"

#include <vulkan/vulkan.h>

struct GLFWwindow;

namespace fine2d {

/**
 * @brief Presentable Vulkan surface for a GLFW window
 */
class Surface {
public:
    /// Create a surface for a GLFW window (implemented in platform/glfw_surface.cpp)
    static SurfacePtr fromGLFW(Instance& instance, GLFWwindow* window);

    VkSurfaceKHR handle() const { return surface_; }
    Instance* instance() const { return instance_; }

    ~Surface();

    Surface(const Surface&) = delete;
    Surface& operator=(const Surface&) = delete;

private:
    Surface(Instance* instance, VkSurfaceKHR surface)
        : surface_(surface), instance_(instance) {}

    VkSurfaceKHR surface_ = VK_NULL_HANDLE;
    Instance* instance_ = nullptr;
};

} // namespace fine2d
