#include "fine2d/core/surface.hpp"
#include "fine2d/core/instance.hpp"
#include "fine2d/core/logging.hpp"
#include "fine2d/core/error.hpp"

#include <GLFW/glfw3.h>

namespace fine2d {

SurfacePtr Surface::fromGLFW(Instance& instance, GLFWwindow* window) {
    if (!window) {
        throw std::logic_error("Surface::fromGLFW: window is null");
    }

    VkSurfaceKHR surface;
    VkResult result = glfwCreateWindowSurface(instance.handle(), window, nullptr, &surface);
    if (result != VK_SUCCESS) {
        throw RenderError("Failed to create window surface", result);
    }

    FINE2D_DEBUG(LogCategory::Core, "GLFW window surface created");
    return SurfacePtr(new Surface(&instance, surface));
}

} // namespace fine2d
