#include "fine2d/window/window.hpp"
#include "fine2d/core/instance.hpp"
#include "fine2d/core/surface.hpp"
#include "fine2d/core/error.hpp"
#include "fine2d/core/logging.hpp"
#include "fine2d/device/logical_device.hpp"
#include "fine2d/rendering/swapchain.hpp"

#include <GLFW/glfw3.h>

namespace fine2d {

namespace {

int limitOrDontCare(uint32_t value) {
    return value == 0 ? GLFW_DONT_CARE : static_cast<int>(value);
}

} // namespace

// ============================================================================
// Builder implementation
// ============================================================================

Window::Builder::Builder(Instance* instance)
    : instance_(instance) {
}

Window::Builder& Window::Builder::title(std::string_view title) {
    title_ = std::string(title);
    return *this;
}

Window::Builder& Window::Builder::size(uint32_t width, uint32_t height) {
    mode_.width = width;
    mode_.height = height;
    return *this;
}

Window::Builder& Window::Builder::resizable(bool enabled) {
    mode_.resizable = enabled;
    return *this;
}

Window::Builder& Window::Builder::fullscreen(bool enabled) {
    mode_.fullscreen = enabled;
    return *this;
}

Window::Builder& Window::Builder::borderless(bool enabled) {
    mode_.borderless = enabled;
    return *this;
}

Window::Builder& Window::Builder::vsync(bool enabled) {
    vsync_ = enabled;
    return *this;
}

Window::Builder& Window::Builder::srgb(bool enabled) {
    srgb_ = enabled;
    return *this;
}

Window::Builder& Window::Builder::visible(bool enabled) {
    mode_.visible = enabled;
    return *this;
}

Window::Builder& Window::Builder::minSize(uint32_t width, uint32_t height) {
    mode_.minWidth = width;
    mode_.minHeight = height;
    return *this;
}

Window::Builder& Window::Builder::maxSize(uint32_t width, uint32_t height) {
    mode_.maxWidth = width;
    mode_.maxHeight = height;
    return *this;
}

Window::Builder& Window::Builder::mode(const WindowMode& mode) {
    mode_ = mode;
    return *this;
}

Window::Builder& Window::Builder::framesInFlight(uint32_t count) {
    framesInFlight_ = count;
    return *this;
}

WindowPtr Window::Builder::build() {
    if (mode_.width == 0 || mode_.height == 0) {
        throw std::logic_error("Window size must be non-zero");
    }
    if (framesInFlight_ == 0) {
        throw std::logic_error("At least one frame in flight is required");
    }

    auto window = WindowPtr(new Window());
    window->instance_ = instance_;
    window->title_ = title_;
    window->mode_ = mode_;
    window->vsync_ = vsync_;
    window->srgb_ = srgb_;
    window->framesInFlight_ = framesInFlight_;

    // Instance::Builder::build() has already initialized GLFW
    glfwDefaultWindowHints();
    glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);  // No OpenGL context
    glfwWindowHint(GLFW_RESIZABLE, mode_.resizable ? GLFW_TRUE : GLFW_FALSE);
    glfwWindowHint(GLFW_DECORATED, mode_.borderless ? GLFW_FALSE : GLFW_TRUE);
    glfwWindowHint(GLFW_VISIBLE, mode_.visible ? GLFW_TRUE : GLFW_FALSE);

    int width = static_cast<int>(mode_.width);
    int height = static_cast<int>(mode_.height);
    GLFWmonitor* monitor = nullptr;
    if (mode_.fullscreen) {
        monitor = glfwGetPrimaryMonitor();
        if (monitor) {
            const GLFWvidmode* vidmode = glfwGetVideoMode(monitor);
            width = vidmode->width;
            height = vidmode->height;
        } else {
            FINE2D_WARN(LogCategory::Core, "No primary monitor, creating a windowed window instead");
        }
    }

    window->window_ = glfwCreateWindow(width, height, title_.c_str(), monitor, nullptr);
    if (!window->window_) {
        throw RenderError("Failed to create GLFW window");
    }

    glfwSetWindowUserPointer(window->window_, window.get());
    glfwSetFramebufferSizeCallback(window->window_, glfwFramebufferSizeCallback);
    window->applySizeLimits();

    window->surface_ = Surface::fromGLFW(*instance_, window->window_);

    FINE2D_INFO(LogCategory::Core, "Window created: " + std::to_string(width) + "x" +
                std::to_string(height) + " \"" + title_ + "\"");

    return window;
}

// ============================================================================
// Window implementation
// ============================================================================

Window::Builder Window::create(Instance* instance) {
    return Builder(instance);
}

Window::~Window() {
    releaseDeviceResources();
    surface_.reset();
    if (window_) {
        glfwDestroyWindow(window_);
        window_ = nullptr;
    }
}

bool Window::isOpen() const {
    return window_ && !glfwWindowShouldClose(window_);
}

void Window::close() {
    if (window_) {
        glfwSetWindowShouldClose(window_, GLFW_TRUE);
    }
}

glm::uvec2 Window::size() const {
    int w, h;
    glfwGetWindowSize(window_, &w, &h);
    return {static_cast<uint32_t>(w), static_cast<uint32_t>(h)};
}

glm::uvec2 Window::framebufferSize() const {
    int w, h;
    glfwGetFramebufferSize(window_, &w, &h);
    return {static_cast<uint32_t>(w), static_cast<uint32_t>(h)};
}

bool Window::isMinimized() const {
    auto fb = framebufferSize();
    return fb.x == 0 || fb.y == 0;
}

void Window::setTitle(std::string_view title) {
    title_ = std::string(title);
    glfwSetWindowTitle(window_, title_.c_str());
}

void Window::setMode(const WindowMode& mode) {
    if (mode.width == 0 || mode.height == 0) {
        throw std::logic_error("Window size must be non-zero");
    }
    mode_ = mode;

    glfwSetWindowAttrib(window_, GLFW_RESIZABLE, mode_.resizable ? GLFW_TRUE : GLFW_FALSE);
    glfwSetWindowAttrib(window_, GLFW_DECORATED, mode_.borderless ? GLFW_FALSE : GLFW_TRUE);

    GLFWmonitor* monitor = mode_.fullscreen ? glfwGetPrimaryMonitor() : nullptr;
    if (monitor) {
        const GLFWvidmode* vidmode = glfwGetVideoMode(monitor);
        glfwSetWindowMonitor(window_, monitor, 0, 0, vidmode->width, vidmode->height,
                             vidmode->refreshRate);
    } else {
        int x, y;
        glfwGetWindowPos(window_, &x, &y);
        glfwSetWindowMonitor(window_, nullptr, x, y,
                             static_cast<int>(mode_.width), static_cast<int>(mode_.height),
                             GLFW_DONT_CARE);
    }
    applySizeLimits();

    if (mode_.visible) {
        glfwShowWindow(window_);
    } else {
        glfwHideWindow(window_);
    }
    framebufferResized_ = true;

    FINE2D_DEBUG(LogCategory::Core, "Window mode set to " + std::to_string(mode_.width) + "x" +
                 std::to_string(mode_.height) + (mode_.fullscreen ? " fullscreen" : ""));
}

void Window::applySizeLimits() {
    glfwSetWindowSizeLimits(window_,
                            limitOrDontCare(mode_.minWidth), limitOrDontCare(mode_.minHeight),
                            limitOrDontCare(mode_.maxWidth), limitOrDontCare(mode_.maxHeight));
}

// ============================================================================
// Surface and swap chain
// ============================================================================

void Window::bindDevice(LogicalDevice& device) {
    if (swapChain_) {
        throw std::logic_error("Window is already bound to a device");
    }
    device_ = &device;

    auto fb = framebufferSize();
    swapChain_ = SwapChain::create(device_, surface_.get())
        .extent(fb.x, fb.y)
        .vsync(vsync_)
        .srgb(srgb_)
        .imageCount(framesInFlight_ + 1)
        .build();
}

void Window::recreateSwapChain() {
    if (!swapChain_) {
        throw std::logic_error("Window has no swap chain to recreate");
    }

    // A minimized window has a zero-sized framebuffer; wait until it is restored
    auto fb = framebufferSize();
    while ((fb.x == 0 || fb.y == 0) && isOpen()) {
        glfwWaitEvents();
        fb = framebufferSize();
    }

    swapChain_->recreate(fb.x, fb.y, vsync_);
    framebufferResized_ = false;
}

bool Window::consumeResized() {
    bool resized = framebufferResized_;
    framebufferResized_ = false;
    return resized;
}

void Window::releaseDeviceResources() {
    swapChain_.reset();
    device_ = nullptr;
}

// ============================================================================
// Events
// ============================================================================

void Window::pollEvents() {
    glfwPollEvents();
}

void Window::glfwFramebufferSizeCallback(GLFWwindow* glfwWindow, int width, int height) {
    auto* window = static_cast<Window*>(glfwGetWindowUserPointer(glfwWindow));
    if (window) {
        window->framebufferResized_ = true;
        if (window->resizeCallback_) {
            window->resizeCallback_(static_cast<uint32_t>(width), static_cast<uint32_t>(height));
        }
    }
}

} // namespace fine2d
