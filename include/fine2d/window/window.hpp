#pragma once

#include "fine2d/core/types.hpp"
#include "fine2d/core/conf.hpp"

#include <vulkan/vulkan.h>
#include <glm/glm.hpp>

#include <functional>
#include <string>
#include <string_view>

struct GLFWwindow;

namespace fine2d {

/**
 * @brief GLFW window with its Vulkan surface and swap chain
 *
 * The window exists before any device does; bindDevice() creates the swap
 * chain once a logical device has been chosen for the surface.
 *
 * Usage:
 * @code
 * auto window = Window::create(instance.get())
 *     .title("My Game")
 *     .size(1280, 720)
 *     .resizable(true)
 *     .build();
 *
 * while (window->isOpen()) {
 *     window->pollEvents();
 *     ...
 * }
 * @endcode
 */
class Window {
public:
    /**
     * @brief Builder for creating Window objects
     */
    class Builder {
    public:
        explicit Builder(Instance* instance);

        Builder& title(std::string_view title);
        Builder& size(uint32_t width, uint32_t height);
        Builder& resizable(bool enabled = true);
        Builder& fullscreen(bool enabled = true);
        Builder& borderless(bool enabled = true);
        Builder& vsync(bool enabled = true);
        Builder& srgb(bool enabled = true);
        Builder& visible(bool enabled = true);
        Builder& minSize(uint32_t width, uint32_t height);
        Builder& maxSize(uint32_t width, uint32_t height);

        /// Replace every WindowMode field at once
        Builder& mode(const WindowMode& mode);

        Builder& framesInFlight(uint32_t count);

        WindowPtr build();

    private:
        Instance* instance_;
        std::string title_ = "fine2d";
        WindowMode mode_;
        bool vsync_ = true;
        bool srgb_ = true;
        uint32_t framesInFlight_ = 2;
    };

    static Builder create(Instance* instance);

    // ========================================================================
    // Window state
    // ========================================================================

    bool isOpen() const;
    void close();

    /// Window size in screen coordinates
    glm::uvec2 size() const;

    /// Drawable size in pixels
    glm::uvec2 framebufferSize() const;

    bool isMinimized() const;

    const std::string& title() const { return title_; }
    void setTitle(std::string_view title);

    const WindowMode& mode() const { return mode_; }

    /**
     * @brief Apply a new window mode
     *
     * Size limits, decoration, resizability, visibility and fullscreen are
     * applied immediately. The swap chain is recreated on the next
     * recreateSwapChain() call.
     */
    void setMode(const WindowMode& mode);

    bool vsync() const { return vsync_; }
    void setVsync(bool enabled) { vsync_ = enabled; }

    uint32_t framesInFlight() const { return framesInFlight_; }

    GLFWwindow* handle() const { return window_; }

    // ========================================================================
    // Surface and swap chain
    // ========================================================================

    Instance* instance() const { return instance_; }
    Surface* surface() const { return surface_.get(); }
    SwapChain* swapChain() const { return swapChain_.get(); }

    /// Create the swap chain on a device that can present to this window's surface
    void bindDevice(LogicalDevice& device);

    /**
     * @brief Recreate the swap chain at the current framebuffer size
     *
     * Blocks while the window is minimized. The caller must have waited for
     * the device to go idle.
     */
    void recreateSwapChain();

    /// True once after the framebuffer changed size
    bool consumeResized();

    /// Destroy the swap chain; called before the device goes away
    void releaseDeviceResources();

    // ========================================================================
    // Events
    // ========================================================================

    void pollEvents();

    using ResizeCallback = std::function<void(uint32_t width, uint32_t height)>;
    void onResize(ResizeCallback callback) { resizeCallback_ = std::move(callback); }

    ~Window();

    Window(const Window&) = delete;
    Window& operator=(const Window&) = delete;

private:
    friend class Builder;
    Window() = default;

    void applySizeLimits();

    static void glfwFramebufferSizeCallback(GLFWwindow* window, int width, int height);

    Instance* instance_ = nullptr;
    LogicalDevice* device_ = nullptr;
    GLFWwindow* window_ = nullptr;

    std::string title_;
    WindowMode mode_;
    bool vsync_ = true;
    bool srgb_ = true;
    uint32_t framesInFlight_ = 2;

    SurfacePtr surface_;
    SwapChainPtr swapChain_;

    bool framebufferResized_ = false;
    ResizeCallback resizeCallback_;
};

} // namespace fine2d
