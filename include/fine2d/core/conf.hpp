#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace fine2d {

/// Multisample count of the screen and of canvases
enum class NumSamples : uint32_t {
    One = 1,
    Two = 2,
    Four = 4,
    Eight = 8,
    Sixteen = 16
};

/// Parse a raw sample count; anything but 1, 2, 4, 8 or 16 is rejected
inline std::optional<NumSamples> numSamplesFromCount(uint32_t count) {
    switch (count) {
        case 1:  return NumSamples::One;
        case 2:  return NumSamples::Two;
        case 4:  return NumSamples::Four;
        case 8:  return NumSamples::Eight;
        case 16: return NumSamples::Sixteen;
        default: return std::nullopt;
    }
}

inline uint32_t sampleCount(NumSamples samples) {
    return static_cast<uint32_t>(samples);
}

/**
 * @brief Settings fixed when the window is created
 */
struct WindowSetup {
    std::string title = "An easy, good game";
    NumSamples samples = NumSamples::One;
    bool vsync = true;
    /// Prefer an sRGB swap chain format
    bool srgb = true;

    WindowSetup& withTitle(std::string value) { title = std::move(value); return *this; }
    WindowSetup& withSamples(NumSamples value) { samples = value; return *this; }
    WindowSetup& withVsync(bool value) { vsync = value; return *this; }
};

/**
 * @brief Settings that can change while the window is open
 *
 * A zero min or max dimension leaves that limit unbounded.
 */
struct WindowMode {
    uint32_t width = 800;
    uint32_t height = 600;
    bool resizable = false;
    bool fullscreen = false;
    bool borderless = false;
    uint32_t minWidth = 0;
    uint32_t minHeight = 0;
    uint32_t maxWidth = 0;
    uint32_t maxHeight = 0;
    bool visible = true;

    WindowMode& dimensions(uint32_t w, uint32_t h) { width = w; height = h; return *this; }
    WindowMode& withResizable(bool value) { resizable = value; return *this; }
    WindowMode& withFullscreen(bool value) { fullscreen = value; return *this; }
    WindowMode& withBorderless(bool value) { borderless = value; return *this; }
    WindowMode& minDimensions(uint32_t w, uint32_t h) { minWidth = w; minHeight = h; return *this; }
    WindowMode& maxDimensions(uint32_t w, uint32_t h) { maxWidth = w; maxHeight = h; return *this; }
    WindowMode& withVisible(bool value) { visible = value; return *this; }
};

/// Vulkan backend options
struct Backend {
    bool enableValidation = false;
    uint32_t framesInFlight = 2;
};

/**
 * @brief Everything GraphicsContext::create needs
 *
 * @code
 * fine2d::Conf conf;
 * conf.windowSetup.withTitle("Shapes").withSamples(fine2d::NumSamples::Four);
 * conf.windowMode.dimensions(1024, 768).withResizable(true);
 * conf.resourceDir = "resources";
 * auto ctx = fine2d::GraphicsContext::create(conf);
 * @endcode
 */
struct Conf {
    WindowSetup windowSetup;
    WindowMode windowMode;
    Backend backend;
    /// Root directory virtual paths resolve against
    std::string resourceDir = "resources";
};

} // namespace fine2d
