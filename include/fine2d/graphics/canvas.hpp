#pragma once

#include "fine2d/core/types.hpp"
#include "fine2d/core/conf.hpp"
#include "fine2d/graphics/drawable.hpp"
#include "fine2d/graphics/image.hpp"

#include <vulkan/vulkan.h>
#include <memory>

namespace fine2d {

/**
 * @brief Render pass, framebuffer and attachments that draw into a canvas texture
 *
 * With more than one sample, drawing goes into a multisample image that is
 * resolved into the texture at the end of every pass.
 */
struct CanvasTarget {
    TextureRef texture;
    DeviceImagePtr multisample;
    RenderPassPtr renderPass;
    FramebufferPtr framebuffer;
    VkSampleCountFlagBits samples = VK_SAMPLE_COUNT_1_BIT;
    VkExtent2D extent{};

    ~CanvasTarget();
};

using CanvasTargetRef = std::shared_ptr<CanvasTarget>;

/**
 * @brief Offscreen render target that can itself be drawn
 *
 * @code
 * auto canvas = Canvas::create(ctx, 256, 256, NumSamples::One);
 * {
 *     RenderTargetScope target(ctx, canvas);
 *     ctx.clear(Color::TRANSPARENT);
 *     sprite.draw(ctx, {128, 128});
 * }
 * canvas.draw(ctx, {400, 300});
 * @endcode
 */
class Canvas : public Drawable {
public:
    static Canvas create(GraphicsContext& ctx, uint32_t width, uint32_t height,
                         NumSamples samples = NumSamples::One);

    /// Canvas the size of the window's drawable area, using the screen's sample count
    static Canvas withWindowSize(GraphicsContext& ctx);

    const Image& image() const { return image_; }
    Image& image() { return image_; }

    uint32_t width() const { return image_.width(); }
    uint32_t height() const { return image_.height(); }
    VkSampleCountFlagBits samples() const { return target_->samples; }

    /// An independent Image holding a copy of the current pixels
    Image toImage(GraphicsContext& ctx) const;

    /// Pixels as RGBA8, rows top to bottom
    std::vector<uint8_t> toRgba8(GraphicsContext& ctx) const;

    void encode(GraphicsContext& ctx, ImageFormat format, const std::string& path) const;

    /// Draws the canvas contents; std::logic_error while the canvas is the active target
    void drawEx(GraphicsContext& ctx, const DrawParam& param) const override;

    std::optional<BlendMode> blendMode() const override { return image_.blendMode(); }
    void setBlendMode(std::optional<BlendMode> mode) override { image_.setBlendMode(mode); }
    std::optional<Rect> dimensions(const GraphicsContext& ctx) const override { return image_.dimensions(ctx); }

    const CanvasTargetRef& target() const { return target_; }

private:
    Canvas(Image image, CanvasTargetRef target);

    Image image_;
    CanvasTargetRef target_;
};

} // namespace fine2d
