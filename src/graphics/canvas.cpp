#include "fine2d/graphics/canvas.hpp"
#include "fine2d/graphics/graphics_context.hpp"
#include "fine2d/graphics/texture.hpp"
#include "fine2d/core/error.hpp"
#include "fine2d/core/logging.hpp"
#include "fine2d/device/command.hpp"
#include "fine2d/device/image.hpp"
#include "fine2d/rendering/framebuffer.hpp"
#include "fine2d/rendering/renderpass.hpp"

#include <stdexcept>

namespace fine2d {

CanvasTarget::~CanvasTarget() = default;

Canvas::Canvas(Image image, CanvasTargetRef target)
    : image_(std::move(image))
    , target_(std::move(target)) {
}

Canvas Canvas::create(GraphicsContext& ctx, uint32_t width, uint32_t height, NumSamples samples) {
    if (width == 0 || height == 0) {
        throw ResourceLoadError("Canvas dimensions must be non-zero (got " + std::to_string(width) +
                                "x" + std::to_string(height) + ")");
    }

    LogicalDevice* device = ctx.device();
    auto target = std::make_shared<CanvasTarget>();
    target->samples = ctx.clampSamples(samples);
    target->extent = {width, height};
    target->texture = Texture::renderTarget(device, ctx.descriptorPool(), ctx.textureSetLayout(),
                                            width, height, ctx.colorFormat());
    target->renderPass = RenderPass::createResume(device, ctx.colorFormat(), target->samples,
                                                  VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL);

    auto framebuffer = Framebuffer::create(device, target->renderPass.get());
    if (target->samples > VK_SAMPLE_COUNT_1_BIT) {
        target->multisample = DeviceImage::createMultisampleTarget(device, width, height,
                                                                   ctx.colorFormat(), target->samples);
        target->multisample->transition(ctx.commandPool(), VK_IMAGE_LAYOUT_UNDEFINED,
                                        VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL);
        framebuffer.attachment(target->multisample->view());
    }
    target->framebuffer = framebuffer
        .attachment(target->texture->view())
        .extent(width, height)
        .build();

    if (target->multisample) {
        // The multisample image is loaded by every pass, so give it defined contents
        auto immediate = ctx.commandPool()->beginImmediate();
        immediate.cmd().beginRenderPass(target->renderPass->handle(), target->framebuffer->handle(),
                                        target->extent);
        immediate.cmd().clearColorAttachment(VkClearColorValue{}, target->extent);
        immediate.cmd().endRenderPass();
        immediate.submit();
    }

    FINE2D_DEBUG(LogCategory::Render, "Canvas created: " + std::to_string(width) + "x" +
                 std::to_string(height) + ", " + std::to_string(static_cast<int>(target->samples)) +
                 " samples");

    Image image(target->texture, ctx.defaultSamplerInfo());
    return Canvas(std::move(image), std::move(target));
}

Canvas Canvas::withWindowSize(GraphicsContext& ctx) {
    auto size = ctx.drawableSize();
    auto samples = numSamplesFromCount(static_cast<uint32_t>(ctx.screenSamples()));
    return create(ctx, size.x, size.y, samples.value_or(NumSamples::One));
}

Image Canvas::toImage(GraphicsContext& ctx) const {
    return Image::fromRgba8(ctx, width(), height(), toRgba8(ctx));
}

std::vector<uint8_t> Canvas::toRgba8(GraphicsContext& ctx) const {
    return image_.toRgba8(ctx);
}

void Canvas::encode(GraphicsContext& ctx, ImageFormat format, const std::string& path) const {
    image_.encode(ctx, format, path);
}

void Canvas::drawEx(GraphicsContext& ctx, const DrawParam& param) const {
    if (ctx.activeTarget() == target_.get()) {
        throw std::logic_error("A canvas cannot be drawn into itself");
    }
    image_.drawEx(ctx, param);
}

} // namespace fine2d
