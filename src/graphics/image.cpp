#include "fine2d/graphics/image.hpp"
#include "fine2d/graphics/graphics_context.hpp"
#include "fine2d/graphics/texture.hpp"
#include "fine2d/core/error.hpp"
#include "fine2d/core/logging.hpp"

#define STB_IMAGE_IMPLEMENTATION
#include "stb_image.h"

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include "stb_image_write.h"

#include <glm/gtc/matrix_transform.hpp>

#include <limits>

namespace fine2d {

namespace {

void validatePixels(uint32_t width, uint32_t height, size_t byteCount) {
    if (width == 0 || height == 0) {
        throw ResourceLoadError("Image dimensions must be non-zero (got " + std::to_string(width) +
                                "x" + std::to_string(height) + ")");
    }
    size_t expected = static_cast<size_t>(width) * height * 4;
    if (byteCount != expected) {
        throw ResourceLoadError("RGBA8 buffer holds " + std::to_string(byteCount) + " bytes, " +
                                std::to_string(width) + "x" + std::to_string(height) +
                                " needs " + std::to_string(expected));
    }
}

} // namespace

Image::Image(TextureRef texture, const SamplerInfo& sampler)
    : texture_(std::move(texture))
    , sampler_(sampler) {
    if (!texture_) {
        throw std::logic_error("Image requires a texture");
    }
    width_ = texture_->width();
    height_ = texture_->height();
}

Image Image::load(GraphicsContext& ctx, const std::string& path) {
    auto bytes = ctx.filesystem().open(path);
    if (bytes.size() > static_cast<size_t>(std::numeric_limits<int>::max())) {
        throw ResourceLoadError("Image file too large: " + path);
    }

    int width = 0;
    int height = 0;
    int channels = 0;
    stbi_uc* pixels = stbi_load_from_memory(bytes.data(), static_cast<int>(bytes.size()),
                                            &width, &height, &channels, STBI_rgb_alpha);
    if (!pixels) {
        throw ResourceLoadError("Failed to decode image " + path + ": " + stbi_failure_reason());
    }

    std::vector<uint8_t> rgba(pixels, pixels + static_cast<size_t>(width) * height * 4);
    stbi_image_free(pixels);

    FINE2D_DEBUG(LogCategory::Resource, "Loaded image: " + path +
        " (" + std::to_string(width) + "x" + std::to_string(height) + ")");

    return fromRgba8(ctx, static_cast<uint32_t>(width), static_cast<uint32_t>(height), rgba);
}

Image Image::fromRgba8(GraphicsContext& ctx, uint32_t width, uint32_t height,
                       const std::vector<uint8_t>& rgba) {
    validatePixels(width, height, rgba.size());

    auto texture = Texture::fromRgba8(ctx.device(), ctx.descriptorPool(), ctx.textureSetLayout(),
                                      width, height, rgba.data());
    return Image(std::move(texture), ctx.defaultSamplerInfo());
}

Image Image::solid(GraphicsContext& ctx, uint32_t size, const Color& color) {
    auto pixel = color.toRgba8();
    std::vector<uint8_t> rgba(static_cast<size_t>(size) * size * 4);
    for (size_t i = 0; i < rgba.size(); i += 4) {
        rgba[i + 0] = pixel[0];
        rgba[i + 1] = pixel[1];
        rgba[i + 2] = pixel[2];
        rgba[i + 3] = pixel[3];
    }
    return fromRgba8(ctx, size, size, rgba);
}

Rect Image::dimensions() const {
    float w = static_cast<float>(width_);
    float h = static_cast<float>(height_);
    return Rect(w * 0.5f, h * 0.5f, w, h);
}

std::optional<Rect> Image::dimensions(const GraphicsContext& /*ctx*/) const {
    return dimensions();
}

void Image::setWrap(WrapMode wrapX, WrapMode wrapY) {
    sampler_.wrapX = wrapX;
    sampler_.wrapY = wrapY;
}

std::vector<uint8_t> Image::toRgba8(GraphicsContext& ctx) const {
    // Pending draws may still write this texture through a canvas
    ctx.flush();
    return texture_->readRgba8(ctx.commandPool());
}

void Image::encode(GraphicsContext& ctx, ImageFormat format, const std::string& path) const {
    switch (format) {
        case ImageFormat::Png:
            ctx.filesystem().create(path, encodePng(width_, height_, toRgba8(ctx)));
            break;
    }
    FINE2D_DEBUG(LogCategory::Resource, "Encoded image to " + path);
}

void Image::drawEx(GraphicsContext& ctx, const DrawParam& param) const {
    BlendModeScope blend(ctx, blendMode_);

    const Rect& src = param.src();
    Matrix4 model = glm::scale(param.toMatrix(),
        glm::vec3(src.w * static_cast<float>(width_), src.h * static_cast<float>(height_), 1.0f));

    ctx.updateInstanceProperties(InstanceProperties::from(param, model));
    ctx.bindTexture(texture_, sampler_);
    ctx.draw();
}

std::vector<uint8_t> encodePng(uint32_t width, uint32_t height, const std::vector<uint8_t>& rgba) {
    validatePixels(width, height, rgba.size());

    std::vector<uint8_t> png;
    int ok = stbi_write_png_to_func(
        [](void* context, void* data, int size) {
            auto* out = static_cast<std::vector<uint8_t>*>(context);
            auto* bytes = static_cast<const uint8_t*>(data);
            out->insert(out->end(), bytes, bytes + size);
        }, &png,
        static_cast<int>(width), static_cast<int>(height), 4,
        rgba.data(), static_cast<int>(width * 4));
    if (!ok) {
        throw ResourceLoadError("PNG encoding failed");
    }
    return png;
}

} // namespace fine2d
