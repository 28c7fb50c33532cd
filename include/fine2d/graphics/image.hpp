#pragma once

#include "fine2d/core/types.hpp"
#include "fine2d/graphics/drawable.hpp"
#include "fine2d/graphics/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace fine2d {

/// Encodings Image::encode can write
enum class ImageFormat {
    Png
};

/**
 * @brief A drawable handle to a GPU texture
 *
 * Copies share the texture. Sampler settings and the blend override belong
 * to the handle, so two copies may draw the same pixels differently.
 */
class Image : public Drawable {
public:
    /// Decode a PNG, JPEG, BMP, TGA or GIF read through the context's Filesystem
    static Image load(GraphicsContext& ctx, const std::string& path);

    /// RGBA8 pixels, rows top to bottom; ResourceLoadError on zero size or length mismatch
    static Image fromRgba8(GraphicsContext& ctx, uint32_t width, uint32_t height,
                           const std::vector<uint8_t>& rgba);

    /// Square image filled with one color
    static Image solid(GraphicsContext& ctx, uint32_t size, const Color& color);

    uint32_t width() const { return width_; }
    uint32_t height() const { return height_; }

    /// Rect centred on half the size, covering the whole image
    Rect dimensions() const;
    std::optional<Rect> dimensions(const GraphicsContext& ctx) const override;

    FilterMode filter() const { return sampler_.filter; }
    void setFilter(FilterMode mode) { sampler_.filter = mode; }

    std::pair<WrapMode, WrapMode> wrap() const { return {sampler_.wrapX, sampler_.wrapY}; }
    void setWrap(WrapMode wrapX, WrapMode wrapY);

    const SamplerInfo& samplerInfo() const { return sampler_; }

    std::optional<BlendMode> blendMode() const override { return blendMode_; }
    void setBlendMode(std::optional<BlendMode> mode) override { blendMode_ = mode; }

    /// Read the pixels back from the GPU, rows top to bottom
    std::vector<uint8_t> toRgba8(GraphicsContext& ctx) const;

    /// Encode and write through the Filesystem
    void encode(GraphicsContext& ctx, ImageFormat format, const std::string& path) const;

    void drawEx(GraphicsContext& ctx, const DrawParam& param) const override;

    const TextureRef& texture() const { return texture_; }

    Image(TextureRef texture, const SamplerInfo& sampler);

private:
    TextureRef texture_;
    SamplerInfo sampler_;
    std::optional<BlendMode> blendMode_;
    uint32_t width_ = 0;
    uint32_t height_ = 0;
};

/// PNG bytes of an RGBA8 buffer
std::vector<uint8_t> encodePng(uint32_t width, uint32_t height, const std::vector<uint8_t>& rgba);

} // namespace fine2d
