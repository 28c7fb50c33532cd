#pragma once

#include "fine2d/graphics/drawable.hpp"
#include "fine2d/graphics/image.hpp"
#include "fine2d/graphics/types.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fine2d {

/**
 * @brief A FreeType face at a fixed pixel height
 *
 * Copies share the face.
 */
class Font {
public:
    /// Parse TrueType/OpenType data; ResourceLoadError if FreeType rejects it
    static Font fromBytes(std::vector<uint8_t> bytes, float pixelHeight);

    /// Read a font file through the context's Filesystem
    static Font load(GraphicsContext& ctx, const std::string& path, float pixelHeight);

    float pixelHeight() const;

    /// Distance from the top of a line to the baseline, in pixels
    int ascender() const;

    /// Height of a rasterised line, in pixels
    int lineHeight() const;

    /// Horizontal advance of a line of UTF-8 text, in pixels
    int measure(const std::string& text) const;

    /**
     * @brief Rasterise one line of UTF-8 text
     *
     * White pixels with glyph coverage in alpha, rows top to bottom. The
     * result is at least 1 pixel wide so an empty string still yields an image.
     */
    struct Bitmap {
        uint32_t width = 0;
        uint32_t height = 0;
        std::vector<uint8_t> rgba;
    };
    Bitmap rasterize(const std::string& text) const;

private:
    struct Face;

    explicit Font(std::shared_ptr<Face> face) : face_(std::move(face)) {}

    std::shared_ptr<Face> face_;
};

/// Code points of a UTF-8 string; malformed sequences become U+FFFD
std::vector<char32_t> decodeUtf8(const std::string& text);

/**
 * @brief A rasterised line of text that draws like an Image
 */
class Text : public Drawable {
public:
    static Text create(GraphicsContext& ctx, std::string contents, const Font& font);

    const std::string& contents() const { return contents_; }
    uint32_t width() const { return image_.width(); }
    uint32_t height() const { return image_.height(); }
    const Image& image() const { return image_; }

    void drawEx(GraphicsContext& ctx, const DrawParam& param) const override { image_.drawEx(ctx, param); }

    std::optional<BlendMode> blendMode() const override { return image_.blendMode(); }
    void setBlendMode(std::optional<BlendMode> mode) override { image_.setBlendMode(mode); }
    std::optional<Rect> dimensions(const GraphicsContext& ctx) const override { return image_.dimensions(ctx); }

private:
    Text(std::string contents, Image image);

    std::string contents_;
    Image image_;
};

} // namespace fine2d
