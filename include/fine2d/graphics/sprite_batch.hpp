#pragma once

#include "fine2d/graphics/drawable.hpp"
#include "fine2d/graphics/image.hpp"
#include "fine2d/graphics/types.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace fine2d {

/**
 * @brief Many copies of one image drawn with a single instanced draw
 *
 * Each sprite's DrawParam is placed inside the DrawParam the batch itself is
 * drawn with, and the two colors multiply.
 */
class SpriteBatch : public Drawable {
public:
    explicit SpriteBatch(Image image);

    /// Add a sprite; returns its index
    size_t add(const DrawParam& param);

    /// Replace a sprite; std::out_of_range for an unknown index
    void set(size_t index, const DrawParam& param);

    const DrawParam& get(size_t index) const;

    void clear() { sprites_.clear(); }
    size_t size() const { return sprites_.size(); }
    bool empty() const { return sprites_.empty(); }

    const Image& image() const { return image_; }
    void setImage(Image image) { image_ = std::move(image); }

    void drawEx(GraphicsContext& ctx, const DrawParam& param) const override;

    std::optional<BlendMode> blendMode() const override { return blendMode_; }
    void setBlendMode(std::optional<BlendMode> mode) override { blendMode_ = mode; }

private:
    Image image_;
    std::vector<DrawParam> sprites_;
    std::optional<BlendMode> blendMode_;
};

} // namespace fine2d
