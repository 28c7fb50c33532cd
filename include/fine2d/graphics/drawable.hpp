#pragma once

#include "fine2d/graphics/types.hpp"

#include <optional>

namespace fine2d {

class GraphicsContext;

/**
 * @brief Anything that can be drawn with a DrawParam
 */
class Drawable {
public:
    virtual ~Drawable() = default;

    /// Draw with full control over placement
    virtual void drawEx(GraphicsContext& ctx, const DrawParam& param) const = 0;

    /// Draw at a position with a rotation
    void draw(GraphicsContext& ctx, Point2 dest, float rotation = 0.0f) const {
        drawEx(ctx, DrawParam().dest(dest).rotation(rotation));
    }

    /// Blend mode used instead of the current shader's while this is drawn
    virtual std::optional<BlendMode> blendMode() const = 0;
    virtual void setBlendMode(std::optional<BlendMode> mode) = 0;

    /// Bounds in local coordinates, if the drawable knows them
    virtual std::optional<Rect> dimensions(const GraphicsContext& /*ctx*/) const { return std::nullopt; }
};

void draw(GraphicsContext& ctx, const Drawable& drawable, Point2 dest, float rotation = 0.0f);
void drawEx(GraphicsContext& ctx, const Drawable& drawable, const DrawParam& param);

/**
 * @brief Applies a drawable's blend override for one draw, then restores the shader's mode
 */
class BlendModeScope {
public:
    BlendModeScope(GraphicsContext& ctx, std::optional<BlendMode> mode);
    ~BlendModeScope();

    BlendModeScope(const BlendModeScope&) = delete;
    BlendModeScope& operator=(const BlendModeScope&) = delete;

private:
    GraphicsContext& ctx_;
    std::optional<BlendMode> previous_;
};

} // namespace fine2d
