#include "fine2d/graphics/drawable.hpp"
#include "fine2d/graphics/graphics_context.hpp"

namespace fine2d {

void draw(GraphicsContext& ctx, const Drawable& drawable, Point2 dest, float rotation) {
    drawable.draw(ctx, dest, rotation);
}

void drawEx(GraphicsContext& ctx, const Drawable& drawable, const DrawParam& param) {
    drawable.drawEx(ctx, param);
}

BlendModeScope::BlendModeScope(GraphicsContext& ctx, std::optional<BlendMode> mode)
    : ctx_(ctx) {
    if (mode) {
        BlendMode current = ctx_.blendMode();
        if (current != *mode) {
            ctx_.setBlendMode(*mode);
            previous_ = current;
        }
    }
}

BlendModeScope::~BlendModeScope() {
    if (previous_) {
        // The previous mode was already active on this shader, so it is allowed
        ctx_.setBlendMode(*previous_);
    }
}

} // namespace fine2d
