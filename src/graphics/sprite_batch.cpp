#include "fine2d/graphics/sprite_batch.hpp"
#include "fine2d/graphics/graphics_context.hpp"

#include <glm/gtc/matrix_transform.hpp>

#include <stdexcept>

namespace fine2d {

SpriteBatch::SpriteBatch(Image image)
    : image_(std::move(image)) {
}

size_t SpriteBatch::add(const DrawParam& param) {
    sprites_.push_back(param);
    return sprites_.size() - 1;
}

void SpriteBatch::set(size_t index, const DrawParam& param) {
    if (index >= sprites_.size()) {
        throw std::out_of_range("SpriteBatch index " + std::to_string(index) + " out of range (size " +
                                std::to_string(sprites_.size()) + ")");
    }
    sprites_[index] = param;
}

const DrawParam& SpriteBatch::get(size_t index) const {
    if (index >= sprites_.size()) {
        throw std::out_of_range("SpriteBatch index " + std::to_string(index) + " out of range (size " +
                                std::to_string(sprites_.size()) + ")");
    }
    return sprites_[index];
}

void SpriteBatch::drawEx(GraphicsContext& ctx, const DrawParam& param) const {
    if (sprites_.empty()) {
        return;
    }

    BlendModeScope blend(ctx, blendMode_ ? blendMode_ : image_.blendMode());

    Matrix4 batchMatrix = param.toMatrix();
    const Color& batchColor = param.color();
    float width = static_cast<float>(image_.width());
    float height = static_cast<float>(image_.height());

    std::vector<InstanceProperties> instances;
    instances.reserve(sprites_.size());
    for (const DrawParam& sprite : sprites_) {
        const Rect& src = sprite.src();
        Matrix4 model = glm::scale(batchMatrix * sprite.toMatrix(),
                                   glm::vec3(src.w * width, src.h * height, 1.0f));

        const Color& c = sprite.color();
        DrawParam combined = sprite;
        combined.color(Color(c.r * batchColor.r, c.g * batchColor.g, c.b * batchColor.b, c.a * batchColor.a));
        instances.push_back(InstanceProperties::from(combined, model));
    }

    ctx.writeInstances(instances);
    ctx.bindTexture(image_.texture(), image_.samplerInfo());
    ctx.draw();
}

} // namespace fine2d
