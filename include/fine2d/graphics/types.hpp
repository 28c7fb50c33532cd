#pragma once

#include <vulkan/vulkan.h>
#include <glm/glm.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>

namespace fine2d {

using Point2 = glm::vec2;
using Vector2 = glm::vec2;
using Matrix4 = glm::mat4;

// ============================================================================
// Color
// ============================================================================

/**
 * @brief RGBA color in sRGB space, components nominally in [0, 1]
 *
 * Components are not clamped on construction; toRgba8() clamps.
 */
struct Color {
    float r = 1.0f;
    float g = 1.0f;
    float b = 1.0f;
    float a = 1.0f;

    constexpr Color() = default;
    constexpr Color(float red, float green, float blue, float alpha = 1.0f)
        : r(red), g(green), b(blue), a(alpha) {}

    static Color fromRgba8(uint8_t r, uint8_t g, uint8_t b, uint8_t a);
    static Color fromRgb8(uint8_t r, uint8_t g, uint8_t b);

    /// From 0xRRGGBBAA
    static Color fromPacked(uint32_t rgba);

    std::array<uint8_t, 4> toRgba8() const;

    /// sRGB to linear per color channel; alpha unchanged
    Color toLinear() const;

    /// Linear color with RGB multiplied by alpha
    Color premultiplied() const;

    glm::vec4 toVec4() const { return {r, g, b, a}; }

    bool operator==(const Color& other) const {
        return r == other.r && g == other.g && b == other.b && a == other.a;
    }
    bool operator!=(const Color& other) const { return !(*this == other); }

    static const Color WHITE;
    static const Color BLACK;
    static const Color RED;
    static const Color GREEN;
    static const Color BLUE;
    static const Color TRANSPARENT;
};

// ============================================================================
// Rect
// ============================================================================

/**
 * @brief Axis-aligned rectangle described by its centre and size
 *
 * Width and height may be negative, which mirrors whatever the rect maps.
 */
struct Rect {
    float x = 0.0f;
    float y = 0.0f;
    float w = 0.0f;
    float h = 0.0f;

    constexpr Rect() = default;
    constexpr Rect(float cx, float cy, float width, float height)
        : x(cx), y(cy), w(width), h(height) {}

    /// The unit rect covering [0,1]x[0,1]
    static constexpr Rect one() { return Rect(0.5f, 0.5f, 1.0f, 1.0f); }

    /// Rect from its top-left corner
    static constexpr Rect fromCorner(float left, float top, float width, float height) {
        return Rect(left + width * 0.5f, top + height * 0.5f, width, height);
    }

    float left() const { return x - w * 0.5f; }
    float right() const { return x + w * 0.5f; }
    float top() const { return y - h * 0.5f; }
    float bottom() const { return y + h * 0.5f; }
    Point2 center() const { return {x, y}; }

    bool contains(Point2 point) const;

    /// (left, top, w, h), the form shaders consume
    glm::vec4 toCorner() const { return {left(), top(), w, h}; }

    bool operator==(const Rect& other) const {
        return x == other.x && y == other.y && w == other.w && h == other.h;
    }
    bool operator!=(const Rect& other) const { return !(*this == other); }
};

// ============================================================================
// DrawParam
// ============================================================================

/**
 * @brief How to place a drawable: source region, transform and tint
 *
 * @code
 * image.drawEx(ctx, DrawParam().dest({100, 50}).rotation(0.5f).color(Color::RED));
 * @endcode
 */
class DrawParam {
public:
    DrawParam() = default;

    DrawParam& src(const Rect& rect) { src_ = rect; return *this; }
    DrawParam& dest(Point2 point) { dest_ = point; return *this; }
    DrawParam& rotation(float radians) { rotation_ = radians; return *this; }
    DrawParam& scale(Vector2 factors) { scale_ = factors; return *this; }
    DrawParam& offset(Point2 pivot) { offset_ = pivot; return *this; }
    DrawParam& shear(Point2 amount) { shear_ = amount; return *this; }
    DrawParam& color(const Color& tint) { color_ = tint; return *this; }

    const Rect& src() const { return src_; }
    Point2 dest() const { return dest_; }
    float rotation() const { return rotation_; }
    Vector2 scale() const { return scale_; }
    Point2 offset() const { return offset_; }
    Point2 shear() const { return shear_; }
    const Color& color() const { return color_; }

    /// T(dest) * T(offset) * R(rotation) * Shear * S(scale) * T(-offset)
    Matrix4 toMatrix() const;

private:
    Rect src_ = Rect::one();
    Point2 dest_{0.0f, 0.0f};
    float rotation_ = 0.0f;
    Vector2 scale_{1.0f, 1.0f};
    Point2 offset_{0.0f, 0.0f};
    Point2 shear_{0.0f, 0.0f};
    Color color_{1.0f, 1.0f, 1.0f, 1.0f};
};

// ============================================================================
// GPU records
// ============================================================================

/**
 * @brief Per-instance record read by the vertex shader (binding 1)
 */
struct InstanceProperties {
    glm::vec4 src;
    glm::vec4 col1;
    glm::vec4 col2;
    glm::vec4 col3;
    glm::vec4 col4;
    glm::vec4 color;

    /// Source rect in corner form, model matrix columns, linear color
    static InstanceProperties from(const DrawParam& param, const Matrix4& model);
    static InstanceProperties from(const DrawParam& param) { return from(param, param.toMatrix()); }

    Matrix4 model() const { return Matrix4(col1, col2, col3, col4); }
};
static_assert(sizeof(InstanceProperties) == 96, "InstanceProperties layout must match the shader");

/**
 * @brief Mesh vertex (binding 0)
 */
struct Vertex {
    glm::vec2 pos;
    glm::vec2 uv;
    glm::vec4 color;
};
static_assert(sizeof(Vertex) == 32, "Vertex layout must match the shader");

// ============================================================================
// Blending and sampling
// ============================================================================

enum class BlendMode : uint32_t {
    Alpha,
    Add,
    Subtract,
    Invert,
    Multiply,
    Replace,
    Lighten,
    Darken,
    Premultiplied
};

constexpr size_t BLEND_MODE_COUNT = 9;

const char* blendModeName(BlendMode mode);

/// Fixed color blend state of a blend mode
VkPipelineColorBlendAttachmentState toBlendState(BlendMode mode);

enum class FilterMode : uint32_t {
    Linear,
    Nearest
};

enum class WrapMode : uint32_t {
    Clamp,
    Tile,
    Mirror,
    Border
};

/**
 * @brief Sampler description; equal infos share one Vulkan sampler
 */
struct SamplerInfo {
    FilterMode filter = FilterMode::Linear;
    WrapMode wrapX = WrapMode::Clamp;
    WrapMode wrapY = WrapMode::Clamp;

    static SamplerInfo withFilter(FilterMode filter) {
        SamplerInfo info;
        info.filter = filter;
        return info;
    }

    bool operator==(const SamplerInfo& other) const {
        return filter == other.filter && wrapX == other.wrapX && wrapY == other.wrapY;
    }
    bool operator!=(const SamplerInfo& other) const { return !(*this == other); }
};

VkFilter toVkFilter(FilterMode mode);
VkSamplerAddressMode toVkAddressMode(WrapMode mode);

} // namespace fine2d

template <>
struct std::hash<fine2d::SamplerInfo> {
    size_t operator()(const fine2d::SamplerInfo& info) const noexcept {
        return static_cast<size_t>(info.filter) |
               (static_cast<size_t>(info.wrapX) << 4) |
               (static_cast<size_t>(info.wrapY) << 8);
    }
};
