#include "fine2d/graphics/types.hpp"

#include <glm/gtc/matrix_transform.hpp>

#include <algorithm>
#include <cmath>

namespace fine2d {

// ============================================================================
// Color
// ============================================================================

const Color Color::WHITE{1.0f, 1.0f, 1.0f, 1.0f};
const Color Color::BLACK{0.0f, 0.0f, 0.0f, 1.0f};
const Color Color::RED{1.0f, 0.0f, 0.0f, 1.0f};
const Color Color::GREEN{0.0f, 1.0f, 0.0f, 1.0f};
const Color Color::BLUE{0.0f, 0.0f, 1.0f, 1.0f};
const Color Color::TRANSPARENT{0.0f, 0.0f, 0.0f, 0.0f};

namespace {

uint8_t toByte(float c) {
    float clamped = std::min(std::max(c, 0.0f), 1.0f);
    return static_cast<uint8_t>(std::lround(clamped * 255.0f));
}

float srgbToLinear(float c) {
    if (c <= 0.04045f) {
        return c / 12.92f;
    }
    return std::pow((c + 0.055f) / 1.055f, 2.4f);
}

} // namespace

Color Color::fromRgba8(uint8_t r, uint8_t g, uint8_t b, uint8_t a) {
    return Color(r / 255.0f, g / 255.0f, b / 255.0f, a / 255.0f);
}

Color Color::fromRgb8(uint8_t r, uint8_t g, uint8_t b) {
    return fromRgba8(r, g, b, 255);
}

Color Color::fromPacked(uint32_t rgba) {
    return fromRgba8(static_cast<uint8_t>(rgba >> 24),
                     static_cast<uint8_t>(rgba >> 16),
                     static_cast<uint8_t>(rgba >> 8),
                     static_cast<uint8_t>(rgba));
}

std::array<uint8_t, 4> Color::toRgba8() const {
    return {toByte(r), toByte(g), toByte(b), toByte(a)};
}

Color Color::toLinear() const {
    return Color(srgbToLinear(r), srgbToLinear(g), srgbToLinear(b), a);
}

Color Color::premultiplied() const {
    Color linear = toLinear();
    return Color(linear.r * a, linear.g * a, linear.b * a, a);
}

// ============================================================================
// Rect
// ============================================================================

bool Rect::contains(Point2 point) const {
    float l = std::min(left(), right());
    float r = std::max(left(), right());
    float t = std::min(top(), bottom());
    float b = std::max(top(), bottom());
    return point.x >= l && point.x <= r && point.y >= t && point.y <= b;
}

// ============================================================================
// DrawParam
// ============================================================================

Matrix4 DrawParam::toMatrix() const {
    Matrix4 shear(1.0f);
    shear[1][0] = shear_.x;  // x += shear.x * y
    shear[0][1] = shear_.y;  // y += shear.y * x

    Matrix4 m = glm::translate(Matrix4(1.0f), glm::vec3(dest_, 0.0f));
    m = glm::translate(m, glm::vec3(offset_, 0.0f));
    m = glm::rotate(m, rotation_, glm::vec3(0.0f, 0.0f, 1.0f));
    m = m * shear;
    m = glm::scale(m, glm::vec3(scale_, 1.0f));
    m = glm::translate(m, glm::vec3(-offset_, 0.0f));
    return m;
}

InstanceProperties InstanceProperties::from(const DrawParam& param, const Matrix4& model) {
    InstanceProperties props;
    props.src = param.src().toCorner();
    props.col1 = model[0];
    props.col2 = model[1];
    props.col3 = model[2];
    props.col4 = model[3];
    props.color = param.color().toLinear().toVec4();
    return props;
}

// ============================================================================
// Blend modes
// ============================================================================

const char* blendModeName(BlendMode mode) {
    switch (mode) {
        case BlendMode::Alpha: return "Alpha";
        case BlendMode::Add: return "Add";
        case BlendMode::Subtract: return "Subtract";
        case BlendMode::Invert: return "Invert";
        case BlendMode::Multiply: return "Multiply";
        case BlendMode::Replace: return "Replace";
        case BlendMode::Lighten: return "Lighten";
        case BlendMode::Darken: return "Darken";
        case BlendMode::Premultiplied: return "Premultiplied";
    }
    return "Unknown";
}

namespace {

VkPipelineColorBlendAttachmentState blendState(VkBlendFactor src, VkBlendFactor dst, VkBlendOp op,
                                               VkBlendFactor srcAlpha, VkBlendFactor dstAlpha,
                                               VkBlendOp alphaOp) {
    VkPipelineColorBlendAttachmentState state{};
    state.blendEnable = VK_TRUE;
    state.srcColorBlendFactor = src;
    state.dstColorBlendFactor = dst;
    state.colorBlendOp = op;
    state.srcAlphaBlendFactor = srcAlpha;
    state.dstAlphaBlendFactor = dstAlpha;
    state.alphaBlendOp = alphaOp;
    state.colorWriteMask = VK_COLOR_COMPONENT_R_BIT | VK_COLOR_COMPONENT_G_BIT |
                           VK_COLOR_COMPONENT_B_BIT | VK_COLOR_COMPONENT_A_BIT;
    return state;
}

} // namespace

VkPipelineColorBlendAttachmentState toBlendState(BlendMode mode) {
    switch (mode) {
        case BlendMode::Add:
            return blendState(VK_BLEND_FACTOR_SRC_ALPHA, VK_BLEND_FACTOR_ONE, VK_BLEND_OP_ADD,
                              VK_BLEND_FACTOR_SRC_ALPHA, VK_BLEND_FACTOR_ONE, VK_BLEND_OP_ADD);
        case BlendMode::Subtract:
            return blendState(VK_BLEND_FACTOR_SRC_ALPHA, VK_BLEND_FACTOR_ONE, VK_BLEND_OP_REVERSE_SUBTRACT,
                              VK_BLEND_FACTOR_SRC_ALPHA, VK_BLEND_FACTOR_ONE, VK_BLEND_OP_REVERSE_SUBTRACT);
        case BlendMode::Invert:
            return blendState(VK_BLEND_FACTOR_ONE, VK_BLEND_FACTOR_ONE, VK_BLEND_OP_SUBTRACT,
                              VK_BLEND_FACTOR_ONE, VK_BLEND_FACTOR_ONE, VK_BLEND_OP_ADD);
        case BlendMode::Multiply:
            return blendState(VK_BLEND_FACTOR_DST_COLOR, VK_BLEND_FACTOR_ZERO, VK_BLEND_OP_ADD,
                              VK_BLEND_FACTOR_DST_ALPHA, VK_BLEND_FACTOR_ZERO, VK_BLEND_OP_ADD);
        case BlendMode::Replace:
            return blendState(VK_BLEND_FACTOR_ONE, VK_BLEND_FACTOR_ZERO, VK_BLEND_OP_ADD,
                              VK_BLEND_FACTOR_ONE, VK_BLEND_FACTOR_ZERO, VK_BLEND_OP_ADD);
        case BlendMode::Lighten:
            return blendState(VK_BLEND_FACTOR_ONE, VK_BLEND_FACTOR_ONE, VK_BLEND_OP_MAX,
                              VK_BLEND_FACTOR_ONE, VK_BLEND_FACTOR_ONE, VK_BLEND_OP_ADD);
        case BlendMode::Darken:
            return blendState(VK_BLEND_FACTOR_ONE, VK_BLEND_FACTOR_ONE, VK_BLEND_OP_MIN,
                              VK_BLEND_FACTOR_ONE, VK_BLEND_FACTOR_ONE, VK_BLEND_OP_ADD);
        case BlendMode::Premultiplied:
            return blendState(VK_BLEND_FACTOR_ONE, VK_BLEND_FACTOR_ONE_MINUS_SRC_ALPHA, VK_BLEND_OP_ADD,
                              VK_BLEND_FACTOR_ONE, VK_BLEND_FACTOR_ONE_MINUS_SRC_ALPHA, VK_BLEND_OP_ADD);
        case BlendMode::Alpha:
        default:
            return blendState(VK_BLEND_FACTOR_SRC_ALPHA, VK_BLEND_FACTOR_ONE_MINUS_SRC_ALPHA, VK_BLEND_OP_ADD,
                              VK_BLEND_FACTOR_ONE, VK_BLEND_FACTOR_ONE_MINUS_SRC_ALPHA, VK_BLEND_OP_ADD);
    }
}

// ============================================================================
// Sampling
// ============================================================================

VkFilter toVkFilter(FilterMode mode) {
    return mode == FilterMode::Nearest ? VK_FILTER_NEAREST : VK_FILTER_LINEAR;
}

VkSamplerAddressMode toVkAddressMode(WrapMode mode) {
    switch (mode) {
        case WrapMode::Tile: return VK_SAMPLER_ADDRESS_MODE_REPEAT;
        case WrapMode::Mirror: return VK_SAMPLER_ADDRESS_MODE_MIRRORED_REPEAT;
        case WrapMode::Border: return VK_SAMPLER_ADDRESS_MODE_CLAMP_TO_BORDER;
        case WrapMode::Clamp:
        default: return VK_SAMPLER_ADDRESS_MODE_CLAMP_TO_EDGE;
    }
}

} // namespace fine2d
