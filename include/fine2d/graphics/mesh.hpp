#pragma once

#include "fine2d/core/types.hpp"
#include "fine2d/graphics/drawable.hpp"
#include "fine2d/graphics/types.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace fine2d {

/**
 * @brief Whether a shape is filled or outlined
 */
class DrawMode {
public:
    static DrawMode fill() { return DrawMode(false, 0.0f); }
    static DrawMode stroke(float width) { return DrawMode(true, width); }

    bool isFill() const { return !stroke_; }
    bool isStroke() const { return stroke_; }

    /// Line width of a stroke, 0 for fills
    float width() const { return width_; }

private:
    DrawMode(bool stroke, float width) : stroke_(stroke), width_(width) {}

    bool stroke_;
    float width_;
};

/// Segments needed to keep a circle of this radius within tolerance of the true curve
uint32_t circleSegments(float radius, float tolerance);

/**
 * @brief Triangulate a simple polygon by ear clipping
 *
 * Accepts either winding. Returns three indices into points per triangle.
 * Throws ResourceLoadError for fewer than three points or a polygon with
 * no ear left to clip (self-intersecting outlines).
 */
std::vector<uint32_t> triangulatePolygon(const std::vector<Point2>& points);

/**
 * @brief Accumulates colored triangles on the CPU
 *
 * Colors are given in sRGB and stored linear, matching instance colors.
 *
 * @code
 * Mesh mesh = MeshBuilder()
 *     .rectangle(DrawMode::fill(), Rect::fromCorner(0, 0, 64, 16), Color::RED)
 *     .circle(DrawMode::stroke(2.0f), {32, 8}, 6.0f, 0.1f, Color::WHITE)
 *     .build(ctx);
 * @endcode
 */
class MeshBuilder {
public:
    MeshBuilder() = default;

    MeshBuilder& rectangle(DrawMode mode, const Rect& rect, const Color& color);

    MeshBuilder& circle(DrawMode mode, Point2 center, float radius, float tolerance, const Color& color);

    MeshBuilder& ellipse(DrawMode mode, Point2 center, float radiusX, float radiusY,
                         float tolerance, const Color& color);

    /// Closed outline through the points; fills are ear clipped
    MeshBuilder& polygon(DrawMode mode, const std::vector<Point2>& points, const Color& color);

    /// Open polyline of the given width
    MeshBuilder& line(const std::vector<Point2>& points, float width, const Color& color);

    /// Every three points form one triangle
    MeshBuilder& triangles(const std::vector<Point2>& points, const Color& color);

    /// Raw geometry; indices are relative to the vertices given here
    MeshBuilder& raw(const std::vector<Vertex>& vertices, const std::vector<uint32_t>& indices);

    const std::vector<Vertex>& vertices() const { return vertices_; }
    const std::vector<uint32_t>& indices() const { return indices_; }
    bool empty() const { return indices_.empty(); }

    /// Upload into a drawable mesh; ResourceLoadError when nothing was added
    class Mesh build(GraphicsContext& ctx) const;

private:
    uint32_t addVertex(Point2 pos, const Color& linear);
    void fillConvex(const std::vector<Point2>& outline, const Color& color);
    void strokeOutline(const std::vector<Point2>& points, bool closed, float width, const Color& color);

    std::vector<Vertex> vertices_;
    std::vector<uint32_t> indices_;
};

/**
 * @brief Colored geometry in GPU-only buffers
 *
 * Drawn with the 1x1 white texture, so the vertex colors times the
 * DrawParam color is what appears.
 */
class Mesh : public Drawable {
public:
    /// Validate and upload vertices and 32-bit indices
    static Mesh fromData(GraphicsContext& ctx, const std::vector<Vertex>& vertices,
                         const std::vector<uint32_t>& indices);

    static Mesh newRectangle(GraphicsContext& ctx, DrawMode mode, const Rect& rect, const Color& color);
    static Mesh newCircle(GraphicsContext& ctx, DrawMode mode, Point2 center, float radius,
                          float tolerance, const Color& color);
    static Mesh newLine(GraphicsContext& ctx, const std::vector<Point2>& points, float width,
                        const Color& color);
    static Mesh newPolygon(GraphicsContext& ctx, DrawMode mode, const std::vector<Point2>& points,
                           const Color& color);

    uint32_t vertexCount() const { return vertexCount_; }
    uint32_t indexCount() const { return indexCount_; }

    /// Axis-aligned bounds of the vertices
    const Rect& bounds() const { return bounds_; }

    void drawEx(GraphicsContext& ctx, const DrawParam& param) const override;

    std::optional<BlendMode> blendMode() const override { return blendMode_; }
    void setBlendMode(std::optional<BlendMode> mode) override { blendMode_ = mode; }
    std::optional<Rect> dimensions(const GraphicsContext& /*ctx*/) const override { return bounds_; }

private:
    Mesh() = default;

    BufferRef vertexBuffer_;
    BufferRef indexBuffer_;
    uint32_t vertexCount_ = 0;
    uint32_t indexCount_ = 0;
    Rect bounds_;
    std::optional<BlendMode> blendMode_;
};

// ============================================================================
// Immediate shapes
// ============================================================================

void rectangle(GraphicsContext& ctx, DrawMode mode, const Rect& rect, const Color& color);
void circle(GraphicsContext& ctx, DrawMode mode, Point2 center, float radius, float tolerance,
            const Color& color);
void ellipse(GraphicsContext& ctx, DrawMode mode, Point2 center, float radiusX, float radiusY,
             float tolerance, const Color& color);
void line(GraphicsContext& ctx, const std::vector<Point2>& points, float width, const Color& color);

/// Square dots of the given size centred on each point
void points(GraphicsContext& ctx, const std::vector<Point2>& points, float size, const Color& color);

void polygon(GraphicsContext& ctx, DrawMode mode, const std::vector<Point2>& points, const Color& color);

} // namespace fine2d
