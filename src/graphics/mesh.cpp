#include "fine2d/graphics/mesh.hpp"
#include "fine2d/graphics/graphics_context.hpp"
#include "fine2d/device/buffer.hpp"
#include "fine2d/core/error.hpp"
#include "fine2d/core/logging.hpp"

#include <glm/gtc/constants.hpp>

#include <algorithm>
#include <cmath>
#include <limits>

namespace fine2d {

namespace {

constexpr uint32_t MIN_CIRCLE_SEGMENTS = 3;
constexpr uint32_t MAX_CIRCLE_SEGMENTS = 1024;

// Miters longer than this many half-widths are clamped
constexpr float MITER_LIMIT = 4.0f;

float cross(Point2 a, Point2 b) {
    return a.x * b.y - a.y * b.x;
}

float signedArea(const std::vector<Point2>& points) {
    float area = 0.0f;
    for (size_t i = 0, j = points.size() - 1; i < points.size(); j = i++) {
        area += cross(points[j], points[i]);
    }
    return area * 0.5f;
}

bool insideTriangle(Point2 p, Point2 a, Point2 b, Point2 c) {
    // Strictly inside; points on an edge do not block an ear
    float d1 = cross(b - a, p - a);
    float d2 = cross(c - b, p - b);
    float d3 = cross(a - c, p - c);
    return d1 > 0.0f && d2 > 0.0f && d3 > 0.0f;
}

Point2 edgeNormal(Point2 from, Point2 to) {
    Point2 d = to - from;
    float len = glm::length(d);
    if (len <= std::numeric_limits<float>::epsilon()) {
        return {0.0f, 0.0f};
    }
    return Point2(-d.y, d.x) / len;
}

std::vector<Point2> ellipseOutline(Point2 center, float radiusX, float radiusY, float tolerance) {
    uint32_t segments = circleSegments(std::max(radiusX, radiusY), tolerance);
    std::vector<Point2> outline;
    outline.reserve(segments);
    for (uint32_t i = 0; i < segments; ++i) {
        float angle = glm::two_pi<float>() * static_cast<float>(i) / static_cast<float>(segments);
        outline.emplace_back(center.x + radiusX * std::cos(angle), center.y + radiusY * std::sin(angle));
    }
    return outline;
}

void requireStrokeWidth(DrawMode mode) {
    if (mode.isStroke() && !(mode.width() > 0.0f)) {
        throw ResourceLoadError("Stroke width must be positive");
    }
}

} // namespace

uint32_t circleSegments(float radius, float tolerance) {
    if (!(radius > 0.0f)) {
        throw ResourceLoadError("Circle radius must be positive");
    }
    if (!(tolerance > 0.0f) || tolerance >= radius) {
        return MIN_CIRCLE_SEGMENTS;
    }
    double segments = std::ceil(glm::pi<double>() / std::acos(1.0 - tolerance / radius));
    return static_cast<uint32_t>(std::clamp(segments, static_cast<double>(MIN_CIRCLE_SEGMENTS),
                                            static_cast<double>(MAX_CIRCLE_SEGMENTS)));
}

std::vector<uint32_t> triangulatePolygon(const std::vector<Point2>& points) {
    if (points.size() < 3) {
        throw ResourceLoadError("A polygon needs at least three points (got " +
                                std::to_string(points.size()) + ")");
    }

    std::vector<uint32_t> remaining(points.size());
    for (uint32_t i = 0; i < remaining.size(); ++i) {
        remaining[i] = i;
    }
    if (signedArea(points) < 0.0f) {
        std::reverse(remaining.begin(), remaining.end());
    }

    std::vector<uint32_t> triangles;
    triangles.reserve((points.size() - 2) * 3);

    while (remaining.size() > 3) {
        size_t n = remaining.size();
        bool clipped = false;

        for (size_t i = 0; i < n && !clipped; ++i) {
            uint32_t ia = remaining[(i + n - 1) % n];
            uint32_t ib = remaining[i];
            uint32_t ic = remaining[(i + 1) % n];
            Point2 a = points[ia];
            Point2 b = points[ib];
            Point2 c = points[ic];

            if (cross(b - a, c - b) <= 0.0f) {
                continue;
            }

            bool blocked = false;
            for (uint32_t other : remaining) {
                if (other != ia && other != ib && other != ic && insideTriangle(points[other], a, b, c)) {
                    blocked = true;
                    break;
                }
            }
            if (blocked) {
                continue;
            }

            triangles.insert(triangles.end(), {ia, ib, ic});
            remaining.erase(remaining.begin() + static_cast<std::ptrdiff_t>(i));
            clipped = true;
        }

        if (!clipped) {
            // Collinear vertices have no area to contribute; drop one and retry
            for (size_t i = 0; i < n && !clipped; ++i) {
                Point2 a = points[remaining[(i + n - 1) % n]];
                Point2 b = points[remaining[i]];
                Point2 c = points[remaining[(i + 1) % n]];
                if (std::abs(cross(b - a, c - b)) <= std::numeric_limits<float>::epsilon()) {
                    remaining.erase(remaining.begin() + static_cast<std::ptrdiff_t>(i));
                    clipped = true;
                }
            }
        }

        if (!clipped) {
            throw ResourceLoadError("Polygon could not be triangulated; is the outline self-intersecting?");
        }
    }

    triangles.insert(triangles.end(), {remaining[0], remaining[1], remaining[2]});
    return triangles;
}

// ============================================================================
// MeshBuilder
// ============================================================================

uint32_t MeshBuilder::addVertex(Point2 pos, const Color& linear) {
    Vertex v;
    v.pos = pos;
    v.uv = pos;
    v.color = linear.toVec4();
    vertices_.push_back(v);
    return static_cast<uint32_t>(vertices_.size() - 1);
}

void MeshBuilder::fillConvex(const std::vector<Point2>& outline, const Color& color) {
    Color linear = color.toLinear();
    uint32_t first = static_cast<uint32_t>(vertices_.size());
    for (Point2 p : outline) {
        addVertex(p, linear);
    }
    for (uint32_t i = 1; i + 1 < outline.size(); ++i) {
        indices_.insert(indices_.end(), {first, first + i, first + i + 1});
    }
}

void MeshBuilder::strokeOutline(const std::vector<Point2>& points, bool closed, float width,
                                const Color& color) {
    Color linear = color.toLinear();
    float halfWidth = width * 0.5f;
    size_t n = points.size();
    uint32_t first = static_cast<uint32_t>(vertices_.size());

    for (size_t i = 0; i < n; ++i) {
        bool hasPrev = closed || i > 0;
        bool hasNext = closed || i + 1 < n;
        Point2 current = points[i];
        Point2 normalIn = hasPrev ? edgeNormal(points[(i + n - 1) % n], current) : Point2(0.0f);
        Point2 normalOut = hasNext ? edgeNormal(current, points[(i + 1) % n]) : Point2(0.0f);

        Point2 offset;
        if (!hasPrev) {
            offset = normalOut * halfWidth;
        } else if (!hasNext) {
            offset = normalIn * halfWidth;
        } else {
            Point2 miter = normalIn + normalOut;
            float len = glm::length(miter);
            if (len <= std::numeric_limits<float>::epsilon()) {
                offset = normalOut * halfWidth;
            } else {
                miter /= len;
                float denom = glm::dot(miter, normalOut);
                float scale = denom > 1.0f / MITER_LIMIT ? halfWidth / denom : halfWidth * MITER_LIMIT;
                offset = miter * scale;
            }
        }

        addVertex(current + offset, linear);
        addVertex(current - offset, linear);
    }

    size_t segments = closed ? n : n - 1;
    for (size_t i = 0; i < segments; ++i) {
        uint32_t a = first + static_cast<uint32_t>(i * 2);
        uint32_t b = first + static_cast<uint32_t>(((i + 1) % n) * 2);
        indices_.insert(indices_.end(), {a, a + 1, b + 1, a, b + 1, b});
    }
}

MeshBuilder& MeshBuilder::rectangle(DrawMode mode, const Rect& rect, const Color& color) {
    requireStrokeWidth(mode);
    std::vector<Point2> corners = {
        {rect.left(), rect.top()},
        {rect.right(), rect.top()},
        {rect.right(), rect.bottom()},
        {rect.left(), rect.bottom()},
    };
    if (mode.isFill()) {
        fillConvex(corners, color);
    } else {
        strokeOutline(corners, true, mode.width(), color);
    }
    return *this;
}

MeshBuilder& MeshBuilder::circle(DrawMode mode, Point2 center, float radius, float tolerance,
                                 const Color& color) {
    return ellipse(mode, center, radius, radius, tolerance, color);
}

MeshBuilder& MeshBuilder::ellipse(DrawMode mode, Point2 center, float radiusX, float radiusY,
                                  float tolerance, const Color& color) {
    requireStrokeWidth(mode);
    if (!(radiusX > 0.0f) || !(radiusY > 0.0f)) {
        throw ResourceLoadError("Ellipse radii must be positive");
    }
    auto outline = ellipseOutline(center, radiusX, radiusY, tolerance);
    if (mode.isFill()) {
        fillConvex(outline, color);
    } else {
        strokeOutline(outline, true, mode.width(), color);
    }
    return *this;
}

MeshBuilder& MeshBuilder::polygon(DrawMode mode, const std::vector<Point2>& points, const Color& color) {
    requireStrokeWidth(mode);
    if (points.size() < 3) {
        throw ResourceLoadError("A polygon needs at least three points (got " +
                                std::to_string(points.size()) + ")");
    }
    if (mode.isStroke()) {
        strokeOutline(points, true, mode.width(), color);
        return *this;
    }

    auto triangles = triangulatePolygon(points);
    Color linear = color.toLinear();
    uint32_t first = static_cast<uint32_t>(vertices_.size());
    for (Point2 p : points) {
        addVertex(p, linear);
    }
    for (uint32_t index : triangles) {
        indices_.push_back(first + index);
    }
    return *this;
}

MeshBuilder& MeshBuilder::line(const std::vector<Point2>& points, float width, const Color& color) {
    if (points.size() < 2) {
        throw ResourceLoadError("A line needs at least two points (got " +
                                std::to_string(points.size()) + ")");
    }
    requireStrokeWidth(DrawMode::stroke(width));
    strokeOutline(points, false, width, color);
    return *this;
}

MeshBuilder& MeshBuilder::triangles(const std::vector<Point2>& points, const Color& color) {
    if (points.size() % 3 != 0) {
        throw ResourceLoadError("Triangle list length must be a multiple of three (got " +
                                std::to_string(points.size()) + ")");
    }
    Color linear = color.toLinear();
    for (Point2 p : points) {
        indices_.push_back(addVertex(p, linear));
    }
    return *this;
}

MeshBuilder& MeshBuilder::raw(const std::vector<Vertex>& vertices, const std::vector<uint32_t>& indices) {
    uint32_t first = static_cast<uint32_t>(vertices_.size());
    for (uint32_t index : indices) {
        if (index >= vertices.size()) {
            throw ResourceLoadError("Mesh index " + std::to_string(index) + " out of range for " +
                                    std::to_string(vertices.size()) + " vertices");
        }
        indices_.push_back(first + index);
    }
    vertices_.insert(vertices_.end(), vertices.begin(), vertices.end());
    return *this;
}

Mesh MeshBuilder::build(GraphicsContext& ctx) const {
    return Mesh::fromData(ctx, vertices_, indices_);
}

// ============================================================================
// Mesh
// ============================================================================

Mesh Mesh::fromData(GraphicsContext& ctx, const std::vector<Vertex>& vertices,
                    const std::vector<uint32_t>& indices) {
    if (vertices.empty() || indices.empty()) {
        throw ResourceLoadError("Cannot build an empty mesh");
    }
    if (indices.size() % 3 != 0) {
        throw ResourceLoadError("Mesh index count must be a multiple of three (got " +
                                std::to_string(indices.size()) + ")");
    }
    for (uint32_t index : indices) {
        if (index >= vertices.size()) {
            throw ResourceLoadError("Mesh index " + std::to_string(index) + " out of range for " +
                                    std::to_string(vertices.size()) + " vertices");
        }
    }

    Mesh mesh;
    mesh.vertexCount_ = static_cast<uint32_t>(vertices.size());
    mesh.indexCount_ = static_cast<uint32_t>(indices.size());

    VkDeviceSize vertexBytes = vertices.size() * sizeof(Vertex);
    VkDeviceSize indexBytes = indices.size() * sizeof(uint32_t);
    mesh.vertexBuffer_ = Buffer::createVertexBuffer(ctx.device(), vertexBytes);
    mesh.vertexBuffer_->upload(vertices.data(), vertexBytes, ctx.commandPool());
    mesh.indexBuffer_ = Buffer::createIndexBuffer(ctx.device(), indexBytes);
    mesh.indexBuffer_->upload(indices.data(), indexBytes, ctx.commandPool());

    glm::vec2 lo = vertices.front().pos;
    glm::vec2 hi = lo;
    for (const auto& v : vertices) {
        lo = glm::min(lo, v.pos);
        hi = glm::max(hi, v.pos);
    }
    mesh.bounds_ = Rect::fromCorner(lo.x, lo.y, hi.x - lo.x, hi.y - lo.y);

    FINE2D_TRACE(LogCategory::Render, "Mesh uploaded: " + std::to_string(mesh.vertexCount_) +
                 " vertices, " + std::to_string(mesh.indexCount_) + " indices");
    return mesh;
}

Mesh Mesh::newRectangle(GraphicsContext& ctx, DrawMode mode, const Rect& rect, const Color& color) {
    return MeshBuilder().rectangle(mode, rect, color).build(ctx);
}

Mesh Mesh::newCircle(GraphicsContext& ctx, DrawMode mode, Point2 center, float radius,
                     float tolerance, const Color& color) {
    return MeshBuilder().circle(mode, center, radius, tolerance, color).build(ctx);
}

Mesh Mesh::newLine(GraphicsContext& ctx, const std::vector<Point2>& points, float width,
                   const Color& color) {
    return MeshBuilder().line(points, width, color).build(ctx);
}

Mesh Mesh::newPolygon(GraphicsContext& ctx, DrawMode mode, const std::vector<Point2>& points,
                      const Color& color) {
    return MeshBuilder().polygon(mode, points, color).build(ctx);
}

void Mesh::drawEx(GraphicsContext& ctx, const DrawParam& param) const {
    BlendModeScope blend(ctx, blendMode_);

    ctx.updateInstanceProperties(param);
    ctx.bindWhiteTexture();

    DrawSlice slice;
    slice.vertices = vertexBuffer_;
    slice.indices = indexBuffer_;
    slice.indexCount = indexCount_;
    ctx.draw(slice);
}

// ============================================================================
// Immediate shapes
// ============================================================================

void rectangle(GraphicsContext& ctx, DrawMode mode, const Rect& rect, const Color& color) {
    Mesh::newRectangle(ctx, mode, rect, color).drawEx(ctx, DrawParam());
}

void circle(GraphicsContext& ctx, DrawMode mode, Point2 center, float radius, float tolerance,
            const Color& color) {
    Mesh::newCircle(ctx, mode, center, radius, tolerance, color).drawEx(ctx, DrawParam());
}

void ellipse(GraphicsContext& ctx, DrawMode mode, Point2 center, float radiusX, float radiusY,
             float tolerance, const Color& color) {
    MeshBuilder().ellipse(mode, center, radiusX, radiusY, tolerance, color).build(ctx).drawEx(ctx, DrawParam());
}

void line(GraphicsContext& ctx, const std::vector<Point2>& points, float width, const Color& color) {
    Mesh::newLine(ctx, points, width, color).drawEx(ctx, DrawParam());
}

void points(GraphicsContext& ctx, const std::vector<Point2>& points, float size, const Color& color) {
    if (points.empty()) {
        return;
    }
    MeshBuilder builder;
    for (Point2 p : points) {
        builder.rectangle(DrawMode::fill(), Rect(p.x, p.y, size, size), color);
    }
    builder.build(ctx).drawEx(ctx, DrawParam());
}

void polygon(GraphicsContext& ctx, DrawMode mode, const std::vector<Point2>& points, const Color& color) {
    Mesh::newPolygon(ctx, mode, points, color).drawEx(ctx, DrawParam());
}

} // namespace fine2d
