/**
 * @file test_types.cpp
 * @brief CPU-side tests - value types, matrix stacks, configuration, tessellation
 *
 * This test verifies:
 * - Color conversions between bytes, packed values and linear space
 * - Rect geometry and DrawParam matrix composition
 * - Instance record layout
 * - MatrixStack push/pop discipline
 * - Conf defaults and sample count parsing
 * - Mesh tessellation (circles, ear clipping, strokes)
 * - UTF-8 decoding and PNG encoding
 *
 * Nothing here needs a window or a GPU.
 */

#include <fine2d/core/conf.hpp>
#include <fine2d/core/error.hpp>
#include <fine2d/graphics/types.hpp>
#include <fine2d/graphics/matrix_stack.hpp>
#include <fine2d/graphics/mesh.hpp>
#include <fine2d/graphics/image.hpp>
#include <fine2d/graphics/text.hpp>

#include <glm/gtc/matrix_transform.hpp>
#include <glm/gtc/constants.hpp>

#include <iostream>
#include <cassert>
#include <cmath>
#include <unordered_set>

using namespace fine2d;

namespace {

bool near(float a, float b, float eps = 1e-4f) {
    return std::abs(a - b) <= eps;
}

bool near(glm::vec4 a, glm::vec4 b, float eps = 1e-4f) {
    return near(a.x, b.x, eps) && near(a.y, b.y, eps) && near(a.z, b.z, eps) && near(a.w, b.w, eps);
}

glm::vec2 transformPoint(const Matrix4& m, glm::vec2 p) {
    glm::vec4 r = m * glm::vec4(p, 0.0f, 1.0f);
    return {r.x, r.y};
}

float triangleArea(const std::vector<Point2>& pts, const std::vector<uint32_t>& tris) {
    float area = 0.0f;
    for (size_t i = 0; i < tris.size(); i += 3) {
        Point2 a = pts[tris[i]];
        Point2 b = pts[tris[i + 1]];
        Point2 c = pts[tris[i + 2]];
        area += std::abs((b.x - a.x) * (c.y - a.y) - (c.x - a.x) * (b.y - a.y)) * 0.5f;
    }
    return area;
}

} // namespace

// ============================================================================
// Color
// ============================================================================

void test_color_bytes() {
    std::cout << "Testing: Color byte conversions... ";

    Color c = Color::fromRgba8(255, 128, 0, 64);
    assert(near(c.r, 1.0f));
    assert(near(c.g, 128.0f / 255.0f));
    assert(near(c.b, 0.0f));
    assert(near(c.a, 64.0f / 255.0f));

    auto bytes = c.toRgba8();
    assert(bytes[0] == 255 && bytes[1] == 128 && bytes[2] == 0 && bytes[3] == 64);

    // Out-of-range components clamp
    auto clamped = Color(2.0f, -1.0f, 0.5f, 1.0f).toRgba8();
    assert(clamped[0] == 255 && clamped[1] == 0 && clamped[2] == 128 && clamped[3] == 255);

    Color packed = Color::fromPacked(0x11223344);
    auto pb = packed.toRgba8();
    assert(pb[0] == 0x11 && pb[1] == 0x22 && pb[2] == 0x33 && pb[3] == 0x44);

    assert(Color::fromRgb8(10, 20, 30).a == 1.0f);
    assert(Color::RED == Color(1.0f, 0.0f, 0.0f, 1.0f));
    assert(Color::TRANSPARENT != Color::BLACK);

    std::cout << "PASSED\n";
}

void test_color_linear() {
    std::cout << "Testing: Color sRGB to linear... ";

    Color white = Color::WHITE.toLinear();
    assert(near(white.r, 1.0f) && near(white.g, 1.0f) && near(white.b, 1.0f));

    Color black = Color::BLACK.toLinear();
    assert(black.r == 0.0f && black.a == 1.0f);

    // sRGB 0.5 is about 0.214 linear
    Color mid = Color(0.5f, 0.5f, 0.5f, 0.5f).toLinear();
    assert(near(mid.r, 0.2140f, 1e-3f));
    assert(mid.a == 0.5f);

    // Linear segment near zero
    assert(near(Color(0.04f, 0.0f, 0.0f).toLinear().r, 0.04f / 12.92f));

    Color pre = Color(1.0f, 1.0f, 1.0f, 0.5f).premultiplied();
    assert(near(pre.r, 0.5f) && pre.a == 0.5f);

    std::cout << "PASSED\n";
}

// ============================================================================
// Rect and DrawParam
// ============================================================================

void test_rect() {
    std::cout << "Testing: Rect geometry... ";

    Rect r(10.0f, 20.0f, 4.0f, 8.0f);
    assert(r.left() == 8.0f && r.right() == 12.0f);
    assert(r.top() == 16.0f && r.bottom() == 24.0f);
    assert(r.contains({10.0f, 20.0f}));
    assert(r.contains({8.0f, 16.0f}));
    assert(!r.contains({7.9f, 20.0f}));

    Rect corner = Rect::fromCorner(0.0f, 0.0f, 100.0f, 50.0f);
    assert(corner == Rect(50.0f, 25.0f, 100.0f, 50.0f));
    assert(near(corner.toCorner(), glm::vec4(0.0f, 0.0f, 100.0f, 50.0f)));

    assert(Rect::one().toCorner() == glm::vec4(0.0f, 0.0f, 1.0f, 1.0f));

    // Negative sizes mirror but still contain their interior
    Rect mirrored(0.0f, 0.0f, -2.0f, -2.0f);
    assert(mirrored.contains({0.5f, -0.5f}));

    std::cout << "PASSED\n";
}

void test_drawparam_matrix() {
    std::cout << "Testing: DrawParam matrix composition... ";

    // Identity by default
    assert(DrawParam().toMatrix() == Matrix4(1.0f));

    // Translation
    glm::vec2 p = transformPoint(DrawParam().dest({100.0f, 50.0f}).toMatrix(), {1.0f, 2.0f});
    assert(near(p.x, 101.0f) && near(p.y, 52.0f));

    // Scale happens before translation
    p = transformPoint(DrawParam().dest({10.0f, 0.0f}).scale({2.0f, 3.0f}).toMatrix(), {1.0f, 1.0f});
    assert(near(p.x, 12.0f) && near(p.y, 3.0f));

    // Rotation by 90 degrees maps +x to +y
    p = transformPoint(DrawParam().rotation(glm::half_pi<float>()).toMatrix(), {1.0f, 0.0f});
    assert(near(p.x, 0.0f) && near(p.y, 1.0f));

    // Rotation about an offset pivot keeps the pivot fixed
    DrawParam pivoted = DrawParam().offset({5.0f, 5.0f}).rotation(1.234f);
    p = transformPoint(pivoted.toMatrix(), {5.0f, 5.0f});
    assert(near(p.x, 5.0f) && near(p.y, 5.0f));

    // Shear in x moves points by shear.x * y
    p = transformPoint(DrawParam().shear({0.5f, 0.0f}).toMatrix(), {0.0f, 2.0f});
    assert(near(p.x, 1.0f) && near(p.y, 2.0f));

    // Matches the documented composition
    DrawParam full = DrawParam().dest({3.0f, 4.0f}).offset({1.0f, 1.0f}).rotation(0.3f)
                                .scale({2.0f, 0.5f});
    Matrix4 expected = glm::translate(Matrix4(1.0f), glm::vec3(3.0f, 4.0f, 0.0f));
    expected = glm::translate(expected, glm::vec3(1.0f, 1.0f, 0.0f));
    expected = glm::rotate(expected, 0.3f, glm::vec3(0.0f, 0.0f, 1.0f));
    expected = glm::scale(expected, glm::vec3(2.0f, 0.5f, 1.0f));
    expected = glm::translate(expected, glm::vec3(-1.0f, -1.0f, 0.0f));
    for (int c = 0; c < 4; ++c) {
        assert(near(full.toMatrix()[c], expected[c]));
    }

    std::cout << "PASSED\n";
}

void test_instance_properties() {
    std::cout << "Testing: Instance properties... ";

    DrawParam param = DrawParam()
        .src(Rect::fromCorner(0.25f, 0.5f, 0.5f, 0.5f))
        .dest({7.0f, 9.0f})
        .color(Color(0.5f, 1.0f, 0.0f, 0.25f));

    InstanceProperties props = InstanceProperties::from(param);
    assert(near(props.src, glm::vec4(0.25f, 0.5f, 0.5f, 0.5f)));
    assert(props.model() == param.toMatrix());
    assert(near(props.col4, glm::vec4(7.0f, 9.0f, 0.0f, 1.0f)));

    // Colors travel in linear space
    assert(near(props.color.x, 0.2140f, 1e-3f));
    assert(near(props.color.y, 1.0f));
    assert(near(props.color.w, 0.25f));

    assert(sizeof(InstanceProperties) == 96);
    assert(sizeof(Vertex) == 32);

    std::cout << "PASSED\n";
}

// ============================================================================
// MatrixStack
// ============================================================================

void test_matrix_stack() {
    std::cout << "Testing: MatrixStack push/pop... ";

    MatrixStack stack;
    assert(stack.depth() == 1);
    assert(stack.top() == Matrix4(1.0f));

    Matrix4 t = glm::translate(Matrix4(1.0f), glm::vec3(5.0f, 0.0f, 0.0f));
    stack.push(t);
    assert(stack.depth() == 2);
    assert(stack.top() == t);

    // Push without a matrix duplicates the top
    stack.push();
    assert(stack.depth() == 3);
    assert(stack.top() == t);

    Matrix4 s = glm::scale(Matrix4(1.0f), glm::vec3(2.0f, 2.0f, 1.0f));
    stack.apply(s);
    assert(stack.top() == s * t);

    stack.pop();
    assert(stack.depth() == 2);
    assert(stack.top() == t);

    stack.pop();
    assert(stack.depth() == 1);
    assert(stack.top() == Matrix4(1.0f));

    // The base can not be popped
    stack.pop();
    stack.pop();
    assert(stack.depth() == 1);

    stack.set(t);
    assert(stack.top() == t);
    stack.origin();
    assert(stack.top() == Matrix4(1.0f));

    std::cout << "PASSED\n";
}

// ============================================================================
// Sampling, blending and configuration
// ============================================================================

void test_sampler_info() {
    std::cout << "Testing: SamplerInfo equality and hashing... ";

    SamplerInfo a;
    SamplerInfo b = SamplerInfo::withFilter(FilterMode::Linear);
    SamplerInfo c = SamplerInfo::withFilter(FilterMode::Nearest);
    SamplerInfo d;
    d.wrapX = WrapMode::Tile;

    assert(a == b);
    assert(a != c);
    assert(a != d);

    std::unordered_set<SamplerInfo> set = {a, b, c, d};
    assert(set.size() == 3);

    assert(toVkFilter(FilterMode::Nearest) == VK_FILTER_NEAREST);
    assert(toVkAddressMode(WrapMode::Tile) == VK_SAMPLER_ADDRESS_MODE_REPEAT);
    assert(toVkAddressMode(WrapMode::Mirror) == VK_SAMPLER_ADDRESS_MODE_MIRRORED_REPEAT);

    std::cout << "PASSED\n";
}

void test_blend_states() {
    std::cout << "Testing: Blend mode states... ";

    auto alpha = toBlendState(BlendMode::Alpha);
    assert(alpha.blendEnable == VK_TRUE);
    assert(alpha.srcColorBlendFactor == VK_BLEND_FACTOR_SRC_ALPHA);
    assert(alpha.dstColorBlendFactor == VK_BLEND_FACTOR_ONE_MINUS_SRC_ALPHA);

    auto add = toBlendState(BlendMode::Add);
    assert(add.dstColorBlendFactor == VK_BLEND_FACTOR_ONE);

    auto premultiplied = toBlendState(BlendMode::Premultiplied);
    assert(premultiplied.srcColorBlendFactor == VK_BLEND_FACTOR_ONE);

    for (uint32_t i = 0; i < BLEND_MODE_COUNT; ++i) {
        auto mode = static_cast<BlendMode>(i);
        assert(std::string(blendModeName(mode)) != "Unknown");
        assert(toBlendState(mode).colorWriteMask != 0);
    }

    std::cout << "PASSED\n";
}

void test_conf_defaults() {
    std::cout << "Testing: Conf defaults... ";

    Conf conf;
    assert(conf.windowSetup.title == "An easy, good game");
    assert(conf.windowSetup.samples == NumSamples::One);
    assert(conf.windowSetup.vsync);
    assert(conf.windowMode.width == 800 && conf.windowMode.height == 600);
    assert(!conf.windowMode.resizable);
    assert(!conf.windowMode.fullscreen);
    assert(conf.windowMode.visible);
    assert(conf.backend.framesInFlight == 2);
    assert(!conf.backend.enableValidation);

    assert(numSamplesFromCount(4) == NumSamples::Four);
    assert(!numSamplesFromCount(3).has_value());
    assert(!numSamplesFromCount(0).has_value());
    assert(sampleCount(NumSamples::Sixteen) == 16);

    std::cout << "PASSED\n";
}

// ============================================================================
// Tessellation
// ============================================================================

void test_circle_segments() {
    std::cout << "Testing: Circle segment counts... ";

    assert(circleSegments(10.0f, 20.0f) == 3);
    uint32_t coarse = circleSegments(100.0f, 1.0f);
    uint32_t fine = circleSegments(100.0f, 0.01f);
    assert(coarse >= 3);
    assert(fine > coarse);
    assert(circleSegments(1.0e6f, 1.0e-6f) == 1024);

    bool threw = false;
    try {
        circleSegments(0.0f, 0.1f);
    } catch (const ResourceLoadError&) {
        threw = true;
    }
    assert(threw);

    std::cout << "PASSED\n";
}

void test_triangulate_convex() {
    std::cout << "Testing: Ear clipping a square in both windings... ";

    std::vector<Point2> square = {{0, 0}, {10, 0}, {10, 10}, {0, 10}};
    auto tris = triangulatePolygon(square);
    assert(tris.size() == 6);
    assert(near(triangleArea(square, tris), 100.0f));

    std::vector<Point2> reversed(square.rbegin(), square.rend());
    tris = triangulatePolygon(reversed);
    assert(tris.size() == 6);
    assert(near(triangleArea(reversed, tris), 100.0f));

    std::cout << "PASSED\n";
}

void test_triangulate_concave() {
    std::cout << "Testing: Ear clipping a concave polygon... ";

    // L shape, area 3 * 1 + 1 * 2 = 5 (in 10-unit squares: 500)
    std::vector<Point2> shape = {
        {0, 0}, {30, 0}, {30, 10}, {10, 10}, {10, 30}, {0, 30}
    };
    auto tris = triangulatePolygon(shape);
    assert(tris.size() == (shape.size() - 2) * 3);
    assert(near(triangleArea(shape, tris), 500.0f, 1e-2f));
    for (uint32_t index : tris) {
        assert(index < shape.size());
    }

    // Collinear vertex on an edge
    std::vector<Point2> withMidpoint = {{0, 0}, {5, 0}, {10, 0}, {10, 10}, {0, 10}};
    tris = triangulatePolygon(withMidpoint);
    assert(near(triangleArea(withMidpoint, tris), 100.0f, 1e-2f));

    bool threw = false;
    try {
        triangulatePolygon({{0, 0}, {1, 1}});
    } catch (const ResourceLoadError&) {
        threw = true;
    }
    assert(threw);

    std::cout << "PASSED\n";
}

void test_mesh_builder() {
    std::cout << "Testing: MeshBuilder shapes... ";

    MeshBuilder fill;
    fill.rectangle(DrawMode::fill(), Rect::fromCorner(0, 0, 4, 2), Color::RED);
    assert(fill.vertices().size() == 4);
    assert(fill.indices().size() == 6);
    // Stored linear; pure red is unchanged
    assert(fill.vertices()[0].color == glm::vec4(1.0f, 0.0f, 0.0f, 1.0f));

    MeshBuilder stroke;
    stroke.rectangle(DrawMode::stroke(2.0f), Rect::fromCorner(0, 0, 10, 10), Color::WHITE);
    assert(stroke.vertices().size() == 8);
    assert(stroke.indices().size() == 24);
    // Outer corner sits a half width outside the rect
    bool outerFound = false;
    for (const auto& v : stroke.vertices()) {
        if (near(v.pos.x, -1.0f) && near(v.pos.y, -1.0f)) {
            outerFound = true;
        }
    }
    assert(outerFound);

    MeshBuilder circle;
    circle.circle(DrawMode::fill(), {0, 0}, 10.0f, 0.5f, Color::WHITE);
    uint32_t segments = circleSegments(10.0f, 0.5f);
    assert(circle.vertices().size() == segments);
    assert(circle.indices().size() == (segments - 2) * 3);

    MeshBuilder line;
    line.line({{0, 0}, {10, 0}, {10, 10}}, 2.0f, Color::WHITE);
    assert(line.vertices().size() == 6);
    assert(line.indices().size() == 12);

    MeshBuilder tris;
    tris.triangles({{0, 0}, {1, 0}, {0, 1}}, Color::WHITE);
    assert(tris.indices().size() == 3);

    bool threw = false;
    try {
        MeshBuilder().triangles({{0, 0}, {1, 0}}, Color::WHITE);
    } catch (const ResourceLoadError&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        MeshBuilder().rectangle(DrawMode::stroke(0.0f), Rect::one(), Color::WHITE);
    } catch (const ResourceLoadError&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        MeshBuilder().raw({Vertex{}}, {0, 0, 1});
    } catch (const ResourceLoadError&) {
        threw = true;
    }
    assert(threw);

    assert(MeshBuilder().empty());

    std::cout << "PASSED\n";
}

// ============================================================================
// Text and encoding helpers
// ============================================================================

void test_utf8_decoding() {
    std::cout << "Testing: UTF-8 decoding... ";

    auto ascii = decodeUtf8("Hi!");
    assert(ascii.size() == 3 && ascii[0] == U'H' && ascii[2] == U'!');

    auto mixed = decodeUtf8("a\xC3\xA9\xE2\x82\xAC\xF0\x9F\x98\x80");
    assert(mixed.size() == 4);
    assert(mixed[1] == 0xE9);
    assert(mixed[2] == 0x20AC);
    assert(mixed[3] == 0x1F600);

    auto broken = decodeUtf8("\xFFx\xC3");
    assert(broken.size() == 3);
    assert(broken[0] == 0xFFFD && broken[1] == U'x' && broken[2] == 0xFFFD);

    assert(decodeUtf8("").empty());

    std::cout << "PASSED\n";
}

void test_png_encoding() {
    std::cout << "Testing: PNG encoding... ";

    std::vector<uint8_t> rgba = {
        255, 0, 0, 255,   0, 255, 0, 255,
        0, 0, 255, 255,   255, 255, 255, 0,
    };
    auto png = encodePng(2, 2, rgba);
    const uint8_t signature[8] = {0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n'};
    assert(png.size() > 33);
    for (int i = 0; i < 8; ++i) {
        assert(png[i] == signature[i]);
    }
    // IHDR width and height, big endian
    assert(png[12] == 'I' && png[13] == 'H' && png[14] == 'D' && png[15] == 'R');
    assert(png[19] == 2 && png[23] == 2);

    bool threw = false;
    try {
        encodePng(0, 2, {});
    } catch (const ResourceLoadError&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        encodePng(2, 2, std::vector<uint8_t>(15));
    } catch (const ResourceLoadError&) {
        threw = true;
    }
    assert(threw);

    std::cout << "PASSED\n";
}

int main() {
    std::cout << "\n========================================\n";
    std::cout << "fine2d - Type Tests\n";
    std::cout << "========================================\n\n";

    try {
        test_color_bytes();
        test_color_linear();
        test_rect();
        test_drawparam_matrix();
        test_instance_properties();
        test_matrix_stack();
        test_sampler_info();
        test_blend_states();
        test_conf_defaults();
        test_circle_segments();
        test_triangulate_convex();
        test_triangulate_concave();
        test_mesh_builder();
        test_utf8_decoding();
        test_png_encoding();
    } catch (const std::exception& e) {
        std::cerr << "\nTest failed with exception: " << e.what() << "\n";
        return 1;
    }

    std::cout << "\n========================================\n";
    std::cout << "All type tests PASSED!\n";
    std::cout << "========================================\n\n";

    return 0;
}
