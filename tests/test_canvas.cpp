/**
 * @file test_canvas.cpp
 * @brief Canvas tests - render targets, orientation, readback, PNG files
 *
 * Needs a window system and a Vulkan device; exits with 77 (skipped) when
 * either is missing.
 */

#include <fine2d/fine2d.hpp>

#include <array>
#include <iostream>
#include <cassert>
#include <filesystem>

using namespace fine2d;

namespace {

constexpr int SKIP_EXIT_CODE = 77;

GraphicsContextPtr g_ctx;

struct Quadrant {
    Point2 center;
    Color color;
    uint8_t r, g, b;
};

// Top-left, top-right, bottom-left, bottom-right of a 64x64 canvas
const Quadrant QUADRANTS[] = {
    {{16.0f, 16.0f}, Color::RED, 255, 0, 0},
    {{48.0f, 16.0f}, Color::GREEN, 0, 255, 0},
    {{16.0f, 48.0f}, Color::BLUE, 0, 0, 255},
    {{48.0f, 48.0f}, Color::WHITE, 255, 255, 255},
};

std::array<uint8_t, 4> pixelAt(const std::vector<uint8_t>& rgba, uint32_t width, uint32_t x, uint32_t y) {
    size_t i = (static_cast<size_t>(y) * width + x) * 4;
    return {rgba[i], rgba[i + 1], rgba[i + 2], rgba[i + 3]};
}

void useCanvasCoordinates(GraphicsContext& ctx, const Canvas& canvas) {
    ctx.setScreenCoordinates(Rect::fromCorner(0.0f, 0.0f, static_cast<float>(canvas.width()),
                                              static_cast<float>(canvas.height())));
}

void restoreScreenCoordinates(GraphicsContext& ctx) {
    auto size = ctx.drawableSize();
    ctx.setScreenCoordinates(Rect::fromCorner(0.0f, 0.0f, static_cast<float>(size.x),
                                              static_cast<float>(size.y)));
}

void drawQuadrants(GraphicsContext& ctx, const Canvas& canvas) {
    useCanvasCoordinates(ctx, canvas);
    RenderTargetScope target(ctx, canvas);
    ctx.clear(Color::BLACK);
    for (const auto& quadrant : QUADRANTS) {
        Image::solid(ctx, 32, quadrant.color).draw(ctx, quadrant.center);
    }
}

void checkQuadrants(const std::vector<uint8_t>& pixels, uint32_t size) {
    for (const auto& quadrant : QUADRANTS) {
        // Sample well inside each quadrant, away from the edges
        for (int dy = -8; dy <= 8; dy += 8) {
            for (int dx = -8; dx <= 8; dx += 8) {
                uint32_t x = static_cast<uint32_t>(quadrant.center.x) * size / 64 + dx;
                uint32_t y = static_cast<uint32_t>(quadrant.center.y) * size / 64 + dy;
                auto px = pixelAt(pixels, size, x, y);
                assert(px[0] == quadrant.r);
                assert(px[1] == quadrant.g);
                assert(px[2] == quadrant.b);
                assert(px[3] == 255);
            }
        }
    }
}

} // namespace

void setup_test_context() {
    Conf conf;
    conf.windowSetup.title = "fine2d canvas test";
    conf.windowMode.width = 128;
    conf.windowMode.height = 96;
    conf.windowMode.visible = false;
    conf.resourceDir = (std::filesystem::temp_directory_path() / "fine2d_test_canvas").string();
    std::filesystem::remove_all(conf.resourceDir);
    g_ctx = GraphicsContext::create(conf);
}

// ============================================================================
// Orientation
// ============================================================================

void test_quadrant_round_trip() {
    std::cout << "Testing: Canvas quadrant colors... ";

    GraphicsContext& ctx = *g_ctx;
    Canvas canvas = Canvas::create(ctx, 64, 64);
    drawQuadrants(ctx, canvas);

    auto pixels = canvas.toRgba8(ctx);
    assert(pixels.size() == 64 * 64 * 4);
    checkQuadrants(pixels, 64);

    restoreScreenCoordinates(ctx);
    std::cout << "PASSED\n";
}

void test_canvas_into_canvas() {
    std::cout << "Testing: Canvas drawn into another canvas keeps orientation... ";

    GraphicsContext& ctx = *g_ctx;
    Canvas source = Canvas::create(ctx, 64, 64);
    drawQuadrants(ctx, source);

    // Drawn twice as large: quadrants stay in place, only scaled
    Canvas dest = Canvas::create(ctx, 128, 128);
    useCanvasCoordinates(ctx, dest);
    {
        RenderTargetScope target(ctx, dest);
        ctx.clear(Color::BLACK);
        source.drawEx(ctx, DrawParam().dest({64.0f, 64.0f}).scale({2.0f, 2.0f}));
    }

    checkQuadrants(dest.toRgba8(ctx), 128);

    restoreScreenCoordinates(ctx);
    std::cout << "PASSED\n";
}

void test_multisampled_canvas() {
    std::cout << "Testing: Multisampled canvas resolves... ";

    GraphicsContext& ctx = *g_ctx;
    Canvas canvas = Canvas::create(ctx, 64, 64, NumSamples::Four);
    assert(canvas.samples() == VK_SAMPLE_COUNT_4_BIT || canvas.samples() == VK_SAMPLE_COUNT_1_BIT);

    drawQuadrants(ctx, canvas);
    checkQuadrants(canvas.toRgba8(ctx), 64);

    restoreScreenCoordinates(ctx);
    std::cout << "PASSED\n";
}

// ============================================================================
// Render target stack
// ============================================================================

void test_render_target_stack() {
    std::cout << "Testing: Render target stack... ";

    GraphicsContext& ctx = *g_ctx;
    Canvas a = Canvas::create(ctx, 16, 16);
    Canvas b = Canvas::create(ctx, 16, 16);

    assert(ctx.targetDepth() == 1);
    assert(ctx.activeTarget() == nullptr);

    ctx.pushCanvas(a);
    assert(ctx.targetDepth() == 2);
    assert(ctx.activeTarget() == a.target().get());

    ctx.pushCanvas(b);
    assert(ctx.activeTarget() == b.target().get());

    bool threw = false;
    try {
        ctx.popCanvas(a);
    } catch (const std::logic_error&) {
        threw = true;
    }
    assert(threw);
    assert(ctx.targetDepth() == 3);

    ctx.popCanvas(b);
    ctx.popCanvas(a);
    assert(ctx.targetDepth() == 1);

    // Popping the screen does nothing
    ctx.popCanvas();
    assert(ctx.targetDepth() == 1);
    assert(ctx.activeTarget() == nullptr);

    {
        RenderTargetScope scope(ctx, a);
        assert(ctx.activeTarget() == a.target().get());
        {
            RenderTargetScope inner(ctx, b);
            assert(ctx.targetDepth() == 3);
        }
        assert(ctx.activeTarget() == a.target().get());
    }
    assert(ctx.targetDepth() == 1);

    std::cout << "PASSED\n";
}

void test_canvas_into_itself() {
    std::cout << "Testing: Drawing a canvas into itself... ";

    GraphicsContext& ctx = *g_ctx;
    Canvas canvas = Canvas::create(ctx, 16, 16);

    bool threw = false;
    {
        RenderTargetScope target(ctx, canvas);
        try {
            canvas.draw(ctx, {8.0f, 8.0f});
        } catch (const std::logic_error&) {
            threw = true;
        }
    }
    assert(threw);

    std::cout << "PASSED\n";
}

void test_zero_size_canvas() {
    std::cout << "Testing: Zero-sized canvas rejected... ";

    bool threw = false;
    try {
        Canvas::create(*g_ctx, 0, 16);
    } catch (const ResourceLoadError&) {
        threw = true;
    }
    assert(threw);

    std::cout << "PASSED\n";
}

// ============================================================================
// Readback and files
// ============================================================================

void test_to_image_is_a_copy() {
    std::cout << "Testing: Canvas toImage copies the pixels... ";

    GraphicsContext& ctx = *g_ctx;
    Canvas canvas = Canvas::create(ctx, 8, 8);
    useCanvasCoordinates(ctx, canvas);
    {
        RenderTargetScope target(ctx, canvas);
        ctx.clear(Color::RED);
    }

    Image snapshot = canvas.toImage(ctx);
    assert(snapshot.width() == 8 && snapshot.height() == 8);
    assert(snapshot.texture() != canvas.image().texture());

    {
        RenderTargetScope target(ctx, canvas);
        ctx.clear(Color::GREEN);
    }

    auto copied = pixelAt(snapshot.toRgba8(ctx), 8, 3, 3);
    assert(copied[0] == 255 && copied[1] == 0 && copied[2] == 0 && copied[3] == 255);
    auto live = pixelAt(canvas.toRgba8(ctx), 8, 3, 3);
    assert(live[0] == 0 && live[1] == 255 && live[2] == 0 && live[3] == 255);

    restoreScreenCoordinates(ctx);
    std::cout << "PASSED\n";
}

void test_png_round_trip() {
    std::cout << "Testing: Canvas PNG encode and load... ";

    GraphicsContext& ctx = *g_ctx;
    Canvas canvas = Canvas::create(ctx, 64, 64);
    drawQuadrants(ctx, canvas);

    canvas.encode(ctx, ImageFormat::Png, "/out/quadrants.png");
    assert(ctx.filesystem().exists("/out/quadrants.png"));

    Image loaded = Image::load(ctx, "/out/quadrants.png");
    assert(loaded.width() == 64 && loaded.height() == 64);

    auto pixels = loaded.toRgba8(ctx);
    assert(pixels == canvas.toRgba8(ctx));
    checkQuadrants(pixels, 64);

    bool threw = false;
    try {
        Image::load(ctx, "/out/missing.png");
    } catch (const FilesystemError&) {
        threw = true;
    }
    assert(threw);

    ctx.filesystem().create("/out/garbage.png", {'n', 'o', 't', ' ', 'p', 'n', 'g'});
    threw = false;
    try {
        Image::load(ctx, "/out/garbage.png");
    } catch (const ResourceLoadError&) {
        threw = true;
    }
    assert(threw);

    restoreScreenCoordinates(ctx);
    std::cout << "PASSED\n";
}

int main() {
    std::cout << "\n========================================\n";
    std::cout << "fine2d - Canvas Tests\n";
    std::cout << "========================================\n\n";

    try {
        setup_test_context();
    } catch (const GameError& e) {
        std::cout << "SKIPPED: " << e.what() << "\n";
        return SKIP_EXIT_CODE;
    }

    try {
        test_quadrant_round_trip();
        test_canvas_into_canvas();
        test_multisampled_canvas();
        test_render_target_stack();
        test_canvas_into_itself();
        test_zero_size_canvas();
        test_to_image_is_a_copy();
        test_png_round_trip();
    } catch (const std::exception& e) {
        std::cerr << "\nTest failed with exception: " << e.what() << "\n";
        g_ctx.reset();
        return 1;
    }

    g_ctx.reset();

    std::cout << "\n========================================\n";
    std::cout << "All canvas tests PASSED!\n";
    std::cout << "========================================\n\n";

    return 0;
}
