/**
 * @file test_context.cpp
 * @brief GraphicsContext tests - images, shaders, blending, samplers, frames
 *
 * This test verifies:
 * - Image creation from RGBA8 pixels and its rejection rules
 * - A 2x2 red image lands where it is drawn
 * - Per-image blend overrides are restored after the draw
 * - Sampler cache deduplication
 * - Pixel shaders with uniforms, and ShaderLock restoring the previous shader
 * - Transform and view stacks on the context
 * - Meshes, sprite batches and text
 * - Presenting frames to the window
 *
 * Needs a window system and a Vulkan device; exits with 77 (skipped) when
 * either is missing.
 */

#include <fine2d/fine2d.hpp>

#include <glm/gtc/matrix_transform.hpp>

#include <array>
#include <iostream>
#include <cassert>
#include <cmath>
#include <cstdlib>
#include <filesystem>

using namespace fine2d;

namespace {

const uint32_t DIM_FRAG_SPV[] =
#include "dim.frag.inc"
;

constexpr int SKIP_EXIT_CODE = 77;

GraphicsContextPtr g_ctx;

std::array<uint8_t, 4> pixelAt(const std::vector<uint8_t>& rgba, uint32_t width, uint32_t x, uint32_t y) {
    size_t i = (static_cast<size_t>(y) * width + x) * 4;
    return {rgba[i], rgba[i + 1], rgba[i + 2], rgba[i + 3]};
}

bool isColor(const std::array<uint8_t, 4>& px, uint8_t r, uint8_t g, uint8_t b, uint8_t a) {
    return px[0] == r && px[1] == g && px[2] == b && px[3] == a;
}

/// Canvas with the projection set to its pixel grid
Canvas makeCanvas(GraphicsContext& ctx, uint32_t width, uint32_t height) {
    Canvas canvas = Canvas::create(ctx, width, height, NumSamples::One);
    ctx.setScreenCoordinates(Rect::fromCorner(0.0f, 0.0f, static_cast<float>(width),
                                              static_cast<float>(height)));
    return canvas;
}

void restoreScreenCoordinates(GraphicsContext& ctx) {
    auto size = ctx.drawableSize();
    ctx.setScreenCoordinates(Rect::fromCorner(0.0f, 0.0f, static_cast<float>(size.x),
                                              static_cast<float>(size.y)));
}

} // namespace

void setup_test_context() {
    Conf conf;
    conf.windowSetup.title = "fine2d context test";
    conf.windowMode.width = 128;
    conf.windowMode.height = 96;
    conf.windowMode.visible = false;
    conf.resourceDir = (std::filesystem::temp_directory_path() / "fine2d_test_context").string();
    g_ctx = GraphicsContext::create(conf);
}

// ============================================================================
// Images
// ============================================================================

void test_image_from_rgba8() {
    std::cout << "Testing: Image from RGBA8... ";

    std::vector<uint8_t> pixels(3 * 2 * 4, 200);
    Image image = Image::fromRgba8(*g_ctx, 3, 2, pixels);
    assert(image.width() == 3);
    assert(image.height() == 2);
    assert(image.dimensions() == Rect(1.5f, 1.0f, 3.0f, 2.0f));
    assert(image.filter() == g_ctx->defaultFilter());

    // Copies share the texture but not the sampler settings
    Image copy = image;
    copy.setFilter(FilterMode::Nearest);
    assert(copy.texture() == image.texture());
    assert(image.filter() == FilterMode::Linear);

    // Pixels come back unchanged
    assert(image.toRgba8(*g_ctx) == pixels);

    std::cout << "PASSED\n";
}

void test_image_zero_size_rejected() {
    std::cout << "Testing: Zero-sized image rejected... ";

    bool threw = false;
    try {
        Image::fromRgba8(*g_ctx, 0, 4, {});
    } catch (const ResourceLoadError&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        Image::fromRgba8(*g_ctx, 4, 0, {});
    } catch (const ResourceLoadError&) {
        threw = true;
    }
    assert(threw);

    std::cout << "PASSED\n";
}

void test_image_length_mismatch() {
    std::cout << "Testing: Image pixel length mismatch rejected... ";

    bool threw = false;
    try {
        Image::fromRgba8(*g_ctx, 2, 2, std::vector<uint8_t>(2 * 2 * 4 - 1));
    } catch (const ResourceLoadError&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        Image::fromRgba8(*g_ctx, 2, 2, std::vector<uint8_t>(2 * 2 * 4 + 4));
    } catch (const ResourceLoadError&) {
        threw = true;
    }
    assert(threw);

    std::cout << "PASSED\n";
}

void test_red_image_scenario() {
    std::cout << "Testing: 2x2 red image drawn at (10,10)... ";

    GraphicsContext& ctx = *g_ctx;
    Image red = Image::solid(ctx, 2, Color::RED);
    Canvas canvas = makeCanvas(ctx, 32, 32);

    {
        RenderTargetScope target(ctx, canvas);
        ctx.clear(Color::BLUE);
        red.draw(ctx, {10.0f, 10.0f});
    }

    auto pixels = canvas.toRgba8(ctx);
    assert(pixels.size() == 32 * 32 * 4);

    // The image is centred on dest and covers pixels 9 and 10 on both axes
    for (uint32_t y = 0; y < 32; ++y) {
        for (uint32_t x = 0; x < 32; ++x) {
            bool inside = (x == 9 || x == 10) && (y == 9 || y == 10);
            auto px = pixelAt(pixels, 32, x, y);
            if (inside) {
                assert(isColor(px, 255, 0, 0, 255));
            } else {
                assert(isColor(px, 0, 0, 255, 255));
            }
        }
    }

    restoreScreenCoordinates(ctx);
    std::cout << "PASSED\n";
}

void test_image_src_rect() {
    std::cout << "Testing: Image source rect and scale... ";

    GraphicsContext& ctx = *g_ctx;

    // Left half red, right half green
    std::vector<uint8_t> pixels = {
        255, 0, 0, 255,   0, 255, 0, 255,
        255, 0, 0, 255,   0, 255, 0, 255,
    };
    Image image = Image::fromRgba8(ctx, 2, 2, pixels);
    image.setFilter(FilterMode::Nearest);

    Canvas canvas = makeCanvas(ctx, 16, 16);
    {
        RenderTargetScope target(ctx, canvas);
        ctx.clear(Color::TRANSPARENT);
        // Right half only, scaled 4x: an 4x8 green block centred on (8,8)
        image.drawEx(ctx, DrawParam()
            .src(Rect::fromCorner(0.5f, 0.0f, 0.5f, 1.0f))
            .dest({8.0f, 8.0f})
            .scale({4.0f, 4.0f}));
    }

    auto out = canvas.toRgba8(ctx);
    assert(isColor(pixelAt(out, 16, 6, 4), 0, 255, 0, 255));
    assert(isColor(pixelAt(out, 16, 9, 11), 0, 255, 0, 255));
    assert(isColor(pixelAt(out, 16, 5, 8), 0, 0, 0, 0));
    assert(isColor(pixelAt(out, 16, 10, 8), 0, 0, 0, 0));

    restoreScreenCoordinates(ctx);
    std::cout << "PASSED\n";
}

// ============================================================================
// Blending and sampling
// ============================================================================

void test_per_image_blend_restore() {
    std::cout << "Testing: Per-image blend mode restored after draw... ";

    GraphicsContext& ctx = *g_ctx;
    Image image = Image::solid(ctx, 4, Color::WHITE);
    Canvas canvas = makeCanvas(ctx, 8, 8);

    assert(ctx.blendMode() == BlendMode::Alpha);
    image.setBlendMode(BlendMode::Add);
    {
        RenderTargetScope target(ctx, canvas);
        image.draw(ctx, {4.0f, 4.0f});
        assert(ctx.blendMode() == BlendMode::Alpha);

        ctx.setBlendMode(BlendMode::Multiply);
        image.draw(ctx, {4.0f, 4.0f});
        assert(ctx.blendMode() == BlendMode::Multiply);

        // Same mode as the override: nothing to restore
        image.setBlendMode(BlendMode::Multiply);
        image.draw(ctx, {4.0f, 4.0f});
        assert(ctx.blendMode() == BlendMode::Multiply);

        ctx.setBlendMode(BlendMode::Alpha);
    }
    ctx.flush();

    assert(ctx.blendMode() == BlendMode::Alpha);
    restoreScreenCoordinates(ctx);
    std::cout << "PASSED\n";
}

void test_sampler_cache_dedup() {
    std::cout << "Testing: Sampler cache deduplication... ";

    SamplerCache& cache = g_ctx->samplers();
    size_t before = cache.size();

    SamplerInfo info;
    info.filter = FilterMode::Nearest;
    info.wrapX = WrapMode::Mirror;
    info.wrapY = WrapMode::Tile;

    Sampler& first = cache.getOrInsert(info);
    assert(cache.size() == before + 1);

    Sampler& second = cache.getOrInsert(info);
    assert(&first == &second);
    assert(cache.size() == before + 1);

    info.wrapY = WrapMode::Clamp;
    Sampler& third = cache.getOrInsert(info);
    assert(&third != &first);
    assert(cache.size() == before + 2);

    std::cout << "PASSED\n";
}

// ============================================================================
// Shaders
// ============================================================================

void test_shader_lock_restore() {
    std::cout << "Testing: ShaderLock restores the previous shader... ";

    GraphicsContext& ctx = *g_ctx;
    std::vector<uint32_t> spirv(std::begin(DIM_FRAG_SPV), std::end(DIM_FRAG_SPV));
    PixelShader dim = PixelShader::fromSpirv(ctx, spirv, {BlendMode::Alpha, BlendMode::Add},
                                             sizeof(float), "dim");
    assert(dim.id() != DEFAULT_SHADER);
    assert(ctx.shaders().name(dim.id()) == "dim");
    assert(ctx.currentShader() == DEFAULT_SHADER);

    float rate = 0.5f;
    dim.sendUniforms(ctx, &rate, sizeof(rate));

    bool threw = false;
    try {
        double wrongSize = 1.0;
        dim.sendUniforms(ctx, &wrongSize, sizeof(wrongSize));
    } catch (const std::logic_error&) {
        threw = true;
    }
    assert(threw);

    Image red = Image::solid(ctx, 4, Color::RED);
    Canvas canvas = makeCanvas(ctx, 8, 8);
    {
        RenderTargetScope target(ctx, canvas);
        ctx.clear(Color::BLACK);
        ShaderLock lock = useShader(ctx, dim);
        assert(ctx.currentShader() == dim.id());
        assert(lock.previous() == DEFAULT_SHADER);
        red.draw(ctx, {4.0f, 4.0f});

        {
            // Nested lock back to the default shader
            ShaderLock inner(ctx, DEFAULT_SHADER);
            assert(ctx.currentShader() == DEFAULT_SHADER);
        }
        assert(ctx.currentShader() == dim.id());
    }
    assert(ctx.currentShader() == DEFAULT_SHADER);

    // Linear 0.5 red is about 188 in sRGB
    auto px = pixelAt(canvas.toRgba8(ctx), 8, 4, 4);
    assert(px[0] >= 180 && px[0] <= 196);
    assert(px[1] == 0 && px[2] == 0 && px[3] == 255);

    restoreScreenCoordinates(ctx);
    std::cout << "PASSED\n";
}

void test_shader_blend_modes() {
    std::cout << "Testing: Shader blend mode ownership... ";

    GraphicsContext& ctx = *g_ctx;
    std::vector<uint32_t> spirv(std::begin(DIM_FRAG_SPV), std::end(DIM_FRAG_SPV));
    PixelShader additive = PixelShader::fromSpirv(ctx, spirv, {BlendMode::Add, BlendMode::Alpha},
                                                  sizeof(float), "additive");

    // The first allowed mode is the initial one
    assert(additive.blendMode(ctx) == BlendMode::Add);

    bool threw = false;
    try {
        additive.setBlendMode(ctx, BlendMode::Multiply);
    } catch (const RenderError&) {
        threw = true;
    }
    assert(threw);
    assert(additive.blendMode(ctx) == BlendMode::Add);

    // Switching shaders switches the effective blend mode
    assert(ctx.blendMode() == BlendMode::Alpha);
    {
        ShaderLock lock = useShader(ctx, additive);
        assert(ctx.blendMode() == BlendMode::Add);
    }
    assert(ctx.blendMode() == BlendMode::Alpha);

    threw = false;
    try {
        PixelShader::fromSpirv(ctx, spirv, {}, 0);
    } catch (const std::logic_error&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        PixelShader::fromSpirv(ctx, spirv, {BlendMode::Alpha}, MAX_UNIFORM_BLOCK_SIZE + 4);
    } catch (const std::logic_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << "PASSED\n";
}

void test_pixel_shader_from_file() {
    std::cout << "Testing: PixelShader from file... ";

    GraphicsContext& ctx = *g_ctx;
    std::vector<uint8_t> bytes(reinterpret_cast<const uint8_t*>(DIM_FRAG_SPV),
                               reinterpret_cast<const uint8_t*>(DIM_FRAG_SPV) + sizeof(DIM_FRAG_SPV));
    ctx.filesystem().create("/shaders/dim.frag.spv", bytes);

    PixelShader shader = PixelShader::fromFile(ctx, "/shaders/dim.frag.spv", {BlendMode::Alpha},
                                               sizeof(float));
    assert(ctx.shaders().name(shader.id()) == "/shaders/dim.frag.spv");

    ctx.filesystem().create("/shaders/broken.spv", {1, 2, 3, 4, 5, 6, 7, 8});
    bool threw = false;
    try {
        PixelShader::fromFile(ctx, "/shaders/broken.spv");
    } catch (const ResourceLoadError&) {
        threw = true;
    }
    assert(threw);

    std::cout << "PASSED\n";
}

// ============================================================================
// Transform stacks
// ============================================================================

void test_context_matrix_stacks() {
    std::cout << "Testing: Context transform and view stacks... ";

    GraphicsContext& ctx = *g_ctx;
    assert(ctx.transformDepth() == 1);
    assert(ctx.viewDepth() == 1);

    Matrix4 t = glm::translate(Matrix4(1.0f), glm::vec3(10.0f, 0.0f, 0.0f));
    ctx.pushTransform(t);
    ctx.pushView();
    assert(ctx.transformDepth() == 2);
    assert(ctx.viewDepth() == 2);
    assert(ctx.transform() == t);

    // Globals only change once applied
    Matrix4 before = ctx.globals();
    ctx.calculateTransformMatrix();
    assert(ctx.globals() == before);
    ctx.updateGlobals();
    assert(ctx.globals() == ctx.projection() * ctx.view() * t);

    ctx.popView();
    ctx.popTransform();
    ctx.popTransform();
    assert(ctx.transformDepth() == 1);
    assert(ctx.viewDepth() == 1);

    ctx.applyTransformations();
    assert(ctx.globals() == ctx.projection());

    std::cout << "PASSED\n";
}

void test_projection_and_views() {
    std::cout << "Testing: Projection and view matrices... ";

    GraphicsContext& ctx = *g_ctx;
    Rect saved = ctx.screenCoordinates();

    ctx.setProjectionRect(Rect::fromCorner(0.0f, 0.0f, 200.0f, 100.0f));
    assert(ctx.screenCoordinates() == Rect::fromCorner(0.0f, 0.0f, 200.0f, 100.0f));

    // Top-left of the rect maps to (-1,-1) in clip space and Y grows downwards
    glm::vec4 topLeft = ctx.projection() * glm::vec4(0.0f, 0.0f, 0.0f, 1.0f);
    glm::vec4 bottomRight = ctx.projection() * glm::vec4(200.0f, 100.0f, 0.0f, 1.0f);
    assert(std::abs(topLeft.x + 1.0f) < 1e-5f && std::abs(topLeft.y + 1.0f) < 1e-5f);
    assert(std::abs(bottomRight.x - 1.0f) < 1e-5f && std::abs(bottomRight.y - 1.0f) < 1e-5f);

    Matrix4 projection = ctx.projection();
    Matrix4 flip = glm::scale(Matrix4(1.0f), glm::vec3(-1.0f, 1.0f, 1.0f));
    ctx.transformProjection(flip);
    assert(ctx.projection() == flip * projection);
    ctx.setProjection(projection);
    assert(ctx.projection() == projection);

    Matrix4 shift = glm::translate(Matrix4(1.0f), glm::vec3(5.0f, 0.0f, 0.0f));
    ctx.setView(shift);
    ctx.applyView(shift);
    assert(ctx.view() == shift * shift);

    ctx.setTransform(shift);
    ctx.applyTransform(flip);
    assert(ctx.transform() == flip * shift);
    ctx.origin();
    assert(ctx.transform() == Matrix4(1.0f));

    ctx.setView(Matrix4(1.0f));
    ctx.setScreenCoordinates(saved);
    assert(ctx.globals() == ctx.projection());

    std::cout << "PASSED\n";
}

// ============================================================================
// Other drawables
// ============================================================================

void test_mesh_draw() {
    std::cout << "Testing: Mesh drawing... ";

    GraphicsContext& ctx = *g_ctx;
    Canvas canvas = makeCanvas(ctx, 16, 16);

    Mesh mesh = MeshBuilder()
        .rectangle(DrawMode::fill(), Rect::fromCorner(0.0f, 0.0f, 8.0f, 8.0f), Color::GREEN)
        .build(ctx);
    assert(mesh.vertexCount() == 4);
    assert(mesh.indexCount() == 6);
    assert(mesh.bounds() == Rect::fromCorner(0.0f, 0.0f, 8.0f, 8.0f));

    {
        RenderTargetScope target(ctx, canvas);
        ctx.clear(Color::BLACK);
        mesh.draw(ctx, {0.0f, 0.0f});
        // Immediate shape in the bottom-right quadrant
        rectangle(ctx, DrawMode::fill(), Rect::fromCorner(8.0f, 8.0f, 8.0f, 8.0f), Color::RED);
    }

    auto out = canvas.toRgba8(ctx);
    assert(isColor(pixelAt(out, 16, 2, 2), 0, 255, 0, 255));
    assert(isColor(pixelAt(out, 16, 12, 12), 255, 0, 0, 255));
    assert(isColor(pixelAt(out, 16, 12, 2), 0, 0, 0, 255));

    bool threw = false;
    try {
        MeshBuilder().build(ctx);
    } catch (const ResourceLoadError&) {
        threw = true;
    }
    assert(threw);

    restoreScreenCoordinates(ctx);
    std::cout << "PASSED\n";
}

void test_mesh_constructors() {
    std::cout << "Testing: Mesh constructors... ";

    GraphicsContext& ctx = *g_ctx;

    Mesh outline = Mesh::newRectangle(ctx, DrawMode::stroke(2.0f), Rect::fromCorner(0.0f, 0.0f, 10.0f, 10.0f),
                                      Color::WHITE);
    assert(outline.vertexCount() == 8);
    assert(outline.indexCount() == 24);

    Mesh disc = Mesh::newCircle(ctx, DrawMode::fill(), {0.0f, 0.0f}, 10.0f, 0.1f, Color::RED);
    uint32_t segments = circleSegments(10.0f, 0.1f);
    assert(disc.indexCount() == (segments - 2) * 3);

    Mesh path = Mesh::newLine(ctx, {{0.0f, 0.0f}, {10.0f, 0.0f}, {10.0f, 10.0f}}, 2.0f, Color::GREEN);
    assert(path.vertexCount() == 6);
    assert(path.indexCount() == 12);

    Mesh arrow = Mesh::newPolygon(ctx, DrawMode::fill(),
                                  {{0.0f, 0.0f}, {4.0f, 2.0f}, {0.0f, 4.0f}, {1.0f, 2.0f}}, Color::BLUE);
    assert(arrow.indexCount() == 6);

    std::vector<Vertex> vertices = {
        {{0.0f, 0.0f}, {0.0f, 0.0f}, {1.0f, 1.0f, 1.0f, 1.0f}},
        {{1.0f, 0.0f}, {1.0f, 0.0f}, {1.0f, 1.0f, 1.0f, 1.0f}},
        {{0.0f, 1.0f}, {0.0f, 1.0f}, {1.0f, 1.0f, 1.0f, 1.0f}},
    };
    Mesh triangle = Mesh::fromData(ctx, vertices, {0, 1, 2});
    assert(triangle.bounds() == Rect::fromCorner(0.0f, 0.0f, 1.0f, 1.0f));

    bool threw = false;
    try {
        Mesh::fromData(ctx, vertices, {0, 1, 3});
    } catch (const ResourceLoadError&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        Mesh::fromData(ctx, vertices, {0, 1});
    } catch (const ResourceLoadError&) {
        threw = true;
    }
    assert(threw);

    std::cout << "PASSED\n";
}

void test_sprite_batch() {
    std::cout << "Testing: SpriteBatch single draw... ";

    GraphicsContext& ctx = *g_ctx;
    Canvas canvas = makeCanvas(ctx, 16, 16);

    SpriteBatch batch(Image::solid(ctx, 2, Color::WHITE));
    size_t a = batch.add(DrawParam().dest({2.0f, 2.0f}));
    size_t b = batch.add(DrawParam().dest({13.0f, 2.0f}));
    batch.add(DrawParam().dest({8.0f, 13.0f}).color(Color::RED));
    assert(a == 0 && b == 1);
    assert(batch.size() == 3);

    batch.set(b, DrawParam().dest({14.0f, 2.0f}).color(Color::GREEN));

    bool threw = false;
    try {
        batch.set(7, DrawParam());
    } catch (const std::out_of_range&) {
        threw = true;
    }
    assert(threw);

    uint64_t drawsBefore = ctx.drawCallCount();
    {
        RenderTargetScope target(ctx, canvas);
        ctx.clear(Color::BLACK);
        batch.draw(ctx, {0.0f, 0.0f});
    }
    assert(ctx.drawCallCount() == drawsBefore + 1);

    auto out = canvas.toRgba8(ctx);
    assert(isColor(pixelAt(out, 16, 2, 2), 255, 255, 255, 255));
    assert(isColor(pixelAt(out, 16, 14, 2), 0, 255, 0, 255));
    assert(isColor(pixelAt(out, 16, 8, 13), 255, 0, 0, 255));
    assert(isColor(pixelAt(out, 16, 8, 8), 0, 0, 0, 255));

    batch.clear();
    assert(batch.empty());

    restoreScreenCoordinates(ctx);
    std::cout << "PASSED\n";
}

void test_text() {
    std::cout << "Testing: Text rasterisation... ";

    const char* candidates[] = {
        "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
        "/usr/share/fonts/dejavu/DejaVuSans.ttf",
        "/usr/share/fonts/TTF/DejaVuSans.ttf",
        "/usr/share/fonts/truetype/liberation/LiberationSans-Regular.ttf",
    };
    std::filesystem::path fontPath;
    for (const char* candidate : candidates) {
        if (std::filesystem::exists(candidate)) {
            fontPath = candidate;
            break;
        }
    }
    if (fontPath.empty()) {
        std::cout << "SKIPPED (no system font)\n";
        return;
    }

    GraphicsContext& ctx = *g_ctx;
    Filesystem system(fontPath.parent_path());
    Font font = Font::fromBytes(system.open(fontPath.filename().string()), 16.0f);
    assert(font.lineHeight() > 0);
    assert(font.measure("Hello") > font.measure("Hi"));

    Text text = Text::create(ctx, "Hello", font);
    assert(text.contents() == "Hello");
    assert(text.width() == static_cast<uint32_t>(font.measure("Hello")));
    assert(text.height() == static_cast<uint32_t>(font.lineHeight()));

    // Some glyph coverage, all of it white
    auto pixels = text.image().toRgba8(ctx);
    bool covered = false;
    for (size_t i = 0; i < pixels.size(); i += 4) {
        assert(pixels[i] == 255 && pixels[i + 1] == 255 && pixels[i + 2] == 255);
        covered = covered || pixels[i + 3] > 0;
    }
    assert(covered);

    Text empty = Text::create(ctx, "", font);
    assert(empty.width() == 1);

    bool threw = false;
    try {
        Font::fromBytes({1, 2, 3, 4}, 16.0f);
    } catch (const ResourceLoadError&) {
        threw = true;
    }
    assert(threw);

    std::cout << "PASSED\n";
}

// ============================================================================
// Frames
// ============================================================================

void test_present_frames() {
    std::cout << "Testing: Presenting frames... ";

    GraphicsContext& ctx = *g_ctx;
    Image image = Image::solid(ctx, 8, Color::WHITE);
    uint64_t presented = ctx.framesPresented();

    for (int frame = 0; frame < 5; ++frame) {
        ctx.window().pollEvents();
        ctx.clear(Color(0.1f, 0.2f, 0.3f, 1.0f));
        image.draw(ctx, {20.0f + frame * 4.0f, 20.0f}, 0.1f * frame);
        circle(ctx, DrawMode::stroke(2.0f), {64.0f, 48.0f}, 20.0f, 0.5f, Color::GREEN);
        ctx.present();
    }

    assert(ctx.framesPresented() == presented + 5);
    assert(ctx.frameIndex() < ctx.conf().backend.framesInFlight);
    assert(!ctx.rendererInfo().empty());

    std::cout << "PASSED\n";
}

void test_screenshot() {
    std::cout << "Testing: Screenshot of the window... ";

    GraphicsContext& ctx = *g_ctx;
    ctx.setBackgroundColor(Color::RED);
    assert(ctx.backgroundColor() == Color::RED);
    ctx.clear();

    Image shot = ctx.screenshot();
    auto size = ctx.drawableSize();
    assert(shot.width() == size.x && shot.height() == size.y);

    auto pixels = shot.toRgba8(ctx);
    assert(isColor(pixelAt(pixels, shot.width(), 0, 0), 255, 0, 0, 255));
    assert(isColor(pixelAt(pixels, shot.width(), shot.width() - 1, shot.height() - 1), 255, 0, 0, 255));

    ctx.present();
    ctx.setBackgroundColor(Color::BLACK);

    std::cout << "PASSED\n";
}

void test_default_filter() {
    std::cout << "Testing: Default filter for new images... ";

    GraphicsContext& ctx = *g_ctx;
    ctx.setDefaultFilter(FilterMode::Nearest);
    Image pixelArt = Image::solid(ctx, 2, Color::WHITE);
    assert(pixelArt.filter() == FilterMode::Nearest);

    pixelArt.setWrap(WrapMode::Tile, WrapMode::Mirror);
    assert(pixelArt.wrap().first == WrapMode::Tile);
    assert(pixelArt.wrap().second == WrapMode::Mirror);

    ctx.setDefaultFilter(FilterMode::Linear);
    assert(Image::solid(ctx, 2, Color::WHITE).filter() == FilterMode::Linear);

    std::cout << "PASSED\n";
}

void test_draw_without_instance() {
    std::cout << "Testing: Draw without instance properties... ";

    // A fresh frame has no instance data to draw with
    GraphicsContext& ctx = *g_ctx;
    ctx.present();

    bool threw = false;
    try {
        ctx.draw();
    } catch (const std::logic_error&) {
        threw = true;
    }
    assert(threw);
    ctx.present();

    std::cout << "PASSED\n";
}

int main() {
    std::cout << "\n========================================\n";
    std::cout << "fine2d - GraphicsContext Tests\n";
    std::cout << "========================================\n\n";

    try {
        setup_test_context();
    } catch (const GameError& e) {
        std::cout << "SKIPPED: " << e.what() << "\n";
        return SKIP_EXIT_CODE;
    }

    try {
        test_image_from_rgba8();
        test_image_zero_size_rejected();
        test_image_length_mismatch();
        test_red_image_scenario();
        test_image_src_rect();
        test_per_image_blend_restore();
        test_sampler_cache_dedup();
        test_shader_lock_restore();
        test_shader_blend_modes();
        test_pixel_shader_from_file();
        test_context_matrix_stacks();
        test_projection_and_views();
        test_mesh_draw();
        test_mesh_constructors();
        test_sprite_batch();
        test_text();
        test_present_frames();
        test_screenshot();
        test_default_filter();
        test_draw_without_instance();
    } catch (const std::exception& e) {
        std::cerr << "\nTest failed with exception: " << e.what() << "\n";
        g_ctx.reset();
        return 1;
    }

    g_ctx.reset();

    std::cout << "\n========================================\n";
    std::cout << "All GraphicsContext tests PASSED!\n";
    std::cout << "========================================\n\n";

    return 0;
}
