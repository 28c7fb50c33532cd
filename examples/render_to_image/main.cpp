/**
 * @file main.cpp
 * @brief Render-to-image example - draws into a canvas and saves it as PNG
 *
 * Demonstrates:
 * - Creating a GraphicsContext from a Conf
 * - Drawing images and meshes into an offscreen Canvas
 * - A pixel shader with uniforms
 * - Reading the canvas back and encoding it through the Filesystem
 */

#include <fine2d/fine2d.hpp>

#include <iostream>

namespace {

const uint32_t DIM_FRAG_SPV[] =
#include "dim.frag.inc"
;

} // namespace

int main() {
    std::cout << "fine2d - Render To Image\n\n";

    try {
        fine2d::Conf conf;
        conf.windowSetup.withTitle("Render To Image");
        conf.windowMode.dimensions(256, 256).withVisible(false);
        conf.resourceDir = ".";

        auto ctx = fine2d::GraphicsContext::create(conf);
        std::cout << "Renderer: " << ctx->rendererInfo() << "\n";

        const uint32_t size = 256;
        fine2d::Canvas canvas = fine2d::Canvas::create(*ctx, size, size, fine2d::NumSamples::Four);

        // A 4x4 checkerboard, scaled up without smoothing
        std::vector<uint8_t> checker;
        for (int y = 0; y < 4; ++y) {
            for (int x = 0; x < 4; ++x) {
                uint8_t v = ((x + y) % 2 == 0) ? 230 : 40;
                checker.insert(checker.end(), {v, v, v, 255});
            }
        }
        fine2d::Image board = fine2d::Image::fromRgba8(*ctx, 4, 4, checker);
        board.setFilter(fine2d::FilterMode::Nearest);

        std::vector<uint32_t> spirv(std::begin(DIM_FRAG_SPV), std::end(DIM_FRAG_SPV));
        auto dim = fine2d::PixelShader::fromSpirv(*ctx, spirv, {fine2d::BlendMode::Alpha},
                                                  sizeof(float), "dim");
        float rate = 0.6f;
        dim.sendUniforms(*ctx, &rate, sizeof(rate));

        ctx->setScreenCoordinates(fine2d::Rect::fromCorner(0.0f, 0.0f, size, size));
        {
            fine2d::RenderTargetScope target(*ctx, canvas);
            ctx->clear(fine2d::Color(0.1f, 0.1f, 0.15f, 1.0f));

            board.drawEx(*ctx, fine2d::DrawParam().dest({128.0f, 128.0f}).scale({48.0f, 48.0f}));

            {
                fine2d::ShaderLock lock = fine2d::useShader(*ctx, dim);
                fine2d::circle(*ctx, fine2d::DrawMode::fill(), {128.0f, 128.0f}, 60.0f, 0.5f,
                               fine2d::Color(1.0f, 0.5f, 0.0f, 0.8f));
            }

            fine2d::rectangle(*ctx, fine2d::DrawMode::stroke(4.0f),
                              fine2d::Rect::fromCorner(8.0f, 8.0f, 240.0f, 240.0f),
                              fine2d::Color::WHITE);
        }

        canvas.encode(*ctx, fine2d::ImageFormat::Png, "/render_to_image.png");
        std::cout << "Wrote " << ctx->filesystem().resolve("/render_to_image.png").string() << "\n";

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
