/**
 * @file main.cpp
 * @brief Shapes example - an animated window using the immediate drawing API
 *
 * Demonstrates:
 * - The frame loop: clear, draw, present
 * - Meshes built once and drawn every frame
 * - A SpriteBatch drawn with a single draw call
 * - Text, when a font path is given on the command line
 */

#include <fine2d/fine2d.hpp>

#include <chrono>
#include <cmath>
#include <iostream>
#include <memory>

int main(int argc, char** argv) {
    std::cout << "fine2d - Shapes\n\n";

    try {
        fine2d::Conf conf;
        conf.windowSetup.withTitle("Shapes").withSamples(fine2d::NumSamples::Four);
        conf.windowMode.dimensions(800, 600).withResizable(true);

        auto ctx = fine2d::GraphicsContext::create(conf);
        std::cout << "Renderer: " << ctx->rendererInfo() << "\n";

        fine2d::Mesh star = fine2d::MeshBuilder()
            .polygon(fine2d::DrawMode::fill(), {
                {0.0f, -60.0f}, {15.0f, -20.0f}, {57.0f, -19.0f}, {24.0f, 8.0f},
                {35.0f, 49.0f}, {0.0f, 25.0f}, {-35.0f, 49.0f}, {-24.0f, 8.0f},
                {-57.0f, -19.0f}, {-15.0f, -20.0f}},
                fine2d::Color(1.0f, 0.85f, 0.2f, 1.0f))
            .build(*ctx);

        fine2d::SpriteBatch dots(fine2d::Image::solid(*ctx, 6, fine2d::Color::WHITE));
        for (int i = 0; i < 64; ++i) {
            dots.add(fine2d::DrawParam());
        }

        std::unique_ptr<fine2d::Text> caption;
        if (argc > 1) {
            fine2d::Filesystem system(".");
            auto font = fine2d::Font::fromBytes(system.open(argv[1]), 24.0f);
            caption = std::make_unique<fine2d::Text>(fine2d::Text::create(*ctx, "fine2d shapes", font));
        }

        auto start = std::chrono::steady_clock::now();
        while (ctx->window().isOpen()) {
            ctx->window().pollEvents();

            float t = std::chrono::duration<float>(std::chrono::steady_clock::now() - start).count();
            auto size = ctx->drawableSize();
            ctx->setScreenCoordinates(fine2d::Rect::fromCorner(0.0f, 0.0f, size.x, size.y));
            fine2d::Point2 center(size.x * 0.5f, size.y * 0.5f);

            ctx->clear(fine2d::Color(0.08f, 0.08f, 0.12f, 1.0f));

            for (size_t i = 0; i < dots.size(); ++i) {
                float angle = t * 0.5f + static_cast<float>(i) * 0.098f;
                float radius = 200.0f + 20.0f * std::sin(t * 2.0f + i);
                dots.set(i, fine2d::DrawParam()
                    .dest(center + radius * fine2d::Point2(std::cos(angle), std::sin(angle)))
                    .color(fine2d::Color(0.5f + 0.5f * std::sin(angle), 0.6f, 1.0f, 1.0f)));
            }
            dots.draw(*ctx, {0.0f, 0.0f});

            star.draw(*ctx, center, t);
            fine2d::circle(*ctx, fine2d::DrawMode::stroke(3.0f), center, 120.0f, 0.25f,
                           fine2d::Color::GREEN);
            fine2d::line(*ctx, {{40.0f, size.y - 40.0f}, {size.x * 0.5f, size.y - 80.0f},
                                {size.x - 40.0f, size.y - 40.0f}},
                         4.0f, fine2d::Color::RED);

            if (caption) {
                caption->draw(*ctx, {20.0f + caption->width() * 0.5f, 20.0f + caption->height() * 0.5f});
            }

            ctx->present();
        }

        std::cout << "Presented " << ctx->framesPresented() << " frames\n";

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
