/**
 * @file test_core.cpp
 * @brief Core tests - Filesystem, Logger, error hierarchy
 *
 * This test verifies:
 * - Virtual path resolution and ".." rejection
 * - Whole-file reads and writes with directory creation
 * - Logger level filtering and sinks
 * - Error types and their messages
 */

#include <fine2d/core/error.hpp>
#include <fine2d/core/filesystem.hpp>
#include <fine2d/core/logging.hpp>

#include <iostream>
#include <cassert>
#include <filesystem>
#include <string>
#include <vector>

using namespace fine2d;

namespace {

std::filesystem::path makeTempRoot() {
    auto root = std::filesystem::temp_directory_path() / "fine2d_test_core";
    std::filesystem::remove_all(root);
    std::filesystem::create_directories(root);
    return root;
}

} // namespace

// ============================================================================
// Filesystem
// ============================================================================

void test_filesystem_resolve() {
    std::cout << "Testing: Filesystem path resolution... ";

    Filesystem fs("/data/game");
    assert(fs.resolve("/player.png") == std::filesystem::path("/data/game/player.png"));
    assert(fs.resolve("player.png") == fs.resolve("/player.png"));
    assert(fs.resolve("/sprites//hero/./idle.png") ==
           std::filesystem::path("/data/game/sprites/hero/idle.png"));

    bool threw = false;
    try {
        fs.resolve("/../secret.txt");
    } catch (const FilesystemError& e) {
        threw = true;
        assert(e.path() == "/../secret.txt");
    }
    assert(threw);

    threw = false;
    try {
        fs.resolve("a/b/../../c");
    } catch (const FilesystemError&) {
        threw = true;
    }
    assert(threw);

    std::cout << "PASSED\n";
}

void test_filesystem_read_write() {
    std::cout << "Testing: Filesystem read and write... ";

    auto root = makeTempRoot();
    Filesystem fs(root);

    assert(!fs.exists("/saves/slot1.bin"));

    std::vector<uint8_t> data = {0, 1, 2, 254, 255};
    fs.create("/saves/slot1.bin", data);
    assert(fs.exists("/saves/slot1.bin"));
    assert(std::filesystem::is_directory(root / "saves"));
    assert(fs.open("saves/slot1.bin") == data);

    // Replacing shrinks the file
    fs.create("/saves/slot1.bin", {42});
    auto replaced = fs.open("/saves/slot1.bin");
    assert(replaced.size() == 1 && replaced[0] == 42);

    // Empty files round trip
    fs.create("/empty", {});
    assert(fs.open("/empty").empty());

    // Directories are not files
    assert(!fs.exists("/saves"));

    std::filesystem::remove_all(root);
    std::cout << "PASSED\n";
}

void test_filesystem_missing() {
    std::cout << "Testing: Filesystem missing file... ";

    auto root = makeTempRoot();
    Filesystem fs(root);

    bool threw = false;
    try {
        fs.open("/nope.png");
    } catch (const FilesystemError& e) {
        threw = true;
        assert(std::string(e.what()).find("nope.png") != std::string::npos);
    }
    assert(threw);

    std::filesystem::remove_all(root);
    std::cout << "PASSED\n";
}

// ============================================================================
// Logger
// ============================================================================

void test_logger_sink() {
    std::cout << "Testing: Logger sink and level filter... ";

    struct Entry {
        LogLevel level;
        LogCategory category;
        std::string message;
    };
    std::vector<Entry> captured;

    Logger& logger = Logger::global();
    LogLevel previousLevel = logger.minLevel();
    logger.setSink([&captured](LogLevel level, LogCategory category, std::string_view message) {
        captured.push_back({level, category, std::string(message)});
    });
    assert(logger.hasSink());

    logger.setMinLevel(LogLevel::Warning);
    FINE2D_INFO(LogCategory::Render, "filtered out");
    FINE2D_WARN(LogCategory::Shader, "kept warning");
    FINE2D_ERROR(LogCategory::Resource, "kept error");
    logger.fatal(LogCategory::Core, "kept fatal");

    assert(captured.size() == 3);
    assert(captured[0].level == LogLevel::Warning);
    assert(captured[0].category == LogCategory::Shader);
    assert(captured[0].message == "kept warning");
    assert(captured[1].category == LogCategory::Resource);
    assert(captured[2].level == LogLevel::Fatal);

    logger.setMinLevel(LogLevel::Trace);
    FINE2D_TRACE(LogCategory::Performance, "now visible");
    assert(captured.size() == 4);
    assert(captured[3].level == LogLevel::Trace);

    logger.setSink(nullptr);
    assert(!logger.hasSink());
    logger.setMinLevel(previousLevel);

    std::cout << "PASSED\n";
}

void test_logger_names() {
    std::cout << "Testing: Logger level and category names... ";

    assert(std::string(Logger::levelToString(LogLevel::Warning)) == "WARNING");
    assert(std::string(Logger::categoryToString(LogCategory::Render)) == "Render");
    assert(std::string(Logger::categoryToString(LogCategory::Shader)) == "Shader");

    std::cout << "PASSED\n";
}

// ============================================================================
// Errors
// ============================================================================

void test_error_hierarchy() {
    std::cout << "Testing: Error hierarchy... ";

    try {
        throw RenderError("Failed to create pipeline", VK_ERROR_OUT_OF_DEVICE_MEMORY);
    } catch (const GameError& e) {
        std::string message = e.what();
        assert(message.find("Failed to create pipeline") != std::string::npos);
        assert(message.find(std::to_string(VK_ERROR_OUT_OF_DEVICE_MEMORY)) != std::string::npos);
        auto* render = dynamic_cast<const RenderError*>(&e);
        assert(render != nullptr);
        assert(render->result() == VK_ERROR_OUT_OF_DEVICE_MEMORY);
    }

    RenderError plain("No result");
    assert(plain.result() == VK_SUCCESS);
    assert(std::string(plain.what()) == "No result");

    try {
        throw ResourceLoadError("bad pixels");
    } catch (const std::runtime_error& e) {
        assert(std::string(e.what()) == "bad pixels");
    }

    FilesystemError fsError("Failed to open file", "/a.png");
    assert(std::string(fsError.what()) == "Failed to open file: /a.png");
    assert(fsError.path() == "/a.png");

    std::cout << "PASSED\n";
}

int main() {
    std::cout << "\n========================================\n";
    std::cout << "fine2d - Core Tests\n";
    std::cout << "========================================\n\n";

    try {
        test_filesystem_resolve();
        test_filesystem_read_write();
        test_filesystem_missing();
        test_logger_sink();
        test_logger_names();
        test_error_hierarchy();
    } catch (const std::exception& e) {
        std::cerr << "\nTest failed with exception: " << e.what() << "\n";
        return 1;
    }

    std::cout << "\n========================================\n";
    std::cout << "All core tests PASSED!\n";
    std::cout << "========================================\n\n";

    return 0;
}
