#pragma once

#include <string>
#include <string_view>
#include <functional>
#include <cstdio>
#include <vulkan/vulkan.h>

namespace fine2d {

// Log levels
enum class LogLevel {
    Trace,      // Very verbose debugging
    Debug,      // Debug information
    Info,       // Informational messages
    Warning,    // Potential problems
    Error,      // Errors that allow recovery
    Fatal       // Unrecoverable errors
};

// Log categories
enum class LogCategory {
    Core,       // Library core systems
    Vulkan,     // Vulkan API calls and validation
    Resource,   // Resource loading
    Render,     // Draw calls, render targets, frames
    Shader,     // Pixel shaders and blend state
    Performance // Performance warnings
};

/**
 * @brief Process-wide logger
 *
 * Messages at or above the minimum level go to stdout (stderr from Warning
 * up), or to the installed sink when there is one.
 */
class Logger {
public:
    /// Receives every message that passes the level filter
    using Sink = std::function<void(LogLevel level, LogCategory category, std::string_view message)>;

    static Logger& global();

    void setMinLevel(LogLevel level) { minLevel_ = level; }
    LogLevel minLevel() const { return minLevel_; }

    /// Redirect output to a sink; an empty sink restores console output
    void setSink(Sink sink) { sink_ = std::move(sink); }
    bool hasSink() const { return static_cast<bool>(sink_); }

    static const char* levelToString(LogLevel level);
    static const char* categoryToString(LogCategory category);

    void log(LogLevel level, LogCategory category, std::string_view message,
             const char* file = nullptr, int line = 0);

    // Convenience methods
    void trace(LogCategory category, std::string_view message);
    void debug(LogCategory category, std::string_view message);
    void info(LogCategory category, std::string_view message);
    void warning(LogCategory category, std::string_view message);
    void error(LogCategory category, std::string_view message);
    void fatal(LogCategory category, std::string_view message);

    // Vulkan validation message integration
    void vulkanMessage(VkDebugUtilsMessageSeverityFlagBitsEXT severity,
                       VkDebugUtilsMessageTypeFlagsEXT type,
                       const VkDebugUtilsMessengerCallbackDataEXT* data);

private:
    Logger() = default;
    LogLevel minLevel_ = LogLevel::Info;
    Sink sink_;
};

// Logging macros with file/line info
#define FINE2D_LOG(level, category, msg) \
    fine2d::Logger::global().log(level, category, msg, __FILE__, __LINE__)

#define FINE2D_TRACE(category, msg)   FINE2D_LOG(fine2d::LogLevel::Trace, category, msg)
#define FINE2D_DEBUG(category, msg)   FINE2D_LOG(fine2d::LogLevel::Debug, category, msg)
#define FINE2D_INFO(category, msg)    FINE2D_LOG(fine2d::LogLevel::Info, category, msg)
#define FINE2D_WARN(category, msg)    FINE2D_LOG(fine2d::LogLevel::Warning, category, msg)
#define FINE2D_ERROR(category, msg)   FINE2D_LOG(fine2d::LogLevel::Error, category, msg)
#define FINE2D_FATAL(category, msg)   FINE2D_LOG(fine2d::LogLevel::Fatal, category, msg)

} // namespace fine2d
