#pragma once

#include <vulkan/vulkan.h>

#include <stdexcept>
#include <string>

namespace fine2d {

/**
 * @brief Base class of every recoverable fine2d error
 *
 * Errors propagate to the application's per-frame callback, which decides
 * whether to log and continue or to shut down. Programming errors (broken
 * stack discipline, bad indices) are reported with std::logic_error instead.
 */
class GameError : public std::runtime_error {
public:
    explicit GameError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief A Vulkan object could not be created, recorded or submitted
 */
class RenderError : public GameError {
public:
    explicit RenderError(const std::string& message, VkResult result = VK_SUCCESS)
        : GameError(result == VK_SUCCESS ? message
                                         : message + " (VkResult " + std::to_string(result) + ")")
        , result_(result) {}

    /// The Vulkan result that caused the failure, VK_SUCCESS if none
    VkResult result() const { return result_; }

private:
    VkResult result_;
};

/// Rejected or undecodable resource data (zero-sized images, bad pixel buffers, bad files)
class ResourceLoadError : public GameError {
public:
    explicit ResourceLoadError(const std::string& message)
        : GameError(message) {}
};

/// Reading or writing through the Filesystem failed
class FilesystemError : public GameError {
public:
    FilesystemError(const std::string& message, const std::string& path)
        : GameError(message + ": " + path)
        , path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

} // namespace fine2d
