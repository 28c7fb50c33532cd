#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace fine2d {

/**
 * @brief Maps virtual paths onto a resource directory
 *
 * Virtual paths use '/' separators and are rooted at the resource directory,
 * so "/player.png" and "player.png" both name <root>/player.png. Paths that
 * would climb out of the root with ".." are rejected.
 */
class Filesystem {
public:
    explicit Filesystem(std::filesystem::path resourceRoot);

    const std::filesystem::path& root() const { return root_; }

    /// Physical location of a virtual path; throws FilesystemError for ".." segments
    std::filesystem::path resolve(std::string_view vpath) const;

    bool exists(std::string_view vpath) const;

    /// Read a whole file
    std::vector<uint8_t> open(std::string_view vpath) const;

    /// Write a whole file, creating parent directories and replacing any existing file
    void create(std::string_view vpath, const std::vector<uint8_t>& bytes) const;

private:
    std::filesystem::path root_;
};

} // namespace fine2d
