#include "fine2d/core/filesystem.hpp"
#include "fine2d/core/error.hpp"
#include "fine2d/core/logging.hpp"

#include <fstream>
#include <system_error>

namespace fine2d {

Filesystem::Filesystem(std::filesystem::path resourceRoot)
    : root_(std::move(resourceRoot)) {
}

std::filesystem::path Filesystem::resolve(std::string_view vpath) const {
    std::filesystem::path result = root_;
    size_t start = 0;
    while (start <= vpath.size()) {
        size_t end = vpath.find('/', start);
        if (end == std::string_view::npos) {
            end = vpath.size();
        }
        std::string_view segment = vpath.substr(start, end - start);
        if (segment == "..") {
            throw FilesystemError("Virtual path leaves the resource directory", std::string(vpath));
        }
        if (!segment.empty() && segment != ".") {
            result /= std::string(segment);
        }
        start = end + 1;
    }
    return result;
}

bool Filesystem::exists(std::string_view vpath) const {
    std::error_code ec;
    return std::filesystem::is_regular_file(resolve(vpath), ec);
}

std::vector<uint8_t> Filesystem::open(std::string_view vpath) const {
    auto path = resolve(vpath);

    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file.is_open()) {
        FINE2D_ERROR(LogCategory::Resource, "Cannot open " + path.string());
        throw FilesystemError("Failed to open file", path.string());
    }

    std::streamsize size = file.tellg();
    if (size < 0) {
        throw FilesystemError("Failed to determine file size", path.string());
    }
    std::vector<uint8_t> bytes(static_cast<size_t>(size));
    file.seekg(0);
    if (size > 0 && !file.read(reinterpret_cast<char*>(bytes.data()), size)) {
        FINE2D_ERROR(LogCategory::Resource, "Short read from " + path.string());
        throw FilesystemError("Failed to read file", path.string());
    }

    FINE2D_TRACE(LogCategory::Resource, "Read " + std::to_string(bytes.size()) + " bytes from " + path.string());
    return bytes;
}

void Filesystem::create(std::string_view vpath, const std::vector<uint8_t>& bytes) const {
    auto path = resolve(vpath);

    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            FINE2D_ERROR(LogCategory::Resource, "Cannot create directory for " + path.string() + ": " + ec.message());
            throw FilesystemError("Failed to create directory", path.parent_path().string());
        }
    }

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        FINE2D_ERROR(LogCategory::Resource, "Cannot create " + path.string());
        throw FilesystemError("Failed to create file", path.string());
    }
    file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!file) {
        FINE2D_ERROR(LogCategory::Resource, "Short write to " + path.string());
        throw FilesystemError("Failed to write file", path.string());
    }
}

} // namespace fine2d
