#include "AssetManager.hpp"
#include "Utils/Debug/Debug.hpp"

#include <SOIL2/SOIL2.h>

#include <algorithm>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

AssetManager::AssetManager(const std::string& rootDirectory)
    : rootDirectory(rootDirectory)
{
    std::error_code ec;
    if (!fs::is_directory(rootDirectory, ec)) {
        Debug::Warning("AssetManager") << "Asset folder not found: " << rootDirectory;
    }
}

std::string AssetManager::imagePath(const std::string& fileName) const {
    return (fs::path(rootDirectory) / "images" / fileName).string();
}

std::string AssetManager::soundPath(const std::string& fileName) const {
    return (fs::path(rootDirectory) / "sounds" / fileName).string();
}

std::vector<std::string> AssetManager::listImages(const std::string& prefix, const std::string& extension) const {
    std::vector<std::string> found;
    fs::path folder = fs::path(rootDirectory) / "images";

    std::error_code ec;
    if (!fs::is_directory(folder, ec)) {
        return found;
    }

    for (fs::directory_iterator it(folder, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file(ec)) continue;

        std::string name = it->path().filename().string();
        bool prefixMatches = name.compare(0, prefix.size(), prefix) == 0;
        bool extensionMatches = name.size() >= extension.size() &&
            name.compare(name.size() - extension.size(), extension.size(), extension) == 0;

        if (prefixMatches && extensionMatches) {
            found.push_back(it->path().string());
        }
    }

    if (ec) {
        Debug::Warning("AssetManager") << "Failed to list " << folder.string() << ": " << ec.message();
    }

    std::sort(found.begin(), found.end());
    return found;
}

std::optional<glm::ivec2> AssetManager::probeImageSize(const std::string& path) const {
    int width = 0;
    int height = 0;
    int channels = 0;

    unsigned char* pixels = SOIL_load_image(path.c_str(), &width, &height, &channels, SOIL_LOAD_AUTO);
    if (!pixels) {
        Debug::Warning("AssetManager") << "Cannot load image " << path << ": " << SOIL_last_result();
        return std::nullopt;
    }
    SOIL_free_image_data(pixels);

    if (width <= 0 || height <= 0) {
        return std::nullopt;
    }
    return glm::ivec2(width, height);
}

glm::ivec2 AssetManager::imageSizeOr(const std::string& path, const glm::ivec2& fallback) const {
    std::optional<glm::ivec2> size = probeImageSize(path);
    if (!size) {
        Debug::Warning("AssetManager") << "Using placeholder size " << fallback.x << "x" << fallback.y
                                       << " for " << path;
        return fallback;
    }
    return *size;
}
