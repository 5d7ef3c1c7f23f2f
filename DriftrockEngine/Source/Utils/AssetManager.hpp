#pragma once
#include <string>
#include <vector>
#include <optional>
#include <glm/glm.hpp>

// Resolves files under an asset root laid out as <root>/images and
// <root>/sounds, and probes image dimensions.
class AssetManager
{
public:
    explicit AssetManager(const std::string& rootDirectory);

    const std::string& root() const { return rootDirectory; }

    std::string imagePath(const std::string& fileName) const;
    std::string soundPath(const std::string& fileName) const;

    // Image files in <root>/images whose name starts with prefix and ends
    // with extension, sorted by name. Empty when the folder is missing.
    std::vector<std::string> listImages(const std::string& prefix, const std::string& extension) const;

    // Pixel size of an image file, or nullopt when it cannot be decoded.
    std::optional<glm::ivec2> probeImageSize(const std::string& path) const;

    // probeImageSize with a logged fallback.
    glm::ivec2 imageSizeOr(const std::string& path, const glm::ivec2& fallback) const;

private:
    std::string rootDirectory;
};
