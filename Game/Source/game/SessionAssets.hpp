#pragma once

#include <vector>

struct SpriteSize {
    float width = 0.0f;
    float height = 0.0f;

    SpriteSize() = default;
    SpriteSize(float w, float h) : width(w), height(h) {}
};

// Sprite dimensions the simulation is sized against. Read once when a
// session is built; rock variant i uses rocks[i].
struct SessionAssets {
    SpriteSize craft = SpriteSize(56.0f, 56.0f);
    std::vector<SpriteSize> rocks;

    static SpriteSize PlaceholderCraft() { return SpriteSize(56.0f, 56.0f); }
    static SpriteSize PlaceholderRock() { return SpriteSize(128.0f, 128.0f); }
};
