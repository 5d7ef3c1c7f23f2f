#pragma once

#include "Components.hpp"
#include <vector>

enum class GamePhase {
    Menu,
    Playing,
    GameOver
};

struct ProjectileView {
    glm::vec2 position;
};

struct RockView {
    glm::vec2 position;
    float rotation;
    float scale;
    float radius;
    int variant;
    SpriteSize sprite;
};

struct CraftView {
    glm::vec2 position = glm::vec2(0.0f);
    float facing = 0.0f;        // degrees
    float radius = 0.0f;
    bool alive = false;
    bool thrusting = false;
    bool invulnerable = false;
    bool visible = false;
    glm::vec2 nose = glm::vec2(0.0f);
    glm::vec2 tail = glm::vec2(0.0f);
    ThrustFlameShape flame;
};

// Copy of everything the renderer and the HUD need for one frame.
struct GameSnapshot {
    std::vector<ProjectileView> projectiles;
    std::vector<RockView> rocks;
    CraftView craft;
    SpriteSize craftSprite;
    glm::vec2 playfield = glm::vec2(0.0f);
    int score = 0;
    int lives = 0;
    int wave = 0;
    GamePhase phase = GamePhase::Menu;
};
