#pragma once

#include <glm/glm.hpp>
#include <string>
#include <vector>

struct PlayfieldConfig {
    float width = 1280.0f;
    float height = 1024.0f;

    glm::vec2 Size() const { return glm::vec2(width, height); }
    glm::vec2 Center() const { return glm::vec2(width * 0.5f, height * 0.5f); }
};

struct ProjectileConfig {
    float speed = 520.0f;        // px/s, added to the craft velocity
    float lifetime = 1.2f;       // seconds
    float collisionRadius = 2.0f;
    int maxConcurrent = 5;
};

struct RockConfig {
    float minSpeed = 60.0f;
    float maxSpeed = 160.0f;
    int minFragments = 2;
    int maxFragments = 3;
    float fragmentScaleFactor = 0.6f;
    float minScale = 0.45f;      // children below this are not produced
    float maxScale = 1.0f;
    float collisionScale = 0.85f;
    float fragmentSpin = 120.0f; // deg/s, symmetric range
    int minScoreValue = 10;
};

struct CraftConfig {
    float turnRate = 220.0f;     // deg/s
    float thrust = 300.0f;       // px/s^2
    float friction = 0.9f;
    float collisionScale = 0.75f;
    float fireCooldown = 0.18f;
    float muzzleOffset = 6.0f;   // px past the nose
    float noseScale = 0.95f;     // fraction of half the sprite height
    float tailScale = 0.90f;
    float invulnerabilityTime = 2.0f;
    float hyperspaceInvulnerability = 0.8f;
    float blinkHz = 10.0f;
    float startHeading = -90.0f; // degrees, screen up
    float flameLength = 18.0f;
    float flameHalfWidth = 10.0f;
};

struct WaveConfig {
    int baseRockCount = 3;       // rocks = base + wave number
    float minSpawnScale = 0.8f;
    float maxSpawnScale = 1.0f;
    float clearanceRadius = 140.0f;
    int maxPlacementAttempts = 64;
    float spawnSpin = 60.0f;     // deg/s, symmetric range
    int startingLives = 3;
};

// Immutable tuning for one session. Built once and passed by const reference
// or copied into the components that need it.
struct GameConfig {
    PlayfieldConfig playfield;
    ProjectileConfig projectile;
    RockConfig rock;
    CraftConfig craft;
    WaveConfig wave;

    static GameConfig Default() { return GameConfig{}; }
};

// Settings of the executable around the simulation.
struct LaunchOptions {
    GameConfig game;
    std::string assetsDir = "assets";
    int fpsCap = 0;              // 0 = uncapped
    float musicVolume = 0.6f;
    float sfxVolume = 0.9f;
    bool consoleLog = true;
    bool showHelp = false;
};

// Parses "--flag value" arguments. Throws std::invalid_argument with
// a readable message on unknown flags or bad values.
LaunchOptions ParseLaunchOptions(const std::vector<std::string>& args);

void PrintHelp();
