#ifndef COMPONENTS_DRIFTROCK
#define COMPONENTS_DRIFTROCK

#include "ecs/ecs_common.hpp"
#include "GameConfig.hpp"
#include "SessionAssets.hpp"
#include "Inputs.hpp"
#include <vector>

class RandomSource;
class IGameAudio;

// Bullet fired by the craft. Position lives in the entity's Transform2D.
class Projectile : public IComponent {
public:
    glm::vec2 velocity;
    float age;       // seconds since spawn
    float lifetime;
    bool alive;

    Projectile(const glm::vec2& vel, const ProjectileConfig& config, const glm::vec2& playfield)
        : velocity(vel), age(0.0f), lifetime(config.lifetime), alive(true), playfieldSize(playfield) {}

    void Update(Transform2D& transform, float deltaTime);

private:
    glm::vec2 playfieldSize;
};

// Everything needed to build one rock entity.
struct RockSpawn {
    glm::vec2 position = glm::vec2(0.0f);
    glm::vec2 velocity = glm::vec2(0.0f);
    float scale = 1.0f;
    float rotation = 0.0f;
    float spinRate = 0.0f;
    int variant = 0;
    SpriteSize sprite;
};

// Drifting rock. Scale and rotation live in the Transform2D; scale and
// collision radius never change after construction.
class RockBody : public IComponent {
public:
    glm::vec2 velocity;
    float spinRate;          // deg/s
    float collisionRadius;
    int variant;
    SpriteSize sprite;
    bool alive;

    RockBody(const RockSpawn& spawn, const RockConfig& config, const glm::vec2& playfield);

    void Update(Transform2D& transform, float deltaTime);

    // Marks the rock dead and returns its children, if any.
    std::vector<RockSpawn> Fragment(const Transform2D& transform, RandomSource& rng);

    static float RadiusFor(float spriteWidth, float scale, float collisionScale);

private:
    RockConfig config;
    glm::vec2 playfieldSize;
};

struct ThrustFlameShape {
    bool visible = false;
    glm::vec2 outer[3] = { glm::vec2(0.0f), glm::vec2(0.0f), glm::vec2(0.0f) };  // tip, base left, base right
    glm::vec2 inner[3] = { glm::vec2(0.0f), glm::vec2(0.0f), glm::vec2(0.0f) };
};

// The player's ship. Facing is the Transform2D rotation in degrees.
class Craft : public IComponent {
public:
    glm::vec2 velocity;
    float fireCooldown;
    float invulnerabilityRemaining;
    bool alive;
    bool isThrusting;
    float collisionRadius;
    float noseDistance;
    float tailDistance;

    Craft(const CraftConfig& config, const ProjectileConfig& projectileConfig,
          const glm::vec2& playfield, const SpriteSize& sprite);

    void Reset(Transform2D& transform);
    void Update(Transform2D& transform, float deltaTime, CraftInput input);

    // Spawns a projectile at the muzzle unless cooling down or at the
    // projectile cap. Returns true when a shot was fired.
    bool Fire(const Transform2D& transform, EntityManager& entityManager, IGameAudio& audio);

    void Hyperspace(Transform2D& transform, RandomSource& rng);

    bool IsInvulnerable() const { return invulnerabilityRemaining > 0.0f; }

    glm::vec2 Forward(const Transform2D& transform) const;
    glm::vec2 NosePosition(const Transform2D& transform) const;
    glm::vec2 TailPosition(const Transform2D& transform) const;
    ThrustFlameShape ThrustFlame(const Transform2D& transform) const;
    bool IsVisible(float timeSeconds) const;

private:
    CraftConfig config;
    ProjectileConfig projectileConfig;
    glm::vec2 playfieldSize;
};

#endif // COMPONENTS_DRIFTROCK
