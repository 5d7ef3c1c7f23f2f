#include "Components.hpp"
#include "EntityFactory.hpp"
#include "GameAudio.hpp"
#include "RandomSource.hpp"
#include "Utils/Geometry.hpp"

#include <algorithm>
#include <cmath>
#include <glm/gtc/constants.hpp>

Craft::Craft(const CraftConfig& config, const ProjectileConfig& projectileConfig,
             const glm::vec2& playfield, const SpriteSize& sprite)
    : velocity(0.0f)
    , fireCooldown(0.0f)
    , invulnerabilityRemaining(config.invulnerabilityTime)
    , alive(true)
    , isThrusting(false)
    , collisionRadius(0.5f * sprite.width * config.collisionScale)
    , noseDistance(0.5f * sprite.height * config.noseScale)
    , tailDistance(0.5f * sprite.height * config.tailScale)
    , config(config)
    , projectileConfig(projectileConfig)
    , playfieldSize(playfield)
{}

void Craft::Reset(Transform2D& transform) {
    transform.setPosition(playfieldSize * 0.5f);
    transform.setRotation(config.startHeading);
    velocity = glm::vec2(0.0f);
    fireCooldown = 0.0f;
    invulnerabilityRemaining = config.invulnerabilityTime;
    isThrusting = false;
    alive = true;
}

void Craft::Update(Transform2D& transform, float deltaTime, CraftInput input) {
    float turn = 0.0f;
    if (HasInput(input, INPUT_TURN_LEFT)) turn -= config.turnRate;
    if (HasInput(input, INPUT_TURN_RIGHT)) turn += config.turnRate;
    if (turn != 0.0f) {
        transform.setRotation(Geometry::WrapDegrees(transform.getRotation() + turn * deltaTime));
    }

    isThrusting = HasInput(input, INPUT_THRUST);
    if (isThrusting) {
        velocity += Forward(transform) * config.thrust * deltaTime;
    }

    // Linear damping; clamped so a huge frame never reverses the motion
    float damping = std::max(0.0f, 1.0f - (1.0f - config.friction) * deltaTime);
    velocity *= damping;

    transform.setPosition(Geometry::Wrap(transform.getPosition() + velocity * deltaTime, playfieldSize));

    fireCooldown = std::max(0.0f, fireCooldown - deltaTime);
    invulnerabilityRemaining = std::max(0.0f, invulnerabilityRemaining - deltaTime);
}

bool Craft::Fire(const Transform2D& transform, EntityManager& entityManager, IGameAudio& audio) {
    if (fireCooldown > 0.0f) return false;

    int liveProjectiles = 0;
    auto query = entityManager.CreateQuery<Projectile>();
    for (auto [entity, projectile] : query) {
        if (projectile->alive) liveProjectiles++;
    }
    if (liveProjectiles >= projectileConfig.maxConcurrent) return false;

    glm::vec2 forward = Forward(transform);
    glm::vec2 muzzle = NosePosition(transform) + forward * config.muzzleOffset;
    glm::vec2 shotVelocity = forward * projectileConfig.speed + velocity;

    EntityFactory::CreateProjectile(entityManager, projectileConfig, playfieldSize, muzzle, shotVelocity);

    fireCooldown = config.fireCooldown;
    audio.PlayShootSound();
    return true;
}

void Craft::Hyperspace(Transform2D& transform, RandomSource& rng) {
    transform.setPosition(rng.PointIn(playfieldSize));
    velocity = glm::vec2(0.0f);
    invulnerabilityRemaining = config.hyperspaceInvulnerability;
}

glm::vec2 Craft::Forward(const Transform2D& transform) const {
    return Geometry::DirectionFromAngle(glm::radians(transform.getRotation()));
}

glm::vec2 Craft::NosePosition(const Transform2D& transform) const {
    return transform.getPosition() + Forward(transform) * noseDistance;
}

glm::vec2 Craft::TailPosition(const Transform2D& transform) const {
    return transform.getPosition() - Forward(transform) * tailDistance;
}

ThrustFlameShape Craft::ThrustFlame(const Transform2D& transform) const {
    ThrustFlameShape flame;
    if (!isThrusting) return flame;

    glm::vec2 forward = Forward(transform);
    glm::vec2 side = Geometry::Perpendicular(forward);
    glm::vec2 tail = TailPosition(transform);

    flame.visible = true;
    flame.outer[0] = tail - forward * config.flameLength;
    flame.outer[1] = tail - side * config.flameHalfWidth;
    flame.outer[2] = tail + side * config.flameHalfWidth;

    flame.inner[0] = flame.outer[0] + forward * 6.0f;
    flame.inner[1] = flame.outer[1] + forward * 4.0f;
    flame.inner[2] = flame.outer[2] + forward * 4.0f;
    return flame;
}

bool Craft::IsVisible(float timeSeconds) const {
    if (!IsInvulnerable()) return true;
    return std::sin(timeSeconds * config.blinkHz * glm::two_pi<float>()) >= 0.0f;
}
